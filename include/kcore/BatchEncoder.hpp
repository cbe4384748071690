/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef KCORE_BATCH_ENCODER_HPP
#define KCORE_BATCH_ENCODER_HPP

#include <kcore/ForwardDcl.hpp>
#include <kcore/Compression.hpp>
#include <kcore/RecordBatch.hpp>

#include <vector>

namespace kcore {

/**
 * @brief The BatchEncoder writes a sealed RecordBatch in the v2 record
 * batch format (magic 2) as the records field of a produce request
 * partition entry, i.e. prefixed by its int32 nullable-bytes length.
 *
 * If the encoder holds a valid Compressor, the records are compressed
 * and the compressed form is kept only if it is strictly smaller.
 * The encoder has no mutable state and can be shared across threads.
 */
class BatchEncoder {

    public:

    /**
     * @brief Constructor.
     *
     * @param compressor Negotiated compressor, invalid for no compression.
     */
    BatchEncoder(Compressor compressor = Compressor{})
    : m_compressor(std::move(compressor)) {}

    const Compressor& compressor() const {
        return m_compressor;
    }

    /**
     * @brief Appends the encoded batch to out.
     *
     * @param batch Sealed batch holding at least one record.
     * @param out Output buffer.
     *
     * @return the number of bytes appended.
     */
    std::size_t encode(const RecordBatch& batch, std::vector<char>& out) const;

    private:

    Compressor m_compressor;
};

}

#endif
