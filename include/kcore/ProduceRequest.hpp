/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef KCORE_PRODUCE_REQUEST_HPP
#define KCORE_PRODUCE_REQUEST_HPP

#include <kcore/ForwardDcl.hpp>
#include <kcore/Compression.hpp>
#include <kcore/RecordBatch.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace kcore {

/**
 * @brief Number of acknowledgements the partition leader must gather
 * before answering a produce request.
 */
struct RequiredAcks {

    int16_t value;

    explicit constexpr RequiredAcks(int16_t val)
    : value(val) {}

    /**
     * @brief The leader does not answer; records are considered sent once
     * written on the wire.
     */
    static constexpr RequiredAcks None() { return RequiredAcks{0}; }

    /**
     * @brief The leader answers once it has written the records itself.
     */
    static constexpr RequiredAcks Leader() { return RequiredAcks{1}; }

    /**
     * @brief The leader answers once all in-sync replicas have the records.
     */
    static constexpr RequiredAcks AllISR() { return RequiredAcks{-1}; }

    inline bool operator==(const RequiredAcks& other) const { return value == other.value; }
    inline bool operator!=(const RequiredAcks& other) const { return value != other.value; }
};

/**
 * @brief A ProduceRequest carries the sealed batches buffered for one
 * broker. Only the request body is written; the request header is the
 * business of the transport.
 */
class ProduceRequest {

    public:

    static constexpr int16_t Key        = 0;
    static constexpr int16_t MinVersion = 3;
    static constexpr int16_t MaxVersion = 7;

    ProduceRequest(RequiredAcks acks,
                   int32_t timeout_ms,
                   std::vector<CompressionCodec> compression = {CompressionCodec::None()})
    : m_acks(acks)
    , m_timeout_ms(timeout_ms)
    , m_compression(std::move(compression)) {}

    int16_t version() const {
        return m_version;
    }

    /**
     * @brief Sets the version negotiated with the broker.
     * Throws an Exception if it is outside [MinVersion, MaxVersion].
     */
    void setVersion(int16_t version);

    RequiredAcks acks() const {
        return m_acks;
    }

    int32_t timeout() const {
        return m_timeout_ms;
    }

    /**
     * @brief Adds a batch to the request. The batch is referenced and must
     * outlive the request. Throws if a batch is already present for the
     * same topic partition.
     */
    void addBatch(const RecordBatch& batch);

    std::size_t numBatches() const;

    /**
     * @brief Appends the request body to out. The compression codec is
     * negotiated from the preference list and the request version.
     */
    void appendTo(std::vector<char>& out) const;

    private:

    int16_t                       m_version = MaxVersion;
    RequiredAcks                  m_acks;
    int32_t                       m_timeout_ms;
    std::vector<CompressionCodec> m_compression;
    std::map<std::string, std::map<int32_t, const RecordBatch*>> m_batches;
};

}

#endif
