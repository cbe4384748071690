/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef KCORE_LZ4_COMPRESSOR_HPP
#define KCORE_LZ4_COMPRESSOR_HPP

#include "kcore/Compression.hpp"

#include <lz4frame.h>
#include <memory>

namespace kcore {

/**
 * @brief LZ4 codec using the LZ4 frame format. The decompression
 * context is kept between calls.
 */
class Lz4Compressor : public CompressorInterface {

    public:

    Lz4Compressor(int level);
    ~Lz4Compressor();

    Lz4Compressor(const Lz4Compressor&) = delete;
    Lz4Compressor& operator=(const Lz4Compressor&) = delete;

    bool compress(std::string_view input, std::vector<char>& output) override;
    void decompress(std::string_view input, std::vector<char>& output) override;

    static std::unique_ptr<CompressorInterface> create(const CompressionCodec& codec);

    private:

    int        m_level;
    LZ4F_dctx* m_dctx = nullptr;
};

}

#endif
