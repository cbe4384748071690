/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef KCORE_GZIP_COMPRESSOR_HPP
#define KCORE_GZIP_COMPRESSOR_HPP

#include "kcore/Compression.hpp"

#include <zlib.h>
#include <memory>

namespace kcore {

/**
 * @brief Gzip codec backed by zlib. The deflate and inflate streams are
 * kept for the lifetime of the instance and reset between calls.
 */
class GzipCompressor : public CompressorInterface {

    public:

    GzipCompressor(int level);
    ~GzipCompressor();

    GzipCompressor(const GzipCompressor&) = delete;
    GzipCompressor& operator=(const GzipCompressor&) = delete;

    bool compress(std::string_view input, std::vector<char>& output) override;
    void decompress(std::string_view input, std::vector<char>& output) override;

    static std::unique_ptr<CompressorInterface> create(const CompressionCodec& codec);

    private:

    z_stream m_deflate;
    z_stream m_inflate;
    bool     m_deflate_ready = false;
    bool     m_inflate_ready = false;
};

}

#endif
