/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef KCORE_ZSTD_COMPRESSOR_HPP
#define KCORE_ZSTD_COMPRESSOR_HPP

#include "kcore/Compression.hpp"

#include <zstd.h>
#include <memory>

namespace kcore {

/**
 * @brief Zstandard codec. Each instance owns one compression and one
 * decompression context, so pooling instances pools the contexts.
 */
class ZstdCompressor : public CompressorInterface {

    public:

    ZstdCompressor(int level);

    bool compress(std::string_view input, std::vector<char>& output) override;
    void decompress(std::string_view input, std::vector<char>& output) override;

    static std::unique_ptr<CompressorInterface> create(const CompressionCodec& codec);

    private:

    std::unique_ptr<ZSTD_CCtx, size_t(*)(ZSTD_CCtx*)> m_cctx;
    std::unique_ptr<ZSTD_DCtx, size_t(*)(ZSTD_DCtx*)> m_dctx;
};

}

#endif
