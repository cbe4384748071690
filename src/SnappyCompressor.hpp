/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef KCORE_SNAPPY_COMPRESSOR_HPP
#define KCORE_SNAPPY_COMPRESSOR_HPP

#include "kcore/Compression.hpp"

#include <memory>

namespace kcore {

/**
 * @brief Snappy codec. Compression produces a raw snappy block.
 * Decompression accepts either a raw block or the chunked framing
 * written by the Java client (magic "\x82SNAPPY\0", two int32 versions,
 * then chunks each prefixed by a big-endian int32 length).
 */
class SnappyCompressor : public CompressorInterface {

    public:

    bool compress(std::string_view input, std::vector<char>& output) override;
    void decompress(std::string_view input, std::vector<char>& output) override;

    static std::unique_ptr<CompressorInterface> create(const CompressionCodec& codec);

    private:

    static void decompressBlock(std::string_view block, std::vector<char>& output);
};

}

#endif
