/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#include "Lz4Compressor.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstring>

namespace kcore {

Lz4Compressor::Lz4Compressor(int level)
: m_level(level) {
    auto ret = LZ4F_createDecompressionContext(&m_dctx, LZ4F_VERSION);
    if(LZ4F_isError(ret))
        throw Exception{fmt::format(
            "Could not create LZ4 decompression context: {}", LZ4F_getErrorName(ret))};
}

Lz4Compressor::~Lz4Compressor() {
    LZ4F_freeDecompressionContext(m_dctx);
}

bool Lz4Compressor::compress(std::string_view input, std::vector<char>& output) {
    LZ4F_preferences_t prefs;
    std::memset(&prefs, 0, sizeof(prefs));
    prefs.compressionLevel = m_level;
    prefs.frameInfo.blockMode = LZ4F_blockIndependent;
    prefs.frameInfo.contentSize = input.size();

    output.resize(LZ4F_compressFrameBound(input.size(), &prefs));
    auto written = LZ4F_compressFrame(output.data(), output.size(),
                                      input.data(), input.size(), &prefs);
    if(LZ4F_isError(written)) {
        spdlog::debug("[kcore:lz4] Compression error ({}), keeping input uncompressed",
                      LZ4F_getErrorName(written));
        output.clear();
        return false;
    }
    output.resize(written);
    return written != 0;
}

void Lz4Compressor::decompress(std::string_view input, std::vector<char>& output) {
    LZ4F_resetDecompressionContext(m_dctx);
    output.clear();

    const char* src = input.data();
    std::size_t srcLeft = input.size();
    std::size_t chunk = std::max<std::size_t>(input.size() * 4, 256);
    std::size_t hint = 1;
    while(hint != 0) {
        auto produced = output.size();
        output.resize(produced + chunk);
        std::size_t dstSize = chunk;
        std::size_t srcSize = srcLeft;
        hint = LZ4F_decompress(m_dctx, output.data() + produced, &dstSize,
                               src, &srcSize, nullptr);
        if(LZ4F_isError(hint))
            throw Exception{fmt::format("LZ4 decompression error: {}", LZ4F_getErrorName(hint))};
        output.resize(produced + dstSize);
        src += srcSize;
        srcLeft -= srcSize;
        if(srcSize == 0 && dstSize == 0) break;
    }
    if(hint != 0)
        throw Exception{"Truncated LZ4 frame"};
}

std::unique_ptr<CompressorInterface> Lz4Compressor::create(const CompressionCodec& codec) {
    return std::make_unique<Lz4Compressor>(codec.level.value_or(0));
}

}
