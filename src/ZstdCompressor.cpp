/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#include "ZstdCompressor.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace kcore {

ZstdCompressor::ZstdCompressor(int level)
: m_cctx(ZSTD_createCCtx(), &ZSTD_freeCCtx)
, m_dctx(ZSTD_createDCtx(), &ZSTD_freeDCtx) {
    if(!m_cctx || !m_dctx)
        throw Exception{"Could not allocate zstd contexts"};
    auto ret = ZSTD_CCtx_setParameter(m_cctx.get(), ZSTD_c_compressionLevel, level);
    if(ZSTD_isError(ret))
        throw Exception{fmt::format("Invalid zstd level {}: {}", level, ZSTD_getErrorName(ret))};
}

bool ZstdCompressor::compress(std::string_view input, std::vector<char>& output) {
    output.resize(ZSTD_compressBound(input.size()));
    auto written = ZSTD_compress2(m_cctx.get(), output.data(), output.size(),
                                  input.data(), input.size());
    if(ZSTD_isError(written)) {
        spdlog::debug("[kcore:zstd] Compression error ({}), keeping input uncompressed",
                      ZSTD_getErrorName(written));
        output.clear();
        return false;
    }
    output.resize(written);
    return written != 0;
}

void ZstdCompressor::decompress(std::string_view input, std::vector<char>& output) {
    output.clear();
    auto reset = ZSTD_DCtx_reset(m_dctx.get(), ZSTD_reset_session_only);
    if(ZSTD_isError(reset))
        throw Exception{fmt::format("Could not reset zstd context: {}", ZSTD_getErrorName(reset))};

    ZSTD_inBuffer in{input.data(), input.size(), 0};
    std::size_t chunk = std::max<std::size_t>(ZSTD_DStreamOutSize(), input.size() * 4);
    std::size_t ret = 1;
    while(ret != 0) {
        auto produced = output.size();
        output.resize(produced + chunk);
        ZSTD_outBuffer out{output.data() + produced, chunk, 0};
        ret = ZSTD_decompressStream(m_dctx.get(), &out, &in);
        if(ZSTD_isError(ret))
            throw Exception{fmt::format("zstd decompression error: {}", ZSTD_getErrorName(ret))};
        output.resize(produced + out.pos);
        if(ret != 0 && in.pos == in.size && out.pos < chunk)
            throw Exception{"Truncated zstd frame"};
    }
}

std::unique_ptr<CompressorInterface> ZstdCompressor::create(const CompressionCodec& codec) {
    return std::make_unique<ZstdCompressor>(codec.level.value_or(ZSTD_CLEVEL_DEFAULT));
}

}
