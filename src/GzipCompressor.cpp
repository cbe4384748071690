/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#include "GzipCompressor.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstring>

namespace kcore {

// 15 bits of window, +16 to write a gzip header instead of a zlib one
static constexpr int GzipWindowBits = 15 + 16;
// +32 to let inflate detect either header
static constexpr int AutoWindowBits = 15 + 32;

GzipCompressor::GzipCompressor(int level) {
    std::memset(&m_deflate, 0, sizeof(m_deflate));
    std::memset(&m_inflate, 0, sizeof(m_inflate));
    auto ret = deflateInit2(&m_deflate, level, Z_DEFLATED, GzipWindowBits, 8, Z_DEFAULT_STRATEGY);
    if(ret != Z_OK)
        throw Exception{fmt::format("deflateInit2 failed with error {}", ret)};
    m_deflate_ready = true;
    ret = inflateInit2(&m_inflate, AutoWindowBits);
    if(ret != Z_OK) {
        deflateEnd(&m_deflate);
        throw Exception{fmt::format("inflateInit2 failed with error {}", ret)};
    }
    m_inflate_ready = true;
}

GzipCompressor::~GzipCompressor() {
    if(m_deflate_ready) deflateEnd(&m_deflate);
    if(m_inflate_ready) inflateEnd(&m_inflate);
}

bool GzipCompressor::compress(std::string_view input, std::vector<char>& output) {
    if(deflateReset(&m_deflate) != Z_OK) {
        spdlog::debug("[kcore:gzip] Could not reset deflate stream, keeping input uncompressed");
        output.clear();
        return false;
    }
    output.resize(deflateBound(&m_deflate, static_cast<uLong>(input.size())));

    m_deflate.next_in   = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
    m_deflate.avail_in  = static_cast<uInt>(input.size());
    m_deflate.next_out  = reinterpret_cast<Bytef*>(output.data());
    m_deflate.avail_out = static_cast<uInt>(output.size());

    auto ret = deflate(&m_deflate, Z_FINISH);
    if(ret != Z_STREAM_END) {
        spdlog::debug("[kcore:gzip] Error {} during compression, keeping input uncompressed", ret);
        output.clear();
        return false;
    }
    output.resize(output.size() - m_deflate.avail_out);
    return !output.empty();
}

void GzipCompressor::decompress(std::string_view input, std::vector<char>& output) {
    if(inflateReset(&m_inflate) != Z_OK)
        throw Exception{"Could not reset inflate stream"};
    output.clear();
    if(input.empty())
        throw Exception{"Cannot gzip-decompress an empty buffer"};

    m_inflate.next_in  = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
    m_inflate.avail_in = static_cast<uInt>(input.size());

    std::size_t chunk = std::max<std::size_t>(input.size() * 4, 256);
    int ret = Z_OK;
    while(ret != Z_STREAM_END) {
        auto produced = output.size();
        output.resize(produced + chunk);
        m_inflate.next_out  = reinterpret_cast<Bytef*>(output.data() + produced);
        m_inflate.avail_out = static_cast<uInt>(chunk);
        ret = inflate(&m_inflate, Z_NO_FLUSH);
        output.resize(output.size() - m_inflate.avail_out);
        if(ret == Z_STREAM_END) break;
        if(ret != Z_OK && ret != Z_BUF_ERROR)
            throw Exception{fmt::format("Error {} during gzip decompression", ret)};
        if(ret == Z_BUF_ERROR && m_inflate.avail_in == 0)
            throw Exception{"Truncated gzip input"};
        chunk *= 2;
    }
}

std::unique_ptr<CompressorInterface> GzipCompressor::create(const CompressionCodec& codec) {
    return std::make_unique<GzipCompressor>(codec.level.value_or(Z_DEFAULT_COMPRESSION));
}

}
