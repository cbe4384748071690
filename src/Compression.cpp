/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#include "kcore/Compression.hpp"
#include "CompressorPool.hpp"
#include "PimplUtil.hpp"
#include "GzipCompressor.hpp"
#include "SnappyCompressor.hpp"
#include "Lz4Compressor.hpp"
#include "ZstdCompressor.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace kcore {

KCORE_REGISTER_COMPRESSOR(gzip, GzipCompressor);
KCORE_REGISTER_COMPRESSOR(snappy, SnappyCompressor);
KCORE_REGISTER_COMPRESSOR(lz4, Lz4Compressor);
KCORE_REGISTER_COMPRESSOR(zstd, ZstdCompressor);

const char* compressionTypeName(CompressionType type) {
    switch(type) {
    case CompressionType::None:   return "none";
    case CompressionType::Gzip:   return "gzip";
    case CompressionType::Snappy: return "snappy";
    case CompressionType::Lz4:    return "lz4";
    case CompressionType::Zstd:   return "zstd";
    }
    throw Exception{fmt::format("Invalid compression type {}", static_cast<int>(type))};
}

CompressionType compressionTypeFromName(std::string_view name) {
    if(name == "none")   return CompressionType::None;
    if(name == "gzip")   return CompressionType::Gzip;
    if(name == "snappy") return CompressionType::Snappy;
    if(name == "lz4")    return CompressionType::Lz4;
    if(name == "zstd")   return CompressionType::Zstd;
    throw Exception{fmt::format("Unknown compression codec \"{}\"", name)};
}

void CompressionCodec::validate() const {
    if(!level) return;
    auto checkRange = [this](int min, int max) {
        if(*level < min || *level > max)
            throw Exception{fmt::format(
                "Invalid level {} for {} compression (expected {} to {})",
                *level, compressionTypeName(type), min, max)};
    };
    switch(type) {
    case CompressionType::Gzip: checkRange(-1, 9);  break;
    case CompressionType::Lz4:  checkRange(0, 12);  break;
    case CompressionType::Zstd: checkRange(1, 22);  break;
    default:
        throw Exception{fmt::format(
            "{} compression does not accept a level", compressionTypeName(type))};
    }
}

using CompressorImpl = CompressorPool;

PIMPL_DEFINE_COMMON_FUNCTIONS_NO_CTOR(Compressor);

Compressor::Compressor() = default;

Compressor::Compressor(const std::shared_ptr<CompressorPool>& impl)
: self(impl) {}

Compressor::Compressor(const CompressionCodec& codec) {
    codec.validate();
    if(codec.type == CompressionType::None) return;
    self = std::make_shared<CompressorPool>(codec);
}

CompressionCodec Compressor::codec() const {
    if(!self) return CompressionCodec::None();
    return self->codec();
}

int16_t Compressor::attributes() const {
    if(!self) return 0;
    return static_cast<int16_t>(self->codec().type) & 0x07;
}

bool Compressor::compress(std::string_view input, std::vector<char>& output) const {
    if(!self) throw Exception{"Calling Compressor::compress on an invalid Compressor"};
    auto instance = self->acquire();
    return instance->compress(input, output);
}

void Compressor::decompress(std::string_view input, std::vector<char>& output) const {
    if(!self) throw Exception{"Calling Compressor::decompress on an invalid Compressor"};
    auto instance = self->acquire();
    instance->decompress(input, output);
}

std::size_t Compressor::pooled() const {
    if(!self) return 0;
    return self->size();
}

Compressor Compressor::Negotiate(const std::vector<CompressionCodec>& preference,
                                 int16_t produceVersion) {
    for(const auto& codec : preference) {
        if(codec.minProduceVersion() > produceVersion) {
            spdlog::debug("[kcore:compression] Skipping {} (requires produce v{}, have v{})",
                          compressionTypeName(codec.type), codec.minProduceVersion(),
                          produceVersion);
            continue;
        }
        if(codec.type == CompressionType::None) return Compressor{};
        return Compressor{codec};
    }
    return Compressor{};
}

std::vector<char> decompress(CompressionType type, std::string_view input) {
    std::vector<char> output;
    if(type == CompressionType::None) {
        output.assign(input.begin(), input.end());
        return output;
    }
    Compressor{CompressionCodec{type, std::nullopt}}.decompress(input, output);
    return output;
}

}
