/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#include "SnappyCompressor.hpp"
#include "kcore/WireReader.hpp"

#include <fmt/format.h>
#include <snappy.h>

namespace kcore {

static constexpr std::string_view XerialMagic{"\x82SNAPPY\0", 8};
static constexpr std::size_t XerialHeaderLength = XerialMagic.size() + 8;

bool SnappyCompressor::compress(std::string_view input, std::vector<char>& output) {
    output.resize(snappy::MaxCompressedLength(input.size()));
    std::size_t written = 0;
    snappy::RawCompress(input.data(), input.size(), output.data(), &written);
    output.resize(written);
    return written != 0;
}

void SnappyCompressor::decompressBlock(std::string_view block, std::vector<char>& output) {
    std::size_t length = 0;
    if(!snappy::GetUncompressedLength(block.data(), block.size(), &length))
        throw Exception{fmt::format(
            "Could not find snappy uncompressed length from input of size {}", block.size())};
    auto offset = output.size();
    output.resize(offset + length);
    if(!snappy::RawUncompress(block.data(), block.size(), output.data() + offset))
        throw Exception{fmt::format(
            "snappy: could not decompress input of size {} to output of size {}",
            block.size(), length)};
}

void SnappyCompressor::decompress(std::string_view input, std::vector<char>& output) {
    output.clear();
    if(input.size() < XerialHeaderLength || input.substr(0, XerialMagic.size()) != XerialMagic) {
        decompressBlock(input, output);
        return;
    }
    WireReader reader{input.substr(XerialHeaderLength)};
    while(reader.remaining() > 0) {
        auto size = reader.readInt32();
        if(size < 0)
            throw Exception{fmt::format("Invalid snappy chunk length {}", size)};
        decompressBlock(reader.readRaw(static_cast<std::size_t>(size)), output);
    }
}

std::unique_ptr<CompressorInterface> SnappyCompressor::create(const CompressionCodec&) {
    return std::make_unique<SnappyCompressor>();
}

}
