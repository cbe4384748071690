/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef KCORE_WIRE_READER_HPP
#define KCORE_WIRE_READER_HPP

#include <kcore/ForwardDcl.hpp>
#include <kcore/Exception.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace kcore {

/**
 * @brief The WireReader consumes Kafka protocol primitives from a
 * non-owned byte range. Reading past the end throws an Exception.
 */
class WireReader {

    public:

    WireReader(std::string_view buf)
    : m_buffer(buf) {}

    std::size_t remaining() const {
        return m_buffer.size();
    }

    std::string_view rest() const {
        return m_buffer;
    }

    std::string_view readRaw(std::size_t size) {
        if(size > m_buffer.size())
            throw Exception(
                    "WireReader error: trying to read more than the buffer size");
        auto result = m_buffer.substr(0, size);
        m_buffer.remove_prefix(size);
        return result;
    }

    int8_t readInt8() {
        return static_cast<int8_t>(readRaw(1)[0]);
    }

    int16_t readInt16() {
        return static_cast<int16_t>(loadBigEndian<uint16_t>());
    }

    int32_t readInt32() {
        return static_cast<int32_t>(loadBigEndian<uint32_t>());
    }

    int64_t readInt64() {
        return static_cast<int64_t>(loadBigEndian<uint64_t>());
    }

    int32_t readVarint() {
        return static_cast<int32_t>(readVarlong());
    }

    int64_t readVarlong() {
        uint64_t u = 0;
        for(unsigned shift = 0; shift < 64; shift += 7) {
            auto b = static_cast<uint8_t>(readRaw(1)[0]);
            u |= static_cast<uint64_t>(b & 0x7f) << shift;
            if((b & 0x80) == 0)
                return static_cast<int64_t>(u >> 1) ^ -static_cast<int64_t>(u & 1);
        }
        throw Exception("WireReader error: varint is too long");
    }

    std::string readString() {
        auto len = readInt16();
        if(len < 0)
            throw Exception("WireReader error: unexpected null string");
        return std::string{readRaw(static_cast<std::size_t>(len))};
    }

    std::optional<std::string> readNullableString() {
        auto len = readInt16();
        if(len < 0) return std::nullopt;
        return std::string{readRaw(static_cast<std::size_t>(len))};
    }

    std::optional<std::string> readVarintBytes() {
        auto len = readVarint();
        if(len < 0) return std::nullopt;
        return std::string{readRaw(static_cast<std::size_t>(len))};
    }

    private:

    template<typename U>
    U loadBigEndian() {
        auto bytes = readRaw(sizeof(U));
        U v = 0;
        for(std::size_t i = 0; i < sizeof(U); ++i)
            v = static_cast<U>((v << 8) | static_cast<uint8_t>(bytes[i]));
        return v;
    }

    std::string_view m_buffer;
};

}

#endif
