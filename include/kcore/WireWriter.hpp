/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef KCORE_WIRE_WRITER_HPP
#define KCORE_WIRE_WRITER_HPP

#include <kcore/ForwardDcl.hpp>
#include <kcore/Exception.hpp>

#include <cstdint>
#include <cstring>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kcore {

/**
 * @brief Number of bytes taken by the zig-zag varint encoding of v.
 */
inline std::size_t varintLength(int64_t v) {
    auto u = (static_cast<uint64_t>(v) << 1) ^ static_cast<uint64_t>(v >> 63);
    std::size_t n = 1;
    while(u >= 0x80) {
        u >>= 7;
        ++n;
    }
    return n;
}

/**
 * @brief Number of bytes taken by a varint-length-prefixed nullable
 * byte sequence.
 */
inline std::size_t varintBytesLength(const std::optional<std::string>& bytes) {
    if(!bytes) return varintLength(-1);
    return varintLength(static_cast<int64_t>(bytes->size())) + bytes->size();
}

/**
 * @brief The WireWriter appends Kafka protocol primitives to a growable
 * buffer that it does not own. Fixed-width integers are big-endian and
 * variable-length integers use the zig-zag encoding.
 *
 * Every append returns nothing; the absolute offset at which a field
 * starts can be obtained with size() before appending it, and that field
 * can later be overwritten in place with one of the patch functions.
 */
class WireWriter {

    public:

    WireWriter(std::vector<char>& buf)
    : m_buffer(buf) {}

    /**
     * @brief Current size of the underlying buffer, i.e. the offset at
     * which the next append will write.
     */
    std::size_t size() const {
        return m_buffer.size();
    }

    std::vector<char>& buffer() {
        return m_buffer;
    }

    void write(const void* data, std::size_t size) {
        auto new_size = m_buffer.size() + size;
        if(m_buffer.capacity() < new_size) {
            m_buffer.reserve(2*new_size);
        }
        auto offset = m_buffer.size();
        m_buffer.resize(new_size);
        if(size) std::memcpy(m_buffer.data() + offset, data, size);
    }

    void appendInt8(int8_t v) {
        m_buffer.push_back(static_cast<char>(v));
    }

    void appendInt16(int16_t v) {
        char b[2];
        storeBigEndian(b, static_cast<uint16_t>(v));
        write(b, sizeof(b));
    }

    void appendInt32(int32_t v) {
        char b[4];
        storeBigEndian(b, static_cast<uint32_t>(v));
        write(b, sizeof(b));
    }

    void appendInt64(int64_t v) {
        char b[8];
        storeBigEndian(b, static_cast<uint64_t>(v));
        write(b, sizeof(b));
    }

    void appendVarint(int32_t v) {
        appendVarlong(v);
    }

    void appendVarlong(int64_t v) {
        auto u = (static_cast<uint64_t>(v) << 1) ^ static_cast<uint64_t>(v >> 63);
        while(u >= 0x80) {
            m_buffer.push_back(static_cast<char>((u & 0x7f) | 0x80));
            u >>= 7;
        }
        m_buffer.push_back(static_cast<char>(u));
    }

    /**
     * @brief Appends an int16-length-prefixed string.
     */
    void appendString(std::string_view s) {
        appendInt16(static_cast<int16_t>(s.size()));
        write(s.data(), s.size());
    }

    /**
     * @brief Appends an int16-length-prefixed nullable string
     * (length -1 for a null string).
     */
    void appendNullableString(const std::optional<std::string>& s) {
        if(!s) {
            appendInt16(-1);
            return;
        }
        appendString(*s);
    }

    void appendArrayLen(std::size_t n) {
        appendInt32(static_cast<int32_t>(n));
    }

    /**
     * @brief Appends a varint-length-prefixed nullable byte sequence.
     */
    void appendVarintBytes(const std::optional<std::string>& bytes) {
        if(!bytes) {
            appendVarint(-1);
            return;
        }
        appendVarintString(*bytes);
    }

    void appendVarintString(std::string_view s) {
        appendVarint(static_cast<int32_t>(s.size()));
        write(s.data(), s.size());
    }

    /**
     * @brief Overwrites the int16 field starting at the given absolute offset.
     */
    void patchInt16(std::size_t at, int16_t v) {
        checkPatch(at, 2);
        storeBigEndian(m_buffer.data() + at, static_cast<uint16_t>(v));
    }

    /**
     * @brief Overwrites the int32 field starting at the given absolute offset.
     */
    void patchInt32(std::size_t at, int32_t v) {
        checkPatch(at, 4);
        storeBigEndian(m_buffer.data() + at, static_cast<uint32_t>(v));
    }

    private:

    template<typename U>
    static void storeBigEndian(char* dst, U v) {
        for(std::size_t i = 0; i < sizeof(U); ++i) {
            dst[sizeof(U) - 1 - i] = static_cast<char>(v & 0xff);
            v >>= 8;
        }
    }

    void checkPatch(std::size_t at, std::size_t width) const {
        if(at + width > m_buffer.size())
            throw Exception("WireWriter error: trying to patch past the end of the buffer");
    }

    std::vector<char>& m_buffer;
};

}

#endif
