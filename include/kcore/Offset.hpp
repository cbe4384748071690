/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef KCORE_OFFSET_HPP
#define KCORE_OFFSET_HPP

#include <kcore/ForwardDcl.hpp>
#include <kcore/Exception.hpp>

#include <fmt/format.h>
#include <cstdint>
#include <string>

namespace kcore {

/**
 * @brief An Offset tells where to start consuming a partition from:
 * its earliest available record, its end, or an exact offset.
 */
class Offset {

    public:

    /**
     * @brief Start from the earliest available record.
     */
    static constexpr Offset Earliest() { return Offset{-2}; }

    /**
     * @brief Start from the end of the partition (new records only).
     */
    static constexpr Offset Latest() { return Offset{-1}; }

    /**
     * @brief Start from an exact offset. Throws if the offset is negative.
     */
    static Offset Exact(int64_t offset) {
        if(offset < 0)
            throw Exception{fmt::format("Invalid negative offset {}", offset)};
        return Offset{offset};
    }

    /**
     * @brief Value sent in list-offsets and fetch requests (-2 for
     * earliest, -1 for latest).
     */
    constexpr int64_t value() const {
        return m_value;
    }

    constexpr bool isEarliest() const { return m_value == -2; }
    constexpr bool isLatest() const { return m_value == -1; }

    std::string toString() const {
        if(isEarliest()) return "earliest";
        if(isLatest()) return "latest";
        return std::to_string(m_value);
    }

    constexpr bool operator==(const Offset& other) const { return m_value == other.m_value; }
    constexpr bool operator!=(const Offset& other) const { return m_value != other.m_value; }

    private:

    explicit constexpr Offset(int64_t value)
    : m_value(value) {}

    int64_t m_value;
};

}

template <>
struct fmt::formatter<kcore::Offset> : fmt::formatter<std::string> {
    template <typename FormatContext>
    auto format(const kcore::Offset& offset, FormatContext& ctx) const {
        return fmt::formatter<std::string>::format(offset.toString(), ctx);
    }
};

#endif
