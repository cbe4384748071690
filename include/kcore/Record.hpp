/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef KCORE_RECORD_HPP
#define KCORE_RECORD_HPP

#include <kcore/ForwardDcl.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace kcore {

/**
 * @brief Key/value pair attached to a Record. The value may be null.
 */
struct RecordHeader {

    std::string                key;
    std::optional<std::string> value;
};

/**
 * @brief A Record is the unit of data produced to a topic.
 *
 * The key and the value are nullable byte sequences: an empty
 * std::optional encodes as a null field on the wire, which is different
 * from an empty (zero-length) field.
 */
struct Record {

    std::optional<std::string> key;
    std::optional<std::string> value;
    std::vector<RecordHeader>  headers;
    std::string                topic;
    /* only used by the manual partitioner */
    int32_t                    partition = 0;
    /* milliseconds since epoch */
    int64_t                    timestamp = 0;
};

}

#endif
