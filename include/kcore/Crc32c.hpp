/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef KCORE_CRC32C_HPP
#define KCORE_CRC32C_HPP

#include <boost/crc.hpp>
#include <cstdint>
#include <string_view>

namespace kcore {

/**
 * @brief CRC-32C (Castagnoli), the checksum of Kafka record batches.
 */
using Crc32c = boost::crc_optimal<32, 0x1EDC6F41, 0xFFFFFFFF, 0xFFFFFFFF, true, true>;

inline uint32_t crc32c(std::string_view data) {
    Crc32c crc;
    crc.process_bytes(data.data(), data.size());
    return crc.checksum();
}

}

#endif
