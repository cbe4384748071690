/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#include "kcore/Partitioner.hpp"
#include "kcore/Exception.hpp"

#include <fmt/format.h>

namespace kcore {

// MurmurHash2 as used by the Java client to hash record keys.
uint32_t murmur2(std::string_view data) {
    constexpr uint32_t seed = 0x9747b28c;
    constexpr uint32_t m    = 0x5bd1e995;
    constexpr int      r    = 24;

    auto b   = reinterpret_cast<const uint8_t*>(data.data());
    auto len = data.size();
    uint32_t h = seed ^ static_cast<uint32_t>(len);

    while(len >= 4) {
        uint32_t k = static_cast<uint32_t>(b[3]) << 24
                   | static_cast<uint32_t>(b[2]) << 16
                   | static_cast<uint32_t>(b[1]) << 8
                   | static_cast<uint32_t>(b[0]);
        k *= m;
        k ^= k >> r;
        k *= m;
        h *= m;
        h ^= k;
        b   += 4;
        len -= 4;
    }

    switch(len) {
    case 3:
        h ^= static_cast<uint32_t>(b[2]) << 16;
        [[fallthrough]];
    case 2:
        h ^= static_cast<uint32_t>(b[1]) << 8;
        [[fallthrough]];
    case 1:
        h ^= static_cast<uint32_t>(b[0]);
        h *= m;
    }

    h ^= h >> 13;
    h *= m;
    h ^= h >> 15;
    return h;
}

static void checkPartitionCount(int32_t n) {
    if(n <= 0)
        throw Exception{fmt::format("Cannot hash a key into {} partitions", n)};
}

PartitionerHasher KafkaHasher(HashFunction hash) {
    if(!hash) hash = murmur2;
    return [hash=std::move(hash)](std::string_view key, int32_t n) {
        checkPartitionCount(n);
        return static_cast<int32_t>((hash(key) & 0x7fffffff) % static_cast<uint32_t>(n));
    };
}

PartitionerHasher SaramaHasher(HashFunction hash) {
    if(!hash) hash = murmur2;
    return [hash=std::move(hash)](std::string_view key, int32_t n) {
        checkPartitionCount(n);
        auto p = static_cast<int32_t>(hash(key)) % n;
        return p < 0 ? -p : p;
    };
}

}
