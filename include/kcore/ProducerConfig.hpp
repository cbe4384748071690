/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef KCORE_PRODUCER_CONFIG_HPP
#define KCORE_PRODUCER_CONFIG_HPP

#include <kcore/ForwardDcl.hpp>
#include <kcore/Compression.hpp>
#include <kcore/Partitioner.hpp>
#include <kcore/ProduceRequest.hpp>

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace kcore {

/**
 * @brief Settings of the producing path.
 */
struct ProducerConfig {

    RequiredAcks acks = RequiredAcks::Leader();

    /* codecs in order of preference */
    std::vector<CompressionCodec> compression = {CompressionCodec::None()};

    bool allowAutoTopicCreation = false;

    /* upper bound of an uncompressed record batch (Kafka's max.message.bytes) */
    int32_t maxRecordBatchBytes = 1000000;

    /* upper bound of a single write to a broker (socket.request.max.bytes) */
    int32_t maxBrokerWriteBytes = 100 << 20;

    int64_t maxBrokerBufferedRecords = std::numeric_limits<int32_t>::max();

    /* a broker flushes its buffered records past this many bytes... */
    int32_t brokerBufferBytes = 1 << 30;

    /* ...or after this long */
    std::chrono::milliseconds brokerBufferDuration{250};

    Partitioner partitioner = Partitioner::Random();

    /**
     * @brief Throws an Exception if the configuration is not usable.
     */
    void validate() const;

    /**
     * @brief JSON representation of this configuration.
     */
    nlohmann::json toJson() const;

    /**
     * @brief Reads a configuration from JSON. Missing fields keep their
     * default value. The result is validated.
     */
    static ProducerConfig FromJson(const nlohmann::json& config);

    /**
     * @brief Reads a configuration from a JSON file.
     */
    static ProducerConfig FromFile(const std::string& filename);
};

}

#endif
