/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#include "kcore/ProducerConfig.hpp"
#include "JsonUtil.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <fstream>
#include <unordered_set>

namespace kcore {

static constexpr const char* ProducerConfigSchema = R"(
{
  "type": "object",
  "properties": {
    "acks": {
      "oneOf": [
        {"enum": ["none", "leader", "all"]},
        {"enum": [0, 1, -1]}
      ]
    },
    "compression": {
      "type": "array",
      "items": {
        "oneOf": [
          {"type": "string"},
          {"type": "object",
           "properties": {
             "type": {"type": "string"},
             "level": {"type": "integer"}
           },
           "required": ["type"]
          }
        ]
      }
    },
    "allow_auto_topic_creation": {"type": "boolean"},
    "max_record_batch_bytes": {"type": "integer", "maximum": 2147483647},
    "max_broker_write_bytes": {"type": "integer", "maximum": 2147483647},
    "max_broker_buffered_records": {"type": "integer", "minimum": 1},
    "broker_buffer_bytes": {"type": "integer", "minimum": 1, "maximum": 2147483647},
    "broker_buffer_duration_ms": {"type": "integer", "minimum": 0},
    "partitioner": {
      "type": "object",
      "properties": {
        "type": {"type": "string"}
      },
      "required": ["type"]
    }
  }
}
)";

static constexpr int32_t KiB = 1 << 10;
static constexpr int32_t GiB = 1 << 30;

static const char* acksName(RequiredAcks acks) {
    if(acks == RequiredAcks::None()) return "none";
    if(acks == RequiredAcks::Leader()) return "leader";
    return "all";
}

static RequiredAcks parseAcks(const nlohmann::json& value) {
    if(value.is_string()) {
        auto& str = value.get_ref<const std::string&>();
        if(str == "none") return RequiredAcks::None();
        if(str == "leader") return RequiredAcks::Leader();
        if(str == "all") return RequiredAcks::AllISR();
    } else if(value.is_number_integer()) {
        auto v = value.get<int>();
        if(v == 0 || v == 1 || v == -1) return RequiredAcks{static_cast<int16_t>(v)};
    }
    throw Exception{fmt::format("Invalid \"acks\" value {}", value.dump())};
}

void ProducerConfig::validate() const {
    if(compression.empty())
        throw Exception{"At least one compression codec must be given (use \"none\" to disable compression)"};
    for(auto& codec : compression)
        codec.validate();
    if(acks != RequiredAcks::None() && acks != RequiredAcks::Leader() && acks != RequiredAcks::AllISR())
        throw Exception{fmt::format("Invalid required acks {}", acks.value)};
    if(maxRecordBatchBytes < KiB)
        throw Exception{fmt::format(
            "max_record_batch_bytes ({}) is less than the minimum of {}",
            maxRecordBatchBytes, KiB)};
    if(maxBrokerWriteBytes < KiB)
        throw Exception{fmt::format(
            "max_broker_write_bytes ({}) is less than the minimum of {}",
            maxBrokerWriteBytes, KiB)};
    if(maxBrokerWriteBytes < maxRecordBatchBytes)
        throw Exception{fmt::format(
            "max_broker_write_bytes ({}) is less than max_record_batch_bytes ({})",
            maxBrokerWriteBytes, maxRecordBatchBytes)};
    if(maxBrokerWriteBytes > GiB)
        throw Exception{fmt::format(
            "max_broker_write_bytes ({}) is more than the maximum of {}",
            maxBrokerWriteBytes, GiB)};
    if(maxBrokerBufferedRecords < 1)
        throw Exception{"max_broker_buffered_records must be at least 1"};
    if(brokerBufferBytes < 1)
        throw Exception{"broker_buffer_bytes must be at least 1"};
    if(brokerBufferDuration.count() < 0)
        throw Exception{"broker_buffer_duration_ms cannot be negative"};
    if(!partitioner)
        throw Exception{"A partitioner is required"};
}

nlohmann::json ProducerConfig::toJson() const {
    auto codecs = nlohmann::json::array();
    for(auto& codec : compression)
        codecs.push_back(CompressionCodecToJson(codec));
    return nlohmann::json{
        {"acks", acksName(acks)},
        {"compression", std::move(codecs)},
        {"allow_auto_topic_creation", allowAutoTopicCreation},
        {"max_record_batch_bytes", maxRecordBatchBytes},
        {"max_broker_write_bytes", maxBrokerWriteBytes},
        {"max_broker_buffered_records", maxBrokerBufferedRecords},
        {"broker_buffer_bytes", brokerBufferBytes},
        {"broker_buffer_duration_ms", brokerBufferDuration.count()},
        {"partitioner", partitioner ? partitioner.config() : nlohmann::json(nullptr)}
    };
}

ProducerConfig ProducerConfig::FromJson(const nlohmann::json& config) {
    static const JsonValidator validator{ProducerConfigSchema};
    validator.validateOrThrow(config, "producer");

    static const std::unordered_set<std::string> knownKeys = {
        "acks", "compression", "allow_auto_topic_creation", "max_record_batch_bytes",
        "max_broker_write_bytes", "max_broker_buffered_records", "broker_buffer_bytes",
        "broker_buffer_duration_ms", "partitioner"
    };
    for(auto& [key, value] : config.items()) {
        if(!knownKeys.count(key))
            spdlog::warn("[kcore:config] Ignoring unknown producer configuration key \"{}\"", key);
    }

    ProducerConfig result;
    if(config.contains("acks"))
        result.acks = parseAcks(config["acks"]);
    if(config.contains("compression")) {
        result.compression.clear();
        for(auto& codec : config["compression"])
            result.compression.push_back(ParseCompressionCodec(codec));
    }
    result.allowAutoTopicCreation = config.value("allow_auto_topic_creation", result.allowAutoTopicCreation);
    result.maxRecordBatchBytes = config.value("max_record_batch_bytes", result.maxRecordBatchBytes);
    result.maxBrokerWriteBytes = config.value("max_broker_write_bytes", result.maxBrokerWriteBytes);
    result.maxBrokerBufferedRecords = config.value("max_broker_buffered_records", result.maxBrokerBufferedRecords);
    result.brokerBufferBytes = config.value("broker_buffer_bytes", result.brokerBufferBytes);
    if(config.contains("broker_buffer_duration_ms"))
        result.brokerBufferDuration = std::chrono::milliseconds{
            config["broker_buffer_duration_ms"].get<int64_t>()};
    if(config.contains("partitioner"))
        result.partitioner = Partitioner::FromConfig(config["partitioner"]);
    result.validate();
    return result;
}

ProducerConfig ProducerConfig::FromFile(const std::string& filename) {
    std::ifstream inputFile(filename);
    if(!inputFile.is_open())
        throw Exception{fmt::format("Could not open config file {}", filename)};
    nlohmann::json config;
    try {
        inputFile >> config;
    } catch(const nlohmann::json::exception& ex) {
        throw Exception{fmt::format("Could not parse config file {}: {}", filename, ex.what())};
    }
    return FromJson(config);
}

}
