/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#include <catch2/catch_test_macros.hpp>
#include <kcore/ProducerConfig.hpp>
#include <spdlog/spdlog.h>
#include "Ensure.hpp"
#include <fstream>

using nlohmann::json;

TEST_CASE("ProducerConfig test", "[producer-config]") {

    spdlog::set_level(spdlog::level::from_str("error"));

    SECTION("Defaults") {
        kcore::ProducerConfig config;
        REQUIRE_NOTHROW(config.validate());
        REQUIRE(config.acks == kcore::RequiredAcks::Leader());
        REQUIRE(config.compression == std::vector<kcore::CompressionCodec>{kcore::CompressionCodec::None()});
        REQUIRE(config.maxRecordBatchBytes == 1000000);
        REQUIRE(config.maxBrokerWriteBytes == 100 * 1024 * 1024);
        REQUIRE(config.brokerBufferBytes == 1024 * 1024 * 1024);
        REQUIRE(config.brokerBufferDuration == std::chrono::milliseconds{250});
        REQUIRE(!config.allowAutoTopicCreation);
        REQUIRE(config.partitioner.config()["type"] == "random");

        auto fromEmpty = kcore::ProducerConfig::FromJson(json::object());
        REQUIRE(fromEmpty.toJson() == config.toJson());
    }

    SECTION("Reading every field") {
        auto config = kcore::ProducerConfig::FromJson(json::parse(R"(
            {
                "acks": "all",
                "compression": ["zstd", {"type": "gzip", "level": 4}, "none"],
                "allow_auto_topic_creation": true,
                "max_record_batch_bytes": 2048,
                "max_broker_write_bytes": 4096,
                "max_broker_buffered_records": 1000,
                "broker_buffer_bytes": 65536,
                "broker_buffer_duration_ms": 10,
                "partitioner": {"type": "sticky_key", "hasher": "sarama"}
            }
        )"));
        REQUIRE(config.acks == kcore::RequiredAcks::AllISR());
        REQUIRE(config.compression.size() == 3);
        REQUIRE(config.compression[0] == kcore::CompressionCodec::Zstd());
        REQUIRE(config.compression[1] == kcore::CompressionCodec::Gzip().withLevel(4));
        REQUIRE(config.compression[2] == kcore::CompressionCodec::None());
        REQUIRE(config.allowAutoTopicCreation);
        REQUIRE(config.maxRecordBatchBytes == 2048);
        REQUIRE(config.maxBrokerWriteBytes == 4096);
        REQUIRE(config.maxBrokerBufferedRecords == 1000);
        REQUIRE(config.brokerBufferBytes == 65536);
        REQUIRE(config.brokerBufferDuration == std::chrono::milliseconds{10});
        REQUIRE(config.partitioner.config()["hasher"] == "sarama");

        auto again = kcore::ProducerConfig::FromJson(config.toJson());
        REQUIRE(again.toJson() == config.toJson());
    }

    SECTION("Numeric acks") {
        REQUIRE(kcore::ProducerConfig::FromJson({{"acks", 0}}).acks == kcore::RequiredAcks::None());
        REQUIRE(kcore::ProducerConfig::FromJson({{"acks", -1}}).acks == kcore::RequiredAcks::AllISR());
        REQUIRE_THROWS_AS(kcore::ProducerConfig::FromJson({{"acks", 2}}), kcore::Exception);
        REQUIRE_THROWS_AS(kcore::ProducerConfig::FromJson({{"acks", "some"}}), kcore::Exception);
    }

    SECTION("Size limits") {
        REQUIRE_THROWS_AS(kcore::ProducerConfig::FromJson({{"max_record_batch_bytes", 1023}}), kcore::Exception);
        REQUIRE_THROWS_AS(kcore::ProducerConfig::FromJson({{"max_broker_write_bytes", 1023}}), kcore::Exception);
        REQUIRE_THROWS_AS(kcore::ProducerConfig::FromJson(
            {{"max_record_batch_bytes", 8192}, {"max_broker_write_bytes", 4096}}), kcore::Exception);
        REQUIRE_THROWS_AS(kcore::ProducerConfig::FromJson(
            {{"max_broker_write_bytes", (1 << 30) + 1}}), kcore::Exception);
        REQUIRE_NOTHROW(kcore::ProducerConfig::FromJson(
            {{"max_record_batch_bytes", 1024}, {"max_broker_write_bytes", 1024}}));
    }

    SECTION("Sizes beyond 32 bits") {
        REQUIRE_THROWS_AS(kcore::ProducerConfig::FromJson(json::parse(
            R"({"max_record_batch_bytes": 4294968320, "max_broker_write_bytes": 4294969344})")),
            kcore::Exception);
        REQUIRE_THROWS_AS(kcore::ProducerConfig::FromJson(json::parse(
            R"({"broker_buffer_bytes": 4294967297})")), kcore::Exception);
        REQUIRE_NOTHROW(kcore::ProducerConfig::FromJson(json::parse(
            R"({"broker_buffer_bytes": 2147483647})")));
    }

    SECTION("Default sticky_key partitioner round-trips") {
        kcore::ProducerConfig config;
        config.partitioner = kcore::Partitioner::StickyKey();
        auto again = kcore::ProducerConfig::FromJson(config.toJson());
        REQUIRE(again.partitioner.config()["hasher"] == "kafka");
    }

    SECTION("Invalid codecs and types") {
        REQUIRE_THROWS_AS(kcore::ProducerConfig::FromJson(
            {{"compression", {"brotli"}}}), kcore::Exception);
        REQUIRE_THROWS_AS(kcore::ProducerConfig::FromJson(
            json::parse(R"({"compression": [{"type": "lz4", "level": 17}]})")), kcore::Exception);
        REQUIRE_THROWS_AS(kcore::ProducerConfig::FromJson(
            json::parse(R"({"compression": []})")), kcore::Exception);
        REQUIRE_THROWS_AS(kcore::ProducerConfig::FromJson(
            {{"broker_buffer_duration_ms", "soon"}}), kcore::Exception);
        REQUIRE_THROWS_AS(kcore::ProducerConfig::FromJson(
            json::parse(R"({"partitioner": {"type": "unknown"}})")), kcore::Exception);
    }

    SECTION("Reading from a file") {
        {
            std::ofstream f{"producer.json"};
            f << R"({"acks": "none", "compression": ["lz4"]})";
        }
        auto remove_file = EnsureFileRemoved{"producer.json"};
        auto config = kcore::ProducerConfig::FromFile("producer.json");
        REQUIRE(config.acks == kcore::RequiredAcks::None());
        REQUIRE(config.compression[0] == kcore::CompressionCodec::Lz4());
        REQUIRE_THROWS_AS(kcore::ProducerConfig::FromFile("does-not-exist.json"), kcore::Exception);
    }

    SECTION("Malformed file") {
        {
            std::ofstream f{"broken.json"};
            f << "{\"acks\": ";
        }
        auto remove_file = EnsureFileRemoved{"broken.json"};
        REQUIRE_THROWS_AS(kcore::ProducerConfig::FromFile("broken.json"), kcore::Exception);
    }
}
