/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#include <catch2/catch_test_macros.hpp>
#include <kcore/RecordBatch.hpp>
#include <spdlog/spdlog.h>

static std::shared_ptr<const kcore::Record> makeRecord(
        std::optional<std::string> key,
        std::optional<std::string> value,
        int64_t timestamp) {
    auto record = std::make_shared<kcore::Record>();
    record->key       = std::move(key);
    record->value     = std::move(value);
    record->timestamp = timestamp;
    return record;
}

TEST_CASE("RecordBatch test", "[record-batch]") {

    spdlog::set_level(spdlog::level::from_str("error"));

    kcore::RecordBatch batch{"mytopic", 3};
    REQUIRE(batch.empty());
    REQUIRE(batch.topic() == "mytopic");
    REQUIRE(batch.partition() == 3);
    REQUIRE(batch.wireLength() == kcore::RecordBatch::HeaderWireLength);
    REQUIRE(kcore::RecordBatch::HeaderWireLength == 65);

    SECTION("Numbering records") {
        auto& first = batch.append(makeRecord("k", "v", 1000));
        REQUIRE(first.offsetDelta == 0);
        REQUIRE(first.timestampDelta == 0);
        // attributes, timestamp delta, offset delta, key, value, header count
        REQUIRE(first.lengthField == 1 + 1 + 1 + 2 + 2 + 1);
        REQUIRE(first.wireLength() == 9);
        REQUIRE(batch.wireLength() == 65 + 9);

        auto& second = batch.append(makeRecord(std::nullopt, std::string(100, 'x'), 1500));
        REQUIRE(second.offsetDelta == 1);
        REQUIRE(second.timestampDelta == 500);
        // 500 and 100 take two bytes as varints, a null key takes one
        REQUIRE(second.lengthField == 1 + 2 + 1 + 1 + (2 + 100) + 1);
        REQUIRE(second.wireLength() == 2 + second.lengthField);

        REQUIRE(batch.count() == 2);
        REQUIRE(batch.firstTimestamp() == 1000);
        REQUIRE(batch.wireLength() == 65 + 9 + second.wireLength());
    }

    SECTION("Timestamps older than the first record give negative deltas") {
        batch.append(makeRecord("a", "b", 1000));
        auto& nr = batch.append(makeRecord("a", "b", 999));
        REQUIRE(nr.timestampDelta == -1);
    }

    SECTION("Headers count in the record length") {
        auto record = std::make_shared<kcore::Record>();
        record->headers.push_back({"h1", std::string{"abc"}});
        record->headers.push_back({"h2", std::nullopt});
        auto& nr = batch.append(record);
        // attrs, ts delta, offset delta, null key, null value, count,
        // then (1 + 2) + (1 + 3) and (1 + 2) + 1 for the headers
        REQUIRE(nr.lengthField == 1 + 1 + 1 + 1 + 1 + 1 + 7 + 4);
    }

    SECTION("tryAppend respects the size limit") {
        auto limit = kcore::RecordBatch::HeaderWireLength - 4 + 9 + 9;
        REQUIRE(batch.tryAppend(makeRecord("k", "v", 0), limit));
        REQUIRE(batch.tryAppend(makeRecord("k", "v", 0), limit));
        REQUIRE(!batch.tryAppend(makeRecord("k", "v", 0), limit));
        REQUIRE(batch.count() == 2);
        REQUIRE(!batch.exceeds(limit));
        REQUIRE(batch.exceeds(limit - 1));
    }

    SECTION("The first record is always accepted") {
        REQUIRE(batch.tryAppend(makeRecord("k", std::string(1000, 'v'), 0), 10));
        REQUIRE(batch.count() == 1);
        REQUIRE(batch.exceeds(10));
    }

    SECTION("Sealed batches and null records") {
        REQUIRE_THROWS_AS(batch.append(nullptr), kcore::Exception);
        batch.append(makeRecord("k", "v", 0));
        batch.seal();
        REQUIRE(batch.sealed());
        REQUIRE_THROWS_AS(batch.append(makeRecord("k", "v", 0)), kcore::Exception);
        REQUIRE_THROWS_AS(batch.tryAppend(makeRecord("k", "v", 0), 1 << 20), kcore::Exception);
    }
}
