/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <kcore/BatchEncoder.hpp>
#include <kcore/WireReader.hpp>
#include <kcore/Crc32c.hpp>
#include <spdlog/spdlog.h>

static constexpr std::size_t RecordsOffset = kcore::RecordBatch::HeaderWireLength;

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

struct BatchHeader {
    int32_t  nullableBytesLength;
    int64_t  baseOffset;
    int32_t  batchLength;
    int32_t  leaderEpoch;
    int8_t   magic;
    uint32_t crc;
    int16_t  attributes;
    int32_t  lastOffsetDelta;
    int64_t  firstTimestamp;
    int64_t  maxTimestamp;
    int64_t  producerId;
    int16_t  producerEpoch;
    int32_t  baseSequence;
    int32_t  count;
};

static BatchHeader readHeader(const std::vector<char>& out) {
    kcore::WireReader reader{std::string_view{out.data(), out.size()}};
    BatchHeader h;
    h.nullableBytesLength = reader.readInt32();
    h.baseOffset          = reader.readInt64();
    h.batchLength         = reader.readInt32();
    h.leaderEpoch         = reader.readInt32();
    h.magic               = reader.readInt8();
    h.crc                 = static_cast<uint32_t>(reader.readInt32());
    h.attributes          = reader.readInt16();
    h.lastOffsetDelta     = reader.readInt32();
    h.firstTimestamp      = reader.readInt64();
    h.maxTimestamp        = reader.readInt64();
    h.producerId          = reader.readInt64();
    h.producerEpoch       = reader.readInt16();
    h.baseSequence        = reader.readInt32();
    h.count               = reader.readInt32();
    return h;
}

static uint32_t checksumAfterCrc(const std::vector<char>& out) {
    constexpr std::size_t from = 4 + 8 + 4 + 4 + 1 + 4;
    return kcore::crc32c({out.data() + from, out.size() - from});
}

TEST_CASE("BatchEncoder test", "[batch-encoder]") {

    spdlog::set_level(spdlog::level::from_str("error"));

    SECTION("Single uncompressed record") {
        kcore::RecordBatch batch{"t", 0};
        batch.append(makeRecord("k", "v", 1000));
        batch.seal();

        std::vector<char> out;
        kcore::BatchEncoder encoder;
        REQUIRE(encoder.encode(batch, out) == 74);

        const unsigned char expected[] = {
            0x00, 0x00, 0x00, 0x46, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
            0x00, 0x00, 0x00, 0x3a, 0xff, 0xff, 0xff, 0xff, 0x02, 0x71, 0x6a, 0x61,
            0x89, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
            0x00, 0x03, 0xe8, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x03, 0xe8, 0xff,
            0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
            0xff, 0x00, 0x00, 0x00, 0x01, 0x10, 0x00, 0x00, 0x00, 0x02, 0x6b, 0x02,
            0x76, 0x00
        };
        REQUIRE(out.size() == sizeof(expected));
        for(std::size_t i = 0; i < sizeof(expected); ++i)
            REQUIRE(static_cast<unsigned char>(out[i]) == expected[i]);
    }

    SECTION("Encoding appends to the output") {
        kcore::RecordBatch batch{"t", 0};
        batch.append(makeRecord("k", "v", 1000));
        batch.seal();
        std::vector<char> out(10, 'x');
        REQUIRE(kcore::BatchEncoder{}.encode(batch, out) == 74);
        REQUIRE(out.size() == 84);
        REQUIRE(out[9] == 'x');
    }

    SECTION("Length fields, timestamps and checksum") {
        kcore::RecordBatch batch{"t", 1};
        for(int i = 0; i < 20; ++i)
            batch.append(makeRecord("key-" + std::to_string(i), std::string(50, static_cast<char>('a' + i % 3)), 2000 + i * 10));
        batch.seal();

        std::vector<char> out;
        kcore::BatchEncoder{}.encode(batch, out);
        auto h = readHeader(out);
        REQUIRE(static_cast<std::size_t>(h.nullableBytesLength) == out.size() - 4);
        REQUIRE(h.batchLength == h.nullableBytesLength - 12);
        REQUIRE(out.size() == batch.wireLength());
        REQUIRE(h.baseOffset == 0);
        REQUIRE(h.leaderEpoch == -1);
        REQUIRE(h.magic == 2);
        REQUIRE(h.attributes == 0);
        REQUIRE(h.lastOffsetDelta == 19);
        REQUIRE(h.firstTimestamp == 2000);
        REQUIRE(h.maxTimestamp == 2190);
        REQUIRE(h.producerId == -1);
        REQUIRE(h.producerEpoch == -1);
        REQUIRE(h.baseSequence == -1);
        REQUIRE(h.count == 20);
        REQUIRE(h.crc == checksumAfterCrc(out));
    }

    SECTION("Compressed batches") {
        auto codec = GENERATE(kcore::CompressionCodec::Gzip(),
                              kcore::CompressionCodec::Snappy(),
                              kcore::CompressionCodec::Lz4(),
                              kcore::CompressionCodec::Zstd());

        kcore::RecordBatch batch{"t", 0};
        for(int i = 0; i < 50; ++i)
            batch.append(makeRecord(std::nullopt, std::string(200, 'z'), 5000));
        batch.seal();

        std::vector<char> plain;
        kcore::BatchEncoder{}.encode(batch, plain);

        std::vector<char> out;
        kcore::BatchEncoder encoder{kcore::Compressor{codec}};
        auto written = encoder.encode(batch, out);
        REQUIRE(written == out.size());
        REQUIRE(out.size() < plain.size());

        auto h = readHeader(out);
        REQUIRE(static_cast<std::size_t>(h.nullableBytesLength) == out.size() - 4);
        REQUIRE(h.batchLength == h.nullableBytesLength - 12);
        REQUIRE((h.attributes & 0x07) == static_cast<int16_t>(codec.type));
        REQUIRE(h.count == 50);
        REQUIRE(h.crc == checksumAfterCrc(out));

        auto records = kcore::decompress(
            codec.type, {out.data() + RecordsOffset, out.size() - RecordsOffset});
        REQUIRE(std::string(records.begin(), records.end())
             == std::string(plain.begin() + RecordsOffset, plain.end()));
    }

    SECTION("Compression never grows a batch") {
        auto codec = GENERATE(kcore::CompressionCodec::Gzip(), kcore::CompressionCodec::Snappy(),
                              kcore::CompressionCodec::Lz4(), kcore::CompressionCodec::Zstd());
        INFO("codec: " << kcore::compressionTypeName(codec.type));
        kcore::RecordBatch batch{"t", 0};
        batch.append(makeRecord("k", "v", 0));
        batch.seal();

        std::vector<char> plain;
        kcore::BatchEncoder{}.encode(batch, plain);

        std::vector<char> out;
        kcore::BatchEncoder{kcore::Compressor{codec}}.encode(batch, out);
        REQUIRE(out.size() <= plain.size());
        REQUIRE(out == plain);
        REQUIRE(readHeader(out).attributes == 0);
    }

    SECTION("Empty or unsealed batches are rejected") {
        std::vector<char> out;
        kcore::RecordBatch empty{"t", 0};
        empty.seal();
        REQUIRE_THROWS_AS(kcore::BatchEncoder{}.encode(empty, out), kcore::Exception);

        kcore::RecordBatch open{"t", 0};
        open.append(makeRecord("k", "v", 0));
        REQUIRE_THROWS_AS(kcore::BatchEncoder{}.encode(open, out), kcore::Exception);
        REQUIRE(out.empty());
    }
}
