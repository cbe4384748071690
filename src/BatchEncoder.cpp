/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#include "kcore/BatchEncoder.hpp"
#include "kcore/WireWriter.hpp"
#include "kcore/Crc32c.hpp"

#include <spdlog/spdlog.h>
#include <string_view>

namespace kcore {

static void appendRecord(WireWriter& writer, const NumberedRecord& nr) {
    const auto& r = *nr.record;
    writer.appendVarint(nr.lengthField);
    writer.appendInt8(0); // attributes, unused
    writer.appendVarlong(nr.timestampDelta);
    writer.appendVarint(nr.offsetDelta);
    writer.appendVarintBytes(r.key);
    writer.appendVarintBytes(r.value);
    writer.appendVarint(static_cast<int32_t>(r.headers.size()));
    for(const auto& h : r.headers) {
        writer.appendVarintString(h.key);
        writer.appendVarintBytes(h.value);
    }
}

std::size_t BatchEncoder::encode(const RecordBatch& batch, std::vector<char>& out) const {
    if(batch.empty())
        throw Exception{"Cannot encode an empty RecordBatch"};
    if(!batch.sealed())
        throw Exception{"Cannot encode a RecordBatch that is not sealed"};

    WireWriter writer{out};
    const auto start = writer.size();

    auto nullableBytesLen = static_cast<int32_t>(batch.wireLength() - 4);
    const auto nullableBytesLenAt = writer.size();
    writer.appendInt32(nullableBytesLen);

    writer.appendInt64(0); // base offset, assigned by the broker

    auto batchLen = nullableBytesLen - 8 - 4;
    const auto batchLenAt = writer.size();
    writer.appendInt32(batchLen);

    writer.appendInt32(-1); // partition leader epoch
    writer.appendInt8(2);   // magic

    const auto crcAt = writer.size();
    writer.appendInt32(0);

    auto attrs = batch.attributes();
    const auto attrsAt = writer.size();
    writer.appendInt16(attrs);

    const auto& records = batch.records();
    writer.appendInt32(static_cast<int32_t>(records.size() - 1)); // last offset delta
    writer.appendInt64(batch.firstTimestamp());
    writer.appendInt64(batch.firstTimestamp() + records.back().timestampDelta);

    writer.appendInt64(-1); // producer id
    writer.appendInt16(-1); // producer epoch
    writer.appendInt32(-1); // base sequence

    writer.appendArrayLen(records.size());
    const auto recordsAt = writer.size();
    for(const auto& nr : records)
        appendRecord(writer, nr);

    if(m_compressor) {
        std::string_view toCompress{out.data() + recordsAt, out.size() - recordsAt};
        std::vector<char> compressed;
        if(m_compressor.compress(toCompress, compressed)
        && !compressed.empty()
        && compressed.size() < toCompress.size()) {
            auto savings = static_cast<int32_t>(toCompress.size() - compressed.size());
            out.resize(recordsAt);
            writer.write(compressed.data(), compressed.size());
            nullableBytesLen -= savings;
            batchLen -= savings;
            attrs |= m_compressor.attributes();
            writer.patchInt32(nullableBytesLenAt, nullableBytesLen);
            writer.patchInt32(batchLenAt, batchLen);
            writer.patchInt16(attrsAt, attrs);
        } else {
            spdlog::trace("[kcore:encoder] Keeping {} uncompressed bytes of records for {}[{}]",
                          toCompress.size(), batch.topic(), batch.partition());
        }
    }

    const auto crcFrom = crcAt + 4;
    auto crc = crc32c(std::string_view{out.data() + crcFrom, out.size() - crcFrom});
    writer.patchInt32(crcAt, static_cast<int32_t>(crc));

    return writer.size() - start;
}

}
