/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#include "kcore/RecordBatch.hpp"
#include "kcore/WireWriter.hpp"

namespace kcore {

std::size_t NumberedRecord::wireLength() const {
    return varintLength(lengthField) + static_cast<std::size_t>(lengthField);
}

RecordBatch::RecordBatch(std::string topic, int32_t partition)
: m_topic(std::move(topic))
, m_partition(partition) {}

NumberedRecord RecordBatch::number(std::shared_ptr<const Record> record) const {
    if(!record)
        throw Exception{"Cannot append a null record to a RecordBatch"};
    NumberedRecord nr;
    nr.offsetDelta    = static_cast<int32_t>(m_records.size());
    nr.timestampDelta = m_records.empty() ? 0 : record->timestamp - m_first_timestamp;

    std::size_t length = 1; // attributes
    length += varintLength(nr.timestampDelta);
    length += varintLength(nr.offsetDelta);
    length += varintBytesLength(record->key);
    length += varintBytesLength(record->value);
    length += varintLength(static_cast<int64_t>(record->headers.size()));
    for(const auto& header : record->headers) {
        length += varintLength(static_cast<int64_t>(header.key.size())) + header.key.size();
        length += varintBytesLength(header.value);
    }
    nr.lengthField = static_cast<int32_t>(length);
    nr.record = std::move(record);
    return nr;
}

const NumberedRecord& RecordBatch::append(std::shared_ptr<const Record> record) {
    if(m_sealed)
        throw Exception{"Cannot append to a sealed RecordBatch"};
    auto nr = number(std::move(record));
    if(m_records.empty())
        m_first_timestamp = nr.record->timestamp;
    m_wire_length += nr.wireLength();
    m_records.push_back(std::move(nr));
    return m_records.back();
}

bool RecordBatch::tryAppend(std::shared_ptr<const Record> record, std::size_t maxBytes) {
    if(m_sealed)
        throw Exception{"Cannot append to a sealed RecordBatch"};
    if(m_records.empty()) {
        append(std::move(record));
        return true;
    }
    auto nr = number(std::move(record));
    if(m_wire_length - 4 + nr.wireLength() > maxBytes)
        return false;
    m_wire_length += nr.wireLength();
    m_records.push_back(std::move(nr));
    return true;
}

}
