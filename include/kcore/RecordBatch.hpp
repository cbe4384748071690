/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef KCORE_RECORD_BATCH_HPP
#define KCORE_RECORD_BATCH_HPP

#include <kcore/ForwardDcl.hpp>
#include <kcore/Record.hpp>
#include <kcore/Exception.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace kcore {

/**
 * @brief A Record annotated with its position in a RecordBatch.
 */
struct NumberedRecord {

    std::shared_ptr<const Record> record;
    /* length of the encoded record, excluding the length varint itself */
    int32_t lengthField    = 0;
    int64_t timestampDelta = 0;
    int32_t offsetDelta    = 0;

    /**
     * @brief Full encoded size of the record, length varint included.
     */
    std::size_t wireLength() const;
};

/**
 * @brief A RecordBatch is an ordered, append-only group of records
 * destined to a single topic partition. Records are referenced, not
 * copied: the batch keeps them alive until it is destroyed.
 *
 * Once sealed, the batch can only be encoded (see BatchEncoder).
 */
class RecordBatch {

    public:

    /**
     * @brief Size of the batch fields preceding the records, including
     * the leading nullable-bytes length field.
     */
    static constexpr std::size_t HeaderWireLength =
        4   /* nullable bytes length */
      + 8   /* base offset */
      + 4   /* batch length */
      + 4   /* partition leader epoch */
      + 1   /* magic */
      + 4   /* crc */
      + 2   /* attributes */
      + 4   /* last offset delta */
      + 8   /* first timestamp */
      + 8   /* max timestamp */
      + 8   /* producer id */
      + 2   /* producer epoch */
      + 4   /* base sequence */
      + 4;  /* record count */

    RecordBatch(std::string topic, int32_t partition);

    RecordBatch(RecordBatch&&) = default;
    RecordBatch& operator=(RecordBatch&&) = default;
    RecordBatch(const RecordBatch&) = delete;
    RecordBatch& operator=(const RecordBatch&) = delete;

    /**
     * @brief Appends a record to the batch and returns its numbering.
     * Throws an Exception if the batch is sealed.
     */
    const NumberedRecord& append(std::shared_ptr<const Record> record);

    /**
     * @brief Appends the record only if the batch, once encoded without
     * compression, would not exceed maxBytes (not counting the leading
     * nullable-bytes length). An empty batch always accepts a record.
     *
     * @return whether the record was appended.
     */
    bool tryAppend(std::shared_ptr<const Record> record, std::size_t maxBytes);

    /**
     * @brief Whether the batch, without its leading length field,
     * is larger than maxBytes.
     */
    bool exceeds(std::size_t maxBytes) const {
        return m_wire_length - 4 > maxBytes;
    }

    void seal() {
        m_sealed = true;
    }

    bool sealed() const {
        return m_sealed;
    }

    const std::string& topic() const {
        return m_topic;
    }

    int32_t partition() const {
        return m_partition;
    }

    std::size_t count() const {
        return m_records.size();
    }

    bool empty() const {
        return m_records.empty();
    }

    const std::vector<NumberedRecord>& records() const {
        return m_records;
    }

    int64_t firstTimestamp() const {
        return m_first_timestamp;
    }

    int16_t attributes() const {
        return m_attributes;
    }

    /**
     * @brief Uncompressed encoded size of the batch, including the leading
     * nullable-bytes length field.
     */
    std::size_t wireLength() const {
        return m_wire_length;
    }

    private:

    NumberedRecord number(std::shared_ptr<const Record> record) const;

    std::string                 m_topic;
    int32_t                     m_partition;
    std::vector<NumberedRecord> m_records;
    int64_t                     m_first_timestamp = 0;
    int16_t                     m_attributes = 0;
    std::size_t                 m_wire_length = HeaderWireLength;
    bool                        m_sealed = false;
};

}

#endif
