/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#include "kcore/ProduceRequest.hpp"
#include "kcore/BatchEncoder.hpp"
#include "kcore/WireWriter.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace kcore {

void ProduceRequest::setVersion(int16_t version) {
    if(version < MinVersion || version > MaxVersion)
        throw Exception{fmt::format(
            "Unsupported produce request version {} (supported: {} to {})",
            version, MinVersion, MaxVersion)};
    m_version = version;
}

void ProduceRequest::addBatch(const RecordBatch& batch) {
    auto& partitions = m_batches[batch.topic()];
    auto inserted = partitions.emplace(batch.partition(), &batch).second;
    if(!inserted)
        throw Exception{fmt::format(
            "ProduceRequest already holds a batch for {}[{}]",
            batch.topic(), batch.partition())};
}

std::size_t ProduceRequest::numBatches() const {
    std::size_t count = 0;
    for(const auto& [topic, partitions] : m_batches)
        count += partitions.size();
    return count;
}

void ProduceRequest::appendTo(std::vector<char>& out) const {
    BatchEncoder encoder{Compressor::Negotiate(m_compression, m_version)};
    spdlog::trace("[kcore:produce] Encoding {} batches with v{} and {} compression",
                  numBatches(), m_version,
                  compressionTypeName(encoder.compressor().codec().type));

    WireWriter writer{out};
    writer.appendNullableString(std::nullopt); // transactional id
    writer.appendInt16(m_acks.value);
    writer.appendInt32(m_timeout_ms);
    writer.appendArrayLen(m_batches.size());
    for(const auto& [topic, partitions] : m_batches) {
        writer.appendString(topic);
        writer.appendArrayLen(partitions.size());
        for(const auto& [partition, batch] : partitions) {
            writer.appendInt32(partition);
            encoder.encode(*batch, out);
        }
    }
}

}
