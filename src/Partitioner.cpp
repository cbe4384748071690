/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#include "kcore/Partitioner.hpp"
#include "PimplUtil.hpp"
#include "BasicPartitioner.hpp"
#include "StickyPartitioner.hpp"
#include "LeastBackupPartitioner.hpp"
#include "RandomPartitioner.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace kcore {

KCORE_REGISTER_PARTITIONER(manual, ManualPartitioner);
KCORE_REGISTER_PARTITIONER(sticky, StickyPartitioner);
KCORE_REGISTER_PARTITIONER(sticky_key, StickyKeyPartitioner);
KCORE_REGISTER_PARTITIONER(least_backup, LeastBackupPartitioner);
KCORE_REGISTER_PARTITIONER(random, RandomPartitioner);

std::pair<int32_t, int64_t> PartitionBackups::next() {
    if(m_on >= m_n)
        throw Exception{fmt::format(
            "PartitionBackups::next called more than {} times", m_n)};
    auto on = m_on++;
    return {on, m_buffered ? m_buffered(on) : 0};
}

std::unique_ptr<PartitionerInterface> StickyKeyPartitioner::create(const nlohmann::json& config) {
    std::string hasher = "kafka";
    if(config.contains("hasher")) {
        if(!config["hasher"].is_string())
            throw Exception{"Invalid \"hasher\" field in sticky_key partitioner (expected string)"};
        hasher = config["hasher"].get<std::string>();
    }
    if(hasher == "kafka")
        return std::make_unique<StickyKeyPartitioner>(KafkaHasher(), hasher);
    if(hasher == "sarama")
        return std::make_unique<StickyKeyPartitioner>(SaramaHasher(), hasher);
    throw Exception{fmt::format(
        "Unknown hasher \"{}\" in sticky_key partitioner (expected \"kafka\" or \"sarama\")",
        hasher)};
}

using PartitionerImpl = PartitionerInterface;

PIMPL_DEFINE_COMMON_FUNCTIONS(Partitioner);

std::unique_ptr<TopicPartitioner> Partitioner::forTopic(std::string_view topic) const {
    if(!self) throw Exception{"Calling Partitioner::forTopic on an invalid Partitioner"};
    return self->forTopic(topic);
}

nlohmann::json Partitioner::config() const {
    if(!self) throw Exception{"Calling Partitioner::config on an invalid Partitioner"};
    return self->config();
}

Partitioner Partitioner::Manual() {
    return Partitioner{std::make_shared<ManualPartitioner>()};
}

Partitioner Partitioner::BasicConsistent(
        std::function<std::function<int32_t(const Record&, int32_t)>(std::string_view)> fn) {
    if(!fn) throw Exception{"BasicConsistent partitioner requires a function"};
    return Partitioner{std::make_shared<BasicPartitioner>(std::move(fn))};
}

Partitioner Partitioner::Sticky() {
    return Partitioner{std::make_shared<StickyPartitioner>()};
}

Partitioner Partitioner::StickyKey(PartitionerHasher hasher) {
    if(!hasher)
        return Partitioner{std::make_shared<StickyKeyPartitioner>(KafkaHasher(), "kafka")};
    return Partitioner{std::make_shared<StickyKeyPartitioner>(std::move(hasher), "custom")};
}

Partitioner Partitioner::LeastBackup() {
    return Partitioner{std::make_shared<LeastBackupPartitioner>()};
}

Partitioner Partitioner::Random() {
    return Partitioner{std::make_shared<RandomPartitioner>()};
}

Partitioner Partitioner::FromConfig(const nlohmann::json& config) {
    if(!config.is_object())
        throw Exception{"Cannot create Partitioner from configuration: expected JSON object"};
    if(!config.contains("type"))
        throw Exception{"Cannot create Partitioner from configuration: missing \"type\" field"};
    auto& type = config["type"];
    if(!type.is_string())
        throw Exception{"Cannot create Partitioner from configuration: "
                        "invalid \"type\" field (expected string)"};
    auto& type_str = type.get_ref<const std::string&>();
    spdlog::debug("[kcore:partitioner] Creating partitioner of type \"{}\"", type_str);
    std::shared_ptr<PartitionerInterface> impl = PartitionerFactory::create(type_str, config);
    return impl;
}

int32_t selectPartition(TopicPartitioner& partitioner,
                        const Record& record,
                        int32_t n,
                        const PartitionBackups::BufferedFn& buffered) {
    if(n <= 0)
        throw Exception{fmt::format("Cannot partition a record among {} partitions", n)};
    if(auto backup = dynamic_cast<TopicBackupPartitioner*>(&partitioner)) {
        PartitionBackups backups{n, buffered};
        return backup->partitionByBackup(record, n, backups);
    }
    return partitioner.partition(record, n);
}

}
