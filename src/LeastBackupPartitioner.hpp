/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef KCORE_LEAST_BACKUP_PARTITIONER_HPP
#define KCORE_LEAST_BACKUP_PARTITIONER_HPP

#include "kcore/Partitioner.hpp"

#include <limits>

namespace kcore {

/**
 * @brief Pins the partition with the fewest buffered records until the
 * next batch. Ties go to the first partition seen.
 */
class LeastBackupTopicPartitioner : public TopicBackupPartitioner {

    public:

    void onNewBatch() override {
        m_on_part = -1;
    }

    bool requiresConsistency(const Record&) const override {
        return false;
    }

    int32_t partition(const Record&, int32_t) override {
        throw Exception{"LeastBackupTopicPartitioner can only partition by backup"};
    }

    int32_t partitionByBackup(const Record&, int32_t n, PartitionBackups& backups) override {
        if(m_on_part == -1 || m_on_part >= n) {
            auto least = std::numeric_limits<int64_t>::max();
            for(int32_t i = 0; i < n; ++i) {
                auto [pick, buffered] = backups.next();
                if(buffered < least) {
                    least     = buffered;
                    m_on_part = pick;
                }
            }
        }
        return m_on_part;
    }

    private:

    int32_t m_on_part = -1;
};

class LeastBackupPartitioner : public PartitionerInterface {

    public:

    std::unique_ptr<TopicPartitioner> forTopic(std::string_view) override {
        return std::make_unique<LeastBackupTopicPartitioner>();
    }

    nlohmann::json config() const override {
        return nlohmann::json{{"type", "least_backup"}};
    }

    static std::unique_ptr<PartitionerInterface> create(const nlohmann::json&) {
        return std::make_unique<LeastBackupPartitioner>();
    }
};

}

#endif
