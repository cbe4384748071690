/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef KCORE_BASIC_PARTITIONER_HPP
#define KCORE_BASIC_PARTITIONER_HPP

#include "kcore/Partitioner.hpp"

namespace kcore {

/**
 * @brief Partitioner wrapping a single function (topic) -> (record, n) -> index.
 * Records always require consistency and batches have no effect.
 */
class BasicPartitioner : public PartitionerInterface {

    public:

    using PartitionFn = std::function<int32_t(const Record&, int32_t)>;
    using TopicFn     = std::function<PartitionFn(std::string_view)>;

    class ForTopicPartitioner : public TopicPartitioner {

        public:

        ForTopicPartitioner(PartitionFn fn)
        : m_fn(std::move(fn)) {}

        void onNewBatch() override {}

        bool requiresConsistency(const Record&) const override {
            return true;
        }

        int32_t partition(const Record& record, int32_t n) override {
            return m_fn(record, n);
        }

        private:

        PartitionFn m_fn;
    };

    BasicPartitioner(TopicFn fn, std::string type = "basic_consistent")
    : m_fn(std::move(fn))
    , m_type(std::move(type)) {}

    std::unique_ptr<TopicPartitioner> forTopic(std::string_view topic) override {
        return std::make_unique<ForTopicPartitioner>(m_fn(topic));
    }

    nlohmann::json config() const override {
        return nlohmann::json{{"type", m_type}};
    }

    private:

    TopicFn     m_fn;
    std::string m_type;
};

/**
 * @brief Partitioner returning the partition already set in the record.
 * The partition is not validated against the number of partitions.
 */
class ManualPartitioner : public BasicPartitioner {

    public:

    ManualPartitioner()
    : BasicPartitioner(
        [](std::string_view) -> PartitionFn {
            return [](const Record& record, int32_t) { return record.partition; };
        }, "manual") {}

    static std::unique_ptr<PartitionerInterface> create(const nlohmann::json&) {
        return std::make_unique<ManualPartitioner>();
    }
};

}

#endif
