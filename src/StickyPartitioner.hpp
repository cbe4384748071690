/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef KCORE_STICKY_PARTITIONER_HPP
#define KCORE_STICKY_PARTITIONER_HPP

#include "kcore/Partitioner.hpp"

#include <random>

namespace kcore {

/**
 * @brief Pins a random partition until the next batch. A new pin never
 * repeats the previous one when there is more than one partition.
 */
class StickyTopicPartitioner : public TopicPartitioner {

    public:

    StickyTopicPartitioner()
    : m_rng(std::random_device{}()) {}

    void onNewBatch() override {
        m_last_part = m_on_part;
        m_on_part   = -1;
    }

    bool requiresConsistency(const Record&) const override {
        return false;
    }

    int32_t partition(const Record&, int32_t n) override {
        if(m_on_part == -1 || m_on_part >= n) {
            std::uniform_int_distribution<int32_t> dist{0, n - 1};
            m_on_part = dist(m_rng);
            if(m_on_part == m_last_part)
                m_on_part = (m_on_part + 1) % n;
        }
        return m_on_part;
    }

    private:

    int32_t      m_last_part = -1;
    int32_t      m_on_part   = -1;
    std::mt19937 m_rng;
};

class StickyPartitioner : public PartitionerInterface {

    public:

    std::unique_ptr<TopicPartitioner> forTopic(std::string_view) override {
        return std::make_unique<StickyTopicPartitioner>();
    }

    nlohmann::json config() const override {
        return nlohmann::json{{"type", "sticky"}};
    }

    static std::unique_ptr<PartitionerInterface> create(const nlohmann::json&) {
        return std::make_unique<StickyPartitioner>();
    }
};

/**
 * @brief Keyed records are hashed to a partition, keyless records follow
 * the sticky strategy.
 */
class StickyKeyTopicPartitioner : public StickyTopicPartitioner {

    public:

    StickyKeyTopicPartitioner(PartitionerHasher hasher)
    : m_hasher(std::move(hasher)) {}

    bool requiresConsistency(const Record& record) const override {
        return record.key.has_value();
    }

    int32_t partition(const Record& record, int32_t n) override {
        if(record.key)
            return m_hasher(*record.key, n);
        return StickyTopicPartitioner::partition(record, n);
    }

    private:

    PartitionerHasher m_hasher;
};

class StickyKeyPartitioner : public PartitionerInterface {

    public:

    StickyKeyPartitioner(PartitionerHasher hasher, std::string hasherName)
    : m_hasher(std::move(hasher))
    , m_hasher_name(std::move(hasherName)) {}

    std::unique_ptr<TopicPartitioner> forTopic(std::string_view) override {
        return std::make_unique<StickyKeyTopicPartitioner>(m_hasher);
    }

    nlohmann::json config() const override {
        return nlohmann::json{{"type", "sticky_key"}, {"hasher", m_hasher_name}};
    }

    static std::unique_ptr<PartitionerInterface> create(const nlohmann::json& config);

    private:

    PartitionerHasher m_hasher;
    std::string       m_hasher_name;
};

}

#endif
