/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef KCORE_RANDOM_PARTITIONER_HPP
#define KCORE_RANDOM_PARTITIONER_HPP

#include "kcore/Partitioner.hpp"

#include <random>

namespace kcore {

class RandomTopicPartitioner : public TopicPartitioner {

    public:

    RandomTopicPartitioner()
    : m_rng(std::random_device{}()) {}

    void onNewBatch() override {}

    bool requiresConsistency(const Record&) const override {
        return false;
    }

    int32_t partition(const Record&, int32_t n) override {
        std::uniform_int_distribution<int32_t> dist{0, n - 1};
        return dist(m_rng);
    }

    private:

    std::mt19937 m_rng;
};

class RandomPartitioner : public PartitionerInterface {

    public:

    std::unique_ptr<TopicPartitioner> forTopic(std::string_view) override {
        return std::make_unique<RandomTopicPartitioner>();
    }

    nlohmann::json config() const override {
        return nlohmann::json{{"type", "random"}};
    }

    static std::unique_ptr<PartitionerInterface> create(const nlohmann::json&) {
        return std::make_unique<RandomPartitioner>();
    }
};

}

#endif
