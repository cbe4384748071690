/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef KCORE_DIRECT_ASSIGNER_HPP
#define KCORE_DIRECT_ASSIGNER_HPP

#include <kcore/ForwardDcl.hpp>
#include <kcore/Offset.hpp>
#include <kcore/Exception.hpp>

#include <nlohmann/json.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace kcore {

/**
 * @brief Live partitions of each topic known to the client.
 */
using Topology = std::unordered_map<std::string, std::vector<int32_t>>;

/**
 * @brief Partitions to consume, per topic, with their starting offset.
 */
using Assignments = std::unordered_map<std::string, std::unordered_map<int32_t, Offset>>;

/**
 * @brief Description of what a client wants to consume directly,
 * without a consumer group.
 */
struct ConsumeOptions {

    /* topics (or patterns, in regex mode) in order of declaration */
    std::vector<std::pair<std::string, Offset>> topics;
    /* explicit partitions, which take precedence over topics */
    std::unordered_map<std::string, std::unordered_map<int32_t, Offset>> partitions;
    /* whether the topics are regular expressions */
    bool regex = false;

    bool empty() const {
        return topics.empty() && partitions.empty();
    }

    /**
     * @brief Builds options from a JSON object of the form
     * {"topics": {...} or [...], "partitions": {...}, "regex": bool}.
     * Topics can be an object mapping names to offsets, or an array of
     * {"name": name, "offset": offset} objects when the order matters
     * (regex mode). Offsets are "earliest", "latest", or an integer.
     */
    static ConsumeOptions FromJson(const nlohmann::json& config);
};

/**
 * @brief Consume the given topics from the given offset. Replaces the
 * topics previously set.
 */
ConsumeOptions& ConsumeTopics(ConsumeOptions& options, Offset offset,
                              const std::vector<std::string>& topics);

/**
 * @brief Consume the given partitions from the given offsets. These
 * offsets take precedence over the ones set by ConsumeTopics.
 */
ConsumeOptions& ConsumePartitions(
        ConsumeOptions& options,
        std::unordered_map<std::string, std::unordered_map<int32_t, Offset>> partitions);

/**
 * @brief Interpret the topics set by ConsumeTopics as regular expressions.
 */
ConsumeOptions& ConsumeTopicsRegex(ConsumeOptions& options);

/**
 * @brief The TopicMatcher decides if a topic name matches a pattern.
 */
class TopicMatcher {

    public:

    virtual ~TopicMatcher() = default;

    /**
     * @brief Called once per pattern, before any call to matches().
     * Throws an Exception if the pattern is invalid.
     */
    virtual void compile(const std::string& pattern) = 0;

    virtual bool matches(const std::string& pattern, std::string_view topic) = 0;
};

/**
 * @brief TopicMatcher using std::regex (ECMAScript grammar). A topic
 * matches if the pattern matches any part of its name; patterns must use
 * ^ and $ to match whole names.
 */
std::shared_ptr<TopicMatcher> RegexTopicMatcher();

/**
 * @brief The DirectAssigner computes, each time the topology of the
 * cluster changes, which partitions start being consumed and from where.
 *
 * A partition returned by findNewAssignments() is remembered and never
 * returned again, even if it later disappears from the topology.
 * Calls must be serialized by the caller.
 */
class DirectAssigner {

    public:

    using Claimed = std::unordered_map<std::string, std::unordered_set<int32_t>>;

    DirectAssigner(ConsumeOptions options,
                   std::shared_ptr<TopicMatcher> matcher = RegexTopicMatcher());

    /**
     * @brief Returns the partitions of the topology that are wanted and
     * not yet claimed, and claims them. An empty result means there is
     * nothing new to consume.
     */
    Assignments findNewAssignments(const Topology& topology);

    /**
     * @brief Partitions claimed so far.
     */
    const Claimed& claimed() const {
        return m_using;
    }

    /**
     * @brief Topics that the client must request in its metadata requests.
     * Empty in regex mode, where all topics have to be listed.
     */
    std::vector<std::string> metadataTopics() const;

    const ConsumeOptions& options() const {
        return m_options;
    }

    private:

    bool wanted(const std::string& topic, Offset& offset);

    ConsumeOptions                          m_options;
    std::shared_ptr<TopicMatcher>           m_matcher;
    std::unordered_map<std::string, Offset> m_topics;
    std::unordered_map<std::string, Offset> m_re_topics;
    std::unordered_set<std::string>         m_re_ignore;
    Claimed                                 m_using;
};

}

#endif
