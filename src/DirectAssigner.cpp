/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#include "kcore/DirectAssigner.hpp"
#include "JsonUtil.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <regex>
#include <set>

namespace kcore {

static constexpr const char* ConsumeOptionsSchema = R"(
{
  "type": "object",
  "properties": {
    "topics": {
      "oneOf": [
        {"type": "object"},
        {"type": "array",
         "items": {
           "type": "object",
           "properties": {
             "name": {"type": "string"},
             "offset": {"type": ["string", "integer"]}
           },
           "required": ["name"]
         }
        }
      ]
    },
    "partitions": {
      "type": "object",
      "additionalProperties": {"type": "object"}
    },
    "regex": {"type": "boolean"}
  }
}
)";

ConsumeOptions& ConsumeTopics(ConsumeOptions& options, Offset offset,
                              const std::vector<std::string>& topics) {
    options.topics.clear();
    for(auto& topic : topics)
        options.topics.emplace_back(topic, offset);
    return options;
}

ConsumeOptions& ConsumePartitions(
        ConsumeOptions& options,
        std::unordered_map<std::string, std::unordered_map<int32_t, Offset>> partitions) {
    options.partitions = std::move(partitions);
    return options;
}

ConsumeOptions& ConsumeTopicsRegex(ConsumeOptions& options) {
    options.regex = true;
    return options;
}

ConsumeOptions ConsumeOptions::FromJson(const nlohmann::json& config) {
    static const JsonValidator validator{ConsumeOptionsSchema};
    validator.validateOrThrow(config, "consume options");

    ConsumeOptions options;
    if(config.contains("topics")) {
        auto& topics = config["topics"];
        if(topics.is_array()) {
            for(auto& entry : topics) {
                auto offset = entry.contains("offset") ? ParseOffset(entry["offset"])
                                                       : Offset::Earliest();
                options.topics.emplace_back(entry["name"].get<std::string>(), offset);
            }
        } else {
            for(auto& [name, offset] : topics.items())
                options.topics.emplace_back(name, ParseOffset(offset));
        }
    }
    if(config.contains("partitions")) {
        for(auto& [topic, partitions] : config["partitions"].items()) {
            auto& pins = options.partitions[topic];
            for(auto& [partition, offset] : partitions.items()) {
                int32_t index = 0;
                try {
                    std::size_t end = 0;
                    index = std::stoi(partition, &end);
                    if(end != partition.size()) throw std::invalid_argument{partition};
                } catch(const std::logic_error&) {
                    throw Exception{fmt::format(
                        "Invalid partition \"{}\" for topic \"{}\"", partition, topic)};
                }
                pins.insert_or_assign(index, ParseOffset(offset));
            }
        }
    }
    options.regex = config.value("regex", false);
    return options;
}

class StdRegexTopicMatcher : public TopicMatcher {

    public:

    void compile(const std::string& pattern) override {
        if(m_compiled.count(pattern)) return;
        try {
            m_compiled.emplace(pattern, std::regex{pattern, std::regex::ECMAScript});
        } catch(const std::regex_error& ex) {
            throw Exception{fmt::format(
                "Invalid topic pattern \"{}\": {}", pattern, ex.what())};
        }
    }

    bool matches(const std::string& pattern, std::string_view topic) override {
        auto it = m_compiled.find(pattern);
        if(it == m_compiled.end()) {
            compile(pattern);
            it = m_compiled.find(pattern);
        }
        return std::regex_search(topic.begin(), topic.end(), it->second);
    }

    private:

    std::unordered_map<std::string, std::regex> m_compiled;
};

std::shared_ptr<TopicMatcher> RegexTopicMatcher() {
    return std::make_shared<StdRegexTopicMatcher>();
}

DirectAssigner::DirectAssigner(ConsumeOptions options,
                               std::shared_ptr<TopicMatcher> matcher)
: m_options(std::move(options))
, m_matcher(std::move(matcher)) {
    for(auto& [topic, offset] : m_options.topics)
        m_topics.insert_or_assign(topic, offset);
    if(m_options.regex) {
        if(!m_matcher)
            throw Exception{"DirectAssigner in regex mode requires a TopicMatcher"};
        for(auto& entry : m_options.topics)
            m_matcher->compile(entry.first);
    }
}

bool DirectAssigner::wanted(const std::string& topic, Offset& offset) {
    if(!m_options.regex) {
        auto it = m_topics.find(topic);
        if(it == m_topics.end()) return false;
        offset = it->second;
        return true;
    }
    auto it = m_re_topics.find(topic);
    if(it != m_re_topics.end()) {
        offset = it->second;
        return true;
    }
    if(m_re_ignore.count(topic)) return false;
    for(auto& [pattern, patternOffset] : m_options.topics) {
        if(m_matcher->matches(pattern, topic)) {
            spdlog::debug("[kcore:assigner] Topic \"{}\" matches pattern \"{}\"", topic, pattern);
            m_re_topics.emplace(topic, patternOffset);
            offset = patternOffset;
            return true;
        }
    }
    m_re_ignore.insert(topic);
    return false;
}

Assignments DirectAssigner::findNewAssignments(const Topology& topology) {
    Assignments toUse;
    for(auto& [topic, partitions] : topology) {
        auto offset = Offset::Earliest();
        if(wanted(topic, offset)) {
            auto& staged = toUse[topic];
            for(auto partition : partitions)
                staged.insert_or_assign(partition, offset);
        }
        auto pins = m_options.partitions.find(topic);
        if(pins == m_options.partitions.end()) continue;
        auto& staged = toUse[topic];
        for(auto& [partition, pinned] : pins->second)
            staged.insert_or_assign(partition, pinned);
    }

    for(auto& [topic, claimed] : m_using) {
        auto it = toUse.find(topic);
        if(it == toUse.end()) continue;
        for(auto partition : claimed)
            it->second.erase(partition);
    }
    for(auto it = toUse.begin(); it != toUse.end();) {
        if(it->second.empty()) it = toUse.erase(it);
        else ++it;
    }

    if(toUse.empty()) return toUse;

    std::size_t count = 0;
    for(auto& [topic, partitions] : toUse) {
        auto& claimed = m_using[topic];
        for(auto& entry : partitions)
            claimed.insert(entry.first);
        count += partitions.size();
    }
    spdlog::debug("[kcore:assigner] {} new partitions assigned across {} topics",
                  count, toUse.size());
    return toUse;
}

std::vector<std::string> DirectAssigner::metadataTopics() const {
    if(m_options.regex) return {};
    std::set<std::string> topics;
    for(auto& entry : m_options.topics)
        topics.insert(entry.first);
    for(auto& entry : m_options.partitions)
        topics.insert(entry.first);
    return {topics.begin(), topics.end()};
}

}
