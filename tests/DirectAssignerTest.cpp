/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#include <catch2/catch_test_macros.hpp>
#include <kcore/DirectAssigner.hpp>
#include <spdlog/spdlog.h>

using kcore::Offset;

/**
 * @brief TopicMatcher counting the evaluations of each (pattern, topic).
 */
class CountingMatcher : public kcore::TopicMatcher {

    public:

    void compile(const std::string& pattern) override {
        m_inner->compile(pattern);
        m_compiled.push_back(pattern);
    }

    bool matches(const std::string& pattern, std::string_view topic) override {
        m_calls += 1;
        m_topics.emplace_back(topic);
        return m_inner->matches(pattern, topic);
    }

    std::shared_ptr<kcore::TopicMatcher> m_inner = kcore::RegexTopicMatcher();
    std::vector<std::string>             m_compiled;
    std::vector<std::string>             m_topics;
    std::size_t                          m_calls = 0;
};

static std::size_t totalPartitions(const kcore::Assignments& assignments) {
    std::size_t n = 0;
    for(auto& entry : assignments) n += entry.second.size();
    return n;
}

TEST_CASE("DirectAssigner test", "[direct-assigner]") {

    spdlog::set_level(spdlog::level::from_str("error"));

    kcore::Topology topology = {
        {"foo",    {0, 1, 2}},
        {"bar",    {0, 1}},
        {"foobar", {0}},
        {"other",  {0, 1, 2, 3}}
    };

    SECTION("Topics are assigned once") {
        kcore::ConsumeOptions options;
        kcore::ConsumeTopics(options, Offset::Earliest(), {"foo", "bar", "missing"});
        kcore::DirectAssigner assigner{options};

        auto first = assigner.findNewAssignments(topology);
        REQUIRE(first.size() == 2);
        REQUIRE(first.at("foo").size() == 3);
        REQUIRE(first.at("bar").size() == 2);
        for(auto& [topic, partitions] : first)
            for(auto& [partition, offset] : partitions)
                REQUIRE(offset == Offset::Earliest());
        REQUIRE(assigner.claimed().at("foo").size() == 3);

        REQUIRE(assigner.findNewAssignments(topology).empty());
        REQUIRE(assigner.findNewAssignments(topology).empty());
    }

    SECTION("New partitions are picked up") {
        kcore::ConsumeOptions options;
        kcore::ConsumeTopics(options, Offset::Latest(), {"foo"});
        kcore::DirectAssigner assigner{options};
        REQUIRE(totalPartitions(assigner.findNewAssignments(topology)) == 3);

        topology["foo"] = {0, 1, 2, 3, 4};
        auto next = assigner.findNewAssignments(topology);
        REQUIRE(next.size() == 1);
        REQUIRE(next.at("foo").size() == 2);
        REQUIRE(next.at("foo").count(3));
        REQUIRE(next.at("foo").count(4));
        REQUIRE(next.at("foo").at(3) == Offset::Latest());
    }

    SECTION("Partitions that disappear stay claimed") {
        kcore::ConsumeOptions options;
        kcore::ConsumeTopics(options, Offset::Latest(), {"foo"});
        kcore::DirectAssigner assigner{options};
        assigner.findNewAssignments(topology);
        topology["foo"] = {0};
        REQUIRE(assigner.findNewAssignments(topology).empty());
        REQUIRE(assigner.claimed().at("foo").size() == 3);
        topology["foo"] = {0, 1, 2};
        REQUIRE(assigner.findNewAssignments(topology).empty());
    }

    SECTION("Pinned partitions take precedence") {
        kcore::ConsumeOptions options;
        kcore::ConsumeTopics(options, Offset::Latest(), {"foo"});
        kcore::ConsumePartitions(options, {
            {"foo", {{1, Offset::Earliest()}}},
            {"bar", {{0, Offset::Exact(42)}}}
        });
        kcore::DirectAssigner assigner{options};
        auto result = assigner.findNewAssignments(topology);
        REQUIRE(result.size() == 2);
        REQUIRE(result.at("foo").at(0) == Offset::Latest());
        REQUIRE(result.at("foo").at(1) == Offset::Earliest());
        REQUIRE(result.at("foo").at(2) == Offset::Latest());
        REQUIRE(result.at("bar").size() == 1);
        REQUIRE(result.at("bar").at(0) == Offset::Exact(42));
    }

    SECTION("Pins only apply to topics in the topology") {
        kcore::ConsumeOptions options;
        kcore::ConsumePartitions(options, {{"unknown", {{0, Offset::Earliest()}}}});
        kcore::DirectAssigner assigner{options};
        REQUIRE(assigner.findNewAssignments(topology).empty());
        topology["unknown"] = {0, 1};
        auto result = assigner.findNewAssignments(topology);
        REQUIRE(result.size() == 1);
        REQUIRE(result.at("unknown").size() == 1);
    }

    SECTION("Regular expressions are evaluated once per topic") {
        kcore::ConsumeOptions options;
        kcore::ConsumeTopics(options, Offset::Earliest(), {"^foo"});
        kcore::ConsumeTopicsRegex(options);
        auto matcher = std::make_shared<CountingMatcher>();
        kcore::DirectAssigner assigner{options, matcher};
        REQUIRE(matcher->m_compiled == std::vector<std::string>{"^foo"});

        auto result = assigner.findNewAssignments(topology);
        REQUIRE(result.size() == 2);
        REQUIRE(result.count("foo"));
        REQUIRE(result.count("foobar"));
        REQUIRE(matcher->m_calls == topology.size());

        topology["foo"].push_back(3);
        topology["foobaz"] = {0};
        result = assigner.findNewAssignments(topology);
        REQUIRE(matcher->m_calls == topology.size());
        REQUIRE(matcher->m_topics.back() == "foobaz");
        REQUIRE(result.size() == 2);
        REQUIRE(result.at("foo").size() == 1);
        REQUIRE(result.at("foobaz").size() == 1);
    }

    SECTION("The first matching pattern gives the offset") {
        kcore::ConsumeOptions options;
        options.topics = {{"bar$", Offset::Exact(7)}, {"^foo", Offset::Latest()}, {".*", Offset::Earliest()}};
        options.regex = true;
        kcore::DirectAssigner assigner{options};
        auto result = assigner.findNewAssignments(topology);
        REQUIRE(result.size() == 4);
        REQUIRE(result.at("foobar").at(0) == Offset::Exact(7));
        REQUIRE(result.at("bar").at(0) == Offset::Exact(7));
        REQUIRE(result.at("foo").at(0) == Offset::Latest());
        REQUIRE(result.at("other").at(0) == Offset::Earliest());
    }

    SECTION("Invalid patterns are rejected") {
        kcore::ConsumeOptions options;
        kcore::ConsumeTopics(options, Offset::Earliest(), {"foo("});
        kcore::ConsumeTopicsRegex(options);
        REQUIRE_THROWS_AS(kcore::DirectAssigner{options}, kcore::Exception);
    }

    SECTION("Metadata topics") {
        kcore::ConsumeOptions options;
        REQUIRE(options.empty());
        kcore::ConsumeTopics(options, Offset::Earliest(), {"b", "a"});
        kcore::ConsumePartitions(options, {{"c", {{0, Offset::Earliest()}}}, {"a", {{1, Offset::Latest()}}}});
        REQUIRE(!options.empty());
        kcore::DirectAssigner assigner{options};
        REQUIRE(assigner.metadataTopics() == std::vector<std::string>{"a", "b", "c"});

        kcore::ConsumeTopicsRegex(options);
        kcore::DirectAssigner regex{options};
        REQUIRE(regex.metadataTopics().empty());
    }

    SECTION("ConsumeTopics replaces the previous topics") {
        kcore::ConsumeOptions options;
        kcore::ConsumeTopics(options, Offset::Earliest(), {"foo"});
        kcore::ConsumeTopics(options, Offset::Latest(), {"bar"});
        REQUIRE(options.topics.size() == 1);
        REQUIRE(options.topics[0].first == "bar");
    }
}

TEST_CASE("ConsumeOptions from JSON", "[direct-assigner]") {

    spdlog::set_level(spdlog::level::from_str("error"));

    SECTION("Object form") {
        auto options = kcore::ConsumeOptions::FromJson(nlohmann::json::parse(R"(
            {
                "topics": {"foo": "earliest", "bar": 12},
                "partitions": {"baz": {"0": "latest", "3": 5}}
            }
        )"));
        REQUIRE(!options.regex);
        REQUIRE(options.topics.size() == 2);
        REQUIRE(options.partitions.at("baz").at(0) == Offset::Latest());
        REQUIRE(options.partitions.at("baz").at(3) == Offset::Exact(5));
    }

    SECTION("Array form keeps the order") {
        auto options = kcore::ConsumeOptions::FromJson(nlohmann::json::parse(R"(
            {
                "topics": [{"name": "z.*", "offset": "latest"}, {"name": "a.*"}],
                "regex": true
            }
        )"));
        REQUIRE(options.regex);
        REQUIRE(options.topics.size() == 2);
        REQUIRE(options.topics[0].first == "z.*");
        REQUIRE(options.topics[0].second == Offset::Latest());
        REQUIRE(options.topics[1].second == Offset::Earliest());
    }

    SECTION("Invalid documents") {
        using nlohmann::json;
        REQUIRE_THROWS_AS(kcore::ConsumeOptions::FromJson(json::parse(R"({"topics": 3})")), kcore::Exception);
        REQUIRE_THROWS_AS(kcore::ConsumeOptions::FromJson(json::parse(R"({"topics": {"a": "middle"}})")), kcore::Exception);
        REQUIRE_THROWS_AS(kcore::ConsumeOptions::FromJson(json::parse(R"({"topics": {"a": -5}})")), kcore::Exception);
        REQUIRE_THROWS_AS(kcore::ConsumeOptions::FromJson(json::parse(R"({"partitions": {"a": {"x": 1}}})")), kcore::Exception);
        REQUIRE_THROWS_AS(kcore::ConsumeOptions::FromJson(json::parse(R"({"regex": "yes"})")), kcore::Exception);
    }
}

TEST_CASE("Offsets", "[direct-assigner]") {
    REQUIRE(Offset::Earliest().isEarliest());
    REQUIRE(Offset::Latest().isLatest());
    REQUIRE(Offset::Exact(0).value() == 0);
    REQUIRE(Offset::Exact(10).toString() == "10");
    REQUIRE(Offset::Earliest().toString() == "earliest");
    REQUIRE(fmt::format("{}", Offset::Latest()) == "latest");
    REQUIRE(Offset::Exact(3) != Offset::Exact(4));
    REQUIRE_THROWS_AS(Offset::Exact(-1), kcore::Exception);
}
