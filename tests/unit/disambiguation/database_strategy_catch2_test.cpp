// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 disambig Contributors

#include <catch2/catch_test_macros.hpp>

#include "../../common/counting_store.h"
#include "../../common/store_fixture.h"

#include <disambig/disambiguation/database_strategy.h>
#include <disambig/disambiguation/id_obfuscator.h>
#include <disambig/graph/graph.h>

#include <nlohmann/json.hpp>

#include <string>
#include <utility>
#include <variant>

using namespace disambig;
using namespace disambig::disambiguation;
using disambig::test::CountingCandidateStore;
using disambig::test::StoreFixture;
using nlohmann::json;

namespace {

graph::Graph makeGraph(json nodes) {
    auto g = graph::loadJsonLdGraph({{"@graph", std::move(nodes)}});
    REQUIRE(g.has_value());
    return std::move(g).value();
}

NodeList nodesOfType(const graph::Graph& g, const std::string& type) {
    NodeList out;
    for (const auto* node : g.nodes()) {
        if (node->type() == type) {
            out.push_back(node);
        }
    }
    return out;
}

metadata::Candidate candidate(const std::string& type, std::int64_t id) {
    metadata::Candidate c;
    c.type = type;
    c.id = id;
    c.concreteType = type;
    return c;
}

} // namespace

TEST_CASE("Strategy: initial pass resolves obfuscated ids", "[unit][disambiguation][strategy]") {
    StoreFixture fix;
    auto jane = fix.addAgent("Jane Doe");
    auto& store = fix.openStore();

    const auto janeId = IdObfuscator::encode(11, jane).value();
    const auto missingId = IdObfuscator::encode(11, jane + 100).value();
    const auto unknownTypeId = IdObfuscator::encode(99, jane).value();

    const auto g = makeGraph(json::array({
        {{"@id", janeId}, {"@type", "Person"}},
        {{"@id", missingId}, {"@type", "Person"}},
        {{"@id", unknownTypeId}, {"@type", "Person"}},
        {{"@id", "not-an-id"}, {"@type", "Person"}},
        {{"@id", "_:blank"}, {"@type", "Person"}},
    }));

    DatabaseStrategy strategy(g, store);
    MatchSet matches;
    REQUIRE(strategy.initialPass(g.nodes(), matches).has_value());

    CHECK(matches.size() == 1);
    REQUIRE(matches.getMatches(janeId).size() == 1);
    CHECK(matches.getMatches(janeId)[0].id == jane);
    CHECK(matches.getMatches(janeId)[0].type == "agent");
    CHECK_FALSE(matches.hasMatches("not-an-id"));
    CHECK_FALSE(matches.hasMatches("_:blank"));
}

TEST_CASE("Strategy: match by attrs", "[unit][disambiguation][strategy]") {
    StoreFixture fix;
    auto work = fix.addWork("A work");
    auto identifier = fix.addWorkIdentifier("http://example.com/a", work);
    auto tag = fix.addTag("biology");
    auto& store = fix.openStore();

    SECTION("Exact value matches, a different value does not") {
        const auto g = makeGraph(json::array({
            {{"@id", "_:i1"}, {"@type", "WorkIdentifier"}, {"uri", "http://example.com/a"}},
            {{"@id", "_:i2"}, {"@type", "WorkIdentifier"}, {"uri", "http://example.com/A"}},
            {{"@id", "_:i3"}, {"@type", "WorkIdentifier"}},
        }));
        DatabaseStrategy strategy(g, store);
        MatchSet matches;
        REQUIRE(strategy
                    .matchByAttrs(nodesOfType(g, "workidentifier"), matches, "workidentifier",
                                  {"uri"})
                    .has_value());
        REQUIRE(matches.getMatches("_:i1").size() == 1);
        CHECK(matches.getMatches("_:i1")[0].id == identifier);
        CHECK_FALSE(matches.hasMatches("_:i2"));
        CHECK_FALSE(matches.hasMatches("_:i3"));
    }

    SECTION("Every attribute has to agree") {
        const auto g = makeGraph(json::array({
            {{"@id", "_:i1"},
             {"@type", "WorkIdentifier"},
             {"uri", "http://example.com/a"},
             {"host", "example.com"}},
            {{"@id", "_:i2"},
             {"@type", "WorkIdentifier"},
             {"uri", "http://example.com/a"},
             {"host", "elsewhere.com"}},
        }));
        DatabaseStrategy strategy(g, store);
        MatchSet matches;
        REQUIRE(strategy
                    .matchByAttrs(nodesOfType(g, "workidentifier"), matches, "workidentifier",
                                  {"uri", "host"})
                    .has_value());
        CHECK(matches.hasMatches("_:i1"));
        CHECK_FALSE(matches.hasMatches("_:i2"));
    }

    SECTION("Subtype constraint") {
        const auto g = makeGraph(json::array({
            {{"@id", "_:w"}, {"@type", "Article"}, {"title", "A work"}},
        }));
        DatabaseStrategy strategy(g, store);

        MatchSet preprints;
        REQUIRE(strategy
                    .matchByAttrs(nodesOfType(g, "article"), preprints, "creativework",
                                  {"title"}, {"preprint"})
                    .has_value());
        CHECK_FALSE(preprints.hasMatches("_:w"));

        MatchSet articles;
        REQUIRE(strategy
                    .matchByAttrs(nodesOfType(g, "article"), articles, "creativework",
                                  {"title"}, {"article", "preprint"})
                    .has_value());
        REQUIRE(articles.hasMatches("_:w"));
        CHECK(articles.getMatches("_:w")[0].id == work);
    }

    SECTION("Unknown type, attribute or subtype is an error") {
        const auto g =
            makeGraph(json::array({{{"@id", "_:t"}, {"@type", "Tag"}, {"name", "biology"}}}));
        DatabaseStrategy strategy(g, store);
        MatchSet matches;
        auto nodes = nodesOfType(g, "tag");
        CHECK(strategy.matchByAttrs(nodes, matches, "spaceship", {"name"}).error().code ==
              ErrorCode::InvalidArgument);
        CHECK(strategy.matchByAttrs(nodes, matches, "tag", {"colour"}).error().code ==
              ErrorCode::InvalidArgument);
        CHECK(strategy.matchByAttrs(nodes, matches, "tag", {"name"}, {"article"}).error().code ==
              ErrorCode::InvalidArgument);

        REQUIRE(strategy.matchByAttrs(nodes, matches, "tag", {"name"}).has_value());
        CHECK(matches.getMatches("_:t")[0].id == tag);
    }
}

TEST_CASE("Strategy: attribute matching is one batched query", "[unit][disambiguation][strategy]") {
    StoreFixture fix;
    auto work = fix.addWork("A work");
    for (int i = 0; i < 600; i += 2) {
        fix.addWorkIdentifier("http://example.com/" + std::to_string(i), work);
    }
    CountingCandidateStore store(fix.openStore());

    json nodes = json::array();
    for (int i = 0; i < 600; ++i) {
        nodes.push_back({{"@id", "_:i" + std::to_string(i)},
                         {"@type", "WorkIdentifier"},
                         {"uri", "http://example.com/" + std::to_string(i)}});
    }
    const auto g = makeGraph(std::move(nodes));

    DatabaseStrategy strategy(g, store);
    MatchSet matches;
    REQUIRE(strategy.matchByAttrs(g.nodes(), matches, "workidentifier", {"uri"}).has_value());

    CHECK(store.nodeJoins == 1);
    CHECK(store.lookups == 0);
    CHECK(matches.size() == 300);
    CHECK(matches.hasMatches("_:i0"));
    CHECK_FALSE(matches.hasMatches("_:i1"));
    CHECK(matches.hasMatches("_:i598"));
}

TEST_CASE("Strategy: many-to-one", "[unit][disambiguation][strategy]") {
    StoreFixture fix;
    auto work = fix.addWork("A work");
    auto biology = fix.addTag("biology");
    auto chemistry = fix.addTag("chemistry");
    auto through = fix.addThroughTag(biology, work);
    auto& store = fix.openStore();

    const auto g = makeGraph(json::array({
        {{"@id", "_:w"}, {"@type", "Article"}},
        {{"@id", "_:t"}, {"@type", "Tag"}, {"name", "biology"}},
        {{"@id", "_:t2"}, {"@type", "Tag"}, {"name", "unknown"}},
        {{"@id", "_:tt"},
         {"@type", "ThroughTags"},
         {"tag", {{"@id", "_:t"}}},
         {"creative_work", {{"@id", "_:w"}}}},
        {{"@id", "_:tt2"},
         {"@type", "ThroughTags"},
         {"tag", {{"@id", "_:t2"}}},
         {"creative_work", {{"@id", "_:w"}}}},
    }));
    DatabaseStrategy strategy(g, store);
    const std::vector<std::string> relations{"tag", "creative_work"};

    SECTION("Single matches key the lookup") {
        MatchSet matches;
        matches.addMatch("_:w", candidate("creativework", work));
        matches.addMatch("_:t", candidate("tag", biology));

        auto outcome = strategy.matchByManyToOne(nodesOfType(g, "throughtags"), matches,
                                                 "throughtags", relations);
        REQUIRE(outcome.has_value());
        REQUIRE(std::holds_alternative<PassCompleted>(outcome.value()));
        CHECK(std::get<PassCompleted>(outcome.value()).matchesAdded == 1);
        REQUIRE(matches.getMatches("_:tt").size() == 1);
        CHECK(matches.getMatches("_:tt")[0].id == through);
        CHECK_FALSE(matches.hasMatches("_:tt2"));
    }

    SECTION("Unmatched relation leaves the node out") {
        MatchSet matches;
        matches.addMatch("_:w", candidate("creativework", work));

        auto outcome = strategy.matchByManyToOne(nodesOfType(g, "throughtags"), matches,
                                                 "throughtags", relations);
        REQUIRE(outcome.has_value());
        CHECK(std::get<PassCompleted>(outcome.value()).matchesAdded == 0);
        CHECK_FALSE(matches.hasMatches("_:tt"));
    }

    SECTION("Several matches require a merge") {
        MatchSet matches;
        matches.addMatch("_:w", candidate("creativework", work));
        matches.addMatch("_:t", candidate("tag", biology));
        matches.addMatch("_:t", candidate("tag", chemistry));

        auto outcome = strategy.matchByManyToOne(nodesOfType(g, "throughtags"), matches,
                                                 "throughtags", relations);
        REQUIRE(outcome.has_value());
        REQUIRE(std::holds_alternative<MergeRequired>(outcome.value()));
        const auto& merge = std::get<MergeRequired>(outcome.value());
        CHECK(merge.nodeId == "_:tt");
        CHECK(merge.relationName == "tag");
        CHECK(merge.relatedNodeId == "_:t");
        REQUIRE(merge.candidates.size() == 2);
        CHECK(merge.candidates[0].id == biology);
        CHECK(merge.candidates[1].id == chemistry);
        CHECK_FALSE(matches.hasMatches("_:tt"));
    }

    SECTION("Unknown relation is an error") {
        MatchSet matches;
        auto outcome = strategy.matchByManyToOne(nodesOfType(g, "throughtags"), matches,
                                                 "throughtags", {"subject"});
        REQUIRE_FALSE(outcome.has_value());
        CHECK(outcome.error().code == ErrorCode::InvalidArgument);
    }
}

TEST_CASE("Strategy: one-to-many through identifiers", "[unit][disambiguation][strategy]") {
    StoreFixture fix;
    auto work = fix.addWork("A work");
    auto duplicate = fix.addWork("A work, again");
    auto i1 = fix.addWorkIdentifier("http://example.com/a", work);
    auto i2 = fix.addWorkIdentifier("http://example.com/b", duplicate);
    auto agent = fix.addAgent("Jane Doe");
    auto ai = fix.addAgentIdentifier("mailto:jane@example.com", agent);
    auto& store = fix.openStore();

    const auto g = makeGraph(json::array({
        {{"@id", "_:w"}, {"@type", "Article"}},
        {{"@id", "_:lonely"}, {"@type", "Article"}},
        {{"@id", "_:i1"}, {"@type", "WorkIdentifier"}, {"creative_work", {{"@id", "_:w"}}}},
        {{"@id", "_:i2"}, {"@type", "WorkIdentifier"}, {"creative_work", {{"@id", "_:w"}}}},
        {{"@id", "_:p"}, {"@type", "Person"}},
        {{"@id", "_:ai"}, {"@type", "AgentIdentifier"}, {"agent", {{"@id", "_:p"}}}},
    }));
    DatabaseStrategy strategy(g, store);

    MatchSet matches;
    matches.addMatch("_:i1", candidate("workidentifier", i1));
    matches.addMatch("_:i1", candidate("workidentifier", i1));
    matches.addMatch("_:i2", candidate("workidentifier", i2));
    matches.addMatch("_:ai", candidate("agentidentifier", ai));

    // Candidates loaded from the store carry the foreign keys
    const auto* identifiers = store.schema().find("workidentifier");
    auto loaded = store.getByIds(*identifiers, {i1, i2});
    REQUIRE(loaded.has_value());
    MatchSet withFks;
    withFks.addMatch("_:i1", loaded.value()[0]);
    withFks.addMatch("_:i2", loaded.value()[1]);
    auto agentIdentifier = store.getById(*store.schema().find("agentidentifier"), ai);
    REQUIRE(agentIdentifier.has_value());
    withFks.addMatch("_:ai", *agentIdentifier.value());

    SECTION("Union of referenced works") {
        REQUIRE(strategy.matchByOneToMany(nodesOfType(g, "article"), withFks, "creativework",
                                          "identifiers")
                    .has_value());
        REQUIRE(withFks.getMatches("_:w").size() == 2);
        CHECK(withFks.getMatches("_:w")[0].id == work);
        CHECK(withFks.getMatches("_:w")[1].id == duplicate);
        CHECK_FALSE(withFks.hasMatches("_:lonely"));
    }

    SECTION("Agents through agent identifiers") {
        REQUIRE(strategy.matchByOneToMany(nodesOfType(g, "person"), withFks, "agent",
                                          "identifiers")
                    .has_value());
        REQUIRE(withFks.getMatches("_:p").size() == 1);
        CHECK(withFks.getMatches("_:p")[0].id == agent);
    }

    SECTION("Candidates without the foreign key add nothing") {
        REQUIRE(strategy.matchByOneToMany(nodesOfType(g, "article"), matches, "creativework",
                                          "identifiers")
                    .has_value());
        CHECK_FALSE(matches.hasMatches("_:w"));
    }

    SECTION("Unknown reverse relation") {
        auto r = strategy.matchByOneToMany(nodesOfType(g, "article"), withFks, "creativework",
                                           "subjects");
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code == ErrorCode::InvalidArgument);
    }
}

TEST_CASE("Strategy: subjects", "[unit][disambiguation][strategy]") {
    StoreFixture fix;
    auto centralSource = fix.addSource("central");
    auto provider = fix.addSource("provider");
    auto centralTax = fix.addTaxonomy(centralSource);
    auto providerTax = fix.addTaxonomy(provider);
    auto biology = fix.addSubject("Biology", "http://example.com/biology", centralTax);
    auto botany = fix.addSubject("Botany", "http://example.com/botany", centralTax);
    auto custom = fix.addSubject("Plants", "http://provider.example/plants", providerTax, botany);
    auto& store = fix.openStore();

    const auto g = makeGraph(json::array({
        {{"@id", "_:central"}, {"@type", "Subject"}, {"name", "Biology"}},
        {{"@id", "_:byuri"},
         {"@type", "Subject"},
         {"name", "Renamed"},
         {"uri", "http://example.com/botany"}},
        {{"@id", "_:nomatch"}, {"@type", "Subject"}, {"name", "Astrology"}},
        {{"@id", "_:custom"},
         {"@type", "Subject"},
         {"name", "Plants"},
         {"central_synonym", {{"@id", "_:central"}}}},
    }));

    SECTION("Without a source custom subjects are skipped") {
        DatabaseStrategy strategy(g, store);
        MatchSet matches;
        REQUIRE(strategy.matchSubjects(g.nodes(), matches).has_value());
        CHECK(matches.getMatches("_:central")[0].id == biology);
        CHECK(matches.getMatches("_:byuri")[0].id == botany);
        CHECK_FALSE(matches.hasMatches("_:nomatch"));
        CHECK_FALSE(matches.hasMatches("_:custom"));
    }

    SECTION("With a source custom subjects use its taxonomy") {
        config::DisambiguationConfig cfg;
        cfg.sourceId = provider;
        DatabaseStrategy strategy(g, store, cfg);
        MatchSet matches;
        REQUIRE(strategy.matchSubjects(g.nodes(), matches).has_value());
        REQUIRE(matches.hasMatches("_:custom"));
        CHECK(matches.getMatches("_:custom")[0].id == custom);
    }

    SECTION("A foreign source sees nothing") {
        config::DisambiguationConfig cfg;
        cfg.sourceId = centralSource;
        DatabaseStrategy strategy(g, store, cfg);
        MatchSet matches;
        REQUIRE(strategy.matchSubjects(nodesOfType(g, "subject"), matches).has_value());
        CHECK_FALSE(matches.hasMatches("_:custom"));
    }
}
