// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 disambig Contributors

#include <catch2/catch_test_macros.hpp>

#include "../../common/counting_store.h"
#include "../../common/store_fixture.h"

#include <disambig/disambiguation/disambiguator.h>
#include <disambig/disambiguation/id_obfuscator.h>
#include <disambig/graph/graph.h>
#include <disambig/normalize/identifier_normalizer.h>

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

struct Seeded {
    std::int64_t work, identifier, agent, agentIdentifier, relation, tag, through, subject;
};

Seeded seed(StoreFixture& fix) {
    Seeded s{};
    s.work = fix.addWork("On Things");
    s.identifier = fix.addWorkIdentifier("http://example.com/things", s.work);
    s.agent = fix.addAgent("Jane Doe");
    s.agentIdentifier = fix.addAgentIdentifier("mailto:jane@example.com", s.agent);
    s.relation = fix.addRelation(s.work, s.agent, "Doe, J.", 0);
    s.tag = fix.addTag("biology");
    s.through = fix.addThroughTag(s.tag, s.work);
    auto taxonomy = fix.addTaxonomy(fix.addSource("central"));
    s.subject = fix.addSubject("Biology", "http://example.com/biology", taxonomy);
    return s;
}

json document(json extra = json::array()) {
    json nodes = json::array({
        {{"@id", "_:w"}, {"@type", "Article"}, {"title", "On Things, revised"}},
        {{"@id", "_:wi"},
         {"@type", "WorkIdentifier"},
         {"uri", "HTTP://EXAMPLE.com/things"},
         {"creative_work", {{"@id", "_:w"}}}},
        {{"@id", "_:p"}, {"@type", "Person"}, {"name", "Jane Doe"}},
        {{"@id", "_:ai"},
         {"@type", "AgentIdentifier"},
         {"uri", "jane@EXAMPLE.com"},
         {"agent", {{"@id", "_:p"}}}},
        {{"@id", "_:r"},
         {"@type", "Creator"},
         {"cited_as", "Jane Doe"},
         {"order_cited", 0},
         {"agent", {{"@id", "_:p"}}},
         {"creative_work", {{"@id", "_:w"}}}},
        {{"@id", "_:t"}, {"@type", "Tag"}, {"name", "biology"}},
        {{"@id", "_:tt"},
         {"@type", "ThroughTags"},
         {"tag", {{"@id", "_:t"}}},
         {"creative_work", {{"@id", "_:w"}}}},
        {{"@id", "_:s"}, {"@type", "Subject"}, {"name", "Biology"}},
    });
    for (auto& node : extra) {
        nodes.push_back(std::move(node));
    }
    return {{"@graph", std::move(nodes)}};
}

graph::Graph normalizedGraph(const json& doc) {
    auto g = graph::loadJsonLdGraph(doc);
    REQUIRE(g.has_value());
    REQUIRE(normalize::normalizeIdentifiers(g.value(), metadata::Schema::share()).has_value());
    return std::move(g).value();
}

} // namespace

TEST_CASE("Disambiguator: default plan resolves a whole document",
          "[unit][disambiguation][disambiguator]") {
    StoreFixture fix;
    auto s = seed(fix);
    CountingCandidateStore store(fix.openStore());

    const auto g = normalizedGraph(document());
    Disambiguator disambiguator(g, store);
    auto outcome = disambiguator.run();
    REQUIRE(outcome.has_value());
    REQUIRE(std::holds_alternative<Resolved>(outcome.value()));
    const auto& matches = std::get<Resolved>(outcome.value()).matches;

    auto single = [&](const char* nodeId) {
        INFO(nodeId);
        REQUIRE(matches.getMatches(nodeId).size() == 1);
        return matches.getMatches(nodeId).front();
    };
    CHECK(single("_:wi").id == s.identifier);
    CHECK(single("_:ai").id == s.agentIdentifier);
    CHECK(single("_:s").id == s.subject);
    CHECK(single("_:t").id == s.tag);
    CHECK(single("_:w").id == s.work);
    CHECK(single("_:w").type == "creativework");
    CHECK(single("_:p").id == s.agent);
    CHECK(single("_:tt").id == s.through);
    CHECK(single("_:r").id == s.relation);
    CHECK(matches.size() == 8);

    // identifier and tag lookups are batched; throughtags is one more join
    CHECK(store.nodeJoins == 4);
}

TEST_CASE("Disambiguator: ambiguous work stops the run", "[unit][disambiguation][disambiguator]") {
    StoreFixture fix;
    auto s = seed(fix);
    auto copy = fix.addWork("On Things (copy)");
    auto copyIdentifier = fix.addWorkIdentifier("http://example.com/things-copy", copy);
    auto& store = fix.openStore();

    const auto g = normalizedGraph(document(json::array({
        {{"@id", "_:wi2"},
         {"@type", "WorkIdentifier"},
         {"uri", "http://example.com/things-copy"},
         {"creative_work", {{"@id", "_:w"}}}},
    })));
    Disambiguator disambiguator(g, store);
    auto outcome = disambiguator.run();
    REQUIRE(outcome.has_value());
    REQUIRE(std::holds_alternative<MergeRequired>(outcome.value()));

    const auto& merge = std::get<MergeRequired>(outcome.value());
    CHECK(merge.nodeId == "_:tt");
    CHECK(merge.relationName == "creative_work");
    CHECK(merge.relatedNodeId == "_:w");
    REQUIRE(merge.candidates.size() == 2);
    CHECK(merge.candidates[0].id == s.work);
    CHECK(merge.candidates[1].id == copy);
    CHECK(copyIdentifier > 0);
}

TEST_CASE("Disambiguator: matched nodes skip later steps", "[unit][disambiguation][disambiguator]") {
    StoreFixture fix;
    auto s = seed(fix);
    auto other = fix.addWork("Something else");
    CountingCandidateStore store(fix.openStore());

    const auto workId = IdObfuscator::encode(10, other).value();
    json doc = {{"@graph",
                 json::array({
                     {{"@id", workId}, {"@type", "Article"}},
                     {{"@id", "_:wi"},
                      {"@type", "WorkIdentifier"},
                      {"uri", "http://example.com/things"},
                      {"creative_work", {{"@id", workId}}}},
                 })}};
    const auto g = normalizedGraph(doc);

    Disambiguator disambiguator(g, store);
    auto outcome = disambiguator.run();
    REQUIRE(outcome.has_value());
    const auto& matches = std::get<Resolved>(outcome.value()).matches;

    REQUIRE(matches.getMatches(workId).size() == 1);
    CHECK(matches.getMatches(workId)[0].id == other);
    CHECK(matches.getMatches("_:wi")[0].id == s.identifier);
}

TEST_CASE("Disambiguator: custom plans", "[unit][disambiguation][disambiguator]") {
    StoreFixture fix;
    auto s = seed(fix);
    auto& store = fix.openStore();
    const auto g = normalizedGraph(document());

    SECTION("Only the steps asked for run") {
        Disambiguator disambiguator(g, store);
        auto outcome = disambiguator.run({{PassKind::Attrs, "tag", {"name"}, {}}});
        REQUIRE(outcome.has_value());
        const auto& matches = std::get<Resolved>(outcome.value()).matches;
        CHECK(matches.size() == 1);
        CHECK(matches.getMatches("_:t")[0].id == s.tag);
    }

    SECTION("Invalid step is an error") {
        Disambiguator disambiguator(g, store);
        auto outcome = disambiguator.run({{PassKind::OneToMany, "creativework", {}, {}}});
        REQUIRE_FALSE(outcome.has_value());
        CHECK(outcome.error().code == ErrorCode::InvalidArgument);
    }

    SECTION("Default plan order") {
        auto plan = Disambiguator::defaultPlan();
        REQUIRE(plan.size() == 9);
        CHECK(plan.front().kind == PassKind::Initial);
        CHECK(plan[7].kind == PassKind::ManyToOne);
        CHECK(plan.back().kind == PassKind::AgentWorkRelations);
        CHECK(std::string(passKindName(plan.back().kind)) == "agent-work-relations");
    }
}
