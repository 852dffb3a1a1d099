// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 disambig Contributors

#include <catch2/catch_test_macros.hpp>

#include <disambig/disambiguation/relation_comparator.h>

#include <deque>
#include <optional>
#include <string>
#include <vector>

using namespace disambig;
using namespace disambig::disambiguation;
using normalize::parseHumanName;

namespace {

struct Fixture {
    graph::Node relation{"_:rel", "creator"};
    graph::Node agent{"_:agent", "person"};
    std::deque<metadata::AgentWorkRelationRecord> records;
    std::vector<CandidateRelationNames> candidates;

    NodeRelationNames node(const std::string& citedAs, const std::string& agentName,
                           std::optional<std::int64_t> order = std::nullopt) {
        relation.setAttr("cited_as", citedAs);
        if (order) {
            relation.setAttr("order_cited", *order);
        }
        agent.setAttr("name", agentName);
        return {&relation, &agent, parseHumanName(citedAs), parseHumanName(agentName)};
    }

    void add(std::int64_t id, const std::string& citedAs, const std::string& agentName,
             std::optional<std::int64_t> order = std::nullopt,
             const std::string& type = "creator") {
        metadata::AgentWorkRelationRecord record;
        record.relation.type = "agentworkrelation";
        record.relation.id = id;
        record.relation.concreteType = type;
        record.relation.fields = {{"id", id}, {"cited_as", citedAs}};
        record.relation.fields["order_cited"] = order ? nlohmann::json(*order) : nlohmann::json();
        record.agent.type = "agent";
        record.agent.id = id * 10;
        record.agent.concreteType = "person";
        record.agent.fields = {{"id", id * 10}, {"name", agentName}};
        records.push_back(std::move(record));
        candidates.push_back(
            {&records.back(), parseHumanName(citedAs), parseHumanName(agentName)});
    }
};

} // namespace

TEST_CASE("Name keys", "[unit][disambiguation][comparator]") {
    auto john = parseHumanName("John Smith");
    CHECK(compareNames(john, parseHumanName("John Smith")) == NameKey{true, true, true});
    CHECK(compareNames(john, parseHumanName("Smith, John")) == NameKey{false, true, true});
    CHECK(compareNames(john, parseHumanName("J. Smith")) == NameKey{false, false, true});
    CHECK(compareNames(john, parseHumanName("Jane Doe")) == NameKey{false, false, false});
    CHECK(compareNames(parseHumanName(""), parseHumanName("")) == NameKey{true, true, true});
}

TEST_CASE("Name keys: initials are whole characters", "[unit][disambiguation][comparator]") {
    auto emile = parseHumanName("Émile Durand");
    CHECK(compareNames(emile, parseHumanName("Öskar Durand")) == NameKey{false, false, false});
    CHECK(compareNames(emile, parseHumanName("É. Durand")) == NameKey{false, false, true});

    Fixture fix;
    auto node = fix.node("Émile Durand", "Émile Durand");
    fix.add(1, "Öskar Durand", "Öskar Durand");
    CHECK(selectBestRelation(node, fix.candidates) == nullptr);

    fix.add(2, "É. Durand", "Émile Durand");
    const auto* best = selectBestRelation(node, fix.candidates);
    REQUIRE(best != nullptr);
    CHECK(best->record->relation.id == 2);
}

TEST_CASE("Comparator: full name beats initials", "[unit][disambiguation][comparator]") {
    Fixture fix;
    auto node = fix.node("John Smith", "John Smith");

    SECTION("Initial-only candidate first") {
        fix.add(1, "J. Smith", "J. Smith");
        fix.add(2, "John Smith", "John Smith");
        const auto* best = selectBestRelation(node, fix.candidates);
        REQUIRE(best != nullptr);
        CHECK(best->record->relation.id == 2);
    }

    SECTION("Full-name candidate first") {
        fix.add(2, "John Smith", "John Smith");
        fix.add(1, "J. Smith", "J. Smith");
        const auto* best = selectBestRelation(node, fix.candidates);
        REQUIRE(best != nullptr);
        CHECK(best->record->relation.id == 2);
    }
}

TEST_CASE("Comparator: validity gate", "[unit][disambiguation][comparator]") {
    Fixture fix;
    auto node = fix.node("John Smith", "John Smith");

    SECTION("No name component in common") {
        fix.add(1, "Alice Jones", "Alice Jones");
        CHECK(selectBestRelation(node, fix.candidates) == nullptr);
    }

    SECTION("Matching agent name alone is not enough") {
        fix.add(1, "Alice Jones", "John Smith", std::nullopt, "creator");
        ComparableAgentWorkRelation comparable(node, fix.candidates.front());
        CHECK_FALSE(comparable.validMatch());
        CHECK(comparable.sortKey()[3]);
        CHECK(selectBestRelation(node, fix.candidates) == nullptr);
    }

    SECTION("No candidates") {
        CHECK(selectBestRelation(node, fix.candidates) == nullptr);
    }
}

TEST_CASE("Comparator: tie-breakers", "[unit][disambiguation][comparator]") {
    Fixture fix;

    SECTION("Citation order") {
        auto node = fix.node("J. Smith", "John Smith", 1);
        fix.add(1, "J. Smith", "John Smith", 0);
        fix.add(2, "J. Smith", "John Smith", 1);
        const auto* best = selectBestRelation(node, fix.candidates);
        REQUIRE(best != nullptr);
        CHECK(best->record->relation.id == 2);
    }

    SECTION("Missing order on both sides counts as equal") {
        auto node = fix.node("J. Smith", "John Smith");
        fix.add(1, "J. Smith", "John Smith", 3);
        fix.add(2, "J. Smith", "John Smith");
        CHECK(selectBestRelation(node, fix.candidates)->record->relation.id == 2);
    }

    SECTION("Concrete type") {
        auto node = fix.node("J. Smith", "John Smith");
        fix.add(1, "J. Smith", "John Smith", std::nullopt, "contributor");
        fix.add(2, "J. Smith", "John Smith", std::nullopt, "creator");
        CHECK(selectBestRelation(node, fix.candidates)->record->relation.id == 2);
    }

    SECTION("Full ties go to the earliest candidate") {
        auto node = fix.node("J. Smith", "John Smith");
        fix.add(5, "J. Smith", "John Smith");
        fix.add(3, "J. Smith", "John Smith");
        CHECK(selectBestRelation(node, fix.candidates)->record->relation.id == 5);
    }

    SECTION("Sort key layout") {
        auto node = fix.node("John Smith", "Smith, John", 0);
        fix.add(1, "John Smith", "J. Smith", 0, "creator");
        ComparableAgentWorkRelation comparable(node, fix.candidates.front());
        CHECK(comparable.sortKey() == SortKey{true, true, true, false, false, true, true, true});
    }
}
