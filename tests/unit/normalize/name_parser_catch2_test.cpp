// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 disambig Contributors

#include <catch2/catch_test_macros.hpp>

#include <disambig/normalize/name_parser.h>

using namespace disambig::normalize;

TEST_CASE("Name parser: forward order", "[unit][normalize][names]") {
    SECTION("First and last") {
        auto n = parseHumanName("John Smith");
        CHECK(n.first == "John");
        CHECK(n.middle.empty());
        CHECK(n.last == "Smith");
        CHECK(n.fullName == "John Smith");
    }

    SECTION("Middle names are kept separately") {
        auto n = parseHumanName("John Ronald Reuel Tolkien");
        CHECK(n.first == "John");
        CHECK(n.middle == "Ronald Reuel");
        CHECK(n.last == "Tolkien");
    }

    SECTION("Titles and suffixes are split off") {
        auto n = parseHumanName("Dr. John A. Smith Jr.");
        CHECK(n.title == "Dr.");
        CHECK(n.first == "John");
        CHECK(n.middle == "A.");
        CHECK(n.last == "Smith");
        CHECK(n.suffix == "Jr.");
    }

    SECTION("Particles stay with the last name") {
        auto n = parseHumanName("Ludwig van Beethoven");
        CHECK(n.first == "Ludwig");
        CHECK(n.middle.empty());
        CHECK(n.last == "van Beethoven");
    }
}

TEST_CASE("Name parser: inverted order", "[unit][normalize][names]") {
    SECTION("Last, First Middle") {
        auto n = parseHumanName("Smith, John Adam");
        CHECK(n.first == "John");
        CHECK(n.middle == "Adam");
        CHECK(n.last == "Smith");
        CHECK(n.fullName == "Smith, John Adam");
    }

    SECTION("Trailing suffix keeps forward order") {
        auto n = parseHumanName("Martin Luther King, Jr.");
        CHECK(n.first == "Martin");
        CHECK(n.middle == "Luther");
        CHECK(n.last == "King");
        CHECK(n.suffix == "Jr.");
    }

    SECTION("Inverted with suffix part") {
        auto n = parseHumanName("King, Martin Luther, Jr.");
        CHECK(n.first == "Martin");
        CHECK(n.last == "King");
        CHECK(n.suffix == "Jr.");
    }

    SECTION("Initials compare equal to forward form") {
        auto inverted = parseHumanName("Smith, J.");
        auto forward = parseHumanName("J. Smith");
        CHECK(inverted.first == forward.first);
        CHECK(inverted.last == forward.last);
    }
}

TEST_CASE("Name parser: normalizes whitespace and drops nicknames", "[unit][normalize][names]") {
    auto n = parseHumanName("  Robert   (Bob)  \"Bobby\" Jones ");
    CHECK(n.fullName == "Robert (Bob) \"Bobby\" Jones");
    CHECK(n.first == "Robert");
    CHECK(n.middle.empty());
    CHECK(n.last == "Jones");
}

TEST_CASE("Name parser: degenerate input", "[unit][normalize][names]") {
    SECTION("Empty string") {
        auto n = parseHumanName("   ");
        CHECK(n.fullName.empty());
        CHECK(n.empty());
    }

    SECTION("Single word is a first name") {
        auto n = parseHumanName("Plato");
        CHECK(n.first == "Plato");
        CHECK(n.last.empty());
    }

    SECTION("Organisation names still parse deterministically") {
        auto a = parseHumanName("Center for Open Science");
        auto b = parseHumanName("Center for Open Science");
        CHECK(a.first == b.first);
        CHECK(a.last == b.last);
        CHECK(a.last == "Science");
    }
}

TEST_CASE("Name parser: UTF-8 characters", "[unit][normalize][names]") {
    CHECK(utf8Length("Smith") == 5);
    CHECK(utf8Length("Émile") == 5);
    CHECK(utf8Length("山田太郎") == 4);
    CHECK(utf8Length("") == 0);

    CHECK(firstCodePoint("Émile") == "É");
    CHECK(firstCodePoint("Öskar") == "Ö");
    CHECK(firstCodePoint("山田") == "山");
    CHECK(firstCodePoint("John") == "J");
    CHECK(firstCodePoint("").empty());
}
