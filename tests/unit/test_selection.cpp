/**
 * @file test_selection.cpp
 * @brief Unit tests for selection expressions
 */

#include <catch2/catch_test_macros.hpp>

#include <anvil/selection.h>
#include <anvil/errors.h>

using namespace anvil;
using Indices = std::vector<uint32_t>;

TEST_CASE("Selection expressions", "[selection]") {
    SECTION("star selects everything") {
        REQUIRE(parseSelection("*", 4) == Indices{0, 1, 2, 3});
        REQUIRE(parseSelection(" * ", 0).empty());
    }

    SECTION("empty expression selects nothing") {
        REQUIRE(parseSelection("", 10).empty());
        REQUIRE(parseSelection("   ", 10).empty());
    }

    SECTION("single indices and lists") {
        REQUIRE(parseSelection("3", 6) == Indices{3});
        REQUIRE(parseSelection("4, 1,2", 6) == Indices{1, 2, 4});
    }

    SECTION("half-open and inclusive ranges") {
        REQUIRE(parseSelection("1..4", 6) == Indices{1, 2, 3});
        REQUIRE(parseSelection("1..=4", 6) == Indices{1, 2, 3, 4});
        REQUIRE(parseSelection("2..2", 6).empty());
    }

    SECTION("result is sorted without duplicates") {
        REQUIRE(parseSelection("5,0..3,2", 6) == Indices{0, 1, 2, 5});
    }
}

TEST_CASE("Invalid selections", "[selection]") {
    SECTION("out of range indices are errors, not clamped") {
        REQUIRE_THROWS_AS(parseSelection("6", 6), GeometryError);
        REQUIRE_THROWS_AS(parseSelection("0..=6", 6), GeometryError);
    }

    SECTION("malformed terms") {
        REQUIRE_THROWS_AS(parseSelection("a", 6), GeometryError);
        REQUIRE_THROWS_AS(parseSelection("1,,2", 6), GeometryError);
        REQUIRE_THROWS_AS(parseSelection("-1", 6), GeometryError);
        REQUIRE_THROWS_AS(parseSelection("1..", 6), GeometryError);
    }
}

TEST_CASE("Selection mask", "[selection]") {
    std::vector<bool> mask = selectionMask({1, 3}, 4);
    REQUIRE(mask == std::vector<bool>{false, true, false, true});
}
