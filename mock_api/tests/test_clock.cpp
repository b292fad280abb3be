#include <catch2/catch_test_macros.hpp>
#include "core/Clock.hpp"

using namespace mockapi;

TEST_CASE("Clock: Formats epoch with microseconds", "[clock]") {
    // 2024-01-15T10:30:00.000123Z
    Timestamp us = 1705314600ULL * 1000000ULL + 123;
    REQUIRE(Clock::formatIsoMicros(us) == "2024-01-15T10:30:00.000123Z");
}

TEST_CASE("Clock: Formats epoch to the second", "[clock]") {
    Timestamp us = 1705314600ULL * 1000000ULL + 999999;
    REQUIRE(Clock::formatIsoSeconds(us) == "2024-01-15T10:30:00Z");
}

TEST_CASE("Clock: Epoch zero", "[clock]") {
    REQUIRE(Clock::formatIsoMicros(0) == "1970-01-01T00:00:00.000000Z");
}

TEST_CASE("Clock: Now is after 2024", "[clock]") {
    REQUIRE(Clock::nowMicros() > 1704067200ULL * 1000000ULL);
    REQUIRE(Clock::nowIsoMicros().back() == 'Z');
}
