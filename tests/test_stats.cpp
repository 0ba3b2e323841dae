/**
 * @file test_stats.cpp
 * @brief Unit tests for pair statistics.
 */

#include <catch2/catch_test_macros.hpp>
#include <rawrfid/stats.hpp>

using namespace rawrfid;

TEST_CASE("compute_stats empty", "[stats]") {
    PairStats stats = compute_stats({});
    REQUIRE(stats.count == 0);
    REQUIRE(stats.total_samples == 0);
    REQUIRE(stats.max_pulse == 0);
    REQUIRE(stats.mean_pulse == 0.0);
}

TEST_CASE("compute_stats captured pairs", "[stats]") {
    const PairList pairs = {{310, 515}, {274, 527}, {252, 743},
                            {291, 534}, {515, 1016}, {266, 515}};
    PairStats stats = compute_stats(pairs);

    REQUIRE(stats.count == 6);
    REQUIRE(stats.total_samples == 3850);
    REQUIRE(stats.min_pulse == 252);
    REQUIRE(stats.max_pulse == 515);
    REQUIRE(stats.min_duration == 515);
    REQUIRE(stats.max_duration == 1016);
    REQUIRE(stats.min_low == 205);
    REQUIRE(stats.max_low == 501);
    REQUIRE(stats.mean_pulse == 318.0);
    REQUIRE(stats.mean_duration == 3850.0 / 6.0);
}

TEST_CASE("compute_stats skips low of malformed pairs", "[stats]") {
    PairStats stats = compute_stats({{5, 3}, {2, 10}});

    REQUIRE(stats.count == 2);
    REQUIRE(stats.max_pulse == 5);
    REQUIRE(stats.min_duration == 3);
    REQUIRE(stats.min_low == 8);
    REQUIRE(stats.max_low == 8);
}
