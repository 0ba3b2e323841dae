/**
 * @file test_signal.cpp
 * @brief Unit tests for Signal and pair/signal conversion.
 */

#include <catch2/catch_test_macros.hpp>
#include <rawrfid/signal.hpp>

#include <vector>

using namespace rawrfid;

namespace {

Signal from_list(const std::vector<std::uint8_t>& samples) {
    return Signal::from_samples(samples.data(), samples.size());
}

// Pairs from a real ASK capture
const PairList CAPTURED_PAIRS = {{310, 515}, {274, 527}, {252, 743},
                                 {291, 534}, {515, 1016}, {266, 515}};

} // namespace

TEST_CASE("Signal initialization", "[signal]") {
    SECTION("default is empty") {
        Signal signal;
        REQUIRE(signal.size() == 0);
        REQUIRE(signal.empty());
        REQUIRE(signal.num_words() == 0);
    }

    SECTION("length constructor is all low") {
        Signal signal(33);
        REQUIRE(signal.size() == 33);
        REQUIRE(signal.num_words() == 2);
        REQUIRE(signal.hamming_weight() == 0);
    }
}

TEST_CASE("Signal bit access", "[signal]") {
    Signal signal(40);

    SECTION("set and get") {
        signal.set_bit(0, 1);
        signal.set_bit(31, 1);
        signal.set_bit(32, 1);
        REQUIRE(signal.get_bit(0) == 1);
        REQUIRE(signal.get_bit(1) == 0);
        REQUIRE(signal.get_bit(31) == 1);
        REQUIRE(signal.get_bit(32) == 1);
        REQUIRE(signal.data()[0] == 0x80000001U);

        signal.set_bit(31, 0);
        REQUIRE(signal.get_bit(31) == 0);
    }

    SECTION("past the end") {
        signal.set_bit(40, 1);
        signal.set_bit(1000, 1);
        REQUIRE(signal.get_bit(40) == 0);
        REQUIRE(signal.hamming_weight() == 0);
    }
}

TEST_CASE("Signal append_run", "[signal]") {
    Signal signal;
    signal.append_run(1, 40);
    signal.append_run(0, 30);
    signal.append_run(1, 1);
    signal.append_run(0, 0);

    REQUIRE(signal.size() == 71);
    REQUIRE(signal.num_words() == 3);
    REQUIRE(signal.hamming_weight() == 41);
    REQUIRE(signal.data()[0] == 0xFFFFFFFFU);
    REQUIRE(signal.data()[1] == 0xFF000000U);
    // Padding after the last sample stays zero
    REQUIRE(signal.data()[2] == 0x02000000U);

    SECTION("run_length across word boundaries") {
        REQUIRE(signal.run_length(0) == 40);
        REQUIRE(signal.run_length(10) == 30);
        REQUIRE(signal.run_length(40) == 30);
        REQUIRE(signal.run_length(64) == 6);
        REQUIRE(signal.run_length(70) == 1);
        REQUIRE(signal.run_length(71) == 0);
    }

    SECTION("append_bit") {
        signal.append_bit(1);
        REQUIRE(signal.size() == 72);
        REQUIRE(signal.run_length(70) == 2);
    }
}

TEST_CASE("Signal samples conversion", "[signal]") {
    const std::vector<std::uint8_t> samples = {1, 1, 0, 0, 0, 1, 0, 1};
    Signal signal = from_list(samples);

    REQUIRE(signal.size() == samples.size());
    REQUIRE(signal.to_samples() == samples);

    SECTION("non-zero bytes count as high") {
        Signal other = from_list({7, 255, 0, 0, 0, 2, 0, 9});
        REQUIRE(other == signal);
    }
}

TEST_CASE("to_signal", "[signal]") {
    Signal signal;

    SECTION("two pairs") {
        REQUIRE(to_signal({{3, 5}, {2, 4}}, signal) == Error::Ok);
        REQUIRE(signal.to_samples() == std::vector<std::uint8_t>{1, 1, 1, 0, 0, 1, 1, 0, 0});
    }

    SECTION("pair without pulse") {
        REQUIRE(to_signal({{0, 4}}, signal) == Error::Ok);
        REQUIRE(signal.to_samples() == std::vector<std::uint8_t>{0, 0, 0, 0});
    }

    SECTION("pulse equal to duration") {
        REQUIRE(to_signal({{3, 3}}, signal) == Error::Ok);
        REQUIRE(signal.to_samples() == std::vector<std::uint8_t>{1, 1, 1});
    }

    SECTION("empty input") {
        signal.append_run(1, 5);
        REQUIRE(to_signal({}, signal) == Error::Ok);
        REQUIRE(signal.empty());
    }

    SECTION("empty pair contributes nothing") {
        REQUIRE(to_signal({{0, 0}, {1, 2}}, signal) == Error::Ok);
        REQUIRE(signal.to_samples() == std::vector<std::uint8_t>{1, 0});
    }

    SECTION("length is the sum of durations") {
        REQUIRE(to_signal(CAPTURED_PAIRS, signal) == Error::Ok);
        REQUIRE(signal.size() == 3850);

        std::size_t high = 0;
        for (const auto& pair : CAPTURED_PAIRS) {
            high += pair.pulse;
        }
        REQUIRE(signal.hamming_weight() == high);
    }
}

TEST_CASE("to_signal errors", "[signal]") {
    Signal signal;
    signal.append_run(1, 3);

    SECTION("pulse longer than duration") {
        REQUIRE(to_signal({{1, 2}, {5, 3}}, signal) == Error::MalformedPair);
    }

    SECTION("too many samples") {
        REQUIRE(to_signal({{0, 0xFFFFFFFFU}}, signal) == Error::Overflow);
    }

    // Output untouched on failure
    REQUIRE(signal.size() == 3);
}

TEST_CASE("to_pairs", "[signal]") {
    PairList pairs;

    SECTION("empty signal") {
        pairs.push_back({1, 2});
        REQUIRE(to_pairs(Signal{}, pairs) == Error::Ok);
        REQUIRE(pairs.empty());
    }

    SECTION("regular edges") {
        REQUIRE(to_pairs(from_list({1, 1, 1, 0, 0, 1, 1, 0, 0}), pairs) == Error::Ok);
        REQUIRE(pairs == PairList{{3, 5}, {2, 4}});
    }

    SECTION("leading low run") {
        REQUIRE(to_pairs(from_list({0, 0, 1, 1, 0}), pairs) == Error::Ok);
        REQUIRE(pairs == PairList{{0, 2}, {2, 3}});
    }

    SECTION("trailing high run") {
        REQUIRE(to_pairs(from_list({1, 1, 0, 1, 1}), pairs) == Error::Ok);
        REQUIRE(pairs == PairList{{2, 3}, {2, 2}});
    }

    SECTION("all low") {
        Signal signal(70);
        REQUIRE(to_pairs(signal, pairs) == Error::Ok);
        REQUIRE(pairs == PairList{{0, 70}});
    }

    SECTION("all high across words") {
        Signal signal;
        signal.append_run(1, 96);
        REQUIRE(to_pairs(signal, pairs) == Error::Ok);
        REQUIRE(pairs == PairList{{96, 96}});
    }
}

TEST_CASE("Pairs survive signal reconstruction", "[signal]") {
    Signal signal;
    PairList recovered;

    SECTION("captured pairs") {
        REQUIRE(to_signal(CAPTURED_PAIRS, signal) == Error::Ok);
        REQUIRE(to_pairs(signal, recovered) == Error::Ok);
        REQUIRE(recovered == CAPTURED_PAIRS);
    }

    SECTION("leading pair without pulse") {
        const PairList pairs = {{0, 7}, {40, 90}, {33, 33}};
        REQUIRE(to_signal(pairs, signal) == Error::Ok);
        REQUIRE(to_pairs(signal, recovered) == Error::Ok);
        REQUIRE(recovered == pairs);
    }

    SECTION("signal survives pair extraction") {
        Signal original = from_list({0, 1, 1, 0, 1, 0, 0, 0, 1, 1, 1});
        REQUIRE(to_pairs(original, recovered) == Error::Ok);
        REQUIRE(to_signal(recovered, signal) == Error::Ok);
        REQUIRE(signal == original);
    }
}
