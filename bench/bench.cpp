/**
 * @file bench.cpp
 * @brief Performance benchmarks for rawrfid decoding and reconstruction.
 *
 * Measures throughput for regression testing during development. Uses
 * synthetic captures unless a raw file is given.
 *
 * Usage:
 *   ./build/rawrfid_bench                     # 100 iterations, synthetic data
 *   ./build/rawrfid_bench 1000                # custom iteration count
 *   ./build/rawrfid_bench 100 tag.ask.raw     # benchmark a real capture
 */

#include <rawrfid/rawrfid.hpp>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <random>
#include <vector>

using namespace rawrfid;

static constexpr int DEFAULT_ITERATIONS = 100;

/**
 * @brief Build a capture resembling a 125 kHz ASK tag read.
 *
 * Pulses cluster around one and two half-bit periods with jitter.
 */
static Container make_synthetic(std::size_t num_pairs) {
    std::mt19937 rng(1234U);
    std::uniform_int_distribution<std::uint32_t> jitter(0U, 40U);
    std::uniform_int_distribution<int> coin(0, 1);

    PairList pairs;
    pairs.reserve(num_pairs);
    for (std::size_t i = 0; i < num_pairs; ++i) {
        std::uint32_t pulse = (coin(rng) ? 256U : 512U) - 20U + jitter(rng);
        std::uint32_t low = (coin(rng) ? 256U : 512U) - 20U + jitter(rng);
        pairs.push_back({pulse, pulse + low});
    }
    return Container(Header{}, std::move(pairs));
}

template <typename Fn>
static double time_us(int iterations, Fn&& fn) {
    // Warmup run
    fn();

    auto start = std::chrono::high_resolution_clock::now();
    for (int i = 0; i < iterations; i++) {
        fn();
    }
    auto end = std::chrono::high_resolution_clock::now();

    double total_us = std::chrono::duration<double, std::micro>(end - start).count();
    return total_us / static_cast<double>(iterations);
}

static void report(const char* name, double per_iter_us, std::size_t pairs,
                   std::uint64_t samples) {
    double per_pair_ns = (per_iter_us * 1000.0) / static_cast<double>(pairs);
    double msamples_per_s = static_cast<double>(samples) / per_iter_us;

    std::printf("%-20s %10.2f µs/iter  %8.2f ns/pair  %10.1f Msamples/s\n", name, per_iter_us,
                per_pair_ns, msamples_per_s);
}

static void bench_container(const char* label, const Container& container, int iterations) {
    ByteBuffer encoded;
    if (encode(container, encoded) != Error::Ok) {
        std::printf("%-20s SKIP (cannot encode)\n", label);
        return;
    }

    std::size_t pairs = container.size();
    std::uint64_t samples = container.total_samples();
    if (pairs == 0) {
        std::printf("%-20s SKIP (no pairs)\n", label);
        return;
    }

    std::printf("\n%s: %zu pairs, %llu samples, %zu bytes\n", label, pairs,
                static_cast<unsigned long long>(samples), encoded.size());

    Container decoded;
    double decode_us = time_us(iterations, [&]() {
        (void)decode(encoded.data(), encoded.size(), decoded);
    });
    report("decode", decode_us, pairs, samples);

    double encode_us = time_us(iterations, [&]() {
        ByteBuffer out;
        (void)encode(container, out);
    });
    report("encode", encode_us, pairs, samples);

    Signal signal;
    if (to_signal(container.pairs(), signal) != Error::Ok) {
        std::printf("%-20s SKIP (malformed pairs)\n", "to_signal");
        return;
    }
    double signal_us = time_us(iterations, [&]() {
        Signal s;
        (void)to_signal(container.pairs(), s);
    });
    report("to_signal", signal_us, pairs, samples);

    double pairs_us = time_us(iterations, [&]() {
        PairList p;
        (void)to_pairs(signal, p);
    });
    report("to_pairs", pairs_us, pairs, samples);
}

int main(int argc, char* argv[]) {
    int iterations = DEFAULT_ITERATIONS;

    if (argc >= 2) {
        iterations = std::atoi(argv[1]);
        if (iterations <= 0) {
            iterations = DEFAULT_ITERATIONS;
        }
    }

    std::printf("rawrfid Benchmarks (C++ Implementation)\n");
    std::printf("=======================================\n");
    std::printf("Iterations: %d\n", iterations);

    if (argc >= 3) {
        DecodeParams params;
        params.strict_pairs = false;

        Container container;
        Error result = load(argv[2], container, &params);
        if (result != Error::Ok) {
            std::printf("Could not load %s: %s\n", argv[2], error_string(result));
            return 1;
        }
        bench_container(argv[2], container, iterations);
    } else {
        bench_container("synthetic-1k", make_synthetic(1000), iterations);
        bench_container("synthetic-100k", make_synthetic(100000), iterations);
    }

    std::printf("\nNote: Use these results for relative comparisons only.\n");

    return 0;
}
