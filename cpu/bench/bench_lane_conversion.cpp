/**
 * Benchmark for lane base conversion
 *
 * Measures performance of:
 * - Spreading a native word into base 13 and base 9
 * - Theta rotation (base 13 -> base 9)
 * - Chi read-back (base 9 -> base 13 / native word)
 * - Full-state field bridge
 */

#include <iostream>
#include <chrono>
#include <random>
#include <vector>
#include <iomanip>
#include <string>
#include "keccak_radix/bridge.hpp"
#include "keccak_radix/convert.hpp"
#include "keccak_radix/init.hpp"

using namespace keccak_radix;

std::vector<std::uint64_t> generate_random_words(std::size_t count) {
    std::vector<std::uint64_t> result;
    result.reserve(count);

    std::random_device rd;
    std::mt19937_64 gen(rd());
    for (std::size_t i = 0; i < count; ++i) {
        result.push_back(gen());
    }
    return result;
}

template <typename Fn>
double time_ns_per_op(std::size_t iterations, Fn&& fn) {
    auto start = std::chrono::high_resolution_clock::now();
    for (std::size_t i = 0; i < iterations; ++i) {
        fn(i);
    }
    auto end = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start);
    return static_cast<double>(duration.count()) / iterations;
}

void print_result(const std::string& operation, double ns_per_op) {
    std::cout << std::left << std::setw(24) << operation << ": ";
    std::cout << std::right << std::setw(10) << std::fixed << std::setprecision(2) << ns_per_op;
    std::cout << " ns/op\n";
}

int main() {
    KECCAK_RADIX_INIT();

    constexpr std::size_t NUM_WORDS = 100;
    constexpr std::size_t ITERATIONS = 20000;

    auto words = generate_random_words(NUM_WORDS);
    std::vector<Lane13> lanes13;
    std::vector<Lane9> lanes9;
    for (auto w : words) {
        lanes13.push_back(convert_b2_to_b13(w));
        lanes9.push_back(convert_b2_to_b9(w));
    }

    std::cout << "Lane conversion benchmark (" << ITERATIONS << " iterations each)\n\n";

    // Prevent optimization
    volatile std::uint64_t sink = 0;

    print_result("b2 -> b13", time_ns_per_op(ITERATIONS, [&](std::size_t i) {
        sink = sink + convert_b2_to_b13(words[i % NUM_WORDS]).low_uint64();
    }));
    print_result("b2 -> b9", time_ns_per_op(ITERATIONS, [&](std::size_t i) {
        sink = sink + convert_b2_to_b9(words[i % NUM_WORDS]).low_uint64();
    }));
    print_result("b13 -> b9 (theta rot)", time_ns_per_op(ITERATIONS, [&](std::size_t i) {
        sink = sink + convert_b13_lane_to_b9(lanes13[i % NUM_WORDS], i % LANE_BITS).low_uint64();
    }));
    print_result("b9 -> b13 (chi)", time_ns_per_op(ITERATIONS, [&](std::size_t i) {
        sink = sink + convert_b9_lane_to_b13(lanes9[i % NUM_WORDS]).low_uint64();
    }));
    print_result("b9 -> b2 (chi)", time_ns_per_op(ITERATIONS, [&](std::size_t i) {
        sink = sink + convert_b9_lane_to_b2(lanes9[i % NUM_WORDS]);
    }));

    StateBigInt state;
    for (std::size_t i = 0; i < StateBigInt::LANES; ++i) {
        state(i / StateBigInt::WIDTH, i % StateBigInt::WIDTH) = lanes13[i];
    }
    print_result("state -> field (25)", time_ns_per_op(ITERATIONS / 10, [&](std::size_t) {
        sink = sink + state_to_field<25>(state)[0].limbs()[0];
    }));

    (void)sink;
    return 0;
}
