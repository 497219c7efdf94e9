// ============================================================================
// Fuzz target: lane base conversion
// ============================================================================
// Build: clang++ -fsanitize=fuzzer,address -O2 -std=c++20 \
//        -I cpu/include fuzz_convert.cpp cpu/src/lane.cpp cpu/src/coef.cpp \
//        cpu/src/convert.cpp -o fuzz_convert
// Run:   ./fuzz_convert -max_len=32 -runs=10000000
// ============================================================================

#include "keccak_radix/convert.hpp"
#include <cstdint>
#include <cstddef>
#include <array>
#include <stdexcept>

using namespace keccak_radix;

static uint64_t load64(const uint8_t* p) {
    uint64_t w = 0;
    for (int i = 7; i >= 0; --i) w = (w << 8) | p[i];
    return w;
}

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size < 25) return 0; // three words and a rotation

    const uint64_t a = load64(data);
    const uint64_t b = load64(data + 8);
    const uint64_t c = load64(data + 16);
    const unsigned rot = data[24] % LANE_BITS;

    // ── Closure: spread and read back ────────────────────────────────────────
    if (convert_b9_lane_to_b2_normal(convert_b2_to_b9(a)) != a) __builtin_trap();
    if (convert_b13_lane_to_b2_normal(convert_b2_to_b13(a)) != a) __builtin_trap();

    // ── Closure: summed base-13 lanes rotate to rotl64 of the XOR ────────────
    auto sum = convert_b2_to_b13(a) + convert_b2_to_b13(b) + convert_b2_to_b13(c);
    const uint64_t x = a ^ b ^ c;
    const uint64_t expected = rot == 0 ? x : (x << rot) | (x >> (64 - rot));
    if (convert_b9_lane_to_b2_normal(convert_b13_lane_to_b9(sum, rot)) != expected) __builtin_trap();

    // ── Closure: chi through base-9 digits ───────────────────────────────────
    const uint64_t d = ~a;
    auto chi = convert_b2_to_b9(a) * A1 + convert_b2_to_b9(b) * A2 +
               convert_b2_to_b9(c) * A3 + convert_b2_to_b9(d) * A4;
    if (convert_b9_lane_to_b2(chi) != (a ^ (~b & c) ^ d)) __builtin_trap();

    // ── Arbitrary lanes: only the documented exceptions may escape ───────────
    if (size >= 57) {
        std::array<uint8_t, 32> buf{};
        __builtin_memcpy(buf.data(), data + 25, 32);
        auto lane = LaneValue::from_bytes_le(buf);
        try {
            (void)convert_b13_lane_to_b9(lane, rot);
        } catch (const std::invalid_argument&) {
        }
        (void)convert_b9_lane_to_b13(convert_lane(lane, B13, B9, convert_b13_coef));
    }

    return 0;
}
