// ============================================================================
// Fuzz target: BN254 field arithmetic and lane bridge
// ============================================================================
// Build: clang++ -fsanitize=fuzzer,address -O2 -std=c++20 \
//        -I cpu/include fuzz_field.cpp cpu/src/lane.cpp cpu/src/field.cpp \
//        -o fuzz_field
// Run:   ./fuzz_field -max_len=64 -runs=10000000
// ============================================================================

#include "keccak_radix/field.hpp"
#include <cstdint>
#include <cstddef>
#include <array>

using keccak_radix::FieldElement;
using keccak_radix::LaneValue;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size < 64) return 0; // need two 32-byte values

    std::array<uint8_t, 32> buf_a{}, buf_b{};
    __builtin_memcpy(buf_a.data(), data, 32);
    __builtin_memcpy(buf_b.data(), data + 32, 32);

    auto lane_a = LaneValue::from_bytes_le(buf_a);
    auto maybe_a = FieldElement::from_repr(buf_a);

    // ── Closure: canonical repr iff value < r ────────────────────────────────
    if (maybe_a.has_value() != (lane_a < FieldElement::modulus())) __builtin_trap();
    if (maybe_a && maybe_a->to_repr() != buf_a) __builtin_trap();

    auto a = FieldElement::from_limbs(lane_a.limbs());
    auto b = FieldElement::from_limbs(LaneValue::from_bytes_le(buf_b).limbs());

    // ── Closure: add/sub round-trip ──────────────────────────────────────────
    auto a_orig = a.to_repr();
    if ((a + b - b).to_repr() != a_orig) __builtin_trap();

    // ── Closure: mul by 1 = identity ─────────────────────────────────────────
    if ((a * FieldElement::one()).to_repr() != a_orig) __builtin_trap();

    // ── Closure: a * b == b * a, a * (b + 1) == a * b + a ────────────────────
    if (a * b != b * a) __builtin_trap();
    if (a * (b + FieldElement::one()) != a * b + a) __builtin_trap();

    // ── Closure: reduced value goes through the lane bridge unchanged ────────
    auto back = FieldElement::from_lane(a.to_lane());
    if (!back || *back != a) __builtin_trap();

    return 0;
}
