#pragma once

// ============================================================================
// State <-> native words <-> field elements
// ============================================================================
// Pure repacking between the three lane representations:
//   State           native 5x5 u64 matrix
//   StateBigInt     radix-encoded lanes (up to 256 bits)
//   FieldElement[N] witness values for the proving layer, lanes in x*5+y order
//
// Nothing here truncates silently: a lane that does not fit its target
// throws.
// ============================================================================

#include "keccak_radix/field.hpp"
#include "keccak_radix/state.hpp"

#include <array>
#include <cstddef>
#include <optional>

namespace keccak_radix {

StateBigInt state_from_words(const State& state);

// Throws std::out_of_range if a lane has bits above bit 63
State state_to_words(const StateBigInt& state);

// Empty optional if lane >= r
[[nodiscard]] std::optional<FieldElement> lane_to_field(const LaneValue& lane);

namespace detail {

void state_to_field(const StateBigInt& state, FieldElement* out, std::size_t n);
StateBigInt state_from_field(const FieldElement* elems, std::size_t n);
State field_to_words(const FieldElement* elems, std::size_t n);

} // namespace detail

// First N lanes as field elements.
// Throws std::overflow_error if a lane is >= r.
template <std::size_t N>
std::array<FieldElement, N> state_to_field(const StateBigInt& state) {
    static_assert(N <= StateBigInt::LANES, "A state holds at most 25 lanes");
    std::array<FieldElement, N> out{};
    detail::state_to_field(state, out.data(), N);
    return out;
}

// N field elements as the first N lanes, the rest zero
template <std::size_t N>
StateBigInt state_from_field(const std::array<FieldElement, N>& elems) {
    static_assert(N <= StateBigInt::LANES, "A state holds at most 25 lanes");
    return detail::state_from_field(elems.data(), N);
}

// N field elements straight to native words, the rest zero.
// Throws std::out_of_range if bytes 8..31 of a representation are non-zero.
template <std::size_t N>
State field_to_words(const std::array<FieldElement, N>& elems) {
    static_assert(N <= StateBigInt::LANES, "A state holds at most 25 lanes");
    return detail::field_to_words(elems.data(), N);
}

} // namespace keccak_radix
