#pragma once

// ============================================================================
// Lane base conversion
// ============================================================================
// Native 64-bit lanes are spread one bit per digit into base 13 (theta, where
// up to 12 bits are summed) or base 9 (chi, where 2a + b + 3c + 2d is summed),
// then folded back through the coefficient mappers in coef.hpp.
// ============================================================================

#include "keccak_radix/coef.hpp"
#include "keccak_radix/lane.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string_view>
#include <utility>
#include <vector>

namespace keccak_radix {

// Number of base-13 digits of a lane leaving the theta step
constexpr std::size_t THETA_CHUNKS = 65;
constexpr std::size_t LANE_BITS = 64;

// sum_i bit_i(word) * base^i
LaneValue convert_b2_to_base(std::uint64_t word, std::uint8_t base);
Lane13 convert_b2_to_b13(std::uint64_t word);
Lane9 convert_b2_to_b9(std::uint64_t word);

// Re-encode every big-endian `from_base` digit of `lane` through `coef_transform`
// and read the result as big-endian `to_base` digits. Empty optional when a
// mapped digit is not a valid `to_base` digit.
template <typename F>
[[nodiscard]] std::optional<LaneValue> try_convert_lane(const LaneValue& lane, std::uint8_t from_base,
                                                        std::uint8_t to_base, F&& coef_transform) {
    std::vector<std::uint8_t> chunks = lane.to_radix_be(from_base);
    for (auto& chunk : chunks) {
        chunk = coef_transform(chunk);
    }
    return LaneValue::from_radix_be(chunks, to_base);
}

// Same as try_convert_lane, but a malformed recomposition yields zero.
// Pipelines that feed valid one-bit-per-digit lanes never hit the fallback.
template <typename F>
LaneValue convert_lane(const LaneValue& lane, std::uint8_t from_base, std::uint8_t to_base, F&& coef_transform) {
    return try_convert_lane(lane, from_base, to_base, std::forward<F>(coef_transform)).value_or(LaneValue::zero());
}

// Theta output (65 base-13 chunks) to a rotated base-9 lane.
// Chunks 0 and 64 were separated in theta and are merged back; the 63 middle
// chunks are rotated left by `rot` with the merged chunk at position `rot`.
// Throws std::invalid_argument if rot > 63, the lane has more than 65 chunks,
// or the merged chunk is not a base-13 digit.
Lane9 convert_b13_lane_to_b9(const Lane13& lane, std::uint32_t rot);

Lane13 convert_b9_lane_to_b13(const Lane9& lane);
// Low 64 bits of the chi result decoded to binary
std::uint64_t convert_b9_lane_to_b2(const Lane9& lane);
// Binary read-back without coefficient mapping
std::uint64_t convert_b9_lane_to_b2_normal(const Lane9& lane);
std::uint64_t convert_b13_lane_to_b2_normal(const Lane13& lane);

// Prints the 65 little-endian chunks of `lane` in `base`
void inspect(std::ostream& out, const LaneValue& lane, std::string_view name, std::uint8_t base);

} // namespace keccak_radix
