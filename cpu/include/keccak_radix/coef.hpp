#pragma once

// ============================================================================
// Digit coefficient mappers
// ============================================================================
// A lane spread one bit per digit in base 13 (or base 9) can be summed with
// other lanes without inter-digit carries. The mappers below recover the
// boolean result at one digit position from the arithmetic sum.
//
// Base 9 coefficient scalers:
//   f_logic(a, b, c, d) = a ^ (~b & c) ^ d
//   f_arith(a, b, c, d) = 2*a + b + 3*c + 2*d
// with 0 <= f_arith < 9 and f_arith -> f_logic well defined.
// ============================================================================

#include <array>
#include <cstdint>

namespace keccak_radix {

constexpr std::uint8_t B2 = 2;
constexpr std::uint8_t B9 = 9;
constexpr std::uint8_t B13 = 13;

constexpr std::uint64_t A1 = 2;
constexpr std::uint64_t A2 = 1;
constexpr std::uint64_t A3 = 3;
constexpr std::uint64_t A4 = 2;

// f_arith -> f_logic
inline constexpr std::array<std::uint8_t, 9> B9_COEF_TABLE = {0, 0, 1, 1, 0, 0, 1, 1, 0};

// Maps a sum of up to 12 bits to their XOR: the parity of the digit.
// Throws std::invalid_argument if x >= 13.
std::uint8_t convert_b13_coef(std::uint8_t x);

// Maps 2*a + b + 3*c + 2*d to a ^ (~b & c) ^ d.
// Throws std::invalid_argument if x >= 9.
std::uint8_t convert_b9_coef(std::uint8_t x);

// Pass-through, for pure re-basing
constexpr std::uint8_t identity_coef(std::uint8_t x) noexcept {
    return x;
}

// Arithmetic and logic forms of the base-9 combinator over single bits
constexpr std::uint8_t b9_arith(std::uint8_t a, std::uint8_t b, std::uint8_t c, std::uint8_t d) noexcept {
    return static_cast<std::uint8_t>(A1 * a + A2 * b + A3 * c + A4 * d);
}

constexpr std::uint8_t b9_logic(std::uint8_t a, std::uint8_t b, std::uint8_t c, std::uint8_t d) noexcept {
    return static_cast<std::uint8_t>((a ^ (~b & c) ^ d) & 1u);
}

} // namespace keccak_radix
