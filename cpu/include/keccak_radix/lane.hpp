#pragma once

// ============================================================================
// Lane integer
// ============================================================================
// Fixed-width 256-bit unsigned integer used for every radix-encoded lane.
// A 64-bit Keccak lane spread over 65 base-13 digits needs ~241 bits, so 256
// bits hold every value the converters produce. Arithmetic is checked: a
// carry out of bit 255 throws instead of wrapping.
// ============================================================================

#include "keccak_radix/types.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace keccak_radix {

class LaneValue {
public:
    using limbs_type = std::array<std::uint64_t, 4>;

    static constexpr std::size_t BYTES = 32;
    static constexpr std::size_t BITS = 256;

    LaneValue();

    static LaneValue zero();
    static LaneValue from_uint64(std::uint64_t value);
    static LaneValue from_limbs(const limbs_type& limbs);

    // Little-endian byte order (byte 0 = least significant)
    static LaneValue from_bytes_le(const std::array<std::uint8_t, 32>& bytes);
    // Accepts any length; empty optional if a byte past the 32nd is non-zero
    [[nodiscard]] static std::optional<LaneValue> from_bytes_le(const std::uint8_t* data, std::size_t len);
    std::array<std::uint8_t, 32> to_bytes_le() const;

    // 64 hex characters, most significant first
    static LaneValue from_hex(const std::string& hex);
    std::string to_hex() const;
    std::string to_decimal() const;

    // Positional digits, base in [2, 256]. Zero is the single digit 0.
    std::vector<std::uint8_t> to_radix_le(std::uint32_t base) const;
    std::vector<std::uint8_t> to_radix_be(std::uint32_t base) const;

    // Empty optional when a digit is >= base or the value exceeds 256 bits.
    // An empty digit sequence is zero.
    [[nodiscard]] static std::optional<LaneValue> from_radix_le(const std::vector<std::uint8_t>& digits,
                                                                std::uint32_t base);
    [[nodiscard]] static std::optional<LaneValue> from_radix_be(const std::vector<std::uint8_t>& digits,
                                                                std::uint32_t base);

    LaneValue operator+(const LaneValue& rhs) const;
    LaneValue operator*(std::uint64_t factor) const;
    LaneValue& operator+=(const LaneValue& rhs);
    LaneValue& operator*=(std::uint64_t factor);

    // In-place division by a small divisor, returns the remainder
    std::uint32_t divmod_small(std::uint32_t divisor);

    bool is_zero() const noexcept;
    bool operator==(const LaneValue& rhs) const noexcept;
    bool operator!=(const LaneValue& rhs) const noexcept { return !(*this == rhs); }
    bool operator<(const LaneValue& rhs) const noexcept;

    std::uint8_t bit(std::size_t index) const;
    std::size_t bit_length() const noexcept;

    bool fits_uint64() const noexcept;
    // Low 64 bits, higher limbs ignored
    std::uint64_t low_uint64() const noexcept { return limbs_[0]; }

    const limbs_type& limbs() const noexcept { return limbs_; }

    LaneData data() const noexcept;
    static LaneValue from_data(const LaneData& data) noexcept;

private:
    limbs_type limbs_{};
};

// Decimal representation
std::ostream& operator<<(std::ostream& os, const LaneValue& value);

using Lane13 = LaneValue;
using Lane9 = LaneValue;

} // namespace keccak_radix
