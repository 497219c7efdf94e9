#pragma once

// ============================================================================
// BN254 scalar field element
// ============================================================================
// r = 0x30644e72e131a029b85045b68181585d2833e84879b9709143e1f593f0000001
//
// The proving layer consumes lanes as elements of this field. The canonical
// representation (repr) is 32 bytes little-endian and must be < r.
// ============================================================================

#include "keccak_radix/lane.hpp"
#include "keccak_radix/types.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace keccak_radix {

class FieldElement {
public:
    using limbs_type = std::array<std::uint64_t, 4>;

    FieldElement();

    static FieldElement zero();
    static FieldElement one();
    static FieldElement from_uint64(std::uint64_t value);
    // Reduces mod r
    static FieldElement from_limbs(const limbs_type& limbs);

    // Canonical little-endian representation; empty optional if >= r
    [[nodiscard]] static std::optional<FieldElement> from_repr(const std::array<std::uint8_t, 32>& bytes);
    std::array<std::uint8_t, 32> to_repr() const;

    // Empty optional if lane >= r
    [[nodiscard]] static std::optional<FieldElement> from_lane(const LaneValue& lane);
    LaneValue to_lane() const;

    // 64 hex characters, most significant first; reduces mod r
    static FieldElement from_hex(const std::string& hex);
    std::string to_hex() const;

    static LaneValue modulus();

    FieldElement operator+(const FieldElement& rhs) const;
    FieldElement operator-(const FieldElement& rhs) const;
    FieldElement operator*(const FieldElement& rhs) const;
    FieldElement& operator+=(const FieldElement& rhs);
    FieldElement& operator-=(const FieldElement& rhs);
    FieldElement& operator*=(const FieldElement& rhs);

    bool is_zero() const noexcept;
    bool operator==(const FieldElement& rhs) const noexcept;
    bool operator!=(const FieldElement& rhs) const noexcept { return !(*this == rhs); }

    std::uint8_t bit(std::size_t index) const;
    const limbs_type& limbs() const noexcept { return limbs_; }

    FieldElementData data() const noexcept;

private:
    FieldElement(const limbs_type& limbs, bool normalized);

    limbs_type limbs_{};
};

// Big-endian digits folded inside the field: acc = acc * base + digit
FieldElement field_from_radix_be(const std::vector<std::uint8_t>& digits, std::uint8_t base);

} // namespace keccak_radix
