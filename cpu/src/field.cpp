#include "keccak_radix/field.hpp"
#include "keccak_radix/config.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <vector>

namespace keccak_radix {
namespace {

using limbs4 = std::array<std::uint64_t, 4>;

constexpr limbs4 MODULUS{
    0x43E1F593F0000001ULL,
    0x2833E84879B97091ULL,
    0xB85045B68181585DULL,
    0x30644E72E131A029ULL
};

constexpr limbs4 ONE{1ULL, 0ULL, 0ULL, 0ULL};

#ifdef KECCAK_RADIX_NO_INT128

inline std::uint64_t add64(std::uint64_t a, std::uint64_t b, unsigned char& carry) {
    std::uint64_t s = a + carry;
    unsigned char c1 = static_cast<unsigned char>(s < a);
    std::uint64_t out = s + b;
    unsigned char c2 = static_cast<unsigned char>(out < s);
    carry = static_cast<unsigned char>(c1 | c2);
    return out;
}

inline std::uint64_t sub64(std::uint64_t a, std::uint64_t b, unsigned char& borrow) {
    std::uint64_t d = a - b;
    unsigned char b1 = static_cast<unsigned char>(a < b);
    std::uint64_t out = d - borrow;
    unsigned char b2 = static_cast<unsigned char>(d < borrow);
    borrow = static_cast<unsigned char>(b1 | b2);
    return out;
}

#else

inline std::uint64_t add64(std::uint64_t a, std::uint64_t b, unsigned char& carry) {
    unsigned __int128 sum = static_cast<unsigned __int128>(a) + b + carry;
    carry = static_cast<unsigned char>(sum >> 64);
    return static_cast<std::uint64_t>(sum);
}

inline std::uint64_t sub64(std::uint64_t a, std::uint64_t b, unsigned char& borrow) {
    unsigned __int128 diff = static_cast<unsigned __int128>(a) - b - borrow;
    borrow = static_cast<unsigned char>((diff >> 127) & 1);
    return static_cast<std::uint64_t>(diff);
}

#endif

[[nodiscard]] bool ge(const limbs4& a, const limbs4& b) {
    for (std::size_t i = 4; i-- > 0;) {
        if (a[i] > b[i]) {
            return true;
        }
        if (a[i] < b[i]) {
            return false;
        }
    }
    return true;
}

[[nodiscard]] limbs4 sub_raw(const limbs4& a, const limbs4& b) {
    limbs4 out{};
    unsigned char borrow = 0;
    for (std::size_t i = 0; i < 4; ++i) {
        out[i] = sub64(a[i], b[i], borrow);
    }
    return out;
}

// Full reduction of an arbitrary 256-bit value (r > 2^253, so at most 5 steps)
[[nodiscard]] limbs4 reduce(limbs4 v) {
    while (ge(v, MODULUS)) {
        v = sub_raw(v, MODULUS);
    }
    return v;
}

// Inputs are < r, so the raw sum never carries out of 256 bits
[[nodiscard]] limbs4 add_impl(const limbs4& a, const limbs4& b) {
    limbs4 sum{};
    unsigned char carry = 0;
    for (std::size_t i = 0; i < 4; ++i) {
        sum[i] = add64(a[i], b[i], carry);
    }
    if (ge(sum, MODULUS)) {
        return sub_raw(sum, MODULUS);
    }
    return sum;
}

[[nodiscard]] limbs4 sub_impl(const limbs4& a, const limbs4& b) {
    limbs4 out{};
    unsigned char borrow = 0;
    for (std::size_t i = 0; i < 4; ++i) {
        out[i] = sub64(a[i], b[i], borrow);
    }
    if (borrow) {
        unsigned char carry = 0;
        for (std::size_t i = 0; i < 4; ++i) {
            out[i] = add64(out[i], MODULUS[i], carry);
        }
    }
    return out;
}

} // namespace

FieldElement::FieldElement() = default;

FieldElement::FieldElement(const limbs_type& limbs, bool normalized) : limbs_(limbs) {
    if (!normalized) {
        limbs_ = reduce(limbs_);
    }
}

FieldElement FieldElement::zero() {
    return FieldElement();
}

FieldElement FieldElement::one() {
    return FieldElement(ONE, true);
}

FieldElement FieldElement::from_uint64(std::uint64_t value) {
    limbs_type limbs{};
    limbs[0] = value;
    return FieldElement(limbs, true);
}

FieldElement FieldElement::from_limbs(const limbs_type& limbs) {
    return FieldElement(limbs, false);
}

std::optional<FieldElement> FieldElement::from_repr(const std::array<std::uint8_t, 32>& bytes) {
    return from_lane(LaneValue::from_bytes_le(bytes));
}

std::array<std::uint8_t, 32> FieldElement::to_repr() const {
    return to_lane().to_bytes_le();
}

std::optional<FieldElement> FieldElement::from_lane(const LaneValue& lane) {
    if (ge(lane.limbs(), MODULUS)) {
        return std::nullopt;
    }
    return FieldElement(lane.limbs(), true);
}

LaneValue FieldElement::to_lane() const {
    return LaneValue::from_limbs(limbs_);
}

FieldElement FieldElement::from_hex(const std::string& hex) {
    return FieldElement(LaneValue::from_hex(hex).limbs(), false);
}

std::string FieldElement::to_hex() const {
    return to_lane().to_hex();
}

LaneValue FieldElement::modulus() {
    return LaneValue::from_limbs(MODULUS);
}

FieldElement FieldElement::operator+(const FieldElement& rhs) const {
    return FieldElement(add_impl(limbs_, rhs.limbs_), true);
}

FieldElement FieldElement::operator-(const FieldElement& rhs) const {
    return FieldElement(sub_impl(limbs_, rhs.limbs_), true);
}

FieldElement FieldElement::operator*(const FieldElement& rhs) const {
    // Double-and-add with modular reduction at each step
    FieldElement result = FieldElement::zero();
    FieldElement base = *this;

    for (std::size_t bit = 0; bit < 256; ++bit) {
        if (rhs.bit(bit)) {
            result += base;
        }
        base += base;
    }

    return result;
}

FieldElement& FieldElement::operator+=(const FieldElement& rhs) {
    limbs_ = add_impl(limbs_, rhs.limbs_);
    return *this;
}

FieldElement& FieldElement::operator-=(const FieldElement& rhs) {
    limbs_ = sub_impl(limbs_, rhs.limbs_);
    return *this;
}

FieldElement& FieldElement::operator*=(const FieldElement& rhs) {
    *this = *this * rhs;
    return *this;
}

bool FieldElement::is_zero() const noexcept {
    for (auto limb : limbs_) {
        if (limb != 0) {
            return false;
        }
    }
    return true;
}

bool FieldElement::operator==(const FieldElement& rhs) const noexcept {
    return limbs_ == rhs.limbs_;
}

std::uint8_t FieldElement::bit(std::size_t index) const {
    if (index >= 256) {
        return 0;
    }
    std::size_t limb_idx = index / 64;
    std::size_t bit_idx = index % 64;
    return static_cast<std::uint8_t>((limbs_[limb_idx] >> bit_idx) & 0x1u);
}

FieldElementData FieldElement::data() const noexcept {
    FieldElementData d{};
    for (std::size_t i = 0; i < 4; ++i) {
        d.limbs[i] = limbs_[i];
    }
    return d;
}

FieldElement field_from_radix_be(const std::vector<std::uint8_t>& digits, std::uint8_t base) {
    const FieldElement b = FieldElement::from_uint64(base);
    FieldElement acc = FieldElement::zero();
    for (auto digit : digits) {
        acc = acc * b + FieldElement::from_uint64(digit);
    }
    return acc;
}

} // namespace keccak_radix
