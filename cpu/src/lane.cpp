#include "keccak_radix/lane.hpp"
#include "keccak_radix/config.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace keccak_radix {
namespace {

using limbs4 = std::array<std::uint64_t, 4>;

#ifdef KECCAK_RADIX_NO_INT128

KECCAK_RADIX_INLINE std::uint64_t add64(std::uint64_t a, std::uint64_t b, unsigned char& carry) {
    std::uint64_t s = a + carry;
    unsigned char c1 = static_cast<unsigned char>(s < a);
    std::uint64_t out = s + b;
    unsigned char c2 = static_cast<unsigned char>(out < s);
    carry = static_cast<unsigned char>(c1 | c2);
    return out;
}

// Low 64 bits of a*b + carry; carry receives the high 64 bits
KECCAK_RADIX_INLINE std::uint64_t mul_add64(std::uint64_t a, std::uint64_t b, std::uint64_t& carry) {
    const std::uint64_t a_lo = a & 0xFFFFFFFFULL;
    const std::uint64_t a_hi = a >> 32;
    const std::uint64_t b_lo = b & 0xFFFFFFFFULL;
    const std::uint64_t b_hi = b >> 32;

    const std::uint64_t p0 = a_lo * b_lo;
    const std::uint64_t p1 = a_lo * b_hi;
    const std::uint64_t p2 = a_hi * b_lo;
    const std::uint64_t p3 = a_hi * b_hi;

    const std::uint64_t mid = (p0 >> 32) + (p1 & 0xFFFFFFFFULL) + (p2 & 0xFFFFFFFFULL);
    std::uint64_t lo = (p0 & 0xFFFFFFFFULL) | (mid << 32);
    std::uint64_t hi = p3 + (p1 >> 32) + (p2 >> 32) + (mid >> 32);

    lo += carry;
    if (lo < carry) {
        ++hi;
    }
    carry = hi;
    return lo;
}

// One limb of long division by a divisor below 2^32, processed in halves
KECCAK_RADIX_INLINE std::uint64_t div_limb(std::uint64_t limb, std::uint32_t divisor, std::uint64_t& rem) {
    std::uint64_t hi = (rem << 32) | (limb >> 32);
    std::uint64_t q_hi = hi / divisor;
    rem = hi % divisor;
    std::uint64_t lo = (rem << 32) | (limb & 0xFFFFFFFFULL);
    std::uint64_t q_lo = lo / divisor;
    rem = lo % divisor;
    return (q_hi << 32) | q_lo;
}

#else

KECCAK_RADIX_INLINE std::uint64_t add64(std::uint64_t a, std::uint64_t b, unsigned char& carry) {
    unsigned __int128 sum = static_cast<unsigned __int128>(a) + b + carry;
    carry = static_cast<unsigned char>(sum >> 64);
    return static_cast<std::uint64_t>(sum);
}

KECCAK_RADIX_INLINE std::uint64_t mul_add64(std::uint64_t a, std::uint64_t b, std::uint64_t& carry) {
    unsigned __int128 prod = static_cast<unsigned __int128>(a) * b + carry;
    carry = static_cast<std::uint64_t>(prod >> 64);
    return static_cast<std::uint64_t>(prod);
}

KECCAK_RADIX_INLINE std::uint64_t div_limb(std::uint64_t limb, std::uint32_t divisor, std::uint64_t& rem) {
    unsigned __int128 cur = (static_cast<unsigned __int128>(rem) << 64) | limb;
    rem = static_cast<std::uint64_t>(cur % divisor);
    return static_cast<std::uint64_t>(cur / divisor);
}

#endif

// Returns true on carry out of bit 255
[[nodiscard]] bool add_impl(limbs4& acc, const limbs4& rhs) {
    unsigned char carry = 0;
    for (std::size_t i = 0; i < 4; ++i) {
        acc[i] = add64(acc[i], rhs[i], carry);
    }
    return carry != 0;
}

[[nodiscard]] bool add_small_impl(limbs4& acc, std::uint64_t value) {
    unsigned char carry = 0;
    acc[0] = add64(acc[0], value, carry);
    for (std::size_t i = 1; i < 4 && carry; ++i) {
        acc[i] = add64(acc[i], 0, carry);
    }
    return carry != 0;
}

// Returns true when the product does not fit 256 bits
[[nodiscard]] bool mul_small_impl(limbs4& acc, std::uint64_t factor) {
    std::uint64_t carry = 0;
    for (std::size_t i = 0; i < 4; ++i) {
        acc[i] = mul_add64(acc[i], factor, carry);
    }
    return carry != 0;
}

void check_base(std::uint32_t base) {
    if (KECCAK_RADIX_UNLIKELY(base < 2 || base > 256)) {
        throw std::invalid_argument("Radix base must be in [2, 256]");
    }
}

// Horner fold over digits given most significant first
template <typename It>
[[nodiscard]] std::optional<LaneValue> fold_digits(It first, It last, std::uint32_t base) {
    limbs4 acc{};
    for (It it = first; it != last; ++it) {
        if (*it >= base) {
            return std::nullopt;
        }
        if (mul_small_impl(acc, base) || add_small_impl(acc, *it)) {
            return std::nullopt;
        }
    }
    return LaneValue::from_limbs(acc);
}

} // namespace

LaneValue::LaneValue() = default;

LaneValue LaneValue::zero() {
    return LaneValue();
}

LaneValue LaneValue::from_uint64(std::uint64_t value) {
    LaneValue v;
    v.limbs_[0] = value;
    return v;
}

LaneValue LaneValue::from_limbs(const limbs_type& limbs) {
    LaneValue v;
    v.limbs_ = limbs;
    return v;
}

LaneValue LaneValue::from_bytes_le(const std::array<std::uint8_t, 32>& bytes) {
    LaneValue v;
    for (std::size_t i = 0; i < 4; ++i) {
        std::uint64_t limb = 0;
        for (std::size_t j = 8; j-- > 0;) {
            limb = (limb << 8) | bytes[i * 8 + j];
        }
        v.limbs_[i] = limb;
    }
    return v;
}

std::optional<LaneValue> LaneValue::from_bytes_le(const std::uint8_t* data, std::size_t len) {
    if (data == nullptr && len != 0) {
        throw std::invalid_argument("Null byte buffer");
    }
    for (std::size_t i = BYTES; i < len; ++i) {
        if (data[i] != 0) {
            return std::nullopt;
        }
    }
    std::array<std::uint8_t, 32> bytes{};
    std::copy(data, data + std::min(len, BYTES), bytes.begin());
    return from_bytes_le(bytes);
}

std::array<std::uint8_t, 32> LaneValue::to_bytes_le() const {
    std::array<std::uint8_t, 32> out{};
    for (std::size_t i = 0; i < 4; ++i) {
        std::uint64_t limb = limbs_[i];
        for (std::size_t j = 0; j < 8; ++j) {
            out[i * 8 + j] = static_cast<std::uint8_t>(limb >> (8 * j));
        }
    }
    return out;
}

LaneValue LaneValue::from_hex(const std::string& hex) {
    if (hex.length() != 64) {
        throw std::invalid_argument("Hex string must be exactly 64 characters (32 bytes)");
    }

    auto hex_to_nibble = [](char c) -> std::uint8_t {
        if (c >= '0' && c <= '9') return static_cast<std::uint8_t>(c - '0');
        if (c >= 'a' && c <= 'f') return static_cast<std::uint8_t>(c - 'a' + 10);
        if (c >= 'A' && c <= 'F') return static_cast<std::uint8_t>(c - 'A' + 10);
        throw std::invalid_argument("Invalid hex character");
    };

    // hex[0..1] is the most significant byte
    std::array<std::uint8_t, 32> bytes{};
    for (std::size_t i = 0; i < 32; ++i) {
        bytes[31 - i] = static_cast<std::uint8_t>((hex_to_nibble(hex[i * 2]) << 4) |
                                                  hex_to_nibble(hex[i * 2 + 1]));
    }
    return from_bytes_le(bytes);
}

std::string LaneValue::to_hex() const {
    auto bytes = to_bytes_le();
    std::string hex;
    hex.reserve(64);
    static const char hex_chars[] = "0123456789abcdef";
    for (std::size_t i = 32; i-- > 0;) {
        hex += hex_chars[(bytes[i] >> 4) & 0xF];
        hex += hex_chars[bytes[i] & 0xF];
    }
    return hex;
}

std::string LaneValue::to_decimal() const {
    auto digits = to_radix_be(10);
    std::string out;
    out.reserve(digits.size());
    for (auto d : digits) {
        out += static_cast<char>('0' + d);
    }
    return out;
}

std::vector<std::uint8_t> LaneValue::to_radix_le(std::uint32_t base) const {
    check_base(base);
    std::vector<std::uint8_t> digits;
    digits.reserve(BITS);

    LaneValue k = *this;
    while (!k.is_zero()) {
        digits.push_back(static_cast<std::uint8_t>(k.divmod_small(base)));
    }
    if (digits.empty()) {
        digits.push_back(0);
    }
    return digits;
}

std::vector<std::uint8_t> LaneValue::to_radix_be(std::uint32_t base) const {
    auto digits = to_radix_le(base);
    std::reverse(digits.begin(), digits.end());
    return digits;
}

std::optional<LaneValue> LaneValue::from_radix_le(const std::vector<std::uint8_t>& digits, std::uint32_t base) {
    check_base(base);
    return fold_digits(digits.rbegin(), digits.rend(), base);
}

std::optional<LaneValue> LaneValue::from_radix_be(const std::vector<std::uint8_t>& digits, std::uint32_t base) {
    check_base(base);
    return fold_digits(digits.begin(), digits.end(), base);
}

LaneValue LaneValue::operator+(const LaneValue& rhs) const {
    LaneValue out = *this;
    out += rhs;
    return out;
}

LaneValue LaneValue::operator*(std::uint64_t factor) const {
    LaneValue out = *this;
    out *= factor;
    return out;
}

LaneValue& LaneValue::operator+=(const LaneValue& rhs) {
    if (add_impl(limbs_, rhs.limbs_)) {
        throw std::overflow_error("Lane addition overflows 256 bits");
    }
    return *this;
}

LaneValue& LaneValue::operator*=(std::uint64_t factor) {
    if (mul_small_impl(limbs_, factor)) {
        throw std::overflow_error("Lane multiplication overflows 256 bits");
    }
    return *this;
}

std::uint32_t LaneValue::divmod_small(std::uint32_t divisor) {
    if (divisor == 0) {
        throw std::invalid_argument("Division by zero");
    }
    std::uint64_t rem = 0;
    for (std::size_t i = 4; i-- > 0;) {
        limbs_[i] = div_limb(limbs_[i], divisor, rem);
    }
    return static_cast<std::uint32_t>(rem);
}

bool LaneValue::is_zero() const noexcept {
    for (auto limb : limbs_) {
        if (limb != 0) {
            return false;
        }
    }
    return true;
}

bool LaneValue::operator==(const LaneValue& rhs) const noexcept {
    return limbs_ == rhs.limbs_;
}

bool LaneValue::operator<(const LaneValue& rhs) const noexcept {
    for (std::size_t i = 4; i-- > 0;) {
        if (limbs_[i] != rhs.limbs_[i]) {
            return limbs_[i] < rhs.limbs_[i];
        }
    }
    return false;
}

std::uint8_t LaneValue::bit(std::size_t index) const {
    if (index >= BITS) {
        return 0;
    }
    std::size_t limb_idx = index / 64;
    std::size_t bit_idx = index % 64;
    return static_cast<std::uint8_t>((limbs_[limb_idx] >> bit_idx) & 0x1u);
}

std::size_t LaneValue::bit_length() const noexcept {
    for (std::size_t i = 4; i-- > 0;) {
        std::uint64_t limb = limbs_[i];
        if (limb != 0) {
            std::size_t n = 0;
            while (limb != 0) {
                limb >>= 1;
                ++n;
            }
            return i * 64 + n;
        }
    }
    return 0;
}

bool LaneValue::fits_uint64() const noexcept {
    return limbs_[1] == 0 && limbs_[2] == 0 && limbs_[3] == 0;
}

LaneData LaneValue::data() const noexcept {
    LaneData d{};
    for (std::size_t i = 0; i < 4; ++i) {
        d.limbs[i] = limbs_[i];
    }
    return d;
}

LaneValue LaneValue::from_data(const LaneData& data) noexcept {
    LaneValue v;
    for (std::size_t i = 0; i < 4; ++i) {
        v.limbs_[i] = data.limbs[i];
    }
    return v;
}

std::ostream& operator<<(std::ostream& os, const LaneValue& value) {
    return os << value.to_decimal();
}

} // namespace keccak_radix
