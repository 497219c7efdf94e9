// Lane integer: byte/hex/radix codecs and checked arithmetic

#include "keccak_radix/lane.hpp"
#include "test_vectors.hpp"
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <vector>
#include <array>
#include <cstdint>

using namespace keccak_radix;

static int g_passed = 0;
static int g_failed = 0;

static void check(bool cond, const char* what) {
    if (cond) {
        ++g_passed;
    } else {
        ++g_failed;
        std::cout << "  [FAIL] " << what << "\n";
    }
}

template <typename E, typename Fn>
static bool throws(Fn&& fn) {
    try {
        fn();
    } catch (const E&) {
        return true;
    }
    return false;
}

static LaneValue all_ones() {
    return LaneValue::from_limbs({~0ULL, ~0ULL, ~0ULL, ~0ULL});
}

static void test_bytes_and_hex() {
    std::cout << "\n=== Bytes / Hex ===" << std::endl;

    auto v = LaneValue::from_limbs({0x0706050403020100ULL, 0x0f0e0d0c0b0a0908ULL,
                                    0x1716151413121110ULL, 0x1f1e1d1c1b1a1918ULL});
    auto bytes = v.to_bytes_le();
    bool sequential = true;
    for (std::size_t i = 0; i < 32; ++i) {
        if (bytes[i] != i) sequential = false;
    }
    check(sequential, "to_bytes_le is little-endian");
    check(LaneValue::from_bytes_le(bytes) == v, "from_bytes_le inverts to_bytes_le");
    check(v.to_hex() == "1f1e1d1c1b1a191817161514131211100f0e0d0c0b0a09080706050403020100",
          "to_hex is most significant first");
    check(LaneValue::from_hex(v.to_hex()) == v, "from_hex inverts to_hex");
    check(LaneValue::from_hex("00000000000000000000000000000000000000000000000000000000000000AA") ==
              LaneValue::from_uint64(170),
          "from_hex accepts upper case");

    check(throws<std::invalid_argument>([] { (void)LaneValue::from_hex("abc"); }),
          "from_hex rejects short input");
    check(throws<std::invalid_argument>([] {
              (void)LaneValue::from_hex("zz00000000000000000000000000000000000000000000000000000000000000");
          }),
          "from_hex rejects non-hex characters");

    std::vector<std::uint8_t> wide(40, 0);
    wide[0] = 0x2a;
    auto fits = LaneValue::from_bytes_le(wide.data(), wide.size());
    check(fits.has_value() && *fits == LaneValue::from_uint64(42), "zero bytes past 32 are accepted");
    wide[35] = 1;
    check(!LaneValue::from_bytes_le(wide.data(), wide.size()).has_value(),
          "non-zero byte past 32 is rejected");
    const std::uint8_t short_buf[3] = {1, 2, 3};
    auto small = LaneValue::from_bytes_le(short_buf, 3);
    check(small.has_value() && *small == LaneValue::from_uint64(0x030201), "short buffers are zero-extended");
}

static void test_radix() {
    std::cout << "\n=== Radix Decomposition ===" << std::endl;

    check(LaneValue::zero().to_radix_le(13) == std::vector<std::uint8_t>{0}, "zero is the single digit 0");
    check(LaneValue::from_uint64(82).to_radix_le(9) == std::vector<std::uint8_t>{1, 0, 1},
          "82 = [1, 0, 1] in base 9");
    check(LaneValue::from_uint64(2379).to_radix_be(13) == std::vector<std::uint8_t>{1, 1, 1, 0},
          "2379 = [1, 1, 1, 0] big-endian in base 13");

    auto v = LaneValue::from_hex(test_vectors::SPREAD_VECTORS[3].base13_hex);
    auto digits = v.to_radix_le(13);
    check(digits.size() == 64, "all-ones spread has 64 base-13 digits");
    bool all_one = true;
    for (auto d : digits) {
        if (d != 1) all_one = false;
    }
    check(all_one, "all-ones spread digits are all 1");
    check(LaneValue::from_radix_le(digits, 13) == v, "from_radix_le inverts to_radix_le");
    check(LaneValue::from_radix_be(v.to_radix_be(256), 256) == v, "base 256 big-endian round trip");

    check(LaneValue::from_radix_le({}, 9) == LaneValue::zero(), "empty digit list is zero");
    check(!LaneValue::from_radix_le({0, 9}, 9).has_value(), "digit equal to base is rejected");
    check(!LaneValue::from_radix_be({2}, 2).has_value(), "digit 2 is rejected in base 2");

    std::vector<std::uint8_t> too_wide(33, 0xff);
    check(!LaneValue::from_radix_be(too_wide, 256).has_value(), "value above 256 bits is rejected");
    std::vector<std::uint8_t> max_wide(32, 0xff);
    check(LaneValue::from_radix_be(max_wide, 256) == all_ones(), "2^256 - 1 is accepted");

    check(throws<std::invalid_argument>([] { (void)LaneValue::from_uint64(1).to_radix_le(1); }),
          "base 1 is a contract violation");
    check(throws<std::invalid_argument>([] { (void)LaneValue::from_radix_le({1}, 257); }),
          "base 257 is a contract violation");
}

static void test_arithmetic() {
    std::cout << "\n=== Checked Arithmetic ===" << std::endl;

    auto a = LaneValue::from_uint64(~0ULL);
    auto b = a + LaneValue::from_uint64(1);
    check(b == LaneValue::from_limbs({0, 1, 0, 0}), "carry propagates into limb 1");
    check(b.bit(64) == 1 && b.bit(63) == 0, "bit() reads across limbs");
    check(b.bit_length() == 65, "bit_length of 2^64");
    check(!b.fits_uint64() && a.fits_uint64(), "fits_uint64");
    check(b.low_uint64() == 0, "low_uint64 drops high limbs");

    check(LaneValue::from_uint64(7) * 6 == LaneValue::from_uint64(42), "small multiply");
    auto big = LaneValue::from_limbs({0, 0, 0, 1ULL << 62});
    check(throws<std::overflow_error>([&] { (void)(big * 4); }), "multiply overflow throws");
    check(throws<std::overflow_error>([] { (void)(all_ones() + LaneValue::from_uint64(1)); }),
          "addition overflow throws");

    auto q = LaneValue::from_uint64(1000003);
    check(q.divmod_small(10) == 3 && q == LaneValue::from_uint64(100000), "divmod_small");
    check(throws<std::invalid_argument>([&] { (void)q.divmod_small(0); }), "division by zero throws");

    check(LaneValue::from_uint64(3) < LaneValue::from_limbs({0, 0, 1, 0}), "ordering by high limb");
    check(!(LaneValue::from_uint64(3) < LaneValue::from_uint64(3)), "ordering is strict");

    std::ostringstream os;
    os << LaneValue::from_uint64(5373459);
    check(os.str() == "5373459", "decimal stream output");
    check(LaneValue::zero().to_decimal() == "0", "decimal zero");
    check(all_ones().to_decimal() ==
              "115792089237316195423570985008687907853269984665640564039457584007913129639935",
          "decimal 2^256 - 1");

    auto data = b.data();
    check(LaneValue::from_data(data) == b, "POD data round trip");
}

int main() {
    std::cout << "KeccakRadix lane integer tests" << std::endl;

    test_bytes_and_hex();
    test_radix();
    test_arithmetic();

    std::cout << "\nResults: " << g_passed << " passed, " << g_failed << " failed" << std::endl;
    return g_failed == 0 ? 0 : 1;
}
