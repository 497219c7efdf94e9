// KeccakRadix Library Self-Test
// Known-answer verification of the digit codecs, lane converters,
// state container and field bridge

#include "keccak_radix/selftest.hpp"
#include "keccak_radix/bridge.hpp"
#include "keccak_radix/coef.hpp"
#include "keccak_radix/convert.hpp"
#include "keccak_radix/field.hpp"
#include "keccak_radix/state.hpp"
#include <iostream>
#include <string>
#include <stdexcept>
#include <vector>
#include <array>
#include <cstdint>

namespace keccak_radix {

// Test vector structure
struct SpreadTestVector {
    std::uint64_t word;
    const char* base13_hex;
    const char* base9_hex;
    const char* description;
};

// Known spreads: sum_i bit_i * 13^i and sum_i bit_i * 9^i
static const SpreadTestVector TEST_VECTORS[] = {
    {
        0x0000000000000005ULL,
        "00000000000000000000000000000000000000000000000000000000000000aa",
        "0000000000000000000000000000000000000000000000000000000000000052",
        "5 (0b101)"
    },
    {
        0xffffffffffffffffULL,
        "0000025e0096c48dafac5ecb902b27ddaff5deee44075aadb75849a2c4bdbec0",
        "00000000000000eac91cd21b4b49a5ddfc8b11ef9f6f7c6c900842903150cf40",
        "all ones"
    },
    {
        0x0123456789abcdefULL,
        "00000000000095a1f25c8b7a4535a5882fc3e0fe99b4ff3331a392b3a5efcfa0",
        "00000000000000000002dd0e22cbb5df3dfc23eb92a4c9a8c2974fa7c291ee20",
        "0x0123456789abcdef"
    }
};

static std::uint64_t rotl64(std::uint64_t w, unsigned r) {
    return r == 0 ? w : (w << r) | (w >> (64 - r));
}

static void report(bool ok, bool verbose) {
    if (verbose) {
        std::cout << (ok ? "    PASS\n" : "    FAIL\n");
    }
}

// Test one spread vector in both bases
static bool test_spread(const SpreadTestVector& vec, bool verbose) {
    if (verbose) {
        std::cout << "  Testing: " << vec.description << "\n";
    }

    std::string b13 = convert_b2_to_b13(vec.word).to_hex();
    std::string b9 = convert_b2_to_b9(vec.word).to_hex();

    bool ok = (b13 == vec.base13_hex) && (b9 == vec.base9_hex);
    if (verbose) {
        if (ok) {
            std::cout << "    PASS\n";
        } else {
            std::cout << "    FAIL\n";
            std::cout << "      Expected B13: " << vec.base13_hex << "\n";
            std::cout << "      Got      B13: " << b13 << "\n";
            std::cout << "      Expected B9:  " << vec.base9_hex << "\n";
            std::cout << "      Got      B9:  " << b9 << "\n";
        }
    }
    return ok;
}

// Parity for base 13, a ^ (~b & c) ^ d for every bit pattern in base 9
static bool test_coefficients(bool verbose) {
    if (verbose) {
        std::cout << "\nCoefficient Mapping Test:\n";
    }
    bool ok = true;
    for (std::uint8_t x = 0; x < B13; ++x) {
        if (convert_b13_coef(x) != x % 2) ok = false;
    }
    for (std::uint8_t bits = 0; bits < 16; ++bits) {
        std::uint8_t a = bits & 1, b = (bits >> 1) & 1, c = (bits >> 2) & 1, d = (bits >> 3) & 1;
        if (convert_b9_coef(b9_arith(a, b, c, d)) != b9_logic(a, b, c, d)) ok = false;
    }
    report(ok, verbose);
    return ok;
}

// word -> base 9 / base 13 -> word
static bool test_binary_round_trip(bool verbose) {
    if (verbose) {
        std::cout << "\nBinary Round Trip Test:\n";
    }
    bool ok = true;
    const std::uint64_t words[] = {0ULL, 1ULL, 0x8000000000000000ULL, 0xdeadbeefcafebabeULL, ~0ULL};
    for (auto w : words) {
        if (convert_b9_lane_to_b2_normal(convert_b2_to_b9(w)) != w) ok = false;
        if (convert_b13_lane_to_b2_normal(convert_b2_to_b13(w)) != w) ok = false;
    }
    if (convert_lane(LaneValue::from_uint64(82), B9, B2, identity_coef) != LaneValue::from_uint64(5)) ok = false;
    report(ok, verbose);
    return ok;
}

// Chunks [0, 1, 1, 1] rotated by 0 and 4
static bool test_rotation_constants(bool verbose) {
    if (verbose) {
        std::cout << "\nTheta Rotation (constants):\n";
    }
    std::vector<std::uint8_t> a = {0, 1, 1, 1};
    a.resize(THETA_CHUNKS, 0);
    std::vector<std::uint8_t> b = {0, 0, 0, 0, 0, 1, 1, 1};
    b.resize(THETA_CHUNKS, 0);

    auto lane = LaneValue::from_radix_le(a, B13).value_or(LaneValue::zero());
    bool ok = lane == LaneValue::from_uint64(2379);
    ok = ok && convert_b13_lane_to_b9(lane, 0) == LaneValue::from_radix_le(a, B9).value_or(LaneValue::zero());
    ok = ok && convert_b13_lane_to_b9(lane, 4) == LaneValue::from_radix_le(b, B9).value_or(LaneValue::zero());
    report(ok, verbose);
    return ok;
}

// Rotation of a one-bit-per-digit lane equals rotl64 of the word
static bool test_rotation_matches_rotl(bool verbose) {
    if (verbose) {
        std::cout << "\nTheta Rotation vs rotl64:\n";
    }
    bool ok = true;
    const std::uint64_t w = 0x0123456789abcdefULL;
    for (unsigned rot = 0; rot < 64 && ok; ++rot) {
        auto lane9 = convert_b13_lane_to_b9(convert_b2_to_b13(w), rot);
        ok = lane9 == convert_b2_to_b9(rotl64(w, rot));
    }
    report(ok, verbose);
    return ok;
}

// XOR of three lanes through base-13 addition, chi through base-9 arithmetic
static bool test_arithmetic_boolean_ops(bool verbose) {
    if (verbose) {
        std::cout << "\nArithmetic Boolean Ops:\n";
    }
    const std::uint64_t a = 0x0123456789abcdefULL;
    const std::uint64_t b = 0xdeadbeefcafebabeULL;
    const std::uint64_t c = 0x8000000000000001ULL;
    const std::uint64_t d = 0xffffffff00000000ULL;

    auto sum13 = convert_b2_to_b13(a) + convert_b2_to_b13(b) + convert_b2_to_b13(c);
    bool ok = convert_b9_lane_to_b2_normal(convert_b13_lane_to_b9(sum13, 0)) == (a ^ b ^ c);

    auto chi9 = convert_b2_to_b9(a) * A1 + convert_b2_to_b9(b) * A2 +
                convert_b2_to_b9(c) * A3 + convert_b2_to_b9(d) * A4;
    ok = ok && convert_b9_lane_to_b2(chi9) == (a ^ (~b & c) ^ d);
    ok = ok && convert_b9_lane_to_b13(chi9) == convert_b2_to_b13(a ^ (~b & c) ^ d);
    report(ok, verbose);
    return ok;
}

// Zero state, transform and inverse transform
static bool test_state(bool verbose) {
    if (verbose) {
        std::cout << "\nState Container Test:\n";
    }
    bool ok = true;
    StateBigInt zero = StateBigInt::zero();
    for (const auto& lane : zero.lanes()) {
        if (!lane.is_zero()) ok = false;
    }

    State words{};
    for (std::size_t x = 0; x < 5; ++x) {
        for (std::size_t y = 0; y < 5; ++y) {
            words[x][y] = 0x9e3779b97f4a7c15ULL * (x * 5 + y + 1);
        }
    }
    StateBigInt s = state_from_words(words);
    StateBigInt s13 = StateBigInt::transform(s, [](const LaneValue& lane) {
        return convert_b2_to_b13(lane.low_uint64());
    });
    StateBigInt back = StateBigInt::transform(s13, [](const LaneValue& lane) {
        return LaneValue::from_uint64(convert_b13_lane_to_b2_normal(lane));
    });
    if (back != s) ok = false;
    if (state_to_words(back) != words) ok = false;
    report(ok, verbose);
    return ok;
}

// Field round trip and overflow rejection
static bool test_field_bridge(bool verbose) {
    if (verbose) {
        std::cout << "\nField Bridge Test:\n";
    }
    bool ok = true;

    StateBigInt s;
    for (std::size_t x = 0; x < 5; ++x) {
        for (std::size_t y = 0; y < 5; ++y) {
            s(x, y) = convert_b2_to_b13(~0ULL - (x * 5 + y));
        }
    }
    auto elems = state_to_field<25>(s);
    if (state_from_field(elems) != s) ok = false;

    s(4, 4) = FieldElement::modulus();
    try {
        (void)state_to_field<25>(s);
        ok = false;
    } catch (const std::overflow_error&) {
    }

    FieldElement seven = FieldElement::from_uint64(7);
    FieldElement five = FieldElement::from_uint64(5);
    if (!(((seven + five) - five) == seven)) ok = false;
    if (!((FieldElement::zero() - seven) + seven == FieldElement::zero())) ok = false;
    if (!(seven * five == FieldElement::from_uint64(35))) ok = false;
    if (!(field_from_radix_be({1, 2, 3}, B13) == FieldElement::from_uint64(198))) ok = false;

    report(ok, verbose);
    return ok;
}

bool Selftest(bool verbose) {
    if (verbose) {
        std::cout << "\n==============================================\n";
        std::cout << "  KeccakRadix Library Self-Test\n";
        std::cout << "==============================================\n";
    }

    int passed = 0;
    int total = 0;

    if (verbose) {
        std::cout << "\nSpread Vectors:\n";
    }
    for (const auto& vec : TEST_VECTORS) {
        total++;
        if (test_spread(vec, verbose)) passed++;
    }

    try {
        total++;
        if (test_coefficients(verbose)) passed++;
        total++;
        if (test_binary_round_trip(verbose)) passed++;
        total++;
        if (test_rotation_constants(verbose)) passed++;
        total++;
        if (test_rotation_matches_rotl(verbose)) passed++;
        total++;
        if (test_arithmetic_boolean_ops(verbose)) passed++;
        total++;
        if (test_state(verbose)) passed++;
        total++;
        if (test_field_bridge(verbose)) passed++;
    } catch (const std::exception& e) {
        if (verbose) {
            std::cout << "    FAIL: unexpected exception: " << e.what() << "\n";
        }
        return false;
    }

    // Summary
    if (verbose) {
        std::cout << "\n==============================================\n";
        std::cout << "  Results: " << passed << "/" << total << " tests passed\n";
        if (passed == total) {
            std::cout << "  [OK] ALL TESTS PASSED\n";
        } else {
            std::cout << "  [FAIL] SOME TESTS FAILED\n";
        }
        std::cout << "==============================================\n\n";
    }

    return (passed == total);
}

} // namespace keccak_radix
