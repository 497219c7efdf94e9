// C ABI: buffer layouts, error codes and agreement with the C++ API

#include "kradix/kradix.h"
#include "keccak_radix/convert.hpp"
#include "test_vectors.hpp"
#include <iostream>
#include <random>
#include <string>
#include <array>
#include <cstdint>
#include <cstring>

namespace tv = keccak_radix::test_vectors;

static int g_passed = 0;
static int g_failed = 0;

static void check(bool cond, const std::string& what) {
    if (cond) {
        ++g_passed;
    } else {
        ++g_failed;
        std::cout << "  [FAIL] " << what << "\n";
    }
}

static keccak_radix::LaneValue lane_of(const uint8_t* bytes) {
    std::array<uint8_t, 32> arr;
    std::memcpy(arr.data(), bytes, 32);
    return keccak_radix::LaneValue::from_bytes_le(arr);
}

static void test_version() {
    std::cout << "\n=== Version / Errors ===" << std::endl;

    check(kradix_version() == KRADIX_VERSION_PACKED, "packed version");
    check(kradix_abi_version() == KRADIX_ABI_VERSION, "ABI version");
    check(std::string(kradix_version_string()) == KRADIX_VERSION_STRING, "version string");
    check(std::string(kradix_error_str(KRADIX_OK)) == "OK", "error string for OK");
    check(kradix_error_str(KRADIX_ERR_ARITH) != nullptr, "error string for ARITH");
    check(std::string(kradix_error_str(99)) == "unknown error", "unknown code");
    check(kradix_init() == KRADIX_OK, "init runs the self-test");
    check(kradix_init() == KRADIX_OK, "init is idempotent");
}

static void test_coefficients() {
    std::cout << "\n=== Coefficients ===" << std::endl;

    uint8_t bit = 0xff;
    check(kradix_coef_b13(7, &bit) == KRADIX_OK && bit == 1, "coef13(7) = 1");
    check(kradix_coef_b9(3, &bit) == KRADIX_OK && bit == 1, "coef9(3) = 1");
    check(kradix_coef_b9(4, &bit) == KRADIX_OK && bit == 0, "coef9(4) = 0");
    check(kradix_coef_b13(13, &bit) == KRADIX_ERR_BAD_INPUT, "coef13(13) rejected");
    check(kradix_coef_b9(9, &bit) == KRADIX_ERR_BAD_INPUT, "coef9(9) rejected");
    check(kradix_coef_b9(0, nullptr) == KRADIX_ERR_NULL_ARG, "NULL output");
}

static void test_lanes() {
    std::cout << "\n=== Lane Conversion ===" << std::endl;

    uint8_t lane13[32], lane9[32], out[32];
    check(kradix_lane_b2_to_b13(5, lane13) == KRADIX_OK, "spread 5 into base 13");
    check(lane13[0] == 0xaa && lane13[1] == 0, "5 -> 170 little-endian");
    check(kradix_lane_b2_to_b9(5, lane9) == KRADIX_OK && lane9[0] == 82, "5 -> 82 in base 9");

    for (const auto& vec : tv::SPREAD_VECTORS) {
        check(kradix_lane_b2_to_b13(vec.word, out) == KRADIX_OK &&
                  lane_of(out).to_hex() == vec.base13_hex,
              "C spread matches base 13 vector");
    }

    std::mt19937_64 gen(9);
    for (unsigned rot = 0; rot < 64; rot += 7) {
        uint64_t w = gen();
        uint64_t back = 0;
        check(kradix_lane_b2_to_b13(w, lane13) == KRADIX_OK, "spread random word");
        check(kradix_lane_b13_to_b9_rot(lane13, rot, lane9) == KRADIX_OK, "rotate rot=" + std::to_string(rot));
        check(kradix_lane_b9_to_b2_normal(lane9, &back) == KRADIX_OK &&
                  back == (rot == 0 ? w : (w << rot) | (w >> (64 - rot))),
              "C rotation equals rotl64");
        check(lane_of(lane9) == keccak_radix::convert_b13_lane_to_b9(lane_of(lane13), rot),
              "C and C++ rotation agree");
    }
    check(kradix_lane_b13_to_b9_rot(lane13, 64, lane9) == KRADIX_ERR_BAD_INPUT, "rotation 64 rejected");
    check(kradix_lane_b13_to_b9_rot(nullptr, 0, lane9) == KRADIX_ERR_NULL_ARG, "NULL lane");

    auto chi = keccak_radix::convert_b2_to_b9(tv::CHI_A) * keccak_radix::A1 +
               keccak_radix::convert_b2_to_b9(tv::CHI_B) * keccak_radix::A2 +
               keccak_radix::convert_b2_to_b9(tv::CHI_C) * keccak_radix::A3 +
               keccak_radix::convert_b2_to_b9(tv::CHI_D) * keccak_radix::A4;
    auto chi_bytes = chi.to_bytes_le();
    uint64_t word = 0;
    check(kradix_lane_b9_to_b2(chi_bytes.data(), &word) == KRADIX_OK && word == tv::CHI_EXPECTED,
          "chi through the C ABI");
    check(kradix_lane_b9_to_b13(chi_bytes.data(), out) == KRADIX_OK &&
              lane_of(out) == keccak_radix::convert_b2_to_b13(tv::CHI_EXPECTED),
          "chi re-spread into base 13");
}

static void test_state() {
    std::cout << "\n=== State Bridge ===" << std::endl;

    uint64_t words[25], back[25];
    std::mt19937_64 gen(17);
    for (auto& w : words) w = gen();

    static uint8_t state[KRADIX_STATE_LEN];
    static uint8_t state2[KRADIX_STATE_LEN];
    static uint8_t field[KRADIX_STATE_LANES * KRADIX_FIELD_LEN];

    check(kradix_words_to_state(words, state) == KRADIX_OK, "words to state");
    check(lane_of(state + 7 * KRADIX_LANE_LEN) == keccak_radix::LaneValue::from_uint64(words[7]),
          "lane (1, 2) at offset 7 * 32");
    check(kradix_state_to_words(state, back) == KRADIX_OK && std::memcmp(words, back, sizeof(words)) == 0,
          "state to words round trip");

    check(kradix_state_to_field(state, 25, field) == KRADIX_OK, "state to field");
    check(kradix_state_from_field(field, 25, state2) == KRADIX_OK &&
              std::memcmp(state, state2, sizeof(state)) == 0,
          "field to state round trip");

    check(kradix_state_from_field(field, 3, state2) == KRADIX_OK, "partial field to state");
    check(lane_of(state2 + 24 * KRADIX_LANE_LEN).is_zero(), "missing lanes are zero");
    check(kradix_state_to_field(state, 26, field) == KRADIX_ERR_BAD_INPUT, "n = 26 rejected");

    // Lane (4, 4) set to the modulus
    std::memcpy(state + 24 * KRADIX_LANE_LEN, tv::FIELD_MODULUS_REPR.data(), KRADIX_LANE_LEN);
    check(kradix_state_to_field(state, 25, field) == KRADIX_ERR_ARITH, "lane equal to r rejected");
    check(kradix_state_to_field(state, 24, field) == KRADIX_OK, "first 24 lanes still convert");
    check(kradix_state_to_words(state, back) == KRADIX_ERR_ARITH, "wide lane rejected as a word");
    check(kradix_state_from_field(tv::FIELD_MODULUS_REPR.data(), 1, state2) == KRADIX_ERR_ARITH,
          "non-canonical field element rejected");
    check(kradix_state_to_words(nullptr, back) == KRADIX_ERR_NULL_ARG, "NULL state");
}

int main() {
    std::cout << "KeccakRadix C ABI tests" << std::endl;

    test_version();
    test_coefficients();
    test_lanes();
    test_state();

    std::cout << "\nResults: " << g_passed << " passed, " << g_failed << " failed" << std::endl;
    return g_failed == 0 ? 0 : 1;
}
