/* ============================================================================
 * KeccakRadix: C API Implementation
 * ============================================================================
 * Wraps the C++ library into a stable C ABI.
 * All functions convert between opaque byte arrays and internal C++ types;
 * exceptions are mapped to error codes at this boundary.
 * ============================================================================ */

#ifndef KRADIX_BUILDING
#define KRADIX_BUILDING
#endif
#include "kradix/kradix.h"

#include <array>
#include <cstdint>
#include <cstring>
#include <exception>
#include <stdexcept>

#include "keccak_radix/bridge.hpp"
#include "keccak_radix/coef.hpp"
#include "keccak_radix/convert.hpp"
#include "keccak_radix/selftest.hpp"

using keccak_radix::FieldElement;
using keccak_radix::LaneValue;
using keccak_radix::StateBigInt;

/* ── Helpers ─────────────────────────────────────────────────────────────── */

static inline LaneValue lane_from_bytes(const uint8_t b[32]) {
    std::array<uint8_t, 32> arr;
    std::memcpy(arr.data(), b, 32);
    return LaneValue::from_bytes_le(arr);
}

static inline void lane_to_bytes(const LaneValue& lane, uint8_t out[32]) {
    auto arr = lane.to_bytes_le();
    std::memcpy(out, arr.data(), 32);
}

static inline StateBigInt state_from_bytes(const uint8_t b[800]) {
    StateBigInt::lanes_type lanes;
    for (std::size_t i = 0; i < StateBigInt::LANES; ++i) {
        lanes[i] = lane_from_bytes(b + i * KRADIX_LANE_LEN);
    }
    return StateBigInt::from_lanes(lanes);
}

static inline void state_to_bytes(const StateBigInt& s, uint8_t out[800]) {
    const auto& lanes = s.lanes();
    for (std::size_t i = 0; i < StateBigInt::LANES; ++i) {
        lane_to_bytes(lanes[i], out + i * KRADIX_LANE_LEN);
    }
}

/* Run fn, mapping the library's exception classes to error codes */
template <typename Fn>
static kradix_error_t guarded(Fn&& fn) {
    try {
        fn();
        return KRADIX_OK;
    } catch (const std::invalid_argument&) {
        return KRADIX_ERR_BAD_INPUT;
    } catch (const std::out_of_range&) {
        return KRADIX_ERR_ARITH;
    } catch (const std::overflow_error&) {
        return KRADIX_ERR_ARITH;
    } catch (const std::exception&) {
        return KRADIX_ERR_INTERNAL;
    }
}

/* ── Version / errors ────────────────────────────────────────────────────── */

unsigned int kradix_version(void) {
    return KRADIX_VERSION_PACKED;
}

unsigned int kradix_abi_version(void) {
    return KRADIX_ABI_VERSION;
}

const char* kradix_version_string(void) {
    return KRADIX_VERSION_STRING;
}

const char* kradix_error_str(kradix_error_t err) {
    switch (err) {
        case KRADIX_OK:            return "OK";
        case KRADIX_ERR_NULL_ARG:  return "NULL argument";
        case KRADIX_ERR_BAD_INPUT: return "input out of range";
        case KRADIX_ERR_ARITH:     return "value does not fit target representation";
        case KRADIX_ERR_SELFTEST:  return "self-test failed";
        case KRADIX_ERR_INTERNAL:  return "internal error";
        default:                   return "unknown error";
    }
}

/* ── Library Lifecycle ───────────────────────────────────────────────────── */

kradix_error_t kradix_init(void) {
    static const bool ok = keccak_radix::Selftest(false);
    return ok ? KRADIX_OK : KRADIX_ERR_SELFTEST;
}

/* ── Digit coefficients ──────────────────────────────────────────────────── */

kradix_error_t kradix_coef_b13(uint8_t digit, uint8_t* bit_out) {
    if (!bit_out) return KRADIX_ERR_NULL_ARG;
    return guarded([&] { *bit_out = keccak_radix::convert_b13_coef(digit); });
}

kradix_error_t kradix_coef_b9(uint8_t digit, uint8_t* bit_out) {
    if (!bit_out) return KRADIX_ERR_NULL_ARG;
    return guarded([&] { *bit_out = keccak_radix::convert_b9_coef(digit); });
}

/* ── Lane conversion ─────────────────────────────────────────────────────── */

kradix_error_t kradix_lane_b2_to_b13(uint64_t word, uint8_t lane_out[32]) {
    if (!lane_out) return KRADIX_ERR_NULL_ARG;
    return guarded([&] { lane_to_bytes(keccak_radix::convert_b2_to_b13(word), lane_out); });
}

kradix_error_t kradix_lane_b2_to_b9(uint64_t word, uint8_t lane_out[32]) {
    if (!lane_out) return KRADIX_ERR_NULL_ARG;
    return guarded([&] { lane_to_bytes(keccak_radix::convert_b2_to_b9(word), lane_out); });
}

kradix_error_t kradix_lane_b13_to_b9_rot(const uint8_t lane13[32], unsigned int rot,
                                         uint8_t lane9_out[32]) {
    if (!lane13 || !lane9_out) return KRADIX_ERR_NULL_ARG;
    return guarded([&] {
        lane_to_bytes(keccak_radix::convert_b13_lane_to_b9(lane_from_bytes(lane13), rot), lane9_out);
    });
}

kradix_error_t kradix_lane_b9_to_b13(const uint8_t lane9[32], uint8_t lane13_out[32]) {
    if (!lane9 || !lane13_out) return KRADIX_ERR_NULL_ARG;
    return guarded([&] {
        lane_to_bytes(keccak_radix::convert_b9_lane_to_b13(lane_from_bytes(lane9)), lane13_out);
    });
}

kradix_error_t kradix_lane_b9_to_b2(const uint8_t lane9[32], uint64_t* word_out) {
    if (!lane9 || !word_out) return KRADIX_ERR_NULL_ARG;
    return guarded([&] { *word_out = keccak_radix::convert_b9_lane_to_b2(lane_from_bytes(lane9)); });
}

kradix_error_t kradix_lane_b9_to_b2_normal(const uint8_t lane9[32], uint64_t* word_out) {
    if (!lane9 || !word_out) return KRADIX_ERR_NULL_ARG;
    return guarded([&] { *word_out = keccak_radix::convert_b9_lane_to_b2_normal(lane_from_bytes(lane9)); });
}

/* ── State bridge ────────────────────────────────────────────────────────── */

kradix_error_t kradix_words_to_state(const uint64_t words[25], uint8_t state_out[800]) {
    if (!words || !state_out) return KRADIX_ERR_NULL_ARG;
    return guarded([&] {
        keccak_radix::State native{};
        for (std::size_t i = 0; i < StateBigInt::LANES; ++i) {
            native[i / 5][i % 5] = words[i];
        }
        state_to_bytes(keccak_radix::state_from_words(native), state_out);
    });
}

kradix_error_t kradix_state_to_words(const uint8_t state[800], uint64_t words_out[25]) {
    if (!state || !words_out) return KRADIX_ERR_NULL_ARG;
    return guarded([&] {
        auto native = keccak_radix::state_to_words(state_from_bytes(state));
        for (std::size_t i = 0; i < StateBigInt::LANES; ++i) {
            words_out[i] = native[i / 5][i % 5];
        }
    });
}

kradix_error_t kradix_state_to_field(const uint8_t state[800], size_t n, uint8_t* field_out) {
    if (!state || !field_out) return KRADIX_ERR_NULL_ARG;
    if (n > StateBigInt::LANES) return KRADIX_ERR_BAD_INPUT;
    return guarded([&] {
        std::array<FieldElement, StateBigInt::LANES> elems{};
        keccak_radix::detail::state_to_field(state_from_bytes(state), elems.data(), n);
        for (std::size_t i = 0; i < n; ++i) {
            auto repr = elems[i].to_repr();
            std::memcpy(field_out + i * KRADIX_FIELD_LEN, repr.data(), KRADIX_FIELD_LEN);
        }
    });
}

kradix_error_t kradix_state_from_field(const uint8_t* field, size_t n, uint8_t state_out[800]) {
    if (!field || !state_out) return KRADIX_ERR_NULL_ARG;
    if (n > StateBigInt::LANES) return KRADIX_ERR_BAD_INPUT;
    return guarded([&] {
        std::array<FieldElement, StateBigInt::LANES> elems{};
        for (std::size_t i = 0; i < n; ++i) {
            std::array<uint8_t, 32> repr;
            std::memcpy(repr.data(), field + i * KRADIX_FIELD_LEN, KRADIX_FIELD_LEN);
            auto fe = FieldElement::from_repr(repr);
            if (!fe) {
                throw std::overflow_error("Non-canonical field element");
            }
            elems[i] = *fe;
        }
        state_to_bytes(keccak_radix::detail::state_from_field(elems.data(), n), state_out);
    });
}
