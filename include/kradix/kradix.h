/* ============================================================================
 * KeccakRadix: Stable C ABI
 * ============================================================================
 *
 * SINGLE HEADER that exposes the entire public C API.
 *
 * ## Conventions
 *
 *   - Lanes:          uint8_t[32]   256-bit unsigned, little-endian
 *   - Field elements: uint8_t[32]   BN254 scalar, canonical little-endian
 *   - States:         uint8_t[800]  25 lanes, lane (x, y) at offset (x*5+y)*32
 *   - Native words:   uint64_t[25]  word (x, y) at index x*5+y
 *   - Every function returns kradix_error_t (0 = OK)
 *
 * ## Naming
 *
 *   kradix_<noun>_<verb>()   e.g. kradix_lane_b2_to_b13()
 *   KRADIX_<CONSTANT>        e.g. KRADIX_LANE_LEN
 *
 * ## Memory
 *
 *   Caller always owns output buffers. The library never allocates on behalf
 *   of the caller. All functions are pure and thread-safe.
 *
 * ============================================================================ */

#ifndef KRADIX_H
#define KRADIX_H

#include "kradix_version.h"
#include "kradix_error.h"

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/* ── Size constants ───────────────────────────────────────────────────────── */

#define KRADIX_LANE_LEN          32
#define KRADIX_FIELD_LEN         32
#define KRADIX_STATE_LANES       25
#define KRADIX_STATE_LEN         (KRADIX_STATE_LANES * KRADIX_LANE_LEN)

/* ═══════════════════════════════════════════════════════════════════════════
 * Library lifecycle
 * ═══════════════════════════════════════════════════════════════════════════ */

/** Run the library self-test (cached after the first call).
 *  @return KRADIX_OK, or KRADIX_ERR_SELFTEST if a known answer mismatched. */
KRADIX_API kradix_error_t kradix_init(void);

/* ═══════════════════════════════════════════════════════════════════════════
 * Digit coefficients
 * ═══════════════════════════════════════════════════════════════════════════ */

/** Parity of a base-13 digit (XOR of up to 12 summed bits).
 *  KRADIX_ERR_BAD_INPUT if digit >= 13. */
KRADIX_API kradix_error_t kradix_coef_b13(uint8_t digit, uint8_t* bit_out);

/** a ^ (~b & c) ^ d from the base-9 digit 2a + b + 3c + 2d.
 *  KRADIX_ERR_BAD_INPUT if digit >= 9. */
KRADIX_API kradix_error_t kradix_coef_b9(uint8_t digit, uint8_t* bit_out);

/* ═══════════════════════════════════════════════════════════════════════════
 * Lane conversion
 * ═══════════════════════════════════════════════════════════════════════════ */

/** Spread a native word one bit per base-13 digit. */
KRADIX_API kradix_error_t kradix_lane_b2_to_b13(uint64_t word,
                                                uint8_t lane_out[32]);

/** Spread a native word one bit per base-9 digit. */
KRADIX_API kradix_error_t kradix_lane_b2_to_b9(uint64_t word,
                                               uint8_t lane_out[32]);

/** Theta output (65 base-13 chunks) to a base-9 lane rotated by rot.
 *  KRADIX_ERR_BAD_INPUT if rot > 63 or the lane is not a theta output. */
KRADIX_API kradix_error_t kradix_lane_b13_to_b9_rot(const uint8_t lane13[32],
                                                    unsigned int rot,
                                                    uint8_t lane9_out[32]);

/** Chi output (base 9) to base 13 through the chi coefficient. */
KRADIX_API kradix_error_t kradix_lane_b9_to_b13(const uint8_t lane9[32],
                                                uint8_t lane13_out[32]);

/** Chi output (base 9) to a native word through the chi coefficient. */
KRADIX_API kradix_error_t kradix_lane_b9_to_b2(const uint8_t lane9[32],
                                               uint64_t* word_out);

/** Base-9 lane whose digits are already bits, read back as a native word. */
KRADIX_API kradix_error_t kradix_lane_b9_to_b2_normal(const uint8_t lane9[32],
                                                      uint64_t* word_out);

/* ═══════════════════════════════════════════════════════════════════════════
 * State bridge
 * ═══════════════════════════════════════════════════════════════════════════ */

/** Native words to a lane state. */
KRADIX_API kradix_error_t kradix_words_to_state(const uint64_t words[25],
                                                uint8_t state_out[800]);

/** Lane state to native words.
 *  KRADIX_ERR_ARITH if a lane has bits above bit 63. */
KRADIX_API kradix_error_t kradix_state_to_words(const uint8_t state[800],
                                                uint64_t words_out[25]);

/** First n lanes (n <= 25) as field elements, n*32 bytes.
 *  KRADIX_ERR_ARITH if a lane is >= the field modulus. */
KRADIX_API kradix_error_t kradix_state_to_field(const uint8_t state[800],
                                                size_t n,
                                                uint8_t* field_out);

/** n field elements (n <= 25) as the first n lanes, the rest zero.
 *  KRADIX_ERR_ARITH if a representation is not canonical. */
KRADIX_API kradix_error_t kradix_state_from_field(const uint8_t* field,
                                                  size_t n,
                                                  uint8_t state_out[800]);

#ifdef __cplusplus
}
#endif

#endif /* KRADIX_H */
