/* ============================================================================
 * KeccakRadix: Error Model
 * ============================================================================
 * Every kradix_* function (except version queries) returns kradix_error_t
 * (0 = success). No C++ exception ever crosses the ABI.
 * ============================================================================ */

#ifndef KRADIX_ERROR_H
#define KRADIX_ERROR_H

#include "kradix_version.h"   /* pulls in KRADIX_API */

#ifdef __cplusplus
extern "C" {
#endif

/* ── Error codes ──────────────────────────────────────────────────────────── */

typedef int kradix_error_t;

#define KRADIX_OK                0   /**< Success                                   */
#define KRADIX_ERR_NULL_ARG      1   /**< Required pointer argument was NULL        */
#define KRADIX_ERR_BAD_INPUT     2   /**< Digit, rotation or coordinate out of range */
#define KRADIX_ERR_ARITH         3   /**< Lane does not fit the target width/field  */
#define KRADIX_ERR_SELFTEST      4   /**< Library self-test failed                  */
#define KRADIX_ERR_INTERNAL      5   /**< Unexpected internal error                 */

/* ── Error inspection ─────────────────────────────────────────────────────── */

/** Map error code to a short English description (never NULL). */
KRADIX_API const char* kradix_error_str(kradix_error_t err);

#ifdef __cplusplus
}
#endif

#endif /* KRADIX_ERROR_H */
