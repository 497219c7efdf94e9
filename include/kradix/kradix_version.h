/* ============================================================================
 * KeccakRadix: Version & ABI Compatibility
 * ============================================================================
 * RULES:
 *   KRADIX_VERSION_MAJOR bump  →  ABI breaking (buffer layout, removed funcs)
 *   KRADIX_VERSION_MINOR bump  →  ABI compatible (new funcs only)
 *   KRADIX_VERSION_PATCH bump  →  ABI compatible (bugfixes only)
 *   KRADIX_ABI_VERSION   bump  →  only on ABI-incompatible changes
 *
 * Clients should check:  kradix_abi_version() == expected_abi
 * ============================================================================ */

#ifndef KRADIX_VERSION_H
#define KRADIX_VERSION_H

#ifdef __cplusplus
extern "C" {
#endif

/* ── Compile-time version ─────────────────────────────────────────────────── */

#define KRADIX_VERSION_MAJOR   1
#define KRADIX_VERSION_MINOR   0
#define KRADIX_VERSION_PATCH   0

/** Packed: (major << 16) | (minor << 8) | patch.  Compare with >= for compat. */
#define KRADIX_VERSION_PACKED \
    ((KRADIX_VERSION_MAJOR << 16) | (KRADIX_VERSION_MINOR << 8) | KRADIX_VERSION_PATCH)

#define KRADIX_VERSION_STRING  "1.0.0"

/* ── ABI version (incremented ONLY on binary-incompatible changes) ────────── */

#define KRADIX_ABI_VERSION     1

/* ── Runtime queries ──────────────────────────────────────────────────────── */

#ifndef KRADIX_API
  #if defined(_WIN32) || defined(__CYGWIN__)
    #ifdef KRADIX_BUILDING
      #define KRADIX_API __declspec(dllexport)
    #else
      #define KRADIX_API __declspec(dllimport)
    #endif
  #elif __GNUC__ >= 4
    #define KRADIX_API __attribute__((visibility("default")))
  #else
    #define KRADIX_API
  #endif
#endif

/** Return packed version at runtime (same as KRADIX_VERSION_PACKED). */
KRADIX_API unsigned int kradix_version(void);

/** Return ABI version at runtime (same as KRADIX_ABI_VERSION). */
KRADIX_API unsigned int kradix_abi_version(void);

/** Return human-readable version string, e.g. "1.0.0". */
KRADIX_API const char* kradix_version_string(void);

#ifdef __cplusplus
}
#endif

#endif /* KRADIX_VERSION_H */
