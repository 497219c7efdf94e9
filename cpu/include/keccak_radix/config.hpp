#ifndef KECCAK_RADIX_CONFIG_HPP_INCLUDED
#define KECCAK_RADIX_CONFIG_HPP_INCLUDED

// ============================================================================
// Platform Detection
// ============================================================================

// 32-bit platform detection
#if defined(__i386__) || defined(_M_IX86) || defined(__arm__) || defined(__xtensa__) || defined(KECCAK_RADIX_32BIT)
    #ifndef KECCAK_RADIX_32BIT
        #define KECCAK_RADIX_32BIT 1
    #endif
#endif

// Disable __int128 on 32-bit platforms, MSVC, or when explicitly requested
#if defined(KECCAK_RADIX_32BIT) || defined(KECCAK_RADIX_NO_INT128) || (defined(_MSC_VER) && !defined(__clang__))
    #ifndef KECCAK_RADIX_NO_INT128
        #define KECCAK_RADIX_NO_INT128 1
    #endif
#endif

// Force inline for limb helpers
#if defined(__GNUC__) || defined(__clang__)
    #define KECCAK_RADIX_INLINE __attribute__((always_inline)) inline
#else
    #define KECCAK_RADIX_INLINE inline
#endif

// Branch prediction hints (contract checks are expected to pass)
#if defined(__GNUC__) || defined(__clang__)
    #define KECCAK_RADIX_LIKELY(x)   __builtin_expect(!!(x), 1)
    #define KECCAK_RADIX_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
    #define KECCAK_RADIX_LIKELY(x)   (x)
    #define KECCAK_RADIX_UNLIKELY(x) (x)
#endif

#endif // KECCAK_RADIX_CONFIG_HPP_INCLUDED
