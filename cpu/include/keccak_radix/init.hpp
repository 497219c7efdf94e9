#pragma once

#include <iostream>
#include <cstdlib>

namespace keccak_radix {

// External selftest function from library
extern bool Selftest(bool verbose);

// Run selftest once per process, terminate if the arithmetic is broken
inline bool ensure_library_integrity(bool verbose = false) {
    static bool tested = false;
    static bool result = true;

    if (!tested) {
        if (verbose) {
            std::cout << "[*] Running library integrity check...\n" << std::flush;
        }

        result = Selftest(verbose);
        tested = true;

        if (!result) {
            std::cerr << "\n[FAIL] CRITICAL: Library integrity check FAILED!\n";
            std::cerr << "   Radix conversions do not match their known answers.\n";
            std::cerr << "   Lanes produced by this build cannot be trusted.\n" << std::flush;
            std::abort();
        }

        if (verbose) {
            std::cout << "[OK] Library integrity verified\n\n" << std::flush;
        }
    }

    return result;
}

// Usage: Add KECCAK_RADIX_INIT(); as the first line in main()
#define KECCAK_RADIX_INIT() \
    keccak_radix::ensure_library_integrity(false)

#define KECCAK_RADIX_INIT_VERBOSE() \
    keccak_radix::ensure_library_integrity(true)

} // namespace keccak_radix
