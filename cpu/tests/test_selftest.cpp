// Library self-test and the integrity guard

#include "keccak_radix/init.hpp"
#include "keccak_radix/selftest.hpp"
#include <iostream>

int main() {
    std::cout << "KeccakRadix self-test\n";

    bool quiet = keccak_radix::Selftest(false);
    bool verbose = keccak_radix::Selftest(true);
    if (quiet != verbose) {
        std::cout << "  [FAIL] verbose and quiet runs disagree\n";
        return 1;
    }

    // Aborts the process on failure
    bool guarded = KECCAK_RADIX_INIT_VERBOSE();
    bool cached = KECCAK_RADIX_INIT();

    if (!(quiet && guarded && cached)) {
        std::cout << "  [FAIL] self-test reported a mismatch\n";
        return 1;
    }
    std::cout << "  [OK] self-test passed\n";
    return 0;
}
