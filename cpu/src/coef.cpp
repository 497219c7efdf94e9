#include "keccak_radix/coef.hpp"
#include "keccak_radix/config.hpp"

#include <stdexcept>
#include <string>

namespace keccak_radix {

std::uint8_t convert_b13_coef(std::uint8_t x) {
    if (KECCAK_RADIX_UNLIKELY(x >= B13)) {
        throw std::invalid_argument("Base 13 digit out of range: " + std::to_string(x));
    }
    return static_cast<std::uint8_t>(x & 1u);
}

std::uint8_t convert_b9_coef(std::uint8_t x) {
    if (KECCAK_RADIX_UNLIKELY(x >= B9)) {
        throw std::invalid_argument("Base 9 digit out of range: " + std::to_string(x));
    }
    return B9_COEF_TABLE[x];
}

} // namespace keccak_radix
