#include "keccak_radix/convert.hpp"
#include "keccak_radix/config.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace keccak_radix {

LaneValue convert_b2_to_base(std::uint64_t word, std::uint8_t base) {
    if (KECCAK_RADIX_UNLIKELY(base < 2)) {
        throw std::invalid_argument("Radix base must be in [2, 256]");
    }
    // Horner from bit 63 down; bases above 16 can overflow 256 bits and throw
    LaneValue lane;
    for (std::size_t i = LANE_BITS; i-- > 0;) {
        lane *= base;
        lane += LaneValue::from_uint64((word >> i) & 1);
    }
    return lane;
}

Lane13 convert_b2_to_b13(std::uint64_t word) {
    return convert_b2_to_base(word, B13);
}

Lane9 convert_b2_to_b9(std::uint64_t word) {
    return convert_b2_to_base(word, B9);
}

Lane9 convert_b13_lane_to_b9(const Lane13& lane, std::uint32_t rot) {
    if (KECCAK_RADIX_UNLIKELY(rot >= LANE_BITS)) {
        throw std::invalid_argument("Rotation must be in [0, 63], got " + std::to_string(rot));
    }

    std::vector<std::uint8_t> chunks = lane.to_radix_le(B13);
    if (KECCAK_RADIX_UNLIKELY(chunks.size() > THETA_CHUNKS)) {
        throw std::invalid_argument("Theta lane has more than 65 base-13 chunks");
    }
    chunks.resize(THETA_CHUNKS, 0);

    const std::uint8_t special = static_cast<std::uint8_t>(chunks[0] + chunks[THETA_CHUNKS - 1]);

    // middle = chunks[1..64), split at 63 - rot:
    //   left  = chunks[1 .. 64 - rot)
    //   right = chunks[64 - rot .. 64)
    // rotated = right ++ [special] ++ left
    const std::size_t split = 1 + (LANE_BITS - 1 - rot);
    std::vector<std::uint8_t> rotated;
    rotated.reserve(LANE_BITS);
    for (std::size_t i = split; i < THETA_CHUNKS - 1; ++i) {
        rotated.push_back(convert_b13_coef(chunks[i]));
    }
    rotated.push_back(convert_b13_coef(special));
    for (std::size_t i = 1; i < split; ++i) {
        rotated.push_back(convert_b13_coef(chunks[i]));
    }

    return LaneValue::from_radix_le(rotated, B9).value_or(LaneValue::zero());
}

Lane13 convert_b9_lane_to_b13(const Lane9& lane) {
    return convert_lane(lane, B9, B13, convert_b9_coef);
}

std::uint64_t convert_b9_lane_to_b2(const Lane9& lane) {
    return convert_lane(lane, B9, B2, convert_b9_coef).low_uint64();
}

std::uint64_t convert_b9_lane_to_b2_normal(const Lane9& lane) {
    return convert_lane(lane, B9, B2, identity_coef).low_uint64();
}

std::uint64_t convert_b13_lane_to_b2_normal(const Lane13& lane) {
    return convert_lane(lane, B13, B2, identity_coef).low_uint64();
}

void inspect(std::ostream& out, const LaneValue& lane, std::string_view name, std::uint8_t base) {
    std::vector<std::uint8_t> chunks = lane.to_radix_le(base);
    chunks.resize(std::max(chunks.size(), THETA_CHUNKS), 0);

    out << "inspect " << name << " " << lane << " info [";
    for (std::size_t i = 0; i < THETA_CHUNKS; ++i) {
        if (i != 0) {
            out << ", ";
        }
        out << "(" << i << ", " << static_cast<unsigned>(chunks[i]) << ")";
    }
    out << "]\n";
}

} // namespace keccak_radix
