#include "keccak_radix/bridge.hpp"
#include "keccak_radix/config.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace keccak_radix {
namespace {

constexpr std::size_t W = StateBigInt::WIDTH;

[[nodiscard]] std::string coord(std::size_t idx) {
    return "(" + std::to_string(idx / W) + ", " + std::to_string(idx % W) + ")";
}

// Byte-level check: everything past the 64-bit window must be zero
[[nodiscard]] std::uint64_t word_from_repr(const std::array<std::uint8_t, 32>& bytes, std::size_t idx) {
    for (std::size_t i = 8; i < bytes.size(); ++i) {
        if (KECCAK_RADIX_UNLIKELY(bytes[i] != 0)) {
            throw std::out_of_range("Lane " + coord(idx) + " does not fit 64 bits");
        }
    }
    std::uint64_t word = 0;
    for (std::size_t j = 8; j-- > 0;) {
        word = (word << 8) | bytes[j];
    }
    return word;
}

} // namespace

StateBigInt state_from_words(const State& state) {
    StateBigInt out;
    for (std::size_t x = 0; x < W; ++x) {
        for (std::size_t y = 0; y < W; ++y) {
            out(x, y) = LaneValue::from_uint64(state[x][y]);
        }
    }
    return out;
}

State state_to_words(const StateBigInt& state) {
    State out{};
    const auto& lanes = state.lanes();
    for (std::size_t i = 0; i < StateBigInt::LANES; ++i) {
        out[i / W][i % W] = word_from_repr(lanes[i].to_bytes_le(), i);
    }
    return out;
}

std::optional<FieldElement> lane_to_field(const LaneValue& lane) {
    return FieldElement::from_lane(lane);
}

namespace detail {

void state_to_field(const StateBigInt& state, FieldElement* out, std::size_t n) {
    const auto& lanes = state.lanes();
    for (std::size_t i = 0; i < n; ++i) {
        auto fe = lane_to_field(lanes[i]);
        if (KECCAK_RADIX_UNLIKELY(!fe)) {
            throw std::overflow_error("Lane " + coord(i) + " exceeds the field modulus");
        }
        out[i] = *fe;
    }
}

StateBigInt state_from_field(const FieldElement* elems, std::size_t n) {
    StateBigInt::lanes_type lanes{};
    for (std::size_t i = 0; i < n; ++i) {
        lanes[i] = elems[i].to_lane();
    }
    return StateBigInt::from_lanes(lanes);
}

State field_to_words(const FieldElement* elems, std::size_t n) {
    State out{};
    for (std::size_t i = 0; i < n; ++i) {
        out[i / W][i % W] = word_from_repr(elems[i].to_repr(), i);
    }
    return out;
}

} // namespace detail

} // namespace keccak_radix
