#include "keccak_radix/state.hpp"
#include "keccak_radix/config.hpp"

#include <stdexcept>
#include <string>

namespace keccak_radix {

StateBigInt::StateBigInt() = default;

StateBigInt StateBigInt::zero() {
    return StateBigInt();
}

StateBigInt StateBigInt::from_lanes(const lanes_type& lanes) {
    StateBigInt s;
    s.xy_ = lanes;
    return s;
}

std::size_t StateBigInt::offset(std::size_t x, std::size_t y) {
    if (KECCAK_RADIX_UNLIKELY(x >= WIDTH || y >= WIDTH)) {
        throw std::out_of_range("State coordinate (" + std::to_string(x) + ", " +
                                std::to_string(y) + ") outside 5x5");
    }
    return x * WIDTH + y;
}

LaneValue& StateBigInt::operator()(std::size_t x, std::size_t y) {
    return xy_[offset(x, y)];
}

const LaneValue& StateBigInt::operator()(std::size_t x, std::size_t y) const {
    return xy_[offset(x, y)];
}

StateData StateBigInt::data() const noexcept {
    StateData d{};
    for (std::size_t i = 0; i < LANES; ++i) {
        d.lanes[i] = xy_[i].data();
    }
    return d;
}

StateBigInt StateBigInt::from_data(const StateData& data) noexcept {
    StateBigInt s;
    for (std::size_t i = 0; i < LANES; ++i) {
        s.xy_[i] = LaneValue::from_data(data.lanes[i]);
    }
    return s;
}

} // namespace keccak_radix
