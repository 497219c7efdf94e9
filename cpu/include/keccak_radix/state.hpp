#pragma once

// ============================================================================
// 5x5 lane state
// ============================================================================
// Flat arena of 25 lanes; lane (x, y) lives at offset x * 5 + y. Coordinates
// outside [0, 5) throw std::out_of_range.
// ============================================================================

#include "keccak_radix/lane.hpp"
#include "keccak_radix/types.hpp"

#include <array>
#include <cstddef>
#include <cstdint>

namespace keccak_radix {

// Native Keccak state, state[x][y]
using State = std::array<std::array<std::uint64_t, 5>, 5>;

class StateBigInt {
public:
    static constexpr std::size_t WIDTH = 5;
    static constexpr std::size_t LANES = WIDTH * WIDTH;

    using lanes_type = std::array<LaneValue, LANES>;

    // All lanes zero
    StateBigInt();
    static StateBigInt zero();
    static StateBigInt from_lanes(const lanes_type& lanes);

    LaneValue& operator()(std::size_t x, std::size_t y);
    const LaneValue& operator()(std::size_t x, std::size_t y) const;
    LaneValue& at(std::size_t x, std::size_t y) { return (*this)(x, y); }
    const LaneValue& at(std::size_t x, std::size_t y) const { return (*this)(x, y); }

    // New state with out(x, y) = lane_transform(src(x, y))
    template <typename F>
    static StateBigInt transform(const StateBigInt& src, F&& lane_transform) {
        StateBigInt out;
        for (std::size_t i = 0; i < LANES; ++i) {
            out.xy_[i] = lane_transform(src.xy_[i]);
        }
        return out;
    }

    template <typename F>
    void transform_inplace(F&& lane_transform) {
        for (auto& lane : xy_) {
            lane = lane_transform(lane);
        }
    }

    const lanes_type& lanes() const noexcept { return xy_; }

    bool operator==(const StateBigInt& rhs) const noexcept { return xy_ == rhs.xy_; }
    bool operator!=(const StateBigInt& rhs) const noexcept { return !(*this == rhs); }

    StateData data() const noexcept;
    static StateBigInt from_data(const StateData& data) noexcept;

    static std::size_t offset(std::size_t x, std::size_t y);

private:
    lanes_type xy_{};
};

} // namespace keccak_radix
