// =============================================================================
// KeccakRadix: Shared POD Data Types
// =============================================================================
// Canonical data layouts for radix-encoded lanes, BN254 scalar field elements
// and the 5x5 lane state. These types define the MEMORY LAYOUT contract between
// the C++ classes and the C ABI.
//
// Design principles:
//   - Pure POD: no constructors, no virtual methods, no inheritance
//   - Little-endian limbs: limbs[0] is the least significant
//   - Lane (x, y) of a state lives at lanes[x * 5 + y]
//
// Usage:
//   - CPU:   class LaneValue / FieldElement { ... };  + data()/from_data()
//   - C ABI: 32-byte little-endian buffers with the same byte order
// =============================================================================

#pragma once

#include <cstdint>
#include <cstddef>

namespace keccak_radix {

// ─────────────────────────────────────────────────────────────────────────────
// Lane: 256-bit unsigned integer holding a base-2/9/13 digit expansion
// Largest value produced by the converters is 13^65 - 1 (< 2^241)
// ─────────────────────────────────────────────────────────────────────────────
struct LaneData {
    uint64_t limbs[4];  // Little-endian: limbs[0] = bits [0..63]
};

// ─────────────────────────────────────────────────────────────────────────────
// Field element: 256-bit integer mod r (BN254 scalar field)
// r = 0x30644e72e131a029b85045b68181585d2833e84879b9709143e1f593f0000001
// ─────────────────────────────────────────────────────────────────────────────
struct FieldElementData {
    uint64_t limbs[4];  // Little-endian: limbs[0] = bits [0..63]
};

// ─────────────────────────────────────────────────────────────────────────────
// State: 5x5 matrix of lanes, flattened row-major by x
// ─────────────────────────────────────────────────────────────────────────────
struct StateData {
    LaneData lanes[25];
};

// =============================================================================
// Layout Guarantees
// =============================================================================
static_assert(sizeof(LaneData)         == 32,  "Lane must be 256 bits");
static_assert(sizeof(FieldElementData) == 32,  "FieldElement must be 256 bits");
static_assert(sizeof(StateData)        == 800, "State must be 25 lanes");

static_assert(offsetof(StateData, lanes) == 0, "StateData.lanes at offset 0");

} // namespace keccak_radix
