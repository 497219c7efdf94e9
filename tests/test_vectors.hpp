// =============================================================================
// KeccakRadix - Shared Test Vectors
// =============================================================================
// Single source of truth for known-answer data used by the CPU test suites,
// the fuzz targets and the C ABI tests.
// =============================================================================

#pragma once

#include <cstdint>
#include <cstring>
#include <array>

namespace keccak_radix {
namespace test_vectors {

// ============================================================================
// One-bit-per-digit spreading: word -> base 13 / base 9 (hex, big-endian)
// ============================================================================

struct SpreadVector {
    std::uint64_t word;
    const char* base13_hex;
    const char* base9_hex;
};

inline constexpr SpreadVector SPREAD_VECTORS[] = {
    {0x0000000000000000ULL,
     "0000000000000000000000000000000000000000000000000000000000000000",
     "0000000000000000000000000000000000000000000000000000000000000000"},
    {0x0000000000000001ULL,
     "0000000000000000000000000000000000000000000000000000000000000001",
     "0000000000000000000000000000000000000000000000000000000000000001"},
    // 5 = 0b101 -> 1 + 13^2 = 170 / 1 + 9^2 = 82
    {0x0000000000000005ULL,
     "00000000000000000000000000000000000000000000000000000000000000aa",
     "0000000000000000000000000000000000000000000000000000000000000052"},
    {0xffffffffffffffffULL,
     "0000025e0096c48dafac5ecb902b27ddaff5deee44075aadb75849a2c4bdbec0",
     "00000000000000eac91cd21b4b49a5ddfc8b11ef9f6f7c6c900842903150cf40"},
    {0x0123456789abcdefULL,
     "00000000000095a1f25c8b7a4535a5882fc3e0fe99b4ff3331a392b3a5efcfa0",
     "00000000000000000002dd0e22cbb5df3dfc23eb92a4c9a8c2974fa7c291ee20"},
    {0x8000000000000001ULL,
     "0000022f630152f8f0ede1597162e9b8f131ba1703b804ef1f6530477a87c3c6",
     "00000000000000d0b2c448fbd1250537195f2c63386319440e403b2ad680b83a"},
    {0xdeadbeefcafebabeULL,
     "0000025ab13b48dfbf38561ab88b85ed87deef6c94c01372adac7152d809d12a",
     "00000000000000e83582f57c9f7e1e200420b982d344b9d694b2e4de26f433d6"},
};

inline constexpr int SPREAD_VECTOR_COUNT = sizeof(SPREAD_VECTORS) / sizeof(SPREAD_VECTORS[0]);

// ============================================================================
// Theta -> rho: base-13 spread of `word`, rotated by `rot`, read in base 9
// Expected value is the base-9 spread of rotl64(word, rot)
// ============================================================================

struct RotationVector {
    std::uint64_t word;
    std::uint32_t rot;
    const char* base9_hex;
};

inline constexpr RotationVector ROTATION_VECTORS[] = {
    {0x0123456789abcdefULL, 17,
     "00000000000000d0bb0300e94972f571d7197859f5df0c4657eb4fef266a2720"},
    {0x8000000000000001ULL, 1,
     "000000000000000000000000000000000000000000000000000000000000000a"},
    {0xdeadbeefcafebabeULL, 63,
     "0000000000000019cd0e8d0dd8d51fcaab20149cc22414a61085a7a6e7e23ea6"},
    {0xffffffffffffffffULL, 36,
     "00000000000000eac91cd21b4b49a5ddfc8b11ef9f6f7c6c900842903150cf40"},
};

inline constexpr int ROTATION_VECTOR_COUNT = sizeof(ROTATION_VECTORS) / sizeof(ROTATION_VECTORS[0]);

// Chunks [0, 1, 1, 1] in base 13 = 13 + 169 + 2197
inline constexpr std::uint64_t ROT_SAMPLE_B13 = 2379;
// Rotation 0: chunks [0, 1, 1, 1] in base 9 = 9 + 81 + 729
inline constexpr std::uint64_t ROT_SAMPLE_B9_ROT0 = 819;
// Rotation 4: chunks [0, 0, 0, 0, 0, 1, 1, 1] in base 9 = 9^5 + 9^6 + 9^7
inline constexpr std::uint64_t ROT_SAMPLE_B9_ROT4 = 5373459;

// ============================================================================
// Chi: a ^ (~b & c) ^ d
// ============================================================================

inline constexpr std::uint64_t CHI_A = 0x0123456789abcdefULL;
inline constexpr std::uint64_t CHI_B = 0xdeadbeefcafebabeULL;
inline constexpr std::uint64_t CHI_C = 0x8000000000000001ULL;
inline constexpr std::uint64_t CHI_D = 0xffffffff00000000ULL;
inline constexpr std::uint64_t CHI_EXPECTED = 0xfedcba9889abcdeeULL;

// ============================================================================
// BN254 scalar field
// ============================================================================

inline constexpr const char* FIELD_MODULUS =
    "30644e72e131a029b85045b68181585d2833e84879b9709143e1f593f0000001";
inline constexpr const char* FIELD_MODULUS_MINUS_ONE =
    "30644e72e131a029b85045b68181585d2833e84879b9709143e1f593f0000000";

// (2^264 - 1) mod r, i.e. 33 bytes of 0xff folded in base 256
inline constexpr const char* FIELD_ALL_ONES_264_MOD_R =
    "0d791464ef86e357276f48b709e2a3495d7570ac31329faef6e31f8c9ffffab5";

// r as 32 little-endian bytes
inline constexpr std::array<std::uint8_t, 32> FIELD_MODULUS_REPR = {
    0x01, 0x00, 0x00, 0xf0, 0x93, 0xf5, 0xe1, 0x43,
    0x91, 0x70, 0xb9, 0x79, 0x48, 0xe8, 0x33, 0x28,
    0x5d, 0x58, 0x81, 0x81, 0xb6, 0x45, 0x50, 0xb8,
    0x29, 0xa0, 0x31, 0xe1, 0x72, 0x4e, 0x64, 0x30,
};

} // namespace test_vectors
} // namespace keccak_radix
