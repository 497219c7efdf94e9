#pragma once

namespace keccak_radix {

// Run known-answer tests over codecs, converters, state and bridge
// Returns true if all tests pass, false otherwise
// Set verbose=true to see detailed test output
bool Selftest(bool verbose = false);

} // namespace keccak_radix
