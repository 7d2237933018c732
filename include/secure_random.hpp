#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace arb {

std::vector<std::uint8_t> secureRandomBytes(std::size_t numBytes);
// Lowercase hex of numBytes fresh random bytes.
std::string secureRandomHex(std::size_t numBytes);

// "<prefix>_<timestampMs>_<8 hex chars>", e.g. "BET_1717171717000_9f2c01ab".
std::string makeEntityId(const std::string& prefix, std::uint64_t timestampMs);

} // namespace arb
