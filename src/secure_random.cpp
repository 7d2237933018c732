#include "secure_random.hpp"

#include "secure_memory.hpp"

#include <stdexcept>

#include <sodium.h>

namespace arb {

namespace {

void ensureSodiumReady() {
    static const bool ready = sodium_init() >= 0;
    if (!ready) {
        throw std::runtime_error("Unable to initialize libsodium RNG");
    }
}

} // namespace

std::vector<std::uint8_t> secureRandomBytes(std::size_t numBytes) {
    std::vector<std::uint8_t> buffer(numBytes);
    if (numBytes == 0) {
        return buffer;
    }
    ensureSodiumReady();
    randombytes_buf(buffer.data(), buffer.size());
    return buffer;
}

std::string secureRandomHex(std::size_t numBytes) {
    auto bytes = secureRandomBytes(numBytes);
    std::string hex(numBytes * 2 + 1, '\0');
    sodium_bin2hex(&hex[0], hex.size(), bytes.data(), bytes.size());
    hex.pop_back();
    secureZero(bytes.data(), bytes.size());
    return hex;
}

std::string makeEntityId(const std::string& prefix, std::uint64_t timestampMs) {
    return prefix + '_' + std::to_string(timestampMs) + '_' + secureRandomHex(4);
}

} // namespace arb
