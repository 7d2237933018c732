#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <sodium.h>

namespace arb {

inline void secureZero(void* ptr, std::size_t numBytes) {
    if (ptr == nullptr || numBytes == 0) {
        return;
    }
    sodium_memzero(ptr, numBytes);
}

inline void secureZero(std::string& value) {
    secureZero(value.data(), value.size());
    value.clear();
}

// Constant-time comparison; lengths are not secret.
inline bool secureEquals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

// Owning byte buffer for key material. Zeroed on destruction and when
// overwritten by a move.
class SecureBytes {
public:
    SecureBytes() = default;
    explicit SecureBytes(const std::string& source) { assign(source.data(), source.size()); }

    SecureBytes(const SecureBytes&) = delete;
    SecureBytes& operator=(const SecureBytes&) = delete;

    SecureBytes(SecureBytes&& other) noexcept : bytes_(std::move(other.bytes_)) {
        other.bytes_.clear();
    }

    SecureBytes& operator=(SecureBytes&& other) noexcept {
        if (this != &other) {
            wipe();
            bytes_ = std::move(other.bytes_);
            other.bytes_.clear();
        }
        return *this;
    }

    ~SecureBytes() { wipe(); }

    void assign(const void* data, std::size_t len) {
        wipe();
        const auto* begin = static_cast<const unsigned char*>(data);
        bytes_.assign(begin, begin + len);
    }

    std::size_t size() const { return bytes_.size(); }
    bool empty() const { return bytes_.empty(); }
    const unsigned char* data() const { return bytes_.data(); }

private:
    void wipe() {
        secureZero(bytes_.data(), bytes_.size());
        bytes_.clear();
    }

    std::vector<unsigned char> bytes_;
};

} // namespace arb
