#include "event_signer.hpp"

#include "errors.hpp"

#include "picosha2.h"

#include <iomanip>
#include <sstream>
#include <stdexcept>

#include <sodium.h>

namespace arb {

namespace {

void appendLengthPrefixed(std::ostringstream& oss, const std::string& value) {
    oss << value.size() << ':';
    oss.write(value.data(), static_cast<std::streamsize>(value.size()));
    oss << ';';
}

} // namespace

std::string toHex(const unsigned char* data, std::size_t len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::vector<unsigned char> fromHex(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        throw std::invalid_argument("hex string must have even length");
    }
    std::vector<unsigned char> out;
    out.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        unsigned int byte = 0;
        std::istringstream iss(hex.substr(i, 2));
        iss >> std::hex >> byte;
        if (iss.fail()) {
            throw std::invalid_argument("hex string contains non-hex characters");
        }
        out.push_back(static_cast<unsigned char>(byte));
    }
    return out;
}

std::string sha256Hex(const std::string& data) {
    std::vector<unsigned char> hash(picosha2::k_digest_size);
    picosha2::hash256(data.begin(), data.end(), hash.begin(), hash.end());
    return picosha2::bytes_to_hex_string(hash.begin(), hash.end());
}

CanonicalRecord& CanonicalRecord::set(const std::string& key, const std::string& value) {
    fields_[key] = value;
    return *this;
}

CanonicalRecord& CanonicalRecord::setNumber(const std::string& key, std::uint64_t value) {
    fields_[key] = std::to_string(value);
    return *this;
}

CanonicalRecord& CanonicalRecord::setAmount(const std::string& key, Fixed64 value) {
    fields_[key] = value.toString();
    return *this;
}

CanonicalRecord& CanonicalRecord::setFlag(const std::string& key, bool value) {
    fields_[key] = value ? "true" : "false";
    return *this;
}

CanonicalRecord& CanonicalRecord::setList(const std::string& key,
                                          const std::vector<std::string>& values) {
    std::ostringstream oss;
    oss << '[';
    for (const auto& value : values) {
        appendLengthPrefixed(oss, value);
    }
    oss << ']';
    fields_[key] = oss.str();
    return *this;
}

CanonicalRecord& CanonicalRecord::setOptional(const std::string& key,
                                              const std::optional<std::string>& value) {
    if (value) {
        fields_[key] = *value;
    }
    return *this;
}

CanonicalRecord& CanonicalRecord::erase(const std::string& key) {
    fields_.erase(key);
    return *this;
}

std::optional<std::string> CanonicalRecord::get(const std::string& key) const {
    auto it = fields_.find(key);
    if (it == fields_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string CanonicalRecord::canonicalize() const {
    std::ostringstream oss;
    oss << '{';
    for (const auto& [key, value] : fields_) {
        appendLengthPrefixed(oss, key);
        oss << '=';
        appendLengthPrefixed(oss, value);
    }
    oss << '}';
    return oss.str();
}

std::string fingerprint(const CanonicalRecord& record) {
    return sha256Hex(record.canonicalize());
}

std::string chainLink(const std::string& signature, const std::string& previousHash) {
    return sha256Hex(signature + previousHash);
}

EventSigner::EventSigner(std::string key) {
    if (sodium_init() < 0) {
        throw std::runtime_error("Unable to initialize libsodium");
    }
    if (key.empty()) {
        throw IntegrityError("audit signing key must not be empty");
    }
    key_.assign(key.data(), key.size());
    secureZero(key);
}

std::string EventSigner::sign(const CanonicalRecord& record) const {
    const std::string message = record.canonicalize();
    crypto_auth_hmacsha256_state state;
    unsigned char mac[crypto_auth_hmacsha256_BYTES];
    if (crypto_auth_hmacsha256_init(&state, key_.data(), key_.size()) != 0 ||
        crypto_auth_hmacsha256_update(&state,
                                      reinterpret_cast<const unsigned char*>(message.data()),
                                      message.size()) != 0 ||
        crypto_auth_hmacsha256_final(&state, mac) != 0) {
        secureZero(&state, sizeof(state));
        throw IntegrityError("HMAC computation failed");
    }
    secureZero(&state, sizeof(state));
    return toHex(mac, sizeof(mac));
}

bool EventSigner::verify(const CanonicalRecord& record, const std::string& signatureHex) const {
    return secureEquals(sign(record), signatureHex);
}

} // namespace arb
