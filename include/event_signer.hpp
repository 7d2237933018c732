#pragma once

#include "fixed_point.hpp"
#include "secure_memory.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace arb {

std::string toHex(const unsigned char* data, std::size_t len);
std::vector<unsigned char> fromHex(const std::string& hex);
std::string sha256Hex(const std::string& data);

// Ordered key/value view of a structured record. Canonicalization is
// key-sorted and length-prefixed so two records serialize identically iff
// they hold the same fields.
class CanonicalRecord {
public:
    CanonicalRecord& set(const std::string& key, const std::string& value);
    CanonicalRecord& setNumber(const std::string& key, std::uint64_t value);
    CanonicalRecord& setAmount(const std::string& key, Fixed64 value);
    CanonicalRecord& setFlag(const std::string& key, bool value);
    CanonicalRecord& setList(const std::string& key, const std::vector<std::string>& values);
    CanonicalRecord& setOptional(const std::string& key, const std::optional<std::string>& value);
    CanonicalRecord& erase(const std::string& key);

    std::optional<std::string> get(const std::string& key) const;
    bool has(const std::string& key) const { return fields_.count(key) != 0; }
    bool empty() const { return fields_.empty(); }
    const std::map<std::string, std::string>& fields() const { return fields_; }

    std::string canonicalize() const;

    bool operator==(const CanonicalRecord& other) const { return fields_ == other.fields_; }
    bool operator!=(const CanonicalRecord& other) const { return fields_ != other.fields_; }

private:
    std::map<std::string, std::string> fields_;
};

// Content hash of a record, independent of any chain linkage.
std::string fingerprint(const CanonicalRecord& record);

// Chain head after an entry: H(signature || previousHash).
std::string chainLink(const std::string& signature, const std::string& previousHash);

class EventSigner {
public:
    // The key string is wiped after being copied into secure storage.
    explicit EventSigner(std::string key);

    std::string sign(const CanonicalRecord& record) const;
    bool verify(const CanonicalRecord& record, const std::string& signatureHex) const;

private:
    SecureBytes key_;
};

} // namespace arb
