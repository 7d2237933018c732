#pragma once

#include "oracle.hpp"
#include "secure_memory.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace arb {

struct VrfKeyPair {
    std::string publicKeyHex;
    std::string secretKeyHex;
};

VrfKeyPair generateVrfKeypair();
VrfKeyPair deriveVrfKeypairFromSeed(const std::string& seedHex);

// Everything an auditor needs to re-check one fulfillment.
struct VrfEvidence {
    std::string alpha;
    std::string proofHex;
    std::string outputHex;
    std::string publicKeyHex;
};

// ECVRF-backed stand-in for an on-chain oracle. Each account reference is
// proven under the oracle key; the proof hash is the fulfillment.
class LocalVrfOracle : public RandomnessOracle {
public:
    // pollsBeforeFulfillment: how many polls return nullopt before the
    // proof is released.
    LocalVrfOracle(std::string secretKeyHex,
                   std::string publicKeyHex,
                   std::size_t pollsBeforeFulfillment = 0);
    ~LocalVrfOracle() override = default;

    std::string submitRandomnessRequest(const std::string& accountRef) override;
    std::optional<std::vector<std::uint8_t>> pollFulfillment(const std::string& accountRef) override;

    std::optional<VrfEvidence> proofFor(const std::string& accountRef) const;
    const std::string& publicKey() const { return publicKeyHex_; }

    static std::string buildAlpha(const std::string& accountRef);
    static bool verify(const VrfEvidence& evidence);

private:
    struct Submission {
        std::string txId;
        std::size_t polls = 0;
        std::optional<VrfEvidence> evidence;
    };

    VrfEvidence prove(const std::string& accountRef) const;

    std::string publicKeyHex_;
    SecureBytes secretKey_;
    std::size_t pollsBeforeFulfillment_;
    mutable std::mutex mutex_;
    std::map<std::string, Submission> submissions_;
};

} // namespace arb
