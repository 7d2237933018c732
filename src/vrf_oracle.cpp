#include "vrf_oracle.hpp"

#include "errors.hpp"
#include "event_signer.hpp"
#include "secure_random.hpp"

#include <algorithm>
#include <stdexcept>
#include <string_view>

#include <sodium.h>

namespace arb {

#ifndef crypto_vrf_PROOFBYTES
#error "libsodium must provide crypto_vrf_* support (version >= 1.0.18)"
#endif

namespace {

bool ensureSodiumReady() {
    static bool ready = sodium_init() >= 0;
    return ready;
}

constexpr std::string_view kVrfDomainTag = "arbiter:vrf:v1";

VrfKeyPair packKeypair(std::vector<unsigned char>& publicKey,
                       std::vector<unsigned char>& secretKey) {
    VrfKeyPair pair{
        toHex(publicKey.data(), publicKey.size()),
        toHex(secretKey.data(), secretKey.size()),
    };
    secureZero(secretKey.data(), secretKey.size());
    return pair;
}

} // namespace

VrfKeyPair generateVrfKeypair() {
    if (!ensureSodiumReady()) {
        throw std::runtime_error("Unable to initialize libsodium");
    }
    std::vector<unsigned char> publicKey(crypto_vrf_PUBLICKEYBYTES);
    std::vector<unsigned char> secretKey(crypto_vrf_SECRETKEYBYTES);
    if (crypto_vrf_keypair(publicKey.data(), secretKey.data()) != 0) {
        throw std::runtime_error("VRF keypair generation failed");
    }
    return packKeypair(publicKey, secretKey);
}

VrfKeyPair deriveVrfKeypairFromSeed(const std::string& seedHex) {
    if (!ensureSodiumReady()) {
        throw std::runtime_error("Unable to initialize libsodium");
    }
    auto seed = fromHex(seedHex);
    if (seed.size() != crypto_vrf_SEEDBYTES) {
        throw std::invalid_argument("Seed must decode to crypto_vrf_SEEDBYTES bytes");
    }
    std::vector<unsigned char> publicKey(crypto_vrf_PUBLICKEYBYTES);
    std::vector<unsigned char> secretKey(crypto_vrf_SECRETKEYBYTES);
    if (crypto_vrf_keypair_from_seed(publicKey.data(), secretKey.data(), seed.data()) != 0) {
        throw std::runtime_error("Failed to derive VRF keypair from seed");
    }
    secureZero(seed.data(), seed.size());
    return packKeypair(publicKey, secretKey);
}

LocalVrfOracle::LocalVrfOracle(std::string secretKeyHex,
                               std::string publicKeyHex,
                               std::size_t pollsBeforeFulfillment)
    : publicKeyHex_(std::move(publicKeyHex))
    , pollsBeforeFulfillment_(pollsBeforeFulfillment) {
    if (!ensureSodiumReady()) {
        throw std::runtime_error("Unable to initialize libsodium");
    }

    auto secretBytes = fromHex(secretKeyHex);
    secureZero(secretKeyHex);
    if (secretBytes.size() != crypto_vrf_SECRETKEYBYTES) {
        secureZero(secretBytes.data(), secretBytes.size());
        throw std::invalid_argument("oracle secret key length invalid");
    }
    secretKey_.assign(secretBytes.data(), secretBytes.size());
    secureZero(secretBytes.data(), secretBytes.size());

    if (fromHex(publicKeyHex_).size() != crypto_vrf_PUBLICKEYBYTES) {
        throw std::invalid_argument("oracle public key length invalid");
    }
}

std::string LocalVrfOracle::buildAlpha(const std::string& accountRef) {
    std::string alpha(kVrfDomainTag);
    alpha += "|";
    alpha += accountRef;
    return alpha;
}

std::string LocalVrfOracle::submitRandomnessRequest(const std::string& accountRef) {
    if (accountRef.empty()) {
        throw ExternalServiceError("account reference must not be empty");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (submissions_.count(accountRef) != 0) {
        throw ExternalServiceError("randomness already requested for " + accountRef);
    }
    Submission submission;
    submission.txId = "localvrf_" + secureRandomHex(16);
    auto txId = submission.txId;
    submissions_.emplace(accountRef, std::move(submission));
    return txId;
}

std::optional<std::vector<std::uint8_t>> LocalVrfOracle::pollFulfillment(const std::string& accountRef) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = submissions_.find(accountRef);
    if (it == submissions_.end()) {
        throw ExternalServiceError("no randomness request for " + accountRef);
    }
    auto& submission = it->second;
    if (!submission.evidence) {
        if (submission.polls < pollsBeforeFulfillment_) {
            ++submission.polls;
            return std::nullopt;
        }
        submission.evidence = prove(accountRef);
    }
    auto bytes = fromHex(submission.evidence->outputHex);
    return std::vector<std::uint8_t>(bytes.begin(), bytes.end());
}

std::optional<VrfEvidence> LocalVrfOracle::proofFor(const std::string& accountRef) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = submissions_.find(accountRef);
    if (it == submissions_.end()) {
        return std::nullopt;
    }
    return it->second.evidence;
}

VrfEvidence LocalVrfOracle::prove(const std::string& accountRef) const {
    VrfEvidence evidence;
    evidence.alpha = buildAlpha(accountRef);
    evidence.publicKeyHex = publicKeyHex_;

    std::vector<unsigned char> proof(crypto_vrf_PROOFBYTES);
    if (crypto_vrf_prove(proof.data(),
                         secretKey_.data(),
                         reinterpret_cast<const unsigned char*>(evidence.alpha.data()),
                         evidence.alpha.size()) != 0) {
        throw ExternalServiceError("VRF prove failed");
    }
    std::vector<unsigned char> output(crypto_vrf_OUTPUTBYTES);
    if (crypto_vrf_proof_to_hash(output.data(), proof.data()) != 0) {
        throw ExternalServiceError("VRF hash extraction failed");
    }

    evidence.proofHex = toHex(proof.data(), proof.size());
    evidence.outputHex = toHex(output.data(), output.size());
    return evidence;
}

bool LocalVrfOracle::verify(const VrfEvidence& evidence) {
    if (!ensureSodiumReady()) {
        return false;
    }

    try {
        auto proof = fromHex(evidence.proofHex);
        auto publicKey = fromHex(evidence.publicKeyHex);
        auto output = fromHex(evidence.outputHex);
        if (proof.size() != crypto_vrf_PROOFBYTES ||
            output.size() != crypto_vrf_OUTPUTBYTES ||
            publicKey.size() != crypto_vrf_PUBLICKEYBYTES) {
            return false;
        }

        std::vector<unsigned char> recomputed(crypto_vrf_OUTPUTBYTES);
        if (crypto_vrf_verify(recomputed.data(),
                              publicKey.data(),
                              proof.data(),
                              reinterpret_cast<const unsigned char*>(evidence.alpha.data()),
                              evidence.alpha.size()) != 0) {
            return false;
        }
        return std::equal(recomputed.begin(), recomputed.end(), output.begin());
    } catch (const std::invalid_argument&) {
        return false;
    }
}

} // namespace arb
