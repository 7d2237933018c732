#include "event_signer.hpp"
#include "randomness_resolver.hpp"
#include "vrf_oracle.hpp"

#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::uint32_t parseSeed(const std::string& text) {
    const auto value = std::stoull(text);
    if (value > 0xFFFFFFFFULL) {
        throw std::out_of_range("random seed exceeds 32 bits");
    }
    return static_cast<std::uint32_t>(value);
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc != 6 && argc != 10) {
        std::cerr << "Usage: verify_outcome <matchId> <randomSeed> <winner> <nonce> <verificationHash>"
                     " [<accountRef> <vrfOutputHex> <vrfProofHex> <publicKeyHex>]\n";
        return 1;
    }

    const std::string matchId = argv[1];
    const std::string winner = argv[3];
    const std::string nonce = argv[4];
    const std::string published = argv[5];
    std::uint32_t seed = 0;
    try {
        seed = parseSeed(argv[2]);
    } catch (const std::exception& ex) {
        std::cerr << "Random seed must be an unsigned 32-bit integer: " << ex.what() << '\n';
        return 1;
    }

    const auto recomputed = arb::computeVerificationHash(matchId, seed, winner, nonce);
    const bool hashOk = recomputed == published;
    std::cout << "Recomputed hash: " << recomputed << '\n';
    std::cout << "Outcome hash: " << (hashOk ? "valid" : "INVALID") << '\n';

    bool vrfOk = true;
    if (argc == 10) {
        arb::VrfEvidence evidence;
        evidence.alpha = arb::LocalVrfOracle::buildAlpha(argv[6]);
        evidence.outputHex = argv[7];
        evidence.proofHex = argv[8];
        evidence.publicKeyHex = argv[9];
        const bool proofOk = arb::LocalVrfOracle::verify(evidence);
        bool seedOk = false;
        if (proofOk) {
            try {
                seedOk = arb::randomValueFromBytes(arb::fromHex(evidence.outputHex)) == seed;
            } catch (const std::exception& ex) {
                std::cerr << "VRF output unusable: " << ex.what() << '\n';
            }
        }
        std::cout << "VRF proof: " << (proofOk ? "valid" : "INVALID") << '\n';
        std::cout << "Seed matches VRF output: " << (seedOk ? "yes" : "NO") << '\n';
        vrfOk = proofOk && seedOk;
    }

    return hashOk && vrfOk ? 0 : 2;
}
