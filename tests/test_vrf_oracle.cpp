#include "errors.hpp"
#include "event_signer.hpp"
#include "randomness_resolver.hpp"
#include "vrf_oracle.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "vrf_oracle_test failure: " << msg << std::endl;
    std::exit(1);
}

} // namespace

int main() {
    using namespace arb;

    const std::string seedHex =
        "000102030405060708090a0b0c0d0e0f000102030405060708090a0b0c0d0e0f";
    const auto keys = deriveVrfKeypairFromSeed(seedHex);
    const auto again = deriveVrfKeypairFromSeed(seedHex);
    if (keys.publicKeyHex != again.publicKeyHex || keys.secretKeyHex != again.secretKeyHex) {
        fail("seeded keypair derivation is not deterministic");
    }
    if (generateVrfKeypair().publicKeyHex == keys.publicKeyHex) {
        fail("fresh keypair collided with the seeded one");
    }

    try {
        LocalVrfOracle broken("abcd", keys.publicKeyHex);
        fail("short secret key accepted");
    } catch (const std::invalid_argument&) {
    }

    LocalVrfOracle oracle(keys.secretKeyHex, keys.publicKeyHex, 2);
    const std::string ref = deriveAccountRef("vrf_1_deadbeef", "arbiter");

    const auto txId = oracle.submitRandomnessRequest(ref);
    if (txId.rfind("localvrf_", 0) != 0) {
        fail("unexpected transaction id " + txId);
    }
    try {
        oracle.submitRandomnessRequest(ref);
        fail("duplicate submission accepted");
    } catch (const ExternalServiceError&) {
    }
    try {
        oracle.pollFulfillment("unknown");
        fail("poll for an unknown account accepted");
    } catch (const ExternalServiceError&) {
    }

    if (oracle.pollFulfillment(ref) || oracle.pollFulfillment(ref)) {
        fail("fulfillment released before the configured number of polls");
    }
    if (oracle.proofFor(ref)) {
        fail("proof available before fulfillment");
    }
    const auto bytes = oracle.pollFulfillment(ref);
    if (!bytes || bytes->size() != 64) {
        fail("fulfillment should be a 64 byte VRF output");
    }
    if (oracle.pollFulfillment(ref) != bytes) {
        fail("repeated polls should return the same fulfillment");
    }

    const auto evidence = oracle.proofFor(ref);
    if (!evidence || evidence->alpha != LocalVrfOracle::buildAlpha(ref) ||
        evidence->publicKeyHex != keys.publicKeyHex) {
        fail("evidence does not describe the request");
    }
    if (!LocalVrfOracle::verify(*evidence)) {
        fail("genuine proof rejected");
    }
    auto forged = *evidence;
    forged.outputHex[0] = forged.outputHex[0] == '0' ? '1' : '0';
    if (LocalVrfOracle::verify(forged)) {
        fail("forged output accepted");
    }
    forged = *evidence;
    forged.alpha = LocalVrfOracle::buildAlpha("someone-else");
    if (LocalVrfOracle::verify(forged)) {
        fail("proof accepted for another account");
    }
    forged = *evidence;
    forged.proofHex = "zz";
    if (LocalVrfOracle::verify(forged)) {
        fail("malformed proof accepted");
    }

    // Same key and account: same randomness.
    LocalVrfOracle replica(keys.secretKeyHex, keys.publicKeyHex);
    replica.submitRandomnessRequest(ref);
    if (replica.pollFulfillment(ref) != bytes) {
        fail("VRF output differs across oracle instances");
    }

    // The resolver's seed is the first four bytes of a verifiable output.
    auto clock = std::make_shared<ManualClock>(1'700'000'000'000ULL);
    auto shared = std::make_shared<LocalVrfOracle>(keys.secretKeyHex, keys.publicKeyHex);
    ResolverConfig config;
    config.minResolutionDelayMs = 1'000;
    config.maxResolutionDelayMs = 10'000;
    RandomnessResolver resolver(config, shared, clock);
    const auto id = resolver.requestOutcome(
        "match_vrf", "tester",
        OutcomeParams{PlayerStats{"p1", 50.0, 50.0}, PlayerStats{"p2", 50.0, 50.0}});
    clock->advance(1'000);
    if (resolver.poll() != 1) {
        fail("resolver did not pick up the VRF fulfillment");
    }
    const auto request = resolver.getRequestStatus(id);
    const auto proof = shared->proofFor(request->accountRef);
    if (!proof || !LocalVrfOracle::verify(*proof)) {
        fail("resolver fulfillment has no verifiable proof");
    }
    const auto outcome = resolver.getMatchOutcome("match_vrf");
    if (!outcome || outcome->randomSeed != randomValueFromBytes(fromHex(proof->outputHex))) {
        fail("outcome seed does not come from the VRF output");
    }

    std::cout << "vrf_oracle_test: ok\n";
    return 0;
}
