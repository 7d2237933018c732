#include "randomness_resolver.hpp"

#include <cmath>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "outcome_verification_test failure: " << msg << std::endl;
    std::exit(1);
}

// Fulfils every request with the same bytes.
class FixedOracle : public arb::RandomnessOracle {
public:
    explicit FixedOracle(std::vector<std::uint8_t> bytes) : bytes_(std::move(bytes)) {}

    std::string submitRandomnessRequest(const std::string& accountRef) override {
        return "tx_" + accountRef.substr(0, 8);
    }

    std::optional<std::vector<std::uint8_t>> pollFulfillment(const std::string&) override {
        return bytes_;
    }

private:
    std::vector<std::uint8_t> bytes_;
};

} // namespace

int main() {
    using namespace arb;

    const OutcomeParams params{PlayerStats{"player_a", 80.0, 50.0},
                               PlayerStats{"player_b", 20.0, 50.0}};

    // 100000 % 10^6 / 10^6 = 0.1, below player_a's 0.8 win probability.
    const std::vector<std::uint8_t> bytes{0x00, 0x01, 0x86, 0xA0, 0xFF, 0xEE};
    if (randomValueFromBytes(bytes) != 100000U) {
        fail("random value is not read big-endian");
    }

    const auto outcome = resolveOutcome("match_7", params, 100000U, "n0nce");
    if (outcome.winner != "player_a" || outcome.loser != "player_b") {
        fail("stronger player should win at u = 0.1");
    }
    if (outcome.confidence < 50.0 || outcome.confidence > 95.0) {
        fail("confidence outside [50, 95]");
    }
    if (std::fabs(outcome.confidence - 83.75) > 1e-9) {
        fail("confidence should be 50 + 45 * 90 / 120");
    }
    if (outcome.method != OutcomeMethod::Decision) {
        fail("outcome method should be decision");
    }
    if (!verifyOutcomeHash(outcome)) {
        fail("fresh outcome does not verify");
    }

    auto mutated = outcome;
    mutated.winner = "player_b";
    if (verifyOutcomeHash(mutated)) {
        fail("mutated winner still verifies");
    }
    mutated = outcome;
    mutated.randomSeed += 1;
    if (verifyOutcomeHash(mutated)) {
        fail("mutated seed still verifies");
    }
    mutated = outcome;
    mutated.matchId = "match_8";
    if (verifyOutcomeHash(mutated)) {
        fail("mutated match id still verifies");
    }

    // u = 0.9 lands above 0.8, so the weaker player takes it.
    const auto upset = resolveOutcome("match_7", params, 900000U, "n0nce");
    if (upset.winner != "player_b") {
        fail("weaker player should win at u = 0.9");
    }

    const auto even = resolveOutcome("match_9", OutcomeParams{PlayerStats{"x", 0, 0},
                                                             PlayerStats{"y", 0, 0}},
                                     499999U, "n");
    if (even.winner != "x" || even.confidence != 50.0) {
        fail("scoreless players should split at one half with confidence 50");
    }

    const auto event = resolveRandomEvent(RandomEventParams{"critical_hit", 10.0}, 100000U);
    if (!event.triggered || !event.value || *event.value != 0U) {
        fail("random event at 0% roll should trigger with value 0");
    }
    if (resolveRandomEvent(RandomEventParams{"critical_hit", 0.0}, 100000U).triggered) {
        fail("zero probability event triggered");
    }

    // Through the resolver.
    auto clock = std::make_shared<ManualClock>(1'700'000'000'000ULL);
    ResolverConfig config;
    config.minResolutionDelayMs = 5'000;
    config.maxResolutionDelayMs = 30'000;
    RandomnessResolver resolver(config, std::make_shared<FixedOracle>(bytes), clock);

    const auto requestId = resolver.requestOutcome("match_7", "tester", params);
    if (resolver.poll() != 0) {
        fail("request fulfilled before the minimum delay");
    }
    clock->advance(5'000);
    if (resolver.poll() != 1) {
        fail("request not fulfilled after the minimum delay");
    }
    const auto request = resolver.getRequestStatus(requestId);
    if (!request || request->status != RequestStatus::Fulfilled || !request->result) {
        fail("request did not reach fulfilled");
    }
    const auto stored = resolver.getMatchOutcome("match_7");
    if (!stored || stored->winner != "player_a" || stored->randomSeed != 100000U) {
        fail("resolver stored the wrong outcome");
    }
    if (!resolver.verifyOutcome("match_7", stored->verificationHash)) {
        fail("resolver rejects its own verification hash");
    }
    if (resolver.verifyOutcome("match_7", std::string(64, '0'))) {
        fail("resolver accepts a forged verification hash");
    }
    if (resolver.verifyOutcome("match_unknown", stored->verificationHash)) {
        fail("resolver verifies an unknown match");
    }

    std::cout << "outcome_verification_test: ok\n";
    return 0;
}
