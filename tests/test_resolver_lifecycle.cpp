#include "audit_chain.hpp"
#include "errors.hpp"
#include "randomness_resolver.hpp"

#include <cstdlib>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "resolver_lifecycle_test failure: " << msg << std::endl;
    std::exit(1);
}

class ScriptedOracle : public arb::RandomnessOracle {
public:
    std::string submitRandomnessRequest(const std::string& accountRef) override {
        if (onSubmit) {
            onSubmit();
        }
        if (failSubmit) {
            throw std::runtime_error("rpc unavailable");
        }
        submitted.push_back(accountRef);
        return "tx_" + std::to_string(submitted.size());
    }

    std::optional<std::vector<std::uint8_t>> pollFulfillment(const std::string&) override {
        ++polls;
        if (pollFailures > 0) {
            --pollFailures;
            throw std::runtime_error("rpc flake");
        }
        return fulfillment;
    }

    std::function<void()> onSubmit;
    bool failSubmit = false;
    std::size_t pollFailures = 0;
    std::size_t polls = 0;
    std::optional<std::vector<std::uint8_t>> fulfillment;
    std::vector<std::string> submitted;
};

template <typename E, typename Fn>
void expectThrow(Fn&& fn, const std::string& what) {
    try {
        fn();
    } catch (const E&) {
        return;
    }
    fail(what);
}

} // namespace

int main() {
    using namespace arb;

    auto clock = std::make_shared<ManualClock>(1'700'000'000'000ULL);
    auto oracle = std::make_shared<ScriptedOracle>();

    AuditConfig auditConfig;
    auditConfig.signingKey = "resolver-lifecycle-key";
    auto audit =
        std::make_shared<AuditChain>(auditConfig, std::make_shared<InMemoryAuditStore>(), clock);

    ResolverConfig config;
    config.minResolutionDelayMs = 5'000;
    config.maxResolutionDelayMs = 30'000;
    config.pollIntervalMs = 1;
    config.requestRetentionMs = 60'000;
    RandomnessResolver resolver(config, oracle, clock, audit);

    std::vector<ResolverEventKind> seen;
    const auto token =
        resolver.subscribe([&seen](const ResolverEvent& event) { seen.push_back(event.kind); });

    // Rejected before registration.
    expectThrow<ValidationError>(
        [&] {
            resolver.requestOutcome("m", "u", OutcomeParams{PlayerStats{"a", 1, 10},
                                                            PlayerStats{"a", 1, 10}});
        },
        "duplicate participants accepted");
    expectThrow<ValidationError>(
        [&] {
            resolver.requestOutcome("m", "u", OutcomeParams{PlayerStats{"a", -1, 10},
                                                            PlayerStats{"b", 1, 10}});
        },
        "negative score accepted");
    expectThrow<ValidationError>([&] { resolver.requestRandomEvent("m", "crit", 101.0); },
                                 "probability above 100 accepted");
    expectThrow<ValidationError>([&] { resolver.requestShuffle("m", "u", {}); },
                                 "empty shuffle accepted");
    if (resolver.getStats().totalRequests != 0 || !seen.empty()) {
        fail("rejected requests left state behind");
    }

    // Submission failure fails only that request.
    oracle->failSubmit = true;
    expectThrow<ExternalServiceError>([&] { resolver.requestRandomEvent("m1", "crit", 50.0); },
                                      "submission failure not surfaced");
    oracle->failSubmit = false;
    if (seen.size() != 1 || seen.back() != ResolverEventKind::Failed) {
        fail("submission failure should emit vrfFailed");
    }

    // No fulfillment within the maximum delay: timeout, and it stays failed.
    const auto slow = resolver.requestShuffle("m2", "u", {"a", "b", "c"});
    if (seen.back() != ResolverEventKind::Requested) {
        fail("request should emit vrfRequested");
    }
    if (resolver.poll() != 0 || oracle->polls != 0) {
        fail("oracle polled before the minimum delay");
    }
    clock->advance(5'000);
    if (resolver.poll() != 0 || oracle->polls != 1) {
        fail("empty poll should keep the request pending");
    }
    clock->advance(25'001);
    if (resolver.poll() != 1 || seen.back() != ResolverEventKind::Timeout) {
        fail("request should time out after the maximum delay");
    }
    auto timedOut = resolver.getRequestStatus(slow);
    if (!timedOut || timedOut->status != RequestStatus::Failed ||
        timedOut->failureCause != FailureCause::Timeout) {
        fail("timed out request not marked failed");
    }
    oracle->fulfillment = std::vector<std::uint8_t>{0, 0, 0, 7};
    clock->advance(1'000);
    resolver.poll();
    if (resolver.getRequestStatus(slow)->status != RequestStatus::Failed) {
        fail("timed out request transitioned again");
    }
    if (resolver.cancelRequest(slow)) {
        fail("terminal request cancelled");
    }
    expectThrow<TimeoutError>([&] { resolver.awaitResult(slow); },
                              "awaitResult should report the timeout");

    // Cancellation.
    const auto cancelled = resolver.requestRandomEvent("m3", "crit", 50.0);
    if (!resolver.cancelRequest(cancelled) || seen.back() != ResolverEventKind::Cancelled) {
        fail("pending request not cancelled");
    }
    if (resolver.cancelRequest(cancelled)) {
        fail("request cancelled twice");
    }
    expectThrow<ExternalServiceError>([&] { resolver.awaitResult(cancelled); },
                                      "awaitResult should report the cancellation");

    // A failing oracle poll is retried on the next pass.
    const auto shuffled = resolver.requestShuffle("m4", "u", {"a", "b", "c"});
    oracle->pollFailures = 1;
    clock->advance(5'000);
    if (resolver.poll() != 0) {
        fail("poll error should not settle the request");
    }
    if (resolver.getRequestStatus(shuffled)->status != RequestStatus::Pending) {
        fail("poll error should leave the request pending");
    }
    if (resolver.poll() != 1 || seen.back() != ResolverEventKind::Fulfilled) {
        fail("request should be fulfilled on the retry");
    }
    const auto done = resolver.awaitResult(shuffled);
    const auto* shuffle = std::get_if<ShuffleResult>(&*done.result);
    if (!shuffle || shuffle->randomSeed != 7U ||
        shuffle->items != resolveShuffle(std::vector<std::string>{"a", "b", "c"}, 7U)) {
        fail("shuffle result does not replay from its seed");
    }

    // Unusable fulfillment fails the request, not the resolver.
    oracle->fulfillment = std::vector<std::uint8_t>{1, 2};
    const auto broken = resolver.requestRandomEvent("m5", "crit", 50.0);
    clock->advance(5'000);
    if (resolver.poll() != 1 || seen.back() != ResolverEventKind::Failed) {
        fail("short fulfillment should fail the request");
    }
    if (resolver.getRequestStatus(broken)->failureCause != FailureCause::ComputationFailed) {
        fail("short fulfillment should be a computation failure");
    }

    const auto stats = resolver.getStats();
    if (stats.totalRequests != 5 || stats.fulfilledRequests != 1 || stats.failedRequests != 4 ||
        stats.pendingRequests != 0) {
        fail("stats do not add up");
    }
    if (stats.successRate != 0.2 || stats.averageFulfillmentMs != 5'000.0) {
        fail("success rate or fulfillment time wrong");
    }

    expectThrow<ValidationError>([&] { resolver.awaitResult("vrf_missing"); },
                                 "unknown request accepted by awaitResult");

    // Every lifecycle event landed in the system audit chain.
    const auto auditMetrics = audit->metrics();
    if (auditMetrics.logsByCategory[categoryIndex(AuditCategory::System)] != seen.size()) {
        fail("audit chain missed resolver events");
    }
    if (!audit->verifyLogIntegrity(AuditCategory::System).passed) {
        fail("resolver audit chain does not verify");
    }

    resolver.unsubscribe(token);
    const auto before = seen.size();
    const auto quiet = resolver.requestRandomEvent("m6", "crit", 50.0);
    if (seen.size() != before) {
        fail("unsubscribed observer still notified");
    }
    resolver.cancelRequest(quiet);

    clock->advance(config.requestRetentionMs + 1);
    if (resolver.cleanup() != 6 || resolver.getStats().totalRequests != 0) {
        fail("cleanup should drop every expired terminal request");
    }

    // A match outcome is created once; later requests cannot replace it.
    auto duelOracle = std::make_shared<ScriptedOracle>();
    duelOracle->fulfillment = std::vector<std::uint8_t>{0, 0, 0, 42};
    RandomnessResolver duels(config, duelOracle, clock);
    const OutcomeParams duel{PlayerStats{"a", 60, 50}, PlayerStats{"b", 40, 50}};
    duels.requestOutcome("final", "u", duel);
    expectThrow<ValidationError>([&] { duels.requestOutcome("final", "u", duel); },
                                 "second outcome request accepted while the first is pending");
    clock->advance(5'000);
    if (duels.poll() != 1) {
        fail("outcome request should be fulfilled");
    }
    const auto published = duels.getMatchOutcome("final")->verificationHash;
    expectThrow<ValidationError>([&] { duels.requestOutcome("final", "u", duel); },
                                 "outcome request accepted for a decided match");
    clock->advance(5'000);
    duels.poll();
    if (!duels.verifyOutcome("final", published) || duels.getStats().totalRequests != 1) {
        fail("published outcome no longer verifies");
    }
    const auto abandoned = duels.requestOutcome("semi", "u", duel);
    duels.cancelRequest(abandoned);
    try {
        duels.requestOutcome("semi", "u", duel);
    } catch (const ValidationError& e) {
        fail(std::string("outcome request after a cancelled one rejected: ") + e.what());
    }

    // Cancelled while the oracle submission is in flight: no vrfRequested.
    auto racyOracle = std::make_shared<ScriptedOracle>();
    RandomnessResolver racy(config, racyOracle, clock);
    std::vector<ResolverEventKind> racySeen;
    racy.subscribe([&racySeen](const ResolverEvent& event) { racySeen.push_back(event.kind); });
    racyOracle->onSubmit = [&racy] {
        for (const auto& id : racy.pendingRequestIds()) {
            racy.cancelRequest(id);
        }
    };
    const auto raced = racy.requestShuffle("m7", "u", {"a", "b"});
    if (racySeen != std::vector<ResolverEventKind>{ResolverEventKind::Cancelled}) {
        fail("request cancelled during submission was still announced");
    }
    const auto racedStatus = racy.getRequestStatus(raced);
    if (!racedStatus || racedStatus->failureCause != FailureCause::Cancelled ||
        racedStatus->txId != std::optional<std::string>("tx_1") || !racy.pendingRequestIds().empty()) {
        fail("request cancelled during submission should stay cancelled");
    }

    std::cout << "resolver_lifecycle_test: ok\n";
    return 0;
}
