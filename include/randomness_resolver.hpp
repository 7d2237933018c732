#pragma once

#include "audit_chain.hpp"
#include "clock.hpp"
#include "config.hpp"
#include "logging.hpp"
#include "oracle.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace arb {

enum class RequestType { Outcome, Shuffle, RandomEvent };
enum class RequestStatus { Pending, Fulfilled, Failed };
enum class FailureCause { None, SubmissionFailed, Timeout, ComputationFailed, Cancelled };
enum class OutcomeMethod { Decision, Timeout, Forfeit };

const char* toString(RequestType type);
const char* toString(RequestStatus status);
const char* toString(FailureCause cause);
const char* toString(OutcomeMethod method);

struct PlayerStats {
    std::string playerId;
    double score = 0.0;
    double confidence = 0.0; // 0..100
};

struct OutcomeParams {
    PlayerStats player1;
    PlayerStats player2;
};

struct RandomEventParams {
    std::string eventType;
    double probability = 0.0; // percent, 0..100
};

struct ShuffleParams {
    std::vector<std::string> items;
};

using RequestParams = std::variant<OutcomeParams, RandomEventParams, ShuffleParams>;

struct MatchOutcome {
    std::string matchId;
    std::string winner;
    std::string loser;
    OutcomeMethod method = OutcomeMethod::Decision;
    double confidence = 50.0;
    std::uint32_t randomSeed = 0;
    std::string nonce;
    std::string verificationHash;
    std::uint64_t resolvedAt = 0;
};

struct RandomEventResult {
    std::string eventType;
    bool triggered = false;
    std::optional<std::uint32_t> value;
    std::uint32_t randomSeed = 0;
};

struct ShuffleResult {
    std::vector<std::string> items;
    std::uint32_t randomSeed = 0;
};

using RequestResult = std::variant<MatchOutcome, RandomEventResult, ShuffleResult>;

struct RandomnessRequest {
    std::string id;
    std::string matchId;
    std::string requesterId;
    RequestType type = RequestType::Outcome;
    RequestParams params;
    RequestStatus status = RequestStatus::Pending;
    std::optional<RequestResult> result;
    std::string accountRef;
    std::optional<std::string> txId;
    std::uint64_t createdAt = 0;
    std::optional<std::uint64_t> completedAt;
    FailureCause failureCause = FailureCause::None;
    std::string failureReason;
};

enum class ResolverEventKind { Requested, Fulfilled, Failed, Timeout, Cancelled };

const char* toString(ResolverEventKind kind);

struct ResolverEvent {
    ResolverEventKind kind = ResolverEventKind::Requested;
    RandomnessRequest request;
};

using ResolverObserver = std::function<void(const ResolverEvent&)>;

struct ResolverStats {
    std::size_t totalRequests = 0;
    std::size_t pendingRequests = 0;
    std::size_t fulfilledRequests = 0;
    std::size_t failedRequests = 0;
    // Fulfilled share of terminal requests, 0..1.
    double successRate = 0.0;
    double averageFulfillmentMs = 0.0;
    std::size_t activeOutcomes = 0;
};

// First four bytes, big-endian. Throws ValidationError on short input.
std::uint32_t randomValueFromBytes(const std::vector<std::uint8_t>& bytes);

MatchOutcome resolveOutcome(const std::string& matchId,
                            const OutcomeParams& params,
                            std::uint32_t randomValue,
                            std::string nonce);

RandomEventResult resolveRandomEvent(const RandomEventParams& params, std::uint32_t randomValue);

/**
 * Deterministic Fisher-Yates permutation driven by a linear congruential
 * generator, walking from the end of the list. The same seed and input
 * always produce the same output, so published seeds can be replayed.
 */
template <typename T>
std::vector<T> resolveShuffle(std::vector<T> items, std::uint32_t seed) {
    std::uint64_t state = seed;
    for (std::size_t current = items.size(); current > 0; --current) {
        state = (state * 1103515245ULL + 12345ULL) % 2147483648ULL;
        const auto j = static_cast<std::size_t>(state % current);
        using std::swap;
        swap(items[current - 1], items[j]);
    }
    return items;
}

// sha256Hex("matchId:randomSeed:winner:nonce")
std::string computeVerificationHash(const std::string& matchId,
                                    std::uint32_t randomSeed,
                                    const std::string& winner,
                                    const std::string& nonce);
bool verifyOutcomeHash(const MatchOutcome& outcome);

// Account reference handed to the oracle for a request.
std::string deriveAccountRef(const std::string& requestId, const std::string& authority);

/**
 * Requests randomness from an oracle and turns fulfillments into match
 * outcomes, random events and shuffles. The host drives monitoring by
 * calling poll() (or run()); nothing is fulfilled before the minimum
 * resolution delay and every request fails once the maximum delay passes.
 */
class RandomnessResolver {
public:
    RandomnessResolver(ResolverConfig config,
                       OraclePtr oracle,
                       ClockPtr clock,
                       std::shared_ptr<AuditChain> audit = nullptr);

    // Throws ValidationError when the match already has an outcome or a
    // pending outcome request.
    std::string requestOutcome(const std::string& matchId,
                               const std::string& requesterId,
                               const OutcomeParams& params);
    std::string requestRandomEvent(const std::string& matchId,
                                   const std::string& eventType,
                                   double probability);
    std::string requestShuffle(const std::string& matchId,
                               const std::string& requesterId,
                               std::vector<std::string> items);

    // One monitoring pass over pending requests. Returns how many requests
    // reached a terminal state.
    std::size_t poll();
    void run(const std::atomic<bool>& stop);

    // Polls until the request is terminal. Throws TimeoutError when it timed
    // out, ExternalServiceError for other failures.
    RandomnessRequest awaitResult(const std::string& requestId);

    // Only pending requests can be cancelled.
    bool cancelRequest(const std::string& requestId);

    std::optional<RandomnessRequest> getRequestStatus(const std::string& requestId) const;
    std::vector<std::string> pendingRequestIds() const;
    std::optional<MatchOutcome> getMatchOutcome(const std::string& matchId) const;
    bool verifyOutcome(const std::string& matchId, const std::string& verificationHash) const;

    ResolverStats getStats() const;
    // Drops terminal requests and outcomes older than the retention window.
    std::size_t cleanup();

    std::uint64_t subscribe(ResolverObserver observer);
    void unsubscribe(std::uint64_t token);

private:
    struct ResolverState {
        std::map<std::string, RandomnessRequest> requests;
        std::map<std::string, MatchOutcome> outcomes;
        std::map<std::uint64_t, ResolverObserver> observers;
        std::uint64_t nextToken = 1;
        std::uint64_t fulfilledCount = 0;
        std::uint64_t totalFulfillmentMs = 0;
    };

    std::string submit(RandomnessRequest request);
    void fulfill(RandomnessRequest& request, const std::vector<std::uint8_t>& bytes,
                 std::uint64_t now);
    void dispatch(const std::vector<ResolverEvent>& events);
    void recordAudit(const ResolverEvent& event);

    ResolverConfig config_;
    OraclePtr oracle_;
    ClockPtr clock_;
    std::shared_ptr<AuditChain> audit_;
    Logger logger_;

    mutable std::mutex mutex_;
    ResolverState state_;
};

} // namespace arb
