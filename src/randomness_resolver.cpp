#include "randomness_resolver.hpp"

#include "errors.hpp"
#include "event_signer.hpp"
#include "secure_memory.hpp"
#include "secure_random.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace arb {

namespace {

void validatePlayer(const PlayerStats& player, const char* label) {
    if (player.playerId.empty()) {
        throw ValidationError(std::string(label) + " id must not be empty");
    }
    if (!std::isfinite(player.score) || player.score < 0.0) {
        throw ValidationError(std::string(label) + " score must be a non-negative number");
    }
    if (!std::isfinite(player.confidence) || player.confidence < 0.0 ||
        player.confidence > 100.0) {
        throw ValidationError(std::string(label) + " confidence must lie in [0, 100]");
    }
}

void requireNonEmpty(const std::string& value, const char* what) {
    if (value.empty()) {
        throw ValidationError(std::string(what) + " must not be empty");
    }
}

bool isTerminal(const RandomnessRequest& request) {
    return request.status != RequestStatus::Pending;
}

std::uint64_t elapsedSince(std::uint64_t start, std::uint64_t now) {
    return now > start ? now - start : 0;
}

} // namespace

const char* toString(RequestType type) {
    switch (type) {
    case RequestType::Outcome:
        return "outcome";
    case RequestType::Shuffle:
        return "shuffle";
    case RequestType::RandomEvent:
        return "random_event";
    }
    return "unknown";
}

const char* toString(RequestStatus status) {
    switch (status) {
    case RequestStatus::Pending:
        return "pending";
    case RequestStatus::Fulfilled:
        return "fulfilled";
    case RequestStatus::Failed:
        return "failed";
    }
    return "unknown";
}

const char* toString(FailureCause cause) {
    switch (cause) {
    case FailureCause::None:
        return "none";
    case FailureCause::SubmissionFailed:
        return "submission_failed";
    case FailureCause::Timeout:
        return "timeout";
    case FailureCause::ComputationFailed:
        return "computation_failed";
    case FailureCause::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

const char* toString(OutcomeMethod method) {
    switch (method) {
    case OutcomeMethod::Decision:
        return "decision";
    case OutcomeMethod::Timeout:
        return "timeout";
    case OutcomeMethod::Forfeit:
        return "forfeit";
    }
    return "unknown";
}

const char* toString(ResolverEventKind kind) {
    switch (kind) {
    case ResolverEventKind::Requested:
        return "vrfRequested";
    case ResolverEventKind::Fulfilled:
        return "vrfFulfilled";
    case ResolverEventKind::Failed:
        return "vrfFailed";
    case ResolverEventKind::Timeout:
        return "vrfTimeout";
    case ResolverEventKind::Cancelled:
        return "vrfCancelled";
    }
    return "unknown";
}

std::uint32_t randomValueFromBytes(const std::vector<std::uint8_t>& bytes) {
    if (bytes.size() < 4) {
        throw ValidationError("randomness fulfillment shorter than 4 bytes");
    }
    std::uint32_t value = 0;
    for (std::size_t i = 0; i < 4; ++i) {
        value = (value << 8) | bytes[i];
    }
    return value;
}

MatchOutcome resolveOutcome(const std::string& matchId,
                            const OutcomeParams& params,
                            std::uint32_t randomValue,
                            std::string nonce) {
    const double total1 = params.player1.score * (1.0 + params.player1.confidence / 100.0);
    const double total2 = params.player2.score * (1.0 + params.player2.confidence / 100.0);
    const double combined = total1 + total2;
    const double player1Probability = combined > 0.0 ? total1 / combined : 0.5;
    const double normalized = static_cast<double>(randomValue % 1'000'000U) / 1'000'000.0;

    const bool player1Wins = normalized < player1Probability;
    const double larger = std::max(total1, total2);
    double confidence = 50.0;
    if (larger > 0.0) {
        confidence = std::clamp(50.0 + 45.0 * std::fabs(total1 - total2) / larger, 50.0, 95.0);
    }

    MatchOutcome outcome;
    outcome.matchId = matchId;
    outcome.winner = player1Wins ? params.player1.playerId : params.player2.playerId;
    outcome.loser = player1Wins ? params.player2.playerId : params.player1.playerId;
    outcome.method = OutcomeMethod::Decision;
    outcome.confidence = confidence;
    outcome.randomSeed = randomValue;
    outcome.nonce = std::move(nonce);
    outcome.verificationHash =
        computeVerificationHash(matchId, randomValue, outcome.winner, outcome.nonce);
    return outcome;
}

RandomEventResult resolveRandomEvent(const RandomEventParams& params, std::uint32_t randomValue) {
    RandomEventResult result;
    result.eventType = params.eventType;
    result.randomSeed = randomValue;
    const auto percent = static_cast<double>(randomValue % 100U);
    result.triggered = percent < params.probability;
    if (result.triggered) {
        result.value = randomValue % 1000U;
    }
    return result;
}

std::string computeVerificationHash(const std::string& matchId,
                                    std::uint32_t randomSeed,
                                    const std::string& winner,
                                    const std::string& nonce) {
    std::ostringstream oss;
    oss << matchId << ':' << randomSeed << ':' << winner << ':' << nonce;
    return sha256Hex(oss.str());
}

bool verifyOutcomeHash(const MatchOutcome& outcome) {
    return secureEquals(
        computeVerificationHash(outcome.matchId, outcome.randomSeed, outcome.winner, outcome.nonce),
        outcome.verificationHash);
}

std::string deriveAccountRef(const std::string& requestId, const std::string& authority) {
    return sha256Hex("VrfAccountData|" + requestId + "|" + authority);
}

RandomnessResolver::RandomnessResolver(ResolverConfig config,
                                       OraclePtr oracle,
                                       ClockPtr clock,
                                       std::shared_ptr<AuditChain> audit)
    : config_(std::move(config))
    , oracle_(std::move(oracle))
    , clock_(std::move(clock))
    , audit_(std::move(audit))
    , logger_(createLogger("resolver")) {
    config_.validate();
    if (!oracle_ || !clock_) {
        throw std::invalid_argument("RandomnessResolver requires an oracle and a clock");
    }
}

std::string RandomnessResolver::requestOutcome(const std::string& matchId,
                                               const std::string& requesterId,
                                               const OutcomeParams& params) {
    requireNonEmpty(matchId, "match id");
    requireNonEmpty(requesterId, "requester id");
    validatePlayer(params.player1, "player1");
    validatePlayer(params.player2, "player2");
    if (params.player1.playerId == params.player2.playerId) {
        throw ValidationError("outcome participants must be distinct");
    }

    RandomnessRequest request;
    request.matchId = matchId;
    request.requesterId = requesterId;
    request.type = RequestType::Outcome;
    request.params = params;
    return submit(std::move(request));
}

std::string RandomnessResolver::requestRandomEvent(const std::string& matchId,
                                                   const std::string& eventType,
                                                   double probability) {
    requireNonEmpty(matchId, "match id");
    requireNonEmpty(eventType, "event type");
    if (!std::isfinite(probability) || probability < 0.0 || probability > 100.0) {
        throw ValidationError("event probability must lie in [0, 100]");
    }

    RandomnessRequest request;
    request.matchId = matchId;
    request.requesterId = "system";
    request.type = RequestType::RandomEvent;
    request.params = RandomEventParams{eventType, probability};
    return submit(std::move(request));
}

std::string RandomnessResolver::requestShuffle(const std::string& matchId,
                                               const std::string& requesterId,
                                               std::vector<std::string> items) {
    requireNonEmpty(matchId, "match id");
    requireNonEmpty(requesterId, "requester id");
    if (items.empty()) {
        throw ValidationError("shuffle requires at least one item");
    }

    RandomnessRequest request;
    request.matchId = matchId;
    request.requesterId = requesterId;
    request.type = RequestType::Shuffle;
    request.params = ShuffleParams{std::move(items)};
    return submit(std::move(request));
}

std::string RandomnessResolver::submit(RandomnessRequest request) {
    const auto now = clock_->nowMillis();
    request.id = makeEntityId("vrf", now);
    request.createdAt = now;
    request.accountRef = deriveAccountRef(request.id, config_.vrfAuthority);
    const auto id = request.id;
    const auto accountRef = request.accountRef;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (request.type == RequestType::Outcome) {
            // A match outcome is created once and never replaced.
            if (state_.outcomes.count(request.matchId) > 0) {
                throw ValidationError("match " + request.matchId + " already has an outcome");
            }
            for (const auto& entry : state_.requests) {
                const auto& other = entry.second;
                if (other.type == RequestType::Outcome && other.matchId == request.matchId &&
                    !isTerminal(other)) {
                    throw ValidationError("match " + request.matchId +
                                          " already has a pending outcome request " + other.id);
                }
            }
        }
        state_.requests.emplace(id, std::move(request));
    }

    std::string txId;
    try {
        txId = oracle_->submitRandomnessRequest(accountRef);
    } catch (const std::exception& e) {
        RandomnessRequest snapshot;
        bool cancelled = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto& stored = state_.requests.at(id);
            cancelled = isTerminal(stored);
        }
        if (cancelled) {
            logger_->warn("randomness submission failed for cancelled request {}: {}", id, e.what());
            throw ExternalServiceError("randomness submission failed for " + id + ": " + e.what());
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto& stored = state_.requests.at(id);
            stored.status = RequestStatus::Failed;
            stored.failureCause = FailureCause::SubmissionFailed;
            stored.failureReason = e.what();
            stored.completedAt = clock_->nowMillis();
            snapshot = stored;
        }
        logger_->warn("randomness submission failed for {}: {}", id, e.what());
        dispatch({ResolverEvent{ResolverEventKind::Failed, std::move(snapshot)}});
        throw ExternalServiceError("randomness submission failed for " + id + ": " + e.what());
    }

    RandomnessRequest snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& stored = state_.requests.at(id);
        stored.txId = txId;
        snapshot = stored;
    }
    if (isTerminal(snapshot)) {
        logger_->info("randomness {} was cancelled during submission (tx {})", id, txId);
        return id;
    }
    logger_->info("requested {} randomness {} for match {} (tx {})", toString(snapshot.type), id,
                  snapshot.matchId, txId);
    dispatch({ResolverEvent{ResolverEventKind::Requested, std::move(snapshot)}});
    return id;
}

void RandomnessResolver::fulfill(RandomnessRequest& request,
                                 const std::vector<std::uint8_t>& bytes,
                                 std::uint64_t now) {
    const auto randomValue = randomValueFromBytes(bytes);

    std::optional<MatchOutcome> outcome;
    if (const auto* params = std::get_if<OutcomeParams>(&request.params)) {
        if (state_.outcomes.count(request.matchId) > 0) {
            throw std::logic_error("match " + request.matchId + " already has an outcome");
        }
        outcome = resolveOutcome(request.matchId, *params, randomValue, secureRandomHex(16));
        outcome->resolvedAt = now;
        request.result = *outcome;
    } else if (const auto* params = std::get_if<RandomEventParams>(&request.params)) {
        request.result = resolveRandomEvent(*params, randomValue);
    } else if (const auto* params = std::get_if<ShuffleParams>(&request.params)) {
        request.result = ShuffleResult{resolveShuffle(params->items, randomValue), randomValue};
    } else {
        throw std::logic_error("randomness request carries no parameters");
    }

    request.status = RequestStatus::Fulfilled;
    request.completedAt = now;
    if (outcome) {
        state_.outcomes.emplace(request.matchId, std::move(*outcome));
    }
    ++state_.fulfilledCount;
    state_.totalFulfillmentMs += elapsedSince(request.createdAt, now);
}

std::size_t RandomnessResolver::poll() {
    const auto now = clock_->nowMillis();
    std::vector<ResolverEvent> events;
    std::vector<std::pair<std::string, std::string>> due;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [id, request] : state_.requests) {
            if (isTerminal(request) || !request.txId) {
                continue;
            }
            const auto elapsed = elapsedSince(request.createdAt, now);
            if (elapsed > config_.maxResolutionDelayMs) {
                request.status = RequestStatus::Failed;
                request.failureCause = FailureCause::Timeout;
                request.failureReason = "randomness not fulfilled within " +
                                        std::to_string(config_.maxResolutionDelayMs) + " ms";
                request.completedAt = now;
                events.push_back(ResolverEvent{ResolverEventKind::Timeout, request});
                continue;
            }
            if (elapsed < config_.minResolutionDelayMs) {
                continue;
            }
            due.emplace_back(id, request.accountRef);
        }
    }

    for (const auto& [id, accountRef] : due) {
        std::optional<std::vector<std::uint8_t>> bytes;
        try {
            bytes = oracle_->pollFulfillment(accountRef);
        } catch (const std::exception& e) {
            logger_->warn("oracle poll failed for {}, retrying next pass: {}", id, e.what());
            continue;
        }
        if (!bytes) {
            logger_->debug("randomness {} not yet available", id);
            continue;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        auto it = state_.requests.find(id);
        if (it == state_.requests.end() || isTerminal(it->second)) {
            continue;
        }
        auto& request = it->second;
        try {
            fulfill(request, *bytes, now);
            events.push_back(ResolverEvent{ResolverEventKind::Fulfilled, request});
        } catch (const std::exception& e) {
            request.status = RequestStatus::Failed;
            request.failureCause = FailureCause::ComputationFailed;
            request.failureReason = e.what();
            request.completedAt = now;
            events.push_back(ResolverEvent{ResolverEventKind::Failed, request});
        }
    }

    for (const auto& event : events) {
        switch (event.kind) {
        case ResolverEventKind::Fulfilled:
            logger_->info("randomness {} fulfilled after {} ms", event.request.id,
                          elapsedSince(event.request.createdAt, now));
            break;
        case ResolverEventKind::Timeout:
            logger_->warn("randomness {} timed out", event.request.id);
            break;
        default:
            logger_->error("randomness {} failed: {}", event.request.id,
                           event.request.failureReason);
            break;
        }
    }

    dispatch(events);
    return events.size();
}

void RandomnessResolver::run(const std::atomic<bool>& stop) {
    while (!stop.load()) {
        poll();
        std::this_thread::sleep_for(std::chrono::milliseconds(config_.pollIntervalMs));
    }
}

RandomnessRequest RandomnessResolver::awaitResult(const std::string& requestId) {
    while (true) {
        auto request = getRequestStatus(requestId);
        if (!request) {
            throw ValidationError("unknown randomness request " + requestId);
        }
        if (request->status == RequestStatus::Fulfilled) {
            return *request;
        }
        if (request->status == RequestStatus::Failed) {
            if (request->failureCause == FailureCause::Timeout) {
                throw TimeoutError("randomness request " + requestId + " timed out");
            }
            throw ExternalServiceError("randomness request " + requestId + " failed: " +
                                       request->failureReason);
        }
        if (poll() == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(config_.pollIntervalMs));
        }
    }
}

bool RandomnessResolver::cancelRequest(const std::string& requestId) {
    RandomnessRequest snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = state_.requests.find(requestId);
        if (it == state_.requests.end() || isTerminal(it->second)) {
            return false;
        }
        auto& request = it->second;
        request.status = RequestStatus::Failed;
        request.failureCause = FailureCause::Cancelled;
        request.failureReason = "cancelled";
        request.completedAt = clock_->nowMillis();
        snapshot = request;
    }
    logger_->info("randomness {} cancelled", requestId);
    dispatch({ResolverEvent{ResolverEventKind::Cancelled, std::move(snapshot)}});
    return true;
}

std::optional<RandomnessRequest> RandomnessResolver::getRequestStatus(const std::string& requestId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = state_.requests.find(requestId);
    if (it == state_.requests.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> RandomnessResolver::pendingRequestIds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    for (const auto& [id, request] : state_.requests) {
        if (!isTerminal(request)) {
            ids.push_back(id);
        }
    }
    return ids;
}

std::optional<MatchOutcome> RandomnessResolver::getMatchOutcome(const std::string& matchId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = state_.outcomes.find(matchId);
    if (it == state_.outcomes.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool RandomnessResolver::verifyOutcome(const std::string& matchId,
                                       const std::string& verificationHash) const {
    auto outcome = getMatchOutcome(matchId);
    if (!outcome) {
        return false;
    }
    return verifyOutcomeHash(*outcome) && secureEquals(outcome->verificationHash, verificationHash);
}

ResolverStats RandomnessResolver::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    ResolverStats stats;
    stats.totalRequests = state_.requests.size();
    for (const auto& [id, request] : state_.requests) {
        switch (request.status) {
        case RequestStatus::Pending:
            ++stats.pendingRequests;
            break;
        case RequestStatus::Fulfilled:
            ++stats.fulfilledRequests;
            break;
        case RequestStatus::Failed:
            ++stats.failedRequests;
            break;
        }
    }
    const auto terminal = stats.fulfilledRequests + stats.failedRequests;
    if (terminal > 0) {
        stats.successRate =
            static_cast<double>(stats.fulfilledRequests) / static_cast<double>(terminal);
    }
    if (state_.fulfilledCount > 0) {
        stats.averageFulfillmentMs = static_cast<double>(state_.totalFulfillmentMs) /
                                     static_cast<double>(state_.fulfilledCount);
    }
    stats.activeOutcomes = state_.outcomes.size();
    return stats;
}

std::size_t RandomnessResolver::cleanup() {
    const auto now = clock_->nowMillis();
    const auto retention = config_.requestRetentionMs;
    std::size_t removed = 0;

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = state_.requests.begin(); it != state_.requests.end();) {
        const auto& request = it->second;
        if (isTerminal(request) && request.completedAt &&
            elapsedSince(*request.completedAt, now) > retention) {
            it = state_.requests.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    for (auto it = state_.outcomes.begin(); it != state_.outcomes.end();) {
        if (elapsedSince(it->second.resolvedAt, now) > retention) {
            it = state_.outcomes.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    if (removed > 0) {
        logger_->debug("cleaned up {} resolver records", removed);
    }
    return removed;
}

std::uint64_t RandomnessResolver::subscribe(ResolverObserver observer) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto token = state_.nextToken++;
    state_.observers.emplace(token, std::move(observer));
    return token;
}

void RandomnessResolver::unsubscribe(std::uint64_t token) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.observers.erase(token);
}

void RandomnessResolver::dispatch(const std::vector<ResolverEvent>& events) {
    if (events.empty()) {
        return;
    }
    std::vector<ResolverObserver> observers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        observers.reserve(state_.observers.size());
        for (const auto& [token, observer] : state_.observers) {
            observers.push_back(observer);
        }
    }

    for (const auto& event : events) {
        recordAudit(event);
        for (const auto& observer : observers) {
            try {
                observer(event);
            } catch (const std::exception& e) {
                logger_->error("observer failed handling {} for {}: {}", toString(event.kind),
                               event.request.id, e.what());
            }
        }
    }
}

void RandomnessResolver::recordAudit(const ResolverEvent& event) {
    if (!audit_) {
        return;
    }
    const auto& request = event.request;

    SystemRecord record;
    record.eventType = toString(event.kind);
    record.component = "randomness_resolver";
    record.subjectId = request.id;
    record.matchId = request.matchId;
    record.description = std::string(toString(request.type)) + " request " + toString(request.status);
    record.details["requestType"] = toString(request.type);
    record.details["requesterId"] = request.requesterId;
    record.details["accountRef"] = request.accountRef;
    record.details["txId"] = request.txId.value_or("");
    if (request.failureCause != FailureCause::None) {
        record.details["failureCause"] = toString(request.failureCause);
        record.details["failureReason"] = request.failureReason;
    }
    if (request.result) {
        if (const auto* outcome = std::get_if<MatchOutcome>(&*request.result)) {
            record.details["winner"] = outcome->winner;
            record.details["randomSeed"] = std::to_string(outcome->randomSeed);
            record.details["verificationHash"] = outcome->verificationHash;
        } else if (const auto* randomEvent = std::get_if<RandomEventResult>(&*request.result)) {
            record.details["triggered"] = randomEvent->triggered ? "true" : "false";
            record.details["randomSeed"] = std::to_string(randomEvent->randomSeed);
        } else if (const auto* shuffle = std::get_if<ShuffleResult>(&*request.result)) {
            record.details["randomSeed"] = std::to_string(shuffle->randomSeed);
        }
    }

    try {
        audit_->logSystemEvent(record);
    } catch (const std::exception& e) {
        logger_->error("failed to audit {} for {}: {}", record.eventType, request.id, e.what());
    }
}

} // namespace arb
