#include "bracket_engine.hpp"

#include "errors.hpp"
#include "secure_random.hpp"
#include "tournament_codec.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>

namespace arb {

namespace {

constexpr char kTieBreakRequester[] = "bracket_engine";

// Pool service failures surface as ExternalServiceError whatever the
// implementation throws.
template <typename Fn>
auto callPoolService(const std::string& what, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const ExternalServiceError&) {
        throw;
    } catch (const std::exception& e) {
        throw ExternalServiceError(what + ": " + e.what());
    }
}

BracketMatch& requireMatch(Tournament& tournament, const std::string& matchId) {
    auto* match = tournament.findMatch(matchId);
    if (!match) {
        throw ValidationError("unknown match " + matchId + " in tournament " + tournament.id);
    }
    return *match;
}

std::uint32_t firstOpenRound(const Tournament& tournament) {
    for (const auto& round : tournament.rounds) {
        for (const auto& match : round.matches) {
            if (match.status != MatchStatus::Completed) {
                return round.roundNumber;
            }
        }
    }
    return tournament.totalRounds;
}

Fixed64 sumBets(const std::map<std::string, std::vector<LiveBet>>& liveBets,
                bool payoutsOnly) {
    Fixed64 total;
    for (const auto& entry : liveBets) {
        for (const auto& bet : entry.second) {
            total += payoutsOnly ? bet.payout : bet.betAmount;
        }
    }
    return total;
}

} // namespace

BracketEngine::BracketEngine(TournamentConfig config,
                             PoolServicePtr pools,
                             TournamentStorePtr store,
                             ClockPtr clock,
                             std::shared_ptr<AuditChain> audit,
                             std::shared_ptr<RandomnessResolver> resolver)
    : config_(std::move(config))
    , pools_(std::move(pools))
    , store_(std::move(store))
    , clock_(std::move(clock))
    , audit_(std::move(audit))
    , resolver_(std::move(resolver))
    , logger_(createLogger("tournament")) {
    if (!pools_ || !store_ || !clock_) {
        throw std::invalid_argument("BracketEngine requires a pool service, a store and a clock");
    }
    config_.validate();
    if (resolver_) {
        observerGate_ = std::make_shared<ObserverGate>();
        observerGate_->engine = this;
        observerToken_ = resolver_->subscribe([gate = observerGate_](const ResolverEvent& event) {
            std::lock_guard<std::mutex> lock(gate->mutex);
            if (gate->engine) {
                gate->engine->onResolverEvent(event);
            }
        });
    }
}

BracketEngine::~BracketEngine() {
    if (resolver_) {
        resolver_->unsubscribe(observerToken_);
        std::lock_guard<std::mutex> lock(observerGate_->mutex);
        observerGate_->engine = nullptr;
    }
}

std::shared_ptr<BracketEngine::TournamentSlot>
BracketEngine::slotFor(const std::string& tournamentId) const {
    std::lock_guard<std::mutex> lock(registryMutex_);
    auto& slot = slots_[tournamentId];
    if (!slot) {
        slot = std::make_shared<TournamentSlot>();
    }
    return slot;
}

std::shared_ptr<BracketEngine::TournamentSlot>
BracketEngine::findSlot(const std::string& tournamentId) const {
    {
        std::lock_guard<std::mutex> lock(registryMutex_);
        auto it = slots_.find(tournamentId);
        if (it != slots_.end()) {
            return it->second;
        }
    }
    if (!store_->load(tournamentId)) {
        return nullptr;
    }
    return slotFor(tournamentId);
}

std::shared_ptr<BracketEngine::TournamentSlot>
BracketEngine::requireSlot(const std::string& tournamentId) const {
    auto slot = findSlot(tournamentId);
    if (!slot) {
        throw ValidationError("unknown tournament " + tournamentId);
    }
    return slot;
}

const Tournament& BracketEngine::loadLocked(TournamentSlot& slot,
                                            const std::string& tournamentId) const {
    if (!slot.tournament) {
        auto stored = store_->load(tournamentId);
        if (!stored) {
            throw ValidationError("unknown tournament " + tournamentId);
        }
        Tournament tournament = deserializeTournament(stored->document);
        if (tournament.version != stored->version) {
            throw IntegrityError("stored tournament " + tournamentId +
                                 " disagrees with its document version");
        }
        slot.tournament = std::move(tournament);
    }
    return *slot.tournament;
}

void BracketEngine::commitLocked(TournamentSlot& slot, Tournament next) {
    const std::uint64_t expected = slot.tournament ? slot.tournament->version : 0;
    next.version = expected + 1;
    store_->save(next.id, serializeTournament(next), expected);
    slot.tournament = std::move(next);
}

void BracketEngine::emit(const AuditBatch& batch) {
    if (!audit_) {
        return;
    }
    // Committed state stands; audit failures are logged.
    try {
        for (const auto& record : batch.bets) {
            audit_->logBet(record);
        }
        for (const auto& record : batch.payouts) {
            audit_->logPayout(record);
        }
        for (const auto& record : batch.events) {
            audit_->logSystemEvent(record);
        }
    } catch (const std::exception& e) {
        logger_->error("failed to audit tournament activity: {}", e.what());
    }
}

std::string BracketEngine::createMatchPool(const Tournament& tournament,
                                           const BracketMatch& match,
                                           std::uint64_t closesAt) {
    PoolSpec spec;
    spec.tournamentId = tournament.id;
    spec.matchId = match.id;
    spec.outcomes = {match.participant1.id, match.participant2.id};
    spec.initialOdds = Fixed64::fromDouble(config_.baseLiveOdds);
    spec.closesAt = closesAt;
    return callPoolService("creating pool for " + match.id,
                           [&] { return pools_->createPool(spec); });
}

Tournament BracketEngine::createTournament(const TournamentSpec& spec) {
    if (spec.id.empty()) {
        throw ValidationError("tournament id must not be empty");
    }
    const auto n = spec.participants.size();
    if (n < config_.minBracketSize || n > config_.maxBracketSize) {
        throw ValidationError("tournament needs between " + std::to_string(config_.minBracketSize) +
                              " and " + std::to_string(config_.maxBracketSize) +
                              " participants, got " + std::to_string(n));
    }
    std::set<std::string> seen;
    for (const auto& participant : spec.participants) {
        if (participant.id.empty() || participant.isBye || participant.isPlaceholder()) {
            throw ValidationError("participant ids must be real and non-empty");
        }
        if (participant.id.rfind("bye_", 0) == 0) {
            throw ValidationError("participant id " + participant.id + " is reserved");
        }
        if (!seen.insert(participant.id).second) {
            throw ValidationError("duplicate participant " + participant.id);
        }
    }

    const auto now = clock_->nowMillis();
    Tournament tournament;
    tournament.id = spec.id;
    tournament.name = spec.name;
    tournament.scheme = spec.scheme;
    tournament.participants = spec.participants;
    tournament.rounds = buildBracket(spec.scheme, spec.participants, config_, now);
    tournament.createdAt = now;
    tournament.startsAt = spec.startsAt;
    tournament.bracketLockTime = spec.startsAt > config_.bracketBettingClosureMs
                                     ? spec.startsAt - config_.bracketBettingClosureMs
                                     : 0;
    tournament.totalRounds = static_cast<std::uint32_t>(tournament.rounds.size());
    tournament.currentRound = firstOpenRound(tournament);

    auto slot = slotFor(spec.id);
    std::lock_guard<std::mutex> lock(slot->mutex);
    if (slot->tournament || store_->load(spec.id)) {
        throw ValidationError("tournament " + spec.id + " already exists");
    }

    for (auto& round : tournament.rounds) {
        for (auto& match : round.matches) {
            if (match.hasBothParticipants() && !match.isByeMatch()) {
                const auto poolId = createMatchPool(tournament, match, tournament.bracketLockTime);
                match.bettingPoolId = poolId;
                tournament.bettingPools[poolId] = match.id;
            }
        }
    }

    commitLocked(*slot, tournament);
    const Tournament created = *slot->tournament;

    logger_->info("created tournament {} ({} participants, {} rounds, {} pools)", created.id,
                  created.participants.size(), created.totalRounds, created.bettingPools.size());

    AuditBatch batch;
    SystemRecord record;
    record.eventType = "tournament_created";
    record.component = "bracket_engine";
    record.subjectId = created.id;
    record.description = created.name;
    record.details["participants"] = std::to_string(created.participants.size());
    record.details["rounds"] = std::to_string(created.totalRounds);
    record.details["bracketLockTime"] = std::to_string(created.bracketLockTime);
    batch.events.push_back(std::move(record));
    emit(batch);
    return created;
}

BracketBet BracketEngine::placeBracketBet(const std::string& userId,
                                          const std::string& tournamentId,
                                          const std::map<std::string, std::string>& predictions,
                                          Fixed64 amount) {
    if (userId.empty()) {
        throw ValidationError("user id must not be empty");
    }
    if (!amount.isPositive()) {
        throw ValidationError("bracket bet amount must be positive");
    }

    auto slot = requireSlot(tournamentId);
    std::lock_guard<std::mutex> lock(slot->mutex);
    const auto& current = loadLocked(*slot, tournamentId);
    const auto now = clock_->nowMillis();

    if (current.status != TournamentStatus::Open || now >= current.bracketLockTime) {
        throw ValidationError("bracket betting is closed for tournament " + tournamentId);
    }
    if (current.bracketBets.count(userId) != 0) {
        throw ValidationError("user " + userId + " already holds a bracket bet on " + tournamentId);
    }
    for (const auto& prediction : predictions) {
        if (!current.findMatch(prediction.first)) {
            throw ValidationError("prediction for unknown match " + prediction.first);
        }
    }
    for (const auto& round : current.rounds) {
        for (const auto& match : round.matches) {
            auto it = predictions.find(match.id);
            if (it == predictions.end()) {
                throw ValidationError("missing prediction for match " + match.id);
            }
            const auto picks = eligiblePicks(current.rounds, match, predictions);
            if (std::find(picks.begin(), picks.end(), it->second) == picks.end()) {
                throw ValidationError("invalid prediction " + it->second + " for match " +
                                      match.id);
            }
        }
    }

    BracketBet bet;
    bet.id = makeEntityId("bracket", now);
    bet.userId = userId;
    bet.tournamentId = tournamentId;
    bet.predictions = predictions;
    bet.betAmount = amount;
    bet.potentialPayout = amount * config_.bracketBonusMultiplier;
    bet.placedAt = now;

    Tournament next = current;
    next.bracketBets[userId] = bet;
    next.prizePool.total += amount;
    next.prizePool.bracketPool += amount;
    commitLocked(*slot, std::move(next));

    logger_->debug("bracket bet {} by {} on {}", bet.id, userId, tournamentId);

    AuditBatch batch;
    BetRecord record;
    record.userId = userId;
    record.betType = "bracket";
    record.amount = amount;
    record.potentialPayout = bet.potentialPayout;
    record.odds = config_.bracketBonusMultiplier;
    record.tournamentId = tournamentId;
    batch.bets.push_back(std::move(record));
    emit(batch);
    return bet;
}

void BracketEngine::lockTournament(const std::string& tournamentId) {
    auto slot = requireSlot(tournamentId);
    std::lock_guard<std::mutex> lock(slot->mutex);
    const auto& current = loadLocked(*slot, tournamentId);
    if (current.status != TournamentStatus::Open) {
        throw ValidationError("tournament " + tournamentId + " is " + toString(current.status) +
                              ", not open");
    }
    Tournament next = current;
    next.status = TournamentStatus::Locked;
    commitLocked(*slot, std::move(next));
    logger_->info("locked tournament {}", tournamentId);
}

BracketMatch BracketEngine::startMatch(const std::string& tournamentId,
                                       const std::string& matchId) {
    auto slot = requireSlot(tournamentId);
    std::lock_guard<std::mutex> lock(slot->mutex);
    Tournament next = loadLocked(*slot, tournamentId);
    if (next.status == TournamentStatus::Completed) {
        throw ValidationError("tournament " + tournamentId + " is completed");
    }
    auto& match = requireMatch(next, matchId);
    if (match.status != MatchStatus::Scheduled) {
        throw ValidationError("match " + matchId + " is " + toString(match.status));
    }
    if (!match.hasBothParticipants() || match.isByeMatch()) {
        throw ValidationError("match " + matchId + " has no opponents yet");
    }

    const auto now = clock_->nowMillis();
    match.status = MatchStatus::Live;
    match.startedAt = now;
    MatchState state;
    state.matchId = matchId;
    state.participant1.participantId = match.participant1.id;
    state.participant2.participantId = match.participant2.id;
    state.updatedAt = now;
    match.odds = computeLiveOdds(state, config_);
    match.liveState = state;
    const BracketMatch started = match;

    next.status = TournamentStatus::Active;
    commitLocked(*slot, std::move(next));
    logger_->info("match {} of {} is live", matchId, tournamentId);
    return started;
}

std::map<std::string, Fixed64> BracketEngine::updateMatchState(const std::string& tournamentId,
                                                               const MatchState& state) {
    auto slot = requireSlot(tournamentId);
    std::lock_guard<std::mutex> lock(slot->mutex);
    Tournament next = loadLocked(*slot, tournamentId);
    auto& match = requireMatch(next, state.matchId);
    if (match.status != MatchStatus::Live) {
        throw ValidationError("match " + state.matchId + " is not live");
    }
    if (state.participant1.participantId != match.participant1.id ||
        state.participant2.participantId != match.participant2.id) {
        throw ValidationError("match state participants do not match " + state.matchId);
    }

    MatchState recorded = state;
    recorded.updatedAt = clock_->nowMillis();
    match.liveState = recorded;
    match.odds = computeLiveOdds(recorded, config_);
    auto odds = match.odds;
    commitLocked(*slot, std::move(next));
    return odds;
}

LiveBet BracketEngine::placeLiveBet(const std::string& userId,
                                    const std::string& tournamentId,
                                    const std::string& matchId,
                                    const std::string& outcomeId,
                                    Fixed64 amount) {
    if (!config_.liveBettingEnabled) {
        throw ValidationError("live betting is disabled");
    }
    if (userId.empty()) {
        throw ValidationError("user id must not be empty");
    }
    if (!amount.isPositive() || amount > config_.maxLiveBetAmount) {
        throw ValidationError("live bet amount must lie in (0, " +
                              config_.maxLiveBetAmount.toString() + "]");
    }

    auto slot = requireSlot(tournamentId);
    std::lock_guard<std::mutex> lock(slot->mutex);
    Tournament next = loadLocked(*slot, tournamentId);
    const auto& match = requireMatch(next, matchId);
    if (match.status != MatchStatus::Live || !match.liveState) {
        throw ValidationError("match " + matchId + " is not live");
    }
    if (!match.involves(outcomeId)) {
        throw ValidationError(outcomeId + " is not playing in match " + matchId);
    }

    const auto odds = computeLiveOdds(*match.liveState, config_);
    const auto now = clock_->nowMillis();

    LiveBet bet;
    bet.id = makeEntityId("live", now);
    bet.userId = userId;
    bet.tournamentId = tournamentId;
    bet.matchId = matchId;
    bet.outcomeId = outcomeId;
    bet.betAmount = amount;
    bet.odds = odds.at(outcomeId);
    bet.potentialPayout = amount * bet.odds;
    bet.placedAt = now;
    bet.matchState = *match.liveState;
    const auto roundNumber = match.roundNumber;

    next.liveBets[matchId].push_back(bet);
    next.prizePool.total += amount;
    commitLocked(*slot, std::move(next));

    logger_->debug("live bet {} by {} on {} at {}", bet.id, userId, outcomeId,
                   bet.odds.toString());

    AuditBatch batch;
    BetRecord record;
    record.userId = userId;
    record.betType = "live";
    record.outcomeId = outcomeId;
    record.amount = amount;
    record.odds = bet.odds;
    record.potentialPayout = bet.potentialPayout;
    record.matchId = matchId;
    record.tournamentId = tournamentId;
    record.roundNumber = roundNumber;
    batch.bets.push_back(std::move(record));
    emit(batch);
    return bet;
}

MatchResultSummary BracketEngine::updateMatchResult(const std::string& tournamentId,
                                                    const std::string& matchId,
                                                    const std::string& winnerId,
                                                    MatchData matchData) {
    auto slot = requireSlot(tournamentId);
    std::lock_guard<std::mutex> lock(slot->mutex);
    Tournament next = loadLocked(*slot, tournamentId);
    if (next.status == TournamentStatus::Completed) {
        throw ValidationError("tournament " + tournamentId + " is completed");
    }
    auto& match = requireMatch(next, matchId);
    if (match.status == MatchStatus::Completed) {
        throw ValidationError("match " + matchId + " already has a result");
    }
    if (!match.hasBothParticipants()) {
        throw ValidationError("match " + matchId + " has no opponents yet");
    }
    if (!match.involves(winnerId) || winnerId.rfind("bye_", 0) == 0) {
        throw ValidationError(winnerId + " is not playing in match " + matchId);
    }

    const auto now = clock_->nowMillis();
    const Participant winner =
        match.participant1.id == winnerId ? match.participant1 : match.participant2;
    const std::string loserId =
        match.participant1.id == winnerId ? match.participant2.id : match.participant1.id;
    AuditBatch batch;

    MatchResultSummary summary;
    summary.tournamentId = tournamentId;
    summary.matchId = matchId;
    summary.winnerId = winnerId;
    summary.loserId = loserId;

    // (a) terminal match state
    match.winner = winnerId;
    match.status = MatchStatus::Completed;
    match.completedAt = now;
    match.matchData = matchData;
    next.results.matches[matchId] = MatchResult{winnerId, loserId, matchData, now};
    next.results.eliminations.push_back(loserId);
    next.status = TournamentStatus::Active;

    // (b) dedicated pool
    if (match.bettingPoolId) {
        const auto poolId = *match.bettingPoolId;
        auto settlement = callPoolService("settling pool " + poolId,
                                          [&] { return pools_->settlePool(poolId, winnerId); });
        next.prizePool.matchPools += settlement.distributable;
        next.prizePool.total += settlement.distributable;
        summary.poolSettlement = std::move(settlement);
    }

    // (c) live bets
    auto liveIt = next.liveBets.find(matchId);
    if (liveIt != next.liveBets.end()) {
        for (auto& bet : liveIt->second) {
            if (bet.status != LiveBetStatus::Active) {
                continue;
            }
            if (bet.outcomeId == winnerId) {
                bet.status = LiveBetStatus::Won;
                bet.payout = bet.betAmount * bet.odds;
                PayoutRecord record;
                record.userId = bet.userId;
                record.payoutType = "live";
                record.amount = bet.payout;
                record.originalBetAmount = bet.betAmount;
                record.odds = bet.odds;
                record.betId = bet.id;
                record.matchId = matchId;
                record.tournamentId = tournamentId;
                record.winningOutcome = winnerId;
                batch.payouts.push_back(std::move(record));
            } else {
                bet.status = LiveBetStatus::Lost;
                bet.payout = Fixed64();
            }
            summary.settledLiveBets.push_back(bet);
        }
    }

    // (d) bracket scoring
    for (auto& entry : next.bracketBets) {
        auto& bet = entry.second;
        if (bet.status != BracketBetStatus::Active) {
            continue;
        }
        auto prediction = bet.predictions.find(matchId);
        if (prediction == bet.predictions.end()) {
            continue;
        }
        if (prediction->second == winnerId) {
            ++bet.correctPredictions;
            bet.bonusMultiplier += config_.advancementBonusRate;
        } else {
            ++bet.incorrectPredictions;
        }
        bet.potentialPayout = bet.betAmount * config_.bracketBonusMultiplier *
                              bet.bonusMultiplier * bet.accuracyRate();
        ++summary.bracketBetsScored;
    }

    // (e) advancement
    const BracketMatch decided = match;
    if (auto* promoted = advanceWinner(next.rounds, decided, winner,
                                       Fixed64::fromDouble(config_.baseLiveOdds))) {
        if (promoted->hasBothParticipants() && !promoted->isByeMatch() &&
            !promoted->bettingPoolId) {
            const auto closesAt =
                std::max(next.bracketLockTime, now + config_.bracketBettingClosureMs);
            const auto poolId = createMatchPool(next, *promoted, closesAt);
            promoted->bettingPoolId = poolId;
            next.bettingPools[poolId] = promoted->id;
        }
    } else {
        next.results.winners.push_back(winnerId);
    }
    next.currentRound = firstOpenRound(next);

    // (f) completion
    if (next.allMatchesCompleted()) {
        next.status = TournamentStatus::Completed;
        next.completedAt = now;
        for (auto& entry : next.bracketBets) {
            auto& bet = entry.second;
            if (bet.incorrectPredictions == 0) {
                next.results.perfectBrackets.push_back(bet.id);
            }
            const Fixed64 accuracy = bet.accuracyRate();
            if (!accuracy.isPositive()) {
                bet.status = BracketBetStatus::Lost;
                bet.finalPayout = Fixed64();
                continue;
            }
            bet.finalPayout = Fixed64::min(
                bet.betAmount + bet.betAmount * bet.bonusMultiplier * accuracy,
                bet.potentialPayout);
            bet.status = BracketBetStatus::Settled;
            if (bet.finalPayout > bet.betAmount) {
                next.prizePool.bonusPool += bet.finalPayout - bet.betAmount;
            }
            next.results.payouts.push_back(
                BracketPayout{bet.userId, bet.id, bet.finalPayout, accuracy, bet.correctPredictions});

            PayoutRecord record;
            record.userId = bet.userId;
            record.payoutType = "bracket";
            record.amount = bet.finalPayout;
            record.originalBetAmount = bet.betAmount;
            record.odds = bet.bonusMultiplier;
            record.betId = bet.id;
            record.tournamentId = tournamentId;
            record.winningOutcome = winnerId;
            batch.payouts.push_back(std::move(record));
        }

        SystemRecord record;
        record.eventType = "tournament_completed";
        record.component = "bracket_engine";
        record.subjectId = tournamentId;
        record.matchId = matchId;
        record.description = "champion " + winnerId;
        record.details["perfectBrackets"] = std::to_string(next.results.perfectBrackets.size());
        record.details["bracketPayouts"] = std::to_string(next.results.payouts.size());
        batch.events.push_back(std::move(record));
    }

    summary.tournamentStatus = next.status;
    if (decided.roundNumber < next.rounds.size()) {
        summary.nextRoundMatches = next.rounds[decided.roundNumber].matches;
    }
    const bool completed = next.status == TournamentStatus::Completed;
    const auto perfect = next.results.perfectBrackets.size();
    commitLocked(*slot, std::move(next));

    logger_->info("{} won {} in {}", winnerId, matchId, tournamentId);
    if (completed) {
        logger_->info("tournament {} completed: champion {}, {} perfect bracket(s)", tournamentId,
                      winnerId, perfect);
    }
    emit(batch);
    return summary;
}

std::string BracketEngine::requestTieBreak(const std::string& tournamentId,
                                           const std::string& matchId,
                                           const PlayerStats& participant1,
                                           const PlayerStats& participant2) {
    if (!resolver_) {
        throw ValidationError("tie-breaks need a randomness resolver");
    }
    {
        auto slot = requireSlot(tournamentId);
        std::lock_guard<std::mutex> lock(slot->mutex);
        Tournament current = loadLocked(*slot, tournamentId);
        const auto& match = requireMatch(current, matchId);
        if (match.status == MatchStatus::Completed) {
            throw ValidationError("match " + matchId + " already has a result");
        }
        if (!match.hasBothParticipants() || match.isByeMatch()) {
            throw ValidationError("match " + matchId + " has no opponents yet");
        }
        const bool sameOrder = participant1.playerId == match.participant1.id &&
                               participant2.playerId == match.participant2.id;
        const bool swapped = participant1.playerId == match.participant2.id &&
                             participant2.playerId == match.participant1.id;
        if (!sameOrder && !swapped) {
            throw ValidationError("tie-break players do not match " + matchId);
        }
    }

    const auto requestId = resolver_->requestOutcome(tournamentId + ":" + matchId,
                                                     kTieBreakRequester,
                                                     OutcomeParams{participant1, participant2});
    {
        std::lock_guard<std::mutex> lock(tieBreakMutex_);
        tieBreaks_[requestId] = TieBreak{tournamentId, matchId};
    }
    logger_->info("tie-break {} requested for {} in {}", requestId, matchId, tournamentId);
    return requestId;
}

std::size_t BracketEngine::pendingTieBreaks() const {
    std::lock_guard<std::mutex> lock(tieBreakMutex_);
    return tieBreaks_.size();
}

void BracketEngine::onResolverEvent(const ResolverEvent& event) {
    if (event.kind == ResolverEventKind::Requested ||
        event.request.requesterId != kTieBreakRequester) {
        return;
    }
    TieBreak tieBreak;
    {
        std::lock_guard<std::mutex> lock(tieBreakMutex_);
        auto it = tieBreaks_.find(event.request.id);
        if (it == tieBreaks_.end()) {
            return;
        }
        tieBreak = it->second;
        tieBreaks_.erase(it);
    }

    if (event.kind != ResolverEventKind::Fulfilled || !event.request.result) {
        logger_->warn("tie-break {} for {} ended {}: {}", event.request.id, tieBreak.matchId,
                      toString(event.kind), event.request.failureReason);
        return;
    }
    const auto* outcome = std::get_if<MatchOutcome>(&*event.request.result);
    if (!outcome) {
        logger_->error("tie-break {} produced no match outcome", event.request.id);
        return;
    }

    MatchData data;
    data.method = "decision";
    data.verificationHash = outcome->verificationHash;
    data.details["requestId"] = event.request.id;
    data.details["randomSeed"] = std::to_string(outcome->randomSeed);
    data.details["nonce"] = outcome->nonce;
    try {
        updateMatchResult(tieBreak.tournamentId, tieBreak.matchId, outcome->winner, data);
    } catch (const std::exception& e) {
        logger_->warn("tie-break {} could not be applied to {}: {}", event.request.id,
                      tieBreak.matchId, e.what());
    }
}

std::optional<Tournament> BracketEngine::getTournament(const std::string& tournamentId) const {
    auto slot = findSlot(tournamentId);
    if (!slot) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(slot->mutex);
    // A slot can outlive a creation that failed to commit.
    if (!slot->tournament && !store_->load(tournamentId)) {
        return std::nullopt;
    }
    return loadLocked(*slot, tournamentId);
}

std::size_t BracketEngine::trackedTournaments() const {
    std::lock_guard<std::mutex> lock(registryMutex_);
    return slots_.size();
}

std::vector<BracketMatch> BracketEngine::getNextRoundMatches(const std::string& tournamentId,
                                                             std::uint32_t roundNumber) const {
    auto slot = requireSlot(tournamentId);
    std::lock_guard<std::mutex> lock(slot->mutex);
    const auto& tournament = loadLocked(*slot, tournamentId);
    if (roundNumber == 0 || roundNumber >= tournament.rounds.size()) {
        return {};
    }
    return tournament.rounds[roundNumber].matches;
}

std::map<std::string, Fixed64> BracketEngine::getCurrentLiveOdds(const std::string& tournamentId,
                                                                 const std::string& matchId) const {
    auto slot = requireSlot(tournamentId);
    std::lock_guard<std::mutex> lock(slot->mutex);
    const auto& tournament = loadLocked(*slot, tournamentId);
    const auto* match = tournament.findMatch(matchId);
    if (!match) {
        throw ValidationError("unknown match " + matchId + " in tournament " + tournamentId);
    }
    if (match->liveState) {
        return computeLiveOdds(*match->liveState, config_);
    }
    return match->odds;
}

TournamentReport BracketEngine::generateTournamentReport(const std::string& tournamentId) const {
    auto slot = requireSlot(tournamentId);
    std::lock_guard<std::mutex> lock(slot->mutex);
    const auto& t = loadLocked(*slot, tournamentId);

    TournamentReport report;
    report.tournamentId = t.id;
    report.name = t.name;
    report.status = t.status;
    report.currentRound = t.currentRound;
    report.totalRounds = t.totalRounds;
    report.participantCount = t.participants.size();
    report.matchCount = t.matchCount();
    report.completedMatches = t.completedMatchCount();
    report.bracketBetCount = t.bracketBets.size();
    for (const auto& entry : t.liveBets) {
        report.liveBetCount += entry.second.size();
    }
    if (!t.results.winners.empty()) {
        report.champion = t.results.winners.back();
    }
    report.prizePool = t.prizePool;
    for (const auto& entry : t.bracketBets) {
        report.bracketVolume += entry.second.betAmount;
        report.bracketPayouts += entry.second.finalPayout;
    }
    report.liveVolume = sumBets(t.liveBets, false);
    report.livePayouts = sumBets(t.liveBets, true);
    report.perfectBrackets = t.results.perfectBrackets;
    report.payouts = t.results.payouts;
    report.completedAt = t.completedAt;
    report.generatedAt = clock_->nowMillis();
    return report;
}

} // namespace arb
