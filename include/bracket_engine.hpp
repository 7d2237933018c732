#pragma once

#include "audit_chain.hpp"
#include "betting_pool.hpp"
#include "clock.hpp"
#include "config.hpp"
#include "logging.hpp"
#include "randomness_resolver.hpp"
#include "tournament.hpp"
#include "tournament_store.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace arb {

struct MatchResultSummary {
    std::string tournamentId;
    std::string matchId;
    std::string winnerId;
    std::string loserId;
    TournamentStatus tournamentStatus = TournamentStatus::Active;
    std::optional<PoolSettlement> poolSettlement;
    std::vector<LiveBet> settledLiveBets;
    std::size_t bracketBetsScored = 0;
    // Matches of the round after the decided one.
    std::vector<BracketMatch> nextRoundMatches;
};

struct TournamentReport {
    std::string tournamentId;
    std::string name;
    TournamentStatus status = TournamentStatus::Open;
    std::uint32_t currentRound = 1;
    std::uint32_t totalRounds = 0;
    std::size_t participantCount = 0;
    std::size_t matchCount = 0;
    std::size_t completedMatches = 0;
    std::size_t bracketBetCount = 0;
    std::size_t liveBetCount = 0;
    std::optional<std::string> champion;
    PrizePool prizePool;
    Fixed64 bracketVolume;
    Fixed64 liveVolume;
    Fixed64 bracketPayouts;
    Fixed64 livePayouts;
    std::vector<std::string> perfectBrackets;
    std::vector<BracketPayout> payouts;
    std::optional<std::uint64_t> completedAt;
    std::uint64_t generatedAt = 0;
};

/**
 * Runs single-elimination tournaments: bracket construction with one betting
 * pool per real match, bracket and live bets, match results with settlement
 * and advancement, and completion payouts. Every mutation works on a copy of
 * the tournament and is committed to the store with an optimistic version
 * check, so a failed step leaves the last consistent state in place.
 *
 * Updates to one tournament are serialized; different tournaments proceed
 * independently.
 */
class BracketEngine {
public:
    BracketEngine(TournamentConfig config,
                  PoolServicePtr pools,
                  TournamentStorePtr store,
                  ClockPtr clock,
                  std::shared_ptr<AuditChain> audit = nullptr,
                  std::shared_ptr<RandomnessResolver> resolver = nullptr);
    ~BracketEngine();

    BracketEngine(const BracketEngine&) = delete;
    BracketEngine& operator=(const BracketEngine&) = delete;

    Tournament createTournament(const TournamentSpec& spec);

    BracketBet placeBracketBet(const std::string& userId,
                               const std::string& tournamentId,
                               const std::map<std::string, std::string>& predictions,
                               Fixed64 amount);

    void lockTournament(const std::string& tournamentId);

    BracketMatch startMatch(const std::string& tournamentId, const std::string& matchId);

    // Records the live state of a match and returns the odds it implies.
    std::map<std::string, Fixed64> updateMatchState(const std::string& tournamentId,
                                                    const MatchState& state);

    LiveBet placeLiveBet(const std::string& userId,
                         const std::string& tournamentId,
                         const std::string& matchId,
                         const std::string& outcomeId,
                         Fixed64 amount);

    /**
     * Decide a match: mark it completed, settle its pool, settle live bets,
     * score bracket bets, advance the winner and complete the tournament
     * when no match is left, in that order.
     */
    MatchResultSummary updateMatchResult(const std::string& tournamentId,
                                         const std::string& matchId,
                                         const std::string& winnerId,
                                         MatchData matchData = MatchData{});

    /**
     * Ask the resolver to decide a match. The outcome is applied through
     * updateMatchResult once the request is fulfilled; a failed or timed
     * out request is dropped.
     */
    std::string requestTieBreak(const std::string& tournamentId,
                                const std::string& matchId,
                                const PlayerStats& participant1,
                                const PlayerStats& participant2);
    std::size_t pendingTieBreaks() const;

    std::optional<Tournament> getTournament(const std::string& tournamentId) const;
    std::vector<BracketMatch> getNextRoundMatches(const std::string& tournamentId,
                                                  std::uint32_t roundNumber) const;
    std::map<std::string, Fixed64> getCurrentLiveOdds(const std::string& tournamentId,
                                                      const std::string& matchId) const;
    TournamentReport generateTournamentReport(const std::string& tournamentId) const;
    // Tournaments this engine holds a registry slot for.
    std::size_t trackedTournaments() const;

private:
    struct TournamentSlot {
        std::mutex mutex;
        std::optional<Tournament> tournament;
    };

    struct AuditBatch {
        std::vector<BetRecord> bets;
        std::vector<PayoutRecord> payouts;
        std::vector<SystemRecord> events;
    };

    struct TieBreak {
        std::string tournamentId;
        std::string matchId;
    };

    // Resolver callbacks run through the gate; the destructor closes it
    // under its mutex so no callback outlives the engine.
    struct ObserverGate {
        std::mutex mutex;
        BracketEngine* engine = nullptr;
    };

    // Creates the slot; only createTournament may do so.
    std::shared_ptr<TournamentSlot> slotFor(const std::string& tournamentId) const;
    // Slot of a cached or stored tournament; nullptr for unknown ids.
    std::shared_ptr<TournamentSlot> findSlot(const std::string& tournamentId) const;
    std::shared_ptr<TournamentSlot> requireSlot(const std::string& tournamentId) const;
    // Caller holds slot.mutex. Throws ValidationError for unknown ids.
    const Tournament& loadLocked(TournamentSlot& slot, const std::string& tournamentId) const;
    void commitLocked(TournamentSlot& slot, Tournament next);
    void emit(const AuditBatch& batch);

    std::string createMatchPool(const Tournament& tournament,
                                const BracketMatch& match,
                                std::uint64_t closesAt);
    void onResolverEvent(const ResolverEvent& event);

    TournamentConfig config_;
    PoolServicePtr pools_;
    TournamentStorePtr store_;
    ClockPtr clock_;
    std::shared_ptr<AuditChain> audit_;
    std::shared_ptr<RandomnessResolver> resolver_;
    Logger logger_;

    mutable std::mutex registryMutex_;
    mutable std::map<std::string, std::shared_ptr<TournamentSlot>> slots_;

    mutable std::mutex tieBreakMutex_;
    std::map<std::string, TieBreak> tieBreaks_; // requestId -> match
    std::uint64_t observerToken_ = 0;
    std::shared_ptr<ObserverGate> observerGate_;
};

} // namespace arb
