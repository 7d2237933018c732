#pragma once

#include "config.hpp"
#include "fixed_point.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace arb {

enum class TournamentScheme { SingleElimination, DoubleElimination, RoundRobin };
enum class TournamentStatus { Open, Locked, Active, Completed };
enum class MatchStatus { Scheduled, Live, Completed };
enum class BracketBetStatus { Active, Settled, Lost };
enum class LiveBetStatus { Active, Won, Lost };

const char* toString(TournamentScheme scheme);
const char* toString(TournamentStatus status);
const char* toString(MatchStatus status);
const char* toString(BracketBetStatus status);
const char* toString(LiveBetStatus status);

// Occupant of a slot whose feeder match has not been decided.
constexpr const char* kPlaceholderId = "tbd";

struct Participant {
    std::string id;
    std::string name;
    bool isBye = false;

    bool isPlaceholder() const { return id == kPlaceholderId; }
    bool operator==(const Participant& other) const;
    bool operator!=(const Participant& other) const { return !(*this == other); }
};

struct ParticipantState {
    std::string participantId;
    double health = 100.0;
    double score = 0.0;

    bool operator==(const ParticipantState& other) const;
};

// Live state of a match as reported by the game server.
struct MatchState {
    std::string matchId;
    ParticipantState participant1;
    ParticipantState participant2;
    std::uint64_t updatedAt = 0;

    bool operator==(const MatchState& other) const;
};

struct MatchData {
    std::string method = "decision";
    std::string verificationHash;
    std::map<std::string, std::string> details;

    bool operator==(const MatchData& other) const;
};

struct BracketMatch {
    std::string id;
    std::uint32_t roundNumber = 1;
    std::uint32_t position = 0;
    Participant participant1;
    Participant participant2;
    std::optional<std::string> winner;
    MatchStatus status = MatchStatus::Scheduled;
    std::optional<std::string> bettingPoolId;
    std::map<std::string, Fixed64> odds;
    std::optional<MatchState> liveState;
    std::optional<std::uint64_t> startedAt;
    std::optional<std::uint64_t> completedAt;
    std::optional<MatchData> matchData;

    bool hasBothParticipants() const;
    bool isByeMatch() const { return participant1.isBye || participant2.isBye; }
    bool involves(const std::string& participantId) const;
    bool operator==(const BracketMatch& other) const;
};

struct BracketRound {
    std::uint32_t roundNumber = 1;
    std::vector<BracketMatch> matches;

    bool operator==(const BracketRound& other) const;
};

struct BracketBet {
    std::string id;
    std::string userId;
    std::string tournamentId;
    std::map<std::string, std::string> predictions; // matchId -> predicted winner
    Fixed64 betAmount;
    Fixed64 potentialPayout;
    std::uint64_t placedAt = 0;
    BracketBetStatus status = BracketBetStatus::Active;
    std::uint32_t correctPredictions = 0;
    std::uint32_t incorrectPredictions = 0;
    Fixed64 bonusMultiplier = Fixed64::fromUnits(1);
    Fixed64 finalPayout;

    // correct / (correct + incorrect), zero before any scoring.
    Fixed64 accuracyRate() const;
    bool operator==(const BracketBet& other) const;
};

struct LiveBet {
    std::string id;
    std::string userId;
    std::string tournamentId;
    std::string matchId;
    std::string outcomeId;
    Fixed64 betAmount;
    Fixed64 odds;
    Fixed64 potentialPayout;
    std::uint64_t placedAt = 0;
    MatchState matchState;
    LiveBetStatus status = LiveBetStatus::Active;
    Fixed64 payout;

    bool operator==(const LiveBet& other) const;
};

struct PrizePool {
    Fixed64 total;
    Fixed64 bracketPool;
    Fixed64 matchPools;
    Fixed64 bonusPool;

    bool operator==(const PrizePool& other) const;
};

struct MatchResult {
    std::string winnerId;
    std::string loserId;
    MatchData matchData;
    std::uint64_t completedAt = 0;

    bool operator==(const MatchResult& other) const;
};

struct BracketPayout {
    std::string userId;
    std::string betId;
    Fixed64 payout;
    Fixed64 accuracyRate;
    std::uint32_t correctPredictions = 0;

    bool operator==(const BracketPayout& other) const;
};

struct TournamentResults {
    std::map<std::string, MatchResult> matches;
    std::vector<std::string> eliminations;
    std::vector<std::string> winners;
    // Bet ids of brackets with no incorrect prediction at completion.
    std::vector<std::string> perfectBrackets;
    std::vector<BracketPayout> payouts;

    bool operator==(const TournamentResults& other) const;
};

struct Tournament {
    std::string id;
    std::string name;
    TournamentScheme scheme = TournamentScheme::SingleElimination;
    std::vector<Participant> participants;
    std::vector<BracketRound> rounds;
    TournamentStatus status = TournamentStatus::Open;
    std::uint64_t createdAt = 0;
    std::uint64_t startsAt = 0;
    std::uint64_t bracketLockTime = 0;
    std::optional<std::uint64_t> completedAt;
    std::uint32_t currentRound = 1;
    std::uint32_t totalRounds = 0;
    std::map<std::string, std::string> bettingPools; // poolId -> matchId
    std::map<std::string, BracketBet> bracketBets;   // userId -> bet
    std::map<std::string, std::vector<LiveBet>> liveBets; // matchId -> bets
    PrizePool prizePool;
    TournamentResults results;
    std::uint64_t version = 0;

    BracketMatch* findMatch(const std::string& matchId);
    const BracketMatch* findMatch(const std::string& matchId) const;
    std::vector<std::string> matchIds() const;
    std::size_t matchCount() const;
    std::size_t completedMatchCount() const;
    bool allMatchesCompleted() const;
    std::optional<Participant> findParticipant(const std::string& participantId) const;

    bool operator==(const Tournament& other) const;
    bool operator!=(const Tournament& other) const { return !(*this == other); }
};

struct TournamentSpec {
    std::string id;
    std::string name;
    TournamentScheme scheme = TournamentScheme::SingleElimination;
    std::vector<Participant> participants;
    std::uint64_t startsAt = 0;
};

// ceil(log2(n)); n must be at least 2.
std::uint32_t totalRoundsFor(std::size_t participantCount);

/**
 * Single-elimination bracket over the given seeds. The field is padded to
 * the next power of two with byes ("bye_<k>") paired against the top
 * seeds; bye matches are completed immediately and their participant
 * advanced. Other schemes throw ValidationError.
 */
std::vector<BracketRound> buildBracket(TournamentScheme scheme,
                                       const std::vector<Participant>& participants,
                                       const TournamentConfig& config,
                                       std::uint64_t now);

// Places a decided match's winner into its slot in the following round.
// Returns the filled match, or nullptr after the final.
BracketMatch* advanceWinner(std::vector<BracketRound>& rounds,
                            const BracketMatch& decided,
                            const Participant& winner,
                            Fixed64 initialOdds);

// Which participants a bettor may pick for a match, given the picks they
// made for earlier rounds.
std::vector<std::string> eligiblePicks(const std::vector<BracketRound>& rounds,
                                       const BracketMatch& match,
                                       const std::map<std::string, std::string>& predictions);

// Advantage of `self` over `other` in [0, 1].
double participantAdvantage(const ParticipantState& self, const ParticipantState& other);

// participantId -> odds, shifted down for the side with the advantage.
std::map<std::string, Fixed64> computeLiveOdds(const MatchState& state,
                                               const TournamentConfig& config);

} // namespace arb
