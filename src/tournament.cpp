#include "tournament.hpp"

#include "errors.hpp"

#include <algorithm>
#include <tuple>

namespace arb {

const char* toString(TournamentScheme scheme) {
    switch (scheme) {
    case TournamentScheme::SingleElimination:
        return "single_elimination";
    case TournamentScheme::DoubleElimination:
        return "double_elimination";
    case TournamentScheme::RoundRobin:
        return "round_robin";
    }
    return "unknown";
}

const char* toString(TournamentStatus status) {
    switch (status) {
    case TournamentStatus::Open:
        return "open";
    case TournamentStatus::Locked:
        return "locked";
    case TournamentStatus::Active:
        return "active";
    case TournamentStatus::Completed:
        return "completed";
    }
    return "unknown";
}

const char* toString(MatchStatus status) {
    switch (status) {
    case MatchStatus::Scheduled:
        return "scheduled";
    case MatchStatus::Live:
        return "live";
    case MatchStatus::Completed:
        return "completed";
    }
    return "unknown";
}

const char* toString(BracketBetStatus status) {
    switch (status) {
    case BracketBetStatus::Active:
        return "active";
    case BracketBetStatus::Settled:
        return "settled";
    case BracketBetStatus::Lost:
        return "lost";
    }
    return "unknown";
}

const char* toString(LiveBetStatus status) {
    switch (status) {
    case LiveBetStatus::Active:
        return "active";
    case LiveBetStatus::Won:
        return "won";
    case LiveBetStatus::Lost:
        return "lost";
    }
    return "unknown";
}

bool Participant::operator==(const Participant& other) const {
    return std::tie(id, name, isBye) == std::tie(other.id, other.name, other.isBye);
}

bool ParticipantState::operator==(const ParticipantState& other) const {
    return std::tie(participantId, health, score) ==
           std::tie(other.participantId, other.health, other.score);
}

bool MatchState::operator==(const MatchState& other) const {
    return std::tie(matchId, participant1, participant2, updatedAt) ==
           std::tie(other.matchId, other.participant1, other.participant2, other.updatedAt);
}

bool MatchData::operator==(const MatchData& other) const {
    return std::tie(method, verificationHash, details) ==
           std::tie(other.method, other.verificationHash, other.details);
}

bool BracketMatch::hasBothParticipants() const {
    return !participant1.isPlaceholder() && !participant2.isPlaceholder();
}

bool BracketMatch::involves(const std::string& participantId) const {
    return participant1.id == participantId || participant2.id == participantId;
}

bool BracketMatch::operator==(const BracketMatch& other) const {
    return std::tie(id, roundNumber, position, participant1, participant2, winner, status,
                    bettingPoolId, odds, liveState, startedAt, completedAt, matchData) ==
           std::tie(other.id, other.roundNumber, other.position, other.participant1,
                    other.participant2, other.winner, other.status, other.bettingPoolId,
                    other.odds, other.liveState, other.startedAt, other.completedAt,
                    other.matchData);
}

bool BracketRound::operator==(const BracketRound& other) const {
    return roundNumber == other.roundNumber && matches == other.matches;
}

Fixed64 BracketBet::accuracyRate() const {
    const std::int64_t decided = static_cast<std::int64_t>(correctPredictions) +
                                 static_cast<std::int64_t>(incorrectPredictions);
    if (decided == 0) {
        return Fixed64();
    }
    return Fixed64::fromRatio(correctPredictions, decided);
}

bool BracketBet::operator==(const BracketBet& other) const {
    return std::tie(id, userId, tournamentId, predictions, betAmount, potentialPayout, placedAt,
                    status, correctPredictions, incorrectPredictions, bonusMultiplier,
                    finalPayout) ==
           std::tie(other.id, other.userId, other.tournamentId, other.predictions,
                    other.betAmount, other.potentialPayout, other.placedAt, other.status,
                    other.correctPredictions, other.incorrectPredictions, other.bonusMultiplier,
                    other.finalPayout);
}

bool LiveBet::operator==(const LiveBet& other) const {
    return std::tie(id, userId, tournamentId, matchId, outcomeId, betAmount, odds,
                    potentialPayout, placedAt, matchState, status, payout) ==
           std::tie(other.id, other.userId, other.tournamentId, other.matchId, other.outcomeId,
                    other.betAmount, other.odds, other.potentialPayout, other.placedAt,
                    other.matchState, other.status, other.payout);
}

bool PrizePool::operator==(const PrizePool& other) const {
    return std::tie(total, bracketPool, matchPools, bonusPool) ==
           std::tie(other.total, other.bracketPool, other.matchPools, other.bonusPool);
}

bool MatchResult::operator==(const MatchResult& other) const {
    return std::tie(winnerId, loserId, matchData, completedAt) ==
           std::tie(other.winnerId, other.loserId, other.matchData, other.completedAt);
}

bool BracketPayout::operator==(const BracketPayout& other) const {
    return std::tie(userId, betId, payout, accuracyRate, correctPredictions) ==
           std::tie(other.userId, other.betId, other.payout, other.accuracyRate,
                    other.correctPredictions);
}

bool TournamentResults::operator==(const TournamentResults& other) const {
    return std::tie(matches, eliminations, winners, perfectBrackets, payouts) ==
           std::tie(other.matches, other.eliminations, other.winners, other.perfectBrackets,
                    other.payouts);
}

BracketMatch* Tournament::findMatch(const std::string& matchId) {
    for (auto& round : rounds) {
        for (auto& match : round.matches) {
            if (match.id == matchId) {
                return &match;
            }
        }
    }
    return nullptr;
}

const BracketMatch* Tournament::findMatch(const std::string& matchId) const {
    return const_cast<Tournament*>(this)->findMatch(matchId);
}

std::vector<std::string> Tournament::matchIds() const {
    std::vector<std::string> ids;
    for (const auto& round : rounds) {
        for (const auto& match : round.matches) {
            ids.push_back(match.id);
        }
    }
    return ids;
}

std::size_t Tournament::matchCount() const {
    std::size_t count = 0;
    for (const auto& round : rounds) {
        count += round.matches.size();
    }
    return count;
}

std::size_t Tournament::completedMatchCount() const {
    std::size_t count = 0;
    for (const auto& round : rounds) {
        for (const auto& match : round.matches) {
            if (match.status == MatchStatus::Completed) {
                ++count;
            }
        }
    }
    return count;
}

bool Tournament::allMatchesCompleted() const {
    return !rounds.empty() && completedMatchCount() == matchCount();
}

std::optional<Participant> Tournament::findParticipant(const std::string& participantId) const {
    for (const auto& participant : participants) {
        if (participant.id == participantId) {
            return participant;
        }
    }
    return std::nullopt;
}

bool Tournament::operator==(const Tournament& other) const {
    return std::tie(id, name, scheme, participants, rounds, status, createdAt, startsAt,
                    bracketLockTime, completedAt, currentRound, totalRounds, bettingPools,
                    bracketBets, liveBets, prizePool, results, version) ==
           std::tie(other.id, other.name, other.scheme, other.participants, other.rounds,
                    other.status, other.createdAt, other.startsAt, other.bracketLockTime,
                    other.completedAt, other.currentRound, other.totalRounds, other.bettingPools,
                    other.bracketBets, other.liveBets, other.prizePool, other.results,
                    other.version);
}

std::uint32_t totalRoundsFor(std::size_t participantCount) {
    if (participantCount < 2) {
        throw ValidationError("a bracket needs at least two participants");
    }
    std::uint32_t rounds = 0;
    std::size_t capacity = 1;
    while (capacity < participantCount) {
        capacity <<= 1;
        ++rounds;
    }
    return rounds;
}

std::vector<BracketRound> buildBracket(TournamentScheme scheme,
                                       const std::vector<Participant>& participants,
                                       const TournamentConfig& config,
                                       std::uint64_t now) {
    if (scheme != TournamentScheme::SingleElimination) {
        throw ValidationError("unsupported tournament scheme: " + std::string(toString(scheme)));
    }

    const auto totalRounds = totalRoundsFor(participants.size());
    const std::size_t fieldSize = std::size_t{1} << totalRounds;
    const std::size_t byes = fieldSize - participants.size();
    const Fixed64 evenOdds = Fixed64::fromDouble(config.baseLiveOdds);

    std::vector<BracketRound> rounds;
    rounds.reserve(totalRounds);
    std::uint32_t matchNumber = 1;

    BracketRound first;
    first.roundNumber = 1;
    for (std::size_t i = 0; i < fieldSize / 2; ++i) {
        BracketMatch match;
        match.id = "match_" + std::to_string(matchNumber++);
        match.roundNumber = 1;
        match.position = static_cast<std::uint32_t>(i);
        if (i < byes) {
            match.participant1 = participants[i];
            match.participant2 =
                Participant{"bye_" + std::to_string(participants.size() + i), "BYE", true};
        } else {
            const std::size_t seed = byes + 2 * (i - byes);
            match.participant1 = participants[seed];
            match.participant2 = participants[seed + 1];
        }
        for (const auto* participant : {&match.participant1, &match.participant2}) {
            if (!participant->isBye) {
                match.odds[participant->id] = evenOdds;
            }
        }
        first.matches.push_back(std::move(match));
    }
    rounds.push_back(std::move(first));

    for (std::uint32_t roundNumber = 2; roundNumber <= totalRounds; ++roundNumber) {
        BracketRound round;
        round.roundNumber = roundNumber;
        const std::size_t matches = fieldSize >> roundNumber;
        for (std::size_t i = 0; i < matches; ++i) {
            BracketMatch match;
            match.id = "match_" + std::to_string(matchNumber++);
            match.roundNumber = roundNumber;
            match.position = static_cast<std::uint32_t>(i);
            match.participant1 = Participant{kPlaceholderId, "TBD", false};
            match.participant2 = Participant{kPlaceholderId, "TBD", false};
            round.matches.push_back(std::move(match));
        }
        rounds.push_back(std::move(round));
    }

    for (std::size_t i = 0; i < byes; ++i) {
        auto& match = rounds.front().matches[i];
        match.status = MatchStatus::Completed;
        match.winner = match.participant1.id;
        match.completedAt = now;
        MatchData data;
        data.method = "bye";
        match.matchData = data;
        advanceWinner(rounds, match, match.participant1, evenOdds);
    }
    return rounds;
}

BracketMatch* advanceWinner(std::vector<BracketRound>& rounds,
                            const BracketMatch& decided,
                            const Participant& winner,
                            Fixed64 initialOdds) {
    if (decided.roundNumber >= rounds.size()) {
        return nullptr;
    }
    auto& next = rounds[decided.roundNumber].matches.at(decided.position / 2);
    auto& slot = (decided.position % 2 == 0) ? next.participant1 : next.participant2;
    slot = winner;
    next.odds[winner.id] = initialOdds;
    return &next;
}

std::vector<std::string> eligiblePicks(const std::vector<BracketRound>& rounds,
                                       const BracketMatch& match,
                                       const std::map<std::string, std::string>& predictions) {
    std::vector<std::string> picks;
    auto consider = [&](const Participant& participant, std::size_t slot) {
        if (!participant.isPlaceholder()) {
            if (!participant.isBye) {
                picks.push_back(participant.id);
            }
            return;
        }
        if (match.roundNumber < 2) {
            return;
        }
        const auto& feeders = rounds.at(match.roundNumber - 2).matches;
        const auto& feeder = feeders.at(match.position * 2 + slot);
        auto it = predictions.find(feeder.id);
        if (it != predictions.end()) {
            picks.push_back(it->second);
        }
    };
    consider(match.participant1, 0);
    consider(match.participant2, 1);
    return picks;
}

double participantAdvantage(const ParticipantState& self, const ParticipantState& other) {
    const double healthTerm = 0.5 * (self.health - other.health) / 100.0;
    const double scoreTerm =
        0.5 * (self.score - other.score) / std::max(1.0, self.score + other.score);
    return std::clamp(healthTerm + scoreTerm, 0.0, 1.0);
}

std::map<std::string, Fixed64> computeLiveOdds(const MatchState& state,
                                               const TournamentConfig& config) {
    const double a1 = participantAdvantage(state.participant1, state.participant2);
    const double a2 = participantAdvantage(state.participant2, state.participant1);
    const double k = config.liveOddsSensitivity;

    std::map<std::string, Fixed64> odds;
    odds[state.participant1.participantId] =
        Fixed64::fromDouble(std::max(config.minLiveOdds, config.baseLiveOdds - k * a1 + k * a2));
    odds[state.participant2.participantId] =
        Fixed64::fromDouble(std::max(config.minLiveOdds, config.baseLiveOdds - k * a2 + k * a1));
    return odds;
}

} // namespace arb
