#include "tournament_codec.hpp"
#include "tournament_store.hpp"
#include "errors.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "tournament_codec_test failure: " << msg << std::endl;
    std::exit(1);
}

void expectMalformed(const std::string& document, const std::string& what) {
    try {
        arb::deserializeTournament(document);
    } catch (const std::invalid_argument&) {
        return;
    }
    fail(what);
}

arb::Tournament sampleTournament() {
    using namespace arb;
    TournamentConfig config;
    std::vector<Participant> field{{"ana", "Ana", false},
                                   {"bo", "Bo", false},
                                   {"cy", "Cy", false},
                                   {"di", "Di", false},
                                   {"ed", "Ed", false}};

    Tournament t;
    t.id = "spring_cup";
    t.name = "Spring Cup \xE2\x9C\x93";
    t.name.push_back('\0');
    t.name += "final";
    t.participants = field;
    t.rounds = buildBracket(TournamentScheme::SingleElimination, field, config, 1'000);
    t.createdAt = 1'000;
    t.startsAt = 7'200'000;
    t.bracketLockTime = 3'600'000;
    t.totalRounds = 3;
    t.status = TournamentStatus::Active;
    t.version = 7;

    auto* live = t.findMatch("match_4");
    live->status = MatchStatus::Live;
    live->startedAt = 5'000;
    live->bettingPoolId = "pool_1_aa";
    MatchState state{"match_4", ParticipantState{"di", 62.5, 3.25}, ParticipantState{"ed", 0.1, 7.0},
                     6'000};
    live->liveState = state;
    live->odds = computeLiveOdds(state, config);
    t.bettingPools["pool_1_aa"] = "match_4";

    BracketBet bracket;
    bracket.id = "bracket_1_bb";
    bracket.userId = "u1";
    bracket.tournamentId = t.id;
    bracket.predictions = {{"match_1", "ana"}, {"match_4", "ed"}};
    bracket.betAmount = Fixed64::fromRatio(25, 2);
    bracket.potentialPayout = Fixed64::fromUnits(25);
    bracket.correctPredictions = 1;
    bracket.bonusMultiplier = Fixed64::fromRatio(11, 10);
    t.bracketBets["u1"] = bracket;

    LiveBet liveBet;
    liveBet.id = "live_1_cc";
    liveBet.userId = "u2";
    liveBet.tournamentId = t.id;
    liveBet.matchId = "match_4";
    liveBet.outcomeId = "di";
    liveBet.betAmount = Fixed64::fromUnits(3);
    liveBet.odds = live->odds.at("di");
    liveBet.potentialPayout = liveBet.betAmount * liveBet.odds;
    liveBet.matchState = state;
    liveBet.status = LiveBetStatus::Won;
    liveBet.payout = liveBet.potentialPayout;
    t.liveBets["match_4"].push_back(liveBet);

    t.prizePool.total = Fixed64::fromRatio(31, 2);
    t.prizePool.bracketPool = bracket.betAmount;
    t.results.matches["match_1"] = MatchResult{"ana", "bye_5", MatchData{"bye", "", {}}, 1'000};
    t.results.eliminations = {"bye_5"};
    t.results.payouts.push_back(BracketPayout{"u1", "bracket_1_bb", Fixed64::fromUnits(20),
                                              Fixed64::fromUnits(1), 1});
    t.completedAt = 9'999;
    return t;
}

} // namespace

int main() {
    using namespace arb;

    const auto original = sampleTournament();
    const auto document = serializeTournament(original);
    if (document.compare(0, 4, "ARBT") != 0) {
        fail("document should start with the format magic");
    }

    const auto decoded = deserializeTournament(document);
    if (decoded != original) {
        fail("round trip changed the tournament");
    }
    if (serializeTournament(decoded) != document) {
        fail("re-encoding is not byte stable");
    }
    if (decoded.findMatch("match_4")->liveState->participant1.health != 62.5) {
        fail("live state doubles lost precision");
    }

    const Tournament empty;
    if (deserializeTournament(serializeTournament(empty)) != empty) {
        fail("default tournament does not round trip");
    }

    expectMalformed(document.substr(0, document.size() - 1), "truncated document accepted");
    expectMalformed(document + '\0', "trailing bytes accepted");
    expectMalformed("XXXX" + document.substr(4), "bad magic accepted");
    auto badVersion = document;
    badVersion[4] = 9;
    expectMalformed(badVersion, "unknown format version accepted");
    expectMalformed("", "empty document accepted");

    // Store: optimistic versioning on top of the document.
    InMemoryTournamentStore store;
    store.save(original.id, document, 0);
    try {
        store.save(original.id, document, 0);
        fail("stale version accepted");
    } catch (const ExternalServiceError&) {
    }
    store.save(original.id, document, 1);
    const auto stored = store.load(original.id);
    if (!stored || stored->version != 2 || stored->document != document) {
        fail("store should hold version 2 of the document");
    }
    if (store.list() != std::vector<std::string>{"spring_cup"} || store.load("nope")) {
        fail("store listing or lookup is wrong");
    }
    if (tournamentKey("spring_cup") != "tournament:spring_cup") {
        fail("tournament key layout changed");
    }

    std::cout << "tournament_codec_test: ok\n";
    return 0;
}
