#include "tournament_codec.hpp"

#include <cstring>
#include <stdexcept>

namespace arb {

namespace {

constexpr char kMagic[] = "ARBT";
constexpr std::uint32_t kFormatVersion = 1;

class Writer {
public:
    void u8(std::uint8_t v) { out_.push_back(static_cast<char>(v)); }

    void u32(std::uint32_t v) {
        for (int i = 0; i < 4; ++i) {
            out_.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
        }
    }

    void u64(std::uint64_t v) {
        for (int i = 0; i < 8; ++i) {
            out_.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
        }
    }

    void flag(bool v) { u8(v ? 1 : 0); }
    void amount(Fixed64 v) { u64(static_cast<std::uint64_t>(v.raw())); }

    void real(double v) {
        std::uint64_t bits = 0;
        std::memcpy(&bits, &v, sizeof(bits));
        u64(bits);
    }

    void str(const std::string& s) {
        u64(static_cast<std::uint64_t>(s.size()));
        out_.append(s);
    }

    void raw(const char* bytes, std::size_t n) { out_.append(bytes, n); }

    std::string take() { return std::move(out_); }

private:
    std::string out_;
};

class Reader {
public:
    explicit Reader(const std::string& in) : in_(in) {}

    std::uint8_t u8() {
        need(1);
        return static_cast<std::uint8_t>(in_[pos_++]);
    }

    std::uint32_t u32() {
        need(4);
        std::uint32_t v = 0;
        for (int i = 0; i < 4; ++i) {
            v |= static_cast<std::uint32_t>(static_cast<unsigned char>(in_[pos_++])) << (8 * i);
        }
        return v;
    }

    std::uint64_t u64() {
        need(8);
        std::uint64_t v = 0;
        for (int i = 0; i < 8; ++i) {
            v |= static_cast<std::uint64_t>(static_cast<unsigned char>(in_[pos_++])) << (8 * i);
        }
        return v;
    }

    bool flag() {
        const auto v = u8();
        if (v > 1) {
            throw std::invalid_argument("tournament document: bad boolean");
        }
        return v == 1;
    }

    Fixed64 amount() { return Fixed64::fromRaw(static_cast<std::int64_t>(u64())); }

    double real() {
        const std::uint64_t bits = u64();
        double v = 0;
        std::memcpy(&v, &bits, sizeof(v));
        return v;
    }

    std::string str() {
        const auto n = count();
        std::string s = in_.substr(pos_, n);
        pos_ += n;
        return s;
    }

    // Collection or string length, bounded by the bytes left.
    std::size_t count() {
        const auto n = u64();
        if (n > in_.size() - pos_) {
            throw std::invalid_argument("tournament document: length exceeds input");
        }
        return static_cast<std::size_t>(n);
    }

    template <typename E>
    E enumeration(E last) {
        const auto v = u8();
        if (v > static_cast<std::uint8_t>(last)) {
            throw std::invalid_argument("tournament document: enum value out of range");
        }
        return static_cast<E>(v);
    }

    void expect(const char* bytes, std::size_t n) {
        need(n);
        if (in_.compare(pos_, n, bytes, n) != 0) {
            throw std::invalid_argument("tournament document: bad magic");
        }
        pos_ += n;
    }

    void finish() const {
        if (pos_ != in_.size()) {
            throw std::invalid_argument("tournament document: trailing bytes");
        }
    }

private:
    void need(std::size_t n) const {
        if (in_.size() - pos_ < n) {
            throw std::invalid_argument("tournament document: truncated");
        }
    }

    const std::string& in_;
    std::size_t pos_ = 0;
};

template <typename T, typename WriteOne>
void writeOptional(Writer& w, const std::optional<T>& value, WriteOne writeOne) {
    w.flag(value.has_value());
    if (value) {
        writeOne(*value);
    }
}

template <typename T, typename ReadOne>
std::optional<T> readOptional(Reader& r, ReadOne readOne) {
    if (!r.flag()) {
        return std::nullopt;
    }
    return readOne();
}

void writeStringMap(Writer& w, const std::map<std::string, std::string>& m) {
    w.u64(m.size());
    for (const auto& [key, value] : m) {
        w.str(key);
        w.str(value);
    }
}

std::map<std::string, std::string> readStringMap(Reader& r) {
    std::map<std::string, std::string> m;
    const auto n = r.count();
    for (std::size_t i = 0; i < n; ++i) {
        auto key = r.str();
        m[std::move(key)] = r.str();
    }
    return m;
}

void writeStrings(Writer& w, const std::vector<std::string>& v) {
    w.u64(v.size());
    for (const auto& s : v) {
        w.str(s);
    }
}

std::vector<std::string> readStrings(Reader& r) {
    std::vector<std::string> v;
    const auto n = r.count();
    v.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        v.push_back(r.str());
    }
    return v;
}

void writeParticipant(Writer& w, const Participant& p) {
    w.str(p.id);
    w.str(p.name);
    w.flag(p.isBye);
}

Participant readParticipant(Reader& r) {
    Participant p;
    p.id = r.str();
    p.name = r.str();
    p.isBye = r.flag();
    return p;
}

void writeParticipantState(Writer& w, const ParticipantState& s) {
    w.str(s.participantId);
    w.real(s.health);
    w.real(s.score);
}

ParticipantState readParticipantState(Reader& r) {
    ParticipantState s;
    s.participantId = r.str();
    s.health = r.real();
    s.score = r.real();
    return s;
}

void writeMatchState(Writer& w, const MatchState& s) {
    w.str(s.matchId);
    writeParticipantState(w, s.participant1);
    writeParticipantState(w, s.participant2);
    w.u64(s.updatedAt);
}

MatchState readMatchState(Reader& r) {
    MatchState s;
    s.matchId = r.str();
    s.participant1 = readParticipantState(r);
    s.participant2 = readParticipantState(r);
    s.updatedAt = r.u64();
    return s;
}

void writeMatchData(Writer& w, const MatchData& d) {
    w.str(d.method);
    w.str(d.verificationHash);
    writeStringMap(w, d.details);
}

MatchData readMatchData(Reader& r) {
    MatchData d;
    d.method = r.str();
    d.verificationHash = r.str();
    d.details = readStringMap(r);
    return d;
}

void writeMatch(Writer& w, const BracketMatch& m) {
    w.str(m.id);
    w.u32(m.roundNumber);
    w.u32(m.position);
    writeParticipant(w, m.participant1);
    writeParticipant(w, m.participant2);
    writeOptional(w, m.winner, [&](const std::string& s) { w.str(s); });
    w.u8(static_cast<std::uint8_t>(m.status));
    writeOptional(w, m.bettingPoolId, [&](const std::string& s) { w.str(s); });
    w.u64(m.odds.size());
    for (const auto& [participantId, odds] : m.odds) {
        w.str(participantId);
        w.amount(odds);
    }
    writeOptional(w, m.liveState, [&](const MatchState& s) { writeMatchState(w, s); });
    writeOptional(w, m.startedAt, [&](std::uint64_t t) { w.u64(t); });
    writeOptional(w, m.completedAt, [&](std::uint64_t t) { w.u64(t); });
    writeOptional(w, m.matchData, [&](const MatchData& d) { writeMatchData(w, d); });
}

BracketMatch readMatch(Reader& r) {
    BracketMatch m;
    m.id = r.str();
    m.roundNumber = r.u32();
    m.position = r.u32();
    m.participant1 = readParticipant(r);
    m.participant2 = readParticipant(r);
    m.winner = readOptional<std::string>(r, [&] { return r.str(); });
    m.status = r.enumeration(MatchStatus::Completed);
    m.bettingPoolId = readOptional<std::string>(r, [&] { return r.str(); });
    const auto odds = r.count();
    for (std::size_t i = 0; i < odds; ++i) {
        auto participantId = r.str();
        m.odds[std::move(participantId)] = r.amount();
    }
    m.liveState = readOptional<MatchState>(r, [&] { return readMatchState(r); });
    m.startedAt = readOptional<std::uint64_t>(r, [&] { return r.u64(); });
    m.completedAt = readOptional<std::uint64_t>(r, [&] { return r.u64(); });
    m.matchData = readOptional<MatchData>(r, [&] { return readMatchData(r); });
    return m;
}

void writeBracketBet(Writer& w, const BracketBet& b) {
    w.str(b.id);
    w.str(b.userId);
    w.str(b.tournamentId);
    writeStringMap(w, b.predictions);
    w.amount(b.betAmount);
    w.amount(b.potentialPayout);
    w.u64(b.placedAt);
    w.u8(static_cast<std::uint8_t>(b.status));
    w.u32(b.correctPredictions);
    w.u32(b.incorrectPredictions);
    w.amount(b.bonusMultiplier);
    w.amount(b.finalPayout);
}

BracketBet readBracketBet(Reader& r) {
    BracketBet b;
    b.id = r.str();
    b.userId = r.str();
    b.tournamentId = r.str();
    b.predictions = readStringMap(r);
    b.betAmount = r.amount();
    b.potentialPayout = r.amount();
    b.placedAt = r.u64();
    b.status = r.enumeration(BracketBetStatus::Lost);
    b.correctPredictions = r.u32();
    b.incorrectPredictions = r.u32();
    b.bonusMultiplier = r.amount();
    b.finalPayout = r.amount();
    return b;
}

void writeLiveBet(Writer& w, const LiveBet& b) {
    w.str(b.id);
    w.str(b.userId);
    w.str(b.tournamentId);
    w.str(b.matchId);
    w.str(b.outcomeId);
    w.amount(b.betAmount);
    w.amount(b.odds);
    w.amount(b.potentialPayout);
    w.u64(b.placedAt);
    writeMatchState(w, b.matchState);
    w.u8(static_cast<std::uint8_t>(b.status));
    w.amount(b.payout);
}

LiveBet readLiveBet(Reader& r) {
    LiveBet b;
    b.id = r.str();
    b.userId = r.str();
    b.tournamentId = r.str();
    b.matchId = r.str();
    b.outcomeId = r.str();
    b.betAmount = r.amount();
    b.odds = r.amount();
    b.potentialPayout = r.amount();
    b.placedAt = r.u64();
    b.matchState = readMatchState(r);
    b.status = r.enumeration(LiveBetStatus::Lost);
    b.payout = r.amount();
    return b;
}

void writeResults(Writer& w, const TournamentResults& results) {
    w.u64(results.matches.size());
    for (const auto& [matchId, result] : results.matches) {
        w.str(matchId);
        w.str(result.winnerId);
        w.str(result.loserId);
        writeMatchData(w, result.matchData);
        w.u64(result.completedAt);
    }
    writeStrings(w, results.eliminations);
    writeStrings(w, results.winners);
    writeStrings(w, results.perfectBrackets);
    w.u64(results.payouts.size());
    for (const auto& payout : results.payouts) {
        w.str(payout.userId);
        w.str(payout.betId);
        w.amount(payout.payout);
        w.amount(payout.accuracyRate);
        w.u32(payout.correctPredictions);
    }
}

TournamentResults readResults(Reader& r) {
    TournamentResults results;
    const auto matches = r.count();
    for (std::size_t i = 0; i < matches; ++i) {
        auto matchId = r.str();
        MatchResult result;
        result.winnerId = r.str();
        result.loserId = r.str();
        result.matchData = readMatchData(r);
        result.completedAt = r.u64();
        results.matches.emplace(std::move(matchId), std::move(result));
    }
    results.eliminations = readStrings(r);
    results.winners = readStrings(r);
    results.perfectBrackets = readStrings(r);
    const auto payouts = r.count();
    for (std::size_t i = 0; i < payouts; ++i) {
        BracketPayout payout;
        payout.userId = r.str();
        payout.betId = r.str();
        payout.payout = r.amount();
        payout.accuracyRate = r.amount();
        payout.correctPredictions = r.u32();
        results.payouts.push_back(std::move(payout));
    }
    return results;
}

} // namespace

std::string serializeTournament(const Tournament& t) {
    Writer w;
    w.raw(kMagic, 4);
    w.u32(kFormatVersion);

    w.str(t.id);
    w.str(t.name);
    w.u8(static_cast<std::uint8_t>(t.scheme));
    w.u64(t.participants.size());
    for (const auto& participant : t.participants) {
        writeParticipant(w, participant);
    }
    w.u64(t.rounds.size());
    for (const auto& round : t.rounds) {
        w.u32(round.roundNumber);
        w.u64(round.matches.size());
        for (const auto& match : round.matches) {
            writeMatch(w, match);
        }
    }
    w.u8(static_cast<std::uint8_t>(t.status));
    w.u64(t.createdAt);
    w.u64(t.startsAt);
    w.u64(t.bracketLockTime);
    writeOptional(w, t.completedAt, [&](std::uint64_t v) { w.u64(v); });
    w.u32(t.currentRound);
    w.u32(t.totalRounds);
    writeStringMap(w, t.bettingPools);
    w.u64(t.bracketBets.size());
    for (const auto& [userId, bet] : t.bracketBets) {
        w.str(userId);
        writeBracketBet(w, bet);
    }
    w.u64(t.liveBets.size());
    for (const auto& [matchId, bets] : t.liveBets) {
        w.str(matchId);
        w.u64(bets.size());
        for (const auto& bet : bets) {
            writeLiveBet(w, bet);
        }
    }
    w.amount(t.prizePool.total);
    w.amount(t.prizePool.bracketPool);
    w.amount(t.prizePool.matchPools);
    w.amount(t.prizePool.bonusPool);
    writeResults(w, t.results);
    w.u64(t.version);
    return w.take();
}

Tournament deserializeTournament(const std::string& document) {
    Reader r(document);
    r.expect(kMagic, 4);
    if (r.u32() != kFormatVersion) {
        throw std::invalid_argument("tournament document: unsupported format version");
    }

    Tournament t;
    t.id = r.str();
    t.name = r.str();
    t.scheme = r.enumeration(TournamentScheme::RoundRobin);
    const auto participants = r.count();
    for (std::size_t i = 0; i < participants; ++i) {
        t.participants.push_back(readParticipant(r));
    }
    const auto rounds = r.count();
    for (std::size_t i = 0; i < rounds; ++i) {
        BracketRound round;
        round.roundNumber = r.u32();
        const auto matches = r.count();
        for (std::size_t j = 0; j < matches; ++j) {
            round.matches.push_back(readMatch(r));
        }
        t.rounds.push_back(std::move(round));
    }
    t.status = r.enumeration(TournamentStatus::Completed);
    t.createdAt = r.u64();
    t.startsAt = r.u64();
    t.bracketLockTime = r.u64();
    t.completedAt = readOptional<std::uint64_t>(r, [&] { return r.u64(); });
    t.currentRound = r.u32();
    t.totalRounds = r.u32();
    t.bettingPools = readStringMap(r);
    const auto bracketBets = r.count();
    for (std::size_t i = 0; i < bracketBets; ++i) {
        auto userId = r.str();
        t.bracketBets.emplace(std::move(userId), readBracketBet(r));
    }
    const auto liveMatches = r.count();
    for (std::size_t i = 0; i < liveMatches; ++i) {
        auto matchId = r.str();
        auto& bets = t.liveBets[matchId];
        const auto n = r.count();
        for (std::size_t j = 0; j < n; ++j) {
            bets.push_back(readLiveBet(r));
        }
    }
    t.prizePool.total = r.amount();
    t.prizePool.bracketPool = r.amount();
    t.prizePool.matchPools = r.amount();
    t.prizePool.bonusPool = r.amount();
    t.results = readResults(r);
    t.version = r.u64();
    r.finish();
    return t;
}

} // namespace arb
