#include "betting_pool.hpp"

#include "errors.hpp"
#include "secure_random.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace arb {

namespace {

Fixed64 stakeOn(const std::vector<PoolBet>& bets) {
    Fixed64 total;
    for (const auto& bet : bets) {
        total += bet.stake;
    }
    return total;
}

bool offersOutcome(const PoolSpec& spec, const std::string& outcomeId) {
    return std::find(spec.outcomes.begin(), spec.outcomes.end(), outcomeId) != spec.outcomes.end();
}

} // namespace

ParimutuelPoolService::ParimutuelPoolService(ClockPtr clock,
                                             std::shared_ptr<AuditChain> audit,
                                             Fixed64 trackTake)
    : clock_(std::move(clock))
    , audit_(std::move(audit))
    , trackTake_(trackTake)
    , logger_(createLogger("pools")) {
    if (!clock_) {
        throw std::invalid_argument("ParimutuelPoolService requires a clock");
    }
    if (trackTake_ < Fixed64() || trackTake_ >= Fixed64::fromUnits(1)) {
        throw std::invalid_argument("track take must lie in [0, 1)");
    }
}

std::string ParimutuelPoolService::createPool(const PoolSpec& spec) {
    if (spec.outcomes.size() < 2) {
        throw ValidationError("a pool needs at least two outcomes");
    }
    for (const auto& outcome : spec.outcomes) {
        if (outcome.empty()) {
            throw ValidationError("pool outcome ids must not be empty");
        }
        if (std::count(spec.outcomes.begin(), spec.outcomes.end(), outcome) > 1) {
            throw ValidationError("pool outcome ids must be distinct");
        }
    }
    if (!spec.initialOdds.isPositive()) {
        throw ValidationError("initial odds must be positive");
    }

    const auto poolId = makeEntityId("pool", clock_->nowMillis());
    Pool pool;
    pool.spec = spec;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pools_.emplace(poolId, std::move(pool));
    }
    logger_->debug("created pool {} for match {}", poolId, spec.matchId);
    return poolId;
}

void ParimutuelPoolService::placeBet(const std::string& poolId,
                                     const std::string& bettorId,
                                     const std::string& outcomeId,
                                     Fixed64 stake) {
    if (bettorId.empty()) {
        throw ValidationError("bettor id must not be empty");
    }
    if (!stake.isPositive()) {
        throw ValidationError("Stake must be positive");
    }

    PoolBet bet{bettorId, outcomeId, stake, clock_->nowMillis()};
    Fixed64 odds;
    std::string matchId;
    std::string tournamentId;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pools_.find(poolId);
        if (it == pools_.end()) {
            throw ValidationError("unknown pool " + poolId);
        }
        auto& pool = it->second;
        if (pool.settled) {
            throw ValidationError("pool " + poolId + " is already settled");
        }
        if (bet.placedAt >= pool.spec.closesAt) {
            throw ValidationError("pool " + poolId + " is closed");
        }
        if (!offersOutcome(pool.spec, outcomeId)) {
            throw ValidationError("outcome " + outcomeId + " is not offered by pool " + poolId);
        }
        const Fixed64 total = pool.totalPool + stake;
        if (total.raw() == std::numeric_limits<std::int64_t>::max()) {
            throw ValidationError("Total pool capacity exceeded");
        }
        pool.bets[outcomeId].push_back(bet);
        pool.totalPool = total;
        odds = oddsFor(pool, outcomeId);
        matchId = pool.spec.matchId;
        tournamentId = pool.spec.tournamentId;
    }

    if (audit_) {
        BetRecord record;
        record.userId = bettorId;
        record.betType = "pool";
        record.poolId = poolId;
        record.outcomeId = outcomeId;
        record.amount = stake;
        record.odds = odds;
        record.potentialPayout = stake * odds;
        record.matchId = matchId;
        record.tournamentId = tournamentId;
        // The stake is booked; audit failures are logged.
        try {
            audit_->logBet(record);
        } catch (const std::exception& e) {
            logger_->error("failed to audit bet on pool {}: {}", poolId, e.what());
        }
    }
}

Fixed64 ParimutuelPoolService::oddsFor(const Pool& pool, const std::string& outcomeId) const {
    auto it = pool.bets.find(outcomeId);
    const Fixed64 onOutcome = it == pool.bets.end() ? Fixed64() : stakeOn(it->second);
    if (!onOutcome.isPositive()) {
        return pool.spec.initialOdds;
    }
    const Fixed64 netPool = pool.totalPool * (Fixed64::fromUnits(1) - trackTake_);
    if (!netPool.isPositive()) {
        return Fixed64();
    }
    return netPool / onOutcome;
}

const ParimutuelPoolService::Pool& ParimutuelPoolService::findPool(const std::string& poolId) const {
    auto it = pools_.find(poolId);
    if (it == pools_.end()) {
        throw ValidationError("unknown pool " + poolId);
    }
    return it->second;
}

Fixed64 ParimutuelPoolService::currentOdds(const std::string& poolId,
                                           const std::string& outcomeId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto& pool = findPool(poolId);
    if (!offersOutcome(pool.spec, outcomeId)) {
        throw ValidationError("outcome " + outcomeId + " is not offered by pool " + poolId);
    }
    return oddsFor(pool, outcomeId);
}

std::map<std::string, Fixed64> ParimutuelPoolService::impliedOdds(const std::string& poolId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto& pool = findPool(poolId);
    std::map<std::string, Fixed64> odds;
    for (const auto& outcome : pool.spec.outcomes) {
        odds[outcome] = oddsFor(pool, outcome);
    }
    return odds;
}

std::optional<PoolSnapshot> ParimutuelPoolService::getPool(const std::string& poolId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pools_.find(poolId);
    if (it == pools_.end()) {
        return std::nullopt;
    }
    const auto& pool = it->second;
    PoolSnapshot snapshot;
    snapshot.poolId = poolId;
    snapshot.spec = pool.spec;
    snapshot.totalPool = pool.totalPool;
    for (const auto& [outcome, bets] : pool.bets) {
        snapshot.stakeByOutcome[outcome] = stakeOn(bets);
        snapshot.betCount += bets.size();
    }
    snapshot.settled = pool.settled;
    snapshot.winningOutcome = pool.winningOutcome;
    return snapshot;
}

PoolSettlement ParimutuelPoolService::settlePool(const std::string& poolId,
                                                 const std::string& winningOutcomeId) {
    PoolSettlement settlement;
    settlement.poolId = poolId;
    settlement.winningOutcome = winningOutcomeId;
    std::string matchId;
    std::string tournamentId;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pools_.find(poolId);
        if (it == pools_.end()) {
            throw ValidationError("unknown pool " + poolId);
        }
        auto& pool = it->second;
        if (pool.settled) {
            if (pool.winningOutcome != winningOutcomeId) {
                throw ValidationError("pool " + poolId + " is already settled on " +
                                      pool.winningOutcome.value_or(""));
            }
            logger_->warn("pool {} already settled on {}, returning recorded settlement", poolId,
                          winningOutcomeId);
            return pool.settlement;
        }
        if (!offersOutcome(pool.spec, winningOutcomeId)) {
            throw ValidationError("outcome " + winningOutcomeId + " is not offered by pool " +
                                  poolId);
        }
        matchId = pool.spec.matchId;
        tournamentId = pool.spec.tournamentId;

        auto winnerIt = pool.bets.find(winningOutcomeId);
        const Fixed64 winnerStake =
            winnerIt == pool.bets.end() ? Fixed64() : stakeOn(winnerIt->second);

        if (!winnerStake.isPositive()) {
            settlement.voided = true;
            settlement.odds = Fixed64::fromUnits(1);
            for (const auto& [outcome, bets] : pool.bets) {
                for (const auto& bet : bets) {
                    settlement.payouts.push_back(
                        PoolPayout{bet.bettorId, outcome, bet.stake, bet.stake, Fixed64()});
                }
            }
        } else {
            settlement.odds = oddsFor(pool, winningOutcomeId);
            settlement.distributable = pool.totalPool * (Fixed64::fromUnits(1) - trackTake_);
            for (const auto& [outcome, bets] : pool.bets) {
                for (const auto& bet : bets) {
                    if (outcome == winningOutcomeId) {
                        const Fixed64 payout = bet.stake * settlement.odds;
                        settlement.payouts.push_back(PoolPayout{bet.bettorId, outcome, bet.stake,
                                                                payout, payout - bet.stake});
                    } else {
                        settlement.payouts.push_back(PoolPayout{
                            bet.bettorId, outcome, bet.stake, Fixed64(), Fixed64() - bet.stake});
                    }
                }
            }
        }
        pool.settled = true;
        pool.winningOutcome = winningOutcomeId;
        pool.settlement = settlement;
    }

    logger_->info("settled pool {} on {} ({} bets{})", poolId, winningOutcomeId,
                  settlement.payouts.size(), settlement.voided ? ", voided" : "");

    if (audit_) {
        for (const auto& payout : settlement.payouts) {
            if (!payout.payout.isPositive()) {
                continue;
            }
            PayoutRecord record;
            record.userId = payout.bettorId;
            record.payoutType = settlement.voided ? "refund" : "pool";
            record.amount = payout.payout;
            record.originalBetAmount = payout.stake;
            record.odds = settlement.odds;
            record.poolId = poolId;
            record.matchId = matchId;
            record.tournamentId = tournamentId;
            record.winningOutcome = winningOutcomeId;
            audit_->logPayout(record);
        }
    }
    return settlement;
}

} // namespace arb
