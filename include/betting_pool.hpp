#pragma once

#include "audit_chain.hpp"
#include "clock.hpp"
#include "fixed_point.hpp"
#include "logging.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace arb {

struct PoolSpec {
    std::string tournamentId;
    std::string matchId;
    std::vector<std::string> outcomes;
    Fixed64 initialOdds = Fixed64::fromUnits(2);
    std::uint64_t closesAt = 0;
};

struct PoolPayout {
    std::string bettorId;
    std::string outcomeId;
    Fixed64 stake;
    Fixed64 payout;
    Fixed64 netChange;
};

struct PoolSettlement {
    std::string poolId;
    std::string winningOutcome;
    // No stake on the winner: every bet is refunded.
    bool voided = false;
    Fixed64 odds;
    Fixed64 distributable;
    std::vector<PoolPayout> payouts;
};

// Betting pools consumed by the bracket engine.
class BettingPoolService {
public:
    virtual ~BettingPoolService() = default;
    virtual std::string createPool(const PoolSpec& spec) = 0;
    virtual PoolSettlement settlePool(const std::string& poolId,
                                      const std::string& winningOutcomeId) = 0;
};

using PoolServicePtr = std::shared_ptr<BettingPoolService>;

struct PoolBet {
    std::string bettorId;
    std::string outcomeId;
    Fixed64 stake;
    std::uint64_t placedAt = 0;
};

struct PoolSnapshot {
    std::string poolId;
    PoolSpec spec;
    Fixed64 totalPool;
    std::map<std::string, Fixed64> stakeByOutcome;
    std::size_t betCount = 0;
    bool settled = false;
    std::optional<std::string> winningOutcome;
};

// In-memory parimutuel pools. Winners split the pool net of the track take
// in proportion to stake.
class ParimutuelPoolService : public BettingPoolService {
public:
    explicit ParimutuelPoolService(ClockPtr clock,
                                   std::shared_ptr<AuditChain> audit = nullptr,
                                   Fixed64 trackTake = Fixed64::fromRatio(1, 10));

    std::string createPool(const PoolSpec& spec) override;
    // Settling again on the recorded winner returns the recorded settlement
    // without paying twice; a different winner is rejected.
    PoolSettlement settlePool(const std::string& poolId,
                              const std::string& winningOutcomeId) override;

    void placeBet(const std::string& poolId,
                  const std::string& bettorId,
                  const std::string& outcomeId,
                  Fixed64 stake);

    // Parimutuel odds for an outcome; the pool's initial odds until stake
    // arrives on that outcome.
    Fixed64 currentOdds(const std::string& poolId, const std::string& outcomeId) const;
    std::map<std::string, Fixed64> impliedOdds(const std::string& poolId) const;
    std::optional<PoolSnapshot> getPool(const std::string& poolId) const;

private:
    struct Pool {
        PoolSpec spec;
        std::map<std::string, std::vector<PoolBet>> bets;
        Fixed64 totalPool;
        bool settled = false;
        std::optional<std::string> winningOutcome;
        PoolSettlement settlement;
    };

    const Pool& findPool(const std::string& poolId) const;
    Fixed64 oddsFor(const Pool& pool, const std::string& outcomeId) const;

    ClockPtr clock_;
    std::shared_ptr<AuditChain> audit_;
    Fixed64 trackTake_;
    Logger logger_;

    mutable std::mutex mutex_;
    std::map<std::string, Pool> pools_;
};

} // namespace arb
