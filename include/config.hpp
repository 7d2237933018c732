#pragma once

#include "fixed_point.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace arb {

// Trimmed value of an environment variable; nullopt when unset or blank.
std::optional<std::string> readEnv(const char* name);

struct ResolverConfig {
    std::uint64_t minResolutionDelayMs = 5'000;
    std::uint64_t maxResolutionDelayMs = 30'000;
    std::uint64_t pollIntervalMs = 1'000;
    std::uint64_t requestRetentionMs = 24ULL * 60 * 60 * 1000;
    std::string vrfAuthority = "arbiter";

    void validate() const;
};

constexpr std::size_t kAuditCategoryCount = 6;

struct AuditConfig {
    // HMAC key for entry signatures. Moved into the signer and wiped there.
    std::string signingKey;
    // Indexed by AuditCategory.
    std::array<std::uint64_t, kAuditCategoryCount> retentionMs{
        30ULL * 24 * 60 * 60 * 1000,  // transaction
        90ULL * 24 * 60 * 60 * 1000,  // bet
        90ULL * 24 * 60 * 60 * 1000,  // payout
        180ULL * 24 * 60 * 60 * 1000, // escrow
        360ULL * 24 * 60 * 60 * 1000, // security
        30ULL * 24 * 60 * 60 * 1000,  // system
    };
    double anomalyFactor = 3.0;
    std::size_t anomalyMinSamples = 5;
    // Maintenance schedule, measured on the chain's clock.
    std::uint64_t integrityCheckIntervalMs = 60ULL * 60 * 1000;
    std::uint64_t pruneIntervalMs = 24ULL * 60 * 60 * 1000;
    // Wall-clock sleep between maintenance passes in runMaintenance().
    std::uint64_t maintenancePollMs = 1'000;
};

struct TournamentConfig {
    std::size_t minBracketSize = 4;
    std::size_t maxBracketSize = 64;
    std::uint64_t bracketBettingClosureMs = 60ULL * 60 * 1000;
    bool liveBettingEnabled = true;
    Fixed64 maxLiveBetAmount = Fixed64::fromUnits(1000);
    Fixed64 bracketBonusMultiplier = Fixed64::fromDouble(2.0);
    Fixed64 advancementBonusRate = Fixed64::fromDouble(0.1);
    double baseLiveOdds = 2.0;
    double liveOddsSensitivity = 0.5;
    double minLiveOdds = 1.01;

    void validate() const;
};

ResolverConfig loadResolverConfigFromEnv();
AuditConfig loadAuditConfigFromEnv();
TournamentConfig loadTournamentConfigFromEnv();

} // namespace arb
