#include "config.hpp"

#include "errors.hpp"

#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace arb {

namespace {

std::string trim(const std::string& value) {
    const auto start = value.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t\n\r\f\v");
    return value.substr(start, end - start + 1);
}

std::uint64_t parseUnsigned(const char* name, const std::string& value) {
    try {
        std::size_t consumed = 0;
        auto parsed = std::stoull(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return parsed;
    } catch (const std::exception& ex) {
        std::ostringstream oss;
        oss << name << " must be an unsigned integer (" << ex.what() << ")";
        throw std::invalid_argument(oss.str());
    }
}

} // namespace

std::optional<std::string> readEnv(const char* name) {
    const char* raw = std::getenv(name);
    if (raw == nullptr) {
        return std::nullopt;
    }
    std::string value = trim(raw);
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

void ResolverConfig::validate() const {
    if (maxResolutionDelayMs <= minResolutionDelayMs) {
        throw std::invalid_argument(
            "maxResolutionDelayMs must be greater than minResolutionDelayMs");
    }
    if (pollIntervalMs == 0) {
        throw std::invalid_argument("pollIntervalMs must be positive");
    }
    if (vrfAuthority.empty()) {
        throw std::invalid_argument("vrfAuthority must not be empty");
    }
}

void TournamentConfig::validate() const {
    if (minBracketSize < 2 || minBracketSize > maxBracketSize) {
        throw std::invalid_argument("bracket size bounds are inconsistent");
    }
    if (!maxLiveBetAmount.isPositive()) {
        throw std::invalid_argument("maxLiveBetAmount must be positive");
    }
    if (minLiveOdds <= 1.0 || baseLiveOdds < minLiveOdds) {
        throw std::invalid_argument("live odds bounds are inconsistent");
    }
}

ResolverConfig loadResolverConfigFromEnv() {
    ResolverConfig cfg;
    if (auto v = readEnv("ARB_VRF_MIN_DELAY_MS")) {
        cfg.minResolutionDelayMs = parseUnsigned("ARB_VRF_MIN_DELAY_MS", *v);
    }
    if (auto v = readEnv("ARB_VRF_MAX_DELAY_MS")) {
        cfg.maxResolutionDelayMs = parseUnsigned("ARB_VRF_MAX_DELAY_MS", *v);
    }
    if (auto v = readEnv("ARB_VRF_AUTHORITY")) {
        cfg.vrfAuthority = *v;
    }
    cfg.validate();
    return cfg;
}

AuditConfig loadAuditConfigFromEnv() {
    AuditConfig cfg;
    auto key = readEnv("ARB_AUDIT_SIGNING_KEY");
    if (!key) {
        throw IntegrityError("ARB_AUDIT_SIGNING_KEY must be set; refusing to sign audit entries");
    }
    if (*key == "default") {
        throw IntegrityError(
            "ARB_AUDIT_SIGNING_KEY cannot be \"default\"; provision a deployment-specific key");
    }
    cfg.signingKey = std::move(*key);
    if (auto v = readEnv("ARB_AUDIT_CHECK_INTERVAL_MS")) {
        cfg.integrityCheckIntervalMs = parseUnsigned("ARB_AUDIT_CHECK_INTERVAL_MS", *v);
    }
    if (auto v = readEnv("ARB_AUDIT_PRUNE_INTERVAL_MS")) {
        cfg.pruneIntervalMs = parseUnsigned("ARB_AUDIT_PRUNE_INTERVAL_MS", *v);
    }
    return cfg;
}

TournamentConfig loadTournamentConfigFromEnv() {
    TournamentConfig cfg;
    if (auto v = readEnv("ARB_LIVE_BETTING")) {
        if (*v != "0" && *v != "1") {
            throw std::invalid_argument("ARB_LIVE_BETTING must be 0 or 1");
        }
        cfg.liveBettingEnabled = (*v == "1");
    }
    if (auto v = readEnv("ARB_MAX_LIVE_BET")) {
        auto units = parseUnsigned("ARB_MAX_LIVE_BET", *v);
        cfg.maxLiveBetAmount = Fixed64::fromUnits(static_cast<std::int64_t>(units));
    }
    cfg.validate();
    return cfg;
}

} // namespace arb
