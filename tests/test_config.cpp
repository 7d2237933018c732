#include "config.hpp"
#include "errors.hpp"
#include "logging.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "config_test failure: " << msg << std::endl;
    std::exit(1);
}

template <typename E, typename Fn>
void expectThrow(Fn&& fn, const std::string& what) {
    try {
        fn();
    } catch (const E&) {
        return;
    }
    fail(what);
}

} // namespace

int main() {
    using namespace arb;

    ::setenv("ARB_VRF_MIN_DELAY_MS", " 2000 ", 1);
    ::setenv("ARB_VRF_MAX_DELAY_MS", "9000", 1);
    ::setenv("ARB_VRF_AUTHORITY", "devnet", 1);
    const auto resolver = loadResolverConfigFromEnv();
    if (resolver.minResolutionDelayMs != 2'000 || resolver.maxResolutionDelayMs != 9'000 ||
        resolver.vrfAuthority != "devnet" || resolver.pollIntervalMs != 1'000) {
        fail("resolver overrides not applied");
    }
    ::setenv("ARB_VRF_MAX_DELAY_MS", "1500", 1);
    expectThrow<std::invalid_argument>([] { loadResolverConfigFromEnv(); },
                                       "max delay below min delay accepted");
    ::setenv("ARB_VRF_MAX_DELAY_MS", "12s", 1);
    expectThrow<std::invalid_argument>([] { loadResolverConfigFromEnv(); },
                                       "non-numeric delay accepted");

    ::unsetenv("ARB_AUDIT_SIGNING_KEY");
    expectThrow<IntegrityError>([] { loadAuditConfigFromEnv(); }, "missing signing key accepted");
    ::setenv("ARB_AUDIT_SIGNING_KEY", "   ", 1);
    expectThrow<IntegrityError>([] { loadAuditConfigFromEnv(); }, "blank signing key accepted");
    ::setenv("ARB_AUDIT_SIGNING_KEY", "default", 1);
    expectThrow<IntegrityError>([] { loadAuditConfigFromEnv(); }, "placeholder signing key accepted");
    ::setenv("ARB_AUDIT_SIGNING_KEY", "k3y", 1);
    ::setenv("ARB_AUDIT_CHECK_INTERVAL_MS", "60000", 1);
    const auto audit = loadAuditConfigFromEnv();
    if (audit.signingKey != "k3y" || audit.anomalyMinSamples != 5 ||
        audit.retentionMs[5] != 30ULL * 24 * 60 * 60 * 1000 ||
        audit.integrityCheckIntervalMs != 60'000 ||
        audit.pruneIntervalMs != 24ULL * 60 * 60 * 1000) {
        fail("audit config not loaded");
    }

    ::setenv("ARB_LIVE_BETTING", "0", 1);
    ::setenv("ARB_MAX_LIVE_BET", "250", 1);
    const auto tournament = loadTournamentConfigFromEnv();
    if (tournament.liveBettingEnabled || tournament.maxLiveBetAmount != Fixed64::fromUnits(250) ||
        tournament.bracketBettingClosureMs != 60ULL * 60 * 1000) {
        fail("tournament overrides not applied");
    }
    ::setenv("ARB_LIVE_BETTING", "yes", 1);
    expectThrow<std::invalid_argument>([] { loadTournamentConfigFromEnv(); },
                                       "non-boolean live betting flag accepted");
    ::setenv("ARB_LIVE_BETTING", "1", 1);
    ::setenv("ARB_MAX_LIVE_BET", "0", 1);
    expectThrow<std::invalid_argument>([] { loadTournamentConfigFromEnv(); },
                                       "zero live bet cap accepted");

    TournamentConfig inverted;
    inverted.minBracketSize = 8;
    inverted.maxBracketSize = 4;
    expectThrow<std::invalid_argument>([&] { inverted.validate(); },
                                       "inverted bracket bounds accepted");

    ::setenv("ARB_LOG_LEVEL", "debug", 1);
    configureLogging();
    if (spdlog::get_level() != spdlog::level::debug) {
        fail("log level not taken from the environment");
    }
    auto logger = createLogger("config_test");
    if (createLogger("config_test") != logger) {
        fail("loggers should be reused by tag");
    }
    ::setenv("ARB_LOG_LEVEL", "nonsense", 1);
    configureLogging();
    if (spdlog::get_level() != spdlog::level::info) {
        fail("unknown log level should fall back to info");
    }

    std::cout << "config_test: ok\n";
    return 0;
}
