#pragma once

#include "audit_store.hpp"
#include "clock.hpp"
#include "config.hpp"
#include "event_signer.hpp"
#include "fixed_point.hpp"
#include "logging.hpp"

#include <array>
#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace arb {

struct TransactionRecord {
    std::string userId;
    std::string userWallet;
    std::string transactionType; // deposit, withdrawal, bet, payout, fee, refund, ...
    Fixed64 amount;
    std::string currency = "SOL";
    std::string fromAddress;
    std::string toAddress;
    std::string transactionHash;
    std::optional<std::uint64_t> blockNumber;
    std::string status = "pending";
    std::string poolId;
    std::string matchId;
    std::string tournamentId;
    std::string escrowId;
    std::string description;
    std::vector<std::string> relatedTransactions;
};

struct BetRecord {
    std::string userId;
    std::string userWallet;
    std::string betType; // pool, bracket, live
    std::string poolId;
    std::string outcomeId;
    Fixed64 amount;
    Fixed64 odds;
    Fixed64 potentialPayout;
    std::string status = "placed";
    std::string matchId;
    std::string tournamentId;
    std::optional<std::uint32_t> roundNumber;
    std::string placementMethod = "api";
    std::string sessionId;
    std::vector<std::string> securityFlags;
};

struct PayoutRecord {
    std::string userId;
    std::string userWallet;
    std::string payoutType; // pool, bracket, live, refund
    Fixed64 amount;
    Fixed64 originalBetAmount;
    Fixed64 odds;
    std::string poolId;
    std::string settlementId;
    std::string betId;
    std::string matchId;
    std::string tournamentId;
    std::string winningOutcome;
    std::string settlementMethod = "automatic";
    Fixed64 platformFee;
};

struct EscrowParticipant {
    std::string userId;
    Fixed64 amount;
};

struct EscrowRecord {
    std::string escrowId;
    std::string operation; // create, deposit, release, refund, dispute
    std::string initiator;
    std::vector<EscrowParticipant> participants;
    Fixed64 amount;
    std::string status;
    std::string eventId;
    std::uint32_t multisigThreshold = 0;
    std::vector<std::string> authorities;
    std::string disputeReason;
    std::string resolutionMethod;
};

enum class Severity { Low, Medium, High, Critical };

const char* severityName(Severity severity);

struct SecurityRecord {
    std::string eventType;
    Severity severity = Severity::Low;
    std::optional<std::string> userId;
    std::string description;
    std::string source;
    std::optional<double> riskScore;
    std::vector<std::string> triggers;
    std::string sessionId;
    std::vector<std::string> actionsTaken;
    bool falsePositive = false;
};

struct SystemRecord {
    std::string eventType;
    std::string component;
    std::string subjectId;
    std::string matchId;
    std::string description;
    std::map<std::string, std::string> details;
};

struct IntegrityCheck {
    AuditCategory category = AuditCategory::System;
    bool passed = true;
    std::size_t checkedEntries = 0;
    std::optional<std::size_t> firstBrokenPosition;
    // The first offending entry and every entry after it.
    std::vector<std::string> brokenEntryIds;
    std::string reason;
    std::string anchor;
    std::string merkleRoot;
    std::uint64_t timestamp = 0;
};

struct IntegrityIssue {
    Severity severity = Severity::Critical;
    std::string type;
    AuditCategory category = AuditCategory::System;
    std::string details;
};

struct IntegrityReport {
    std::uint64_t generatedAt = 0;
    std::string overallStatus; // healthy, compromised
    std::vector<IntegrityCheck> checks;
    std::vector<IntegrityIssue> issues;
    std::vector<std::string> recommendations;
};

struct ReportCriteria {
    std::uint64_t startTime = 0;
    std::uint64_t endTime = 0;
    AuditCategory category = AuditCategory::Transaction;
    std::optional<std::string> userId;
    bool includeDetails = false;
};

struct TypeTotals {
    std::size_t count = 0;
    Fixed64 volume;
};

enum class AnomalyKind { AmountOutlier, BrokenChain };

struct Anomaly {
    AnomalyKind kind = AnomalyKind::AmountOutlier;
    std::string entryId;
    std::uint64_t timestamp = 0;
    std::optional<Fixed64> amount;
    Fixed64 runningMean;
    std::string description;
};

struct FinancialReport {
    std::uint64_t generatedAt = 0;
    ReportCriteria criteria;
    std::size_t totalRecords = 0;
    Fixed64 totalVolume;
    Fixed64 totalBets;
    Fixed64 totalPayouts;
    Fixed64 totalFees;
    Fixed64 netRevenue;
    std::size_t uniqueUsers = 0;
    std::map<std::string, TypeTotals> byType;
    Fixed64 averageSize;
    // Entries with signature and fingerprint stripped; filled on request.
    std::vector<AuditEntry> details;
    std::vector<Anomaly> anomalies;
    IntegrityCheck integrity;
    std::string integrityStatus; // verified, compromised
};

struct PruneResult {
    std::array<std::size_t, kAuditCategoryCount> removed{};
    std::size_t total() const;
};

// What one maintenance pass ran; a step that was not due is empty.
struct MaintenanceResult {
    std::optional<IntegrityReport> integrity;
    std::optional<PruneResult> pruned;
};

struct AuditMetrics {
    std::uint64_t totalLogs = 0;
    std::array<std::uint64_t, kAuditCategoryCount> logsByCategory{};
    std::uint64_t integrityChecks = 0;
    std::uint64_t tamperDetections = 0;
    std::optional<std::uint64_t> lastIntegrityCheck;
};

// Per-category HMAC-signed hash chains over an AuditStore. Each append
// links to the previous head; verification replays the chain from its
// anchor ("genesis", or the head left behind by retention pruning).
class AuditChain {
public:
    AuditChain(AuditConfig config, AuditStorePtr store, ClockPtr clock);

    std::string logTransaction(const TransactionRecord& record);
    std::string logBet(const BetRecord& record);
    std::string logPayout(const PayoutRecord& record);
    std::string logEscrow(const EscrowRecord& record);
    std::string logSecurityEvent(const SecurityRecord& record);
    std::string logSystemEvent(const SystemRecord& record);

    IntegrityCheck verifyLogIntegrity(AuditCategory category) const;
    IntegrityReport generateIntegrityReport() const;

    PruneResult pruneExpired();

    // Runs the integrity self-check over every chain and retention pruning,
    // each once its interval has elapsed since it last ran.
    MaintenanceResult runMaintenanceOnce();
    void runMaintenance(const std::atomic<bool>& stop);

    FinancialReport generateFinancialReport(const ReportCriteria& criteria) const;

    // Retained entries with startTime <= timestamp <= endTime, in chain order.
    std::vector<AuditEntry> entriesInRange(AuditCategory category,
                                           std::uint64_t startTime,
                                           std::uint64_t endTime,
                                           const std::optional<std::string>& userId = std::nullopt) const;

    std::optional<AuditEntry> getEntry(AuditCategory category, const std::string& id) const;
    std::vector<UserAuditRef> userTrail(const std::string& userId) const;

    AuditMetrics metrics() const;
    // Advisory: set once any verification has failed. Appends continue.
    bool isCompromised() const { return compromised_.load(); }

private:
    struct Draft {
        AuditCategory category = AuditCategory::System;
        std::string idPrefix;
        std::string type;
        std::string userId;
        std::vector<std::string> actors;
        std::optional<Fixed64> amount;
        CanonicalRecord payload;
        // Users whose trail should reference the entry.
        std::vector<std::string> indexedUsers;
    };

    std::string append(Draft draft);

    AuditConfig config_;
    AuditStorePtr store_;
    ClockPtr clock_;
    EventSigner signer_;
    Logger logger_;

    mutable std::array<std::mutex, kAuditCategoryCount> chainLocks_;
    mutable std::mutex metricsMutex_;
    mutable AuditMetrics metrics_;
    mutable std::atomic<bool> compromised_{false};

    std::mutex maintenanceMutex_;
    std::uint64_t lastSelfCheck_ = 0;
    std::uint64_t lastPrune_ = 0;
};

} // namespace arb
