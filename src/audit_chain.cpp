#include "audit_chain.hpp"

#include "errors.hpp"
#include "secure_memory.hpp"
#include "secure_random.hpp"

#include <algorithm>
#include <chrono>
#include <set>
#include <stdexcept>
#include <thread>
#include <utility>

namespace arb {

namespace {

std::string checkedKey(std::string& key) {
    if (key.empty() || key == "default") {
        throw IntegrityError("audit signing key is missing or uses the placeholder value");
    }
    return std::move(key);
}

std::string hashPair(const std::string& left, const std::string& right) {
    return sha256Hex(left + right);
}

// Pairwise SHA-256 tree; an odd node is paired with itself.
std::string merkleRootOf(std::vector<std::string> layer) {
    if (layer.empty()) {
        return {};
    }
    while (layer.size() > 1) {
        std::vector<std::string> next;
        next.reserve((layer.size() + 1) / 2);
        for (std::size_t i = 0; i < layer.size(); i += 2) {
            const std::string& right = (i + 1 < layer.size()) ? layer[i + 1] : layer[i];
            next.push_back(hashPair(layer[i], right));
        }
        layer = std::move(next);
    }
    return layer.front();
}

std::vector<std::string> participantIds(const std::vector<EscrowParticipant>& participants) {
    std::vector<std::string> ids;
    ids.reserve(participants.size());
    for (const auto& participant : participants) {
        ids.push_back(participant.userId);
    }
    return ids;
}

enum class FlowKind { Bet, Payout, Fee, Other };

FlowKind classify(const AuditEntry& entry) {
    if (entry.category == AuditCategory::Bet) {
        return FlowKind::Bet;
    }
    if (entry.category == AuditCategory::Payout) {
        return FlowKind::Payout;
    }
    auto kind = entry.payload.get("kind").value_or("");
    if (kind == "bet") {
        return FlowKind::Bet;
    }
    if (kind == "payout") {
        return FlowKind::Payout;
    }
    if (kind == "fee") {
        return FlowKind::Fee;
    }
    return FlowKind::Other;
}

} // namespace

const char* severityName(Severity severity) {
    switch (severity) {
    case Severity::Low:
        return "low";
    case Severity::Medium:
        return "medium";
    case Severity::High:
        return "high";
    case Severity::Critical:
        return "critical";
    }
    throw std::invalid_argument("unknown severity");
}

std::size_t PruneResult::total() const {
    std::size_t sum = 0;
    for (auto count : removed) {
        sum += count;
    }
    return sum;
}

AuditChain::AuditChain(AuditConfig config, AuditStorePtr store, ClockPtr clock)
    : config_(std::move(config))
    , store_(std::move(store))
    , clock_(std::move(clock))
    , signer_(checkedKey(config_.signingKey))
    , logger_(createLogger("audit")) {
    secureZero(config_.signingKey);
    if (!store_ || !clock_) {
        throw std::invalid_argument("AuditChain requires a store and a clock");
    }
    lastSelfCheck_ = lastPrune_ = clock_->nowMillis();
}

std::string AuditChain::logTransaction(const TransactionRecord& record) {
    Draft draft;
    draft.category = AuditCategory::Transaction;
    draft.idPrefix = "TXN";
    draft.type = "transaction";
    draft.userId = record.userId;
    draft.actors = {record.userId};
    draft.amount = record.amount;
    draft.payload.set("kind", record.transactionType)
        .set("userId", record.userId)
        .set("userWallet", record.userWallet)
        .setAmount("amount", record.amount)
        .set("currency", record.currency)
        .set("fromAddress", record.fromAddress)
        .set("toAddress", record.toAddress)
        .set("transactionHash", record.transactionHash)
        .set("status", record.status)
        .set("poolId", record.poolId)
        .set("matchId", record.matchId)
        .set("tournamentId", record.tournamentId)
        .set("escrowId", record.escrowId)
        .set("description", record.description)
        .setList("relatedTransactions", record.relatedTransactions);
    if (record.blockNumber) {
        draft.payload.setNumber("blockNumber", *record.blockNumber);
    }
    draft.indexedUsers = {record.userId};
    return append(std::move(draft));
}

std::string AuditChain::logBet(const BetRecord& record) {
    Draft draft;
    draft.category = AuditCategory::Bet;
    draft.idPrefix = "BET";
    draft.type = "bet";
    draft.userId = record.userId;
    draft.actors = {record.userId};
    draft.amount = record.amount;
    draft.payload.set("kind", record.betType)
        .set("userId", record.userId)
        .set("userWallet", record.userWallet)
        .set("poolId", record.poolId)
        .set("outcomeId", record.outcomeId)
        .setAmount("amount", record.amount)
        .setAmount("odds", record.odds)
        .setAmount("potentialPayout", record.potentialPayout)
        .set("status", record.status)
        .set("matchId", record.matchId)
        .set("tournamentId", record.tournamentId)
        .set("placementMethod", record.placementMethod)
        .set("sessionId", record.sessionId)
        .setList("securityFlags", record.securityFlags);
    if (record.roundNumber) {
        draft.payload.setNumber("roundNumber", *record.roundNumber);
    }
    draft.indexedUsers = {record.userId};
    return append(std::move(draft));
}

std::string AuditChain::logPayout(const PayoutRecord& record) {
    Draft draft;
    draft.category = AuditCategory::Payout;
    draft.idPrefix = "PAY";
    draft.type = "payout";
    draft.userId = record.userId;
    draft.actors = {record.userId};
    draft.amount = record.amount;
    draft.payload.set("kind", record.payoutType)
        .set("userId", record.userId)
        .set("userWallet", record.userWallet)
        .setAmount("amount", record.amount)
        .setAmount("originalBetAmount", record.originalBetAmount)
        .setAmount("odds", record.odds)
        .setAmount("profit", record.amount - record.originalBetAmount)
        .set("poolId", record.poolId)
        .set("settlementId", record.settlementId)
        .set("betId", record.betId)
        .set("matchId", record.matchId)
        .set("tournamentId", record.tournamentId)
        .set("winningOutcome", record.winningOutcome)
        .set("settlementMethod", record.settlementMethod)
        .setAmount("platformFee", record.platformFee);
    draft.indexedUsers = {record.userId};
    return append(std::move(draft));
}

std::string AuditChain::logEscrow(const EscrowRecord& record) {
    Draft draft;
    draft.category = AuditCategory::Escrow;
    draft.idPrefix = "ESC";
    draft.type = "escrow";
    draft.userId = record.initiator;
    draft.actors = participantIds(record.participants);
    draft.amount = record.amount;

    std::vector<std::string> shares;
    shares.reserve(record.participants.size());
    for (const auto& participant : record.participants) {
        shares.push_back(participant.userId + "=" + participant.amount.toString());
    }
    draft.payload.set("kind", record.operation)
        .set("escrowId", record.escrowId)
        .set("initiator", record.initiator)
        .setList("participants", shares)
        .setAmount("amount", record.amount)
        .set("status", record.status)
        .set("eventId", record.eventId)
        .setNumber("multisigThreshold", record.multisigThreshold)
        .setList("authorities", record.authorities)
        .set("disputeReason", record.disputeReason)
        .set("resolutionMethod", record.resolutionMethod);

    draft.indexedUsers = draft.actors;
    if (std::find(draft.indexedUsers.begin(), draft.indexedUsers.end(), record.initiator) ==
        draft.indexedUsers.end()) {
        draft.indexedUsers.push_back(record.initiator);
    }
    return append(std::move(draft));
}

std::string AuditChain::logSecurityEvent(const SecurityRecord& record) {
    Draft draft;
    draft.category = AuditCategory::Security;
    draft.idPrefix = "SEC";
    draft.type = "security";
    draft.userId = record.userId.value_or("");
    if (record.userId) {
        draft.actors = {*record.userId};
        draft.indexedUsers = {*record.userId};
    }
    draft.payload.set("kind", record.eventType)
        .set("severity", severityName(record.severity))
        .setOptional("userId", record.userId)
        .set("description", record.description)
        .set("source", record.source)
        .setList("triggers", record.triggers)
        .set("sessionId", record.sessionId)
        .setList("actionsTaken", record.actionsTaken)
        .setFlag("falsePositive", record.falsePositive);
    if (record.riskScore) {
        draft.payload.setAmount("riskScore", Fixed64::fromDouble(*record.riskScore));
    }

    auto id = append(std::move(draft));
    if (record.severity == Severity::Critical) {
        logger_->error("critical security event {} ({}): {}", id, record.eventType,
                       record.description);
    }
    return id;
}

std::string AuditChain::logSystemEvent(const SystemRecord& record) {
    Draft draft;
    draft.category = AuditCategory::System;
    draft.idPrefix = "SYS";
    draft.type = "system";
    draft.actors = {record.component};
    draft.payload.set("kind", record.eventType)
        .set("component", record.component)
        .set("subjectId", record.subjectId)
        .set("matchId", record.matchId)
        .set("description", record.description);
    for (const auto& [key, value] : record.details) {
        draft.payload.set("detail." + key, value);
    }
    return append(std::move(draft));
}

std::string AuditChain::append(Draft draft) {
    const auto index = categoryIndex(draft.category);
    const auto now = clock_->nowMillis();

    AuditEntry entry;
    entry.id = makeEntityId(draft.idPrefix, now);
    entry.category = draft.category;
    entry.type = std::move(draft.type);
    entry.timestamp = now;
    entry.userId = std::move(draft.userId);
    entry.actors = std::move(draft.actors);
    entry.amount = draft.amount;
    entry.payload = std::move(draft.payload);
    entry.fingerprint = fingerprint(entry.payload);

    {
        std::lock_guard<std::mutex> lock(chainLocks_[index]);
        entry.previousHash =
            store_->getPointer(lastHashKey(entry.category)).value_or(kGenesisHash);
        entry.signature = signer_.sign(entry.signingView());
        store_->putEntry(entry);
        store_->setPointer(lastHashKey(entry.category),
                           chainLink(entry.signature, entry.previousHash));
    }

    for (const auto& userId : draft.indexedUsers) {
        if (userId.empty()) {
            continue;
        }
        store_->appendUserRef(userId, UserAuditRef{entry.id, entry.category, entry.type,
                                                   entry.timestamp, entry.amount});
    }

    {
        std::lock_guard<std::mutex> lock(metricsMutex_);
        ++metrics_.totalLogs;
        ++metrics_.logsByCategory[index];
    }
    logger_->debug("appended {} to {}", entry.id, categoryName(entry.category));
    return entry.id;
}

IntegrityCheck AuditChain::verifyLogIntegrity(AuditCategory category) const {
    IntegrityCheck check;
    check.category = category;
    check.timestamp = clock_->nowMillis();

    std::vector<AuditEntry> entries;
    std::vector<std::string> missing;
    std::optional<std::string> head;
    {
        std::lock_guard<std::mutex> lock(chainLocks_[categoryIndex(category)]);
        check.anchor = store_->getPointer(prunedAnchorKey(category)).value_or(kGenesisHash);
        head = store_->getPointer(lastHashKey(category));
        for (const auto& id : store_->chronologicalIds(category)) {
            auto entry = store_->getEntry(category, id);
            if (!entry) {
                // Indexed but gone: keep a placeholder so the scan reports it.
                AuditEntry hole;
                hole.id = id;
                hole.category = category;
                entries.push_back(std::move(hole));
                missing.push_back(id);
                continue;
            }
            entries.push_back(std::move(*entry));
        }
    }

    auto markBroken = [&](std::size_t position, std::string reason) {
        check.passed = false;
        check.firstBrokenPosition = position;
        check.reason = std::move(reason);
        for (std::size_t i = position; i < entries.size(); ++i) {
            check.brokenEntryIds.push_back(entries[i].id);
        }
    };

    std::string expected = check.anchor;
    std::vector<std::string> signatures;
    signatures.reserve(entries.size());
    for (std::size_t i = 0; i < entries.size(); ++i) {
        const auto& entry = entries[i];
        ++check.checkedEntries;
        if (std::find(missing.begin(), missing.end(), entry.id) != missing.end()) {
            markBroken(i, "entry " + entry.id + " is indexed but missing from the store");
            break;
        }
        if (entry.previousHash != expected) {
            markBroken(i, "previous hash mismatch at entry " + entry.id);
            break;
        }
        if (fingerprint(entry.payload) != entry.fingerprint) {
            markBroken(i, "fingerprint mismatch at entry " + entry.id);
            break;
        }
        if (!signer_.verify(entry.signingView(), entry.signature)) {
            markBroken(i, "signature mismatch at entry " + entry.id);
            break;
        }
        signatures.push_back(entry.signature);
        expected = chainLink(entry.signature, entry.previousHash);
    }

    if (check.passed && head && *head != expected) {
        check.passed = false;
        check.firstBrokenPosition = entries.size();
        check.reason = "chain head does not match the last retained entry";
    }
    check.merkleRoot = merkleRootOf(std::move(signatures));

    {
        std::lock_guard<std::mutex> lock(metricsMutex_);
        ++metrics_.integrityChecks;
        metrics_.lastIntegrityCheck = check.timestamp;
        if (!check.passed) {
            ++metrics_.tamperDetections;
        }
    }
    if (!check.passed) {
        compromised_.store(true);
        logger_->error("integrity check failed for {}: {}", categoryName(category),
                       check.reason);
    } else {
        logger_->debug("integrity check passed for {} ({} entries)", categoryName(category),
                       check.checkedEntries);
    }
    return check;
}

IntegrityReport AuditChain::generateIntegrityReport() const {
    IntegrityReport report;
    report.generatedAt = clock_->nowMillis();
    for (auto category : kAllAuditCategories) {
        auto check = verifyLogIntegrity(category);
        if (!check.passed) {
            report.issues.push_back(IntegrityIssue{Severity::Critical, "hash_chain_broken",
                                                   category, check.reason});
        }
        report.checks.push_back(std::move(check));
    }
    report.overallStatus = report.issues.empty() ? "healthy" : "compromised";
    if (!report.issues.empty()) {
        report.recommendations.push_back(
            "Investigate the broken chains immediately and preserve the affected entries");
        report.recommendations.push_back(
            "Cross-check affected financial records against the settlement ledger");
    }
    return report;
}

PruneResult AuditChain::pruneExpired() {
    PruneResult result;
    const auto now = clock_->nowMillis();
    for (auto category : kAllAuditCategories) {
        const auto index = categoryIndex(category);
        const auto ttl = config_.retentionMs[index];
        if (now <= ttl) {
            continue;
        }
        const auto cutoff = now - ttl;

        std::lock_guard<std::mutex> lock(chainLocks_[index]);
        std::optional<std::string> anchor;
        for (const auto& id : store_->chronologicalIds(category)) {
            auto entry = store_->getEntry(category, id);
            if (!entry || entry->timestamp >= cutoff) {
                break;
            }
            anchor = chainLink(entry->signature, entry->previousHash);
            store_->eraseEntry(category, id);
            ++result.removed[index];
        }
        if (anchor) {
            store_->setPointer(prunedAnchorKey(category), *anchor);
            logger_->info("pruned {} expired entries from {}", result.removed[index],
                          categoryName(category));
        }
    }
    return result;
}

std::vector<AuditEntry> AuditChain::entriesInRange(AuditCategory category,
                                                   std::uint64_t startTime,
                                                   std::uint64_t endTime,
                                                   const std::optional<std::string>& userId) const {
    std::vector<AuditEntry> out;
    for (const auto& id : store_->chronologicalIds(category)) {
        auto entry = store_->getEntry(category, id);
        if (!entry || entry->timestamp < startTime || entry->timestamp > endTime) {
            continue;
        }
        if (userId && entry->userId != *userId &&
            std::find(entry->actors.begin(), entry->actors.end(), *userId) ==
                entry->actors.end()) {
            continue;
        }
        out.push_back(std::move(*entry));
    }
    return out;
}

MaintenanceResult AuditChain::runMaintenanceOnce() {
    MaintenanceResult result;
    const auto now = clock_->nowMillis();
    bool checkDue = false;
    bool pruneDue = false;
    {
        std::lock_guard<std::mutex> lock(maintenanceMutex_);
        if (now >= lastSelfCheck_ && now - lastSelfCheck_ >= config_.integrityCheckIntervalMs) {
            lastSelfCheck_ = now;
            checkDue = true;
        }
        if (now >= lastPrune_ && now - lastPrune_ >= config_.pruneIntervalMs) {
            lastPrune_ = now;
            pruneDue = true;
        }
    }

    if (checkDue) {
        try {
            result.integrity = generateIntegrityReport();
            if (result.integrity->overallStatus != "healthy") {
                logger_->error("scheduled integrity check found {} broken chain(s)",
                               result.integrity->issues.size());
            }
        } catch (const std::exception& e) {
            logger_->error("scheduled integrity check failed: {}", e.what());
        }
    }
    if (pruneDue) {
        try {
            result.pruned = pruneExpired();
        } catch (const std::exception& e) {
            logger_->error("scheduled retention pruning failed: {}", e.what());
        }
    }
    return result;
}

void AuditChain::runMaintenance(const std::atomic<bool>& stop) {
    while (!stop.load()) {
        runMaintenanceOnce();
        std::this_thread::sleep_for(std::chrono::milliseconds(config_.maintenancePollMs));
    }
}

FinancialReport AuditChain::generateFinancialReport(const ReportCriteria& criteria) const {
    if (criteria.endTime < criteria.startTime) {
        throw ValidationError("report window ends before it starts");
    }

    FinancialReport report;
    report.generatedAt = clock_->nowMillis();
    report.criteria = criteria;
    report.integrity = verifyLogIntegrity(criteria.category);
    report.integrityStatus = report.integrity.passed ? "verified" : "compromised";

    auto entries =
        entriesInRange(criteria.category, criteria.startTime, criteria.endTime, criteria.userId);
    report.totalRecords = entries.size();

    const std::set<std::string> broken(report.integrity.brokenEntryIds.begin(),
                                       report.integrity.brokenEntryIds.end());
    const auto factor = Fixed64::fromDouble(config_.anomalyFactor);

    std::set<std::string> users;
    Fixed64 runningSum;
    std::int64_t samples = 0;
    for (const auto& entry : entries) {
        if (!entry.userId.empty()) {
            users.insert(entry.userId);
        }
        if (broken.count(entry.id) != 0) {
            report.anomalies.push_back(Anomaly{AnomalyKind::BrokenChain, entry.id,
                                               entry.timestamp, entry.amount, Fixed64{},
                                               "entry belongs to a broken chain segment"});
        }
        if (!entry.amount) {
            continue;
        }

        const Fixed64 amount = *entry.amount;
        const std::string kind = entry.payload.get("kind").value_or(entry.type);
        auto& totals = report.byType[kind];
        ++totals.count;
        totals.volume += amount;
        report.totalVolume += amount;
        switch (classify(entry)) {
        case FlowKind::Bet:
            report.totalBets += amount;
            break;
        case FlowKind::Payout:
            report.totalPayouts += amount;
            break;
        case FlowKind::Fee:
            report.totalFees += amount;
            break;
        case FlowKind::Other:
            break;
        }

        if (samples >= static_cast<std::int64_t>(config_.anomalyMinSamples)) {
            const Fixed64 mean = runningSum / Fixed64::fromUnits(samples);
            const Fixed64 deviation = amount > mean ? amount - mean : mean - amount;
            if (mean.isPositive() && deviation > mean * factor) {
                report.anomalies.push_back(Anomaly{
                    AnomalyKind::AmountOutlier, entry.id, entry.timestamp, amount, mean,
                    "amount " + amount.toString() + " deviates from running mean " +
                        mean.toString()});
            }
        }
        runningSum += amount;
        ++samples;
    }

    report.uniqueUsers = users.size();
    report.netRevenue = report.totalBets - report.totalPayouts + report.totalFees;
    if (samples > 0) {
        report.averageSize = report.totalVolume / Fixed64::fromUnits(samples);
    }
    if (criteria.includeDetails) {
        for (auto& entry : entries) {
            entry.signature.clear();
            entry.fingerprint.clear();
            report.details.push_back(std::move(entry));
        }
    }

    if (!report.integrity.passed) {
        logger_->warn("financial report for {} generated over a compromised chain",
                      categoryName(criteria.category));
    }
    return report;
}

std::optional<AuditEntry> AuditChain::getEntry(AuditCategory category,
                                               const std::string& id) const {
    return store_->getEntry(category, id);
}

std::vector<UserAuditRef> AuditChain::userTrail(const std::string& userId) const {
    auto refs = store_->userRefs(userId);
    std::stable_sort(refs.begin(), refs.end(), [](const UserAuditRef& a, const UserAuditRef& b) {
        return a.timestamp > b.timestamp;
    });
    return refs;
}

AuditMetrics AuditChain::metrics() const {
    std::lock_guard<std::mutex> lock(metricsMutex_);
    return metrics_;
}

} // namespace arb
