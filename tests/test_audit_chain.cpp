#include "audit_chain.hpp"
#include "errors.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "audit_chain_test failure: " << msg << std::endl;
    std::exit(1);
}

constexpr std::uint64_t kStart = 1'700'000'000'000ULL;

arb::AuditConfig testConfig() {
    arb::AuditConfig config;
    config.signingKey = "audit-chain-test-key";
    return config;
}

arb::TransactionRecord transaction(const std::string& user, const std::string& kind, int units) {
    arb::TransactionRecord record;
    record.userId = user;
    record.transactionType = kind;
    record.amount = arb::Fixed64::fromUnits(units);
    record.status = "confirmed";
    return record;
}

void expectBrokenFrom(const arb::IntegrityCheck& check,
                      std::size_t position,
                      const std::vector<std::string>& ids,
                      const std::string& label) {
    if (check.passed) {
        fail(label + ": tampering went unnoticed");
    }
    if (!check.firstBrokenPosition || *check.firstBrokenPosition != position) {
        fail(label + ": wrong first broken position");
    }
    const std::vector<std::string> expected(ids.begin() + static_cast<std::ptrdiff_t>(position),
                                            ids.end());
    if (check.brokenEntryIds != expected) {
        fail(label + ": broken ids should run from the tampered entry to the end");
    }
}

} // namespace

int main() {
    using namespace arb;

    auto clock = std::make_shared<ManualClock>(kStart);

    for (const std::string key : {"", "default"}) {
        AuditConfig bad;
        bad.signingKey = key;
        try {
            AuditChain chain(bad, std::make_shared<InMemoryAuditStore>(), clock);
            fail("unusable signing key accepted: '" + key + "'");
        } catch (const IntegrityError&) {
        }
    }

    auto store = std::make_shared<InMemoryAuditStore>();
    AuditChain chain(testConfig(), store, clock);

    for (auto category : kAllAuditCategories) {
        if (!chain.verifyLogIntegrity(category).passed) {
            fail(std::string("empty chain fails: ") + categoryName(category));
        }
    }

    std::vector<std::string> ids;
    const std::vector<TransactionRecord> records{
        transaction("alice", "bet", 10),    transaction("bob", "bet", 12),
        transaction("alice", "payout", 8),  transaction("alice", "fee", 1),
        transaction("bob", "deposit", 9),   transaction("alice", "bet", 500),
    };
    for (const auto& record : records) {
        ids.push_back(chain.logTransaction(record));
        clock->advance(1);
    }
    if (ids.front().rfind("TXN_", 0) != 0) {
        fail("transaction ids should carry the TXN prefix");
    }

    const auto firstEntry = chain.getEntry(AuditCategory::Transaction, ids[0]);
    if (!firstEntry || firstEntry->previousHash != kGenesisHash) {
        fail("first entry should link to genesis");
    }
    const auto secondEntry = chain.getEntry(AuditCategory::Transaction, ids[1]);
    if (!secondEntry ||
        secondEntry->previousHash != chainLink(firstEntry->signature, firstEntry->previousHash)) {
        fail("second entry should link to the first");
    }

    const auto clean = chain.verifyLogIntegrity(AuditCategory::Transaction);
    if (!clean.passed || clean.checkedEntries != ids.size() || clean.merkleRoot.empty()) {
        fail("sequential appends should verify");
    }

    // Financial report over the clean chain.
    ReportCriteria criteria;
    criteria.startTime = kStart;
    criteria.endTime = clock->nowMillis();
    criteria.includeDetails = true;
    const auto report = chain.generateFinancialReport(criteria);
    if (report.integrityStatus != "verified" || report.totalRecords != 6) {
        fail("report should cover six verified records");
    }
    if (report.totalBets != Fixed64::fromUnits(522) || report.totalPayouts != Fixed64::fromUnits(8) ||
        report.totalFees != Fixed64::fromUnits(1) || report.netRevenue != Fixed64::fromUnits(515)) {
        fail("report totals are wrong");
    }
    if (report.totalVolume != Fixed64::fromUnits(540) ||
        report.averageSize != Fixed64::fromUnits(90) || report.uniqueUsers != 2) {
        fail("report volume, average or user count is wrong");
    }
    if (report.byType.at("bet").count != 3) {
        fail("report should group three bets");
    }
    if (report.anomalies.size() != 1 || report.anomalies[0].entryId != ids[5] ||
        report.anomalies[0].kind != AnomalyKind::AmountOutlier) {
        fail("the 500 unit bet should be the only outlier");
    }
    if (report.details.size() != 6 || !report.details[0].signature.empty() ||
        !report.details[0].fingerprint.empty()) {
        fail("report details should be stripped of signatures and fingerprints");
    }

    ReportCriteria bobOnly = criteria;
    bobOnly.userId = "bob";
    if (chain.generateFinancialReport(bobOnly).totalRecords != 2) {
        fail("user filter should keep bob's two records");
    }
    ReportCriteria backwards = criteria;
    backwards.endTime = kStart - 1;
    try {
        chain.generateFinancialReport(backwards);
        fail("inverted report window accepted");
    } catch (const ValidationError&) {
    }

    // Flipped signature: broken from that entry onward.
    const auto original = *store->getEntry(AuditCategory::Transaction, ids[2]);
    auto forged = original;
    forged.signature[0] = forged.signature[0] == 'a' ? 'b' : 'a';
    store->putEntry(forged);
    expectBrokenFrom(chain.verifyLogIntegrity(AuditCategory::Transaction), 2, ids, "signature");
    if (!chain.isCompromised()) {
        fail("failed verification should flag the chain as compromised");
    }
    const auto tamperedReport = chain.generateFinancialReport(criteria);
    if (tamperedReport.integrityStatus != "compromised") {
        fail("report over a tampered chain should say so");
    }
    std::size_t brokenAnomalies = 0;
    for (const auto& anomaly : tamperedReport.anomalies) {
        if (anomaly.kind == AnomalyKind::BrokenChain) {
            ++brokenAnomalies;
        }
    }
    if (brokenAnomalies != 4) {
        fail("report should list every entry of the broken segment");
    }
    store->putEntry(original);
    if (!chain.verifyLogIntegrity(AuditCategory::Transaction).passed) {
        fail("restored entry should verify again");
    }

    // Flipped previous hash.
    const auto fourth = *store->getEntry(AuditCategory::Transaction, ids[3]);
    auto relinked = fourth;
    relinked.previousHash[0] = relinked.previousHash[0] == 'a' ? 'b' : 'a';
    store->putEntry(relinked);
    expectBrokenFrom(chain.verifyLogIntegrity(AuditCategory::Transaction), 3, ids, "previousHash");
    store->putEntry(fourth);

    // Edited payload no longer matches its fingerprint.
    const auto fifth = *store->getEntry(AuditCategory::Transaction, ids[4]);
    auto edited = fifth;
    edited.payload.setAmount("amount", Fixed64::fromUnits(9000));
    store->putEntry(edited);
    expectBrokenFrom(chain.verifyLogIntegrity(AuditCategory::Transaction), 4, ids, "payload");
    store->putEntry(fifth);

    // Dropping the newest entry leaves the head pointer dangling.
    EscrowRecord escrow;
    escrow.escrowId = "escrow_1";
    escrow.operation = "create";
    escrow.initiator = "carol";
    escrow.participants = {EscrowParticipant{"carol", Fixed64::fromUnits(5)},
                           EscrowParticipant{"dave", Fixed64::fromUnits(5)}};
    escrow.amount = Fixed64::fromUnits(10);
    escrow.multisigThreshold = 2;
    chain.logEscrow(escrow);
    clock->advance(1);
    escrow.operation = "release";
    const auto lastEscrow = chain.logEscrow(escrow);
    if (!chain.verifyLogIntegrity(AuditCategory::Escrow).passed) {
        fail("escrow chain should verify");
    }
    if (chain.userTrail("dave").size() != 2) {
        fail("escrow entries should appear in every participant's trail");
    }
    store->eraseEntry(AuditCategory::Escrow, lastEscrow);
    const auto truncated = chain.verifyLogIntegrity(AuditCategory::Escrow);
    if (truncated.passed || !truncated.firstBrokenPosition || *truncated.firstBrokenPosition != 1) {
        fail("removing the newest entry should be detected");
    }

    const auto integrity = chain.generateIntegrityReport();
    if (integrity.overallStatus != "compromised" || integrity.issues.size() != 1 ||
        integrity.issues[0].category != AuditCategory::Escrow ||
        integrity.recommendations.empty() || integrity.checks.size() != kAuditCategoryCount) {
        fail("integrity report should single out the escrow chain");
    }

    const auto trail = chain.userTrail("alice");
    if (trail.size() != 4) {
        fail("alice should have four trail entries");
    }
    for (std::size_t i = 1; i < trail.size(); ++i) {
        if (trail[i - 1].timestamp < trail[i].timestamp) {
            fail("user trail should be newest first");
        }
    }

    const auto metrics = chain.metrics();
    if (metrics.totalLogs != 8 ||
        metrics.logsByCategory[categoryIndex(AuditCategory::Transaction)] != 6 ||
        metrics.tamperDetections == 0 || !metrics.lastIntegrityCheck) {
        fail("metrics do not reflect the activity");
    }

    // Retention pruning of a clean prefix is not tampering.
    auto retentionClock = std::make_shared<ManualClock>(kStart);
    auto config = testConfig();
    config.retentionMs[categoryIndex(AuditCategory::System)] = 1'000;
    AuditChain retained(config, std::make_shared<InMemoryAuditStore>(), retentionClock);
    SystemRecord event;
    event.eventType = "heartbeat";
    event.component = "scheduler";
    retained.logSystemEvent(event);
    retentionClock->advance(2'000);
    const auto keptFirst = retained.logSystemEvent(event);
    retained.logSystemEvent(event);
    retentionClock->advance(500);

    const auto pruned = retained.pruneExpired();
    if (pruned.total() != 1 || pruned.removed[categoryIndex(AuditCategory::System)] != 1) {
        fail("exactly the expired first entry should be pruned");
    }
    const auto afterPrune = retained.verifyLogIntegrity(AuditCategory::System);
    if (!afterPrune.passed || afterPrune.checkedEntries != 2 || afterPrune.anchor == kGenesisHash) {
        fail("chain should verify from the pruning anchor");
    }
    if (!retained.getEntry(AuditCategory::System, keptFirst)) {
        fail("unexpired entry was pruned");
    }
    if (retained.pruneExpired().total() != 0) {
        fail("second prune should find nothing");
    }
    if (retained.isCompromised()) {
        fail("pruning should not flag the chain");
    }

    // Scheduled maintenance: self-check every second, prune every five.
    auto maintenanceClock = std::make_shared<ManualClock>(kStart);
    auto scheduled = testConfig();
    scheduled.retentionMs[categoryIndex(AuditCategory::System)] = 4'500;
    scheduled.integrityCheckIntervalMs = 1'000;
    scheduled.pruneIntervalMs = 5'000;
    scheduled.maintenancePollMs = 1;
    AuditChain maintained(scheduled, std::make_shared<InMemoryAuditStore>(), maintenanceClock);
    maintained.logSystemEvent(event);

    const auto idle = maintained.runMaintenanceOnce();
    if (idle.integrity || idle.pruned) {
        fail("nothing should be due right after construction");
    }
    maintenanceClock->advance(1'000);
    const auto checked = maintained.runMaintenanceOnce();
    if (!checked.integrity || checked.integrity->overallStatus != "healthy" ||
        checked.integrity->checks.size() != kAuditCategoryCount || checked.pruned) {
        fail("only the self-check should be due after one interval");
    }
    maintained.logSystemEvent(event);
    maintenanceClock->advance(4'000);
    const auto both = maintained.runMaintenanceOnce();
    if (!both.integrity || !both.pruned || both.pruned->total() != 1) {
        fail("self-check and pruning should both run, dropping the first entry");
    }
    if (!maintained.verifyLogIntegrity(AuditCategory::System).passed) {
        fail("scheduled pruning broke the chain");
    }

    maintenanceClock->advance(1'000);
    const auto checksBefore = maintained.metrics().integrityChecks;
    std::atomic<bool> stop{false};
    std::thread worker([&] { maintained.runMaintenance(stop); });
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (maintained.metrics().integrityChecks < checksBefore + kAuditCategoryCount &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    stop = true;
    worker.join();
    if (maintained.metrics().integrityChecks < checksBefore + kAuditCategoryCount) {
        fail("maintenance loop did not run the self-check");
    }

    std::cout << "audit_chain_test: ok\n";
    return 0;
}
