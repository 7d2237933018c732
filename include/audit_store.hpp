#pragma once

#include "config.hpp"
#include "event_signer.hpp"
#include "fixed_point.hpp"

#include <array>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace arb {

enum class AuditCategory { Transaction, Bet, Payout, Escrow, Security, System };

constexpr std::array<AuditCategory, kAuditCategoryCount> kAllAuditCategories{
    AuditCategory::Transaction, AuditCategory::Bet,      AuditCategory::Payout,
    AuditCategory::Escrow,      AuditCategory::Security, AuditCategory::System,
};

// Store-level name of a category chain, e.g. "bet_audit".
const char* categoryName(AuditCategory category);
std::size_t categoryIndex(AuditCategory category);

constexpr const char* kGenesisHash = "genesis";

struct AuditEntry {
    std::string id;
    AuditCategory category = AuditCategory::System;
    std::string type;
    std::uint64_t timestamp = 0;
    std::string userId;
    std::vector<std::string> actors;
    std::optional<Fixed64> amount;
    CanonicalRecord payload;
    std::string fingerprint;
    std::string signature;
    std::string previousHash;

    // Every field except the signature, in canonical form.
    CanonicalRecord signingView() const;
};

struct UserAuditRef {
    std::string auditId;
    AuditCategory category = AuditCategory::System;
    std::string type;
    std::uint64_t timestamp = 0;
    std::optional<Fixed64> amount;
};

// Persistence boundary for audit chains. Keys follow "{category}:{entryId}",
// with a "{category}_chronological" insertion index and named pointers such
// as "{category}_last_hash". Implementations must be internally synchronized.
class AuditStore {
public:
    virtual ~AuditStore() = default;

    // Insert or overwrite; first insertion of an id appends it to the index.
    virtual void putEntry(const AuditEntry& entry) = 0;
    virtual std::optional<AuditEntry> getEntry(AuditCategory category,
                                               const std::string& id) const = 0;
    virtual std::vector<std::string> chronologicalIds(AuditCategory category) const = 0;
    virtual bool eraseEntry(AuditCategory category, const std::string& id) = 0;

    virtual std::optional<std::string> getPointer(const std::string& key) const = 0;
    virtual void setPointer(const std::string& key, const std::string& value) = 0;

    virtual void appendUserRef(const std::string& userId, const UserAuditRef& ref) = 0;
    virtual std::vector<UserAuditRef> userRefs(const std::string& userId) const = 0;
};

using AuditStorePtr = std::shared_ptr<AuditStore>;

std::string entryKey(AuditCategory category, const std::string& id);
std::string chronologicalKey(AuditCategory category);
std::string lastHashKey(AuditCategory category);
std::string prunedAnchorKey(AuditCategory category);

class InMemoryAuditStore : public AuditStore {
public:
    void putEntry(const AuditEntry& entry) override;
    std::optional<AuditEntry> getEntry(AuditCategory category,
                                       const std::string& id) const override;
    std::vector<std::string> chronologicalIds(AuditCategory category) const override;
    bool eraseEntry(AuditCategory category, const std::string& id) override;

    std::optional<std::string> getPointer(const std::string& key) const override;
    void setPointer(const std::string& key, const std::string& value) override;

    void appendUserRef(const std::string& userId, const UserAuditRef& ref) override;
    std::vector<UserAuditRef> userRefs(const std::string& userId) const override;

    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, AuditEntry> entries_;
    std::map<std::string, std::vector<std::string>> indexes_;
    std::map<std::string, std::string> pointers_;
    std::map<std::string, std::vector<UserAuditRef>> users_;
};

} // namespace arb
