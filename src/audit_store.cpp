#include "audit_store.hpp"

#include <algorithm>
#include <stdexcept>

namespace arb {

const char* categoryName(AuditCategory category) {
    switch (category) {
    case AuditCategory::Transaction:
        return "transaction_audit";
    case AuditCategory::Bet:
        return "bet_audit";
    case AuditCategory::Payout:
        return "payout_audit";
    case AuditCategory::Escrow:
        return "escrow_audit";
    case AuditCategory::Security:
        return "security_audit";
    case AuditCategory::System:
        return "system_audit";
    }
    throw std::invalid_argument("unknown audit category");
}

std::size_t categoryIndex(AuditCategory category) {
    return static_cast<std::size_t>(category);
}

CanonicalRecord AuditEntry::signingView() const {
    CanonicalRecord view;
    view.set("id", id)
        .set("category", categoryName(category))
        .set("type", type)
        .setNumber("timestamp", timestamp)
        .set("userId", userId)
        .setList("actors", actors)
        .set("fingerprint", fingerprint)
        .set("previousHash", previousHash);
    if (amount) {
        view.setAmount("amount", *amount);
    }
    for (const auto& [key, value] : payload.fields()) {
        view.set("payload." + key, value);
    }
    return view;
}

std::string entryKey(AuditCategory category, const std::string& id) {
    return std::string(categoryName(category)) + ":" + id;
}

std::string chronologicalKey(AuditCategory category) {
    return std::string(categoryName(category)) + "_chronological";
}

std::string lastHashKey(AuditCategory category) {
    return std::string(categoryName(category)) + "_last_hash";
}

std::string prunedAnchorKey(AuditCategory category) {
    return std::string(categoryName(category)) + "_pruned_anchor";
}

void InMemoryAuditStore::putEntry(const AuditEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto key = entryKey(entry.category, entry.id);
    auto inserted = entries_.insert_or_assign(key, entry);
    if (inserted.second) {
        indexes_[chronologicalKey(entry.category)].push_back(entry.id);
    }
}

std::optional<AuditEntry> InMemoryAuditStore::getEntry(AuditCategory category,
                                                       const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(entryKey(category, id));
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> InMemoryAuditStore::chronologicalIds(AuditCategory category) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = indexes_.find(chronologicalKey(category));
    if (it == indexes_.end()) {
        return {};
    }
    return it->second;
}

bool InMemoryAuditStore::eraseEntry(AuditCategory category, const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (entries_.erase(entryKey(category, id)) == 0) {
        return false;
    }
    auto& index = indexes_[chronologicalKey(category)];
    index.erase(std::remove(index.begin(), index.end(), id), index.end());
    return true;
}

std::optional<std::string> InMemoryAuditStore::getPointer(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pointers_.find(key);
    if (it == pointers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void InMemoryAuditStore::setPointer(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    pointers_[key] = value;
}

void InMemoryAuditStore::appendUserRef(const std::string& userId, const UserAuditRef& ref) {
    std::lock_guard<std::mutex> lock(mutex_);
    users_[userId].push_back(ref);
}

std::vector<UserAuditRef> InMemoryAuditStore::userRefs(const std::string& userId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = users_.find(userId);
    if (it == users_.end()) {
        return {};
    }
    return it->second;
}

std::size_t InMemoryAuditStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace arb
