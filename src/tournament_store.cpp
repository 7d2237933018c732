#include "tournament_store.hpp"

#include "errors.hpp"

namespace arb {

namespace {
constexpr char kKeyPrefix[] = "tournament:";
}

std::string tournamentKey(const std::string& tournamentId) {
    return kKeyPrefix + tournamentId;
}

std::optional<StoredDocument> InMemoryTournamentStore::load(const std::string& tournamentId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = documents_.find(tournamentKey(tournamentId));
    if (it == documents_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void InMemoryTournamentStore::save(const std::string& tournamentId,
                                   const std::string& document,
                                   std::uint64_t expectedVersion) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto key = tournamentKey(tournamentId);
    auto it = documents_.find(key);
    const std::uint64_t current = it == documents_.end() ? 0 : it->second.version;
    if (current != expectedVersion) {
        throw ExternalServiceError("version conflict on " + key + ": stored " +
                                   std::to_string(current) + ", expected " +
                                   std::to_string(expectedVersion));
    }
    documents_[key] = StoredDocument{document, expectedVersion + 1};
}

std::vector<std::string> InMemoryTournamentStore::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(documents_.size());
    const std::size_t prefix = sizeof(kKeyPrefix) - 1;
    for (const auto& entry : documents_) {
        ids.push_back(entry.first.substr(prefix));
    }
    return ids;
}

} // namespace arb
