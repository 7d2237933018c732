#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace arb {

struct StoredDocument {
    std::string document;
    std::uint64_t version = 0;
};

std::string tournamentKey(const std::string& tournamentId);

// Versioned tournament documents keyed by "tournament:{id}".
class TournamentStore {
public:
    virtual ~TournamentStore() = default;

    virtual std::optional<StoredDocument> load(const std::string& tournamentId) const = 0;

    /**
     * Store a document as version expectedVersion + 1. expectedVersion is 0
     * for a tournament that has never been saved. A version mismatch throws
     * ExternalServiceError and leaves the stored document untouched.
     */
    virtual void save(const std::string& tournamentId,
                      const std::string& document,
                      std::uint64_t expectedVersion) = 0;

    virtual std::vector<std::string> list() const = 0;
};

using TournamentStorePtr = std::shared_ptr<TournamentStore>;

class InMemoryTournamentStore : public TournamentStore {
public:
    std::optional<StoredDocument> load(const std::string& tournamentId) const override;
    void save(const std::string& tournamentId,
              const std::string& document,
              std::uint64_t expectedVersion) override;
    std::vector<std::string> list() const override;

private:
    mutable std::mutex mutex_;
    std::map<std::string, StoredDocument> documents_;
};

} // namespace arb
