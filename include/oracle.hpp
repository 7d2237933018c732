#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace arb {

// Source of verifiable randomness. The resolver treats account references
// and transaction ids as opaque strings.
class RandomnessOracle {
public:
    virtual ~RandomnessOracle() = default;

    // Returns the submission transaction id; throws on submission failure.
    virtual std::string submitRandomnessRequest(const std::string& accountRef) = 0;

    // Raw random bytes once the request is fulfilled, nullopt while pending.
    // Must be safe to call repeatedly.
    virtual std::optional<std::vector<std::uint8_t>> pollFulfillment(const std::string& accountRef) = 0;
};

using OraclePtr = std::shared_ptr<RandomnessOracle>;

} // namespace arb
