#pragma once

#include <stdexcept>
#include <string>

namespace arb {

// Malformed input or an operation outside its allowed window. Thrown before
// any state is mutated.
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& what) : std::runtime_error(what) {}
};

// A randomness request that was never fulfilled within its deadline.
class TimeoutError : public std::runtime_error {
public:
    explicit TimeoutError(const std::string& what) : std::runtime_error(what) {}
};

class IntegrityError : public std::runtime_error {
public:
    explicit IntegrityError(const std::string& what) : std::runtime_error(what) {}
};

// Oracle, pool service or store failure. Only the operation that hit it fails.
class ExternalServiceError : public std::runtime_error {
public:
    explicit ExternalServiceError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace arb
