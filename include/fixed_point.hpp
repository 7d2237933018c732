#pragma once

#include <cmath>
#include <cstdint>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>

namespace arb {

// Deterministic fixed-point amounts, odds and multipliers. Every settlement
// figure goes through this type so replays produce identical numbers.
class Fixed64 {
public:
    static constexpr std::int64_t kScale = 1'000'000; // microunits
    static constexpr std::int64_t kMaxUnits = std::numeric_limits<std::int64_t>::max() / kScale;

    Fixed64() : raw_(0) {}

    static Fixed64 fromRaw(std::int64_t raw) { return Fixed64(raw, RawTag{}); }

    static Fixed64 fromUnits(std::int64_t units) {
        if (units > kMaxUnits || units < -kMaxUnits) {
            throw std::overflow_error("Fixed64 unit value out of range");
        }
        return Fixed64(units * kScale, RawTag{});
    }

    static Fixed64 fromDouble(double value) {
        if (!std::isfinite(value)) {
            throw std::domain_error("Fixed64 cannot represent a non-finite value");
        }
        double scaled = std::round(value * static_cast<double>(kScale));
        return Fixed64(clamp(static_cast<long double>(scaled)), RawTag{});
    }

    // numerator / denominator without going through floating point.
    static Fixed64 fromRatio(std::int64_t numerator, std::int64_t denominator) {
        if (denominator == 0) {
            throw std::domain_error("Fixed64 ratio with zero denominator");
        }
        __int128 wide = static_cast<__int128>(numerator) * kScale / denominator;
        return Fixed64(saturate(wide), RawTag{});
    }

    static Fixed64 min(Fixed64 a, Fixed64 b) { return a < b ? a : b; }
    static Fixed64 max(Fixed64 a, Fixed64 b) { return a > b ? a : b; }

    double toDouble() const { return static_cast<double>(raw_) / static_cast<double>(kScale); }
    std::int64_t raw() const { return raw_; }
    std::int64_t wholeUnits() const { return raw_ / kScale; }
    bool isPositive() const { return raw_ > 0; }
    bool isZero() const { return raw_ == 0; }

    // Exact decimal rendering ("12.500000"), used in canonical audit payloads.
    std::string toString() const {
        std::ostringstream oss;
        std::int64_t whole = raw_ / kScale;
        std::int64_t frac = raw_ % kScale;
        if (raw_ < 0) {
            oss << '-';
            whole = -whole;
            frac = -frac;
        }
        oss << whole << '.' << std::setw(6) << std::setfill('0') << frac;
        return oss.str();
    }

    Fixed64 operator+(Fixed64 other) const {
        return Fixed64(saturate(static_cast<__int128>(raw_) + other.raw_), RawTag{});
    }
    Fixed64 operator-(Fixed64 other) const {
        return Fixed64(saturate(static_cast<__int128>(raw_) - other.raw_), RawTag{});
    }
    Fixed64 operator*(Fixed64 other) const {
        __int128 wide = static_cast<__int128>(raw_) * static_cast<__int128>(other.raw_);
        return Fixed64(saturate(wide / kScale), RawTag{});
    }
    Fixed64 operator/(Fixed64 other) const {
        if (other.raw_ == 0) {
            throw std::domain_error("Fixed64 division by zero");
        }
        __int128 wide = static_cast<__int128>(raw_) * static_cast<__int128>(kScale);
        return Fixed64(saturate(wide / other.raw_), RawTag{});
    }

    Fixed64& operator+=(Fixed64 other) { return *this = *this + other; }
    Fixed64& operator-=(Fixed64 other) { return *this = *this - other; }
    Fixed64& operator*=(Fixed64 other) { return *this = *this * other; }

    bool operator<(Fixed64 other) const { return raw_ < other.raw_; }
    bool operator>(Fixed64 other) const { return raw_ > other.raw_; }
    bool operator<=(Fixed64 other) const { return raw_ <= other.raw_; }
    bool operator>=(Fixed64 other) const { return raw_ >= other.raw_; }
    bool operator==(Fixed64 other) const { return raw_ == other.raw_; }
    bool operator!=(Fixed64 other) const { return raw_ != other.raw_; }

private:
    struct RawTag {};
    Fixed64(std::int64_t raw, RawTag) : raw_(raw) {}

    static std::int64_t saturate(__int128 value) {
        constexpr __int128 hi = std::numeric_limits<std::int64_t>::max();
        constexpr __int128 lo = std::numeric_limits<std::int64_t>::min();
        if (value > hi) {
            return std::numeric_limits<std::int64_t>::max();
        }
        if (value < lo) {
            return std::numeric_limits<std::int64_t>::min();
        }
        return static_cast<std::int64_t>(value);
    }

    static std::int64_t clamp(long double value) {
        if (value >= static_cast<long double>(std::numeric_limits<std::int64_t>::max())) {
            return std::numeric_limits<std::int64_t>::max();
        }
        if (value <= static_cast<long double>(std::numeric_limits<std::int64_t>::min())) {
            return std::numeric_limits<std::int64_t>::min();
        }
        return static_cast<std::int64_t>(value);
    }

    std::int64_t raw_;
};

} // namespace arb
