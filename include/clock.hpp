#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>

namespace arb {

// Milliseconds since the Unix epoch.
class Clock {
public:
    virtual ~Clock() = default;
    virtual std::uint64_t nowMillis() const = 0;
};

class SystemClock : public Clock {
public:
    std::uint64_t nowMillis() const override {
        auto since = std::chrono::system_clock::now().time_since_epoch();
        return static_cast<std::uint64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(since).count());
    }
};

// Deterministic clock for tests and replays; only moves when told to.
class ManualClock : public Clock {
public:
    explicit ManualClock(std::uint64_t startMillis = 0) : now_(startMillis) {}

    std::uint64_t nowMillis() const override { return now_.load(); }
    void set(std::uint64_t millis) { now_.store(millis); }
    void advance(std::uint64_t millis) { now_.fetch_add(millis); }

private:
    std::atomic<std::uint64_t> now_;
};

using ClockPtr = std::shared_ptr<Clock>;

} // namespace arb
