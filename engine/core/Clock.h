// Monotonic millisecond clocks used for cooldown and interval gating.
#pragma once

#include <chrono>

namespace Engine {

class Clock {
public:
    virtual ~Clock() = default;

    // Milliseconds since an arbitrary, fixed origin. Never decreases.
    virtual double nowMs() const = 0;
};

// Wall clock backed by std::chrono::steady_clock, zeroed at construction.
class SteadyClock final : public Clock {
public:
    SteadyClock() : origin_(std::chrono::steady_clock::now()) {}

    double nowMs() const override {
        const std::chrono::duration<double, std::milli> elapsed = std::chrono::steady_clock::now() - origin_;
        return elapsed.count();
    }

private:
    std::chrono::steady_clock::time_point origin_;
};

// Hand-driven clock for tests and headless runs.
class ManualClock final : public Clock {
public:
    explicit ManualClock(double startMs = 0.0) : now_(startMs) {}

    double nowMs() const override { return now_; }
    void set(double ms) {
        if (ms > now_) now_ = ms;
    }
    void advance(double ms) {
        if (ms > 0.0) now_ += ms;
    }

private:
    double now_{0.0};
};

}  // namespace Engine
