#pragma once

#include <chrono>

namespace sk::core {

/**
 * @brief Monotonic time source, in seconds.
 *
 * Services sample the clock once per update and derive elapsed time as `now - start`,
 * so frame-rate variation never accumulates into drift.
 */
class Clock {
public:
    virtual ~Clock() = default;

    /**
     * @brief Current time in seconds since an arbitrary epoch
     */
    virtual double now() const = 0;
};

/**
 * @brief Wall-independent clock backed by std::chrono::steady_clock
 */
class SteadyClock final : public Clock {
public:
    SteadyClock();
    double now() const override;

private:
    std::chrono::steady_clock::time_point origin_;
};

/**
 * @brief Clock advanced explicitly by the caller (simulation and tests)
 */
class ManualClock final : public Clock {
public:
    explicit ManualClock(double start = 0.0) : now_(start) {}

    double now() const override { return now_; }

    void set(double seconds) { now_ = seconds; }
    void advance(double seconds) { now_ += seconds; }
    // Models a hardware clock reset (e.g. device change); may move time backwards.
    void reset(double seconds = 0.0) { now_ = seconds; }

private:
    double now_;
};

} // namespace sk::core
