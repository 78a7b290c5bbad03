#pragma once
// Watchdog: independent stall detector for the cycle scheduler
//
// Runs on its own timer, much finer-grained than the cycle interval.
// A check reads in-memory timestamps only and never calls out to
// collaborators, so the watchdog itself cannot stall.

#include <anima/clock.hpp>
#include <anima/timer_loop.hpp>
#include <atomic>
#include <optional>
#include <string>

namespace anima {

// What the watchdog audits, implemented by the daemon
class Supervised {
public:
    virtual ~Supervised() = default;

    virtual std::optional<Timestamp> last_heartbeat_at() const = 0;

    // Start of the cycle currently in flight, if any
    virtual std::optional<Timestamp> cycle_started_at() const = 0;

    // Clear the reentrancy guard and run watchdog recovery
    virtual void force_recover(const std::string& reason) = 0;
};

class Watchdog {
public:
    Watchdog(TimerLoop& timers, const Clock& clock, Supervised& target,
             int64_t interval_ms, int64_t timeout_ms);
    ~Watchdog();

    Watchdog(const Watchdog&) = delete;
    Watchdog& operator=(const Watchdog&) = delete;

    void start();
    void stop();
    bool enabled() const { return enabled_; }

    // One audit. Returns true if it forced recovery.
    bool check();

    int64_t interval_ms() const { return interval_ms_; }
    int64_t timeout_ms() const { return timeout_ms_; }

    struct Stats {
        size_t checks = 0;
        size_t stalls = 0;
        size_t slow_cycle_warnings = 0;
    };
    Stats stats() const;

private:
    TimerLoop& timers_;
    const Clock& clock_;
    Supervised& target_;
    int64_t interval_ms_;
    int64_t timeout_ms_;

    std::atomic<bool> enabled_{false};
    std::optional<TimerLoop::TimerId> timer_;

    std::atomic<size_t> checks_{0};
    std::atomic<size_t> stalls_{0};
    std::atomic<size_t> slow_cycle_warnings_{0};
};

} // namespace anima
