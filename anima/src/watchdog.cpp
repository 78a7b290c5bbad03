#include <anima/watchdog.hpp>
#include <anima/log.hpp>

namespace anima {

Watchdog::Watchdog(TimerLoop& timers, const Clock& clock, Supervised& target,
                   int64_t interval_ms, int64_t timeout_ms)
    : timers_(timers)
    , clock_(clock)
    , target_(target)
    , interval_ms_(interval_ms)
    , timeout_ms_(timeout_ms) {}

Watchdog::~Watchdog() {
    stop();
}

void Watchdog::start() {
    if (timer_) {
        timers_.cancel(*timer_);
    }
    enabled_ = true;
    timer_ = timers_.every(interval_ms_, [this]() {
        if (enabled_) check();
    });

    log_info("watchdog", "Watchdog started (interval: %lldms, timeout: %lldms)",
             static_cast<long long>(interval_ms_), static_cast<long long>(timeout_ms_));
}

void Watchdog::stop() {
    if (timer_) {
        timers_.cancel(*timer_);
        timer_.reset();
    }
    if (enabled_.exchange(false)) {
        log_info("watchdog", "Watchdog stopped");
    }
}

bool Watchdog::check() {
    checks_++;
    Timestamp current = clock_.now();

    auto last = target_.last_heartbeat_at();
    if (!last) {
        log_warn("watchdog", "No heartbeat recorded - system may be starting up");
        return false;
    }

    int64_t silence = current - *last;
    if (silence > timeout_ms_) {
        stalls_++;
        log_error("watchdog", "STALLED LOOP DETECTED - No heartbeat for %llds",
                  static_cast<long long>(silence / 1000));
        target_.force_recover("No heartbeat for " + std::to_string(silence / 1000) + "s");
        return true;
    }

    // Early warning: a cycle past half the timeout is on its way to a stall
    auto started = target_.cycle_started_at();
    if (started && current - *started > timeout_ms_ / 2) {
        slow_cycle_warnings_++;
        log_warn("watchdog", "Cycle running too long (%llds) - may be stuck",
                 static_cast<long long>((current - *started) / 1000));
    }
    return false;
}

Watchdog::Stats Watchdog::stats() const {
    Stats s;
    s.checks = checks_;
    s.stalls = stalls_;
    s.slow_cycle_warnings = slow_cycle_warnings_;
    return s;
}

} // namespace anima
