#include <anima/timer_loop.hpp>
#include <anima/log.hpp>
#include <algorithm>
#include <chrono>
#include <exception>
#include <vector>

namespace anima {

TimerLoop::TimerLoop(const Clock& clock)
    : clock_(clock) {}

TimerLoop::~TimerLoop() {
    stop();
}

TimerLoop::TimerId TimerLoop::every(int64_t interval_ms, Callback fn) {
    return schedule(interval_ms, std::max<int64_t>(interval_ms, 1), std::move(fn));
}

TimerLoop::TimerId TimerLoop::after(int64_t delay_ms, Callback fn) {
    return schedule(delay_ms, 0, std::move(fn));
}

TimerLoop::TimerId TimerLoop::schedule(int64_t delay_ms, int64_t interval_ms, Callback fn) {
    TimerId id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = next_id_++;
        Timer timer;
        timer.deadline = clock_.now() + std::max<int64_t>(delay_ms, 0);
        timer.interval_ms = interval_ms;
        timer.fn = std::move(fn);
        timers_.emplace(id, std::move(timer));
    }
    wake_.notify_all();
    return id;
}

bool TimerLoop::cancel(TimerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.erase(id) > 0;
}

size_t TimerLoop::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.size();
}

size_t TimerLoop::run_due() {
    Timestamp current = clock_.now();

    // Collect due timers in deadline order (ties: creation order)
    std::vector<std::pair<Timestamp, TimerId>> due;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : timers_) {
            if (entry.second.deadline <= current) {
                due.emplace_back(entry.second.deadline, entry.first);
            }
        }
    }
    std::sort(due.begin(), due.end());

    size_t fired = 0;
    for (const auto& item : due) {
        Callback fn;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = timers_.find(item.second);
            if (it == timers_.end()) continue;  // cancelled by an earlier callback

            fn = it->second.fn;
            if (it->second.interval_ms > 0) {
                // Skip missed periods instead of replaying them
                Timestamp next = it->second.deadline + it->second.interval_ms;
                if (next <= current) {
                    int64_t behind = current - it->second.deadline;
                    next = it->second.deadline +
                           (behind / it->second.interval_ms + 1) * it->second.interval_ms;
                }
                it->second.deadline = next;
            } else {
                timers_.erase(it);
            }
        }

        try {
            fn();
        } catch (const std::exception& e) {
            log_error("timer", "Timer %llu callback failed: %s",
                      static_cast<unsigned long long>(item.second), e.what());
        } catch (...) {
            log_error("timer", "Timer %llu callback failed: unknown error",
                      static_cast<unsigned long long>(item.second));
        }
        ++fired;
    }
    return fired;
}

void TimerLoop::start() {
    if (running_.exchange(true)) return;  // Already running

    thread_ = std::thread([this]() {
        run_loop();
    });
}

void TimerLoop::stop() {
    if (!running_.exchange(false)) return;  // Not running

    wake_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void TimerLoop::run_loop() {
    while (running_) {
        run_due();

        std::unique_lock<std::mutex> lock(mutex_);
        int64_t sleep_ms = MAX_SLEEP_MS;
        Timestamp current = clock_.now();
        for (const auto& entry : timers_) {
            sleep_ms = std::min(sleep_ms, entry.second.deadline - current);
        }
        if (sleep_ms <= 0) continue;

        // Woken early by schedule() or stop()
        wake_.wait_for(lock, std::chrono::milliseconds(sleep_ms));
    }
}

} // namespace anima
