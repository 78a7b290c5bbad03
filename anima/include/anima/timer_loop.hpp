#pragma once
// TimerLoop: repeating and one-shot timers on a single thread
//
// Hosts the daemon's cycle timer, the watchdog timer and the delayed
// first-cycle kick. Callbacks run on the loop thread, one at a time,
// with the loop's lock released so they may schedule or cancel timers.
//
// Driven two ways:
//   start()/stop()  background thread sleeping until the next deadline
//   run_due()       fire whatever is due right now (tests, ManualClock)

#include <anima/clock.hpp>
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>

namespace anima {

class TimerLoop {
public:
    using Callback = std::function<void()>;
    using TimerId = uint64_t;

    // Upper bound on one sleep, so a stopped loop notices promptly
    static constexpr int64_t MAX_SLEEP_MS = 1000;

    explicit TimerLoop(const Clock& clock);
    ~TimerLoop();

    // Non-copyable, non-movable (owns a thread)
    TimerLoop(const TimerLoop&) = delete;
    TimerLoop& operator=(const TimerLoop&) = delete;

    // First firing after `interval_ms`, then every `interval_ms`
    TimerId every(int64_t interval_ms, Callback fn);

    // Single firing after `delay_ms`
    TimerId after(int64_t delay_ms, Callback fn);

    // Returns false if the timer already fired (one-shot) or never existed
    bool cancel(TimerId id);

    // Fire every timer whose deadline is <= clock.now(), earliest first.
    // A repeating timer fires at most once per call.
    size_t run_due();

    void start();
    void stop();
    bool running() const { return running_; }

    size_t pending() const;

private:
    struct Timer {
        Timestamp deadline = 0;
        int64_t interval_ms = 0;  // 0 = one-shot
        Callback fn;
    };

    TimerId schedule(int64_t delay_ms, int64_t interval_ms, Callback fn);
    void run_loop();

    const Clock& clock_;
    mutable std::mutex mutex_;
    std::condition_variable wake_;
    std::map<TimerId, Timer> timers_;
    TimerId next_id_ = 1;

    std::atomic<bool> running_{false};
    std::thread thread_;
};

} // namespace anima
