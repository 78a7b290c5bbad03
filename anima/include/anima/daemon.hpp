#pragma once
// Daemon: the agent's autonomous heartbeat
//
// A living system keeps thinking without being told to. The daemon
// owns the recurring cycle timer, guards against overlapping cycles,
// records heartbeats, snapshots every K completed cycles, and hands
// stall detection to its watchdog.
//
// Lifecycle: construct → start() → ... → stop(). Nothing here throws
// across the public surface and nothing terminates the process; every
// failure degrades to "keep cycling with less confidence in state".

#include <anima/clock.hpp>
#include <anima/collaborators.hpp>
#include <anima/config.hpp>
#include <anima/heartbeat.hpp>
#include <anima/snapshot.hpp>
#include <anima/timer_loop.hpp>
#include <anima/watchdog.hpp>
#include <atomic>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace anima {

enum class RecoveryType {
    ColdStart,
    CrashRecovery,
    WatchdogRecovery,
    ManualRecovery
};

NLOHMANN_JSON_SERIALIZE_ENUM(RecoveryType, {
    {RecoveryType::ColdStart, "cold_start"},
    {RecoveryType::CrashRecovery, "crash_recovery"},
    {RecoveryType::WatchdogRecovery, "watchdog_recovery"},
    {RecoveryType::ManualRecovery, "manual_recovery"},
})

const char* recovery_type_name(RecoveryType type);

// Process-liveness recovery (distinct from continuity's RebirthEvent)
struct RecoveryEvent {
    std::string id;
    Timestamp timestamp = 0;
    RecoveryType type = RecoveryType::ManualRecovery;
    std::optional<std::string> snapshot_used;
    int64_t cycle_restored = 0;
    struct {
        int confidence = 0;
        int autonomy = 0;
        bool patterns_preserved = false;
    } state_restored;
    std::string notes;
};

void to_json(json& j, const RecoveryEvent& e);

enum class DaemonPhase {
    Disabled,
    Idle,
    Running,
    ErrorPendingRecovery
};

const char* daemon_phase_name(DaemonPhase phase);

// Daemon event types
enum class DaemonEvent {
    Started,
    Stopped,
    CycleCompleted,
    CycleFailed,
    CycleSkipped,
    SnapshotSaved,
    Recovered
};

// Daemon callback for events
using DaemonCallback = std::function<void(DaemonEvent, const std::string&)>;

// Runs a cycle body somewhere other than the timer thread
using Dispatcher = std::function<void(std::function<void()>)>;

class Daemon : public Supervised {
public:
    // Empty dispatcher = one std::async task per cycle
    Daemon(DaemonConfig config, TimerLoop& timers, const Clock& clock,
           SnapshotStore& store, CycleRunner& runner, StateProvider& state,
           Dispatcher dispatcher = {});
    ~Daemon() override;

    // Non-copyable, non-movable (timers capture `this`)
    Daemon(const Daemon&) = delete;
    Daemon& operator=(const Daemon&) = delete;

    void on_event(DaemonCallback callback) { callback_ = std::move(callback); }

    // Cold-start recovery, "alive" heartbeat, cycle timer, watchdog,
    // and a first cycle after first_cycle_delay_ms
    void start();

    // Cancel timers, stop the watchdog, final snapshot. An in-flight
    // cycle is allowed to finish.
    void stop();

    bool enabled() const { return enabled_; }

    // Restore confidence/autonomy/patterns from the startup snapshot.
    // Runs at most once per process; returns true only when it restored.
    bool cold_start_recover();

    // One cycle, synchronously. No-op if a cycle is already in flight.
    void run_cycle();

    // Timer entry point: dispatch run_cycle() unless one is in flight
    void tick();

    // Shared by crash, watchdog and manual paths
    RecoveryEvent recover(RecoveryType type, const std::string& reason);

    // Stop-then-restart when enabled
    void set_cycle_interval(int64_t interval_ms);

    // nullopt when the write failed
    std::optional<StateSnapshot> save_snapshot();

    // Heartbeat exists, is younger than the stall timeout, and the
    // failure streak is below the threshold
    bool is_healthy() const;

    DaemonPhase phase() const;
    bool cycle_in_flight() const { return in_flight_; }

    std::vector<Heartbeat> heartbeat_history(size_t limit = 20) const;
    std::optional<Heartbeat> last_heartbeat() const;
    std::vector<RecoveryEvent> recovery_events() const;

    size_t recovery_count() const;
    std::optional<Timestamp> last_recovery_at() const;
    size_t total_cycles_run() const;
    size_t skipped_ticks() const { return skipped_ticks_; }
    int64_t current_cycle() const;
    const DaemonConfig& config() const { return config_; }
    Watchdog& watchdog() { return watchdog_; }

    // Read-only, side-effect free
    json export_status() const;

    // Supervised
    std::optional<Timestamp> last_heartbeat_at() const override;
    std::optional<Timestamp> cycle_started_at() const override;
    void force_recover(const std::string& reason) override;

private:
    void dispatch(std::function<void()> fn);
    void reap_finished_tasks();
    void emit(DaemonEvent event, const std::string& msg);
    void arm_timers();
    void cancel_timers();

    DaemonConfig config_;
    TimerLoop& timers_;
    const Clock& clock_;
    SnapshotStore& store_;
    CycleRunner& runner_;
    StateProvider& state_;
    Dispatcher dispatcher_;
    DaemonCallback callback_;
    Watchdog watchdog_;

    mutable std::mutex mutex_;
    HeartbeatLog heartbeats_;
    RingBuffer<RecoveryEvent> recoveries_;
    std::optional<Timestamp> started_at_;
    std::optional<Timestamp> last_recovery_;
    std::optional<Timestamp> cycle_started_at_;
    int64_t current_cycle_ = 0;
    size_t total_cycles_run_ = 0;
    size_t recovery_count_ = 0;
    bool cold_start_done_ = false;
    bool resume_pending_ = false;   // next cycle follows a cold-start restore
    bool restored_at_start_ = false;

    std::atomic<bool> enabled_{false};
    std::atomic<bool> in_flight_{false};   // reentrancy guard
    uint64_t run_id_ = 0;                  // owner of the guard, under mutex_
    std::atomic<size_t> skipped_ticks_{0};

    std::optional<TimerLoop::TimerId> cycle_timer_;
    std::optional<TimerLoop::TimerId> first_kick_;

    std::mutex tasks_mutex_;
    std::vector<std::future<void>> tasks_;
};

} // namespace anima
