#include <anima/daemon.hpp>
#include <anima/log.hpp>
#include <chrono>
#include <exception>

namespace anima {

const char* recovery_type_name(RecoveryType type) {
    switch (type) {
        case RecoveryType::ColdStart: return "cold_start";
        case RecoveryType::CrashRecovery: return "crash_recovery";
        case RecoveryType::WatchdogRecovery: return "watchdog_recovery";
        case RecoveryType::ManualRecovery: return "manual_recovery";
    }
    return "manual_recovery";
}

const char* daemon_phase_name(DaemonPhase phase) {
    switch (phase) {
        case DaemonPhase::Disabled: return "disabled";
        case DaemonPhase::Idle: return "idle";
        case DaemonPhase::Running: return "running";
        case DaemonPhase::ErrorPendingRecovery: return "error_pending_recovery";
    }
    return "disabled";
}

void to_json(json& j, const RecoveryEvent& e) {
    j = json{
        {"id", e.id},
        {"timestamp", e.timestamp},
        {"type", e.type},
        {"snapshot_used", e.snapshot_used ? json(*e.snapshot_used) : json(nullptr)},
        {"cycle_restored", e.cycle_restored},
        {"state_restored", {
            {"confidence", e.state_restored.confidence},
            {"autonomy", e.state_restored.autonomy},
            {"patterns_preserved", e.state_restored.patterns_preserved}
        }},
        {"notes", e.notes}
    };
}

namespace {

// Values the daemon divides by or sizes buffers with
DaemonConfig clamped(DaemonConfig config) {
    if (config.snapshot_every < 1) {
        log_warn("daemon", "snapshot_every=%d, using 1", config.snapshot_every);
        config.snapshot_every = 1;
    }
    if (config.failure_threshold < 1) {
        log_warn("daemon", "failure_threshold=%d, using 1", config.failure_threshold);
        config.failure_threshold = 1;
    }
    if (config.heartbeat_history == 0) config.heartbeat_history = 1;
    if (config.recovery_history == 0) config.recovery_history = 1;
    return config;
}

} // namespace

Daemon::Daemon(DaemonConfig config, TimerLoop& timers, const Clock& clock,
               SnapshotStore& store, CycleRunner& runner, StateProvider& state,
               Dispatcher dispatcher)
    : config_(clamped(std::move(config)))
    , timers_(timers)
    , clock_(clock)
    , store_(store)
    , runner_(runner)
    , state_(state)
    , dispatcher_(std::move(dispatcher))
    , watchdog_(timers, clock, *this, config_.watchdog_interval_ms, config_.heartbeat_timeout_ms)
    , heartbeats_(config_.heartbeat_history)
    , recoveries_(config_.recovery_history)
{
    log_info("daemon", "Initialized - continuous operation ready");
}

Daemon::~Daemon() {
    stop();

    // In-flight cycles reference this object; let them land
    std::vector<std::future<void>> pending;
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        pending.swap(tasks_);
    }
    for (auto& task : pending) {
        if (task.valid()) task.wait();
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════════════════════════════════

void Daemon::start() {
    if (enabled_) {
        log_warn("daemon", "Already running");
        return;
    }

    cold_start_recover();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        started_at_ = clock_.now();
        heartbeats_.record(HeartbeatStatus::Alive, current_cycle_, *started_at_);
    }
    enabled_ = true;

    arm_timers();
    watchdog_.start();

    log_info("daemon", "STARTED - Cycle interval: %llds",
             static_cast<long long>(config_.cycle_interval_ms / 1000));
    emit(DaemonEvent::Started, "Daemon started");
}

void Daemon::stop() {
    if (!enabled_) return;

    cancel_timers();
    watchdog_.stop();
    save_snapshot();
    enabled_ = false;

    log_info("daemon", "STOPPED - Final snapshot saved");
    emit(DaemonEvent::Stopped, "Daemon stopped");
}

void Daemon::set_cycle_interval(int64_t interval_ms) {
    config_.cycle_interval_ms = interval_ms;

    if (enabled_) {
        stop();
        start();
    }

    log_info("daemon", "Cycle interval set to %lldms", static_cast<long long>(interval_ms));
}

void Daemon::arm_timers() {
    cycle_timer_ = timers_.every(config_.cycle_interval_ms, [this]() { tick(); });
    first_kick_ = timers_.after(config_.first_cycle_delay_ms, [this]() { tick(); });
}

void Daemon::cancel_timers() {
    if (cycle_timer_) {
        timers_.cancel(*cycle_timer_);
        cycle_timer_.reset();
    }
    if (first_kick_) {
        timers_.cancel(*first_kick_);
        first_kick_.reset();
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Cold start
// ═══════════════════════════════════════════════════════════════════════════

bool Daemon::cold_start_recover() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cold_start_done_) {
            log_debug("daemon", "Cold-start recovery already performed - skipping");
            return false;
        }
        cold_start_done_ = true;
    }

    auto snapshot = store_.startup_snapshot();
    if (!snapshot) {
        log_info("daemon", "Cold start: no usable snapshot - fresh state");
        return false;
    }

    RestoredState restored;
    restored.confidence = snapshot->agent_state.confidence;
    restored.autonomy_level = snapshot->autonomy_level;
    restored.behavior_pattern_hash = snapshot->behavior_pattern_hash;

    std::string notes = "Restored from snapshot cycle " + std::to_string(snapshot->cycle);
    bool applied = true;
    try {
        state_.restore(restored);
    } catch (const std::exception& e) {
        applied = false;
        notes += "; restore into live state failed: " + std::string(e.what());
        log_error("daemon", "Cold start: restore failed: %s", e.what());
    }

    if (applied) {
        log_info("daemon", "Cold start: confidence=%d autonomy=%d patterns=%s (not reset)",
                 restored.confidence, restored.autonomy_level,
                 restored.behavior_pattern_hash.empty() ? "(none)" : restored.behavior_pattern_hash.c_str());
    }

    RecoveryEvent event;
    event.timestamp = clock_.now();
    event.id = generate_id("recovery", event.timestamp);
    event.type = RecoveryType::ColdStart;
    event.snapshot_used = snapshot->id;
    event.cycle_restored = snapshot->cycle;
    event.state_restored.confidence = restored.confidence;
    event.state_restored.autonomy = restored.autonomy_level;
    event.state_restored.patterns_preserved = applied;
    event.notes = notes;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        current_cycle_ = snapshot->cycle;
        resume_pending_ = true;
        restored_at_start_ = true;
        recoveries_.push(event);
    }

    emit(DaemonEvent::Recovered, "Cold start from cycle " + std::to_string(snapshot->cycle));
    return true;
}

// ═══════════════════════════════════════════════════════════════════════════
// Cycles
// ═══════════════════════════════════════════════════════════════════════════

void Daemon::tick() {
    if (!enabled_) return;

    if (in_flight_) {
        skipped_ticks_++;
        log_warn("daemon", "Cycle already running - skipping tick");
        emit(DaemonEvent::CycleSkipped, "Tick skipped: cycle in flight");
        return;
    }

    dispatch([this]() { run_cycle(); });
}

void Daemon::run_cycle() {
    uint64_t my_run = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!in_flight_) {
            in_flight_ = true;
            my_run = ++run_id_;
        }
    }
    if (my_run == 0) {
        skipped_ticks_++;
        log_warn("daemon", "Cycle already running - skipping");
        return;
    }

    // Final step: release the guard unless recovery took it away, in which
    // case run_id_ has moved on and the guard belongs to someone else
    struct GuardRelease {
        Daemon& self;
        uint64_t run;
        ~GuardRelease() {
            std::lock_guard<std::mutex> lock(self.mutex_);
            if (self.run_id_ == run) {
                self.cycle_started_at_.reset();
                self.in_flight_ = false;
            }
        }
    } release{*this, my_run};

    CycleContext ctx;
    Timestamp started = clock_.now();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ctx.cycle = current_cycle_ + 1;
        ctx.resumed_after_restart = resume_pending_;
        resume_pending_ = false;
        cycle_started_at_ = started;
        heartbeats_.record(HeartbeatStatus::Running, ctx.cycle, started);
    }
    log_info("daemon", "Heartbeat: running | Cycle %lld%s",
             static_cast<long long>(ctx.cycle),
             ctx.resumed_after_restart ? " | resumed after restart" : "");

    CycleResult result;
    std::string failure;
    try {
        result = runner_.run_one_cycle(ctx);
        if (!result.success) {
            failure = result.error.empty() ? "cycle reported failure" : result.error;
        }
    } catch (const std::exception& e) {
        result.success = false;
        failure = std::string("cycle crashed: ") + e.what();
    } catch (...) {
        result.success = false;
        failure = "cycle crashed: unknown error";
    }

    Timestamp finished = clock_.now();
    int64_t duration = finished - started;
    bool take_snapshot = false;
    bool needs_recovery = false;
    int64_t cycle = ctx.cycle;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (result.success) {
            if (result.cycle > 0) cycle = result.cycle;
            current_cycle_ = cycle;
            total_cycles_run_++;
            heartbeats_.record(HeartbeatStatus::Completed, cycle, finished, duration);
            take_snapshot = total_cycles_run_ % static_cast<size_t>(config_.snapshot_every) == 0;
        } else {
            const auto& hb = heartbeats_.record(HeartbeatStatus::Error, cycle, finished, duration);
            needs_recovery = hb.consecutive_failures >= config_.failure_threshold;
        }
    }

    if (result.success) {
        log_info("daemon", "Heartbeat: completed | Cycle %lld | Duration %lldms",
                 static_cast<long long>(cycle), static_cast<long long>(duration));
        emit(DaemonEvent::CycleCompleted, "Cycle " + std::to_string(cycle) + " completed");
        if (take_snapshot) {
            save_snapshot();
        }
    } else {
        log_error("daemon", "Heartbeat: error | Cycle %lld | Duration %lldms | %s",
                  static_cast<long long>(cycle), static_cast<long long>(duration), failure.c_str());
        emit(DaemonEvent::CycleFailed, failure);
        if (needs_recovery) {
            log_warn("daemon", "%d consecutive failures - triggering recovery",
                     config_.failure_threshold);
            recover(RecoveryType::CrashRecovery,
                    std::to_string(config_.failure_threshold) + " consecutive failures, last: " + failure);
        }
    }
}

void Daemon::dispatch(std::function<void()> fn) {
    if (dispatcher_) {
        dispatcher_(std::move(fn));
        return;
    }

    reap_finished_tasks();
    std::lock_guard<std::mutex> lock(tasks_mutex_);
    tasks_.push_back(std::async(std::launch::async, std::move(fn)));
}

void Daemon::reap_finished_tasks() {
    std::lock_guard<std::mutex> lock(tasks_mutex_);
    auto it = tasks_.begin();
    while (it != tasks_.end()) {
        if (it->wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
            it = tasks_.erase(it);
        } else {
            ++it;
        }
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Recovery
// ═══════════════════════════════════════════════════════════════════════════

RecoveryEvent Daemon::recover(RecoveryType type, const std::string& reason) {
    log_info("daemon", "Starting %s procedure: %s", recovery_type_name(type), reason.c_str());

    // In-memory only; recovery never touches the snapshot file
    auto snapshot = store_.last();

    RecoveryEvent event;
    event.timestamp = clock_.now();
    event.id = generate_id("recovery", event.timestamp);
    event.type = type;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        recovery_count_++;
        last_recovery_ = event.timestamp;

        if (snapshot) {
            event.snapshot_used = snapshot->id;
            event.cycle_restored = snapshot->cycle;
            event.state_restored.confidence = snapshot->agent_state.confidence;
            event.state_restored.autonomy = snapshot->autonomy_level;
            event.state_restored.patterns_preserved = true;
            event.notes = reason + "; state from snapshot cycle " + std::to_string(snapshot->cycle);
        } else {
            event.cycle_restored = current_cycle_;
            event.state_restored.patterns_preserved = false;
            event.notes = reason + "; no snapshot available - patterns not preserved";
        }

        // Only the stuck-execution guard is cleared; history counters stay.
        // A stuck run that lands later no longer owns the guard.
        cycle_started_at_.reset();
        in_flight_ = false;
        ++run_id_;
        heartbeats_.record(HeartbeatStatus::Alive, current_cycle_, event.timestamp);
        recoveries_.push(event);
    }

    if (snapshot) {
        log_info("daemon", "Restoring from snapshot cycle %lld", static_cast<long long>(snapshot->cycle));
    } else {
        log_warn("daemon", "No snapshot available - patterns not preserved");
    }
    log_info("daemon", "Recovery complete - resuming operations");
    emit(DaemonEvent::Recovered, event.notes);
    return event;
}

void Daemon::force_recover(const std::string& reason) {
    if (in_flight_) {
        log_warn("daemon", "Force stopping stalled cycle");
    }
    recover(RecoveryType::WatchdogRecovery, reason);
}

std::optional<StateSnapshot> Daemon::save_snapshot() {
    LiveState live;
    try {
        live = state_.capture();
    } catch (const std::exception& e) {
        log_error("daemon", "State capture failed, snapshotting defaults: %s", e.what());
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        live.cycle = current_cycle_;
    }

    bool written = false;
    StateSnapshot snapshot = store_.save(live, &written);
    if (!written) return std::nullopt;

    emit(DaemonEvent::SnapshotSaved, snapshot.id);
    return snapshot;
}

// ═══════════════════════════════════════════════════════════════════════════
// Queries
// ═══════════════════════════════════════════════════════════════════════════

bool Daemon::is_healthy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto last = heartbeats_.last();
    if (!last) return false;

    int64_t age = clock_.now() - last->timestamp;
    return age < config_.heartbeat_timeout_ms &&
           last->consecutive_failures < config_.failure_threshold;
}

DaemonPhase Daemon::phase() const {
    if (!enabled_) return DaemonPhase::Disabled;
    if (in_flight_) return DaemonPhase::Running;

    std::lock_guard<std::mutex> lock(mutex_);
    auto last = heartbeats_.last();
    if (last && last->status == HeartbeatStatus::Error) {
        return DaemonPhase::ErrorPendingRecovery;
    }
    return DaemonPhase::Idle;
}

std::vector<Heartbeat> Daemon::heartbeat_history(size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return heartbeats_.recent(limit);
}

std::optional<Heartbeat> Daemon::last_heartbeat() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return heartbeats_.last();
}

std::vector<RecoveryEvent> Daemon::recovery_events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return recoveries_.to_vector();
}

size_t Daemon::recovery_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return recovery_count_;
}

std::optional<Timestamp> Daemon::last_recovery_at() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_recovery_;
}

size_t Daemon::total_cycles_run() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_cycles_run_;
}

int64_t Daemon::current_cycle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_cycle_;
}

std::optional<Timestamp> Daemon::last_heartbeat_at() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto last = heartbeats_.last();
    if (!last) return std::nullopt;
    return last->timestamp;
}

std::optional<Timestamp> Daemon::cycle_started_at() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cycle_started_at_;
}

json Daemon::export_status() const {
    bool healthy = is_healthy();
    DaemonPhase current_phase = phase();
    auto snapshot = store_.last();

    std::lock_guard<std::mutex> lock(mutex_);
    Timestamp current = clock_.now();
    auto last = heartbeats_.last();

    json status = {
        {"enabled", enabled_.load()},
        {"running", in_flight_.load()},
        {"healthy", healthy},
        {"phase", daemon_phase_name(current_phase)},
        {"started_at", started_at_ ? json(*started_at_) : json(nullptr)},
        {"uptime_ms", started_at_ ? current - *started_at_ : 0},
        {"current_cycle", current_cycle_},
        {"total_cycles_run", total_cycles_run_},
        {"skipped_ticks", skipped_ticks_.load()},
        {"cycle_interval_ms", config_.cycle_interval_ms},
        {"watchdog_enabled", watchdog_.enabled()},
        {"last_heartbeat", last ? json(*last) : json(nullptr)},
        {"recovery_count", recovery_count_},
        {"last_recovery", last_recovery_ ? json(*last_recovery_) : json(nullptr)},
        {"resumed_after_restart", restored_at_start_}
    };
    if (snapshot) {
        status["last_snapshot"] = {
            {"id", snapshot->id},
            {"cycle", snapshot->cycle},
            {"timestamp", snapshot->timestamp}
        };
    } else {
        status["last_snapshot"] = nullptr;
    }
    return status;
}

void Daemon::emit(DaemonEvent event, const std::string& msg) {
    if (callback_) {
        callback_(event, msg);
    }
}

} // namespace anima
