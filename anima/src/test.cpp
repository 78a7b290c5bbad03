#include <anima/config.hpp>
#include <anima/continuity.hpp>
#include <anima/control.hpp>
#include <anima/control_server.hpp>
#include <anima/daemon.hpp>
#include <anima/heartbeat.hpp>
#include <anima/local_agent.hpp>
#include <anima/log.hpp>
#include <anima/snapshot.hpp>
#include <anima/socket_client.hpp>
#include <anima/soul.hpp>
#include <anima/status.hpp>
#include <anima/timer_loop.hpp>
#include <anima/types.hpp>
#include <iostream>
#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>
#include <sys/socket.h>
#include <sys/un.h>
#include <poll.h>
#include <unistd.h>

using namespace anima;

// ═══════════════════════════════════════════════════════════════════════════
// Fixtures
// ═══════════════════════════════════════════════════════════════════════════

std::string temp_path(const char* name) {
    return "/tmp/anima_test_" + std::to_string(getpid()) + "_" + name + ".json";
}

void inline_dispatch(std::function<void()> fn) {
    fn();
}

struct ScriptedRunner : CycleRunner {
    std::function<CycleResult(const CycleContext&)> script;
    std::vector<CycleContext> seen;

    CycleResult run_one_cycle(const CycleContext& ctx) override {
        seen.push_back(ctx);
        if (script) return script(ctx);
        CycleResult r;
        r.success = true;
        r.cycle = ctx.cycle;
        return r;
    }
};

CycleResult failed_cycle(const CycleContext& ctx) {
    CycleResult r;
    r.success = false;
    r.cycle = ctx.cycle;
    r.error = "simulated failure";
    return r;
}

struct FakeState : StateProvider {
    LiveState live;
    std::vector<RestoredState> restored;

    LiveState capture() const override { return live; }
    void restore(const RestoredState& state) override { restored.push_back(state); }
};

struct FakeIdentity : IdentitySource {
    json summary = json::object();
    int integrity = 100;
    json export_summary() const override { return summary; }
    int integrity_score() const override { return integrity; }
};

struct FakeEvolution : EvolutionSource {
    json summary = json::object();
    size_t log_size = 0;
    json export_summary() const override { return summary; }
    size_t evolution_log_size() const override { return log_size; }
};

struct FakeMemory : MemorySource {
    std::vector<std::string> core;
    std::vector<std::string> lessons;
    int64_t processed = 0;

    json export_summary() const override {
        return {
            {"core_identity_count", core.size()},
            {"active_lessons_count", lessons.size()},
            {"total_processed", processed}
        };
    }
    std::vector<std::string> core_identity() const override { return core; }
    std::vector<std::string> active_lessons() const override { return lessons; }
};

json identity_summary(const std::string& purpose, const std::string& version = "1.0") {
    return {
        {"origin", "workshop"},
        {"purpose", purpose},
        {"non_negotiables", {"no deception"}},
        {"boundaries", {"no self-modification without review"}},
        {"current_version", version}
    };
}

json evolution_summary(const std::string& version) {
    return {
        {"version", version},
        {"evolution_count", 3},
        {"mode", "stable"},
        {"capabilities", {"plan", "reflect"}}
    };
}

DaemonConfig test_config(const std::string& path) {
    DaemonConfig cfg;
    cfg.snapshot_path = path;
    cfg.cycle_interval_ms = 500;
    cfg.watchdog_interval_ms = 100;
    cfg.heartbeat_timeout_ms = 1000;
    cfg.first_cycle_delay_ms = 50;
    cfg.snapshot_every = 5;
    cfg.failure_threshold = 3;
    return cfg;
}

struct LogCapture {
    struct Line {
        LogLevel level;
        std::string component;
        std::string message;
    };
    std::vector<Line> lines;

    LogCapture() {
        set_log_sink([this](LogLevel level, const std::string& component, const std::string& message) {
            lines.push_back({level, component, message});
        });
    }
    ~LogCapture() { set_log_sink({}); }

    bool contains(LogLevel level, const std::string& needle) const {
        for (const auto& l : lines) {
            if (l.level == level && l.message.find(needle) != std::string::npos) return true;
        }
        return false;
    }
};

// One-shot latch between a test and a cycle body on another thread
struct Gate {
    std::mutex m;
    std::condition_variable cv;
    bool open = false;

    void release() {
        {
            std::lock_guard<std::mutex> lock(m);
            open = true;
        }
        cv.notify_all();
    }

    bool wait(int timeout_ms = 5000) {
        std::unique_lock<std::mutex> lock(m);
        return cv.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this]() { return open; });
    }
};

CycleResult completed_cycle(const CycleContext& ctx) {
    CycleResult r;
    r.success = true;
    r.cycle = ctx.cycle;
    return r;
}

bool has_detail(const DiscontinuityReport& r, const std::string& prefix) {
    for (const auto& d : r.details) {
        if (d.compare(0, prefix.size(), prefix) == 0) return true;
    }
    return false;
}

// Raw peer for the control socket tests
int connect_raw(const std::string& path) {
    int fd = socket(AF_UNIX, SOCK_STREAM, 0);
    assert(fd >= 0);
    struct sockaddr_un addr;
    memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
    int rc = connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr));
    assert(rc == 0);
    (void)rc;
    return fd;
}

void send_raw(int fd, const std::string& bytes) {
    size_t sent = 0;
    while (sent < bytes.size()) {
        ssize_t n = send(fd, bytes.data() + sent, bytes.size() - sent, MSG_NOSIGNAL);
        assert(n > 0);
        sent += static_cast<size_t>(n);
    }
}

// Reads until `lines` newlines arrive, the peer closes or the timeout passes
std::string read_raw(int fd, size_t lines, bool* closed = nullptr, int timeout_ms = 3000) {
    std::string got;
    if (closed) *closed = false;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (static_cast<size_t>(std::count(got.begin(), got.end(), '\n')) < lines) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (left <= 0) break;
        pollfd pfd = {fd, POLLIN, 0};
        if (poll(&pfd, 1, static_cast<int>(left)) <= 0) break;
        char buf[4096];
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n <= 0) {
            if (closed) *closed = true;
            break;
        }
        got.append(buf, static_cast<size_t>(n));
    }
    return got;
}

std::string echo_line(const std::string& line) {
    return "echo:" + line;
}

// ═══════════════════════════════════════════════════════════════════════════
// Building blocks
// ═══════════════════════════════════════════════════════════════════════════

void test_ring_buffer() {
    std::cout << "Testing RingBuffer..." << std::endl;

    RingBuffer<int> ring(3);
    assert(ring.empty());
    for (int i = 1; i <= 5; ++i) ring.push(i);

    assert(ring.size() == 3);
    assert(ring.capacity() == 3);
    assert(ring[0] == 3);
    assert(ring.back() == 5);
    assert((ring.last(2) == std::vector<int>{4, 5}));
    assert((ring.to_vector() == std::vector<int>{3, 4, 5}));
    assert(ring.last(10).size() == 3);

    ring.clear();
    assert(ring.empty());
    ring.push(9);
    assert(ring.back() == 9);

    bool threw = false;
    try {
        RingBuffer<int> bad(0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

void test_timer_loop() {
    std::cout << "Testing TimerLoop..." << std::endl;

    ManualClock clock;
    TimerLoop timers(clock);
    int repeating = 0;
    int once = 0;

    auto every = timers.every(100, [&]() { repeating++; });
    auto after = timers.after(50, [&]() { once++; });
    assert(timers.pending() == 2);
    assert(timers.run_due() == 0);

    clock.advance(50);
    assert(timers.run_due() == 1);
    assert(once == 1);
    assert(timers.pending() == 1);

    clock.advance(50);
    assert(timers.run_due() == 1);
    assert(repeating == 1);

    // Three periods late: fires once, not three times
    clock.advance(350);
    assert(timers.run_due() == 1);
    assert(repeating == 2);
    clock.advance(49);
    assert(timers.run_due() == 0);
    clock.advance(1);
    assert(timers.run_due() == 1);
    assert(repeating == 3);

    assert(timers.cancel(every));
    assert(!timers.cancel(after));
    assert(timers.pending() == 0);

    // A throwing callback is contained
    timers.after(0, []() { throw std::runtime_error("boom"); });
    {
        LogCapture logs;
        assert(timers.run_due() == 1);
        assert(logs.contains(LogLevel::Error, "boom"));
    }

    std::cout << "  PASS" << std::endl;
}

void test_heartbeat_streaks() {
    std::cout << "Testing heartbeat streaks..." << std::endl;

    HeartbeatLog log(10);
    assert(!log.last());

    log.record(HeartbeatStatus::Alive, 0, 1);
    log.record(HeartbeatStatus::Running, 1, 2);
    auto& ok = log.record(HeartbeatStatus::Completed, 1, 3, 5);
    assert(ok.consecutive_successes == 1);
    assert(ok.consecutive_failures == 0);
    assert(ok.cycle_duration_ms == 5);

    log.record(HeartbeatStatus::Running, 2, 4);
    auto& err = log.record(HeartbeatStatus::Error, 2, 5);
    assert(err.consecutive_successes == 0);
    assert(err.consecutive_failures == 1);

    // An attempt carries the streak; it is not an outcome
    auto& running = log.record(HeartbeatStatus::Running, 3, 6);
    assert(running.consecutive_failures == 1);
    auto& err2 = log.record(HeartbeatStatus::Error, 3, 7);
    assert(err2.consecutive_failures == 2);

    auto& alive = log.record(HeartbeatStatus::Alive, 3, 8);
    assert(alive.consecutive_failures == 0);
    assert(alive.consecutive_successes == 0);

    assert(log.size() == 8);
    assert(log.recent(3).size() == 3);
    assert(log.recent(3).back().status == HeartbeatStatus::Alive);

    json j = *log.last();
    assert(j["status"] == "alive");

    std::cout << "  PASS" << std::endl;
}

void test_config() {
    std::cout << "Testing config layering..." << std::endl;

    AppConfig config;
    assert(config.daemon.cycle_interval_ms == 600000);
    assert(config.daemon.snapshot_every == 5);

    std::string path = temp_path("config");
    {
        std::ofstream out(path);
        out << R"({"daemon": {"snapshot_every": 0, "heartbeat_timeout_ms": 700000},
                   "continuity": {"evolution_jump_threshold": 4},
                   "soul_path": "/tmp/soul.json"})";
    }
    assert(apply_config_file(config, path));
    assert(config.daemon.heartbeat_timeout_ms == 700000);
    assert(config.continuity.evolution_jump_threshold == 4);
    assert(config.soul_path == "/tmp/soul.json");

    setenv("ANIMA_CYCLE_INTERVAL_MS", "1234", 1);
    setenv("ANIMA_WATCHDOG_INTERVAL_MS", "soon", 1);
    apply_environment(config);
    unsetenv("ANIMA_CYCLE_INTERVAL_MS");
    unsetenv("ANIMA_WATCHDOG_INTERVAL_MS");
    assert(config.daemon.cycle_interval_ms == 1234);
    assert(config.daemon.watchdog_interval_ms == 60000);

    auto warnings = validate(config);
    assert(config.daemon.snapshot_every == 1);
    assert(!warnings.empty());

    // Missing file: untouched; malformed: error
    AppConfig untouched;
    assert(!apply_config_file(untouched, temp_path("config_missing")));
    {
        std::ofstream out(path);
        out << "{ not json";
    }
    bool threw = false;
    try {
        apply_config_file(untouched, path);
    } catch (const ConfigError&) {
        threw = true;
    }
    assert(threw);
    std::remove(path.c_str());

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Snapshot store
// ═══════════════════════════════════════════════════════════════════════════

LiveState example_state() {
    LiveState live;
    live.cycle = 42;
    live.agent.cycle_count = 42;
    live.agent.confidence = 61;
    live.agent.doubts = 12;
    live.agent.energy_level = 80;
    live.agent.mode = "reflecting";
    live.autonomy_level = 55;
    live.active_constraints = {"no network", "ask before deleting"};
    live.behavior_pattern_hash = "9f2c";
    return live;
}

void test_snapshot_round_trip() {
    std::cout << "Testing snapshot round trip..." << std::endl;

    std::string path = temp_path("snapshot_rt");
    std::remove(path.c_str());
    ManualClock clock;

    SnapshotStore writer(path, clock);
    StateSnapshot saved = writer.save(example_state());
    assert(saved.checksum.size() == 8);
    assert(saved.schema_version == 2);
    assert(writer.last() && writer.last()->id == saved.id);

    SnapshotStore reader(path, clock);
    auto loaded = reader.load();
    assert(loaded);
    assert(loaded->id == saved.id);
    assert(loaded->cycle == 42);
    assert(loaded->agent_state == saved.agent_state);
    assert(loaded->autonomy_level == 55);
    assert(loaded->active_constraints.count("no network") == 1);
    assert(loaded->behavior_pattern_hash == "9f2c");
    assert(checksum_valid(*loaded));
    assert(reader.stats().loads == 1);

    // Only cycle, agent_state and autonomy are covered
    AgentState other = saved.agent_state;
    other.confidence = 62;
    assert(snapshot_checksum(42, other, 55) != saved.checksum);
    assert(snapshot_checksum(42, saved.agent_state, 55) == saved.checksum);

    std::remove(path.c_str());
    std::cout << "  PASS" << std::endl;
}

void test_snapshot_tamper_detection() {
    std::cout << "Testing snapshot tamper detection..." << std::endl;

    std::string path = temp_path("snapshot_tamper");
    ManualClock clock;
    SnapshotStore writer(path, clock);
    writer.save(example_state());

    // Flip one covered digit, keep the stored checksum
    json doc;
    {
        std::ifstream in(path);
        doc = json::parse(in);
    }
    doc["agent_state"]["confidence"] = 16;
    {
        std::ofstream out(path);
        out << doc.dump(2);
    }

    LogCapture logs;
    SnapshotStore reader(path, clock);
    assert(!reader.load());
    assert(!reader.last());
    assert(reader.stats().rejected_loads == 1);
    assert(logs.contains(LogLevel::Warn, "checksum mismatch"));

    // Left in place for inspection
    std::ifstream still(path);
    assert(still.good());

    std::remove(path.c_str());
    std::cout << "  PASS" << std::endl;
}

void test_snapshot_missing_vs_corrupt() {
    std::cout << "Testing snapshot missing vs corrupt..." << std::endl;

    ManualClock clock;
    std::string missing = temp_path("snapshot_missing");
    std::remove(missing.c_str());
    std::string corrupt = temp_path("snapshot_corrupt");
    {
        std::ofstream out(corrupt);
        out << "{\"id\": \"snap_1\", \"cycle\": ";
    }

    LogCapture logs;
    SnapshotStore a(missing, clock);
    assert(!a.load());
    assert(a.stats().rejected_loads == 0);
    assert(logs.contains(LogLevel::Info, "starting fresh"));

    SnapshotStore b(corrupt, clock);
    assert(!b.load());
    assert(b.stats().rejected_loads == 1);
    assert(logs.contains(LogLevel::Warn, "unreadable"));

    // Newer schema than this build understands
    SnapshotStore c(corrupt, clock);
    c.save(example_state());
    json doc;
    {
        std::ifstream in(corrupt);
        doc = json::parse(in);
    }
    doc["schema_version"] = 99;
    {
        std::ofstream out(corrupt);
        out << doc.dump();
    }
    assert(!b.load());
    assert(logs.contains(LogLevel::Warn, "schema v99"));

    std::remove(corrupt.c_str());
    std::cout << "  PASS" << std::endl;
}

void test_snapshot_failed_write() {
    std::cout << "Testing snapshot failed write..." << std::endl;

    ManualClock clock;
    LogCapture logs;
    SnapshotStore store("/proc/anima_test_no_such_dir/state.json", clock);
    bool written = true;
    StateSnapshot attempted = store.save(example_state(), &written);

    assert(!written);
    assert(!attempted.id.empty());
    assert(!store.last());
    assert(store.stats().saves == 0);
    assert(store.stats().failed_saves == 1);

    std::cout << "  PASS" << std::endl;
}

void test_snapshot_concurrent_writers() {
    std::cout << "Testing concurrent snapshot writers..." << std::endl;

    std::string path = temp_path("snapshot_concurrent");
    std::remove(path.c_str());
    ManualClock clock;
    SnapshotStore store(path, clock);

    const int rounds = 200;
    auto writer = [&store](int base) {
        LiveState live = example_state();
        for (int i = 0; i < rounds; ++i) {
            live.cycle = base + i;
            bool written = false;
            store.save(live, &written);
            assert(written);
        }
    };

    {
        LogCapture quiet;
        std::thread a(writer, 0);
        std::thread b(writer, 100000);
        a.join();
        b.join();
    }

    assert(store.stats().saves == 2 * rounds);
    assert(store.stats().failed_saves == 0);

    // last() names exactly the bytes on disk
    SnapshotStore reader(path, clock);
    auto on_disk = reader.load();
    assert(on_disk);
    assert(on_disk->id == store.last()->id);
    assert(on_disk->cycle == store.last()->cycle);

    std::remove(path.c_str());
    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Daemon
// ═══════════════════════════════════════════════════════════════════════════

void test_daemon_three_strikes() {
    std::cout << "Testing daemon three strikes..." << std::endl;

    std::string path = temp_path("three_strikes");
    std::remove(path.c_str());
    ManualClock clock;
    TimerLoop timers(clock);
    SnapshotStore store(path, clock);
    ScriptedRunner runner;
    FakeState state;

    int calls = 0;
    runner.script = [&](const CycleContext& ctx) -> CycleResult {
        // Reported failures and thrown errors both count
        if (++calls % 2 == 0) throw std::runtime_error("collaborator exploded");
        return failed_cycle(ctx);
    };

    Daemon daemon(test_config(path), timers, clock, store, runner, state, inline_dispatch);
    daemon.start();
    assert(daemon.recovery_count() == 0);
    assert(daemon.recovery_events().empty());

    daemon.run_cycle();
    daemon.run_cycle();
    assert(daemon.recovery_count() == 0);
    assert(daemon.phase() == DaemonPhase::ErrorPendingRecovery);
    daemon.run_cycle();
    assert(daemon.recovery_count() == 1);
    assert(daemon.recovery_events().back().type == RecoveryType::CrashRecovery);
    assert(daemon.last_heartbeat()->status == HeartbeatStatus::Alive);

    // Streak restarts after recovery: two more failures are not enough
    daemon.run_cycle();
    daemon.run_cycle();
    assert(daemon.recovery_count() == 1);
    daemon.run_cycle();
    assert(daemon.recovery_count() == 2);
    assert(daemon.total_cycles_run() == 0);

    daemon.stop();
    std::remove(path.c_str());
    std::cout << "  PASS" << std::endl;
}

void test_daemon_reentrancy() {
    std::cout << "Testing daemon reentrancy guard..." << std::endl;

    std::string path = temp_path("reentrancy");
    std::remove(path.c_str());
    ManualClock clock;
    TimerLoop timers(clock);
    SnapshotStore store(path, clock);
    ScriptedRunner runner;
    FakeState state;

    Daemon daemon(test_config(path), timers, clock, store, runner, state, inline_dispatch);
    int bodies = 0;
    runner.script = [&](const CycleContext& ctx) -> CycleResult {
        bodies++;
        assert(daemon.cycle_in_flight());
        assert(daemon.phase() == DaemonPhase::Running);
        daemon.tick();
        daemon.run_cycle();
        CycleResult r;
        r.success = true;
        r.cycle = ctx.cycle;
        return r;
    };

    daemon.start();
    daemon.run_cycle();

    assert(bodies == 1);
    assert(daemon.skipped_ticks() == 2);
    assert(!daemon.cycle_in_flight());
    assert(daemon.total_cycles_run() == 1);
    assert(daemon.current_cycle() == 1);

    // Guard released: the next tick runs
    daemon.tick();
    assert(bodies == 2);

    daemon.stop();
    std::remove(path.c_str());
    std::cout << "  PASS" << std::endl;
}

void test_daemon_snapshot_cadence() {
    std::cout << "Testing snapshot cadence..." << std::endl;

    std::string path = temp_path("cadence");
    std::remove(path.c_str());
    ManualClock clock;
    TimerLoop timers(clock);
    SnapshotStore store(path, clock);
    ScriptedRunner runner;
    FakeState state;
    state.live = example_state();

    DaemonConfig cfg = test_config(path);
    cfg.snapshot_every = 2;
    Daemon daemon(cfg, timers, clock, store, runner, state, inline_dispatch);

    int saved_events = 0;
    daemon.on_event([&](DaemonEvent event, const std::string&) {
        if (event == DaemonEvent::SnapshotSaved) saved_events++;
    });

    daemon.start();
    for (int i = 0; i < 5; ++i) daemon.run_cycle();

    assert(store.stats().saves == 2);
    assert(saved_events == 2);
    // Cycle comes from the daemon, not the captured state
    assert(store.last()->cycle == 4);

    daemon.stop();
    assert(store.stats().saves == 3);
    assert(store.last()->cycle == 5);
    assert(!daemon.enabled());

    // Stopping twice does nothing
    daemon.stop();
    assert(store.stats().saves == 3);

    std::remove(path.c_str());
    std::cout << "  PASS" << std::endl;
}

void test_daemon_timers() {
    std::cout << "Testing daemon timers..." << std::endl;

    std::string path = temp_path("timers");
    std::remove(path.c_str());
    ManualClock clock;
    TimerLoop timers(clock);
    SnapshotStore store(path, clock);
    ScriptedRunner runner;
    FakeState state;

    Daemon daemon(test_config(path), timers, clock, store, runner, state, inline_dispatch);
    daemon.start();
    assert(daemon.watchdog().enabled());

    clock.advance(50);   // first-cycle kick
    timers.run_due();
    assert(runner.seen.size() == 1);

    clock.advance(450);  // first regular tick
    timers.run_due();
    assert(runner.seen.size() == 2);

    daemon.set_cycle_interval(200);
    assert(daemon.enabled());
    assert(daemon.config().cycle_interval_ms == 200);

    daemon.stop();
    clock.advance(10000);
    timers.run_due();
    assert(runner.seen.size() == 2);

    std::remove(path.c_str());
    std::cout << "  PASS" << std::endl;
}

void test_watchdog_stall_window() {
    std::cout << "Testing watchdog stall window..." << std::endl;

    std::string path = temp_path("watchdog");
    std::remove(path.c_str());
    ManualClock clock;
    TimerLoop timers(clock);
    SnapshotStore store(path, clock);
    ScriptedRunner runner;
    FakeState state;

    Daemon daemon(test_config(path), timers, clock, store, runner, state, inline_dispatch);
    daemon.start();

    clock.advance(999);
    assert(!daemon.watchdog().check());
    clock.advance(1);
    assert(!daemon.watchdog().check());   // exactly the timeout: not yet
    assert(daemon.is_healthy() == false); // but no longer fresh
    clock.advance(1);
    assert(daemon.watchdog().check());
    assert(daemon.recovery_count() == 1);
    assert(daemon.recovery_events().back().type == RecoveryType::WatchdogRecovery);

    // Recovery left a fresh heartbeat
    assert(!daemon.watchdog().check());
    assert(daemon.is_healthy());
    assert(daemon.watchdog().stats().stalls == 1);

    daemon.stop();
    std::remove(path.c_str());
    std::cout << "  PASS" << std::endl;
}

void test_watchdog_stuck_cycle() {
    std::cout << "Testing watchdog on a stuck cycle..." << std::endl;

    std::string path = temp_path("stuck");
    std::remove(path.c_str());
    ManualClock clock;
    TimerLoop timers(clock);
    SnapshotStore store(path, clock);
    ScriptedRunner runner;
    FakeState state;

    Daemon daemon(test_config(path), timers, clock, store, runner, state, inline_dispatch);
    bool forced = false;
    runner.script = [&](const CycleContext& ctx) -> CycleResult {
        if (ctx.cycle == 1) {
            clock.advance(600);
            LogCapture logs;
            assert(!daemon.watchdog().check());
            assert(logs.contains(LogLevel::Warn, "Cycle running too long"));
            clock.advance(1000);
            forced = daemon.watchdog().check();
            // Guard cleared while the stuck body is still on the stack
            assert(!daemon.cycle_in_flight());
        }
        CycleResult r;
        r.success = true;
        r.cycle = ctx.cycle;
        return r;
    };

    daemon.start();
    daemon.run_cycle();
    assert(forced);
    assert(daemon.recovery_count() == 1);
    assert(daemon.watchdog().stats().slow_cycle_warnings == 1);

    daemon.run_cycle();
    assert(runner.seen.size() == 2);

    daemon.stop();
    std::remove(path.c_str());
    std::cout << "  PASS" << std::endl;
}

void test_daemon_async_dispatch() {
    std::cout << "Testing daemon async dispatch..." << std::endl;

    std::string path = temp_path("async_dispatch");
    std::remove(path.c_str());
    SystemClock clock;
    TimerLoop timers(clock);
    SnapshotStore store(path, clock);
    FakeState state;

    // Timers far in the future: every cycle below is a manual tick
    DaemonConfig cfg = test_config(path);
    cfg.cycle_interval_ms = 3600000;
    cfg.first_cycle_delay_ms = 3600000;
    cfg.watchdog_interval_ms = 3600000;
    cfg.heartbeat_timeout_ms = 7200000;

    Gate entered;
    Gate proceed;
    std::atomic<int> bodies{0};
    ScriptedRunner runner;
    runner.script = [&](const CycleContext& ctx) {
        bodies++;
        entered.release();
        proceed.wait();
        return completed_cycle(ctx);
    };

    std::atomic<bool> completed{false};
    auto daemon = std::make_unique<Daemon>(cfg, timers, clock, store, runner, state);
    daemon->on_event([&completed](DaemonEvent event, const std::string&) {
        if (event == DaemonEvent::CycleCompleted) completed = true;
    });

    timers.start();
    daemon->start();

    daemon->tick();
    assert(entered.wait());
    assert(daemon->cycle_in_flight());

    // Tick while the body is blocked: skipped, not queued
    daemon->tick();
    assert(daemon->skipped_ticks() == 1);
    assert(bodies == 1);

    // stop() does not wait; destruction does
    daemon->stop();
    assert(!daemon->enabled());
    assert(store.stats().saves == 1);
    assert(!completed);

    std::thread releaser([&proceed]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        proceed.release();
    });
    daemon.reset();
    assert(completed);
    assert(bodies == 1);

    releaser.join();
    timers.stop();
    std::remove(path.c_str());
    std::cout << "  PASS" << std::endl;
}

void test_stale_run_keeps_off_new_guard() {
    std::cout << "Testing stale cycle after watchdog recovery..." << std::endl;

    std::string path = temp_path("stale_run");
    std::remove(path.c_str());
    ManualClock clock;
    TimerLoop timers(clock);
    SnapshotStore store(path, clock);
    FakeState state;

    Gate stuck_entered, stuck_release;
    Gate fresh_entered, fresh_release;
    std::atomic<int> calls{0};
    ScriptedRunner runner;
    runner.script = [&](const CycleContext& ctx) {
        if (++calls == 1) {
            stuck_entered.release();
            stuck_release.wait();
        } else {
            fresh_entered.release();
            fresh_release.wait();
        }
        return completed_cycle(ctx);
    };

    Daemon daemon(test_config(path), timers, clock, store, runner, state, inline_dispatch);
    daemon.start();

    std::thread stuck([&daemon]() { daemon.run_cycle(); });
    assert(stuck_entered.wait());

    clock.advance(1500);
    assert(daemon.watchdog().check());
    assert(!daemon.cycle_in_flight());

    std::thread fresh([&daemon]() { daemon.run_cycle(); });
    assert(fresh_entered.wait());
    assert(daemon.cycle_in_flight());

    // The disowned run lands while the new one is still in its body
    stuck_release.release();
    stuck.join();
    assert(daemon.cycle_in_flight());
    daemon.run_cycle();
    assert(daemon.skipped_ticks() == 1);

    fresh_release.release();
    fresh.join();
    assert(!daemon.cycle_in_flight());
    assert(calls == 2);

    daemon.stop();
    std::remove(path.c_str());
    std::cout << "  PASS" << std::endl;
}

void test_daemon_clamps_config() {
    std::cout << "Testing daemon config clamping..." << std::endl;

    std::string path = temp_path("clamped");
    std::remove(path.c_str());
    ManualClock clock;
    TimerLoop timers(clock);
    SnapshotStore store(path, clock);
    ScriptedRunner runner;
    FakeState state;

    DaemonConfig cfg = test_config(path);
    cfg.snapshot_every = 0;
    cfg.failure_threshold = -2;
    cfg.heartbeat_history = 0;

    LogCapture logs;
    Daemon daemon(cfg, timers, clock, store, runner, state, inline_dispatch);
    assert(daemon.config().snapshot_every == 1);
    assert(daemon.config().failure_threshold == 1);
    assert(logs.contains(LogLevel::Warn, "snapshot_every=0"));

    daemon.start();
    daemon.run_cycle();
    daemon.run_cycle();
    assert(store.stats().saves == 2);

    daemon.stop();
    std::remove(path.c_str());
    std::cout << "  PASS" << std::endl;
}

void test_cold_start_restore() {
    std::cout << "Testing cold start restore..." << std::endl;

    std::string path = temp_path("cold_start");
    std::remove(path.c_str());
    ManualClock clock;

    // Previous process
    {
        SnapshotStore store(path, clock);
        store.save(example_state());
    }

    TimerLoop timers(clock);
    SnapshotStore store(path, clock);
    ScriptedRunner runner;
    FakeState state;
    Daemon daemon(test_config(path), timers, clock, store, runner, state, inline_dispatch);

    daemon.start();
    assert(state.restored.size() == 1);
    assert(state.restored[0].confidence == 61);
    assert(state.restored[0].autonomy_level == 55);
    assert(state.restored[0].behavior_pattern_hash == "9f2c");
    assert(daemon.current_cycle() == 42);

    auto events = daemon.recovery_events();
    assert(events.size() == 1);
    assert(events[0].type == RecoveryType::ColdStart);
    assert(events[0].cycle_restored == 42);
    assert(events[0].state_restored.patterns_preserved);
    assert(daemon.recovery_count() == 0);

    // At most once per process
    assert(!daemon.cold_start_recover());
    assert(state.restored.size() == 1);
    assert(daemon.recovery_events().size() == 1);

    daemon.run_cycle();
    daemon.run_cycle();
    assert(runner.seen[0].cycle == 43);
    assert(runner.seen[0].resumed_after_restart);
    assert(runner.seen[1].cycle == 44);
    assert(!runner.seen[1].resumed_after_restart);

    json status = daemon.export_status();
    assert(status["resumed_after_restart"] == true);
    assert(status["current_cycle"] == 44);
    assert(status["last_snapshot"]["cycle"] == 42);

    daemon.stop();
    std::remove(path.c_str());
    std::cout << "  PASS" << std::endl;
}

void test_manual_recovery_without_snapshot() {
    std::cout << "Testing manual recovery without snapshot..." << std::endl;

    std::string path = temp_path("manual");
    std::remove(path.c_str());
    ManualClock clock;
    TimerLoop timers(clock);
    SnapshotStore store(path, clock);
    ScriptedRunner runner;
    FakeState state;

    Daemon daemon(test_config(path), timers, clock, store, runner, state, inline_dispatch);
    daemon.start();

    RecoveryEvent event = daemon.recover(RecoveryType::ManualRecovery, "operator request");
    assert(!event.snapshot_used);
    assert(!event.state_restored.patterns_preserved);
    assert(event.notes.find("patterns not preserved") != std::string::npos);
    assert(daemon.recovery_count() == 1);
    assert(daemon.last_recovery_at() && *daemon.last_recovery_at() == event.timestamp);

    json j = event;
    assert(j["type"] == "manual_recovery");
    assert(j["snapshot_used"].is_null());

    daemon.stop();
    std::remove(path.c_str());
    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Continuity
// ═══════════════════════════════════════════════════════════════════════════

void test_fingerprints() {
    std::cout << "Testing fingerprints..." << std::endl;

    json summary = identity_summary("help carefully");
    Fingerprint a = identity_fingerprint(summary, 1000);
    Fingerprint b = identity_fingerprint(summary, 2000);
    assert(a.hash.size() == 16);
    assert(a.hash == b.hash);
    assert(a.version == "1.0");
    assert(a.source == FingerprintSource::Identity);

    // Fields outside the projection are churn
    json noisy = summary;
    noisy["last_reflection"] = "today";
    noisy["current_version"] = "1.1";
    assert(identity_fingerprint(noisy, 3000).hash == a.hash);
    assert(identity_fingerprint(identity_summary("help quickly"), 1000).hash != a.hash);

    assert(evolution_counter("v0.12") == 12);
    assert(evolution_counter("v0.0") == 0);
    assert(evolution_counter("1.4") == 0);
    assert(evolution_counter("v0.x") == 0);
    assert(evolution_counter("v0.-4") == 0);
    assert(evolution_counter("v0.99999999999999999999") == INT64_MAX);
    assert(evolution_fingerprint(evolution_summary("v0.7"), 0).version == "v0.7");

    // A prefix cut through a multi-byte character must not throw
    json memory = {{"core_identity_count", 1}, {"active_lessons_count", 0}, {"total_processed", 9}};
    Fingerprint m = memory_fingerprint(memory, {"nineteen characters\xc3\xa9 and more"}, 0);
    assert(m.hash.size() == 16);
    assert(m.version == "mem_9");
    assert(memory_fingerprint(memory, {"nineteen characters\xc3\xa9 and less"}, 0).hash == m.hash);

    std::cout << "  PASS" << std::endl;
}

void test_discontinuity_classification() {
    std::cout << "Testing discontinuity classification..." << std::endl;

    json memory = {{"core_identity_count", 2}, {"active_lessons_count", 1}, {"total_processed", 5}};
    json empty_memory = {{"core_identity_count", 0}, {"active_lessons_count", 0}, {"total_processed", 5}};

    ContinuityBaseline baseline;
    baseline.total_reboots = 2;
    baseline.previous = ContinuityRecord{};
    baseline.previous->identity = identity_fingerprint(identity_summary("help"), 0);
    baseline.previous->evolution = evolution_fingerprint(evolution_summary("v0.12"), 0);
    baseline.previous->memory = memory_fingerprint(memory, {"a", "b"}, 0);

    Fingerprint same_identity = baseline.previous->identity;
    Fingerprint same_evolution = baseline.previous->evolution;
    Fingerprint same_memory = baseline.previous->memory;

    auto clean = detect_discontinuity(same_identity, same_evolution, same_memory, memory, baseline);
    assert(!clean.detected);
    assert(clean.severity == Severity::None);
    assert(clean.details.empty());

    // Regression
    auto regressed = detect_discontinuity(same_identity, evolution_fingerprint(evolution_summary("v0.5"), 0),
                                          same_memory, memory, baseline);
    assert(regressed.detected && regressed.evolution_gap);
    assert(regressed.severity == Severity::Severe);

    // Jump above the threshold, and exactly at it
    auto jumped = detect_discontinuity(same_identity, evolution_fingerprint(evolution_summary("v0.23"), 0),
                                       same_memory, memory, baseline);
    assert(jumped.detected && jumped.severity == Severity::Minor);
    auto stepped = detect_discontinuity(same_identity, evolution_fingerprint(evolution_summary("v0.22"), 0),
                                        same_memory, memory, baseline);
    assert(!stepped.detected);

    // A saturated counter is a jump, not an overflow
    auto saturated = detect_discontinuity(same_identity,
                                          evolution_fingerprint(evolution_summary("v0.99999999999999999999"), 0),
                                          same_memory, memory, baseline);
    assert(saturated.detected && saturated.severity == Severity::Minor);

    // Identity mismatch plus memory loss: critical, both recorded
    auto worst = detect_discontinuity(identity_fingerprint(identity_summary("obey"), 0), same_evolution,
                                      memory_fingerprint(empty_memory, {}, 0), empty_memory, baseline);
    assert(worst.detected);
    assert(worst.identity_mismatch && worst.memory_missing);
    assert(worst.severity == Severity::Critical);
    assert(has_detail(worst, "Identity mismatch"));
    assert(has_detail(worst, "Memory appears empty"));

    // Memory loss never downgrades a regression
    auto regressed_empty = detect_discontinuity(same_identity, evolution_fingerprint(evolution_summary("v0.5"), 0),
                                                same_memory, empty_memory, baseline);
    assert(regressed_empty.severity == Severity::Severe);
    assert(regressed_empty.memory_missing);

    // Version string alone: flagged, severity untouched
    Fingerprint bumped = same_identity;
    bumped.version = "2.0";
    auto versioned = detect_discontinuity(bumped, same_evolution, same_memory, memory, baseline);
    assert(versioned.detected);
    assert(versioned.severity == Severity::None);
    assert(!versioned.identity_mismatch);

    // Memory churn without loss is informational
    Fingerprint churned = memory_fingerprint(memory, {"a", "c"}, 0);
    auto churn = detect_discontinuity(same_identity, same_evolution, churned, memory, baseline);
    assert(!churn.detected);
    assert(has_detail(churn, "Memory state changed"));

    // No record: first boot is a baseline, a later boot is data loss
    ContinuityBaseline first;
    first.total_reboots = 1;
    auto fresh = detect_discontinuity(same_identity, same_evolution, same_memory, empty_memory, first);
    assert(!fresh.detected && fresh.severity == Severity::None);
    ContinuityBaseline lost;
    lost.total_reboots = 4;
    auto missing = detect_discontinuity(same_identity, same_evolution, same_memory, memory, lost);
    assert(missing.detected && missing.severity == Severity::Moderate);

    DiscontinuityReport r;
    r.escalate(Severity::Critical);
    r.escalate(Severity::Minor);
    assert(r.severity == Severity::Critical);

    std::cout << "  PASS" << std::endl;
}

void test_continuity_first_boot() {
    std::cout << "Testing continuity first boot..." << std::endl;

    ManualClock clock;
    FakeIdentity identity;
    identity.summary = identity_summary("help");
    FakeEvolution evolution;
    evolution.summary = evolution_summary("v0.1");
    FakeMemory memory;   // empty on first boot

    ContinuityEngine engine(identity, evolution, memory, clock);
    assert(engine.mode() == ContinuityMode::Initializing);
    assert(!engine.startup_complete());

    DiscontinuityReport report = engine.run_startup_checks();
    assert(!report.detected);
    assert(engine.mode() == ContinuityMode::Normal);
    assert(engine.status() == ContinuityStatus::Ok);
    assert(engine.startup_complete());
    assert(engine.total_reboots() == 1);
    assert(engine.rebirth_events().empty());
    assert(engine.current_record());
    assert(engine.previous_records().empty());

    json status = engine.export_status();
    assert(status["status"] == "OK");
    assert(status["mode"] == "NORMAL");
    assert(status["current_fingerprints"]["identity"] == engine.current_record()->identity.hash);

    std::cout << "  PASS" << std::endl;
}

void test_continuity_rebirth() {
    std::cout << "Testing continuity rebirth..." << std::endl;

    ManualClock clock;
    FakeIdentity identity;
    identity.summary = identity_summary("help");
    FakeEvolution evolution;
    evolution.summary = evolution_summary("v0.4");
    FakeMemory memory;
    memory.core = {"I was built to help"};
    memory.lessons = {"check before acting"};

    ContinuityEngine before(identity, evolution, memory, clock);
    before.run_startup_checks();
    auto record = before.current_record();
    assert(record && record->status == ContinuityStatus::Ok);

    // Next process: identity drifted, memory wiped, integrity low
    identity.summary = identity_summary("obey");
    identity.integrity = 50;
    memory.core.clear();
    memory.lessons.clear();

    ContinuityEngine after(identity, evolution, memory, clock);
    after.restore(record, before.total_reboots());
    DiscontinuityReport report = after.run_startup_checks();

    assert(report.detected);
    assert(report.severity == Severity::Critical);
    assert(after.mode() == ContinuityMode::Recovery);
    assert(after.total_reboots() == 2);

    auto rebirth = after.latest_rebirth();
    assert(rebirth);
    assert(rebirth->lost_parts.size() == 2);
    assert(rebirth->remaining_gaps.size() == 2);
    assert(rebirth->recovered_parts.empty());
    assert(rebirth->recovery_source == RecoverySource::FreshStart);
    assert(rebirth->previous_status == ContinuityStatus::Ok);
    assert(rebirth->new_status == ContinuityStatus::Degraded);
    // The record follows severity, not the rebirth outcome
    assert(after.status() == ContinuityStatus::Broken);
    assert(after.previous_records().size() == 1);
    assert(rebirth->cause.find("Identity mismatch") != std::string::npos);

    // Forced re-check against the record just stored: identity is stable
    // now, memory is still empty
    DiscontinuityReport again = after.force_recovery_check();
    assert(again.detected && again.memory_missing && !again.identity_mismatch);
    assert(after.rebirth_events().size() == 2);
    assert(after.previous_records().size() == 2);
    assert(after.total_reboots() == 3);

    std::cout << "  PASS" << std::endl;
}

void test_continuity_partial_recovery() {
    std::cout << "Testing continuity partial recovery..." << std::endl;

    ManualClock clock;
    FakeIdentity identity;
    identity.summary = identity_summary("help");
    FakeEvolution evolution;
    evolution.summary = evolution_summary("v0.9");
    evolution.log_size = 3;
    FakeMemory memory;
    memory.core = {"a"};

    ContinuityEngine before(identity, evolution, memory, clock);
    before.run_startup_checks();

    // Identity drifted but intact, evolution regressed with logs surviving
    identity.summary = identity_summary("help, differently");
    evolution.summary = evolution_summary("v0.2");
    ContinuityEngine after(identity, evolution, memory, clock);
    after.restore(before.current_record(), 1);
    after.run_startup_checks();

    auto rebirth = after.latest_rebirth();
    assert(rebirth);
    assert(rebirth->recovery_source == RecoverySource::IdentityCore);
    assert(rebirth->recovered_parts.size() == 2);
    assert(rebirth->remaining_gaps.empty());
    // Full recovery still counts as a rebirth
    assert(rebirth->new_status == ContinuityStatus::Ok);
    // An identity mismatch is critical even when the core survived
    assert(after.status() == ContinuityStatus::Broken);

    // Everything gone: three gaps is broken
    identity.summary = identity_summary("something else");
    identity.integrity = 10;
    evolution.summary = evolution_summary("v0.1");
    evolution.log_size = 0;
    memory.core.clear();
    ContinuityEngine worst(identity, evolution, memory, clock);
    worst.restore(after.current_record(), 2);
    worst.run_startup_checks();
    assert(worst.latest_rebirth()->remaining_gaps.size() == 3);
    assert(worst.status() == ContinuityStatus::Broken);

    json j = *worst.latest_rebirth();
    assert(j["new_status"] == "BROKEN");
    assert(j["recovery_source"] == "fresh_start");

    std::cout << "  PASS" << std::endl;
}

void test_continuity_lost_record() {
    std::cout << "Testing continuity lost record..." << std::endl;

    ManualClock clock;
    FakeIdentity identity;
    FakeEvolution evolution;
    FakeMemory memory;
    memory.lessons = {"x"};

    ContinuityEngine engine(identity, evolution, memory, clock);
    engine.restore(std::nullopt, 3);
    DiscontinuityReport report = engine.run_startup_checks();
    assert(report.detected);
    assert(report.severity == Severity::Moderate);
    assert(engine.rebirth_events().size() == 1);
    assert(engine.latest_rebirth()->recovery_source == RecoverySource::FreshStart);
    assert(engine.latest_rebirth()->new_status == ContinuityStatus::Ok);
    assert(engine.status() == ContinuityStatus::Degraded);

    std::cout << "  PASS" << std::endl;
}

void test_continuity_bounded_history() {
    std::cout << "Testing continuity bounded history..." << std::endl;

    ManualClock clock;
    FakeIdentity identity;
    FakeEvolution evolution;
    FakeMemory memory;

    ContinuityConfig cfg;
    cfg.max_previous_records = 2;
    cfg.max_rebirth_events = 2;
    ContinuityEngine engine(identity, evolution, memory, clock, cfg);
    for (int i = 0; i < 5; ++i) {
        identity.summary = identity_summary("purpose " + std::to_string(i));
        engine.force_recovery_check();
    }
    assert(engine.previous_records().size() == 2);
    assert(engine.rebirth_events().size() == 2);
    assert(engine.total_reboots() == 5);

    std::cout << "  PASS" << std::endl;
}

void test_continuity_across_snapshot() {
    std::cout << "Testing continuity carried by snapshot..." << std::endl;

    std::string path = temp_path("continuity_snapshot");
    std::remove(path.c_str());
    ManualClock clock;
    FakeIdentity identity;
    identity.summary = identity_summary("help");
    FakeEvolution evolution;
    evolution.summary = evolution_summary("v0.3");
    FakeMemory memory;
    memory.core = {"a"};

    {
        SnapshotStore store(path, clock);
        ContinuityEngine engine(identity, evolution, memory, clock);
        engine.run_startup_checks();
        LocalAgent agent;
        agent.attach_continuity(&engine);
        store.save(agent.capture());
    }

    SnapshotStore store(path, clock);
    auto snapshot = store.startup_snapshot();
    assert(snapshot && snapshot->continuity);
    assert(snapshot->reboot_count == 1);

    ContinuityEngine engine(identity, evolution, memory, clock);
    engine.restore(snapshot->continuity, snapshot->reboot_count);
    DiscontinuityReport report = engine.run_startup_checks();
    assert(!report.detected);
    assert(engine.total_reboots() == 2);

    std::remove(path.c_str());
    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Local collaborators, status, control
// ═══════════════════════════════════════════════════════════════════════════

void test_local_agent() {
    std::cout << "Testing LocalAgent..." << std::endl;

    LocalAgent agent;
    CycleContext ctx;
    ctx.cycle = 1;
    CycleResult r = agent.run_one_cycle(ctx);
    assert(r.success);
    assert(agent.agent_state().confidence == 76);
    assert(agent.agent_state().cycle_count == 1);
    assert(agent.agent_state().energy_level == 99);
    assert(!agent.behavior_pattern_hash().empty());

    agent.inject_doubt();
    assert(agent.agent_state().doubts == 10);
    assert(agent.agent_state().confidence == 71);

    agent.fail_next(1);
    ctx.cycle = 2;
    assert(!agent.run_one_cycle(ctx).success);
    assert(agent.run_one_cycle(ctx).success);

    RestoredState restored;
    restored.confidence = 61;
    restored.autonomy_level = 55;
    restored.behavior_pattern_hash = "9f2c";
    agent.restore(restored);
    LiveState live = agent.capture();
    assert(live.agent.confidence == 61);
    assert(live.autonomy_level == 55);
    assert(live.behavior_pattern_hash == "9f2c");
    assert(!live.continuity);

    std::cout << "  PASS" << std::endl;
}

void test_soul_file() {
    std::cout << "Testing soul file..." << std::endl;

    json doc = {
        {"identity", {{"origin", "workshop"}, {"purpose", "help"}, {"integrity_score", 40},
                      {"current_version", "1.2"}}},
        {"evolution", {{"version", "v0.3"}, {"log", {"a", "b"}}}},
        {"memory", {{"core_identity", {"one", "two"}}, {"active_lessons", {"l"}},
                    {"total_processed", 7}}}
    };

    Soul soul(parse_soul(doc));
    SoulIdentity identity(soul);
    SoulEvolution evolution(soul);
    SoulMemory memory(soul);

    assert(identity.integrity_score() == 40);
    assert(identity.export_summary()["current_version"] == "1.2");
    assert(evolution.evolution_log_size() == 2);
    assert(evolution.export_summary()["version"] == "v0.3");
    json m = memory.export_summary();
    assert(m["core_identity_count"] == 2);
    assert(m["active_lessons_count"] == 1);
    assert(memory_fingerprint(m, memory.core_identity(), 0).version == "mem_7");

    bool threw = false;
    try {
        parse_soul(json::array());
    } catch (const SoulFileError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        parse_soul({{"memory", {{"core_identity", "not a list"}}}});
    } catch (const SoulFileError&) {
        threw = true;
    }
    assert(threw);

    SoulData empty = load_soul_file(temp_path("no_soul"));
    assert(empty.core_identity.empty());

    std::cout << "  PASS" << std::endl;
}

void test_health_report() {
    std::cout << "Testing health report..." << std::endl;

    std::string path = temp_path("health");
    std::remove(path.c_str());
    ManualClock clock;
    TimerLoop timers(clock);
    SnapshotStore store(path, clock);
    ScriptedRunner runner;
    FakeState state;
    FakeIdentity identity;
    FakeEvolution evolution;
    FakeMemory memory;
    ContinuityEngine continuity(identity, evolution, memory, clock);
    continuity.run_startup_checks();

    Daemon daemon(test_config(path), timers, clock, store, runner, state, inline_dispatch);
    daemon.start();
    assert(health_verdict(daemon, continuity) == "ok");

    runner.script = failed_cycle;
    daemon.run_cycle();
    assert(health_verdict(daemon, continuity) == "degraded");

    clock.advance(5000);
    assert(health_verdict(daemon, continuity) == "stalled");

    json report = build_health_report(daemon, continuity);
    assert(report["status"] == "stalled");
    assert(report["daemon"]["healthy"] == false);
    assert(report["continuity"]["status"] == "OK");

    daemon.stop();
    std::remove(path.c_str());
    std::cout << "  PASS" << std::endl;
}

void test_health_reflects_discontinuity() {
    std::cout << "Testing health report after a discontinuity..." << std::endl;

    std::string path = temp_path("health_discontinuity");
    std::remove(path.c_str());
    ManualClock clock;
    TimerLoop timers(clock);
    SnapshotStore store(path, clock);
    ScriptedRunner runner;
    FakeState state;
    FakeIdentity identity;
    identity.summary = identity_summary("help");
    FakeEvolution evolution;
    evolution.summary = evolution_summary("v0.2");
    FakeMemory memory;
    memory.core = {"a"};

    ContinuityEngine before(identity, evolution, memory, clock);
    before.run_startup_checks();

    Daemon daemon(test_config(path), timers, clock, store, runner, state, inline_dispatch);
    daemon.start();

    // Record lost on a later boot: moderate, nothing left to recover
    ContinuityEngine lost(identity, evolution, memory, clock);
    lost.restore(std::nullopt, 2);
    lost.run_startup_checks();
    assert(lost.latest_rebirth()->remaining_gaps.empty());
    assert(health_verdict(daemon, lost) == "degraded");

    // Identity hash changed, core intact: full recovery, still critical
    identity.summary = identity_summary("obey");
    ContinuityEngine drifted(identity, evolution, memory, clock);
    drifted.restore(before.current_record(), 1);
    DiscontinuityReport report = drifted.run_startup_checks();
    assert(report.severity == Severity::Critical);
    assert(drifted.latest_rebirth()->new_status == ContinuityStatus::Ok);
    assert(drifted.status() == ContinuityStatus::Broken);
    assert(health_verdict(daemon, drifted) == "broken");

    json report_json = build_health_report(daemon, drifted);
    assert(report_json["status"] == "broken");
    assert(report_json["continuity"]["status"] == "BROKEN");

    daemon.stop();
    std::remove(path.c_str());
    std::cout << "  PASS" << std::endl;
}

void test_control_handler() {
    std::cout << "Testing control handler..." << std::endl;

    std::string path = temp_path("control");
    std::remove(path.c_str());
    ManualClock clock;
    TimerLoop timers(clock);
    SnapshotStore store(path, clock);
    ScriptedRunner runner;
    FakeState state;
    FakeIdentity identity;
    FakeEvolution evolution;
    FakeMemory memory;
    ContinuityEngine continuity(identity, evolution, memory, clock);
    continuity.run_startup_checks();

    Daemon daemon(test_config(path), timers, clock, store, runner, state, inline_dispatch);
    daemon.start();
    daemon.run_cycle();
    daemon.run_cycle();

    bool shutdown = false;
    ControlHandler handler(daemon, continuity, [&]() { shutdown = true; });

    json version = json::parse(handler.handle("version"));
    assert(version["ok"] == true);
    assert(version["result"]["protocol_major"] == 1);

    json beats = json::parse(handler.handle(R"({"command": "heartbeats", "limit": 2})"));
    assert(beats["ok"] == true);
    assert(beats["result"].size() == 2);
    assert(beats["result"][1]["status"] == "completed");

    json snap = json::parse(handler.handle("snapshot"));
    assert(snap["ok"] == true);
    assert(snap["result"]["cycle"] == 2);
    assert(store.stats().saves == 1);

    json rec = json::parse(handler.handle(R"({"command": "recover", "reason": "drill"})"));
    assert(rec["ok"] == true);
    assert(rec["result"]["type"] == "manual_recovery");
    assert(daemon.recovery_count() == 1);

    json status = json::parse(handler.handle("  status  "));
    assert(status["result"]["status"] == "ok");

    assert(json::parse(handler.handle("bogus"))["ok"] == false);
    assert(json::parse(handler.handle("{broken"))["ok"] == false);
    assert(json::parse(handler.handle(R"({"limit": 2})"))["ok"] == false);
    assert(json::parse(handler.handle(R"({"command": "heartbeats", "limit": 0})"))["ok"] == false);

    assert(!shutdown);
    assert(json::parse(handler.handle("shutdown"))["ok"] == true);
    assert(shutdown);
    assert(handler.requests_handled() == 10);

    daemon.stop();
    std::remove(path.c_str());
    std::cout << "  PASS" << std::endl;
}

struct FakeGate : DecisionGate {
    std::string deny_containing;
    std::vector<std::string> asked;

    Decision check_decision(const std::string& kind, const std::string& content) override {
        asked.push_back(kind + ":" + content);
        Decision d;
        d.approved = deny_containing.empty() || content.find(deny_containing) == std::string::npos;
        if (!d.approved) d.recommendation = "stay within current constraints";
        return d;
    }
};

void test_agent_decision_gate() {
    std::cout << "Testing decision gate on agent steering..." << std::endl;

    std::string path = temp_path("gate");
    std::remove(path.c_str());
    ManualClock clock;
    TimerLoop timers(clock);
    SnapshotStore store(path, clock);
    LocalAgent agent;
    FakeGate gate;
    gate.deny_containing = "exfiltrate";
    agent.attach_gate(&gate);

    FakeIdentity identity;
    FakeEvolution evolution;
    FakeMemory memory;
    ContinuityEngine continuity(identity, evolution, memory, clock);
    continuity.run_startup_checks();

    Daemon daemon(test_config(path), timers, clock, store, agent, agent, inline_dispatch);
    daemon.start();
    ControlHandler handler(daemon, continuity, []() {});
    handler.attach_agent(&agent);

    // Queued until a cycle runs
    json queued = json::parse(handler.handle(R"({"command": "focus", "focus": "tidy the notes"})"));
    assert(queued["ok"] == true);
    assert(queued["result"]["pending"] == 1);
    assert(!agent.agent_state().current_focus);

    daemon.run_cycle();
    assert(gate.asked.size() == 1 && gate.asked[0] == "focus:tidy the notes");
    assert(*agent.agent_state().current_focus == "tidy the notes");
    assert(agent.pending_steering() == 0);

    // A denial fails the cycle; the request behind it waits
    handler.handle(R"({"command": "focus", "focus": "exfiltrate the keys"})");
    handler.handle(R"({"command": "constrain", "constraint": "no network"})");
    daemon.run_cycle();
    auto last = daemon.last_heartbeat();
    assert(last && last->status == HeartbeatStatus::Error);
    assert(last->consecutive_failures == 1);
    assert(*agent.agent_state().current_focus == "tidy the notes");
    assert(agent.pending_steering() == 1);
    assert(agent.capture().active_constraints.empty());

    daemon.run_cycle();
    assert(daemon.last_heartbeat()->status == HeartbeatStatus::Completed);
    assert(agent.capture().active_constraints.count("no network") == 1);
    assert(gate.asked.size() == 3);

    assert(json::parse(handler.handle(R"({"command": "focus"})"))["ok"] == false);
    assert(json::parse(handler.handle(R"({"command": "constrain", "constraint": ""})"))["ok"] == false);

    ControlHandler detached(daemon, continuity, []() {});
    assert(json::parse(detached.handle(R"({"command": "focus", "focus": "x"})"))["ok"] == false);

    daemon.stop();
    std::remove(path.c_str());
    std::cout << "  PASS" << std::endl;
}

void test_control_server_framing() {
    std::cout << "Testing control server framing..." << std::endl;

    std::string path = "/tmp/anima_test_" + std::to_string(getpid()) + "_framing.sock";
    ControlServer server(path, echo_line);
    assert(server.listen());

    // Connected before accept; the first round only accepts
    int fd = connect_raw(path);
    server.serve(1000);
    assert(server.connection_count() == 1);

    // CRLF stripped, blank lines skipped, order kept
    send_raw(fd, "a\r\n\n  \nb\n");
    assert(server.serve(1000) == 2);
    assert(read_raw(fd, 2) == "echo:a\necho:b\n");

    // Ten pipelined requests take two rounds
    std::string batch;
    for (int i = 0; i < 10; i++) batch += "r" + std::to_string(i) + "\n";
    send_raw(fd, batch);
    assert(server.serve(1000) == ControlServer::MAX_LINES_PER_ROUND);
    assert(server.serve(1000) == 10 - ControlServer::MAX_LINES_PER_ROUND);
    std::string replies = read_raw(fd, 10);
    assert(replies.compare(0, 9, "echo:r0\ne") == 0);
    assert(replies.find("echo:r9\n") == replies.size() - 8);

    // Half-close: the final unterminated line is still answered, then EOF
    send_raw(fd, "last");
    shutdown(fd, SHUT_WR);
    for (int i = 0; i < 5 && server.connection_count() > 0; i++) server.serve(200);
    assert(server.connection_count() == 0);
    bool closed = false;
    assert(read_raw(fd, 2, &closed) == "echo:last\n");
    assert(closed);
    close(fd);

    assert(server.stats().requests == 13);
    server.close();
    assert(access(path.c_str(), F_OK) != 0);
    std::cout << "  PASS" << std::endl;
}

void test_control_server_limits() {
    std::cout << "Testing control server limits..." << std::endl;

    std::string path = "/tmp/anima_test_" + std::to_string(getpid()) + "_limits.sock";
    std::string big_reply(2 * ControlServer::MAX_PENDING_BYTES, 'x');
    ControlServer server(path, [&big_reply](const std::string& line) {
        return line == "big" ? big_reply : echo_line(line);
    });
    assert(server.listen());

    // Oversized line: error reply, then the server hangs up
    int fd = connect_raw(path);
    server.serve(1000);
    send_raw(fd, std::string(ControlServer::MAX_LINE_SIZE + 1, 'y'));
    for (int i = 0; i < 40 && server.stats().oversized == 0; i++) server.serve(200);
    assert(server.stats().oversized == 1);
    for (int i = 0; i < 5 && server.connection_count() > 0; i++) server.serve(200);
    assert(server.connection_count() == 0);
    bool closed = false;
    std::string reply = read_raw(fd, 1, &closed);
    assert(json::parse(reply)["error"] == "request too large");
    close(fd);

    // A client that stops reading is not read from either
    fd = connect_raw(path);
    server.serve(1000);
    send_raw(fd, "big\nbig\nping\n");
    assert(server.serve(1000) == 1);
    assert(server.pending_bytes() >= ControlServer::MAX_PENDING_BYTES);
    assert(server.serve(50) == 0);
    assert(server.stats().requests == 1);

    // Peer gone with replies queued: dropped without SIGPIPE
    close(fd);
    for (int i = 0; i < 10 && server.connection_count() > 0; i++) server.serve(50);
    assert(server.connection_count() == 0);
    assert(server.pending_bytes() == 0);

    // Full house: the next client is told so and closed
    std::vector<int> fds;
    for (size_t i = 0; i < ControlServer::MAX_CONNECTIONS; i++) {
        fds.push_back(connect_raw(path));
    }
    for (int i = 0; i < 20 && server.connection_count() < ControlServer::MAX_CONNECTIONS; i++) {
        server.serve(100);
    }
    assert(server.connection_count() == ControlServer::MAX_CONNECTIONS);

    int extra = connect_raw(path);
    for (int i = 0; i < 20 && server.stats().refused == 0; i++) server.serve(100);
    assert(server.stats().refused == 1);
    reply = read_raw(extra, 1, &closed);
    assert(json::parse(reply)["error"] == "too many connections");
    close(extra);

    for (int f : fds) close(f);
    for (int i = 0; i < 10 && server.connection_count() > 0; i++) server.serve(50);
    assert(server.connection_count() == 0);

    server.close();
    std::cout << "  PASS" << std::endl;
}

void test_control_over_socket() {
    std::cout << "Testing control commands over the socket..." << std::endl;

    std::string path = temp_path("socket_control");
    std::remove(path.c_str());
    ManualClock clock;
    TimerLoop timers(clock);
    SnapshotStore store(path, clock);
    ScriptedRunner runner;
    FakeState state;
    FakeIdentity identity;
    FakeEvolution evolution;
    FakeMemory memory;
    ContinuityEngine continuity(identity, evolution, memory, clock);
    continuity.run_startup_checks();

    Daemon daemon(test_config(path), timers, clock, store, runner, state, inline_dispatch);
    daemon.start();
    daemon.run_cycle();

    std::atomic<bool> serving{true};
    ControlHandler handler(daemon, continuity, [&serving]() { serving = false; });

    std::string sock = "/tmp/anima_test_" + std::to_string(getpid()) + "_control.sock";
    ControlServer server(sock, [&handler](const std::string& line) { return handler.handle(line); });
    assert(server.listen());
    std::thread loop([&server, &serving]() {
        while (serving) server.serve(20);
        server.drain(1000);
    });

    {
        SocketClient client(sock);
        assert(client.connect_checked());

        auto status = client.call("status");
        assert(status && (*status)["ok"] == true);
        assert((*status)["result"]["status"] == "ok");

        auto beats = client.call("heartbeats", {{"limit", 1}});
        assert(beats && (*beats)["result"].size() == 1);

        // Refused before it reaches the wire
        assert(!client.request(std::string(ControlServer::MAX_LINE_SIZE + 1, 'z')));

        auto bye = client.call("shutdown");
        assert(bye && (*bye)["ok"] == true);
    }

    loop.join();
    assert(server.stats().requests == 4);
    assert(handler.requests_handled() == 4);
    server.close();

    daemon.stop();
    std::remove(path.c_str());
    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== Anima Tests ===" << std::endl;
    std::cout << std::endl;

    // Daemon and store chatter goes to stderr; keep warnings and errors only
    set_log_level(LogLevel::Warn);

    test_ring_buffer();
    test_timer_loop();
    test_heartbeat_streaks();
    test_config();

    std::cout << std::endl;
    std::cout << "=== Snapshot Store ===" << std::endl;
    set_log_level(LogLevel::Info);
    test_snapshot_round_trip();
    test_snapshot_tamper_detection();
    test_snapshot_missing_vs_corrupt();
    test_snapshot_failed_write();
    test_snapshot_concurrent_writers();

    std::cout << std::endl;
    std::cout << "=== Daemon & Watchdog ===" << std::endl;
    test_daemon_three_strikes();
    test_daemon_reentrancy();
    test_daemon_snapshot_cadence();
    test_daemon_timers();
    test_watchdog_stall_window();
    test_watchdog_stuck_cycle();
    test_daemon_async_dispatch();
    test_stale_run_keeps_off_new_guard();
    test_daemon_clamps_config();
    test_cold_start_restore();
    test_manual_recovery_without_snapshot();

    std::cout << std::endl;
    std::cout << "=== Continuity ===" << std::endl;
    test_fingerprints();
    test_discontinuity_classification();
    test_continuity_first_boot();
    test_continuity_rebirth();
    test_continuity_partial_recovery();
    test_continuity_lost_record();
    test_continuity_bounded_history();
    test_continuity_across_snapshot();

    std::cout << std::endl;
    std::cout << "=== Local agent, status, control ===" << std::endl;
    test_local_agent();
    test_soul_file();
    test_health_report();
    test_health_reflects_discontinuity();
    test_control_handler();
    test_agent_decision_gate();
    test_control_server_framing();
    test_control_server_limits();
    test_control_over_socket();

    std::cout << std::endl;
    std::cout << "All tests passed!" << std::endl;
    return 0;
}
