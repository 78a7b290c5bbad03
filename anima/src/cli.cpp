// animad: autonomous cycle daemon with continuity checks
//
// Usage: animad <command> [options]
//
// Commands:
//   run        Run the daemon in the foreground
//   status     Health report from a running daemon
//   heartbeats Recent heartbeats from a running daemon
//   shutdown   Gracefully stop a running daemon
//   recover    Ask a running daemon for manual recovery
//   inspect    Verify a snapshot file offline
//   check      Fingerprint a soul file against the last snapshot
//   help       Show this help

#include <anima/config.hpp>
#include <anima/continuity.hpp>
#include <anima/control.hpp>
#include <anima/daemon.hpp>
#include <anima/local_agent.hpp>
#include <anima/log.hpp>
#include <anima/snapshot.hpp>
#include <anima/socket_client.hpp>
#include <anima/control_server.hpp>
#include <anima/soul.hpp>
#include <anima/status.hpp>
#include <anima/timer_loop.hpp>
#include <anima/version.hpp>
#include <algorithm>
#include <iostream>
#include <string>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <cstdlib>
#include <csignal>
#include <atomic>
#include <fstream>
#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>

using namespace anima;

// Get program name from path
static const char* prog_name(const char* path) {
    const char* last = path;
    for (const char* p = path; *p; ++p) {
        if (*p == '/') last = p + 1;
    }
    return last;
}

void print_usage(const char* prog) {
    const char* name = prog_name(prog);
    std::cerr << "animad " << ANIMA_VERSION << " - autonomous cycle daemon\n\n"
              << "Usage: " << name << " <command> [options]\n\n"
              << "Commands:\n"
              << "  run                Run the daemon in the foreground\n"
              << "  status             Health report from the running daemon\n"
              << "  heartbeats         Recent heartbeats from the running daemon\n"
              << "  shutdown           Gracefully stop the running daemon\n"
              << "  recover            Trigger manual recovery in the running daemon\n"
              << "  inspect            Load and verify a snapshot file\n"
              << "  check              Fingerprint the soul file against the last snapshot\n"
              << "  help               Show this help\n\n"
              << "Options:\n"
              << "  --config FILE      JSON config file\n"
              << "  --soul FILE        Soul file (identity, evolution, memory)\n"
              << "  --snapshot PATH    Snapshot file (default: ./data/state_snapshot.json)\n"
              << "  --interval MS      Cycle interval in milliseconds\n"
              << "  --socket-path PATH Unix socket path (default: derived from snapshot path)\n"
              << "  --pid-file PATH    Write PID to file\n"
              << "  --limit N          Heartbeats to show (default: 20)\n"
              << "  --reason TEXT      Reason recorded with manual recovery\n"
              << "  --json             Output as JSON\n"
              << "  --verbose          Enable verbose debug logging\n"
              << "  -v, --version      Show version\n";
}

// ═══════════════════════════════════════════════════════════════════════════
// Single instance
// ═══════════════════════════════════════════════════════════════════════════

// Global flag for daemon shutdown
static std::atomic<bool> daemon_running{true};

void daemon_signal_handler(int sig) {
    (void)sig;
    daemon_running = false;
}

struct DaemonLock {
    int fd = -1;
    std::string path;
};

bool acquire_daemon_lock(const std::string& snapshot_path, DaemonLock& lock, std::string& error) {
    lock.path = lock_path_for_snapshot(snapshot_path);
    lock.fd = open(lock.path.c_str(), O_CREAT | O_RDWR, 0600);
    if (lock.fd < 0) {
        error = std::string("Failed to open daemon lock: ") + strerror(errno);
        return false;
    }

    struct flock fl;
    fl.l_type = F_WRLCK;
    fl.l_whence = SEEK_SET;
    fl.l_start = 0;
    fl.l_len = 0;

    if (fcntl(lock.fd, F_SETLK, &fl) != 0) {
        if (errno == EACCES || errno == EAGAIN) {
            error = "Daemon already running for " + snapshot_path + " (lock held)";
        } else {
            error = std::string("Failed to acquire daemon lock: ") + strerror(errno);
        }
        close(lock.fd);
        lock.fd = -1;
        return false;
    }

    std::string pid = std::to_string(getpid()) + "\n";
    if (ftruncate(lock.fd, 0) == 0) {
        if (write(lock.fd, pid.data(), pid.size()) < 0) {
            log_warn("daemon", "Could not record pid in lock file: %s", strerror(errno));
        }
    }

    return true;
}

void release_daemon_lock(DaemonLock& lock) {
    if (lock.fd >= 0) {
        close(lock.fd);
        lock.fd = -1;
    }
    if (!lock.path.empty()) {
        unlink(lock.path.c_str());
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Commands
// ═══════════════════════════════════════════════════════════════════════════

int cmd_run(const AppConfig& config) {
    DaemonLock lock;
    std::string lock_error;
    if (!acquire_daemon_lock(config.daemon.snapshot_path, lock, lock_error)) {
        log_error("daemon", "%s", lock_error.c_str());
        return 1;
    }

    Soul soul;
    try {
        soul.replace(load_soul_file(config.soul_path));
    } catch (const SoulFileError& e) {
        log_error("soul", "%s", e.what());
        release_daemon_lock(lock);
        return 1;
    }

    if (!config.pid_file.empty()) {
        std::ofstream pf(config.pid_file);
        if (pf) {
            pf << getpid() << "\n";
        } else {
            log_warn("daemon", "Could not write pid file %s", config.pid_file.c_str());
        }
    }

    SystemClock clock;
    TimerLoop timers(clock);
    SnapshotStore store(config.daemon.snapshot_path, clock);
    LocalAgent agent;

    SoulIdentity identity(soul);
    SoulEvolution evolution(soul);
    SoulMemory memory(soul);
    ContinuityEngine continuity(identity, evolution, memory, clock, config.continuity);

    // Who we were: the continuity record rides along in the snapshot
    auto startup = store.startup_snapshot();
    // A snapshot proves an earlier run even when it carries no record
    if (startup) {
        continuity.restore(startup->continuity, std::max<int64_t>(startup->reboot_count, 1));
    }
    continuity.run_startup_checks();
    agent.attach_continuity(&continuity);

    Daemon daemon(config.daemon, timers, clock, store, agent, agent);

    std::string socket_path = config.socket_path.empty()
        ? socket_path_for_snapshot(config.daemon.snapshot_path)
        : config.socket_path;
    ControlHandler handler(daemon, continuity, []() { daemon_running = false; });
    handler.attach_agent(&agent);
    ControlServer server(socket_path, [&handler](const std::string& line) {
        return handler.handle(line);
    });
    if (!server.listen()) {
        log_error("daemon", "Failed to listen on %s", socket_path.c_str());
        if (!config.pid_file.empty()) std::remove(config.pid_file.c_str());
        release_daemon_lock(lock);
        return 1;
    }

    std::signal(SIGTERM, daemon_signal_handler);
    std::signal(SIGINT, daemon_signal_handler);
    std::signal(SIGPIPE, SIG_IGN);

    daemon.start();
    timers.start();

    log_info("daemon", "Started (socket=%s, interval=%lldms, pid=%d%s)",
             socket_path.c_str(), static_cast<long long>(config.daemon.cycle_interval_ms),
             static_cast<int>(getpid()), verbose() ? ", verbose=on" : "");

    while (daemon_running) {
        server.serve(100);
    }

    log_info("daemon", "Shutting down...");
    daemon.stop();
    timers.stop();

    // Flush replies already queued (the shutdown acknowledgement among them)
    if (!server.drain(500)) {
        log_warn("daemon", "%zu reply bytes undelivered at exit", server.pending_bytes());
    }
    server.close();

    if (!config.pid_file.empty()) {
        std::remove(config.pid_file.c_str());
    }
    release_daemon_lock(lock);

    log_info("daemon", "Stopped (cycles=%zu, recoveries=%zu, requests=%zu)",
             daemon.total_cycles_run(), daemon.recovery_count(), handler.requests_handled());
    return 0;
}

// Connect, send one command, print the result
int remote_call(const std::string& socket_path, const std::string& command,
                json params, bool json_output) {
    SocketClient client(socket_path);
    if (!client.connect_checked()) {
        std::cerr << client.last_error() << "\n";
        return 1;
    }

    auto response = client.call(command, std::move(params));
    if (!response) {
        std::cerr << "Request failed: " << client.last_error() << "\n";
        return 1;
    }
    if (!response->value("ok", false)) {
        std::cerr << "Daemon error: " << response->value("error", std::string("unknown")) << "\n";
        return 1;
    }

    const json& result = (*response)["result"];
    if (json_output || command != "status") {
        std::cout << result.dump(2) << "\n";
        return 0;
    }

    json d = result.value("daemon", json::object());
    json c = result.value("continuity", json::object());
    std::cout << "Status:     " << result.value("status", "?") << "\n"
              << "Version:    " << result.value("version", "?") << "\n"
              << "Phase:      " << d.value("phase", "?") << "\n"
              << "Cycle:      " << d.value("current_cycle", 0) << " ("
              << d.value("total_cycles_run", 0) << " this run, "
              << d.value("skipped_ticks", 0) << " skipped)\n"
              << "Recoveries: " << d.value("recovery_count", 0) << "\n"
              << "Continuity: " << c.value("status", "?") << " / " << c.value("mode", "?")
              << " (reboots " << c.value("total_reboots", 0) << ", rebirths "
              << c.value("rebirth_count", 0) << ")\n";
    if (d.contains("last_snapshot") && d["last_snapshot"].is_object()) {
        std::cout << "Snapshot:   " << d["last_snapshot"].value("id", "?")
                  << " at cycle " << d["last_snapshot"].value("cycle", 0) << "\n";
    } else {
        std::cout << "Snapshot:   none\n";
    }
    return result.value("status", "") == "ok" ? 0 : 2;
}

int cmd_shutdown(const std::string& socket_path) {
    SocketClient client(socket_path);

    if (!client.connect_checked()) {
        std::cerr << "No daemon running (" << client.last_error() << ")\n";
        return 1;
    }

    auto response = client.call("shutdown");
    if (!response || !response->value("ok", false)) {
        std::cerr << "Failed to request shutdown: " << client.last_error() << "\n";
        return 1;
    }

    std::cout << "Daemon shutdown requested\n";
    client.disconnect();
    if (client.wait_for_socket_gone(10000)) {
        std::cout << "Daemon stopped\n";
    } else {
        std::cerr << "Warning: shutdown requested but socket still exists\n";
    }
    return 0;
}

int cmd_inspect(const std::string& snapshot_path, bool json_output) {
    struct stat st;
    if (stat(snapshot_path.c_str(), &st) != 0) {
        std::cerr << "No snapshot at " << snapshot_path << "\n";
        return 1;
    }

    SystemClock clock;
    SnapshotStore store(snapshot_path, clock);
    auto snapshot = store.load();
    if (!snapshot) {
        std::cerr << "Snapshot at " << snapshot_path << " is unusable (see log above)\n";
        return 2;
    }

    if (json_output) {
        std::cout << json(*snapshot).dump(2) << "\n";
        return 0;
    }

    std::cout << "Snapshot:   " << snapshot->id << " (schema " << snapshot->schema_version << ")\n"
              << "Taken:      " << format_iso8601(snapshot->timestamp) << "\n"
              << "Cycle:      " << snapshot->cycle << "\n"
              << "Confidence: " << snapshot->agent_state.confidence
              << "  Doubts: " << snapshot->agent_state.doubts
              << "  Energy: " << snapshot->agent_state.energy_level << "\n"
              << "Autonomy:   " << snapshot->autonomy_level << "\n"
              << "Checksum:   " << snapshot->checksum << " (valid)\n"
              << "Reboots:    " << snapshot->reboot_count << "\n";
    if (snapshot->continuity) {
        std::cout << "Continuity: " << continuity_status_name(snapshot->continuity->status)
                  << " identity=" << snapshot->continuity->identity.hash
                  << " evolution=" << snapshot->continuity->evolution.hash
                  << " memory=" << snapshot->continuity->memory.hash << "\n";
    }
    return 0;
}

// Dry run of the startup checks; nothing is written
int cmd_check(const AppConfig& config, bool json_output) {
    Soul soul;
    try {
        soul.replace(load_soul_file(config.soul_path));
    } catch (const SoulFileError& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    SystemClock clock;
    SnapshotStore store(config.daemon.snapshot_path, clock);
    SoulIdentity identity(soul);
    SoulEvolution evolution(soul);
    SoulMemory memory(soul);
    ContinuityEngine continuity(identity, evolution, memory, clock, config.continuity);

    auto snapshot = store.load();
    if (snapshot) {
        continuity.restore(snapshot->continuity, std::max<int64_t>(snapshot->reboot_count, 1));
    }
    DiscontinuityReport report = continuity.run_startup_checks();

    json out = {
        {"report", report},
        {"record", continuity.current_record() ? json(*continuity.current_record()) : json(nullptr)},
        {"rebirth", continuity.latest_rebirth() ? json(*continuity.latest_rebirth()) : json(nullptr)}
    };

    if (json_output) {
        std::cout << out.dump(2) << "\n";
    } else {
        auto record = continuity.current_record();
        std::cout << "Identity:   " << record->identity.hash << " (" << record->identity.version << ")\n"
                  << "Evolution:  " << record->evolution.hash << " (" << record->evolution.version << ")\n"
                  << "Memory:     " << record->memory.hash << " (" << record->memory.version << ")\n"
                  << "Severity:   " << severity_name(report.severity)
                  << (report.detected ? " (discontinuity)" : "") << "\n"
                  << "Status:     " << continuity_status_name(record->status) << "\n";
        for (const auto& detail : report.details) {
            std::cout << "  - " << detail << "\n";
        }
    }
    return report.severity >= Severity::Severe ? 2 : 0;
}

int main(int argc, char* argv[]) {
    AppConfig config;
    std::string command;
    std::string config_file;
    std::string reason = "manual request";
    int64_t limit = 20;
    bool json_output = false;

    // Flags are applied after the config file and environment
    std::string flag_soul, flag_snapshot, flag_socket, flag_pid;
    int64_t flag_interval = 0;
    bool flag_verbose = false;

    try {
        for (int i = 1; i < argc; ++i) {
            if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
                config_file = argv[++i];
            } else if (strcmp(argv[i], "--soul") == 0 && i + 1 < argc) {
                flag_soul = argv[++i];
            } else if (strcmp(argv[i], "--snapshot") == 0 && i + 1 < argc) {
                flag_snapshot = argv[++i];
            } else if (strcmp(argv[i], "--interval") == 0 && i + 1 < argc) {
                flag_interval = std::stoll(argv[++i]);
            } else if (strcmp(argv[i], "--socket-path") == 0 && i + 1 < argc) {
                flag_socket = argv[++i];
            } else if (strcmp(argv[i], "--pid-file") == 0 && i + 1 < argc) {
                flag_pid = argv[++i];
            } else if (strcmp(argv[i], "--limit") == 0 && i + 1 < argc) {
                limit = std::stoll(argv[++i]);
            } else if (strcmp(argv[i], "--reason") == 0 && i + 1 < argc) {
                reason = argv[++i];
            } else if (strcmp(argv[i], "--json") == 0) {
                json_output = true;
            } else if (strcmp(argv[i], "--verbose") == 0) {
                flag_verbose = true;
            } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
                print_usage(argv[0]);
                return 0;
            } else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
                std::cout << "animad " << ANIMA_VERSION << "\n";
                return 0;
            } else if (argv[i][0] != '-' && command.empty()) {
                command = argv[i];
            } else {
                std::cerr << "Unknown option: " << argv[i] << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid number: " << e.what() << "\n";
        return 1;
    }

    if (command.empty() || command == "help") {
        print_usage(argv[0]);
        return command.empty() ? 1 : 0;
    }

    try {
        if (!config_file.empty() && !apply_config_file(config, config_file)) {
            std::cerr << "Config file not found: " << config_file << "\n";
            return 1;
        }
    } catch (const ConfigError& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }
    apply_environment(config);

    if (!flag_soul.empty()) config.soul_path = flag_soul;
    if (!flag_snapshot.empty()) config.daemon.snapshot_path = flag_snapshot;
    if (!flag_socket.empty()) config.socket_path = flag_socket;
    if (!flag_pid.empty()) config.pid_file = flag_pid;
    if (flag_interval > 0) config.daemon.cycle_interval_ms = flag_interval;
    if (flag_verbose) config.verbose = true;

    set_verbose(config.verbose);
    auto warnings = validate(config);

    std::string socket_path = config.socket_path.empty()
        ? socket_path_for_snapshot(config.daemon.snapshot_path)
        : config.socket_path;

    if (command == "run") {
        log_config_status(config, warnings);
        return cmd_run(config);
    }
    if (command == "status") {
        return remote_call(socket_path, "status", json::object(), json_output);
    }
    if (command == "heartbeats") {
        return remote_call(socket_path, "heartbeats", {{"limit", limit}}, true);
    }
    if (command == "recover") {
        return remote_call(socket_path, "recover", {{"reason", reason}}, true);
    }
    if (command == "shutdown") {
        return cmd_shutdown(socket_path);
    }
    if (command == "inspect") {
        return cmd_inspect(config.daemon.snapshot_path, json_output);
    }
    if (command == "check") {
        return cmd_check(config, json_output);
    }

    std::cerr << "Unknown command: " << command << "\n";
    print_usage(argv[0]);
    return 1;
}
