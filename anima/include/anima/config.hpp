#pragma once
// Config: compiled defaults → JSON file → environment → CLI flags
//
// Every interval is in milliseconds. Nothing here is fatal except a
// config file that exists but cannot be parsed (ConfigError).

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace anima {

// Cycle scheduler, watchdog and snapshot cadence
struct DaemonConfig {
    int64_t cycle_interval_ms = 600000;     // 10 minutes between cycles
    int64_t watchdog_interval_ms = 60000;   // 1 minute between stall checks
    int64_t heartbeat_timeout_ms = 900000;  // 15 minutes without a heartbeat = stalled
    int64_t first_cycle_delay_ms = 5000;    // first cycle shortly after start
    int snapshot_every = 5;                 // snapshot every K completed cycles
    int failure_threshold = 3;              // consecutive errors before recovery
    size_t heartbeat_history = 100;
    size_t recovery_history = 50;
    std::string snapshot_path = "./data/state_snapshot.json";
};

// Discontinuity classification and rebirth bookkeeping
struct ContinuityConfig {
    size_t max_rebirth_events = 50;
    size_t max_previous_records = 20;
    int64_t evolution_jump_threshold = 10;
    int identity_integrity_threshold = 80;
};

struct AppConfig {
    DaemonConfig daemon;
    ContinuityConfig continuity;
    std::string soul_path;     // identity/evolution/memory summaries (JSON)
    std::string socket_path;   // empty = derived from snapshot path
    std::string pid_file;
    bool verbose = false;
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// Overlay a JSON config file. Missing file: returns false, config untouched.
// Unreadable or malformed file: throws ConfigError.
bool apply_config_file(AppConfig& config, const std::string& path);

// Overlay ANIMA_* environment variables. Unparseable values are ignored.
void apply_environment(AppConfig& config);

// Non-fatal sanity checks; clamps values that cannot work at all
std::vector<std::string> validate(AppConfig& config);

void log_config_status(const AppConfig& config, const std::vector<std::string>& warnings);

} // namespace anima
