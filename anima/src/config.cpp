#include <anima/config.hpp>
#include <anima/log.hpp>
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace anima {

using json = nlohmann::json;

namespace {

bool env_int(const char* key, int64_t& out) {
    const char* value = std::getenv(key);
    if (!value || !*value) return false;

    char* end = nullptr;
    long long parsed = std::strtoll(value, &end, 10);
    if (end == value || *end != '\0') {
        log_warn("config", "%s=%s is not an integer, keeping default", key, value);
        return false;
    }
    out = parsed;
    return true;
}

bool env_string(const char* key, std::string& out) {
    const char* value = std::getenv(key);
    if (!value || !*value) return false;
    out = value;
    return true;
}

template <typename T>
void read_field(const json& obj, const char* key, T& out) {
    auto it = obj.find(key);
    if (it != obj.end() && !it->is_null()) {
        out = it->get<T>();
    }
}

} // namespace

bool apply_config_file(AppConfig& config, const std::string& path) {
    std::ifstream in(path);
    if (!in) return false;

    std::stringstream buffer;
    buffer << in.rdbuf();

    try {
        json root = json::parse(buffer.str());

        if (root.contains("daemon")) {
            const auto& d = root.at("daemon");
            read_field(d, "cycle_interval_ms", config.daemon.cycle_interval_ms);
            read_field(d, "watchdog_interval_ms", config.daemon.watchdog_interval_ms);
            read_field(d, "heartbeat_timeout_ms", config.daemon.heartbeat_timeout_ms);
            read_field(d, "first_cycle_delay_ms", config.daemon.first_cycle_delay_ms);
            read_field(d, "snapshot_every", config.daemon.snapshot_every);
            read_field(d, "failure_threshold", config.daemon.failure_threshold);
            read_field(d, "heartbeat_history", config.daemon.heartbeat_history);
            read_field(d, "recovery_history", config.daemon.recovery_history);
            read_field(d, "snapshot_path", config.daemon.snapshot_path);
        }
        if (root.contains("continuity")) {
            const auto& c = root.at("continuity");
            read_field(c, "max_rebirth_events", config.continuity.max_rebirth_events);
            read_field(c, "max_previous_records", config.continuity.max_previous_records);
            read_field(c, "evolution_jump_threshold", config.continuity.evolution_jump_threshold);
            read_field(c, "identity_integrity_threshold", config.continuity.identity_integrity_threshold);
        }
        read_field(root, "soul_path", config.soul_path);
        read_field(root, "socket_path", config.socket_path);
        read_field(root, "pid_file", config.pid_file);
        read_field(root, "verbose", config.verbose);
    } catch (const json::exception& e) {
        throw ConfigError("Invalid config file " + path + ": " + e.what());
    }

    log_info("config", "Loaded config file %s", path.c_str());
    return true;
}

void apply_environment(AppConfig& config) {
    int64_t value = 0;
    if (env_int("ANIMA_CYCLE_INTERVAL_MS", value)) config.daemon.cycle_interval_ms = value;
    if (env_int("ANIMA_WATCHDOG_INTERVAL_MS", value)) config.daemon.watchdog_interval_ms = value;
    if (env_int("ANIMA_HEARTBEAT_TIMEOUT_MS", value)) config.daemon.heartbeat_timeout_ms = value;
    if (env_int("ANIMA_SNAPSHOT_EVERY", value)) config.daemon.snapshot_every = static_cast<int>(value);
    env_string("ANIMA_SNAPSHOT_PATH", config.daemon.snapshot_path);
    env_string("ANIMA_SOUL_PATH", config.soul_path);
    env_string("ANIMA_SOCKET_PATH", config.socket_path);
}

std::vector<std::string> validate(AppConfig& config) {
    std::vector<std::string> warnings;
    auto& d = config.daemon;

    if (d.snapshot_every < 1) {
        warnings.push_back("snapshot_every < 1 - snapshotting every cycle");
        d.snapshot_every = 1;
    }
    if (d.failure_threshold < 1) {
        warnings.push_back("failure_threshold < 1 - using 1");
        d.failure_threshold = 1;
    }
    if (d.cycle_interval_ms < 1) {
        warnings.push_back("cycle_interval_ms < 1 - using default 600000");
        d.cycle_interval_ms = 600000;
    }
    if (d.watchdog_interval_ms < 1) {
        warnings.push_back("watchdog_interval_ms < 1 - using default 60000");
        d.watchdog_interval_ms = 60000;
    }
    if (d.heartbeat_history == 0) d.heartbeat_history = 1;
    if (d.recovery_history == 0) d.recovery_history = 1;
    if (config.continuity.max_rebirth_events == 0) config.continuity.max_rebirth_events = 1;
    if (config.continuity.max_previous_records == 0) config.continuity.max_previous_records = 1;

    if (d.watchdog_interval_ms >= d.heartbeat_timeout_ms) {
        warnings.push_back("watchdog_interval_ms >= heartbeat_timeout_ms - stalls will be detected late");
    }
    if (d.heartbeat_timeout_ms <= d.cycle_interval_ms) {
        warnings.push_back("heartbeat_timeout_ms <= cycle_interval_ms - idle gaps between cycles will look like stalls");
    }
    if (d.snapshot_path.empty()) {
        warnings.push_back("snapshot_path empty - using ./data/state_snapshot.json");
        d.snapshot_path = "./data/state_snapshot.json";
    }
    if (config.soul_path.empty()) {
        warnings.push_back("soul_path not set - continuity fingerprints use an empty soul");
    }

    return warnings;
}

void log_config_status(const AppConfig& config, const std::vector<std::string>& warnings) {
    const auto& d = config.daemon;
    log_info("config", "Cycle interval: %llds", static_cast<long long>(d.cycle_interval_ms / 1000));
    log_info("config", "Watchdog interval: %llds, stall timeout: %llds",
             static_cast<long long>(d.watchdog_interval_ms / 1000),
             static_cast<long long>(d.heartbeat_timeout_ms / 1000));
    log_info("config", "Snapshot: every %d cycles -> %s", d.snapshot_every, d.snapshot_path.c_str());
    log_info("config", "Soul: %s", config.soul_path.empty() ? "(none)" : config.soul_path.c_str());

    for (const auto& warning : warnings) {
        log_warn("config", "%s", warning.c_str());
    }
}

} // namespace anima
