#include <anima/snapshot.hpp>
#include <anima/log.hpp>
#include <anima/version.hpp>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

namespace anima {

void to_json(json& j, const StateSnapshot& s) {
    j = json{
        {"id", s.id},
        {"timestamp", s.timestamp},
        {"cycle", s.cycle},
        {"schema_version", s.schema_version},
        {"agent_state", s.agent_state},
        {"autonomy_level", s.autonomy_level},
        {"active_constraints", s.active_constraints},
        {"reality_metrics_summary", s.reality_metrics_summary},
        {"behavior_pattern_hash", s.behavior_pattern_hash},
        {"desire_state_summary", s.desire_state_summary},
        {"governance_state", s.governance_state},
        {"continuity", s.continuity ? json(*s.continuity) : json(nullptr)},
        {"reboot_count", s.reboot_count},
        {"checksum", s.checksum}
    };
}

void from_json(const json& j, StateSnapshot& s) {
    j.at("id").get_to(s.id);
    j.at("timestamp").get_to(s.timestamp);
    j.at("cycle").get_to(s.cycle);
    j.at("schema_version").get_to(s.schema_version);
    j.at("agent_state").get_to(s.agent_state);
    j.at("autonomy_level").get_to(s.autonomy_level);
    j.at("checksum").get_to(s.checksum);

    // Fields outside the checksum; schema v1 files lack the last two
    s.active_constraints = j.value("active_constraints", std::set<std::string>{});
    if (j.contains("reality_metrics_summary")) {
        j.at("reality_metrics_summary").get_to(s.reality_metrics_summary);
    }
    s.behavior_pattern_hash = j.value("behavior_pattern_hash", std::string());
    s.desire_state_summary = j.value("desire_state_summary", json::object());
    s.governance_state = j.value("governance_state", json::object());

    auto continuity = j.find("continuity");
    if (continuity != j.end() && !continuity->is_null()) {
        s.continuity = continuity->get<ContinuityRecord>();
    } else {
        s.continuity.reset();
    }
    s.reboot_count = j.value("reboot_count", int64_t{0});
}

std::string snapshot_checksum(int64_t cycle, const AgentState& agent, int autonomy_level) {
    // json objects keep keys sorted, so dump() is deterministic
    json covered = {
        {"cycle", cycle},
        {"agent_state", agent},
        {"autonomy_level", autonomy_level}
    };
    return to_hex(crc32(covered.dump()), 8);
}

SnapshotStore::SnapshotStore(std::string path, const Clock& clock)
    : path_(std::move(path))
    , clock_(clock) {}

StateSnapshot SnapshotStore::save(const LiveState& state, bool* written) {
    StateSnapshot snapshot;
    snapshot.timestamp = clock_.now();
    snapshot.id = generate_id("snap", snapshot.timestamp);
    snapshot.cycle = state.cycle;
    snapshot.schema_version = ANIMA_SNAPSHOT_SCHEMA_VERSION;
    snapshot.agent_state = state.agent;
    snapshot.autonomy_level = state.autonomy_level;
    snapshot.active_constraints = state.active_constraints;
    snapshot.reality_metrics_summary = state.reality;
    snapshot.behavior_pattern_hash = state.behavior_pattern_hash;
    snapshot.desire_state_summary = state.desire_state_summary;
    snapshot.governance_state = state.governance_state;
    snapshot.continuity = state.continuity;
    snapshot.reboot_count = state.reboot_count;
    snapshot.checksum = snapshot_checksum(snapshot.cycle, snapshot.agent_state,
                                          snapshot.autonomy_level);

    // Held until last_ names the bytes this call put on disk
    std::lock_guard<std::mutex> write_lock(write_mutex_);
    bool ok = write_file(snapshot);
    if (written) *written = ok;

    std::lock_guard<std::mutex> lock(mutex_);
    if (ok) {
        last_ = snapshot;
        stats_.saves++;
        log_info("snapshot", "Snapshot saved at cycle %lld (%s)",
                 static_cast<long long>(snapshot.cycle), snapshot.checksum.c_str());
    } else {
        stats_.failed_saves++;
    }
    return snapshot;
}

bool SnapshotStore::write_file(const StateSnapshot& snapshot) {
    std::string body;
    try {
        body = json(snapshot).dump(2);
        body += "\n";
    } catch (const json::exception& e) {
        log_error("snapshot", "Failed to serialize snapshot: %s", e.what());
        return false;
    }

    if (!ensure_parent_dir(path_)) {
        log_error("snapshot", "Failed to create directory for %s: %s",
                  path_.c_str(), strerror(errno));
        return false;
    }

    bool ok = safe_save(path_, [&body](FILE* f) {
        return ::fwrite(body.data(), 1, body.size(), f) == body.size();
    });
    if (!ok) {
        log_error("snapshot", "Failed to save snapshot to %s: %s",
                  path_.c_str(), strerror(errno));
    }
    return ok;
}

std::optional<StateSnapshot> SnapshotStore::load() {
    std::ifstream in(path_, std::ios::binary);
    if (!in) {
        log_info("snapshot", "No snapshot at %s - starting fresh", path_.c_str());
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << in.rdbuf();

    StateSnapshot snapshot;
    try {
        snapshot = json::parse(buffer.str()).get<StateSnapshot>();
    } catch (const json::exception& e) {
        log_warn("snapshot", "Snapshot unreadable (%s) - ignoring, file left at %s",
                 e.what(), path_.c_str());
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.rejected_loads++;
        return std::nullopt;
    }

    if (!version::snapshot_readable(snapshot.schema_version)) {
        log_warn("snapshot", "Snapshot schema v%d not supported (max v%d) - ignoring",
                 snapshot.schema_version, ANIMA_SNAPSHOT_SCHEMA_VERSION);
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.rejected_loads++;
        return std::nullopt;
    }

    if (!checksum_valid(snapshot)) {
        log_warn("snapshot", "Snapshot checksum mismatch - ignoring corrupted snapshot (left at %s)",
                 path_.c_str());
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.rejected_loads++;
        return std::nullopt;
    }

    log_info("snapshot", "Loaded snapshot from cycle %lld", static_cast<long long>(snapshot.cycle));

    std::lock_guard<std::mutex> lock(mutex_);
    stats_.loads++;
    last_ = snapshot;
    return snapshot;
}

std::optional<StateSnapshot> SnapshotStore::startup_snapshot() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (startup_loaded_) return startup_;
    }

    auto loaded = load();

    std::lock_guard<std::mutex> lock(mutex_);
    if (!startup_loaded_) {
        startup_ = loaded;
        startup_loaded_ = true;
    }
    return startup_;
}

std::optional<StateSnapshot> SnapshotStore::last() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_;
}

SnapshotStore::Stats SnapshotStore::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

} // namespace anima
