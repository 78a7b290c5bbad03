#pragma once
// Snapshot: checksummed projection of live state, one file, overwritten
//
// The checksum covers {cycle, agent_state, autonomy_level} only. It is a
// CRC32 over a deterministic JSON rendering of those three fields, meant
// to catch truncation and bit rot, not deliberate tampering. Every other
// field may change without invalidating it.
//
// Writes are atomic (temp file + fsync + rename); a failed write leaves
// both the previous file and the in-memory "last snapshot" untouched.

#include <anima/clock.hpp>
#include <anima/state.hpp>
#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace anima {

struct StateSnapshot {
    std::string id;
    Timestamp timestamp = 0;
    int64_t cycle = 0;
    int schema_version = 0;
    AgentState agent_state;
    int autonomy_level = 0;
    std::set<std::string> active_constraints;
    RealityMetricsSummary reality_metrics_summary;
    std::string behavior_pattern_hash;
    json desire_state_summary = json::object();
    json governance_state = json::object();
    std::optional<ContinuityRecord> continuity;
    int64_t reboot_count = 0;
    std::string checksum;
};

void to_json(json& j, const StateSnapshot& s);
void from_json(const json& j, StateSnapshot& s);

// 8 lowercase hex chars
std::string snapshot_checksum(int64_t cycle, const AgentState& agent, int autonomy_level);

inline bool checksum_valid(const StateSnapshot& s) {
    return s.checksum == snapshot_checksum(s.cycle, s.agent_state, s.autonomy_level);
}

class SnapshotStore {
public:
    SnapshotStore(std::string path, const Clock& clock);

    // Build, checksum and persist a snapshot of `state`. Never throws; on
    // I/O failure logs, keeps last() unchanged, and still returns the
    // snapshot it tried to write. `written` reports whether this call's
    // bytes reached disk. Concurrent saves are serialized.
    StateSnapshot save(const LiveState& state, bool* written = nullptr);

    // Read and verify the file. Missing and corrupted files both give
    // nullopt (logged differently); a corrupted file is left in place.
    std::optional<StateSnapshot> load();

    // The snapshot found at process start; reads the file on first call only
    std::optional<StateSnapshot> startup_snapshot();

    // Newest verified snapshot: the last successful save, else the startup one
    std::optional<StateSnapshot> last() const;

    const std::string& path() const { return path_; }

    struct Stats {
        size_t saves = 0;
        size_t failed_saves = 0;
        size_t loads = 0;
        size_t rejected_loads = 0;
    };
    Stats stats() const;

private:
    bool write_file(const StateSnapshot& snapshot);

    std::string path_;
    const Clock& clock_;

    std::mutex write_mutex_;   // one writer at a time; taken before mutex_
    mutable std::mutex mutex_;
    std::optional<StateSnapshot> last_;
    std::optional<StateSnapshot> startup_;
    bool startup_loaded_ = false;
    Stats stats_;
};

} // namespace anima
