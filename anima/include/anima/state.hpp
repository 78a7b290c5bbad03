#pragma once
// State: the persisted vocabulary shared by snapshot and continuity
//
// AgentState is the live scorekeeping the unit of work mutates.
// Fingerprints and ContinuityRecord describe "who we were" at the end
// of the last run. All of it round-trips through JSON.

#include <anima/types.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>

namespace anima {

using json = nlohmann::json;

struct AgentState {
    int64_t cycle_count = 0;
    int confidence = 75;      // 0..100
    int doubts = 0;           // 0..100
    int energy_level = 100;   // 0..100
    std::string mode = "idle";
    std::optional<std::string> current_focus;

    bool operator==(const AgentState& o) const {
        return cycle_count == o.cycle_count && confidence == o.confidence &&
               doubts == o.doubts && energy_level == o.energy_level &&
               mode == o.mode && current_focus == o.current_focus;
    }
    bool operator!=(const AgentState& o) const { return !(*this == o); }
};

struct RealityMetricsSummary {
    int stability = 0;
    int evolution = 0;
    int autonomy = 0;
    int consecutive_mismatches = 0;
};

// ═══════════════════════════════════════════════════════════════════════════
// Continuity vocabulary
// ═══════════════════════════════════════════════════════════════════════════

enum class FingerprintSource {
    Identity,
    Evolution,
    Memory
};

enum class ContinuityStatus {
    Ok,
    Degraded,
    Broken
};

NLOHMANN_JSON_SERIALIZE_ENUM(FingerprintSource, {
    {FingerprintSource::Identity, "identity"},
    {FingerprintSource::Evolution, "evolution"},
    {FingerprintSource::Memory, "memory"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(ContinuityStatus, {
    {ContinuityStatus::Ok, "OK"},
    {ContinuityStatus::Degraded, "DEGRADED"},
    {ContinuityStatus::Broken, "BROKEN"},
})

inline const char* continuity_status_name(ContinuityStatus s) {
    switch (s) {
        case ContinuityStatus::Ok: return "OK";
        case ContinuityStatus::Degraded: return "DEGRADED";
        case ContinuityStatus::Broken: return "BROKEN";
    }
    return "OK";
}

// Hash over a fixed projection of one subsystem's exported summary
struct Fingerprint {
    std::string hash;          // 16 hex chars
    Timestamp timestamp = 0;
    std::string version;
    FingerprintSource source = FingerprintSource::Identity;
};

struct ContinuityRecord {
    Fingerprint identity;
    Fingerprint evolution;
    Fingerprint memory;
    Timestamp last_verified = 0;
    ContinuityStatus status = ContinuityStatus::Ok;
};

// ═══════════════════════════════════════════════════════════════════════════
// Live state handed to the snapshot store, and what cold start gives back
// ═══════════════════════════════════════════════════════════════════════════

struct LiveState {
    int64_t cycle = 0;
    AgentState agent;
    int autonomy_level = 50;
    std::set<std::string> active_constraints;
    RealityMetricsSummary reality;
    std::string behavior_pattern_hash;
    json desire_state_summary = json::object();
    json governance_state = json::object();

    // Carried so the next process can tell whether it is still "us"
    std::optional<ContinuityRecord> continuity;
    int64_t reboot_count = 0;
};

struct RestoredState {
    int confidence = 0;
    int autonomy_level = 0;
    std::string behavior_pattern_hash;
};

// JSON conversions (ADL hooks for nlohmann::json)
void to_json(json& j, const AgentState& s);
void from_json(const json& j, AgentState& s);
void to_json(json& j, const RealityMetricsSummary& r);
void from_json(const json& j, RealityMetricsSummary& r);
void to_json(json& j, const Fingerprint& f);
void from_json(const json& j, Fingerprint& f);
void to_json(json& j, const ContinuityRecord& r);
void from_json(const json& j, ContinuityRecord& r);

} // namespace anima
