#pragma once
// Continuity: am I still the one who went to sleep?
//
// At startup the engine fingerprints identity, evolution and memory,
// compares them with the record left by the previous run, and classifies
// any drift. On a discontinuity it asks the same subsystems for whatever
// survived and records a RebirthEvent describing what was lost, what came
// back, and what is still missing.
//
// Severity, most severe wins, every applicable detail recorded:
//   no previous record (not first boot)  moderate
//   identity hash changed                critical
//   identity version changed             detail only
//   evolution counter went backwards     severe
//   evolution counter jumped > threshold minor
//   memory holds nothing                 moderate

#include <anima/clock.hpp>
#include <anima/collaborators.hpp>
#include <anima/config.hpp>
#include <anima/state.hpp>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace anima {

enum class Severity {
    None = 0,
    Minor = 1,
    Moderate = 2,
    Severe = 3,
    Critical = 4
};

enum class ContinuityMode {
    Initializing,
    Normal,
    Recovery
};

enum class RecoverySource {
    IdentityCore,
    DistilledMemory,
    EvolutionLogs,
    FreshStart
};

NLOHMANN_JSON_SERIALIZE_ENUM(Severity, {
    {Severity::None, "none"},
    {Severity::Minor, "minor"},
    {Severity::Moderate, "moderate"},
    {Severity::Severe, "severe"},
    {Severity::Critical, "critical"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(ContinuityMode, {
    {ContinuityMode::Initializing, "INITIALIZING"},
    {ContinuityMode::Normal, "NORMAL"},
    {ContinuityMode::Recovery, "RECOVERY"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(RecoverySource, {
    {RecoverySource::IdentityCore, "identity_core"},
    {RecoverySource::DistilledMemory, "distilled_memory"},
    {RecoverySource::EvolutionLogs, "evolution_logs"},
    {RecoverySource::FreshStart, "fresh_start"},
})

const char* severity_name(Severity s);

struct DiscontinuityReport {
    bool detected = false;
    bool identity_mismatch = false;
    bool evolution_gap = false;
    bool memory_missing = false;
    Severity severity = Severity::None;
    std::vector<std::string> details;

    // Raise severity, never lower it
    void escalate(Severity s) {
        if (s > severity) severity = s;
    }
};

struct RebirthEvent {
    std::string id;
    Timestamp timestamp = 0;
    std::string cause;
    std::vector<std::string> lost_parts;
    std::vector<std::string> recovered_parts;
    std::vector<std::string> remaining_gaps;
    RecoverySource recovery_source = RecoverySource::FreshStart;
    ContinuityStatus previous_status = ContinuityStatus::Ok;
    ContinuityStatus new_status = ContinuityStatus::Ok;
};

void to_json(json& j, const DiscontinuityReport& r);
void to_json(json& j, const RebirthEvent& e);

// ═══════════════════════════════════════════════════════════════════════════
// Fingerprinting (pure)
// ═══════════════════════════════════════════════════════════════════════════

// 16 hex chars of FNV-1a 64 over the projection's JSON dump
std::string fingerprint_hash(const json& projection);

Fingerprint identity_fingerprint(const json& summary, Timestamp at);
Fingerprint evolution_fingerprint(const json& summary, Timestamp at);
// Memory also hashes a short prefix of each retained core identity item
Fingerprint memory_fingerprint(const json& summary,
                               const std::vector<std::string>& core_identity,
                               Timestamp at);

// "v0.12" → 12; anything unparseable → 0
int64_t evolution_counter(const std::string& version);

// What the previous run left behind, as far as classification cares
struct ContinuityBaseline {
    std::optional<ContinuityRecord> previous;
    int64_t total_reboots = 0;   // including the current startup
};

// Memory holds nothing if it reports zero core identity items and zero lessons
bool memory_empty(const json& memory_summary);

DiscontinuityReport detect_discontinuity(const Fingerprint& identity,
                                         const Fingerprint& evolution,
                                         const Fingerprint& memory,
                                         const json& memory_summary,
                                         const ContinuityBaseline& baseline,
                                         int64_t evolution_jump_threshold = 10);

// ═══════════════════════════════════════════════════════════════════════════
// Engine
// ═══════════════════════════════════════════════════════════════════════════

class ContinuityEngine {
public:
    ContinuityEngine(IdentitySource& identity, EvolutionSource& evolution,
                     MemorySource& memory, const Clock& clock,
                     ContinuityConfig config = {});

    // Seed from the startup snapshot: last run's record and reboot counter
    void restore(std::optional<ContinuityRecord> record, int64_t reboot_count);

    // Fingerprint, classify, recover if needed, store the new record
    DiscontinuityReport run_startup_checks();

    // Re-run the checks on demand
    DiscontinuityReport force_recovery_check();

    ContinuityStatus status() const;
    ContinuityMode mode() const;
    bool startup_complete() const;
    int64_t total_reboots() const;

    std::optional<ContinuityRecord> current_record() const;
    std::vector<ContinuityRecord> previous_records() const;
    std::vector<RebirthEvent> rebirth_events() const;
    std::optional<RebirthEvent> latest_rebirth() const;

    json export_status() const;

private:
    DiscontinuityReport run_checks_locked();
    json safe_summary(const SummarySource& source, const char* name) const;
    RebirthEvent enter_recovery(const DiscontinuityReport& report,
                                ContinuityStatus previous_status);

    IdentitySource& identity_;
    EvolutionSource& evolution_;
    MemorySource& memory_;
    const Clock& clock_;
    ContinuityConfig config_;

    mutable std::mutex mutex_;
    std::optional<ContinuityRecord> current_;
    RingBuffer<ContinuityRecord> previous_;
    RingBuffer<RebirthEvent> rebirths_;
    ContinuityMode mode_ = ContinuityMode::Initializing;
    bool startup_complete_ = false;
    Timestamp last_check_ = 0;
    int64_t total_reboots_ = 0;
};

} // namespace anima
