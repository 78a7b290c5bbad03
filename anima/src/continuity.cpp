#include <anima/continuity.hpp>
#include <anima/log.hpp>
#include <cstdlib>
#include <exception>

namespace anima {

namespace {

const char* const PREFIX_V0 = "v0.";
constexpr size_t CORE_IDENTITY_PREFIX = 20;

std::string join(const std::vector<std::string>& parts, const char* sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i) out += sep;
        out += parts[i];
    }
    return out;
}

json array_or_empty(const json& summary, const char* key) {
    auto it = summary.find(key);
    if (it == summary.end() || !it->is_array()) return json::array();
    return *it;
}

std::string string_or_empty(const json& summary, const char* key) {
    auto it = summary.find(key);
    if (it == summary.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

int64_t int_or_zero(const json& summary, const char* key) {
    auto it = summary.find(key);
    if (it == summary.end() || !it->is_number()) return 0;
    return it->get<int64_t>();
}

} // namespace

const char* severity_name(Severity s) {
    switch (s) {
        case Severity::None: return "none";
        case Severity::Minor: return "minor";
        case Severity::Moderate: return "moderate";
        case Severity::Severe: return "severe";
        case Severity::Critical: return "critical";
    }
    return "none";
}

void to_json(json& j, const DiscontinuityReport& r) {
    j = json{
        {"detected", r.detected},
        {"identity_mismatch", r.identity_mismatch},
        {"evolution_gap", r.evolution_gap},
        {"memory_missing", r.memory_missing},
        {"severity", r.severity},
        {"details", r.details}
    };
}

void to_json(json& j, const RebirthEvent& e) {
    j = json{
        {"id", e.id},
        {"timestamp", e.timestamp},
        {"cause", e.cause},
        {"lost_parts", e.lost_parts},
        {"recovered_parts", e.recovered_parts},
        {"remaining_gaps", e.remaining_gaps},
        {"recovery_source", e.recovery_source},
        {"previous_status", e.previous_status},
        {"new_status", e.new_status}
    };
}

// ═══════════════════════════════════════════════════════════════════════════
// Fingerprinting
// ═══════════════════════════════════════════════════════════════════════════

std::string fingerprint_hash(const json& projection) {
    // Object keys are sorted, so the dump is stable for equal content.
    // Truncated UTF-8 (prefixes) is replaced rather than thrown on.
    std::string canonical = projection.dump(-1, ' ', false, json::error_handler_t::replace);
    return to_hex(fnv1a_64(canonical), 16);
}

Fingerprint identity_fingerprint(const json& summary, Timestamp at) {
    json projection = {
        {"origin", string_or_empty(summary, "origin")},
        {"purpose", string_or_empty(summary, "purpose")},
        {"non_negotiables", array_or_empty(summary, "non_negotiables")},
        {"boundaries", array_or_empty(summary, "boundaries")}
    };

    Fingerprint f;
    f.hash = fingerprint_hash(projection);
    f.timestamp = at;
    f.version = string_or_empty(summary, "current_version");
    f.source = FingerprintSource::Identity;
    return f;
}

Fingerprint evolution_fingerprint(const json& summary, Timestamp at) {
    json projection = {
        {"version", string_or_empty(summary, "version")},
        {"evolution_count", int_or_zero(summary, "evolution_count")},
        {"mode", string_or_empty(summary, "mode")},
        {"capabilities", array_or_empty(summary, "capabilities")}
    };

    Fingerprint f;
    f.hash = fingerprint_hash(projection);
    f.timestamp = at;
    f.version = string_or_empty(summary, "version");
    f.source = FingerprintSource::Evolution;
    return f;
}

Fingerprint memory_fingerprint(const json& summary,
                               const std::vector<std::string>& core_identity,
                               Timestamp at) {
    json prefixes = json::array();
    for (const auto& item : core_identity) {
        prefixes.push_back(item.substr(0, CORE_IDENTITY_PREFIX));
    }

    json projection = {
        {"core_identity_count", int_or_zero(summary, "core_identity_count")},
        {"active_lessons_count", int_or_zero(summary, "active_lessons_count")},
        {"core_identity_prefixes", prefixes}
    };

    Fingerprint f;
    f.hash = fingerprint_hash(projection);
    f.timestamp = at;
    f.version = "mem_" + std::to_string(int_or_zero(summary, "total_processed"));
    f.source = FingerprintSource::Memory;
    return f;
}

int64_t evolution_counter(const std::string& version) {
    if (version.compare(0, 3, PREFIX_V0) != 0) return 0;
    const char* digits = version.c_str() + 3;
    char* end = nullptr;
    long long n = std::strtoll(digits, &end, 10);
    if (end == digits || n < 0) return 0;
    return static_cast<int64_t>(n);
}

bool memory_empty(const json& memory_summary) {
    return int_or_zero(memory_summary, "core_identity_count") == 0 &&
           int_or_zero(memory_summary, "active_lessons_count") == 0;
}

// ═══════════════════════════════════════════════════════════════════════════
// Classification
// ═══════════════════════════════════════════════════════════════════════════

DiscontinuityReport detect_discontinuity(const Fingerprint& identity,
                                         const Fingerprint& evolution,
                                         const Fingerprint& memory,
                                         const json& memory_summary,
                                         const ContinuityBaseline& baseline,
                                         int64_t evolution_jump_threshold) {
    DiscontinuityReport report;

    if (!baseline.previous) {
        if (baseline.total_reboots > 1) {
            report.detected = true;
            report.escalate(Severity::Moderate);
            report.details.push_back("No previous continuity record found - possible fresh start or data loss");
        } else {
            report.details.push_back("First startup - establishing baseline continuity record");
        }
        return report;
    }

    const ContinuityRecord& prev = *baseline.previous;

    if (prev.identity.hash != identity.hash) {
        report.detected = true;
        report.identity_mismatch = true;
        report.escalate(Severity::Critical);
        report.details.push_back("Identity mismatch: " + prev.identity.hash + " -> " + identity.hash);
    }

    if (prev.identity.version != identity.version) {
        report.detected = true;
        report.details.push_back("Identity version changed: " + prev.identity.version +
                                 " -> " + identity.version);
    }

    int64_t prev_count = evolution_counter(prev.evolution.version);
    int64_t count = evolution_counter(evolution.version);
    if (count < prev_count) {
        report.detected = true;
        report.evolution_gap = true;
        report.escalate(Severity::Severe);
        report.details.push_back("Evolution regression: " + prev.evolution.version +
                                 " -> " + evolution.version);
    } else if (count - prev_count > evolution_jump_threshold) {
        report.detected = true;
        report.evolution_gap = true;
        report.escalate(Severity::Minor);
        report.details.push_back("Large evolution jump: " + prev.evolution.version +
                                 " -> " + evolution.version);
    }

    if (memory_empty(memory_summary)) {
        report.detected = true;
        report.memory_missing = true;
        report.escalate(Severity::Moderate);
        report.details.push_back("Memory appears empty - possible memory loss");
    } else if (prev.memory.hash != memory.hash) {
        report.details.push_back("Memory state changed: " + prev.memory.hash + " -> " + memory.hash);
    }

    return report;
}

// ═══════════════════════════════════════════════════════════════════════════
// Engine
// ═══════════════════════════════════════════════════════════════════════════

ContinuityEngine::ContinuityEngine(IdentitySource& identity, EvolutionSource& evolution,
                                   MemorySource& memory, const Clock& clock,
                                   ContinuityConfig config)
    : identity_(identity)
    , evolution_(evolution)
    , memory_(memory)
    , clock_(clock)
    , config_(config)
    , previous_(config.max_previous_records)
    , rebirths_(config.max_rebirth_events)
    , last_check_(clock.now())
{
    log_info("continuity", "Initialized in INITIALIZING mode");
}

void ContinuityEngine::restore(std::optional<ContinuityRecord> record, int64_t reboot_count) {
    std::lock_guard<std::mutex> lock(mutex_);
    current_ = std::move(record);
    total_reboots_ = reboot_count;
    if (current_) {
        log_info("continuity", "Previous record restored (status %s, %lld prior startups)",
                 continuity_status_name(current_->status),
                 static_cast<long long>(total_reboots_));
    }
}

json ContinuityEngine::safe_summary(const SummarySource& source, const char* name) const {
    try {
        json summary = source.export_summary();
        if (summary.is_object()) return summary;
        log_warn("continuity", "%s summary is not an object - fingerprinting empty state", name);
    } catch (const std::exception& e) {
        log_error("continuity", "%s summary failed: %s", name, e.what());
    }
    return json::object();
}

DiscontinuityReport ContinuityEngine::run_startup_checks() {
    std::lock_guard<std::mutex> lock(mutex_);
    return run_checks_locked();
}

DiscontinuityReport ContinuityEngine::force_recovery_check() {
    std::lock_guard<std::mutex> lock(mutex_);
    log_info("continuity", "Forced recovery check initiated");
    startup_complete_ = false;
    return run_checks_locked();
}

DiscontinuityReport ContinuityEngine::run_checks_locked() {
    log_info("continuity", "=== STARTUP CONTINUITY CHECK ===");
    Timestamp at = clock_.now();
    last_check_ = at;
    total_reboots_++;

    json identity_summary = safe_summary(identity_, "Identity");
    json evolution_summary = safe_summary(evolution_, "Evolution");
    json memory_summary = safe_summary(memory_, "Memory");

    std::vector<std::string> core;
    try {
        core = memory_.core_identity();
    } catch (const std::exception& e) {
        log_error("continuity", "Core identity query failed: %s", e.what());
    }

    Fingerprint identity = identity_fingerprint(identity_summary, at);
    Fingerprint evolution = evolution_fingerprint(evolution_summary, at);
    Fingerprint memory = memory_fingerprint(memory_summary, core, at);

    log_info("continuity", "Identity fingerprint: %s (%s)", identity.hash.c_str(), identity.version.c_str());
    log_info("continuity", "Evolution fingerprint: %s (%s)", evolution.hash.c_str(), evolution.version.c_str());
    log_info("continuity", "Memory fingerprint: %s (%s)", memory.hash.c_str(), memory.version.c_str());

    ContinuityBaseline baseline;
    baseline.previous = current_;
    baseline.total_reboots = total_reboots_;

    DiscontinuityReport report = detect_discontinuity(identity, evolution, memory, memory_summary,
                                                      baseline, config_.evolution_jump_threshold);

    ContinuityStatus status = ContinuityStatus::Ok;
    if (report.detected) {
        log_warn("continuity", "DISCONTINUITY DETECTED: %s", severity_name(report.severity));
        for (const auto& detail : report.details) {
            log_warn("continuity", "- %s", detail.c_str());
        }
        mode_ = ContinuityMode::Recovery;
        ContinuityStatus previous_status = current_ ? current_->status : ContinuityStatus::Ok;
        enter_recovery(report, previous_status);
        // Record status follows severity; the rebirth keeps its own outcome
        status = report.severity == Severity::Critical ? ContinuityStatus::Broken
                                                       : ContinuityStatus::Degraded;
    } else {
        for (const auto& detail : report.details) {
            log_info("continuity", "%s", detail.c_str());
        }
        log_info("continuity", "ContinuityStatus: OK");
        mode_ = ContinuityMode::Normal;
    }

    if (current_) {
        previous_.push(*current_);
    }

    ContinuityRecord record;
    record.identity = identity;
    record.evolution = evolution;
    record.memory = memory;
    record.last_verified = at;
    record.status = status;
    current_ = record;
    startup_complete_ = true;

    log_info("continuity", "Startup checks complete. Mode: %s",
             json(mode_).get<std::string>().c_str());
    return report;
}

RebirthEvent ContinuityEngine::enter_recovery(const DiscontinuityReport& report,
                                              ContinuityStatus previous_status) {
    log_warn("continuity", "=== ENTERING RECOVERY MODE ===");

    RebirthEvent event;
    event.timestamp = clock_.now();
    event.id = generate_id("rebirth", event.timestamp);
    event.cause = join(report.details, "; ");
    event.previous_status = previous_status;

    auto claim_source = [&event](RecoverySource source) {
        if (event.recovery_source == RecoverySource::FreshStart) {
            event.recovery_source = source;
        }
    };

    // Each query may throw; a failed query is a gap, not a crash
    if (report.identity_mismatch) {
        int integrity = 0;
        try {
            integrity = identity_.integrity_score();
        } catch (const std::exception& e) {
            log_error("continuity", "Identity integrity query failed: %s", e.what());
        }
        if (integrity >= config_.identity_integrity_threshold) {
            event.recovered_parts.push_back("Identity Core (intact)");
            claim_source(RecoverySource::IdentityCore);
            log_info("continuity", "Recovery: Identity Core is intact and usable");
        } else {
            event.lost_parts.push_back("Identity integrity compromised");
            event.remaining_gaps.push_back("Identity may need human review");
        }
    }

    if (report.memory_missing) {
        event.lost_parts.push_back("Distilled memory");

        std::vector<std::string> core;
        std::vector<std::string> lessons;
        try {
            core = memory_.core_identity();
            lessons = memory_.active_lessons();
        } catch (const std::exception& e) {
            log_error("continuity", "Memory recovery query failed: %s", e.what());
        }

        if (!core.empty()) {
            event.recovered_parts.push_back("Core identity memories (" + std::to_string(core.size()) + " items)");
            claim_source(RecoverySource::DistilledMemory);
            log_info("continuity", "Recovery: Found %zu core identity memories", core.size());
        } else {
            event.remaining_gaps.push_back("No core identity memories available");
        }

        if (!lessons.empty()) {
            event.recovered_parts.push_back("Active lessons (" + std::to_string(lessons.size()) + " items)");
            claim_source(RecoverySource::DistilledMemory);
            log_info("continuity", "Recovery: Found %zu active lessons", lessons.size());
        }
    }

    if (report.evolution_gap) {
        event.lost_parts.push_back("Evolution continuity");

        size_t entries = 0;
        try {
            entries = evolution_.evolution_log_size();
        } catch (const std::exception& e) {
            log_error("continuity", "Evolution log query failed: %s", e.what());
        }

        if (entries > 0) {
            event.recovered_parts.push_back("Evolution log (" + std::to_string(entries) + " entries)");
            claim_source(RecoverySource::EvolutionLogs);
            log_info("continuity", "Recovery: Found %zu evolution log entries", entries);
        } else {
            event.remaining_gaps.push_back("No evolution history available");
        }
    }

    size_t gaps = event.remaining_gaps.size();
    event.new_status = gaps > 2 ? ContinuityStatus::Broken
                     : gaps > 0 ? ContinuityStatus::Degraded
                     : ContinuityStatus::Ok;

    rebirths_.push(event);

    log_info("continuity", "Rebirth event recorded: %s", event.id.c_str());
    log_info("continuity", "Lost: %zu, Recovered: %zu, Gaps: %zu",
             event.lost_parts.size(), event.recovered_parts.size(), gaps);
    if (event.new_status != ContinuityStatus::Ok) {
        log_warn("continuity", "Operating in %s state - some continuity gaps remain",
                 continuity_status_name(event.new_status));
    } else {
        log_info("continuity", "ContinuityStatus: OK");
    }
    return event;
}

ContinuityStatus ContinuityEngine::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_ ? current_->status : ContinuityStatus::Ok;
}

ContinuityMode ContinuityEngine::mode() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return mode_;
}

bool ContinuityEngine::startup_complete() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return startup_complete_;
}

int64_t ContinuityEngine::total_reboots() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_reboots_;
}

std::optional<ContinuityRecord> ContinuityEngine::current_record() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

std::vector<ContinuityRecord> ContinuityEngine::previous_records() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return previous_.to_vector();
}

std::vector<RebirthEvent> ContinuityEngine::rebirth_events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rebirths_.to_vector();
}

std::optional<RebirthEvent> ContinuityEngine::latest_rebirth() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (rebirths_.empty()) return std::nullopt;
    return rebirths_.back();
}

json ContinuityEngine::export_status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    json fingerprints = nullptr;
    if (current_) {
        fingerprints = {
            {"identity", current_->identity.hash},
            {"evolution", current_->evolution.hash},
            {"memory", current_->memory.hash}
        };
    }
    return json{
        {"status", current_ ? current_->status : ContinuityStatus::Ok},
        {"mode", mode_},
        {"startup_complete", startup_complete_},
        {"total_reboots", total_reboots_},
        {"rebirth_count", rebirths_.size()},
        {"last_check", last_check_},
        {"current_fingerprints", fingerprints}
    };
}

} // namespace anima
