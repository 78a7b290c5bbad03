#pragma once
// Collaborators: what the daemon and continuity engine consume
//
// The core never knows how a cycle thinks, how identity is stored, or
// what the decision gate approves. It only needs:
//   - run one unit of work, report success/failure
//   - an exported summary per subsystem, to fingerprint
//   - live state to snapshot, and a place to restore it into

#include <anima/state.hpp>
#include <optional>
#include <string>
#include <vector>

namespace anima {

// Passed to every cycle so the unit of work knows what led to it
struct CycleContext {
    int64_t cycle = 0;                   // attempt number, previous + 1
    bool resumed_after_restart = false;  // first cycle after cold-start restore
};

struct CycleResult {
    bool success = false;
    int64_t cycle = 0;
    json stats = json::object();
    std::string error;
};

// Invoked once per tick, never concurrently with itself
class CycleRunner {
public:
    virtual ~CycleRunner() = default;
    virtual CycleResult run_one_cycle(const CycleContext& ctx) = 0;
};

struct Decision {
    bool approved = false;
    std::string recommendation;
};

// Consulted by the agent before it changes its own focus or constraints.
// The daemon never calls it; a denial surfaces as a failed CycleResult.
class DecisionGate {
public:
    virtual ~DecisionGate() = default;
    virtual Decision check_decision(const std::string& kind, const std::string& content) = 0;
};

// Live state for snapshots, and the sink for cold-start restoration
class StateProvider {
public:
    virtual ~StateProvider() = default;
    virtual LiveState capture() const = 0;
    virtual void restore(const RestoredState& state) = 0;
};

// ═══════════════════════════════════════════════════════════════════════════
// Fingerprint sources
//
// export_summary() returns a small JSON object; only a fixed projection of
// it is hashed. The extra queries are for best-effort rebirth recovery.
// ═══════════════════════════════════════════════════════════════════════════

class SummarySource {
public:
    virtual ~SummarySource() = default;
    virtual json export_summary() const = 0;
};

// Summary keys: origin, purpose, non_negotiables[], boundaries[], current_version
class IdentitySource : public SummarySource {
public:
    virtual int integrity_score() const = 0;  // 0..100
};

// Summary keys: version ("v0.N"), evolution_count, mode, capabilities[]
class EvolutionSource : public SummarySource {
public:
    virtual size_t evolution_log_size() const = 0;
};

// Summary keys: core_identity_count, active_lessons_count, total_processed
class MemorySource : public SummarySource {
public:
    virtual std::vector<std::string> core_identity() const = 0;
    virtual std::vector<std::string> active_lessons() const = 0;
};

} // namespace anima
