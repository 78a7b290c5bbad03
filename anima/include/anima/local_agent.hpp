#pragma once
// LocalAgent: the in-process agent animad drives
//
// Holds live state, runs one unit of work per cycle, and hands state to
// the snapshot store. Each cycle nudges the scorekeeping the way a calm
// mind settles: doubts fade by one, confidence grows by one, energy is
// spent and recovered. Anomalies inject doubt.
//
// Focus and constraint changes are steering: they queue until the next
// cycle, where an attached DecisionGate must approve each one. A denial
// fails that cycle and the change is dropped.
//
// capture() also carries the continuity record and reboot counter when a
// ContinuityEngine is attached, so the next process can compare itself.

#include <anima/collaborators.hpp>
#include <mutex>
#include <string>
#include <vector>

namespace anima {

class ContinuityEngine;

class LocalAgent : public CycleRunner, public StateProvider {
public:
    LocalAgent() = default;

    void attach_continuity(const ContinuityEngine* continuity) { continuity_ = continuity; }
    void attach_gate(DecisionGate* gate) { gate_ = gate; }

    // CycleRunner
    CycleResult run_one_cycle(const CycleContext& ctx) override;

    // StateProvider
    LiveState capture() const override;
    void restore(const RestoredState& state) override;

    // +10 doubts, -5 confidence; "doubting" past 50 doubts
    void inject_doubt();

    // The next `n` cycles report failure (operational drills)
    void fail_next(int n);

    void set_focus(const std::string& focus);
    void add_constraint(const std::string& constraint);
    size_t pending_steering() const;

    AgentState agent_state() const;
    int autonomy_level() const;
    std::string behavior_pattern_hash() const;

private:
    struct Steer {
        std::string kind;     // "focus" or "constraint"
        std::string content;
    };

    mutable std::mutex mutex_;
    AgentState agent_;
    int autonomy_level_ = 50;
    std::set<std::string> constraints_;
    std::string pattern_hash_;
    int pending_failures_ = 0;
    int64_t last_cycle_ = 0;
    std::vector<Steer> steering_;
    const ContinuityEngine* continuity_ = nullptr;
    DecisionGate* gate_ = nullptr;
};

} // namespace anima
