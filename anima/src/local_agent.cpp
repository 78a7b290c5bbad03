#include <anima/local_agent.hpp>
#include <anima/continuity.hpp>
#include <anima/log.hpp>
#include <algorithm>

namespace anima {

namespace {

int clamp_score(int v) {
    return std::max(0, std::min(100, v));
}

constexpr int LOW_ENERGY = 20;

} // namespace

CycleResult LocalAgent::run_one_cycle(const CycleContext& ctx) {
    std::lock_guard<std::mutex> lock(mutex_);

    CycleResult result;
    result.cycle = ctx.cycle;

    if (pending_failures_ > 0) {
        pending_failures_--;
        agent_.confidence = clamp_score(agent_.confidence - 5);
        result.success = false;
        result.error = "drill: injected cycle failure";
        return result;
    }

    std::vector<Steer> steering;
    steering.swap(steering_);
    for (size_t i = 0; i < steering.size(); ++i) {
        const Steer& s = steering[i];
        if (gate_) {
            Decision decision = gate_->check_decision(s.kind, s.content);
            if (!decision.approved) {
                log_warn("agent", "Gate denied %s '%s': %s", s.kind.c_str(), s.content.c_str(),
                         decision.recommendation.c_str());
                // Later requests wait for the next cycle
                steering_.insert(steering_.begin(), steering.begin() + i + 1, steering.end());
                agent_.confidence = clamp_score(agent_.confidence - 5);
                result.success = false;
                result.error = "decision gate denied " + s.kind + ": " + decision.recommendation;
                return result;
            }
        }
        if (s.kind == "focus") {
            agent_.current_focus = s.content;
        } else {
            constraints_.insert(s.content);
        }
    }

    if (ctx.resumed_after_restart && !agent_.current_focus) {
        agent_.current_focus = "reorient after restart";
    }

    agent_.cycle_count = ctx.cycle;
    agent_.doubts = clamp_score(agent_.doubts - 1);
    agent_.confidence = clamp_score(agent_.confidence + 1);

    if (agent_.energy_level <= LOW_ENERGY) {
        agent_.mode = "resting";
        agent_.energy_level = clamp_score(agent_.energy_level + 10);
    } else {
        agent_.mode = agent_.doubts > 50 ? "doubting" : "reflecting";
        agent_.energy_level = clamp_score(agent_.energy_level - 1);
    }

    // Rolling hash of the mode sequence: what this agent tends to do
    pattern_hash_ = to_hex(fnv1a_64(pattern_hash_ + agent_.mode), 16);
    last_cycle_ = ctx.cycle;

    result.success = true;
    result.stats = {
        {"confidence", agent_.confidence},
        {"doubts", agent_.doubts},
        {"energy_level", agent_.energy_level},
        {"mode", agent_.mode}
    };
    return result;
}

LiveState LocalAgent::capture() const {
    LiveState live;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        live.cycle = last_cycle_;
        live.agent = agent_;
        live.autonomy_level = autonomy_level_;
        live.active_constraints = constraints_;
        live.behavior_pattern_hash = pattern_hash_;
        live.reality.stability = clamp_score(agent_.confidence - agent_.doubts);
        live.reality.autonomy = autonomy_level_;
        live.desire_state_summary = {{"focus", agent_.current_focus ? json(*agent_.current_focus) : json(nullptr)}};
        live.governance_state = {{"constraints", constraints_.size()}};
    }

    if (continuity_) {
        live.continuity = continuity_->current_record();
        live.reboot_count = continuity_->total_reboots();
    }
    return live;
}

void LocalAgent::restore(const RestoredState& state) {
    std::lock_guard<std::mutex> lock(mutex_);
    agent_.confidence = clamp_score(state.confidence);
    autonomy_level_ = clamp_score(state.autonomy_level);
    pattern_hash_ = state.behavior_pattern_hash;
}

void LocalAgent::inject_doubt() {
    std::lock_guard<std::mutex> lock(mutex_);
    agent_.doubts = clamp_score(agent_.doubts + 10);
    agent_.confidence = clamp_score(agent_.confidence - 5);
    if (agent_.doubts > 50) agent_.mode = "doubting";
    log_debug("agent", "Doubt injected (doubts=%d)", agent_.doubts);
}

void LocalAgent::fail_next(int n) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_failures_ = std::max(0, n);
}

void LocalAgent::set_focus(const std::string& focus) {
    std::lock_guard<std::mutex> lock(mutex_);
    steering_.push_back({"focus", focus});
}

void LocalAgent::add_constraint(const std::string& constraint) {
    std::lock_guard<std::mutex> lock(mutex_);
    steering_.push_back({"constraint", constraint});
}

size_t LocalAgent::pending_steering() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return steering_.size();
}

AgentState LocalAgent::agent_state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return agent_;
}

int LocalAgent::autonomy_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return autonomy_level_;
}

std::string LocalAgent::behavior_pattern_hash() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pattern_hash_;
}

} // namespace anima
