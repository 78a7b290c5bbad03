#include <anima/heartbeat.hpp>

namespace anima {

const char* heartbeat_status_name(HeartbeatStatus status) {
    switch (status) {
        case HeartbeatStatus::Alive: return "alive";
        case HeartbeatStatus::Running: return "running";
        case HeartbeatStatus::Completed: return "completed";
        case HeartbeatStatus::Error: return "error";
    }
    return "alive";
}

void to_json(json& j, const Heartbeat& hb) {
    j = json{
        {"cycle", hb.cycle},
        {"timestamp", hb.timestamp},
        {"status", hb.status},
        {"cycle_duration_ms", hb.cycle_duration_ms},
        {"consecutive_successes", hb.consecutive_successes},
        {"consecutive_failures", hb.consecutive_failures}
    };
}

const Heartbeat& HeartbeatLog::record(HeartbeatStatus status, int64_t cycle,
                                      Timestamp at, int64_t duration_ms) {
    int successes = 0;
    int failures = 0;
    if (!history_.empty()) {
        successes = history_.back().consecutive_successes;
        failures = history_.back().consecutive_failures;
    }

    Heartbeat hb;
    hb.cycle = cycle;
    hb.timestamp = at;
    hb.status = status;
    hb.cycle_duration_ms = duration_ms;

    switch (status) {
        case HeartbeatStatus::Completed:
            hb.consecutive_successes = successes + 1;
            hb.consecutive_failures = 0;
            break;
        case HeartbeatStatus::Error:
            hb.consecutive_successes = 0;
            hb.consecutive_failures = failures + 1;
            break;
        case HeartbeatStatus::Running:
            hb.consecutive_successes = successes;
            hb.consecutive_failures = failures;
            break;
        case HeartbeatStatus::Alive:
            break;
    }

    history_.push(hb);
    return history_.back();
}

std::optional<Heartbeat> HeartbeatLog::last() const {
    if (history_.empty()) return std::nullopt;
    return history_.back();
}

} // namespace anima
