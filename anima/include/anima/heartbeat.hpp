#pragma once
// Heartbeat: append-only, bounded record of cycle liveness
//
// Each heartbeat is immutable. Its streak counters are derived from the
// previous heartbeat when it is recorded:
//   completed  successes + 1, failures reset
//   error      failures + 1, successes reset
//   running    both carried forward (an attempt is not an outcome)
//   alive      both reset (fresh start or post-recovery baseline)

#include <anima/state.hpp>
#include <optional>
#include <vector>

namespace anima {

enum class HeartbeatStatus {
    Alive,
    Running,
    Completed,
    Error
};

NLOHMANN_JSON_SERIALIZE_ENUM(HeartbeatStatus, {
    {HeartbeatStatus::Alive, "alive"},
    {HeartbeatStatus::Running, "running"},
    {HeartbeatStatus::Completed, "completed"},
    {HeartbeatStatus::Error, "error"},
})

const char* heartbeat_status_name(HeartbeatStatus status);

struct Heartbeat {
    int64_t cycle = 0;
    Timestamp timestamp = 0;
    HeartbeatStatus status = HeartbeatStatus::Alive;
    int64_t cycle_duration_ms = 0;
    int consecutive_successes = 0;
    int consecutive_failures = 0;
};

void to_json(json& j, const Heartbeat& hb);

class HeartbeatLog {
public:
    explicit HeartbeatLog(size_t capacity = 100) : history_(capacity) {}

    // Build the next heartbeat from the previous one and append it
    const Heartbeat& record(HeartbeatStatus status, int64_t cycle,
                            Timestamp at, int64_t duration_ms = 0);

    std::optional<Heartbeat> last() const;

    // Newest `limit` heartbeats, oldest first
    std::vector<Heartbeat> recent(size_t limit) const { return history_.last(limit); }

    size_t size() const { return history_.size(); }
    size_t capacity() const { return history_.capacity(); }

private:
    RingBuffer<Heartbeat> history_;
};

} // namespace anima
