#pragma once
// Control: the request vocabulary of the daemon's control socket
//
// One line in, one line out. A request is a JSON object
// {"command": "...", ...params} or a bare command word. Responses are
// {"ok": true, "result": ...} or {"ok": false, "error": "..."}.
//
//   version       software + protocol version (client handshake)
//   status        health report
//   heartbeats    recent heartbeats, newest last ("limit", default 20)
//   recoveries    recovery events
//   rebirths      continuity rebirth events
//   snapshot      save a snapshot now
//   recover       manual recovery ("reason")
//   continuity    re-run continuity checks
//   focus         steer the agent's focus ("focus"); applied next cycle
//   constrain     add an active constraint ("constraint"); applied next cycle
//   shutdown      graceful stop

#include <anima/continuity.hpp>
#include <anima/daemon.hpp>
#include <anima/local_agent.hpp>
#include <functional>
#include <stdexcept>
#include <string>

namespace anima {

class ControlError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ControlHandler {
public:
    ControlHandler(Daemon& daemon, ContinuityEngine& continuity,
                   std::function<void()> on_shutdown);

    // Enables focus/constrain; without it they are errors
    void attach_agent(LocalAgent* agent) { agent_ = agent; }

    // Never throws; malformed input becomes an error response
    std::string handle(const std::string& line);

    // Throws ControlError for unknown commands and bad parameters
    json dispatch(const std::string& command, const json& params);

    size_t requests_handled() const { return handled_; }

private:
    Daemon& daemon_;
    ContinuityEngine& continuity_;
    std::function<void()> on_shutdown_;
    LocalAgent* agent_ = nullptr;
    size_t handled_ = 0;
};

} // namespace anima
