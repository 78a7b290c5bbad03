#include <anima/control.hpp>
#include <anima/log.hpp>
#include <anima/status.hpp>
#include <anima/version.hpp>

namespace anima {

ControlHandler::ControlHandler(Daemon& daemon, ContinuityEngine& continuity,
                               std::function<void()> on_shutdown)
    : daemon_(daemon)
    , continuity_(continuity)
    , on_shutdown_(std::move(on_shutdown)) {}

std::string ControlHandler::handle(const std::string& line) {
    handled_++;
    json response;
    try {
        std::string command;
        json params = json::object();

        size_t start = line.find_first_not_of(" \t");
        if (start != std::string::npos && line[start] == '{') {
            params = json::parse(line);
            auto it = params.find("command");
            if (it == params.end() || !it->is_string()) {
                throw ControlError("missing \"command\"");
            }
            command = it->get<std::string>();
        } else {
            size_t end = line.find_last_not_of(" \t");
            if (start != std::string::npos) command = line.substr(start, end - start + 1);
        }

        if (command.empty()) throw ControlError("empty request");

        log_debug("control", "Request: %s", command.c_str());
        response = {{"ok", true}, {"result", dispatch(command, params)}};
    } catch (const json::exception& e) {
        response = {{"ok", false}, {"error", std::string("bad request: ") + e.what()}};
    } catch (const ControlError& e) {
        response = {{"ok", false}, {"error", e.what()}};
    } catch (const std::exception& e) {
        log_error("control", "Request failed: %s", e.what());
        response = {{"ok", false}, {"error", e.what()}};
    }
    return response.dump();
}

json ControlHandler::dispatch(const std::string& command, const json& params) {
    if (command == "version") {
        return {
            {"software_version", ANIMA_VERSION},
            {"protocol_major", ANIMA_PROTOCOL_VERSION_MAJOR},
            {"protocol_minor", ANIMA_PROTOCOL_VERSION_MINOR},
            {"snapshot_schema", ANIMA_SNAPSHOT_SCHEMA_VERSION}
        };
    }

    if (command == "status") {
        return build_health_report(daemon_, continuity_);
    }

    if (command == "heartbeats") {
        int64_t limit = params.value("limit", static_cast<int64_t>(20));
        if (limit < 1) throw ControlError("limit must be positive");
        return daemon_.heartbeat_history(static_cast<size_t>(limit));
    }

    if (command == "recoveries") {
        return daemon_.recovery_events();
    }

    if (command == "rebirths") {
        return continuity_.rebirth_events();
    }

    if (command == "snapshot") {
        auto s = daemon_.save_snapshot();
        if (!s) throw ControlError("snapshot write failed - see daemon log");
        return {{"id", s->id}, {"cycle", s->cycle}, {"checksum", s->checksum}};
    }

    if (command == "recover") {
        std::string reason = params.value("reason", std::string("manual request"));
        return daemon_.recover(RecoveryType::ManualRecovery, reason);
    }

    if (command == "continuity") {
        return continuity_.force_recovery_check();
    }

    if (command == "focus" || command == "constrain") {
        if (!agent_) throw ControlError(command + ": no agent attached");
        const char* key = command == "focus" ? "focus" : "constraint";
        auto it = params.find(key);
        if (it == params.end() || !it->is_string() || it->get<std::string>().empty()) {
            throw ControlError(std::string(key) + " must be a non-empty string");
        }
        if (command == "focus") {
            agent_->set_focus(it->get<std::string>());
        } else {
            agent_->add_constraint(it->get<std::string>());
        }
        return {{"queued", true}, {"pending", agent_->pending_steering()}};
    }

    if (command == "shutdown") {
        log_info("control", "Shutdown requested over control socket");
        if (on_shutdown_) on_shutdown_();
        return {{"stopping", true}};
    }

    throw ControlError("unknown command: " + command);
}

} // namespace anima
