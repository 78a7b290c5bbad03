#pragma once
// Socket Client: talks to a running animad over its control socket
//
// Connects only; never starts, kills or restarts a daemon.

#include <anima/control_server.hpp>
#include <anima/state.hpp>
#include <optional>
#include <string>

namespace anima {

struct DaemonVersion {
    std::string software;
    int protocol_major = 0;
    int protocol_minor = 0;
};

class SocketClient {
public:
    static constexpr int RESPONSE_TIMEOUT_MS = 30000;
    static constexpr size_t MAX_RESPONSE_SIZE = 16 * 1024 * 1024;

    explicit SocketClient(std::string socket_path);
    ~SocketClient();

    // Non-copyable, non-movable (owns file descriptor)
    SocketClient(const SocketClient&) = delete;
    SocketClient& operator=(const SocketClient&) = delete;
    SocketClient(SocketClient&&) = delete;
    SocketClient& operator=(SocketClient&&) = delete;

    bool connect();
    void disconnect();
    bool connected() const { return fd_ >= 0; }

    // Connect and verify protocol compatibility
    bool connect_checked();

    std::optional<DaemonVersion> check_version();

    // Send {"command": ..., params...}; returns the parsed response line
    std::optional<json> call(const std::string& command, json params = json::object());

    // Raw line in, raw line out
    std::optional<std::string> request(const std::string& line);

    bool wait_for_socket_gone(int timeout_ms);

    const std::string& last_error() const { return last_error_; }
    const std::string& socket_path() const { return socket_path_; }

private:
    std::string socket_path_;
    int fd_ = -1;
    std::string last_error_;
};

} // namespace anima
