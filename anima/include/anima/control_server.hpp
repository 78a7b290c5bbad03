#pragma once
// Control Server: the daemon's Unix-socket control channel
//
// One request per line in, one response line out, in order, per client.
// The server owns the framing and calls the line handler itself; the run
// loop only calls serve(). Control traffic is small and must never crowd
// out the daemon, so every client is held to tight limits:
//   - a line over MAX_LINE_SIZE gets an error reply, then the connection
//     closes once that reply is flushed
//   - once a client's unsent replies pass MAX_PENDING_BYTES it is not read
//     from until it drains them; its requests wait in the kernel buffer
//   - at most MAX_LINES_PER_ROUND requests per client per serve()
//   - a client that half-closes still gets replies, including one for a
//     final line without a newline
//   - past MAX_CONNECTIONS a newcomer gets a "busy" reply and is closed
//
// Paths are derived from the snapshot path, so two daemons persisting to
// different files never collide.

#include <anima/types.hpp>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace anima {

inline std::string socket_path_for_snapshot(const std::string& snapshot_path) {
    return "/tmp/anima-" + std::to_string(djb2_hash(snapshot_path)) + ".sock";
}

inline std::string lock_path_for_snapshot(const std::string& snapshot_path) {
    return "/tmp/anima-" + std::to_string(djb2_hash(snapshot_path)) + ".lock";
}

inline std::string pid_path_for_snapshot(const std::string& snapshot_path) {
    return "/tmp/anima-" + std::to_string(djb2_hash(snapshot_path)) + ".pid";
}

// One request line (no newline) to one response line; must not throw
using LineHandler = std::function<std::string(const std::string& line)>;

class ControlServer {
public:
    static constexpr size_t MAX_CONNECTIONS = 16;
    static constexpr size_t MAX_LINE_SIZE = 64 * 1024;
    static constexpr size_t MAX_PENDING_BYTES = 1024 * 1024;
    static constexpr size_t MAX_LINES_PER_ROUND = 8;

    ControlServer(std::string socket_path, LineHandler handler);
    ~ControlServer();

    // Non-copyable, non-movable (owns file descriptors)
    ControlServer(const ControlServer&) = delete;
    ControlServer& operator=(const ControlServer&) = delete;

    bool listen();
    void close();
    bool listening() const { return listen_fd_ >= 0; }

    // One poll round: accept, read, answer complete lines, flush.
    // Returns the number of requests answered.
    size_t serve(int timeout_ms = 100);

    // Flush queued replies for up to timeout_ms; true when none are left
    bool drain(int timeout_ms);

    size_t connection_count() const { return clients_.size(); }
    size_t pending_bytes() const;

    struct Stats {
        size_t requests = 0;
        size_t oversized = 0;
        size_t refused = 0;
    };
    const Stats& stats() const { return stats_; }

    const std::string& socket_path() const { return socket_path_; }

private:
    struct Client {
        int fd = -1;
        std::string inbox;
        std::string outbox;
        bool peer_closed = false;        // no more requests coming
        bool close_after_flush = false;  // rejected; close once outbox is empty
        bool broken = false;             // I/O error; close now
    };

    bool open_socket();
    void accept_clients();
    bool wants_input(const Client& c) const;
    bool has_request(const Client& c) const;
    void read_from(Client& c);
    size_t answer(Client& c);
    void reject_oversized(Client& c);
    void write_to(Client& c);
    void reap();

    std::string socket_path_;
    LineHandler handler_;
    int listen_fd_ = -1;
    std::vector<Client> clients_;
    Stats stats_;
};

} // namespace anima
