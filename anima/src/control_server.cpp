#include <anima/control_server.hpp>
#include <anima/log.hpp>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>

namespace anima {

namespace {

const char REPLY_TOO_LARGE[] = "{\"ok\":false,\"error\":\"request too large\"}";
const char REPLY_BUSY[] = "{\"ok\":false,\"error\":\"too many connections\"}\n";

void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

bool transient(int err) {
    return err == EAGAIN || err == EWOULDBLOCK || err == EINTR;
}

} // namespace

ControlServer::ControlServer(std::string socket_path, LineHandler handler)
    : socket_path_(std::move(socket_path))
    , handler_(std::move(handler)) {}

ControlServer::~ControlServer() {
    close();
}

bool ControlServer::listen() {
    if (listen_fd_ >= 0) return true;
    if (!open_socket()) return false;

    log_info("control", "Listening on %s", socket_path_.c_str());
    return true;
}

void ControlServer::close() {
    for (auto& c : clients_) {
        ::close(c.fd);
    }
    clients_.clear();

    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
        unlink(socket_path_.c_str());
    }
}

bool ControlServer::open_socket() {
    struct sockaddr_un addr;
    memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    if (socket_path_.size() >= sizeof(addr.sun_path)) {
        log_error("control", "Socket path too long: %s", socket_path_.c_str());
        return false;
    }
    strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

    // Stale socket from a crashed run; the instance lock is already held
    unlink(socket_path_.c_str());

    int fd = socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0) {
        log_error("control", "socket() failed: %s", strerror(errno));
        return false;
    }
    set_nonblocking(fd);

    const char* step = nullptr;
    if (bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        step = "bind";
    } else if (chmod(socket_path_.c_str(), 0600) < 0) {
        step = "chmod";
    } else if (::listen(fd, static_cast<int>(MAX_CONNECTIONS)) < 0) {
        step = "listen";
    }
    if (step) {
        log_error("control", "%s() failed on %s: %s", step, socket_path_.c_str(), strerror(errno));
        ::close(fd);
        unlink(socket_path_.c_str());
        return false;
    }

    listen_fd_ = fd;
    return true;
}

// ═══════════════════════════════════════════════════════════════════════════
// Serving
// ═══════════════════════════════════════════════════════════════════════════

bool ControlServer::wants_input(const Client& c) const {
    return !c.peer_closed && !c.close_after_flush && !c.broken &&
           c.outbox.size() < MAX_PENDING_BYTES;
}

bool ControlServer::has_request(const Client& c) const {
    if (c.broken || c.close_after_flush || c.outbox.size() >= MAX_PENDING_BYTES) return false;
    return c.inbox.find('\n') != std::string::npos || (c.peer_closed && !c.inbox.empty());
}

size_t ControlServer::serve(int timeout_ms) {
    if (listen_fd_ < 0) return 0;

    std::vector<pollfd> fds;
    fds.reserve(1 + clients_.size());
    fds.push_back({listen_fd_, POLLIN, 0});

    bool backlog = false;
    for (const auto& c : clients_) {
        short events = 0;
        if (wants_input(c)) events |= POLLIN;
        if (!c.outbox.empty()) events |= POLLOUT;
        fds.push_back({c.fd, events, 0});
        backlog = backlog || has_request(c);
    }

    // Lines left over from the last round are answered without waiting
    int ret = ::poll(fds.data(), fds.size(), backlog ? 0 : timeout_ms);
    if (ret < 0) {
        if (errno != EINTR) {
            log_error("control", "poll() error: %s", strerror(errno));
        }
        return 0;
    }

    size_t answered = 0;
    size_t known = clients_.size();   // accept_clients() appends
    for (size_t i = 0; i < known; ++i) {
        Client& c = clients_[i];
        short revents = fds[i + 1].revents;

        if (revents & POLLIN) read_from(c);
        if (revents & (POLLERR | POLLNVAL)) c.broken = true;
        if ((revents & POLLHUP) && !(revents & POLLIN)) c.peer_closed = true;

        answered += answer(c);
        write_to(c);
    }

    if (fds[0].revents & POLLIN) {
        accept_clients();
    }

    reap();
    return answered;
}

void ControlServer::read_from(Client& c) {
    char buf[4096];
    ssize_t n = ::read(c.fd, buf, sizeof(buf));
    if (n > 0) {
        c.inbox.append(buf, static_cast<size_t>(n));
    } else if (n == 0) {
        c.peer_closed = true;
    } else if (!transient(errno)) {
        c.broken = true;
    }
}

size_t ControlServer::answer(Client& c) {
    size_t answered = 0;
    while (answered < MAX_LINES_PER_ROUND && has_request(c)) {
        size_t pos = c.inbox.find('\n');
        size_t length = pos == std::string::npos ? c.inbox.size() : pos;
        if (length > MAX_LINE_SIZE) {
            reject_oversized(c);
            break;
        }

        std::string line = c.inbox.substr(0, length);
        c.inbox.erase(0, std::min(length + 1, c.inbox.size()));
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.find_first_not_of(" \t") == std::string::npos) continue;

        c.outbox += handler_(line);
        c.outbox += '\n';
        stats_.requests++;
        answered++;
    }

    // A partial line already past the limit will not get shorter
    if (!c.close_after_flush && c.inbox.size() > MAX_LINE_SIZE &&
        c.inbox.find('\n') == std::string::npos) {
        reject_oversized(c);
    }
    return answered;
}

void ControlServer::reject_oversized(Client& c) {
    stats_.oversized++;
    log_warn("control", "Request over %zu bytes on fd=%d - closing", MAX_LINE_SIZE, c.fd);
    c.inbox.clear();
    c.outbox += REPLY_TOO_LARGE;
    c.outbox += '\n';
    c.close_after_flush = true;
}

void ControlServer::write_to(Client& c) {
    if (c.outbox.empty() || c.broken) return;

    ssize_t n = ::send(c.fd, c.outbox.data(), c.outbox.size(), MSG_NOSIGNAL);
    if (n > 0) {
        c.outbox.erase(0, static_cast<size_t>(n));
    } else if (n < 0 && !transient(errno)) {
        c.broken = true;
    }
}

void ControlServer::accept_clients() {
    while (true) {
        int fd = accept(listen_fd_, nullptr, nullptr);
        if (fd < 0) {
            if (!transient(errno)) {
                log_error("control", "accept() error: %s", strerror(errno));
            }
            break;
        }

        if (clients_.size() >= MAX_CONNECTIONS) {
            stats_.refused++;
            if (::send(fd, REPLY_BUSY, sizeof(REPLY_BUSY) - 1, MSG_NOSIGNAL | MSG_DONTWAIT) < 0) {
                log_debug("control", "Busy reply not delivered: %s", strerror(errno));
            }
            ::close(fd);
            log_warn("control", "%zu clients connected - refusing another", clients_.size());
            continue;
        }

        set_nonblocking(fd);
        Client c;
        c.fd = fd;
        clients_.push_back(std::move(c));
        log_debug("control", "Client connected (fd=%d, total=%zu)", fd, clients_.size());
    }
}

void ControlServer::reap() {
    auto done = [](const Client& c) {
        if (c.broken) return true;
        if (!c.outbox.empty()) return false;
        return c.close_after_flush || (c.peer_closed && c.inbox.empty());
    };

    auto it = std::remove_if(clients_.begin(), clients_.end(), [&done](const Client& c) {
        if (!done(c)) return false;
        log_debug("control", "Client disconnected (fd=%d)", c.fd);
        ::close(c.fd);
        return true;
    });
    clients_.erase(it, clients_.end());
}

bool ControlServer::drain(int timeout_ms) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

    while (pending_bytes() > 0) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (left <= 0) return false;

        std::vector<pollfd> fds;
        for (const auto& c : clients_) {
            fds.push_back({c.fd, static_cast<short>(c.outbox.empty() ? 0 : POLLOUT), 0});
        }
        int ret = ::poll(fds.data(), fds.size(), static_cast<int>(std::min<int64_t>(left, 50)));
        if (ret < 0 && errno != EINTR) {
            log_error("control", "poll() error while draining: %s", strerror(errno));
            return false;
        }

        for (size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].revents & (POLLERR | POLLHUP | POLLNVAL)) clients_[i].broken = true;
            if (fds[i].revents & POLLOUT) write_to(clients_[i]);
        }
        reap();
    }
    return true;
}

size_t ControlServer::pending_bytes() const {
    size_t total = 0;
    for (const auto& c : clients_) {
        total += c.outbox.size();
    }
    return total;
}

} // namespace anima
