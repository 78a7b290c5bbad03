#include <anima/socket_client.hpp>
#include <anima/version.hpp>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <chrono>
#include <thread>

namespace anima {

SocketClient::SocketClient(std::string socket_path)
    : socket_path_(std::move(socket_path)) {}

SocketClient::~SocketClient() {
    disconnect();
}

bool SocketClient::connect() {
    if (fd_ >= 0) return true;

    fd_ = socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd_ < 0) {
        last_error_ = std::string("socket() failed: ") + strerror(errno);
        return false;
    }

    struct sockaddr_un addr;
    memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

    if (::connect(fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        last_error_ = std::string("connect() failed: ") + strerror(errno);
        close(fd_);
        fd_ = -1;
        return false;
    }

    return true;
}

void SocketClient::disconnect() {
    if (fd_ >= 0) {
        close(fd_);
        fd_ = -1;
    }
}

bool SocketClient::connect_checked() {
    if (!connect()) {
        last_error_ = "No daemon listening on " + socket_path_ + " (" + last_error_ + ")";
        return false;
    }

    auto version = check_version();
    if (!version) {
        disconnect();
        return false;
    }

    if (!version::protocol_compatible(version->protocol_major, version->protocol_minor)) {
        last_error_ = "Daemon v" + version->software + " (protocol " +
                      std::to_string(version->protocol_major) + "." +
                      std::to_string(version->protocol_minor) +
                      ") incompatible with client v" ANIMA_VERSION;
        disconnect();
        return false;
    }
    return true;
}

std::optional<DaemonVersion> SocketClient::check_version() {
    auto response = call("version");
    if (!response) return std::nullopt;

    if (!response->is_object() || !response->contains("result") ||
        !(*response)["result"].is_object()) {
        last_error_ = "Malformed version response";
        return std::nullopt;
    }
    const json& result = (*response)["result"];

    DaemonVersion ver;
    ver.software = result.value("software_version", "");
    ver.protocol_major = result.value("protocol_major", 0);
    ver.protocol_minor = result.value("protocol_minor", 0);
    return ver;
}

std::optional<json> SocketClient::call(const std::string& command, json params) {
    json req = params.is_object() ? std::move(params) : json::object();
    req["command"] = command;

    auto line = request(req.dump());
    if (!line) return std::nullopt;

    try {
        json response = json::parse(*line);
        if (!response.is_object()) {
            last_error_ = "Malformed response: not an object";
            return std::nullopt;
        }
        if (!response.value("ok", false)) {
            last_error_ = response.value("error", std::string("request failed"));
        }
        return response;
    } catch (const json::parse_error& e) {
        last_error_ = std::string("Malformed response: ") + e.what();
        return std::nullopt;
    }
}

std::optional<std::string> SocketClient::request(const std::string& line) {
    if (fd_ < 0) {
        last_error_ = "Not connected";
        return std::nullopt;
    }

    if (line.size() > ControlServer::MAX_LINE_SIZE || line.find('\n') != std::string::npos) {
        last_error_ = "Request too large or not a single line";
        return std::nullopt;
    }

    std::string msg = line + "\n";
    size_t sent = 0;
    while (sent < msg.size()) {
        ssize_t n = send(fd_, msg.data() + sent, msg.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) {
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
                pollfd pfd = {fd_, POLLOUT, 0};
                poll(&pfd, 1, 1000);
                continue;
            }
            last_error_ = std::string("send() failed: ") + strerror(errno);
            return std::nullopt;
        }
        sent += static_cast<size_t>(n);
    }

    std::string response;
    pollfd pfd = {fd_, POLLIN, 0};

    while (true) {
        int ret = poll(&pfd, 1, RESPONSE_TIMEOUT_MS);

        if (ret < 0) {
            if (errno == EINTR) continue;
            last_error_ = std::string("poll() failed: ") + strerror(errno);
            return std::nullopt;
        }

        if (ret == 0) {
            last_error_ = "Response timeout";
            return std::nullopt;
        }

        char buf[4096];
        ssize_t n = read(fd_, buf, sizeof(buf));

        if (n <= 0) {
            last_error_ = n == 0 ? "Connection closed" :
                          std::string("read() failed: ") + strerror(errno);
            return std::nullopt;
        }

        response.append(buf, static_cast<size_t>(n));
        if (response.size() > MAX_RESPONSE_SIZE) {
            last_error_ = "Response too large";
            return std::nullopt;
        }

        size_t pos = response.find('\n');
        if (pos != std::string::npos) {
            return response.substr(0, pos);
        }
    }
}

bool SocketClient::wait_for_socket_gone(int timeout_ms) {
    auto start = std::chrono::steady_clock::now();

    while (access(socket_path_.c_str(), F_OK) == 0) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        if (elapsed >= timeout_ms) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return true;
}

} // namespace anima
