#include <anima/log.hpp>
#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>

namespace anima {

namespace {

std::atomic<int> min_level{static_cast<int>(LogLevel::Info)};
std::mutex sink_mutex;
LogSink custom_sink;

void write_stderr(LogLevel level, const std::string& component, const std::string& message) {
    // Get timestamp with milliseconds
    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local_tm{};
    localtime_r(&now_time_t, &local_tm);
    char time_buf[32];
    std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &local_tm);

    std::cerr << "[" << time_buf << "." << std::setfill('0') << std::setw(3) << now_ms.count()
              << "][" << component << "] ";
    if (level == LogLevel::Warn || level == LogLevel::Error) {
        std::cerr << log_level_name(level) << ": ";
    }
    std::cerr << message << "\n";
}

} // namespace

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARNING";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

void set_log_level(LogLevel level) {
    min_level = static_cast<int>(level);
}

LogLevel log_level() {
    return static_cast<LogLevel>(min_level.load());
}

void set_verbose(bool on) {
    set_log_level(on ? LogLevel::Debug : LogLevel::Info);
}

bool verbose() {
    return log_level() == LogLevel::Debug;
}

void set_log_sink(LogSink sink) {
    std::lock_guard<std::mutex> lock(sink_mutex);
    custom_sink = std::move(sink);
}

namespace {

void vlog(LogLevel level, const char* component, const char* fmt, va_list args) {
    if (static_cast<int>(level) < min_level.load()) return;

    va_list retry;
    va_copy(retry, args);

    char buf[1024];
    int n = vsnprintf(buf, sizeof(buf), fmt, args);

    std::string message;
    if (n < 0) {
        message = fmt;
    } else if (static_cast<size_t>(n) < sizeof(buf)) {
        message.assign(buf, static_cast<size_t>(n));
    } else {
        // Long line: format again into an exact-size buffer
        message.resize(static_cast<size_t>(n) + 1);
        vsnprintf(&message[0], message.size(), fmt, retry);
        message.resize(static_cast<size_t>(n));
    }
    va_end(retry);

    std::lock_guard<std::mutex> lock(sink_mutex);
    if (custom_sink) {
        custom_sink(level, component, message);
    } else {
        write_stderr(level, component, message);
    }
}

} // namespace

void log_debug(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(LogLevel::Debug, component, fmt, args);
    va_end(args);
}

void log_info(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(LogLevel::Info, component, fmt, args);
    va_end(args);
}

void log_warn(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(LogLevel::Warn, component, fmt, args);
    va_end(args);
}

void log_error(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(LogLevel::Error, component, fmt, args);
    va_end(args);
}

} // namespace anima
