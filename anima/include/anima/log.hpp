#pragma once
// Log: component-tagged stderr lines
//
//   [02:25:31.042][daemon] Heartbeat: completed | Cycle 42 | Duration 812ms
//
// Debug lines only appear in verbose mode. Tests swap the sink to
// capture lines instead of printing them.

#include <functional>
#include <string>

namespace anima {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3
};

const char* log_level_name(LogLevel level);

// Receives fully formatted lines (without trailing newline)
using LogSink = std::function<void(LogLevel, const std::string& component,
                                   const std::string& message)>;

void set_log_level(LogLevel level);
LogLevel log_level();

// Convenience for --verbose: Debug when on, Info otherwise
void set_verbose(bool verbose);
bool verbose();

// Replace the sink; an empty function restores stderr
void set_log_sink(LogSink sink);

// printf-style; Debug lines only appear in verbose mode
void log_debug(const char* component, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
void log_info(const char* component, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
void log_warn(const char* component, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
void log_error(const char* component, const char* fmt, ...) __attribute__((format(printf, 2, 3)));

} // namespace anima
