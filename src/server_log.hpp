#pragma once

#include <string>
#include <functional>
#include <mutex>

namespace cerberus_dash {

enum class Severity {
    Info,
    Warn,
    Error
};

// Process-wide diagnostic log for the dashboard itself. Output goes to the
// console by default; the terminal UI replaces the sink while it runs.
class ServerLog {
public:
    using Sink = std::function<void(const std::string& component,
                                    const std::string& message,
                                    Severity severity)>;

    static void set_sink(Sink sink);
    static void info(const std::string& component, const std::string& message);
    static void warn(const std::string& component, const std::string& message);
    static void error(const std::string& component, const std::string& message);

    // Writes "HH:MM:SS [component] message" to stdout, errors to stderr
    static void console_sink(const std::string& component,
                             const std::string& message, Severity severity);

private:
    static void write(const std::string& component, const std::string& message,
                      Severity severity);

    static Sink sink_;
    static std::mutex mutex_;
};

} // namespace cerberus_dash
