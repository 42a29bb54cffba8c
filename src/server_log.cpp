#include "server_log.hpp"
#include "log_normalizer.hpp"
#include <iostream>

namespace cerberus_dash {

ServerLog::Sink ServerLog::sink_ = ServerLog::console_sink;
std::mutex ServerLog::mutex_;

void ServerLog::set_sink(Sink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = sink ? std::move(sink) : console_sink;
}

void ServerLog::info(const std::string& component, const std::string& message) {
    write(component, message, Severity::Info);
}

void ServerLog::warn(const std::string& component, const std::string& message) {
    write(component, message, Severity::Warn);
}

void ServerLog::error(const std::string& component, const std::string& message) {
    write(component, message, Severity::Error);
}

void ServerLog::write(const std::string& component, const std::string& message,
                      Severity severity) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sink_) {
        sink_(component, message, severity);
    }
}

void ServerLog::console_sink(const std::string& component,
                             const std::string& message, Severity severity) {
    std::ostream& out = severity == Severity::Error ? std::cerr : std::cout;
    out << current_time_string() << " [" << component << "] ";
    if (severity == Severity::Warn) {
        out << "warning: ";
    }
    out << message << std::endl;
}

} // namespace cerberus_dash
