#pragma once

#include "log_entry.hpp"
#include <atomic>
#include <functional>
#include <string>

namespace cerberus_dash {

// Follows one log source and hands every new line to a sink. Each tailer is
// its own failure domain: attach errors are logged and the tailer simply
// stops, without throwing out of start() or its worker thread.
class SourceTailer {
public:
    using LineSink = std::function<void(const std::string& line, const std::string& source)>;

    // Longest line held back waiting for its newline; longer runs are
    // delivered in pieces of this size
    static constexpr size_t kMaxLineBytes = 64 * 1024;

    SourceTailer(std::string name, std::string target, LineSink sink);
    virtual ~SourceTailer() = default;

    SourceTailer(const SourceTailer&) = delete;
    SourceTailer& operator=(const SourceTailer&) = delete;

    virtual void start() = 0;
    virtual void stop() = 0;
    virtual SourceKind kind() const = 0;

    bool is_running() const { return running_; }
    const std::string& name() const { return name_; }
    const std::string& target() const { return target_; }

protected:
    // Deliver a line to the sink; sink exceptions are logged, not propagated
    void emit(const std::string& line);

    std::string name_;
    std::string target_;
    LineSink sink_;
    std::atomic<bool> running_{false};
};

} // namespace cerberus_dash
