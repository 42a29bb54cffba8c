#pragma once

#include "event_buffer.hpp"
#include "log_entry.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>

namespace cerberus_dash {

// One viewer's live SSE feed: Connecting -> Streaming -> Closed.
class StreamingSession {
public:
    enum class State {
        Connecting,
        Streaming,
        Closed
    };

    // Writes one frame to the connection; false means the client is gone
    using Writer = std::function<bool(const std::string& frame)>;

    static constexpr std::chrono::milliseconds kDefaultKeepalive{1000};

    explicit StreamingSession(EventBuffer& events,
                              std::chrono::milliseconds keepalive = kDefaultKeepalive);
    ~StreamingSession();

    StreamingSession(const StreamingSession&) = delete;
    StreamingSession& operator=(const StreamingSession&) = delete;

    // Blocks for the lifetime of the connection. Returns once the writer
    // fails, stop() is called, or the event buffer closes the subscription.
    void run(const Writer& write);

    // Ends this session only. Safe from any thread; wakes a session
    // blocked waiting for entries.
    void stop();

    State state() const { return state_; }

    // "data: <json>\n\n"
    static std::string format_event(const LogEntry& entry);

    // SSE comment frame, ignored by EventSource clients
    static std::string keepalive_frame();

    static LogEntry connected_entry();

private:
    void close();

    EventBuffer& events_;
    std::chrono::milliseconds keepalive_;
    std::atomic<State> state_{State::Connecting};
    std::atomic<bool> stop_requested_{false};

    std::mutex mutex_;
    SubscriptionPtr subscription_;
};

} // namespace cerberus_dash
