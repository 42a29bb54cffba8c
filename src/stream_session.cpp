#include "stream_session.hpp"
#include "log_normalizer.hpp"

namespace cerberus_dash {

StreamingSession::StreamingSession(EventBuffer& events, std::chrono::milliseconds keepalive)
    : events_(events)
    , keepalive_(keepalive)
{
}

StreamingSession::~StreamingSession() {
    close();
}

std::string StreamingSession::format_event(const LogEntry& entry) {
    return "data: " + dump_json(entry.to_json()) + "\n\n";
}

std::string StreamingSession::keepalive_frame() {
    return ": keepalive\n\n";
}

LogEntry StreamingSession::connected_entry() {
    LogEntry entry;
    entry.time = current_time_string();
    entry.level = Level::Info;
    entry.source = "dashboard";
    entry.message = "Connected to log stream";
    return entry;
}

void StreamingSession::run(const Writer& write) {
    if (state_ != State::Connecting) return;

    SubscriptionPtr subscription = events_.subscribe();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        subscription_ = subscription;
    }
    state_ = State::Streaming;

    // stop() or a hub shutdown may have raced the subscribe above
    if (stop_requested_ || subscription->is_closed() ||
        !write(format_event(connected_entry()))) {
        close();
        return;
    }

    while (!stop_requested_) {
        auto entry = subscription->wait_next(keepalive_);
        if (stop_requested_) break;

        if (entry) {
            if (!write(format_event(*entry))) break;
        } else if (subscription->is_closed()) {
            break;
        } else if (!write(keepalive_frame())) {
            break;
        }
    }

    close();
}

void StreamingSession::stop() {
    stop_requested_ = true;

    std::lock_guard<std::mutex> lock(mutex_);
    if (subscription_) {
        events_.unsubscribe(subscription_);
    }
}

void StreamingSession::close() {
    SubscriptionPtr subscription;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        subscription.swap(subscription_);
    }
    if (subscription) {
        events_.unsubscribe(subscription);
    }
    state_ = State::Closed;
}

} // namespace cerberus_dash
