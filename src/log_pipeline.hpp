#pragma once

#include "event_buffer.hpp"
#include "log_entry.hpp"
#include "stats_aggregator.hpp"
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace cerberus_dash {

// Shared dashboard state, owned by main and passed by reference to the
// tailers, the HTTP layer and the console UI.
class LogPipeline {
public:
    explicit LogPipeline(size_t capacity = EventBuffer::kDefaultCapacity);

    // Non-copyable
    LogPipeline(const LogPipeline&) = delete;
    LogPipeline& operator=(const LogPipeline&) = delete;

    // Normalize a raw source line, count it, store and broadcast it.
    LogEntry ingest(const std::string& raw_line, const std::string& source_name);

    // Dashboard announcements (source "dashboard"); stored and broadcast
    // without touching stats
    void announce(Level level, const std::string& message);

    EventBuffer& events() { return events_; }
    const EventBuffer& events() const { return events_; }
    Stats stats() const { return stats_.snapshot(); }

    // Process start, milliseconds since the Unix epoch
    int64_t start_time_ms() const { return start_time_ms_; }

    // Local observers of every published entry (e.g. the console UI)
    using EntryCallback = std::function<void(const LogEntry&)>;
    size_t subscribe(EntryCallback callback);

    // Blocks until any in-flight call of the callback has returned
    void unsubscribe(size_t id);

private:
    void dispatch(const LogEntry& entry);

    EventBuffer events_;
    StatsAggregator stats_;
    int64_t start_time_ms_;

    std::mutex callbacks_mutex_;
    std::vector<std::pair<size_t, EntryCallback>> callbacks_;
    size_t next_callback_id_{1};
};

} // namespace cerberus_dash
