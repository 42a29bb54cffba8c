#include "log_pipeline.hpp"
#include "log_normalizer.hpp"
#include "server_log.hpp"
#include <algorithm>
#include <chrono>

namespace cerberus_dash {

LogPipeline::LogPipeline(size_t capacity)
    : events_(capacity)
{
    auto now = std::chrono::system_clock::now();
    start_time_ms_ = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count();
}

LogEntry LogPipeline::ingest(const std::string& raw_line, const std::string& source_name) {
    LogEntry entry = normalize(raw_line, source_name);
    stats_.observe(entry);
    dispatch(entry);
    return entry;
}

void LogPipeline::announce(Level level, const std::string& message) {
    LogEntry entry;
    entry.time = current_time_string();
    entry.level = level;
    entry.source = "dashboard";
    entry.message = message;
    dispatch(entry);
}

size_t LogPipeline::subscribe(EntryCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    size_t id = next_callback_id_++;
    callbacks_.emplace_back(id, std::move(callback));
    return id;
}

void LogPipeline::unsubscribe(size_t id) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    callbacks_.erase(
        std::remove_if(callbacks_.begin(), callbacks_.end(),
            [id](const auto& c) { return c.first == id; }),
        callbacks_.end()
    );
}

void LogPipeline::dispatch(const LogEntry& entry) {
    events_.push(entry);

    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    for (auto& observer : callbacks_) {
        try {
            observer.second(entry);
        } catch (const std::exception& e) {
            ServerLog::error("Pipeline", std::string("Entry observer failed: ") + e.what());
        }
    }
}

} // namespace cerberus_dash
