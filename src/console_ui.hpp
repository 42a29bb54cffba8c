#pragma once

#include "command_table.hpp"
#include "log_entry.hpp"
#include "log_pipeline.hpp"
#include "server_log.hpp"
#include <ftxui/component/component.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <string>
#include <vector>
#include <deque>
#include <mutex>
#include <atomic>
#include <functional>
#include <thread>
#include <chrono>

namespace cerberus_dash {

class SourceManager;
class StatusProbe;

// Server log entry (from ServerLog capture)
struct ServerLogLine {
    std::string component;
    std::string message;
    Severity severity;
};

// Bounded pane contents shared between the render loop and producers
template<typename T>
class LineBuffer {
public:
    explicit LineBuffer(size_t max_lines) : max_lines_(max_lines) {}

    void push(T line) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (lines_.size() == max_lines_) lines_.pop_front();
        lines_.push_back(std::move(line));
    }

    // Last `count` lines, oldest first
    std::vector<T> tail(size_t count) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto first = lines_.size() > count ? lines_.end() - static_cast<std::ptrdiff_t>(count)
                                           : lines_.begin();
        return std::vector<T>(first, lines_.end());
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lines_.size();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        lines_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::deque<T> lines_;
    size_t max_lines_;
};

// Header figures, refreshed once a second
struct DisplayStats {
    Stats counters;
    size_t buffered = 0;
    size_t viewers = 0;
    size_t sources_running = 0;
    size_t sources_total = 0;
    double entries_per_second = 0.0;
    int64_t uptime_seconds = 0;
};

// Full-screen terminal view of the live stream (--tui)
class ConsoleUI {
public:
    ConsoleUI(LogPipeline& pipeline, SourceManager& sources, StatusProbe& status,
              uint16_t http_port);
    ~ConsoleUI();

    // Start the TUI (blocks until exit)
    void run(std::atomic<bool>& running);

    // Called for every entry published by the pipeline
    void on_entry(const LogEntry& entry);

    // Called to add a server log (replaces console output)
    void log_server(const std::string& component, const std::string& message,
                    Severity severity = Severity::Info);

    ServerLog::Sink get_log_sink();

private:
    static ftxui::Color level_to_color(Level level);

    void update_stats();
    void refresh_status();

    LogPipeline& pipeline_;
    SourceManager& sources_;
    StatusProbe& status_;
    LineBuffer<LogEntry> entries_;
    LineBuffer<ServerLogLine> server_logs_;
    DisplayStats stats_;
    std::mutex stats_mutex_;

    // UI state
    std::atomic<bool> paused_{false};

    // Command input state
    std::string command_input_;
    std::string completion_hint_;
    CommandTable commands_;

    void init_commands(std::atomic<bool>& running, ftxui::ScreenInteractive& screen);
    void execute_command();
    void show_help();

    uint16_t http_port_;

    // Rate tracking
    std::atomic<int64_t> entries_in_window_{0};
    std::chrono::steady_clock::time_point rate_window_start_;

    std::thread status_thread_;
    size_t pipeline_subscription_ = 0;

    // Screen reference for refresh
    std::atomic<ftxui::ScreenInteractive*> screen_{nullptr};
};

} // namespace cerberus_dash
