#include "file_tailer.hpp"
#include "server_log.hpp"
#include <filesystem>
#include <fstream>

namespace cerberus_dash {

FileTailer::FileTailer(const std::string& name, const std::string& path, LineSink sink)
    : SourceTailer(name.empty() ? std::filesystem::path(path).filename().string() : name,
                   path, std::move(sink))
{
}

FileTailer::~FileTailer() {
    stop();
}

void FileTailer::start() {
    if (running_ || thread_.joinable()) return;

    std::ifstream probe(target_);
    if (!probe.is_open()) {
        ServerLog::error("FileTailer", "Cannot open " + target_ + " for " + name_);
        return;
    }

    try {
        last_pos_ = std::filesystem::file_size(target_);  // Start at end
    } catch (const std::exception& e) {
        ServerLog::error("FileTailer", std::string("Failed to stat file: ") + e.what());
        return;
    }

    running_ = true;
    stop_requested_ = false;
    ServerLog::info("FileTailer", "Started tailing: " + target_ + " (as " + name_ + ")");

    thread_ = std::thread([this]() {
        monitor_loop();
    });
}

void FileTailer::stop() {
    stop_requested_ = true;
    if (thread_.joinable()) {
        thread_.join();
        ServerLog::info("FileTailer", "Stopped tailing: " + target_);
    }
    running_ = false;
}

void FileTailer::monitor_loop() {
    while (!stop_requested_) {
        bool got_data = false;
        try {
            got_data = read_new_content();
        } catch (const std::exception& e) {
            ServerLog::error("FileTailer", std::string("Error reading file: ") + e.what());
        }

        if (!got_data) {
            std::this_thread::sleep_for(kPollInterval);
        }
    }
    running_ = false;
}

bool FileTailer::read_new_content() {
    std::error_code ec;
    auto current_size = std::filesystem::file_size(target_, ec);
    if (ec) {
        // File was removed or rotated away; wait for it to reappear
        return false;
    }

    if (current_size < last_pos_) {
        ServerLog::info("FileTailer", "File truncated, resetting position: " + target_);
        last_pos_ = 0;
        partial_.clear();
    }

    if (current_size == last_pos_) {
        return false;
    }

    std::ifstream file(target_, std::ios::binary);
    if (!file.is_open()) {
        return false;
    }

    file.seekg(static_cast<std::streamoff>(last_pos_));
    std::string chunk(static_cast<size_t>(current_size - last_pos_), '\0');
    file.read(&chunk[0], static_cast<std::streamsize>(chunk.size()));
    chunk.resize(static_cast<size_t>(file.gcount()));
    last_pos_ += chunk.size();

    partial_ += chunk;

    size_t start = 0;
    size_t newline;
    while ((newline = partial_.find('\n', start)) != std::string::npos && !stop_requested_) {
        emit(partial_.substr(start, newline - start));
        start = newline + 1;
    }
    partial_.erase(0, start);

    while (partial_.size() >= kMaxLineBytes && !stop_requested_) {
        emit(partial_.substr(0, kMaxLineBytes));
        partial_.erase(0, kMaxLineBytes);
    }

    return !chunk.empty();
}

} // namespace cerberus_dash
