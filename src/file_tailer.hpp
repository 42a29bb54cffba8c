#pragma once

#include "source_tailer.hpp"
#include <chrono>
#include <cstdint>
#include <string>
#include <thread>

namespace cerberus_dash {

class FileTailer : public SourceTailer {
public:
    static constexpr std::chrono::milliseconds kPollInterval{100};

    FileTailer(const std::string& name, const std::string& path, LineSink sink);
    ~FileTailer() override;

    // Seeks to the current end of the file; pre-existing content is ignored
    void start() override;
    void stop() override;
    SourceKind kind() const override { return SourceKind::File; }

private:
    void monitor_loop();
    bool read_new_content();

    std::thread thread_;
    std::atomic<bool> stop_requested_{false};
    std::uintmax_t last_pos_{0};
    std::string partial_;     // Bytes after the last newline, under kMaxLineBytes
};

} // namespace cerberus_dash
