#pragma once

#include "log_entry.hpp"
#include "log_pipeline.hpp"
#include "source_tailer.hpp"
#include <string>
#include <memory>
#include <mutex>
#include <vector>

namespace cerberus_dash {

struct SourceInfo {
    SourceDescriptor descriptor;
    bool running = false;

    nlohmann::json to_json() const {
        nlohmann::json j = descriptor.to_json();
        j["running"] = running;
        return j;
    }
};

// Owns one tailer per configured source, all feeding the same pipeline.
class SourceManager {
public:
    explicit SourceManager(LogPipeline& pipeline);
    ~SourceManager();

    // Create and start a tailer. Returns false if it failed to attach; the
    // source stays listed as not running and no other source is affected.
    bool add_source(const SourceDescriptor& descriptor);

    // Adopt an already constructed tailer (used for command-backed sources)
    bool add_tailer(const SourceDescriptor& descriptor, std::unique_ptr<SourceTailer> tailer);

    std::vector<SourceInfo> list_sources() const;
    size_t running_count() const;

    // Lifecycle
    void stop_all();

private:
    std::unique_ptr<SourceTailer> make_tailer(const SourceDescriptor& descriptor);

    struct Source {
        SourceDescriptor descriptor;
        std::unique_ptr<SourceTailer> tailer;
    };

    LogPipeline& pipeline_;
    std::vector<Source> sources_;
    mutable std::mutex mutex_;
};

} // namespace cerberus_dash
