#include "source_manager.hpp"
#include "file_tailer.hpp"
#include "journal_tailer.hpp"
#include "server_log.hpp"

namespace cerberus_dash {

SourceManager::SourceManager(LogPipeline& pipeline)
    : pipeline_(pipeline)
{
}

SourceManager::~SourceManager() {
    stop_all();
}

std::unique_ptr<SourceTailer> SourceManager::make_tailer(const SourceDescriptor& descriptor) {
    auto sink = [this](const std::string& line, const std::string& source) {
        pipeline_.ingest(line, source);
    };

    if (descriptor.kind == SourceKind::File) {
        return std::make_unique<FileTailer>(descriptor.name, descriptor.target, sink);
    }
    return std::make_unique<JournalTailer>(descriptor.name, descriptor.target, sink);
}

bool SourceManager::add_source(const SourceDescriptor& descriptor) {
    return add_tailer(descriptor, make_tailer(descriptor));
}

bool SourceManager::add_tailer(const SourceDescriptor& descriptor,
                               std::unique_ptr<SourceTailer> tailer) {
    tailer->start();
    bool running = tailer->is_running();

    if (!running) {
        ServerLog::warn("Sources", "Source " + descriptor.name + " (" +
                        source_kind_to_string(descriptor.kind) + ": " + descriptor.target +
                        ") is unavailable");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    sources_.push_back(Source{descriptor, std::move(tailer)});
    return running;
}

std::vector<SourceInfo> SourceManager::list_sources() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<SourceInfo> result;
    for (const auto& source : sources_) {
        SourceInfo info;
        info.descriptor = source.descriptor;
        info.running = source.tailer->is_running();
        result.push_back(info);
    }
    return result;
}

size_t SourceManager::running_count() const {
    std::lock_guard<std::mutex> lock(mutex_);

    size_t count = 0;
    for (const auto& source : sources_) {
        if (source.tailer->is_running()) ++count;
    }
    return count;
}

void SourceManager::stop_all() {
    std::lock_guard<std::mutex> lock(mutex_);

    for (auto& source : sources_) {
        source.tailer->stop();
    }
    sources_.clear();
}

} // namespace cerberus_dash
