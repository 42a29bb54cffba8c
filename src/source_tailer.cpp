#include "source_tailer.hpp"
#include "server_log.hpp"

namespace cerberus_dash {

SourceTailer::SourceTailer(std::string name, std::string target, LineSink sink)
    : name_(std::move(name))
    , target_(std::move(target))
    , sink_(std::move(sink))
{
}

void SourceTailer::emit(const std::string& line) {
    if (!sink_) return;
    try {
        sink_(line, name_);
    } catch (const std::exception& e) {
        ServerLog::error(name_, std::string("Failed to process line: ") + e.what());
    }
}

} // namespace cerberus_dash
