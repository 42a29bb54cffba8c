#pragma once

#include "log_entry.hpp"
#include <atomic>
#include <cstdint>

namespace cerberus_dash {

// Process-lifetime counters derived from entry messages. Never reset.
class StatsAggregator {
public:
    StatsAggregator() = default;

    StatsAggregator(const StatsAggregator&) = delete;
    StatsAggregator& operator=(const StatsAggregator&) = delete;

    void observe(const LogEntry& entry);
    Stats snapshot() const;

private:
    std::atomic<uint64_t> requests_{0};
    std::atomic<uint64_t> blocked_{0};
    std::atomic<uint64_t> captchas_{0};
};

} // namespace cerberus_dash
