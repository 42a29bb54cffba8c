#include "stats_aggregator.hpp"
#include "log_normalizer.hpp"

namespace cerberus_dash {

void StatsAggregator::observe(const LogEntry& entry) {
    std::string lower = to_lower(entry.message);
    auto has = [&lower](const char* word) { return lower.find(word) != std::string::npos; };

    if (has("request")) {
        requests_.fetch_add(1, std::memory_order_relaxed);
    }
    if (has("blocked") || has("denied") || has("reject")) {
        blocked_.fetch_add(1, std::memory_order_relaxed);
    }
    if (has("captcha")) {
        captchas_.fetch_add(1, std::memory_order_relaxed);
    }
}

Stats StatsAggregator::snapshot() const {
    Stats stats;
    stats.requests = requests_.load(std::memory_order_relaxed);
    stats.blocked = blocked_.load(std::memory_order_relaxed);
    stats.captchas = captchas_.load(std::memory_order_relaxed);
    return stats;
}

} // namespace cerberus_dash
