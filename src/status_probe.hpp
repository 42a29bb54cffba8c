#pragma once

#include "log_pipeline.hpp"
#include "process.hpp"
#include <chrono>
#include <functional>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace cerberus_dash {

// Up/down state of the stack's systemd units and the hidden service address.
class StatusProbe {
public:
    using CommandRunner = std::function<std::optional<CommandResult>(
        const std::vector<std::string>& argv, std::chrono::milliseconds timeout)>;

    static constexpr std::chrono::milliseconds kCommandTimeout{5000};

    StatusProbe(std::vector<std::string> units, std::string hostname_file,
                std::string backend_onion, CommandRunner runner = run_command);

    // Display name -> "running" | "stopped" | "unknown"
    std::map<std::string, std::string> service_status() const;

    // Trimmed contents of the hostname file, if readable
    std::optional<std::string> mirror_onion() const;

    // Body of GET /api/status
    nlohmann::json status_json(const LogPipeline& pipeline) const;

    // "redis-server" -> "redis"
    static std::string display_name(const std::string& unit);

private:
    std::vector<std::string> units_;
    std::string hostname_file_;
    std::string backend_onion_;
    CommandRunner runner_;
};

} // namespace cerberus_dash
