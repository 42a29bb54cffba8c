#include "status_probe.hpp"
#include "log_normalizer.hpp"
#include <fstream>
#include <sstream>

namespace cerberus_dash {

StatusProbe::StatusProbe(std::vector<std::string> units, std::string hostname_file,
                         std::string backend_onion, CommandRunner runner)
    : units_(std::move(units))
    , hostname_file_(std::move(hostname_file))
    , backend_onion_(std::move(backend_onion))
    , runner_(std::move(runner))
{
}

std::string StatusProbe::display_name(const std::string& unit) {
    const std::string suffix = "-server";
    std::string name = unit;
    auto pos = name.find(suffix);
    if (pos != std::string::npos) {
        name.erase(pos, suffix.size());
    }
    return name;
}

std::map<std::string, std::string> StatusProbe::service_status() const {
    std::map<std::string, std::string> services;

    for (const auto& unit : units_) {
        auto result = runner_({"systemctl", "is-active", unit}, kCommandTimeout);
        std::string state;
        if (!result) {
            state = "unknown";
        } else {
            state = trim(result->output) == "active" ? "running" : "stopped";
        }
        services[display_name(unit)] = state;
    }
    return services;
}

std::optional<std::string> StatusProbe::mirror_onion() const {
    std::ifstream file(hostname_file_);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::stringstream ss;
    ss << file.rdbuf();
    return trim(ss.str());
}

nlohmann::json StatusProbe::status_json(const LogPipeline& pipeline) const {
    nlohmann::json j;
    j["services"] = service_status();

    auto onion = mirror_onion();
    if (onion) {
        j["mirror_onion"] = *onion;
    } else {
        j["mirror_onion"] = nullptr;
    }

    j["backend_onion"] = backend_onion_;
    j["stats"] = pipeline.stats().to_json();
    j["start_time"] = pipeline.start_time_ms();
    return j;
}

} // namespace cerberus_dash
