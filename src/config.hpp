#pragma once

#include "log_entry.hpp"
#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace cerberus_dash {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct Config {
    uint16_t port = 9999;
    std::string bind_address = "0.0.0.0";
    std::string dashboard_dir = "dashboard";

    size_t buffer_capacity = 1000;
    size_t history_limit = 100;
    std::chrono::milliseconds keepalive{1000};

    // systemd units reported by /api/status
    std::vector<std::string> services;
    std::vector<SourceDescriptor> sources;

    std::string hostname_file = "/var/lib/tor/cerberus_hs/hostname";
    std::string backend_onion = "sigilahzwq5u34gdh2bl3ymokyc7kobika55kyhztsucdoub73hz7qid.onion";

    bool tui = false;
    bool show_help = false;

    // Stack defaults: fortify, tor, haproxy, nginx and redis journals plus
    // the nginx access log
    static Config defaults();

    nlohmann::json to_json() const;
};

// Overlay keys present in `j` onto `config`. Throws ConfigError on bad types
// or values.
void apply_json(Config& config, const nlohmann::json& j);

// Read and apply a JSON config file
void apply_file(Config& config, const std::string& path);

// defaults -> --config file -> command-line options
Config parse_args(int argc, char* argv[]);

// "NAME=VALUE" as used by --journal and --file
SourceDescriptor parse_source_spec(const std::string& spec, SourceKind kind);

std::string usage(const std::string& program);

} // namespace cerberus_dash
