#include "config.hpp"
#include <fstream>
#include <sstream>

namespace cerberus_dash {

namespace {

uint64_t parse_unsigned(const std::string& option, const std::string& value,
                        uint64_t min, uint64_t max) {
    try {
        size_t consumed = 0;
        long long parsed = std::stoll(value, &consumed);
        if (consumed != value.size() || parsed < static_cast<long long>(min) ||
            static_cast<unsigned long long>(parsed) > max) {
            throw ConfigError(option + " out of range: " + value);
        }
        return static_cast<uint64_t>(parsed);
    } catch (const ConfigError&) {
        throw;
    } catch (const std::exception&) {
        throw ConfigError(option + " expects a number, got: " + value);
    }
}

uint64_t json_unsigned(const nlohmann::json& j, const std::string& key,
                       uint64_t min, uint64_t max) {
    int64_t value = j.at(key).get<int64_t>();
    if (value < static_cast<int64_t>(min) || static_cast<uint64_t>(value) > max) {
        throw ConfigError(key + " out of range: " + std::to_string(value));
    }
    return static_cast<uint64_t>(value);
}

SourceKind parse_kind(const std::string& kind) {
    if (kind == "journal") return SourceKind::Journal;
    if (kind == "file") return SourceKind::File;
    throw ConfigError("Unknown source kind: " + kind);
}

} // namespace

Config Config::defaults() {
    Config config;
    config.services = {"fortify", "tor", "haproxy", "nginx", "redis-server"};
    config.sources = {
        {"fortify", SourceKind::Journal, "fortify"},
        {"tor", SourceKind::Journal, "tor"},
        {"haproxy", SourceKind::Journal, "haproxy"},
        {"nginx", SourceKind::Journal, "nginx"},
        {"redis", SourceKind::Journal, "redis-server"},
        {"nginx", SourceKind::File, "/var/log/nginx/access.log"},
    };
    return config;
}

nlohmann::json Config::to_json() const {
    nlohmann::json j;
    j["port"] = port;
    j["bind"] = bind_address;
    j["dashboard_dir"] = dashboard_dir;
    j["buffer_capacity"] = buffer_capacity;
    j["history_limit"] = history_limit;
    j["keepalive_ms"] = keepalive.count();
    j["services"] = services;
    j["sources"] = nlohmann::json::array();
    for (const auto& source : sources) {
        j["sources"].push_back(source.to_json());
    }
    j["hostname_file"] = hostname_file;
    j["backend_onion"] = backend_onion;
    j["tui"] = tui;
    return j;
}

void apply_json(Config& config, const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigError("Config must be a JSON object");
    }

    try {
        if (j.contains("port")) {
            config.port = static_cast<uint16_t>(json_unsigned(j, "port", 1, 65535));
        }
        if (j.contains("bind")) config.bind_address = j["bind"].get<std::string>();
        if (j.contains("dashboard_dir")) config.dashboard_dir = j["dashboard_dir"].get<std::string>();
        if (j.contains("buffer_capacity")) {
            config.buffer_capacity = static_cast<size_t>(json_unsigned(j, "buffer_capacity", 1, 1000000));
        }
        if (j.contains("history_limit")) {
            config.history_limit = static_cast<size_t>(json_unsigned(j, "history_limit", 1, 1000000));
        }
        if (j.contains("keepalive_ms")) {
            config.keepalive = std::chrono::milliseconds(json_unsigned(j, "keepalive_ms", 1, 3600000));
        }
        if (j.contains("services")) {
            config.services = j["services"].get<std::vector<std::string>>();
        }
        if (j.contains("sources")) {
            config.sources.clear();
            for (const auto& item : j["sources"]) {
                SourceDescriptor source;
                source.name = item.at("name").get<std::string>();
                source.kind = parse_kind(item.value("kind", "journal"));
                source.target = item.at("target").get<std::string>();
                config.sources.push_back(source);
            }
        }
        if (j.contains("hostname_file")) config.hostname_file = j["hostname_file"].get<std::string>();
        if (j.contains("backend_onion")) config.backend_onion = j["backend_onion"].get<std::string>();
        if (j.contains("tui")) config.tui = j["tui"].get<bool>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("Invalid config: ") + e.what());
    }
}

void apply_file(Config& config, const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path);
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Failed to parse " + path + ": " + e.what());
    }
    apply_json(config, j);
}

SourceDescriptor parse_source_spec(const std::string& spec, SourceKind kind) {
    auto eq = spec.find('=');
    if (eq == std::string::npos || eq == 0 || eq + 1 == spec.size()) {
        throw ConfigError("Expected NAME=" + std::string(kind == SourceKind::File ? "PATH" : "UNIT") +
                          ", got: " + spec);
    }

    SourceDescriptor source;
    source.name = spec.substr(0, eq);
    source.kind = kind;
    source.target = spec.substr(eq + 1);
    return source;
}

Config parse_args(int argc, char* argv[]) {
    Config config = Config::defaults();

    // First pass: options that change the baseline the others apply to
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            config.show_help = true;
            return config;
        }
        else if (arg == "--config") {
            if (i + 1 >= argc) throw ConfigError("--config requires a path");
            apply_file(config, argv[++i]);
        }
        else if (arg == "--no-default-sources") {
            config.sources.clear();
        }
    }

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;

        if (arg == "--config") {
            ++i;
        }
        else if (arg == "--no-default-sources") {
            continue;
        }
        else if (arg == "--tui") {
            config.tui = true;
        }
        else if (!has_value) {
            throw ConfigError("Unknown option or missing value: " + arg);
        }
        else if (arg == "--port") {
            config.port = static_cast<uint16_t>(parse_unsigned(arg, argv[++i], 1, 65535));
        }
        else if (arg == "--bind") {
            config.bind_address = argv[++i];
        }
        else if (arg == "--dashboard-dir") {
            config.dashboard_dir = argv[++i];
        }
        else if (arg == "--capacity") {
            config.buffer_capacity = static_cast<size_t>(parse_unsigned(arg, argv[++i], 1, 1000000));
        }
        else if (arg == "--history") {
            config.history_limit = static_cast<size_t>(parse_unsigned(arg, argv[++i], 1, 1000000));
        }
        else if (arg == "--keepalive-ms") {
            config.keepalive = std::chrono::milliseconds(parse_unsigned(arg, argv[++i], 1, 3600000));
        }
        else if (arg == "--journal") {
            config.sources.push_back(parse_source_spec(argv[++i], SourceKind::Journal));
        }
        else if (arg == "--file") {
            config.sources.push_back(parse_source_spec(argv[++i], SourceKind::File));
        }
        else if (arg == "--hostname-file") {
            config.hostname_file = argv[++i];
        }
        else if (arg == "--backend-onion") {
            config.backend_onion = argv[++i];
        }
        else {
            throw ConfigError("Unknown option: " + arg);
        }
    }

    return config;
}

std::string usage(const std::string& program) {
    std::ostringstream ss;
    ss << "Cerberus Dashboard - live service status and log stream\n\n";
    ss << "Usage: " << program << " [options]\n\n";
    ss << "Options:\n";
    ss << "  --config PATH           JSON config file (applied before other options)\n";
    ss << "  --port PORT             HTTP port (default: 9999)\n";
    ss << "  --bind ADDR             Bind address (default: 0.0.0.0)\n";
    ss << "  --dashboard-dir DIR     Static dashboard assets (default: ./dashboard)\n";
    ss << "  --capacity N            Entries kept in memory (default: 1000)\n";
    ss << "  --history N             Entries returned by /api/logs/history (default: 100)\n";
    ss << "  --keepalive-ms MS       Idle interval between stream keepalives (default: 1000)\n";
    ss << "  --journal NAME=UNIT     Follow a systemd unit's journal\n";
    ss << "  --file NAME=PATH        Follow a growing log file\n";
    ss << "  --no-default-sources    Do not follow the stack's default sources\n";
    ss << "  --hostname-file PATH    Hidden service hostname file\n";
    ss << "  --backend-onion ADDR    Backend onion address reported by /api/status\n";
    ss << "  --tui                   Show the terminal dashboard\n";
    ss << "  --help                  Show this help message\n\n";
    ss << "Example:\n";
    ss << "  " << program << " --port 9999 --no-default-sources --journal tor=tor --file nginx=/var/log/nginx/access.log\n";
    return ss.str();
}

} // namespace cerberus_dash
