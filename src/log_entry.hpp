#pragma once

#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace cerberus_dash {

// Serialize for the wire. Bytes that are not valid UTF-8 become U+FFFD
// instead of throwing, so a bad source line can still be served.
inline std::string dump_json(const nlohmann::json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

enum class Level : int {
    Info = 0,
    Warn = 1,
    Error = 2,
    Debug = 3
};

inline std::string level_to_string(Level l) {
    switch (l) {
        case Level::Info: return "info";
        case Level::Warn: return "warn";
        case Level::Error: return "error";
        case Level::Debug: return "debug";
        default: return "info";
    }
}

inline Level string_to_level(const std::string& s) {
    if (s == "warn") return Level::Warn;
    if (s == "error") return Level::Error;
    if (s == "debug") return Level::Debug;
    return Level::Info; // Default
}

struct LogEntry {
    std::string time;                 // Wall-clock "HH:MM:SS"
    Level level = Level::Info;
    std::string source;               // e.g. "tor", "nginx", "dashboard"
    std::string message;

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["time"] = time;
        j["level"] = level_to_string(level);
        j["source"] = source;
        j["message"] = message;
        return j;
    }

    static LogEntry from_json(const nlohmann::json& j) {
        LogEntry entry;
        entry.time = j.value("time", "");
        entry.level = string_to_level(j.value("level", "info"));
        entry.source = j.value("source", "unknown");
        entry.message = j.value("message", "");
        return entry;
    }
};

enum class SourceKind {
    Journal,
    File
};

inline std::string source_kind_to_string(SourceKind k) {
    return k == SourceKind::Journal ? "journal" : "file";
}

struct SourceDescriptor {
    std::string name;       // Tag carried by every entry from this source
    SourceKind kind = SourceKind::Journal;
    std::string target;     // Unit name or file path

    nlohmann::json to_json() const {
        return {
            {"name", name},
            {"kind", source_kind_to_string(kind)},
            {"target", target}
        };
    }
};

struct Stats {
    uint64_t requests = 0;
    uint64_t blocked = 0;
    uint64_t captchas = 0;

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["requests"] = requests;
        j["blocked"] = blocked;
        j["captchas"] = captchas;
        return j;
    }
};

} // namespace cerberus_dash
