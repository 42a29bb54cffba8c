#pragma once

#include "log_entry.hpp"
#include <optional>
#include <string>

namespace cerberus_dash {

// Level from keyword substrings, case-insensitive. Priority:
// error/failed/fatal > warn/warning > debug/trace > info.
Level classify_level(const std::string& line);

// First HH:MM:SS found anywhere in the line.
std::optional<std::string> extract_time(const std::string& line);

// Local wall-clock time formatted as HH:MM:SS.
std::string current_time_string();

LogEntry normalize(const std::string& raw_line, const std::string& source_name);

std::string to_lower(const std::string& s);
std::string trim(const std::string& s);

} // namespace cerberus_dash
