#include "log_normalizer.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace cerberus_dash {

namespace {

bool contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

} // namespace

std::string to_lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n\f\v";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

Level classify_level(const std::string& line) {
    std::string lower = to_lower(line);

    if (contains(lower, "error") || contains(lower, "failed") || contains(lower, "fatal")) {
        return Level::Error;
    }
    // "warning" contains "warn", kept for parity with the keyword list
    if (contains(lower, "warn") || contains(lower, "warning")) {
        return Level::Warn;
    }
    if (contains(lower, "debug") || contains(lower, "trace")) {
        return Level::Debug;
    }
    return Level::Info;
}

std::optional<std::string> extract_time(const std::string& line) {
    if (line.size() < 8) return std::nullopt;

    for (size_t i = 0; i + 8 <= line.size(); ++i) {
        if (is_digit(line[i]) && is_digit(line[i + 1]) && line[i + 2] == ':' &&
            is_digit(line[i + 3]) && is_digit(line[i + 4]) && line[i + 5] == ':' &&
            is_digit(line[i + 6]) && is_digit(line[i + 7])) {
            return line.substr(i, 8);
        }
    }
    return std::nullopt;
}

std::string current_time_string() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&t, &tm);

    std::ostringstream ss;
    ss << std::put_time(&tm, "%H:%M:%S");
    return ss.str();
}

LogEntry normalize(const std::string& raw_line, const std::string& source_name) {
    LogEntry entry;
    auto time = extract_time(raw_line);
    entry.time = time ? *time : current_time_string();
    entry.level = classify_level(raw_line);
    entry.source = source_name;
    entry.message = trim(raw_line);
    return entry;
}

} // namespace cerberus_dash
