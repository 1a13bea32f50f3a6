// common/utils/logging.cpp
#include "common/utils/logging.h"
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <mutex>

namespace ucop {

namespace {

LogLevel initial_level() {
    if (const char* env = std::getenv("UCOP_LOG_LEVEL")) {
        if (auto level = parse_log_level(env)) {
            return *level;
        }
    }
    return LogLevel::INFO;
}

std::atomic<LogLevel>& threshold() {
    static std::atomic<LogLevel> level{initial_level()};
    return level;
}

std::mutex& output_mutex() {
    static std::mutex m;
    return m;
}

} // namespace

const char* to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

std::optional<LogLevel> parse_log_level(std::string_view name) {
    std::string lower;
    for (char c : name) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warning" || lower == "warn") return LogLevel::WARNING;
    if (lower == "error") return LogLevel::ERROR;
    return std::nullopt;
}

void set_log_level(LogLevel level) {
    threshold().store(level);
}

LogLevel get_log_level() {
    return threshold().load();
}

void log_message(LogLevel level, std::string_view component, std::string_view message) {
    if (level < threshold().load()) {
        return;
    }
    std::lock_guard<std::mutex> lock(output_mutex());
    std::cerr << "[" << to_string(level) << "] [" << component << "] " << message << std::endl;
}

} // namespace ucop
