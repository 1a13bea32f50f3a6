#ifndef UCOP_COMMON_UTILS_LOGGING_H
#define UCOP_COMMON_UTILS_LOGGING_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ucop {

enum class LogLevel : uint8_t {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

const char* to_string(LogLevel level);
std::optional<LogLevel> parse_log_level(std::string_view name);

// Process-wide threshold; starts from UCOP_LOG_LEVEL (default info)
void set_log_level(LogLevel level);
LogLevel get_log_level();

// Writes "[LEVEL] [component] message" to std::cerr
void log_message(LogLevel level, std::string_view component, std::string_view message);

inline void log_debug(std::string_view component, std::string_view message) {
    log_message(LogLevel::DEBUG, component, message);
}
inline void log_info(std::string_view component, std::string_view message) {
    log_message(LogLevel::INFO, component, message);
}
inline void log_warning(std::string_view component, std::string_view message) {
    log_message(LogLevel::WARNING, component, message);
}
inline void log_error(std::string_view component, std::string_view message) {
    log_message(LogLevel::ERROR, component, message);
}

} // namespace ucop

#endif // UCOP_COMMON_UTILS_LOGGING_H
