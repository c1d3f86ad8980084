#pragma once

#include <string>

#define LOG_DEBUG(fmt, ...) log_message(LogLevel::DEBUG, fmt, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...) log_message(LogLevel::INFO, fmt, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) log_message(LogLevel::ERROR, fmt, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...) log_message(LogLevel::WARN, fmt, ##__VA_ARGS__)

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR
};

void log_message(LogLevel level, const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 2, 3)))
#endif
    ;

std::string get_timestamp();

// Mirrors log lines into `path` (append mode) when non-empty.
// `debug` enables LOG_DEBUG output.
void initialize_logging(const std::string& path, bool debug);

std::string error_to_string(int errnum);

std::string to_lower(const std::string& s);
std::string trim(const std::string& s);
bool starts_with(const std::string& s, const std::string& prefix);
