#include "utils.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <fstream>
#include <system_error>

namespace {
    std::mutex g_log_mutex;
    std::ofstream g_log_file;
    std::atomic<bool> g_debug{false};

    const char* level_name(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO: return "INFO";
            case LogLevel::WARN: return "WARN";
            case LogLevel::ERROR: return "ERROR";
        }
        return "INFO";
    }
}

void log_message(LogLevel level, const char* fmt, ...) {
    if (level == LogLevel::DEBUG && !g_debug.load()) {
        return;
    }

    char buf[2048];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);

    std::string ts = get_timestamp();
    std::lock_guard<std::mutex> lock(g_log_mutex);
    fprintf(stderr, "[%s] [%s] %s\n", ts.c_str(), level_name(level), buf);
    if (g_log_file.is_open()) {
        g_log_file << "[" << ts << "] [" << level_name(level) << "] " << buf << "\n";
        g_log_file.flush();
    }
}

std::string get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf{};
    localtime_r(&in_time_t, &tm_buf);
    std::stringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%d %X");
    return ss.str();
}

void initialize_logging(const std::string& path, bool debug) {
    g_debug.store(debug);
    if (!path.empty()) {
        std::lock_guard<std::mutex> lock(g_log_mutex);
        g_log_file.open(path, std::ios::app);
        if (g_log_file) {
            g_log_file << "[" << get_timestamp() << "] [INFO] Logging initialized" << (debug ? " (debug)" : "") << "\n";
        } else {
            fprintf(stderr, "[%s] [WARN] cannot open log file %s\n", get_timestamp().c_str(), path.c_str());
        }
    }
}

std::string error_to_string(int errnum) {
    return std::system_category().message(errnum);
}

std::string to_lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}
