#ifndef APP_CONFIG_HPP
#define APP_CONFIG_HPP

#include "protocol.hpp"

#include <string>

struct TuningConfig {
    size_t buffer_size = protocol::BUFFER_SIZE;
    size_t max_buffer_size = protocol::MAX_BUFFER_SIZE;
    size_t chunk_size = protocol::CHUNK_SIZE;
    // seconds
    int read_timeout = protocol::READ_TIMEOUT;
    int response_timeout = protocol::RESPONSE_TIMEOUT;
    int command_timeout = protocol::COMMAND_TIMEOUT;
    int download_timeout = protocol::DOWNLOAD_TIMEOUT;
    int ping_interval = protocol::PING_INTERVAL;
};

struct ListenerConfig {
    int port = 0;
    std::string bind_interface = "0.0.0.0";
    bool shared_secret_auth = false;
    std::string cert_path;
    std::string key_path;
    bool auto_cert = false;
    std::string key_type = "ecdsa";
    bool tls_info = false;
};

struct AgentConfig {
    std::string target;
    int max_retries = 5; // 0 = retry forever
    std::string shared_secret;
    std::string cert_fingerprint;
};

struct AppConfig {
    std::string mode; // "listen" or "connect"
    ListenerConfig listener;
    AgentConfig agent;
    TuningConfig tuning;
    std::string config_file;
    std::string log_file;
    bool debug = false;
    bool show_help = false;

    bool validate(std::string& error) const;
};

// Exactly 64 hex characters (a 32-byte key).
bool is_valid_shared_secret(const std::string& secret);

// Defaults < --config file < command line < RELAYSHELL_* environment.
bool load_config(int argc, char* argv[], AppConfig& config, std::string& error);

bool apply_config_file(const std::string& path, AppConfig& config, std::string& error);
bool apply_command_line(int argc, char* argv[], AppConfig& config, std::string& error);
bool apply_environment(AppConfig& config, std::string& error);

std::string usage_text(const char* program);

#endif // APP_CONFIG_HPP
