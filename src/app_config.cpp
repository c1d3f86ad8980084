#include "app_config.hpp"
#include "auth_handshake.hpp"
#include "utils.hpp"

#include "nlohmann/json.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <limits>

using json = nlohmann::json;

namespace {
    bool parse_long(const std::string& text, long long& out) {
        std::string t = trim(text);
        if (t.empty()) {
            return false;
        }
        errno = 0;
        char* end = nullptr;
        long long v = std::strtoll(t.c_str(), &end, 10);
        if (errno != 0 || end == nullptr || *end != '\0') {
            return false;
        }
        out = v;
        return true;
    }

    bool parse_int_value(const std::string& name, const std::string& text, int& out, std::string& error) {
        long long v = 0;
        if (!parse_long(text, v) || v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
            error = "invalid integer for " + name + ": '" + text + "'";
            return false;
        }
        out = static_cast<int>(v);
        return true;
    }

    bool parse_size_value(const std::string& name, const std::string& text, size_t& out, std::string& error) {
        long long v = 0;
        if (!parse_long(text, v) || v <= 0) {
            error = "invalid size for " + name + ": '" + text + "'";
            return false;
        }
        out = static_cast<size_t>(v);
        return true;
    }

    bool parse_bool_value(const std::string& name, const std::string& text, bool& out, std::string& error) {
        std::string t = to_lower(trim(text));
        if (t == "1" || t == "true" || t == "yes" || t == "on") {
            out = true;
            return true;
        }
        if (t == "0" || t == "false" || t == "no" || t == "off") {
            out = false;
            return true;
        }
        error = "invalid boolean for " + name + ": '" + text + "'";
        return false;
    }

    bool is_hex_string(const std::string& s) {
        for (char c : s) {
            if (!std::isxdigit(static_cast<unsigned char>(c))) {
                return false;
            }
        }
        return true;
    }

    // Settings shared by the JSON file and the environment, keyed by their
    // file name. Returns false with `error` set on a malformed value.
    bool apply_setting(const std::string& key, const std::string& value, AppConfig& config, std::string& error) {
        TuningConfig& t = config.tuning;
        if (key == "port") return parse_int_value(key, value, config.listener.port, error);
        if (key == "interface") { config.listener.bind_interface = value; return true; }
        if (key == "shared_secret_auth") return parse_bool_value(key, value, config.listener.shared_secret_auth, error);
        if (key == "target") { config.agent.target = value; return true; }
        if (key == "max_retries") return parse_int_value(key, value, config.agent.max_retries, error);
        if (key == "shared_secret") { config.agent.shared_secret = trim(value); return true; }
        if (key == "cert_fingerprint") { config.agent.cert_fingerprint = trim(value); return true; }
        if (key == "buffer_size") return parse_size_value(key, value, t.buffer_size, error);
        if (key == "max_buffer_size") return parse_size_value(key, value, t.max_buffer_size, error);
        if (key == "chunk_size") return parse_size_value(key, value, t.chunk_size, error);
        if (key == "read_timeout") return parse_int_value(key, value, t.read_timeout, error);
        if (key == "response_timeout") return parse_int_value(key, value, t.response_timeout, error);
        if (key == "command_timeout") return parse_int_value(key, value, t.command_timeout, error);
        if (key == "download_timeout") return parse_int_value(key, value, t.download_timeout, error);
        if (key == "ping_interval") return parse_int_value(key, value, t.ping_interval, error);
        if (key == "cert") { config.listener.cert_path = value; return true; }
        if (key == "key") { config.listener.key_path = value; return true; }
        if (key == "auto_cert") return parse_bool_value(key, value, config.listener.auto_cert, error);
        if (key == "log_file") { config.log_file = value; return true; }
        if (key == "debug") return parse_bool_value(key, value, config.debug, error);
        error = "unknown configuration key '" + key + "'";
        return false;
    }

    const struct {
        const char* env;
        const char* key;
    } kEnvironment[] = {
        {"RELAYSHELL_PORT", "port"},
        {"RELAYSHELL_INTERFACE", "interface"},
        {"RELAYSHELL_SHARED_SECRET_AUTH", "shared_secret_auth"},
        {"RELAYSHELL_TARGET", "target"},
        {"RELAYSHELL_MAX_RETRIES", "max_retries"},
        {"RELAYSHELL_SHARED_SECRET", "shared_secret"},
        {"RELAYSHELL_CERT_FINGERPRINT", "cert_fingerprint"},
        {"RELAYSHELL_BUFFER_SIZE", "buffer_size"},
        {"RELAYSHELL_MAX_BUFFER_SIZE", "max_buffer_size"},
        {"RELAYSHELL_CHUNK_SIZE", "chunk_size"},
        {"RELAYSHELL_READ_TIMEOUT", "read_timeout"},
        {"RELAYSHELL_RESPONSE_TIMEOUT", "response_timeout"},
        {"RELAYSHELL_COMMAND_TIMEOUT", "command_timeout"},
        {"RELAYSHELL_DOWNLOAD_TIMEOUT", "download_timeout"},
        {"RELAYSHELL_PING_INTERVAL", "ping_interval"},
    };
}

bool is_valid_shared_secret(const std::string& secret) {
    return secret.size() == 64 && is_hex_string(secret);
}

bool AppConfig::validate(std::string& error) const {
    if (mode != "listen" && mode != "connect") {
        error = "one of --listen or --connect is required";
        return false;
    }
    if (tuning.buffer_size == 0 || tuning.max_buffer_size == 0 || tuning.chunk_size == 0) {
        error = "buffer sizes must be positive";
        return false;
    }
    if (tuning.max_buffer_size < tuning.buffer_size) {
        error = "max_buffer_size must be at least buffer_size";
        return false;
    }
    if (tuning.chunk_size > tuning.max_buffer_size) {
        error = "chunk_size must not exceed max_buffer_size";
        return false;
    }
    if (tuning.read_timeout <= 0 || tuning.response_timeout <= 0 || tuning.command_timeout <= 0 ||
        tuning.download_timeout <= 0 || tuning.ping_interval <= 0) {
        error = "timeouts must be positive";
        return false;
    }

    if (mode == "listen") {
        if (listener.port < 1 || listener.port > 65535) {
            error = "port must be in 1..65535";
            return false;
        }
        if (trim(listener.bind_interface).empty()) {
            error = "interface must not be empty";
            return false;
        }
        if (!listener.auto_cert && (listener.cert_path.empty() || listener.key_path.empty())) {
            error = "--cert and --key are required unless --auto-cert is given";
            return false;
        }
        return true;
    }

    if (agent.target.empty()) {
        error = "target host:port is required";
        return false;
    }
    if (agent.max_retries < 0) {
        error = "max_retries must be >= 0";
        return false;
    }
    if (!agent.shared_secret.empty() && !is_valid_shared_secret(agent.shared_secret)) {
        error = "shared secret must be exactly 64 hex characters";
        return false;
    }
    if (!agent.cert_fingerprint.empty()) {
        std::string fp = normalize_fingerprint(agent.cert_fingerprint);
        if (fp.size() != 64 || !is_hex_string(fp)) {
            error = "certificate fingerprint must be a SHA-256 hex digest";
            return false;
        }
    }
    return true;
}

bool apply_config_file(const std::string& path, AppConfig& config, std::string& error) {
    std::ifstream in(path);
    if (!in) {
        error = "cannot open config file " + path;
        return false;
    }
    try {
        json j = json::parse(in);
        if (!j.is_object()) {
            error = "config file " + path + " must contain a JSON object";
            return false;
        }
        for (auto it = j.begin(); it != j.end(); ++it) {
            std::string value;
            if (it.value().is_string()) {
                value = it.value().get<std::string>();
            } else if (it.value().is_number_integer() || it.value().is_boolean()) {
                value = it.value().dump();
            } else {
                error = "unsupported value for '" + it.key() + "' in " + path;
                return false;
            }
            if (!apply_setting(it.key(), value, config, error)) {
                return false;
            }
        }
    } catch (const json::exception& e) {
        error = "cannot parse config file " + path + ": " + e.what();
        return false;
    }
    return true;
}

bool apply_command_line(int argc, char* argv[], AppConfig& config, std::string& error) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&](std::string& value) {
            if (i + 1 >= argc) {
                error = arg + " requires a value";
                return false;
            }
            value = argv[++i];
            return true;
        };
        std::string value;

        if (arg == "--listen") {
            config.mode = "listen";
        } else if (arg == "--connect") {
            if (!next(value)) return false;
            config.mode = "connect";
            config.agent.target = value;
        } else if (arg == "--port") {
            if (!next(value) || !parse_int_value(arg, value, config.listener.port, error)) return false;
        } else if (arg == "--interface") {
            if (!next(value)) return false;
            config.listener.bind_interface = value;
        } else if (arg == "--shared-secret-auth" || arg == "-s") {
            config.listener.shared_secret_auth = true;
        } else if (arg == "--cert") {
            if (!next(value)) return false;
            config.listener.cert_path = value;
        } else if (arg == "--key") {
            if (!next(value)) return false;
            config.listener.key_path = value;
        } else if (arg == "--auto-cert") {
            config.listener.auto_cert = true;
        } else if (arg == "--keytype") {
            if (!next(value)) return false;
            config.listener.key_type = value;
        } else if (arg == "--tls-info") {
            config.listener.tls_info = true;
        } else if (arg == "--retries") {
            if (!next(value) || !parse_int_value(arg, value, config.agent.max_retries, error)) return false;
        } else if (arg == "--shared-secret") {
            if (!next(value)) return false;
            config.agent.shared_secret = trim(value);
        } else if (arg == "--cert-fingerprint") {
            if (!next(value)) return false;
            config.agent.cert_fingerprint = trim(value);
        } else if (arg == "--buffer-size") {
            if (!next(value) || !parse_size_value(arg, value, config.tuning.buffer_size, error)) return false;
        } else if (arg == "--max-buffer-size") {
            if (!next(value) || !parse_size_value(arg, value, config.tuning.max_buffer_size, error)) return false;
        } else if (arg == "--chunk-size") {
            if (!next(value) || !parse_size_value(arg, value, config.tuning.chunk_size, error)) return false;
        } else if (arg == "--command-timeout") {
            if (!next(value) || !parse_int_value(arg, value, config.tuning.command_timeout, error)) return false;
        } else if (arg == "--download-timeout") {
            if (!next(value) || !parse_int_value(arg, value, config.tuning.download_timeout, error)) return false;
        } else if (arg == "--ping-interval") {
            if (!next(value) || !parse_int_value(arg, value, config.tuning.ping_interval, error)) return false;
        } else if (arg == "--config") {
            if (!next(value)) return false;
            config.config_file = value;
        } else if (arg == "--log-file") {
            if (!next(value)) return false;
            config.log_file = value;
        } else if (arg == "--debug") {
            config.debug = true;
        } else if (arg == "--help" || arg == "-h") {
            config.show_help = true;
        } else {
            error = "unknown argument '" + arg + "'";
            return false;
        }
    }
    return true;
}

bool apply_environment(AppConfig& config, std::string& error) {
    for (const auto& entry : kEnvironment) {
        const char* value = std::getenv(entry.env);
        if (value == nullptr || *value == '\0') {
            continue;
        }
        if (!apply_setting(entry.key, value, config, error)) {
            error = std::string(entry.env) + ": " + error;
            return false;
        }
    }
    return true;
}

bool load_config(int argc, char* argv[], AppConfig& config, std::string& error) {
    // The file sits below the command line, so find it first.
    AppConfig first_pass;
    if (!apply_command_line(argc, argv, first_pass, error)) {
        return false;
    }
    if (!first_pass.config_file.empty() && !apply_config_file(first_pass.config_file, config, error)) {
        return false;
    }
    if (!apply_command_line(argc, argv, config, error)) {
        return false;
    }
    if (config.show_help) {
        return true;
    }
    if (!apply_environment(config, error)) {
        return false;
    }
    return config.validate(error);
}

std::string usage_text(const char* program) {
    std::string p = program ? program : "relayshell";
    return "Usage:\n"
           "  " + p + " --listen --port N [--interface ADDR] (--cert FILE --key FILE | --auto-cert) [-s]\n"
           "  " + p + " --connect HOST:PORT [--shared-secret HEX] [--cert-fingerprint SHA256] [--retries N]\n"
           "\n"
           "Listener options:\n"
           "  --port N                 port to listen on\n"
           "  --interface ADDR         address to bind (default 0.0.0.0)\n"
           "  -s, --shared-secret-auth require agents to prove a generated shared secret\n"
           "  --cert FILE, --key FILE  PEM certificate and private key\n"
           "  --auto-cert              generate a self-signed pair with openssl when missing\n"
           "  --keytype ecdsa|rsa      key type for --auto-cert (default ecdsa)\n"
           "  --tls-info               log negotiated TLS version and cipher suite\n"
           "\n"
           "Agent options:\n"
           "  --retries N              give up after N failed attempts (0 = never, default 5)\n"
           "  --shared-secret HEX      64 hex characters printed by the listener\n"
           "  --cert-fingerprint FP    expected SHA-256 of the listener certificate\n"
           "\n"
           "Common options:\n"
           "  --buffer-size N, --max-buffer-size N, --chunk-size N\n"
           "  --command-timeout S, --download-timeout S, --ping-interval S\n"
           "  --config FILE            JSON file with any of the settings above\n"
           "  --log-file FILE          mirror log output to FILE\n"
           "  --debug                  enable debug logging\n"
           "\n"
           "Environment variables RELAYSHELL_* override every other source.\n";
}
