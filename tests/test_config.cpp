/**
 * @file test_config.cpp
 * @brief Unit tests for configuration loading and validation.
 *
 * Covers shared-secret validation, the file < command line < environment
 * precedence, and the listener/agent validation rules.
 */

#include "app_config.hpp"
#include "test_framework.hpp"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>
#include <unistd.h>
#include <vector>

namespace {
    const std::string kSecret(64, 'a');

    // Owns mutable copies of the arguments for load_config().
    struct Args {
        explicit Args(std::vector<std::string> a) : storage(std::move(a)) {
            for (auto& s : storage) ptrs.push_back(&s[0]);
            ptrs.push_back(nullptr);
        }
        int argc() const { return static_cast<int>(storage.size()); }
        char** argv() { return ptrs.data(); }

        std::vector<std::string> storage;
        std::vector<char*> ptrs;
    };

    void clear_environment() {
        const char* names[] = {"RELAYSHELL_PORT", "RELAYSHELL_INTERFACE", "RELAYSHELL_SHARED_SECRET_AUTH",
                               "RELAYSHELL_TARGET", "RELAYSHELL_MAX_RETRIES", "RELAYSHELL_SHARED_SECRET",
                               "RELAYSHELL_CERT_FINGERPRINT", "RELAYSHELL_BUFFER_SIZE", "RELAYSHELL_MAX_BUFFER_SIZE",
                               "RELAYSHELL_CHUNK_SIZE", "RELAYSHELL_READ_TIMEOUT", "RELAYSHELL_RESPONSE_TIMEOUT",
                               "RELAYSHELL_COMMAND_TIMEOUT", "RELAYSHELL_DOWNLOAD_TIMEOUT", "RELAYSHELL_PING_INTERVAL"};
        for (const char* n : names) unsetenv(n);
    }

    std::string write_temp_file(const std::string& content) {
        char path[] = "/tmp/relayshell_config_XXXXXX";
        int fd = mkstemp(path);
        if (fd < 0) return std::string();
        close(fd);
        std::ofstream out(path);
        out << content;
        return path;
    }
}

TEST(test_shared_secret_validation) {
    ASSERT_TRUE(is_valid_shared_secret(kSecret), "64 hex chars");
    ASSERT_TRUE(is_valid_shared_secret(std::string(32, 'A') + std::string(32, '0')), "uppercase hex");
    ASSERT_FALSE(is_valid_shared_secret(std::string(63, 'a')), "63 chars");
    ASSERT_FALSE(is_valid_shared_secret(std::string(65, 'a')), "65 chars");
    ASSERT_FALSE(is_valid_shared_secret(std::string(63, 'a') + "g"), "non-hex char");
    ASSERT_FALSE(is_valid_shared_secret(""), "empty");
    PASS("Shared secret must be exactly 64 hex characters");
}

TEST(test_defaults) {
    clear_environment();
    AppConfig config;
    std::string error;
    Args args({"relayshell", "--connect", "10.0.0.1:4444"});
    ASSERT_TRUE(load_config(args.argc(), args.argv(), config, error), "minimal agent config: " + error);
    ASSERT_EQ(config.mode, std::string("connect"), "mode");
    ASSERT_EQ(config.agent.max_retries, 5, "default retries");
    ASSERT_EQ(config.tuning.chunk_size, protocol::CHUNK_SIZE, "default chunk size");
    ASSERT_EQ(config.tuning.command_timeout, protocol::COMMAND_TIMEOUT, "default command timeout");
    PASS("Defaults applied for a minimal agent command line");
}

TEST(test_listener_requires_certificate) {
    clear_environment();
    AppConfig config;
    std::string error;
    Args args({"relayshell", "--listen", "--port", "4444"});
    ASSERT_FALSE(load_config(args.argc(), args.argv(), config, error), "no cert or auto-cert");

    AppConfig auto_config;
    Args auto_args({"relayshell", "--listen", "--port", "4444", "--auto-cert"});
    ASSERT_TRUE(load_config(auto_args.argc(), auto_args.argv(), auto_config, error), "auto-cert: " + error);
    PASS("Listener needs --cert/--key or --auto-cert");
}

TEST(test_invalid_values_rejected) {
    clear_environment();
    std::string error;
    {
        AppConfig config;
        Args args({"relayshell", "--listen", "--port", "70000", "--auto-cert"});
        ASSERT_FALSE(load_config(args.argc(), args.argv(), config, error), "port out of range");
    }
    {
        AppConfig config;
        Args args({"relayshell", "--listen", "--port", "abc", "--auto-cert"});
        ASSERT_FALSE(load_config(args.argc(), args.argv(), config, error), "non-numeric port");
    }
    {
        AppConfig config;
        Args args({"relayshell", "--connect", "h:1", "--shared-secret", "1234"});
        ASSERT_FALSE(load_config(args.argc(), args.argv(), config, error), "short secret");
    }
    {
        AppConfig config;
        Args args({"relayshell", "--connect", "h:1", "--chunk-size", "2048", "--max-buffer-size", "1024",
                   "--buffer-size", "512"});
        ASSERT_FALSE(load_config(args.argc(), args.argv(), config, error), "chunk larger than max buffer");
    }
    {
        AppConfig config;
        Args args({"relayshell", "--bogus"});
        ASSERT_FALSE(load_config(args.argc(), args.argv(), config, error), "unknown flag");
    }
    {
        AppConfig config;
        Args args({"relayshell", "--port", "1"});
        ASSERT_FALSE(load_config(args.argc(), args.argv(), config, error), "no mode");
    }
    PASS("Malformed values and missing mode rejected");
}

TEST(test_fingerprint_normalization) {
    clear_environment();
    std::string fp;
    for (int i = 0; i < 32; ++i) {
        if (i) fp += ":";
        fp += "AB";
    }
    AppConfig config;
    std::string error;
    Args args({"relayshell", "--connect", "h:1", "--cert-fingerprint", fp});
    ASSERT_TRUE(load_config(args.argc(), args.argv(), config, error), "colon form accepted: " + error);

    AppConfig bad;
    Args bad_args({"relayshell", "--connect", "h:1", "--cert-fingerprint", "abcd"});
    ASSERT_FALSE(load_config(bad_args.argc(), bad_args.argv(), bad, error), "short fingerprint");
    PASS("Fingerprint accepted with colons, rejected when short");
}

TEST(test_precedence) {
    clear_environment();
    std::string path = write_temp_file(
        "{\"port\": 1111, \"interface\": \"127.0.0.1\", \"auto_cert\": true, \"command_timeout\": 60}");
    ASSERT_FALSE(path.empty(), "temp file created");

    AppConfig config;
    std::string error;
    Args args({"relayshell", "--listen", "--config", path, "--port", "2222"});
    ASSERT_TRUE(load_config(args.argc(), args.argv(), config, error), "file + CLI: " + error);
    ASSERT_EQ(config.listener.port, 2222, "command line beats file");
    ASSERT_EQ(config.listener.bind_interface, std::string("127.0.0.1"), "file value kept");
    ASSERT_EQ(config.tuning.command_timeout, 60, "file timeout kept");

    setenv("RELAYSHELL_PORT", "3333", 1);
    AppConfig env_config;
    Args env_args({"relayshell", "--listen", "--config", path, "--port", "2222"});
    bool ok = load_config(env_args.argc(), env_args.argv(), env_config, error);
    unsetenv("RELAYSHELL_PORT");
    std::remove(path.c_str());
    ASSERT_TRUE(ok, "file + CLI + env: " + error);
    ASSERT_EQ(env_config.listener.port, 3333, "environment beats command line");
    PASS("Environment > command line > config file > defaults");
}

TEST(test_bad_environment_value) {
    clear_environment();
    setenv("RELAYSHELL_MAX_RETRIES", "many", 1);
    AppConfig config;
    std::string error;
    Args args({"relayshell", "--connect", "h:1"});
    bool ok = load_config(args.argc(), args.argv(), config, error);
    unsetenv("RELAYSHELL_MAX_RETRIES");
    ASSERT_FALSE(ok, "non-numeric env value");
    ASSERT_TRUE(error.find("RELAYSHELL_MAX_RETRIES") != std::string::npos, "error names the variable");
    PASS("Malformed environment value reported by name");
}

TEST(test_bad_config_file) {
    clear_environment();
    std::string path = write_temp_file("{ not json");
    AppConfig config;
    std::string error;
    bool ok = apply_config_file(path, config, error);
    std::remove(path.c_str());
    ASSERT_FALSE(ok, "invalid JSON");

    std::string unknown = write_temp_file("{\"colour\": \"blue\"}");
    ok = apply_config_file(unknown, config, error);
    std::remove(unknown.c_str());
    ASSERT_FALSE(ok, "unknown key");

    ASSERT_FALSE(apply_config_file("/nonexistent/relayshell.json", config, error), "missing file");
    PASS("Broken config files rejected");
}

TEST(test_help_skips_validation) {
    clear_environment();
    AppConfig config;
    std::string error;
    Args args({"relayshell", "--help"});
    ASSERT_TRUE(load_config(args.argc(), args.argv(), config, error), "help without mode");
    ASSERT_TRUE(config.show_help, "show_help set");
    ASSERT_FALSE(usage_text("relayshell").empty(), "usage text");
    PASS("--help bypasses validation");
}

int main() {
    std::cout << "==========================================" << std::endl;
    std::cout << " Configuration Unit Tests" << std::endl;
    std::cout << "==========================================" << std::endl;

    test_shared_secret_validation();
    test_defaults();
    test_listener_requires_certificate();
    test_invalid_values_rejected();
    test_fingerprint_normalization();
    test_precedence();
    test_bad_environment_value();
    test_bad_config_file();
    test_help_skips_validation();

    return test_summary("Configuration");
}
