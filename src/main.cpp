#include "agent_client.hpp"
#include "app_config.hpp"
#include "auth_handshake.hpp"
#include "console.hpp"
#include "reconnect.hpp"
#include "session_manager.hpp"
#include "session_registry.hpp"
#include "signal_handler.hpp"
#include "tls_wrapper.hpp"
#include "utils.hpp"
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <thread>

namespace {
    bool ensure_certificate(ListenerConfig& listener) {
        auto file_exists = [](const std::string& p) { return !p.empty() && std::filesystem::exists(std::filesystem::path(p)); };
        if (listener.cert_path.empty()) listener.cert_path = "cert.pem";
        if (listener.key_path.empty()) listener.key_path = "key.pem";
        if (file_exists(listener.cert_path) && file_exists(listener.key_path)) {
            return true;
        }

        std::string cmd;
        if (listener.key_type == "ecdsa") {
            cmd = std::string("openssl ecparam -name prime256v1 -genkey -noout -out ") + listener.key_path +
                  std::string(" && openssl req -x509 -new -key ") + listener.key_path + std::string(" -out ") + listener.cert_path +
                  std::string(" -days 365 -nodes -subj \"/CN=localhost\"");
        } else {
            cmd = std::string("openssl req -x509 -newkey rsa:2048 -keyout ") + listener.key_path + std::string(" -out ") + listener.cert_path +
                  std::string(" -days 365 -nodes -subj \"/CN=localhost\"");
        }
        LOG_INFO("Generating %s certificate %s", listener.key_type.c_str(), listener.cert_path.c_str());
        int rc = std::system(cmd.c_str());
        if (rc != 0) {
            LOG_ERROR("certificate generation failed (exit status %d)", rc);
            return false;
        }
        return true;
    }

    RegistryOptions registry_options(const TuningConfig& tuning) {
        RegistryOptions options;
        options.max_buffer_size = tuning.max_buffer_size;
        options.send_timeout_ms = tuning.response_timeout * 1000;
        options.read_timeout_ms = tuning.read_timeout * 1000;
        return options;
    }

    int run_listener(AppConfig& config) {
        if (config.listener.auto_cert && !ensure_certificate(config.listener)) {
            return 1;
        }

        std::string fingerprint = TLSWrapper::file_fingerprint(config.listener.cert_path);
        if (fingerprint.empty()) {
            LOG_ERROR("Cannot read certificate %s", config.listener.cert_path.c_str());
            return 1;
        }
        LOG_INFO("Certificate SHA-256 fingerprint: %s", fingerprint.c_str());

        std::string secret;
        if (config.listener.shared_secret_auth) {
            if (!generate_random_hex(32, secret)) {
                return 1;
            }
            LOG_INFO("Shared-secret authentication enabled");
            std::cout << "Agents must connect with:\n  --connect <this-host>:" << config.listener.port
                      << " --shared-secret " << secret << " --cert-fingerprint " << fingerprint << "\n";
        }

        SessionRegistry registry(registry_options(config.tuning));
        SessionManager manager(config, registry, secret);
        if (!manager.start_listening()) {
            return 1;
        }
        LOG_INFO("Listening on %s:%d", config.listener.bind_interface.c_str(), manager.port());

        Console console(registry, config.tuning, std::cin, std::cout);
        console.run();

        manager.stop();
        return 0;
    }

    int run_agent(const AppConfig& config) {
        std::string agent_id;
        if (!generate_random_hex(8, agent_id)) {
            return 1;
        }

        RetryPolicy policy;
        policy.max_retries = config.agent.max_retries;

        auto factory = [&config, &agent_id]() -> std::unique_ptr<AgentLink> {
            return std::make_unique<AgentClient>(config, agent_id);
        };
        auto sleep_fn = [](std::chrono::seconds delay) {
            auto until = std::chrono::steady_clock::now() + delay;
            while (std::chrono::steady_clock::now() < until) {
                if (shutdown_requested()) {
                    return false;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
            }
            return !shutdown_requested();
        };

        int attempts = connect_with_retry(policy, factory, sleep_fn);
        LOG_INFO("Agent stopped after %d connection attempts", attempts);
        return 0;
    }
}

int main(int argc, char* argv[]) {
    AppConfig config;
    std::string error;
    if (!load_config(argc, argv, config, error)) {
        std::cerr << "Error: " << error << "\n\n" << usage_text(argv[0]);
        return 1;
    }
    if (config.show_help) {
        std::cout << usage_text(argv[0]);
        return 0;
    }

    initialize_logging(config.log_file, config.debug);
    setup_signal_handlers();

    if (config.mode == "listen") {
        return run_listener(config);
    }
    return run_agent(config);
}
