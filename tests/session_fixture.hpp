/**
 * @file session_fixture.hpp
 * @brief Registry plus the worker threads serving its in-memory sessions.
 *
 * Raw sessions hand the agent end back to the test; agent sessions are
 * driven by a real AgentClient command loop.
 */

#pragma once

#include "agent_client.hpp"
#include "app_config.hpp"
#include "memory_connection.hpp"
#include "session_registry.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

inline RegistryOptions fast_registry_options() {
    RegistryOptions options;
    options.read_timeout_ms = 100;
    options.send_timeout_ms = 1000;
    options.pty_enter_timeout_ms = 5000;
    return options;
}

inline AppConfig agent_test_config() {
    AppConfig config;
    config.mode = "connect";
    config.agent.target = "listener:4444";
    return config;
}

class SessionFixture {
public:
    explicit SessionFixture(const RegistryOptions& options = fast_registry_options()) : registry(options) {}

    ~SessionFixture() {
        registry.close_all(2000);
        for (auto& t : threads_) {
            if (t.joinable()) t.join();
        }
    }

    SessionFixture(const SessionFixture&) = delete;
    SessionFixture& operator=(const SessionFixture&) = delete;

    // Listener end admitted and served; returns the agent end.
    std::unique_ptr<MemoryConnection> admit_raw(const std::string& address) {
        auto pair = make_connection_pair(address);
        SessionHandle session = registry.admit(std::move(pair.first));
        threads_.emplace_back([this, session]() { registry.serve(session); });
        return std::move(pair.second);
    }

    bool admit_agent(const std::string& address, const std::string& agent_id,
                     const AppConfig& config = agent_test_config()) {
        auto pair = make_connection_pair(address);
        auto client = std::make_shared<AgentClient>(config, agent_id);
        if (!client->attach(std::move(pair.second))) {
            return false;
        }
        SessionHandle session = registry.admit(std::move(pair.first));
        threads_.emplace_back([this, session]() { registry.serve(session); });
        threads_.emplace_back([client]() {
            client->handle_commands();
            client->close();
        });
        return true;
    }

    bool wait_for_identity(const std::string& address, int timeout_ms = 5000) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
        while (std::chrono::steady_clock::now() < deadline) {
            if (!registry.identifier(address).empty()) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        return false;
    }

    SessionRegistry registry;

private:
    std::vector<std::thread> threads_;
};
