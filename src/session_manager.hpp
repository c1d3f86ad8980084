#pragma once

#include "app_config.hpp"
#include "listener.hpp"
#include "session_registry.hpp"

#include <atomic>
#include <cstdint>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

// Listener side server: accepts agents, runs the TLS and auth handshakes on a
// worker per connection, admits them into the registry and keeps them alive.
class SessionManager {
public:
    SessionManager(const AppConfig& config, SessionRegistry& registry, const std::string& shared_secret);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    bool start_listening();
    void stop();

    int port() const;

private:
    void accept_loop();
    void handle_connection(intptr_t fd, const std::string& peer, uint64_t handler_id);
    void keepalive_loop();

    void track_handshake(int fd);
    void untrack_handshake(int fd);
    void reap_handlers();

    AppConfig config;
    SessionRegistry& registry_;
    std::string shared_secret_;

    std::unique_ptr<Listener> listener;
    std::atomic<bool> running_{false};
    std::thread accept_thread_;
    std::thread keepalive_thread_;

    std::mutex stop_mutex_;
    std::condition_variable stop_cv_;

    // Connections still in handshake; shut down on stop() so workers return.
    // The mutex also orders admission against stop().
    std::mutex handshake_mutex_;
    std::set<int> handshake_fds_;

    // One worker per accepted connection; finished ones are joined by the
    // accept loop, the rest by stop().
    std::map<uint64_t, std::thread> handlers_;
    std::vector<uint64_t> finished_handlers_;
    uint64_t next_handler_ = 0;
};
