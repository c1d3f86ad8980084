#ifndef LISTENER_HPP
#define LISTENER_HPP

#include <atomic>
#include <cstdint>
#include <string>

class Listener {
public:
    Listener(const std::string& bind_interface, int port);
    ~Listener();

    Listener(const Listener&) = delete;
    Listener& operator=(const Listener&) = delete;

    bool start();
    // Blocks until a client connects or stop() is called; -1 when stopped or
    // on error. `peer` receives "host:port".
    intptr_t accept_connection(std::string& peer);
    void stop();

    // Port actually bound (useful with port 0).
    int bound_port() const;

private:
    std::string interface_;
    int port_;
    intptr_t listen_fd_ = -1;
    std::atomic<bool> stopped_{false};
};

#endif // LISTENER_HPP
