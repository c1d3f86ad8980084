#pragma once

#include "connection.hpp"
#include "tls_wrapper.hpp"

#include <atomic>
#include <memory>

// Connection over an accepted or dialed socket with an established TLS
// session. Owns the socket; the destructor sends close_notify and closes it.
class TLSConnection : public Connection {
public:
    TLSConnection(intptr_t fd, std::unique_ptr<TLSWrapper> tls, std::string peer_address);
    ~TLSConnection() override;

    IoStatus write_all(const void* buf, size_t len, int timeout_ms) override;
    IoStatus read_some(void* buf, size_t len, size_t& n, int timeout_ms) override;
    void shutdown() override;

    std::string peer_address() const override { return peer_address_; }
    std::string peer_fingerprint() override;

    TLSWrapper& tls() { return *tls_; }

    // Connects a socket to host:port (IPv4 or IPv6, names resolved).
    // Returns -1 and logs on failure.
    static intptr_t dial(const std::string& host, int port, int timeout_ms);
    static bool split_host_port(const std::string& target, std::string& host, int& port);

private:
    intptr_t fd_;
    std::unique_ptr<TLSWrapper> tls_;
    std::string peer_address_;
    std::atomic<bool> shut_down_{false};
};
