#pragma once

#include <cstddef>
#include <string>

enum class IoStatus {
    OK,
    TIMEOUT,
    CLOSED,
    ERROR
};

const char* io_status_name(IoStatus status);

// Byte-stream capability shared by the TLS transport and in-memory doubles.
// write_all and read_some may be called concurrently from two threads;
// shutdown() may be called from any thread and wakes blocked callers.
class Connection {
public:
    virtual ~Connection() = default;

    virtual IoStatus write_all(const void* buf, size_t len, int timeout_ms) = 0;
    // Reads at least one byte unless the status is not OK.
    virtual IoStatus read_some(void* buf, size_t len, size_t& n, int timeout_ms) = 0;
    virtual void shutdown() = 0;

    virtual std::string peer_address() const = 0;
    // Lowercase hex SHA-256 of the peer certificate, empty if there is none.
    virtual std::string peer_fingerprint() = 0;
};
