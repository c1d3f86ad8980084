#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace tunnel_wire {

// Raw bytes read from a tunnelled socket per TUNNEL_DATA line.
constexpr size_t READ_CHUNK = 32 * 1024;

// "<command> <tunnel id> <connection id>[ <payload>]"
struct TunnelLine {
    std::string command;
    std::string tunnel_id;
    std::string conn_id;
    std::string payload; // target for TUNNEL_OPEN, gzip-hex for TUNNEL_DATA
};

bool parse_line(const std::string& line, TunnelLine& out);
std::string build_line(const char* command, const std::string& tunnel_id, const std::string& conn_id,
                       const std::string& payload = std::string());

// Writes all of `data` to a blocking or non-blocking socket, waiting at most
// `timeout_ms` for each stall.
bool write_fd_all(int fd, const uint8_t* data, size_t len, int timeout_ms);

}
