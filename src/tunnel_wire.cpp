#include "tunnel_wire.hpp"

#include <cerrno>
#include <poll.h>
#include <sys/socket.h>

namespace tunnel_wire {

namespace {
    bool next_word(const std::string& line, size_t& pos, std::string& word) {
        size_t end = line.find(' ', pos);
        if (end == std::string::npos) {
            end = line.size();
        }
        if (end == pos) {
            return false;
        }
        word = line.substr(pos, end - pos);
        pos = end < line.size() ? end + 1 : end;
        return true;
    }
}

bool parse_line(const std::string& line, TunnelLine& out) {
    size_t pos = 0;
    TunnelLine parsed;
    if (!next_word(line, pos, parsed.command) || !next_word(line, pos, parsed.tunnel_id) ||
        !next_word(line, pos, parsed.conn_id)) {
        return false;
    }
    parsed.payload = line.substr(pos);
    out = std::move(parsed);
    return true;
}

std::string build_line(const char* command, const std::string& tunnel_id, const std::string& conn_id,
                       const std::string& payload) {
    std::string line = std::string(command) + " " + tunnel_id + " " + conn_id;
    if (!payload.empty()) {
        line += " " + payload;
    }
    return line;
}

bool write_fd_all(int fd, const uint8_t* data, size_t len, int timeout_ms) {
    size_t off = 0;
    while (off < len) {
        ssize_t n = ::send(fd, data + off, len - off, MSG_NOSIGNAL | MSG_DONTWAIT);
        if (n > 0) {
            off += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            pollfd pfd{};
            pfd.fd = fd;
            pfd.events = POLLOUT;
            int rc = ::poll(&pfd, 1, timeout_ms);
            if (rc > 0) continue;
            if (rc < 0 && errno == EINTR) continue;
            return false;
        }
        return false;
    }
    return true;
}

}
