#include "tls_connection.hpp"
#include "utils.hpp"

#include <cerrno>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <stdexcept>

TLSConnection::TLSConnection(intptr_t fd, std::unique_ptr<TLSWrapper> tls, std::string peer_address)
    : fd_(fd), tls_(std::move(tls)), peer_address_(std::move(peer_address)) {}

TLSConnection::~TLSConnection() {
    if (!shut_down_.load()) {
        tls_->close_notify();
    }
    tls_.reset();
    if (fd_ >= 0) {
        ::close(static_cast<int>(fd_));
    }
}

IoStatus TLSConnection::write_all(const void* buf, size_t len, int timeout_ms) {
    if (shut_down_.load()) return IoStatus::CLOSED;
    return tls_->tls_write_all(buf, len, timeout_ms);
}

IoStatus TLSConnection::read_some(void* buf, size_t len, size_t& n, int timeout_ms) {
    n = 0;
    if (shut_down_.load()) return IoStatus::CLOSED;
    IoStatus st = tls_->tls_read_some(buf, len, n, timeout_ms);
    if (st != IoStatus::OK && shut_down_.load()) return IoStatus::CLOSED;
    return st;
}

void TLSConnection::shutdown() {
    if (shut_down_.exchange(true)) {
        return;
    }
    // Unblocks any poll() in the reader; the TLS context itself is torn down
    // by the destructor once no thread uses it.
    ::shutdown(static_cast<int>(fd_), SHUT_RDWR);
}

std::string TLSConnection::peer_fingerprint() {
    return tls_->get_peer_fingerprint();
}

bool TLSConnection::split_host_port(const std::string& target, std::string& host, int& port) {
    size_t colon = target.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 >= target.size()) {
        return false;
    }
    host = target.substr(0, colon);
    if (host.size() > 2 && host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }
    try {
        size_t used = 0;
        port = std::stoi(target.substr(colon + 1), &used);
        if (used != target.size() - colon - 1) return false;
    } catch (const std::exception&) {
        return false;
    }
    return port > 0 && port <= 65535;
}

intptr_t TLSConnection::dial(const std::string& host, int port, int timeout_ms) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;
    addrinfo* res = nullptr;
    std::string port_str = std::to_string(port);
    int gai = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res);
    if (gai != 0 || res == nullptr) {
        LOG_ERROR("getaddrinfo failed for %s: %s", host.c_str(), gai_strerror(gai));
        return -1;
    }

    int s = -1;
    for (addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
        s = socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (s < 0) {
            continue;
        }
        int flags = fcntl(s, F_GETFL, 0);
        fcntl(s, F_SETFL, flags | O_NONBLOCK);

        int rc = connect(s, ai->ai_addr, ai->ai_addrlen);
        if (rc < 0 && errno == EINPROGRESS) {
            pollfd pfd{};
            pfd.fd = s;
            pfd.events = POLLOUT;
            rc = ::poll(&pfd, 1, timeout_ms);
            if (rc == 1) {
                int err = 0;
                socklen_t err_len = sizeof(err);
                getsockopt(s, SOL_SOCKET, SO_ERROR, &err, &err_len);
                rc = err == 0 ? 0 : -1;
                errno = err;
            } else {
                if (rc == 0) errno = ETIMEDOUT;
                rc = -1;
            }
        }
        if (rc == 0) {
            fcntl(s, F_SETFL, flags);
            break;
        }
        LOG_WARN("connect() to %s:%d failed: %s", host.c_str(), port, error_to_string(errno).c_str());
        ::close(s);
        s = -1;
    }
    freeaddrinfo(res);
    return s;
}
