#include "listener.hpp"
#include "utils.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace {
    std::string format_peer(const sockaddr_storage& addr) {
        char host[NI_MAXHOST] = {0};
        char serv[NI_MAXSERV] = {0};
        socklen_t len = addr.ss_family == AF_INET6 ? sizeof(sockaddr_in6) : sizeof(sockaddr_in);
        if (getnameinfo(reinterpret_cast<const sockaddr*>(&addr), len, host, sizeof(host), serv, sizeof(serv),
                        NI_NUMERICHOST | NI_NUMERICSERV) != 0) {
            return "unknown";
        }
        if (addr.ss_family == AF_INET6) {
            return std::string("[") + host + "]:" + serv;
        }
        return std::string(host) + ":" + serv;
    }
}

Listener::Listener(const std::string& bind_interface, int port) : interface_(bind_interface), port_(port) {}

Listener::~Listener() {
    if (listen_fd_ != -1) {
        close(static_cast<int>(listen_fd_));
    }
}

bool Listener::start() {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE | AI_NUMERICSERV;
    addrinfo* res = nullptr;
    std::string port_str = std::to_string(port_);
    const char* node = interface_.empty() ? nullptr : interface_.c_str();
    int gai = getaddrinfo(node, port_str.c_str(), &hints, &res);
    if (gai != 0 || res == nullptr) {
        LOG_ERROR("cannot resolve bind address %s: %s", interface_.c_str(), gai_strerror(gai));
        return false;
    }

    int fd = socket(res->ai_family, res->ai_socktype | SOCK_CLOEXEC, res->ai_protocol);
    if (fd < 0) {
        LOG_ERROR("socket() failed: %s", error_to_string(errno).c_str());
        freeaddrinfo(res);
        return false;
    }
    listen_fd_ = fd;

    int opt = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        LOG_ERROR("setsockopt() failed: %s", error_to_string(errno).c_str());
        freeaddrinfo(res);
        return false;
    }

    if (bind(fd, res->ai_addr, res->ai_addrlen) < 0) {
        LOG_ERROR("bind() to %s:%d failed: %s", interface_.c_str(), port_, error_to_string(errno).c_str());
        freeaddrinfo(res);
        return false;
    }
    freeaddrinfo(res);

    if (listen(fd, SOMAXCONN) < 0) {
        LOG_ERROR("listen() failed: %s", error_to_string(errno).c_str());
        return false;
    }

    LOG_INFO("Listening on %s:%d", interface_.c_str(), bound_port());
    return true;
}

int Listener::bound_port() const {
    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    if (listen_fd_ < 0 || getsockname(static_cast<int>(listen_fd_), reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
        return port_;
    }
    if (addr.ss_family == AF_INET6) {
        return ntohs(reinterpret_cast<sockaddr_in6*>(&addr)->sin6_port);
    }
    return ntohs(reinterpret_cast<sockaddr_in*>(&addr)->sin_port);
}

intptr_t Listener::accept_connection(std::string& peer) {
    while (!stopped_.load()) {
        pollfd pfd{};
        pfd.fd = static_cast<int>(listen_fd_);
        pfd.events = POLLIN;
        int pr = poll(&pfd, 1, 500);
        if (pr < 0) {
            if (errno == EINTR) continue;
            LOG_ERROR("poll() on listening socket failed: %s", error_to_string(errno).c_str());
            return -1;
        }
        if (pr == 0) {
            continue;
        }

        sockaddr_storage cli_addr{};
        socklen_t clilen = sizeof(cli_addr);
        int new_fd = accept4(static_cast<int>(listen_fd_), reinterpret_cast<sockaddr*>(&cli_addr), &clilen, SOCK_CLOEXEC);
        if (new_fd < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == ECONNABORTED) continue;
            LOG_ERROR("accept() failed: %s", error_to_string(errno).c_str());
            return -1;
        }
        peer = format_peer(cli_addr);
        return new_fd;
    }
    return -1;
}

void Listener::stop() {
    stopped_.store(true);
}
