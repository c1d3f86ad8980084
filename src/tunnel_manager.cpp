#include "tunnel_manager.hpp"
#include "protocol.hpp"
#include "tunnel_wire.hpp"
#include "utils.hpp"
#include "wire_codec.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <chrono>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace {
    // SOCKS5 (RFC 1928), no-authentication CONNECT only.
    constexpr uint8_t SOCKS_VERSION = 0x05;
    constexpr uint8_t SOCKS_NO_AUTH = 0x00;
    constexpr uint8_t SOCKS_NO_ACCEPTABLE = 0xFF;
    constexpr uint8_t SOCKS_CMD_CONNECT = 0x01;
    constexpr uint8_t SOCKS_ATYP_IPV4 = 0x01;
    constexpr uint8_t SOCKS_ATYP_DOMAIN = 0x03;
    constexpr uint8_t SOCKS_ATYP_IPV6 = 0x04;
    constexpr uint8_t SOCKS_REP_SUCCESS = 0x00;
    constexpr uint8_t SOCKS_REP_HOST_UNREACHABLE = 0x04;
    constexpr uint8_t SOCKS_REP_CMD_UNSUPPORTED = 0x07;
    constexpr uint8_t SOCKS_REP_ATYP_UNSUPPORTED = 0x08;

    constexpr int SOCKS_HANDSHAKE_TIMEOUT_MS = 10000;
    constexpr int LOCAL_WRITE_TIMEOUT_MS = protocol::RESPONSE_TIMEOUT * 1000;

    bool read_exact(int fd, uint8_t* buf, size_t len, int timeout_ms) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
        size_t off = 0;
        while (off < len) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
            if (left.count() <= 0) {
                return false;
            }
            pollfd pfd{};
            pfd.fd = fd;
            pfd.events = POLLIN;
            int rc = ::poll(&pfd, 1, static_cast<int>(left.count()));
            if (rc < 0 && errno == EINTR) continue;
            if (rc <= 0) return false;
            ssize_t n = ::recv(fd, buf + off, len - off, 0);
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) return false;
            off += static_cast<size_t>(n);
        }
        return true;
    }

    bool send_socks_reply(int fd, uint8_t code) {
        const uint8_t reply[] = {SOCKS_VERSION, code, 0x00, SOCKS_ATYP_IPV4, 0, 0, 0, 0, 0, 0};
        return tunnel_wire::write_fd_all(fd, reply, sizeof(reply), SOCKS_HANDSHAKE_TIMEOUT_MS);
    }
}

const char* tunnel_kind_name(TunnelKind kind) {
    switch (kind) {
        case TunnelKind::FORWARD: return "forward";
        case TunnelKind::SOCKS: return "socks5";
    }
    return "unknown";
}

TunnelManager::TunnelManager(SessionRegistry& registry, const std::string& bind_interface)
    : registry_(registry), interface_(bind_interface) {
    registry_.set_tunnel_endpoint(this);
}

TunnelManager::~TunnelManager() {
    registry_.set_tunnel_endpoint(nullptr);
    stop_all();
}

bool TunnelManager::start_forward(const std::string& address, int local_port, const std::string& target,
                                  std::string& id, std::string& error) {
    return start(TunnelKind::FORWARD, address, local_port, target, id, error);
}

bool TunnelManager::start_socks(const std::string& address, int local_port, std::string& id, std::string& error) {
    return start(TunnelKind::SOCKS, address, local_port, std::string(), id, error);
}

bool TunnelManager::start(TunnelKind kind, const std::string& address, int local_port, const std::string& target,
                          std::string& id, std::string& error) {
    std::vector<std::string> sessions = registry_.list();
    if (std::find(sessions.begin(), sessions.end(), address) == sessions.end()) {
        error = "session not found";
        return false;
    }
    if (local_port < 0 || local_port > 65535) {
        error = "invalid local port";
        return false;
    }

    auto tunnel = std::make_shared<Tunnel>();
    tunnel->listener = std::make_unique<Listener>(interface_, local_port);
    if (!tunnel->listener->start()) {
        error = "cannot listen on " + interface_ + ":" + std::to_string(local_port);
        return false;
    }
    tunnel->info.kind = kind;
    tunnel->info.session_address = address;
    tunnel->info.local_port = tunnel->listener->bound_port();
    tunnel->info.target = target;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        tunnel->info.id = std::to_string(++next_tunnel_);
        tunnels_[tunnel->info.id] = tunnel;
    }
    tunnel->acceptor = std::thread([this, tunnel]() { accept_loop(tunnel); });

    id = tunnel->info.id;
    if (kind == TunnelKind::FORWARD) {
        LOG_INFO("Tunnel %s: %s:%d -> %s via %s", id.c_str(), interface_.c_str(), tunnel->info.local_port,
                 target.c_str(), address.c_str());
    } else {
        LOG_INFO("Tunnel %s: SOCKS5 proxy on %s:%d via %s", id.c_str(), interface_.c_str(), tunnel->info.local_port,
                 address.c_str());
    }
    return true;
}

void TunnelManager::accept_loop(const TunnelPtr& tunnel) {
    while (!tunnel->stopping) {
        std::string peer;
        intptr_t fd = tunnel->listener->accept_connection(peer);
        if (fd < 0) {
            if (tunnel->stopping) break;
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            continue;
        }
        reap_links(tunnel);

        auto link = std::make_shared<Link>();
        link->fd = static_cast<int>(fd);
        {
            std::lock_guard<std::mutex> lock(tunnel->links_mutex);
            link->id = std::to_string(++tunnel->next_link);
            tunnel->links[link->id] = link;
        }
        LOG_DEBUG("Tunnel %s: connection %s from %s", tunnel->info.id.c_str(), link->id.c_str(), peer.c_str());
        link->worker = std::thread([this, tunnel, link]() { link_loop(tunnel, link); });
    }
}

void TunnelManager::link_loop(const TunnelPtr& tunnel, const LinkPtr& link) {
    std::string target = tunnel->info.target;
    bool socks = tunnel->info.kind == TunnelKind::SOCKS;
    bool ready = true;

    if (socks && !socks_handshake(link, target)) {
        ready = false;
        std::lock_guard<std::mutex> lock(link->mutex);
        link->state = LinkState::CLOSED;
    }

    if (ready) {
        SessionError err = registry_.send_tunnel_line(
            tunnel->info.session_address,
            tunnel_wire::build_line(protocol::CMD_TUNNEL_OPEN, tunnel->info.id, link->id, target));
        if (err != SessionError::OK) {
            LOG_WARN("Tunnel %s: cannot open connection %s: %s", tunnel->info.id.c_str(), link->id.c_str(),
                     session_error_name(err));
            std::lock_guard<std::mutex> lock(link->mutex);
            link->state = LinkState::CLOSED;
            ready = false;
        } else {
            ready = wait_open(tunnel, link);
        }
        if (socks) {
            send_socks_reply(link->fd, ready ? SOCKS_REP_SUCCESS : SOCKS_REP_HOST_UNREACHABLE);
        }
    }

    if (ready) {
        LOG_INFO("Tunnel %s: connection %s open to %s", tunnel->info.id.c_str(), link->id.c_str(), target.c_str());
        relay(tunnel, link);
    }
    send_close(tunnel, link);

    {
        std::lock_guard<std::mutex> lock(link->mutex);
        ::close(link->fd);
        link->fd = -1;
    }
    link->finished = true;
}

bool TunnelManager::socks_handshake(const LinkPtr& link, std::string& target) {
    uint8_t head[2];
    if (!read_exact(link->fd, head, 2, SOCKS_HANDSHAKE_TIMEOUT_MS) || head[0] != SOCKS_VERSION) {
        LOG_WARN("SOCKS: bad greeting on connection %s", link->id.c_str());
        return false;
    }
    std::vector<uint8_t> methods(head[1]);
    if (!methods.empty() && !read_exact(link->fd, methods.data(), methods.size(), SOCKS_HANDSHAKE_TIMEOUT_MS)) {
        return false;
    }
    bool no_auth = std::find(methods.begin(), methods.end(), SOCKS_NO_AUTH) != methods.end();
    const uint8_t choice[] = {SOCKS_VERSION, no_auth ? SOCKS_NO_AUTH : SOCKS_NO_ACCEPTABLE};
    if (!tunnel_wire::write_fd_all(link->fd, choice, sizeof(choice), SOCKS_HANDSHAKE_TIMEOUT_MS) || !no_auth) {
        LOG_WARN("SOCKS: client offers no usable authentication method");
        return false;
    }

    uint8_t request[4];
    if (!read_exact(link->fd, request, 4, SOCKS_HANDSHAKE_TIMEOUT_MS) || request[0] != SOCKS_VERSION) {
        return false;
    }
    if (request[1] != SOCKS_CMD_CONNECT) {
        LOG_WARN("SOCKS: unsupported command %u", request[1]);
        send_socks_reply(link->fd, SOCKS_REP_CMD_UNSUPPORTED);
        return false;
    }

    std::string host;
    switch (request[3]) {
        case SOCKS_ATYP_IPV4: {
            uint8_t addr[4];
            char text[INET_ADDRSTRLEN] = {0};
            if (!read_exact(link->fd, addr, sizeof(addr), SOCKS_HANDSHAKE_TIMEOUT_MS) ||
                inet_ntop(AF_INET, addr, text, sizeof(text)) == nullptr) {
                return false;
            }
            host = text;
            break;
        }
        case SOCKS_ATYP_DOMAIN: {
            uint8_t len = 0;
            if (!read_exact(link->fd, &len, 1, SOCKS_HANDSHAKE_TIMEOUT_MS) || len == 0) {
                return false;
            }
            std::vector<uint8_t> name(len);
            if (!read_exact(link->fd, name.data(), name.size(), SOCKS_HANDSHAKE_TIMEOUT_MS)) {
                return false;
            }
            host.assign(name.begin(), name.end());
            if (host.find_first_of(" \r\n") != std::string::npos) {
                send_socks_reply(link->fd, SOCKS_REP_HOST_UNREACHABLE);
                return false;
            }
            break;
        }
        case SOCKS_ATYP_IPV6: {
            uint8_t addr[16];
            char text[INET6_ADDRSTRLEN] = {0};
            if (!read_exact(link->fd, addr, sizeof(addr), SOCKS_HANDSHAKE_TIMEOUT_MS) ||
                inet_ntop(AF_INET6, addr, text, sizeof(text)) == nullptr) {
                return false;
            }
            host = std::string("[") + text + "]";
            break;
        }
        default:
            LOG_WARN("SOCKS: unsupported address type %u", request[3]);
            send_socks_reply(link->fd, SOCKS_REP_ATYP_UNSUPPORTED);
            return false;
    }

    uint8_t port[2];
    if (!read_exact(link->fd, port, sizeof(port), SOCKS_HANDSHAKE_TIMEOUT_MS)) {
        return false;
    }
    target = host + ":" + std::to_string((port[0] << 8) | port[1]);
    return true;
}

bool TunnelManager::wait_open(const TunnelPtr& tunnel, const LinkPtr& link) {
    std::unique_lock<std::mutex> lock(link->mutex);
    bool answered = link->cv.wait_for(lock, std::chrono::seconds(protocol::TUNNEL_OPEN_TIMEOUT), [&]() {
        return link->state != LinkState::OPENING || tunnel->stopping;
    });
    if (link->state == LinkState::OPEN) {
        return true;
    }
    if (!answered) {
        LOG_WARN("Tunnel %s: connection %s timed out waiting for the agent", tunnel->info.id.c_str(),
                 link->id.c_str());
    } else if (link->state == LinkState::CLOSED) {
        LOG_WARN("Tunnel %s: agent could not reach the target for connection %s", tunnel->info.id.c_str(),
                 link->id.c_str());
    }
    return false;
}

void TunnelManager::relay(const TunnelPtr& tunnel, const LinkPtr& link) {
    std::vector<uint8_t> buf(tunnel_wire::READ_CHUNK);
    while (!tunnel->stopping) {
        pollfd pfd{};
        pfd.fd = link->fd;
        pfd.events = POLLIN;
        int rc = ::poll(&pfd, 1, 200);
        if (rc == 0) continue;
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }
        ssize_t n = ::recv(link->fd, buf.data(), buf.size(), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;

        std::string encoded;
        if (!wire_codec::compress_to_hex(std::vector<uint8_t>(buf.begin(), buf.begin() + n), encoded)) {
            LOG_ERROR("Tunnel %s: failed to encode data", tunnel->info.id.c_str());
            break;
        }
        SessionError err = registry_.send_tunnel_line(
            tunnel->info.session_address,
            tunnel_wire::build_line(protocol::CMD_TUNNEL_DATA, tunnel->info.id, link->id, encoded));
        if (err != SessionError::OK) {
            break;
        }
    }
}

void TunnelManager::send_close(const TunnelPtr& tunnel, const LinkPtr& link) {
    {
        std::lock_guard<std::mutex> lock(link->mutex);
        if (link->state == LinkState::CLOSED) {
            return;
        }
        link->state = LinkState::CLOSED;
    }
    SessionError err = registry_.send_tunnel_line(
        tunnel->info.session_address, tunnel_wire::build_line(protocol::CMD_TUNNEL_CLOSE, tunnel->info.id, link->id));
    if (err != SessionError::OK) {
        LOG_DEBUG("Tunnel %s: close of connection %s not delivered: %s", tunnel->info.id.c_str(), link->id.c_str(),
                  session_error_name(err));
    }
}

TunnelManager::LinkPtr TunnelManager::find_link(const std::string& address, const std::string& tunnel_id,
                                                const std::string& conn_id) {
    TunnelPtr tunnel;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tunnels_.find(tunnel_id);
        if (it == tunnels_.end() || it->second->info.session_address != address) {
            return nullptr;
        }
        tunnel = it->second;
    }
    std::lock_guard<std::mutex> lock(tunnel->links_mutex);
    auto it = tunnel->links.find(conn_id);
    return it == tunnel->links.end() ? nullptr : it->second;
}

void TunnelManager::handle_agent_line(const std::string& address, const std::string& line) {
    tunnel_wire::TunnelLine msg;
    if (!tunnel_wire::parse_line(line, msg)) {
        LOG_WARN("Malformed tunnel line from %s", address.c_str());
        return;
    }
    LinkPtr link = find_link(address, msg.tunnel_id, msg.conn_id);
    if (!link) {
        LOG_DEBUG("Tunnel line for unknown connection %s %s from %s", msg.tunnel_id.c_str(), msg.conn_id.c_str(),
                  address.c_str());
        return;
    }

    if (msg.command == protocol::CMD_TUNNEL_OK) {
        std::lock_guard<std::mutex> lock(link->mutex);
        if (link->state == LinkState::OPENING) {
            link->state = LinkState::OPEN;
        }
        link->cv.notify_all();
        return;
    }

    if (msg.command == protocol::CMD_TUNNEL_CLOSE) {
        std::lock_guard<std::mutex> lock(link->mutex);
        // A refused open still owes the SOCKS client its failure reply.
        if (link->state == LinkState::OPEN && link->fd >= 0) {
            ::shutdown(link->fd, SHUT_RDWR);
        }
        link->state = LinkState::CLOSED;
        link->cv.notify_all();
        return;
    }

    if (msg.command == protocol::CMD_TUNNEL_DATA) {
        std::vector<uint8_t> data;
        std::string error;
        if (!wire_codec::decompress_hex(msg.payload, data, &error)) {
            LOG_WARN("Tunnel %s: bad data from %s: %s", msg.tunnel_id.c_str(), address.c_str(), error.c_str());
            return;
        }
        std::lock_guard<std::mutex> lock(link->mutex);
        if (link->state != LinkState::OPEN || link->fd < 0) {
            return;
        }
        if (!tunnel_wire::write_fd_all(link->fd, data.data(), data.size(), LOCAL_WRITE_TIMEOUT_MS)) {
            LOG_WARN("Tunnel %s: local write failed on connection %s", msg.tunnel_id.c_str(), msg.conn_id.c_str());
            ::shutdown(link->fd, SHUT_RDWR);
        }
        return;
    }

    LOG_WARN("Unexpected tunnel command %s from %s", msg.command.c_str(), address.c_str());
}

void TunnelManager::reap_links(const TunnelPtr& tunnel) {
    std::vector<LinkPtr> done;
    {
        std::lock_guard<std::mutex> lock(tunnel->links_mutex);
        for (auto it = tunnel->links.begin(); it != tunnel->links.end();) {
            if (it->second->finished) {
                done.push_back(it->second);
                it = tunnel->links.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (const auto& link : done) {
        if (link->worker.joinable()) {
            link->worker.join();
        }
    }
}

void TunnelManager::shutdown_tunnel(const TunnelPtr& tunnel) {
    tunnel->stopping = true;
    tunnel->listener->stop();
    if (tunnel->acceptor.joinable()) {
        tunnel->acceptor.join();
    }

    std::map<std::string, LinkPtr> links;
    {
        std::lock_guard<std::mutex> lock(tunnel->links_mutex);
        links.swap(tunnel->links);
    }
    for (auto& entry : links) {
        std::lock_guard<std::mutex> lock(entry.second->mutex);
        if (entry.second->fd >= 0) {
            ::shutdown(entry.second->fd, SHUT_RDWR);
        }
        entry.second->cv.notify_all();
    }
    for (auto& entry : links) {
        if (entry.second->worker.joinable()) {
            entry.second->worker.join();
        }
    }
    LOG_INFO("Tunnel %s stopped", tunnel->info.id.c_str());
}

bool TunnelManager::stop(const std::string& id) {
    TunnelPtr tunnel;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tunnels_.find(id);
        if (it == tunnels_.end()) {
            return false;
        }
        tunnel = it->second;
        tunnels_.erase(it);
    }
    shutdown_tunnel(tunnel);
    return true;
}

void TunnelManager::stop_all() {
    std::map<std::string, TunnelPtr> tunnels;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tunnels.swap(tunnels_);
    }
    for (auto& entry : tunnels) {
        shutdown_tunnel(entry.second);
    }
}

void TunnelManager::session_closed(const std::string& address) {
    std::vector<TunnelPtr> gone;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = tunnels_.begin(); it != tunnels_.end();) {
            if (it->second->info.session_address == address) {
                gone.push_back(it->second);
                it = tunnels_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (const auto& tunnel : gone) {
        LOG_INFO("Stopping tunnel %s: session %s closed", tunnel->info.id.c_str(), address.c_str());
        shutdown_tunnel(tunnel);
    }
}

std::vector<TunnelInfo> TunnelManager::list() const {
    std::vector<TunnelInfo> out;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : tunnels_) {
        TunnelInfo info = entry.second->info;
        std::lock_guard<std::mutex> links_lock(entry.second->links_mutex);
        info.connections = static_cast<size_t>(std::count_if(
            entry.second->links.begin(), entry.second->links.end(),
            [](const std::pair<const std::string, LinkPtr>& link) { return !link.second->finished; }));
        out.push_back(info);
    }
    return out;
}
