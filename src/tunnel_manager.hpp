#ifndef TUNNEL_MANAGER_HPP
#define TUNNEL_MANAGER_HPP

#include "listener.hpp"
#include "session_registry.hpp"

#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

enum class TunnelKind {
    FORWARD, // fixed target
    SOCKS    // SOCKS5 CONNECT chooses the target per connection
};

const char* tunnel_kind_name(TunnelKind kind);

struct TunnelInfo {
    std::string id;
    TunnelKind kind = TunnelKind::FORWARD;
    std::string session_address;
    int local_port = 0;
    std::string target; // empty for SOCKS
    size_t connections = 0;
};

// Local listening sockets whose connections are carried to an agent as
// TUNNEL_* lines; the agent dials the target. Registers itself with the
// registry for the agent's replies.
class TunnelManager : public TunnelEndpoint {
public:
    explicit TunnelManager(SessionRegistry& registry, const std::string& bind_interface = "127.0.0.1");
    ~TunnelManager() override;

    TunnelManager(const TunnelManager&) = delete;
    TunnelManager& operator=(const TunnelManager&) = delete;

    // Port 0 binds an ephemeral port; list() reports the one chosen.
    bool start_forward(const std::string& address, int local_port, const std::string& target, std::string& id,
                       std::string& error);
    bool start_socks(const std::string& address, int local_port, std::string& id, std::string& error);

    bool stop(const std::string& id);
    void stop_all();
    std::vector<TunnelInfo> list() const;

    void handle_agent_line(const std::string& address, const std::string& line) override;
    void session_closed(const std::string& address) override;

private:
    enum class LinkState {
        OPENING,
        OPEN,
        CLOSED
    };

    struct Link {
        std::string id;
        int fd = -1;
        std::mutex mutex; // guards fd writes and state
        std::condition_variable cv;
        LinkState state = LinkState::OPENING;
        std::thread worker;
        std::atomic<bool> finished{false};
    };
    using LinkPtr = std::shared_ptr<Link>;

    struct Tunnel {
        TunnelInfo info;
        std::unique_ptr<Listener> listener;
        std::thread acceptor;
        std::atomic<bool> stopping{false};
        std::mutex links_mutex;
        std::map<std::string, LinkPtr> links;
        uint64_t next_link = 0;
    };
    using TunnelPtr = std::shared_ptr<Tunnel>;

    bool start(TunnelKind kind, const std::string& address, int local_port, const std::string& target,
               std::string& id, std::string& error);
    void accept_loop(const TunnelPtr& tunnel);
    void link_loop(const TunnelPtr& tunnel, const LinkPtr& link);
    bool socks_handshake(const LinkPtr& link, std::string& target);
    bool wait_open(const TunnelPtr& tunnel, const LinkPtr& link);
    void relay(const TunnelPtr& tunnel, const LinkPtr& link);
    void send_close(const TunnelPtr& tunnel, const LinkPtr& link);
    void shutdown_tunnel(const TunnelPtr& tunnel);
    void reap_links(const TunnelPtr& tunnel);
    LinkPtr find_link(const std::string& address, const std::string& tunnel_id, const std::string& conn_id);

    SessionRegistry& registry_;
    std::string interface_;

    mutable std::mutex mutex_;
    std::map<std::string, TunnelPtr> tunnels_;
    uint64_t next_tunnel_ = 0;
};

#endif // TUNNEL_MANAGER_HPP
