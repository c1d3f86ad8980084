#include "session_manager.hpp"
#include "auth_handshake.hpp"
#include "line_channel.hpp"
#include "tls_connection.hpp"
#include "tls_wrapper.hpp"
#include "utils.hpp"

#include <sys/socket.h>
#include <unistd.h>

SessionManager::SessionManager(const AppConfig& config, SessionRegistry& registry, const std::string& shared_secret)
    : config(config), registry_(registry), shared_secret_(shared_secret) {}

SessionManager::~SessionManager() {
    stop();
}

bool SessionManager::start_listening() {
    listener = std::make_unique<Listener>(config.listener.bind_interface, config.listener.port);
    if (!listener->start()) {
        return false;
    }
    running_.store(true);
    accept_thread_ = std::thread(&SessionManager::accept_loop, this);
    keepalive_thread_ = std::thread(&SessionManager::keepalive_loop, this);
    return true;
}

int SessionManager::port() const {
    return listener ? listener->bound_port() : config.listener.port;
}

void SessionManager::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    LOG_INFO("Stopping listener");
    listener->stop();
    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
    }
    stop_cv_.notify_all();
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
    if (keepalive_thread_.joinable()) {
        keepalive_thread_.join();
    }

    std::map<uint64_t, std::thread> handlers;
    {
        std::lock_guard<std::mutex> lock(handshake_mutex_);
        for (int fd : handshake_fds_) {
            ::shutdown(fd, SHUT_RDWR);
        }
        handlers.swap(handlers_);
        finished_handlers_.clear();
    }
    // Workers admitted before this point are closed here; later ones see
    // running_ == false and drop their connection.
    registry_.close_all(2000);

    for (auto& entry : handlers) {
        entry.second.join();
    }
    LOG_INFO("Listener stopped (%zu connection handler(s) joined)", handlers.size());
}

void SessionManager::accept_loop() {
    while (running_.load()) {
        std::string peer;
        intptr_t fd = listener->accept_connection(peer);
        if (fd < 0) {
            if (!running_.load()) {
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            continue;
        }

        LOG_INFO("Connection from %s", peer.c_str());
        reap_handlers();
        track_handshake(static_cast<int>(fd));
        std::lock_guard<std::mutex> lock(handshake_mutex_);
        uint64_t id = ++next_handler_;
        handlers_[id] = std::thread(&SessionManager::handle_connection, this, fd, peer, id);
    }
}

void SessionManager::track_handshake(int fd) {
    std::lock_guard<std::mutex> lock(handshake_mutex_);
    handshake_fds_.insert(fd);
}

void SessionManager::reap_handlers() {
    std::vector<std::thread> done;
    {
        std::lock_guard<std::mutex> lock(handshake_mutex_);
        for (uint64_t id : finished_handlers_) {
            auto it = handlers_.find(id);
            if (it != handlers_.end()) {
                done.push_back(std::move(it->second));
                handlers_.erase(it);
            }
        }
        finished_handlers_.clear();
    }
    for (auto& t : done) {
        t.join();
    }
}

void SessionManager::untrack_handshake(int fd) {
    std::lock_guard<std::mutex> lock(handshake_mutex_);
    handshake_fds_.erase(fd);
}

void SessionManager::handle_connection(intptr_t fd, const std::string& peer, uint64_t handler_id) {
    auto tls = std::make_unique<TLSWrapper>();
    bool ok = tls->configure_ssl(true, config.listener.cert_path, config.listener.key_path) &&
              tls->attach_socket(fd) &&
              tls->perform_handshake(protocol::HANDSHAKE_TIMEOUT * 1000);

    SessionHandle session;
    if (!ok) {
        LOG_WARN("TLS handshake with %s failed", peer.c_str());
        untrack_handshake(static_cast<int>(fd));
        tls.reset();
        ::close(static_cast<int>(fd));
    } else {
        if (config.listener.tls_info) {
            LOG_INFO("%s: %s, %s", peer.c_str(), tls->get_tls_version().c_str(), tls->get_ciphersuite().c_str());
        }
        auto conn = std::make_unique<TLSConnection>(fd, std::move(tls), peer);

        AuthResult auth = AuthResult::OK;
        {
            // The agent sends nothing beyond its AUTH line until it sees AUTH_OK,
            // so this channel never buffers bytes meant for the session.
            LineChannel channel(*conn);
            auth = authenticate_agent(channel, shared_secret_, protocol::AUTH_TIMEOUT * 1000);
        }
        untrack_handshake(static_cast<int>(fd));

        if (auth != AuthResult::OK) {
            LOG_WARN("Rejected %s: %s", peer.c_str(), auth_result_name(auth));
        } else {
            std::lock_guard<std::mutex> lock(handshake_mutex_);
            if (!running_.load()) {
                LOG_INFO("Dropping %s: listener is shutting down", peer.c_str());
            } else {
                session = registry_.admit(std::move(conn));
            }
        }
    }

    if (session) {
        registry_.serve(session);
    }

    std::lock_guard<std::mutex> lock(handshake_mutex_);
    finished_handlers_.push_back(handler_id);
}

void SessionManager::keepalive_loop() {
    auto interval = std::chrono::seconds(config.tuning.ping_interval);
    std::unique_lock<std::mutex> lock(stop_mutex_);
    while (running_.load()) {
        if (stop_cv_.wait_for(lock, interval, [this] { return !running_.load(); })) {
            break;
        }
        lock.unlock();
        registry_.keepalive(config.tuning.ping_interval);
        lock.lock();
    }
}
