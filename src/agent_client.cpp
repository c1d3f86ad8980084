#include "agent_client.hpp"
#include "auth_handshake.hpp"
#include "control_protocol.hpp"
#include "signal_handler.hpp"
#include "tls_connection.hpp"
#include "tls_wrapper.hpp"
#include "utils.hpp"

#include <unistd.h>

const char* agent_state_name(AgentState state) {
    switch (state) {
        case AgentState::DISCONNECTED: return "DISCONNECTED";
        case AgentState::CONNECTING: return "CONNECTING";
        case AgentState::AUTHENTICATING: return "AUTHENTICATING";
        case AgentState::READY: return "READY";
        case AgentState::EXECUTING: return "EXECUTING";
        case AgentState::PTY_ACTIVE: return "PTY_ACTIVE";
    }
    return "UNKNOWN";
}

AgentClient::AgentClient(const AppConfig& config, const std::string& agent_id)
    : config_(config), agent_id_(agent_id) {}

AgentClient::~AgentClient() {
    close();
}

AgentState AgentClient::state() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

void AgentClient::set_state(AgentState new_state) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ != new_state) {
        LOG_DEBUG("Agent state %s -> %s", agent_state_name(state_), agent_state_name(new_state));
    }
    state_ = new_state;
}

bool AgentClient::connect() {
    close();
    set_state(AgentState::CONNECTING);

    std::string host;
    int port = 0;
    if (!TLSConnection::split_host_port(config_.agent.target, host, port)) {
        LOG_ERROR("Invalid target '%s', expected host:port", config_.agent.target.c_str());
        set_state(AgentState::DISCONNECTED);
        return false;
    }

    LOG_INFO("Connecting to %s", config_.agent.target.c_str());
    intptr_t fd = TLSConnection::dial(host, port, config_.tuning.response_timeout * 1000);
    if (fd < 0) {
        set_state(AgentState::DISCONNECTED);
        return false;
    }

    auto tls = std::make_unique<TLSWrapper>();
    if (!tls->configure_ssl(false, "", "") || !tls->attach_socket(fd) ||
        !tls->perform_handshake(protocol::HANDSHAKE_TIMEOUT * 1000)) {
        ::close(static_cast<int>(fd));
        set_state(AgentState::DISCONNECTED);
        return false;
    }
    LOG_DEBUG("TLS established: %s, %s", tls->get_tls_version().c_str(), tls->get_ciphersuite().c_str());

    return attach(std::make_unique<TLSConnection>(fd, std::move(tls), config_.agent.target));
}

bool AgentClient::attach(std::unique_ptr<Connection> conn) {
    conn_ = std::move(conn);
    channel_ = std::make_unique<LineChannel>(*conn_, config_.tuning.max_buffer_size * 2 + protocol::CHUNK_SIZE);

    set_state(AgentState::AUTHENTICATING);
    AuthContext auth;
    auth.shared_secret_hex = config_.agent.shared_secret;
    auth.expected_fingerprint = config_.agent.cert_fingerprint;
    AuthResult result = authenticate_to_listener(*channel_, conn_->peer_fingerprint(), auth,
                                                 protocol::AUTH_TIMEOUT * 1000);
    if (result != AuthResult::OK) {
        LOG_ERROR("Authentication with %s failed: %s", conn_->peer_address().c_str(), auth_result_name(result));
        close();
        return false;
    }

    std::string ident = std::string(protocol::CMD_IDENT) + " " +
                        control::build_ident(control::local_identity(agent_id_));
    IoStatus st = channel_->write_line(ident, config_.tuning.response_timeout * 1000);
    if (st != IoStatus::OK) {
        LOG_ERROR("Failed to announce identity: %s", io_status_name(st));
        close();
        return false;
    }

    ProcessorOptions options;
    options.max_buffer_size = config_.tuning.max_buffer_size;
    options.write_timeout_ms = config_.tuning.command_timeout * 1000;
    processor_ = std::make_unique<CommandProcessor>(*channel_, options);

    LOG_INFO("Connected to %s as %s", conn_->peer_address().c_str(), agent_id_.c_str());
    set_state(AgentState::READY);
    return true;
}

bool AgentClient::handle_commands() {
    if (!channel_ || !processor_) {
        return false;
    }

    int read_timeout_ms = config_.tuning.read_timeout * 1000;
    std::string line;
    for (;;) {
        if (shutdown_requested()) {
            LOG_INFO("Shutdown requested; leaving command loop");
            return false;
        }

        IoStatus st = channel_->read_line(line, read_timeout_ms);
        if (st == IoStatus::TIMEOUT) {
            continue;
        }
        if (st != IoStatus::OK) {
            LOG_WARN("Connection to listener lost: %s", io_status_name(st));
            return false;
        }

        if (starts_with(line, protocol::CMD_AUTH_CHALLENGE) || trim(line) == protocol::CMD_AUTH_FAILED) {
            LOG_ERROR("Listener requires a shared secret; none is configured");
            return false;
        }

        bool was_pty = processor_->in_pty_mode();
        if (!was_pty) {
            set_state(AgentState::EXECUTING);
        }
        ProcessOutcome outcome = processor_->process(line);
        set_state(processor_->in_pty_mode() ? AgentState::PTY_ACTIVE : AgentState::READY);

        if (outcome == ProcessOutcome::EXIT) {
            return true;
        }
        if (outcome == ProcessOutcome::FAILED) {
            return false;
        }
    }
}

void AgentClient::close() {
    if (processor_) {
        processor_->reset();
        processor_.reset();
    }
    if (conn_) {
        conn_->shutdown();
    }
    channel_.reset();
    conn_.reset();
    set_state(AgentState::DISCONNECTED);
}
