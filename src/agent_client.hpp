#ifndef AGENT_CLIENT_HPP
#define AGENT_CLIENT_HPP

#include "app_config.hpp"
#include "command_handlers.hpp"
#include "connection.hpp"
#include "line_channel.hpp"

#include <memory>
#include <mutex>
#include <string>

enum class AgentState {
    DISCONNECTED,
    CONNECTING,
    AUTHENTICATING,
    READY,
    EXECUTING,
    PTY_ACTIVE
};

const char* agent_state_name(AgentState state);

// One connection lifetime of the agent, driven by connect_with_retry().
class AgentLink {
public:
    virtual ~AgentLink() = default;

    // Dial, handshake, authenticate and announce. False leaves the link closed.
    virtual bool connect() = 0;
    // Runs until the connection ends. True when the listener sent `exit`.
    virtual bool handle_commands() = 0;
    virtual void close() = 0;
};

class AgentClient : public AgentLink {
public:
    AgentClient(const AppConfig& config, const std::string& agent_id);
    ~AgentClient() override;

    bool connect() override;
    bool handle_commands() override;
    void close() override;

    AgentState state();

    // Authenticates and announces over an established connection.
    bool attach(std::unique_ptr<Connection> conn);

private:
    void set_state(AgentState new_state);

    AppConfig config_;
    std::string agent_id_;

    std::mutex state_mutex_;
    AgentState state_ = AgentState::DISCONNECTED;

    std::unique_ptr<Connection> conn_;
    std::unique_ptr<LineChannel> channel_;
    std::unique_ptr<CommandProcessor> processor_;
};

#endif // AGENT_CLIENT_HPP
