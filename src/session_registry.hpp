#ifndef SESSION_REGISTRY_HPP
#define SESSION_REGISTRY_HPP

#include "connection.hpp"
#include "control_protocol.hpp"
#include "framing.hpp"
#include "line_channel.hpp"
#include "protocol.hpp"
#include "pty_channel.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

enum class SessionMode {
    COMMAND,
    PTY_ACTIVE
};

enum class SessionError {
    OK,
    SESSION_NOT_FOUND,
    TRANSPORT_ERROR,
    RESPONSE_TIMEOUT,
    WRONG_MODE,
    REJECTED
};

const char* session_error_name(SessionError err);

struct RegistryOptions {
    size_t max_buffer_size = protocol::MAX_BUFFER_SIZE;
    int send_timeout_ms = protocol::RESPONSE_TIMEOUT * 1000;
    int read_timeout_ms = protocol::READ_TIMEOUT * 1000;
    int pty_enter_timeout_ms = protocol::PTY_ENTER_TIMEOUT * 1000;
};

// One admitted agent connection. All fields are owned by the registry;
// callers only hold SessionHandle to keep a session alive while they use it.
class Session {
public:
    Session(std::unique_ptr<Connection> conn, size_t max_line);

    const std::string& address() const { return address_; }
    bool closed() const;

private:
    friend class SessionRegistry;

    void close();

    std::string address_;
    std::unique_ptr<Connection> conn_;
    LineChannel channel_;

    // Held for a whole command/response exchange.
    std::mutex exchange_mutex_;

    mutable std::mutex state_mutex_;
    std::condition_variable lines_cv_;
    std::deque<std::string> lines_;
    size_t queued_bytes_ = 0;
    // End markers still owed by exchanges that timed out; their lines are
    // skipped so a late reply is never taken for the next one.
    size_t stale_ends_ = 0;
    bool closed_ = false;
    SessionMode mode_ = SessionMode::COMMAND;
    std::shared_ptr<PtyChannel> pty_;
    std::chrono::steady_clock::time_point last_activity_;
    bool has_identity_ = false;
    control::AgentIdentity identity_;
};

using SessionHandle = std::shared_ptr<Session>;

// Receives the TUNNEL_* lines agents send for tunnelled TCP connections.
class TunnelEndpoint {
public:
    virtual ~TunnelEndpoint() = default;

    // Called on the session's worker thread.
    virtual void handle_agent_line(const std::string& address, const std::string& line) = 0;
    // The session at `address` is gone and no other took its place.
    virtual void session_closed(const std::string& address) = 0;
};

class SessionRegistry {
public:
    explicit SessionRegistry(const RegistryOptions& options = RegistryOptions());
    ~SessionRegistry();

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    // Registers an authenticated connection under its peer address. A session
    // already registered there is replaced and closed.
    SessionHandle admit(std::unique_ptr<Connection> conn);

    // Read loop for one session; returns once the connection is gone. Runs on
    // the connection's worker thread.
    void serve(const SessionHandle& session);

    std::vector<std::string> list() const;
    size_t size() const;
    // `index_text` is 1-based into list(). Out of range or non-numeric -> false.
    bool lookup_by_index(const std::string& index_text, std::string& address) const;

    SessionError send_command(const std::string& address, const std::string& text);
    SessionError get_response(const std::string& address, int timeout_ms, std::string& response);
    SessionError get_frames(const std::string& address, int timeout_ms, std::vector<framing::Frame>& frames);

    // send_command + get_response / get_frames as one exchange.
    SessionError execute(const std::string& address, const std::string& text, int timeout_ms, std::string& response);
    SessionError execute_frames(const std::string& address, const std::string& text, int timeout_ms,
                                std::vector<framing::Frame>& frames);

    void remove(const std::string& address);

    SessionError enter_pty_mode(const std::string& address, std::shared_ptr<PtyChannel>& channel);
    SessionError exit_pty_mode(const std::string& address);
    SessionError send_pty_input(const std::string& address, const std::vector<uint8_t>& data);
    SessionError send_pty_resize(const std::string& address, int rows, int cols);
    bool is_in_pty_mode(const std::string& address) const;
    std::shared_ptr<PtyChannel> pty_channel(const std::string& address) const;

    // Out-of-band line for a tunnelled connection; allowed in either mode.
    SessionError send_tunnel_line(const std::string& address, const std::string& line);
    // Waits for callbacks in progress, so the previous endpoint may be
    // destroyed once this returns.
    void set_tunnel_endpoint(TunnelEndpoint* endpoint);

    std::string identifier(const std::string& address) const;
    bool metadata(const std::string& address, control::AgentIdentity& identity) const;

    // One keepalive pass: PING every idle command-mode session.
    void keepalive(int idle_seconds);

    // Closes every session and waits up to wait_ms for workers to finish.
    void close_all(int wait_ms);

    // Frames -> operator text. Corrupt DATA frames are logged and skipped.
    static std::string assemble_response(const std::string& address, const std::vector<framing::Frame>& frames);

private:
    SessionHandle find(const std::string& address) const;
    void remove_session(const SessionHandle& session);
    void handle_line(const SessionHandle& session, const std::string& line);
    void enqueue_line(Session& session, const std::string& line);
    bool dispatch_tunnel_line(const std::string& address, const std::string& line);
    void notify_session_closed(const std::string& address);

    SessionError write_command(const SessionHandle& session, const std::string& text);
    SessionError collect_frames(const SessionHandle& session, int timeout_ms, std::vector<framing::Frame>& frames);

    RegistryOptions options_;

    mutable std::mutex mutex_;
    std::map<std::string, SessionHandle> sessions_;

    std::shared_mutex endpoint_mutex_;
    TunnelEndpoint* endpoint_ = nullptr;

    std::mutex workers_mutex_;
    std::condition_variable workers_cv_;
    int active_workers_ = 0;
};

#endif // SESSION_REGISTRY_HPP
