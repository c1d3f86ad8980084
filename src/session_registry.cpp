#include "session_registry.hpp"
#include "utils.hpp"
#include "wire_codec.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>

namespace {
    using Clock = std::chrono::steady_clock;

    std::string command_prefix(const char* cmd) {
        return std::string(cmd) + " ";
    }

    // Payload-carrying commands are logged without their payload.
    std::string loggable(const std::string& text) {
        for (const char* cmd : {protocol::CMD_UPLOAD_CHUNK, protocol::CMD_PTY_DATA}) {
            if (starts_with(text, command_prefix(cmd))) {
                return std::string(cmd) + " <data>";
            }
        }
        return text;
    }

    bool is_tunnel_line(const std::string& line) {
        for (const char* cmd : {protocol::CMD_TUNNEL_OK, protocol::CMD_TUNNEL_DATA, protocol::CMD_TUNNEL_CLOSE}) {
            if (starts_with(line, command_prefix(cmd))) {
                return true;
            }
        }
        return false;
    }
}

const char* session_error_name(SessionError err) {
    switch (err) {
        case SessionError::OK: return "ok";
        case SessionError::SESSION_NOT_FOUND: return "session not found";
        case SessionError::TRANSPORT_ERROR: return "transport error";
        case SessionError::RESPONSE_TIMEOUT: return "timeout waiting for response";
        case SessionError::WRONG_MODE: return "session is in the wrong mode";
        case SessionError::REJECTED: return "request rejected by agent";
    }
    return "unknown";
}

Session::Session(std::unique_ptr<Connection> conn, size_t max_line)
    : address_(conn->peer_address()),
      conn_(std::move(conn)),
      channel_(*conn_, max_line),
      last_activity_(Clock::now()) {}

bool Session::closed() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return closed_;
}

void Session::close() {
    std::shared_ptr<PtyChannel> pty;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
        mode_ = SessionMode::COMMAND;
        pty.swap(pty_);
    }
    lines_cv_.notify_all();
    if (pty) {
        pty->close();
    }
    conn_->shutdown();
}

SessionRegistry::SessionRegistry(const RegistryOptions& options) : options_(options) {}

SessionRegistry::~SessionRegistry() {
    close_all(2000);
}

SessionHandle SessionRegistry::admit(std::unique_ptr<Connection> conn) {
    // A download response is one hex line, roughly twice the file size.
    size_t max_line = options_.max_buffer_size * 2 + protocol::CHUNK_SIZE;
    auto session = std::make_shared<Session>(std::move(conn), max_line);

    SessionHandle previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session->address());
        if (it != sessions_.end()) {
            previous = it->second;
            it->second = session;
        } else {
            sessions_.emplace(session->address(), session);
        }
    }
    if (previous) {
        LOG_WARN("Session %s re-registered; closing the previous connection", session->address().c_str());
        previous->close();
    }
    LOG_INFO("[+] Session admitted: %s", session->address().c_str());
    return session;
}

void SessionRegistry::serve(const SessionHandle& session) {
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        ++active_workers_;
    }

    std::string line;
    for (;;) {
        IoStatus st = session->channel_.read_line(line, options_.read_timeout_ms);
        if (st == IoStatus::OK) {
            handle_line(session, line);
            continue;
        }
        if (st == IoStatus::TIMEOUT) {
            if (session->closed()) break;
            continue;
        }
        if (st == IoStatus::ERROR) {
            LOG_ERROR("Error reading from %s: %s", session->address().c_str(), io_status_name(st));
        }
        break;
    }

    remove_session(session);
    session->close();
    LOG_INFO("[-] Session disconnected: %s", session->address().c_str());
    if (!find(session->address())) {
        notify_session_closed(session->address());
    }

    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        --active_workers_;
    }
    workers_cv_.notify_all();
}

void SessionRegistry::handle_line(const SessionHandle& session, const std::string& raw) {
    std::string line = raw;
    if (!line.empty() && line.back() == '\r') line.pop_back();

    {
        std::lock_guard<std::mutex> lock(session->state_mutex_);
        session->last_activity_ = Clock::now();
    }

    if (starts_with(line, command_prefix(protocol::CMD_IDENT))) {
        control::AgentIdentity identity;
        if (control::parse_ident(line.substr(std::strlen(protocol::CMD_IDENT) + 1), identity)) {
            std::lock_guard<std::mutex> lock(session->state_mutex_);
            session->identity_ = identity;
            session->has_identity_ = true;
            LOG_INFO("[+] Session %s identifier: %s (%s@%s)", session->address().c_str(),
                     identity.id.c_str(), identity.user.c_str(), identity.hostname.c_str());
        }
        return;
    }

    if (line == protocol::CMD_PONG) {
        LOG_DEBUG("keepalive reply from %s", session->address().c_str());
        return;
    }

    if (starts_with(line, command_prefix(protocol::CMD_PTY_DATA))) {
        std::vector<uint8_t> data;
        std::string error;
        if (!wire_codec::decompress_hex(line.substr(std::strlen(protocol::CMD_PTY_DATA) + 1), data, &error)) {
            LOG_WARN("Error decoding PTY data from %s: %s", session->address().c_str(), error.c_str());
            return;
        }
        std::shared_ptr<PtyChannel> pty;
        {
            std::lock_guard<std::mutex> lock(session->state_mutex_);
            pty = session->pty_;
        }
        if (pty && !pty->push(std::move(data))) {
            LOG_WARN("PTY channel full for %s; dropping output", session->address().c_str());
        }
        return;
    }

    if (line == protocol::CMD_PTY_EXIT) {
        std::shared_ptr<PtyChannel> pty;
        {
            std::lock_guard<std::mutex> lock(session->state_mutex_);
            pty.swap(session->pty_);
            session->mode_ = SessionMode::COMMAND;
        }
        if (pty) {
            LOG_INFO("Remote shell on %s exited", session->address().c_str());
            pty->close();
        }
        return;
    }

    if (is_tunnel_line(line)) {
        if (!dispatch_tunnel_line(session->address(), line)) {
            LOG_DEBUG("tunnel line from %s with no endpoint", session->address().c_str());
        }
        return;
    }

    enqueue_line(*session, line);
}

bool SessionRegistry::dispatch_tunnel_line(const std::string& address, const std::string& line) {
    std::shared_lock<std::shared_mutex> lock(endpoint_mutex_);
    if (!endpoint_) {
        return false;
    }
    endpoint_->handle_agent_line(address, line);
    return true;
}

void SessionRegistry::notify_session_closed(const std::string& address) {
    std::shared_lock<std::shared_mutex> lock(endpoint_mutex_);
    if (endpoint_) {
        endpoint_->session_closed(address);
    }
}

void SessionRegistry::set_tunnel_endpoint(TunnelEndpoint* endpoint) {
    std::unique_lock<std::shared_mutex> lock(endpoint_mutex_);
    endpoint_ = endpoint;
}

void SessionRegistry::enqueue_line(Session& session, const std::string& line) {
    size_t cap = options_.max_buffer_size * 2 + protocol::CHUNK_SIZE;
    {
        std::lock_guard<std::mutex> lock(session.state_mutex_);
        session.lines_.push_back(line);
        session.queued_bytes_ += line.size();
        while (session.queued_bytes_ > cap && session.lines_.size() > 1) {
            session.queued_bytes_ -= session.lines_.front().size();
            if (session.stale_ends_ > 0 &&
                framing::classify_line(session.lines_.front()).type == framing::FrameType::END_OF_OUTPUT) {
                --session.stale_ends_;
            }
            session.lines_.pop_front();
            LOG_WARN("Response backlog from %s exceeds %zu bytes; dropping oldest line", session.address().c_str(), cap);
        }
    }
    session.lines_cv_.notify_all();
}

SessionHandle SessionRegistry::find(const std::string& address) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(address);
    if (it == sessions_.end()) {
        return nullptr;
    }
    return it->second;
}

void SessionRegistry::remove_session(const SessionHandle& session) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session->address());
    if (it != sessions_.end() && it->second == session) {
        sessions_.erase(it);
    }
}

std::vector<std::string> SessionRegistry::list() const {
    std::vector<std::string> out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        out.reserve(sessions_.size());
        for (const auto& kv : sessions_) {
            out.push_back(kv.first);
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

bool SessionRegistry::lookup_by_index(const std::string& index_text, std::string& address) const {
    std::string t = trim(index_text);
    if (t.empty() || t.size() > 9) {
        return false;
    }
    for (char c : t) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    size_t index = static_cast<size_t>(std::stoul(t));
    std::vector<std::string> addresses = list();
    if (index == 0 || index > addresses.size()) {
        return false;
    }
    address = addresses[index - 1];
    return true;
}

SessionError SessionRegistry::write_command(const SessionHandle& session, const std::string& text) {
    {
        std::lock_guard<std::mutex> lock(session->state_mutex_);
        if (session->closed_) {
            return SessionError::SESSION_NOT_FOUND;
        }
        if (session->mode_ == SessionMode::PTY_ACTIVE) {
            return SessionError::WRONG_MODE;
        }
        if (!session->lines_.empty()) {
            LOG_DEBUG("discarding %zu stale lines from %s", session->lines_.size(), session->address().c_str());
            for (const auto& line : session->lines_) {
                if (session->stale_ends_ > 0 &&
                    framing::classify_line(line).type == framing::FrameType::END_OF_OUTPUT) {
                    --session->stale_ends_;
                }
            }
            session->lines_.clear();
            session->queued_bytes_ = 0;
        }
    }

    LOG_DEBUG("-> %s: %s", session->address().c_str(), loggable(text).c_str());
    IoStatus st = session->channel_.write_line(text, options_.send_timeout_ms);
    if (st != IoStatus::OK) {
        LOG_ERROR("Sending command to %s failed: %s", session->address().c_str(), io_status_name(st));
        return SessionError::TRANSPORT_ERROR;
    }
    return SessionError::OK;
}

SessionError SessionRegistry::collect_frames(const SessionHandle& session, int timeout_ms,
                                             std::vector<framing::Frame>& frames) {
    frames.clear();
    auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);

    std::unique_lock<std::mutex> lock(session->state_mutex_);
    for (;;) {
        while (!session->lines_.empty()) {
            std::string line = std::move(session->lines_.front());
            session->lines_.pop_front();
            session->queued_bytes_ -= std::min(session->queued_bytes_, line.size());

            framing::Frame frame = framing::classify_line(line);
            if (session->stale_ends_ > 0) {
                if (frame.type == framing::FrameType::END_OF_OUTPUT) {
                    --session->stale_ends_;
                }
                continue;
            }
            if (frame.type == framing::FrameType::END_OF_OUTPUT) {
                return SessionError::OK;
            }
            frames.push_back(std::move(frame));
        }
        if (session->closed_) {
            return SessionError::SESSION_NOT_FOUND;
        }
        if (session->lines_cv_.wait_until(lock, deadline) == std::cv_status::timeout &&
            session->lines_.empty() && !session->closed_) {
            // The rest of this reply may still arrive.
            ++session->stale_ends_;
            return SessionError::RESPONSE_TIMEOUT;
        }
    }
}

std::string SessionRegistry::assemble_response(const std::string& address, const std::vector<framing::Frame>& frames) {
    std::string response;
    for (const auto& frame : frames) {
        if (frame.type == framing::FrameType::DATA) {
            std::vector<uint8_t> data;
            std::string error;
            if (!wire_codec::decompress_hex(frame.text, data, &error)) {
                LOG_WARN("Skipping corrupt data line from %s: %s", address.c_str(), error.c_str());
                continue;
            }
            response.append(data.begin(), data.end());
        } else {
            response += frame.text;
            response += '\n';
        }
    }
    return response;
}

SessionError SessionRegistry::send_command(const std::string& address, const std::string& text) {
    SessionHandle session = find(address);
    if (!session) {
        return SessionError::SESSION_NOT_FOUND;
    }
    std::lock_guard<std::mutex> exchange(session->exchange_mutex_);
    return write_command(session, text);
}

SessionError SessionRegistry::get_frames(const std::string& address, int timeout_ms,
                                         std::vector<framing::Frame>& frames) {
    SessionHandle session = find(address);
    if (!session) {
        return SessionError::SESSION_NOT_FOUND;
    }
    std::lock_guard<std::mutex> exchange(session->exchange_mutex_);
    return collect_frames(session, timeout_ms, frames);
}

SessionError SessionRegistry::get_response(const std::string& address, int timeout_ms, std::string& response) {
    std::vector<framing::Frame> frames;
    SessionError err = get_frames(address, timeout_ms, frames);
    if (err != SessionError::OK) {
        return err;
    }
    response = assemble_response(address, frames);
    return SessionError::OK;
}

SessionError SessionRegistry::execute_frames(const std::string& address, const std::string& text, int timeout_ms,
                                             std::vector<framing::Frame>& frames) {
    SessionHandle session = find(address);
    if (!session) {
        return SessionError::SESSION_NOT_FOUND;
    }
    std::lock_guard<std::mutex> exchange(session->exchange_mutex_);
    SessionError err = write_command(session, text);
    if (err != SessionError::OK) {
        return err;
    }
    return collect_frames(session, timeout_ms, frames);
}

SessionError SessionRegistry::execute(const std::string& address, const std::string& text, int timeout_ms,
                                      std::string& response) {
    std::vector<framing::Frame> frames;
    SessionError err = execute_frames(address, text, timeout_ms, frames);
    if (err != SessionError::OK) {
        return err;
    }
    response = assemble_response(address, frames);
    return SessionError::OK;
}

void SessionRegistry::remove(const std::string& address) {
    SessionHandle session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(address);
        if (it == sessions_.end()) {
            return;
        }
        session = it->second;
        sessions_.erase(it);
    }
    LOG_INFO("Removing session %s", address.c_str());
    session->close();
}

SessionError SessionRegistry::enter_pty_mode(const std::string& address, std::shared_ptr<PtyChannel>& channel) {
    SessionHandle session = find(address);
    if (!session) {
        return SessionError::SESSION_NOT_FOUND;
    }
    std::lock_guard<std::mutex> exchange(session->exchange_mutex_);

    // The channel is attached before PTY_MODE goes out so early shell output
    // is not lost; the mode flag flips only once the agent confirms.
    auto pty = std::make_shared<PtyChannel>(options_.max_buffer_size);
    {
        std::lock_guard<std::mutex> lock(session->state_mutex_);
        if (session->closed_) {
            return SessionError::SESSION_NOT_FOUND;
        }
        if (session->mode_ == SessionMode::PTY_ACTIVE || session->pty_) {
            return SessionError::WRONG_MODE;
        }
        session->pty_ = pty;
    }

    auto detach = [&session, &pty]() {
        std::lock_guard<std::mutex> lock(session->state_mutex_);
        if (session->pty_ == pty) {
            session->pty_.reset();
        }
        pty->close();
    };

    SessionError err = write_command(session, protocol::CMD_PTY_MODE);
    std::vector<framing::Frame> frames;
    if (err == SessionError::OK) {
        err = collect_frames(session, options_.pty_enter_timeout_ms, frames);
    }
    if (err != SessionError::OK) {
        detach();
        if (err == SessionError::RESPONSE_TIMEOUT && write_command(session, protocol::CMD_PTY_EXIT) == SessionError::OK) {
            // A shell started after the deadline is stopped again; its
            // acknowledgement is skipped like the late PTY_MODE reply.
            std::lock_guard<std::mutex> lock(session->state_mutex_);
            ++session->stale_ends_;
        }
        return err;
    }

    std::string reply = trim(assemble_response(address, frames));
    if (reply != protocol::REPLY_OK) {
        LOG_WARN("Agent %s refused PTY mode: %s", address.c_str(), reply.c_str());
        detach();
        return SessionError::REJECTED;
    }

    {
        std::lock_guard<std::mutex> lock(session->state_mutex_);
        if (session->closed_) {
            return SessionError::SESSION_NOT_FOUND;
        }
        if (session->pty_ != pty) {
            // Shell exited before the confirmation was processed.
            return SessionError::REJECTED;
        }
        session->mode_ = SessionMode::PTY_ACTIVE;
    }
    channel = pty;
    return SessionError::OK;
}

SessionError SessionRegistry::exit_pty_mode(const std::string& address) {
    SessionHandle session = find(address);
    if (!session) {
        return SessionError::SESSION_NOT_FOUND;
    }
    std::lock_guard<std::mutex> exchange(session->exchange_mutex_);

    std::shared_ptr<PtyChannel> pty;
    bool was_active;
    {
        std::lock_guard<std::mutex> lock(session->state_mutex_);
        was_active = session->mode_ == SessionMode::PTY_ACTIVE;
        session->mode_ = SessionMode::COMMAND;
        pty.swap(session->pty_);
    }
    if (pty) {
        pty->close();
    }
    if (!was_active) {
        return SessionError::OK;
    }

    // Answered like a command once the agent's shell is gone, so a PTY_MODE
    // sent afterwards cannot overtake the shutdown.
    SessionError err = write_command(session, protocol::CMD_PTY_EXIT);
    std::vector<framing::Frame> frames;
    if (err == SessionError::OK) {
        err = collect_frames(session, options_.pty_enter_timeout_ms, frames);
    }
    if (err != SessionError::OK) {
        LOG_WARN("Agent %s did not confirm leaving PTY mode: %s", address.c_str(), session_error_name(err));
    }
    return err;
}

SessionError SessionRegistry::send_pty_input(const std::string& address, const std::vector<uint8_t>& data) {
    SessionHandle session = find(address);
    if (!session) {
        return SessionError::SESSION_NOT_FOUND;
    }
    {
        std::lock_guard<std::mutex> lock(session->state_mutex_);
        if (session->mode_ != SessionMode::PTY_ACTIVE) {
            return SessionError::WRONG_MODE;
        }
    }
    std::string encoded;
    if (!wire_codec::compress_to_hex(data, encoded)) {
        LOG_ERROR("Encoding PTY input failed");
        return SessionError::TRANSPORT_ERROR;
    }
    IoStatus st = session->channel_.write_line(command_prefix(protocol::CMD_PTY_DATA) + encoded, options_.send_timeout_ms);
    if (st != IoStatus::OK) {
        return SessionError::TRANSPORT_ERROR;
    }
    return SessionError::OK;
}

SessionError SessionRegistry::send_pty_resize(const std::string& address, int rows, int cols) {
    SessionHandle session = find(address);
    if (!session) {
        return SessionError::SESSION_NOT_FOUND;
    }
    {
        std::lock_guard<std::mutex> lock(session->state_mutex_);
        if (session->mode_ != SessionMode::PTY_ACTIVE) {
            return SessionError::WRONG_MODE;
        }
    }
    IoStatus st = session->channel_.write_line(command_prefix(protocol::CMD_PTY_RESIZE) + control::build_resize(rows, cols),
                                               options_.send_timeout_ms);
    return st == IoStatus::OK ? SessionError::OK : SessionError::TRANSPORT_ERROR;
}

SessionError SessionRegistry::send_tunnel_line(const std::string& address, const std::string& line) {
    SessionHandle session = find(address);
    if (!session || session->closed()) {
        return SessionError::SESSION_NOT_FOUND;
    }
    IoStatus st = session->channel_.write_line(line, options_.send_timeout_ms);
    if (st != IoStatus::OK) {
        LOG_WARN("Tunnel write to %s failed: %s", address.c_str(), io_status_name(st));
        return SessionError::TRANSPORT_ERROR;
    }
    return SessionError::OK;
}

bool SessionRegistry::is_in_pty_mode(const std::string& address) const {
    SessionHandle session = find(address);
    if (!session) {
        return false;
    }
    std::lock_guard<std::mutex> lock(session->state_mutex_);
    return session->mode_ == SessionMode::PTY_ACTIVE;
}

std::shared_ptr<PtyChannel> SessionRegistry::pty_channel(const std::string& address) const {
    SessionHandle session = find(address);
    if (!session) {
        return nullptr;
    }
    std::lock_guard<std::mutex> lock(session->state_mutex_);
    if (session->mode_ != SessionMode::PTY_ACTIVE) {
        return nullptr;
    }
    return session->pty_;
}

std::string SessionRegistry::identifier(const std::string& address) const {
    control::AgentIdentity identity;
    if (!metadata(address, identity)) {
        return std::string();
    }
    return identity.id;
}

bool SessionRegistry::metadata(const std::string& address, control::AgentIdentity& identity) const {
    SessionHandle session = find(address);
    if (!session) {
        return false;
    }
    std::lock_guard<std::mutex> lock(session->state_mutex_);
    if (!session->has_identity_) {
        return false;
    }
    identity = session->identity_;
    return true;
}

void SessionRegistry::keepalive(int idle_seconds) {
    std::vector<SessionHandle> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& kv : sessions_) {
            snapshot.push_back(kv.second);
        }
    }

    auto now = Clock::now();
    for (const auto& session : snapshot) {
        {
            std::lock_guard<std::mutex> lock(session->state_mutex_);
            if (session->closed_ || session->mode_ != SessionMode::COMMAND ||
                now - session->last_activity_ < std::chrono::seconds(idle_seconds)) {
                continue;
            }
        }
        // Skip sessions with an exchange in flight.
        std::unique_lock<std::mutex> exchange(session->exchange_mutex_, std::try_to_lock);
        if (!exchange.owns_lock()) {
            continue;
        }
        IoStatus st = session->channel_.write_line(protocol::CMD_PING, options_.send_timeout_ms);
        if (st != IoStatus::OK) {
            LOG_WARN("Keepalive to %s failed: %s", session->address().c_str(), io_status_name(st));
            exchange.unlock();
            remove_session(session);
            session->close();
        }
    }
}

void SessionRegistry::close_all(int wait_ms) {
    std::map<std::string, SessionHandle> sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions.swap(sessions_);
    }
    for (auto& kv : sessions) {
        kv.second->close();
    }

    std::unique_lock<std::mutex> lock(workers_mutex_);
    if (!workers_cv_.wait_for(lock, std::chrono::milliseconds(wait_ms), [this] { return active_workers_ == 0; })) {
        LOG_WARN("%d session workers still running at shutdown", active_workers_);
    }
}
