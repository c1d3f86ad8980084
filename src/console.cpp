#include "console.hpp"
#include "io_bridge.hpp"
#include "signal_handler.hpp"
#include "utils.hpp"

#include <algorithm>
#include <iostream>
#include <sstream>
#include <unistd.h>

namespace {
    std::vector<std::string> split_words(const std::string& line) {
        std::istringstream ss(line);
        std::vector<std::string> words;
        std::string w;
        while (ss >> w) {
            words.push_back(w);
        }
        return words;
    }

    TransferOptions transfer_options(const TuningConfig& tuning) {
        TransferOptions options;
        options.chunk_size = tuning.chunk_size;
        options.ack_timeout_ms = std::max(tuning.response_timeout, protocol::TRANSFER_ACK_TIMEOUT) * 1000;
        options.download_timeout_ms = tuning.download_timeout * 1000;
        return options;
    }

    bool parse_port(const std::string& text, int& port) {
        if (text.empty() || text.size() > 5 || text.find_first_not_of("0123456789") != std::string::npos) {
            return false;
        }
        port = std::stoi(text);
        return port <= 65535;
    }
}

Console::Console(SessionRegistry& registry, const TuningConfig& tuning, std::istream& in, std::ostream& out)
    : registry_(registry), tuning_(tuning), transfers_(registry, transfer_options(tuning)),
      tunnels_(registry), in_(in), out_(out) {}

std::string Console::prompt() const {
    if (active_.empty()) {
        return "listener> ";
    }
    return "[" + active_ + "]> ";
}

void Console::run() {
    print_help();
    std::string line;
    while (!shutdown_requested()) {
        out_ << prompt() << std::flush;
        if (!std::getline(in_, line)) {
            if (shutdown_requested()) {
                break;
            }
            if (in_.eof()) {
                out_ << "\n";
                break;
            }
            // Interrupted read; the signal flag is checked above.
            in_.clear();
            continue;
        }
        if (!execute_line(line)) {
            break;
        }
    }
}

bool Console::execute_line(const std::string& raw) {
    std::string line = trim(raw);
    if (line.empty()) {
        return true;
    }
    std::vector<std::string> words = split_words(line);
    const std::string& cmd = words[0];

    if (cmd == "exit" || cmd == "quit") {
        return false;
    }
    if (cmd == "help") {
        print_help();
        return true;
    }
    if (cmd == "ls" || cmd == "sessions") {
        list_sessions();
        return true;
    }
    if (cmd == "use") {
        use_session(words);
        return true;
    }
    if (cmd == "background" || cmd == "bg") {
        if (!active_.empty()) {
            out_ << "Backgrounded session " << active_ << "\n";
            active_.clear();
        }
        return true;
    }
    if (cmd == "upload") {
        upload(words);
        return true;
    }
    if (cmd == "download") {
        download(words);
        return true;
    }
    if (cmd == "shell") {
        shell();
        return true;
    }
    if (cmd == "forward") {
        start_forward(words);
        return true;
    }
    if (cmd == "socks") {
        start_socks(words);
        return true;
    }
    if (cmd == "tunnels") {
        list_tunnels();
        return true;
    }
    if (cmd == "stop") {
        stop_tunnel(words);
        return true;
    }

    if (active_.empty()) {
        out_ << "Unknown command '" << cmd << "'. Select a session with 'use <n>' to run remote commands.\n";
        return true;
    }
    run_remote(line);
    return true;
}

void Console::print_help() {
    out_ << "Commands:\n"
         << "  ls                          list connected sessions\n"
         << "  use <n>                     attach to session n (from ls)\n"
         << "  background, bg              detach from the current session\n"
         << "  upload <local> <remote>     send a file to the attached agent\n"
         << "  download <remote> <local>   fetch a file from the attached agent\n"
         << "  shell                       interactive shell (Ctrl-D to return)\n"
         << "  forward <port> <host:port>  forward local port through the attached agent\n"
         << "  socks <port>                SOCKS5 proxy on local port through the attached agent\n"
         << "  tunnels                     list active forwards and proxies\n"
         << "  stop <id>                   stop a forward or proxy\n"
         << "  help                        show this help\n"
         << "  exit                        stop the listener\n"
         << "Any other input is run as a shell command on the attached agent.\n";
}

void Console::list_sessions() {
    std::vector<std::string> addresses = registry_.list();
    if (addresses.empty()) {
        out_ << "No active sessions\n";
        return;
    }
    out_ << "Active sessions:\n";
    for (size_t i = 0; i < addresses.size(); ++i) {
        const std::string& addr = addresses[i];
        control::AgentIdentity identity;
        out_ << "  " << (i + 1) << ". " << addr;
        if (registry_.metadata(addr, identity)) {
            out_ << "  id=" << identity.id;
            if (!identity.user.empty() || !identity.hostname.empty()) {
                out_ << "  " << identity.user << "@" << identity.hostname;
            }
            if (!identity.os.empty()) {
                out_ << "  (" << identity.os << ")";
            }
        }
        if (registry_.is_in_pty_mode(addr)) {
            out_ << "  [pty]";
        }
        if (addr == active_) {
            out_ << "  *";
        }
        out_ << "\n";
    }
}

void Console::use_session(const std::vector<std::string>& args) {
    if (args.size() != 2) {
        out_ << "Usage: use <n>\n";
        return;
    }
    std::string address;
    if (!registry_.lookup_by_index(args[1], address)) {
        out_ << "Invalid session number '" << args[1] << "'\n";
        return;
    }
    active_ = address;
    out_ << "Using session " << address << "\n";
}

bool Console::require_session() {
    if (active_.empty()) {
        out_ << "No session selected; use 'use <n>' first\n";
        return false;
    }
    return true;
}

void Console::drop_active(const std::string& reason) {
    out_ << "Session " << active_ << " lost: " << reason << "\n";
    LOG_WARN("Dropping session %s: %s", active_.c_str(), reason.c_str());
    registry_.remove(active_);
    active_.clear();
}

void Console::upload(const std::vector<std::string>& args) {
    if (args.size() != 3) {
        out_ << "Usage: upload <local_path> <remote_path>\n";
        return;
    }
    if (!require_session()) {
        return;
    }
    TransferResult result = transfers_.upload(active_, args[1], args[2]);
    if (result.ok()) {
        out_ << "Uploaded " << result.bytes << " bytes to " << args[2] << "\n";
        return;
    }
    if (is_session_fatal(result.status)) {
        drop_active(result.message);
        return;
    }
    out_ << "Upload failed (" << transfer_status_name(result.status) << "): " << result.message << "\n";
}

void Console::download(const std::vector<std::string>& args) {
    if (args.size() != 3) {
        out_ << "Usage: download <remote_path> <local_path>\n";
        return;
    }
    if (!require_session()) {
        return;
    }
    TransferResult result = transfers_.download(active_, args[1], args[2]);
    if (result.ok()) {
        out_ << "Downloaded " << result.bytes << " bytes to " << args[2] << "\n";
        return;
    }
    if (is_session_fatal(result.status)) {
        drop_active(result.message);
        return;
    }
    out_ << "Download failed (" << transfer_status_name(result.status) << "): " << result.message << "\n";
}

void Console::shell() {
    if (!require_session()) {
        return;
    }
    out_ << "Entering PTY shell with " << active_ << "... Press Ctrl-D to return.\n" << std::flush;
    SessionError err = run_pty_bridge(registry_, active_, STDIN_FILENO, STDOUT_FILENO);
    switch (err) {
        case SessionError::OK:
            out_ << "\nReturned to listener prompt\n";
            break;
        case SessionError::REJECTED:
        case SessionError::WRONG_MODE:
        case SessionError::RESPONSE_TIMEOUT:
            out_ << "Cannot start shell: " << session_error_name(err) << "\n";
            break;
        default:
            drop_active(session_error_name(err));
            break;
    }
}

void Console::start_forward(const std::vector<std::string>& args) {
    int port = 0;
    if (args.size() != 3 || !parse_port(args[1], port)) {
        out_ << "Usage: forward <local_port> <remote_host:remote_port>\n";
        return;
    }
    if (!require_session()) {
        return;
    }
    std::string id;
    std::string error;
    if (!tunnels_.start_forward(active_, port, args[2], id, error)) {
        out_ << "Failed to start forward: " << error << "\n";
        return;
    }
    out_ << "Forward " << id << " started: 127.0.0.1:" << bound_port(id) << " -> " << args[2] << " (via " << active_
         << ")\n";
}

void Console::start_socks(const std::vector<std::string>& args) {
    int port = 0;
    if (args.size() != 2 || !parse_port(args[1], port)) {
        out_ << "Usage: socks <local_port>\n";
        return;
    }
    if (!require_session()) {
        return;
    }
    std::string id;
    std::string error;
    if (!tunnels_.start_socks(active_, port, id, error)) {
        out_ << "Failed to start SOCKS proxy: " << error << "\n";
        return;
    }
    out_ << "SOCKS5 proxy " << id << " started on 127.0.0.1:" << bound_port(id) << " (via " << active_ << ")\n";
}

int Console::bound_port(const std::string& id) const {
    for (const auto& info : tunnels_.list()) {
        if (info.id == id) {
            return info.local_port;
        }
    }
    return 0;
}

void Console::list_tunnels() {
    std::vector<TunnelInfo> tunnels = tunnels_.list();
    if (tunnels.empty()) {
        out_ << "No active tunnels\n";
        return;
    }
    out_ << "Active tunnels:\n";
    for (const auto& info : tunnels) {
        out_ << "  " << info.id << ". " << tunnel_kind_name(info.kind) << "  127.0.0.1:" << info.local_port;
        if (info.kind == TunnelKind::FORWARD) {
            out_ << " -> " << info.target;
        }
        out_ << "  via " << info.session_address << "  connections=" << info.connections << "\n";
    }
}

void Console::stop_tunnel(const std::vector<std::string>& args) {
    if (args.size() != 2) {
        out_ << "Usage: stop <id>\n";
        return;
    }
    if (!tunnels_.stop(args[1])) {
        out_ << "No tunnel with id '" << args[1] << "'\n";
        return;
    }
    out_ << "Stopped tunnel " << args[1] << "\n";
}

void Console::run_remote(const std::string& command) {
    std::string response;
    SessionError err = registry_.execute(active_, command, tuning_.command_timeout * 1000, response);
    switch (err) {
        case SessionError::OK:
            out_ << response;
            if (!response.empty() && response.back() != '\n') {
                out_ << "\n";
            }
            break;
        case SessionError::RESPONSE_TIMEOUT:
            out_ << "Timed out waiting for response from " << active_ << "\n";
            break;
        case SessionError::WRONG_MODE:
            out_ << "Session is in PTY mode\n";
            break;
        default:
            drop_active(session_error_name(err));
            break;
    }
    out_ << std::flush;
}
