#ifndef CONSOLE_HPP
#define CONSOLE_HPP

#include "app_config.hpp"
#include "session_registry.hpp"
#include "transfer.hpp"
#include "tunnel_manager.hpp"

#include <iosfwd>
#include <string>
#include <vector>

// Operator prompt of the listener.
class Console {
public:
    Console(SessionRegistry& registry, const TuningConfig& tuning, std::istream& in, std::ostream& out);

    // Reads commands until `exit`, end of input or a shutdown signal.
    void run();

    // Handles one input line. False when the operator asked to exit.
    bool execute_line(const std::string& line);

    const std::string& active_session() const { return active_; }

private:
    void print_help();
    void list_sessions();
    void use_session(const std::vector<std::string>& args);
    void upload(const std::vector<std::string>& args);
    void download(const std::vector<std::string>& args);
    void shell();
    void start_forward(const std::vector<std::string>& args);
    void start_socks(const std::vector<std::string>& args);
    void list_tunnels();
    int bound_port(const std::string& id) const;
    void stop_tunnel(const std::vector<std::string>& args);
    void run_remote(const std::string& command);

    bool require_session();
    void drop_active(const std::string& reason);
    std::string prompt() const;

    SessionRegistry& registry_;
    TuningConfig tuning_;
    TransferEngine transfers_;
    TunnelManager tunnels_;
    std::istream& in_;
    std::ostream& out_;
    std::string active_;
};

#endif // CONSOLE_HPP
