#ifndef CONTROL_PROTOCOL_HPP
#define CONTROL_PROTOCOL_HPP

#include "nlohmann/json.hpp"

#include <string>

using json = nlohmann::json;

// JSON payloads carried on single protocol lines (IDENT, PTY_RESIZE).
namespace control {

struct AgentIdentity {
    std::string id;
    std::string hostname;
    std::string user;
    std::string os;
    long pid = 0;
};

// Describes the running agent process; `id` is supplied by the caller.
AgentIdentity local_identity(const std::string& id);

std::string build_ident(const AgentIdentity& identity);
bool parse_ident(const std::string& payload, AgentIdentity& identity);

std::string build_resize(int rows, int cols);
bool parse_resize(const std::string& payload, int& rows, int& cols);

}

#endif // CONTROL_PROTOCOL_HPP
