#include "control_protocol.hpp"
#include "utils.hpp"

#include <pwd.h>
#include <sys/utsname.h>
#include <unistd.h>

namespace control {

AgentIdentity local_identity(const std::string& id) {
    AgentIdentity identity;
    identity.id = id;

    char host[256] = {0};
    if (gethostname(host, sizeof(host) - 1) == 0) {
        identity.hostname = host;
    }

    const passwd* pw = getpwuid(geteuid());
    if (pw != nullptr && pw->pw_name != nullptr) {
        identity.user = pw->pw_name;
    }

    utsname uts{};
    if (uname(&uts) == 0) {
        identity.os = std::string(uts.sysname) + " " + uts.release + " " + uts.machine;
    }

    identity.pid = static_cast<long>(getpid());
    return identity;
}

std::string build_ident(const AgentIdentity& identity) {
    json msg = {
        {"id", identity.id},
        {"hostname", identity.hostname},
        {"user", identity.user},
        {"os", identity.os},
        {"pid", identity.pid}
    };
    return msg.dump();
}

bool parse_ident(const std::string& payload, AgentIdentity& identity) {
    try {
        auto j = json::parse(payload);
        if (!j.is_object() || !j.contains("id") || !j["id"].is_string()) {
            return false;
        }
        identity.id = j["id"].get<std::string>();
        identity.hostname = j.value("hostname", "");
        identity.user = j.value("user", "");
        identity.os = j.value("os", "");
        identity.pid = j.value("pid", 0L);
        return true;
    } catch (const json::exception& e) {
        LOG_WARN("malformed IDENT payload: %s", e.what());
        return false;
    }
}

std::string build_resize(int rows, int cols) {
    json winch_msg = {
        {"type", "winch"},
        {"rows", rows},
        {"cols", cols}
    };
    return winch_msg.dump();
}

bool parse_resize(const std::string& payload, int& rows, int& cols) {
    try {
        auto j = json::parse(payload);
        if (!j.is_object() || j.value("type", "") != "winch") {
            return false;
        }
        rows = j.value("rows", 24);
        cols = j.value("cols", 80);
        return rows > 0 && cols > 0 && rows <= 65535 && cols <= 65535;
    } catch (const json::exception& e) {
        LOG_WARN("malformed resize payload: %s", e.what());
        return false;
    }
}

}
