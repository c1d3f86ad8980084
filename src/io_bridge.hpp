#pragma once

#include "session_registry.hpp"

#include <string>

// Ctrl-D on the operator side detaches from the remote shell.
constexpr unsigned char DETACH_KEY = 0x04;

// Relays raw bytes between the operator terminal (in_fd/out_fd) and the
// remote shell of `address` until Ctrl-D, remote shell exit, shutdown or a
// transport failure. The terminal is switched to raw mode when in_fd is a tty.
SessionError run_pty_bridge(SessionRegistry& registry, const std::string& address, int in_fd, int out_fd);
