#include "signal_handler.hpp"
#include "utils.hpp"

#include <csignal>
#include <cstring>

namespace {
    volatile std::sig_atomic_t g_shutdown = 0;
    volatile std::sig_atomic_t g_resize = 0;
}

static void signal_handler(int signal) {
    if (signal == SIGWINCH) {
        g_resize = 1;
    } else {
        g_shutdown = 1;
    }
}

void setup_signal_handlers() {
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    // No SA_RESTART: a blocking console read returns EINTR so the flag is seen.
    sa.sa_flags = 0;
    if (sigaction(SIGINT, &sa, nullptr) != 0 || sigaction(SIGTERM, &sa, nullptr) != 0) {
        LOG_WARN("cannot install shutdown handlers");
    }
    sa.sa_flags = SA_RESTART;
    if (sigaction(SIGWINCH, &sa, nullptr) != 0) {
        LOG_WARN("cannot install SIGWINCH handler");
    }
    std::signal(SIGPIPE, SIG_IGN);
}

bool shutdown_requested() {
    return g_shutdown != 0;
}

void request_shutdown() {
    g_shutdown = 1;
}

bool consume_resize_signal() {
    if (g_resize == 0) {
        return false;
    }
    g_resize = 0;
    return true;
}
