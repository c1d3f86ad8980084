#ifndef RESIZE_COALESCER_HPP
#define RESIZE_COALESCER_HPP

#include "session_registry.hpp"

#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

// Collapses bursts of SIGWINCH into single PTY_RESIZE messages for one session.
class ResizeCoalescer {
public:
    ResizeCoalescer(SessionRegistry& registry, const std::string& address, int tty_fd);
    ~ResizeCoalescer();

    void start();
    void stop();
    void signal_resize();

private:
    void coalescer_loop();
    void send_winch_frame(int rows, int cols);

    SessionRegistry& registry_;
    std::string address_;
    int tty_fd_;
    std::thread thread_;
    bool running_ = false;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool pending_resize_ = false;
};

#endif // RESIZE_COALESCER_HPP
