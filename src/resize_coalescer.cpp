#include "resize_coalescer.hpp"
#include "utils.hpp"

#include <sys/ioctl.h>
#include <unistd.h>

ResizeCoalescer::ResizeCoalescer(SessionRegistry& registry, const std::string& address, int tty_fd)
    : registry_(registry), address_(address), tty_fd_(tty_fd) {}

ResizeCoalescer::~ResizeCoalescer() {
    stop();
}

void ResizeCoalescer::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        return;
    }
    running_ = true;
    thread_ = std::thread(&ResizeCoalescer::coalescer_loop, this);
}

void ResizeCoalescer::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
    }
    cv_.notify_one();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void ResizeCoalescer::signal_resize() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_resize_ = true;
    }
    cv_.notify_one();
}

void ResizeCoalescer::coalescer_loop() {
    for (;;) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return pending_resize_ || !running_; });

        if (!running_) {
            break;
        }

        pending_resize_ = false;
        lock.unlock();

        struct winsize ws;
        if (ioctl(tty_fd_, TIOCGWINSZ, &ws) == 0 && ws.ws_row > 0 && ws.ws_col > 0) {
            send_winch_frame(ws.ws_row, ws.ws_col);
        }
    }
}

void ResizeCoalescer::send_winch_frame(int rows, int cols) {
    SessionError err = registry_.send_pty_resize(address_, rows, cols);
    if (err != SessionError::OK) {
        LOG_DEBUG("resize to %dx%d not sent: %s", cols, rows, session_error_name(err));
    }
}
