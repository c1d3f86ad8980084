#include "pty_handler.hpp"
#include "utils.hpp"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <fcntl.h>
#include <poll.h>
#include <pty.h>
#include <sys/ioctl.h>
#include <sys/wait.h>
#include <termios.h>

#include <chrono>
#include <thread>

PTYHandler::~PTYHandler() {
    terminate_child();
}

bool PTYHandler::create_pty_and_fork_shell() {
    if (running()) {
        LOG_WARN("PTY shell already running (pid %d)", static_cast<int>(child_pid_));
        return false;
    }

    child_pid_ = forkpty(&master_fd_, nullptr, nullptr, nullptr);
    if (child_pid_ < 0) {
        LOG_ERROR("forkpty() failed: %s", error_to_string(errno).c_str());
        child_pid_ = -1;
        master_fd_ = -1;
        return false;
    }

    if (child_pid_ == 0) { // Child process
        execute_shell();
    }

    // Parent process
    int flags = fcntl(master_fd_, F_GETFL, 0);
    if (flags < 0 || fcntl(master_fd_, F_SETFL, flags | O_NONBLOCK) < 0) {
        LOG_WARN("fcntl(O_NONBLOCK) on pty failed: %s", error_to_string(errno).c_str());
    }
    LOG_INFO("PTY shell started (pid %d)", static_cast<int>(child_pid_));
    return true;
}

ssize_t PTYHandler::pty_read(char* buf, size_t buf_size, int timeout_ms) {
    if (master_fd_ < 0) {
        return -1;
    }
    pollfd pfd{};
    pfd.fd = master_fd_;
    pfd.events = POLLIN;
    int pr = poll(&pfd, 1, timeout_ms);
    if (pr < 0) {
        return errno == EINTR ? 0 : -1;
    }
    if (pr == 0) {
        return 0;
    }
    ssize_t n = read(master_fd_, buf, buf_size);
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
        return 0;
    }
    // EIO on Linux once the slave side has no more openers.
    if (n == 0) {
        return -1;
    }
    return n;
}

bool PTYHandler::pty_write(const char* buf, size_t len) {
    size_t off = 0;
    while (off < len) {
        ssize_t w = write(master_fd_, buf + off, len - off);
        if (w < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                pollfd pfd{};
                pfd.fd = master_fd_;
                pfd.events = POLLOUT;
                if (poll(&pfd, 1, 1000) <= 0) {
                    LOG_WARN("pty write stalled");
                    return false;
                }
                continue;
            }
            LOG_ERROR("pty write failed: %s", error_to_string(errno).c_str());
            return false;
        }
        off += static_cast<size_t>(w);
    }
    return true;
}

void PTYHandler::apply_window_size(int rows, int cols) {
    struct winsize ws{};
    ws.ws_row = static_cast<unsigned short>(rows);
    ws.ws_col = static_cast<unsigned short>(cols);
    if (ioctl(master_fd_, TIOCSWINSZ, &ws) < 0) {
        LOG_WARN("TIOCSWINSZ failed: %s", error_to_string(errno).c_str());
    }
}

void PTYHandler::terminate_child() {
    if (child_pid_ > 0) {
        kill(child_pid_, SIGHUP);
        kill(child_pid_, SIGTERM);
        int status = 0;
        pid_t r = 0;
        for (int i = 0; i < 20; ++i) {
            r = waitpid(child_pid_, &status, WNOHANG);
            if (r != 0) break;
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        if (r == 0) {
            kill(child_pid_, SIGKILL);
            waitpid(child_pid_, &status, 0);
        }
        LOG_INFO("PTY shell (pid %d) terminated", static_cast<int>(child_pid_));
        child_pid_ = -1;
    }
    close_master();
}

void PTYHandler::close_master() {
    if (master_fd_ >= 0) {
        close(master_fd_);
        master_fd_ = -1;
    }
}

void PTYHandler::execute_shell() {
    struct termios term_settings;
    if (tcgetattr(STDIN_FILENO, &term_settings) == 0) {
        term_settings.c_lflag |= (ECHO | ICANON);
        term_settings.c_iflag |= ICRNL;
        tcsetattr(STDIN_FILENO, TCSANOW, &term_settings);
    }
    setenv("TERM", "xterm-256color", 0);

    const char* candidates[] = {getenv("SHELL"), "/bin/bash", "/bin/sh"};
    for (const char* shell : candidates) {
        if (shell == nullptr || *shell == '\0') continue;
        execl(shell, shell, "-i", static_cast<char*>(nullptr));
    }
    _exit(127);
}
