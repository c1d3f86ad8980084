#ifndef PTY_HANDLER_HPP
#define PTY_HANDLER_HPP

#include <string>

#include <sys/types.h>
#include <unistd.h>

// Agent-side pseudo-terminal running an interactive shell.
class PTYHandler {
public:
    PTYHandler() = default;
    ~PTYHandler();

    PTYHandler(const PTYHandler&) = delete;
    PTYHandler& operator=(const PTYHandler&) = delete;

    // Tries $SHELL, /bin/bash, then /bin/sh.
    bool create_pty_and_fork_shell();

    bool running() const { return child_pid_ > 0; }

    // Waits up to timeout_ms. Returns bytes read, 0 on timeout, -1 once the
    // shell side is gone.
    ssize_t pty_read(char* buf, size_t buf_size, int timeout_ms);
    bool pty_write(const char* buf, size_t len);
    void apply_window_size(int rows, int cols);
    void terminate_child();

private:
    void execute_shell();
    void close_master();

    int master_fd_ = -1;
    pid_t child_pid_ = -1;
};

#endif // PTY_HANDLER_HPP
