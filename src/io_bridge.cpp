#include "io_bridge.hpp"
#include "resize_coalescer.hpp"
#include "signal_handler.hpp"
#include "utils.hpp"

#include <atomic>
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <termios.h>
#include <thread>
#include <unistd.h>
#include <vector>

namespace {
    // Raw mode for the lifetime of the bridge; restored on every exit path.
    class RawTerminal {
    public:
        explicit RawTerminal(int fd) : fd_(fd) {
            if (isatty(fd_) && tcgetattr(fd_, &orig_) == 0) {
                struct termios raw = orig_;
                cfmakeraw(&raw);
                if (tcsetattr(fd_, TCSANOW, &raw) == 0) {
                    active_ = true;
                }
            }
        }

        ~RawTerminal() {
            if (!active_) {
                return;
            }
            tcsetattr(fd_, TCSANOW, &orig_);
            // Drop terminal replies (e.g. cursor reports) still queued for us.
            tcflush(fd_, TCIFLUSH);
        }

        bool active() const { return active_; }

    private:
        int fd_;
        struct termios orig_{};
        bool active_ = false;
    };

    bool write_fd(int fd, const uint8_t* data, size_t len) {
        size_t off = 0;
        while (off < len) {
            ssize_t w = write(fd, data + off, len - off);
            if (w < 0) {
                if (errno == EINTR) continue;
                return false;
            }
            off += static_cast<size_t>(w);
        }
        return true;
    }

    // Modes a remote full-screen program may have left enabled.
    const char* kResetSequences = "\x1b[?1000l\x1b[?1002l\x1b[?1003l\x1b[?1006l\x1b[?1015l\x1b[?2004l\x1b[?1004l";
}

SessionError run_pty_bridge(SessionRegistry& registry, const std::string& address, int in_fd, int out_fd) {
    std::shared_ptr<PtyChannel> channel;
    SessionError err = registry.enter_pty_mode(address, channel);
    if (err != SessionError::OK) {
        return err;
    }
    LOG_INFO("PTY shell active on %s. Press Ctrl-D to return to the listener prompt.", address.c_str());

    SessionError result = SessionError::OK;
    bool was_raw = false;
    {
        RawTerminal raw(in_fd);

        ResizeCoalescer coalescer(registry, address, out_fd);
        coalescer.start();
        coalescer.signal_resize();

        std::atomic<bool> remote_done{false};
        std::thread output_thread([&channel, &remote_done, out_fd]() {
            std::vector<uint8_t> data;
            while (channel->pop(data, 200)) {
                if (!data.empty() && !write_fd(out_fd, data.data(), data.size())) {
                    LOG_WARN("Cannot write PTY output to the terminal: %s", error_to_string(errno).c_str());
                    break;
                }
            }
            remote_done.store(true);
        });

        std::vector<uint8_t> buf(4096);
        while (!remote_done.load()) {
            if (shutdown_requested()) {
                break;
            }
            if (consume_resize_signal()) {
                coalescer.signal_resize();
            }

            pollfd pfd{};
            pfd.fd = in_fd;
            pfd.events = POLLIN;
            int pr = poll(&pfd, 1, 200);
            if (pr < 0) {
                if (errno == EINTR) continue;
                LOG_ERROR("poll() on terminal failed: %s", error_to_string(errno).c_str());
                break;
            }
            if (pr == 0) {
                continue;
            }

            ssize_t n = read(in_fd, buf.data(), buf.size());
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n <= 0) {
                break;
            }

            size_t len = static_cast<size_t>(n);
            bool detach = false;
            const void* key = std::memchr(buf.data(), DETACH_KEY, len);
            if (key != nullptr) {
                len = static_cast<size_t>(static_cast<const uint8_t*>(key) - buf.data());
                detach = true;
            }
            if (len > 0) {
                err = registry.send_pty_input(address, std::vector<uint8_t>(buf.begin(), buf.begin() + len));
                if (err == SessionError::WRONG_MODE) {
                    // Remote shell exited between polls.
                    break;
                }
                if (err != SessionError::OK) {
                    result = err;
                    break;
                }
            }
            if (detach) {
                break;
            }
        }

        if (result == SessionError::OK) {
            err = registry.exit_pty_mode(address);
            // An unconfirmed exit leaves the session usable; its late
            // acknowledgement is skipped.
            if (err != SessionError::OK && err != SessionError::RESPONSE_TIMEOUT) {
                result = err;
            }
        }
        channel->close();
        output_thread.join();
        coalescer.stop();
        was_raw = raw.active();
    }

    if (was_raw && !write_fd(out_fd, reinterpret_cast<const uint8_t*>(kResetSequences), std::strlen(kResetSequences))) {
        LOG_DEBUG("terminal reset sequence not written");
    }
    LOG_INFO("Left PTY shell on %s", address.c_str());
    return result;
}
