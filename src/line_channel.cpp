#include "line_channel.hpp"
#include "utils.hpp"

#include <chrono>

const char* io_status_name(IoStatus status) {
    switch (status) {
        case IoStatus::OK: return "ok";
        case IoStatus::TIMEOUT: return "timeout";
        case IoStatus::CLOSED: return "connection closed";
        case IoStatus::ERROR: return "I/O error";
    }
    return "unknown";
}

LineChannel::LineChannel(Connection& conn, size_t max_line)
    : conn_(conn), max_line_(max_line), chunk_(64 * 1024) {}

bool LineChannel::extract_line(std::string& line) {
    while (true) {
        size_t nl = buffer_.find('\n', scan_);
        if (nl == std::string::npos) {
            scan_ = buffer_.size();
            if (buffer_.size() - start_ > max_line_) {
                if (!discarding_) {
                    LOG_WARN("line from %s exceeds %zu bytes; discarding it", conn_.peer_address().c_str(), max_line_);
                }
                discarding_ = true;
                buffer_.clear();
                start_ = 0;
                scan_ = 0;
            }
            return false;
        }

        bool drop = discarding_;
        if (!drop) {
            line.assign(buffer_, start_, nl - start_);
        }
        discarding_ = false;
        start_ = nl + 1;
        scan_ = start_;
        if (start_ > buffer_.size() / 2) {
            buffer_.erase(0, start_);
            scan_ -= start_;
            start_ = 0;
        }
        if (!drop) {
            return true;
        }
    }
}

IoStatus LineChannel::read_line(std::string& line, int timeout_ms) {
    using Clock = std::chrono::steady_clock;
    auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);

    std::lock_guard<std::mutex> lock(read_mutex_);
    for (;;) {
        if (extract_line(line)) {
            return IoStatus::OK;
        }
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
        if (left <= 0) {
            return IoStatus::TIMEOUT;
        }
        size_t n = 0;
        IoStatus st = conn_.read_some(chunk_.data(), chunk_.size(), n, static_cast<int>(left));
        if (st != IoStatus::OK) {
            return st;
        }
        buffer_.append(chunk_.data(), n);
    }
}

IoStatus LineChannel::write_line(const std::string& line, int timeout_ms) {
    if (!line.empty() && line.back() == '\n') {
        return write_raw(line, timeout_ms);
    }
    return write_raw(line + "\n", timeout_ms);
}

IoStatus LineChannel::write_raw(const std::string& data, int timeout_ms) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    return conn_.write_all(data.data(), data.size(), timeout_ms);
}
