#include "pty_channel.hpp"

#include <chrono>

PtyChannel::PtyChannel(size_t max_pending_bytes) : max_pending_bytes_(max_pending_bytes) {}

bool PtyChannel::push(std::vector<uint8_t> data) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || pending_bytes_ + data.size() > max_pending_bytes_) {
            return false;
        }
        pending_bytes_ += data.size();
        queue_.push_back(std::move(data));
    }
    cv_.notify_one();
    return true;
}

bool PtyChannel::pop(std::vector<uint8_t>& data, int timeout_ms) {
    data.clear();
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this] { return !queue_.empty() || closed_; });
    if (!queue_.empty()) {
        data = std::move(queue_.front());
        queue_.pop_front();
        pending_bytes_ -= data.size();
        return true;
    }
    return !closed_;
}

void PtyChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool PtyChannel::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}
