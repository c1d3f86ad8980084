#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <vector>

// Byte conduit from an agent's pseudo-terminal to the operator console.
// Producer: the session's reader worker. Consumer: the console bridge.
class PtyChannel {
public:
    explicit PtyChannel(size_t max_pending_bytes);

    // Returns false (and drops the data) when closed or over capacity.
    bool push(std::vector<uint8_t> data);

    // Blocks up to timeout_ms; a timeout returns true with `data` empty.
    // Returns false once closed and drained.
    bool pop(std::vector<uint8_t>& data, int timeout_ms);

    void close();
    bool closed() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::vector<uint8_t>> queue_;
    size_t pending_bytes_ = 0;
    size_t max_pending_bytes_;
    bool closed_ = false;
};
