#ifndef TUNNEL_HANDLER_HPP
#define TUNNEL_HANDLER_HPP

#include "line_channel.hpp"

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

// Agent end of tunnelled TCP connections. TUNNEL_OPEN dials the target and
// starts a reader that streams the socket back as TUNNEL_DATA lines.
class TunnelHandler {
public:
    TunnelHandler(LineChannel& channel, int write_timeout_ms, int dial_timeout_ms);
    ~TunnelHandler();

    TunnelHandler(const TunnelHandler&) = delete;
    TunnelHandler& operator=(const TunnelHandler&) = delete;

    // Each takes the arguments after the command word. False only when the
    // reply could not be written to the listener.
    bool open(const std::string& args);
    bool data(const std::string& args);
    bool close(const std::string& args);

    void close_all();

private:
    struct Stream {
        std::string tunnel_id;
        std::string conn_id;
        int fd = -1;
        std::thread reader;
        std::mutex write_mutex;
        std::atomic<bool> closing{false};
        std::atomic<bool> finished{false};
    };
    using StreamPtr = std::shared_ptr<Stream>;

    void reader_loop(const StreamPtr& stream);
    bool send(const std::string& line);
    void release(const StreamPtr& stream);
    void reap_finished();
    StreamPtr find(const std::string& key);

    LineChannel& channel_;
    int write_timeout_ms_;
    int dial_timeout_ms_;

    std::mutex mutex_;
    std::map<std::string, StreamPtr> streams_;
};

#endif // TUNNEL_HANDLER_HPP
