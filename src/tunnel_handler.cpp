#include "tunnel_handler.hpp"
#include "protocol.hpp"
#include "tls_connection.hpp"
#include "tunnel_wire.hpp"
#include "utils.hpp"
#include "wire_codec.hpp"

#include <cerrno>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <vector>

namespace {
    std::string stream_key(const std::string& tunnel_id, const std::string& conn_id) {
        return tunnel_id + " " + conn_id;
    }
}

TunnelHandler::TunnelHandler(LineChannel& channel, int write_timeout_ms, int dial_timeout_ms)
    : channel_(channel), write_timeout_ms_(write_timeout_ms), dial_timeout_ms_(dial_timeout_ms) {}

TunnelHandler::~TunnelHandler() {
    close_all();
}

bool TunnelHandler::send(const std::string& line) {
    IoStatus st = channel_.write_line(line, write_timeout_ms_);
    if (st != IoStatus::OK) {
        LOG_ERROR("Failed to send tunnel line: %s", io_status_name(st));
        return false;
    }
    return true;
}

TunnelHandler::StreamPtr TunnelHandler::find(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = streams_.find(key);
    return it == streams_.end() ? nullptr : it->second;
}

bool TunnelHandler::open(const std::string& args) {
    reap_finished();

    tunnel_wire::TunnelLine request;
    if (!tunnel_wire::parse_line(std::string(protocol::CMD_TUNNEL_OPEN) + " " + args, request)) {
        LOG_WARN("Malformed tunnel open: %s", args.c_str());
        return true;
    }
    std::string key = stream_key(request.tunnel_id, request.conn_id);
    std::string reject = tunnel_wire::build_line(protocol::CMD_TUNNEL_CLOSE, request.tunnel_id, request.conn_id);

    std::string host;
    int port = 0;
    if (!TLSConnection::split_host_port(request.payload, host, port)) {
        LOG_WARN("Tunnel %s: invalid target '%s'", key.c_str(), request.payload.c_str());
        return send(reject);
    }
    if (find(key)) {
        LOG_WARN("Tunnel %s already open", key.c_str());
        return send(reject);
    }

    intptr_t fd = TLSConnection::dial(host, port, dial_timeout_ms_);
    if (fd < 0) {
        LOG_WARN("Tunnel %s: cannot reach %s", key.c_str(), request.payload.c_str());
        return send(reject);
    }

    auto stream = std::make_shared<Stream>();
    stream->tunnel_id = request.tunnel_id;
    stream->conn_id = request.conn_id;
    stream->fd = static_cast<int>(fd);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        streams_[key] = stream;
    }
    LOG_INFO("Tunnel %s connected to %s", key.c_str(), request.payload.c_str());

    // OK goes out before the reader can send the first data line.
    if (!send(tunnel_wire::build_line(protocol::CMD_TUNNEL_OK, request.tunnel_id, request.conn_id))) {
        return false;
    }
    stream->reader = std::thread([this, stream]() { reader_loop(stream); });
    return true;
}

bool TunnelHandler::data(const std::string& args) {
    tunnel_wire::TunnelLine line;
    if (!tunnel_wire::parse_line(std::string(protocol::CMD_TUNNEL_DATA) + " " + args, line)) {
        LOG_WARN("Malformed tunnel data line");
        return true;
    }
    StreamPtr stream = find(stream_key(line.tunnel_id, line.conn_id));
    if (!stream) {
        LOG_DEBUG("Data for unknown tunnel %s %s", line.tunnel_id.c_str(), line.conn_id.c_str());
        return send(tunnel_wire::build_line(protocol::CMD_TUNNEL_CLOSE, line.tunnel_id, line.conn_id));
    }

    std::vector<uint8_t> bytes;
    std::string error;
    if (!wire_codec::decompress_hex(line.payload, bytes, &error)) {
        LOG_WARN("Tunnel %s %s: bad payload: %s", line.tunnel_id.c_str(), line.conn_id.c_str(), error.c_str());
        return true;
    }

    std::lock_guard<std::mutex> lock(stream->write_mutex);
    if (stream->closing || stream->fd < 0) {
        return true;
    }
    if (!tunnel_wire::write_fd_all(stream->fd, bytes.data(), bytes.size(), write_timeout_ms_)) {
        LOG_WARN("Tunnel %s %s: write to target failed", line.tunnel_id.c_str(), line.conn_id.c_str());
        // The reader sees the shutdown and reports the close.
        ::shutdown(stream->fd, SHUT_RDWR);
    }
    return true;
}

bool TunnelHandler::close(const std::string& args) {
    tunnel_wire::TunnelLine line;
    if (!tunnel_wire::parse_line(std::string(protocol::CMD_TUNNEL_CLOSE) + " " + args, line)) {
        LOG_WARN("Malformed tunnel close line");
        return true;
    }
    StreamPtr stream;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = streams_.find(stream_key(line.tunnel_id, line.conn_id));
        if (it == streams_.end()) {
            return true;
        }
        stream = it->second;
        streams_.erase(it);
    }
    release(stream);
    LOG_INFO("Tunnel %s %s closed by listener", line.tunnel_id.c_str(), line.conn_id.c_str());
    return true;
}

void TunnelHandler::reader_loop(const StreamPtr& stream) {
    std::vector<uint8_t> buf(tunnel_wire::READ_CHUNK);
    while (!stream->closing) {
        pollfd pfd{};
        pfd.fd = stream->fd;
        pfd.events = POLLIN;
        int rc = ::poll(&pfd, 1, 200);
        if (rc == 0) continue;
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }
        ssize_t n = ::recv(stream->fd, buf.data(), buf.size(), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;

        std::string encoded;
        if (!wire_codec::compress_to_hex(std::vector<uint8_t>(buf.begin(), buf.begin() + n), encoded)) {
            LOG_ERROR("Tunnel %s %s: failed to encode data", stream->tunnel_id.c_str(), stream->conn_id.c_str());
            break;
        }
        if (!send(tunnel_wire::build_line(protocol::CMD_TUNNEL_DATA, stream->tunnel_id, stream->conn_id, encoded))) {
            break;
        }
    }
    if (!stream->closing) {
        LOG_INFO("Tunnel %s %s closed by target", stream->tunnel_id.c_str(), stream->conn_id.c_str());
        send(tunnel_wire::build_line(protocol::CMD_TUNNEL_CLOSE, stream->tunnel_id, stream->conn_id));
    }
    stream->finished = true;
}

void TunnelHandler::release(const StreamPtr& stream) {
    stream->closing = true;
    {
        std::lock_guard<std::mutex> lock(stream->write_mutex);
        if (stream->fd >= 0) {
            ::shutdown(stream->fd, SHUT_RDWR);
        }
    }
    if (stream->reader.joinable()) {
        stream->reader.join();
    }
    std::lock_guard<std::mutex> lock(stream->write_mutex);
    if (stream->fd >= 0) {
        ::close(stream->fd);
        stream->fd = -1;
    }
}

void TunnelHandler::reap_finished() {
    std::vector<StreamPtr> done;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = streams_.begin(); it != streams_.end();) {
            if (it->second->finished) {
                done.push_back(it->second);
                it = streams_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (const auto& stream : done) {
        release(stream);
    }
}

void TunnelHandler::close_all() {
    std::map<std::string, StreamPtr> streams;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        streams.swap(streams_);
    }
    for (auto& entry : streams) {
        release(entry.second);
    }
    if (!streams.empty()) {
        LOG_INFO("Closed %zu tunnelled connection(s)", streams.size());
    }
}
