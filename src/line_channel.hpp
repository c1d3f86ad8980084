#ifndef LINE_CHANNEL_HPP
#define LINE_CHANNEL_HPP

#include "connection.hpp"
#include "protocol.hpp"

#include <mutex>
#include <string>
#include <vector>

// Newline-delimited reader/writer over a Connection. Reads and writes are
// independently serialized so one reader thread and many writers can share it.
class LineChannel {
public:
    explicit LineChannel(Connection& conn, size_t max_line = protocol::MAX_BUFFER_SIZE);

    // Returns the next line without its terminator. Lines longer than the
    // limit are discarded with a warning and reading continues.
    IoStatus read_line(std::string& line, int timeout_ms);

    // Appends '\n' when missing.
    IoStatus write_line(const std::string& line, int timeout_ms);
    // Writes pre-framed bytes as one unit (several lines at once).
    IoStatus write_raw(const std::string& data, int timeout_ms);

    Connection& connection() { return conn_; }

private:
    bool extract_line(std::string& line);

    Connection& conn_;
    size_t max_line_;

    std::mutex read_mutex_;
    std::string buffer_;
    size_t start_ = 0;
    size_t scan_ = 0;
    bool discarding_ = false;
    std::vector<char> chunk_;

    std::mutex write_mutex_;
};

#endif // LINE_CHANNEL_HPP
