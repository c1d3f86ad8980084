#ifndef PROTOCOL_HPP
#define PROTOCOL_HPP

#include <cstddef>

namespace protocol {

constexpr size_t BUFFER_SIZE = 1024 * 1024;          // 1 MiB socket read buffer
constexpr size_t MAX_BUFFER_SIZE = 10 * 1024 * 1024; // longest line / largest captured output
constexpr size_t CHUNK_SIZE = 65536;                 // raw bytes per upload chunk

// All command output travels inside DATA lines, so the marker can never
// appear at the start of a line by accident.
constexpr const char* END_OF_OUTPUT_MARKER = "<<<END_OF_OUTPUT>>>";
constexpr const char* DATA_PREFIX = "DATA ";

constexpr const char* CMD_PING = "PING";
constexpr const char* CMD_PONG = "PONG";
constexpr const char* CMD_AUTH_CHALLENGE = "AUTH_CHALLENGE";
constexpr const char* CMD_AUTH = "AUTH";
constexpr const char* CMD_AUTH_OK = "AUTH_OK";
constexpr const char* CMD_AUTH_FAILED = "AUTH_FAILED";
constexpr const char* CMD_IDENT = "IDENT";
constexpr const char* CMD_EXIT = "exit";
constexpr const char* CMD_START_UPLOAD = "START_UPLOAD";
constexpr const char* CMD_UPLOAD_CHUNK = "UPLOAD_CHUNK";
constexpr const char* CMD_END_UPLOAD = "END_UPLOAD";
constexpr const char* CMD_DOWNLOAD = "DOWNLOAD";

constexpr const char* CMD_PTY_MODE = "PTY_MODE";
constexpr const char* CMD_PTY_DATA = "PTY_DATA";
constexpr const char* CMD_PTY_RESIZE = "PTY_RESIZE";
constexpr const char* CMD_PTY_EXIT = "PTY_EXIT";

// Tunnelled TCP connections, keyed by "<tunnel id> <connection id>". All
// four travel out of band in both directions.
constexpr const char* CMD_TUNNEL_OPEN = "TUNNEL_OPEN";   // listener -> agent, with host:port
constexpr const char* CMD_TUNNEL_OK = "TUNNEL_OK";       // agent -> listener
constexpr const char* CMD_TUNNEL_DATA = "TUNNEL_DATA";   // gzip-hex payload
constexpr const char* CMD_TUNNEL_CLOSE = "TUNNEL_CLOSE";

constexpr const char* REPLY_OK = "OK";

// seconds
constexpr int READ_TIMEOUT = 1;
constexpr int RESPONSE_TIMEOUT = 5;
constexpr int COMMAND_TIMEOUT = 120;
constexpr int DOWNLOAD_TIMEOUT = 300;
constexpr int TRANSFER_ACK_TIMEOUT = 30;
constexpr int PTY_ENTER_TIMEOUT = 10;
constexpr int AUTH_TIMEOUT = 10;
constexpr int HANDSHAKE_TIMEOUT = 15;
constexpr int PING_INTERVAL = 30;
constexpr int TUNNEL_OPEN_TIMEOUT = 10;

constexpr int BASE_BACKOFF = 5;
constexpr int MAX_BACKOFF = 300;

} // namespace protocol

#endif // PROTOCOL_HPP
