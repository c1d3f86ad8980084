#ifndef TRANSFER_HPP
#define TRANSFER_HPP

#include "protocol.hpp"
#include "session_registry.hpp"

#include <string>

enum class TransferStatus {
    OK,
    LOCAL_IO_ERROR,  // session intact
    TRANSPORT_ERROR, // session should be dropped
    PROTOCOL_ERROR,  // undecodable reply, session intact
    REMOTE_ERROR     // agent reported a failure, session intact
};

const char* transfer_status_name(TransferStatus status);
bool is_session_fatal(TransferStatus status);

struct TransferResult {
    TransferStatus status = TransferStatus::OK;
    std::string message;
    size_t bytes = 0;

    bool ok() const { return status == TransferStatus::OK; }
};

struct TransferOptions {
    size_t chunk_size = protocol::CHUNK_SIZE;
    int ack_timeout_ms = protocol::TRANSFER_ACK_TIMEOUT * 1000;
    int download_timeout_ms = protocol::DOWNLOAD_TIMEOUT * 1000;
};

// File transfer over the command channel of one session.
class TransferEngine {
public:
    TransferEngine(SessionRegistry& registry, const TransferOptions& options = TransferOptions());

    TransferResult upload(const std::string& address, const std::string& local_path, const std::string& remote_path);
    TransferResult download(const std::string& address, const std::string& remote_path, const std::string& local_path);

private:
    TransferResult exchange(const std::string& address, const std::string& command, int timeout_ms,
                            std::string& response);

    SessionRegistry& registry_;
    TransferOptions options_;
};

#endif // TRANSFER_HPP
