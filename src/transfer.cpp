#include "transfer.hpp"
#include "utils.hpp"
#include "wire_codec.hpp"

#include <algorithm>
#include <cerrno>
#include <fstream>
#include <iterator>
#include <sstream>
#include <vector>

namespace {
    TransferResult failure(TransferStatus status, const std::string& message) {
        TransferResult result;
        result.status = status;
        result.message = message;
        return result;
    }

    TransferStatus from_session_error(SessionError err) {
        switch (err) {
            case SessionError::OK: return TransferStatus::OK;
            case SessionError::WRONG_MODE:
            case SessionError::REJECTED: return TransferStatus::PROTOCOL_ERROR;
            default: return TransferStatus::TRANSPORT_ERROR;
        }
    }
}

const char* transfer_status_name(TransferStatus status) {
    switch (status) {
        case TransferStatus::OK: return "ok";
        case TransferStatus::LOCAL_IO_ERROR: return "local I/O error";
        case TransferStatus::TRANSPORT_ERROR: return "transport error";
        case TransferStatus::PROTOCOL_ERROR: return "protocol error";
        case TransferStatus::REMOTE_ERROR: return "remote error";
    }
    return "unknown";
}

bool is_session_fatal(TransferStatus status) {
    return status == TransferStatus::TRANSPORT_ERROR;
}

TransferEngine::TransferEngine(SessionRegistry& registry, const TransferOptions& options)
    : registry_(registry), options_(options) {}

TransferResult TransferEngine::exchange(const std::string& address, const std::string& command, int timeout_ms,
                                        std::string& response) {
    SessionError err = registry_.execute(address, command, timeout_ms, response);
    if (err != SessionError::OK) {
        return failure(from_session_error(err), session_error_name(err));
    }
    return TransferResult();
}

TransferResult TransferEngine::upload(const std::string& address, const std::string& local_path,
                                      const std::string& remote_path) {
    std::ifstream in(local_path, std::ios::binary);
    if (!in) {
        return failure(TransferStatus::LOCAL_IO_ERROR, "cannot open " + local_path + ": " + error_to_string(errno));
    }
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return failure(TransferStatus::LOCAL_IO_ERROR, "cannot read " + local_path);
    }

    LOG_INFO("Uploading %s -> %s:%s (%zu bytes)", local_path.c_str(), address.c_str(), remote_path.c_str(), data.size());

    std::string response;
    std::string start = std::string(protocol::CMD_START_UPLOAD) + " " + std::to_string(data.size()) + " " + remote_path;
    TransferResult result = exchange(address, start, options_.ack_timeout_ms, response);
    if (!result.ok()) {
        return result;
    }
    if (trim(response) != protocol::REPLY_OK) {
        return failure(TransferStatus::REMOTE_ERROR, trim(response));
    }

    size_t chunks = 0;
    for (size_t off = 0; off < data.size(); off += options_.chunk_size) {
        size_t len = std::min(options_.chunk_size, data.size() - off);
        std::string encoded;
        if (!wire_codec::compress_to_hex(std::vector<uint8_t>(data.begin() + off, data.begin() + off + len), encoded)) {
            return failure(TransferStatus::LOCAL_IO_ERROR, "failed to encode chunk at offset " + std::to_string(off));
        }
        result = exchange(address, std::string(protocol::CMD_UPLOAD_CHUNK) + " " + encoded, options_.ack_timeout_ms,
                          response);
        if (!result.ok()) {
            result.message = "chunk " + std::to_string(chunks + 1) + ": " + result.message;
            return result;
        }
        if (trim(response) != protocol::REPLY_OK) {
            return failure(TransferStatus::REMOTE_ERROR, trim(response));
        }
        ++chunks;
    }

    result = exchange(address, protocol::CMD_END_UPLOAD, options_.ack_timeout_ms, response);
    if (!result.ok()) {
        return result;
    }

    std::istringstream reply(response);
    std::string status_line;
    std::string count_line;
    std::getline(reply, status_line);
    std::getline(reply, count_line);
    if (trim(status_line) != protocol::REPLY_OK) {
        return failure(TransferStatus::REMOTE_ERROR, trim(response));
    }
    if (trim(count_line) != std::to_string(data.size())) {
        return failure(TransferStatus::REMOTE_ERROR,
                       "agent stored " + trim(count_line) + " bytes, expected " + std::to_string(data.size()));
    }

    LOG_INFO("Upload complete: %zu bytes in %zu chunks", data.size(), chunks);
    result.bytes = data.size();
    result.message = "uploaded " + std::to_string(data.size()) + " bytes";
    return result;
}

TransferResult TransferEngine::download(const std::string& address, const std::string& remote_path,
                                        const std::string& local_path) {
    LOG_INFO("Downloading %s:%s -> %s", address.c_str(), remote_path.c_str(), local_path.c_str());

    std::vector<framing::Frame> frames;
    SessionError err = registry_.execute_frames(address, std::string(protocol::CMD_DOWNLOAD) + " " + remote_path,
                                                options_.download_timeout_ms, frames);
    if (err != SessionError::OK) {
        return failure(from_session_error(err), session_error_name(err));
    }

    const framing::Frame* payload = nullptr;
    std::string remote_text;
    for (const auto& frame : frames) {
        if (frame.type == framing::FrameType::DATA) {
            if (payload != nullptr) {
                return failure(TransferStatus::PROTOCOL_ERROR, "more than one data frame in download reply");
            }
            payload = &frame;
        } else {
            if (!remote_text.empty()) remote_text += '\n';
            remote_text += frame.text;
        }
    }
    if (payload == nullptr) {
        if (remote_text.empty()) {
            return failure(TransferStatus::PROTOCOL_ERROR, "empty download reply");
        }
        return failure(TransferStatus::REMOTE_ERROR, remote_text);
    }

    std::vector<uint8_t> data;
    std::string error;
    if (!wire_codec::decompress_hex(payload->text, data, &error)) {
        return failure(TransferStatus::PROTOCOL_ERROR, "cannot decode download: " + error);
    }

    std::ofstream out(local_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return failure(TransferStatus::LOCAL_IO_ERROR, "cannot open " + local_path + ": " + error_to_string(errno));
    }
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    out.close();
    if (out.fail()) {
        return failure(TransferStatus::LOCAL_IO_ERROR, "cannot write " + local_path + ": " + error_to_string(errno));
    }

    LOG_INFO("Download complete: %zu bytes", data.size());
    TransferResult result;
    result.bytes = data.size();
    result.message = "downloaded " + std::to_string(data.size()) + " bytes";
    return result;
}
