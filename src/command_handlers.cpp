#include "command_handlers.hpp"
#include "control_protocol.hpp"
#include "framing.hpp"
#include "utils.hpp"
#include "wire_codec.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {
    bool has_command(const std::string& line, const char* cmd, std::string& args) {
        size_t len = std::strlen(cmd);
        if (line.compare(0, len, cmd) != 0) {
            return false;
        }
        if (line.size() == len) {
            args.clear();
            return true;
        }
        if (line[len] != ' ') {
            return false;
        }
        args = line.substr(len + 1);
        return true;
    }

    bool parse_size(const std::string& text, size_t& out) {
        if (text.empty() || text.size() > 19) {
            return false;
        }
        size_t v = 0;
        for (char c : text) {
            if (c < '0' || c > '9') return false;
            v = v * 10 + static_cast<size_t>(c - '0');
        }
        out = v;
        return true;
    }
}

CommandProcessor::CommandProcessor(LineChannel& channel, const ProcessorOptions& options)
    : channel_(channel), options_(options),
      tunnels_(channel, options.write_timeout_ms, options.tunnel_dial_timeout_ms) {}

CommandProcessor::~CommandProcessor() {
    reset();
}

void CommandProcessor::reset() {
    stop_pty();
    tunnels_.close_all();
    abort_upload();
}

ProcessOutcome CommandProcessor::process(const std::string& raw) {
    std::string command = raw;
    if (!command.empty() && command.back() == '\r') command.pop_back();

    std::string args;
    if (command == protocol::CMD_PING) {
        return handle_ping();
    }
    if (command == protocol::CMD_EXIT) {
        LOG_INFO("Listener requested disconnect");
        return ProcessOutcome::EXIT;
    }
    // Tunnel lines carry no end-of-output marker.
    if (has_command(command, protocol::CMD_TUNNEL_DATA, args)) {
        return tunnels_.data(args) ? ProcessOutcome::CONTINUE : ProcessOutcome::FAILED;
    }
    if (has_command(command, protocol::CMD_TUNNEL_OPEN, args)) {
        return tunnels_.open(args) ? ProcessOutcome::CONTINUE : ProcessOutcome::FAILED;
    }
    if (has_command(command, protocol::CMD_TUNNEL_CLOSE, args)) {
        return tunnels_.close(args) ? ProcessOutcome::CONTINUE : ProcessOutcome::FAILED;
    }
    if (command == protocol::CMD_PTY_MODE) {
        return handle_pty_mode();
    }
    if (has_command(command, protocol::CMD_PTY_DATA, args)) {
        return handle_pty_data(args);
    }
    if (has_command(command, protocol::CMD_PTY_RESIZE, args)) {
        return handle_pty_resize(args);
    }
    if (command == protocol::CMD_PTY_EXIT) {
        return handle_pty_exit();
    }
    if (has_command(command, protocol::CMD_START_UPLOAD, args)) {
        return handle_start_upload(args);
    }
    if (has_command(command, protocol::CMD_UPLOAD_CHUNK, args)) {
        return handle_upload_chunk(args);
    }
    if (has_command(command, protocol::CMD_END_UPLOAD, args)) {
        return handle_end_upload();
    }
    if (has_command(command, protocol::CMD_DOWNLOAD, args)) {
        return handle_download(args);
    }
    return handle_shell(command);
}

ProcessOutcome CommandProcessor::reply(const std::string& text) {
    std::string out;
    if (!text.empty()) {
        out = framing::build_plain_line(text);
    }
    out += framing::end_of_output_line();
    IoStatus st = channel_.write_raw(out, options_.write_timeout_ms);
    if (st != IoStatus::OK) {
        LOG_ERROR("Failed to send reply: %s", io_status_name(st));
        return ProcessOutcome::FAILED;
    }
    return ProcessOutcome::CONTINUE;
}

bool CommandProcessor::send_data(const std::vector<uint8_t>& data) {
    std::string encoded;
    if (!wire_codec::compress_to_hex(data, encoded)) {
        LOG_ERROR("Failed to encode output");
        return false;
    }
    IoStatus st = channel_.write_raw(framing::build_data_line(encoded), options_.write_timeout_ms);
    if (st != IoStatus::OK) {
        LOG_ERROR("Failed to send output: %s", io_status_name(st));
        return false;
    }
    return true;
}

bool CommandProcessor::send_end() {
    IoStatus st = channel_.write_raw(framing::end_of_output_line(), options_.write_timeout_ms);
    if (st != IoStatus::OK) {
        LOG_ERROR("Failed to send end of output: %s", io_status_name(st));
        return false;
    }
    return true;
}

ProcessOutcome CommandProcessor::handle_ping() {
    IoStatus st = channel_.write_line(protocol::CMD_PONG, options_.write_timeout_ms);
    return st == IoStatus::OK ? ProcessOutcome::CONTINUE : ProcessOutcome::FAILED;
}

ProcessOutcome CommandProcessor::handle_shell(const std::string& command) {
    if (trim(command).empty()) {
        return reply("");
    }
    LOG_INFO("Executing command: %s", command.c_str());

    int fds[2];
    if (pipe(fds) != 0) {
        return reply("Error creating pipe: " + error_to_string(errno));
    }

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close(fds[0]);
        close(fds[1]);
        return reply("Error starting command: " + error_to_string(err));
    }

    if (pid == 0) { // Child process
        setpgid(0, 0);
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(fds[1], STDOUT_FILENO);
        dup2(fds[1], STDERR_FILENO);
        close(fds[0]);
        close(fds[1]);
        execl(options_.shell.c_str(), options_.shell.c_str(), "-c", command.c_str(), static_cast<char*>(nullptr));
        _exit(127);
    }

    close(fds[1]);

    std::vector<uint8_t> buf(options_.read_chunk_size);
    size_t total = 0;
    bool truncated = false;
    bool exited = false;
    bool send_failed = false;
    bool read_failed = false;
    int status = 0;

    for (;;) {
        pollfd pfd{};
        pfd.fd = fds[0];
        pfd.events = POLLIN;
        int pr = poll(&pfd, 1, 200);
        if (pr < 0) {
            if (errno == EINTR) continue;
            LOG_ERROR("poll on command output failed: %s", error_to_string(errno).c_str());
            read_failed = true;
            break;
        }
        if (pr == 0) {
            // Background children may hold the pipe open after the shell exits.
            if (!exited && waitpid(pid, &status, WNOHANG) == pid) {
                exited = true;
                continue;
            }
            if (exited) break;
            continue;
        }

        ssize_t n = read(fds[0], buf.data(), buf.size());
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            LOG_ERROR("read on command output failed: %s", error_to_string(errno).c_str());
            read_failed = true;
            break;
        }
        if (n == 0) {
            break;
        }

        size_t take = std::min(static_cast<size_t>(n), options_.max_buffer_size - total);
        if (take > 0) {
            if (!send_data(std::vector<uint8_t>(buf.begin(), buf.begin() + take))) {
                send_failed = true;
                break;
            }
            total += take;
        }
        if (take < static_cast<size_t>(n)) {
            truncated = true;
            break;
        }
    }
    close(fds[0]);

    if (truncated || send_failed || read_failed) {
        kill(-pid, SIGKILL);
    }
    if (!exited) {
        waitpid(pid, &status, 0);
    }
    if (WIFEXITED(status)) {
        LOG_DEBUG("command exited with status %d, %zu bytes of output", WEXITSTATUS(status), total);
    }

    if (send_failed) {
        return ProcessOutcome::FAILED;
    }
    if (truncated) {
        static const std::string notice = "\n...output truncated\n";
        if (!send_data(std::vector<uint8_t>(notice.begin(), notice.end()))) {
            return ProcessOutcome::FAILED;
        }
    }
    return send_end() ? ProcessOutcome::CONTINUE : ProcessOutcome::FAILED;
}

void CommandProcessor::abort_upload() {
    if (!upload_active_) {
        return;
    }
    upload_file_.close();
    std::error_code ec;
    fs::remove(upload_path_, ec);
    LOG_WARN("Upload to %s abandoned after %zu bytes", upload_path_.c_str(), upload_received_);
    upload_active_ = false;
    upload_path_.clear();
    upload_expected_ = 0;
    upload_received_ = 0;
}

ProcessOutcome CommandProcessor::handle_start_upload(const std::string& args) {
    abort_upload();

    size_t sp = args.find(' ');
    size_t expected = 0;
    if (sp == std::string::npos || !parse_size(args.substr(0, sp), expected) || sp + 1 >= args.size()) {
        return reply("Invalid start_upload command");
    }
    std::string path = args.substr(sp + 1);

    upload_file_.open(path, std::ios::binary | std::ios::trunc);
    if (!upload_file_) {
        return reply("Error opening " + path + ": " + error_to_string(errno));
    }
    upload_active_ = true;
    upload_path_ = path;
    upload_expected_ = expected;
    upload_received_ = 0;
    LOG_INFO("Receiving upload: %s (%zu bytes)", path.c_str(), expected);
    return reply(protocol::REPLY_OK);
}

ProcessOutcome CommandProcessor::handle_upload_chunk(const std::string& payload) {
    if (!upload_active_) {
        return reply("No active upload");
    }
    std::vector<uint8_t> data;
    std::string error;
    if (!wire_codec::decompress_hex(payload, data, &error)) {
        abort_upload();
        return reply("Decompression error: " + error);
    }
    if (upload_received_ + data.size() > upload_expected_) {
        abort_upload();
        return reply("Upload exceeds announced size");
    }
    upload_file_.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!upload_file_) {
        int err = errno;
        abort_upload();
        return reply("Write error: " + error_to_string(err));
    }
    upload_received_ += data.size();
    return reply(protocol::REPLY_OK);
}

ProcessOutcome CommandProcessor::handle_end_upload() {
    if (!upload_active_) {
        return reply("No active upload");
    }
    if (upload_received_ != upload_expected_) {
        std::string msg = "Size mismatch: expected " + std::to_string(upload_expected_) +
                          " bytes, received " + std::to_string(upload_received_);
        abort_upload();
        return reply(msg);
    }
    upload_file_.close();
    if (upload_file_.fail()) {
        int err = errno;
        abort_upload();
        return reply("Write error: " + error_to_string(err));
    }
    LOG_INFO("Upload complete: %s (%zu bytes)", upload_path_.c_str(), upload_received_);
    std::string msg = std::string(protocol::REPLY_OK) + "\n" + std::to_string(upload_received_);
    upload_active_ = false;
    upload_path_.clear();
    upload_expected_ = 0;
    upload_received_ = 0;
    return reply(msg);
}

ProcessOutcome CommandProcessor::handle_download(const std::string& path) {
    if (path.empty()) {
        return reply("Invalid download command");
    }
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return reply("Error reading file: " + path + " is not a regular file");
    }
    uintmax_t size = fs::file_size(path, ec);
    if (ec) {
        return reply("Error reading file: " + ec.message());
    }
    if (size > options_.max_buffer_size) {
        return reply("Error reading file: " + std::to_string(size) + " bytes exceeds the " +
                     std::to_string(options_.max_buffer_size) + " byte transfer limit");
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return reply("Error reading file: " + error_to_string(errno));
    }
    std::vector<uint8_t> data(static_cast<size_t>(size));
    if (size > 0 && !in.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(size))) {
        return reply("Error reading file: short read");
    }

    LOG_INFO("Sending download: %s (%zu bytes)", path.c_str(), data.size());
    if (!send_data(data) || !send_end()) {
        return ProcessOutcome::FAILED;
    }
    return ProcessOutcome::CONTINUE;
}

void CommandProcessor::stop_pty() {
    pty_stop_.store(true);
    if (pty_thread_.joinable()) {
        pty_thread_.join();
    }
    if (pty_) {
        pty_->terminate_child();
        pty_.reset();
    }
    pty_stop_.store(false);
    pty_active_.store(false);
}

ProcessOutcome CommandProcessor::handle_pty_mode() {
    if (pty_active_.load()) {
        return reply("Already in PTY mode");
    }
    // A shell that exited on its own leaves a finished pump behind.
    stop_pty();

    pty_ = std::make_unique<PTYHandler>();
    if (!pty_->create_pty_and_fork_shell()) {
        pty_.reset();
        return reply("Failed to start PTY: could not spawn a shell");
    }

    pty_active_.store(true);
    ProcessOutcome outcome = reply(protocol::REPLY_OK);
    if (outcome != ProcessOutcome::CONTINUE) {
        stop_pty();
        return outcome;
    }
    pty_thread_ = std::thread(&CommandProcessor::pty_pump_loop, this);
    LOG_INFO("Entered PTY mode");
    return ProcessOutcome::CONTINUE;
}

void CommandProcessor::pty_pump_loop() {
    std::vector<char> buf(options_.read_chunk_size);
    while (!pty_stop_.load()) {
        ssize_t n = pty_->pty_read(buf.data(), buf.size(), 200);
        if (n == 0) {
            continue;
        }
        if (n < 0) {
            if (pty_active_.exchange(false)) {
                LOG_INFO("PTY shell exited");
                IoStatus st = channel_.write_line(protocol::CMD_PTY_EXIT, options_.write_timeout_ms);
                if (st != IoStatus::OK) {
                    LOG_ERROR("Failed to report PTY exit: %s", io_status_name(st));
                }
            }
            return;
        }

        std::string encoded;
        if (!wire_codec::compress_to_hex(std::vector<uint8_t>(buf.begin(), buf.begin() + n), encoded)) {
            LOG_ERROR("Error encoding PTY data");
            continue;
        }
        IoStatus st = channel_.write_line(std::string(protocol::CMD_PTY_DATA) + " " + encoded, options_.write_timeout_ms);
        if (st != IoStatus::OK) {
            LOG_ERROR("Failed to send PTY data: %s", io_status_name(st));
            return;
        }
    }
}

ProcessOutcome CommandProcessor::handle_pty_data(const std::string& payload) {
    if (!pty_active_.load() || !pty_) {
        LOG_WARN("PTY data received while not in PTY mode");
        return ProcessOutcome::CONTINUE;
    }
    std::vector<uint8_t> data;
    std::string error;
    if (!wire_codec::decompress_hex(payload, data, &error)) {
        LOG_WARN("Failed to decode PTY data: %s", error.c_str());
        return ProcessOutcome::CONTINUE;
    }
    if (!pty_->pty_write(reinterpret_cast<const char*>(data.data()), data.size())) {
        LOG_WARN("Dropped %zu bytes of PTY input", data.size());
    }
    return ProcessOutcome::CONTINUE;
}

ProcessOutcome CommandProcessor::handle_pty_resize(const std::string& payload) {
    if (!pty_active_.load() || !pty_) {
        LOG_WARN("PTY resize received while not in PTY mode");
        return ProcessOutcome::CONTINUE;
    }
    int rows = 0;
    int cols = 0;
    if (!control::parse_resize(payload, rows, cols)) {
        LOG_WARN("Invalid resize command: %s", payload.c_str());
        return ProcessOutcome::CONTINUE;
    }
    pty_->apply_window_size(rows, cols);
    LOG_DEBUG("PTY resized to %dx%d", cols, rows);
    return ProcessOutcome::CONTINUE;
}

ProcessOutcome CommandProcessor::handle_pty_exit() {
    bool was_active = pty_active_.exchange(false);
    stop_pty();
    if (was_active) {
        LOG_INFO("Exiting PTY mode (requested by listener)");
    }
    // Always acknowledged, even when the shell had already exited.
    return reply(protocol::REPLY_OK);
}
