#ifndef COMMAND_HANDLERS_HPP
#define COMMAND_HANDLERS_HPP

#include "line_channel.hpp"
#include "protocol.hpp"
#include "pty_handler.hpp"
#include "tunnel_handler.hpp"

#include <atomic>
#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

enum class ProcessOutcome {
    CONTINUE, // reply sent, read the next command
    EXIT,     // listener asked the agent to disconnect
    FAILED    // the reply could not be written
};

struct ProcessorOptions {
    size_t max_buffer_size = protocol::MAX_BUFFER_SIZE;
    size_t read_chunk_size = 4096;
    int write_timeout_ms = protocol::COMMAND_TIMEOUT * 1000;
    std::string shell = "/bin/sh";
    int tunnel_dial_timeout_ms = protocol::TUNNEL_OPEN_TIMEOUT * 1000 / 2;
};

// Executes listener commands on the agent. One command runs to completion
// before the next is read; only the PTY output pump and tunnel readers run
// alongside.
class CommandProcessor {
public:
    CommandProcessor(LineChannel& channel, const ProcessorOptions& options = ProcessorOptions());
    ~CommandProcessor();

    CommandProcessor(const CommandProcessor&) = delete;
    CommandProcessor& operator=(const CommandProcessor&) = delete;

    ProcessOutcome process(const std::string& command);

    bool in_pty_mode() const { return pty_active_.load(); }

    // Kills any interactive shell, closes tunnelled connections and abandons
    // a partial upload.
    void reset();

private:
    ProcessOutcome handle_ping();
    ProcessOutcome handle_shell(const std::string& command);
    ProcessOutcome handle_start_upload(const std::string& args);
    ProcessOutcome handle_upload_chunk(const std::string& payload);
    ProcessOutcome handle_end_upload();
    ProcessOutcome handle_download(const std::string& path);
    ProcessOutcome handle_pty_mode();
    ProcessOutcome handle_pty_data(const std::string& payload);
    ProcessOutcome handle_pty_resize(const std::string& payload);
    ProcessOutcome handle_pty_exit();

    // Status text followed by the end-of-output marker.
    ProcessOutcome reply(const std::string& text);
    bool send_data(const std::vector<uint8_t>& data);
    bool send_end();

    void abort_upload();
    void stop_pty();
    void pty_pump_loop();

    LineChannel& channel_;
    ProcessorOptions options_;

    std::ofstream upload_file_;
    std::string upload_path_;
    bool upload_active_ = false;
    size_t upload_expected_ = 0;
    size_t upload_received_ = 0;

    std::unique_ptr<PTYHandler> pty_;
    std::thread pty_thread_;
    std::atomic<bool> pty_active_{false};
    std::atomic<bool> pty_stop_{false};

    TunnelHandler tunnels_;
};

#endif // COMMAND_HANDLERS_HPP
