/**
 * @file test_command_processor.cpp
 * @brief Agent-side command execution tests.
 *
 * The processor writes into one end of an in-memory connection; the test
 * reads the protocol lines back from the other end.
 */

#include "command_handlers.hpp"
#include "framing.hpp"
#include "line_channel.hpp"
#include "memory_connection.hpp"
#include "session_registry.hpp"
#include "test_framework.hpp"
#include "wire_codec.hpp"

#include <chrono>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <string>
#include <unistd.h>
#include <vector>

namespace {
    const int kTimeoutMs = 5000;

    struct Harness {
        explicit Harness(ProcessorOptions options = ProcessorOptions())
            : pair(make_connection_pair("10.0.0.5:40000")),
              listener(*pair.first),
              agent(*pair.second),
              processor(agent, options) {}

        // Lines up to the end marker, as the registry would collect them.
        bool read_frames(std::vector<framing::Frame>& frames) {
            frames.clear();
            std::string line;
            while (listener.read_line(line, kTimeoutMs) == IoStatus::OK) {
                framing::Frame f = framing::classify_line(line);
                if (f.type == framing::FrameType::END_OF_OUTPUT) return true;
                frames.push_back(f);
            }
            return false;
        }

        bool read_response(std::string& text) {
            std::vector<framing::Frame> frames;
            if (!read_frames(frames)) return false;
            text = SessionRegistry::assemble_response("agent", frames);
            return true;
        }

        std::pair<std::unique_ptr<MemoryConnection>, std::unique_ptr<MemoryConnection>> pair;
        LineChannel listener;
        LineChannel agent;
        CommandProcessor processor;
    };

    std::string temp_path(const char* tag) {
        return "/tmp/relayshell_" + std::string(tag) + "_" + std::to_string(getpid());
    }

    std::string read_file(const std::string& path) {
        std::ifstream in(path, std::ios::binary);
        return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }

    bool file_exists(const std::string& path) {
        return access(path.c_str(), F_OK) == 0;
    }

    std::string chunk_line(const std::string& data) {
        std::string encoded;
        wire_codec::compress_to_hex(to_bytes(data), encoded);
        return std::string(protocol::CMD_UPLOAD_CHUNK) + " " + encoded;
    }
}

TEST(test_ping_gets_bare_pong) {
    Harness h;
    ASSERT_TRUE(h.processor.process("PING") == ProcessOutcome::CONTINUE, "PING handled");
    std::string line;
    ASSERT_TRUE(h.listener.read_line(line, kTimeoutMs) == IoStatus::OK, "reply read");
    ASSERT_EQ(line, std::string("PONG"), "PONG line");
    ASSERT_TRUE(h.listener.read_line(line, 100) == IoStatus::TIMEOUT, "no end marker after PONG");
    PASS("PING answered with a single PONG line");
}

TEST(test_shell_command_output) {
    Harness h;
    ASSERT_TRUE(h.processor.process("echo hello; echo err 1>&2") == ProcessOutcome::CONTINUE, "command ran");
    std::vector<framing::Frame> frames;
    ASSERT_TRUE(h.read_frames(frames), "end marker received");
    for (const auto& f : frames) {
        ASSERT_TRUE(f.type == framing::FrameType::DATA, "command output only in DATA frames");
    }
    std::string text = SessionRegistry::assemble_response("agent", frames);
    ASSERT_TRUE(text.find("hello\n") != std::string::npos, "stdout captured");
    ASSERT_TRUE(text.find("err\n") != std::string::npos, "stderr captured");
    PASS("Shell output framed as DATA lines plus end marker");
}

TEST(test_output_looking_like_marker) {
    Harness h;
    ASSERT_TRUE(h.processor.process("printf '<<<END_OF_OUTPUT>>>\\nafter\\n'") == ProcessOutcome::CONTINUE, "ran");
    std::string text;
    ASSERT_TRUE(h.read_response(text), "response read");
    ASSERT_EQ(text, std::string("<<<END_OF_OUTPUT>>>\nafter\n"), "marker text delivered as data");
    PASS("Marker text inside output does not end the response");
}

TEST(test_silent_command) {
    Harness h;
    ASSERT_TRUE(h.processor.process("true") == ProcessOutcome::CONTINUE, "ran");
    std::vector<framing::Frame> frames;
    ASSERT_TRUE(h.read_frames(frames), "end marker");
    ASSERT_TRUE(frames.empty(), "no frames for silent command");
    PASS("Command without output yields only the end marker");
}

TEST(test_output_truncated) {
    ProcessorOptions options;
    options.max_buffer_size = 1000;
    Harness h(options);
    ASSERT_TRUE(h.processor.process("head -c 100000 /dev/zero | tr '\\0' 'x'") == ProcessOutcome::CONTINUE, "ran");
    std::string text;
    ASSERT_TRUE(h.read_response(text), "response read");
    std::string notice = "\n...output truncated\n";
    ASSERT_EQ(text.size(), static_cast<size_t>(1000) + notice.size(), "capped plus notice");
    ASSERT_TRUE(text.compare(1000, std::string::npos, notice) == 0, "notice appended");
    PASS("Oversized output capped with a truncation notice");
}

TEST(test_exit_command) {
    Harness h;
    ASSERT_TRUE(h.processor.process("exit") == ProcessOutcome::EXIT, "exit recognised");
    PASS("exit ends the session");
}

TEST(test_upload_sequence) {
    Harness h;
    std::string path = temp_path("upload");
    std::string payload = "first part|second part";
    std::string text;

    h.processor.process("START_UPLOAD " + std::to_string(payload.size()) + " " + path);
    ASSERT_TRUE(h.read_response(text) && text == "OK\n", "start acknowledged");
    h.processor.process(chunk_line(payload.substr(0, 11)));
    ASSERT_TRUE(h.read_response(text) && text == "OK\n", "chunk 1 acknowledged");
    h.processor.process(chunk_line(payload.substr(11)));
    ASSERT_TRUE(h.read_response(text) && text == "OK\n", "chunk 2 acknowledged");
    h.processor.process("END_UPLOAD");
    ASSERT_TRUE(h.read_response(text), "end acknowledged");
    ASSERT_EQ(text, "OK\n" + std::to_string(payload.size()) + "\n", "byte count reported");
    ASSERT_EQ(read_file(path), payload, "file content");
    std::remove(path.c_str());
    PASS("Upload written chunk by chunk");
}

TEST(test_upload_size_mismatch_removes_file) {
    Harness h;
    std::string path = temp_path("short_upload");
    std::string text;

    h.processor.process("START_UPLOAD 100 " + path);
    ASSERT_TRUE(h.read_response(text) && text == "OK\n", "start acknowledged");
    h.processor.process(chunk_line("only ten b"));
    ASSERT_TRUE(h.read_response(text) && text == "OK\n", "chunk acknowledged");
    h.processor.process("END_UPLOAD");
    ASSERT_TRUE(h.read_response(text), "end answered");
    ASSERT_TRUE(text.find("Size mismatch") != std::string::npos, "mismatch reported");
    ASSERT_FALSE(file_exists(path), "partial file removed");
    PASS("Short upload rejected and cleaned up");
}

TEST(test_upload_corrupt_chunk) {
    Harness h;
    std::string path = temp_path("corrupt_upload");
    std::string text;

    h.processor.process("START_UPLOAD 10 " + path);
    ASSERT_TRUE(h.read_response(text) && text == "OK\n", "start acknowledged");
    h.processor.process("UPLOAD_CHUNK 00112233");
    ASSERT_TRUE(h.read_response(text), "chunk answered");
    ASSERT_TRUE(text.find("Decompression error") != std::string::npos, "decode failure reported");
    ASSERT_FALSE(file_exists(path), "partial file removed");

    h.processor.process("END_UPLOAD");
    ASSERT_TRUE(h.read_response(text) && text.find("No active upload") != std::string::npos, "upload abandoned");
    PASS("Corrupt chunk aborts the upload");
}

TEST(test_download) {
    Harness h;
    std::string path = temp_path("download");
    std::string content(5000, 'z');
    content += "tail";
    {
        std::ofstream out(path, std::ios::binary);
        out << content;
    }
    h.processor.process("DOWNLOAD " + path);
    std::vector<framing::Frame> frames;
    ASSERT_TRUE(h.read_frames(frames), "end marker");
    std::remove(path.c_str());
    ASSERT_EQ(frames.size(), static_cast<size_t>(1), "one DATA frame");
    ASSERT_TRUE(frames[0].type == framing::FrameType::DATA, "frame is DATA");
    std::vector<uint8_t> data;
    ASSERT_TRUE(wire_codec::decompress_hex(frames[0].text, data), "payload decodes");
    ASSERT_EQ(std::string(data.begin(), data.end()), content, "content intact");
    PASS("Download sent as a single DATA frame");
}

TEST(test_download_errors) {
    Harness h;
    std::vector<framing::Frame> frames;
    h.processor.process("DOWNLOAD /nonexistent/relayshell/file");
    ASSERT_TRUE(h.read_frames(frames), "end marker");
    ASSERT_EQ(frames.size(), static_cast<size_t>(1), "one status line");
    ASSERT_TRUE(frames[0].type == framing::FrameType::PLAIN, "error is plain text");
    ASSERT_TRUE(frames[0].text.find("Error reading file") != std::string::npos, "error text");

    h.processor.process("DOWNLOAD /tmp");
    ASSERT_TRUE(h.read_frames(frames), "end marker for directory");
    ASSERT_TRUE(frames.size() == 1 && frames[0].type == framing::FrameType::PLAIN, "directory refused");
    PASS("Missing file and directory reported as plain errors");
}

TEST(test_pty_session) {
    Harness h;
    h.processor.process("PTY_MODE");
    std::string text;
    ASSERT_TRUE(h.read_response(text), "PTY_MODE answered");
    if (text != "OK\n") {
        std::cout << "  SKIP: no pseudo-terminal available (" << text << ")" << std::endl;
        return;
    }
    ASSERT_TRUE(h.processor.in_pty_mode(), "processor in PTY mode");

    std::string input;
    ASSERT_TRUE(wire_codec::compress_to_hex(to_bytes("echo relay-pty-$((40+2))\n"), input), "encode input");
    ASSERT_TRUE(h.processor.process("PTY_DATA " + input) == ProcessOutcome::CONTINUE, "input forwarded");

    std::string seen;
    std::string line;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (seen.find("relay-pty-42") == std::string::npos && std::chrono::steady_clock::now() < deadline) {
        if (h.listener.read_line(line, 500) != IoStatus::OK) continue;
        if (line.compare(0, 9, "PTY_DATA ") != 0) continue;
        std::vector<uint8_t> data;
        if (wire_codec::decompress_hex(line.substr(9), data)) seen.append(data.begin(), data.end());
    }
    ASSERT_TRUE(seen.find("relay-pty-42") != std::string::npos, "shell output streamed back");

    ASSERT_TRUE(h.processor.process("PTY_EXIT") == ProcessOutcome::CONTINUE, "exit handled");
    ASSERT_FALSE(h.processor.in_pty_mode(), "back in command mode");
    // Shell output still in flight precedes the acknowledgement.
    bool acked = false;
    bool saw_ok = false;
    while (h.listener.read_line(line, 2000) == IoStatus::OK) {
        if (line.compare(0, 9, "PTY_DATA ") == 0) continue;
        if (line == "OK") {
            saw_ok = true;
            continue;
        }
        if (line == protocol::END_OF_OUTPUT_MARKER) {
            acked = saw_ok;
            break;
        }
    }
    ASSERT_TRUE(acked, "PTY_EXIT answered with OK and the end marker");

    ASSERT_TRUE(h.processor.process("PTY_EXIT") == ProcessOutcome::CONTINUE, "repeated exit handled");
    ASSERT_TRUE(h.read_response(text) && text == "OK\n", "repeated exit still acknowledged");

    ASSERT_TRUE(h.processor.process("echo back") == ProcessOutcome::CONTINUE, "command mode works again");
    ASSERT_TRUE(h.read_response(text) && text == "back\n", "command output after PTY");
    PASS("PTY session streams output and returns to command mode");
}

int main() {
    std::cout << "==========================================" << std::endl;
    std::cout << " Command Processor Tests" << std::endl;
    std::cout << "==========================================" << std::endl;

    std::cout << "\n[Commands]" << std::endl;
    test_ping_gets_bare_pong();
    test_shell_command_output();
    test_output_looking_like_marker();
    test_silent_command();
    test_output_truncated();
    test_exit_command();

    std::cout << "\n[Transfers]" << std::endl;
    test_upload_sequence();
    test_upload_size_mismatch_removes_file();
    test_upload_corrupt_chunk();
    test_download();
    test_download_errors();

    std::cout << "\n[PTY]" << std::endl;
    test_pty_session();

    return test_summary("Command processor");
}
