/**
 * @file test_session_registry.cpp
 * @brief Listener-side session registry tests.
 *
 * Sessions are admitted over in-memory connections. "Live" sessions are
 * served by a real AgentClient; "raw" sessions let the test play the agent
 * by writing protocol lines directly.
 */

#include "framing.hpp"
#include "line_channel.hpp"
#include "session_fixture.hpp"
#include "test_framework.hpp"
#include "wire_codec.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {
    const int kTimeoutMs = 5000;
}

TEST(test_empty_registry) {
    SessionFixture f;
    std::string address;
    ASSERT_TRUE(f.registry.list().empty(), "no sessions");
    ASSERT_FALSE(f.registry.lookup_by_index("1", address), "index 1 on empty registry");
    std::string response;
    ASSERT_TRUE(f.registry.execute("1.2.3.4:5", "id", 100, response) == SessionError::SESSION_NOT_FOUND,
                "unknown address");
    PASS("Empty registry lists nothing and resolves nothing");
}

TEST(test_index_lookup) {
    SessionFixture f;
    auto b = f.admit_raw("10.0.0.2:2000");
    auto a = f.admit_raw("10.0.0.1:1000");
    std::vector<std::string> listed = f.registry.list();
    ASSERT_EQ(listed.size(), static_cast<size_t>(2), "two sessions");
    ASSERT_EQ(listed[0], std::string("10.0.0.1:1000"), "sorted by address");

    std::string address;
    ASSERT_TRUE(f.registry.lookup_by_index("1", address) && address == "10.0.0.1:1000", "index 1");
    ASSERT_TRUE(f.registry.lookup_by_index("2", address) && address == "10.0.0.2:2000", "index 2");
    ASSERT_FALSE(f.registry.lookup_by_index("0", address), "zero");
    ASSERT_FALSE(f.registry.lookup_by_index("3", address), "past the end");
    ASSERT_FALSE(f.registry.lookup_by_index("-1", address), "negative");
    ASSERT_FALSE(f.registry.lookup_by_index("1a", address), "trailing garbage");
    ASSERT_FALSE(f.registry.lookup_by_index("", address), "empty");
    PASS("1-based index lookup over the sorted list");
}

TEST(test_execute_end_to_end) {
    SessionFixture f;
    ASSERT_TRUE(f.admit_agent("192.168.1.20:50123", "agent-e2e"), "agent attached");
    ASSERT_TRUE(f.wait_for_identity("192.168.1.20:50123"), "IDENT processed");
    ASSERT_EQ(f.registry.identifier("192.168.1.20:50123"), std::string("agent-e2e"), "identifier recorded");

    std::string response;
    SessionError err = f.registry.execute("192.168.1.20:50123", "echo relay-$((6*7))", kTimeoutMs, response);
    ASSERT_TRUE(err == SessionError::OK, std::string("execute: ") + session_error_name(err));
    ASSERT_EQ(response, std::string("relay-42\n"), "command output");

    err = f.registry.execute("192.168.1.20:50123", "printf 'a\\nb\\n'", kTimeoutMs, response);
    ASSERT_TRUE(err == SessionError::OK && response == "a\nb\n", "second command on same session");
    PASS("Command round trip through a live agent");
}

TEST(test_response_timeout) {
    SessionFixture f;
    auto agent = f.admit_raw("10.0.0.9:9000");
    std::string response;
    SessionError err = f.registry.execute("10.0.0.9:9000", "sleep 100", 200, response);
    ASSERT_TRUE(err == SessionError::RESPONSE_TIMEOUT, "silent agent times out");
    ASSERT_EQ(f.registry.size(), static_cast<size_t>(1), "session kept after timeout");
    PASS("Unanswered command times out without dropping the session");
}

TEST(test_stale_lines_discarded) {
    SessionFixture f;
    auto agent_conn = f.admit_raw("10.0.0.10:1");
    LineChannel agent(*agent_conn);

    // Late reply to an earlier, timed-out command.
    ASSERT_TRUE(agent.write_raw("stale\n" + framing::end_of_output_line(), 1000) == IoStatus::OK, "stale reply");
    std::this_thread::sleep_for(std::chrono::milliseconds(300));

    ASSERT_TRUE(f.registry.send_command("10.0.0.10:1", "whoami") == SessionError::OK, "command sent");
    std::string fresh;
    ASSERT_TRUE(wire_codec::compress_to_hex(to_bytes("fresh\n"), fresh), "encode");
    ASSERT_TRUE(agent.write_raw(framing::build_data_line(fresh) + framing::end_of_output_line(), 1000) == IoStatus::OK,
                "fresh reply");

    std::string response;
    ASSERT_TRUE(f.registry.get_response("10.0.0.10:1", kTimeoutMs, response) == SessionError::OK, "response");
    ASSERT_EQ(response, std::string("fresh\n"), "stale reply not mixed in");
    PASS("Leftover lines are discarded when a new command is sent");
}

TEST(test_late_reply_after_timeout) {
    SessionFixture f;
    const std::string addr = "10.0.0.17:1";
    auto agent_conn = f.admit_raw(addr);
    LineChannel agent(*agent_conn);

    std::string response;
    ASSERT_TRUE(f.registry.execute(addr, "sleep 3; echo slow-output", 200, response) == SessionError::RESPONSE_TIMEOUT,
                "slow command times out");
    ASSERT_TRUE(f.registry.send_command(addr, "id") == SessionError::OK, "next command sent");

    // Both replies arrive after the second command went out, in order.
    std::string slow;
    std::string fresh;
    ASSERT_TRUE(wire_codec::compress_to_hex(to_bytes("slow-output\n"), slow), "encode slow");
    ASSERT_TRUE(wire_codec::compress_to_hex(to_bytes("uid=0(root)\n"), fresh), "encode fresh");
    std::string replies = framing::build_data_line(slow) + framing::end_of_output_line() +
                          framing::build_data_line(fresh) + framing::end_of_output_line();
    ASSERT_TRUE(agent.write_raw(replies, 1000) == IoStatus::OK, "replies written");

    ASSERT_TRUE(f.registry.get_response(addr, kTimeoutMs, response) == SessionError::OK, "response");
    ASSERT_EQ(response, std::string("uid=0(root)\n"), "late output not returned for the next command");

    // Late reply that lands before the next command is dropped as well.
    ASSERT_TRUE(f.registry.execute(addr, "sleep 3", 200, response) == SessionError::RESPONSE_TIMEOUT, "second timeout");
    ASSERT_TRUE(agent.write_raw("late\n" + framing::end_of_output_line(), 1000) == IoStatus::OK, "late reply");
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    ASSERT_TRUE(f.registry.send_command(addr, "pwd") == SessionError::OK, "third command sent");
    ASSERT_TRUE(agent.write_raw("/root\n" + framing::end_of_output_line(), 1000) == IoStatus::OK, "pwd reply");
    ASSERT_TRUE(f.registry.get_response(addr, kTimeoutMs, response) == SessionError::OK, "pwd response");
    ASSERT_EQ(response, std::string("/root\n"), "reply matches its command");
    PASS("Replies to timed-out commands are never returned for later ones");
}

TEST(test_corrupt_data_line_skipped) {
    SessionFixture f;
    auto agent_conn = f.admit_raw("10.0.0.11:1");
    LineChannel agent(*agent_conn);

    ASSERT_TRUE(f.registry.send_command("10.0.0.11:1", "cat x") == SessionError::OK, "command sent");
    std::string good;
    ASSERT_TRUE(wire_codec::compress_to_hex(to_bytes("good\n"), good), "encode");
    std::string reply = framing::build_data_line("zz-not-hex") + framing::build_data_line("00112233") +
                        framing::build_data_line(good) + framing::end_of_output_line();
    ASSERT_TRUE(agent.write_raw(reply, 1000) == IoStatus::OK, "reply written");

    std::string response;
    ASSERT_TRUE(f.registry.get_response("10.0.0.11:1", kTimeoutMs, response) == SessionError::OK, "response");
    ASSERT_EQ(response, std::string("good\n"), "only the valid frame kept");
    PASS("Corrupt DATA lines are skipped");
}

TEST(test_out_of_band_lines) {
    SessionFixture f;
    auto agent_conn = f.admit_raw("10.0.0.12:1");
    LineChannel agent(*agent_conn);

    ASSERT_TRUE(f.registry.send_command("10.0.0.12:1", "pwd") == SessionError::OK, "command sent");
    ASSERT_TRUE(agent.write_raw("PONG\nIDENT {\"id\":\"late\"}\n/root\n" + framing::end_of_output_line(), 1000) ==
                    IoStatus::OK, "reply written");

    std::string response;
    ASSERT_TRUE(f.registry.get_response("10.0.0.12:1", kTimeoutMs, response) == SessionError::OK, "response");
    ASSERT_EQ(response, std::string("/root\n"), "PONG and IDENT not part of the response");
    ASSERT_EQ(f.registry.identifier("10.0.0.12:1"), std::string("late"), "IDENT applied");
    PASS("Keepalive and identity lines bypass the response queue");
}

TEST(test_keepalive_pings_idle_session) {
    SessionFixture f;
    auto agent_conn = f.admit_raw("10.0.0.13:1");
    LineChannel agent(*agent_conn);

    f.registry.keepalive(0);
    std::string line;
    ASSERT_TRUE(agent.read_line(line, kTimeoutMs) == IoStatus::OK, "agent received a line");
    ASSERT_EQ(line, std::string("PING"), "PING sent");

    f.registry.keepalive(3600);
    ASSERT_TRUE(agent.read_line(line, 200) == IoStatus::TIMEOUT, "recently active session not pinged");
    PASS("Keepalive pings only idle sessions");
}

TEST(test_readmit_replaces_session) {
    SessionFixture f;
    auto first = f.admit_raw("10.0.0.14:7");
    auto second = f.admit_raw("10.0.0.14:7");
    ASSERT_EQ(f.registry.size(), static_cast<size_t>(1), "one entry per address");

    LineChannel old_agent(*first);
    std::string line;
    IoStatus st = old_agent.read_line(line, 1000);
    ASSERT_TRUE(st == IoStatus::CLOSED, "previous connection closed");
    PASS("Same address re-admitted replaces the old session");
}

TEST(test_remove_and_disconnect) {
    SessionFixture f;
    auto agent_conn = f.admit_raw("10.0.0.15:1");
    f.registry.remove("10.0.0.15:1");
    ASSERT_EQ(f.registry.size(), static_cast<size_t>(0), "removed");
    std::string response;
    ASSERT_TRUE(f.registry.execute("10.0.0.15:1", "id", 100, response) == SessionError::SESSION_NOT_FOUND,
                "removed session unknown");

    auto gone = f.admit_raw("10.0.0.16:1");
    gone->shutdown();
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (f.registry.size() > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    ASSERT_EQ(f.registry.size(), static_cast<size_t>(0), "disconnected agent dropped by its worker");
    PASS("Explicit removal and remote disconnect both drop the session");
}

TEST(test_pty_mode_transitions) {
    SessionFixture f;
    const std::string addr = "192.168.1.30:40000";
    ASSERT_TRUE(f.admit_agent(addr, "agent-pty"), "agent attached");

    std::shared_ptr<PtyChannel> channel;
    SessionError err = f.registry.enter_pty_mode(addr, channel);
    if (err == SessionError::REJECTED) {
        std::cout << "  SKIP: agent could not open a pseudo-terminal" << std::endl;
        return;
    }
    ASSERT_TRUE(err == SessionError::OK, std::string("enter: ") + session_error_name(err));
    ASSERT_TRUE(channel != nullptr, "channel returned");
    ASSERT_TRUE(f.registry.is_in_pty_mode(addr), "PTY mode active");

    std::shared_ptr<PtyChannel> second;
    ASSERT_TRUE(f.registry.enter_pty_mode(addr, second) == SessionError::WRONG_MODE, "no nested PTY");
    std::string response;
    ASSERT_TRUE(f.registry.execute(addr, "id", 100, response) == SessionError::WRONG_MODE, "commands refused");

    std::string cmd = "echo pty-$((5*5))\n";
    ASSERT_TRUE(f.registry.send_pty_input(addr, std::vector<uint8_t>(cmd.begin(), cmd.end())) == SessionError::OK,
                "input sent");
    ASSERT_TRUE(f.registry.send_pty_resize(addr, 40, 120) == SessionError::OK, "resize sent");

    std::string seen;
    std::vector<uint8_t> data;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (seen.find("pty-25") == std::string::npos && std::chrono::steady_clock::now() < deadline) {
        if (channel->pop(data, 200)) seen.append(data.begin(), data.end());
    }
    ASSERT_TRUE(seen.find("pty-25") != std::string::npos, "shell output reached the channel");

    ASSERT_TRUE(f.registry.exit_pty_mode(addr) == SessionError::OK, "exit");
    ASSERT_FALSE(f.registry.is_in_pty_mode(addr), "command mode again");
    ASSERT_TRUE(channel->closed(), "channel closed on exit");
    ASSERT_TRUE(f.registry.send_pty_input(addr, {'x'}) == SessionError::WRONG_MODE, "PTY input refused");

    err = f.registry.execute(addr, "echo after", kTimeoutMs, response);
    ASSERT_TRUE(err == SessionError::OK && response == "after\n", "commands work after PTY");
    PASS("PTY mode entered, used and left");
}

TEST(test_pty_reenter_immediately) {
    SessionFixture f;
    const std::string addr = "192.168.1.31:40001";
    ASSERT_TRUE(f.admit_agent(addr, "agent-reenter"), "agent attached");

    for (int round = 1; round <= 3; ++round) {
        std::shared_ptr<PtyChannel> channel;
        SessionError err = f.registry.enter_pty_mode(addr, channel);
        if (round == 1 && err == SessionError::REJECTED) {
            std::cout << "  SKIP: agent could not open a pseudo-terminal" << std::endl;
            return;
        }
        ASSERT_TRUE(err == SessionError::OK,
                    "enter round " + std::to_string(round) + ": " + session_error_name(err));
        err = f.registry.exit_pty_mode(addr);
        ASSERT_TRUE(err == SessionError::OK, "exit round " + std::to_string(round) + ": " + session_error_name(err));
        ASSERT_TRUE(channel->closed(), "channel closed after exit");
        ASSERT_FALSE(f.registry.is_in_pty_mode(addr), "command mode after exit");
    }

    std::string response;
    SessionError err = f.registry.execute(addr, "echo settled", kTimeoutMs, response);
    ASSERT_TRUE(err == SessionError::OK && response == "settled\n", "commands work after repeated PTY use");
    PASS("PTY mode can be re-entered right after leaving it");
}

int main() {
    std::cout << "==========================================" << std::endl;
    std::cout << " Session Registry Tests" << std::endl;
    std::cout << "==========================================" << std::endl;

    std::cout << "\n[Lookup]" << std::endl;
    test_empty_registry();
    test_index_lookup();

    std::cout << "\n[Exchanges]" << std::endl;
    test_execute_end_to_end();
    test_response_timeout();
    test_stale_lines_discarded();
    test_late_reply_after_timeout();
    test_corrupt_data_line_skipped();
    test_out_of_band_lines();

    std::cout << "\n[Lifecycle]" << std::endl;
    test_keepalive_pings_idle_session();
    test_readmit_replaces_session();
    test_remove_and_disconnect();

    std::cout << "\n[PTY]" << std::endl;
    test_pty_mode_transitions();
    test_pty_reenter_immediately();

    return test_summary("Session registry");
}
