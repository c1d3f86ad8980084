/**
 * @file test_console.cpp
 * @brief Operator console tests driven through string streams.
 */

#include "console.hpp"
#include "session_fixture.hpp"
#include "test_framework.hpp"

#include <sstream>
#include <string>

namespace {
    bool contains(const std::string& haystack, const std::string& needle) {
        return haystack.find(needle) != std::string::npos;
    }
}

TEST(test_ls_without_sessions) {
    SessionFixture f;
    std::istringstream in;
    std::ostringstream out;
    Console console(f.registry, TuningConfig(), in, out);
    ASSERT_TRUE(console.execute_line("ls"), "ls keeps running");
    ASSERT_TRUE(contains(out.str(), "No active sessions"), "empty listing");
    PASS("ls reports an empty registry");
}

TEST(test_use_and_background) {
    SessionFixture f;
    ASSERT_TRUE(f.admit_agent("10.1.1.1:3000", "console-agent"), "agent attached");
    ASSERT_TRUE(f.wait_for_identity("10.1.1.1:3000"), "identity");
    std::istringstream in;
    std::ostringstream out;
    Console console(f.registry, TuningConfig(), in, out);

    console.execute_line("ls");
    ASSERT_TRUE(contains(out.str(), "1. 10.1.1.1:3000"), "numbered entry");
    ASSERT_TRUE(contains(out.str(), "id=console-agent"), "identifier shown");

    console.execute_line("use 5");
    ASSERT_TRUE(console.active_session().empty(), "bad index leaves console detached");
    ASSERT_TRUE(contains(out.str(), "Invalid session number"), "bad index reported");

    console.execute_line("use 1");
    ASSERT_EQ(console.active_session(), std::string("10.1.1.1:3000"), "attached");

    console.execute_line("bg");
    ASSERT_TRUE(console.active_session().empty(), "backgrounded");
    PASS("use attaches, bg detaches");
}

TEST(test_remote_command) {
    SessionFixture f;
    ASSERT_TRUE(f.admit_agent("10.1.1.2:3000", "console-agent"), "agent attached");
    std::istringstream in;
    std::ostringstream out;
    Console console(f.registry, TuningConfig(), in, out);

    console.execute_line("whoami-not-attached");
    ASSERT_TRUE(contains(out.str(), "Unknown command"), "commands need a session");

    console.execute_line("use 1");
    out.str("");
    console.execute_line("echo console-$((2+3))");
    ASSERT_TRUE(contains(out.str(), "console-5\n"), "remote output printed");
    PASS("Input is forwarded to the attached agent");
}

TEST(test_transfer_usage_and_missing_session) {
    SessionFixture f;
    std::istringstream in;
    std::ostringstream out;
    Console console(f.registry, TuningConfig(), in, out);

    console.execute_line("upload onlyone");
    ASSERT_TRUE(contains(out.str(), "Usage: upload"), "usage printed");
    console.execute_line("download a b");
    ASSERT_TRUE(contains(out.str(), "No session selected"), "session required");
    console.execute_line("shell");
    ASSERT_TRUE(contains(out.str(), "No session selected"), "shell needs a session");
    PASS("Transfer commands validate arguments and session");
}

TEST(test_tunnel_commands) {
    SessionFixture f;
    ASSERT_TRUE(f.admit_agent("10.1.1.4:3000", "console-agent"), "agent attached");
    std::istringstream in;
    std::ostringstream out;
    Console console(f.registry, TuningConfig(), in, out);

    console.execute_line("tunnels");
    ASSERT_TRUE(contains(out.str(), "No active tunnels"), "empty tunnel list");
    console.execute_line("socks 0");
    ASSERT_TRUE(contains(out.str(), "No session selected"), "proxy needs a session");
    console.execute_line("forward 99999 127.0.0.1:22");
    ASSERT_TRUE(contains(out.str(), "Usage: forward"), "bad port rejected");

    console.execute_line("use 1");
    console.execute_line("forward 0 127.0.0.1:22");
    ASSERT_TRUE(contains(out.str(), "Forward 1 started"), "forward started");
    console.execute_line("socks 0");
    ASSERT_TRUE(contains(out.str(), "SOCKS5 proxy 2 started"), "proxy started");

    out.str("");
    console.execute_line("tunnels");
    ASSERT_TRUE(contains(out.str(), "1. forward"), "forward listed");
    ASSERT_TRUE(contains(out.str(), "-> 127.0.0.1:22"), "target listed");
    ASSERT_TRUE(contains(out.str(), "2. socks5"), "proxy listed");

    console.execute_line("stop 1");
    ASSERT_TRUE(contains(out.str(), "Stopped tunnel 1"), "stopped");
    console.execute_line("stop 1");
    ASSERT_TRUE(contains(out.str(), "No tunnel with id '1'"), "already gone");
    PASS("Forward and SOCKS commands start, list and stop tunnels");
}

TEST(test_lost_session_detaches) {
    SessionFixture f;
    auto agent = f.admit_raw("10.1.1.3:3000");
    std::istringstream in;
    std::ostringstream out;
    Console console(f.registry, TuningConfig(), in, out);
    console.execute_line("use 1");
    ASSERT_FALSE(console.active_session().empty(), "attached");

    agent->shutdown();
    console.execute_line("id");
    ASSERT_TRUE(console.active_session().empty(), "detached after the agent vanished");
    ASSERT_TRUE(contains(out.str(), "lost"), "loss reported");
    PASS("Transport failure drops the session and detaches");
}

TEST(test_run_until_exit) {
    SessionFixture f;
    std::istringstream in("help\nls\nexit\nls\n");
    std::ostringstream out;
    Console console(f.registry, TuningConfig(), in, out);
    console.run();
    std::string text = out.str();
    size_t first = text.find("No active sessions");
    ASSERT_TRUE(first != std::string::npos, "ls before exit ran");
    ASSERT_TRUE(text.find("No active sessions", first + 1) == std::string::npos, "nothing after exit ran");
    PASS("run() stops at exit");
}

int main() {
    std::cout << "==========================================" << std::endl;
    std::cout << " Operator Console Tests" << std::endl;
    std::cout << "==========================================" << std::endl;

    test_ls_without_sessions();
    test_use_and_background();
    test_remote_command();
    test_transfer_usage_and_missing_session();
    test_tunnel_commands();
    test_lost_session_detaches();
    test_run_until_exit();

    return test_summary("Console");
}
