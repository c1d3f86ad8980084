/**
 * @file test_reconnect.cpp
 * @brief Tests for the agent reconnect driver and its backoff schedule.
 *
 * Links are scripted doubles; sleeping is recorded instead of performed.
 */

#include "reconnect.hpp"
#include "test_framework.hpp"

#include <chrono>
#include <memory>
#include <vector>

namespace {
    struct Script {
        int connects_ok_from = 1000; // link number from which connect() succeeds
        int exit_requests = 0; // sessions that end with the listener's exit
        int created = 0;
        int closed = 0;
        int served = 0;
    };

    class ScriptedLink : public AgentLink {
    public:
        ScriptedLink(Script& script, int number) : script_(script), number_(number) {}

        bool connect() override { return number_ >= script_.connects_ok_from; }
        bool handle_commands() override {
            ++script_.served;
            if (script_.exit_requests > 0) {
                --script_.exit_requests;
                return true;
            }
            return false;
        }
        void close() override { ++script_.closed; }

    private:
        Script& script_;
        int number_;
    };

    LinkFactory factory_for(Script& script) {
        return [&script]() -> std::unique_ptr<AgentLink> {
            ++script.created;
            return std::make_unique<ScriptedLink>(script, script.created);
        };
    }

    std::vector<long long> as_seconds(const std::vector<std::chrono::seconds>& v) {
        std::vector<long long> out;
        for (auto s : v) out.push_back(static_cast<long long>(s.count()));
        return out;
    }
}

TEST(test_gives_up_after_max_retries) {
    Script script;
    std::vector<std::chrono::seconds> sleeps;
    RetryPolicy policy;
    policy.max_retries = 5;

    int created = connect_with_retry(policy, factory_for(script), [&](std::chrono::seconds s) {
        sleeps.push_back(s);
        return true;
    });

    ASSERT_EQ(created, 5, "five connection attempts");
    ASSERT_EQ(script.closed, 5, "every link closed");
    ASSERT_TRUE(as_seconds(sleeps) == (std::vector<long long>{5, 10, 20, 40}), "backoff 5, 10, 20, 40");
    PASS("Unreachable listener: 5 attempts with doubling backoff");
}

TEST(test_backoff_caps_at_max) {
    Script script;
    std::vector<std::chrono::seconds> sleeps;
    RetryPolicy policy;
    policy.max_retries = 9;

    connect_with_retry(policy, factory_for(script), [&](std::chrono::seconds s) {
        sleeps.push_back(s);
        return true;
    });

    ASSERT_TRUE(as_seconds(sleeps) == (std::vector<long long>{5, 10, 20, 40, 80, 160, 300, 300}),
                "capped at 300 seconds");
    PASS("Backoff never exceeds the maximum");
}

TEST(test_unlimited_until_sleep_declines) {
    Script script;
    int sleeps = 0;
    RetryPolicy policy;
    policy.max_retries = 0;

    int created = connect_with_retry(policy, factory_for(script), [&](std::chrono::seconds) {
        return ++sleeps < 12;
    });

    ASSERT_EQ(created, 12, "kept trying past the default limit");
    ASSERT_EQ(sleeps, 12, "stopped when sleep declined");
    PASS("Zero retry limit retries until shutdown");
}

TEST(test_lost_sessions_count_as_retries) {
    Script script;
    script.connects_ok_from = 1;
    std::vector<std::chrono::seconds> sleeps;
    RetryPolicy policy;
    policy.max_retries = 3;

    int created = connect_with_retry(policy, factory_for(script), [&](std::chrono::seconds s) {
        sleeps.push_back(s);
        return true;
    });

    ASSERT_EQ(created, 3, "three sessions");
    ASSERT_EQ(script.served, 3, "each session served");
    ASSERT_TRUE(as_seconds(sleeps) == (std::vector<long long>{5, 10}), "backoff not reset by a good connection");
    PASS("Ended sessions consume retries and keep the backoff");
}

TEST(test_exit_request_reconnects_immediately) {
    Script script;
    script.connects_ok_from = 1;
    script.exit_requests = 3;
    std::vector<std::chrono::seconds> sleeps;
    RetryPolicy policy;
    policy.max_retries = 2;

    int created = connect_with_retry(policy, factory_for(script), [&](std::chrono::seconds s) {
        sleeps.push_back(s);
        return true;
    });

    ASSERT_EQ(created, 5, "three exits plus two lost sessions");
    ASSERT_EQ(script.served, 5, "every link served");
    ASSERT_EQ(script.closed, 5, "every link closed");
    ASSERT_TRUE(as_seconds(sleeps) == (std::vector<long long>{5}), "only the lost session slept");
    PASS("Listener exit reconnects without a retry or a sleep");
}

TEST(test_exit_keeps_backoff) {
    Script script;
    script.connects_ok_from = 2;
    std::vector<std::chrono::seconds> sleeps;
    RetryPolicy policy;
    policy.max_retries = 0;

    // Attempt 1 fails, 2 ends with exit, 3 is lost.
    script.exit_requests = 1;
    connect_with_retry(policy, factory_for(script), [&](std::chrono::seconds s) {
        sleeps.push_back(s);
        return sleeps.size() < 2;
    });

    ASSERT_EQ(script.created, 3, "three links");
    ASSERT_TRUE(as_seconds(sleeps) == (std::vector<long long>{5, 10}), "backoff continues across the exit");
    PASS("Exit does not reset the backoff");
}

TEST(test_recovers_after_failures) {
    Script script;
    script.connects_ok_from = 3;
    int sleeps = 0;
    RetryPolicy policy;
    policy.max_retries = 0;

    connect_with_retry(policy, factory_for(script), [&](std::chrono::seconds) {
        // Stop once the first successful session has ended.
        ++sleeps;
        return script.served == 0;
    });

    ASSERT_EQ(script.created, 3, "third attempt connected");
    ASSERT_EQ(script.served, 1, "session served once");
    ASSERT_EQ(sleeps, 3, "slept after each ended attempt");
    PASS("Agent connects once the listener appears");
}

int main() {
    std::cout << "==========================================" << std::endl;
    std::cout << " Reconnect Driver Tests" << std::endl;
    std::cout << "==========================================" << std::endl;

    test_gives_up_after_max_retries();
    test_backoff_caps_at_max();
    test_unlimited_until_sleep_declines();
    test_lost_sessions_count_as_retries();
    test_exit_request_reconnects_immediately();
    test_exit_keeps_backoff();
    test_recovers_after_failures();

    return test_summary("Reconnect");
}
