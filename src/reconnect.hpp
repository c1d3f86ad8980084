#ifndef RECONNECT_HPP
#define RECONNECT_HPP

#include "agent_client.hpp"
#include "protocol.hpp"

#include <chrono>
#include <functional>
#include <memory>

struct RetryPolicy {
    int max_retries = 5; // 0 = never give up
    std::chrono::seconds base_backoff{protocol::BASE_BACKOFF};
    std::chrono::seconds max_backoff{protocol::MAX_BACKOFF};
};

using LinkFactory = std::function<std::unique_ptr<AgentLink>()>;
// Returns false to stop retrying (shutdown).
using SleepFn = std::function<bool(std::chrono::seconds)>;

// Creates, connects and serves links until the retry limit is reached or
// sleep_fn declines. A failed connect or a lost session counts as a failure;
// the backoff doubles up to max_backoff and is never reset. A session the
// listener ended with `exit` reconnects at once. Returns links created.
int connect_with_retry(const RetryPolicy& policy, const LinkFactory& factory, const SleepFn& sleep_fn);

#endif // RECONNECT_HPP
