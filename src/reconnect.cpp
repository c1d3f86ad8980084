#include "reconnect.hpp"
#include "utils.hpp"

#include <algorithm>

int connect_with_retry(const RetryPolicy& policy, const LinkFactory& factory, const SleepFn& sleep_fn) {
    int created = 0;
    int retries = 0;
    std::chrono::seconds backoff = policy.base_backoff;

    for (;;) {
        std::unique_ptr<AgentLink> link = factory();
        ++created;

        if (!link) {
            LOG_ERROR("Could not create agent link");
        } else if (link->connect()) {
            bool exit_requested = link->handle_commands();
            link->close();
            if (exit_requested) {
                // Not a failure: no retry is used and the backoff is kept.
                LOG_INFO("Listener closed the session; reconnecting");
                continue;
            }
            LOG_WARN("Connection lost");
        } else {
            link->close();
            LOG_WARN("Connection attempt %d failed", created);
        }

        ++retries;
        if (policy.max_retries > 0 && retries >= policy.max_retries) {
            LOG_ERROR("Max retries (%d) reached, giving up", policy.max_retries);
            break;
        }

        LOG_INFO("Reconnecting in %lld seconds (retry %d%s)", static_cast<long long>(backoff.count()), retries,
                 policy.max_retries > 0 ? (" of " + std::to_string(policy.max_retries)).c_str() : "");
        if (!sleep_fn(backoff)) {
            LOG_INFO("Reconnect cancelled");
            break;
        }
        backoff = std::min(backoff * 2, policy.max_backoff);
    }
    return created;
}
