#pragma once
#include <chrono>
#include <functional>
#include <string>
#include <thread>
#include <utility>

#include "errors.hpp"
#include "scribe_config.hpp"
#include "scribe_log.hpp"

namespace scribe {

using Sleeper = std::function<void(std::chrono::milliseconds)>;

inline void real_sleep(std::chrono::milliseconds d) { std::this_thread::sleep_for(d); }

// Runs one network call under a RetryPolicy. NetworkError is retried after
// base_delay * attempt; any other exception propagates on the first throw.
class RetryExecutor {
public:
    explicit RetryExecutor(const RetryPolicy& policy, Sleeper sleep = real_sleep)
        : policy_(policy), sleep_(std::move(sleep)) {}

    template <typename F>
    auto run(const std::string& what, F&& op) -> decltype(op()) {
        const int attempts = policy_.max_attempts < 1 ? 1 : policy_.max_attempts;
        for (int attempt = 1;; ++attempt) {
            try {
                SLOG(debug) << what << ": attempt " << attempt << " of " << attempts;
                return op();
            } catch (const NetworkError& e) {
                SLOG(warning) << what << ": network error on attempt " << attempt << ": " << e.what();
                if (attempt >= attempts) throw NetworkExhausted(attempts, e.what());
                sleep_(std::chrono::milliseconds(policy_.base_delay_ms * attempt));
            }
        }
    }

    const RetryPolicy& policy() const { return policy_; }

private:
    RetryPolicy policy_;
    Sleeper sleep_;
};

} // namespace scribe
