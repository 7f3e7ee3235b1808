#pragma once

#include "ironq/config.hpp"
#include "ironq/errors.hpp"
#include <spdlog/spdlog.h>
#include <exception>
#include <thread>
#include <utility>

namespace ironq {

/**
 * Bounded retry executor.
 *
 * Runs fn() up to max_attempts times. Only transient remote failures
 * (RemoteError with a 5xx status) are retried; anything else is rethrown
 * after the first attempt. The last error is rethrown when attempts run out.
 */
class RetryPolicy {
public:
    explicit RetryPolicy(RetryOptions options = RetryOptions()) : options_(options) {
        if (options_.max_attempts < 1) {
            options_.max_attempts = 1;
        }
    }

    static bool is_transient(const std::exception& e) {
        const auto* remote = dynamic_cast<const RemoteError*>(&e);
        return remote != nullptr && remote->is_transient();
    }

    template <typename Fn>
    auto run(Fn&& fn) const -> decltype(fn()) {
        for (int attempt = 1;; ++attempt) {
            try {
                return fn();
            } catch (const RemoteError& e) {
                if (!e.is_transient() || attempt >= options_.max_attempts) {
                    throw;
                }
                spdlog::warn("[ironq] Transient remote error (status {}), attempt {}/{}: {}",
                             e.status_code(), attempt, options_.max_attempts, e.what());
            }
            if (options_.backoff.count() > 0) {
                std::this_thread::sleep_for(options_.backoff);
            }
        }
    }

    const RetryOptions& options() const { return options_; }

private:
    RetryOptions options_;
};

} // namespace ironq
