#pragma once

#include "ironq/message.hpp"
#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace ironq {

// Handler signals failure by throwing
using MessageHandler = std::function<void(Message& msg)>;
using FallbackHandler = std::function<void(Message& msg, std::exception_ptr error)>;

struct TaskOptions {
    std::string name;
    MessageHandler handler;

    // Called once retries are exhausted
    FallbackHandler fallback_handler;

    int retry_limit = 3;
    std::chrono::milliseconds min_backoff{1000};
    std::chrono::milliseconds max_backoff{30000};
};

/**
 * Exponential backoff: min_backoff * 2^(attempt-1), capped at max_backoff.
 * attempt is 1-based.
 */
std::chrono::milliseconds backoff_delay(int attempt,
                                        std::chrono::milliseconds min_backoff,
                                        std::chrono::milliseconds max_backoff);

/**
 * Named handlers the consumer dispatches reserved messages to.
 * Thread-safe.
 */
class TaskRegistry {
public:
    // Throws Error on empty name, missing handler or duplicate registration
    std::shared_ptr<const TaskOptions> register_task(TaskOptions options);

    std::shared_ptr<const TaskOptions> find(const std::string& name) const;

    bool unregister_task(const std::string& name);

    std::vector<std::string> names() const;

private:
    std::unordered_map<std::string, std::shared_ptr<const TaskOptions>> tasks_;
    mutable std::shared_mutex mutex_;
};

} // namespace ironq
