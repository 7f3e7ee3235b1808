#include "ironq/task.hpp"
#include "ironq/errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <mutex>

namespace ironq {

std::chrono::milliseconds backoff_delay(int attempt,
                                        std::chrono::milliseconds min_backoff,
                                        std::chrono::milliseconds max_backoff) {
    if (attempt < 1) {
        attempt = 1;
    }
    if (max_backoff < min_backoff) {
        max_backoff = min_backoff;
    }

    auto delay = min_backoff;
    for (int i = 1; i < attempt; ++i) {
        if (delay >= max_backoff / 2) {
            return max_backoff;
        }
        delay *= 2;
    }
    return std::min(delay, max_backoff);
}

std::shared_ptr<const TaskOptions> TaskRegistry::register_task(TaskOptions options) {
    if (options.name.empty()) {
        throw Error("ironq: task name is required");
    }
    if (!options.handler) {
        throw Error("ironq: task " + options.name + " has no handler");
    }
    if (options.retry_limit < 1) {
        options.retry_limit = 1;
    }

    auto task = std::make_shared<const TaskOptions>(std::move(options));

    std::unique_lock lock(mutex_);
    auto [it, inserted] = tasks_.emplace(task->name, task);
    if (!inserted) {
        throw Error("ironq: task " + task->name + " is already registered");
    }

    spdlog::debug("[ironq] Registered task {} (retry_limit={}, min_backoff={}ms)",
                  task->name, task->retry_limit, task->min_backoff.count());
    return it->second;
}

std::shared_ptr<const TaskOptions> TaskRegistry::find(const std::string& name) const {
    std::shared_lock lock(mutex_);
    auto it = tasks_.find(name);
    if (it == tasks_.end()) {
        return nullptr;
    }
    return it->second;
}

bool TaskRegistry::unregister_task(const std::string& name) {
    std::unique_lock lock(mutex_);
    return tasks_.erase(name) > 0;
}

std::vector<std::string> TaskRegistry::names() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> result;
    result.reserve(tasks_.size());
    for (const auto& [name, task] : tasks_) {
        result.push_back(name);
    }
    std::sort(result.begin(), result.end());
    return result;
}

} // namespace ironq
