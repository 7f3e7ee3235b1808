#include "ironq/work_queue.hpp"
#include "ironq/errors.hpp"
#include "ironq/task.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace ironq {

WorkQueue::WorkQueue(WorkQueueOptions options)
    : options_(std::move(options)) {
    if (!options_.handler) {
        throw Error("ironq: work queue " + options_.name + " has no handler");
    }
    if (options_.buffer_size == 0) {
        options_.buffer_size = 1;
    }
    if (options_.worker_count < 1) {
        options_.worker_count = 1;
    }
    if (options_.retry_limit < 1) {
        options_.retry_limit = 1;
    }

    workers_.reserve(options_.worker_count);
    for (int i = 0; i < options_.worker_count; ++i) {
        workers_.emplace_back([this, i]() { worker_loop(i); });
    }

    spdlog::debug("[ironq] WorkQueue {} started: handler={}, buffer={}, workers={}, retry_limit={}",
                  options_.name, options_.handler_name, options_.buffer_size,
                  options_.worker_count, options_.retry_limit);
}

WorkQueue::~WorkQueue() {
    size_t abandoned = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        abandoned = ready_.size() + delayed_.size();
        closing_ = true;
        stopping_ = true;
        ready_.clear();
        delayed_.clear();
    }
    work_cv_.notify_all();
    space_cv_.notify_all();

    if (abandoned > 0) {
        spdlog::warn("[ironq] WorkQueue {} destroyed with {} unprocessed messages", options_.name, abandoned);
        dropped_ += abandoned;
    }

    join_workers();
}

void WorkQueue::add(Envelope env) {
    std::unique_lock<std::mutex> lock(mutex_);

    space_cv_.wait(lock, [this]() {
        return closing_ || ready_.size() < options_.buffer_size;
    });

    if (closing_) {
        throw QueueClosedError(options_.name);
    }

    ready_.push_back(std::move(env));
    lock.unlock();
    work_cv_.notify_one();
}

void WorkQueue::fail(Envelope env, std::exception_ptr error) {
    handle_failure(std::move(env), std::move(error));
}

void WorkQueue::close_timeout(std::chrono::milliseconds timeout) {
    size_t dropped = 0;
    size_t in_flight = 0;
    bool drained = false;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (stopping_) {
            return;
        }
        closing_ = true;
        space_cv_.notify_all();

        drained = idle_cv_.wait_for(lock, timeout, [this]() { return idle_locked(); });

        if (!drained) {
            dropped = ready_.size() + delayed_.size();
            in_flight = in_flight_;
            ready_.clear();
            delayed_.clear();
        }
        stopping_ = true;
    }
    work_cv_.notify_all();

    if (!drained) {
        dropped_ += dropped;
        spdlog::error("[ironq] WorkQueue {} drain timed out after {}ms: {} dropped, {} in flight",
                      options_.name, timeout.count(), dropped, in_flight);
        throw TimeoutError("ironq: timeout closing " + options_.name + " (" +
                           std::to_string(dropped) + " messages dropped, " +
                           std::to_string(in_flight) + " in flight)");
    }

    // Workers are idle and observe stopping_, join them now
    join_workers();
    spdlog::debug("[ironq] WorkQueue {} closed", options_.name);
}

bool WorkQueue::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closing_;
}

size_t WorkQueue::len() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ready_.size() + delayed_.size() + in_flight_;
}

WorkQueueStats WorkQueue::stats() const {
    WorkQueueStats stats;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats.buffered = ready_.size();
        stats.delayed = delayed_.size();
        stats.in_flight = in_flight_;
    }
    stats.processed = processed_.load();
    stats.retried = retried_.load();
    stats.failed = failed_.load();
    stats.dropped = dropped_.load();
    return stats;
}

void WorkQueue::worker_loop(int worker_id) {
    std::unique_lock<std::mutex> lock(mutex_);

    while (!stopping_) {
        promote_due_locked(Clock::now());

        if (!ready_.empty()) {
            Envelope env = std::move(ready_.front());
            ready_.pop_front();
            in_flight_++;
            lock.unlock();
            space_cv_.notify_one();

            process(env);

            lock.lock();
            in_flight_--;
            if (idle_locked()) {
                idle_cv_.notify_all();
            }
            continue;
        }

        if (delayed_.empty()) {
            work_cv_.wait(lock);
        } else {
            auto next = std::min_element(delayed_.begin(), delayed_.end(),
                [](const DelayedEnvelope& a, const DelayedEnvelope& b) {
                    return a.ready_at < b.ready_at;
                });
            Clock::time_point wake_at = next->ready_at;
            work_cv_.wait_until(lock, wake_at);
        }
    }

    spdlog::debug("[ironq] WorkQueue {} worker {} stopped", options_.name, worker_id);
}

void WorkQueue::process(Envelope& env) {
    env.attempt++;
    try {
        options_.handler(env);
        processed_++;
    } catch (...) {
        handle_failure(std::move(env), std::current_exception());
    }
}

void WorkQueue::handle_failure(Envelope env, std::exception_ptr error) {
    if (env.attempt < options_.retry_limit) {
        auto delay = backoff_delay(env.attempt, options_.min_backoff, options_.max_backoff);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!stopping_) {
                spdlog::warn("[ironq] {} failed (attempt {}/{}), retrying in {}ms: {}",
                             options_.handler_name, env.attempt, options_.retry_limit,
                             delay.count(), describe_error(error));
                delayed_.push_back(DelayedEnvelope{Clock::now() + delay, std::move(env)});
                retried_++;
                work_cv_.notify_one();
                return;
            }
        }
    }
    run_fallback(env, error);
}

void WorkQueue::run_fallback(Envelope& env, std::exception_ptr error) {
    failed_++;
    spdlog::error("[ironq] {} failed after {} attempt(s): {}",
                  options_.handler_name, env.attempt, describe_error(error));

    if (!options_.fallback_handler) {
        return;
    }
    try {
        options_.fallback_handler(env, error);
    } catch (const std::exception& e) {
        spdlog::error("[ironq] {} fallback failed: {}", options_.handler_name, e.what());
    }
}

void WorkQueue::promote_due_locked(Clock::time_point now) {
    auto due = std::stable_partition(delayed_.begin(), delayed_.end(),
        [now](const DelayedEnvelope& d) { return d.ready_at > now; });
    for (auto it = due; it != delayed_.end(); ++it) {
        ready_.push_back(std::move(it->env));
    }
    delayed_.erase(due, delayed_.end());
}

bool WorkQueue::idle_locked() const {
    return ready_.empty() && delayed_.empty() && in_flight_ == 0;
}

void WorkQueue::join_workers() {
    for (auto& worker : workers_) {
        if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) {
            worker.join();
        }
    }
}

} // namespace ironq
