#include "ironq/consumer.hpp"
#include "ironq/errors.hpp"
#include "ironq/queue.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace ironq {

Consumer::Consumer(Queue& queue, std::shared_ptr<TaskRegistry> registry, ConsumerConfig config)
    : queue_(queue), registry_(std::move(registry)), config_(config) {
    if (!registry_) {
        registry_ = std::make_shared<TaskRegistry>();
    }
    if (config_.concurrency < 1) {
        config_.concurrency = 1;
    }
    if (config_.reservation_size < 1) {
        config_.reservation_size = 1;
    }
    if (config_.buffer_size == 0) {
        config_.buffer_size = 1;
    }
}

Consumer::~Consumer() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        running_ = false;
        ctx_.cancel();
    }
    work_cv_.notify_all();
    space_cv_.notify_all();
    join_threads();
}

void Consumer::start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_) {
            return;
        }
        if (stopping_ && !idle_locked()) {
            throw Error("ironq: consumer for " + queue_.name() + " is still stopping");
        }
    }

    // Threads of a previous run exit once they observe stopping_
    join_threads();

    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = false;
    running_ = true;
    ctx_ = Context();

    fetcher_ = std::thread([this]() { fetch_loop(); });
    workers_.reserve(config_.concurrency);
    for (int i = 0; i < config_.concurrency; ++i) {
        workers_.emplace_back([this, i]() { worker_loop(i); });
    }

    spdlog::info("[ironq:consumer] Started on {}: concurrency={}, reservation_size={}, wait={}ms",
                 queue_.name(), config_.concurrency, config_.reservation_size,
                 config_.wait_timeout.count());
}

void Consumer::stop_timeout(std::chrono::milliseconds timeout) {
    bool drained = false;
    size_t buffered = 0;
    size_t in_flight = 0;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
        stopping_ = true;
        ctx_.cancel();
        work_cv_.notify_all();
        space_cv_.notify_all();

        drained = idle_cv_.wait_for(lock, timeout, [this]() { return idle_locked(); });
        buffered = buffer_.size();
        in_flight = in_flight_;
    }

    if (!drained) {
        spdlog::error("[ironq:consumer] Stop of {} timed out after {}ms: {} buffered, {} in flight",
                      queue_.name(), timeout.count(), buffered, in_flight);
        throw TimeoutError("ironq: timeout stopping consumer for " + queue_.name());
    }

    join_threads();
    spdlog::info("[ironq:consumer] Stopped on {}", queue_.name());
}

bool Consumer::running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

ConsumerStats Consumer::stats() const {
    ConsumerStats stats;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats.buffered = buffer_.size();
        stats.in_flight = in_flight_;
    }
    stats.fetched = fetched_.load();
    stats.processed = processed_.load();
    stats.failed = failed_.load();
    stats.released = released_.load();
    stats.poisoned = poisoned_.load();
    stats.fetch_errors = fetch_errors_.load();
    return stats;
}

void Consumer::fetch_loop() {
    std::unique_lock<std::mutex> lock(mutex_);

    while (true) {
        space_cv_.wait(lock, [this]() {
            return stopping_ || buffer_.size() < config_.buffer_size;
        });
        if (stopping_) {
            break;
        }

        fetching_ = true;
        Context ctx = ctx_;
        lock.unlock();

        std::vector<Message> msgs;
        bool failed = false;
        try {
            msgs = queue_.reserve_n(ctx, config_.reservation_size, config_.wait_timeout);
        } catch (const std::exception& e) {
            failed = true;
            fetch_errors_++;
            spdlog::warn("[ironq:consumer] Reserve on {} failed, backing off {}ms: {}",
                         queue_.name(), config_.error_backoff.count(), e.what());
        }

        lock.lock();
        fetching_ = false;

        if (failed) {
            if (idle_locked()) idle_cv_.notify_all();
            work_cv_.notify_all();
            space_cv_.wait_for(lock, config_.error_backoff, [this]() { return stopping_; });
            continue;
        }

        fetched_ += msgs.size();
        for (auto& msg : msgs) {
            buffer_.push_back(std::move(msg));
        }
        work_cv_.notify_all();
        if (idle_locked()) idle_cv_.notify_all();
    }

    // Workers waiting on an empty buffer may exit now
    work_cv_.notify_all();
    if (idle_locked()) idle_cv_.notify_all();
}

void Consumer::worker_loop(int worker_id) {
    std::unique_lock<std::mutex> lock(mutex_);

    while (true) {
        work_cv_.wait(lock, [this]() {
            return !buffer_.empty() || (stopping_ && !fetching_);
        });
        if (buffer_.empty()) {
            break;
        }

        Message msg = std::move(buffer_.front());
        buffer_.pop_front();
        in_flight_++;
        lock.unlock();
        space_cv_.notify_one();

        process(msg);

        lock.lock();
        in_flight_--;
        if (idle_locked()) {
            idle_cv_.notify_all();
        }
    }

    spdlog::debug("[ironq:consumer] Worker {} on {} stopped", worker_id, queue_.name());
}

void Consumer::process(Message& msg) {
    auto task = registry_->find(msg.task_name);

    if (msg.has_error()) {
        handle_failure(msg, task.get(),
                       std::make_exception_ptr(CodecError("ironq: message " + msg.id + ": " + msg.err_detail)));
        return;
    }
    if (!task) {
        handle_failure(msg, nullptr,
                       std::make_exception_ptr(Error("ironq: unknown task \"" + msg.task_name + "\"")));
        return;
    }

    try {
        task->handler(msg);
    } catch (...) {
        handle_failure(msg, task.get(), std::current_exception());
        return;
    }

    processed_++;
    acknowledge(msg);
}

void Consumer::handle_failure(Message& msg, const TaskOptions* task, std::exception_ptr error) {
    failed_++;

    TaskOptions defaults;
    const TaskOptions& options = task ? *task : defaults;

    if (msg.reserved_count >= options.retry_limit) {
        poisoned_++;
        spdlog::error("[ironq:consumer] Message {} ({}) failed after {} reservation(s), giving up: {}",
                      msg.id, msg.task_name, msg.reserved_count, describe_error(error));
        if (options.fallback_handler) {
            try {
                options.fallback_handler(msg, error);
            } catch (const std::exception& e) {
                spdlog::error("[ironq:consumer] Fallback for {} failed: {}", msg.task_name, e.what());
            }
        }
        acknowledge(msg);
        return;
    }

    msg.delay = backoff_delay(std::max(msg.reserved_count, 1), options.min_backoff, options.max_backoff);
    spdlog::warn("[ironq:consumer] Message {} ({}) failed (reservation {}/{}), releasing with {}ms delay: {}",
                 msg.id, msg.task_name, msg.reserved_count, options.retry_limit,
                 msg.delay.count(), describe_error(error));
    try {
        queue_.release(msg);
        released_++;
    } catch (const std::exception& e) {
        // The reservation expires on its own and the message is redelivered
        spdlog::error("[ironq:consumer] Release of {} failed: {}", msg.id, e.what());
    }
}

void Consumer::acknowledge(Message& msg) {
    try {
        queue_.submit_delete(msg);
    } catch (const std::exception& e) {
        spdlog::error("[ironq:consumer] Delete of {} failed, it will be redelivered: {}", msg.id, e.what());
    }
}

bool Consumer::idle_locked() const {
    return buffer_.empty() && in_flight_ == 0 && !fetching_;
}

void Consumer::join_threads() {
    if (fetcher_.joinable()) {
        fetcher_.join();
    }
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

} // namespace ironq
