#include "ironq/batcher.hpp"
#include "ironq/errors.hpp"
#include <spdlog/spdlog.h>

namespace ironq {

Batcher::Batcher(BatcherOptions options)
    : options_(std::move(options)) {
    if (!options_.handler) {
        throw Error("ironq: batcher " + options_.name + " has no handler");
    }
    if (!options_.should_batch) {
        options_.should_batch = [](const std::vector<Envelope>&, const Envelope&) { return true; };
    }

    timer_ = std::thread([this]() { timer_loop(); });
}

Batcher::~Batcher() {
    try {
        close();
    } catch (const std::exception& e) {
        spdlog::error("[ironq] Batcher {} final flush failed: {}", options_.name, e.what());
    }
    if (timer_.joinable()) {
        timer_.join();
    }
}

void Batcher::add(Envelope env) {
    std::exception_ptr error;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (closed_) {
            std::vector<Envelope> single;
            single.push_back(std::move(env));
            error = process_locked(std::move(single));
        } else if (batch_.empty() || options_.should_batch(batch_, env)) {
            if (batch_.empty()) {
                batch_deadline_ = Clock::now() + options_.timeout;
                timer_cv_.notify_one();
            }
            batch_.push_back(std::move(env));
        } else {
            std::vector<Envelope> full;
            full.swap(batch_);
            error = process_locked(std::move(full));

            batch_deadline_ = Clock::now() + options_.timeout;
            batch_.push_back(std::move(env));
            timer_cv_.notify_one();
        }
    }

    // The failed batch went to on_error; the item just added is unaffected
    if (error) {
        spdlog::debug("[ironq] Batcher {} flush during add failed", options_.name);
    }
}

void Batcher::flush() {
    std::exception_ptr error;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (batch_.empty()) {
            return;
        }
        std::vector<Envelope> open;
        open.swap(batch_);
        error = process_locked(std::move(open));
    }
    if (error) {
        std::rethrow_exception(error);
    }
}

void Batcher::close() {
    std::exception_ptr error;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
        if (!batch_.empty()) {
            std::vector<Envelope> open;
            open.swap(batch_);
            error = process_locked(std::move(open));
        }
    }
    timer_cv_.notify_all();

    if (error) {
        std::rethrow_exception(error);
    }
}

bool Batcher::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t Batcher::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return batch_.size();
}

std::exception_ptr Batcher::process_locked(std::vector<Envelope> batch) {
    flushes_++;
    try {
        options_.handler(batch);
        return nullptr;
    } catch (...) {
        auto error = std::current_exception();
        failures_++;
        spdlog::error("[ironq] Batcher {} failed to flush {} item(s): {}",
                      options_.name, batch.size(), describe_error(error));
        if (options_.on_error) {
            options_.on_error(batch, error);
        }
        return error;
    }
}

void Batcher::timer_loop() {
    std::unique_lock<std::mutex> lock(mutex_);

    while (!closed_) {
        if (batch_.empty()) {
            timer_cv_.wait(lock);
            continue;
        }

        Clock::time_point deadline = batch_deadline_;
        timer_cv_.wait_until(lock, deadline);

        if (closed_ || batch_.empty() || Clock::now() < batch_deadline_) {
            continue;
        }

        spdlog::debug("[ironq] Batcher {} timer flush of {} item(s)", options_.name, batch_.size());
        std::vector<Envelope> open;
        open.swap(batch_);
        process_locked(std::move(open));
    }
}

} // namespace ironq
