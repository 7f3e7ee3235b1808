#pragma once

#include "ironq/envelope.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace ironq {

using BatchHandler = std::function<void(std::vector<Envelope>& batch)>;
using ShouldBatch = std::function<bool(const std::vector<Envelope>& batch, const Envelope& next)>;
using BatchErrorHandler = std::function<void(std::vector<Envelope>& batch, std::exception_ptr error)>;

struct BatcherOptions {
    std::string name;
    BatchHandler handler;

    // true = append next to the open batch, false = flush the open batch first
    ShouldBatch should_batch;

    // Receives a batch whose handler threw
    BatchErrorHandler on_error;

    // An open batch is flushed after waiting this long
    std::chrono::milliseconds timeout{3000};
};

/**
 * Batcher - coalesces single items into batches for one handler call.
 *
 * There is a single open batch. The batch lock is held while the handler
 * runs, so only one flush is in flight and concurrent add() calls queue
 * behind it.
 */
class Batcher {
public:
    explicit Batcher(BatcherOptions options);
    ~Batcher();

    Batcher(const Batcher&) = delete;
    Batcher& operator=(const Batcher&) = delete;

    void add(Envelope env);

    /**
     * Flush the open batch now, if any.
     * A handler failure is passed to on_error and then rethrown.
     */
    void flush();

    /**
     * Flush what is left and stop the timer. Items added afterwards are
     * flushed one by one. Rethrows a failure of the final flush.
     */
    void close();

    bool closed() const;
    size_t pending() const;

    uint64_t flushes() const { return flushes_.load(); }
    uint64_t failures() const { return failures_.load(); }

private:
    using Clock = std::chrono::steady_clock;

    std::exception_ptr process_locked(std::vector<Envelope> batch);
    void timer_loop();

    BatcherOptions options_;

    std::vector<Envelope> batch_;
    Clock::time_point batch_deadline_;
    bool closed_ = false;

    mutable std::mutex mutex_;
    std::condition_variable timer_cv_;
    std::thread timer_;

    std::atomic<uint64_t> flushes_{0};
    std::atomic<uint64_t> failures_{0};
};

} // namespace ironq
