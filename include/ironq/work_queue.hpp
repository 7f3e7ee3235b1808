#pragma once

#include "ironq/envelope.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace ironq {

using EnvelopeHandler = std::function<void(Envelope& env)>;
using EnvelopeFallback = std::function<void(Envelope& env, std::exception_ptr error)>;

struct WorkQueueOptions {
    std::string name;
    size_t buffer_size = 100;
    int worker_count = 1;

    // Registered handler, throws on failure
    std::string handler_name;
    EnvelopeHandler handler;
    EnvelopeFallback fallback_handler;

    int retry_limit = 3;
    std::chrono::milliseconds min_backoff{1000};
    std::chrono::milliseconds max_backoff{30000};
};

struct WorkQueueStats {
    size_t buffered = 0;
    size_t delayed = 0;
    size_t in_flight = 0;
    uint64_t processed = 0;
    uint64_t retried = 0;
    uint64_t failed = 0;
    uint64_t dropped = 0;
};

/**
 * WorkQueue - bounded in-memory buffer drained by dedicated worker threads.
 *
 * add() returns once the envelope is buffered; the handler runs later on a
 * worker. Failed envelopes are retried with exponential backoff until
 * retry_limit attempts were made, then passed to the fallback handler.
 *
 * Thread-safe: add/fail/close_timeout may be called from any thread,
 * including from inside the handler.
 */
class WorkQueue {
public:
    explicit WorkQueue(WorkQueueOptions options);
    ~WorkQueue();

    WorkQueue(const WorkQueue&) = delete;
    WorkQueue& operator=(const WorkQueue&) = delete;

    const std::string& name() const { return options_.name; }

    /**
     * Buffer an envelope for processing.
     * Blocks while the buffer is full; throws QueueClosedError once closing.
     */
    void add(Envelope env);

    /**
     * Report a failure for an envelope whose handler already returned
     * (e.g. it was handed to a batching stage). Enters the normal
     * retry/fallback path.
     */
    void fail(Envelope env, std::exception_ptr error);

    /**
     * Stop accepting and wait until buffered, delayed and in-flight work is
     * done. Throws TimeoutError when the deadline passes first; whatever is
     * still buffered is dropped.
     */
    void close_timeout(std::chrono::milliseconds timeout);

    bool closed() const;

    // Buffered + waiting for retry + in flight
    size_t len() const;

    WorkQueueStats stats() const;

private:
    using Clock = std::chrono::steady_clock;

    struct DelayedEnvelope {
        Clock::time_point ready_at;
        Envelope env;
    };

    void worker_loop(int worker_id);
    void process(Envelope& env);
    void handle_failure(Envelope env, std::exception_ptr error);
    void run_fallback(Envelope& env, std::exception_ptr error);
    void promote_due_locked(Clock::time_point now);
    bool idle_locked() const;
    void join_workers();

    WorkQueueOptions options_;

    std::deque<Envelope> ready_;
    std::vector<DelayedEnvelope> delayed_;
    size_t in_flight_ = 0;

    bool closing_ = false;
    bool stopping_ = false;

    mutable std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable space_cv_;
    std::condition_variable idle_cv_;

    std::vector<std::thread> workers_;

    std::atomic<uint64_t> processed_{0};
    std::atomic<uint64_t> retried_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<uint64_t> dropped_{0};
};

} // namespace ironq
