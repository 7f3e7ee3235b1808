#pragma once

#include "ironq/config.hpp"
#include "ironq/context.hpp"
#include "ironq/message.hpp"
#include "ironq/task.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace ironq {

class Queue;

struct ConsumerStats {
    size_t buffered = 0;
    size_t in_flight = 0;
    uint64_t fetched = 0;
    uint64_t processed = 0;
    uint64_t failed = 0;
    uint64_t released = 0;
    uint64_t poisoned = 0;
    uint64_t fetch_errors = 0;
};

/**
 * Consumer - reserves messages from a Queue and runs registered handlers.
 *
 * One fetcher thread long-polls into a bounded buffer, `concurrency` workers
 * drain it. A handled message is acknowledged through submit_delete(); a
 * failed one is released with backoff, or handed to the fallback and deleted
 * once its reservation count reaches the task's retry limit.
 */
class Consumer {
public:
    Consumer(Queue& queue, std::shared_ptr<TaskRegistry> registry, ConsumerConfig config = ConsumerConfig());
    ~Consumer();

    Consumer(const Consumer&) = delete;
    Consumer& operator=(const Consumer&) = delete;

    void start();

    /**
     * Stop fetching and finish what is already buffered.
     * Throws TimeoutError when workers are still busy after `timeout`.
     */
    void stop_timeout(std::chrono::milliseconds timeout);

    bool running() const;

    // Dispatch one reserved message synchronously on the calling thread
    void process(Message& msg);

    ConsumerStats stats() const;

private:
    void fetch_loop();
    void worker_loop(int worker_id);
    void handle_failure(Message& msg, const TaskOptions* task, std::exception_ptr error);
    void acknowledge(Message& msg);
    bool idle_locked() const;
    void join_threads();

    Queue& queue_;
    std::shared_ptr<TaskRegistry> registry_;
    ConsumerConfig config_;
    Context ctx_;

    std::deque<Message> buffer_;
    size_t in_flight_ = 0;
    bool fetching_ = false;
    bool running_ = false;
    bool stopping_ = false;

    mutable std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable space_cv_;
    std::condition_variable idle_cv_;

    std::thread fetcher_;
    std::vector<std::thread> workers_;

    std::atomic<uint64_t> fetched_{0};
    std::atomic<uint64_t> processed_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<uint64_t> released_{0};
    std::atomic<uint64_t> poisoned_{0};
    std::atomic<uint64_t> fetch_errors_{0};
};

} // namespace ironq
