#pragma once

#include "ironq/batcher.hpp"
#include "ironq/config.hpp"
#include "ironq/consumer.hpp"
#include "ironq/queue.hpp"
#include "ironq/remote_queue.hpp"
#include "ironq/retry_policy.hpp"
#include "ironq/storage.hpp"
#include "ironq/task.hpp"
#include "ironq/work_queue.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>

namespace ironq {

/**
 * RemoteQueueAdapter - Queue backed by a RemoteQueue service.
 *
 * add() dedups and buffers; an add pipeline pushes in the background.
 * submit_delete() buffers; a delete pipeline feeds a batcher that settles
 * up to batch_limit reservations per remote call. reserve_n() long-polls
 * and recreates the queue when the service reports it missing.
 *
 * Remote calls made from release/delete run under the configured
 * RetryPolicy (transient failures only).
 */
class RemoteQueueAdapter : public Queue {
public:
    RemoteQueueAdapter(std::shared_ptr<RemoteQueue> remote,
                       AdapterConfig config = AdapterConfig(),
                       std::shared_ptr<Storage> storage = nullptr,
                       std::shared_ptr<TaskRegistry> registry = nullptr);
    ~RemoteQueueAdapter() override;

    RemoteQueueAdapter(const RemoteQueueAdapter&) = delete;
    RemoteQueueAdapter& operator=(const RemoteQueueAdapter&) = delete;

    std::string name() const override { return config_.queue_name; }

    int len() override;

    /**
     * Buffer msg for pushing and return.
     * Throws TaskNameRequiredError on an empty task name and
     * QueueClosedError once close() has begun. A duplicate is
     * marked on msg->err and never pushed. msg->id is set by the pipeline
     * once the push went through.
     */
    void add(const std::shared_ptr<Message>& msg) override;

    std::vector<Message> reserve_n(const Context& ctx, int n,
                                   std::chrono::milliseconds wait_timeout) override;

    void release(const Message& msg) override;

    // A message the service no longer knows counts as deleted
    void delete_message(const Message& msg) override;

    // Queue msg for a batched delete
    void submit_delete(Message msg) override;

    void purge() override;

    void close() override;

    /**
     * Stop the consumer, flush and drain the delete pipeline, then drain the
     * add pipeline, each step bounded by `timeout`. Every step runs; the first
     * failure is rethrown.
     */
    void close_timeout(std::chrono::milliseconds timeout) override;

    // Lazily created consumer dispatching to the adapter's task registry
    Consumer& consumer();

    std::shared_ptr<TaskRegistry> registry() const { return registry_; }
    const AdapterConfig& config() const { return config_; }

    size_t pending_adds() const;
    size_t pending_deletes() const;
    QueueStats stats() const;

private:
    friend struct RemoteQueueAdapterTestAccess;

    void push_envelope(Envelope& env);
    void push_fallback(Envelope& env, std::exception_ptr error);
    void submit_to_batcher(Envelope& env);
    void delete_fallback(Envelope& env, std::exception_ptr error);
    bool should_batch_delete(const std::vector<Envelope>& batch, const Envelope& next) const;
    void delete_batch(std::vector<Envelope>& batch);
    void on_delete_batch_failed(std::vector<Envelope>& batch, std::exception_ptr error);
    bool is_duplicate(const Message& msg);
    void recreate_queue();

    std::shared_ptr<RemoteQueue> remote_;
    AdapterConfig config_;
    std::shared_ptr<Storage> storage_;
    std::shared_ptr<TaskRegistry> registry_;
    RetryPolicy retry_;

    std::string add_handler_name_;
    std::string delete_handler_name_;

    std::atomic<bool> closed_{false};

    std::atomic<uint64_t> pushed_{0};
    std::atomic<uint64_t> push_failed_{0};
    std::atomic<uint64_t> duplicates_{0};
    std::atomic<uint64_t> reserved_{0};
    std::atomic<uint64_t> deleted_{0};
    std::atomic<uint64_t> batch_flushes_{0};
    std::atomic<uint64_t> batch_flush_failed_{0};
    std::atomic<uint64_t> released_{0};
    std::atomic<uint64_t> queue_recreated_{0};

    // Destroyed in reverse: consumer, delete queue, batcher, add queue
    std::unique_ptr<WorkQueue> add_queue_;
    std::unique_ptr<Batcher> del_batcher_;
    std::unique_ptr<WorkQueue> del_queue_;

    std::mutex consumer_mutex_;
    std::unique_ptr<Consumer> consumer_;
};

} // namespace ironq
