#include "ironq/queue_adapter.hpp"
#include "ironq/envelope.hpp"
#include "ironq/errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

namespace ironq {

namespace {

constexpr int MAX_RESERVE_N = 100;

// The service settles at most this many reservations per delete call
constexpr size_t MAX_DELETE_BATCH = 10;

int whole_seconds(std::chrono::milliseconds d) {
    return static_cast<int>(std::chrono::duration_cast<std::chrono::seconds>(d).count());
}

void require_reservation(const Message& msg, const char* operation) {
    if (msg.id.empty() || msg.reservation_id.empty()) {
        throw InvalidReservationError(std::string("ironq: ") + operation +
                                      " requires a reserved message (id=" + msg.id + ")");
    }
}

} // namespace

RemoteQueueAdapter::RemoteQueueAdapter(std::shared_ptr<RemoteQueue> remote,
                                       AdapterConfig config,
                                       std::shared_ptr<Storage> storage,
                                       std::shared_ptr<TaskRegistry> registry)
    : remote_(std::move(remote)),
      config_(std::move(config)),
      storage_(std::move(storage)),
      registry_(std::move(registry)),
      retry_(config_.retry) {
    if (!remote_) {
        throw Error("ironq: remote queue is required");
    }
    if (config_.queue_name.empty()) {
        config_.queue_name = remote_->name();
    }
    if (!storage_) {
        storage_ = std::make_shared<LocalStorage>(config_.dedup_cache_size, config_.dedup_ttl);
    }
    if (!registry_) {
        registry_ = std::make_shared<TaskRegistry>();
    }
    config_.batch_limit = std::max<size_t>(1, std::min(config_.batch_limit, MAX_DELETE_BATCH));

    const std::string prefix = "ironq:" + config_.queue_name;
    add_handler_name_ = prefix + ":add-message";
    delete_handler_name_ = prefix + ":delete-message";

    WorkQueueOptions add_options;
    add_options.name = prefix + ":add";
    add_options.buffer_size = config_.buffer_size;
    add_options.handler_name = add_handler_name_;
    add_options.handler = [this](Envelope& env) { push_envelope(env); };
    add_options.fallback_handler = [this](Envelope& env, std::exception_ptr error) {
        push_fallback(env, error);
    };
    add_options.retry_limit = config_.pipeline_retry_limit;
    add_options.min_backoff = config_.pipeline_min_backoff;
    add_options.max_backoff = config_.pipeline_max_backoff;
    add_queue_ = std::make_unique<WorkQueue>(std::move(add_options));

    BatcherOptions batch_options;
    batch_options.name = prefix + ":delete-batch";
    batch_options.handler = [this](std::vector<Envelope>& batch) { delete_batch(batch); };
    batch_options.should_batch = [this](const std::vector<Envelope>& batch, const Envelope& next) {
        return should_batch_delete(batch, next);
    };
    batch_options.on_error = [this](std::vector<Envelope>& batch, std::exception_ptr error) {
        on_delete_batch_failed(batch, error);
    };
    batch_options.timeout = config_.batch_timeout;
    del_batcher_ = std::make_unique<Batcher>(std::move(batch_options));

    WorkQueueOptions del_options;
    del_options.name = prefix + ":delete";
    del_options.buffer_size = config_.buffer_size;
    del_options.handler_name = delete_handler_name_;
    del_options.handler = [this](Envelope& env) { submit_to_batcher(env); };
    del_options.fallback_handler = [this](Envelope& env, std::exception_ptr error) {
        delete_fallback(env, error);
    };
    del_options.retry_limit = config_.pipeline_retry_limit;
    del_options.min_backoff = config_.pipeline_min_backoff;
    del_options.max_backoff = config_.pipeline_max_backoff;
    del_queue_ = std::make_unique<WorkQueue>(std::move(del_options));

    spdlog::info("[ironq] Queue {} ready: buffer={}, batch_limit={}, reservation_timeout={}ms, retry_attempts={}",
                 config_.queue_name, config_.buffer_size, config_.batch_limit,
                 config_.reservation_timeout.count(), retry_.options().max_attempts);
}

RemoteQueueAdapter::~RemoteQueueAdapter() {
    try {
        close();
    } catch (const std::exception& e) {
        spdlog::error("[ironq] Queue {} close on destruction failed: {}", config_.queue_name, e.what());
    }
}

int RemoteQueueAdapter::len() {
    return remote_->size();
}

// ============================================================================
// Add pipeline
// ============================================================================

void RemoteQueueAdapter::add(const std::shared_ptr<Message>& msg) {
    if (!msg) {
        throw std::invalid_argument("ironq: add of a null message");
    }
    if (msg->task_name.empty()) {
        throw TaskNameRequiredError();
    }
    // Checked before dedup so a rejected add records no key
    if (closed_) {
        throw QueueClosedError(config_.queue_name);
    }
    if (is_duplicate(*msg)) {
        msg->err = MessageErr::duplicate;
        duplicates_++;
        spdlog::debug("[ironq:add] {} \"{}\" is a duplicate, not pushed", msg->task_name, msg->name);
        return;
    }
    add_queue_->add(wrap_message(msg, add_handler_name_));
}

bool RemoteQueueAdapter::is_duplicate(const Message& msg) {
    if (msg.name.empty()) {
        return false;
    }
    return storage_->exists(msg.ctx, full_message_name(config_.queue_name, msg));
}

void RemoteQueueAdapter::push_envelope(Envelope& env) {
    auto msg = unwrap_message(env);
    std::string body = encode_to_string(marshal_message(*msg));

    try {
        msg->id = remote_->push(body, whole_seconds(msg->delay));
    } catch (const RemoteError& e) {
        spdlog::error("[ironq:add] Push of {} to {} failed (status {}): {}",
                      msg->task_name, config_.queue_name, e.status_code(), e.what());
        throw;
    }
    pushed_++;
    spdlog::debug("[ironq:add] Pushed {} to {} as {}", msg->task_name, config_.queue_name, msg->id);
}

void RemoteQueueAdapter::push_fallback(Envelope& env, std::exception_ptr error) {
    push_failed_++;
    auto msg = unwrap_message(env);

    auto task = registry_->find(msg->task_name);
    if (!task) {
        spdlog::error("[ironq:add] Giving up on {} for {}, no local handler: {}",
                      msg->task_name, config_.queue_name, describe_error(error));
        return;
    }

    spdlog::warn("[ironq:add] Push of {} exhausted, running it locally", msg->task_name);
    task->handler(*msg);
}

// ============================================================================
// Delete pipeline
// ============================================================================

void RemoteQueueAdapter::submit_delete(Message msg) {
    require_reservation(msg, "delete");
    del_queue_->add(wrap_message(std::make_shared<Message>(std::move(msg)), delete_handler_name_));
}

void RemoteQueueAdapter::submit_to_batcher(Envelope& env) {
    del_batcher_->add(env);
}

void RemoteQueueAdapter::delete_fallback(Envelope& env, std::exception_ptr error) {
    auto msg = unwrap_message(env);
    spdlog::error("[ironq:delete] Giving up deleting {} from {}, it is redelivered after its reservation expires: {}",
                  msg->id, config_.queue_name, describe_error(error));
}

bool RemoteQueueAdapter::should_batch_delete(const std::vector<Envelope>& batch, const Envelope&) const {
    return batch.size() + 1 < config_.batch_limit;
}

void RemoteQueueAdapter::delete_batch(std::vector<Envelope>& batch) {
    if (batch.empty()) {
        throw std::logic_error("ironq: no messages to delete");
    }

    std::vector<ReservedRef> refs;
    refs.reserve(batch.size());
    for (const auto& env : batch) {
        auto msg = unwrap_message(env);
        refs.push_back(ReservedRef{msg->id, msg->reservation_id});
    }

    try {
        retry_.run([&]() { remote_->delete_reserved(refs); });
    } catch (const RemoteError& e) {
        spdlog::error("[ironq:delete] Batch delete of {} message(s) from {} failed (status {}): {}",
                      refs.size(), config_.queue_name, e.status_code(), e.what());
        throw;
    }

    batch_flushes_++;
    deleted_ += refs.size();
    spdlog::debug("[ironq:delete] Deleted {} message(s) from {}", refs.size(), config_.queue_name);
}

void RemoteQueueAdapter::on_delete_batch_failed(std::vector<Envelope>& batch, std::exception_ptr error) {
    batch_flush_failed_++;
    for (auto& env : batch) {
        del_queue_->fail(std::move(env), error);
    }
}

// ============================================================================
// Reservation
// ============================================================================

std::vector<Message> RemoteQueueAdapter::reserve_n(const Context& ctx, int n,
                                                   std::chrono::milliseconds wait_timeout) {
    if (closed_) {
        throw QueueClosedError(config_.queue_name);
    }
    if (ctx.done()) {
        return {};
    }
    n = std::max(1, std::min(n, MAX_RESERVE_N));

    std::vector<RemoteMessage> records;
    try {
        records = remote_->long_poll(n, whole_seconds(config_.reservation_timeout), whole_seconds(wait_timeout));
    } catch (const RemoteError& e) {
        if (e.reason() == RemoteErrorReason::message_not_found) {
            spdlog::debug("[ironq] Reserve on {}: no messages", config_.queue_name);
            return {};
        }
        if (e.reason() == RemoteErrorReason::queue_not_found) {
            spdlog::warn("[ironq] Queue {} not found, recreating it", config_.queue_name);
            recreate_queue();
        }
        throw;
    }

    std::vector<Message> msgs;
    msgs.reserve(records.size());
    for (auto& record : records) {
        Message msg;
        try {
            unmarshal_message(decode_string(record.body), msg);
        } catch (const CodecError& e) {
            msg.err = MessageErr::decode;
            msg.err_detail = e.what();
            spdlog::warn("[ironq] Message {} on {} could not be decoded: {}",
                         record.id, config_.queue_name, e.what());
        }
        msg.id = std::move(record.id);
        msg.reservation_id = std::move(record.reservation_id);
        msg.reserved_count = record.reserved_count;
        msg.ctx = ctx;
        msgs.push_back(std::move(msg));
    }

    reserved_ += msgs.size();
    return msgs;
}

void RemoteQueueAdapter::recreate_queue() {
    try {
        remote_->create_queue();
        queue_recreated_++;
    } catch (const RemoteError& e) {
        spdlog::error("[ironq] Recreating queue {} failed (status {}): {}",
                      config_.queue_name, e.status_code(), e.what());
    }
}

// ============================================================================
// Release / delete / purge
// ============================================================================

void RemoteQueueAdapter::release(const Message& msg) {
    require_reservation(msg, "release");
    retry_.run([&]() { remote_->release(msg.id, msg.reservation_id, whole_seconds(msg.delay)); });
    released_++;
}

void RemoteQueueAdapter::delete_message(const Message& msg) {
    require_reservation(msg, "delete");
    try {
        retry_.run([&]() { remote_->delete_message(msg.id, msg.reservation_id); });
    } catch (const RemoteError& e) {
        if (!e.is_not_found()) {
            throw;
        }
        spdlog::debug("[ironq:delete] Message {} already gone from {}", msg.id, config_.queue_name);
        return;
    }
    deleted_++;
}

void RemoteQueueAdapter::purge() {
    remote_->clear();
    spdlog::info("[ironq] Purged {}", config_.queue_name);
}

// ============================================================================
// Lifecycle
// ============================================================================

Consumer& RemoteQueueAdapter::consumer() {
    std::lock_guard<std::mutex> lock(consumer_mutex_);
    if (!consumer_) {
        consumer_ = std::make_unique<Consumer>(*this, registry_, config_.consumer);
    }
    return *consumer_;
}

void RemoteQueueAdapter::close() {
    close_timeout(config_.close_timeout);
}

void RemoteQueueAdapter::close_timeout(std::chrono::milliseconds timeout) {
    if (closed_.exchange(true)) {
        return;
    }

    std::exception_ptr first_error;
    auto record = [&](const char* step, std::exception_ptr error) {
        if (!first_error) {
            first_error = error;
        } else {
            spdlog::warn("[ironq] Close of {}: {} also failed: {}", config_.queue_name, step, describe_error(error));
        }
    };

    {
        std::lock_guard<std::mutex> lock(consumer_mutex_);
        if (consumer_ && consumer_->running()) {
            try {
                consumer_->stop_timeout(timeout);
            } catch (...) {
                record("stop consumer", std::current_exception());
            }
        }
    }

    try {
        del_batcher_->flush();
    } catch (...) {
        record("flush delete batch", std::current_exception());
    }

    try {
        del_queue_->close_timeout(timeout);
    } catch (...) {
        record("drain delete buffer", std::current_exception());
    }

    try {
        del_batcher_->close();
    } catch (...) {
        record("close delete batcher", std::current_exception());
    }

    try {
        add_queue_->close_timeout(timeout);
    } catch (...) {
        record("drain add buffer", std::current_exception());
    }

    if (first_error) {
        spdlog::error("[ironq] Queue {} closed with errors: {}", config_.queue_name, describe_error(first_error));
        std::rethrow_exception(first_error);
    }
    spdlog::info("[ironq] Queue {} closed", config_.queue_name);
}

size_t RemoteQueueAdapter::pending_adds() const {
    return add_queue_->len();
}

size_t RemoteQueueAdapter::pending_deletes() const {
    return del_queue_->len() + del_batcher_->pending();
}

QueueStats RemoteQueueAdapter::stats() const {
    QueueStats stats;
    stats.queue_name = config_.queue_name;
    stats.pending_adds = pending_adds();
    stats.pending_deletes = pending_deletes();
    stats.open_batch = del_batcher_->pending();
    stats.pushed = pushed_.load();
    stats.push_failed = push_failed_.load();
    stats.duplicates = duplicates_.load();
    stats.reserved = reserved_.load();
    stats.deleted = deleted_.load();
    stats.batch_flushes = batch_flushes_.load();
    stats.batch_flush_failed = batch_flush_failed_.load();
    stats.released = released_.load();
    stats.queue_recreated = queue_recreated_.load();
    return stats;
}

} // namespace ironq
