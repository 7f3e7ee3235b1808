#pragma once

#include "ironq/context.hpp"
#include <chrono>
#include <cstdint>
#include <string>
#include <utility>

namespace ironq {

// Terminal per-message condition, attached instead of thrown
enum class MessageErr {
    none,
    duplicate,   // Suppressed by the dedup filter, never pushed
    decode       // Reserved body could not be decoded
};

struct Message {
    std::string id;               // Remote-assigned, empty until pushed
    std::string name;             // Optional logical name used for dedup
    std::string task_name;        // Handler that consumes the message (required)
    std::string payload;          // Opaque binary body
    std::chrono::milliseconds delay{0};

    MessageErr err = MessageErr::none;
    std::string err_detail;

    std::string reservation_id;
    int reserved_count = 0;

    Context ctx;

    Message() = default;
    Message(std::string task, std::string body)
        : task_name(std::move(task)), payload(std::move(body)) {}

    bool is_duplicate() const { return err == MessageErr::duplicate; }
    bool has_error() const { return err != MessageErr::none; }
    bool is_reserved() const { return !id.empty() && !reservation_id.empty(); }
};

// One record returned by a long-poll
struct RemoteMessage {
    std::string id;
    std::string reservation_id;
    std::string body;
    int reserved_count = 0;
};

// (id, reservation_id) pair identifying a reserved instance for batch delete
struct ReservedRef {
    std::string id;
    std::string reservation_id;
};

struct QueueStats {
    std::string queue_name;
    size_t pending_adds = 0;
    size_t pending_deletes = 0;
    size_t open_batch = 0;            // Deletes waiting in the batcher
    uint64_t pushed = 0;
    uint64_t push_failed = 0;
    uint64_t duplicates = 0;
    uint64_t reserved = 0;
    uint64_t deleted = 0;
    uint64_t batch_flushes = 0;
    uint64_t batch_flush_failed = 0;
    uint64_t released = 0;
    uint64_t queue_recreated = 0;
};

} // namespace ironq
