#pragma once

#include "ironq/context.hpp"
#include "ironq/message.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace ironq {

/**
 * Queue capability the task framework drives.
 *
 * Backends implement exactly these operations. submit_delete() is the
 * asynchronous acknowledgement hook used by the consumer; the default
 * deletes synchronously.
 */
class Queue {
public:
    virtual ~Queue() = default;

    virtual std::string name() const = 0;

    // Number of messages held by the backend
    virtual int len() = 0;

    virtual void add(const std::shared_ptr<Message>& msg) = 0;

    virtual std::vector<Message> reserve_n(const Context& ctx, int n,
                                           std::chrono::milliseconds wait_timeout) = 0;

    virtual void release(const Message& msg) = 0;
    virtual void delete_message(const Message& msg) = 0;

    virtual void submit_delete(Message msg) { delete_message(msg); }

    virtual void purge() = 0;

    virtual void close() = 0;
    virtual void close_timeout(std::chrono::milliseconds timeout) = 0;
};

} // namespace ironq
