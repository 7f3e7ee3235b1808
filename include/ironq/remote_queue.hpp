#pragma once

#include "ironq/message.hpp"
#include <string>
#include <vector>

namespace ironq {

/**
 * Remote, HTTP-polled queue service.
 *
 * Every call blocks on the network. Failures are reported as RemoteError
 * with a typed reason so callers never inspect error text.
 */
class RemoteQueue {
public:
    virtual ~RemoteQueue() = default;

    virtual std::string name() const = 0;

    // Returns the remote-assigned message id
    virtual std::string push(const std::string& body, int delay_seconds) = 0;

    /**
     * Reserve up to n messages, blocking server-side up to wait_seconds.
     * An empty poll is reported as RemoteError(404, message_not_found).
     */
    virtual std::vector<RemoteMessage> long_poll(int n, int reservation_seconds, int wait_seconds) = 0;

    virtual void release(const std::string& id, const std::string& reservation_id, int delay_seconds) = 0;
    virtual void delete_message(const std::string& id, const std::string& reservation_id) = 0;
    virtual void delete_reserved(const std::vector<ReservedRef>& refs) = 0;

    // Remove every message from the queue
    virtual void clear() = 0;

    virtual int size() = 0;

    // Provision the queue; safe to call when it already exists
    virtual void create_queue() = 0;
};

} // namespace ironq
