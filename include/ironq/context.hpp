#pragma once

#include <atomic>
#include <chrono>
#include <memory>

namespace ironq {

/**
 * Cancellation/deadline carrier passed along with messages and reservations.
 * Copies share the same cancellation flag. Never persisted.
 */
class Context {
public:
    using Clock = std::chrono::steady_clock;

    Context() : cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

    static Context with_timeout(std::chrono::milliseconds timeout) {
        Context ctx;
        ctx.deadline_ = Clock::now() + timeout;
        return ctx;
    }

    void cancel() { cancelled_->store(true); }

    bool cancelled() const { return cancelled_->load(); }

    Clock::time_point deadline() const { return deadline_; }

    bool done() const {
        return cancelled() || Clock::now() >= deadline_;
    }

private:
    std::shared_ptr<std::atomic<bool>> cancelled_;
    Clock::time_point deadline_ = Clock::time_point::max();
};

} // namespace ironq
