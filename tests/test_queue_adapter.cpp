/**
 * RemoteQueueAdapter tests against an in-memory remote queue
 *
 * - ADD: validation, dedup, async push, delay conversion, fallback
 * - RESERVE: round trip, empty poll, queue re-creation, decode isolation
 * - DELETE: batching, retries, 404 handling
 * - CLOSE: drain and timeout
 */

#include "test_helpers.hpp"
#include "fake_remote_queue.hpp"
#include "ironq/envelope.hpp"
#include "ironq/queue_adapter.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <stdexcept>

using namespace ironq;
using Op = FakeRemoteQueue::Op;

namespace ironq {

struct RemoteQueueAdapterTestAccess {
    static void delete_batch(RemoteQueueAdapter& queue, std::vector<Envelope>& batch) {
        queue.delete_batch(batch);
    }
};

} // namespace ironq

namespace {

AdapterConfig test_config() {
    AdapterConfig config;
    config.queue_name = "jobs";
    config.pipeline_min_backoff = std::chrono::milliseconds(10);
    config.pipeline_max_backoff = std::chrono::milliseconds(40);
    config.close_timeout = std::chrono::seconds(5);
    return config;
}

std::shared_ptr<Message> make_message(const std::string& task, const std::string& payload,
                                      const std::string& name = "") {
    auto msg = std::make_shared<Message>(task, payload);
    msg->name = name;
    return msg;
}

// Push n messages and reserve them all
std::vector<Message> reserve_pushed(RemoteQueueAdapter& queue, int n) {
    for (int i = 0; i < n; ++i) {
        queue.add(make_message("work", "payload-" + std::to_string(i)));
    }
    wait_for([&]() { return queue.stats().pushed == static_cast<uint64_t>(n); });
    return queue.reserve_n(Context(), 100, std::chrono::milliseconds(0));
}

} // namespace

// ============================================================================
// ADD
// ============================================================================

TEST(test_add_requires_task_name) {
    auto remote = std::make_shared<FakeRemoteQueue>();
    RemoteQueueAdapter queue(remote, test_config());

    ASSERT_THROWS(queue.add(make_message("", "body")), TaskNameRequiredError, "Empty task name rejected");
    queue.close();
    ASSERT_EQ(remote->calls(Op::push), 0, "No network call");
}

TEST(test_duplicate_is_marked_not_pushed) {
    auto remote = std::make_shared<FakeRemoteQueue>();
    RemoteQueueAdapter queue(remote, test_config());

    auto first = make_message("send-email", "a", "welcome-1");
    auto second = make_message("send-email", "b", "welcome-1");
    queue.add(first);
    queue.add(second);
    queue.close();

    ASSERT(!first->has_error(), "First submission accepted");
    ASSERT(second->is_duplicate(), "Second submission marked duplicate");
    ASSERT_EQ(remote->calls(Op::push), 1, "Exactly one push");
    ASSERT_EQ(queue.stats().duplicates, uint64_t(1), "Duplicate counted");
}

TEST(test_unnamed_messages_are_not_deduplicated) {
    auto remote = std::make_shared<FakeRemoteQueue>();
    RemoteQueueAdapter queue(remote, test_config());

    queue.add(make_message("work", "same"));
    queue.add(make_message("work", "same"));
    queue.close();

    ASSERT_EQ(remote->calls(Op::push), 2, "Both pushed");
}

TEST(test_duplicate_check_uses_shared_storage) {
    auto remote = std::make_shared<FakeRemoteQueue>();
    auto storage = std::make_shared<LocalStorage>();

    RemoteQueueAdapter a(remote, test_config(), storage);
    RemoteQueueAdapter b(remote, test_config(), storage);

    auto msg_a = make_message("report", "x", "daily");
    auto msg_b = make_message("report", "x", "daily");
    a.add(msg_a);
    b.add(msg_b);
    a.close();
    b.close();

    ASSERT(msg_b->is_duplicate(), "Second adapter sees the first adapter's key");
    ASSERT_EQ(remote->calls(Op::push), 1, "One push across both adapters");
}

TEST(test_push_assigns_id_and_whole_second_delay) {
    auto remote = std::make_shared<FakeRemoteQueue>();
    RemoteQueueAdapter queue(remote, test_config());

    auto msg = make_message("work", "later");
    msg->delay = std::chrono::milliseconds(2900);
    queue.add(msg);
    queue.close();

    ASSERT(!msg->id.empty(), "Remote id attached after push");
    ASSERT_EQ(remote->last_delay_of(msg->id), 2, "Delay truncated to whole seconds");
}

TEST(test_push_retried_then_falls_back_to_local_handler) {
    auto remote = std::make_shared<FakeRemoteQueue>();
    auto registry = std::make_shared<TaskRegistry>();
    std::atomic<int> ran_locally{0};

    TaskOptions task;
    task.name = "work";
    task.handler = [&](Message& msg) {
        ASSERT_EQ(msg.payload, std::string("important"), "Local handler gets the original payload");
        ran_locally++;
    };
    registry->register_task(task);

    remote->fail_next(Op::push, RemoteError(503, "Service Unavailable"), 3);
    RemoteQueueAdapter queue(remote, test_config(), nullptr, registry);

    queue.add(make_message("work", "important"));
    queue.close();

    ASSERT_EQ(remote->calls(Op::push), 3, "Pipeline retry limit honoured");
    ASSERT_EQ(ran_locally.load(), 1, "Exhausted push handled locally");
    ASSERT_EQ(queue.stats().push_failed, uint64_t(1), "Push failure counted");
}

TEST(test_add_after_close_throws) {
    auto remote = std::make_shared<FakeRemoteQueue>();
    RemoteQueueAdapter queue(remote, test_config());
    queue.close();

    ASSERT_THROWS(queue.add(make_message("work", "late")), QueueClosedError, "Closed adapter rejects adds");
    ASSERT_THROWS(queue.reserve_n(Context(), 1, std::chrono::milliseconds(0)), QueueClosedError,
                  "Closed adapter rejects reservations");
}

TEST(test_add_rejected_after_close_leaves_name_free) {
    auto remote = std::make_shared<FakeRemoteQueue>();
    auto storage = std::make_shared<LocalStorage>();

    RemoteQueueAdapter closed(remote, test_config(), storage);
    closed.close();
    auto rejected = make_message("report", "x", "daily");
    ASSERT_THROWS(closed.add(rejected), QueueClosedError, "Closed adapter rejects the add");
    ASSERT(!rejected->is_duplicate(), "Rejected add is not marked duplicate");

    RemoteQueueAdapter open(remote, test_config(), storage);
    auto retry = make_message("report", "x", "daily");
    open.add(retry);
    open.close();

    ASSERT(!retry->is_duplicate(), "Resubmission after a rejected add is accepted");
    ASSERT_EQ(remote->calls(Op::push), 1, "Resubmission pushed");
}

// ============================================================================
// RESERVE
// ============================================================================

TEST(test_push_then_reserve_round_trip) {
    auto remote = std::make_shared<FakeRemoteQueue>();
    RemoteQueueAdapter queue(remote, test_config());

    std::string payload("bin\0ary\xfe", 8);
    auto msg = make_message("resize", payload, "img-1");
    queue.add(msg);
    ASSERT(wait_for([&]() { return queue.stats().pushed == 1; }), "Pushed in the background");

    auto reserved = queue.reserve_n(Context(), 10, std::chrono::milliseconds(0));
    ASSERT_EQ(reserved.size(), size_t(1), "One message reserved");
    ASSERT(reserved[0].payload == payload, "Payload round-trips byte for byte");
    ASSERT_EQ(reserved[0].task_name, std::string("resize"), "Task name restored");
    ASSERT_EQ(reserved[0].name, std::string("img-1"), "Name restored");
    ASSERT_EQ(reserved[0].id, msg->id, "Same remote identity");
    ASSERT(reserved[0].is_reserved(), "Reservation token attached");
    ASSERT_EQ(reserved[0].reserved_count, 1, "First reservation");

    queue.close();
}

TEST(test_reserve_arguments) {
    auto remote = std::make_shared<FakeRemoteQueue>();
    RemoteQueueAdapter queue(remote, test_config());

    queue.reserve_n(Context(), 500, std::chrono::milliseconds(2500));
    auto args = remote->last_poll();
    ASSERT_EQ(args.n, 100, "n clamped to 100");
    ASSERT_EQ(args.reservation_seconds, 300, "Reservation timeout in seconds");
    ASSERT_EQ(args.wait_seconds, 2, "Wait timeout truncated to seconds");
    queue.close();
}

TEST(test_empty_poll_is_not_an_error) {
    auto remote = std::make_shared<FakeRemoteQueue>();
    RemoteQueueAdapter queue(remote, test_config());

    auto reserved = queue.reserve_n(Context(), 10, std::chrono::milliseconds(0));
    ASSERT(reserved.empty(), "Empty result");
    ASSERT_EQ(remote->calls(Op::create_queue), 0, "No repair for an empty poll");
    queue.close();
}

TEST(test_missing_queue_is_recreated_once) {
    auto remote = std::make_shared<FakeRemoteQueue>();
    remote->set_queue_exists(false);
    RemoteQueueAdapter queue(remote, test_config());

    bool thrown = false;
    try {
        queue.reserve_n(Context(), 10, std::chrono::milliseconds(0));
    } catch (const RemoteError& e) {
        thrown = true;
        ASSERT(e.reason() == RemoteErrorReason::queue_not_found, "Original error surfaces");
    }
    ASSERT(thrown, "Current call still fails");
    ASSERT_EQ(remote->calls(Op::create_queue), 1, "Exactly one provisioning call");
    ASSERT_EQ(queue.stats().queue_recreated, uint64_t(1), "Re-creation counted");

    auto reserved = queue.reserve_n(Context(), 10, std::chrono::milliseconds(0));
    ASSERT(reserved.empty(), "Next poll works against the recreated queue");
    queue.close();
}

TEST(test_failed_recreation_still_surfaces_original_error) {
    auto remote = std::make_shared<FakeRemoteQueue>();
    remote->set_queue_exists(false);
    remote->fail_next(Op::create_queue, RemoteError(403, "Forbidden"));
    RemoteQueueAdapter queue(remote, test_config());

    bool not_found = false;
    try {
        queue.reserve_n(Context(), 1, std::chrono::milliseconds(0));
    } catch (const RemoteError& e) {
        not_found = e.reason() == RemoteErrorReason::queue_not_found;
    }
    ASSERT(not_found, "Repair failure does not replace the not-found error");
    ASSERT_EQ(queue.stats().queue_recreated, uint64_t(0), "Nothing recreated");
    queue.close();
}

TEST(test_other_poll_errors_surface_unchanged) {
    auto remote = std::make_shared<FakeRemoteQueue>();
    remote->fail_next(Op::long_poll, RemoteError(500, "Internal Server Error"));
    RemoteQueueAdapter queue(remote, test_config());

    ASSERT_THROWS(queue.reserve_n(Context(), 1, std::chrono::milliseconds(0)), RemoteError,
                  "Server error propagates");
    ASSERT_EQ(remote->calls(Op::long_poll), 1, "Reservation is not retried");
    queue.close();
}

TEST(test_decode_failure_isolated_to_one_message) {
    auto remote = std::make_shared<FakeRemoteQueue>();
    RemoteQueueAdapter queue(remote, test_config());

    queue.add(make_message("work", "good"));
    ASSERT(wait_for([&]() { return queue.stats().pushed == 1; }), "Pushed");
    std::string bad_id = remote->inject_raw("not*base64");

    auto reserved = queue.reserve_n(Context(), 10, std::chrono::milliseconds(0));
    ASSERT_EQ(reserved.size(), size_t(2), "Batch not aborted");

    int decoded = 0;
    int broken = 0;
    for (const auto& msg : reserved) {
        if (msg.err == MessageErr::decode) {
            broken++;
            ASSERT_EQ(msg.id, bad_id, "Error attached to the bad record");
            ASSERT(msg.is_reserved(), "Bad record can still be acknowledged");
            ASSERT(!msg.err_detail.empty(), "Detail recorded");
        } else {
            decoded++;
            ASSERT_EQ(msg.payload, std::string("good"), "Good record decoded");
        }
    }
    ASSERT_EQ(decoded, 1, "One good record");
    ASSERT_EQ(broken, 1, "One broken record");
    queue.close();
}

TEST(test_body_with_text_version_isolated_to_one_message) {
    auto remote = std::make_shared<FakeRemoteQueue>();
    RemoteQueueAdapter queue(remote, test_config());

    queue.add(make_message("work", "good"));
    ASSERT(wait_for([&]() { return queue.stats().pushed == 1; }), "Pushed");
    nlohmann::json bad_body = {{"v", "1"}, {"task", "work"}};
    std::string bad_id = remote->inject_raw(encode_to_string(nlohmann::json::to_msgpack(bad_body)));

    auto reserved = queue.reserve_n(Context(), 10, std::chrono::milliseconds(0));
    ASSERT_EQ(reserved.size(), size_t(2), "Batch not aborted by a mistyped version");

    for (const auto& msg : reserved) {
        if (msg.id == bad_id) {
            ASSERT(msg.err == MessageErr::decode, "Decode error attached to the bad record");
            ASSERT(msg.is_reserved(), "Bad record can still be acknowledged");
        } else {
            ASSERT(!msg.has_error(), "Neighbour decoded");
            ASSERT_EQ(msg.payload, std::string("good"), "Neighbour payload intact");
        }
    }
    queue.close();
}

TEST(test_done_context_skips_poll) {
    auto remote = std::make_shared<FakeRemoteQueue>();
    RemoteQueueAdapter queue(remote, test_config());

    Context ctx;
    ctx.cancel();
    ASSERT(queue.reserve_n(ctx, 10, std::chrono::milliseconds(0)).empty(), "Nothing reserved");
    ASSERT_EQ(remote->calls(Op::long_poll), 0, "No network call");
    queue.close();
}

// ============================================================================
// RELEASE / DELETE
// ============================================================================

TEST(test_release_and_delete_require_reservation) {
    auto remote = std::make_shared<FakeRemoteQueue>();
    RemoteQueueAdapter queue(remote, test_config());

    Message unreserved("work", "x");
    unreserved.id = "msg-1";
    ASSERT_THROWS(queue.release(unreserved), InvalidReservationError, "Release needs a reservation");
    ASSERT_THROWS(queue.delete_message(unreserved), InvalidReservationError, "Delete needs a reservation");
    ASSERT_THROWS(queue.submit_delete(unreserved), InvalidReservationError, "Batched delete needs one too");
    queue.close();
}

TEST(test_release_retries_transient_errors) {
    auto remote = std::make_shared<FakeRemoteQueue>();
    RemoteQueueAdapter queue(remote, test_config());

    auto reserved = reserve_pushed(queue, 1);
    ASSERT_EQ(reserved.size(), size_t(1), "Reserved");

    remote->fail_next(Op::release, RemoteError(503, "busy"), 2);
    reserved[0].delay = std::chrono::milliseconds(4000);
    queue.release(reserved[0]);

    ASSERT_EQ(remote->calls(Op::release), 3, "Two transient failures then success");
    ASSERT_EQ(remote->last_release_delay(), 4, "Delay sent in seconds");
    ASSERT(remote->reservation_of(reserved[0].id).empty(), "Message reservable again");
    queue.close();
}

TEST(test_delete_of_missing_message_succeeds) {
    auto remote = std::make_shared<FakeRemoteQueue>();
    RemoteQueueAdapter queue(remote, test_config());

    Message gone("work", "x");
    gone.id = "msg-404";
    gone.reservation_id = "res-404";
    queue.delete_message(gone);

    ASSERT_EQ(remote->calls(Op::delete_message), 1, "404 not retried");
    queue.close();
}

TEST(test_delete_permanent_error_surfaces) {
    auto remote = std::make_shared<FakeRemoteQueue>();
    RemoteQueueAdapter queue(remote, test_config());

    auto reserved = reserve_pushed(queue, 1);
    remote->fail_next(Op::delete_message, RemoteError(400, "Bad request"));

    ASSERT_THROWS(queue.delete_message(reserved[0]), RemoteError, "Permanent error propagates");
    ASSERT_EQ(remote->calls(Op::delete_message), 1, "Not retried");

    queue.delete_message(reserved[0]);
    ASSERT_EQ(remote->stored(), size_t(0), "Deleted on the next call");
    queue.close();
}

TEST(test_twenty_five_deletes_make_three_batches) {
    auto remote = std::make_shared<FakeRemoteQueue>();
    RemoteQueueAdapter queue(remote, test_config());

    auto reserved = reserve_pushed(queue, 25);
    ASSERT_EQ(reserved.size(), size_t(25), "All reserved");

    for (auto& msg : reserved) {
        queue.submit_delete(msg);
    }
    ASSERT(wait_for([&]() { return remote->batch_sizes().size() == 2 && queue.stats().open_batch == 7; }),
           "Two full batches flushed, seven open");
    queue.close();

    auto sizes = remote->batch_sizes();
    ASSERT_EQ(sizes.size(), size_t(3), "Three batch-delete calls");
    ASSERT_EQ(sizes[0], size_t(9), "First batch");
    ASSERT_EQ(sizes[1], size_t(9), "Second batch");
    ASSERT_EQ(sizes[2], size_t(7), "Final batch on close");
    ASSERT_EQ(remote->stored(), size_t(0), "Every message deleted");
    ASSERT_EQ(remote->calls(Op::delete_message), 0, "No single deletes");
}

TEST(test_configured_batch_limit_capped_at_ten) {
    auto remote = std::make_shared<FakeRemoteQueue>();
    AdapterConfig config = test_config();
    config.batch_limit = 50;
    RemoteQueueAdapter queue(remote, config);
    ASSERT_EQ(queue.config().batch_limit, size_t(10), "Limit capped");

    auto reserved = reserve_pushed(queue, 25);
    ASSERT_EQ(reserved.size(), size_t(25), "All reserved");
    for (auto& msg : reserved) {
        queue.submit_delete(msg);
    }
    queue.close();

    auto sizes = remote->batch_sizes();
    ASSERT(sizes.size() >= 3, "25 deletes need at least three calls");
    for (size_t size : sizes) {
        ASSERT(size <= 9, "No batch above the service ceiling");
    }
    ASSERT_EQ(remote->stored(), size_t(0), "Every message deleted");
}

TEST(test_empty_delete_batch_is_a_logic_error) {
    auto remote = std::make_shared<FakeRemoteQueue>();
    RemoteQueueAdapter queue(remote, test_config());

    std::vector<Envelope> empty;
    ASSERT_THROWS(RemoteQueueAdapterTestAccess::delete_batch(queue, empty), std::logic_error,
                  "Empty flush reported");
    ASSERT_EQ(remote->calls(Op::delete_reserved), 0, "No network call");
    ASSERT_EQ(queue.stats().batch_flushes, uint64_t(0), "Not counted as a flush");
    queue.close();
}

TEST(test_batch_delete_retries_transient_errors) {
    auto remote = std::make_shared<FakeRemoteQueue>();
    RemoteQueueAdapter queue(remote, test_config());

    auto reserved = reserve_pushed(queue, 3);
    remote->fail_next(Op::delete_reserved, RemoteError(500, "Internal Server Error"), 2);
    for (auto& msg : reserved) {
        queue.submit_delete(msg);
    }
    queue.close();

    ASSERT_EQ(remote->calls(Op::delete_reserved), 3, "Retried inside one flush");
    ASSERT_EQ(remote->stored(), size_t(0), "Deleted");
    ASSERT_EQ(queue.stats().batch_flush_failed, uint64_t(0), "Flush succeeded in the end");
}

TEST(test_permanent_batch_failure_reported_by_close) {
    auto remote = std::make_shared<FakeRemoteQueue>();
    AdapterConfig config = test_config();
    config.pipeline_retry_limit = 2;
    RemoteQueueAdapter queue(remote, config);

    auto reserved = reserve_pushed(queue, 1);
    remote->fail_next(Op::delete_reserved, RemoteError(400, "Bad request"), 10);
    queue.submit_delete(reserved[0]);
    ASSERT(wait_for([&]() { return queue.stats().open_batch == 1; }),
           "Delete waiting in the open batch");

    ASSERT_THROWS(queue.close(), RemoteError, "First close step error is rethrown");
    ASSERT_EQ(remote->calls(Op::delete_reserved), 2, "One flush per pipeline attempt");
    ASSERT_EQ(queue.stats().batch_flush_failed, uint64_t(2), "Both flushes failed");
    ASSERT_EQ(remote->stored(), size_t(1), "Message left for redelivery");
}

// ============================================================================
// CLOSE / MISC
// ============================================================================

TEST(test_close_with_sufficient_deadline_flushes_everything) {
    auto remote = std::make_shared<FakeRemoteQueue>();
    RemoteQueueAdapter queue(remote, test_config());

    auto reserved = reserve_pushed(queue, 5);
    for (auto& msg : reserved) {
        queue.submit_delete(msg);
    }
    queue.close_timeout(std::chrono::seconds(5));

    size_t covered = 0;
    for (size_t size : remote->batch_sizes()) covered += size;
    ASSERT_EQ(covered, size_t(5), "Flush covered every buffered delete");
    ASSERT_EQ(remote->stored(), size_t(0), "Remote queue empty");
    ASSERT_EQ(queue.pending_deletes(), size_t(0), "Nothing pending");
}

TEST(test_close_with_short_deadline_times_out) {
    auto remote = std::make_shared<FakeRemoteQueue>();
    RemoteQueueAdapter queue(remote, test_config());

    auto reserved = reserve_pushed(queue, 25);
    remote->set_delete_latency(std::chrono::milliseconds(200));
    for (auto& msg : reserved) {
        queue.submit_delete(msg);
    }

    ASSERT_THROWS(queue.close_timeout(std::chrono::milliseconds(1)), TimeoutError,
                  "Drain past the deadline is reported");
}

TEST(test_close_is_idempotent) {
    auto remote = std::make_shared<FakeRemoteQueue>();
    RemoteQueueAdapter queue(remote, test_config());
    queue.close();
    queue.close();
    ASSERT(true, "Second close is a no-op");
}

TEST(test_len_and_purge) {
    auto remote = std::make_shared<FakeRemoteQueue>();
    RemoteQueueAdapter queue(remote, test_config());

    queue.add(make_message("work", "a"));
    queue.add(make_message("work", "b"));
    ASSERT(wait_for([&]() { return queue.stats().pushed == 2; }), "Pushed");

    ASSERT_EQ(queue.len(), 2, "Remote size");
    queue.purge();
    ASSERT_EQ(queue.len(), 0, "Cleared");
    queue.close();
}

TEST(test_name_defaults_to_remote_name) {
    auto remote = std::make_shared<FakeRemoteQueue>("from-remote");
    AdapterConfig config = test_config();
    config.queue_name.clear();
    RemoteQueueAdapter queue(remote, config);

    ASSERT_EQ(queue.name(), std::string("from-remote"), "Remote name used");
    ASSERT_EQ(queue.stats().queue_name, std::string("from-remote"), "Stats carry the name");
    queue.close();
}

int main() {
    spdlog::set_level(spdlog::level::off);

    std::cout << "=== ADD Tests ===" << std::endl;
    RUN_TEST(test_add_requires_task_name);
    RUN_TEST(test_duplicate_is_marked_not_pushed);
    RUN_TEST(test_unnamed_messages_are_not_deduplicated);
    RUN_TEST(test_duplicate_check_uses_shared_storage);
    RUN_TEST(test_push_assigns_id_and_whole_second_delay);
    RUN_TEST(test_push_retried_then_falls_back_to_local_handler);
    RUN_TEST(test_add_after_close_throws);
    RUN_TEST(test_add_rejected_after_close_leaves_name_free);

    std::cout << std::endl << "=== RESERVE Tests ===" << std::endl;
    RUN_TEST(test_push_then_reserve_round_trip);
    RUN_TEST(test_reserve_arguments);
    RUN_TEST(test_empty_poll_is_not_an_error);
    RUN_TEST(test_missing_queue_is_recreated_once);
    RUN_TEST(test_failed_recreation_still_surfaces_original_error);
    RUN_TEST(test_other_poll_errors_surface_unchanged);
    RUN_TEST(test_decode_failure_isolated_to_one_message);
    RUN_TEST(test_body_with_text_version_isolated_to_one_message);
    RUN_TEST(test_done_context_skips_poll);

    std::cout << std::endl << "=== DELETE Tests ===" << std::endl;
    RUN_TEST(test_release_and_delete_require_reservation);
    RUN_TEST(test_release_retries_transient_errors);
    RUN_TEST(test_delete_of_missing_message_succeeds);
    RUN_TEST(test_delete_permanent_error_surfaces);
    RUN_TEST(test_twenty_five_deletes_make_three_batches);
    RUN_TEST(test_configured_batch_limit_capped_at_ten);
    RUN_TEST(test_empty_delete_batch_is_a_logic_error);
    RUN_TEST(test_batch_delete_retries_transient_errors);
    RUN_TEST(test_permanent_batch_failure_reported_by_close);

    std::cout << std::endl << "=== CLOSE Tests ===" << std::endl;
    RUN_TEST(test_close_with_sufficient_deadline_flushes_everything);
    RUN_TEST(test_close_with_short_deadline_times_out);
    RUN_TEST(test_close_is_idempotent);
    RUN_TEST(test_len_and_purge);
    RUN_TEST(test_name_defaults_to_remote_name);

    return print_summary();
}
