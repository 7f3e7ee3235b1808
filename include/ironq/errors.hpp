#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace ironq {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

class TaskNameRequiredError : public Error {
public:
    TaskNameRequiredError() : Error("ironq: message TaskName is required") {}
};

// Release/delete of a message that does not hold a reservation
class InvalidReservationError : public Error {
public:
    explicit InvalidReservationError(const std::string& what) : Error(what) {}
};

class CodecError : public Error {
public:
    explicit CodecError(const std::string& what) : Error(what) {}
};

class QueueClosedError : public Error {
public:
    explicit QueueClosedError(const std::string& queue_name)
        : Error("ironq: queue " + queue_name + " is closed") {}
};

class TimeoutError : public Error {
public:
    explicit TimeoutError(const std::string& what) : Error(what) {}
};

/**
 * Why the remote service answered "not found".
 *
 * A 404 from a long-poll means either "nothing to reserve" (normal empty poll)
 * or "the queue does not exist" (must be provisioned again).
 */
enum class RemoteErrorReason {
    other,
    message_not_found,
    queue_not_found
};

const char* to_string(RemoteErrorReason reason);

/**
 * Failure reported by the remote queue service.
 * status_code is the HTTP status, 0 when the request never got a response.
 */
class RemoteError : public Error {
public:
    RemoteError(int status_code, const std::string& message,
                RemoteErrorReason reason = RemoteErrorReason::other)
        : Error(message), status_code_(status_code), reason_(reason) {}

    int status_code() const { return status_code_; }
    RemoteErrorReason reason() const { return reason_; }

    bool is_not_found() const { return status_code_ == 404; }

    // Server-side overload/error, worth another attempt
    bool is_transient() const { return status_code_ >= 500; }

private:
    int status_code_;
    RemoteErrorReason reason_;
};

/**
 * Derive the typed reason from a raw error response.
 *
 * The service exposes no error code, only a human readable "msg". Matching on
 * "Message not found" / "Queue not found" is kept as a compatibility shim.
 */
RemoteErrorReason classify_remote_error(int status_code, const std::string& message);

// what() of a captured exception, for logging
std::string describe_error(const std::exception_ptr& error);

} // namespace ironq
