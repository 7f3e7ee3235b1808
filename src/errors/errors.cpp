#include "ironq/errors.hpp"

namespace ironq {

const char* to_string(RemoteErrorReason reason) {
    switch (reason) {
        case RemoteErrorReason::message_not_found:
            return "message_not_found";
        case RemoteErrorReason::queue_not_found:
            return "queue_not_found";
        case RemoteErrorReason::other:
            break;
    }
    return "other";
}

RemoteErrorReason classify_remote_error(int status_code, const std::string& message) {
    if (status_code != 404) {
        return RemoteErrorReason::other;
    }
    if (message.find("Queue not found") != std::string::npos) {
        return RemoteErrorReason::queue_not_found;
    }
    if (message.find("Message not found") != std::string::npos) {
        return RemoteErrorReason::message_not_found;
    }
    return RemoteErrorReason::other;
}

std::string describe_error(const std::exception_ptr& error) {
    if (!error) {
        return "no error";
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "non-standard exception";
    }
}

} // namespace ironq
