#include "ironq/envelope.hpp"
#include "ironq/errors.hpp"
#include <nlohmann/json.hpp>

namespace ironq {

namespace {

constexpr int ENVELOPE_VERSION = 1;

} // namespace

Envelope wrap_message(std::shared_ptr<Message> msg, const std::string& handler_name) {
    Envelope env;
    env.task_name = handler_name;
    if (msg) {
        env.name = msg->name;
    }
    env.message = std::move(msg);
    return env;
}

std::shared_ptr<Message> unwrap_message(const Envelope& env) {
    if (!env.message) {
        throw CodecError("ironq: unwrap_message: envelope " + env.task_name + " carries no message");
    }
    return env.message;
}

std::vector<uint8_t> marshal_message(const Message& msg) {
    nlohmann::json doc = {
        {"v", ENVELOPE_VERSION},
        {"task", msg.task_name},
        {"name", msg.name},
        {"delay", msg.delay.count()},
        {"payload", nlohmann::json::binary(std::vector<uint8_t>(msg.payload.begin(), msg.payload.end()))}
    };
    return nlohmann::json::to_msgpack(doc);
}

void unmarshal_message(const std::vector<uint8_t>& data, Message& msg) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::from_msgpack(data);
    } catch (const nlohmann::json::parse_error& e) {
        throw CodecError(std::string("ironq: malformed message body: ") + e.what());
    }

    if (!doc.is_object()) {
        throw CodecError("ironq: message body is not a map");
    }

    const auto version = doc.find("v");
    if (version == doc.end() || !version->is_number_integer()) {
        throw CodecError("ironq: message body has no integer version");
    }
    if (version->get<int64_t>() != ENVELOPE_VERSION) {
        throw CodecError("ironq: unsupported message version " + std::to_string(version->get<int64_t>()));
    }

    try {
        msg.task_name = doc.at("task").get<std::string>();
        msg.name = doc.value("name", "");
        msg.delay = std::chrono::milliseconds(doc.value("delay", static_cast<int64_t>(0)));

        const auto& payload = doc.at("payload");
        if (payload.is_binary()) {
            const auto& bytes = payload.get_binary();
            msg.payload.assign(bytes.begin(), bytes.end());
        } else if (payload.is_null()) {
            msg.payload.clear();
        } else {
            throw CodecError("ironq: message payload is not binary");
        }
    } catch (const nlohmann::json::exception& e) {
        throw CodecError(std::string("ironq: invalid message body: ") + e.what());
    }
}

std::string full_message_name(const std::string& queue_name, const Message& msg) {
    std::string key;
    key.reserve(6 + queue_name.size() + msg.task_name.size() + msg.name.size() + 2);
    key += "ironq:";
    key += queue_name;
    key += ':';
    key += msg.task_name;
    key += ':';
    key += msg.name;
    return key;
}

} // namespace ironq
