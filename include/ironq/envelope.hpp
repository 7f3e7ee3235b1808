#pragma once

#include "ironq/message.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace ironq {

/**
 * Routing wrapper used by the internal add/delete pipelines.
 *
 * task_name is the pipeline's internal handler name; the original message
 * travels untouched inside and is restored by unwrap_message().
 */
struct Envelope {
    std::string task_name;
    std::string name;
    std::shared_ptr<Message> message;
    int attempt = 0;   // Handler attempts made so far
};

Envelope wrap_message(std::shared_ptr<Message> msg, const std::string& handler_name);

// Throws CodecError when the envelope carries no message
std::shared_ptr<Message> unwrap_message(const Envelope& env);

/**
 * Binary transport encoding of a message (msgpack map, versioned).
 * Carries task_name, name, delay and payload; remote identity and
 * reservation fields are not part of the body.
 */
std::vector<uint8_t> marshal_message(const Message& msg);
void unmarshal_message(const std::vector<uint8_t>& data, Message& msg);

// Printable representation of binary data for the remote API (base64)
std::string encode_to_string(const std::vector<uint8_t>& data);
std::vector<uint8_t> decode_string(const std::string& encoded);

// Dedup key: queue identity + task + logical name
std::string full_message_name(const std::string& queue_name, const Message& msg);

} // namespace ironq
