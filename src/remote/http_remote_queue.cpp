#include "ironq/http_remote_queue.hpp"
#include "ironq/errors.hpp"
#include <spdlog/spdlog.h>

#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
#define CPPHTTPLIB_OPENSSL_SUPPORT
#endif
#include <httplib.h>

namespace ironq {

using json = nlohmann::json;

HttpRemoteQueue::HttpRemoteQueue(std::string queue_name, HttpConfig config)
    : queue_name_(std::move(queue_name)), config_(std::move(config)) {
    if (queue_name_.empty()) {
        throw Error("ironq: queue name is required");
    }
    if (config_.project_id.empty() || config_.token.empty()) {
        throw Error("ironq: project_id and token are required for " + config_.host);
    }
    base_url_ = config_.scheme + "://" + config_.host + ":" + std::to_string(config_.port);
}

std::string HttpRemoteQueue::queue_path() const {
    return "/" + config_.api_version + "/projects/" + config_.project_id + "/queues/" + queue_name_;
}

std::string HttpRemoteQueue::messages_path() const {
    return queue_path() + "/messages";
}

HttpRemoteQueue::HttpResponse HttpRemoteQueue::execute_request(const std::string& method,
                                                               const std::string& path,
                                                               const json& body,
                                                               int extra_timeout_millis) {
    int timeout_millis = config_.timeout_millis + extra_timeout_millis;

    httplib::Client client(base_url_);
    client.set_connection_timeout(std::chrono::milliseconds(config_.timeout_millis));
    client.set_read_timeout(std::chrono::milliseconds(timeout_millis));
    client.set_write_timeout(std::chrono::milliseconds(config_.timeout_millis));

    httplib::Headers headers = {
        {"Authorization", "OAuth " + config_.token},
        {"Accept", "application/json"}
    };

    std::string body_str = body.is_null() ? "" : body.dump();
    httplib::Result res;

    if (method == "GET") {
        res = client.Get(path, headers);
    } else if (method == "POST") {
        res = client.Post(path, headers, body_str, "application/json");
    } else if (method == "PUT") {
        res = client.Put(path, headers, body_str, "application/json");
    } else if (method == "DELETE") {
        res = client.Delete(path, headers, body_str, "application/json");
    } else {
        throw Error("ironq: unsupported HTTP method " + method);
    }

    if (!res) {
        std::string error = httplib::to_string(res.error());
        spdlog::error("[ironq:http] {} {} failed: {}", method, path, error);
        throw RemoteError(0, "ironq: " + method + " " + path + ": " + error);
    }

    return {res->status, res->body};
}

json HttpRemoteQueue::request(const std::string& method, const std::string& path,
                              const json& body, int extra_timeout_millis) {
    HttpResponse response = execute_request(method, path, body, extra_timeout_millis);

    if (response.status_code < 200 || response.status_code >= 300) {
        std::string message = "HTTP " + std::to_string(response.status_code);
        if (!response.body.empty()) {
            json error_body = json::parse(response.body, nullptr, false);
            if (error_body.is_object() && error_body.contains("msg") && error_body["msg"].is_string()) {
                message = error_body["msg"].get<std::string>();
            }
        }
        auto reason = classify_remote_error(response.status_code, message);
        if (response.status_code != 404) {
            spdlog::error("[ironq:http] {} {} returned {}: {}", method, path, response.status_code, message);
        }
        throw RemoteError(response.status_code, message, reason);
    }

    if (response.body.empty()) {
        return json::object();
    }
    json doc = json::parse(response.body, nullptr, false);
    if (doc.is_discarded()) {
        throw RemoteError(response.status_code, "ironq: malformed response from " + path);
    }
    return doc;
}

std::string HttpRemoteQueue::push(const std::string& body, int delay_seconds) {
    json payload = {
        {"messages", json::array({{{"body", body}, {"delay", delay_seconds}}})}
    };
    json doc = request("POST", messages_path(), payload);

    if (!doc.contains("ids") || !doc["ids"].is_array() || doc["ids"].empty()) {
        throw RemoteError(200, "ironq: push to " + queue_name_ + " returned no id");
    }
    if (!doc["ids"][0].is_string()) {
        throw RemoteError(200, "ironq: malformed response from " + messages_path());
    }
    return doc["ids"][0].get<std::string>();
}

std::vector<RemoteMessage> HttpRemoteQueue::long_poll(int n, int reservation_seconds, int wait_seconds) {
    json payload = {
        {"n", n},
        {"timeout", reservation_seconds},
        {"wait", wait_seconds},
        {"delete", false}
    };
    json doc = request("POST", queue_path() + "/reservations", payload, wait_seconds * 1000);

    std::vector<RemoteMessage> messages;
    if (!doc.contains("messages") || doc["messages"].empty()) {
        // v3 answers an empty poll with an empty list; report it like older servers do
        throw RemoteError(404, "Message not found", RemoteErrorReason::message_not_found);
    }
    if (!doc["messages"].is_array()) {
        throw RemoteError(200, "ironq: malformed response from " + queue_path() + "/reservations");
    }

    try {
        for (const auto& item : doc["messages"]) {
            RemoteMessage msg;
            msg.id = item.value("id", "");
            msg.reservation_id = item.value("reservation_id", "");
            msg.body = item.value("body", "");
            msg.reserved_count = item.value("reserved_count", 0);
            messages.push_back(std::move(msg));
        }
    } catch (const json::exception& e) {
        throw RemoteError(200, "ironq: malformed response from " + queue_path() + "/reservations: " + e.what());
    }
    return messages;
}

void HttpRemoteQueue::release(const std::string& id, const std::string& reservation_id, int delay_seconds) {
    json payload = {
        {"reservation_id", reservation_id},
        {"delay", delay_seconds}
    };
    request("POST", messages_path() + "/" + id + "/release", payload);
}

void HttpRemoteQueue::delete_message(const std::string& id, const std::string& reservation_id) {
    request("DELETE", messages_path() + "/" + id, json{{"reservation_id", reservation_id}});
}

void HttpRemoteQueue::delete_reserved(const std::vector<ReservedRef>& refs) {
    json ids = json::array();
    for (const auto& ref : refs) {
        ids.push_back({{"id", ref.id}, {"reservation_id", ref.reservation_id}});
    }
    request("DELETE", messages_path(), json{{"ids", ids}});
}

void HttpRemoteQueue::clear() {
    request("DELETE", messages_path(), json::object());
}

int HttpRemoteQueue::size() {
    json doc = request("GET", queue_path());
    if (!doc.contains("queue")) {
        return 0;
    }
    try {
        return doc["queue"].value("size", 0);
    } catch (const json::exception& e) {
        throw RemoteError(200, "ironq: malformed response from " + queue_path() + ": " + e.what());
    }
}

void HttpRemoteQueue::create_queue() {
    request("PUT", queue_path(), json{{"queue", json::object()}});
    spdlog::info("[ironq:http] Provisioned queue {}", queue_name_);
}

} // namespace ironq
