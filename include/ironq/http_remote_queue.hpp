#pragma once

#include "ironq/config.hpp"
#include "ironq/remote_queue.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace ironq {

/**
 * HttpRemoteQueue - RemoteQueue over the IronMQ v3 REST API.
 *
 * One connection per request, authenticated with an OAuth token.
 * Non-2xx answers become RemoteError carrying the status and the
 * service's "msg"; transport failures use status 0.
 */
class HttpRemoteQueue : public RemoteQueue {
public:
    HttpRemoteQueue(std::string queue_name, HttpConfig config);

    std::string name() const override { return queue_name_; }

    std::string push(const std::string& body, int delay_seconds) override;
    std::vector<RemoteMessage> long_poll(int n, int reservation_seconds, int wait_seconds) override;
    void release(const std::string& id, const std::string& reservation_id, int delay_seconds) override;
    void delete_message(const std::string& id, const std::string& reservation_id) override;
    void delete_reserved(const std::vector<ReservedRef>& refs) override;
    void clear() override;
    int size() override;
    void create_queue() override;

private:
    struct HttpResponse {
        int status_code;
        std::string body;
    };

    std::string queue_path() const;
    std::string messages_path() const;

    HttpResponse execute_request(const std::string& method, const std::string& path,
                                 const nlohmann::json& body = nullptr, int extra_timeout_millis = 0);

    // Throws RemoteError for non-2xx, parses the body otherwise
    nlohmann::json request(const std::string& method, const std::string& path,
                           const nlohmann::json& body = nullptr, int extra_timeout_millis = 0);

    std::string queue_name_;
    HttpConfig config_;
    std::string base_url_;
};

} // namespace ironq
