/**
 * ironq - Basic Example
 *
 * Demonstrates:
 * - Configuring the adapter from IRONQ_* environment variables
 * - Registering a task handler
 * - Adding messages (one of them a duplicate)
 * - Consuming them and closing with drain
 *
 * Requires IRONQ_PROJECT_ID and IRONQ_TOKEN.
 */

#include "ironq/http_remote_queue.hpp"
#include "ironq/queue_adapter.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <iostream>
#include <thread>

using namespace ironq;

int main() {
    configure_logging(LoggingConfig::from_env().level);

    try {
        AdapterConfig config = AdapterConfig::from_env();
        if (config.queue_name.empty()) {
            config.queue_name = "ironq-example";
        }

        auto remote = std::make_shared<HttpRemoteQueue>(config.queue_name, HttpConfig::from_env());
        remote->create_queue();

        RemoteQueueAdapter queue(remote, config);

        std::atomic<int> handled{0};
        TaskOptions greet;
        greet.name = "greet";
        greet.handler = [&](Message& msg) {
            handled++;
            std::cout << "  [" << handled << "] " << msg.id << ": " << msg.payload << std::endl;
        };
        queue.registry()->register_task(greet);

        std::cout << "Adding messages..." << std::endl;
        for (int i = 1; i <= 5; i++) {
            auto msg = std::make_shared<Message>("greet", "Hello from ironq #" + std::to_string(i));
            msg->name = "greeting-" + std::to_string(i);
            queue.add(msg);
        }

        auto again = std::make_shared<Message>("greet", "Hello again");
        again->name = "greeting-1";
        queue.add(again);
        std::cout << "  duplicate suppressed: " << (again->is_duplicate() ? "yes" : "no") << std::endl;

        std::cout << "Consuming..." << std::endl;
        queue.consumer().start();

        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(30);
        while (handled < 5 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        queue.close();

        QueueStats stats = queue.stats();
        std::cout << "Pushed " << stats.pushed << ", reserved " << stats.reserved
                  << ", deleted " << stats.deleted << ", duplicates " << stats.duplicates << std::endl;

    } catch (const std::exception& e) {
        spdlog::error("[ironq] Example failed: {}", e.what());
        return 1;
    }

    return 0;
}
