#pragma once

#include <chrono>
#include <string>
#include <cstdlib>
#include <cstring>

namespace ironq {

// Helper function to get boolean from environment
inline bool get_env_bool(const char* name, bool default_value) {
    const char* value = std::getenv(name);
    if (!value) return default_value;
    return std::strcmp(value, "true") == 0;
}

// Helper function to get int from environment
inline int get_env_int(const char* name, int default_value) {
    const char* value = std::getenv(name);
    return value ? std::atoi(value) : default_value;
}

// Helper function to get string from environment
inline std::string get_env_string(const char* name, const std::string& default_value) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : default_value;
}

inline std::chrono::milliseconds get_env_millis(const char* name, int default_ms) {
    return std::chrono::milliseconds(get_env_int(name, default_ms));
}

/**
 * Bounded retry settings used by release, single delete and batch delete.
 * The loop only continues on transient (5xx) remote failures.
 */
struct RetryOptions {
    int max_attempts = 3;
    std::chrono::milliseconds backoff{0};   // Delay between attempts (0 = retry immediately)

    static RetryOptions from_env() {
        RetryOptions options;
        options.max_attempts = get_env_int("IRONQ_RETRY_ATTEMPTS", 3);
        options.backoff = get_env_millis("IRONQ_RETRY_BACKOFF_MS", 0);
        return options;
    }
};

struct ConsumerConfig {
    int concurrency = 1;                     // Handler worker threads
    int reservation_size = 10;               // Messages requested per long-poll
    std::chrono::milliseconds wait_timeout{3000};
    size_t buffer_size = 20;                 // Reserved messages waiting for a worker
    std::chrono::milliseconds error_backoff{1000};

    static ConsumerConfig from_env() {
        ConsumerConfig config;
        config.concurrency = get_env_int("IRONQ_CONSUMER_CONCURRENCY", 1);
        config.reservation_size = get_env_int("IRONQ_RESERVATION_SIZE", 10);
        config.wait_timeout = get_env_millis("IRONQ_WAIT_TIMEOUT_MS", 3000);
        config.buffer_size = static_cast<size_t>(get_env_int("IRONQ_CONSUMER_BUFFER_SIZE", 20));
        config.error_backoff = get_env_millis("IRONQ_CONSUMER_ERROR_BACKOFF_MS", 1000);
        return config;
    }
};

struct AdapterConfig {
    std::string queue_name;

    // Visibility timeout requested on every reservation
    std::chrono::milliseconds reservation_timeout{300000};   // 5 minutes

    // Add / delete pipelines
    size_t buffer_size = 100;
    int pipeline_retry_limit = 3;
    std::chrono::milliseconds pipeline_min_backoff{1000};
    std::chrono::milliseconds pipeline_max_backoff{30000};

    // Delete batching - remote API accepts at most 10 ids per call
    size_t batch_limit = 10;
    std::chrono::milliseconds batch_timeout{3000};

    RetryOptions retry;

    std::chrono::milliseconds close_timeout{30000};

    // Local dedup store
    size_t dedup_cache_size = 128000;
    std::chrono::milliseconds dedup_ttl{24 * 60 * 60 * 1000};

    ConsumerConfig consumer;

    static AdapterConfig from_env() {
        AdapterConfig config;
        config.queue_name = get_env_string("IRONQ_QUEUE", "");
        config.reservation_timeout = get_env_millis("IRONQ_RESERVATION_TIMEOUT_MS", 300000);
        config.buffer_size = static_cast<size_t>(get_env_int("IRONQ_BUFFER_SIZE", 100));
        config.pipeline_retry_limit = get_env_int("IRONQ_PIPELINE_RETRY_LIMIT", 3);
        config.pipeline_min_backoff = get_env_millis("IRONQ_PIPELINE_MIN_BACKOFF_MS", 1000);
        config.pipeline_max_backoff = get_env_millis("IRONQ_PIPELINE_MAX_BACKOFF_MS", 30000);
        config.batch_limit = static_cast<size_t>(get_env_int("IRONQ_DELETE_BATCH_LIMIT", 10));
        config.batch_timeout = get_env_millis("IRONQ_DELETE_BATCH_TIMEOUT_MS", 3000);
        config.retry = RetryOptions::from_env();
        config.close_timeout = get_env_millis("IRONQ_CLOSE_TIMEOUT_MS", 30000);
        config.dedup_cache_size = static_cast<size_t>(get_env_int("IRONQ_DEDUP_CACHE_SIZE", 128000));
        config.dedup_ttl = get_env_millis("IRONQ_DEDUP_TTL_MS", 24 * 60 * 60 * 1000);
        config.consumer = ConsumerConfig::from_env();
        return config;
    }
};

struct HttpConfig {
    std::string scheme = "https";
    std::string host = "mq-aws-us-east-1-1.iron.io";
    int port = 443;
    std::string project_id;
    std::string token;
    std::string api_version = "3";
    int timeout_millis = 30000;

    static HttpConfig from_env() {
        HttpConfig config;
        config.scheme = get_env_string("IRONQ_SCHEME", "https");
        config.host = get_env_string("IRONQ_HOST", "mq-aws-us-east-1-1.iron.io");
        config.port = get_env_int("IRONQ_PORT", config.scheme == "https" ? 443 : 80);
        config.project_id = get_env_string("IRONQ_PROJECT_ID", "");
        config.token = get_env_string("IRONQ_TOKEN", "");
        config.timeout_millis = get_env_int("IRONQ_HTTP_TIMEOUT_MS", 30000);
        return config;
    }
};

struct LoggingConfig {
    std::string level = "info";

    static LoggingConfig from_env() {
        LoggingConfig config;
        config.level = get_env_string("IRONQ_LOG_LEVEL", "info");
        return config;
    }
};

// Apply level and pattern to the default spdlog logger
void configure_logging(const std::string& level);

} // namespace ironq
