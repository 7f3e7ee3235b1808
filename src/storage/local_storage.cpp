#include "ironq/storage.hpp"
#include <spdlog/spdlog.h>

namespace ironq {

LocalStorage::LocalStorage(size_t max_size, std::chrono::milliseconds ttl)
    : cache_(max_size, ttl) {
}

bool LocalStorage::exists(const Context& ctx, const std::string& key) {
    (void)ctx;
    bool seen = cache_.test_and_set(key);
    if (seen) {
        spdlog::debug("[ironq] Dedup key already recorded: {}", key);
    }
    return seen;
}

} // namespace ironq
