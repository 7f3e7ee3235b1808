#pragma once

#include "ironq/caches/lru_cache.hpp"
#include "ironq/context.hpp"
#include <chrono>
#include <string>

namespace ironq {

/**
 * Existence store backing the dedup filter.
 *
 * exists() has set-if-absent semantics: the first caller for a key records it
 * and gets false, later callers get true until the entry expires.
 */
class Storage {
public:
    virtual ~Storage() = default;

    virtual bool exists(const Context& ctx, const std::string& key) = 0;
};

// In-process store, only deduplicates within one process
class LocalStorage : public Storage {
public:
    explicit LocalStorage(size_t max_size = 128000,
                          std::chrono::milliseconds ttl = std::chrono::hours(24));

    bool exists(const Context& ctx, const std::string& key) override;

    size_t size() const { return cache_.size(); }

private:
    caches::LRUKeyCache<std::string> cache_;
};

} // namespace ironq
