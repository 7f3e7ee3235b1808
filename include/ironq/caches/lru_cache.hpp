#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <list>
#include <mutex>
#include <unordered_map>

namespace ironq {
namespace caches {

/**
 * Thread-safe LRU set of keys with TTL support
 *
 * - LRU eviction when size limit is reached
 * - TTL-based expiration for entries
 * - Stats tracking (hits, misses, evictions)
 *
 * @tparam K Key type (must be hashable)
 */
template<typename K>
class LRUKeyCache {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    struct CacheEntry {
        K key;
        TimePoint expires_at;
    };

    using ListIterator = typename std::list<CacheEntry>::iterator;

    /**
     * @param max_size Maximum number of entries
     * @param ttl TTL per entry (0 = no TTL)
     */
    explicit LRUKeyCache(size_t max_size, std::chrono::milliseconds ttl = std::chrono::milliseconds(0))
        : max_size_(max_size == 0 ? 1 : max_size), ttl_(ttl) {}

    /**
     * Record key unless it is already present and not expired.
     * @return true if the key was already present (hit), false if it was inserted
     */
    bool test_and_set(const K& key) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto now = Clock::now();
        auto it = lookup_.find(key);
        if (it != lookup_.end()) {
            if (now < it->second->expires_at) {
                items_.splice(items_.begin(), items_, it->second);
                hits_++;
                return true;
            }
            // Expired - drop and re-insert below
            items_.erase(it->second);
            lookup_.erase(it);
        }

        misses_++;
        insert_locked(key, now);
        return false;
    }

    bool contains(const K& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = lookup_.find(key);
        return it != lookup_.end() && Clock::now() < it->second->expires_at;
    }

    bool remove(const K& key) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = lookup_.find(key);
        if (it == lookup_.end()) {
            return false;
        }

        items_.erase(it->second);
        lookup_.erase(it);
        return true;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        items_.clear();
        lookup_.clear();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    size_t max_size() const { return max_size_; }

    uint64_t hits() const { return hits_.load(); }
    uint64_t misses() const { return misses_.load(); }
    uint64_t evictions() const { return evictions_.load(); }

private:
    void insert_locked(const K& key, TimePoint now) {
        while (items_.size() >= max_size_ && !items_.empty()) {
            auto& back = items_.back();
            lookup_.erase(back.key);
            items_.pop_back();
            evictions_++;
        }

        TimePoint expires_at = ttl_.count() > 0 ? now + ttl_ : TimePoint::max();
        items_.push_front(CacheEntry{key, expires_at});
        lookup_[key] = items_.begin();
    }

    size_t max_size_;
    std::chrono::milliseconds ttl_;

    std::list<CacheEntry> items_;
    std::unordered_map<K, ListIterator> lookup_;
    mutable std::mutex mutex_;

    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> evictions_{0};
};

} // namespace caches
} // namespace ironq
