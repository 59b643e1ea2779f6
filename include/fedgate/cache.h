#pragma once
// ═══════════════════════════════════════════════════════════════════
//  fedgate/cache.h — Bounded, thread-safe LRU map with a shared TTL
// ═══════════════════════════════════════════════════════════════════
//
//    cache::LRUCache<std::string, Plan> plans(1000, std::chrono::minutes(5));
//    plans.put(sig, plan);
//    if (auto hit = plans.get(sig)) ...
//
//  Age is checked on read against the TTL in force at that moment,
//  so configure() applies to entries already stored. A zero TTL keeps
//  entries until they fall off the LRU end.
// ═══════════════════════════════════════════════════════════════════

#include <chrono>
#include <cstdint>
#include <iterator>
#include <list>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace fedgate::cache {

struct CacheStats {
    std::uint64_t hits = 0;
    std::uint64_t misses = 0;
    std::uint64_t evictions = 0;   // capacity and expiry
    std::size_t size = 0;
};

template <typename Key, typename Value>
class LRUCache {
public:
    using Clock = std::chrono::steady_clock;

    explicit LRUCache(std::size_t capacity = 1000, std::chrono::milliseconds ttl = {})
        : capacity_(capacity), ttl_(ttl) {}

    std::optional<Value> get(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto found = index_.find(key);
        if (found == index_.end()) {
            ++stats_.misses;
            return std::nullopt;
        }
        auto node = found->second;
        if (expired(*node, Clock::now())) {
            drop(node);
            ++stats_.misses;
            return std::nullopt;
        }
        order_.splice(order_.begin(), order_, node);
        ++stats_.hits;
        return node->value;
    }

    // Insert or replace; the entry becomes most recently used
    void put(const Key& key, Value value) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto found = index_.find(key);
        if (found != index_.end()) {
            found->second->value = std::move(value);
            found->second->storedAt = Clock::now();
            order_.splice(order_.begin(), order_, found->second);
            return;
        }
        order_.push_front(Node{key, std::move(value), Clock::now()});
        index_.emplace(key, order_.begin());
        shrink();
    }

    bool erase(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto found = index_.find(key);
        if (found == index_.end()) return false;
        order_.erase(found->second);
        index_.erase(found);
        return true;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        index_.clear();
        order_.clear();
    }

    // Returns how many entries were past their TTL
    std::size_t purgeExpired() {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = Clock::now();
        std::size_t purged = 0;
        for (auto it = order_.begin(); it != order_.end();) {
            auto next = std::next(it);
            if (expired(*it, now)) {
                drop(it);
                ++purged;
            }
            it = next;
        }
        return purged;
    }

    void configure(std::size_t capacity, std::chrono::milliseconds ttl) {
        std::lock_guard<std::mutex> lock(mutex_);
        capacity_ = capacity;
        ttl_ = ttl;
        shrink();
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return index_.size();
    }

    CacheStats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto out = stats_;
        out.size = index_.size();
        return out;
    }

private:
    struct Node {
        Key key;
        Value value;
        Clock::time_point storedAt;
    };
    using Order = std::list<Node>;

    std::size_t capacity_;
    std::chrono::milliseconds ttl_;
    Order order_;   // front = most recently used
    std::unordered_map<Key, typename Order::iterator> index_;
    CacheStats stats_;
    mutable std::mutex mutex_;

    bool expired(const Node& node, Clock::time_point now) const {
        return ttl_.count() > 0 && now - node.storedAt >= ttl_;
    }

    void drop(typename Order::iterator node) {
        index_.erase(node->key);
        order_.erase(node);
        ++stats_.evictions;
    }

    void shrink() {
        while (index_.size() > capacity_) drop(std::prev(order_.end()));
    }
};

} // namespace fedgate::cache
