// include/riskdesk/cache/memory_cache.hpp
#pragma once

#include <algorithm>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "riskdesk/cache/cache_config.hpp"
#include "riskdesk/core/time_utils.hpp"
#include "riskdesk/core/types.hpp"

namespace riskdesk {

/**
 * @brief One memory tier entry
 */
template <typename V>
struct CacheEntry {
    std::string key;
    V payload;
    Timestamp fetched_at{};
    TtlClass ttl_class{TtlClass::LIVE};
};

/**
 * @class MemoryCache
 * @brief Bounded, sharded LRU with lazy TTL expiry
 *
 * Capacity is split evenly across shards, each with its own mutex and recency
 * list. An entry is expired once now >= fetched_at + ttl(class); expired
 * entries are removed by the read that finds them. Nothing runs in the
 * background.
 */
template <typename V>
class MemoryCache {
public:
    MemoryCache(size_t capacity, size_t shard_count, TtlPolicy ttl, const core::Clock& clock)
        : ttl_(ttl), clock_(clock) {
        shard_count = std::max<size_t>(1, shard_count);
        size_t per_shard = std::max<size_t>(1, (capacity + shard_count - 1) / shard_count);
        shards_.reserve(shard_count);
        for (size_t i = 0; i < shard_count; ++i) {
            shards_.push_back(std::make_unique<Shard>(per_shard));
        }
    }

    MemoryCache(const MemoryCache&) = delete;
    MemoryCache& operator=(const MemoryCache&) = delete;

    /**
     * @brief Fresh value for a key, refreshing its recency
     */
    std::optional<V> get(const std::string& key) {
        auto entry = get_entry(key);
        if (!entry) {
            return std::nullopt;
        }
        return std::move(entry->payload);
    }

    /**
     * @brief Fresh entry for a key, with its timestamps
     */
    std::optional<CacheEntry<V>> get_entry(const std::string& key) {
        Shard& shard = shard_for(key);
        std::lock_guard<std::mutex> lock(shard.mutex);

        auto it = shard.index.find(key);
        if (it == shard.index.end()) {
            return std::nullopt;
        }

        auto node = it->second;
        if (is_expired(*node)) {
            shard.entries.erase(node);
            shard.index.erase(it);
            return std::nullopt;
        }

        shard.entries.splice(shard.entries.begin(), shard.entries, node);
        return *node;
    }

    /**
     * @brief Insert or replace a value
     * @param fetched_at Freshness anchor of the value, now when omitted
     */
    void set(const std::string& key, V value, TtlClass ttl_class,
             std::optional<Timestamp> fetched_at = std::nullopt) {
        Shard& shard = shard_for(key);
        std::lock_guard<std::mutex> lock(shard.mutex);

        auto it = shard.index.find(key);
        if (it != shard.index.end()) {
            shard.entries.erase(it->second);
            shard.index.erase(it);
        }

        shard.entries.push_front(
            CacheEntry<V>{key, std::move(value), fetched_at.value_or(clock_.now()), ttl_class});
        shard.index[key] = shard.entries.begin();

        while (shard.entries.size() > shard.capacity) {
            shard.index.erase(shard.entries.back().key);
            shard.entries.pop_back();
        }
    }

    /**
     * @return true if an entry was removed
     */
    bool erase(const std::string& key) {
        Shard& shard = shard_for(key);
        std::lock_guard<std::mutex> lock(shard.mutex);

        auto it = shard.index.find(key);
        if (it == shard.index.end()) {
            return false;
        }
        shard.entries.erase(it->second);
        shard.index.erase(it);
        return true;
    }

    /**
     * @brief Remove every entry matching a predicate, expired ones included
     * @return Number of entries removed
     */
    size_t erase_if(const std::function<bool(const std::string&, const V&)>& predicate) {
        size_t removed = 0;
        for (auto& shard : shards_) {
            std::lock_guard<std::mutex> lock(shard->mutex);
            for (auto it = shard->entries.begin(); it != shard->entries.end();) {
                if (predicate(it->key, it->payload)) {
                    shard->index.erase(it->key);
                    it = shard->entries.erase(it);
                    ++removed;
                } else {
                    ++it;
                }
            }
        }
        return removed;
    }

    /**
     * @return Number of entries removed
     */
    size_t clear() {
        size_t removed = 0;
        for (auto& shard : shards_) {
            std::lock_guard<std::mutex> lock(shard->mutex);
            removed += shard->entries.size();
            shard->entries.clear();
            shard->index.clear();
        }
        return removed;
    }

    /**
     * @brief Entries held, expired ones not yet read included
     */
    size_t size() const {
        size_t total = 0;
        for (const auto& shard : shards_) {
            std::lock_guard<std::mutex> lock(shard->mutex);
            total += shard->entries.size();
        }
        return total;
    }

    size_t shard_count() const {
        return shards_.size();
    }

private:
    struct Shard {
        explicit Shard(size_t cap) : capacity(cap) {}

        mutable std::mutex mutex;
        size_t capacity;
        std::list<CacheEntry<V>> entries;  // Most recently used first
        std::unordered_map<std::string, typename std::list<CacheEntry<V>>::iterator> index;
    };

    Shard& shard_for(const std::string& key) {
        return *shards_[std::hash<std::string>{}(key) % shards_.size()];
    }

    bool is_expired(const CacheEntry<V>& entry) const {
        return clock_.now() >= entry.fetched_at + ttl_.for_class(entry.ttl_class);
    }

    TtlPolicy ttl_;
    const core::Clock& clock_;
    std::vector<std::unique_ptr<Shard>> shards_;
};

}  // namespace riskdesk
