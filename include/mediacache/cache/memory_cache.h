#pragma once

#include <cstddef>
#include <cstdint>
#include <list>
#include <optional>
#include <unordered_map>
#include <utility>

#include <mediacache/cache/cache_key.h>

namespace mediacache::cache {

/**
 * @brief Counters for one in-memory tier
 */
struct CacheStats {
    std::uint64_t hits = 0;          ///< Number of cache hits
    std::uint64_t misses = 0;        ///< Number of cache misses
    std::uint64_t evictions = 0;     ///< Entries evicted under count/cost pressure
    std::uint64_t invalidations = 0; ///< Entries removed explicitly
    std::uint64_t insertions = 0;    ///< Number of insertions
    std::uint64_t rejections = 0;    ///< Entries larger than the whole cost limit

    std::size_t currentSize = 0; ///< Current number of entries
    std::size_t totalCost = 0;   ///< Sum of entry costs in bytes
    std::size_t countLimit = 0;  ///< 0 = unlimited
    std::size_t costLimit = 0;   ///< 0 = unlimited

    double hitRate() const {
        const auto total = hits + misses;
        return total > 0 ? static_cast<double>(hits) / static_cast<double>(total) : 0.0;
    }
};

/**
 * @brief Keyed LRU store with a count limit and a cost limit
 *
 * Limits are enforced strictly on insertion: least-recently-used entries are
 * evicted until both limits hold again. A limit of 0 means unlimited. get()
 * refreshes recency. Not synchronized; DurableCache guards its tiers with a
 * single lock.
 */
template <typename V, typename Key = CacheKey, typename Hash = CacheKeyHash> class MemoryCache {
public:
    MemoryCache(std::size_t countLimit = 0, std::size_t costLimit = 0)
        : countLimit_(countLimit), costLimit_(costLimit) {}

    std::optional<V> get(const Key& key) {
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            ++stats_.misses;
            return std::nullopt;
        }
        ++stats_.hits;
        moveToFront(it->second);
        return it->second.value;
    }

    bool contains(const Key& key) const { return entries_.find(key) != entries_.end(); }

    /**
     * Insert or replace. Returns false if the entry alone exceeds the cost limit
     * (nothing is stored in that case).
     */
    bool put(const Key& key, V value, std::size_t cost) {
        if (costLimit_ != 0 && cost > costLimit_) {
            ++stats_.rejections;
            invalidate(key);
            return false;
        }

        auto it = entries_.find(key);
        if (it != entries_.end()) {
            totalCost_ -= it->second.cost;
            it->second.value = std::move(value);
            it->second.cost = cost;
            totalCost_ += cost;
            moveToFront(it->second);
        } else {
            lru_.push_front(key);
            entries_.emplace(key, Entry{std::move(value), cost, lru_.begin()});
            totalCost_ += cost;
        }
        ++stats_.insertions;
        enforceLimits();
        return true;
    }

    bool invalidate(const Key& key) {
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return false;
        }
        erase(it);
        ++stats_.invalidations;
        return true;
    }

    /**
     * Remove every entry whose key satisfies pred. Returns the number removed.
     */
    template <typename Pred> std::size_t invalidateIf(Pred&& pred) {
        std::size_t removed = 0;
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (pred(it->first)) {
                totalCost_ -= it->second.cost;
                lru_.erase(it->second.lruPos);
                it = entries_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        stats_.invalidations += removed;
        return removed;
    }

    void clear() {
        entries_.clear();
        lru_.clear();
        totalCost_ = 0;
    }

    std::size_t size() const { return entries_.size(); }
    std::size_t totalCost() const { return totalCost_; }

    void setCountLimit(std::size_t limit) {
        countLimit_ = limit;
        enforceLimits();
    }

    void setCostLimit(std::size_t limit) {
        costLimit_ = limit;
        enforceLimits();
    }

    std::size_t countLimit() const { return countLimit_; }
    std::size_t costLimit() const { return costLimit_; }

    CacheStats stats() const {
        CacheStats snapshot = stats_;
        snapshot.currentSize = entries_.size();
        snapshot.totalCost = totalCost_;
        snapshot.countLimit = countLimit_;
        snapshot.costLimit = costLimit_;
        return snapshot;
    }

private:
    using ListIterator = typename std::list<Key>::iterator;

    struct Entry {
        V value;
        std::size_t cost;
        ListIterator lruPos;
    };

    using Map = std::unordered_map<Key, Entry, Hash>;

    void moveToFront(Entry& entry) { lru_.splice(lru_.begin(), lru_, entry.lruPos); }

    void erase(typename Map::iterator it) {
        totalCost_ -= it->second.cost;
        lru_.erase(it->second.lruPos);
        entries_.erase(it);
    }

    void evictLRU() {
        if (lru_.empty()) {
            return;
        }
        auto it = entries_.find(lru_.back());
        if (it != entries_.end()) {
            erase(it);
            ++stats_.evictions;
        } else {
            lru_.pop_back();
        }
    }

    bool overLimit() const {
        return (countLimit_ != 0 && entries_.size() > countLimit_) ||
               (costLimit_ != 0 && totalCost_ > costLimit_);
    }

    void enforceLimits() {
        while (!entries_.empty() && overLimit()) {
            evictLRU();
        }
    }

    std::size_t countLimit_;
    std::size_t costLimit_;
    std::size_t totalCost_{0};
    std::list<Key> lru_; ///< front = most recently used
    Map entries_;
    CacheStats stats_;
};

} // namespace mediacache::cache
