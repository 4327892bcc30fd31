#ifndef TRAITFORGE_CACHE_HPP
#define TRAITFORGE_CACHE_HPP

#include <cstddef>
#include <functional>
#include <list>
#include <memory>
#include <optional>
#include <unordered_map>

namespace traitforge {

/**
 * Decides which entry leaves a Cache when it is over budget.
 * The cache reports every insert, hit and removal so the policy can keep its
 * own ordering.
 */
template<typename Key, typename Hash = std::hash<Key>>
class EvictionPolicy {
public:
    virtual ~EvictionPolicy() = default;

    virtual void on_insert(const Key& key) = 0;
    virtual void on_access(const Key& key) = 0;
    virtual void on_erase(const Key& key) = 0;
    virtual std::optional<Key> victim() const = 0;
    virtual void clear() = 0;
};

namespace detail {

// Shared list bookkeeping for the order-based policies
template<typename Key, typename Hash>
class OrderedPolicy : public EvictionPolicy<Key, Hash> {
public:
    void on_insert(const Key& key) override {
        on_erase(key);
        order_.push_front(key);
        positions_.emplace(key, order_.begin());
    }

    void on_erase(const Key& key) override {
        auto it = positions_.find(key);
        if (it == positions_.end()) return;
        order_.erase(it->second);
        positions_.erase(it);
    }

    std::optional<Key> victim() const override {
        if (order_.empty()) return std::nullopt;
        return order_.back();
    }

    void clear() override {
        order_.clear();
        positions_.clear();
    }

protected:
    void touch(const Key& key) {
        auto it = positions_.find(key);
        if (it == positions_.end()) return;
        order_.splice(order_.begin(), order_, it->second);
    }

private:
    std::list<Key> order_;   // Front is newest
    std::unordered_map<Key, typename std::list<Key>::iterator, Hash> positions_;
};

} // namespace detail

// Least recently used entry is evicted first
template<typename Key, typename Hash = std::hash<Key>>
class LruPolicy : public detail::OrderedPolicy<Key, Hash> {
public:
    void on_access(const Key& key) override { this->touch(key); }
};

// Oldest inserted entry is evicted first; hits don't refresh
template<typename Key, typename Hash = std::hash<Key>>
class FifoPolicy : public detail::OrderedPolicy<Key, Hash> {
public:
    void on_access(const Key&) override {}
};

struct CacheLimits {
    std::size_t max_entries = 0;   // 0 = unlimited
    std::size_t max_bytes = 0;     // 0 = unlimited
};

struct CacheStats {
    std::size_t hits = 0;
    std::size_t misses = 0;
    std::size_t evictions = 0;
};

/**
 * Bounded single-owner cache with a pluggable eviction policy.
 *
 * Not thread-safe: each instance belongs to one run (decode cache) or one
 * solver (dead-end memo). Values should be cheap to copy; large payloads are
 * stored behind shared_ptr.
 */
template<typename Key, typename Value, typename Hash = std::hash<Key>>
class Cache {
public:
    using SizeFunction = std::function<std::size_t(const Value&)>;

    Cache(CacheLimits limits,
          std::unique_ptr<EvictionPolicy<Key, Hash>> policy,
          SizeFunction size_of = nullptr)
        : limits_(limits), policy_(std::move(policy)), size_of_(std::move(size_of)) {}

    std::optional<Value> get(const Key& key) {
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            ++stats_.misses;
            return std::nullopt;
        }
        ++stats_.hits;
        policy_->on_access(key);
        return it->second.value;
    }

    bool contains(const Key& key) const {
        return entries_.find(key) != entries_.end();
    }

    /**
     * Insert or replace. An entry larger than the whole byte budget is not
     * stored at all.
     * @return true if the entry is in the cache afterwards
     */
    bool put(const Key& key, Value value) {
        std::size_t bytes = size_of_ ? size_of_(value) : 0;
        if (limits_.max_bytes > 0 && bytes > limits_.max_bytes) {
            erase(key);
            return false;
        }

        erase(key);
        entries_.emplace(key, Entry{std::move(value), bytes});
        total_bytes_ += bytes;
        policy_->on_insert(key);

        while (over_budget()) {
            auto victim = policy_->victim();
            if (!victim) break;
            erase(*victim);
            ++stats_.evictions;
        }
        return contains(key);
    }

    bool erase(const Key& key) {
        auto it = entries_.find(key);
        if (it == entries_.end()) return false;
        total_bytes_ -= it->second.bytes;
        entries_.erase(it);
        policy_->on_erase(key);
        return true;
    }

    void clear() {
        entries_.clear();
        policy_->clear();
        total_bytes_ = 0;
    }

    std::size_t size() const { return entries_.size(); }
    std::size_t bytes() const { return total_bytes_; }
    const CacheStats& stats() const { return stats_; }
    const CacheLimits& limits() const { return limits_; }

private:
    struct Entry {
        Value value;
        std::size_t bytes;
    };

    bool over_budget() const {
        if (limits_.max_entries > 0 && entries_.size() > limits_.max_entries) return true;
        if (limits_.max_bytes > 0 && total_bytes_ > limits_.max_bytes) return true;
        return false;
    }

    CacheLimits limits_;
    std::unique_ptr<EvictionPolicy<Key, Hash>> policy_;
    SizeFunction size_of_;
    std::unordered_map<Key, Entry, Hash> entries_;
    std::size_t total_bytes_ = 0;
    CacheStats stats_;
};

} // namespace traitforge

#endif // TRAITFORGE_CACHE_HPP
