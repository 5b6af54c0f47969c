// include/syndrql/highlight/lru_cache.hpp
// @brief String-keyed LRU cache bounded by entry count and approximate bytes.
// @invariant size() <= policy.maxEntries and bytes() <= policy.maxBytes after
//            every put, except that a single oversized entry is kept alone.
// @invariant get() and put() promote the entry to most-recently-used.
// @ownership The cache owns copies of keys and values.
#pragma once

#include <cstddef>
#include <functional>
#include <list>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace syndrql::highlight
{

/// @brief Eviction limits; zero disables the corresponding limit.
struct CachePolicy
{
    std::size_t maxEntries = 256;
    std::size_t maxBytes = 4u * 1024u * 1024u;
};

template <typename V> class LruCache
{
  public:
    /// @brief Approximate byte weight of one entry.
    using Weigher = std::function<std::size_t(const std::string &, const V &)>;

    explicit LruCache(CachePolicy policy = {}, Weigher weigher = {})
        : policy_(policy), weigher_(std::move(weigher))
    {
        if (!weigher_)
            weigher_ = [](const std::string &key, const V &) { return key.size(); };
    }

    /// @brief Value for @p key, promoted to most-recently-used; nullptr on miss.
    /// @note The pointer is invalidated by the next put() or clear().
    [[nodiscard]] const V *get(const std::string &key)
    {
        auto it = index_.find(key);
        if (it == index_.end())
        {
            ++misses_;
            return nullptr;
        }
        ++hits_;
        order_.splice(order_.begin(), order_, it->second);
        return &it->second->value;
    }

    /// @brief True if @p key is cached; does not affect recency.
    [[nodiscard]] bool contains(const std::string &key) const
    {
        return index_.find(key) != index_.end();
    }

    /// @brief Insert or replace @p key, then evict least-recently-used entries
    ///        until the policy holds.
    void put(const std::string &key, V value)
    {
        const std::size_t weight = weigher_(key, value);
        auto it = index_.find(key);
        if (it != index_.end())
        {
            bytes_ -= it->second->weight;
            it->second->value = std::move(value);
            it->second->weight = weight;
            order_.splice(order_.begin(), order_, it->second);
        }
        else
        {
            order_.push_front(Entry{key, std::move(value), weight});
            index_.emplace(key, order_.begin());
        }
        bytes_ += weight;
        evict();
    }

    /// @brief Drop @p key if present.
    void erase(const std::string &key)
    {
        auto it = index_.find(key);
        if (it == index_.end())
            return;
        bytes_ -= it->second->weight;
        order_.erase(it->second);
        index_.erase(it);
    }

    void clear()
    {
        order_.clear();
        index_.clear();
        bytes_ = 0;
    }

    /// @brief Replace the policy and evict as needed.
    void setPolicy(CachePolicy policy)
    {
        policy_ = policy;
        evict();
    }

    [[nodiscard]] const CachePolicy &policy() const
    {
        return policy_;
    }

    [[nodiscard]] std::size_t size() const
    {
        return index_.size();
    }

    [[nodiscard]] std::size_t bytes() const
    {
        return bytes_;
    }

    [[nodiscard]] std::size_t evictions() const
    {
        return evictions_;
    }

    [[nodiscard]] std::size_t hits() const
    {
        return hits_;
    }

    [[nodiscard]] std::size_t misses() const
    {
        return misses_;
    }

  private:
    struct Entry
    {
        std::string key;
        V value;
        std::size_t weight;
    };

    [[nodiscard]] bool overLimit() const
    {
        if (policy_.maxEntries != 0 && index_.size() > policy_.maxEntries)
            return true;
        return policy_.maxBytes != 0 && bytes_ > policy_.maxBytes;
    }

    void evict()
    {
        while (order_.size() > 1 && overLimit())
        {
            const Entry &victim = order_.back();
            bytes_ -= victim.weight;
            index_.erase(victim.key);
            order_.pop_back();
            ++evictions_;
        }
    }

    CachePolicy policy_;
    Weigher weigher_;
    std::list<Entry> order_; ///< Front is most recently used.
    std::unordered_map<std::string, typename std::list<Entry>::iterator> index_;
    std::size_t bytes_ = 0;
    std::size_t evictions_ = 0;
    std::size_t hits_ = 0;
    std::size_t misses_ = 0;
};

} // namespace syndrql::highlight
