// tests/test_lru_cache.cpp
// @brief Tests for the bounded LRU cache used by the highlighter.
// @invariant Least-recently-used entries are evicted first.
// @ownership Test owns cache instances.

#include <gtest/gtest.h>

#include "syndrql/highlight/lru_cache.hpp"

#include <string>

using syndrql::highlight::CachePolicy;
using syndrql::highlight::LruCache;

TEST(LruCache, EvictsLeastRecentlyUsedByCount)
{
    LruCache<int> cache(CachePolicy{2, 0});
    cache.put("a", 1);
    cache.put("b", 2);
    ASSERT_NE(cache.get("a"), nullptr); // "b" is now the oldest
    cache.put("c", 3);

    EXPECT_EQ(cache.size(), 2u);
    EXPECT_TRUE(cache.contains("a"));
    EXPECT_FALSE(cache.contains("b"));
    EXPECT_TRUE(cache.contains("c"));
    EXPECT_EQ(cache.evictions(), 1u);
}

TEST(LruCache, EvictsByWeight)
{
    LruCache<std::string> cache(CachePolicy{0, 10},
                                [](const std::string &key, const std::string &value)
                                { return key.size() + value.size(); });
    cache.put("k1", "aaaa"); // 6
    cache.put("k2", "bb");   // 4, total 10
    EXPECT_EQ(cache.bytes(), 10u);
    cache.put("k3", "c"); // 3, evicts k1
    EXPECT_FALSE(cache.contains("k1"));
    EXPECT_EQ(cache.bytes(), 7u);

    // A single oversized entry is kept on its own.
    cache.put("big", "0123456789");
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_TRUE(cache.contains("big"));
}

TEST(LruCache, ReplacingUpdatesValueAndWeight)
{
    LruCache<int> cache;
    cache.put("key", 1);
    cache.put("key", 2);
    EXPECT_EQ(cache.size(), 1u);
    ASSERT_NE(cache.get("key"), nullptr);
    EXPECT_EQ(*cache.get("key"), 2);
    EXPECT_EQ(cache.bytes(), 3u);
}

TEST(LruCache, CountsHitsAndMisses)
{
    LruCache<int> cache;
    cache.put("x", 1);
    EXPECT_EQ(cache.get("y"), nullptr);
    EXPECT_NE(cache.get("x"), nullptr);
    EXPECT_EQ(cache.hits(), 1u);
    EXPECT_EQ(cache.misses(), 1u);
}

TEST(LruCache, EraseClearAndShrinkPolicy)
{
    LruCache<int> cache;
    for (int i = 0; i < 5; ++i)
        cache.put("k" + std::to_string(i), i);
    cache.erase("k0");
    cache.erase("missing");
    EXPECT_EQ(cache.size(), 4u);

    cache.setPolicy(CachePolicy{2, 0});
    EXPECT_EQ(cache.size(), 2u);
    EXPECT_TRUE(cache.contains("k4"));
    EXPECT_TRUE(cache.contains("k3"));

    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_EQ(cache.bytes(), 0u);
}
