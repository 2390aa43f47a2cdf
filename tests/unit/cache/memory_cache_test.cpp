#include <gtest/gtest.h>

#include <string>
#include <unordered_set>

#include <mediacache/cache/memory_cache.h>

using namespace mediacache::cache;

namespace {

CacheKey imageKey(const std::string& name) {
    return CacheKey::original("https://img.example.com/" + name + ".png", ResourceKind::Image);
}

} // namespace

class MemoryCacheTest : public ::testing::Test {
protected:
    MemoryCache<std::string> cache_{0, 0};
};

// ===== Basic Operations Tests =====

TEST_F(MemoryCacheTest, PutAndGet) {
    ASSERT_TRUE(cache_.put(imageKey("a"), "alpha", 5));
    auto hit = cache_.get(imageKey("a"));
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(*hit, "alpha");
    EXPECT_FALSE(cache_.get(imageKey("b")).has_value());

    auto stats = cache_.stats();
    EXPECT_EQ(stats.hits, 1u);
    EXPECT_EQ(stats.misses, 1u);
    EXPECT_DOUBLE_EQ(stats.hitRate(), 0.5);
}

TEST_F(MemoryCacheTest, ReplaceUpdatesCost) {
    cache_.put(imageKey("a"), "alpha", 5);
    cache_.put(imageKey("a"), "alphabet", 8);
    EXPECT_EQ(cache_.size(), 1u);
    EXPECT_EQ(cache_.totalCost(), 8u);
    EXPECT_EQ(*cache_.get(imageKey("a")), "alphabet");
}

TEST_F(MemoryCacheTest, KeysDifferByVariantAndKind) {
    const std::string src = "https://img.example.com/a.png";
    cache_.put(CacheKey::original(src, ResourceKind::Image), "orig", 1);
    cache_.put(CacheKey::sized(src, ResourceKind::Image, {200, 100}), "small", 1);
    cache_.put(CacheKey::original(src, ResourceKind::Video), "video", 1);

    EXPECT_EQ(cache_.size(), 3u);
    EXPECT_FALSE(cache_.get(CacheKey::sized(src, ResourceKind::Image, {100, 200})).has_value());
    EXPECT_EQ(*cache_.get(CacheKey::sized(src, ResourceKind::Image, {200, 100})), "small");
}

// ===== Eviction Tests =====

TEST_F(MemoryCacheTest, CountLimitEvictsLeastRecentlyAccessed) {
    MemoryCache<std::string> cache(2, 0);
    cache.put(imageKey("first"), "1", 1);
    cache.put(imageKey("second"), "2", 1);
    ASSERT_TRUE(cache.get(imageKey("first")).has_value());

    cache.put(imageKey("third"), "3", 1);

    EXPECT_EQ(cache.size(), 2u);
    EXPECT_TRUE(cache.contains(imageKey("first")));
    EXPECT_FALSE(cache.contains(imageKey("second")));
    EXPECT_TRUE(cache.contains(imageKey("third")));
    EXPECT_EQ(cache.stats().evictions, 1u);
}

TEST_F(MemoryCacheTest, CostLimitEvictsUntilItFits) {
    MemoryCache<std::string> cache(0, 100);
    cache.put(imageKey("a"), "a", 40);
    cache.put(imageKey("b"), "b", 40);
    cache.put(imageKey("c"), "c", 40);

    EXPECT_FALSE(cache.contains(imageKey("a")));
    EXPECT_TRUE(cache.contains(imageKey("b")));
    EXPECT_TRUE(cache.contains(imageKey("c")));
    EXPECT_EQ(cache.totalCost(), 80u);
}

TEST_F(MemoryCacheTest, OversizedEntryIsRejected) {
    MemoryCache<std::string> cache(0, 100);
    cache.put(imageKey("a"), "small", 10);

    EXPECT_FALSE(cache.put(imageKey("a"), "huge", 101));
    EXPECT_FALSE(cache.contains(imageKey("a")));
    EXPECT_EQ(cache.stats().rejections, 1u);
    EXPECT_EQ(cache.totalCost(), 0u);
}

TEST_F(MemoryCacheTest, LoweringLimitsEvictsImmediately) {
    for (int i = 0; i < 5; ++i) {
        cache_.put(imageKey(std::to_string(i)), "v", 10);
    }
    cache_.setCountLimit(3);
    EXPECT_EQ(cache_.size(), 3u);
    EXPECT_FALSE(cache_.contains(imageKey("0")));

    cache_.setCostLimit(15);
    EXPECT_EQ(cache_.size(), 1u);
    EXPECT_TRUE(cache_.contains(imageKey("4")));
}

// ===== Invalidation Tests =====

TEST_F(MemoryCacheTest, InvalidateIfRemovesMatchingKeys) {
    const std::string src = "https://img.example.com/a.png";
    cache_.put(CacheKey::original(src, ResourceKind::Image), "o", 1);
    cache_.put(CacheKey::sized(src, ResourceKind::Image, {10, 10}), "s", 1);
    cache_.put(imageKey("other"), "x", 1);

    auto removed =
        cache_.invalidateIf([&](const CacheKey& key) { return key.sourceIdentity == src; });

    EXPECT_EQ(removed, 2u);
    EXPECT_EQ(cache_.size(), 1u);
    EXPECT_EQ(cache_.totalCost(), 1u);
    EXPECT_FALSE(cache_.invalidate(CacheKey::original(src, ResourceKind::Image)));
}

TEST_F(MemoryCacheTest, ClearEmptiesEverything) {
    cache_.put(imageKey("a"), "a", 3);
    cache_.put(imageKey("b"), "b", 4);
    cache_.clear();
    EXPECT_EQ(cache_.size(), 0u);
    EXPECT_EQ(cache_.totalCost(), 0u);
}

// ===== Key Tests =====

TEST(CacheKeyTest, VariantTokenUsesOneDecimal) {
    EXPECT_EQ(Variant::original().token(), "original");
    EXPECT_EQ(Variant::sized({327, 246}).token(), "327.0-246.0");
    EXPECT_EQ(Variant::sized({1280.5, 720}).token(), "1280.5-720.0");
}

TEST(CacheKeyTest, EqualityAndHashAgree) {
    auto a = CacheKey::sized("u", ResourceKind::Video, {1, 2});
    auto b = CacheKey::sized("u", ResourceKind::Video, {1, 2});
    auto c = CacheKey::sized("u", ResourceKind::Image, {1, 2});
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_EQ(CacheKeyHash{}(a), CacheKeyHash{}(b));

    std::unordered_set<CacheKey, CacheKeyHash> keys{a, b, c, CacheKey::original("u", ResourceKind::Video)};
    EXPECT_EQ(keys.size(), 3u);
}
