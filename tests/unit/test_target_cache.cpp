#include "targets/target_cache.h"

#include <gtest/gtest.h>

using namespace larder;
using namespace std::chrono_literals;

namespace {

class TargetCacheTest : public ::testing::Test {
protected:
    TargetCache::Clock clock() {
        return [this]() { return now_; };
    }

    static TargetVector make_targets(double calories) {
        TargetVector t;
        t.calories = calories;
        t.protein_g = 100.0;
        t.carbs_g = 200.0;
        t.fat_g = 60.0;
        return t;
    }

    std::chrono::steady_clock::time_point now_{};
};

} // namespace

TEST_F(TargetCacheTest, MissThenHit) {
    TargetCache cache(300s, clock());
    Date day(2024, 1, 1);

    EXPECT_FALSE(cache.get("u1", day).has_value());
    EXPECT_TRUE(cache.put("u1", day, make_targets(2000.0), cache.generation("u1")));

    auto hit = cache.get("u1", day);
    ASSERT_TRUE(hit.has_value());
    EXPECT_DOUBLE_EQ(hit->calories, 2000.0);
    EXPECT_FALSE(cache.get("u2", day).has_value());
    EXPECT_FALSE(cache.get("u1", day.add_days(1)).has_value());
}

TEST_F(TargetCacheTest, EntriesExpireAfterTtl) {
    TargetCache cache(300s, clock());
    Date day(2024, 1, 1);
    cache.put("u1", day, make_targets(2000.0), cache.generation("u1"));

    now_ += 299s;
    EXPECT_TRUE(cache.get("u1", day).has_value());

    now_ += 1s;
    EXPECT_FALSE(cache.get("u1", day).has_value());
    EXPECT_EQ(cache.size(), 0u);
}

TEST_F(TargetCacheTest, PutSweepsExpiredEntries) {
    TargetCache cache(300s, clock(), 1);
    Date first(2024, 1, 1);
    for (int i = 0; i < 1000; ++i) {
        cache.put("u1", first.add_days(i), make_targets(2000.0), cache.generation("u1"));
    }
    cache.put("u2", first, make_targets(1800.0), cache.generation("u2"));
    EXPECT_EQ(cache.size(), 1001u);

    now_ += 24h;
    EXPECT_TRUE(cache.put("u1", first.add_days(1000), make_targets(2000.0),
                          cache.generation("u1")));
    EXPECT_EQ(cache.size(), 1u);
}

TEST_F(TargetCacheTest, SweepKeepsInvalidationGeneration) {
    TargetCache cache(300s, clock(), 1);
    Date day(2024, 1, 1);
    auto stale = cache.generation("u1");
    cache.invalidate_user("u1");

    now_ += 24h;
    cache.put("u2", day, make_targets(1800.0), cache.generation("u2"));
    EXPECT_FALSE(cache.put("u1", day, make_targets(2000.0), stale));
}

TEST_F(TargetCacheTest, InvalidateDropsOnlyThatUser) {
    TargetCache cache(300s, clock());
    cache.put("u1", Date(2024, 1, 1), make_targets(2000.0), cache.generation("u1"));
    cache.put("u1", Date(2024, 1, 2), make_targets(2000.0), cache.generation("u1"));
    cache.put("u2", Date(2024, 1, 1), make_targets(1800.0), cache.generation("u2"));

    EXPECT_EQ(cache.invalidate_user("u1"), 2u);
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_FALSE(cache.get("u1", Date(2024, 1, 1)).has_value());
    EXPECT_TRUE(cache.get("u2", Date(2024, 1, 1)).has_value());
    EXPECT_EQ(cache.invalidate_user("nobody"), 0u);
}

TEST_F(TargetCacheTest, StalePutAfterInvalidationIsRejected) {
    TargetCache cache(300s, clock());
    Date day(2024, 1, 1);

    auto generation = cache.generation("u1");
    cache.invalidate_user("u1");

    EXPECT_FALSE(cache.put("u1", day, make_targets(2000.0), generation));
    EXPECT_FALSE(cache.get("u1", day).has_value());

    EXPECT_TRUE(cache.put("u1", day, make_targets(2100.0), cache.generation("u1")));
    EXPECT_DOUBLE_EQ(cache.get("u1", day)->calories, 2100.0);
}

TEST_F(TargetCacheTest, InvalidConstructionThrows) {
    EXPECT_THROW(TargetCache(0s), std::invalid_argument);
    EXPECT_THROW(TargetCache(60s, nullptr, 0), std::invalid_argument);
}
