#include "targets/target_resolver.h"
#include "storage/memory_repositories.h"

#include <gtest/gtest.h>

using namespace larder;
using namespace std::chrono_literals;

namespace {

// Returns fixed targets and counts how often it was asked.
class CountingCalculator : public IMacroCalculator {
public:
    TargetVector compute(const UserProfile&, GoalType goal) const override {
        ++calls;
        last_goal = goal;
        TargetVector t;
        t.calories = 1900.0;
        t.protein_g = 95.0;
        t.carbs_g = 230.0;
        t.fat_g = 63.0;
        return t;
    }

    mutable int calls = 0;
    mutable GoalType last_goal = GoalType::MAINTENANCE;
};

TargetVector make_targets(double calories) {
    TargetVector t;
    t.calories = calories;
    t.protein_g = 100.0;
    t.carbs_g = 250.0;
    t.fat_g = 70.0;
    return t;
}

GoalLayer make_layer(const std::string& id, PrecedenceClass precedence,
                     const Date& start, std::optional<TargetVector> targets) {
    GoalLayer layer;
    layer.id = id;
    layer.user_id = "u1";
    layer.precedence = precedence;
    layer.start_date = start;
    layer.targets = std::move(targets);
    return layer;
}

class TargetResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        // 2024-01-01 is a Monday.
        layers_.upsert_layer(make_layer("base", PrecedenceClass::BASE, Date(2023, 12, 1),
                                        make_targets(2000.0)));

        auto monday = make_layer("monday", PrecedenceClass::WEEKLY_CYCLE, Date(2023, 12, 1),
                                 make_targets(2400.0));
        monday.day_of_week = 1;
        layers_.upsert_layer(monday);

        auto luteal = make_layer("luteal", PrecedenceClass::PHASE_BASED, Date(2023, 12, 1),
                                 make_targets(2200.0));
        luteal.phase.phase = CyclePhase::LUTEAL;
        luteal.phase.cycle_start = Date(2024, 1, 1);
        luteal.phase.start_day = 1;
        luteal.phase.end_day = 5;
        luteal.phase.cycle_length_days = 28;
        layers_.upsert_layer(luteal);
    }

    MemoryGoalLayerRepository layers_;
    MemoryProfileRepository profiles_;
    CountingCalculator calculator_;
};

} // namespace

TEST_F(TargetResolverTest, PhaseBeatsWeeklyBeatsBase) {
    TargetResolver resolver(layers_, profiles_, calculator_);

    // Monday inside the phase window
    EXPECT_DOUBLE_EQ(resolver.resolve("u1", Date(2024, 1, 1)).calories, 2200.0);
    // Monday outside it
    EXPECT_DOUBLE_EQ(resolver.resolve("u1", Date(2024, 1, 8)).calories, 2400.0);
    // Neither
    EXPECT_DOUBLE_EQ(resolver.resolve("u1", Date(2024, 1, 10)).calories, 2000.0);
    // Next cycle
    EXPECT_DOUBLE_EQ(resolver.resolve("u1", Date(2024, 1, 29)).calories, 2200.0);
}

TEST_F(TargetResolverTest, RemovingWinnerFallsThrough) {
    TargetResolver resolver(layers_, profiles_, calculator_);
    Date monday(2024, 1, 1);

    EXPECT_DOUBLE_EQ(resolver.resolve("u1", monday).calories, 2200.0);
    ASSERT_TRUE(layers_.remove_layer("u1", "luteal"));
    EXPECT_DOUBLE_EQ(resolver.resolve("u1", monday).calories, 2400.0);
    ASSERT_TRUE(layers_.remove_layer("u1", "monday"));
    EXPECT_DOUBLE_EQ(resolver.resolve("u1", monday).calories, 2000.0);
}

TEST_F(TargetResolverTest, LatestStartWinsWithinClass) {
    layers_.upsert_layer(make_layer("base2", PrecedenceClass::BASE, Date(2024, 1, 5),
                                    make_targets(1800.0)));
    TargetResolver resolver(layers_, profiles_, calculator_);

    EXPECT_DOUBLE_EQ(resolver.resolve("u1", Date(2024, 1, 4)).calories, 2000.0);
    EXPECT_DOUBLE_EQ(resolver.resolve("u1", Date(2024, 1, 10)).calories, 1800.0);
}

TEST_F(TargetResolverTest, GoalTypeLayerUsesCalculator) {
    MemoryGoalLayerRepository layers;
    auto layer = make_layer("goal", PrecedenceClass::BASE, Date(2024, 1, 1), std::nullopt);
    layer.goal_type = GoalType::WEIGHT_LOSS;
    layers.upsert_layer(layer);

    UserProfile profile;
    profile.user_id = "u1";
    profile.weight_kg = 70.0;
    profile.height_cm = 170.0;
    profiles_.put(profile);

    TargetResolver resolver(layers, profiles_, calculator_);
    auto targets = resolver.resolve("u1", Date(2024, 1, 2));
    EXPECT_DOUBLE_EQ(targets.calories, 1900.0);
    EXPECT_EQ(calculator_.last_goal, GoalType::WEIGHT_LOSS);
}

TEST_F(TargetResolverTest, MissingProfileOrLayerThrows) {
    MemoryGoalLayerRepository layers;
    auto layer = make_layer("goal", PrecedenceClass::BASE, Date(2024, 1, 1), std::nullopt);
    layer.goal_type = GoalType::MAINTENANCE;
    layers.upsert_layer(layer);

    TargetResolver resolver(layers, profiles_, calculator_);
    EXPECT_THROW(resolver.resolve("u1", Date(2024, 1, 2)), TargetResolutionError);
    EXPECT_THROW(resolver.resolve("u1", Date(2023, 12, 31)), TargetResolutionError);
    EXPECT_THROW(resolver.resolve("stranger", Date(2024, 1, 2)), TargetResolutionError);
}

TEST_F(TargetResolverTest, ResultsAreCachedUntilLayersChange) {
    MemoryGoalLayerRepository layers;
    auto layer = make_layer("goal", PrecedenceClass::BASE, Date(2024, 1, 1), std::nullopt);
    layer.goal_type = GoalType::MAINTENANCE;
    layers.upsert_layer(layer);

    UserProfile profile;
    profile.user_id = "u1";
    profiles_.put(profile);

    TargetResolver resolver(layers, profiles_, calculator_);
    Date day(2024, 1, 2);

    resolver.resolve("u1", day);
    resolver.resolve("u1", day);
    EXPECT_EQ(calculator_.calls, 1);
    EXPECT_EQ(resolver.cache().size(), 1u);

    layer.goal_type = GoalType::MUSCLE_GAIN;
    layers.upsert_layer(layer);
    EXPECT_EQ(resolver.cache().size(), 0u);

    resolver.resolve("u1", day);
    EXPECT_EQ(calculator_.calls, 2);
    EXPECT_EQ(calculator_.last_goal, GoalType::MUSCLE_GAIN);
}

TEST_F(TargetResolverTest, CacheExpiresWithClock) {
    std::chrono::steady_clock::time_point now{};
    MemoryGoalLayerRepository layers;
    auto layer = make_layer("goal", PrecedenceClass::BASE, Date(2024, 1, 1), std::nullopt);
    layer.goal_type = GoalType::MAINTENANCE;
    layers.upsert_layer(layer);

    UserProfile profile;
    profile.user_id = "u1";
    profiles_.put(profile);

    TargetResolver resolver(layers, profiles_, calculator_, 60s, nullptr,
                            [&now]() { return now; });
    resolver.resolve("u1", Date(2024, 1, 2));
    now += 61s;
    resolver.resolve("u1", Date(2024, 1, 2));
    EXPECT_EQ(calculator_.calls, 2);
}

TEST_F(TargetResolverTest, GetRangeResolvesEachDay) {
    TargetResolver resolver(layers_, profiles_, calculator_);

    auto range = resolver.get_range("u1", Date(2024, 1, 6), Date(2024, 1, 8));
    ASSERT_EQ(range.size(), 3u);
    EXPECT_EQ(range[0].first, Date(2024, 1, 6));
    EXPECT_DOUBLE_EQ(range[0].second.calories, 2000.0);
    EXPECT_DOUBLE_EQ(range[2].second.calories, 2400.0);

    EXPECT_THROW(resolver.get_range("u1", Date(2024, 1, 8), Date(2024, 1, 6)),
                 std::invalid_argument);
}

TEST_F(TargetResolverTest, MalformedExplicitTargetsThrow) {
    MemoryGoalLayerRepository layers;
    auto bad = make_targets(2000.0);
    bad.protein_g = 0.0;
    layers.upsert_layer(make_layer("bad", PrecedenceClass::BASE, Date(2024, 1, 1), bad));

    TargetResolver resolver(layers, profiles_, calculator_);
    EXPECT_THROW(resolver.resolve("u1", Date(2024, 1, 2)), std::invalid_argument);
}

TEST(TargetResolverSelect, TiesBreakOnGreatestId) {
    ActiveLayerSet active;
    active.base.push_back(make_layer("a", PrecedenceClass::BASE, Date(2024, 1, 1),
                                     make_targets(2000.0)));
    active.base.push_back(make_layer("b", PrecedenceClass::BASE, Date(2024, 1, 1),
                                     make_targets(2100.0)));

    auto selected = TargetResolver::select_layers(active, Date(2024, 1, 3));
    ASSERT_TRUE(selected.base.has_value());
    EXPECT_EQ(selected.base->id, "b");
    EXPECT_FALSE(selected.weekly_cycle.has_value());
    ASSERT_NE(selected.winner(), nullptr);
    EXPECT_EQ(selected.winner()->id, "b");
}
