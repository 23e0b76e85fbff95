#include "storage/json_codec.h"
#include "storage/json_fixture.h"

#include <gtest/gtest.h>

using namespace larder;

static nlohmann::json make_fixture() {
    return nlohmann::json::parse(R"({
        "profiles": [
            { "user_id": "u1", "sex": "female", "age_years": 30,
              "height_cm": 165, "weight_kg": 60,
              "activity_level": "moderately_active", "current_goal": "maintenance" }
        ],
        "intake": [
            { "user_id": "u1", "logged_at": "2024-01-15T08:00:00Z",
              "nutrients": { "calories": 95, "protein_g": 0.5, "fiber_g": 4.4 } },
            { "user_id": "u1", "logged_at": "2024-01-15T12:30:00.250Z",
              "nutrients": { "calories": 165, "protein_g": 31, "sodium_mg": 0 } }
        ],
        "goal_layers": [
            { "id": "base", "user_id": "u1", "class": "base", "start_date": "2024-01-01",
              "targets": { "calories": 2000, "protein_g": 100, "carbs_g": 250, "fat_g": 67 } },
            { "id": "sat", "user_id": "u1", "class": "weekly_cycle", "start_date": "2024-01-01",
              "day_of_week": 6, "goal_type": "muscle_gain" },
            { "id": "luteal", "user_id": "u1", "class": "phase_based", "start_date": "2024-01-01",
              "end_date": "2024-06-30", "phase": "luteal", "cycle_start_date": "2024-01-01",
              "phase_start_day": 15, "phase_end_day": 28,
              "targets": { "calories": 2200, "protein_g": 110, "carbs_g": 270, "fat_g": 70,
                           "fiber_g": 30 } }
        ]
    })");
}

TEST(JsonFixture, LoadsEverySection) {
    MemoryIntakeRepository intake;
    MemoryGoalLayerRepository layers;
    MemoryProfileRepository profiles;

    auto counts = load_fixture(make_fixture(), intake, layers, profiles);
    EXPECT_EQ(counts.profiles, 1u);
    EXPECT_EQ(counts.intake, 2u);
    EXPECT_EQ(counts.goal_layers, 3u);
    EXPECT_EQ(intake.size(), 2u);

    auto profile = profiles.get_profile("u1");
    ASSERT_TRUE(profile.has_value());
    EXPECT_EQ(profile->activity_level, ActivityLevel::MODERATELY_ACTIVE);

    auto active = layers.get_active_layers("u1", Date(2024, 1, 20));
    EXPECT_EQ(active.base.size(), 1u);
    ASSERT_EQ(active.weekly_cycle.size(), 1u);
    EXPECT_EQ(active.weekly_cycle[0].day_of_week, 6);
    ASSERT_TRUE(active.weekly_cycle[0].goal_type.has_value());
    EXPECT_EQ(*active.weekly_cycle[0].goal_type, GoalType::MUSCLE_GAIN);
    ASSERT_EQ(active.phase_based.size(), 1u);
    EXPECT_EQ(active.phase_based[0].phase.end_day, 28);
    ASSERT_TRUE(active.phase_based[0].targets->fiber_g.has_value());
    EXPECT_DOUBLE_EQ(*active.phase_based[0].targets->fiber_g, 30.0);
}

TEST(JsonFixture, IntakeDropsNonPositiveNutrients) {
    auto record = decode_intake(make_fixture()["intake"][1]);
    EXPECT_EQ(record.nutrients.count("sodium_mg"), 0u);
    EXPECT_DOUBLE_EQ(record.nutrients.at("calories"), 165.0);
    EXPECT_EQ(Date::from_time_point(record.logged_at), Date(2024, 1, 15));
}

TEST(JsonFixture, BadEntryNamesSectionAndIndex) {
    auto fixture = make_fixture();
    fixture["goal_layers"][1].erase("day_of_week");

    MemoryIntakeRepository intake;
    MemoryGoalLayerRepository layers;
    MemoryProfileRepository profiles;

    try {
        load_fixture(fixture, intake, layers, profiles);
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("goal_layers[1]"), std::string::npos);
    }
}

TEST(JsonFixture, LayerNeedsTargetsOrGoalType) {
    auto layer = make_fixture()["goal_layers"][0];
    layer.erase("targets");
    EXPECT_THROW(decode_goal_layer(layer), std::invalid_argument);
}

TEST(JsonFixture, InvalidPhaseWindowThrows) {
    auto layer = make_fixture()["goal_layers"][2];
    layer["phase_end_day"] = 40;
    EXPECT_THROW(decode_goal_layer(layer), std::invalid_argument);
}

TEST(JsonFixture, NonNumericNutrientThrows) {
    EXPECT_THROW(decode_nutrients(nlohmann::json{{"calories", "lots"}}), std::invalid_argument);
    EXPECT_THROW(decode_nutrients(nlohmann::json::array()), std::invalid_argument);
}

TEST(JsonFixture, EncodeStreakUsesNullForMissingDates) {
    StreakRecord streak;
    streak.nutrient = "iron_mg";
    auto j = encode(streak);
    EXPECT_EQ(j["condition"], "meeting_goal");
    EXPECT_TRUE(j["streak_start"].is_null());
    EXPECT_EQ(j["current_streak"], 0);
}

TEST(JsonFixture, MissingFileThrows) {
    MemoryIntakeRepository intake;
    MemoryGoalLayerRepository layers;
    MemoryProfileRepository profiles;
    EXPECT_THROW(load_fixture_file("/tmp/nonexistent_larder_fixture_12345.json",
                                   intake, layers, profiles),
                 std::runtime_error);
}
