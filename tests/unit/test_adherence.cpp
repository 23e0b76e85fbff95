#include "nutrients/adherence.h"

#include <gtest/gtest.h>

using namespace larder;

TEST(Adherence, CaloriesAgainstTarget) {
    NutrientVector actual{{"calories", 260.0}};
    NutrientVector target{{"calories", 2000.0}};
    EXPECT_DOUBLE_EQ(calculate_adherence(actual, target, {"calories"}), 13.0);
}

TEST(Adherence, MaximizeNutrientCapsAtHundred) {
    EXPECT_DOUBLE_EQ(calculate_nutrient_adherence(200.0, 150.0, "protein_g"), 100.0);
    EXPECT_DOUBLE_EQ(calculate_nutrient_adherence(75.0, 150.0, "protein_g"), 50.0);
    EXPECT_DOUBLE_EQ(calculate_nutrient_adherence(0.0, 150.0, "protein_g"), 0.0);
}

TEST(Adherence, MinimizeNutrientPenalizesOverage) {
    EXPECT_DOUBLE_EQ(calculate_nutrient_adherence(2000.0, 2300.0, "sodium_mg"), 100.0);
    EXPECT_DOUBLE_EQ(calculate_nutrient_adherence(3450.0, 2300.0, "sodium_mg"), 50.0);
    EXPECT_DOUBLE_EQ(calculate_nutrient_adherence(4600.0, 2300.0, "sodium_mg"), 0.0);
    EXPECT_DOUBLE_EQ(calculate_nutrient_adherence(9000.0, 2300.0, "sodium_mg"), 0.0);
}

TEST(Adherence, ZeroTargetUsesSentinels) {
    EXPECT_DOUBLE_EQ(calculate_nutrient_adherence(0.0, 0.0, "trans_fat_g"), 100.0);
    EXPECT_DOUBLE_EQ(calculate_nutrient_adherence(1.5, 0.0, "trans_fat_g"), 0.0);
}

TEST(Adherence, MeanSkipsUntargetedKeys) {
    NutrientVector actual{{"calories", 1000.0}, {"protein_g", 150.0}, {"fat_g", 10.0}};
    NutrientVector target{{"calories", 2000.0}, {"protein_g", 150.0}};

    double score = calculate_adherence(actual, target,
                                       {"calories", "protein_g", "carbs_g", "fat_g"});
    EXPECT_DOUBLE_EQ(score, 75.0);
}

TEST(Adherence, NoTargetsScoresZero) {
    NutrientVector actual{{"calories", 1000.0}};
    EXPECT_DOUBLE_EQ(calculate_adherence(actual, {}, {"calories"}), 0.0);
}

TEST(MacroBalance, CalorieShares) {
    NutrientVector day{{"protein_g", 30.0}, {"carbs_g", 75.0}, {"fat_g", 20.0}};
    auto b = calculate_macro_balance(day);
    EXPECT_DOUBLE_EQ(b.total_calories, 600.0);
    EXPECT_DOUBLE_EQ(b.protein_percent, 20.0);
    EXPECT_DOUBLE_EQ(b.carbs_percent, 50.0);
    EXPECT_DOUBLE_EQ(b.fat_percent, 30.0);
}

TEST(MacroBalance, EmptyDayIsAllZero) {
    auto b = calculate_macro_balance({{"calories", 300.0}});
    EXPECT_DOUBLE_EQ(b.total_calories, 0.0);
    EXPECT_DOUBLE_EQ(b.protein_percent, 0.0);
    EXPECT_DOUBLE_EQ(b.carbs_percent, 0.0);
    EXPECT_DOUBLE_EQ(b.fat_percent, 0.0);
}
