#include "fault/fault_injector.h"
#include "fault/faulty_repository.h"
#include "logging/logger.h"
#include "nutrients/adherence.h"
#include "service/analytics_service.h"
#include "storage/json_codec.h"
#include "storage/memory_repositories.h"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <gtest/gtest.h>

using namespace larder;
using namespace std::chrono_literals;

namespace {

TargetVector make_targets(double calories) {
    TargetVector t;
    t.calories = calories;
    t.protein_g = 100.0;
    t.carbs_g = 250.0;
    t.fat_g = 67.0;
    return t;
}

class EndToEndTest : public ::testing::Test {
protected:
    void SetUp() override {
        GoalLayer base;
        base.id = "base";
        base.user_id = "u1";
        base.precedence = PrecedenceClass::BASE;
        base.start_date = Date(2024, 1, 1);
        base.targets = make_targets(2000.0);
        layers_.upsert_layer(base);
    }

    void log_meal(const Date& date, int hour, NutrientVector nutrients) {
        RawIntakeRecord r;
        r.user_id = "u1";
        r.logged_at = date.start_of_day() + std::chrono::hours(hour);
        r.nutrients = std::move(nutrients);
        intake_.add(r);
    }

    // Balanced macros with a fixed iron amount, logged across two meals.
    void log_days(const Date& first, int days, double iron) {
        for (int i = 0; i < days; ++i) {
            Date d = first.add_days(i);
            log_meal(d, 8, {{"calories", 900.0}, {"protein_g", 45.0}, {"carbs_g", 110.0},
                            {"fat_g", 30.0}, {"iron_mg", iron / 2.0}, {"fiber_g", 14.0}});
            log_meal(d, 18, {{"calories", 1100.0}, {"protein_g", 55.0}, {"carbs_g", 140.0},
                             {"fat_g", 37.0}, {"iron_mg", iron / 2.0}, {"fiber_g", 14.0}});
        }
    }

    MemoryIntakeRepository intake_;
    MemorySummaryRepository summaries_;
    MemoryGoalLayerRepository layers_;
    MemoryProfileRepository profiles_;
    MifflinStJeorCalculator calculator_;
};

} // namespace

TEST_F(EndToEndTest, SingleDayAdherence) {
    Date day(2024, 1, 15);
    log_meal(day, 8, {{"calories", 95.0}, {"protein_g", 0.5}});
    log_meal(day, 13, {{"calories", 165.0}, {"protein_g", 31.0}});

    AnalyticsConfig config;
    config.adherence_keys = {"calories"};
    AnalyticsService service(intake_, summaries_, layers_, profiles_, calculator_, config);

    EXPECT_EQ(service.run_daily_rollup("u1", day), RollupStatus::WRITTEN);

    auto window = service.build_window("u1", DateRange{day, day});
    ASSERT_EQ(window.size(), 1u);
    const auto& d = window.days()[0];
    EXPECT_DOUBLE_EQ(d.nutrients.at("calories"), 260.0);
    EXPECT_EQ(d.entry_count, 2);
    EXPECT_DOUBLE_EQ(d.targets.at("calories"), 2000.0);
    EXPECT_DOUBLE_EQ(d.targets.at("sodium_mg"), 2300.0);
    EXPECT_DOUBLE_EQ(d.adherence, 13.0);
}

TEST_F(EndToEndTest, BackfillThenWeeklyAverages) {
    log_days(Date(2024, 1, 1), 14, 18.0);

    AnalyticsService service(intake_, summaries_, layers_, profiles_, calculator_);
    auto report = service.backfill("u1", DateRange{Date(2024, 1, 1), Date(2024, 1, 14)});
    EXPECT_EQ(report.failed, 0);
    // 14 days, 2 weeks, 1 month
    EXPECT_EQ(report.written, 17);

    auto weeks = service.weekly_averages("u1", Date(2024, 1, 14), 3);
    ASSERT_EQ(weeks.size(), 2u);
    EXPECT_EQ(weeks[0].week, (IsoWeek{2024, 1}));
    EXPECT_EQ(weeks[1].week, (IsoWeek{2024, 2}));
    EXPECT_DOUBLE_EQ(weeks[1].averages.at("calories"), 2000.0);
    EXPECT_EQ(weeks[1].total_entries, 14);

    EXPECT_THROW(service.weekly_averages("u1", Date(2024, 1, 14), 0), std::invalid_argument);
}

TEST_F(EndToEndTest, IronDeficiencySurfacesFirst) {
    log_days(Date(2024, 1, 1), 10, 4.0);

    AnalyticsService service(intake_, summaries_, layers_, profiles_, calculator_);
    DateRange range{Date(2024, 1, 1), Date(2024, 1, 10)};
    service.backfill("u1", range);

    auto insights = service.evaluate_insights("u1", range);
    ASSERT_FALSE(insights.empty());
    EXPECT_EQ(insights[0].key, "iron_low_streak");
    EXPECT_EQ(insights[0].severity, InsightSeverity::HIGH);
    EXPECT_EQ(insights[0].id, "iron_low_streak_iron_mg_2024-01-10");
    EXPECT_EQ(insights[0].details["streak_length"], 10);

    // Same inputs, same output
    auto again = service.evaluate_insights("u1", range);
    ASSERT_EQ(again.size(), insights.size());
    for (std::size_t i = 0; i < insights.size(); ++i) {
        EXPECT_EQ(again[i].id, insights[i].id);
        EXPECT_EQ(encode(again[i]), encode(insights[i]));
    }
}

TEST_F(EndToEndTest, TrendsAndStreaksOverStoredDays) {
    for (int i = 0; i < 14; ++i) {
        log_meal(Date(2024, 1, 1).add_days(i), 12,
                 {{"calories", 2000.0}, {"protein_g", 60.0 + 5.0 * i}});
    }

    AnalyticsService service(intake_, summaries_, layers_, profiles_, calculator_);
    DateRange range{Date(2024, 1, 1), Date(2024, 1, 14)};
    service.backfill("u1", range);

    auto trends = service.compute_trends("u1", range, {"protein_g", "calories"});
    ASSERT_EQ(trends.size(), 2u);
    EXPECT_EQ(trends[0].nutrient, "protein_g");
    EXPECT_EQ(trends[0].trend, TrendDirection::INCREASING);
    EXPECT_EQ(trends[0].values.size(), 14u);
    EXPECT_EQ(trends[1].trend, TrendDirection::STABLE);

    // protein reaches the 100 g target from day 9 onward
    auto streaks = service.compute_streaks("u1", range, {"protein_g"},
                                           StreakCondition::MEETING_GOAL);
    ASSERT_EQ(streaks.size(), 1u);
    EXPECT_EQ(streaks[0].current_streak, 6);
    EXPECT_TRUE(streaks[0].is_active);
    EXPECT_EQ(*streaks[0].streak_start, Date(2024, 1, 9));

    EXPECT_TRUE(service.compute_trends("u1", DateRange{Date(2023, 1, 1), Date(2023, 1, 5)},
                                       {"calories"}).empty());
}

TEST_F(EndToEndTest, UnresolvableTargetsFallBackToEmpty) {
    auto log_path = std::filesystem::temp_directory_path() / "larder_test_e2e_fallback.jsonl";
    std::filesystem::remove(log_path);

    RawIntakeRecord r;
    r.user_id = "stranger";
    r.logged_at = Date(2024, 1, 2).start_of_day() + 9h;
    r.nutrients = {{"calories", 1200.0}};
    intake_.add(r);

    {
        Logger logger(log_path.string(), false);
        AnalyticsService service(intake_, summaries_, layers_, profiles_, calculator_, {},
                                 &logger);
        service.run_daily_rollup("stranger", Date(2024, 1, 2));

        // No goal layer for this user
        auto window = service.build_window("stranger", DateRange{Date(2024, 1, 2),
                                                                 Date(2024, 1, 2)});
        ASSERT_EQ(window.size(), 1u);
        EXPECT_DOUBLE_EQ(window.days()[0].nutrients.at("calories"), 1200.0);
        EXPECT_TRUE(window.days()[0].targets.empty());
        EXPECT_DOUBLE_EQ(window.days()[0].adherence, 0.0);
    }

    bool saw_fallback = false;
    std::ifstream file(log_path);
    std::string line;
    while (std::getline(file, line)) {
        auto j = nlohmann::json::parse(line);
        if (j["type"] == "target_fallback") {
            saw_fallback = true;
            EXPECT_EQ(j["user"], "stranger");
        }
    }
    std::filesystem::remove(log_path);
    EXPECT_TRUE(saw_fallback);
}

TEST_F(EndToEndTest, LayerChangeIsSeenImmediately) {
    AnalyticsService service(intake_, summaries_, layers_, profiles_, calculator_);
    Date day(2024, 3, 4);

    EXPECT_DOUBLE_EQ(service.resolve_target("u1", day).calories, 2000.0);

    GoalLayer cut;
    cut.id = "cut";
    cut.user_id = "u1";
    cut.precedence = PrecedenceClass::BASE;
    cut.start_date = Date(2024, 3, 1);
    cut.targets = make_targets(1700.0);
    layers_.upsert_layer(cut);

    EXPECT_DOUBLE_EQ(service.resolve_target("u1", day).calories, 1700.0);
    EXPECT_DOUBLE_EQ(service.resolve_target("u1", Date(2024, 2, 28)).calories, 2000.0);
}

TEST_F(EndToEndTest, FaultyStorageOnlyLosesAffectedPeriods) {
    log_days(Date(2024, 1, 1), 7, 18.0);

    FaultInjector faults;
    faults.inject("2024-01-04", FaultType::FETCH_ERROR);
    FaultyIntakeRepository intake(intake_, faults);
    FaultySummaryRepository summaries(summaries_, faults);

    AnalyticsService service(intake, summaries, layers_, profiles_, calculator_);
    auto report = service.backfill("u1", DateRange{Date(2024, 1, 1), Date(2024, 1, 7)});

    EXPECT_EQ(report.failed, 1);
    EXPECT_EQ(report.completed(), 8);

    auto window = service.build_window("u1", DateRange{Date(2024, 1, 1), Date(2024, 1, 7)});
    EXPECT_EQ(window.size(), 6u);
    EXPECT_EQ(faults.triggered_count(), 1);
}
