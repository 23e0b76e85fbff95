#include "config/analytics_config.h"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

using namespace larder;

namespace {

class AnalyticsConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_path_ = std::filesystem::temp_directory_path() / "larder_test_config.json";
    }

    void TearDown() override {
        std::filesystem::remove(config_path_);
    }

    void write_config(const std::string& json_content) {
        std::ofstream file(config_path_);
        file << json_content;
    }

    std::filesystem::path config_path_;
};

} // namespace

TEST_F(AnalyticsConfigTest, EmptyDocumentKeepsDefaults) {
    write_config("{}");
    auto cfg = AnalyticsConfig::load(config_path_.string());

    EXPECT_EQ(cfg.target_cache_ttl_s, 300);
    EXPECT_EQ(cfg.backfill_workers, 1u);
    EXPECT_EQ(cfg.rolling_window, 7u);
    EXPECT_EQ(cfg.adherence_keys.size(), 4u);
    EXPECT_EQ(cfg.insights.deficiency_nutrient, "iron_mg");
    EXPECT_DOUBLE_EQ(cfg.insights.sodium_limit, 2300.0);
    EXPECT_EQ(cfg.insights.trend_nutrients.size(), 7u);
}

TEST_F(AnalyticsConfigTest, OverridesApply) {
    write_config(R"({
        "target_cache_ttl_s": 60,
        "backfill_workers": 4,
        "rolling_window": 5,
        "adherence_keys": ["calories", "fiber_g"],
        "insights": {
            "deficiency_nutrient": "calcium_mg",
            "deficiency_default_target": 1000,
            "fiber_target": 30,
            "weekend_threshold_percent": 15,
            "trend_nutrients": ["calories"]
        }
    })");
    auto cfg = AnalyticsConfig::load(config_path_.string());

    EXPECT_EQ(cfg.target_cache_ttl_s, 60);
    EXPECT_EQ(cfg.backfill_workers, 4u);
    EXPECT_EQ(cfg.rolling_window, 5u);
    EXPECT_EQ(cfg.adherence_keys, (std::vector<std::string>{"calories", "fiber_g"}));
    EXPECT_EQ(cfg.insights.deficiency_nutrient, "calcium_mg");
    EXPECT_DOUBLE_EQ(cfg.insights.deficiency_default_target, 1000.0);
    EXPECT_DOUBLE_EQ(cfg.insights.fiber_target, 30.0);
    EXPECT_DOUBLE_EQ(cfg.insights.weekend_threshold_percent, 15.0);
    EXPECT_DOUBLE_EQ(cfg.insights.weekend_warn_percent, 40.0);
    EXPECT_EQ(cfg.insights.trend_nutrients, (std::vector<std::string>{"calories"}));
}

TEST_F(AnalyticsConfigTest, OutOfRangeValuesThrow) {
    EXPECT_THROW(AnalyticsConfig::from_json({{"target_cache_ttl_s", 0}}), std::invalid_argument);
    EXPECT_THROW(AnalyticsConfig::from_json({{"backfill_workers", 0}}), std::invalid_argument);
    EXPECT_THROW(AnalyticsConfig::from_json({{"backfill_workers", -2}}), std::invalid_argument);
    EXPECT_THROW(AnalyticsConfig::from_json({{"rolling_window", 0}}), std::invalid_argument);
}

TEST_F(AnalyticsConfigTest, UnknownNutrientKeysThrow) {
    EXPECT_THROW(AnalyticsConfig::from_json({{"adherence_keys", {"calories", "protien_g"}}}),
                 std::invalid_argument);
    EXPECT_THROW(AnalyticsConfig::from_json(
                     {{"insights", {{"trend_nutrients", {"iron_mg", "vitamin_z_mg"}}}}}),
                 std::invalid_argument);
    EXPECT_THROW(AnalyticsConfig::from_json({{"insights", {{"deficiency_nutrient", "iron"}}}}),
                 std::invalid_argument);
    EXPECT_NO_THROW(AnalyticsConfig::from_json(
        {{"adherence_keys", {"vitamin_d_ug", "sodium_mg"}}}));
}

TEST_F(AnalyticsConfigTest, MalformedFileThrows) {
    write_config("{ not json");
    EXPECT_THROW(AnalyticsConfig::load(config_path_.string()), std::runtime_error);
    EXPECT_THROW(AnalyticsConfig::load("/tmp/nonexistent_larder_config_12345.json"),
                 std::runtime_error);
}
