#pragma once

#include "insights/insight_thresholds.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace larder {

struct AnalyticsConfig {
    int target_cache_ttl_s = 300;
    std::size_t backfill_workers = 1;
    std::size_t rolling_window = 7;
    std::vector<std::string> adherence_keys = {"calories", "protein_g", "carbs_g", "fat_g"};
    InsightThresholds insights;

    // Missing keys keep their defaults. Throws std::runtime_error if the
    // file cannot be opened or parsed, std::invalid_argument on values out
    // of range.
    static AnalyticsConfig load(const std::string& path);
    static AnalyticsConfig from_json(const nlohmann::json& json);
};

} // namespace larder
