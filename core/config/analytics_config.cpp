#include "config/analytics_config.h"

#include "nutrients/nutrient_vector.h"

#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace larder {

namespace {

void require_known(const char* field, const std::string& key) {
    const auto& known = known_nutrient_keys();
    if (std::find(known.begin(), known.end(), key) == known.end()) {
        throw std::invalid_argument(std::string(field) + ": unknown nutrient '" + key + "'");
    }
}

} // namespace

AnalyticsConfig AnalyticsConfig::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open config: " + path);
    }

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("cannot parse config " + path + ": " + e.what());
    }
    return from_json(json);
}

AnalyticsConfig AnalyticsConfig::from_json(const nlohmann::json& json) {
    AnalyticsConfig cfg;

    cfg.target_cache_ttl_s = json.value("target_cache_ttl_s", cfg.target_cache_ttl_s);
    int workers = json.value("backfill_workers", static_cast<int>(cfg.backfill_workers));
    int window = json.value("rolling_window", static_cast<int>(cfg.rolling_window));
    cfg.adherence_keys = json.value("adherence_keys", cfg.adherence_keys);

    if (cfg.target_cache_ttl_s <= 0) {
        throw std::invalid_argument("target_cache_ttl_s must be > 0");
    }
    if (workers < 1) {
        throw std::invalid_argument("backfill_workers must be >= 1");
    }
    if (window < 1) {
        throw std::invalid_argument("rolling_window must be >= 1");
    }
    cfg.backfill_workers = static_cast<std::size_t>(workers);
    cfg.rolling_window = static_cast<std::size_t>(window);

    if (json.contains("insights")) {
        const auto& in = json.at("insights");
        auto& t = cfg.insights;
        t.deficiency_nutrient = in.value("deficiency_nutrient", t.deficiency_nutrient);
        t.deficiency_fraction = in.value("deficiency_fraction", t.deficiency_fraction);
        t.deficiency_min_days = in.value("deficiency_min_days", t.deficiency_min_days);
        t.deficiency_high_days = in.value("deficiency_high_days", t.deficiency_high_days);
        t.deficiency_default_target =
            in.value("deficiency_default_target", t.deficiency_default_target);
        t.fiber_target = in.value("fiber_target", t.fiber_target);
        t.sodium_limit = in.value("sodium_limit", t.sodium_limit);
        t.weekend_threshold_percent =
            in.value("weekend_threshold_percent", t.weekend_threshold_percent);
        t.weekend_warn_percent = in.value("weekend_warn_percent", t.weekend_warn_percent);
        t.protein_min = in.value("protein_min", t.protein_min);
        t.protein_max = in.value("protein_max", t.protein_max);
        t.carbs_min = in.value("carbs_min", t.carbs_min);
        t.carbs_max = in.value("carbs_max", t.carbs_max);
        t.fat_min = in.value("fat_min", t.fat_min);
        t.fat_max = in.value("fat_max", t.fat_max);
        t.trend_nutrients = in.value("trend_nutrients", t.trend_nutrients);
    }

    for (const auto& key : cfg.adherence_keys) {
        require_known("adherence_keys", key);
    }
    for (const auto& key : cfg.insights.trend_nutrients) {
        require_known("trend_nutrients", key);
    }
    require_known("deficiency_nutrient", cfg.insights.deficiency_nutrient);

    return cfg;
}

} // namespace larder
