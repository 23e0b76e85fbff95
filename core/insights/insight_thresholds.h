#pragma once

#include <string>
#include <vector>

namespace larder {

// Tunable trigger points for the built-in insight rules.
struct InsightThresholds {
    std::string deficiency_nutrient = "iron_mg";
    double deficiency_fraction = 0.7;
    int deficiency_min_days = 3;
    int deficiency_high_days = 7;
    double deficiency_default_target = 18.0;

    double fiber_target = 25.0;
    double sodium_limit = 2300.0;

    double weekend_threshold_percent = 25.0;
    double weekend_warn_percent = 40.0;

    double protein_min = 10.0;
    double protein_max = 35.0;
    double carbs_min = 20.0;
    double carbs_max = 65.0;
    double fat_min = 15.0;
    double fat_max = 40.0;

    std::vector<std::string> trend_nutrients = {
        "calories", "protein_g", "carbs_g", "fat_g",
        "fiber_g", "sodium_mg", "iron_mg"
    };
};

} // namespace larder
