#pragma once

#include "nutrients/nutrient_vector.h"

#include <string>
#include <vector>

namespace larder {

// Share of macro energy (protein 4 kcal/g, carbs 4 kcal/g, fat 9 kcal/g).
struct MacroBalance {
    double protein_percent = 0.0;
    double carbs_percent = 0.0;
    double fat_percent = 0.0;
    double total_calories = 0.0;
};

MacroBalance calculate_macro_balance(const NutrientVector& nutrients);

// Percent of target achieved for a single nutrient, in [0, 100]. Minimize
// nutrients score 100 up to the target and lose a point per percent over it.
double calculate_nutrient_adherence(double actual, double target,
                                    const std::string& nutrient);

// Mean adherence over the keys that carry a target. 0 when none do.
double calculate_adherence(const NutrientVector& actual,
                           const NutrientVector& target,
                           const std::vector<std::string>& keys);

} // namespace larder
