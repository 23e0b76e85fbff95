#pragma once

#include "nutrients/nutrient_vector.h"

#include <optional>

namespace larder {

// Effective daily targets. The four macros are required and must be > 0.
struct TargetVector {
    double calories = 0.0;
    double protein_g = 0.0;
    double carbs_g = 0.0;
    double fat_g = 0.0;
    std::optional<double> fiber_g;
    NutrientVector micros; // per-micronutrient overrides

    // Throws std::invalid_argument if a required macro is missing or not
    // positive, or an optional value is negative.
    void validate() const;

    // Flattened view keyed like intake vectors.
    NutrientVector as_nutrients() const;

    bool operator==(const TargetVector& o) const {
        return calories == o.calories && protein_g == o.protein_g &&
               carbs_g == o.carbs_g && fat_g == o.fat_g &&
               fiber_g == o.fiber_g && micros == o.micros;
    }
    bool operator!=(const TargetVector& o) const { return !(*this == o); }
};

} // namespace larder
