#include "targets/target_vector.h"

#include <cmath>
#include <stdexcept>

namespace larder {

namespace {

void require_positive(const char* field, double value) {
    if (!std::isfinite(value) || value <= 0.0) {
        throw std::invalid_argument(std::string("target ") + field +
                                    " must be > 0, got " + std::to_string(value));
    }
}

} // namespace

void TargetVector::validate() const {
    require_positive("calories", calories);
    require_positive("protein_g", protein_g);
    require_positive("carbs_g", carbs_g);
    require_positive("fat_g", fat_g);

    if (fiber_g && (!std::isfinite(*fiber_g) || *fiber_g < 0.0)) {
        throw std::invalid_argument("target fiber_g must be >= 0");
    }
    for (const auto& [key, value] : micros) {
        if (!std::isfinite(value) || value < 0.0) {
            throw std::invalid_argument("target " + key + " must be >= 0");
        }
    }
}

NutrientVector TargetVector::as_nutrients() const {
    NutrientVector v = micros;
    v["calories"] = calories;
    v["protein_g"] = protein_g;
    v["carbs_g"] = carbs_g;
    v["fat_g"] = fat_g;
    if (fiber_g) {
        v["fiber_g"] = *fiber_g;
    }
    return v;
}

} // namespace larder
