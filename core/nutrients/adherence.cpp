#include "nutrients/adherence.h"

#include <algorithm>

namespace larder {

MacroBalance calculate_macro_balance(const NutrientVector& nutrients) {
    double protein_cals = amount_of(nutrients, "protein_g") * 4.0;
    double carbs_cals = amount_of(nutrients, "carbs_g") * 4.0;
    double fat_cals = amount_of(nutrients, "fat_g") * 9.0;
    double total = protein_cals + carbs_cals + fat_cals;

    MacroBalance balance;
    if (total <= 0.0) {
        return balance;
    }

    balance.protein_percent = protein_cals / total * 100.0;
    balance.carbs_percent = carbs_cals / total * 100.0;
    balance.fat_percent = fat_cals / total * 100.0;
    balance.total_calories = total;
    return balance;
}

double calculate_nutrient_adherence(double actual, double target,
                                    const std::string& nutrient) {
    if (target <= 0.0) {
        return actual == 0.0 ? 100.0 : 0.0;
    }

    double ratio = actual / target;

    if (is_minimize_nutrient(nutrient)) {
        if (ratio <= 1.0) {
            return 100.0;
        }
        return std::max(0.0, 100.0 - (ratio - 1.0) * 100.0);
    }

    return std::clamp(ratio * 100.0, 0.0, 100.0);
}

double calculate_adherence(const NutrientVector& actual,
                           const NutrientVector& target,
                           const std::vector<std::string>& keys) {
    double sum = 0.0;
    int counted = 0;

    for (const auto& key : keys) {
        auto it = target.find(key);
        if (it == target.end() || it->second <= 0.0) {
            continue;
        }
        sum += calculate_nutrient_adherence(amount_of(actual, key), it->second, key);
        ++counted;
    }

    if (counted == 0) {
        return 0.0;
    }
    return std::clamp(sum / counted, 0.0, 100.0);
}

} // namespace larder
