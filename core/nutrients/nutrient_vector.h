#pragma once

#include <map>
#include <string>
#include <vector>

namespace larder {

// Sparse nutrient amounts keyed by nutrient name ("calories", "protein_g",
// "iron_mg", ...). An absent key means "not recorded", never zero. The
// ordered map keeps serialized output stable from run to run.
using NutrientVector = std::map<std::string, double>;

// Rounds to 2 decimal places. Applied after every arithmetic combination so
// drift does not accumulate across many entries.
double round2(double value);

// Key-wise sum. A key is emitted only if either input holds a positive
// value for it.
NutrientVector merge(const NutrientVector& a, const NutrientVector& b);

// Multiplies every present key by factor. A factor <= 0 yields an empty
// vector rather than negative nutrients.
NutrientVector scale(const NutrientVector& v, double factor);

// Folds merge() over all vectors.
NutrientVector accumulate(const std::vector<NutrientVector>& vectors);

// Amount recorded for key, 0 when absent.
double amount_of(const NutrientVector& v, const std::string& key);

// Full catalog of tracked nutrient keys (macros, sub-macros, minerals,
// vitamins) in display order.
const std::vector<std::string>& known_nutrient_keys();

// Nutrients where less is better (sodium, saturated/trans fat, added sugar).
bool is_minimize_nutrient(const std::string& key);

// "iron_mg" -> "Iron", "vitamin_b12_ug" -> "Vitamin B12".
std::string nutrient_display_name(const std::string& key);
// "iron_mg" -> "mg", "calories" -> "kcal".
std::string nutrient_unit(const std::string& key);

} // namespace larder
