#include "nutrients/nutrient_vector.h"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace larder {

namespace {

// Treats NaN, infinities and negatives from malformed history as absent.
double sanitized(double value) {
    if (!std::isfinite(value) || value < 0.0) {
        return 0.0;
    }
    return value;
}

bool has_suffix(const std::string& s, const std::string& suffix) {
    return s.size() > suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

double round2(double value) {
    return std::round(value * 100.0) / 100.0;
}

NutrientVector merge(const NutrientVector& a, const NutrientVector& b) {
    NutrientVector result;

    for (const auto& [key, value] : a) {
        double v = sanitized(value);
        if (v > 0.0) {
            result[key] = v;
        }
    }

    for (const auto& [key, value] : b) {
        double v = sanitized(value);
        if (v > 0.0) {
            result[key] += v;
        }
    }

    for (auto& [key, value] : result) {
        value = round2(value);
    }
    return result;
}

NutrientVector scale(const NutrientVector& v, double factor) {
    NutrientVector result;
    if (!(factor > 0.0) || !std::isfinite(factor)) {
        return result;
    }

    for (const auto& [key, value] : v) {
        double scaled = round2(sanitized(value) * factor);
        if (scaled > 0.0) {
            result[key] = scaled;
        }
    }
    return result;
}

NutrientVector accumulate(const std::vector<NutrientVector>& vectors) {
    NutrientVector total;
    for (const auto& v : vectors) {
        total = merge(total, v);
    }
    return total;
}

double amount_of(const NutrientVector& v, const std::string& key) {
    auto it = v.find(key);
    if (it == v.end()) {
        return 0.0;
    }
    return sanitized(it->second);
}

const std::vector<std::string>& known_nutrient_keys() {
    static const std::vector<std::string> keys = {
        // Core macros
        "calories", "protein_g", "carbs_g", "fat_g", "fiber_g",
        // Sub-macros
        "saturated_fat_g", "monounsaturated_fat_g", "polyunsaturated_fat_g",
        "trans_fat_g", "cholesterol_mg", "total_sugars_g", "added_sugars_g",
        // Minerals
        "sodium_mg", "potassium_mg", "calcium_mg", "iron_mg", "magnesium_mg",
        "zinc_mg", "phosphorus_mg", "copper_mg", "manganese_mg", "selenium_ug",
        // Vitamins
        "vitamin_a_ug", "vitamin_c_mg", "vitamin_d_ug", "vitamin_e_mg",
        "vitamin_k_ug", "thiamin_b1_mg", "riboflavin_b2_mg", "niacin_b3_mg",
        "vitamin_b6_mg", "folate_b9_ug", "vitamin_b12_ug",
        "pantothenic_acid_b5_mg", "choline_mg",
    };
    return keys;
}

bool is_minimize_nutrient(const std::string& key) {
    return key == "sodium_mg" || key == "saturated_fat_g" ||
           key == "trans_fat_g" || key == "added_sugars_g";
}

std::string nutrient_display_name(const std::string& key) {
    std::string base = key;
    for (const char* suffix : {"_mg", "_ug", "_g"}) {
        if (has_suffix(base, suffix)) {
            base.erase(base.size() - std::char_traits<char>::length(suffix));
            break;
        }
    }

    std::string name;
    std::size_t pos = 0;
    while (pos <= base.size()) {
        std::size_t next = base.find('_', pos);
        if (next == std::string::npos) {
            next = base.size();
        }
        std::string word = base.substr(pos, next - pos);
        pos = next + 1;
        if (word.empty()) {
            continue;
        }

        bool letter_tag = std::isalpha(static_cast<unsigned char>(word[0])) &&
                          std::all_of(word.begin() + 1, word.end(), [](char c) {
                              return std::isdigit(static_cast<unsigned char>(c));
                          });
        // Vitamin letters and B-complex tags: "c" -> "C", "b12" -> "B12"
        if (name.empty() || letter_tag) {
            word[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(word[0])));
        }

        if (!name.empty()) {
            name += ' ';
        }
        name += word;
    }
    return name;
}

std::string nutrient_unit(const std::string& key) {
    if (key == "calories") return "kcal";
    if (has_suffix(key, "_mg")) return "mg";
    if (has_suffix(key, "_ug")) return "ug";
    if (has_suffix(key, "_g")) return "g";
    return "";
}

} // namespace larder
