#include "insights/rules/macro_imbalance_rule.h"

#include "nutrients/adherence.h"

namespace larder {

namespace {

constexpr std::size_t kDaysRequired = 7;

} // namespace

MacroImbalanceRule::MacroImbalanceRule(const InsightThresholds& thresholds)
    : thresholds_(thresholds) {}

std::vector<Insight> MacroImbalanceRule::evaluate(const AnalyticsWindow& window) {
    if (window.size() < kDaysRequired) {
        return {};
    }

    auto week = window.last(kDaysRequired);
    double protein = 0.0;
    double carbs = 0.0;
    double fat = 0.0;
    for (const auto& day : week) {
        auto balance = calculate_macro_balance(day.nutrients);
        protein += balance.protein_percent;
        carbs += balance.carbs_percent;
        fat += balance.fat_percent;
    }
    const double n = static_cast<double>(week.size());
    protein /= n;
    carbs /= n;
    fat /= n;

    const auto& t = thresholds_;
    bool out_of_band = protein < t.protein_min || protein > t.protein_max ||
                       carbs < t.carbs_min || carbs > t.carbs_max ||
                       fat < t.fat_min || fat > t.fat_max;
    if (!out_of_band) {
        return {};
    }

    // Far outside the bands.
    bool severe = protein < t.protein_min / 2.0 || protein > t.protein_max + 5.0 ||
                  carbs < t.carbs_min / 2.0 || carbs > t.carbs_max + 10.0;

    auto recommendations = nlohmann::json::array();
    if (protein < t.protein_min + 5.0) {
        recommendations.push_back("Increase protein intake with lean meats, legumes, or protein powder");
    }
    if (protein > t.protein_max) {
        recommendations.push_back("Replace some protein with whole-food carbohydrates or healthy fats");
    }
    if (carbs > t.carbs_max - 5.0) {
        recommendations.push_back("Consider reducing refined carbohydrates");
    }
    if (carbs < t.carbs_min) {
        recommendations.push_back("Add whole grains, fruit, or starchy vegetables");
    }
    if (fat < t.fat_min + 5.0) {
        recommendations.push_back("Include healthy fats like avocado, nuts, and olive oil");
    }
    if (fat > t.fat_max) {
        recommendations.push_back("Choose leaner cooking methods and fewer fried foods");
    }

    Insight insight;
    insight.key = key();
    insight.subject = "macros";
    insight.range = DateRange{week.front().date, week.back().date};
    insight.id = make_insight_id(insight.key, insight.subject, insight.range.end);
    insight.severity = severe ? InsightSeverity::HIGH : InsightSeverity::WARN;
    insight.priority = priority();
    insight.message = "Macro balance may need adjustment. Current averages: " +
                      format_number(protein, 1) + "% protein, " +
                      format_number(carbs, 1) + "% carbs, " +
                      format_number(fat, 1) + "% fat.";
    insight.details = {
        {"protein_percent", protein},
        {"carbs_percent", carbs},
        {"fat_percent", fat},
        {"recommendations", recommendations}
    };
    return {insight};
}

} // namespace larder
