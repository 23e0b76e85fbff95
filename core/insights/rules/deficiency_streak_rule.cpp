#include "insights/rules/deficiency_streak_rule.h"

#include "nutrients/nutrient_vector.h"

#include <algorithm>
#include <stdexcept>

namespace larder {

DeficiencyStreakRule::DeficiencyStreakRule(std::string nutrient, double fraction,
                                           int min_days, int high_days,
                                           double default_target)
    : nutrient_(std::move(nutrient)), fraction_(fraction), min_days_(min_days),
      high_days_(high_days), default_target_(default_target) {
    if (fraction_ <= 0.0 || min_days_ < 1 || high_days_ < min_days_) {
        throw std::invalid_argument("invalid deficiency streak thresholds");
    }
}

std::string DeficiencyStreakRule::key() const {
    // "iron_mg" -> "iron_low_streak", "vitamin_d_ug" -> "vitamin_d_low_streak"
    auto cut = nutrient_.rfind('_');
    auto base = cut == std::string::npos ? nutrient_ : nutrient_.substr(0, cut);
    return base + "_low_streak";
}

std::vector<Insight> DeficiencyStreakRule::evaluate(const AnalyticsWindow& window) {
    if (window.empty()) {
        return {};
    }

    auto series = window.series_for(nutrient_, default_target_);
    double fraction = fraction_;
    auto streak = TrendAnalyzer::detect_nutrient_streaks(
        nutrient_, series,
        [fraction](double value, double target) { return value < target * fraction; });

    if (streak.current_streak < min_days_) {
        return {};
    }

    double deficit_sum = 0.0;
    for (std::size_t i = series.size() - static_cast<std::size_t>(streak.current_streak);
         i < series.size(); ++i) {
        deficit_sum += std::max(0.0, series[i].target.value_or(0.0) - series[i].value);
    }
    double avg_deficit = deficit_sum / streak.current_streak;

    const auto unit = nutrient_unit(nutrient_);
    const auto name = nutrient_display_name(nutrient_);

    Insight insight;
    insight.key = key();
    insight.subject = nutrient_;
    insight.range = window.range();
    insight.id = make_insight_id(insight.key, insight.subject, insight.range.end);
    insight.severity = streak.current_streak >= high_days_ ? InsightSeverity::HIGH
                                                           : InsightSeverity::WARN;
    insight.priority = priority();
    insight.message = name + " intake has been consistently low for " +
                      std::to_string(streak.current_streak) + " days. Average deficit: " +
                      format_number(avg_deficit, 1) + unit + " daily.";
    insight.details = {
        {"streak_length", streak.current_streak},
        {"avg_deficit", avg_deficit},
        {"recommendations", nlohmann::json::array({
            "Include foods rich in " + name + " at most meals",
            "Review whether logged portions reflect what was eaten",
            "Consider consulting a healthcare provider if this continues"
        })}
    };
    return {insight};
}

} // namespace larder
