#include "insights/rules/weekend_pattern_rule.h"

#include "nutrients/nutrient_vector.h"

#include <cmath>

namespace larder {

namespace {

constexpr std::size_t kMinDays = 14;
constexpr int kMinWeekendDays = 4;
constexpr int kMinWeekdays = 8;

} // namespace

WeekendPatternRule::WeekendPatternRule(double threshold_percent, double warn_percent)
    : threshold_percent_(threshold_percent), warn_percent_(warn_percent) {}

std::vector<Insight> WeekendPatternRule::evaluate(const AnalyticsWindow& window) {
    if (window.size() < kMinDays) {
        return {};
    }

    double weekend_sum = 0.0;
    double weekday_sum = 0.0;
    int weekend_days = 0;
    int weekdays = 0;

    for (const auto& day : window.days()) {
        double calories = amount_of(day.nutrients, "calories");
        if (day.date.is_weekend()) {
            weekend_sum += calories;
            ++weekend_days;
        } else {
            weekday_sum += calories;
            ++weekdays;
        }
    }

    if (weekend_days < kMinWeekendDays || weekdays < kMinWeekdays) {
        return {};
    }

    double weekend_avg = weekend_sum / weekend_days;
    double weekday_avg = weekday_sum / weekdays;
    if (weekday_avg <= 0.0) {
        return {};
    }

    double percent_diff = (weekend_avg - weekday_avg) / weekday_avg * 100.0;
    if (std::abs(percent_diff) <= threshold_percent_) {
        return {};
    }

    Insight insight;
    insight.key = key();
    insight.subject = "calories";
    insight.range = window.range();
    insight.id = make_insight_id(insight.key, insight.subject, insight.range.end);
    insight.severity = std::abs(percent_diff) > warn_percent_ ? InsightSeverity::WARN
                                                             : InsightSeverity::INFO;
    insight.priority = priority();
    insight.message = std::string("Weekend eating differs significantly from weekdays. ") +
                      (percent_diff > 0.0 ? "Higher" : "Lower") +
                      " weekend intake by " + format_number(std::abs(percent_diff), 1) + "%.";
    insight.details = {
        {"weekend_avg_calories", weekend_avg},
        {"weekday_avg_calories", weekday_avg},
        {"percent_diff", percent_diff},
        {"recommendations", nlohmann::json::array({
            "Consider meal planning for weekends",
            "Be mindful of social eating situations",
            "Maintain consistent eating patterns across the week"
        })}
    };
    return {insight};
}

} // namespace larder
