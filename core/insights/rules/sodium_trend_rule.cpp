#include "insights/rules/sodium_trend_rule.h"

#include "trends/trend_analyzer.h"

namespace larder {

namespace {

constexpr std::size_t kWeek = 7;
constexpr std::size_t kTrendDays = 14;

} // namespace

SodiumTrendRule::SodiumTrendRule(double sodium_limit)
    : sodium_limit_(sodium_limit) {}

std::vector<Insight> SodiumTrendRule::evaluate(const AnalyticsWindow& window) {
    if (window.size() < kWeek) {
        return {};
    }

    auto series = window.series_for("sodium_mg");
    std::vector<SeriesPoint> recent_span(
        series.size() > kTrendDays ? series.end() - kTrendDays : series.begin(),
        series.end());

    auto direction = TrendAnalyzer::compare_recent_periods(recent_span, kWeek);

    double sum = 0.0;
    for (std::size_t i = series.size() - kWeek; i < series.size(); ++i) {
        sum += series[i].value;
    }
    double recent_avg = sum / static_cast<double>(kWeek);

    if (direction != TrendDirection::INCREASING || recent_avg <= sodium_limit_) {
        return {};
    }

    Insight insight;
    insight.key = key();
    insight.subject = "sodium_mg";
    insight.range = DateRange{recent_span.front().date, recent_span.back().date};
    insight.id = make_insight_id(insight.key, insight.subject, insight.range.end);
    insight.severity = recent_avg > sodium_limit_ * 1.5 ? InsightSeverity::HIGH
                                                       : InsightSeverity::WARN;
    insight.priority = priority();
    insight.message = "Sodium intake is trending upward and exceeds recommended limits. "
                      "Recent average: " + format_number(recent_avg, 0) + "mg daily.";
    insight.details = {
        {"recent_avg", recent_avg},
        {"limit", sodium_limit_},
        {"excess", recent_avg - sodium_limit_},
        {"recommendations", nlohmann::json::array({
            "Reduce processed and packaged foods",
            "Cook more meals at home",
            "Use herbs and spices instead of salt for flavor",
            "Read nutrition labels carefully"
        })}
    };
    return {insight};
}

} // namespace larder
