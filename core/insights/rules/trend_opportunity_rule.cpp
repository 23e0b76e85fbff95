#include "insights/rules/trend_opportunity_rule.h"

namespace larder {

namespace {

InsightSeverity severity_for(OpportunityPriority priority) {
    switch (priority) {
        case OpportunityPriority::HIGH:   return InsightSeverity::HIGH;
        case OpportunityPriority::MEDIUM: return InsightSeverity::WARN;
        case OpportunityPriority::LOW:    return InsightSeverity::INFO;
    }
    return InsightSeverity::INFO;
}

} // namespace

TrendOpportunityRule::TrendOpportunityRule(std::vector<std::string> nutrients,
                                           std::size_t window_size)
    : nutrients_(std::move(nutrients)), analyzer_(window_size) {}

std::vector<Insight> TrendOpportunityRule::evaluate(const AnalyticsWindow& window) {
    if (window.empty()) {
        return {};
    }

    std::vector<TrendResult> trends;
    trends.reserve(nutrients_.size());
    for (const auto& nutrient : nutrients_) {
        trends.push_back(analyzer_.calculate_trend(nutrient, window.series_for(nutrient)));
    }

    auto range = window.range();
    std::vector<Insight> insights;

    for (const auto& op : analyzer_.identify_improvement_opportunities(trends)) {
        Insight insight;
        insight.key = key();
        insight.subject = op.nutrient;
        insight.range = range;
        insight.id = make_insight_id(insight.key, insight.subject, range.end);
        insight.severity = severity_for(op.priority);
        insight.priority = priority();
        insight.message = op.reasoning;
        insight.details = {
            {"nutrient", op.nutrient},
            {"opportunity", to_string(op.kind)},
            {"priority", to_string(op.priority)},
            {"average_adherence", op.average_adherence},
            {"consistency", op.consistency}
        };
        insights.push_back(insight);
    }

    return insights;
}

} // namespace larder
