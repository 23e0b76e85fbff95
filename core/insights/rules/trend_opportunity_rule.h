#pragma once

#include "insights/insight_rule.h"
#include "trends/trend_analyzer.h"

#include <string>
#include <vector>

namespace larder {

// Runs the trend analyzer over each tracked nutrient and turns every
// improvement opportunity it finds into an insight.
class TrendOpportunityRule : public IInsightRule {
public:
    TrendOpportunityRule(std::vector<std::string> nutrients, std::size_t window_size = 7);

    std::vector<Insight> evaluate(const AnalyticsWindow& window) override;
    std::string key() const override { return "trend_opportunity"; }
    int priority() const override { return 4; }

private:
    std::vector<std::string> nutrients_;
    TrendAnalyzer analyzer_;
};

} // namespace larder
