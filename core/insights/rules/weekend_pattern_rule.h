#pragma once

#include "insights/insight_rule.h"

namespace larder {

// Compares mean weekend calories with mean weekday calories. Needs two full
// weeks of days so one unusual weekend cannot trigger it.
class WeekendPatternRule : public IInsightRule {
public:
    WeekendPatternRule(double threshold_percent, double warn_percent);

    std::vector<Insight> evaluate(const AnalyticsWindow& window) override;
    std::string key() const override { return "weekend_pattern"; }
    int priority() const override { return 3; }

private:
    double threshold_percent_;
    double warn_percent_;
};

} // namespace larder
