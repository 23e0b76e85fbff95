#pragma once

#include "insights/insight_rule.h"

namespace larder {

// Sodium trending upward over the latest two weeks with the latest 7-day
// mean above the limit.
class SodiumTrendRule : public IInsightRule {
public:
    explicit SodiumTrendRule(double sodium_limit);

    std::vector<Insight> evaluate(const AnalyticsWindow& window) override;
    std::string key() const override { return "sodium_high_trend"; }
    int priority() const override { return 1; }

private:
    double sodium_limit_;
};

} // namespace larder
