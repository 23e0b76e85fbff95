#pragma once

#include "insights/insight_rule.h"

namespace larder {

// At least 5 of the latest 7 days below 60% of the fiber target.
class FiberLowRule : public IInsightRule {
public:
    explicit FiberLowRule(double fiber_target);

    std::vector<Insight> evaluate(const AnalyticsWindow& window) override;
    std::string key() const override { return "fiber_consistently_low"; }
    int priority() const override { return 2; }

private:
    double fiber_target_;
};

} // namespace larder
