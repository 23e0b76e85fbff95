#pragma once

#include "insights/insight_rule.h"

#include <string>

namespace larder {

// Fires when a nutrient has stayed under a fraction of its target for the
// most recent N consecutive days.
class DeficiencyStreakRule : public IInsightRule {
public:
    DeficiencyStreakRule(std::string nutrient, double fraction, int min_days,
                         int high_days, double default_target);

    std::vector<Insight> evaluate(const AnalyticsWindow& window) override;
    std::string key() const override;
    int priority() const override { return 1; }

private:
    std::string nutrient_;
    double fraction_;
    int min_days_;
    int high_days_;
    double default_target_;
};

} // namespace larder
