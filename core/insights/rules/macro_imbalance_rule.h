#pragma once

#include "insights/insight_rule.h"
#include "insights/insight_thresholds.h"

namespace larder {

// Averages the calorie share of protein/carbs/fat over the latest week and
// flags a share outside its healthy band.
class MacroImbalanceRule : public IInsightRule {
public:
    explicit MacroImbalanceRule(const InsightThresholds& thresholds);

    std::vector<Insight> evaluate(const AnalyticsWindow& window) override;
    std::string key() const override { return "macro_imbalance"; }
    int priority() const override { return 2; }

private:
    InsightThresholds thresholds_;
};

} // namespace larder
