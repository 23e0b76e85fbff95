#pragma once

#include "insights/analytics_window.h"
#include "insights/insight.h"
#include "insights/insight_rule.h"
#include "insights/insight_thresholds.h"

#include <memory>
#include <string>
#include <vector>

namespace larder {

class Logger;

class InsightEngine {
public:
    explicit InsightEngine(Logger* logger = nullptr);

    void add_rule(std::unique_ptr<IInsightRule> rule);

    // Runs every rule over the window. A rule that throws is logged and
    // skipped. Output keeps one insight per (key, subject), ordered by
    // severity (high first) and then rule priority. Windows with fewer than
    // two days produce nothing.
    std::vector<Insight> evaluate(const AnalyticsWindow& window);

    std::size_t rule_count() const { return rules_.size(); }

private:
    std::vector<std::unique_ptr<IInsightRule>> rules_;
    Logger* logger_;
};

// Installs the built-in rule catalog.
void register_default_rules(InsightEngine& engine, const InsightThresholds& thresholds,
                            std::size_t trend_window = 7);

} // namespace larder
