#include "insights/insight_engine.h"

#include "insights/rules/deficiency_streak_rule.h"
#include "insights/rules/fiber_low_rule.h"
#include "insights/rules/macro_imbalance_rule.h"
#include "insights/rules/sodium_trend_rule.h"
#include "insights/rules/trend_opportunity_rule.h"
#include "insights/rules/weekend_pattern_rule.h"
#include "logging/logger.h"

#include <algorithm>
#include <set>
#include <stdexcept>
#include <utility>

namespace larder {

InsightEngine::InsightEngine(Logger* logger)
    : logger_(logger) {}

void InsightEngine::add_rule(std::unique_ptr<IInsightRule> rule) {
    rules_.push_back(std::move(rule));
}

std::vector<Insight> InsightEngine::evaluate(const AnalyticsWindow& window) {
    if (window.size() < 2) {
        return {};
    }

    std::vector<Insight> insights;
    std::set<std::pair<std::string, std::string>> seen;

    for (const auto& rule : rules_) {
        std::vector<Insight> found;
        try {
            found = rule->evaluate(window);
        } catch (const std::exception& e) {
            if (logger_) {
                logger_->log_rule_error(rule->key(), e.what());
            }
            continue;
        }

        for (auto& insight : found) {
            if (seen.insert({insight.key, insight.subject}).second) {
                insights.push_back(std::move(insight));
            }
        }
    }

    std::stable_sort(insights.begin(), insights.end(),
                     [](const Insight& a, const Insight& b) {
                         if (a.severity != b.severity) {
                             return severity_rank(a.severity) > severity_rank(b.severity);
                         }
                         return a.priority < b.priority;
                     });

    if (logger_) {
        for (const auto& insight : insights) {
            logger_->log_insight(insight);
        }
    }

    return insights;
}

void register_default_rules(InsightEngine& engine, const InsightThresholds& thresholds,
                            std::size_t trend_window) {
    const auto& t = thresholds;
    engine.add_rule(std::make_unique<DeficiencyStreakRule>(
        t.deficiency_nutrient, t.deficiency_fraction, t.deficiency_min_days,
        t.deficiency_high_days, t.deficiency_default_target));
    engine.add_rule(std::make_unique<MacroImbalanceRule>(t));
    engine.add_rule(std::make_unique<WeekendPatternRule>(
        t.weekend_threshold_percent, t.weekend_warn_percent));
    engine.add_rule(std::make_unique<FiberLowRule>(t.fiber_target));
    engine.add_rule(std::make_unique<SodiumTrendRule>(t.sodium_limit));
    engine.add_rule(std::make_unique<TrendOpportunityRule>(t.trend_nutrients, trend_window));
}

} // namespace larder
