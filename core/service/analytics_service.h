#pragma once

#include "calendar/date.h"
#include "config/analytics_config.h"
#include "insights/analytics_window.h"
#include "insights/insight.h"
#include "insights/insight_engine.h"
#include "rollup/rollup_aggregator.h"
#include "storage/repository.h"
#include "targets/macro_calculator.h"
#include "targets/target_resolver.h"
#include "trends/trend_analyzer.h"

#include <atomic>
#include <string>
#include <vector>

namespace larder {

class Logger;

struct ServiceClocks {
    RollupAggregator::Clock rollup;   // stamps computed_at
    TargetCache::Clock cache;         // drives target cache expiry
};

// Query surface over the analytics core. Callers invoke it synchronously per
// request; every method is safe to call from several threads.
class AnalyticsService {
public:
    AnalyticsService(IRawIntakeRepository& intake, ISummaryRepository& summaries,
                     IGoalLayerRepository& layers, IProfileRepository& profiles,
                     const IMacroCalculator& calculator,
                     AnalyticsConfig config = {}, Logger* logger = nullptr,
                     ServiceClocks clocks = {});

    // Daily rows in range joined with each day's resolved targets. Days
    // whose targets cannot be resolved carry empty targets.
    AnalyticsWindow build_window(const std::string& user_id, const DateRange& range);

    // One result per nutrient; empty when the range has no daily rows.
    std::vector<TrendResult> compute_trends(const std::string& user_id, const DateRange& range,
                                            const std::vector<std::string>& nutrient_keys);

    std::vector<StreakRecord> compute_streaks(const std::string& user_id, const DateRange& range,
                                              const std::vector<std::string>& nutrient_keys,
                                              StreakCondition condition);

    std::vector<Insight> evaluate_insights(const std::string& user_id, const DateRange& range);

    TargetVector resolve_target(const std::string& user_id, const Date& date);

    RollupStatus run_daily_rollup(const std::string& user_id, const Date& date);
    RollupStatus run_weekly_rollup(const std::string& user_id, int iso_year, int iso_week);
    RollupStatus run_monthly_rollup(const std::string& user_id, int year, int month);

    BackfillReport backfill(const std::string& user_id, const DateRange& range,
                            const std::atomic<bool>* cancel = nullptr);

    // Stored weekly rows for the `weeks` ISO weeks ending with the one
    // holding as_of, oldest first. Weeks without a row are left out.
    std::vector<WeeklySummary> weekly_averages(const std::string& user_id, const Date& as_of,
                                               int weeks);

    const AnalyticsConfig& config() const { return config_; }
    TargetResolver& resolver() { return resolver_; }

private:
    ISummaryRepository& summaries_;
    AnalyticsConfig config_;
    Logger* logger_;
    TargetResolver resolver_;
    RollupAggregator rollups_;
    TrendAnalyzer analyzer_;
};

} // namespace larder
