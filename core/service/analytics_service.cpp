#include "service/analytics_service.h"

#include "logging/logger.h"
#include "nutrients/adherence.h"

#include <stdexcept>

namespace larder {

AnalyticsService::AnalyticsService(IRawIntakeRepository& intake, ISummaryRepository& summaries,
                                   IGoalLayerRepository& layers, IProfileRepository& profiles,
                                   const IMacroCalculator& calculator,
                                   AnalyticsConfig config, Logger* logger,
                                   ServiceClocks clocks)
    : summaries_(summaries),
      config_(std::move(config)),
      logger_(logger),
      resolver_(layers, profiles, calculator,
                std::chrono::seconds(config_.target_cache_ttl_s), logger,
                std::move(clocks.cache)),
      rollups_(intake, summaries, logger, std::move(clocks.rollup)),
      analyzer_(config_.rolling_window) {}

AnalyticsWindow AnalyticsService::build_window(const std::string& user_id,
                                               const DateRange& range) {
    if (range.end < range.start) {
        throw std::invalid_argument("range end precedes start");
    }

    AnalyticsWindow window;

    for (const auto& row : summaries_.find_daily_range(user_id, range.start, range.end)) {
        if (row.entry_count <= 0) {
            continue;
        }

        AnalyticsDay day;
        day.date = row.date;
        day.nutrients = row.nutrients;
        day.entry_count = row.entry_count;

        try {
            day.targets = resolver_.resolve(user_id, row.date).as_nutrients();
            day.targets.emplace("sodium_mg", config_.insights.sodium_limit);
        } catch (const TargetResolutionError& e) {
            if (logger_) {
                logger_->log_target_fallback(user_id, row.date, e.what());
            }
        }

        day.adherence = calculate_adherence(day.nutrients, day.targets, config_.adherence_keys);
        window.push(day);
    }

    return window;
}

std::vector<TrendResult> AnalyticsService::compute_trends(
    const std::string& user_id, const DateRange& range,
    const std::vector<std::string>& nutrient_keys) {

    auto window = build_window(user_id, range);
    if (window.empty()) {
        return {};
    }

    std::vector<TrendResult> trends;
    trends.reserve(nutrient_keys.size());
    for (const auto& key : nutrient_keys) {
        trends.push_back(analyzer_.calculate_trend(key, window.series_for(key)));
    }
    return trends;
}

std::vector<StreakRecord> AnalyticsService::compute_streaks(
    const std::string& user_id, const DateRange& range,
    const std::vector<std::string>& nutrient_keys, StreakCondition condition) {

    auto window = build_window(user_id, range);

    std::vector<StreakRecord> streaks;
    streaks.reserve(nutrient_keys.size());
    for (const auto& key : nutrient_keys) {
        streaks.push_back(
            TrendAnalyzer::detect_nutrient_streaks(key, window.series_for(key), condition));
    }
    return streaks;
}

std::vector<Insight> AnalyticsService::evaluate_insights(const std::string& user_id,
                                                         const DateRange& range) {
    auto window = build_window(user_id, range);

    InsightEngine engine(logger_);
    register_default_rules(engine, config_.insights, config_.rolling_window);
    return engine.evaluate(window);
}

TargetVector AnalyticsService::resolve_target(const std::string& user_id, const Date& date) {
    return resolver_.resolve(user_id, date);
}

RollupStatus AnalyticsService::run_daily_rollup(const std::string& user_id, const Date& date) {
    return rollups_.run_daily_rollup(user_id, date);
}

RollupStatus AnalyticsService::run_weekly_rollup(const std::string& user_id,
                                                 int iso_year, int iso_week) {
    return rollups_.run_weekly_rollup(user_id, iso_year, iso_week);
}

RollupStatus AnalyticsService::run_monthly_rollup(const std::string& user_id,
                                                  int year, int month) {
    return rollups_.run_monthly_rollup(user_id, year, month);
}

BackfillReport AnalyticsService::backfill(const std::string& user_id, const DateRange& range,
                                          const std::atomic<bool>* cancel) {
    BackfillOptions options;
    options.workers = config_.backfill_workers;
    options.cancel = cancel;
    return rollups_.backfill_user_rollups(user_id, range.start, range.end, options);
}

std::vector<WeeklySummary> AnalyticsService::weekly_averages(const std::string& user_id,
                                                             const Date& as_of, int weeks) {
    if (weeks <= 0) {
        throw std::invalid_argument("weeks must be > 0");
    }

    std::vector<WeeklySummary> result;
    for (int i = weeks - 1; i >= 0; --i) {
        auto week = iso_week_of(as_of.add_days(-7 * static_cast<std::int64_t>(i)));
        if (auto row = summaries_.get_weekly(user_id, week)) {
            result.push_back(*row);
        }
    }
    return result;
}

} // namespace larder
