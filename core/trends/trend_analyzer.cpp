#include "trends/trend_analyzer.h"

#include "nutrients/nutrient_vector.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <stdexcept>

namespace larder {

namespace {

// Correlations weaker than this are not treated as a trend.
constexpr double kMinCorrelation = 0.3;

double percent_of_target(const SeriesPoint& p) {
    double target = p.target.value_or(0.0);
    if (target == 0.0) {
        return p.value == 0.0 ? 100.0 : 0.0;
    }
    return p.value / target * 100.0;
}

std::string format_percent(double value) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f", value);
    return buf;
}

} // namespace

const char* to_string(StreakCondition condition) {
    switch (condition) {
        case StreakCondition::MEETING_GOAL:   return "meeting_goal";
        case StreakCondition::EXCEEDING_GOAL: return "exceeding_goal";
        case StreakCondition::UNDER_GOAL:     return "under_goal";
        case StreakCondition::CUSTOM:         return "custom";
    }
    return "custom";
}

const char* to_string(OpportunityKind kind) {
    switch (kind) {
        case OpportunityKind::INCREASE_INTAKE:     return "increase_intake";
        case OpportunityKind::DECREASE_INTAKE:     return "decrease_intake";
        case OpportunityKind::IMPROVE_CONSISTENCY: return "improve_consistency";
    }
    return "increase_intake";
}

const char* to_string(OpportunityPriority priority) {
    switch (priority) {
        case OpportunityPriority::HIGH:   return "high";
        case OpportunityPriority::MEDIUM: return "medium";
        case OpportunityPriority::LOW:    return "low";
    }
    return "low";
}

TrendAnalyzer::TrendAnalyzer(std::size_t window_size)
    : window_size_(window_size) {
    if (window_size_ == 0) {
        throw std::invalid_argument("trend window size must be > 0");
    }
}

TrendResult TrendAnalyzer::calculate_trend(const std::string& nutrient,
                                           std::vector<SeriesPoint> series) const {
    if (series.empty()) {
        throw std::invalid_argument("cannot calculate trend for " + nutrient +
                                    " with empty data");
    }

    std::stable_sort(series.begin(), series.end(),
                     [](const SeriesPoint& a, const SeriesPoint& b) {
                         return a.date < b.date;
                     });

    auto smoothed = calculate_rolling_averages(series, window_size_);

    TrendResult result;
    result.nutrient = nutrient;
    result.trend = determine_trend_direction(smoothed);
    result.change_percent = calculate_percentage_change(smoothed);
    result.values = std::move(series);
    return result;
}

std::vector<SeriesPoint> TrendAnalyzer::calculate_rolling_averages(
    const std::vector<SeriesPoint>& series, std::size_t window_size) {

    if (window_size == 0) {
        throw std::invalid_argument("rolling window size must be > 0");
    }
    if (series.size() < window_size) {
        return series;
    }

    std::vector<SeriesPoint> result;
    result.reserve(series.size() - window_size + 1);

    for (std::size_t i = window_size - 1; i < series.size(); ++i) {
        double value_sum = 0.0;
        double target_sum = 0.0;
        for (std::size_t j = i + 1 - window_size; j <= i; ++j) {
            value_sum += series[j].value;
            target_sum += series[j].target.value_or(0.0);
        }

        SeriesPoint point;
        point.date = series[i].date;
        point.value = value_sum / static_cast<double>(window_size);
        double avg_target = target_sum / static_cast<double>(window_size);
        if (avg_target > 0.0) {
            point.target = avg_target;
        }
        result.push_back(point);
    }

    return result;
}

TrendDirection TrendAnalyzer::determine_trend_direction(
    const std::vector<SeriesPoint>& series) {

    if (series.size() < 2) {
        return TrendDirection::STABLE;
    }

    const double n = static_cast<double>(series.size());
    double sum_x = 0.0;
    double sum_y = 0.0;
    double sum_xy = 0.0;
    double sum_x2 = 0.0;

    for (std::size_t i = 0; i < series.size(); ++i) {
        double x = static_cast<double>(i);
        double y = series[i].value;
        sum_x += x;
        sum_y += y;
        sum_xy += x * y;
        sum_x2 += x * x;
    }

    double slope = (n * sum_xy - sum_x * sum_y) / (n * sum_x2 - sum_x * sum_x);

    double mean_x = sum_x / n;
    double mean_y = sum_y / n;
    double numerator = 0.0;
    double denom_x = 0.0;
    double denom_y = 0.0;

    for (std::size_t i = 0; i < series.size(); ++i) {
        double dx = static_cast<double>(i) - mean_x;
        double dy = series[i].value - mean_y;
        numerator += dx * dy;
        denom_x += dx * dx;
        denom_y += dy * dy;
    }

    // A flat series has no defined correlation.
    if (denom_x == 0.0 || denom_y == 0.0) {
        return TrendDirection::STABLE;
    }

    double correlation = numerator / std::sqrt(denom_x * denom_y);
    if (!std::isfinite(correlation) || std::abs(correlation) < kMinCorrelation) {
        return TrendDirection::STABLE;
    }

    return slope > 0.0 ? TrendDirection::INCREASING : TrendDirection::DECREASING;
}

double TrendAnalyzer::calculate_percentage_change(const std::vector<SeriesPoint>& series) {
    if (series.size() < 2) {
        return 0.0;
    }

    double first = series.front().value;
    double last = series.back().value;

    if (first == 0.0) {
        return last > 0.0 ? 100.0 : 0.0;
    }

    double change = (last - first) / first * 100.0;
    return std::isfinite(change) ? change : 0.0;
}

TrendDirection TrendAnalyzer::compare_recent_periods(const std::vector<SeriesPoint>& series,
                                                     std::size_t window_size) {
    if (window_size == 0 || series.size() <= window_size) {
        return TrendDirection::STABLE;
    }

    auto mean_of = [&](std::size_t begin, std::size_t end) {
        double sum = 0.0;
        for (std::size_t i = begin; i < end; ++i) {
            sum += series[i].value;
        }
        return sum / static_cast<double>(end - begin);
    };

    std::size_t n = series.size();
    double recent = mean_of(n - window_size, n);
    std::size_t earlier_begin = n >= 2 * window_size ? n - 2 * window_size : 0;
    double earlier = mean_of(earlier_begin, n - window_size);

    if (earlier == 0.0) {
        return recent > 0.0 ? TrendDirection::INCREASING : TrendDirection::STABLE;
    }

    double change = (recent - earlier) / earlier * 100.0;
    if (std::abs(change) < 5.0) {
        return TrendDirection::STABLE;
    }
    return change > 0.0 ? TrendDirection::INCREASING : TrendDirection::DECREASING;
}

StreakRecord TrendAnalyzer::detect_nutrient_streaks(const std::string& nutrient,
                                                    const std::vector<SeriesPoint>& series,
                                                    StreakCondition condition) {
    StreakPredicate predicate;
    switch (condition) {
        case StreakCondition::MEETING_GOAL:
            predicate = [](double v, double t) { return v >= t; };
            break;
        case StreakCondition::EXCEEDING_GOAL:
            predicate = [](double v, double t) { return v >= t * 1.1; };
            break;
        case StreakCondition::UNDER_GOAL:
            predicate = [](double v, double t) { return v < t * 0.9; };
            break;
        case StreakCondition::CUSTOM:
            throw std::invalid_argument("CUSTOM streaks need an explicit predicate");
    }
    return detect_nutrient_streaks(nutrient, series, predicate, condition);
}

StreakRecord TrendAnalyzer::detect_nutrient_streaks(const std::string& nutrient,
                                                    const std::vector<SeriesPoint>& series,
                                                    const StreakPredicate& predicate,
                                                    StreakCondition tag) {
    StreakRecord record;
    record.nutrient = nutrient;
    record.condition = tag;

    if (series.empty()) {
        return record;
    }

    int run = 0;
    bool touching_latest = true;
    bool recent_closed = false;
    std::size_t recent_first = 0;
    std::size_t recent_last = 0;
    bool have_recent = false;

    // Single backward pass: the first run met is the most recent one.
    for (std::size_t k = series.size(); k-- > 0;) {
        const auto& p = series[k];
        if (predicate(p.value, p.target.value_or(0.0))) {
            if (run == 0 && !have_recent) {
                recent_last = k;
                have_recent = true;
            }
            ++run;
            record.max_streak = std::max(record.max_streak, run);
            continue;
        }

        if (touching_latest) {
            record.current_streak = run;
            touching_latest = false;
        }
        if (run > 0 && !recent_closed) {
            recent_first = k + 1;
            recent_closed = true;
        }
        run = 0;
    }

    if (touching_latest) {
        record.current_streak = run;
    }
    if (have_recent && !recent_closed) {
        recent_first = 0;
    }

    record.is_active = record.current_streak > 0;

    if (have_recent) {
        record.streak_start = series[recent_first].date;
        record.streak_end = series[recent_last].date;

        double value_sum = 0.0;
        double target_sum = 0.0;
        for (std::size_t k = recent_first; k <= recent_last; ++k) {
            value_sum += series[k].value;
            target_sum += series[k].target.value_or(0.0);
        }
        double count = static_cast<double>(recent_last - recent_first + 1);
        record.average_value = value_sum / count;
        record.average_target = target_sum / count;
    }

    return record;
}

double TrendAnalyzer::calculate_consistency_score(const std::vector<SeriesPoint>& series) {
    if (series.empty()) {
        return 0.0;
    }

    std::vector<double> percentages;
    percentages.reserve(series.size());
    for (const auto& p : series) {
        percentages.push_back(percent_of_target(p));
    }

    double mean = 0.0;
    for (double pct : percentages) {
        mean += pct;
    }
    mean /= static_cast<double>(percentages.size());

    double variance = 0.0;
    for (double pct : percentages) {
        variance += (pct - mean) * (pct - mean);
    }
    variance /= static_cast<double>(percentages.size());

    double cv = mean > 0.0 ? std::sqrt(variance) / mean : 1.0;
    return std::clamp(100.0 - cv * 100.0, 0.0, 100.0);
}

std::vector<ImprovementOpportunity> TrendAnalyzer::identify_improvement_opportunities(
    const std::vector<TrendResult>& trends) const {

    std::vector<ImprovementOpportunity> opportunities;

    for (const auto& trend : trends) {
        std::size_t n = trend.values.size();
        std::size_t begin = n > window_size_ ? n - window_size_ : 0;

        std::vector<SeriesPoint> targeted;
        double adherence_sum = 0.0;
        for (std::size_t i = begin; i < n; ++i) {
            const auto& p = trend.values[i];
            if (p.target && *p.target > 0.0) {
                adherence_sum += p.value / *p.target * 100.0;
                targeted.push_back(p);
            }
        }
        // Nothing to measure against.
        if (targeted.empty()) {
            continue;
        }

        ImprovementOpportunity op;
        op.nutrient = trend.nutrient;
        op.average_adherence = adherence_sum / static_cast<double>(targeted.size());
        bool minimize = is_minimize_nutrient(trend.nutrient);

        if (!minimize && op.average_adherence < 70.0 &&
            trend.trend == TrendDirection::DECREASING) {
            op.kind = OpportunityKind::INCREASE_INTAKE;
            op.priority = OpportunityPriority::HIGH;
            op.reasoning = nutrient_display_name(trend.nutrient) +
                           " intake is declining and below target (" +
                           format_percent(op.average_adherence) + "% of goal)";
            opportunities.push_back(op);
        } else if (minimize && op.average_adherence > 130.0 &&
                   trend.trend == TrendDirection::INCREASING) {
            op.kind = OpportunityKind::DECREASE_INTAKE;
            op.priority = OpportunityPriority::MEDIUM;
            op.reasoning = nutrient_display_name(trend.nutrient) +
                           " intake is increasing and above recommended limits (" +
                           format_percent(op.average_adherence) + "% of limit)";
            opportunities.push_back(op);
        } else if (trend.trend == TrendDirection::STABLE &&
                   std::abs(trend.change_percent) < 5.0) {
            op.consistency = calculate_consistency_score(targeted);
            if (op.consistency < 60.0) {
                op.kind = OpportunityKind::IMPROVE_CONSISTENCY;
                op.priority = OpportunityPriority::LOW;
                op.reasoning = nutrient_display_name(trend.nutrient) +
                               " intake varies significantly day-to-day (consistency score: " +
                               format_percent(op.consistency) + "%)";
                opportunities.push_back(op);
            }
        }
    }

    std::stable_sort(opportunities.begin(), opportunities.end(),
                     [](const ImprovementOpportunity& a, const ImprovementOpportunity& b) {
                         return static_cast<int>(a.priority) < static_cast<int>(b.priority);
                     });
    return opportunities;
}

} // namespace larder
