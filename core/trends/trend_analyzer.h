#pragma once

#include "calendar/date.h"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace larder {

struct SeriesPoint {
    Date date;
    double value = 0.0;
    std::optional<double> target;
};

enum class TrendDirection {
    INCREASING,
    DECREASING,
    STABLE
};

inline const char* to_string(TrendDirection direction) {
    switch (direction) {
        case TrendDirection::INCREASING: return "increasing";
        case TrendDirection::DECREASING: return "decreasing";
        case TrendDirection::STABLE:     return "stable";
    }
    return "stable";
}

struct TrendResult {
    std::string nutrient;
    std::vector<SeriesPoint> values; // raw points, date order
    TrendDirection trend = TrendDirection::STABLE;
    double change_percent = 0.0;
};

// Explicit discriminant for the condition a streak was counted against.
enum class StreakCondition {
    MEETING_GOAL,   // value >= target
    EXCEEDING_GOAL, // value >= 1.1 * target
    UNDER_GOAL,     // value < 0.9 * target
    CUSTOM
};

const char* to_string(StreakCondition condition);

using StreakPredicate = std::function<bool(double value, double target)>;

struct StreakRecord {
    std::string nutrient;
    StreakCondition condition = StreakCondition::MEETING_GOAL;
    int current_streak = 0;      // length of the run ending at the latest point
    int max_streak = 0;
    bool is_active = false;
    std::optional<Date> streak_start; // most recent run
    std::optional<Date> streak_end;
    double average_value = 0.0;  // over the most recent run
    double average_target = 0.0;
};

enum class OpportunityKind {
    INCREASE_INTAKE,
    DECREASE_INTAKE,
    IMPROVE_CONSISTENCY
};

enum class OpportunityPriority {
    HIGH,
    MEDIUM,
    LOW
};

const char* to_string(OpportunityKind kind);
const char* to_string(OpportunityPriority priority);

struct ImprovementOpportunity {
    std::string nutrient;
    OpportunityKind kind = OpportunityKind::INCREASE_INTAKE;
    OpportunityPriority priority = OpportunityPriority::LOW;
    double average_adherence = 0.0;
    double consistency = 0.0;
    std::string reasoning;
};

// Statistical description of a single-nutrient daily series.
class TrendAnalyzer {
public:
    explicit TrendAnalyzer(std::size_t window_size = 7);

    // Sorts by date, smooths with rolling averages, then classifies the
    // smoothed series. Throws std::invalid_argument on an empty series.
    TrendResult calculate_trend(const std::string& nutrient,
                                std::vector<SeriesPoint> series) const;

    std::size_t window_size() const { return window_size_; }

    // One averaged point per window position (len - window + 1 points). A
    // series shorter than the window is returned unchanged.
    static std::vector<SeriesPoint> calculate_rolling_averages(
        const std::vector<SeriesPoint>& series, std::size_t window_size);

    // Least-squares slope over (index, value); |Pearson r| < 0.3 is stable.
    static TrendDirection determine_trend_direction(const std::vector<SeriesPoint>& series);

    // (last - first) / first * 100. A zero first value yields 100 when the
    // series ends positive, else 0.
    static double calculate_percentage_change(const std::vector<SeriesPoint>& series);

    // Compares the mean of the latest window against up to one window of
    // points before it; changes under 5% are stable. Stable when there is no
    // earlier point.
    static TrendDirection compare_recent_periods(const std::vector<SeriesPoint>& series,
                                                 std::size_t window_size = 7);

    static StreakRecord detect_nutrient_streaks(const std::string& nutrient,
                                                const std::vector<SeriesPoint>& series,
                                                StreakCondition condition);
    static StreakRecord detect_nutrient_streaks(const std::string& nutrient,
                                                const std::vector<SeriesPoint>& series,
                                                const StreakPredicate& predicate,
                                                StreakCondition tag = StreakCondition::CUSTOM);

    // 100 minus the coefficient of variation (in percent) of the
    // percent-of-target series, clamped to [0, 100]. Empty input scores 0.
    static double calculate_consistency_score(const std::vector<SeriesPoint>& series);

    std::vector<ImprovementOpportunity> identify_improvement_opportunities(
        const std::vector<TrendResult>& trends) const;

private:
    std::size_t window_size_;
};

} // namespace larder
