#pragma once

#include "calendar/date.h"
#include "storage/records.h"
#include "storage/repository.h"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace larder {

class Logger;

enum class RollupStatus {
    WRITTEN,
    SKIPPED  // nothing to summarize, no row written
};

enum class RollupPeriod {
    DAILY,
    WEEKLY,
    MONTHLY
};

inline const char* to_string(RollupStatus status) {
    switch (status) {
        case RollupStatus::WRITTEN: return "written";
        case RollupStatus::SKIPPED: return "skipped";
    }
    return "skipped";
}

inline const char* to_string(RollupPeriod period) {
    switch (period) {
        case RollupPeriod::DAILY:   return "daily";
        case RollupPeriod::WEEKLY:  return "weekly";
        case RollupPeriod::MONTHLY: return "monthly";
    }
    return "daily";
}

struct PeriodFailure {
    RollupPeriod period = RollupPeriod::DAILY;
    std::string key;    // "2024-01-05", "2024-W01", "2024-01"
    std::string error;
};

struct BackfillReport {
    int written = 0;
    int empty = 0;      // ran, nothing to summarize
    int failed = 0;
    int cancelled = 0;  // never started
    std::vector<PeriodFailure> failures;

    int completed() const { return written + empty; }
};

struct BackfillOptions {
    std::size_t workers = 1;
    // Checked before each period starts. Periods already finished stay
    // persisted.
    const std::atomic<bool>* cancel = nullptr;
};

// Computes and upserts daily, weekly and monthly summaries. Every run for the
// same inputs rewrites the same row.
class RollupAggregator {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    RollupAggregator(IRawIntakeRepository& intake, ISummaryRepository& summaries,
                     Logger* logger = nullptr, Clock clock = nullptr);

    // Sums every raw record in [date 00:00Z, next day 00:00Z) and upserts
    // the day's row, even when the day has no records. Repository errors
    // propagate.
    RollupStatus run_daily_rollup(const std::string& user_id, const Date& date);

    // Means over the days of the ISO week that have entries. SKIPPED when
    // there are none. Throws std::invalid_argument for a week the ISO year
    // does not have.
    RollupStatus run_weekly_rollup(const std::string& user_id, int iso_year, int iso_week);

    RollupStatus run_monthly_rollup(const std::string& user_id, int year, int month);

    // Every day in [start, end], then every ISO week and month the range
    // touches. A failing period is logged and counted; the rest still run.
    BackfillReport backfill_user_rollups(const std::string& user_id,
                                         const Date& start, const Date& end,
                                         const BackfillOptions& options = {});

private:
    struct Averages {
        NutrientVector values;
        int days_with_data = 0;
        int total_entries = 0;
    };

    Averages average_days(const std::string& user_id, const Date& first, const Date& last);
    std::chrono::system_clock::time_point now() const;

    IRawIntakeRepository& intake_;
    ISummaryRepository& summaries_;
    Logger* logger_;
    Clock clock_;
};

// Distinct ISO weeks holding at least one day of [start, end], in order.
std::vector<IsoWeek> weeks_in_range(const Date& start, const Date& end);

// Distinct (year, month) pairs touched by [start, end], in order.
std::vector<std::pair<int, int>> months_in_range(const Date& start, const Date& end);

} // namespace larder
