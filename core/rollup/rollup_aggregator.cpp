#include "rollup/rollup_aggregator.h"

#include "logging/logger.h"
#include "nutrients/nutrient_vector.h"

#include <algorithm>
#include <cstdio>
#include <stdexcept>
#include <thread>

namespace larder {

namespace {

std::string month_key(int year, int month) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d", year, month);
    return buf;
}

struct PeriodJob {
    RollupPeriod period;
    std::string key;
    std::function<RollupStatus()> run;
};

enum class JobOutcome {
    PENDING,
    WRITTEN,
    EMPTY,
    FAILED,
    CANCELLED
};

struct JobResult {
    JobOutcome outcome = JobOutcome::PENDING;
    std::string error;
};

// Runs the jobs on up to `workers` threads. Each slot of the result vector is
// written by exactly one thread.
std::vector<JobResult> run_jobs(const std::vector<PeriodJob>& jobs, std::size_t workers,
                                const std::atomic<bool>* cancel) {
    std::vector<JobResult> results(jobs.size());
    std::atomic<std::size_t> next{0};

    auto work = [&]() {
        for (;;) {
            std::size_t i = next.fetch_add(1);
            if (i >= jobs.size()) {
                return;
            }
            if (cancel && cancel->load()) {
                results[i].outcome = JobOutcome::CANCELLED;
                continue;
            }
            try {
                auto status = jobs[i].run();
                results[i].outcome = status == RollupStatus::WRITTEN ? JobOutcome::WRITTEN
                                                                     : JobOutcome::EMPTY;
            } catch (const std::exception& e) {
                results[i].outcome = JobOutcome::FAILED;
                results[i].error = e.what();
            }
        }
    };

    std::size_t threads = std::min(std::max<std::size_t>(workers, 1), jobs.size());
    if (threads <= 1) {
        work();
        return results;
    }

    std::vector<std::thread> pool;
    pool.reserve(threads);
    for (std::size_t t = 0; t < threads; ++t) {
        pool.emplace_back(work);
    }
    for (auto& th : pool) {
        th.join();
    }
    return results;
}

} // namespace

RollupAggregator::RollupAggregator(IRawIntakeRepository& intake, ISummaryRepository& summaries,
                                   Logger* logger, Clock clock)
    : intake_(intake), summaries_(summaries), logger_(logger), clock_(std::move(clock)) {}

RollupStatus RollupAggregator::run_daily_rollup(const std::string& user_id, const Date& date) {
    auto records = intake_.find_by_user_and_date_range(
        user_id, date.start_of_day(), date.add_days(1).start_of_day());

    std::vector<NutrientVector> vectors;
    vectors.reserve(records.size());
    for (const auto& r : records) {
        vectors.push_back(r.nutrients);
    }

    DailySummary summary;
    summary.user_id = user_id;
    summary.date = date;
    summary.nutrients = accumulate(vectors);
    summary.entry_count = static_cast<int>(records.size());
    summary.computed_at = now();

    summaries_.upsert_daily(summary);

    if (logger_) {
        logger_->log_rollup("daily", user_id, date.to_string(), "written",
                            summary.entry_count, 1);
    }
    return RollupStatus::WRITTEN;
}

RollupStatus RollupAggregator::run_weekly_rollup(const std::string& user_id,
                                                 int iso_year, int iso_week) {
    Date week_start = iso_week_start(iso_year, iso_week);
    IsoWeek week{iso_year, iso_week};
    auto averages = average_days(user_id, week_start, week_start.add_days(6));

    if (averages.days_with_data == 0) {
        if (logger_) {
            logger_->log_rollup("weekly", user_id, to_string(week), "skipped", 0, 0);
        }
        return RollupStatus::SKIPPED;
    }

    WeeklySummary summary;
    summary.user_id = user_id;
    summary.week = week;
    summary.week_start = week_start;
    summary.averages = std::move(averages.values);
    summary.days_with_data = averages.days_with_data;
    summary.total_entries = averages.total_entries;
    summary.computed_at = now();

    summaries_.upsert_weekly(summary);

    if (logger_) {
        logger_->log_rollup("weekly", user_id, to_string(week), "written",
                            summary.total_entries, summary.days_with_data);
    }
    return RollupStatus::WRITTEN;
}

RollupStatus RollupAggregator::run_monthly_rollup(const std::string& user_id,
                                                  int year, int month) {
    if (month < 1 || month > 12) {
        throw std::invalid_argument("month out of range: " + std::to_string(month));
    }

    auto key = month_key(year, month);
    auto averages = average_days(user_id, first_of_month(year, month),
                                 last_of_month(year, month));

    if (averages.days_with_data == 0) {
        if (logger_) {
            logger_->log_rollup("monthly", user_id, key, "skipped", 0, 0);
        }
        return RollupStatus::SKIPPED;
    }

    MonthlySummary summary;
    summary.user_id = user_id;
    summary.year = year;
    summary.month = month;
    summary.averages = std::move(averages.values);
    summary.days_with_data = averages.days_with_data;
    summary.total_entries = averages.total_entries;
    summary.computed_at = now();

    summaries_.upsert_monthly(summary);

    if (logger_) {
        logger_->log_rollup("monthly", user_id, key, "written",
                            summary.total_entries, summary.days_with_data);
    }
    return RollupStatus::WRITTEN;
}

BackfillReport RollupAggregator::backfill_user_rollups(const std::string& user_id,
                                                       const Date& start, const Date& end,
                                                       const BackfillOptions& options) {
    if (end < start) {
        throw std::invalid_argument("backfill range end precedes start");
    }

    std::vector<PeriodJob> daily;
    for (Date d = start; d <= end; d = d.add_days(1)) {
        daily.push_back({RollupPeriod::DAILY, d.to_string(),
                         [this, user_id, d]() { return run_daily_rollup(user_id, d); }});
    }

    std::vector<PeriodJob> weekly;
    for (const auto& w : weeks_in_range(start, end)) {
        weekly.push_back({RollupPeriod::WEEKLY, to_string(w),
                          [this, user_id, w]() {
                              return run_weekly_rollup(user_id, w.year, w.week);
                          }});
    }

    std::vector<PeriodJob> monthly;
    for (const auto& [year, month] : months_in_range(start, end)) {
        int y = year;
        int m = month;
        monthly.push_back({RollupPeriod::MONTHLY, month_key(y, m),
                           [this, user_id, y, m]() {
                               return run_monthly_rollup(user_id, y, m);
                           }});
    }

    BackfillReport report;

    // Weekly and monthly averages read the daily rows, so phases run in order.
    for (const auto* phase : {&daily, &weekly, &monthly}) {
        auto results = run_jobs(*phase, options.workers, options.cancel);
        for (std::size_t i = 0; i < results.size(); ++i) {
            const auto& job = (*phase)[i];
            switch (results[i].outcome) {
                case JobOutcome::WRITTEN:
                    ++report.written;
                    break;
                case JobOutcome::EMPTY:
                    ++report.empty;
                    break;
                case JobOutcome::FAILED:
                    ++report.failed;
                    report.failures.push_back({job.period, job.key, results[i].error});
                    if (logger_) {
                        logger_->log_rollup_failure(to_string(job.period), user_id,
                                                    job.key, results[i].error);
                    }
                    break;
                case JobOutcome::CANCELLED:
                case JobOutcome::PENDING:
                    ++report.cancelled;
                    break;
            }
        }
    }

    if (logger_) {
        logger_->log_backfill(user_id, DateRange{start, end}, report.completed(),
                              report.failed, report.cancelled);
    }
    return report;
}

RollupAggregator::Averages RollupAggregator::average_days(const std::string& user_id,
                                                          const Date& first,
                                                          const Date& last) {
    Averages result;
    NutrientVector sums;

    for (const auto& day : summaries_.find_daily_range(user_id, first, last)) {
        if (day.entry_count <= 0) {
            continue;
        }
        ++result.days_with_data;
        result.total_entries += day.entry_count;
        for (const auto& [key, value] : day.nutrients) {
            sums[key] += value;
        }
    }

    // A key missing on a contributing day counts as 0 for that day.
    for (const auto& [key, total] : sums) {
        double mean = round2(total / result.days_with_data);
        if (mean > 0.0) {
            result.values[key] = mean;
        }
    }
    return result;
}

std::chrono::system_clock::time_point RollupAggregator::now() const {
    return clock_ ? clock_() : std::chrono::system_clock::now();
}

std::vector<IsoWeek> weeks_in_range(const Date& start, const Date& end) {
    std::vector<IsoWeek> weeks;
    for (Date d = start; d <= end; d = d.add_days(1)) {
        auto w = iso_week_of(d);
        if (weeks.empty() || !(weeks.back() == w)) {
            weeks.push_back(w);
        }
    }
    return weeks;
}

std::vector<std::pair<int, int>> months_in_range(const Date& start, const Date& end) {
    std::vector<std::pair<int, int>> months;
    if (end < start) {
        return months;
    }
    int year = start.year();
    int month = start.month();
    while (year < end.year() || (year == end.year() && month <= end.month())) {
        months.emplace_back(year, month);
        if (++month > 12) {
            month = 1;
            ++year;
        }
    }
    return months;
}

} // namespace larder
