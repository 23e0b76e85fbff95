#include "fault/faulty_repository.h"

#include <cstdio>

namespace larder {

FaultyIntakeRepository::FaultyIntakeRepository(IRawIntakeRepository& inner,
                                               FaultInjector& faults)
    : inner_(inner), faults_(faults) {}

std::vector<RawIntakeRecord> FaultyIntakeRepository::find_by_user_and_date_range(
    const std::string& user_id,
    std::chrono::system_clock::time_point start_inclusive,
    std::chrono::system_clock::time_point end_exclusive) {

    faults_.check(Date::from_time_point(start_inclusive).to_string(),
                  FaultType::FETCH_ERROR);
    return inner_.find_by_user_and_date_range(user_id, start_inclusive, end_exclusive);
}

FaultySummaryRepository::FaultySummaryRepository(ISummaryRepository& inner,
                                                 FaultInjector& faults)
    : inner_(inner), faults_(faults) {}

void FaultySummaryRepository::upsert_daily(const DailySummary& summary) {
    faults_.check(summary.date.to_string(), FaultType::UPSERT_ERROR);
    inner_.upsert_daily(summary);
}

void FaultySummaryRepository::upsert_weekly(const WeeklySummary& summary) {
    faults_.check(to_string(summary.week), FaultType::UPSERT_ERROR);
    inner_.upsert_weekly(summary);
}

void FaultySummaryRepository::upsert_monthly(const MonthlySummary& summary) {
    char key[16];
    std::snprintf(key, sizeof(key), "%04d-%02d", summary.year, summary.month);
    faults_.check(key, FaultType::UPSERT_ERROR);
    inner_.upsert_monthly(summary);
}

std::optional<DailySummary> FaultySummaryRepository::get_daily(const std::string& user_id,
                                                               const Date& date) {
    return inner_.get_daily(user_id, date);
}

std::optional<WeeklySummary> FaultySummaryRepository::get_weekly(const std::string& user_id,
                                                                 const IsoWeek& week) {
    return inner_.get_weekly(user_id, week);
}

std::optional<MonthlySummary> FaultySummaryRepository::get_monthly(const std::string& user_id,
                                                                   int year, int month) {
    return inner_.get_monthly(user_id, year, month);
}

std::vector<DailySummary> FaultySummaryRepository::find_daily_range(const std::string& user_id,
                                                                    const Date& first,
                                                                    const Date& last) {
    return inner_.find_daily_range(user_id, first, last);
}

} // namespace larder
