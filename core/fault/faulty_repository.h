#pragma once

#include "fault/fault_injector.h"
#include "storage/repository.h"

namespace larder {

// Decorators that consult a FaultInjector before delegating.

class FaultyIntakeRepository : public IRawIntakeRepository {
public:
    FaultyIntakeRepository(IRawIntakeRepository& inner, FaultInjector& faults);

    // Faults are keyed by the UTC day of start_inclusive.
    std::vector<RawIntakeRecord> find_by_user_and_date_range(
        const std::string& user_id,
        std::chrono::system_clock::time_point start_inclusive,
        std::chrono::system_clock::time_point end_exclusive) override;

private:
    IRawIntakeRepository& inner_;
    FaultInjector& faults_;
};

class FaultySummaryRepository : public ISummaryRepository {
public:
    FaultySummaryRepository(ISummaryRepository& inner, FaultInjector& faults);

    void upsert_daily(const DailySummary& summary) override;
    void upsert_weekly(const WeeklySummary& summary) override;
    void upsert_monthly(const MonthlySummary& summary) override;

    std::optional<DailySummary> get_daily(const std::string& user_id,
                                          const Date& date) override;
    std::optional<WeeklySummary> get_weekly(const std::string& user_id,
                                            const IsoWeek& week) override;
    std::optional<MonthlySummary> get_monthly(const std::string& user_id,
                                              int year, int month) override;
    std::vector<DailySummary> find_daily_range(const std::string& user_id,
                                               const Date& first,
                                               const Date& last) override;

private:
    ISummaryRepository& inner_;
    FaultInjector& faults_;
};

} // namespace larder
