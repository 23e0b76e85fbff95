#pragma once

#include "storage/repository.h"

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace larder {

// In-process repositories backing the CLI and the test suite. Each one
// serializes access with a mutex so upserts are atomic to readers.

class MemoryIntakeRepository : public IRawIntakeRepository {
public:
    void add(const RawIntakeRecord& record);

    std::vector<RawIntakeRecord> find_by_user_and_date_range(
        const std::string& user_id,
        std::chrono::system_clock::time_point start_inclusive,
        std::chrono::system_clock::time_point end_exclusive) override;

    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<RawIntakeRecord>> records_;
};

class MemorySummaryRepository : public ISummaryRepository {
public:
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

    std::size_t daily_count() const;
    std::size_t weekly_count() const;
    std::size_t monthly_count() const;

private:
    mutable std::mutex mutex_;
    std::map<std::pair<std::string, std::int64_t>, DailySummary> daily_;
    std::map<std::pair<std::string, IsoWeek>, WeeklySummary> weekly_;
    std::map<std::pair<std::string, int>, MonthlySummary> monthly_; // year*100+month
};

class MemoryGoalLayerRepository : public IGoalLayerRepository {
public:
    ActiveLayerSet get_active_layers(const std::string& user_id,
                                     const Date& date) override;

    void upsert_layer(const GoalLayer& layer) override;
    bool remove_layer(const std::string& user_id,
                      const std::string& layer_id) override;

    int subscribe(ChangeListener listener) override;
    void unsubscribe(int token) override;

private:
    void notify(const std::string& user_id);

    std::mutex mutex_;
    std::unordered_map<std::string, std::vector<GoalLayer>> layers_;

    std::mutex listeners_mutex_;
    std::map<int, ChangeListener> listeners_;
    int next_token_ = 1;
};

class MemoryProfileRepository : public IProfileRepository {
public:
    void put(const UserProfile& profile);
    std::optional<UserProfile> get_profile(const std::string& user_id) override;

private:
    std::mutex mutex_;
    std::unordered_map<std::string, UserProfile> profiles_;
};

} // namespace larder
