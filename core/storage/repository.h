#pragma once

#include "calendar/date.h"
#include "storage/records.h"
#include "targets/goal_layer.h"
#include "targets/macro_calculator.h"

#include <chrono>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace larder {

// Raised by repositories when the storage layer is unreachable or fails.
class RepositoryError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class IRawIntakeRepository {
public:
    virtual ~IRawIntakeRepository() = default;

    virtual std::vector<RawIntakeRecord> find_by_user_and_date_range(
        const std::string& user_id,
        std::chrono::system_clock::time_point start_inclusive,
        std::chrono::system_clock::time_point end_exclusive) = 0;
};

class ISummaryRepository {
public:
    virtual ~ISummaryRepository() = default;

    virtual void upsert_daily(const DailySummary& summary) = 0;
    virtual void upsert_weekly(const WeeklySummary& summary) = 0;
    virtual void upsert_monthly(const MonthlySummary& summary) = 0;

    virtual std::optional<DailySummary> get_daily(const std::string& user_id,
                                                  const Date& date) = 0;
    virtual std::optional<WeeklySummary> get_weekly(const std::string& user_id,
                                                    const IsoWeek& week) = 0;
    virtual std::optional<MonthlySummary> get_monthly(const std::string& user_id,
                                                      int year, int month) = 0;

    // Daily rows with first <= date <= last, oldest first.
    virtual std::vector<DailySummary> find_daily_range(const std::string& user_id,
                                                       const Date& first,
                                                       const Date& last) = 0;
};

class IGoalLayerRepository {
public:
    using ChangeListener = std::function<void(const std::string& user_id)>;

    virtual ~IGoalLayerRepository() = default;

    // Layers whose [start_date, end_date] covers date, grouped by class.
    virtual ActiveLayerSet get_active_layers(const std::string& user_id,
                                             const Date& date) = 0;

    virtual void upsert_layer(const GoalLayer& layer) = 0;
    virtual bool remove_layer(const std::string& user_id,
                              const std::string& layer_id) = 0;

    // Listeners are notified after every mutation of a user's layers.
    virtual int subscribe(ChangeListener listener) = 0;
    virtual void unsubscribe(int token) = 0;
};

class IProfileRepository {
public:
    virtual ~IProfileRepository() = default;
    virtual std::optional<UserProfile> get_profile(const std::string& user_id) = 0;
};

} // namespace larder
