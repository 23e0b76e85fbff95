#include "storage/memory_repositories.h"

#include <algorithm>

namespace larder {

// --- MemoryIntakeRepository ---

void MemoryIntakeRepository::add(const RawIntakeRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_[record.user_id].push_back(record);
}

std::vector<RawIntakeRecord> MemoryIntakeRepository::find_by_user_and_date_range(
    const std::string& user_id,
    std::chrono::system_clock::time_point start_inclusive,
    std::chrono::system_clock::time_point end_exclusive) {

    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<RawIntakeRecord> result;

    auto it = records_.find(user_id);
    if (it == records_.end()) {
        return result;
    }

    for (const auto& record : it->second) {
        if (record.logged_at >= start_inclusive && record.logged_at < end_exclusive) {
            result.push_back(record);
        }
    }
    return result;
}

std::size_t MemoryIntakeRepository::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t total = 0;
    for (const auto& [user, records] : records_) {
        total += records.size();
    }
    return total;
}

// --- MemorySummaryRepository ---

void MemorySummaryRepository::upsert_daily(const DailySummary& summary) {
    std::lock_guard<std::mutex> lock(mutex_);
    daily_[{summary.user_id, summary.date.days_since_epoch()}] = summary;
}

void MemorySummaryRepository::upsert_weekly(const WeeklySummary& summary) {
    std::lock_guard<std::mutex> lock(mutex_);
    weekly_[{summary.user_id, summary.week}] = summary;
}

void MemorySummaryRepository::upsert_monthly(const MonthlySummary& summary) {
    std::lock_guard<std::mutex> lock(mutex_);
    monthly_[{summary.user_id, summary.year * 100 + summary.month}] = summary;
}

std::optional<DailySummary> MemorySummaryRepository::get_daily(
    const std::string& user_id, const Date& date) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = daily_.find({user_id, date.days_since_epoch()});
    if (it == daily_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<WeeklySummary> MemorySummaryRepository::get_weekly(
    const std::string& user_id, const IsoWeek& week) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = weekly_.find({user_id, week});
    if (it == weekly_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<MonthlySummary> MemorySummaryRepository::get_monthly(
    const std::string& user_id, int year, int month) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = monthly_.find({user_id, year * 100 + month});
    if (it == monthly_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<DailySummary> MemorySummaryRepository::find_daily_range(
    const std::string& user_id, const Date& first, const Date& last) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DailySummary> result;

    auto it = daily_.lower_bound({user_id, first.days_since_epoch()});
    auto end = daily_.upper_bound({user_id, last.days_since_epoch()});
    for (; it != end; ++it) {
        result.push_back(it->second);
    }
    return result;
}

std::size_t MemorySummaryRepository::daily_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return daily_.size();
}

std::size_t MemorySummaryRepository::weekly_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return weekly_.size();
}

std::size_t MemorySummaryRepository::monthly_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return monthly_.size();
}

// --- MemoryGoalLayerRepository ---

ActiveLayerSet MemoryGoalLayerRepository::get_active_layers(
    const std::string& user_id, const Date& date) {
    std::lock_guard<std::mutex> lock(mutex_);
    ActiveLayerSet set;

    auto it = layers_.find(user_id);
    if (it == layers_.end()) {
        return set;
    }

    for (const auto& layer : it->second) {
        if (!layer.covers(date)) {
            continue;
        }
        switch (layer.precedence) {
            case PrecedenceClass::BASE:         set.base.push_back(layer); break;
            case PrecedenceClass::WEEKLY_CYCLE: set.weekly_cycle.push_back(layer); break;
            case PrecedenceClass::PHASE_BASED:  set.phase_based.push_back(layer); break;
        }
    }
    return set;
}

void MemoryGoalLayerRepository::upsert_layer(const GoalLayer& layer) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& layers = layers_[layer.user_id];
        auto it = std::find_if(layers.begin(), layers.end(),
                               [&](const GoalLayer& l) { return l.id == layer.id; });
        if (it != layers.end()) {
            *it = layer;
        } else {
            layers.push_back(layer);
        }
    }
    notify(layer.user_id);
}

bool MemoryGoalLayerRepository::remove_layer(const std::string& user_id,
                                             const std::string& layer_id) {
    bool removed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = layers_.find(user_id);
        if (it != layers_.end()) {
            auto& layers = it->second;
            auto before = layers.size();
            layers.erase(std::remove_if(layers.begin(), layers.end(),
                                        [&](const GoalLayer& l) { return l.id == layer_id; }),
                         layers.end());
            removed = layers.size() != before;
        }
    }
    if (removed) {
        notify(user_id);
    }
    return removed;
}

int MemoryGoalLayerRepository::subscribe(ChangeListener listener) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    int token = next_token_++;
    listeners_[token] = std::move(listener);
    return token;
}

void MemoryGoalLayerRepository::unsubscribe(int token) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_.erase(token);
}

void MemoryGoalLayerRepository::notify(const std::string& user_id) {
    // Called unlocked so a listener may subscribe or unsubscribe.
    std::vector<ChangeListener> snapshot;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        snapshot.reserve(listeners_.size());
        for (const auto& [token, listener] : listeners_) {
            snapshot.push_back(listener);
        }
    }
    for (const auto& listener : snapshot) {
        listener(user_id);
    }
}

// --- MemoryProfileRepository ---

void MemoryProfileRepository::put(const UserProfile& profile) {
    std::lock_guard<std::mutex> lock(mutex_);
    profiles_[profile.user_id] = profile;
}

std::optional<UserProfile> MemoryProfileRepository::get_profile(
    const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = profiles_.find(user_id);
    if (it == profiles_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace larder
