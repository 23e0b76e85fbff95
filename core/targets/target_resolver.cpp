#include "targets/target_resolver.h"

#include "logging/logger.h"

namespace larder {

namespace {

std::optional<GoalLayer> pick(const std::vector<GoalLayer>& candidates, const Date& date) {
    const GoalLayer* best = nullptr;
    for (const auto& layer : candidates) {
        if (!layer.applies_on(date)) {
            continue;
        }
        if (!best || best->start_date < layer.start_date ||
            (best->start_date == layer.start_date && best->id < layer.id)) {
            best = &layer;
        }
    }
    if (!best) {
        return std::nullopt;
    }
    return *best;
}

} // namespace

TargetResolver::TargetResolver(IGoalLayerRepository& layers, IProfileRepository& profiles,
                               const IMacroCalculator& calculator,
                               std::chrono::seconds cache_ttl, Logger* logger,
                               TargetCache::Clock clock)
    : layers_(layers), profiles_(profiles), calculator_(calculator),
      cache_(cache_ttl, std::move(clock)), logger_(logger) {
    subscription_ = layers_.subscribe([this](const std::string& user_id) {
        invalidate_user(user_id);
    });
}

TargetResolver::~TargetResolver() {
    layers_.unsubscribe(subscription_);
}

TargetVector TargetResolver::resolve(const std::string& user_id, const Date& date) {
    if (auto cached = cache_.get(user_id, date)) {
        return *cached;
    }

    auto generation = cache_.generation(user_id);
    auto targets = compute(user_id, date);
    cache_.put(user_id, date, targets, generation);
    return targets;
}

std::vector<std::pair<Date, TargetVector>> TargetResolver::get_range(
    const std::string& user_id, const Date& start, const Date& end) {

    if (end < start) {
        throw std::invalid_argument("target range end precedes start");
    }

    std::vector<std::pair<Date, TargetVector>> result;
    result.reserve(static_cast<std::size_t>(start.days_until(end)) + 1);
    for (Date d = start; d <= end; d = d.add_days(1)) {
        result.emplace_back(d, resolve(user_id, d));
    }
    return result;
}

std::size_t TargetResolver::invalidate_user(const std::string& user_id) {
    auto removed = cache_.invalidate_user(user_id);
    if (logger_) {
        logger_->log_cache_invalidation(user_id, removed);
    }
    return removed;
}

SelectedLayers TargetResolver::select_layers(const ActiveLayerSet& active, const Date& date) {
    SelectedLayers selected;
    selected.base = pick(active.base, date);
    selected.weekly_cycle = pick(active.weekly_cycle, date);
    selected.phase_based = pick(active.phase_based, date);
    return selected;
}

TargetVector TargetResolver::compute(const std::string& user_id, const Date& date) {
    auto selected = select_layers(layers_.get_active_layers(user_id, date), date);

    const GoalLayer* winner = selected.winner();
    if (!winner) {
        throw TargetResolutionError("no goal layer applies for user " + user_id +
                                    " on " + date.to_string());
    }

    if (winner->targets) {
        winner->targets->validate();
        return *winner->targets;
    }

    auto profile = profiles_.get_profile(user_id);
    if (!profile) {
        throw TargetResolutionError("layer " + winner->id + " needs a profile for user " +
                                    user_id);
    }

    GoalType goal = winner->goal_type.value_or(profile->current_goal);
    return calculator_.compute(*profile, goal);
}

} // namespace larder
