#pragma once

#include "calendar/date.h"
#include "storage/repository.h"
#include "targets/goal_layer.h"
#include "targets/macro_calculator.h"
#include "targets/target_cache.h"
#include "targets/target_vector.h"

#include <chrono>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace larder {

class Logger;

// No layer applies on the date, or a goal-type layer has no profile to
// compute from.
class TargetResolutionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Effective targets per (user, date): phase-based beats weekly-cycle beats
// base. Results are cached; any change to a user's layers drops that user's
// cached entries.
class TargetResolver {
public:
    TargetResolver(IGoalLayerRepository& layers, IProfileRepository& profiles,
                   const IMacroCalculator& calculator,
                   std::chrono::seconds cache_ttl = std::chrono::seconds(300),
                   Logger* logger = nullptr,
                   TargetCache::Clock clock = nullptr);
    ~TargetResolver();

    TargetResolver(const TargetResolver&) = delete;
    TargetResolver& operator=(const TargetResolver&) = delete;

    // Throws TargetResolutionError, RepositoryError, or std::invalid_argument
    // for a layer carrying malformed explicit targets.
    TargetVector resolve(const std::string& user_id, const Date& date);

    // One resolve() per day, start..end inclusive.
    std::vector<std::pair<Date, TargetVector>> get_range(const std::string& user_id,
                                                         const Date& start,
                                                         const Date& end);

    std::size_t invalidate_user(const std::string& user_id);

    // Picks at most one layer per class among those applying on date; the
    // latest start date wins, then the greatest id.
    static SelectedLayers select_layers(const ActiveLayerSet& active, const Date& date);

    const TargetCache& cache() const { return cache_; }

private:
    TargetVector compute(const std::string& user_id, const Date& date);

    IGoalLayerRepository& layers_;
    IProfileRepository& profiles_;
    const IMacroCalculator& calculator_;
    TargetCache cache_;
    Logger* logger_;
    int subscription_;
};

} // namespace larder
