#pragma once

#include "calendar/date.h"
#include "nutrients/nutrient_vector.h"
#include "trends/trend_analyzer.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace larder {

// One summarized day as seen by the insight rules.
struct AnalyticsDay {
    Date date;
    NutrientVector nutrients;
    NutrientVector targets;   // empty when no target resolved for the day
    double adherence = 0.0;
    int entry_count = 0;
};

// Date-ordered run of analytics days. Pushing a date that is already present
// replaces that day.
class AnalyticsWindow {
public:
    AnalyticsWindow() = default;

    void push(const AnalyticsDay& day);

    const std::vector<AnalyticsDay>& days() const { return days_; }

    // The latest n days (all of them when fewer), oldest first.
    std::vector<AnalyticsDay> last(std::size_t n) const;

    // Per-day series for one nutrient. The target is the day's own target
    // when positive, else default_target.
    std::vector<SeriesPoint> series_for(const std::string& nutrient,
                                        std::optional<double> default_target = std::nullopt) const;

    std::size_t size() const { return days_.size(); }
    bool empty() const { return days_.empty(); }

    // First to last day. Throws std::logic_error on an empty window.
    DateRange range() const;

private:
    std::vector<AnalyticsDay> days_;
};

} // namespace larder
