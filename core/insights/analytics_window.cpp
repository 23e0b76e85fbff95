#include "insights/analytics_window.h"

#include <algorithm>
#include <stdexcept>

namespace larder {

void AnalyticsWindow::push(const AnalyticsDay& day) {
    auto it = std::lower_bound(days_.begin(), days_.end(), day.date,
                               [](const AnalyticsDay& d, const Date& date) {
                                   return d.date < date;
                               });
    if (it != days_.end() && it->date == day.date) {
        *it = day;
        return;
    }
    days_.insert(it, day);
}

std::vector<AnalyticsDay> AnalyticsWindow::last(std::size_t n) const {
    if (n >= days_.size()) {
        return days_;
    }
    return std::vector<AnalyticsDay>(days_.end() - static_cast<std::ptrdiff_t>(n),
                                     days_.end());
}

std::vector<SeriesPoint> AnalyticsWindow::series_for(
    const std::string& nutrient, std::optional<double> default_target) const {

    std::vector<SeriesPoint> series;
    series.reserve(days_.size());

    for (const auto& day : days_) {
        SeriesPoint point;
        point.date = day.date;
        point.value = amount_of(day.nutrients, nutrient);

        double target = amount_of(day.targets, nutrient);
        if (target > 0.0) {
            point.target = target;
        } else if (default_target) {
            point.target = default_target;
        }
        series.push_back(point);
    }

    return series;
}

DateRange AnalyticsWindow::range() const {
    if (days_.empty()) {
        throw std::logic_error("empty analytics window has no range");
    }
    return DateRange{days_.front().date, days_.back().date};
}

} // namespace larder
