#include "insights/rules/fiber_low_rule.h"

#include "nutrients/nutrient_vector.h"

namespace larder {

namespace {

constexpr std::size_t kWeek = 7;
constexpr int kLowDaysRequired = 5;

} // namespace

FiberLowRule::FiberLowRule(double fiber_target)
    : fiber_target_(fiber_target) {}

std::vector<Insight> FiberLowRule::evaluate(const AnalyticsWindow& window) {
    if (window.empty() || fiber_target_ <= 0.0) {
        return {};
    }

    auto week = window.last(kWeek);
    int low_days = 0;
    double sum = 0.0;
    for (const auto& day : week) {
        double fiber = amount_of(day.nutrients, "fiber_g");
        sum += fiber;
        if (fiber < fiber_target_ * 0.6) {
            ++low_days;
        }
    }

    if (low_days < kLowDaysRequired) {
        return {};
    }

    double avg = sum / static_cast<double>(week.size());

    Insight insight;
    insight.key = key();
    insight.subject = "fiber_g";
    insight.range = DateRange{week.front().date, week.back().date};
    insight.id = make_insight_id(insight.key, insight.subject, insight.range.end);
    insight.severity = avg < fiber_target_ * 0.4 ? InsightSeverity::WARN
                                                 : InsightSeverity::INFO;
    insight.priority = priority();
    insight.message = "Fiber intake has been low this week. Current average: " +
                      format_number(avg, 1) + "g daily (target: " +
                      format_number(fiber_target_, 0) + "g).";
    insight.details = {
        {"avg_fiber", avg},
        {"target", fiber_target_},
        {"deficit", fiber_target_ - avg},
        {"low_days", low_days},
        {"recommendations", nlohmann::json::array({
            "Add more vegetables to each meal",
            "Choose whole grains over refined grains",
            "Include fruits with skin when possible",
            "Add legumes like beans and lentils to meals"
        })}
    };
    return {insight};
}

} // namespace larder
