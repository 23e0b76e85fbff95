#pragma once

#include "insights/insight.h"
#include "storage/records.h"
#include "targets/goal_layer.h"
#include "targets/macro_calculator.h"
#include "targets/target_vector.h"
#include "trends/trend_analyzer.h"

#include <nlohmann/json.hpp>

namespace larder {

nlohmann::json encode(const TargetVector& targets);
nlohmann::json encode(const DailySummary& summary);
nlohmann::json encode(const WeeklySummary& summary);
nlohmann::json encode(const MonthlySummary& summary);
nlohmann::json encode(const Insight& insight);
nlohmann::json encode(const TrendResult& trend);
nlohmann::json encode(const StreakRecord& streak);

// Decoders throw std::invalid_argument (or nlohmann::json::exception for a
// missing or mistyped field) on malformed input.
NutrientVector decode_nutrients(const nlohmann::json& json);
TargetVector decode_targets(const nlohmann::json& json);
GoalLayer decode_goal_layer(const nlohmann::json& json);
UserProfile decode_profile(const nlohmann::json& json);
RawIntakeRecord decode_intake(const nlohmann::json& json);

} // namespace larder
