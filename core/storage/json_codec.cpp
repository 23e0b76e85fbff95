#include "storage/json_codec.h"

#include <cmath>
#include <stdexcept>

namespace larder {

nlohmann::json encode(const TargetVector& targets) {
    nlohmann::json j;
    j["calories"] = targets.calories;
    j["protein_g"] = targets.protein_g;
    j["carbs_g"] = targets.carbs_g;
    j["fat_g"] = targets.fat_g;
    if (targets.fiber_g) {
        j["fiber_g"] = *targets.fiber_g;
    }
    if (!targets.micros.empty()) {
        j["micros"] = targets.micros;
    }
    return j;
}

nlohmann::json encode(const DailySummary& summary) {
    nlohmann::json j;
    j["user_id"] = summary.user_id;
    j["date"] = summary.date.to_string();
    j["nutrients"] = summary.nutrients;
    j["entry_count"] = summary.entry_count;
    j["computed_at"] = format_timestamp(summary.computed_at);
    return j;
}

nlohmann::json encode(const WeeklySummary& summary) {
    nlohmann::json j;
    j["user_id"] = summary.user_id;
    j["week"] = to_string(summary.week);
    j["week_start"] = summary.week_start.to_string();
    j["averages"] = summary.averages;
    j["days_with_data"] = summary.days_with_data;
    j["total_entries"] = summary.total_entries;
    j["computed_at"] = format_timestamp(summary.computed_at);
    return j;
}

nlohmann::json encode(const MonthlySummary& summary) {
    nlohmann::json j;
    j["user_id"] = summary.user_id;
    j["year"] = summary.year;
    j["month"] = summary.month;
    j["averages"] = summary.averages;
    j["days_with_data"] = summary.days_with_data;
    j["total_entries"] = summary.total_entries;
    j["computed_at"] = format_timestamp(summary.computed_at);
    return j;
}

nlohmann::json encode(const Insight& insight) {
    nlohmann::json j;
    j["id"] = insight.id;
    j["key"] = insight.key;
    j["subject"] = insight.subject;
    j["severity"] = to_string(insight.severity);
    j["start"] = insight.range.start.to_string();
    j["end"] = insight.range.end.to_string();
    j["message"] = insight.message;
    j["details"] = insight.details;
    return j;
}

nlohmann::json encode(const TrendResult& trend) {
    nlohmann::json values = nlohmann::json::array();
    for (const auto& p : trend.values) {
        nlohmann::json point;
        point["date"] = p.date.to_string();
        point["value"] = p.value;
        if (p.target) {
            point["target"] = *p.target;
        }
        values.push_back(point);
    }

    nlohmann::json j;
    j["nutrient"] = trend.nutrient;
    j["trend"] = to_string(trend.trend);
    j["change_percent"] = trend.change_percent;
    j["values"] = values;
    return j;
}

nlohmann::json encode(const StreakRecord& streak) {
    nlohmann::json j;
    j["nutrient"] = streak.nutrient;
    j["condition"] = to_string(streak.condition);
    j["current_streak"] = streak.current_streak;
    j["max_streak"] = streak.max_streak;
    j["is_active"] = streak.is_active;
    j["streak_start"] = streak.streak_start ? nlohmann::json(streak.streak_start->to_string())
                                            : nlohmann::json(nullptr);
    j["streak_end"] = streak.streak_end ? nlohmann::json(streak.streak_end->to_string())
                                        : nlohmann::json(nullptr);
    j["average_value"] = streak.average_value;
    j["average_target"] = streak.average_target;
    return j;
}

NutrientVector decode_nutrients(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw std::invalid_argument("nutrients must be an object");
    }
    NutrientVector v;
    for (auto it = json.begin(); it != json.end(); ++it) {
        if (!it.value().is_number()) {
            throw std::invalid_argument("nutrient " + it.key() + " is not a number");
        }
        double amount = it.value().get<double>();
        if (std::isfinite(amount) && amount > 0.0) {
            v[it.key()] = amount;
        }
    }
    return v;
}

TargetVector decode_targets(const nlohmann::json& json) {
    TargetVector t;
    t.calories = json.at("calories").get<double>();
    t.protein_g = json.at("protein_g").get<double>();
    t.carbs_g = json.at("carbs_g").get<double>();
    t.fat_g = json.at("fat_g").get<double>();
    if (json.contains("fiber_g") && !json.at("fiber_g").is_null()) {
        t.fiber_g = json.at("fiber_g").get<double>();
    }
    if (json.contains("micros")) {
        for (auto it = json.at("micros").begin(); it != json.at("micros").end(); ++it) {
            t.micros[it.key()] = it.value().get<double>();
        }
    }
    t.validate();
    return t;
}

GoalLayer decode_goal_layer(const nlohmann::json& json) {
    GoalLayer layer;
    layer.id = json.at("id").get<std::string>();
    layer.user_id = json.at("user_id").get<std::string>();
    layer.precedence = parse_precedence_class(json.at("class").get<std::string>());
    layer.start_date = Date::parse(json.at("start_date").get<std::string>());

    if (json.contains("end_date") && !json.at("end_date").is_null()) {
        layer.end_date = Date::parse(json.at("end_date").get<std::string>());
    }
    if (json.contains("targets") && !json.at("targets").is_null()) {
        layer.targets = decode_targets(json.at("targets"));
    }
    if (json.contains("goal_type") && !json.at("goal_type").is_null()) {
        layer.goal_type = parse_goal_type(json.at("goal_type").get<std::string>());
    }
    if (!layer.targets && !layer.goal_type) {
        throw std::invalid_argument("goal layer " + layer.id + " has neither targets nor goal_type");
    }

    switch (layer.precedence) {
        case PrecedenceClass::BASE:
            break;
        case PrecedenceClass::WEEKLY_CYCLE:
            layer.day_of_week = json.at("day_of_week").get<int>();
            if (layer.day_of_week < 0 || layer.day_of_week > 6) {
                throw std::invalid_argument("goal layer " + layer.id + ": day_of_week out of range");
            }
            break;
        case PrecedenceClass::PHASE_BASED:
            layer.phase.phase = parse_cycle_phase(json.at("phase").get<std::string>());
            layer.phase.cycle_start = Date::parse(json.at("cycle_start_date").get<std::string>());
            layer.phase.start_day = json.at("phase_start_day").get<int>();
            layer.phase.end_day = json.at("phase_end_day").get<int>();
            layer.phase.cycle_length_days = json.value("cycle_length_days", 28);
            if (layer.phase.cycle_length_days <= 0 || layer.phase.start_day < 1 ||
                layer.phase.end_day < layer.phase.start_day ||
                layer.phase.end_day > layer.phase.cycle_length_days) {
                throw std::invalid_argument("goal layer " + layer.id + ": invalid phase window");
            }
            break;
    }

    return layer;
}

UserProfile decode_profile(const nlohmann::json& json) {
    UserProfile p;
    p.user_id = json.at("user_id").get<std::string>();
    p.sex = parse_sex(json.at("sex").get<std::string>());
    p.age_years = json.at("age_years").get<int>();
    p.height_cm = json.at("height_cm").get<double>();
    p.weight_kg = json.at("weight_kg").get<double>();
    p.activity_level = parse_activity_level(json.value("activity_level", std::string("sedentary")));
    p.current_goal = parse_goal_type(json.value("current_goal", std::string("maintenance")));
    return p;
}

RawIntakeRecord decode_intake(const nlohmann::json& json) {
    RawIntakeRecord r;
    r.user_id = json.at("user_id").get<std::string>();
    r.logged_at = parse_timestamp(json.at("logged_at").get<std::string>());
    r.nutrients = decode_nutrients(json.at("nutrients"));
    return r;
}

} // namespace larder
