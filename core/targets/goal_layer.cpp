#include "targets/goal_layer.h"

#include <stdexcept>

namespace larder {

const char* to_string(PrecedenceClass precedence) {
    switch (precedence) {
        case PrecedenceClass::BASE:         return "base";
        case PrecedenceClass::WEEKLY_CYCLE: return "weekly_cycle";
        case PrecedenceClass::PHASE_BASED:  return "phase_based";
    }
    return "base";
}

const char* to_string(GoalType goal) {
    switch (goal) {
        case GoalType::WEIGHT_LOSS:        return "weight_loss";
        case GoalType::MAINTENANCE:        return "maintenance";
        case GoalType::MUSCLE_GAIN:        return "muscle_gain";
        case GoalType::BODY_RECOMPOSITION: return "body_recomposition";
    }
    return "maintenance";
}

const char* to_string(CyclePhase phase) {
    switch (phase) {
        case CyclePhase::MENSTRUAL:  return "menstrual";
        case CyclePhase::FOLLICULAR: return "follicular";
        case CyclePhase::OVULATION:  return "ovulation";
        case CyclePhase::LUTEAL:     return "luteal";
    }
    return "follicular";
}

PrecedenceClass parse_precedence_class(const std::string& s) {
    if (s == "base")                         return PrecedenceClass::BASE;
    if (s == "weekly_cycle" || s == "weekly") return PrecedenceClass::WEEKLY_CYCLE;
    if (s == "phase_based" || s == "phase")   return PrecedenceClass::PHASE_BASED;
    throw std::invalid_argument("unknown precedence class: " + s);
}

GoalType parse_goal_type(const std::string& s) {
    if (s == "weight_loss")        return GoalType::WEIGHT_LOSS;
    if (s == "maintenance")        return GoalType::MAINTENANCE;
    if (s == "muscle_gain")        return GoalType::MUSCLE_GAIN;
    if (s == "body_recomposition") return GoalType::BODY_RECOMPOSITION;
    throw std::invalid_argument("unknown goal type: " + s);
}

CyclePhase parse_cycle_phase(const std::string& s) {
    if (s == "menstrual")  return CyclePhase::MENSTRUAL;
    if (s == "follicular") return CyclePhase::FOLLICULAR;
    if (s == "ovulation")  return CyclePhase::OVULATION;
    if (s == "luteal")     return CyclePhase::LUTEAL;
    throw std::invalid_argument("unknown cycle phase: " + s);
}

bool GoalLayer::covers(const Date& date) const {
    if (date < start_date) {
        return false;
    }
    return !end_date || *end_date >= date;
}

bool GoalLayer::applies_on(const Date& date) const {
    if (!covers(date)) {
        return false;
    }

    switch (precedence) {
        case PrecedenceClass::BASE:
            return true;

        case PrecedenceClass::WEEKLY_CYCLE:
            return date.day_of_week() == day_of_week;

        case PrecedenceClass::PHASE_BASED: {
            if (phase.cycle_length_days <= 0 || date < phase.cycle_start) {
                return false;
            }
            auto elapsed = phase.cycle_start.days_until(date);
            int cycle_day = static_cast<int>(elapsed % phase.cycle_length_days) + 1;
            return cycle_day >= phase.start_day && cycle_day <= phase.end_day;
        }
    }
    return false;
}

const GoalLayer* SelectedLayers::winner() const {
    if (phase_based) return &*phase_based;
    if (weekly_cycle) return &*weekly_cycle;
    if (base) return &*base;
    return nullptr;
}

} // namespace larder
