#pragma once

#include "calendar/date.h"
#include "targets/target_vector.h"

#include <optional>
#include <string>
#include <vector>

namespace larder {

// Highest wins: PHASE_BASED > WEEKLY_CYCLE > BASE.
enum class PrecedenceClass {
    BASE,
    WEEKLY_CYCLE,
    PHASE_BASED
};

enum class GoalType {
    WEIGHT_LOSS,
    MAINTENANCE,
    MUSCLE_GAIN,
    BODY_RECOMPOSITION
};

enum class CyclePhase {
    MENSTRUAL,
    FOLLICULAR,
    OVULATION,
    LUTEAL
};

const char* to_string(PrecedenceClass precedence);
const char* to_string(GoalType goal);
const char* to_string(CyclePhase phase);

// Throw std::invalid_argument on unknown names.
PrecedenceClass parse_precedence_class(const std::string& s);
GoalType parse_goal_type(const std::string& s);
CyclePhase parse_cycle_phase(const std::string& s);

struct PhaseWindow {
    CyclePhase phase = CyclePhase::FOLLICULAR;
    Date cycle_start;
    int start_day = 1;          // 1-based day within the cycle
    int end_day = 1;            // inclusive
    int cycle_length_days = 28;
};

// A time-bounded target definition. Either explicit targets or a goal type
// (or both) may be given; explicit targets win.
struct GoalLayer {
    std::string id;
    std::string user_id;
    PrecedenceClass precedence = PrecedenceClass::BASE;
    Date start_date;
    std::optional<Date> end_date;   // nullopt = open-ended
    std::optional<TargetVector> targets;
    std::optional<GoalType> goal_type;

    int day_of_week = 0;            // WEEKLY_CYCLE only, 0 = Sunday
    PhaseWindow phase;              // PHASE_BASED only

    // start_date <= date and (no end_date or end_date >= date).
    bool covers(const Date& date) const;

    // covers() plus the class key: weekly layers match their day of week,
    // phase layers match their cycle-day window.
    bool applies_on(const Date& date) const;
};

// Candidate layers per class whose date range covers a date.
struct ActiveLayerSet {
    std::vector<GoalLayer> base;
    std::vector<GoalLayer> weekly_cycle;
    std::vector<GoalLayer> phase_based;
};

// At most one winner per class.
struct SelectedLayers {
    std::optional<GoalLayer> base;
    std::optional<GoalLayer> weekly_cycle;
    std::optional<GoalLayer> phase_based;

    // Highest-precedence selected layer, or nullptr.
    const GoalLayer* winner() const;
};

} // namespace larder
