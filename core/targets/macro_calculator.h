#pragma once

#include "targets/goal_layer.h"
#include "targets/target_vector.h"

#include <string>

namespace larder {

enum class Sex {
    MALE,
    FEMALE
};

enum class ActivityLevel {
    SEDENTARY,
    LIGHTLY_ACTIVE,
    MODERATELY_ACTIVE,
    ACTIVE,
    VERY_ACTIVE
};

const char* to_string(Sex sex);
const char* to_string(ActivityLevel level);
Sex parse_sex(const std::string& s);
ActivityLevel parse_activity_level(const std::string& s);

// Physiological profile used when a goal layer names a goal type but no
// explicit numbers.
struct UserProfile {
    std::string user_id;
    Sex sex = Sex::FEMALE;
    int age_years = 30;
    double height_cm = 0.0;
    double weight_kg = 0.0;
    ActivityLevel activity_level = ActivityLevel::SEDENTARY;
    GoalType current_goal = GoalType::MAINTENANCE;
};

class IMacroCalculator {
public:
    virtual ~IMacroCalculator() = default;
    virtual TargetVector compute(const UserProfile& profile, GoalType goal) const = 0;
};

// Mifflin-St Jeor BMR, activity-scaled TDEE, goal energy adjustment,
// protein by body weight, 30% fat, carbs as the remainder and 14 g fiber
// per 1000 kcal.
class MifflinStJeorCalculator : public IMacroCalculator {
public:
    TargetVector compute(const UserProfile& profile, GoalType goal) const override;

    static double basal_metabolic_rate(const UserProfile& profile);
    static double activity_multiplier(ActivityLevel level);
    static double goal_adjustment(GoalType goal);
};

} // namespace larder
