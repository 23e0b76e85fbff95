#include "targets/macro_calculator.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace larder {

const char* to_string(Sex sex) {
    return sex == Sex::MALE ? "male" : "female";
}

const char* to_string(ActivityLevel level) {
    switch (level) {
        case ActivityLevel::SEDENTARY:         return "sedentary";
        case ActivityLevel::LIGHTLY_ACTIVE:    return "lightly_active";
        case ActivityLevel::MODERATELY_ACTIVE: return "moderately_active";
        case ActivityLevel::ACTIVE:            return "active";
        case ActivityLevel::VERY_ACTIVE:       return "very_active";
    }
    return "sedentary";
}

Sex parse_sex(const std::string& s) {
    if (s == "male")   return Sex::MALE;
    if (s == "female") return Sex::FEMALE;
    throw std::invalid_argument("unknown sex: " + s);
}

ActivityLevel parse_activity_level(const std::string& s) {
    if (s == "sedentary")         return ActivityLevel::SEDENTARY;
    if (s == "lightly_active")    return ActivityLevel::LIGHTLY_ACTIVE;
    if (s == "moderately_active") return ActivityLevel::MODERATELY_ACTIVE;
    if (s == "active")            return ActivityLevel::ACTIVE;
    if (s == "very_active")       return ActivityLevel::VERY_ACTIVE;
    throw std::invalid_argument("unknown activity level: " + s);
}

double MifflinStJeorCalculator::basal_metabolic_rate(const UserProfile& profile) {
    double base = 10.0 * profile.weight_kg + 6.25 * profile.height_cm -
                  5.0 * profile.age_years;
    return profile.sex == Sex::MALE ? base + 5.0 : base - 161.0;
}

double MifflinStJeorCalculator::activity_multiplier(ActivityLevel level) {
    switch (level) {
        case ActivityLevel::SEDENTARY:         return 1.2;
        case ActivityLevel::LIGHTLY_ACTIVE:    return 1.375;
        case ActivityLevel::MODERATELY_ACTIVE: return 1.55;
        case ActivityLevel::ACTIVE:            return 1.725;
        case ActivityLevel::VERY_ACTIVE:       return 1.9;
    }
    return 1.2;
}

double MifflinStJeorCalculator::goal_adjustment(GoalType goal) {
    switch (goal) {
        case GoalType::WEIGHT_LOSS:        return -0.20;
        case GoalType::MAINTENANCE:        return 0.0;
        case GoalType::MUSCLE_GAIN:        return 0.15;
        case GoalType::BODY_RECOMPOSITION: return -0.10;
    }
    return 0.0;
}

TargetVector MifflinStJeorCalculator::compute(const UserProfile& profile,
                                              GoalType goal) const {
    if (profile.weight_kg <= 0.0 || profile.height_cm <= 0.0) {
        throw std::invalid_argument("profile for " + profile.user_id +
                                    " needs positive height and weight");
    }

    double tdee = basal_metabolic_rate(profile) *
                  activity_multiplier(profile.activity_level);
    double kcal = std::round(tdee * (1.0 + goal_adjustment(goal)));

    double protein_per_kg = 1.0;
    if (goal == GoalType::MUSCLE_GAIN) protein_per_kg = 1.6;
    if (goal == GoalType::WEIGHT_LOSS) protein_per_kg = 1.2;
    if (goal == GoalType::BODY_RECOMPOSITION) protein_per_kg = 1.4;

    double height_m = profile.height_cm / 100.0;
    double bmi = profile.weight_kg / (height_m * height_m);
    if (bmi > 30.0) {
        protein_per_kg *= 1.1;
    }

    double protein_g = std::round(profile.weight_kg * protein_per_kg);
    double fat_kcal = std::round(kcal * 0.30);
    double fat_g = std::round(fat_kcal / 9.0);
    double carbs_g = std::round((kcal - protein_g * 4.0 - fat_kcal) / 4.0);

    TargetVector targets;
    targets.calories = kcal;
    targets.protein_g = protein_g;
    targets.fat_g = fat_g;
    // Protein-heavy profiles can use up all calories; keep carbs positive.
    targets.carbs_g = std::max(1.0, carbs_g);
    targets.fiber_g = std::round(kcal / 1000.0 * 14.0);
    return targets;
}

} // namespace larder
