#pragma once

#include "calendar/date.h"
#include "nutrients/nutrient_vector.h"

#include <chrono>
#include <string>

namespace larder {

// One logged consumption event, already scaled to the consumed quantity.
struct RawIntakeRecord {
    std::string user_id;
    std::chrono::system_clock::time_point logged_at;
    NutrientVector nutrients;
};

// One row per (user, date); upserted, never appended.
struct DailySummary {
    std::string user_id;
    Date date;
    NutrientVector nutrients;
    int entry_count = 0;
    std::chrono::system_clock::time_point computed_at;
};

// Per-nutrient means across the contributing daily rows.
struct WeeklySummary {
    std::string user_id;
    IsoWeek week;
    Date week_start;
    NutrientVector averages;
    int days_with_data = 0;
    int total_entries = 0;
    std::chrono::system_clock::time_point computed_at;
};

struct MonthlySummary {
    std::string user_id;
    int year = 0;
    int month = 0;
    NutrientVector averages;
    int days_with_data = 0;
    int total_entries = 0;
    std::chrono::system_clock::time_point computed_at;
};

} // namespace larder
