#pragma once

#include "calendar/date.h"

#include <nlohmann/json.hpp>

#include <string>

namespace larder {

enum class InsightSeverity {
    INFO,
    WARN,
    HIGH
};

inline const char* to_string(InsightSeverity severity) {
    switch (severity) {
        case InsightSeverity::INFO: return "info";
        case InsightSeverity::WARN: return "warn";
        case InsightSeverity::HIGH: return "high";
    }
    return "info";
}

// Higher is more severe.
inline int severity_rank(InsightSeverity severity) {
    return static_cast<int>(severity);
}

struct Insight {
    std::string id;
    DateRange range;
    std::string key;      // rule key, e.g. "iron_low_streak"
    std::string subject;  // nutrient (or "macros") the finding is about
    InsightSeverity severity = InsightSeverity::INFO;
    std::string message;
    nlohmann::json details = nlohmann::json::object();
    int priority = 99;    // lower sorts first within a severity
};

} // namespace larder
