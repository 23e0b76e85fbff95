#pragma once

#include "insights/analytics_window.h"
#include "insights/insight.h"

#include <cstdio>
#include <string>
#include <vector>

namespace larder {

// A pattern detector over an analytics window. Rules hold only their
// configuration; evaluate() must not depend on earlier calls.
class IInsightRule {
public:
    virtual ~IInsightRule() = default;
    virtual std::vector<Insight> evaluate(const AnalyticsWindow& window) = 0;
    virtual std::string key() const = 0;
    virtual int priority() const = 0;
};

// Builds the deterministic id "<key>_<subject>_<end date>".
inline std::string make_insight_id(const std::string& key, const std::string& subject,
                                   const Date& end) {
    return key + "_" + subject + "_" + end.to_string();
}

// Fixed-point rendering for messages ("12.3").
inline std::string format_number(double value, int decimals) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", decimals, value);
    return buf;
}

} // namespace larder
