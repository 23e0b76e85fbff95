#pragma once

#include "fault/fault_injector.h"

#include <string>
#include <vector>

namespace larder {

struct FaultConfig {
    std::string key;   // period key the fault fires on
    FaultType type = FaultType::FETCH_ERROR;
    FaultParameters params;
};

class FaultProfile {
public:
    // {"faults": [{"key": "2024-01-03", "type": "FetchError", "fail_count": 1}]}
    static std::vector<FaultConfig> load(const std::string& path);

    static void apply(const std::vector<FaultConfig>& configs, FaultInjector& injector);
};

} // namespace larder
