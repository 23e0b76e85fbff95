#include "fault/fault_profile.h"

#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace larder {

static FaultType parse_fault_type(const std::string& s) {
    if (s == "FetchError")  return FaultType::FETCH_ERROR;
    if (s == "UpsertError") return FaultType::UPSERT_ERROR;
    throw std::runtime_error("unknown fault type: " + s);
}

std::vector<FaultConfig> FaultProfile::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open fault profile: " + path);
    }

    auto json = nlohmann::json::parse(file);
    std::vector<FaultConfig> configs;

    for (const auto& entry : json.at("faults")) {
        FaultConfig fc;
        fc.key = entry.at("key").get<std::string>();
        fc.type = parse_fault_type(entry.at("type").get<std::string>());
        fc.params.fail_count = entry.value("fail_count", -1);
        fc.params.message = entry.value("message", fc.params.message);

        if (fc.params.fail_count == 0 || fc.params.fail_count < -1) {
            throw std::runtime_error("fault " + fc.key + ": fail_count must be -1 or > 0");
        }
        configs.push_back(fc);
    }

    return configs;
}

void FaultProfile::apply(const std::vector<FaultConfig>& configs, FaultInjector& injector) {
    for (const auto& fc : configs) {
        injector.inject(fc.key, fc.type, fc.params);
    }
}

} // namespace larder
