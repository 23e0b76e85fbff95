#include "storage/json_fixture.h"

#include "storage/json_codec.h"

#include <fstream>
#include <stdexcept>

namespace larder {

namespace {

template <typename Fn>
std::size_t for_each_entry(const nlohmann::json& json, const char* section, Fn&& fn) {
    if (!json.contains(section)) {
        return 0;
    }
    const auto& entries = json.at(section);
    if (!entries.is_array()) {
        throw std::runtime_error(std::string("fixture section ") + section + " is not an array");
    }

    std::size_t index = 0;
    for (const auto& entry : entries) {
        try {
            fn(entry);
        } catch (const std::exception& e) {
            throw std::runtime_error(std::string("fixture ") + section + "[" +
                                     std::to_string(index) + "]: " + e.what());
        }
        ++index;
    }
    return index;
}

} // namespace

FixtureCounts load_fixture(const nlohmann::json& json,
                           MemoryIntakeRepository& intake,
                           MemoryGoalLayerRepository& layers,
                           MemoryProfileRepository& profiles) {
    FixtureCounts counts;
    counts.profiles = for_each_entry(json, "profiles", [&](const nlohmann::json& e) {
        profiles.put(decode_profile(e));
    });
    counts.intake = for_each_entry(json, "intake", [&](const nlohmann::json& e) {
        intake.add(decode_intake(e));
    });
    counts.goal_layers = for_each_entry(json, "goal_layers", [&](const nlohmann::json& e) {
        layers.upsert_layer(decode_goal_layer(e));
    });
    return counts;
}

FixtureCounts load_fixture_file(const std::string& path,
                                MemoryIntakeRepository& intake,
                                MemoryGoalLayerRepository& layers,
                                MemoryProfileRepository& profiles) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open fixture: " + path);
    }

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("cannot parse fixture " + path + ": " + e.what());
    }
    return load_fixture(json, intake, layers, profiles);
}

} // namespace larder
