#pragma once

#include "storage/memory_repositories.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>

namespace larder {

struct FixtureCounts {
    std::size_t profiles = 0;
    std::size_t intake = 0;
    std::size_t goal_layers = 0;
};

// Populates the in-memory repositories from a document with optional
// "profiles", "intake" and "goal_layers" arrays. Throws std::runtime_error
// naming the section and index of the first bad entry.
FixtureCounts load_fixture(const nlohmann::json& json,
                           MemoryIntakeRepository& intake,
                           MemoryGoalLayerRepository& layers,
                           MemoryProfileRepository& profiles);

FixtureCounts load_fixture_file(const std::string& path,
                                MemoryIntakeRepository& intake,
                                MemoryGoalLayerRepository& layers,
                                MemoryProfileRepository& profiles);

} // namespace larder
