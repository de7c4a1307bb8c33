#pragma once

#include "ledge/core/CharacterTypes.hh"
#include "ledge/utils/ErrorHandling.hh"

#include <toml++/toml.hpp>

#include <filesystem>
#include <string_view>

namespace ledge {

// Reads MovementConfig from the [movement] table of a TOML document.
//
//   [movement]
//   move_speed = 8.0
//   jump_force = 14.0
//   wall_jump_force = 10.0
//   directed_wall_jump_force = 12.0
//   wall_slide_speed = 2.0
//   wall_check_distance = 0.6
//   wall_jump_time = 0.2
//   wall_layer = [1]        # layer indices, or an integer bit mask
//
// Every key is optional and falls back to the MovementConfig default. Values
// are not range-checked; non-positive numbers are logged as warnings.
Result<MovementConfig> parseMovementConfig(std::string_view tomlContent, std::string_view sourceName = "string");

Result<MovementConfig> loadMovementConfig(const std::filesystem::path& path);

// Deserializer over an already parsed document
Result<MovementConfig> movementConfigFromTable(const toml::table& root, std::string_view sourceName);

} // namespace ledge
