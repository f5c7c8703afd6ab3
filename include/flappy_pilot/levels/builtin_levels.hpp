#pragma once

#include "level_config.hpp"

#include <random>
#include <string_view>
#include <vector>

namespace flappy_pilot::levels {

[[nodiscard]] level_config_t simple_level();
[[nodiscard]] level_config_t medium_level();
[[nodiscard]] level_config_t hard_level();
[[nodiscard]] level_config_t floor_test_level();

// 200 pipes with random gap heights and centres at a fixed spacing.
[[nodiscard]] level_config_t marathon_level(std::mt19937& rng);

[[nodiscard]] std::vector<std::string_view> builtin_level_ids();

// Unknown ids fall back to the marathon.
[[nodiscard]] level_config_t builtin_level(std::string_view id, std::mt19937& rng);

} // namespace flappy_pilot::levels
