#pragma once

#include "level_config.hpp"
#include "flappy_pilot/game_logic/state.hpp"

#include <random>
#include <vector>

namespace flappy_pilot::levels {

struct materialize_config_t {
	float margin_top{ 0.0f };
	float margin_bottom_from_floor{ 10.0f };
	float field_height{ 600.0f };
};

struct materialized_level_t {
	float floor_y;
	std::vector<game_logic::pipe_t> pipes;
};

// Throws std::invalid_argument for an inverted floor band, requests out of
// ascending position_x, or a request with non-finite values or a non-positive
// gap height.
void validate(const level_config_t& level);

// Throws std::invalid_argument unless the margins are finite and non-negative
// and the field height is finite and positive.
void validate(const materialize_config_t& config);

[[nodiscard]] int sample_floor(const floor_band_t& floor_band, std::mt19937& rng);

// Keeps the gap height, moves the centre into the band between the top margin
// and the floor clearance. An infeasible band puts the centre at its midpoint.
[[nodiscard]] game_logic::pipe_t place_pipe(
	const materialize_config_t& config, const pipe_request_t& request, float floor_y
);

[[nodiscard]] materialized_level_t materialize(
	const materialize_config_t& config, const level_config_t& level, std::mt19937& rng
);

} // namespace flappy_pilot::levels
