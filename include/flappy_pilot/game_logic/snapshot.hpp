#pragma once

#include "config.hpp"
#include "state.hpp"

#include <optional>

namespace flappy_pilot::game_logic {

// Everything the autopilot may look at for one tick. Rebuilt every tick.
struct snapshot_t {
	pilot_state_t pilot;
	std::optional<pipe_t> current_pipe;
	float pipe_velocity_x;
	float gravitational_acceleration_y;
	float jump_velocity_y;
	float floor_y;
	std::size_t score;
	bool game_over;
};

[[nodiscard]] snapshot_t make_snapshot(const config_t& config, const state_t& state);

// Throws std::invalid_argument for non-finite values or non-positive gravity.
// An inverted gap is accepted.
void validate(const snapshot_t& snapshot);

} // namespace flappy_pilot::game_logic
