#include "flappy_pilot/game_logic/snapshot.hpp"

#include "flappy_pilot/game_logic/physics_engine.hpp"

#include <cmath>
#include <stdexcept>

namespace flappy_pilot::game_logic {

snapshot_t make_snapshot(const config_t& config, const state_t& state) {

	std::optional<pipe_t> current_pipe;
	if (const auto index = find_current_pipe(config, state.pilot, state.pipes)) {
		current_pipe = state.pipes[*index];
	}

	return { .pilot = state.pilot,
		     .current_pipe = current_pipe,
		     .pipe_velocity_x = config.pipe_velocity_x,
		     .gravitational_acceleration_y = config.gravitational_acceleration_y,
		     .jump_velocity_y = config.jump_velocity_y,
		     .floor_y = state.floor_y,
		     .score = state.score,
		     .game_over = state.game_over };
}

void validate(const snapshot_t& snapshot) {

	validate(snapshot.pilot);

	if (snapshot.current_pipe) {
		validate(*snapshot.current_pipe);
	}

	if (not std::isfinite(snapshot.floor_y)) {
		throw std::invalid_argument("floor_y must be finite");
	}
	if (not(std::isfinite(snapshot.gravitational_acceleration_y) and snapshot.gravitational_acceleration_y > 0.0f)) {
		throw std::invalid_argument("gravitational_acceleration_y must be positive and finite");
	}
}

} // namespace flappy_pilot::game_logic
