#include "flappy_pilot/game_logic/state.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace flappy_pilot::game_logic {

const char* to_string(const collision_t collision) {
	switch (collision) {
	case collision_t::none:
		return "none";
	case collision_t::floor:
		return "floor";
	case collision_t::ceiling:
		return "ceiling";
	case collision_t::pipe:
		return "pipe";
	}
	return "unknown";
}

void validate(const pipe_t& pipe) {
	if (not std::isfinite(pipe.position_x) or not std::isfinite(pipe.gap_top) or not std::isfinite(pipe.gap_bottom)) {
		throw std::invalid_argument("pipe coordinates must be finite");
	}
}

void validate(const pilot_state_t& pilot) {
	if (not std::isfinite(pilot.position_x) or not std::isfinite(pilot.position_y) or
	    not std::isfinite(pilot.velocity_y)) {
		throw std::invalid_argument("pilot position and velocity must be finite");
	}
	if (not(pilot.width > 0.0f and pilot.height > 0.0f) or not std::isfinite(pilot.width) or
	    not std::isfinite(pilot.height)) {
		throw std::invalid_argument("pilot size must be positive and finite");
	}
}

void validate(const state_t& state) {
	validate(state.pilot);

	if (not std::isfinite(state.floor_y)) {
		throw std::invalid_argument("floor_y must be finite");
	}

	for (const auto& pipe : state.pipes) {
		validate(pipe);
	}

	const auto by_position_x = [](const pipe_t& a, const pipe_t& b) { return a.position_x < b.position_x; };
	if (not std::is_sorted(state.pipes.begin(), state.pipes.end(), by_position_x)) {
		throw std::invalid_argument("pipes must be in ascending position_x");
	}
}

} // namespace flappy_pilot::game_logic
