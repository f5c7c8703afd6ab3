#include "flappy_pilot/game_logic/config.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace flappy_pilot::game_logic {

void validate(const config_t& config) {

	const auto require_finite = [](const float value, const char* name) {
		if (not std::isfinite(value)) {
			throw std::invalid_argument(std::string(name) + " must be finite");
		}
	};

	require_finite(config.gravitational_acceleration_y, "gravitational_acceleration_y");
	require_finite(config.jump_velocity_y, "jump_velocity_y");
	require_finite(config.pilot_x, "pilot_x");
	require_finite(config.pilot_width, "pilot_width");
	require_finite(config.pilot_height, "pilot_height");
	require_finite(config.pipe_velocity_x, "pipe_velocity_x");
	require_finite(config.pipe_width, "pipe_width");
	require_finite(config.field_width, "field_width");
	require_finite(config.field_height, "field_height");

	if (config.gravitational_acceleration_y <= 0.0f) {
		throw std::invalid_argument("gravitational_acceleration_y must be positive (downward)");
	}
	if (config.jump_velocity_y >= 0.0f) {
		throw std::invalid_argument("jump_velocity_y must be negative (upward)");
	}
	if (config.pilot_width <= 0.0f or config.pilot_height <= 0.0f) {
		throw std::invalid_argument("pilot dimensions must be positive");
	}
	if (config.pipe_width < 0.0f) {
		throw std::invalid_argument("pipe_width must not be negative");
	}
	if (config.pipe_velocity_x < 0.0f) {
		throw std::invalid_argument("pipe_velocity_x must not be negative");
	}
	if (config.field_height <= 0.0f) {
		throw std::invalid_argument("field_height must be positive");
	}
}

float apex_rise(const config_t& config) {
	return (config.jump_velocity_y * config.jump_velocity_y) / (2.0f * config.gravitational_acceleration_y);
}

} // namespace flappy_pilot::game_logic
