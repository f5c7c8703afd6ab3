#pragma once

namespace flappy_pilot::game_logic {

struct config_t {
	float gravitational_acceleration_y{ 0.5f };
	float jump_velocity_y{ -8.0f };

	float pilot_x{ 100.0f };
	float pilot_width{ 30.0f };
	float pilot_height{ 30.0f };

	float pipe_velocity_x{ 3.0f };
	float pipe_width{ 60.0f };

	float field_width{ 800.0f };
	float field_height{ 600.0f };
};

// Throws std::invalid_argument for constants the physics cannot run on.
void validate(const config_t& config);

// Height gained by a single jump before gravity cancels it: v² / (2g).
[[nodiscard]] float apex_rise(const config_t& config);

} // namespace flappy_pilot::game_logic
