#pragma once

#include "config.hpp"
#include "state.hpp"

#include <optional>

namespace flappy_pilot::game_logic {

struct step_result_t {
	bool jumped;
	collision_t collision;
	std::size_t score;
	bool game_over;
};

// Sets the jump velocity when requested, then integrates one explicit Euler step.
void integrate(const config_t& config, pilot_state_t& pilot, bool jump);

// Pilot after `steps` ticks of free fall.
[[nodiscard]] pilot_state_t predict(const pilot_state_t& pilot, float gravitational_acceleration_y, int steps);

void advance_pipes(const config_t& config, std::vector<pipe_t>& pipes);

// First pipe whose right edge is still strictly right of the pilot.
[[nodiscard]] std::optional<std::size_t> find_current_pipe(
	const config_t& config, const pilot_state_t& pilot, const std::vector<pipe_t>& pipes
);

[[nodiscard]] std::size_t count_passed_pipes(
	const config_t& config, const pilot_state_t& pilot, const std::vector<pipe_t>& pipes
);

// Only the current pipe is tested. Pipes must be spaced so that no two can
// overlap the pilot horizontally at once.
[[nodiscard]] collision_t detect_collision(const config_t& config, const state_t& state);

class physics_engine_t {
public:
	explicit physics_engine_t(const config_t& config);

	// Throws std::invalid_argument unless the pipes are finite and in ascending position_x.
	[[nodiscard]] state_t initial_state(float floor_y, std::vector<pipe_t> pipes) const;

	// A finished state is returned unchanged. A live state is validated first.
	step_result_t update(state_t& state, bool jump) const;

	[[nodiscard]] const config_t& config() const;

private:
	config_t m_config;
};

} // namespace flappy_pilot::game_logic
