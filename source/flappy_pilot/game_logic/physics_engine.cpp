#include "flappy_pilot/game_logic/physics_engine.hpp"

#include <algorithm>
#include <utility>

namespace flappy_pilot::game_logic {

void integrate(const config_t& config, pilot_state_t& pilot, const bool jump) {
	if (jump) {
		pilot.velocity_y = config.jump_velocity_y;
	}
	pilot.velocity_y += config.gravitational_acceleration_y;
	pilot.position_y += pilot.velocity_y;
}

pilot_state_t predict(const pilot_state_t& pilot, const float gravitational_acceleration_y, const int steps) {
	auto predicted = pilot;
	for (int i{}; i != steps; ++i) {
		predicted.velocity_y += gravitational_acceleration_y;
		predicted.position_y += predicted.velocity_y;
	}
	return predicted;
}

void advance_pipes(const config_t& config, std::vector<pipe_t>& pipes) {
	for (auto& pipe : pipes) {
		pipe.position_x -= config.pipe_velocity_x;
	}
}

std::optional<std::size_t> find_current_pipe(
	const config_t& config, const pilot_state_t& pilot, const std::vector<pipe_t>& pipes
) {
	const auto it = std::find_if(pipes.begin(), pipes.end(), [&](const pipe_t& pipe) {
		return pipe.position_x + config.pipe_width > pilot.position_x;
	});

	if (it == pipes.end()) {
		return std::nullopt;
	}
	return static_cast<std::size_t>(it - pipes.begin());
}

std::size_t count_passed_pipes(const config_t& config, const pilot_state_t& pilot, const std::vector<pipe_t>& pipes) {
	return static_cast<std::size_t>(std::count_if(pipes.begin(), pipes.end(), [&](const pipe_t& pipe) {
		return pipe.position_x + config.pipe_width < pilot.position_x;
	}));
}

collision_t detect_collision(const config_t& config, const state_t& state) {

	const auto& pilot = state.pilot;

	const auto pilot_left = pilot.position_x;
	const auto pilot_right = pilot.position_x + pilot.width;
	const auto pilot_top = pilot.position_y;
	const auto pilot_bottom = pilot.position_y + pilot.height;

	if (pilot_bottom >= state.floor_y) {
		return collision_t::floor;
	}

	if (pilot_top <= 0.0f) {
		return collision_t::ceiling;
	}

	const auto current_pipe_index = find_current_pipe(config, pilot, state.pipes);
	if (not current_pipe_index) {
		return collision_t::none;
	}

	const auto& pipe = state.pipes[*current_pipe_index];
	const auto pipe_left = pipe.position_x;
	const auto pipe_right = pipe.position_x + config.pipe_width;

	if (pilot_right > pipe_left and pilot_left < pipe_right) {
		if (pilot_top < pipe.gap_top or pilot_bottom > pipe.gap_bottom) {
			return collision_t::pipe;
		}
	}

	return collision_t::none;
}

physics_engine_t::physics_engine_t(const config_t& config) : m_config{ config } {
	validate(m_config);
}

state_t physics_engine_t::initial_state(const float floor_y, std::vector<pipe_t> pipes) const {

	auto state = state_t{ .pilot = { .position_x = m_config.pilot_x,
		                             .position_y = m_config.field_height / 2.0f,
		                             .velocity_y = 0.0f,
		                             .width = m_config.pilot_width,
		                             .height = m_config.pilot_height },
		                  .pipes = std::move(pipes),
		                  .floor_y = floor_y,
		                  .score = 0,
		                  .frame_count = 0,
		                  .game_over = false,
		                  .collision = collision_t::none };

	validate(state);

	return state;
}

step_result_t physics_engine_t::update(state_t& state, const bool jump) const {

	if (state.game_over) {
		return { .jumped = false, .collision = state.collision, .score = state.score, .game_over = true };
	}

	validate(state);

	++state.frame_count;

	integrate(m_config, state.pilot, jump);
	advance_pipes(m_config, state.pipes);

	state.score = count_passed_pipes(m_config, state.pilot, state.pipes);

	state.collision = detect_collision(m_config, state);
	state.game_over = state.collision != collision_t::none;

	return { .jumped = jump, .collision = state.collision, .score = state.score, .game_over = state.game_over };
}

const config_t& physics_engine_t::config() const {
	return m_config;
}

} // namespace flappy_pilot::game_logic
