#pragma once

#include "flappy_pilot/autopilot/autopilot.hpp"
#include "flappy_pilot/autopilot/config.hpp"
#include "flappy_pilot/game_logic/config.hpp"
#include "flappy_pilot/game_logic/state.hpp"
#include "flappy_pilot/levels/level_config.hpp"
#include "flappy_pilot/levels/materialize.hpp"

#include <array>
#include <cinttypes>
#include <span>
#include <string>
#include <vector>

namespace flappy_pilot::evaluation {

struct config_t {
	game_logic::config_t game_config;
	autopilot::config_t autopilot_config;
	levels::materialize_config_t materialize_config;
};

struct run_request_t {
	levels::level_config_t level;
	std::uint32_t seed;
	std::size_t max_frames;
};

struct run_result_t {
	std::string level_id;
	std::uint32_t seed;
	float floor_y;
	std::size_t frames;
	std::size_t score;
	std::size_t pipe_count;
	game_logic::collision_t collision;
	bool completed; // no collision before all pipes were passed or the frame limit
	std::array<std::size_t, autopilot::rule_count> rule_counts;
	std::size_t jump_count;
};

// Runs the autopilot until game over, until every pipe is passed, or for
// `max_frames` ticks, whichever comes first.
[[nodiscard]] run_result_t run(const config_t& config, const run_request_t& request);

// Each run owns its simulation and random engine. Results keep request order.
[[nodiscard]] std::vector<run_result_t> evaluate_batch(
	const config_t& config, std::span<const run_request_t> requests, std::uint32_t thread_count
);

} // namespace flappy_pilot::evaluation
