#include "flappy_pilot/autopilot/autopilot.hpp"

#include "flappy_pilot/game_logic/physics_engine.hpp"

#include <algorithm>

namespace flappy_pilot::autopilot {

namespace {

bool always(const context_t&) {
	return true;
}

bool never(const context_t&) {
	return false;
}

bool has_pipe(const context_t& context) {
	return context.snapshot.current_pipe.has_value();
}

bool gap_in_upper_half(const context_t& context) {
	return has_pipe(context) and context.snapshot.current_pipe->gap_center() <= context.config.screen_center_y;
}

bool next_bottom_reaches(const context_t& context, const float limit_y) {
	return context.predicted_bottom_next + context.safety_margin >= limit_y;
}

bool floor_safety_applies(const context_t& context) {
	return next_bottom_reaches(context, context.snapshot.floor_y);
}

bool pipe_emergency_applies(const context_t& context) {
	if (not has_pipe(context)) {
		return false;
	}

	const auto& snapshot = context.snapshot;
	const auto& pipe = *snapshot.current_pipe;

	const auto distance_x = pipe.position_x - snapshot.pilot.position_x;
	if (not(0.0f < distance_x and distance_x < context.config.emergency_range_x)) {
		return false;
	}

	const auto predicted = game_logic::predict(
		snapshot.pilot,
		snapshot.gravitational_acceleration_y,
		context.config.emergency_lookahead_steps
	);

	return predicted.position_y + predicted.height >= pipe.gap_bottom;
}

bool no_pipe_applies(const context_t& context) {
	return not has_pipe(context);
}

bool apex_fallback_applies(const context_t& context) {
	if (not gap_in_upper_half(context)) {
		return false;
	}
	const auto lowest_y = minimum_y(context.config, context.apex_rise, *context.snapshot.current_pipe);
	return lowest_y >= context.snapshot.floor_y - context.config.apex_floor_clearance;
}

bool apex_jump(const context_t& context) {
	if (not has_pipe(context)) {
		return false;
	}
	const auto lowest_y = minimum_y(context.config, context.apex_rise, *context.snapshot.current_pipe);
	return context.snapshot.pilot.position_y >= lowest_y;
}

bool bottom_pipe_jump(const context_t& context) {
	return has_pipe(context) and next_bottom_reaches(context, context.snapshot.current_pipe->gap_bottom);
}

const std::array<rule_t, rule_count> cascade{ {
	{ rule_id_t::floor_safety, floor_safety_applies, always },
	{ rule_id_t::pipe_emergency, pipe_emergency_applies, always },
	{ rule_id_t::no_pipe, no_pipe_applies, never },
	{ rule_id_t::apex_fallback, apex_fallback_applies, bottom_pipe_jump },
	{ rule_id_t::apex, gap_in_upper_half, apex_jump },
	{ rule_id_t::bottom_pipe, always, bottom_pipe_jump },
} };

} // namespace

autopilot_t::autopilot_t(const game_logic::config_t& physics_config, const config_t& config) :
	m_config{ config } {
	game_logic::validate(physics_config);
	m_apex_rise = game_logic::apex_rise(physics_config);
}

decision_t autopilot_t::decide(const game_logic::snapshot_t& snapshot) const {

	game_logic::validate(snapshot);

	const auto next_velocity_y = snapshot.pilot.velocity_y + snapshot.gravitational_acceleration_y;
	const auto next_y = snapshot.pilot.position_y + next_velocity_y;

	const auto context = context_t{ .snapshot = snapshot,
		                            .config = m_config,
		                            .apex_rise = m_apex_rise,
		                            .safety_margin = safety_margin(m_config, snapshot.pilot),
		                            .predicted_bottom_next = next_y + snapshot.pilot.height };

	for (const auto& rule : cascade) {
		if (rule.applies(context)) {
			return { .jump = rule.jump(context), .rule = rule.id };
		}
	}

	// bottom_pipe always applies.
	return { .jump = false, .rule = rule_id_t::bottom_pipe };
}

bool autopilot_t::should_jump(const game_logic::snapshot_t& snapshot) const {
	return decide(snapshot).jump;
}

float autopilot_t::apex_rise() const {
	return m_apex_rise;
}

const config_t& autopilot_t::config() const {
	return m_config;
}

const std::array<rule_t, rule_count>& autopilot_t::rules() {
	return cascade;
}

float safety_margin(const config_t& config, const game_logic::pilot_state_t& pilot) {
	return std::max({ pilot.height * config.safety_margin_fraction,
	                  pilot.width * config.safety_margin_fraction,
	                  config.min_safety_margin });
}

float minimum_y(const config_t& config, const float apex_rise, const game_logic::pipe_t& pipe) {
	const auto target_y = pipe.gap_bottom - pipe.gap_height() * config.apex_target_fraction;
	return target_y + apex_rise;
}

const char* to_string(const rule_id_t rule) {
	switch (rule) {
	case rule_id_t::floor_safety:
		return "floor_safety";
	case rule_id_t::pipe_emergency:
		return "pipe_emergency";
	case rule_id_t::no_pipe:
		return "no_pipe";
	case rule_id_t::apex_fallback:
		return "apex_fallback";
	case rule_id_t::apex:
		return "apex";
	case rule_id_t::bottom_pipe:
		return "bottom_pipe";
	}
	return "unknown";
}

} // namespace flappy_pilot::autopilot
