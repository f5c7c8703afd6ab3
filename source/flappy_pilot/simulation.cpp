#include "flappy_pilot/simulation.hpp"

namespace flappy_pilot {

simulation_t::simulation_t(const game_logic::config_t& game_config, const autopilot::config_t& autopilot_config) :
	m_physics_engine{ game_config },
	m_autopilot{ game_config, autopilot_config },
	m_level{ .floor_y = game_config.field_height, .pipes = {} } {
	reset();
}

void simulation_t::load(const levels::materialized_level_t& level) {
	m_level = level;
	reset();
}

void simulation_t::reset() {
	m_state = m_physics_engine.initial_state(m_level.floor_y, m_level.pipes);
	m_will_jump = false;
}

void simulation_t::jump() {
	if (not m_state.game_over) {
		m_will_jump = true;
	}
}

void simulation_t::set_autopilot(const bool enabled) {
	m_autopilot_enabled = enabled;
}

bool simulation_t::autopilot_enabled() const {
	return m_autopilot_enabled;
}

tick_result_t simulation_t::update() {

	auto result = tick_result_t{};

	if (m_autopilot_enabled and not m_state.game_over) {
		result.decision = m_autopilot.decide(snapshot());
		m_will_jump = m_will_jump or result.decision->jump;
	}

	result.step = m_physics_engine.update(m_state, m_will_jump);
	m_will_jump = false;

	return result;
}

game_logic::snapshot_t simulation_t::snapshot() const {
	return game_logic::make_snapshot(m_physics_engine.config(), m_state);
}

const game_logic::state_t& simulation_t::state() const {
	return m_state;
}

const game_logic::config_t& simulation_t::game_config() const {
	return m_physics_engine.config();
}

const autopilot::autopilot_t& simulation_t::autopilot() const {
	return m_autopilot;
}

} // namespace flappy_pilot
