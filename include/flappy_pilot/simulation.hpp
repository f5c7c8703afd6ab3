#pragma once

#include "autopilot/autopilot.hpp"
#include "autopilot/config.hpp"
#include "game_logic/config.hpp"
#include "game_logic/physics_engine.hpp"
#include "game_logic/snapshot.hpp"
#include "game_logic/state.hpp"
#include "levels/materialize.hpp"

#include <optional>

namespace flappy_pilot {

struct tick_result_t {
	std::optional<autopilot::decision_t> decision; // empty unless the autopilot was consulted
	game_logic::step_result_t step;
};

class simulation_t {
public:
	simulation_t(const game_logic::config_t& game_config, const autopilot::config_t& autopilot_config);

	void load(const levels::materialized_level_t& level);

	// Pilot and pipes back to the loaded level. The floor is kept.
	void reset();

	// Consumed by the next update.
	void jump();

	void set_autopilot(bool enabled);

	[[nodiscard]] bool autopilot_enabled() const;

	tick_result_t update();

	[[nodiscard]] game_logic::snapshot_t snapshot() const;

	[[nodiscard]] const game_logic::state_t& state() const;

	[[nodiscard]] const game_logic::config_t& game_config() const;

	[[nodiscard]] const autopilot::autopilot_t& autopilot() const;

private:
	game_logic::physics_engine_t m_physics_engine;
	autopilot::autopilot_t m_autopilot;
	levels::materialized_level_t m_level;
	game_logic::state_t m_state;
	bool m_autopilot_enabled{ true };
	bool m_will_jump{ false };
};

} // namespace flappy_pilot
