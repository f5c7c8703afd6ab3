#pragma once

#include "autopilot/config.hpp"
#include "game_logic/config.hpp"
#include "levels/builtin_levels.hpp"
#include "levels/level_config.hpp"
#include "levels/materialize.hpp"
#include "rendering/color_config.hpp"
#include "rendering/color_renderer.hpp"
#include "rendering/view_config.hpp"
#include "simulation.hpp"

#include <SFML/Graphics/RenderWindow.hpp>
#include <algorithm>
#include <cinttypes>
#include <optional>
#include <random>
#include <string_view>

namespace flappy_pilot {

// Interactive driving loop around one simulation.
template<class Renderer>
class game_engine_t {
public:
	using renderer_config_t = typename Renderer::config_t;

	game_engine_t(
		const game_logic::config_t& game_config,
		const autopilot::config_t& autopilot_config,
		const levels::materialize_config_t& materialize_config,
		const renderer_config_t& renderer_config,
		std::uint32_t seed,
		int window_width,
		int window_height
	);

	// Materializes the level again, so the floor is resampled.
	void load_level(std::string_view level_id);

	void jump();

	void toggle_autopilot();

	void toggle_pause();

	bool update();

	void render(sf::RenderWindow& window);

	void reset();

	void default_view(int window_width, int window_height);

	[[nodiscard]] const simulation_t& simulation() const;

private:
	levels::materialize_config_t m_materialize_config;
	std::mt19937 m_rng;
	levels::level_config_t m_level;
	simulation_t m_simulation;
	Renderer m_renderer;
	rendering::view_config_t m_view_config;

	std::optional<autopilot::decision_t> m_last_decision;
	bool m_paused{ false };
};

} // namespace flappy_pilot

#include "flappy_pilot/game_engine.ipp"
