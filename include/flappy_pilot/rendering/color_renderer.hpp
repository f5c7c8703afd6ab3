#pragma once

#include "flappy_pilot/autopilot/autopilot.hpp"
#include "flappy_pilot/game_logic/config.hpp"
#include "flappy_pilot/game_logic/state.hpp"
#include "flappy_pilot/rendering/color_config.hpp"
#include "flappy_pilot/rendering/view_config.hpp"

#include <SFML/Graphics/Font.hpp>
#include <SFML/Graphics/RectangleShape.hpp>
#include <SFML/Graphics/RenderWindow.hpp>
#include <SFML/Graphics/Text.hpp>
#include <optional>
#include <string>

namespace flappy_pilot::rendering {

using game_config_t = game_logic::config_t;
using game_state_t = game_logic::state_t;

struct hud_t {
	bool autopilot;
	bool paused;
	std::optional<flappy_pilot::autopilot::decision_t> decision;
	std::string level_name;
};

class color_renderer_t {
public:
	using config_t = color_config_t;

	explicit color_renderer_t(const color_config_t& color_config);

	void render(
		const view_config_t& view_config,
		const game_config_t& game_config,
		const game_state_t& game_state,
		const hud_t& hud,
		sf::RenderWindow& window
	);

private:
	const color_config_t m_color_config;

	bool m_has_font{ false };
	sf::Font m_font;
	sf::Text m_score_text, m_info_text;
	sf::RectangleShape m_pilot_rect;
	sf::RectangleShape m_pipe_rect;
	sf::RectangleShape m_gap_center_rect;
	sf::RectangleShape m_floor_rect;
};

} // namespace flappy_pilot::rendering
