#pragma once

#include <SFML/Graphics/Color.hpp>

#include <string_view>

namespace flappy_pilot::rendering {

struct color_config_t {
	sf::Color background_color{ 66, 133, 244 };
	sf::Color floor_color{ 194, 178, 128 };
	sf::Color pipe_color{ 15, 157, 88 };
	sf::Color gap_center_color{ 255, 215, 0 };
	sf::Color pilot_color{ 220, 20, 60 };
	sf::Color pilot_jump_color{ 255, 215, 0 };
	sf::Color text_color{ sf::Color::White };
	std::string_view font_file{ "PixeloidSans-mLxMm.ttf" };
};

} // namespace flappy_pilot::rendering
