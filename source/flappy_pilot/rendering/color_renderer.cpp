#include "flappy_pilot/rendering/color_renderer.hpp"

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace flappy_pilot::rendering {

color_renderer_t::color_renderer_t(const color_config_t& color_config) : m_color_config{ color_config } {
	const auto current_path = std::filesystem::current_path();
	const auto font_file = current_path / ".." / "assets" / "fonts" / m_color_config.font_file;

	m_has_font = m_font.loadFromFile(font_file.string());
	if (not m_has_font) {
		std::cerr << "Could not open font file: " << font_file << ", drawing without text." << std::endl;
	}

	m_score_text.setFont(m_font);
	m_score_text.setFillColor(m_color_config.text_color);
	m_score_text.setOutlineColor(sf::Color::Black);

	m_info_text.setFont(m_font);
	m_info_text.setFillColor(m_color_config.text_color);
}

void color_renderer_t::render(
	const view_config_t& view_config,
	const game_config_t& game_config,
	const game_state_t& game_state,
	const hud_t& hud,
	sf::RenderWindow& window
) {

	window.clear(sf::Color::Black);

	const auto to_window_x = [&](const float x) { return view_config.offset_x + view_config.scale * x; };
	const auto to_window_y = [&](const float y) { return view_config.offset_y + view_config.scale * y; };
	const auto measure = [&](const float size) { return view_config.scale * size; };

	const auto field_window_width = measure(game_config.field_width);
	const auto field_window_height = measure(game_config.field_height);

	// Background
	m_floor_rect.setPosition(to_window_x(0.0f), to_window_y(0.0f));
	m_floor_rect.setSize({ field_window_width, field_window_height });
	m_floor_rect.setFillColor(m_color_config.background_color);
	window.draw(m_floor_rect);

	// Pipes
	const auto pipe_window_width = measure(game_config.pipe_width);
	m_pipe_rect.setFillColor(m_color_config.pipe_color);
	m_pipe_rect.setOutlineColor(sf::Color::Black);
	m_pipe_rect.setOutlineThickness(-1.0f);
	m_gap_center_rect.setFillColor(m_color_config.gap_center_color);

	for (const auto& pipe : game_state.pipes) {
		if (pipe.position_x > game_config.field_width or pipe.position_x + game_config.pipe_width < 0.0f) {
			continue;
		}

		const auto pipe_window_x = to_window_x(pipe.position_x);

		m_pipe_rect.setPosition(pipe_window_x, to_window_y(0.0f));
		m_pipe_rect.setSize({ pipe_window_width, measure(pipe.gap_top) });
		window.draw(m_pipe_rect);

		m_pipe_rect.setPosition(pipe_window_x, to_window_y(pipe.gap_bottom));
		m_pipe_rect.setSize({ pipe_window_width, measure(game_config.field_height - pipe.gap_bottom) });
		window.draw(m_pipe_rect);

		m_gap_center_rect.setPosition(pipe_window_x, to_window_y(pipe.gap_center()) - 1.0f);
		m_gap_center_rect.setSize({ pipe_window_width, 2.0f });
		window.draw(m_gap_center_rect);
	}

	// Floor
	if (game_state.floor_y < game_config.field_height) {
		m_floor_rect.setPosition(to_window_x(0.0f), to_window_y(game_state.floor_y));
		m_floor_rect.setSize({ field_window_width, measure(game_config.field_height - game_state.floor_y) });
		m_floor_rect.setFillColor(m_color_config.floor_color);
		window.draw(m_floor_rect);
	}

	// Pilot
	const auto& pilot = game_state.pilot;
	const auto jumping = hud.decision and hud.decision->jump;
	m_pilot_rect.setFillColor(jumping ? m_color_config.pilot_jump_color : m_color_config.pilot_color);
	m_pilot_rect.setPosition(to_window_x(pilot.position_x), to_window_y(pilot.position_y));
	m_pilot_rect.setSize({ measure(pilot.width), measure(pilot.height) });
	window.draw(m_pilot_rect);

	if (not m_has_font) {
		return;
	}

	const auto window_height = static_cast<float>(window.getSize().y);

	m_score_text.setString("Score: " + std::to_string(game_state.score));
	const auto text_size = 0.06f * window_height;
	m_score_text.setCharacterSize(static_cast<unsigned int>(text_size));
	m_score_text.setOutlineThickness(0.05f * text_size);
	m_score_text.setPosition(to_window_x(10.0f), to_window_y(10.0f));
	window.draw(m_score_text);

	std::ostringstream info;
	info << std::fixed << std::setprecision(2);
	info << hud.level_name << '\n';
	info << "Frame: " << game_state.frame_count << '\n';
	info << "Velocity: " << pilot.velocity_y << '\n';
	info << (hud.autopilot ? "Autopilot" : "Manual");
	if (hud.decision) {
		info << " | " << autopilot::to_string(hud.decision->rule) << (hud.decision->jump ? " -> jump" : "");
	}
	if (hud.paused) {
		info << "\nPAUSED";
	}
	if (game_state.game_over) {
		info << "\nGAME OVER (" << game_logic::to_string(game_state.collision) << ") - press R to restart";
	}

	m_info_text.setString(info.str());
	m_info_text.setCharacterSize(static_cast<unsigned int>(0.03f * window_height));
	m_info_text.setPosition(to_window_x(10.0f), to_window_y(10.0f) + 1.2f * text_size);
	window.draw(m_info_text);
}

} // namespace flappy_pilot::rendering
