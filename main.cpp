#include "flappy_pilot/evaluation/evaluation.hpp"
#include "flappy_pilot/game_engine.hpp"
#include "flappy_pilot/levels/builtin_levels.hpp"
#include "flappy_pilot/options.hpp"
#include "flappy_pilot/rendering/color_renderer.hpp"

#include <SFML/Window/Event.hpp>
#include <chrono>
#include <cstdlib>
#include <exception>
#include <iomanip>
#include <iostream>
#include <random>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace {

int run_headless(const flappy_pilot::options_t& options) {

	const auto config = flappy_pilot::evaluation::config_t{};

	auto level_ids = flappy_pilot::levels::builtin_level_ids();
	if (options.level_id) {
		level_ids = { *options.level_id };
	}

	std::vector<flappy_pilot::evaluation::run_request_t> requests;
	for (const auto& level_id : level_ids) {
		for (std::uint32_t i{}; i != options.seed_count; ++i) {
			const auto seed = options.seed + i;
			std::mt19937 level_rng{ seed };
			requests.push_back({ .level = flappy_pilot::levels::builtin_level(level_id, level_rng),
			                     .seed = seed,
			                     .max_frames = options.max_frames });
		}
	}

	std::cout << "Running " << requests.size() << " games on " << options.thread_count << " thread(s)..."
			  << std::endl;

	const auto start = std::chrono::steady_clock::now();
	const auto results = flappy_pilot::evaluation::evaluate_batch(config, requests, options.thread_count);
	const auto finish = std::chrono::steady_clock::now();

	std::size_t completed_count{};
	for (const auto& result : results) {
		std::cout << std::left << std::setw(12) << result.level_id << " seed " << std::setw(6) << result.seed
				  << " floor " << std::setw(4) << result.floor_y << " score " << result.score << '/'
				  << result.pipe_count << " frames " << result.frames << " jumps " << result.jump_count;
		if (result.completed) {
			std::cout << " completed";
		} else {
			std::cout << " crashed into " << flappy_pilot::game_logic::to_string(result.collision);
		}
		std::cout << std::endl;
		completed_count += static_cast<std::size_t>(result.completed);
	}

	const auto seconds = std::chrono::duration<float>(finish - start).count();
	std::cout << "Completed " << completed_count << " of " << results.size() << " games in " << seconds << "s"
			  << std::endl;

	return completed_count == results.size() ? EXIT_SUCCESS : EXIT_FAILURE;
}

int run_window(const flappy_pilot::options_t& options) {

	const auto res_width = 800, res_height = 600;

	const auto fps = 60;
	using seconds_t = std::chrono::duration<float>;
	const auto frame_time = seconds_t{ 1.0 } / static_cast<float>(fps);

	const auto level_ids = flappy_pilot::levels::builtin_level_ids();

	auto game_engine = flappy_pilot::game_engine_t<flappy_pilot::rendering::color_renderer_t>(
		flappy_pilot::game_logic::config_t{},
		flappy_pilot::autopilot::config_t{},
		flappy_pilot::levels::materialize_config_t{},
		flappy_pilot::rendering::color_config_t{},
		options.seed,
		res_width,
		res_height
	);
	game_engine.load_level(options.level_id.value_or("simple"));

	std::cout << "Controls:" << std::endl;
	std::cout << "  SPACE - jump (manual mode)" << std::endl;
	std::cout << "  A     - toggle autopilot" << std::endl;
	std::cout << "  R     - restart" << std::endl;
	std::cout << "  1-5   - select level" << std::endl;
	std::cout << "  TAB   - pause" << std::endl;
	std::cout << "  ESC   - quit" << std::endl;

	auto window = sf::RenderWindow(sf::VideoMode(res_width, res_height), "flappy_pilot", sf::Style::Default);

	bool running = true;
	bool game_over = false;
	bool reported = false;

	while (running) {
		const auto start = std::chrono::high_resolution_clock::now();

		if (game_over and not reported) {
			const auto& state = game_engine.simulation().state();
			std::cout << "score: " << state.score << " (" << flappy_pilot::game_logic::to_string(state.collision)
					  << " collision after " << state.frame_count << " frames)" << std::endl;
			reported = true;
		}

		sf::Event event;
		while (window.pollEvent(event)) {
			if (event.type == sf::Event::Closed) {
				running = false;
			} else if (event.type == sf::Event::Resized) {
				window.setView(sf::View(
					{ 0.0f, 0.0f, static_cast<float>(event.size.width), static_cast<float>(event.size.height) }
				));
				game_engine.default_view(static_cast<int>(event.size.width), static_cast<int>(event.size.height));
			} else if (event.type == sf::Event::KeyPressed) {
				switch (event.key.code) {
				case sf::Keyboard::Escape:
					running = false;
					break;
				case sf::Keyboard::Tab:
					game_engine.toggle_pause();
					break;
				case sf::Keyboard::R:
					game_engine.reset();
					game_over = reported = false;
					break;
				case sf::Keyboard::A:
					game_engine.toggle_autopilot();
					break;
				case sf::Keyboard::Space:
					game_engine.jump();
					break;
				default:
					if (sf::Keyboard::Num1 <= event.key.code and event.key.code <= sf::Keyboard::Num5) {
						const auto level_index = static_cast<std::size_t>(event.key.code - sf::Keyboard::Num1);
						if (level_index < level_ids.size()) {
							game_engine.load_level(level_ids[level_index]);
							game_over = reported = false;
						}
					}
					break;
				}
			}
		}

		if (not game_over) {
			game_over = game_engine.update();
		}

		game_engine.render(window);
		window.display();

		const auto finish = std::chrono::high_resolution_clock::now();
		std::this_thread::sleep_for(frame_time - (finish - start));
	}

	return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char** argv) {
	try {
		const auto options = flappy_pilot::parse_options(argc, argv);
		if (options.headless) {
			return run_headless(options);
		}
		return run_window(options);
	} catch (const std::exception& e) {
		std::cerr << "flappy_pilot: " << e.what() << std::endl;
		return EXIT_FAILURE;
	}
}
