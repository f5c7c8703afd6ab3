#include "flappy_pilot/levels/builtin_levels.hpp"

namespace flappy_pilot::levels {

level_config_t simple_level() {
	return { .id = "simple",
		     .name = "Simple (1 Pipe)",
		     .description = "Single pipe to test basic logic",
		     .floor_band = { .min_y = 500, .max_y = 600 },
		     .pipes = { { 400.0f, 300.0f, 150.0f } } };
}

level_config_t medium_level() {
	return { .id = "medium",
		     .name = "Medium (5 Pipes)",
		     .description = "Five pipes with varying gaps",
		     .floor_band = { .min_y = 480, .max_y = 600 },
		     .pipes = {
				 { 400.0f, 300.0f, 150.0f },
				 { 650.0f, 250.0f, 150.0f },
				 { 900.0f, 350.0f, 140.0f },
				 { 1'150.0f, 280.0f, 160.0f },
				 { 1'400.0f, 320.0f, 150.0f },
			 } };
}

level_config_t hard_level() {
	return { .id = "hard",
		     .name = "Hard (10 Pipes)",
		     .description = "Ten pipes with challenging gaps",
		     .floor_band = { .min_y = 500, .max_y = 600 },
		     .pipes = {
				 { 400.0f, 300.0f, 150.0f },
				 { 650.0f, 200.0f, 140.0f },
				 { 900.0f, 380.0f, 140.0f },
				 { 1'150.0f, 250.0f, 145.0f },
				 { 1'400.0f, 350.0f, 140.0f },
				 { 1'650.0f, 220.0f, 150.0f },
				 { 1'900.0f, 330.0f, 140.0f },
				 { 2'150.0f, 270.0f, 145.0f },
				 { 2'400.0f, 310.0f, 140.0f },
				 { 2'650.0f, 290.0f, 150.0f },
			 } };
}

level_config_t floor_test_level() {
	return { .id = "floor_test",
		     .name = "Floor Test",
		     .description = "No pipes, just floor avoidance",
		     .floor_band = { .min_y = 500, .max_y = 600 },
		     .pipes = {} };
}

level_config_t marathon_level(std::mt19937& rng) {

	static constexpr auto pipe_count = 200;
	static constexpr auto first_pipe_x = 400.0f;
	static constexpr auto pipe_spacing_x = 350.0f;
	static constexpr auto min_gap_height = 150.0f, max_gap_height = 200.0f;
	static constexpr auto field_height = 600.0f;
	static constexpr auto margin_top = 40.0f, margin_bottom = 40.0f;

	auto level = level_config_t{ .id = "marathon",
		                         .name = "Marathon (200 Pipes!)",
		                         .description = "Ultimate stress test with 200 pipes",
		                         .floor_band = { .min_y = 550, .max_y = 600 },
		                         .pipes = {} };

	level.pipes.reserve(pipe_count);

	std::uniform_real_distribution<float> unit_distrib(0.0f, 1.0f);

	for (int i{}; i != pipe_count; ++i) {
		const auto gap_height = min_gap_height + unit_distrib(rng) * (max_gap_height - min_gap_height);

		const auto min_center = margin_top + gap_height / 2.0f;
		const auto max_center = field_height - margin_bottom - gap_height / 2.0f;
		const auto gap_center = min_center + unit_distrib(rng) * (max_center - min_center);

		level.pipes.push_back({ .position_x = first_pipe_x + static_cast<float>(i) * pipe_spacing_x,
		                        .gap_center = gap_center,
		                        .gap_height = gap_height });
	}

	return level;
}

std::vector<std::string_view> builtin_level_ids() {
	return { "simple", "medium", "hard", "floor_test", "marathon" };
}

level_config_t builtin_level(const std::string_view id, std::mt19937& rng) {
	if (id == "simple") {
		return simple_level();
	}
	if (id == "medium") {
		return medium_level();
	}
	if (id == "hard") {
		return hard_level();
	}
	if (id == "floor_test") {
		return floor_test_level();
	}
	return marathon_level(rng);
}

} // namespace flappy_pilot::levels
