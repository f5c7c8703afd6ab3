#include "flappy_pilot/levels/materialize.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace flappy_pilot::levels {

void validate(const level_config_t& level) {

	if (level.floor_band.min_y > level.floor_band.max_y) {
		throw std::invalid_argument("level '" + level.id + "': floor band min exceeds max");
	}

	for (const auto& request : level.pipes) {
		if (not std::isfinite(request.position_x) or not std::isfinite(request.gap_center) or
		    not std::isfinite(request.gap_height)) {
			throw std::invalid_argument("level '" + level.id + "': pipe request values must be finite");
		}
		if (request.gap_height <= 0.0f) {
			throw std::invalid_argument("level '" + level.id + "': gap height must be positive");
		}
	}

	const auto by_position_x = [](const pipe_request_t& a, const pipe_request_t& b) {
		return a.position_x < b.position_x;
	};
	if (not std::is_sorted(level.pipes.begin(), level.pipes.end(), by_position_x)) {
		throw std::invalid_argument("level '" + level.id + "': pipes must be in ascending position_x");
	}
}

void validate(const materialize_config_t& config) {

	const auto non_negative = [](const float value) { return std::isfinite(value) and value >= 0.0f; };

	if (not non_negative(config.margin_top) or not non_negative(config.margin_bottom_from_floor)) {
		throw std::invalid_argument("materialize margins must be finite and non-negative");
	}
	if (not(std::isfinite(config.field_height) and config.field_height > 0.0f)) {
		throw std::invalid_argument("materialize field_height must be finite and positive");
	}
}

int sample_floor(const floor_band_t& floor_band, std::mt19937& rng) {
	std::uniform_int_distribution<int> floor_distrib(floor_band.min_y, floor_band.max_y);
	return floor_distrib(rng);
}

game_logic::pipe_t place_pipe(const materialize_config_t& config, const pipe_request_t& request, const float floor_y) {

	const auto half_gap = request.gap_height / 2.0f;

	const auto min_center = config.margin_top + half_gap;
	const auto max_center = floor_y - config.margin_bottom_from_floor - half_gap;

	auto center = request.gap_center;
	if (max_center < min_center) {
		center = (min_center + max_center) / 2.0f;
	} else {
		center = std::clamp(center, min_center, max_center);
	}

	return { .position_x = request.position_x, .gap_top = center - half_gap, .gap_bottom = center + half_gap };
}

materialized_level_t materialize(const materialize_config_t& config, const level_config_t& level, std::mt19937& rng) {

	validate(config);
	validate(level);

	auto floor_y = static_cast<float>(sample_floor(level.floor_band, rng));

	if (level.pipes.empty()) {
		floor_y = std::clamp(floor_y, 0.0f, config.field_height - 1.0f);
		return { .floor_y = floor_y, .pipes = {} };
	}

	auto materialized = materialized_level_t{ .floor_y = floor_y, .pipes = {} };
	materialized.pipes.reserve(level.pipes.size());

	for (const auto& request : level.pipes) {
		materialized.pipes.push_back(place_pipe(config, request, floor_y));
	}

	return materialized;
}

} // namespace flappy_pilot::levels
