#pragma once

#include <string>
#include <vector>

namespace flappy_pilot::levels {

struct floor_band_t {
	int min_y;
	int max_y; // inclusive
};

struct pipe_request_t {
	float position_x;
	float gap_center;
	float gap_height;
};

struct level_config_t {
	std::string id;
	std::string name;
	std::string description;
	floor_band_t floor_band;
	std::vector<pipe_request_t> pipes; // ascending position_x
};

} // namespace flappy_pilot::levels
