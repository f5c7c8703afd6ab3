#pragma once

#include <cinttypes>
#include <cstddef>
#include <vector>

namespace flappy_pilot::game_logic {

struct pilot_state_t {
	float position_x;
	float position_y;
	float velocity_y;
	float width;
	float height;
};

struct pipe_t {
	float position_x;
	float gap_top;
	float gap_bottom;

	[[nodiscard]] float gap_height() const {
		return gap_bottom - gap_top;
	}

	[[nodiscard]] float gap_center() const {
		return (gap_top + gap_bottom) / 2.0f;
	}
};

enum class collision_t : std::uint8_t {
	none,
	floor,
	ceiling,
	pipe
};

struct state_t {
	pilot_state_t pilot;
	std::vector<pipe_t> pipes; // ascending position_x
	float floor_y;
	std::size_t score;
	std::size_t frame_count;
	bool game_over;
	collision_t collision;
};

[[nodiscard]] const char* to_string(collision_t collision);

// Throws std::invalid_argument for non-finite coordinates.
void validate(const pipe_t& pipe);

// Throws std::invalid_argument for non-finite values or a non-positive size.
void validate(const pilot_state_t& pilot);

// Pilot, floor and every pipe, plus ascending pipe order.
void validate(const state_t& state);

} // namespace flappy_pilot::game_logic
