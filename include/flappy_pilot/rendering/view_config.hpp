#pragma once

namespace flappy_pilot::rendering {

// Maps field coordinates (y down, same as the window) into window pixels.
struct view_config_t {
	float scale{ 1.0f };
	float offset_x{ 0.0f };
	float offset_y{ 0.0f };
};

} // namespace flappy_pilot::rendering
