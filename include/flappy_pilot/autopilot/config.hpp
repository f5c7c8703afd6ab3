#pragma once

namespace flappy_pilot::autopilot {

struct config_t {
	// Gaps centred at or above this line are approached with the apex strategy.
	float screen_center_y{ 300.0f };

	float safety_margin_fraction{ 0.1f };
	float min_safety_margin{ 5.0f };

	float emergency_range_x{ 150.0f };
	int emergency_lookahead_steps{ 5 };

	// Fraction of the gap height, measured up from the gap bottom.
	float apex_target_fraction{ 0.75f };
	float apex_floor_clearance{ 20.0f };
};

} // namespace flappy_pilot::autopilot
