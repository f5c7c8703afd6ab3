#pragma once

#include "config.hpp"
#include "flappy_pilot/game_logic/config.hpp"
#include "flappy_pilot/game_logic/snapshot.hpp"

#include <array>
#include <cinttypes>
#include <cstddef>

namespace flappy_pilot::autopilot {

// In priority order.
enum class rule_id_t : std::uint8_t {
	floor_safety,
	pipe_emergency,
	no_pipe,
	apex_fallback,
	apex,
	bottom_pipe
};

inline constexpr std::size_t rule_count{ 6 };

struct decision_t {
	bool jump;
	rule_id_t rule;
};

// Quantities every rule may read, derived once per tick.
struct context_t {
	const game_logic::snapshot_t& snapshot;
	const config_t& config;
	float apex_rise;
	float safety_margin;
	float predicted_bottom_next;
};

struct rule_t {
	rule_id_t id;
	bool (*applies)(const context_t& context);
	bool (*jump)(const context_t& context);
};

class autopilot_t {
public:
	autopilot_t(const game_logic::config_t& physics_config, const config_t& config);

	// Throws std::invalid_argument for a snapshot with non-finite values.
	[[nodiscard]] decision_t decide(const game_logic::snapshot_t& snapshot) const;

	[[nodiscard]] bool should_jump(const game_logic::snapshot_t& snapshot) const;

	[[nodiscard]] float apex_rise() const;

	[[nodiscard]] const config_t& config() const;

	// First match wins. Every predicate is safe to call without a current pipe;
	// the pipe-based ones then report false.
	[[nodiscard]] static const std::array<rule_t, rule_count>& rules();

private:
	config_t m_config;
	float m_apex_rise;
};

[[nodiscard]] float safety_margin(const config_t& config, const game_logic::pilot_state_t& pilot);

// Lowest altitude (largest y) from which one jump still peaks at the apex target.
[[nodiscard]] float minimum_y(const config_t& config, float apex_rise, const game_logic::pipe_t& pipe);

[[nodiscard]] const char* to_string(rule_id_t rule);

} // namespace flappy_pilot::autopilot
