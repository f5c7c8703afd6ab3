namespace flappy_pilot {

template<class Renderer>
game_engine_t<Renderer>::game_engine_t(
	const game_logic::config_t& game_config,
	const autopilot::config_t& autopilot_config,
	const levels::materialize_config_t& materialize_config,
	const renderer_config_t& renderer_config,
	const std::uint32_t seed,
	const int window_width,
	const int window_height
) :
	m_materialize_config{ materialize_config },
	m_rng{ seed },
	m_simulation{ game_config, autopilot_config },
	m_renderer{ renderer_config } {
	default_view(window_width, window_height);
}

template<class Renderer>
void game_engine_t<Renderer>::load_level(const std::string_view level_id) {
	m_level = levels::builtin_level(level_id, m_rng);
	m_simulation.load(levels::materialize(m_materialize_config, m_level, m_rng));
	m_last_decision.reset();
}

template<class Renderer>
void game_engine_t<Renderer>::jump() {
	if (not m_simulation.autopilot_enabled()) {
		m_simulation.jump();
	}
}

template<class Renderer>
void game_engine_t<Renderer>::toggle_autopilot() {
	m_simulation.set_autopilot(not m_simulation.autopilot_enabled());
	m_last_decision.reset();
}

template<class Renderer>
void game_engine_t<Renderer>::toggle_pause() {
	m_paused = not m_paused;
}

template<class Renderer>
bool game_engine_t<Renderer>::update() {
	if (m_paused) {
		return m_simulation.state().game_over;
	}

	const auto tick = m_simulation.update();
	if (tick.decision) {
		m_last_decision = tick.decision;
	}
	return tick.step.game_over;
}

template<class Renderer>
void game_engine_t<Renderer>::render(sf::RenderWindow& window) {
	const auto hud = rendering::hud_t{ .autopilot = m_simulation.autopilot_enabled(),
		                               .paused = m_paused,
		                               .decision = m_last_decision,
		                               .level_name = m_level.name };
	m_renderer.render(m_view_config, m_simulation.game_config(), m_simulation.state(), hud, window);
}

template<class Renderer>
void game_engine_t<Renderer>::reset() {
	m_simulation.reset();
	m_last_decision.reset();
}

template<class Renderer>
void game_engine_t<Renderer>::default_view(const int window_width, const int window_height) {
	const auto& game_config = m_simulation.game_config();

	const auto scale_x = static_cast<float>(window_width) / game_config.field_width;
	const auto scale_y = static_cast<float>(window_height) / game_config.field_height;

	m_view_config.scale = std::min(scale_x, scale_y);
	m_view_config.offset_x = (static_cast<float>(window_width) - m_view_config.scale * game_config.field_width) / 2.0f;
	m_view_config.offset_y = (static_cast<float>(window_height) - m_view_config.scale * game_config.field_height) /
		2.0f;
}

template<class Renderer>
const simulation_t& game_engine_t<Renderer>::simulation() const {
	return m_simulation;
}

} // namespace flappy_pilot
