#include "arcade/runner/environment.hpp"

namespace arcade::runner {

environment_t::environment_t(const config_t& config) :
	m_config(config),
	m_geometry{ make_geometry(m_config) },
	m_physics_engine{ m_config, m_geometry },
	m_obstacle_stream{ m_geometry },
	m_reward_policy{ m_config, m_geometry },
	m_observation_encoder{ m_config, m_geometry },
	m_frame{ m_observation_encoder.make_frame() } {
}

reset_result_t environment_t::reset(const std::optional<seed_t> seed) {

	if (seed) {
		m_state.rng.seed(*seed);
	}

	m_state.steps = 0;
	m_state.score = 0;
	m_state.speed = m_config.base_speed;
	m_state.agent = agent_state_t{ .position_y = m_geometry.grounded_y(), .velocity_y = 0.0f };

	m_obstacle_stream.reset(m_state.rng);

	m_observation_encoder.encode(m_state.agent, m_obstacle_stream.obstacles(), m_frame);
	m_phase = episode_phase_t::running;

	return { .observation = m_frame, .info = info() };
}

step_result_t environment_t::step(const action_t action) {

	++m_state.steps;

	m_physics_engine.update(m_state.agent, action);

	m_state.speed += m_config.speed_increase;
	m_obstacle_stream.advance(m_state.speed, m_state.rng);

	const auto outcome = m_reward_policy.evaluate(m_state, m_obstacle_stream.obstacles());

	m_observation_encoder.encode(m_state.agent, m_obstacle_stream.obstacles(), m_frame);

	if (outcome.terminated or outcome.truncated) {
		m_phase = episode_phase_t::done;
	}

	return { .observation = m_frame,
		     .reward = outcome.reward,
		     .terminated = outcome.terminated,
		     .truncated = outcome.truncated,
		     .info = info() };
}

frame_t environment_t::render_rgb() const {
	return observation_encoder_t::to_rgb(m_frame);
}

void environment_t::close() {
}

box_space_t environment_t::observation_space() const {
	return { .low = { 0.0f },
		     .high = { 255.0f },
		     .shape = { static_cast<std::size_t>(m_geometry.screen_height),
		                static_cast<std::size_t>(m_geometry.screen_width),
		                1 },
		     .dtype = "uint8" };
}

discrete_space_t environment_t::action_space() {
	return {};
}

const config_t& environment_t::config() const {
	return m_config;
}

const geometry_t& environment_t::geometry() const {
	return m_geometry;
}

episode_phase_t environment_t::phase() const {
	return m_phase;
}

bool environment_t::on_ground() const {
	return m_physics_engine.on_ground(m_state.agent);
}

info_t environment_t::info() const {
	return { .score = m_state.score, .speed = m_state.speed, .steps = m_state.steps };
}

episode_state_t& environment_t::state() {
	return m_state;
}

const episode_state_t& environment_t::state() const {
	return m_state;
}

obstacle_stream_t& environment_t::obstacle_stream() {
	return m_obstacle_stream;
}

const obstacle_stream_t& environment_t::obstacle_stream() const {
	return m_obstacle_stream;
}

} // namespace arcade::runner
