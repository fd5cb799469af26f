#include "arcade/flyer/environment.hpp"

namespace arcade::flyer {

namespace {

const config_t& validated(const config_t& config) {
	validate(config);
	return config;
}

} // namespace

environment_t::environment_t(const config_t& config) :
	m_config(validated(config)),
	m_physics_engine{ m_config },
	m_pipe_stream{ m_config },
	m_reward_policy{ m_config } {
}

reset_result_t environment_t::reset(const std::optional<seed_t> seed) {

	if (seed) {
		m_state.rng.seed(*seed);
	}

	m_state.steps = 0;
	m_state.score = 0;
	m_state.agent = agent_state_t{ .position_y = m_config.start_y, .velocity_y = 0.0f };

	m_pipe_stream.reset(m_state.rng);
	m_phase = episode_phase_t::running;

	return { .observation = observation(), .info = info() };
}

step_result_t environment_t::step(const action_t action) {

	++m_state.steps;

	m_physics_engine.update(m_state.agent, action);
	m_pipe_stream.advance(m_config.pipe_speed);

	// The pass is judged before a pipe that left the screen is respawned.
	const auto reward = m_reward_policy.collect(m_state, m_pipe_stream.pipe());
	m_pipe_stream.recycle(m_state.rng);

	const auto terminated = m_reward_policy.terminal(m_state.agent, m_pipe_stream.pipe());
	if (terminated) {
		m_phase = episode_phase_t::done;
	}

	return { .observation = observation(),
		     .reward = reward,
		     .terminated = terminated,
		     .truncated = false,
		     .info = info() };
}

void environment_t::close() {
}

box_space_t environment_t::observation_space() {
	return { .low = { 0.0f, -1.0f, 0.0f, 0.0f },
		     .high = { 1.0f, 1.0f, 1.0f, 1.0f },
		     .shape = { feature_count },
		     .dtype = "float32" };
}

discrete_space_t environment_t::action_space() {
	return {};
}

const config_t& environment_t::config() const {
	return m_config;
}

episode_phase_t environment_t::phase() const {
	return m_phase;
}

info_t environment_t::info() const {
	return { .score = m_state.score };
}

observation_t environment_t::observation() const {
	return encode(m_config, m_state.agent, m_pipe_stream.pipe());
}

episode_state_t& environment_t::state() {
	return m_state;
}

const episode_state_t& environment_t::state() const {
	return m_state;
}

pipe_stream_t& environment_t::pipe_stream() {
	return m_pipe_stream;
}

const pipe_stream_t& environment_t::pipe_stream() const {
	return m_pipe_stream;
}

} // namespace arcade::flyer
