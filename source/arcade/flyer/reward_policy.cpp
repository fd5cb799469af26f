#include "arcade/flyer/reward_policy.hpp"
#include "arcade/flyer/collision.hpp"

namespace arcade::flyer {

reward_policy_t::reward_policy_t(const config_t& config) : m_config{ config } {
}

float reward_policy_t::collect(episode_state_t& episode, pipe_t& pipe) const {

	auto reward = m_config.alive_reward;

	if (not pipe.passed and pipe.position_x < m_config.agent_x) {
		pipe.passed = true;
		reward += m_config.pass_reward;
		++episode.score;
	}

	return reward;
}

bool reward_policy_t::terminal(const agent_state_t& agent, const pipe_t& pipe) const {
	return collides(m_config, agent, pipe);
}

} // namespace arcade::flyer
