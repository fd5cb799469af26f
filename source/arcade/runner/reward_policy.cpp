#include "arcade/runner/reward_policy.hpp"
#include "arcade/runner/collision.hpp"

namespace arcade::runner {

reward_policy_t::reward_policy_t(const config_t& config, const geometry_t& geometry) :
	m_geometry{ geometry },
	m_max_steps{ config.max_steps },
	m_alive_reward{ config.alive_reward },
	m_pass_reward{ config.pass_reward },
	m_collision_penalty{ config.collision_penalty } {
}

tick_outcome_t reward_policy_t::evaluate(episode_state_t& episode, std::deque<obstacle_t>& obstacles) const {

	auto outcome = tick_outcome_t{ .reward = m_alive_reward };

	outcome.truncated = episode.steps >= m_max_steps;

	const auto agent_x = static_cast<float>(m_geometry.agent_x);
	for (auto& obstacle : obstacles) {
		if (not obstacle.passed and obstacle.position_x + static_cast<float>(obstacle.width) < agent_x) {
			obstacle.passed = true;
			outcome.reward += m_pass_reward;
			++episode.score;
		}
	}

	if (collides(m_geometry, episode.agent, obstacles)) {
		outcome.reward -= m_collision_penalty;
		outcome.terminated = true;
	}

	return outcome;
}

} // namespace arcade::runner
