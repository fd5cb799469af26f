#pragma once

#include "config.hpp"
#include "state.hpp"

#include <cinttypes>
#include <deque>

namespace arcade::runner {

struct tick_outcome_t {
	float reward{};
	bool terminated{ false };
	bool truncated{ false };
};

class reward_policy_t {
public:
	reward_policy_t(const config_t& config, const geometry_t& geometry);

	// Marks newly passed obstacles and bumps the score; everything else is read only.
	[[nodiscard]] tick_outcome_t evaluate(episode_state_t& episode, std::deque<obstacle_t>& obstacles) const;

private:
	geometry_t m_geometry;
	std::uint32_t m_max_steps;
	float m_alive_reward, m_pass_reward, m_collision_penalty;
};

} // namespace arcade::runner
