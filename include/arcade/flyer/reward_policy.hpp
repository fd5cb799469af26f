#pragma once

#include "config.hpp"
#include "state.hpp"

namespace arcade::flyer {

class reward_policy_t {
public:
	explicit reward_policy_t(const config_t& config);

	// Alive reward plus the pass bonus the first tick the pipe is left of the agent.
	[[nodiscard]] float collect(episode_state_t& episode, pipe_t& pipe) const;

	// Death costs nothing beyond the rewards that are no longer collected.
	[[nodiscard]] bool terminal(const agent_state_t& agent, const pipe_t& pipe) const;

private:
	config_t m_config;
};

} // namespace arcade::flyer
