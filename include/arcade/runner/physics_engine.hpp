#pragma once

#include "arcade/common/types.hpp"
#include "config.hpp"
#include "state.hpp"

namespace arcade::runner {

class physics_engine_t {
public:
	physics_engine_t(const config_t& config, const geometry_t& geometry);

	[[nodiscard]] bool on_ground(const agent_state_t& agent) const;

	void update(agent_state_t& agent, action_t action) const;

private:
	float m_gravity, m_jump_velocity, m_max_fall_speed, m_grounded_tolerance;
	float m_grounded_y;
};

} // namespace arcade::runner
