#include "arcade/runner/physics_engine.hpp"

#include <algorithm>

namespace arcade::runner {

physics_engine_t::physics_engine_t(const config_t& config, const geometry_t& geometry) :
	m_gravity{ config.gravity },
	m_jump_velocity{ config.jump_velocity },
	m_max_fall_speed{ config.max_fall_speed },
	m_grounded_tolerance{ config.grounded_tolerance },
	m_grounded_y{ geometry.grounded_y() } {
}

bool physics_engine_t::on_ground(const agent_state_t& agent) const {
	// Integration can leave the body a fraction of a pixel above the ground after a snap.
	return agent.position_y >= m_grounded_y - m_grounded_tolerance;
}

void physics_engine_t::update(agent_state_t& agent, const action_t action) const {

	if (action == action_t::impulse and on_ground(agent)) {
		agent.velocity_y = m_jump_velocity;
	}

	agent.velocity_y = std::min(agent.velocity_y + m_gravity, m_max_fall_speed);
	agent.position_y += agent.velocity_y;

	// The ground snap is the only way back into the grounded state.
	if (agent.position_y > m_grounded_y) {
		agent.position_y = m_grounded_y;
		agent.velocity_y = 0.0f;
	}

	// Negative rows would wrap around in the rasterized frame.
	if (agent.position_y < 0.0f) {
		agent.position_y = 0.0f;
		agent.velocity_y = 0.0f;
	}
}

} // namespace arcade::runner
