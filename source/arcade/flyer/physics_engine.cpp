#include "arcade/flyer/physics_engine.hpp"

#include <algorithm>

namespace arcade::flyer {

physics_engine_t::physics_engine_t(const config_t& config) :
	m_gravity{ config.gravity }, m_flap_impulse{ config.flap_impulse }, m_max_velocity_y{ config.max_velocity_y } {
}

void physics_engine_t::update(agent_state_t& agent, const action_t action) const {

	if (action == action_t::impulse) {
		agent.velocity_y += m_flap_impulse;
	}

	agent.velocity_y += m_gravity;
	agent.velocity_y = std::clamp(agent.velocity_y, -m_max_velocity_y, m_max_velocity_y);

	agent.position_y += agent.velocity_y;
}

} // namespace arcade::flyer
