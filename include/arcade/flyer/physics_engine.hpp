#pragma once

#include "arcade/common/types.hpp"
#include "config.hpp"
#include "state.hpp"

namespace arcade::flyer {

// Flaps add to the velocity on every tick they are requested, grounded or not.
// Position is not clamped; leaving the world is judged by the reward policy.
class physics_engine_t {
public:
	explicit physics_engine_t(const config_t& config);

	void update(agent_state_t& agent, action_t action) const;

private:
	float m_gravity, m_flap_impulse, m_max_velocity_y;
};

} // namespace arcade::flyer
