#include "arcade/flyer/autopilot.hpp"

namespace arcade::flyer {

autopilot_t::autopilot_t(const autopilot_config_t& config) : m_config{ config } {
}

action_t autopilot_t::act(const observation_t& observation) const {
	const auto target_y = observation[features::gap_center_y] + m_config.target_offset_y;
	const auto desired_velocity_y = m_config.gain * (target_y - observation[features::position_y]);
	return observation[features::velocity_y] < desired_velocity_y - m_config.margin ? action_t::impulse
	                                                                                : action_t::idle;
}

} // namespace arcade::flyer
