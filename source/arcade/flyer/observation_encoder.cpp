#include "arcade/flyer/observation_encoder.hpp"

#include <algorithm>

namespace arcade::flyer {

observation_t encode(const config_t& config, const agent_state_t& agent, const pipe_t& pipe) {
	observation_t observation;
	observation[features::position_y] = agent.position_y;
	observation[features::velocity_y] = agent.velocity_y;
	observation[features::pipe_distance_x] = std::clamp(pipe.position_x - config.agent_x, 0.0f, 1.0f);
	observation[features::gap_center_y] = pipe.gap_center_y;
	return observation;
}

} // namespace arcade::flyer
