#include "arcade/flyer/collision.hpp"

#include <cmath>

namespace arcade::flyer {

bool out_of_bounds(const agent_state_t& agent) {
	return agent.position_y <= 0.0f or agent.position_y >= 1.0f;
}

bool in_pipe_column(const config_t& config, const pipe_t& pipe) {
	return config.agent_x < pipe.position_x and pipe.position_x < config.agent_x + config.pipe_column_width;
}

bool hits_pipe(const config_t& config, const agent_state_t& agent, const pipe_t& pipe) {
	return in_pipe_column(config, pipe) and std::abs(agent.position_y - pipe.gap_center_y) > config.gap_half_height;
}

bool collides(const config_t& config, const agent_state_t& agent, const pipe_t& pipe) {
	return out_of_bounds(agent) or hits_pipe(config, agent, pipe);
}

} // namespace arcade::flyer
