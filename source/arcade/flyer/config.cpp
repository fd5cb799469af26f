#include "arcade/flyer/config.hpp"
#include "arcade/common/config_error.hpp"

#include <cmath>
#include <string>

namespace arcade::flyer {

namespace {

void require(const bool condition, const std::string& message) {
	if (not condition) {
		throw config_error("flyer config: " + message);
	}
}

bool inside_world(const float value) {
	return 0.0f <= value and value <= 1.0f;
}

} // namespace

void validate(const config_t& config) {

	for (const auto value : { config.gravity,
	                          config.flap_impulse,
	                          config.max_velocity_y,
	                          config.agent_x,
	                          config.start_y,
	                          config.pipe_speed,
	                          config.pipe_spawn_x,
	                          config.pipe_column_width,
	                          config.gap_half_height,
	                          config.initial_gap_min_y,
	                          config.initial_gap_max_y,
	                          config.respawn_gap_min_y,
	                          config.respawn_gap_max_y,
	                          config.alive_reward,
	                          config.pass_reward }) {
		require(std::isfinite(value), "constants must be finite");
	}

	require(config.max_velocity_y > 0.0f, "max_velocity_y must be positive");
	require(config.pipe_speed > 0.0f, "pipe_speed must be positive");
	require(config.gap_half_height > 0.0f, "gap_half_height must be positive");
	require(config.pipe_column_width > 0.0f, "pipe_column_width must be positive");

	require(inside_world(config.agent_x), "agent_x must lie inside the world");
	require(0.0f < config.start_y and config.start_y < 1.0f, "start_y must lie strictly inside the world");
	require(config.pipe_spawn_x > config.agent_x, "pipes must spawn in front of the agent");

	require(config.initial_gap_min_y <= config.initial_gap_max_y, "initial gap range has min > max");
	require(config.respawn_gap_min_y <= config.respawn_gap_max_y, "respawn gap range has min > max");
	require(
		inside_world(config.initial_gap_min_y) and inside_world(config.initial_gap_max_y),
		"initial gap range must lie inside the world"
	);
	require(
		inside_world(config.respawn_gap_min_y) and inside_world(config.respawn_gap_max_y),
		"respawn gap range must lie inside the world"
	);
}

} // namespace arcade::flyer
