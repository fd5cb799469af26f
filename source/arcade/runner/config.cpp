#include "arcade/runner/config.hpp"
#include "arcade/common/config_error.hpp"

#include <cmath>
#include <string>

namespace arcade::runner {

namespace {

int pixels(const int extent, const double fraction) {
	return static_cast<int>(static_cast<double>(extent) * fraction);
}

void require(const bool condition, const std::string& message) {
	if (not condition) {
		throw config_error("runner config: " + message);
	}
}

// Checked before any fraction is multiplied out into pixels.
void require_fraction(const double fraction, const std::string& name) {
	require(std::isfinite(fraction) and 0.0 <= fraction and fraction <= 1.0, name + " must lie in [0, 1]");
}

geometry_t derive(const config_t& config) {
	const auto width = config.screen_width;
	const auto height = config.screen_height;
	const auto width_f = static_cast<double>(width);

	return geometry_t{
		.screen_width = width,
		.screen_height = height,
		.ground_y = pixels(height, config.ground_line_fraction),
		.agent_x = pixels(width, config.agent_x_fraction),
		.agent_width = pixels(width, config.agent_width_fraction),
		.agent_height = pixels(height, config.agent_height_fraction),
		.obstacle_min_width = pixels(width, config.obstacle_min_width_fraction),
		.obstacle_max_width = pixels(width, config.obstacle_max_width_fraction),
		.obstacle_height = pixels(height, config.obstacle_height_fraction),
		.spawn_threshold_x = static_cast<float>(width_f * config.spawn_threshold_fraction),
		.spawn_gap_min = static_cast<float>(width_f * config.spawn_gap_min_fraction),
		.spawn_gap_max = static_cast<float>(width_f * config.spawn_gap_max_fraction),
		.initial_spawn_x = static_cast<float>(width_f + width_f * config.initial_spawn_offset_fraction)
	};
}

} // namespace

void validate(const config_t& config) {
	require(config.screen_width > 0 and config.screen_height > 0, "screen dimensions must be positive");
	require(config.max_steps > 0, "max_steps must be positive");

	for (const auto value : { config.gravity,
	                          config.jump_velocity,
	                          config.max_fall_speed,
	                          config.grounded_tolerance,
	                          config.base_speed,
	                          config.speed_increase,
	                          config.alive_reward,
	                          config.pass_reward,
	                          config.collision_penalty }) {
		require(std::isfinite(value), "physics and reward constants must be finite");
	}
	require(config.max_fall_speed > 0.0f, "max_fall_speed must be positive");
	require(config.base_speed > 0.0f, "base_speed must be positive");
	require(config.speed_increase >= 0.0f, "speed_increase must not be negative");
	require(config.grounded_tolerance >= 0.0f, "grounded_tolerance must not be negative");
	require(config.ground_band_rows >= 0, "ground_band_rows must not be negative");

	require_fraction(config.ground_line_fraction, "ground_line_fraction");
	require_fraction(config.agent_width_fraction, "agent_width_fraction");
	require_fraction(config.agent_height_fraction, "agent_height_fraction");
	require_fraction(config.agent_x_fraction, "agent_x_fraction");
	require_fraction(config.obstacle_min_width_fraction, "obstacle_min_width_fraction");
	require_fraction(config.obstacle_max_width_fraction, "obstacle_max_width_fraction");
	require_fraction(config.obstacle_height_fraction, "obstacle_height_fraction");
	require_fraction(config.spawn_threshold_fraction, "spawn_threshold_fraction");
	require_fraction(config.spawn_gap_min_fraction, "spawn_gap_min_fraction");
	require_fraction(config.spawn_gap_max_fraction, "spawn_gap_max_fraction");
	require_fraction(config.initial_spawn_offset_fraction, "initial_spawn_offset_fraction");

	require(
		config.spawn_gap_min_fraction <= config.spawn_gap_max_fraction,
		"spawn gap range has min > max"
	);

	const auto geometry = derive(config);

	require(geometry.agent_width > 0 and geometry.agent_height > 0, "agent size must be at least one pixel");
	require(geometry.obstacle_height > 0, "obstacle height must be at least one pixel");
	require(geometry.obstacle_min_width > 0, "obstacle width must be at least one pixel");
	require(geometry.obstacle_min_width <= geometry.obstacle_max_width, "obstacle width range has min > max");
	require(
		0 < geometry.ground_y and geometry.ground_y <= geometry.screen_height,
		"ground line must lie inside the screen"
	);
	require(geometry.agent_height <= geometry.ground_y, "agent does not fit above the ground line");
	require(geometry.obstacle_height <= geometry.ground_y, "obstacle does not fit above the ground line");
	require(
		0 <= geometry.agent_x and geometry.agent_x + geometry.agent_width <= geometry.screen_width,
		"agent must lie inside the screen"
	);
}

geometry_t make_geometry(const config_t& config) {
	validate(config);
	return derive(config);
}

} // namespace arcade::runner
