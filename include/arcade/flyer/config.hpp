#pragma once

namespace arcade::flyer {

// World is normalised to [0, 1] on both axes, y grows upward.
struct config_t {
	float gravity{ -0.002f };
	float flap_impulse{ 0.03f };
	float max_velocity_y{ 0.3f };

	float agent_x{ 0.2f };
	float start_y{ 0.5f };

	float pipe_speed{ 0.01f };
	float pipe_spawn_x{ 1.0f };
	float pipe_column_width{ 0.05f };
	float gap_half_height{ 0.1f };
	float initial_gap_min_y{ 0.1f }, initial_gap_max_y{ 0.9f };
	float respawn_gap_min_y{ 0.3f }, respawn_gap_max_y{ 0.7f };

	float alive_reward{ 0.01f };
	float pass_reward{ 1.0f };
};

// Throws config_error describing the first inconsistency found.
void validate(const config_t& config);

} // namespace arcade::flyer
