#pragma once

#include <cinttypes>

namespace arcade::runner {

// World is in pixels, y grows downward. Sizes given as fractions of the
// screen are truncated to whole pixels when the geometry is built.
struct config_t {
	int screen_width{ 84 };
	int screen_height{ 84 };
	std::uint32_t max_steps{ 5'000 };

	double ground_line_fraction{ 0.7 };
	double agent_width_fraction{ 0.06 };
	double agent_height_fraction{ 0.18 };
	double agent_x_fraction{ 0.15 };

	float gravity{ 0.5f };
	float jump_velocity{ -6.0f };
	float max_fall_speed{ 10.0f };
	float grounded_tolerance{ 1.0f };

	double obstacle_min_width_fraction{ 0.04 };
	double obstacle_max_width_fraction{ 0.08 };
	double obstacle_height_fraction{ 0.15 };

	float base_speed{ 1.0f };
	float speed_increase{ 0.001f };

	double spawn_threshold_fraction{ 0.6 };
	double spawn_gap_min_fraction{ 0.3 };
	double spawn_gap_max_fraction{ 0.6 };
	double initial_spawn_offset_fraction{ 0.3 };

	int ground_band_rows{ 2 };

	float alive_reward{ 1.0f };
	float pass_reward{ 10.0f };
	float collision_penalty{ 50.0f };
};

struct geometry_t {
	int screen_width, screen_height;
	int ground_y;
	int agent_x, agent_width, agent_height;
	int obstacle_min_width, obstacle_max_width, obstacle_height;
	float spawn_threshold_x;
	float spawn_gap_min, spawn_gap_max;
	float initial_spawn_x;

	[[nodiscard]] float grounded_y() const {
		return static_cast<float>(ground_y - agent_height);
	}

	[[nodiscard]] float obstacle_top_y() const {
		return static_cast<float>(ground_y - obstacle_height);
	}
};

// Throws config_error describing the first inconsistency found.
void validate(const config_t& config);

[[nodiscard]] geometry_t make_geometry(const config_t& config);

} // namespace arcade::runner
