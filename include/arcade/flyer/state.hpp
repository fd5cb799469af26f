#pragma once

#include "arcade/common/random.hpp"

#include <cinttypes>

namespace arcade::flyer {

struct agent_state_t {
	float position_y;
	float velocity_y; // positive is upward
};

// The single live pipe. `passed` is cleared only when the pipe respawns.
struct pipe_t {
	float position_x;
	float gap_center_y;
	bool passed{ false };
};

struct episode_state_t {
	agent_state_t agent;
	std::uint32_t steps{};
	std::uint32_t score{};
	rng_t rng{ entropy_seed() };
};

struct info_t {
	std::uint32_t score{};
};

} // namespace arcade::flyer
