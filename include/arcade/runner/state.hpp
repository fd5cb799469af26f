#pragma once

#include "arcade/common/random.hpp"

#include <cinttypes>

namespace arcade::runner {

struct agent_state_t {
	float position_y; // top edge
	float velocity_y; // positive is downward
};

struct obstacle_t {
	float position_x; // left edge
	int width;
	bool passed{ false };
};

struct episode_state_t {
	agent_state_t agent;
	std::uint32_t steps{};
	std::uint32_t score{};
	float speed{};
	rng_t rng{ entropy_seed() };
};

struct info_t {
	std::uint32_t score{};
	float speed{};
	std::uint32_t steps{};
};

} // namespace arcade::runner
