#pragma once

#include "config.hpp"
#include "state.hpp"

#include <deque>

namespace arcade::runner {

struct box_t {
	float left, right, top, bottom;
};

[[nodiscard]] box_t agent_box(const geometry_t& geometry, const agent_state_t& agent);

[[nodiscard]] box_t obstacle_box(const geometry_t& geometry, const obstacle_t& obstacle);

// Strict overlap on both axes; touching edges do not collide.
[[nodiscard]] bool overlaps(const box_t& a, const box_t& b);

[[nodiscard]] bool collides(const geometry_t& geometry, const agent_state_t& agent, const std::deque<obstacle_t>& obstacles);

} // namespace arcade::runner
