#include "arcade/runner/collision.hpp"

#include <algorithm>

namespace arcade::runner {

box_t agent_box(const geometry_t& geometry, const agent_state_t& agent) {
	return { .left = static_cast<float>(geometry.agent_x),
		     .right = static_cast<float>(geometry.agent_x + geometry.agent_width),
		     .top = agent.position_y,
		     .bottom = agent.position_y + static_cast<float>(geometry.agent_height) };
}

box_t obstacle_box(const geometry_t& geometry, const obstacle_t& obstacle) {
	return { .left = obstacle.position_x,
		     .right = obstacle.position_x + static_cast<float>(obstacle.width),
		     .top = geometry.obstacle_top_y(),
		     .bottom = static_cast<float>(geometry.ground_y) };
}

bool overlaps(const box_t& a, const box_t& b) {
	return a.right > b.left and a.left < b.right and a.bottom > b.top and a.top < b.bottom;
}

bool collides(const geometry_t& geometry, const agent_state_t& agent, const std::deque<obstacle_t>& obstacles) {
	const auto agent_bounds = agent_box(geometry, agent);
	return std::any_of(obstacles.begin(), obstacles.end(), [&](const obstacle_t& obstacle) {
		return overlaps(agent_bounds, obstacle_box(geometry, obstacle));
	});
}

} // namespace arcade::runner
