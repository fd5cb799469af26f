#include "arcade/runner/obstacle_stream.hpp"

#include <algorithm>
#include <random>

namespace arcade::runner {

obstacle_stream_t::obstacle_stream_t(const geometry_t& geometry) : m_geometry{ geometry } {
}

void obstacle_stream_t::reset(rng_t& rng) {
	m_obstacles.clear();
	spawn(rng, true);
}

void obstacle_stream_t::advance(const float speed, rng_t& rng) {

	for (auto& obstacle : m_obstacles) {
		obstacle.position_x -= speed;
	}

	std::erase_if(m_obstacles, [](const obstacle_t& obstacle) {
		return obstacle.position_x + static_cast<float>(obstacle.width) <= 0.0f;
	});

	if (m_obstacles.empty() or m_obstacles.back().position_x < m_geometry.spawn_threshold_x) {
		spawn(rng, false);
	}
}

std::deque<obstacle_t>& obstacle_stream_t::obstacles() {
	return m_obstacles;
}

const std::deque<obstacle_t>& obstacle_stream_t::obstacles() const {
	return m_obstacles;
}

void obstacle_stream_t::spawn(rng_t& rng, const bool initial) {

	// Width is drawn before the gap so a seed always yields the same sequence.
	std::uniform_int_distribution width_distrib(m_geometry.obstacle_min_width, m_geometry.obstacle_max_width);
	const auto width = width_distrib(rng);

	auto position_x = m_geometry.initial_spawn_x;
	if (not initial) {
		std::uniform_real_distribution gap_distrib(m_geometry.spawn_gap_min, m_geometry.spawn_gap_max);
		position_x = static_cast<float>(m_geometry.screen_width) + gap_distrib(rng);
	}

	m_obstacles.push_back(obstacle_t{ .position_x = position_x, .width = width, .passed = false });
}

} // namespace arcade::runner
