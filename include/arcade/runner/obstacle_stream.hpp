#pragma once

#include "config.hpp"
#include "state.hpp"

#include <deque>

namespace arcade::runner {

// Owns the obstacles of one episode, ordered by spawn time (and therefore by position).
// Obstacles scroll left by the current speed every tick, are retired once their right
// edge leaves the screen and are replaced on the right with a random width and gap.
class obstacle_stream_t {
public:
	explicit obstacle_stream_t(const geometry_t& geometry);

	void reset(rng_t& rng);

	void advance(float speed, rng_t& rng);

	[[nodiscard]] std::deque<obstacle_t>& obstacles();

	[[nodiscard]] const std::deque<obstacle_t>& obstacles() const;

private:
	void spawn(rng_t& rng, bool initial);

	geometry_t m_geometry;
	std::deque<obstacle_t> m_obstacles;
};

} // namespace arcade::runner
