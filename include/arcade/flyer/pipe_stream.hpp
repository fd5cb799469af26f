#pragma once

#include "config.hpp"
#include "state.hpp"

namespace arcade::flyer {

// Single-pipe stream. The pipe scrolls left by the given speed and, once it has
// crossed the left edge, is moved back to the spawn column with a fresh gap.
// The first pipe of an episode draws its gap from a wider range than respawns do.
class pipe_stream_t {
public:
	explicit pipe_stream_t(const config_t& config);

	void reset(rng_t& rng);

	void advance(float speed);

	// Returns whether the pipe was respawned.
	bool recycle(rng_t& rng);

	[[nodiscard]] pipe_t& pipe();

	[[nodiscard]] const pipe_t& pipe() const;

private:
	config_t m_config;
	pipe_t m_pipe{ .position_x = 0.0f, .gap_center_y = 0.0f };
};

} // namespace arcade::flyer
