#include "arcade/flyer/pipe_stream.hpp"

#include <random>

namespace arcade::flyer {

pipe_stream_t::pipe_stream_t(const config_t& config) : m_config{ config } {
}

void pipe_stream_t::reset(rng_t& rng) {
	std::uniform_real_distribution gap_distrib(m_config.initial_gap_min_y, m_config.initial_gap_max_y);
	m_pipe = pipe_t{ .position_x = m_config.pipe_spawn_x, .gap_center_y = gap_distrib(rng), .passed = false };
}

void pipe_stream_t::advance(const float speed) {
	m_pipe.position_x -= speed;
}

bool pipe_stream_t::recycle(rng_t& rng) {
	if (m_pipe.position_x >= 0.0f) {
		return false;
	}
	std::uniform_real_distribution gap_distrib(m_config.respawn_gap_min_y, m_config.respawn_gap_max_y);
	m_pipe = pipe_t{ .position_x = m_config.pipe_spawn_x, .gap_center_y = gap_distrib(rng), .passed = false };
	return true;
}

pipe_t& pipe_stream_t::pipe() {
	return m_pipe;
}

const pipe_t& pipe_stream_t::pipe() const {
	return m_pipe;
}

} // namespace arcade::flyer
