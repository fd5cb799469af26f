#include "arcade/runner/observation_encoder.hpp"

#include <algorithm>

namespace arcade::runner {

observation_encoder_t::observation_encoder_t(const config_t& config, const geometry_t& geometry) :
	m_geometry{ geometry }, m_ground_band_rows{ config.ground_band_rows } {
}

frame_t observation_encoder_t::make_frame() const {
	return frame_t{
		.height = m_geometry.screen_height,
		.width = m_geometry.screen_width,
		.channels = 1,
		.pixels = std::vector<std::uint8_t>(
			static_cast<std::size_t>(m_geometry.screen_height) * m_geometry.screen_width,
			background_intensity
		)
	};
}

void observation_encoder_t::encode(
	const agent_state_t& agent, const std::deque<obstacle_t>& obstacles, frame_t& frame
) const {

	std::fill(frame.pixels.begin(), frame.pixels.end(), background_intensity);

	const auto& g = m_geometry;

	fill(frame, g.ground_y, g.ground_y + m_ground_band_rows, 0, g.screen_width);

	fill(
		frame,
		static_cast<int>(agent.position_y),
		static_cast<int>(agent.position_y + static_cast<float>(g.agent_height)),
		g.agent_x,
		g.agent_x + g.agent_width
	);

	const auto obstacle_top = g.ground_y - g.obstacle_height;
	for (const auto& obstacle : obstacles) {
		const auto left = static_cast<int>(obstacle.position_x);
		const auto right = static_cast<int>(obstacle.position_x + static_cast<float>(obstacle.width));
		fill(frame, obstacle_top, g.ground_y, left, right);
	}
}

frame_t observation_encoder_t::to_rgb(const frame_t& frame) {
	auto rgb = frame_t{ .height = frame.height, .width = frame.width, .channels = 3, .pixels = {} };
	rgb.pixels.reserve(frame.pixels.size() * 3);
	for (const auto intensity : frame.pixels) {
		rgb.pixels.insert(rgb.pixels.end(), 3, intensity);
	}
	return rgb;
}

void observation_encoder_t::fill(frame_t& frame, int top, int bottom, int left, int right) {

	top = std::max(top, 0);
	bottom = std::min(bottom, frame.height);
	left = std::max(left, 0);
	right = std::min(right, frame.width);

	if (bottom <= top or right <= left) {
		return;
	}

	for (auto row = top; row != bottom; ++row) {
		const auto row_begin = frame.pixels.begin() + static_cast<std::ptrdiff_t>(row) * frame.width;
		std::fill(row_begin + left, row_begin + right, foreground_intensity);
	}
}

} // namespace arcade::runner
