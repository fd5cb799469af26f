#include "arcade/runner/autopilot.hpp"

#include <algorithm>

namespace arcade::runner {

autopilot_t::autopilot_t(const geometry_t& geometry, const autopilot_config_t& config) :
	m_scan_row{ geometry.ground_y - 1 },
	m_scan_begin{ geometry.agent_x + geometry.agent_width + config.lookahead_min },
	m_scan_end{ geometry.agent_x + geometry.agent_width + config.lookahead_max + 1 } {
}

action_t autopilot_t::act(const frame_t& frame) const {

	if (m_scan_row < 0 or m_scan_row >= frame.height) {
		return action_t::idle;
	}

	const auto begin = std::clamp(m_scan_begin, 0, frame.width);
	const auto end = std::clamp(m_scan_end, begin, frame.width);

	for (auto column = begin; column != end; ++column) {
		if (frame.at(m_scan_row, column) != background_intensity) {
			return action_t::impulse;
		}
	}
	return action_t::idle;
}

} // namespace arcade::runner
