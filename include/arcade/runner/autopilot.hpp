#pragma once

#include "arcade/common/types.hpp"
#include "config.hpp"
#include "observation_encoder.hpp"

namespace arcade::runner {

struct autopilot_config_t {
	int lookahead_min{ 4 }; // pixels in front of the agent's right edge
	int lookahead_max{ 8 };
};

// Scripted stand-in for a trained policy. Reads only the observation: jumps when
// obstacle pixels show up in the row just above the ground inside the look-ahead window.
class autopilot_t {
public:
	explicit autopilot_t(const geometry_t& geometry, const autopilot_config_t& config = {});

	[[nodiscard]] action_t act(const frame_t& frame) const;

private:
	int m_scan_row;
	int m_scan_begin, m_scan_end;
};

} // namespace arcade::runner
