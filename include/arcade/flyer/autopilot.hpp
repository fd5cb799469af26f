#pragma once

#include "arcade/common/types.hpp"
#include "observation_encoder.hpp"

namespace arcade::flyer {

struct autopilot_config_t {
	float target_offset_y{ 0.0f }; // relative to the gap centre
	float gain{ 0.1f };            // desired vy per unit of height error
	float margin{ 0.01f };
};

// Proportional climb controller: flaps whenever the vertical velocity lags the
// velocity that would close the distance to the gap centre.
class autopilot_t {
public:
	explicit autopilot_t(const autopilot_config_t& config = {});

	[[nodiscard]] action_t act(const observation_t& observation) const;

private:
	autopilot_config_t m_config;
};

} // namespace arcade::flyer
