#pragma once

#include "config.hpp"
#include "state.hpp"

#include <array>

namespace arcade::flyer {

inline constexpr std::size_t feature_count{ 4 };

// [ agent y, agent vy, horizontal distance to the pipe in [0, 1], gap centre y ]
using observation_t = std::array<float, feature_count>;

namespace features {
inline constexpr std::size_t position_y{ 0 }, velocity_y{ 1 }, pipe_distance_x{ 2 }, gap_center_y{ 3 };
} // namespace features

[[nodiscard]] observation_t encode(const config_t& config, const agent_state_t& agent, const pipe_t& pipe);

} // namespace arcade::flyer
