#pragma once

#include "config.hpp"
#include "state.hpp"

namespace arcade::flyer {

[[nodiscard]] bool out_of_bounds(const agent_state_t& agent);

// Open interval (agent_x, agent_x + pipe_column_width).
[[nodiscard]] bool in_pipe_column(const config_t& config, const pipe_t& pipe);

[[nodiscard]] bool hits_pipe(const config_t& config, const agent_state_t& agent, const pipe_t& pipe);

[[nodiscard]] bool collides(const config_t& config, const agent_state_t& agent, const pipe_t& pipe);

} // namespace arcade::flyer
