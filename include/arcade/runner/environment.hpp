#pragma once

#include "arcade/common/types.hpp"
#include "collision.hpp"
#include "config.hpp"
#include "obstacle_stream.hpp"
#include "observation_encoder.hpp"
#include "physics_engine.hpp"
#include "reward_policy.hpp"
#include "state.hpp"

#include <optional>

namespace arcade::runner {

using observation_t = frame_t;
using reset_result_t = arcade::reset_result_t<observation_t, info_t>;
using step_result_t = arcade::step_result_t<observation_t, info_t>;

// Obstacle runner with a rasterized observation.
//
// The agent sits at a fixed column and can only jump while grounded. Obstacles scroll in
// from the right at a speed that grows every step. An episode terminates on the first
// collision and is truncated after config_t::max_steps steps.
//
// reset() must be called before the first step(), and again after a step() that returned
// terminated or truncated. Neither condition is checked.
class environment_t {
public:
	using config_type = config_t;

	static constexpr int render_fps{ 30 };

	explicit environment_t(const config_t& config = {});

	reset_result_t reset(std::optional<seed_t> seed = std::nullopt);

	step_result_t step(action_t action);

	// RGB copy of the most recent observation.
	[[nodiscard]] frame_t render_rgb() const;

	void close();

	[[nodiscard]] box_space_t observation_space() const;

	[[nodiscard]] static discrete_space_t action_space();

	[[nodiscard]] const config_t& config() const;

	[[nodiscard]] const geometry_t& geometry() const;

	[[nodiscard]] episode_phase_t phase() const;

	[[nodiscard]] bool on_ground() const;

	[[nodiscard]] info_t info() const;

	// Direct access for viewers and tests; writes bypass every invariant.
	episode_state_t& state();

	[[nodiscard]] const episode_state_t& state() const;

	obstacle_stream_t& obstacle_stream();

	[[nodiscard]] const obstacle_stream_t& obstacle_stream() const;

private:
	config_t m_config;
	geometry_t m_geometry;
	physics_engine_t m_physics_engine;
	obstacle_stream_t m_obstacle_stream;
	reward_policy_t m_reward_policy;
	observation_encoder_t m_observation_encoder;

	episode_state_t m_state;
	episode_phase_t m_phase{ episode_phase_t::unready };
	frame_t m_frame;
};

} // namespace arcade::runner
