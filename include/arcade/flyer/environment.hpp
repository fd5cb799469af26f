#pragma once

#include "arcade/common/types.hpp"
#include "collision.hpp"
#include "config.hpp"
#include "observation_encoder.hpp"
#include "physics_engine.hpp"
#include "pipe_stream.hpp"
#include "reward_policy.hpp"
#include "state.hpp"

#include <optional>

namespace arcade::flyer {

using reset_result_t = arcade::reset_result_t<observation_t, info_t>;
using step_result_t = arcade::step_result_t<observation_t, info_t>;

// Side-scrolling flyer with a four-feature observation.
//
// Episodes end when the agent leaves the world or hits the pipe inside its column;
// they are never truncated. Same reset/step preconditions as runner::environment_t.
class environment_t {
public:
	using config_type = config_t;

	static constexpr int render_fps{ 30 };

	explicit environment_t(const config_t& config = {});

	reset_result_t reset(std::optional<seed_t> seed = std::nullopt);

	step_result_t step(action_t action);

	void close();

	[[nodiscard]] static box_space_t observation_space();

	[[nodiscard]] static discrete_space_t action_space();

	[[nodiscard]] const config_t& config() const;

	[[nodiscard]] episode_phase_t phase() const;

	[[nodiscard]] info_t info() const;

	[[nodiscard]] observation_t observation() const;

	episode_state_t& state();

	[[nodiscard]] const episode_state_t& state() const;

	pipe_stream_t& pipe_stream();

	[[nodiscard]] const pipe_stream_t& pipe_stream() const;

private:
	config_t m_config;
	physics_engine_t m_physics_engine;
	pipe_stream_t m_pipe_stream;
	reward_policy_t m_reward_policy;

	episode_state_t m_state;
	episode_phase_t m_phase{ episode_phase_t::unready };
};

} // namespace arcade::flyer
