#pragma once

#include "arcade/common/random.hpp"
#include "arcade/common/types.hpp"

#include <cinttypes>
#include <optional>
#include <vector>

namespace arcade::rollout {

struct config_t {
	std::uint32_t copies{ 8 };
	std::uint32_t episodes_per_copy{ 1 };
	std::uint32_t thread_count{ 1 };
	seed_t base_seed{ 0 };
	// Cut-off applied by the driver, independent of any truncation by the environment.
	std::uint32_t max_steps_per_episode{ 10'000 };
};

struct episode_result_t {
	std::uint32_t score{};
	float total_reward{};
	std::uint32_t steps{};
	bool terminated{ false };
	bool truncated{ false };
};

struct copy_result_t {
	seed_t seed{};
	std::vector<episode_result_t> episodes;

	[[nodiscard]] float mean_score() const;
	[[nodiscard]] float mean_return() const;
};

struct summary_t {
	float min_score{}, mean_score{}, max_score{};
	float mean_return{};
	std::uint64_t total_steps{};
};

// Plays one episode with `autopilot` choosing every action from the latest observation.
// A seed reseeds the environment; without one its random stream continues.
template<class Environment, class Autopilot>
episode_result_t play_episode(
	Environment& environment, const Autopilot& autopilot, std::optional<seed_t> seed, std::uint32_t max_steps
);

// Runs `config.copies` independent environments, copy `i` seeded with `base_seed + i`,
// split into balanced contiguous segments over `config.thread_count` threads.
// The result does not depend on the thread count.
//
// `make_autopilot` is called once per copy with the copy's environment.
// Throws config_error from the calling thread if `environment_config` is invalid. An exception
// thrown while running a copy is rethrown here once every worker has been joined.
template<class Environment, class AutopilotFactory>
std::vector<copy_result_t> run(
	const typename Environment::config_type& environment_config,
	const AutopilotFactory& make_autopilot,
	const config_t& config
);

[[nodiscard]] summary_t summarize(const std::vector<copy_result_t>& copies);

} // namespace arcade::rollout

#include "arcade/rollout.ipp"
