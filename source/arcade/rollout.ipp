#include "util/integer_range.hpp"

#include <algorithm>
#include <exception>
#include <thread>

namespace arcade::rollout {

template<class Environment, class Autopilot>
episode_result_t play_episode(
	Environment& environment, const Autopilot& autopilot, const std::optional<seed_t> seed, const std::uint32_t max_steps
) {
	auto result = episode_result_t{};

	auto observation = environment.reset(seed).observation;

	while (result.steps != max_steps) {
		const auto step = environment.step(autopilot.act(observation));
		++result.steps;
		result.total_reward += step.reward;
		result.score = step.info.score;
		result.terminated = step.terminated;
		result.truncated = step.truncated;
		if (step.done()) {
			break;
		}
		observation = step.observation;
	}

	environment.close();

	return result;
}

template<class Environment, class AutopilotFactory>
std::vector<copy_result_t> run(
	const typename Environment::config_type& environment_config,
	const AutopilotFactory& make_autopilot,
	const config_t& config
) {
	// Fail on a bad config here rather than inside a worker thread.
	{
		[[maybe_unused]] const auto probe = Environment(environment_config);
	}

	std::vector<copy_result_t> results(config.copies);

	const auto run_copy = [&](const std::uint32_t copy_index) {
		auto environment = Environment(environment_config);
		const auto autopilot = make_autopilot(environment);

		auto& copy = results[copy_index];
		copy.seed = config.base_seed + copy_index;
		copy.episodes.reserve(config.episodes_per_copy);

		for (std::uint32_t episode_index{}; episode_index != config.episodes_per_copy; ++episode_index) {
			// Only the first reset is seeded; later episodes continue the copy's stream.
			const auto seed = episode_index == 0 ? std::optional<seed_t>{ copy.seed } : std::nullopt;
			copy.episodes.push_back(play_episode(environment, autopilot, seed, config.max_steps_per_episode));
		}
	};

	const auto copy_range = integer_range<std::uint32_t>::from_index_count(0, config.copies);
	const auto thread_count = std::clamp<std::uint32_t>(config.thread_count, 1, std::max(config.copies, 1u));

	// One slot per thread; the first failure is rethrown once every thread has been joined.
	std::vector<std::exception_ptr> failures(thread_count);
	std::vector<std::thread> threads;
	threads.reserve(thread_count);

	const auto join_all = [&]() {
		for (auto& thread : threads) {
			thread.join();
		}
	};

	try {
		std::size_t thread_index{};
		for (const auto& segment : copy_range.balanced_segments(thread_count)) {
			threads.emplace_back([&, segment, thread_index]() {
				try {
					for (const auto copy_index : segment.indices()) {
						run_copy(copy_index);
					}
				} catch (...) {
					failures[thread_index] = std::current_exception();
				}
			});
			++thread_index;
		}
	} catch (...) {
		join_all();
		throw;
	}
	join_all();

	for (const auto& failure : failures) {
		if (failure) {
			std::rethrow_exception(failure);
		}
	}

	return results;
}

} // namespace arcade::rollout
