#include "arcade/common/config_error.hpp"
#include "arcade/flyer/autopilot.hpp"
#include "arcade/flyer/environment.hpp"
#include "arcade/rollout.hpp"
#include "arcade/runner/autopilot.hpp"
#include "arcade/runner/environment.hpp"
#include "util/integer_range.hpp"

#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>

namespace arcade::rollout {
namespace {

const auto make_runner_autopilot = [](const runner::environment_t& environment) {
	return runner::autopilot_t(environment.geometry());
};

const auto make_flyer_autopilot = [](const flyer::environment_t&) {
	return flyer::autopilot_t{};
};

void expect_same_results(const std::vector<copy_result_t>& a, const std::vector<copy_result_t>& b) {
	ASSERT_EQ(a.size(), b.size());
	for (std::size_t i{}; i != a.size(); ++i) {
		EXPECT_EQ(a[i].seed, b[i].seed);
		ASSERT_EQ(a[i].episodes.size(), b[i].episodes.size());
		for (std::size_t j{}; j != a[i].episodes.size(); ++j) {
			const auto& x = a[i].episodes[j];
			const auto& y = b[i].episodes[j];
			EXPECT_EQ(x.score, y.score);
			EXPECT_EQ(x.steps, y.steps);
			EXPECT_EQ(x.total_reward, y.total_reward);
			EXPECT_EQ(x.terminated, y.terminated);
			EXPECT_EQ(x.truncated, y.truncated);
		}
	}
}

TEST(RolloutTest, ResultsDoNotDependOnThreadCount) {
	auto config = config_t{ .copies = 5, .episodes_per_copy = 2, .thread_count = 1, .base_seed = 100, .max_steps_per_episode = 600 };
	const auto single = run<flyer::environment_t>(flyer::config_t{}, make_flyer_autopilot, config);

	config.thread_count = 3;
	const auto threaded = run<flyer::environment_t>(flyer::config_t{}, make_flyer_autopilot, config);

	expect_same_results(single, threaded);
}

TEST(RolloutTest, MoreThreadsThanCopiesIsFine) {
	const auto config = config_t{ .copies = 2, .thread_count = 16, .max_steps_per_episode = 50 };
	const auto results = run<runner::environment_t>(runner::config_t{}, make_runner_autopilot, config);
	ASSERT_EQ(results.size(), 2u);
	EXPECT_EQ(results[1].episodes.size(), 1u);
}

TEST(RolloutTest, CopiesAreSeededConsecutively) {
	const auto config = config_t{ .copies = 4, .base_seed = 20, .max_steps_per_episode = 200 };
	const auto results = run<flyer::environment_t>(flyer::config_t{}, make_flyer_autopilot, config);

	ASSERT_EQ(results.size(), 4u);
	for (std::uint32_t i{}; i != 4; ++i) {
		EXPECT_EQ(results[i].seed, 20u + i);

		auto environment = flyer::environment_t{};
		const auto expected = play_episode(environment, flyer::autopilot_t{}, seed_t{ 20u + i }, 200);
		EXPECT_EQ(results[i].episodes.front().steps, expected.steps);
		EXPECT_EQ(results[i].episodes.front().total_reward, expected.total_reward);
	}
}

TEST(RolloutTest, DriverCutsEpisodesOff) {
	const auto config = config_t{ .copies = 3, .episodes_per_copy = 2, .max_steps_per_episode = 30 };
	const auto results = run<runner::environment_t>(runner::config_t{}, make_runner_autopilot, config);

	for (const auto& copy : results) {
		for (const auto& episode : copy.episodes) {
			EXPECT_EQ(episode.steps, 30u);
			EXPECT_FALSE(episode.terminated);
			EXPECT_FALSE(episode.truncated);
			EXPECT_FLOAT_EQ(episode.total_reward, 30.0f);
		}
	}
}

TEST(RolloutTest, EnvironmentTruncationEndsEpisode) {
	const auto config = config_t{ .copies = 1, .max_steps_per_episode = 1'000 };
	const auto results = run<runner::environment_t>(runner::config_t{ .max_steps = 40 }, make_runner_autopilot, config);

	const auto& episode = results.front().episodes.front();
	EXPECT_EQ(episode.steps, 40u);
	EXPECT_TRUE(episode.truncated);
}

TEST(RolloutTest, InvalidEnvironmentConfigThrowsOnCaller) {
	const auto config = config_t{ .copies = 4, .thread_count = 2 };
	EXPECT_THROW(
		run<flyer::environment_t>(flyer::config_t{ .pipe_speed = 0.0f }, make_flyer_autopilot, config),
		config_error
	);
}

TEST(RolloutTest, WorkerFailureIsRethrownAfterJoining) {
	const auto failing_autopilot = [](const flyer::environment_t&) -> flyer::autopilot_t {
		throw std::runtime_error("autopilot unavailable");
	};
	const auto config = config_t{ .copies = 6, .thread_count = 3, .max_steps_per_episode = 10 };
	EXPECT_THROW(run<flyer::environment_t>(flyer::config_t{}, failing_autopilot, config), std::runtime_error);
}

TEST(RolloutSummaryTest, AggregatesPerCopyMeans) {
	const std::vector<copy_result_t> copies{
		copy_result_t{ .seed = 0,
		               .episodes = { episode_result_t{ .score = 2, .total_reward = 10.0f, .steps = 100 },
		                             episode_result_t{ .score = 4, .total_reward = 20.0f, .steps = 50 } } },
		copy_result_t{ .seed = 1, .episodes = { episode_result_t{ .score = 9, .total_reward = 3.0f, .steps = 7 } } }
	};

	EXPECT_FLOAT_EQ(copies[0].mean_score(), 3.0f);
	EXPECT_FLOAT_EQ(copies[0].mean_return(), 15.0f);

	const auto summary = summarize(copies);
	EXPECT_FLOAT_EQ(summary.min_score, 3.0f);
	EXPECT_FLOAT_EQ(summary.max_score, 9.0f);
	EXPECT_FLOAT_EQ(summary.mean_score, 6.0f);
	EXPECT_FLOAT_EQ(summary.mean_return, 9.0f);
	EXPECT_EQ(summary.total_steps, 157u);
}

TEST(RolloutSummaryTest, EmptyInputGivesZeroes) {
	const auto summary = summarize({});
	EXPECT_EQ(summary.total_steps, 0u);
	EXPECT_FLOAT_EQ(summary.mean_score, 0.0f);
}

TEST(IntegerRangeTest, BalancedSegmentsDifferByAtMostOne) {
	const auto range = integer_range<std::uint32_t>::from_index_count(0, 10);

	std::vector<integer_range<std::uint32_t>> segments;
	for (const auto& segment : range.balanced_segments(3)) {
		segments.push_back(segment);
	}

	ASSERT_EQ(segments.size(), 3u);
	EXPECT_EQ(segments[0], integer_range<std::uint32_t>::from_begin_end(0, 4));
	EXPECT_EQ(segments[1], integer_range<std::uint32_t>::from_begin_end(4, 7));
	EXPECT_EQ(segments[2], integer_range<std::uint32_t>::from_begin_end(7, 10));
}

TEST(IntegerRangeTest, MoreSegmentsThanValuesLeavesEmptyTail) {
	const auto range = integer_range<std::uint32_t>::from_begin_end(5, 7);

	std::vector<std::uint32_t> sizes;
	for (const auto& segment : range.balanced_segments(4)) {
		sizes.push_back(segment.size());
	}
	EXPECT_EQ(sizes, (std::vector<std::uint32_t>{ 1, 1, 0, 0 }));
}

} // namespace
} // namespace arcade::rollout
