#include "arcade/runner/config.hpp"
#include "arcade/runner/obstacle_stream.hpp"

#include <gtest/gtest.h>
#include <vector>

namespace arcade::runner {
namespace {

class ObstacleStreamTest : public ::testing::Test {
protected:
	geometry_t geometry{ make_geometry(config_t{}) };
	obstacle_stream_t stream{ geometry };
	rng_t rng{ 42 };

	void expect_width_in_range(const obstacle_t& obstacle) const {
		EXPECT_GE(obstacle.width, geometry.obstacle_min_width);
		EXPECT_LE(obstacle.width, geometry.obstacle_max_width);
	}
};

TEST_F(ObstacleStreamTest, ResetSpawnsOneObstacleFartherOut) {
	stream.reset(rng);
	ASSERT_EQ(stream.obstacles().size(), 1u);

	const auto& first = stream.obstacles().front();
	EXPECT_FLOAT_EQ(first.position_x, 109.2f);
	EXPECT_FALSE(first.passed);
	expect_width_in_range(first);
}

TEST_F(ObstacleStreamTest, AdvanceShiftsEveryObstacleBySpeed) {
	stream.reset(rng);
	stream.advance(1.5f, rng);
	ASSERT_EQ(stream.obstacles().size(), 1u);
	EXPECT_FLOAT_EQ(stream.obstacles().front().position_x, 109.2f - 1.5f);
}

TEST_F(ObstacleStreamTest, SpawnsWhenLastObstacleCrossesThreshold) {
	stream.reset(rng);
	stream.obstacles().front().position_x = 51.0f;

	stream.advance(1.0f, rng);
	ASSERT_EQ(stream.obstacles().size(), 2u);

	const auto& spawned = stream.obstacles().back();
	EXPECT_GE(spawned.position_x, 84.0f + geometry.spawn_gap_min);
	EXPECT_LE(spawned.position_x, 84.0f + geometry.spawn_gap_max);
	EXPECT_FALSE(spawned.passed);
	expect_width_in_range(spawned);

	// The new obstacle is far out, so no further spawn.
	stream.advance(1.0f, rng);
	EXPECT_EQ(stream.obstacles().size(), 2u);
}

TEST_F(ObstacleStreamTest, RetiresObstacleOnceFullyOffScreen) {
	stream.reset(rng);
	auto& obstacles = stream.obstacles();
	obstacles.front() = obstacle_t{ .position_x = 0.5f, .width = 3, .passed = true };

	stream.advance(4.0f, rng);

	// Retired, then replaced through the regular gap spawn because the stream became empty.
	ASSERT_EQ(obstacles.size(), 1u);
	EXPECT_GE(obstacles.front().position_x, 84.0f + geometry.spawn_gap_min);
	EXPECT_FALSE(obstacles.front().passed);
}

TEST_F(ObstacleStreamTest, KeepsObstacleWhilePartiallyVisible) {
	stream.reset(rng);
	auto& obstacles = stream.obstacles();
	obstacles.front() = obstacle_t{ .position_x = -2.0f, .width = 3, .passed = true };
	obstacles.push_back(obstacle_t{ .position_x = 70.0f, .width = 4 });

	stream.advance(0.5f, rng);

	ASSERT_EQ(obstacles.size(), 2u);
	EXPECT_FLOAT_EQ(obstacles.front().position_x, -2.5f);
	EXPECT_TRUE(obstacles.front().passed);
}

std::vector<float> newest_obstacle_trace(const geometry_t& geometry, const seed_t seed) {
	auto stream = obstacle_stream_t(geometry);
	auto rng = rng_t(seed);
	stream.reset(rng);

	std::vector<float> positions;
	for (int i{}; i != 1'000; ++i) {
		stream.advance(1.0f, rng);
		const auto& newest = stream.obstacles().back();
		positions.push_back(newest.position_x);
		positions.push_back(static_cast<float>(newest.width));
	}
	return positions;
}

TEST_F(ObstacleStreamTest, SameSeedReproducesSequence) {
	const auto a = newest_obstacle_trace(geometry, 3);
	const auto b = newest_obstacle_trace(geometry, 3);
	ASSERT_FALSE(a.empty());
	EXPECT_EQ(a, b);
}

TEST_F(ObstacleStreamTest, DifferentSeedsDiverge) {
	EXPECT_NE(newest_obstacle_trace(geometry, 3), newest_obstacle_trace(geometry, 4));
}

} // namespace
} // namespace arcade::runner
