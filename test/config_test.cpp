#include "arcade/common/config_error.hpp"
#include "arcade/flyer/environment.hpp"
#include "arcade/runner/environment.hpp"

#include <gtest/gtest.h>
#include <limits>
#include <stdexcept>

namespace arcade {
namespace {

TEST(RunnerConfigTest, DefaultsDeriveExpectedGeometry) {
	const auto geometry = runner::make_geometry(runner::config_t{});

	EXPECT_EQ(geometry.screen_width, 84);
	EXPECT_EQ(geometry.screen_height, 84);
	EXPECT_EQ(geometry.ground_y, 58);
	EXPECT_EQ(geometry.agent_x, 12);
	EXPECT_EQ(geometry.agent_width, 5);
	EXPECT_EQ(geometry.agent_height, 15);
	EXPECT_EQ(geometry.obstacle_min_width, 3);
	EXPECT_EQ(geometry.obstacle_max_width, 6);
	EXPECT_EQ(geometry.obstacle_height, 12);
	EXPECT_FLOAT_EQ(geometry.grounded_y(), 43.0f);
	EXPECT_FLOAT_EQ(geometry.obstacle_top_y(), 46.0f);
	EXPECT_FLOAT_EQ(geometry.spawn_threshold_x, 50.4f);
	EXPECT_FLOAT_EQ(geometry.spawn_gap_min, 25.2f);
	EXPECT_FLOAT_EQ(geometry.spawn_gap_max, 50.4f);
	EXPECT_FLOAT_EQ(geometry.initial_spawn_x, 109.2f);
}

TEST(RunnerConfigTest, LargerScreenScalesGeometry) {
	const auto geometry = runner::make_geometry(runner::config_t{ .screen_width = 168, .screen_height = 168 });
	EXPECT_EQ(geometry.ground_y, 117);
	EXPECT_EQ(geometry.agent_height, 30);
	EXPECT_NO_THROW(runner::environment_t(runner::config_t{ .screen_width = 168, .screen_height = 168 }));
}

TEST(RunnerConfigTest, RejectsImpossibleWorlds) {
	EXPECT_THROW(runner::validate({ .screen_width = 0 }), config_error);
	EXPECT_THROW(runner::validate({ .max_steps = 0 }), config_error);
	EXPECT_THROW(runner::validate({ .obstacle_min_width_fraction = 0.1, .obstacle_max_width_fraction = 0.05 }), config_error);
	EXPECT_THROW(runner::validate({ .spawn_gap_min_fraction = 0.7, .spawn_gap_max_fraction = 0.6 }), config_error);
	EXPECT_THROW(runner::validate({ .max_fall_speed = 0.0f }), config_error);
	EXPECT_THROW(runner::validate({ .gravity = std::numeric_limits<float>::quiet_NaN() }), config_error);

	// Tiny screens truncate the agent to zero pixels.
	EXPECT_THROW(runner::validate({ .screen_width = 10, .screen_height = 10 }), config_error);

	// Agent taller than the space above the ground.
	EXPECT_THROW(runner::validate({ .ground_line_fraction = 0.1 }), config_error);
}

TEST(RunnerConfigTest, RejectsFractionsOutsideTheScreen) {
	const auto nan = std::numeric_limits<double>::quiet_NaN();

	EXPECT_THROW(runner::validate({ .ground_line_fraction = nan }), config_error);
	EXPECT_THROW(runner::validate({ .agent_height_fraction = 1e20 }), config_error);
	EXPECT_THROW(runner::validate({ .agent_x_fraction = -0.1 }), config_error);
	EXPECT_THROW(runner::validate({ .obstacle_height_fraction = nan }), config_error);
	EXPECT_THROW(runner::validate({ .spawn_threshold_fraction = nan }), config_error);
	EXPECT_THROW(runner::validate({ .spawn_threshold_fraction = 1.5 }), config_error);
	EXPECT_THROW(runner::validate({ .spawn_gap_max_fraction = 1e20 }), config_error);
	EXPECT_THROW(runner::validate({ .initial_spawn_offset_fraction = std::numeric_limits<double>::infinity() }), config_error);
	EXPECT_THROW(static_cast<void>(runner::make_geometry({ .ground_line_fraction = nan })), config_error);
	EXPECT_THROW(runner::environment_t(runner::config_t{ .ground_line_fraction = 1e20 }), config_error);
}

TEST(RunnerConfigTest, EnvironmentConstructorValidates) {
	EXPECT_THROW(runner::environment_t(runner::config_t{ .screen_height = -1 }), std::invalid_argument);
}

TEST(FlyerConfigTest, DefaultsAreValid) {
	EXPECT_NO_THROW(flyer::validate(flyer::config_t{}));
}

TEST(FlyerConfigTest, RejectsImpossibleWorlds) {
	EXPECT_THROW(flyer::validate({ .max_velocity_y = 0.0f }), config_error);
	EXPECT_THROW(flyer::validate({ .agent_x = 1.5f }), config_error);
	EXPECT_THROW(flyer::validate({ .start_y = 1.0f }), config_error);
	EXPECT_THROW(flyer::validate({ .pipe_speed = -0.01f }), config_error);
	EXPECT_THROW(flyer::validate({ .agent_x = 0.5f, .pipe_spawn_x = 0.4f }), config_error);
	EXPECT_THROW(flyer::validate({ .gap_half_height = 0.0f }), config_error);
	EXPECT_THROW(flyer::validate({ .initial_gap_min_y = 0.8f, .initial_gap_max_y = 0.2f }), config_error);
	EXPECT_THROW(flyer::validate({ .respawn_gap_min_y = -0.1f }), config_error);
	EXPECT_THROW(flyer::validate({ .gravity = std::numeric_limits<float>::infinity() }), config_error);
}

TEST(FlyerConfigTest, EnvironmentConstructorValidates) {
	EXPECT_THROW(flyer::environment_t(flyer::config_t{ .pipe_column_width = 0.0f }), std::invalid_argument);
}

} // namespace
} // namespace arcade
