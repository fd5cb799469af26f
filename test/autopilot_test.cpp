#include "arcade/flyer/autopilot.hpp"
#include "arcade/runner/autopilot.hpp"
#include "arcade/runner/environment.hpp"

#include <gtest/gtest.h>
#include <deque>

namespace arcade {
namespace {

class RunnerAutopilotTest : public ::testing::Test {
protected:
	runner::config_t config{};
	runner::geometry_t geometry{ runner::make_geometry(config) };
	runner::observation_encoder_t encoder{ config, geometry };
	runner::autopilot_t autopilot{ geometry };

	runner::frame_t frame_with_obstacle_at(const float position_x, const int width) const {
		auto frame = encoder.make_frame();
		const auto agent = runner::agent_state_t{ .position_y = geometry.grounded_y(), .velocity_y = 0.0f };
		encoder.encode(agent, { runner::obstacle_t{ .position_x = position_x, .width = width } }, frame);
		return frame;
	}
};

TEST_F(RunnerAutopilotTest, JumpsForObstacleInsideLookahead) {
	EXPECT_EQ(autopilot.act(frame_with_obstacle_at(22.0f, 3)), action_t::impulse);
	EXPECT_EQ(autopilot.act(frame_with_obstacle_at(25.0f, 6)), action_t::impulse);
}

TEST_F(RunnerAutopilotTest, JumpsWhenTrailingEdgeReachesWindow) {
	// Columns 19, 20 and 21; 21 is the first scanned column.
	EXPECT_EQ(autopilot.act(frame_with_obstacle_at(19.0f, 3)), action_t::impulse);
}

TEST_F(RunnerAutopilotTest, IgnoresDistantOrPassedObstacles) {
	EXPECT_EQ(autopilot.act(frame_with_obstacle_at(40.0f, 6)), action_t::idle);
	EXPECT_EQ(autopilot.act(frame_with_obstacle_at(26.0f, 6)), action_t::idle);
	EXPECT_EQ(autopilot.act(frame_with_obstacle_at(17.0f, 3)), action_t::idle);
	EXPECT_EQ(autopilot.act(encoder.make_frame()), action_t::idle);
}

TEST_F(RunnerAutopilotTest, ClearsObstaclesOverALongRun) {
	auto environment = runner::environment_t{ config };
	auto observation = environment.reset(0).observation;

	auto last = runner::step_result_t{};
	for (int i{}; i != 400; ++i) {
		last = environment.step(autopilot.act(observation));
		ASSERT_FALSE(last.terminated) << "collided on step " << last.info.steps;
		observation = last.observation;
	}
	EXPECT_GE(last.info.score, 2u);
}

TEST(FlyerAutopilotTest, FlapsWhileBelowTarget) {
	const auto autopilot = flyer::autopilot_t{};
	EXPECT_EQ(autopilot.act({ 0.2f, 0.0f, 0.5f, 0.5f }), action_t::impulse);
}

TEST(FlyerAutopilotTest, FallsWhileAboveTarget) {
	const auto autopilot = flyer::autopilot_t{};
	EXPECT_EQ(autopilot.act({ 0.6f, 0.0f, 0.5f, 0.5f }), action_t::idle);
}

TEST(FlyerAutopilotTest, CoastsWhenAlreadyClimbingFastEnough) {
	const auto autopilot = flyer::autopilot_t{};
	EXPECT_EQ(autopilot.act({ 0.2f, 0.05f, 0.5f, 0.5f }), action_t::idle);
}

TEST(FlyerAutopilotTest, TargetOffsetShiftsTheSetPoint) {
	const auto autopilot = flyer::autopilot_t{ { .target_offset_y = -0.3f } };
	EXPECT_EQ(autopilot.act({ 0.3f, 0.0f, 0.5f, 0.5f }), action_t::idle);
}

} // namespace
} // namespace arcade
