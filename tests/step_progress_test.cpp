#include <gtest/gtest.h>
#include "progmeter/progress/step_progress.hpp"
#include "progmeter/config/error_codes.hpp"
#include "test_support.hpp"
#include <chrono>
#include <ostream>
#include <sstream>
#include <utility>

using namespace progmeter;
using progress::StepProgress;
using namespace std::chrono_literals;

TEST(StepProgressTest, FirstStepRendersImmediately) {
    std::ostringstream out;
    StepProgress tracker(10);
    tracker.setOutputSink(out).setRefreshInterval(1h);
    
    EXPECT_TRUE(out.str().empty());
    EXPECT_FALSE(tracker.isLocked());
    
    tracker.step();
    EXPECT_TRUE(tracker.isLocked());
    EXPECT_EQ(test::occurrences(out.str(), "\r"), 1u);
    
    tracker.step(3);
    EXPECT_EQ(tracker.count(), 4u);
    EXPECT_EQ(test::occurrences(out.str(), "\r"), 1u);
}

TEST(StepProgressTest, CompletingStepDefersToFinalRender) {
    std::ostringstream out;
    StepProgress tracker(3);
    tracker.setOutputSink(out);
    tracker.step(3);
    EXPECT_TRUE(out.str().empty());
    
    tracker.finish();
    EXPECT_EQ(test::renderedLines(out.str()).size(), 1u);
}

TEST(StepProgressTest, FinishRendersExactlyOnce) {
    std::ostringstream out;
    {
        StepProgress tracker(3);
        tracker.setOutputSink(out);
        tracker.step(3);
        tracker.finish();
        tracker.finish();
        EXPECT_TRUE(tracker.isFinished());
    }
    
    EXPECT_EQ(test::occurrences(out.str(), "\n"), 1u);
    EXPECT_EQ(test::occurrences(out.str(), "100.0%"), 1u);
}

TEST(StepProgressTest, DestructorFinalizes) {
    std::ostringstream out;
    {
        StepProgress tracker(100);
        tracker.setOutputSink(out);
        tracker.step(40);
    }
    
    auto lines = test::renderedLines(out.str());
    ASSERT_FALSE(lines.empty());
    EXPECT_NE(lines.back().find("40/100"), std::string::npos);
    EXPECT_EQ(out.str().back(), '\n');
}

TEST(StepProgressTest, MovedFromTrackerStaysSilent) {
    std::ostringstream out;
    {
        StepProgress original(5);
        original.setOutputSink(out);
        {
            StepProgress moved(std::move(original));
            moved.step(5);
        }
        EXPECT_EQ(test::occurrences(out.str(), "\n"), 1u);
    }
    EXPECT_EQ(test::occurrences(out.str(), "\n"), 1u);
}

TEST(StepProgressTest, MoveAssignmentFinalizesTarget) {
    std::ostringstream first_out;
    std::ostringstream second_out;
    
    StepProgress first(2);
    first.setOutputSink(first_out);
    first.step();
    
    StepProgress second(4);
    second.setOutputSink(second_out);
    
    first = std::move(second);
    EXPECT_EQ(test::occurrences(first_out.str(), "\n"), 1u);
    
    first.step(4);
    first.finish();
    EXPECT_EQ(test::occurrences(second_out.str(), "\n"), 1u);
    EXPECT_NE(second_out.str().find("4/4"), std::string::npos);
}

TEST(StepProgressTest, SettersAreFrozenAfterFirstRender) {
    std::ostringstream out;
    StepProgress tracker(10);
    tracker.setOutputSink(out).setPrefix("early");
    tracker.step();
    
    tracker.setPrefix("late").setTotal(99).setBarWidth(3);
    
    EXPECT_EQ(tracker.config().prefix, "early");
    EXPECT_EQ(tracker.config().bar_width, 40u);
    EXPECT_EQ(tracker.total(), 10u);
}

TEST(StepProgressTest, ExplicitTotalOverridesAutomaticTotal) {
    std::ostringstream out;
    StepProgress tracker;
    tracker.setOutputSink(out);
    EXPECT_FALSE(tracker.total().has_value());
    
    tracker.setAutoTotal(50);
    EXPECT_EQ(tracker.total(), 50u);
    
    tracker.setTotal(10);
    EXPECT_EQ(tracker.total(), 10u);
    
    tracker.setAutoTotal(20);
    tracker.settleAutoTotal();
    EXPECT_EQ(tracker.total(), 10u);
}

TEST(StepProgressTest, SettleReplacesAutomaticTotalWithCount) {
    std::ostringstream out;
    StepProgress tracker(100);
    tracker.setOutputSink(out);
    tracker.step(60);
    tracker.settleAutoTotal();
    EXPECT_EQ(tracker.total(), 60u);
    tracker.finish();
    
    EXPECT_NE(out.str().find("60/60"), std::string::npos);
}

TEST(StepProgressTest, SettleKeepsUnknownTotalUnknown) {
    std::ostringstream out;
    StepProgress tracker;
    tracker.setOutputSink(out);
    tracker.step(8);
    tracker.settleAutoTotal();
    EXPECT_FALSE(tracker.total().has_value());
}

TEST(StepProgressTest, InvalidSettersThrow) {
    std::ostringstream out;
    StepProgress tracker;
    tracker.setOutputSink(out);
    EXPECT_THROW(tracker.setRefreshInterval(0ms), config::ConfigError);
    EXPECT_THROW(tracker.setBarWidth(0), config::ConfigError);
    EXPECT_THROW(tracker.setDisplayWidth(0), config::ConfigError);
    EXPECT_THROW(tracker.setShapes('#', '\n', ' '), config::ConfigError);
    
    EXPECT_EQ(tracker.config().refresh_interval, 100ms);
    EXPECT_EQ(tracker.config().bar_width, 40u);
}

TEST(StepProgressTest, InvalidConfigurationRejectedAtConstruction) {
    common::ProgressConfig config;
    config.bar_width = 0;
    
    try {
        StepProgress tracker(config, 10);
        FAIL() << "expected ConfigError";
    } catch (const config::ConfigError& e) {
        EXPECT_EQ(e.code(), config::ConfigErrorCode::INVALID_BAR_WIDTH);
    }
}

TEST(StepProgressTest, CustomShapesAreUsed) {
    std::ostringstream out;
    {
        StepProgress tracker(4);
        tracker.setOutputSink(out).setShapes('#', '#', '.').setBarWidth(4);
        tracker.step(4);
    }
    EXPECT_NE(out.str().find("[####]"), std::string::npos);
}

TEST(StepProgressTest, BrokenSinkDoesNotStopCounting) {
    std::ostringstream out;
    out.setstate(std::ios::badbit);
    
    StepProgress tracker(3);
    tracker.setOutputSink(out);
    tracker.step();
    EXPECT_TRUE(tracker.state().render_failed);
    
    EXPECT_NO_THROW(tracker.step(2));
    tracker.finish();
    EXPECT_EQ(tracker.count(), 3u);
    EXPECT_TRUE(tracker.isFinished());
}

TEST(StepProgressTest, FrozenSettersIgnoreInvalidValues) {
    std::ostringstream out;
    StepProgress tracker(10);
    tracker.setOutputSink(out);
    tracker.step();
    
    EXPECT_NO_THROW(tracker.setBarWidth(0));
    EXPECT_NO_THROW(tracker.setRefreshInterval(0ms));
    EXPECT_NO_THROW(tracker.setShapes('\n', '\n', '\n'));
    EXPECT_EQ(tracker.config().bar_width, 40u);
    EXPECT_EQ(tracker.config().refresh_interval, 100ms);
    EXPECT_EQ(tracker.config().shape_body, '=');
}

TEST(StepProgressTest, ExtraInfoCanChangeAfterFirstRender) {
    std::ostringstream out;
    {
        StepProgress tracker(4);
        tracker.setOutputSink(out).setExtraInfo("start");
        tracker.step();
        tracker.setExtraInfo("done");
        EXPECT_EQ(tracker.state().extra_info, "done");
        tracker.step(3);
    }
    
    auto lines = test::renderedLines(out.str());
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_NE(lines.front().find("| start"), std::string::npos);
    EXPECT_NE(lines.back().find("| done"), std::string::npos);
}

TEST(StepProgressTest, ThrowingSinkDuringDestructionIsContained) {
    test::ThrowingStreambuf broken;
    std::ostream out(&broken);
    out.exceptions(std::ios::badbit);
    
    EXPECT_NO_THROW({
        StepProgress tracker(2);
        tracker.setOutputSink(out);
    });
}
