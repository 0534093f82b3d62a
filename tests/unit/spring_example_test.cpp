#include <gtest/gtest.h>
#include <cmath>
#include "motion/core/compositor_host.hpp"
#include "motion/core/constants.hpp"
#include "motion/demo/spring_example.hpp"

using Motion::MotionState;

class SpringExampleTest : public ::testing::Test {
protected:
    CompositorHost host{SystemConfig{1.0 / 120.0, 1.0}};
    SpringExample example{host, 400.0, 300.0, 42u};
};

TEST_F(SpringExampleTest, SquareStartsCentered) {
    EXPECT_EQ(example.viewCenter(), Position(200.0, 150.0));
    EXPECT_EQ(example.squarePosition().value(), Position(200.0, 150.0));
    EXPECT_EQ(example.squarePosition().presentationValue(), Position(200.0, 150.0));
    EXPECT_DOUBLE_EQ(host.getRegistry().get<Components::Shape>(example.square()).halfSize,
                     MotionConstants::ExampleViewHalfSize);
}

TEST_F(SpringExampleTest, SpringIsLooserThanDefault) {
    EXPECT_DOUBLE_EQ(example.spring().friction(), MotionConstants::DefaultSpringFriction / 2);
    EXPECT_DOUBLE_EQ(example.spring().tension(), MotionConstants::DefaultSpringTension);
    EXPECT_TRUE(example.spring().isEnabled());
    EXPECT_EQ(example.spring().state().value(), MotionState::AtRest);
}

TEST_F(SpringExampleTest, TapsLandInsideTheView) {
    for (int i = 0; i < 200; ++i) {
        example.handleTap(0.0, 0.0);

        ASSERT_TRUE(example.spring().destination().has_value());
        Position const d = *example.spring().destination();
        EXPECT_GE(d.x, 0.0);
        EXPECT_LT(d.x, 400.0);
        EXPECT_GE(d.y, 0.0);
        EXPECT_LT(d.y, 300.0);
        EXPECT_DOUBLE_EQ(d.x, std::floor(d.x));
        EXPECT_DOUBLE_EQ(d.y, std::floor(d.y));
    }
    EXPECT_EQ(example.spring().activeAnimationCount(), 200u);
}

TEST_F(SpringExampleTest, TapMovesTheSquare) {
    example.handleTap(10.0, 10.0);
    Position const destination = *example.spring().destination();

    EXPECT_EQ(example.spring().state().value(), MotionState::Active);
    EXPECT_EQ(example.motionState().state().value(), MotionState::Active);
    EXPECT_EQ(example.squarePosition().value(), destination);

    for (int i = 0; i < 1000; ++i) {
        host.tick();
    }
    EXPECT_EQ(example.spring().state().value(), MotionState::AtRest);
    EXPECT_EQ(example.motionState().state().value(), MotionState::AtRest);
    EXPECT_EQ(example.squarePosition().presentationValue(), destination);
}

TEST_F(SpringExampleTest, SameSeedSameDestinations) {
    CompositorHost otherHost{SystemConfig{1.0 / 120.0, 1.0}};
    SpringExample other{otherHost, 400.0, 300.0, 42u};

    for (int i = 0; i < 5; ++i) {
        example.handleTap(0.0, 0.0);
        other.handleTap(0.0, 0.0);
        EXPECT_EQ(*example.spring().destination(), *other.spring().destination());
    }
}

TEST_F(SpringExampleTest, RecenterPutsSquareBack) {
    example.handleTap(0.0, 0.0);
    host.tick();

    example.recenter();
    EXPECT_EQ(example.spring().state().value(), MotionState::AtRest);
    EXPECT_FALSE(example.spring().destination().has_value());
    EXPECT_FALSE(example.spring().isStopped());
    EXPECT_EQ(example.squarePosition().value(), example.viewCenter());
    EXPECT_EQ(example.squarePosition().presentationValue(), example.viewCenter());

    // Still interactive afterwards
    example.handleTap(0.0, 0.0);
    EXPECT_EQ(example.spring().state().value(), MotionState::Active);
}

TEST(SpringExampleInfoTest, TitleAndInstructions) {
    EXPECT_STREQ(SpringExample::title(), "Spring");
    EXPECT_STREQ(SpringExample::instructions(), "Tap anywhere to move the view.");
}
