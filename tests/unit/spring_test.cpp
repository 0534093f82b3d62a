#include <gtest/gtest.h>
#include <memory>
#include <optional>
#include <vector>
#include "motion/animation/i_animatable.hpp"
#include "motion/core/constants.hpp"
#include "motion/interactions/spring.hpp"
#include "motion/math/vector_math.hpp"

using Interactions::Spring;
using Motion::AnimationKey;
using Motion::MotionState;

namespace {

// Records what the spring asks of the layer; completions fire on demand
class RecordingProperty : public Animation::IAnimatableProperty<Position> {
public:
    struct Added {
        Animation::SpringAnimation<Position> animation;
        AnimationKey key;
        std::optional<Position> initialVelocity;
        Animation::CompletionCallback onComplete;
    };

    Position value() const override { return current; }
    void setValue(const Position& v) override { current = v; }

    void add(const Animation::SpringAnimation<Position>& animation,
             AnimationKey key,
             const std::optional<Position>& initialVelocity,
             Animation::CompletionCallback onComplete) override {
        added.push_back(Added{animation, key, initialVelocity, std::move(onComplete)});
    }

    void removeAnimation(AnimationKey key) override { removed.push_back(key); }

    void complete(std::size_t index) {
        auto callback = added.at(index).onComplete;
        callback();
    }

    Position current;
    std::vector<Added> added;
    std::vector<AnimationKey> removed;
};

} // namespace

class SpringTest : public ::testing::Test {
protected:
    std::shared_ptr<RecordingProperty> property = std::make_shared<RecordingProperty>();
    Spring<Position> spring{property};
};

TEST_F(SpringTest, InitialState) {
    EXPECT_FALSE(spring.isEnabled());
    EXPECT_FALSE(spring.isStopped());
    EXPECT_FALSE(spring.destination().has_value());
    EXPECT_FALSE(spring.initialVelocity().has_value());
    EXPECT_EQ(spring.state().value(), MotionState::AtRest);
    EXPECT_EQ(spring.activeAnimationCount(), 0u);

    EXPECT_DOUBLE_EQ(spring.tension(), MotionConstants::DefaultSpringTension);
    EXPECT_DOUBLE_EQ(spring.friction(), MotionConstants::DefaultSpringFriction);
    EXPECT_DOUBLE_EQ(spring.mass(), MotionConstants::DefaultSpringMass);
    EXPECT_DOUBLE_EQ(spring.suggestedDuration(), 0.0);
}

TEST_F(SpringTest, EnableIsIdempotent) {
    spring.setDestination(Position(5.0, 5.0));
    EXPECT_TRUE(property->added.empty());

    spring.enable();
    ASSERT_EQ(property->added.size(), 1u);

    spring.enable();
    EXPECT_EQ(property->added.size(), 1u);
    EXPECT_EQ(spring.activeAnimationCount(), 1u);
    EXPECT_TRUE(spring.isEnabled());
}

TEST_F(SpringTest, EnableWithoutDestinationStaysAtRest) {
    spring.enable();
    EXPECT_TRUE(property->added.empty());
    EXPECT_EQ(spring.state().value(), MotionState::AtRest);
}

TEST_F(SpringTest, DisableCancelsTrackedAnimations) {
    spring.enable();
    spring.setDestination(Position(1.0, 0.0));
    spring.setDestination(Position(2.0, 0.0));
    ASSERT_EQ(spring.activeAnimationCount(), 2u);

    spring.disable();
    EXPECT_EQ(spring.state().value(), MotionState::AtRest);
    EXPECT_EQ(spring.activeAnimationCount(), 0u);
    ASSERT_EQ(property->removed.size(), 2u);
    EXPECT_TRUE(property->removed[0] == property->added[0].key || property->removed[0] == property->added[1].key);
    EXPECT_NE(property->removed[0], property->removed[1]);

    // Second disable is a no-op
    spring.disable();
    EXPECT_EQ(property->removed.size(), 2u);
    EXPECT_FALSE(spring.isStopped());
}

TEST_F(SpringTest, DestinationWhileEnabledEmitsOnce) {
    property->current = Position(1.0, 2.0);
    spring.setTension(200.0);
    spring.setFriction(12.0);
    spring.setMass(2.0);
    spring.enable();

    spring.setDestination(Position(10.0, 20.0));

    ASSERT_EQ(property->added.size(), 1u);
    const auto& anim = property->added[0].animation;
    EXPECT_EQ(anim.from, Position(1.0, 2.0));
    EXPECT_EQ(anim.to, Position(10.0, 20.0));
    EXPECT_DOUBLE_EQ(anim.stiffness, 200.0);
    EXPECT_DOUBLE_EQ(anim.damping, 12.0);
    EXPECT_DOUBLE_EQ(anim.mass, 2.0);

    // Model value already holds the destination
    EXPECT_EQ(property->current, Position(10.0, 20.0));
    EXPECT_EQ(spring.state().value(), MotionState::Active);
    EXPECT_TRUE(spring.isActive());
}

TEST_F(SpringTest, DestinationWhileDisabledIsInert) {
    spring.setDestination(Position(10.0, 10.0));

    EXPECT_TRUE(property->added.empty());
    EXPECT_EQ(property->current, Position(0.0, 0.0));
    EXPECT_EQ(spring.state().value(), MotionState::AtRest);
    ASSERT_TRUE(spring.destination().has_value());
    EXPECT_EQ(*spring.destination(), Position(10.0, 10.0));
}

TEST_F(SpringTest, OverlappingEmissionsRestAfterLastCompletion) {
    std::vector<MotionState> seen;
    spring.state().subscribe([&seen](const MotionState& s) { seen.push_back(s); });

    spring.enable();
    spring.setDestination(Position(1.0, 0.0));
    spring.setDestination(Position(2.0, 0.0));
    spring.setDestination(Position(3.0, 0.0));

    ASSERT_EQ(property->added.size(), 3u);
    EXPECT_TRUE(property->removed.empty());  // earlier animations keep running
    EXPECT_EQ(spring.state().value(), MotionState::Active);

    property->complete(1);
    property->complete(0);
    EXPECT_EQ(spring.state().value(), MotionState::Active);
    EXPECT_EQ(spring.activeAnimationCount(), 1u);

    property->complete(2);
    EXPECT_EQ(spring.state().value(), MotionState::AtRest);

    std::vector<MotionState> expected = {MotionState::AtRest, MotionState::Active, MotionState::AtRest};
    EXPECT_EQ(seen, expected);
}

TEST_F(SpringTest, EachEmissionGetsAFreshKey) {
    spring.enable();
    spring.setDestination(Position(1.0, 0.0));
    spring.setDestination(Position(1.0, 0.0));

    ASSERT_EQ(property->added.size(), 2u);
    EXPECT_NE(property->added[0].key, property->added[1].key);
}

TEST_F(SpringTest, StopThenStartReEmits) {
    spring.enable();
    spring.setDestination(Position(4.0, 4.0));
    ASSERT_EQ(property->added.size(), 1u);

    spring.stop();
    EXPECT_TRUE(spring.isStopped());
    EXPECT_EQ(spring.state().value(), MotionState::AtRest);
    ASSERT_EQ(property->removed.size(), 1u);
    EXPECT_EQ(property->removed[0], property->added[0].key);

    // Stopped springs store destinations without emitting
    spring.setDestination(Position(8.0, 8.0));
    EXPECT_EQ(property->added.size(), 1u);

    spring.start();
    ASSERT_EQ(property->added.size(), 2u);
    EXPECT_EQ(property->added[1].animation.to, Position(8.0, 8.0));
    EXPECT_EQ(spring.state().value(), MotionState::Active);
}

TEST_F(SpringTest, StartWithoutStopIsNoop) {
    spring.enable();
    spring.setDestination(Position(4.0, 4.0));

    spring.start();
    EXPECT_EQ(property->added.size(), 1u);
}

TEST_F(SpringTest, StopIsIndependentOfEnabled) {
    spring.setDestination(Position(3.0, 3.0));
    spring.stop();
    spring.stop();

    spring.enable();
    EXPECT_TRUE(property->added.empty());

    spring.start();
    EXPECT_EQ(property->added.size(), 1u);

    // disable() leaves the stopped flag alone
    spring.stop();
    spring.disable();
    EXPECT_TRUE(spring.isStopped());
}

TEST_F(SpringTest, SuggestedDurationIsUsedLiterally) {
    spring.setSuggestedDuration(0.75);
    spring.enable();
    spring.setDestination(Position(1.0, 1.0));

    ASSERT_EQ(property->added.size(), 1u);
    EXPECT_DOUBLE_EQ(property->added[0].animation.duration, 0.75);
}

TEST_F(SpringTest, ZeroDurationUsesSettlingDuration) {
    spring.enable();
    spring.setDestination(Position(1.0, 1.0));

    ASSERT_EQ(property->added.size(), 1u);
    Math::DampedOscillator osc(MotionConstants::DefaultSpringTension,
                               MotionConstants::DefaultSpringFriction,
                               MotionConstants::DefaultSpringMass);
    EXPECT_DOUBLE_EQ(property->added[0].animation.duration, osc.settlingDuration());
}

TEST_F(SpringTest, InitialVelocityReadAtEmission) {
    spring.setInitialVelocity(Position(1.0, 2.0));
    spring.enable();
    spring.setDestination(Position(5.0, 5.0));

    spring.setInitialVelocity(Position(9.0, 9.0));

    ASSERT_EQ(property->added.size(), 1u);
    ASSERT_TRUE(property->added[0].initialVelocity.has_value());
    EXPECT_EQ(*property->added[0].initialVelocity, Position(1.0, 2.0));

    spring.setInitialVelocity(std::nullopt);
    spring.setDestination(Position(6.0, 6.0));
    ASSERT_EQ(property->added.size(), 2u);
    EXPECT_FALSE(property->added[1].initialVelocity.has_value());
}

TEST_F(SpringTest, ClearingDestinationIsInert) {
    spring.enable();
    spring.clearDestination();
    EXPECT_TRUE(property->added.empty());
    EXPECT_FALSE(spring.destination().has_value());
}

TEST_F(SpringTest, TapScenario) {
    EXPECT_EQ(spring.state().value(), MotionState::AtRest);

    spring.enable();
    EXPECT_EQ(spring.state().value(), MotionState::AtRest);

    spring.setDestination(Position(10.0, 10.0));
    ASSERT_EQ(property->added.size(), 1u);
    EXPECT_EQ(spring.activeAnimationCount(), 1u);
    EXPECT_EQ(spring.state().value(), MotionState::Active);

    property->complete(0);
    EXPECT_EQ(spring.state().value(), MotionState::AtRest);
    EXPECT_EQ(spring.activeAnimationCount(), 0u);
}

TEST_F(SpringTest, LateCompletionAfterDisableIsHarmless) {
    spring.enable();
    spring.setDestination(Position(1.0, 1.0));
    spring.disable();

    property->complete(0);
    EXPECT_EQ(spring.state().value(), MotionState::AtRest);
    EXPECT_EQ(spring.activeAnimationCount(), 0u);

    // Re-enabling with a destination emits again
    spring.enable();
    EXPECT_EQ(property->added.size(), 2u);
    EXPECT_EQ(spring.state().value(), MotionState::Active);
}

TEST_F(SpringTest, DisableFromActiveObserverSkipsTheAnimation) {
    spring.enable();
    spring.state().subscribe([this](MotionState s) {
        if (s == MotionState::Active) {
            spring.disable();
        }
    });

    spring.setDestination(Position(5.0, 5.0));

    EXPECT_TRUE(property->added.empty());
    EXPECT_FALSE(spring.isEnabled());
    EXPECT_EQ(spring.activeAnimationCount(), 0u);
    EXPECT_EQ(spring.state().value(), MotionState::AtRest);
}

TEST_F(SpringTest, StopFromActiveObserverSkipsTheAnimation) {
    spring.enable();
    auto const id = spring.state().subscribe([this](MotionState s) {
        if (s == MotionState::Active) {
            spring.stop();
        }
    });

    spring.setDestination(Position(5.0, 5.0));
    EXPECT_TRUE(property->added.empty());
    EXPECT_EQ(spring.state().value(), MotionState::AtRest);

    EXPECT_TRUE(spring.state().unsubscribe(id));
    spring.start();
    EXPECT_EQ(property->added.size(), 1u);
    EXPECT_EQ(spring.state().value(), MotionState::Active);
}

TEST(SpringLifetimeTest, CompletionAfterSpringDestroyed) {
    auto property = std::make_shared<RecordingProperty>();
    auto spring = std::make_unique<Spring<Position>>(property);
    spring->enable();
    spring->setDestination(Position(2.0, 2.0));
    spring.reset();

    ASSERT_EQ(property->added.size(), 1u);
    property->complete(0);  // must not touch freed memory
    SUCCEED();
}

TEST(SpringScalarTest, AnimatesDoubles) {
    class ScalarProperty : public Animation::IAnimatableProperty<double> {
    public:
        double value() const override { return current; }
        void setValue(const double& v) override { current = v; }
        void add(const Animation::SpringAnimation<double>& animation, AnimationKey,
                 const std::optional<double>&, Animation::CompletionCallback onComplete) override {
            last = animation;
            completion = std::move(onComplete);
        }
        void removeAnimation(AnimationKey) override {}

        double current = 0.5;
        Animation::SpringAnimation<double> last;
        Animation::CompletionCallback completion;
    };

    auto property = std::make_shared<ScalarProperty>();
    Spring<double> opacity(property);
    opacity.enable();
    opacity.setDestination(1.0);

    EXPECT_DOUBLE_EQ(property->last.from, 0.5);
    EXPECT_DOUBLE_EQ(property->last.to, 1.0);
    EXPECT_DOUBLE_EQ(property->current, 1.0);

    property->completion();
    EXPECT_EQ(opacity.state().value(), MotionState::AtRest);
}
