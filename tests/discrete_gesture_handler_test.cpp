#include "discrete_gesture_handler.h"

#include <gtest/gtest.h>

TEST(DiscreteGestureHandlerTest, TapIgnoredWhenDisabled)
{
    DiscreteGestureHandler handler;
    EXPECT_FALSE(handler.isTapNavigationEnabled());
    EXPECT_EQ(handler.resolveTap(700.0f, 800.0f), ScrollDirection::None);
}

TEST(DiscreteGestureHandlerTest, TapZonesSplitAtHalfWidth)
{
    DiscreteGestureHandler handler;
    handler.setTapNavigationEnabled(true);
    EXPECT_EQ(handler.resolveTap(100.0f, 800.0f), ScrollDirection::Backward);
    EXPECT_EQ(handler.resolveTap(399.0f, 800.0f), ScrollDirection::Backward);
    EXPECT_EQ(handler.resolveTap(400.0f, 800.0f), ScrollDirection::Forward);
    EXPECT_EQ(handler.resolveTap(100.0f, 0.0f), ScrollDirection::None);
}

TEST(DiscreteGestureHandlerTest, LeftwardSwipeIsForward)
{
    DiscreteGestureHandler handler;
    handler.touchStart(400.0f, 0);
    handler.touchMove(380.0f);
    handler.touchMove(300.0f);
    EXPECT_EQ(handler.touchEnd(300.0f, 120), ScrollDirection::Forward);
    EXPECT_FALSE(handler.isTracking());
}

TEST(DiscreteGestureHandlerTest, RightwardSwipeIsBackward)
{
    DiscreteGestureHandler handler;
    handler.touchStart(100.0f, 0);
    handler.touchMove(200.0f);
    EXPECT_EQ(handler.touchEnd(200.0f, 100), ScrollDirection::Backward);
}

TEST(DiscreteGestureHandlerTest, ShortOrMotionlessTouchIsNotASwipe)
{
    DiscreteGestureHandler handler;
    handler.touchStart(400.0f, 0);
    handler.touchMove(360.0f);
    EXPECT_EQ(handler.touchEnd(360.0f, 100), ScrollDirection::None);

    handler.touchStart(400.0f, 200);
    EXPECT_EQ(handler.touchEnd(400.0f, 250), ScrollDirection::None);

    EXPECT_EQ(handler.touchEnd(400.0f, 300), ScrollDirection::None);
}

TEST(DiscreteGestureHandlerTest, LiftPositionCompletesFlickWithoutMotion)
{
    DiscreteGestureHandler handler;
    handler.touchStart(600.0f, 0);
    EXPECT_EQ(handler.touchEnd(200.0f, 80), ScrollDirection::Forward);

    handler.touchStart(100.0f, 200);
    EXPECT_EQ(handler.touchEnd(300.0f, 260), ScrollDirection::Backward);

    // Lifted where it went down
    handler.touchStart(300.0f, 400);
    EXPECT_EQ(handler.touchEnd(300.0f, 450), ScrollDirection::None);
}

TEST(DiscreteGestureHandlerTest, LiftPositionOverridesLastMotion)
{
    DiscreteGestureHandler handler;
    handler.touchStart(400.0f, 0);
    handler.touchMove(200.0f);
    // Finger drifted back before lifting
    EXPECT_EQ(handler.touchEnd(380.0f, 100), ScrollDirection::None);
}

TEST(DiscreteGestureHandlerTest, SlowSwipeRejectedWhenDurationLimited)
{
    DiscreteGestureHandler handler(50.0f, 300);
    handler.touchStart(400.0f, 0);
    handler.touchMove(200.0f);
    EXPECT_EQ(handler.touchEnd(200.0f, 1000), ScrollDirection::None);

    handler.touchStart(400.0f, 2000);
    handler.touchMove(200.0f);
    EXPECT_EQ(handler.touchEnd(200.0f, 2200), ScrollDirection::Forward);
}

TEST(DiscreteGestureHandlerTest, CancelDropsTouch)
{
    DiscreteGestureHandler handler;
    handler.touchStart(400.0f, 0);
    handler.touchMove(100.0f);
    handler.touchCancel();
    EXPECT_EQ(handler.touchEnd(100.0f, 50), ScrollDirection::None);
}
