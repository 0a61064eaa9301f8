#include "page_turn_controller.h"

#include <gtest/gtest.h>
#include <vector>

namespace
{
class PageTurnControllerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        controller.setPageTurnCallback([this](const PageTurnIntent& intent)
                                       { intents.push_back(intent); });
    }

    // Forward Line-mode wheel events of 50 raw units, 16ms apart
    void wheelForward(int count, TimestampMs start)
    {
        for (int i = 0; i < count; ++i)
        {
            controller.handleWheel(50.0, WheelDeltaMode::Line, start + i * 16);
        }
    }

    PageTurnController controller;
    std::vector<PageTurnIntent> intents;
};
} // namespace

TEST_F(PageTurnControllerTest, WheelFlickTurnsExactlyOnePage)
{
    controller.setReaderPosition(5, 20);
    wheelForward(5, 1000);

    ASSERT_EQ(intents.size(), 1u);
    EXPECT_EQ(intents[0].targetPage, 6);
    EXPECT_EQ(intents[0].direction, ScrollDirection::Forward);
    EXPECT_EQ(intents[0].source, TurnSource::Wheel);
    EXPECT_EQ(controller.navigation().getCurrentPage(), 6);
    EXPECT_DOUBLE_EQ(controller.gestureState().accumulatedEnergy, 0.0);
    EXPECT_TRUE(controller.gestureState().isCoolingDown);

    // Sixth event 50ms after the fifth
    controller.handleWheel(50.0, WheelDeltaMode::Line, 1000 + 4 * 16 + 50);
    EXPECT_EQ(intents.size(), 1u);
    EXPECT_EQ(controller.turnCount(), 1);
}

TEST_F(PageTurnControllerTest, FiredTurnFlashesReadyFeedback)
{
    controller.setReaderPosition(5, 20);
    wheelForward(4, 0);
    EXPECT_TRUE(controller.feedback().visible);
    EXPECT_FLOAT_EQ(controller.feedback().progress, 100.0f);
    EXPECT_EQ(controller.feedbackBand(), FeedbackBand::Ready);

    controller.tick(48 + 500);
    EXPECT_FALSE(controller.feedback().visible);
}

TEST_F(PageTurnControllerTest, PartialGestureShowsProgress)
{
    controller.setReaderPosition(5, 20);
    wheelForward(2, 0);
    EXPECT_TRUE(controller.feedback().visible);
    EXPECT_NEAR(controller.feedback().progress, 80.0f / 150.0f * 100.0f, 0.01f);
    EXPECT_EQ(controller.accumulatorPhase(16), AccumulatorPhase::Accumulating);
    EXPECT_TRUE(intents.empty());
}

TEST_F(PageTurnControllerTest, BackwardAtFirstPageEmitsNothing)
{
    controller.setReaderPosition(1, 20);
    for (int i = 0; i < 5; ++i)
    {
        controller.handleWheel(-50.0, WheelDeltaMode::Line, i * 16);
    }
    EXPECT_TRUE(intents.empty());
    EXPECT_EQ(controller.turnCount(), 0);
    EXPECT_FALSE(controller.feedback().visible);
    EXPECT_TRUE(controller.gestureState().hasFiredThisGesture);
    EXPECT_EQ(controller.navigation().getCurrentPage(), 1);
}

TEST_F(PageTurnControllerTest, ForwardAtLastPageEmitsNothing)
{
    controller.setReaderPosition(20, 20);
    wheelForward(5, 0);
    EXPECT_FALSE(controller.handleKey(NavigationKey::Next, 100));
    EXPECT_TRUE(intents.empty());
}

TEST_F(PageTurnControllerTest, UnknownTotalAllowsForwardTurns)
{
    controller.setReaderPosition(3, 0);
    wheelForward(4, 0);
    ASSERT_EQ(intents.size(), 1u);
    EXPECT_EQ(intents[0].targetPage, 4);

    EXPECT_FALSE(controller.handleKey(NavigationKey::Last, 100));
    EXPECT_EQ(intents.size(), 1u);
}

TEST_F(PageTurnControllerTest, SwipeBypassesAccumulator)
{
    controller.setReaderPosition(5, 20);
    controller.handleWheel(50.0, WheelDeltaMode::Line, 0);
    double energy = controller.gestureState().accumulatedEnergy;

    controller.handleTouchStart(500.0f, 10);
    controller.handleTouchMove(300.0f);
    EXPECT_TRUE(controller.handleTouchEnd(300.0f, 100));

    ASSERT_EQ(intents.size(), 1u);
    EXPECT_EQ(intents[0].source, TurnSource::Swipe);
    EXPECT_EQ(intents[0].targetPage, 6);
    EXPECT_DOUBLE_EQ(controller.gestureState().accumulatedEnergy, energy);
}

TEST_F(PageTurnControllerTest, SwipeIgnoresWheelCooldown)
{
    controller.setReaderPosition(5, 20);
    wheelForward(4, 0);
    ASSERT_EQ(intents.size(), 1u);

    controller.handleTouchStart(500.0f, 60);
    controller.handleTouchMove(100.0f);
    controller.handleTouchEnd(100.0f, 120);
    ASSERT_EQ(intents.size(), 2u);
    EXPECT_EQ(intents[1].targetPage, 7);
}

TEST_F(PageTurnControllerTest, TapRequiresClickNavigation)
{
    controller.setReaderPosition(5, 20);
    EXPECT_FALSE(controller.handleTap(700.0f, 800.0f));
    EXPECT_TRUE(intents.empty());

    controller.setClickNavigationEnabled(true);
    EXPECT_TRUE(controller.handleTap(100.0f, 800.0f));
    ASSERT_EQ(intents.size(), 1u);
    EXPECT_EQ(intents[0].targetPage, 4);
    EXPECT_EQ(intents[0].source, TurnSource::Tap);
}

TEST_F(PageTurnControllerTest, KeysJumpToEnds)
{
    controller.setReaderPosition(5, 20);
    EXPECT_TRUE(controller.handleKey(NavigationKey::Last, 0));
    EXPECT_TRUE(controller.handleKey(NavigationKey::First, 0));
    EXPECT_FALSE(controller.handleKey(NavigationKey::First, 0));

    ASSERT_EQ(intents.size(), 2u);
    EXPECT_EQ(intents[0].targetPage, 20);
    EXPECT_EQ(intents[1].targetPage, 1);
    EXPECT_EQ(intents[1].direction, ScrollDirection::None);
}

TEST_F(PageTurnControllerTest, PageJumpEmitsTarget)
{
    controller.setReaderPosition(5, 20);
    controller.handleKey(NavigationKey::StartPageJump, 0);
    EXPECT_TRUE(controller.handlePageJumpDigit('1', 100));
    EXPECT_TRUE(controller.handlePageJumpDigit('2', 200));
    EXPECT_TRUE(controller.handleKey(NavigationKey::ConfirmPageJump, 300));

    ASSERT_EQ(intents.size(), 1u);
    EXPECT_EQ(intents[0].targetPage, 12);
    EXPECT_EQ(intents[0].source, TurnSource::PageJump);
}

TEST_F(PageTurnControllerTest, PageJumpExpiresOnTick)
{
    controller.handleKey(NavigationKey::StartPageJump, 0);
    controller.tick(NavigationState::PAGE_JUMP_TIMEOUT + 1);
    EXPECT_FALSE(controller.navigation().isPageJumpInputActive());
}

TEST_F(PageTurnControllerTest, RendererClampOverridesOptimisticPage)
{
    controller.setReaderPosition(9, 0);
    controller.handleKey(NavigationKey::Next, 0);
    EXPECT_EQ(controller.navigation().getCurrentPage(), 10);

    controller.setPageCount(8);
    EXPECT_EQ(controller.navigation().getCurrentPage(), 8);
}

TEST_F(PageTurnControllerTest, ResetForDocumentStartsOver)
{
    controller.setReaderPosition(5, 20);
    wheelForward(2, 0);
    controller.resetForDocument(40);

    EXPECT_FALSE(controller.hasPendingTimers());
    EXPECT_FALSE(controller.feedback().visible);
    EXPECT_EQ(controller.navigation().getCurrentPage(), 1);
    EXPECT_EQ(controller.navigation().getPageCount(), 40);
}

TEST_F(PageTurnControllerTest, ShutdownDropsTimersAndCallback)
{
    controller.setReaderPosition(5, 20);
    wheelForward(2, 0);
    EXPECT_TRUE(controller.hasPendingTimers());

    controller.shutdown();
    EXPECT_FALSE(controller.hasPendingTimers());

    controller.handleKey(NavigationKey::Next, 100);
    EXPECT_TRUE(intents.empty());
}

TEST_F(PageTurnControllerTest, EventExactlyIdleGapLaterContinuesWithOrWithoutTick)
{
    PageTurnController ticked;
    PageTurnController unticked;
    ticked.setReaderPosition(5, 20);
    unticked.setReaderPosition(5, 20);

    ticked.handleWheel(100.0, WheelDeltaMode::Line, 1000);
    unticked.handleWheel(100.0, WheelDeltaMode::Line, 1000);

    ticked.tick(1200);
    ticked.handleWheel(100.0, WheelDeltaMode::Line, 1200);
    unticked.handleWheel(100.0, WheelDeltaMode::Line, 1200);

    EXPECT_DOUBLE_EQ(ticked.gestureState().accumulatedEnergy, 100.0);
    EXPECT_DOUBLE_EQ(unticked.gestureState().accumulatedEnergy, 100.0);
    EXPECT_EQ(ticked.accumulatorPhase(1200), AccumulatorPhase::Accumulating);
}

TEST_F(PageTurnControllerTest, EventPastIdleGapStartsOverWithOrWithoutTick)
{
    PageTurnController ticked;
    PageTurnController unticked;
    ticked.setReaderPosition(5, 20);
    unticked.setReaderPosition(5, 20);

    ticked.handleWheel(100.0, WheelDeltaMode::Line, 1000);
    unticked.handleWheel(100.0, WheelDeltaMode::Line, 1000);

    ticked.tick(1201);
    EXPECT_EQ(ticked.accumulatorPhase(1201), AccumulatorPhase::Idle);
    ticked.handleWheel(100.0, WheelDeltaMode::Line, 1201);
    unticked.handleWheel(100.0, WheelDeltaMode::Line, 1201);

    EXPECT_DOUBLE_EQ(ticked.gestureState().accumulatedEnergy, 50.0);
    EXPECT_DOUBLE_EQ(unticked.gestureState().accumulatedEnergy, 50.0);
}

TEST_F(PageTurnControllerTest, CoolingDownReportedFromGuardWithoutTick)
{
    controller.setReaderPosition(5, 20);
    wheelForward(4, 0);
    ASSERT_EQ(intents.size(), 1u);
    EXPECT_TRUE(controller.isCoolingDown(500));
    EXPECT_EQ(controller.cooldownRemainingMs(448), 400u);

    EXPECT_FALSE(controller.isCoolingDown(48 + 800));
    EXPECT_EQ(controller.cooldownRemainingMs(48 + 800), 0u);
    EXPECT_EQ(controller.accumulatorPhase(48 + 800), AccumulatorPhase::Idle);
}

TEST_F(PageTurnControllerTest, WheelMidPageIsLeftToContent)
{
    controller.setReaderPosition(5, 20);
    controller.setScrollEdges(false, false);

    for (int i = 0; i < 6; ++i)
    {
        EXPECT_FALSE(controller.handleWheel(50.0, WheelDeltaMode::Line, i * 16));
        EXPECT_FALSE(controller.handleWheel(-50.0, WheelDeltaMode::Line, i * 16 + 8));
    }

    EXPECT_TRUE(intents.empty());
    EXPECT_DOUBLE_EQ(controller.gestureState().accumulatedEnergy, 0.0);
    EXPECT_FALSE(controller.feedback().visible);
    EXPECT_EQ(controller.accumulatorPhase(100), AccumulatorPhase::Idle);
}

TEST_F(PageTurnControllerTest, WheelAccumulatesOnlyPastTheEdgeItFaces)
{
    controller.setReaderPosition(5, 20);

    controller.setScrollEdges(true, false);
    EXPECT_FALSE(controller.handleWheel(50.0, WheelDeltaMode::Line, 0));
    EXPECT_TRUE(controller.handleWheel(-50.0, WheelDeltaMode::Line, 16));
    EXPECT_EQ(controller.gestureState().direction, ScrollDirection::Backward);
    EXPECT_DOUBLE_EQ(controller.gestureState().accumulatedEnergy, 40.0);

    controller.resetForDocument(20);
    controller.setReaderPosition(5, 20);
    controller.setScrollEdges(false, true);
    EXPECT_FALSE(controller.handleWheel(-50.0, WheelDeltaMode::Line, 1000));
    wheelForward(4, 1016);

    ASSERT_EQ(intents.size(), 1u);
    EXPECT_EQ(intents[0].targetPage, 6);
}

TEST_F(PageTurnControllerTest, ContentScrollSettleWindowBlocksWheel)
{
    controller.setReaderPosition(5, 20);
    controller.handleContentScroll(false, true, 1000);
    EXPECT_TRUE(controller.isContentScrolling(1000));
    EXPECT_TRUE(controller.hasPendingTimers());

    EXPECT_FALSE(controller.handleWheel(50.0, WheelDeltaMode::Line, 1100));
    EXPECT_FALSE(controller.handleWheel(50.0, WheelDeltaMode::Line, 1149));
    EXPECT_DOUBLE_EQ(controller.gestureState().accumulatedEnergy, 0.0);

    controller.tick(1150);
    EXPECT_FALSE(controller.isContentScrolling(1150));
    EXPECT_FALSE(controller.hasPendingTimers());
    EXPECT_TRUE(controller.handleWheel(50.0, WheelDeltaMode::Line, 1150));
    EXPECT_DOUBLE_EQ(controller.gestureState().accumulatedEnergy, 40.0);
}

TEST_F(PageTurnControllerTest, LeavingEdgeDropsBuildingGesture)
{
    controller.setReaderPosition(5, 20);
    controller.setScrollEdges(false, true);
    wheelForward(2, 0);
    ASSERT_DOUBLE_EQ(controller.gestureState().accumulatedEnergy, 80.0);
    ASSERT_TRUE(controller.feedback().visible);

    controller.handleContentScroll(false, false, 40);
    EXPECT_DOUBLE_EQ(controller.gestureState().accumulatedEnergy, 0.0);
    EXPECT_FALSE(controller.feedback().visible);
    EXPECT_EQ(controller.accumulatorPhase(40), AccumulatorPhase::Idle);

    // Back at the bottom the next push starts from zero
    controller.handleContentScroll(false, true, 100);
    EXPECT_TRUE(controller.handleWheel(50.0, WheelDeltaMode::Line, 300));
    EXPECT_DOUBLE_EQ(controller.gestureState().accumulatedEnergy, 40.0);
    EXPECT_TRUE(intents.empty());
}

TEST_F(PageTurnControllerTest, LeavingEdgeKeepsCooldownOfFiredTurn)
{
    controller.setReaderPosition(5, 20);
    controller.setScrollEdges(false, true);
    wheelForward(4, 0);
    ASSERT_EQ(intents.size(), 1u);

    controller.setScrollEdges(false, false);
    EXPECT_TRUE(controller.isCoolingDown(100));

    controller.setScrollEdges(false, true);
    wheelForward(10, 120);
    EXPECT_EQ(intents.size(), 1u);
}
