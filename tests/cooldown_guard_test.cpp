#include "cooldown_guard.h"
#include "deadline_timer.h"

#include <gtest/gtest.h>

TEST(DeadlineTimerTest, FiresOnceAtDeadline)
{
    DeadlineTimer timer;
    EXPECT_FALSE(timer.isArmed());

    timer.restart(1000, 200);
    EXPECT_TRUE(timer.isArmed());
    EXPECT_FALSE(timer.poll(1199));
    EXPECT_TRUE(timer.poll(1200));
    EXPECT_FALSE(timer.poll(1300));
    EXPECT_FALSE(timer.isArmed());
}

TEST(DeadlineTimerTest, RestartReplacesPendingDeadline)
{
    DeadlineTimer timer;
    timer.restart(0, 200);
    timer.restart(150, 200);
    EXPECT_EQ(timer.deadline(), 350u);
    EXPECT_FALSE(timer.poll(200));
    EXPECT_TRUE(timer.poll(350));
}

TEST(DeadlineTimerTest, CancelDisarms)
{
    DeadlineTimer timer;
    timer.restart(0, 100);
    timer.cancel();
    EXPECT_FALSE(timer.poll(500));
}

TEST(CooldownGuardTest, InactiveUntilArmed)
{
    CooldownGuard guard;
    EXPECT_FALSE(guard.isActive(0));
    EXPECT_EQ(guard.remainingMs(0), 0u);
}

TEST(CooldownGuardTest, ActiveForWindow)
{
    CooldownGuard guard(800);
    guard.arm(1000);
    EXPECT_TRUE(guard.isActive(1000));
    EXPECT_TRUE(guard.isActive(1799));
    EXPECT_EQ(guard.remainingMs(1300), 500u);
    EXPECT_FALSE(guard.isActive(1800));
    EXPECT_EQ(guard.remainingMs(1800), 0u);
}

TEST(CooldownGuardTest, EarlierTimestampCountsAsActive)
{
    CooldownGuard guard(800);
    guard.arm(5000);
    EXPECT_TRUE(guard.isActive(4000));
}

TEST(CooldownGuardTest, ClearEndsCooldown)
{
    CooldownGuard guard(800);
    guard.arm(0);
    guard.clear();
    EXPECT_FALSE(guard.isActive(10));
    EXPECT_EQ(guard.remainingMs(10), 0u);
}
