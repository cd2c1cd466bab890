#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "judge/timeout_governor.hpp"

namespace interjudge::judge {
namespace {

using std::chrono::milliseconds;

TEST(TimeoutGovernorTest, FreshGovernorIsWithinBudget) {
    TimeoutGovernor governor(milliseconds(5000), milliseconds(2000));
    EXPECT_FALSE(governor.TotalExceeded());
    EXPECT_FALSE(governor.IdleExceeded());
    EXPECT_LE(governor.NextWait(), TimeoutGovernor::kPollQuantum);
    EXPECT_GT(governor.NextWait(), TimeoutGovernor::Duration::zero());
}

TEST(TimeoutGovernorTest, NextWaitNeverExceedsRemainingBudget) {
    TimeoutGovernor governor(milliseconds(30), milliseconds(5000));
    EXPECT_LE(governor.NextWait(), milliseconds(30));
}

TEST(TimeoutGovernorTest, IdleBudgetExpiresWithoutActivity) {
    TimeoutGovernor governor(milliseconds(5000), milliseconds(50));
    std::this_thread::sleep_for(milliseconds(80));
    EXPECT_TRUE(governor.IdleExceeded());
    EXPECT_FALSE(governor.TotalExceeded());
    EXPECT_EQ(governor.NextWait(), TimeoutGovernor::Duration::zero());
}

TEST(TimeoutGovernorTest, ActivityRestartsIdleClockOnly) {
    TimeoutGovernor governor(milliseconds(5000), milliseconds(150));
    std::this_thread::sleep_for(milliseconds(100));
    governor.MarkActivity();
    std::this_thread::sleep_for(milliseconds(100));
    EXPECT_FALSE(governor.IdleExceeded());
    EXPECT_LT(governor.ElapsedIdle(), governor.ElapsedTotal());
    EXPECT_GE(governor.ElapsedTotal(), milliseconds(200));
}

TEST(TimeoutGovernorTest, TotalBudgetExpiresDespiteActivity) {
    TimeoutGovernor governor(milliseconds(100), milliseconds(5000));
    for (int i = 0; i < 6; ++i) {
        std::this_thread::sleep_for(milliseconds(30));
        governor.MarkActivity();
    }
    EXPECT_TRUE(governor.TotalExceeded());
    EXPECT_FALSE(governor.IdleExceeded());
    EXPECT_EQ(governor.NextWait(), TimeoutGovernor::Duration::zero());
}

}  // namespace
}  // namespace interjudge::judge
