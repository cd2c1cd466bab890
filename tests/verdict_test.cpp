#include <gtest/gtest.h>

#include "judge/verdict.hpp"
#include "utils/process.hpp"

#include <sys/wait.h>

namespace interjudge::judge {
namespace {

TEST(ResolveVerdictTest, MapsJudgeExitCodes) {
    EXPECT_EQ(ResolveVerdict(0), Verdict::kAccepted);
    EXPECT_EQ(ResolveVerdict(1), Verdict::kWrongAnswer);
    EXPECT_EQ(ResolveVerdict(2), Verdict::kProtocolError);
}

TEST(ResolveVerdictTest, AnyOtherCodeIsRuntimeError) {
    EXPECT_EQ(ResolveVerdict(3), Verdict::kRuntimeError);
    EXPECT_EQ(ResolveVerdict(-1), Verdict::kRuntimeError);
    EXPECT_EQ(ResolveVerdict(137), Verdict::kRuntimeError);
    EXPECT_EQ(ResolveVerdict(255), Verdict::kRuntimeError);
}

TEST(VerdictTest, ShortNames) {
    EXPECT_STREQ(ToString(Verdict::kAccepted), "AC");
    EXPECT_STREQ(ToString(Verdict::kWrongAnswer), "WA");
    EXPECT_STREQ(ToString(Verdict::kProtocolError), "PE");
    EXPECT_STREQ(ToString(Verdict::kTimeLimitExceeded), "TLE");
    EXPECT_STREQ(ToString(Verdict::kRuntimeError), "RE");
}

TEST(DecodeExitStatusTest, SignalsMapAbove128) {
    EXPECT_EQ(utils::DecodeExitStatus(3 << 8), 3);
    EXPECT_EQ(utils::DecodeExitStatus(SIGKILL), 128 + SIGKILL);
    EXPECT_EQ(ResolveVerdict(utils::DecodeExitStatus(SIGSEGV)), Verdict::kRuntimeError);
}

}  // namespace
}  // namespace interjudge::judge
