/**
 * @file test_signals.cpp
 * @brief Signal handlers only set the loop's control flags
 */

#include <gtest/gtest.h>

#include <csignal>

#include "daemon/signals.hpp"

namespace {

class SignalsTest : public ::testing::Test {
protected:
    void SetUp() override { ASSERT_TRUE(Signals::install(flags)); }
    void TearDown() override { Signals::restoreDefaults(); }

    ControlFlags flags;
};

}  // namespace

// =============================================================================
// HANDLERS
// =============================================================================

TEST_F(SignalsTest, HangupRequestsReload) {
    ASSERT_EQ(std::raise(SIGHUP), 0);
    EXPECT_TRUE(flags.reload.load());
    EXPECT_FALSE(flags.stop.load());
}

TEST_F(SignalsTest, TerminateRequestsStop) {
    ASSERT_EQ(std::raise(SIGTERM), 0);
    EXPECT_TRUE(flags.stop.load());
    EXPECT_FALSE(flags.reload.load());
}

TEST_F(SignalsTest, InterruptRequestsStop) {
    ASSERT_EQ(std::raise(SIGINT), 0);
    EXPECT_TRUE(flags.stop.load());
    EXPECT_FALSE(flags.reload.load());
}

TEST_F(SignalsTest, RepeatedHangupsCollapseIntoOneReload) {
    ASSERT_EQ(std::raise(SIGHUP), 0);
    ASSERT_EQ(std::raise(SIGHUP), 0);
    EXPECT_TRUE(flags.reload.exchange(false));
    EXPECT_FALSE(flags.reload.load());
}

TEST(Signals, RestoreDefaultsReinstatesDefaultDisposition) {
    ControlFlags flags;
    ASSERT_TRUE(Signals::install(flags));
    Signals::restoreDefaults();

    for (int sig : {SIGINT, SIGTERM, SIGHUP}) {
        struct sigaction current {};
        ASSERT_EQ(sigaction(sig, nullptr, &current), 0);
        EXPECT_EQ(current.sa_handler, SIG_DFL) << "signal " << sig;
    }
}
