#include <gtest/gtest.h>
#include "interrupt.hpp"
#include "run_context.hpp"

#include <csignal>

class InterruptTest : public ::testing::Test {
protected:
    void SetUp() override {
        install_interrupt_handler();
        reset_interrupt();
    }

    void TearDown() override {
        reset_interrupt();
    }
};

TEST_F(InterruptTest, SignalRaisesFlag) {
    EXPECT_FALSE(interrupt_requested());
    std::raise(SIGINT);
    EXPECT_TRUE(interrupt_requested());

    reset_interrupt();
    std::raise(SIGTERM);
    EXPECT_TRUE(interrupt_requested());
}

TEST_F(InterruptTest, FlagDrivesRunContext) {
    RunContext ctx{.stop_requested = interrupt_requested};
    EXPECT_FALSE(ctx.should_stop());
    std::raise(SIGINT);
    EXPECT_TRUE(ctx.should_stop());
}

TEST(RunContextTest, EmptyCollaboratorsNeverStopAndDiscard) {
    RunContext ctx;
    EXPECT_FALSE(ctx.should_stop());
    EXPECT_NO_THROW(ctx.report("ignored"));
}
