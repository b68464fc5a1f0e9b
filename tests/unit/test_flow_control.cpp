#include <gtest/gtest.h>
#include "peerdrop/transfer/flow_control.hpp"

using namespace peerdrop::transfer;

TEST(FlowControllerTest, StartsEmpty) {
    FlowController flow(1000);
    
    EXPECT_TRUE(flow.can_send());
    EXPECT_EQ(flow.in_flight(), 0u);
    EXPECT_EQ(flow.window_remaining(), 1000u);
    EXPECT_FALSE(flow.is_paused());
}

TEST(FlowControllerTest, BlocksWhenBudgetIsUsed) {
    FlowController flow(1000);
    
    flow.on_bytes_sent(600);
    EXPECT_TRUE(flow.can_send());
    EXPECT_EQ(flow.window_remaining(), 400u);
    
    // A chunk may overshoot the remaining window; the next one waits.
    flow.on_bytes_sent(600);
    EXPECT_FALSE(flow.can_send());
    EXPECT_EQ(flow.window_remaining(), 0u);
    EXPECT_EQ(flow.in_flight(), 1200u);
}

TEST(FlowControllerTest, AcknowledgmentsReopenWindow) {
    FlowController flow(1000);
    flow.on_bytes_sent(1000);
    ASSERT_FALSE(flow.can_send());
    
    EXPECT_TRUE(flow.on_ack(400));
    EXPECT_TRUE(flow.can_send());
    EXPECT_EQ(flow.in_flight(), 600u);
    EXPECT_EQ(flow.bytes_acked(), 400u);
    
    // Duplicate cumulative acks are harmless.
    EXPECT_TRUE(flow.on_ack(400));
    EXPECT_EQ(flow.bytes_acked(), 400u);
}

TEST(FlowControllerTest, RejectsInvalidAcknowledgments) {
    FlowController flow(1000);
    flow.on_bytes_sent(500);
    ASSERT_TRUE(flow.on_ack(300));
    
    EXPECT_FALSE(flow.on_ack(200));
    EXPECT_FALSE(flow.on_ack(501));
    EXPECT_EQ(flow.bytes_acked(), 300u);
}

TEST(FlowControllerTest, ResetStartsAtOffset) {
    FlowController flow(1000);
    flow.on_bytes_sent(900);
    flow.set_paused(true);
    
    flow.reset(5000);
    
    EXPECT_FALSE(flow.is_paused());
    EXPECT_EQ(flow.in_flight(), 0u);
    EXPECT_EQ(flow.bytes_sent(), 5000u);
    EXPECT_FALSE(flow.on_ack(4000));
    
    flow.on_bytes_sent(100);
    EXPECT_TRUE(flow.on_ack(5100));
}

TEST(FlowControllerTest, ZeroBudgetStillAllowsOneChunk) {
    FlowController flow(0);
    
    EXPECT_EQ(flow.max_in_flight_bytes(), 1u);
    EXPECT_TRUE(flow.can_send());
    flow.on_bytes_sent(10);
    EXPECT_FALSE(flow.can_send());
}
