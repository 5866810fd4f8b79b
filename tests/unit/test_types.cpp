// ============================================================================
// PACER - Core Types Unit Tests
// ============================================================================

#include "pacer/core/types.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace pacer;

// ============================================================================
// RecvResult Tests
// ============================================================================

TEST(RecvResultTest, ReceivedCarriesValue) {
    auto result = RecvResult<int>::received(42);

    EXPECT_TRUE(result.is_received());
    EXPECT_FALSE(result.is_closed());
    EXPECT_TRUE(static_cast<bool>(result));
    ASSERT_TRUE(result.value.has_value());
    EXPECT_EQ(*result.value, 42);
}

TEST(RecvResultTest, TerminalOutcomesCarryNoValue) {
    auto closed = RecvResult<std::string>::closed();
    auto timed_out = RecvResult<std::string>::timed_out();
    auto empty = RecvResult<std::string>::empty();

    EXPECT_TRUE(closed.is_closed());
    EXPECT_FALSE(closed.value.has_value());

    EXPECT_EQ(timed_out.status, RecvStatus::TimedOut);
    EXPECT_FALSE(timed_out);
    EXPECT_FALSE(timed_out.is_closed());

    EXPECT_EQ(empty.status, RecvStatus::Empty);
    EXPECT_FALSE(empty.value.has_value());
}

TEST(RecvResultTest, DefaultIsClosed) {
    RecvResult<int> result;
    EXPECT_TRUE(result.is_closed());
}

// ============================================================================
// Names
// ============================================================================

TEST(StatusNameTest, RecvStatus) {
    EXPECT_EQ(to_string(RecvStatus::Received), "received");
    EXPECT_EQ(to_string(RecvStatus::Closed), "closed");
    EXPECT_EQ(to_string(RecvStatus::TimedOut), "timed_out");
    EXPECT_EQ(to_string(RecvStatus::Empty), "empty");
}

TEST(StatusNameTest, SendStatus) {
    EXPECT_EQ(to_string(SendStatus::Sent), "sent");
    EXPECT_EQ(to_string(SendStatus::Closed), "closed");
    EXPECT_EQ(to_string(SendStatus::Full), "full");
}

TEST(TimeTest, ToMilliseconds) {
    EXPECT_EQ(to_ms(std::chrono::seconds{2}), 2000);
    EXPECT_EQ(to_ms(std::chrono::microseconds{1999}), 1);
}
