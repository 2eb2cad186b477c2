/**
 * @file test_cancel.cpp
 * @brief Unit tests for cancellation and bounded channels
 */

#include <clipsync/channel.h>
#include <clipsync/clipsync.h>
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

using namespace clipsync;

class CancelTest : public ::testing::Test {};

// ============================================================================
// Cancellation
// ============================================================================

TEST_F(CancelTest, DefaultTokenNeverCancels) {
  CancellationToken token;
  EXPECT_FALSE(token.is_cancelled());
  EXPECT_FALSE(token.wait_for(Milliseconds(1)));
}

TEST_F(CancelTest, CancelIsObserved) {
  CancellationSource source;
  CancellationToken token = source.token();
  EXPECT_FALSE(token.is_cancelled());

  source.cancel();
  EXPECT_TRUE(token.is_cancelled());
  EXPECT_TRUE(source.is_cancelled());
  EXPECT_TRUE(token.wait_for(Milliseconds(10000)));
}

TEST_F(CancelTest, WaitForWakesOnCancel) {
  CancellationSource source;
  CancellationToken token = source.token();

  auto start = std::chrono::steady_clock::now();
  std::thread canceller([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    source.cancel();
  });

  EXPECT_TRUE(token.wait_for(Milliseconds(10000)));
  auto elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_LT(elapsed, std::chrono::seconds(5));
  canceller.join();
}

TEST_F(CancelTest, CallbackRunsOnce) {
  CancellationSource source;
  std::atomic<int> calls{0};
  auto reg = source.token().on_cancel([&] { calls++; });

  source.cancel();
  source.cancel();
  EXPECT_EQ(calls.load(), 1);
}

TEST_F(CancelTest, CallbackAfterCancelRunsImmediately) {
  CancellationSource source;
  source.cancel();

  bool called = false;
  auto reg = source.token().on_cancel([&] { called = true; });
  EXPECT_TRUE(called);
}

TEST_F(CancelTest, ResetRegistrationUnsubscribes) {
  CancellationSource source;
  bool called = false;
  auto reg = source.token().on_cancel([&] { called = true; });
  reg.reset();

  source.cancel();
  EXPECT_FALSE(called);
}

TEST_F(CancelTest, RegistrationOutlivesSource) {
  CancelRegistration reg;
  {
    CancellationSource source;
    reg = source.token().on_cancel([] {});
  }
  reg.reset();
}

// ============================================================================
// Channel
// ============================================================================

TEST_F(CancelTest, ChannelFifo) {
  Channel<int> ch(4);
  ch.push(1);
  ch.push(2);
  EXPECT_EQ(ch.size(), 2u);
  EXPECT_EQ(ch.pop().value(), 1);
  EXPECT_EQ(ch.pop().value(), 2);
}

TEST_F(CancelTest, ChannelDropsOldestWhenFull) {
  Channel<int> ch(8);
  for (int i = 0; i < 10; ++i) {
    ch.push(i);
  }
  EXPECT_EQ(ch.size(), 8u);
  EXPECT_EQ(ch.dropped(), 2u);
  EXPECT_EQ(ch.pop().value(), 2);
}

TEST_F(CancelTest, ChannelCloseDrainsThenEnds) {
  Channel<int> ch(4);
  ch.push(7);
  ch.close();

  EXPECT_FALSE(ch.push(8));
  EXPECT_EQ(ch.pop().value(), 7);
  EXPECT_FALSE(ch.pop().has_value());
  EXPECT_TRUE(ch.closed());
}

TEST_F(CancelTest, ChannelCloseWakesConsumer) {
  Channel<int> ch(4);
  std::thread consumer([&] { EXPECT_FALSE(ch.pop().has_value()); });
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  ch.close();
  consumer.join();
}

TEST_F(CancelTest, ChannelPopForTimesOut) {
  Channel<int> ch(1);
  EXPECT_FALSE(ch.pop_for(Milliseconds(10)).has_value());
}
