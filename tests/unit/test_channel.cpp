/**
 * @file test_channel.cpp
 * @brief Unit tests for the closable event channel
 */

#include <gtest/gtest.h>
#include <pdrop/channel.h>

#include <chrono>
#include <thread>

using namespace pdrop;
using namespace std::chrono_literals;

TEST(ChannelTest, FifoOrder) {
  Channel<int> ch;
  EXPECT_TRUE(ch.send(1));
  EXPECT_TRUE(ch.send(2));
  EXPECT_TRUE(ch.send(3));
  EXPECT_EQ(ch.size(), 3u);

  int v = 0;
  EXPECT_EQ(ch.receive(v, 0ms), ChannelStatus::Ok);
  EXPECT_EQ(v, 1);
  EXPECT_EQ(ch.receive(v, 0ms), ChannelStatus::Ok);
  EXPECT_EQ(v, 2);
  EXPECT_EQ(ch.try_receive().value(), 3);
  EXPECT_FALSE(ch.try_receive().has_value());
}

TEST(ChannelTest, ReceiveTimesOut) {
  Channel<int> ch;
  int v = 0;
  auto began = std::chrono::steady_clock::now();
  EXPECT_EQ(ch.receive(v, 20ms), ChannelStatus::Timeout);
  EXPECT_GE(std::chrono::steady_clock::now() - began, 20ms);
}

TEST(ChannelTest, CloseDrainsThenReportsClosed) {
  Channel<int> ch;
  ch.send(7);
  ch.close();

  EXPECT_TRUE(ch.is_closed());
  EXPECT_FALSE(ch.is_finished());
  EXPECT_FALSE(ch.send(8));

  int v = 0;
  EXPECT_EQ(ch.receive(v, 10ms), ChannelStatus::Ok);
  EXPECT_EQ(v, 7);
  EXPECT_EQ(ch.receive(v, 10ms), ChannelStatus::Closed);
  EXPECT_TRUE(ch.is_finished());
}

TEST(ChannelTest, CloseWakesBlockedReceiver) {
  Channel<int> ch;
  ChannelStatus status = ChannelStatus::Ok;

  std::thread receiver([&] {
    int v = 0;
    status = ch.receive(v, 5s);
  });

  std::this_thread::sleep_for(20ms);
  auto began = std::chrono::steady_clock::now();
  ch.close();
  receiver.join();

  EXPECT_EQ(status, ChannelStatus::Closed);
  EXPECT_LT(std::chrono::steady_clock::now() - began, 1s);
}

TEST(ChannelTest, ReceiveUntilDeadline) {
  Channel<int> ch;
  std::thread sender([&] {
    std::this_thread::sleep_for(10ms);
    ch.send(42);
  });

  int v = 0;
  auto status =
      ch.receive_until(v, std::chrono::steady_clock::now() + 2s);
  sender.join();

  EXPECT_EQ(status, ChannelStatus::Ok);
  EXPECT_EQ(v, 42);
}

TEST(ChannelTest, FullChannelDropsOldest) {
  Channel<int> ch(2);
  EXPECT_EQ(ch.capacity(), 2u);
  EXPECT_TRUE(ch.send(1));
  EXPECT_TRUE(ch.send(2));
  EXPECT_TRUE(ch.send(3));
  EXPECT_TRUE(ch.send(4));
  EXPECT_EQ(ch.size(), 2u);
  EXPECT_EQ(ch.dropped(), 2u);

  EXPECT_EQ(ch.try_receive().value(), 3);
  EXPECT_EQ(ch.try_receive().value(), 4);
  EXPECT_TRUE(ch.send(5));
  EXPECT_EQ(ch.dropped(), 2u);
}

TEST(ChannelTest, ZeroCapacityIsUnbounded) {
  Channel<int> ch(0);
  for (int i = 0; i < 10000; ++i) {
    ch.send(i);
  }
  EXPECT_EQ(ch.size(), 10000u);
  EXPECT_EQ(ch.dropped(), 0u);
}

TEST(ChannelTest, StatusNames) {
  EXPECT_STREQ(channel_status_name(ChannelStatus::Ok), "Ok");
  EXPECT_STREQ(channel_status_name(ChannelStatus::Timeout), "Timeout");
  EXPECT_STREQ(channel_status_name(ChannelStatus::Closed), "Closed");
}
