#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "loadcell_bus/byte_chunk_channel.h"
#include "loadcell_bus/loadcell_exception.h"

namespace loadcell_bus {
namespace {

using std::chrono::milliseconds;

TEST(ByteChunkChannelTest, DropsOldestWhenFull) {
  ByteChunkChannel channel(2);
  EXPECT_TRUE(channel.Push({0x01}));
  EXPECT_TRUE(channel.Push({0x02}));
  EXPECT_TRUE(channel.Push({0x03}));

  EXPECT_EQ(channel.Size(), 2U);
  EXPECT_EQ(channel.DroppedChunks(), 1U);

  Bytes out;
  ASSERT_TRUE(channel.TryPop(out));
  EXPECT_EQ(out, Bytes{0x02});
  ASSERT_TRUE(channel.TryPop(out));
  EXPECT_EQ(out, Bytes{0x03});
  EXPECT_FALSE(channel.TryPop(out));
}

TEST(ByteChunkChannelTest, EmptyChunkIsIgnored) {
  ByteChunkChannel channel(4);
  EXPECT_FALSE(channel.Push(Bytes{}));
  EXPECT_EQ(channel.Size(), 0U);
}

TEST(ByteChunkChannelTest, PopTimesOut) {
  ByteChunkChannel channel(4);
  Bytes out;
  const auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(channel.Pop(out, milliseconds(20)));
  EXPECT_GE(std::chrono::steady_clock::now() - start, milliseconds(15));
}

TEST(ByteChunkChannelTest, PopWakesOnPushFromAnotherThread) {
  ByteChunkChannel channel(4);
  std::thread producer([&channel] {
    std::this_thread::sleep_for(milliseconds(10));
    channel.Push({0xAA, 0xBB});
  });

  Bytes out;
  EXPECT_TRUE(channel.Pop(out, milliseconds(2000)));
  EXPECT_EQ(out, (Bytes{0xAA, 0xBB}));
  producer.join();
}

TEST(ByteChunkChannelTest, CloseWakesWaiterAndRejectsPush) {
  ByteChunkChannel channel(4);
  std::thread closer([&channel] {
    std::this_thread::sleep_for(milliseconds(10));
    channel.Close();
  });

  Bytes out;
  EXPECT_FALSE(channel.Pop(out, milliseconds(2000)));
  closer.join();

  EXPECT_TRUE(channel.IsClosed());
  EXPECT_FALSE(channel.Push({0x01}));

  channel.Reopen();
  EXPECT_FALSE(channel.IsClosed());
  EXPECT_TRUE(channel.Push({0x01}));
}

TEST(ByteChunkChannelTest, ZeroCapacityIsRejected) {
  EXPECT_THROW(ByteChunkChannel{0}, LoadCellException);
}

} // namespace
} // namespace loadcell_bus
