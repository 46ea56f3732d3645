#include <gtest/gtest.h>

#include <cstdint>
#include <stdexcept>
#include <vector>

#include "loadcell_bus/protocol_engine.h"

namespace loadcell_bus {
namespace {

const Bytes kBcdFrame{0x01, 0x05, 0x02, 0x00, 0x09, 0x02, 0x91, 0xA4};
const Bytes kBinaryFrame{0x02, 0x05, 0x02, 0x00, 0x03, 0x00, 0xC5, 0x1A, 0xEB};
const Bytes kParamFrame{0x03, 0x05, 0x23, 0x31, 0x25, 0x00, 0x4E, 0x20, 0xEF};
const Bytes kIdFrame{0x04, 0x05, 0x05, 0x00, 0x00, 0x00,
                     0x00, 0xDE, 0xAD, 0xBE, 0xEF, 0x46};

TEST(ProtocolEngineTest, FrameSplitAcrossChunks) {
  ProtocolEngine engine;

  EXPECT_TRUE(engine.Feed(kBcdFrame.data(), 5).empty());
  EXPECT_EQ(engine.Buffered(), 5U);

  const auto events = engine.Feed(kBcdFrame.data() + 5, 3);
  ASSERT_EQ(events.size(), 1U);
  EXPECT_EQ(events[0].kind, EventKind::kWeight);
  EXPECT_EQ(events[0].address, 0x01);
  EXPECT_DOUBLE_EQ(events[0].weight.weight_grams, 29100.0);
  EXPECT_EQ(engine.Buffered(), 0U);
}

TEST(ProtocolEngineTest, HeldBinaryFrameCompletesOnNextFeed) {
  ProtocolEngine engine;

  EXPECT_TRUE(engine.Feed(kBinaryFrame.data(), 8).empty());
  EXPECT_EQ(engine.Buffered(), 8U);

  const auto events = engine.Feed(kBinaryFrame.data() + 8, 1);
  ASSERT_EQ(events.size(), 1U);
  EXPECT_TRUE(events[0].weight.binary_format);
  EXPECT_EQ(events[0].weight.raw_magnitude, 50458U);
}

TEST(ProtocolEngineTest, ParamFrameSplitAfterEightBytes) {
  ProtocolEngine engine;

  EXPECT_TRUE(engine.Feed(kParamFrame.data(), 8).empty());
  EXPECT_EQ(engine.Buffered(), 8U);

  const auto events = engine.Feed(kParamFrame.data() + 8, 1);
  ASSERT_EQ(events.size(), 1U);
  EXPECT_EQ(events[0].kind, EventKind::kParams);
  EXPECT_EQ(events[0].address, 0x03);
  EXPECT_EQ(engine.Stats().bytes_skipped, 0U);
  EXPECT_EQ(engine.Buffered(), 0U);
}

TEST(ProtocolEngineTest, IdFrameSplitAfterEightBytes) {
  ProtocolEngine engine;

  EXPECT_TRUE(engine.Feed(kIdFrame.data(), 8).empty());
  EXPECT_EQ(engine.Buffered(), 8U);

  const auto events = engine.Feed(kIdFrame.data() + 8, 4);
  ASSERT_EQ(events.size(), 1U);
  EXPECT_EQ(events[0].kind, EventKind::kIdentity);
  EXPECT_EQ(events[0].identity.ToHexString(), "DEADBEEF");
  EXPECT_EQ(engine.Stats().bytes_skipped, 0U);
  EXPECT_EQ(engine.Buffered(), 0U);
}

TEST(ProtocolEngineTest, HeldWeightCandidateResyncsWhenNoiseArrives) {
  ProtocolEngine engine;

  EXPECT_TRUE(engine.Feed(kBinaryFrame.data(), 8).empty());
  EXPECT_EQ(engine.Stats().bytes_skipped, 0U);

  const std::uint8_t noise = 0xFF;
  EXPECT_TRUE(engine.Feed(&noise, 1).empty());
  EXPECT_EQ(engine.Stats().bytes_skipped, 2U);
  EXPECT_EQ(engine.Buffered(), 7U);
}

TEST(ProtocolEngineTest, DispatchesEveryFrameKindAndCountsStats) {
  ProtocolEngine engine;

  Bytes stream{0xFF, 0x00};
  for (const Bytes &f : {kBcdFrame, kBinaryFrame, kParamFrame, kIdFrame})
    stream.insert(stream.end(), f.begin(), f.end());

  const auto events = engine.Feed(stream);
  ASSERT_EQ(events.size(), 4U);
  EXPECT_EQ(events[0].kind, EventKind::kWeight);
  EXPECT_EQ(events[1].kind, EventKind::kWeight);
  EXPECT_EQ(events[2].kind, EventKind::kParams);
  EXPECT_EQ(events[2].params.scale_kind_name, "normal");
  EXPECT_EQ(events[3].kind, EventKind::kIdentity);
  EXPECT_EQ(events[3].identity.ToHexString(), "DEADBEEF");

  const EngineStats &s = engine.Stats();
  EXPECT_EQ(s.bytes_fed, stream.size());
  EXPECT_EQ(s.bytes_skipped, 2U);
  EXPECT_EQ(s.weight_frames, 2U);
  EXPECT_EQ(s.param_frames, 1U);
  EXPECT_EQ(s.id_frames, 1U);

  engine.ResetStats();
  EXPECT_EQ(engine.Stats().bytes_fed, 0U);
}

TEST(ProtocolEngineTest, SubscribeAndUnsubscribe) {
  ProtocolEngine engine;

  int first = 0;
  int second = 0;
  const auto id1 = engine.Subscribe([&first](const DecodedEvent &) { ++first; });
  const auto id2 = engine.Subscribe([&second](const DecodedEvent &) { ++second; });
  EXPECT_NE(id1, id2);

  engine.Feed(kBcdFrame);
  EXPECT_EQ(first, 1);
  EXPECT_EQ(second, 1);

  EXPECT_TRUE(engine.Unsubscribe(id1));
  EXPECT_FALSE(engine.Unsubscribe(id1));

  engine.Feed(kBcdFrame);
  EXPECT_EQ(first, 1);
  EXPECT_EQ(second, 2);
}

TEST(ProtocolEngineTest, ThrowingSubscriberDoesNotStopDelivery) {
  ProtocolEngine engine;

  int delivered = 0;
  engine.Subscribe([](const DecodedEvent &) { throw std::runtime_error("boom"); });
  engine.Subscribe([&delivered](const DecodedEvent &) { ++delivered; });

  const auto events = engine.Feed(kBcdFrame);
  EXPECT_EQ(events.size(), 1U);
  EXPECT_EQ(delivered, 1);
  EXPECT_EQ(engine.Stats().subscriber_errors, 1U);
}

TEST(ProtocolEngineTest, UnsubscribeFromInsideCallback) {
  ProtocolEngine engine;

  int calls = 0;
  ProtocolEngine::SubscriptionId self = 0;
  self = engine.Subscribe([&](const DecodedEvent &) {
    ++calls;
    engine.Unsubscribe(self);
  });

  engine.Feed(kBcdFrame);
  engine.Feed(kBcdFrame);
  EXPECT_EQ(calls, 1);
}

TEST(ProtocolEngineTest, ClearDropsPartialFrame) {
  ProtocolEngine engine;
  engine.Feed(kBcdFrame.data(), 6);
  engine.Clear();
  EXPECT_EQ(engine.Buffered(), 0U);

  // 남은 2바이트만으로는 프레임이 되지 않는다
  EXPECT_TRUE(engine.Feed(kBcdFrame.data() + 6, 2).empty());
}

TEST(ProtocolEngineTest, CustomCountsPerGram) {
  EngineConfig config;
  config.binary_counts_per_gram = 10.0;
  ProtocolEngine engine(config);

  const auto events = engine.Feed(kBinaryFrame);
  ASSERT_EQ(events.size(), 1U);
  EXPECT_DOUBLE_EQ(events[0].weight.weight_grams, 5045.8);
}

} // namespace
} // namespace loadcell_bus
