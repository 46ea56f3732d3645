#include <gtest/gtest.h>

#include <cstddef>

#include "loadcell_bus/stream_scanner.h"

namespace loadcell_bus {
namespace {

// addr 1, division 9 (100g), BCD 0291
const Bytes kBcdFrame{0x01, 0x05, 0x02, 0x00, 0x09, 0x02, 0x91, 0xA4};
// addr 2, division 3, binary 0x00C51A
const Bytes kBinaryFrame{0x02, 0x05, 0x02, 0x00, 0x03, 0x00, 0xC5, 0x1A, 0xEB};
// addr 3, division 3 / kind 1, zero 2 / settle 5, max 20000
const Bytes kParamFrame{0x03, 0x05, 0x23, 0x31, 0x25, 0x00, 0x4E, 0x20, 0xEF};
// addr 4, id DEADBEEF
const Bytes kIdFrame{0x04, 0x05, 0x05, 0x00, 0x00, 0x00,
                     0x00, 0xDE, 0xAD, 0xBE, 0xEF, 0x46};

Bytes Concat(std::initializer_list<Bytes> parts) {
  Bytes out;
  for (const auto &p : parts)
    out.insert(out.end(), p.begin(), p.end());
  return out;
}

TEST(StreamScannerTest, FixtureChecksumsAreValid) {
  for (const Bytes &f : {kBcdFrame, kBinaryFrame, kParamFrame, kIdFrame})
    EXPECT_TRUE(FrameCodec::VerifyChecksum(f.data(), f.size()));
}

TEST(StreamScannerTest, SkipsLeadingNoiseAndFindsBothShapes) {
  const Bytes buffer = Concat({{0xFF}, kBcdFrame, kBinaryFrame});

  const ScanResult r = StreamScanner().Scan(buffer);
  ASSERT_EQ(r.frames.size(), 2U);
  EXPECT_EQ(r.frames[0].bytes, kBcdFrame);
  EXPECT_EQ(r.frames[0].source_offset, 1U);
  EXPECT_EQ(r.frames[1].bytes, kBinaryFrame);
  EXPECT_EQ(r.frames[1].source_offset, 9U);
  EXPECT_EQ(r.skipped, 1U);
  EXPECT_EQ(r.consumed, buffer.size());
}

TEST(StreamScannerTest, ConcatenatedFramesFromSeveralDevices) {
  const Bytes second_bcd{0x02, 0x05, 0x02, 0x00, 0x09, 0x02, 0x91, 0xA5};
  const Bytes buffer = Concat({kBcdFrame, second_bcd, kParamFrame, kIdFrame});

  const ScanResult r = StreamScanner().Scan(buffer);
  ASSERT_EQ(r.frames.size(), 4U);
  EXPECT_EQ(r.frames[0].Address(), 0x01);
  EXPECT_EQ(r.frames[1].Address(), 0x02);
  EXPECT_EQ(r.frames[2].Register(), 0x23);
  EXPECT_EQ(r.frames[2].Size(), 9U);
  EXPECT_EQ(r.frames[3].Register(), 0x05);
  EXPECT_EQ(r.frames[3].Size(), 12U);
  EXPECT_EQ(r.skipped, 0U);
  EXPECT_EQ(r.consumed, buffer.size());
}

TEST(StreamScannerTest, ShortTailIsLeftForNextScan) {
  const Bytes buffer = Concat({kBcdFrame, {0x02, 0x05, 0x02}});

  const ScanResult r = StreamScanner().Scan(buffer);
  ASSERT_EQ(r.frames.size(), 1U);
  EXPECT_EQ(r.consumed, kBcdFrame.size());
}

TEST(StreamScannerTest, HoldsWeightCandidateWaitingForNinthByte) {
  const Bytes partial(kBinaryFrame.begin(), kBinaryFrame.end() - 1);

  const ScanResult r = StreamScanner().Scan(partial);
  EXPECT_TRUE(r.frames.empty());
  EXPECT_EQ(r.consumed, 0U);
  EXPECT_EQ(r.skipped, 0U);
}

TEST(StreamScannerTest, HoldsParamCandidateWaitingForLastByte) {
  const Bytes partial(kParamFrame.begin(), kParamFrame.end() - 1);

  const ScanResult r = StreamScanner().Scan(partial);
  EXPECT_TRUE(r.frames.empty());
  EXPECT_EQ(r.consumed, 0U);
  EXPECT_EQ(r.skipped, 0U);
}

TEST(StreamScannerTest, HoldsIdCandidateUntilTwelveBytes) {
  for (std::size_t n = 8; n < kIdFrame.size(); ++n) {
    const Bytes partial(kIdFrame.begin(), kIdFrame.begin() + n);

    const ScanResult r = StreamScanner().Scan(partial);
    EXPECT_TRUE(r.frames.empty()) << "n=" << n;
    EXPECT_EQ(r.consumed, 0U) << "n=" << n;
    EXPECT_EQ(r.skipped, 0U) << "n=" << n;
  }

  const ScanResult full = StreamScanner().Scan(kIdFrame);
  ASSERT_EQ(full.frames.size(), 1U);
  EXPECT_EQ(full.consumed, kIdFrame.size());
}

TEST(StreamScannerTest, HeldParamCandidateRejectedWhenNoiseCompletesIt) {
  Bytes buffer(kParamFrame.begin(), kParamFrame.end() - 1);
  ASSERT_EQ(StreamScanner().Scan(buffer).consumed, 0U);

  // 9번째 바이트가 checksum 과 맞지 않으면 그때 resync
  buffer.push_back(0x00);
  const ScanResult rejected = StreamScanner().Scan(buffer);
  EXPECT_TRUE(rejected.frames.empty());
  EXPECT_EQ(rejected.skipped, 2U);
  EXPECT_EQ(rejected.consumed, 2U);

  buffer.erase(buffer.begin(), buffer.begin() + rejected.consumed);
  buffer.insert(buffer.end(), kBcdFrame.begin(), kBcdFrame.end());
  const ScanResult next = StreamScanner().Scan(buffer);
  ASSERT_EQ(next.frames.size(), 1U);
  EXPECT_EQ(next.frames[0].bytes, kBcdFrame);
  EXPECT_EQ(next.skipped, 7U);
  EXPECT_EQ(next.consumed, buffer.size());
}

TEST(StreamScannerTest, CompletedIdCandidateWithBadChecksumIsRejected) {
  Bytes buffer(kIdFrame.begin(), kIdFrame.begin() + 8);
  ASSERT_EQ(StreamScanner().Scan(buffer).consumed, 0U);

  buffer.insert(buffer.end(), {0xFF, 0xFF, 0xFF, 0xFF});
  const ScanResult r = StreamScanner().Scan(buffer);
  EXPECT_TRUE(r.frames.empty());
  EXPECT_EQ(r.skipped, 5U);
  EXPECT_EQ(r.consumed, 5U);
}

TEST(StreamScannerTest, CorruptedFrameIsSkippedByteByByte) {
  Bytes bad = kBcdFrame;
  bad[7] = 0x00;
  const Bytes buffer = Concat({bad, kBinaryFrame});

  const ScanResult r = StreamScanner().Scan(buffer);
  ASSERT_EQ(r.frames.size(), 1U);
  EXPECT_EQ(r.frames[0].bytes, kBinaryFrame);
  EXPECT_EQ(r.skipped, bad.size());
}

TEST(StreamScannerTest, NonResponseFunctionIsRejected) {
  // 명령 echo (function 0x63) 는 응답이 아님
  const Bytes echo{0x00, 0x63, 0x06, 0x03, 0x6C, 0x00, 0x00, 0x00};
  const ScanResult r = StreamScanner().Scan(echo);
  EXPECT_TRUE(r.frames.empty());
  EXPECT_EQ(r.skipped, 1U);
  EXPECT_TRUE(StreamScanner::IsResponseFunction(0x05));
  EXPECT_TRUE(StreamScanner::IsResponseFunction(0x06));
  EXPECT_FALSE(StreamScanner::IsResponseFunction(0x63));
}

TEST(StreamScannerTest, EmptyInput) {
  const ScanResult r = StreamScanner().Scan(nullptr, 0);
  EXPECT_TRUE(r.frames.empty());
  EXPECT_EQ(r.consumed, 0U);
}

} // namespace
} // namespace loadcell_bus
