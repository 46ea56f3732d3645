#include <gtest/gtest.h>

#include "loadcell_bus/frame_codec.h"
#include "loadcell_bus/loadcell_exception.h"

namespace loadcell_bus {
namespace {

TEST(FrameCodecTest, ReadCommandsAreBroadcastWithChecksum) {
  EXPECT_EQ(FrameCodec::ReadWeight(), (Bytes{0x00, 0x05, 0x02, 0x05, 0x0C}));
  EXPECT_EQ(FrameCodec::ReadId(), (Bytes{0x00, 0x05, 0x05, 0x05, 0x0F}));
  EXPECT_EQ(FrameCodec::ReadParams(), (Bytes{0x00, 0x05, 0x23, 0x05, 0x2D}));
}

TEST(FrameCodecTest, WriteCommands) {
  EXPECT_EQ(FrameCodec::SetZero(), (Bytes{0x00, 0x63, 0x06, 0x03, 0x6C}));
  EXPECT_EQ(FrameCodec::ChangeAddress(5), (Bytes{0x00, 0x63, 0x10, 0x05, 0x78}));

  ParamWriteArgs args;
  args.max_weight_index = 3;
  args.division_index = 2;
  args.zero_range = 1;
  args.settling_range = 4;
  args.scale_kind = 1;
  EXPECT_EQ(FrameCodec::WriteParams(args),
            (Bytes{0x00, 0x63, 0x23, 0x03, 0x02, 0x01, 0x04, 0x01, 0x91}));
}

TEST(FrameCodecTest, CommandStructMatchesSerializedBytes) {
  const Command cmd = FrameCodec::MakeChangeAddress(10);
  EXPECT_EQ(cmd.address, 0x00);
  EXPECT_EQ(cmd.function, 0x63);
  EXPECT_EQ(cmd.reg, 0x10);
  ASSERT_EQ(cmd.payload.size(), 1U);
  EXPECT_EQ(cmd.payload[0], 10);
  EXPECT_EQ(cmd.checksum, 0x7D);
  EXPECT_EQ(cmd.Serialize(), (Bytes{0x00, 0x63, 0x10, 0x0A, 0x7D}));
}

TEST(FrameCodecTest, ChangeAddressRejectsOutOfRange) {
  for (const std::uint8_t bad : {0, 11, 0xFF}) {
    try {
      FrameCodec::ChangeAddress(bad);
      FAIL() << "address " << static_cast<int>(bad) << " accepted";
    } catch (const LoadCellException &e) {
      EXPECT_EQ(e.Code(), ResultCode::kInvalidArgument);
    }
  }
  EXPECT_NO_THROW(FrameCodec::ChangeAddress(1));
  EXPECT_NO_THROW(FrameCodec::ChangeAddress(10));
}

TEST(FrameCodecTest, WriteParamsRejectsOutOfRange) {
  ParamWriteArgs base;

  ParamWriteArgs a = base;
  a.max_weight_index = 20;
  EXPECT_THROW(FrameCodec::WriteParams(a), LoadCellException);

  a = base;
  a.division_index = 15;
  EXPECT_THROW(FrameCodec::WriteParams(a), LoadCellException);

  a = base;
  a.zero_range = 10;
  EXPECT_THROW(FrameCodec::WriteParams(a), LoadCellException);

  a = base;
  a.settling_range = 0;
  EXPECT_THROW(FrameCodec::WriteParams(a), LoadCellException);
  a.settling_range = 11;
  EXPECT_THROW(FrameCodec::WriteParams(a), LoadCellException);

  a = base;
  a.scale_kind = 4;
  EXPECT_THROW(FrameCodec::WriteParams(a), LoadCellException);

  a = base;
  a.max_weight_index = 19;
  a.division_index = 14;
  a.zero_range = 9;
  a.settling_range = 10;
  a.scale_kind = 3;
  EXPECT_NO_THROW(FrameCodec::WriteParams(a));
}

TEST(FrameCodecTest, EncodeCommandDispatchesByKind) {
  EXPECT_EQ(FrameCodec::EncodeCommand(CommandKind::kReadWeight), FrameCodec::ReadWeight());
  EXPECT_EQ(FrameCodec::EncodeCommand(CommandKind::kSetZero), FrameCodec::SetZero());

  CommandArgs args;
  args.new_address = 3;
  EXPECT_EQ(FrameCodec::EncodeCommand(CommandKind::kChangeAddress, args), FrameCodec::ChangeAddress(3));

  args.new_address = 0;
  EXPECT_THROW(FrameCodec::EncodeCommand(CommandKind::kChangeAddress, args), LoadCellException);
}

TEST(FrameCodecTest, VerifyChecksum) {
  const Bytes frame{0x01, 0x05, 0x02, 0x00, 0x09, 0x02, 0x91, 0xA4};
  EXPECT_TRUE(FrameCodec::VerifyChecksum(frame.data(), frame.size()));

  Bytes corrupted = frame;
  corrupted[6] = 0x92;
  EXPECT_FALSE(FrameCodec::VerifyChecksum(corrupted.data(), corrupted.size()));
  EXPECT_FALSE(FrameCodec::VerifyChecksum(nullptr, 8));
  EXPECT_FALSE(FrameCodec::VerifyChecksum(frame.data(), 1));
}

TEST(LoadCellExceptionTest, WhatCarriesResultCodeName) {
  const LoadCellException e(ResultCode::kUnknownDevice, "zero: device 0x07");
  EXPECT_EQ(e.Code(), ResultCode::kUnknownDevice);
  EXPECT_STREQ(e.what(), "[UNKNOWN_DEVICE] zero: device 0x07");
}

} // namespace
} // namespace loadcell_bus
