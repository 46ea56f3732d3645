#include "loadcell_bus/frame_codec.h"

#include <string>
#include <utility>

#include "loadcell_bus/loadcell_exception.h"
#include "loadcell_bus/protocol_constants.h"

namespace loadcell_bus {

namespace {

void RequireRange_(const char *name, unsigned value, unsigned lo, unsigned hi) {
  if (value < lo || value > hi) {
    throw LoadCellException(ResultCode::kInvalidArgument,
                            std::string(name) + " out of range: " +
                                std::to_string(value) + " (allowed " +
                                std::to_string(lo) + ".." + std::to_string(hi) +
                                ")");
  }
}

} // namespace

const char *CommandKindToString(CommandKind kind) noexcept {
  switch (kind) {
  case CommandKind::kReadWeight:
    return "read_weight";
  case CommandKind::kReadId:
    return "read_id";
  case CommandKind::kReadParams:
    return "read_params";
  case CommandKind::kSetZero:
    return "set_zero";
  case CommandKind::kChangeAddress:
    return "change_address";
  case CommandKind::kWriteParams:
    return "write_params";
  }
  return "unknown";
}

Bytes Command::Serialize() const {
  Bytes out;
  out.reserve(4 + payload.size());
  out.push_back(address);
  out.push_back(function);
  out.push_back(reg);
  out.insert(out.end(), payload.begin(), payload.end());
  out.push_back(checksum);
  return out;
}

std::uint8_t FrameCodec::Checksum(const std::uint8_t *data,
                                  std::size_t size) noexcept {
  std::uint32_t sum = 0;
  for (std::size_t i = 0; i < size; ++i)
    sum += data[i];
  return static_cast<std::uint8_t>(sum & 0xFFu);
}

std::uint8_t FrameCodec::Checksum(const Bytes &data) noexcept {
  return Checksum(data.data(), data.size());
}

bool FrameCodec::VerifyChecksum(const std::uint8_t *frame,
                                std::size_t size) noexcept {
  if (frame == nullptr || size < 2)
    return false;
  return Checksum(frame, size - 1) == frame[size - 1];
}

Command FrameCodec::Make_(std::uint8_t function, std::uint8_t reg,
                          Bytes payload) {
  Command cmd;
  cmd.address = protocol::kBroadcastAddress;
  cmd.function = function;
  cmd.reg = reg;
  cmd.payload = std::move(payload);

  std::uint32_t sum = cmd.address + cmd.function + cmd.reg;
  for (const std::uint8_t b : cmd.payload)
    sum += b;
  cmd.checksum = static_cast<std::uint8_t>(sum & 0xFFu);
  return cmd;
}

Command FrameCodec::MakeReadWeight() {
  return Make_(protocol::kFuncRead, protocol::kRegWeight,
               {protocol::kReadArgument});
}

Command FrameCodec::MakeReadId() {
  return Make_(protocol::kFuncRead, protocol::kRegId,
               {protocol::kReadArgument});
}

Command FrameCodec::MakeReadParams() {
  return Make_(protocol::kFuncRead, protocol::kRegParam,
               {protocol::kReadArgument});
}

Command FrameCodec::MakeSetZero() {
  return Make_(protocol::kFuncWrite, protocol::kRegZeroSet,
               {protocol::kZeroSetArgument});
}

Command FrameCodec::MakeChangeAddress(std::uint8_t new_address) {
  RequireRange_("new_address", new_address, protocol::kMinDeviceAddress,
                protocol::kMaxDeviceAddress);
  return Make_(protocol::kFuncWrite, protocol::kRegAddress, {new_address});
}

Command FrameCodec::MakeWriteParams(const ParamWriteArgs &args) {
  RequireRange_("max_weight_index", args.max_weight_index, 0,
                protocol::kMaxWeightTableKg.size() - 1);
  RequireRange_("division_index", args.division_index, 0,
                protocol::kResolutionTable.size() - 1);
  RequireRange_("zero_range", args.zero_range, 0,
                protocol::kMaxZeroRangeIndex);
  RequireRange_("settling_range", args.settling_range,
                protocol::kMinSettlingRangeIndex,
                protocol::kMaxSettlingRangeIndex);
  RequireRange_("scale_kind", args.scale_kind, 0,
                protocol::kScaleKindNames.size() - 1);

  return Make_(protocol::kFuncWrite, protocol::kRegParam,
               {args.max_weight_index, args.division_index, args.zero_range,
                args.settling_range, args.scale_kind});
}

Bytes FrameCodec::EncodeCommand(CommandKind kind, const CommandArgs &args) {
  switch (kind) {
  case CommandKind::kReadWeight:
    return ReadWeight();
  case CommandKind::kReadId:
    return ReadId();
  case CommandKind::kReadParams:
    return ReadParams();
  case CommandKind::kSetZero:
    return SetZero();
  case CommandKind::kChangeAddress:
    return ChangeAddress(args.new_address);
  case CommandKind::kWriteParams:
    return WriteParams(args.params);
  }
  throw LoadCellException(ResultCode::kInvalidArgument,
                          "unknown command kind: " +
                              std::to_string(static_cast<int>(kind)));
}

} // namespace loadcell_bus
