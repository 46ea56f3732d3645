#include "loadcell_bus/frame_decoder.h"

#include <cmath>
#include <cstdio>

#include "loadcell_bus/loadcell_exception.h"

namespace loadcell_bus {

namespace {

/** BCD 1바이트 -> 두 자리 값. 상위 nibble 이 앞자리 */
std::uint32_t BcdPair_(std::uint8_t b) noexcept {
  return static_cast<std::uint32_t>((b >> 4) & 0x0F) * 10u +
         static_cast<std::uint32_t>(b & 0x0F);
}

std::uint32_t ReadU24BE_(const std::uint8_t *p) noexcept {
  return (static_cast<std::uint32_t>(p[0]) << 16) |
         (static_cast<std::uint32_t>(p[1]) << 8) |
         static_cast<std::uint32_t>(p[2]);
}

} // namespace

std::string DeviceIdentity::ToHexString() const {
  char buf[9] = {0};
  std::snprintf(buf, sizeof(buf), "%02X%02X%02X%02X", id[0], id[1], id[2],
                id[3]);
  return std::string(buf);
}

double ResolutionForDivision(std::uint8_t division) noexcept {
  if (division < protocol::kResolutionTable.size())
    return protocol::kResolutionTable[division];
  return protocol::kFallbackResolutionGrams;
}

const char *ScaleKindName(std::uint8_t scale_kind) noexcept {
  if (scale_kind < protocol::kScaleKindNames.size())
    return protocol::kScaleKindNames[scale_kind];
  return protocol::kUnknownScaleKindName;
}

WeightDecoder::WeightDecoder(double binary_counts_per_gram)
    : counts_per_gram_(binary_counts_per_gram) {
  if (!std::isfinite(counts_per_gram_) || counts_per_gram_ <= 0.0) {
    throw LoadCellException(ResultCode::kInvalidArgument,
                            "binary_counts_per_gram must be positive");
  }
}

bool WeightDecoder::CanDecode(const Frame &frame) noexcept {
  const std::size_t n = frame.Size();
  if (n != protocol::kBcdWeightFrameBytes &&
      n != protocol::kBinaryWeightFrameBytes)
    return false;
  return frame.Register() == protocol::kRegWeight &&
         StreamScanner::IsResponseFunction(frame.Function());
}

DecodedWeight WeightDecoder::Decode(const Frame &frame) const {
  if (!CanDecode(frame)) {
    throw LoadCellException(ResultCode::kInvalidArgument,
                            "not a weight frame (size=" +
                                std::to_string(frame.Size()) + ")");
  }

  const std::uint8_t *p = frame.bytes.data();

  DecodedWeight out;
  out.status = p[3];
  out.division = p[4] & 0x0F;
  out.is_negative = (p[4] & 0x80) != 0;
  out.resolution_grams = ResolutionForDivision(out.division);

  if (frame.Size() == protocol::kBinaryWeightFrameBytes) {
    out.binary_format = true;
    out.raw_magnitude = ReadU24BE_(p + 5);
    out.weight_grams = static_cast<double>(out.raw_magnitude) / counts_per_gram_;
  } else {
    out.binary_format = false;
    out.raw_magnitude = BcdPair_(p[5]) * 100u + BcdPair_(p[6]);
    out.weight_grams = out.resolution_grams * out.raw_magnitude;
  }

  if (out.is_negative)
    out.weight_grams = -out.weight_grams;

  return out;
}

bool IdDecoder::CanDecode(const Frame &frame) noexcept {
  return frame.Size() == protocol::kIdFrameBytes &&
         frame.Register() == protocol::kRegId;
}

DeviceIdentity IdDecoder::Decode(const Frame &frame) {
  if (!CanDecode(frame)) {
    throw LoadCellException(ResultCode::kInvalidArgument,
                            "not an id frame (size=" +
                                std::to_string(frame.Size()) + ")");
  }

  DeviceIdentity out;
  out.address = frame.Address();
  for (std::size_t k = 0; k < out.id.size(); ++k)
    out.id[k] = frame.bytes[7 + k];
  return out;
}

bool ParamDecoder::CanDecode(const Frame &frame) noexcept {
  return frame.Size() == protocol::kParamFrameBytes &&
         frame.Register() == protocol::kRegParam;
}

DeviceParams ParamDecoder::Decode(const Frame &frame) {
  if (!CanDecode(frame)) {
    throw LoadCellException(ResultCode::kInvalidArgument,
                            "not a parameter frame (size=" +
                                std::to_string(frame.Size()) + ")");
  }

  const std::uint8_t *p = frame.bytes.data();

  DeviceParams out;
  out.address = p[0];
  out.division = (p[3] >> 4) & 0x0F;
  out.scale_kind = p[3] & 0x0F;
  out.zero_range = (p[4] >> 4) & 0x0F;
  out.settling_range = p[4] & 0x0F;
  out.resolution_grams = ResolutionForDivision(out.division);
  out.scale_kind_name = ScaleKindName(out.scale_kind);
  out.max_weight_raw = ReadU24BE_(p + 5);
  out.max_weight_grams = out.resolution_grams * out.max_weight_raw;
  return out;
}

} // namespace loadcell_bus
