#include "loadcell_bus/stream_scanner.h"

#include <utility>

#include "loadcell_bus/protocol_constants.h"

namespace loadcell_bus {

bool StreamScanner::IsResponseFunction(std::uint8_t function) noexcept {
  return function == protocol::kFuncRead ||
         function == protocol::kFuncContinuous;
}

StreamScanner::Candidate
StreamScanner::ClassifyFixed_(const std::uint8_t *p, std::size_t remaining,
                              std::size_t frame_bytes,
                              std::size_t &out_length) noexcept {
  // 아직 tail 에 다 모이지 않음. 다음 Feed 에서 다시 판정
  if (remaining < frame_bytes)
    return Candidate::kHold;
  if (!FrameCodec::VerifyChecksum(p, frame_bytes))
    return Candidate::kReject;
  out_length = frame_bytes;
  return Candidate::kAccept;
}

StreamScanner::Candidate
StreamScanner::Classify_(const std::uint8_t *p, std::size_t remaining,
                         std::size_t &out_length) const noexcept {
  out_length = 0;

  const std::uint8_t function = p[1];
  const std::uint8_t reg = p[2];

  if (!IsResponseFunction(function))
    return Candidate::kReject;

  switch (reg) {
  case protocol::kRegWeight:
    if (remaining >= protocol::kBinaryWeightFrameBytes &&
        FrameCodec::VerifyChecksum(p, protocol::kBinaryWeightFrameBytes)) {
      out_length = protocol::kBinaryWeightFrameBytes;
      return Candidate::kAccept;
    }
    if (FrameCodec::VerifyChecksum(p, protocol::kBcdWeightFrameBytes)) {
      out_length = protocol::kBcdWeightFrameBytes;
      return Candidate::kAccept;
    }
    // binary 프레임의 마지막 바이트가 아직 도착하지 않았을 수 있음
    if (remaining == protocol::kBcdWeightFrameBytes)
      return Candidate::kHold;
    return Candidate::kReject;

  case protocol::kRegParam:
    return ClassifyFixed_(p, remaining, protocol::kParamFrameBytes,
                          out_length);

  case protocol::kRegId:
    return ClassifyFixed_(p, remaining, protocol::kIdFrameBytes, out_length);

  default:
    return Candidate::kReject;
  }
}

ScanResult StreamScanner::Scan(const std::uint8_t *data,
                               std::size_t size) const {
  ScanResult result;
  if (data == nullptr)
    return result;

  std::size_t i = 0;
  while (size - i >= protocol::kMinFrameBytes) {
    std::size_t length = 0;
    const Candidate candidate = Classify_(data + i, size - i, length);

    if (candidate == Candidate::kHold)
      break;

    if (candidate == Candidate::kReject) {
      ++i;
      ++result.skipped;
      continue;
    }

    Frame frame;
    frame.bytes.assign(data + i, data + i + length);
    frame.source_offset = i;
    result.frames.push_back(std::move(frame));
    i += length;
  }

  result.consumed = i;
  return result;
}

} // namespace loadcell_bus
