#ifndef LOADCELL_BUS_STREAM_SCANNER_H_
#define LOADCELL_BUS_STREAM_SCANNER_H_

#include <cstddef>
#include <cstdint>
#include <vector>

#include "frame_codec.h"

namespace loadcell_bus {

/**
 * @brief checksum 까지 검증된 응답 프레임 한 개.
 * StreamScanner 만 생성한다.
 */
struct Frame {
  Bytes bytes;
  std::size_t source_offset = 0; // scan 대상 버퍼 내 시작 위치

  std::uint8_t Address() const noexcept { return bytes[0]; }
  std::uint8_t Function() const noexcept { return bytes[1]; }
  std::uint8_t Register() const noexcept { return bytes[2]; }
  std::size_t Size() const noexcept { return bytes.size(); }
};

struct ScanResult {
  std::vector<Frame> frames;
  /** @brief 앞에서부터 버려도 되는 바이트 수(프레임 + resync skip) */
  std::size_t consumed = 0;
  /** @brief consumed 중 resync 로 버린 바이트 수 */
  std::size_t skipped = 0;
};

/**
 * @brief 누적 수신 버퍼에서 응답 프레임을 찾아낸다.
 *
 * - 위치 i 에서 function(i+1), register(i+2) 로 후보 모양을 판정
 * - 9바이트 checksum 우선, 실패 시 8바이트(무게 프레임만)
 * - 후보가 거부되면 정확히 1바이트 전진(resync)
 * - 남은 바이트가 8 미만이면 중단, tail 은 호출자가 보존
 * - 무게 후보가 정확히 8바이트 남은 상태에서 8바이트 checksum 이 실패하면
 *   9번째 바이트를 기다리기 위해 중단한다
 * - id(12바이트)/param(9바이트) 후보도 길이가 다 차지 않았으면 중단한다.
 *   길이가 찬 뒤 checksum 이 틀리면 그때 1바이트 resync
 *
 * 버퍼는 호출자가 소유하며 Scan() 은 상태를 갖지 않는다.
 */
class StreamScanner final {
public:
  ScanResult Scan(const std::uint8_t *data, std::size_t size) const;
  ScanResult Scan(const Bytes &buffer) const {
    return Scan(buffer.data(), buffer.size());
  }

  /** @brief 응답 function code(0x05 read, 0x06 continuous) 여부 */
  static bool IsResponseFunction(std::uint8_t function) noexcept;

private:
  enum class Candidate { kAccept, kReject, kHold };

  Candidate Classify_(const std::uint8_t *p, std::size_t remaining,
                      std::size_t &out_length) const noexcept;
  /** @brief 길이가 고정된 id/param 후보 판정 */
  static Candidate ClassifyFixed_(const std::uint8_t *p, std::size_t remaining,
                                  std::size_t frame_bytes,
                                  std::size_t &out_length) noexcept;
};

} // namespace loadcell_bus

#endif // LOADCELL_BUS_STREAM_SCANNER_H_
