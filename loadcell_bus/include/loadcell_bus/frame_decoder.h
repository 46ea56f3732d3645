#ifndef LOADCELL_BUS_FRAME_DECODER_H_
#define LOADCELL_BUS_FRAME_DECODER_H_

#include <array>
#include <cstdint>
#include <string>

#include "loadcell_status.h"
#include "protocol_constants.h"
#include "stream_scanner.h"

namespace loadcell_bus {

/** @brief 무게 프레임 디코딩 결과 */
struct DecodedWeight {
  std::uint8_t status = 0;
  std::uint8_t division = 0;
  double resolution_grams = protocol::kFallbackResolutionGrams;
  std::uint32_t raw_magnitude = 0;
  bool is_negative = false;
  double weight_grams = 0.0;
  bool binary_format = false; // true: 9바이트, false: 8바이트(BCD)

  StatusFlags Flags() const noexcept { return DecodeStatusFlags(status); }
};

/** @brief id 응답 디코딩 결과 */
struct DeviceIdentity {
  std::uint8_t address = 0;
  std::array<std::uint8_t, 4> id{};

  /** @brief "0A1B2C3D" 형태 16진 문자열 */
  std::string ToHexString() const;
};

/** @brief 파라미터 응답 디코딩 결과 */
struct DeviceParams {
  std::uint8_t address = 0;
  std::uint8_t division = 0;
  double resolution_grams = protocol::kFallbackResolutionGrams;
  std::uint8_t scale_kind = 0;
  std::string scale_kind_name;
  std::uint8_t zero_range = 0;
  std::uint8_t settling_range = 0;
  std::uint32_t max_weight_raw = 0;
  double max_weight_grams = 0.0;
};

/** @brief division -> 분해능(g). 범위 밖이면 1g */
double ResolutionForDivision(std::uint8_t division) noexcept;

/** @brief scale kind -> 이름. 범위 밖이면 "Unknown" */
const char *ScaleKindName(std::uint8_t scale_kind) noexcept;

/**
 * @brief 무게 프레임(8바이트 BCD / 9바이트 binary) 디코더.
 *
 * 8바이트: raw = BCD 4자리(offset 5, 6), weight = resolution * raw
 * 9바이트: raw = big-endian 24bit(offset 5..7), weight = raw / counts_per_gram
 * offset 4 의 bit7 이 설정되어 있으면 음수.
 */
class WeightDecoder final {
public:
  explicit WeightDecoder(
      double binary_counts_per_gram = protocol::kDefaultBinaryCountsPerGram);

  static bool CanDecode(const Frame &frame) noexcept;

  /** @throw LoadCellException(kInvalidArgument) 무게 프레임이 아닌 경우 */
  DecodedWeight Decode(const Frame &frame) const;

  double BinaryCountsPerGram() const noexcept { return counts_per_gram_; }

private:
  double counts_per_gram_;
};

class IdDecoder final {
public:
  static bool CanDecode(const Frame &frame) noexcept;
  static DeviceIdentity Decode(const Frame &frame);
};

class ParamDecoder final {
public:
  static bool CanDecode(const Frame &frame) noexcept;
  static DeviceParams Decode(const Frame &frame);
};

} // namespace loadcell_bus

#endif // LOADCELL_BUS_FRAME_DECODER_H_
