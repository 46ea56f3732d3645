#ifndef LOADCELL_BUS_DEVICE_REGISTRY_H_
#define LOADCELL_BUS_DEVICE_REGISTRY_H_

#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <vector>

#include "correction_policy.h"
#include "frame_decoder.h"
#include "stability_detector.h"

namespace loadcell_bus {

/** @brief 교정(calibrate) 시 scale factor 갱신 방식 */
enum class CalibrationMode : std::uint8_t {
  kReplace = 0,  // scale = known / (raw - zero)
  kMultiply = 1  // scale *= known / 현재 교정 무게
};

enum class SignMode : std::uint8_t { kSigned = 0, kAbsolute = 1 };

/**
 * @brief kMultiDrop: 응답 주소 0x00 은 장치로 취급하지 않음(버림).
 *        첫 번째로 버린 샘플에서 stderr 경고 한 줄을 남긴다
 *        kSingleDevice: 0x00 도 일반 장치처럼 등록
 */
enum class BusMode : std::uint8_t { kMultiDrop = 0, kSingleDevice = 1 };

const char *CalibrationModeToString(CalibrationMode mode) noexcept;
const char *SignModeToString(SignMode mode) noexcept;
const char *BusModeToString(BusMode mode) noexcept;

struct RegistryConfig {
  BusMode bus_mode = BusMode::kMultiDrop;
  SignMode sign_mode = SignMode::kSigned;
  CalibrationMode calibration_mode = CalibrationMode::kReplace;
  CorrectionPolicy correction{};
  std::size_t smoothing_window = 1; // 1 이면 smoothing 없음
  StabilityConfig stability{};
};

/** @brief 주소별 장치 상태 (Snapshot 의 원소) */
struct DeviceState {
  std::uint8_t address = 0;
  double zero_offset_grams = 0.0;
  double scale_factor = 1.0;
  double last_raw_weight = 0.0;
  double last_calibrated_weight = 0.0;
  double last_corrected_weight = 0.0;
  double smoothed_weight = 0.0;
  std::uint64_t sample_count = 0;
  std::uint8_t last_status = 0;
  bool is_stable = false;
  double stable_weight = 0.0;

  bool operator==(const DeviceState &rhs) const noexcept;
  bool operator!=(const DeviceState &rhs) const noexcept {
    return !(*this == rhs);
  }
};

/**
 * @brief 응답 주소 -> 장치별 교정 상태/최근 값 매핑.
 *
 * 처음 보는 주소의 유효 무게 프레임이 들어오면 항목을 만들고(zero 0, scale 1)
 * 이후 프레임마다 갱신한다. 항목은 Clear() 전까지 제거되지 않는다.
 *
 * @note thread-safe 하지 않다. 단일 consumer 에서만 호출할 것.
 */
class DeviceRegistry {
public:
  explicit DeviceRegistry(RegistryConfig config = {});

  /**
   * @brief 디코딩된 무게 한 건을 반영한다.
   * @return 안정 무게 변화가 감지된 경우 WeightChange
   */
  std::optional<WeightChange> Record(std::uint8_t address,
                                     const DecodedWeight &decoded);

  /**
   * @brief zero offset := 마지막 raw 무게
   * @throw LoadCellException(kUnknownDevice)
   */
  void Zero(std::uint8_t address);

  /**
   * @brief 알고 있는 무게로 scale factor 를 교정한다.
   * @return 새 scale factor
   * @throw LoadCellException(kUnknownDevice / kCalibrationTooCloseToZero /
   *        kInvalidArgument)
   */
  double Calibrate(std::uint8_t address, double known_weight_grams);

  /** @brief 주소별 보정 곡선 지정 (아직 보지 못한 주소도 지정 가능) */
  void SetCorrectionPolicy(std::uint8_t address, const CorrectionPolicy &policy);
  void ClearCorrectionPolicy(std::uint8_t address);
  const CorrectionPolicy &CorrectionFor(std::uint8_t address) const noexcept;

  /** @brief 주소 오름차순 복사본 */
  std::vector<DeviceState> Snapshot() const;

  std::optional<DeviceState> Find(std::uint8_t address) const;
  bool Contains(std::uint8_t address) const noexcept;
  std::size_t Size() const noexcept { return devices_.size(); }
  void Clear() noexcept;

  /** @brief kMultiDrop 에서 버려진 0x00 응답 수 */
  std::uint64_t IgnoredBroadcastSamples() const noexcept {
    return ignored_broadcast_samples_;
  }

  const RegistryConfig &Config() const noexcept { return config_; }

private:
  struct Entry {
    explicit Entry(const StabilityConfig &stability) : detector(stability) {}

    DeviceState state;
    std::deque<double> window;
    StabilityDetector detector;
  };

  Entry &Require_(std::uint8_t address, const char *operation);
  /** zero/scale/correction/smoothing 재계산 */
  void Recompute_(Entry &entry);
  /** 교정 이후 이력 초기화 */
  void ResetHistory_(Entry &entry);

  RegistryConfig config_;
  std::map<std::uint8_t, Entry> devices_;
  std::map<std::uint8_t, CorrectionPolicy> corrections_;
  std::uint64_t ignored_broadcast_samples_ = 0;
};

} // namespace loadcell_bus

#endif // LOADCELL_BUS_DEVICE_REGISTRY_H_
