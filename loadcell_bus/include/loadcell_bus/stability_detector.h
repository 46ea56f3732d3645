#ifndef LOADCELL_BUS_STABILITY_DETECTOR_H_
#define LOADCELL_BUS_STABILITY_DETECTOR_H_

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>

namespace loadcell_bus {

struct StabilityConfig {
  std::size_t stable_count = 5;  // 연속 N개가 tolerance 이내면 안정
  double tolerance_grams = 1.0;
};

enum class WeightChangeKind : std::uint8_t { kAdded = 0, kRemoved = 1 };

const char *WeightChangeKindToString(WeightChangeKind kind) noexcept;

/** @brief 안정 무게가 이전 안정 무게 대비 tolerance 이상 변했을 때의 이벤트 */
struct WeightChange {
  std::uint8_t address = 0;
  WeightChangeKind kind = WeightChangeKind::kAdded;
  double delta_grams = 0.0;
  double stable_weight_grams = 0.0;
};

/**
 * @brief 무게 안정 상태 검출기.
 *
 * 최근 stable_count + 5 개의 무게를 보관하고, 마지막 stable_count 개가 모두
 * 평균 +- tolerance 이내이면 안정으로 판단한다.
 * 불안정 -> 안정 전이 시 안정 무게(평균)가 기준값과 tolerance 초과로 다르면
 * WeightChange 를 반환하고 기준값을 옮긴다.
 */
class StabilityDetector {
public:
  explicit StabilityDetector(StabilityConfig config = {});

  std::optional<WeightChange> Update(double weight_grams);

  bool IsStable() const noexcept { return is_stable_; }
  double StableWeight() const noexcept { return stable_weight_; }
  double Baseline() const noexcept { return baseline_; }
  const StabilityConfig &Config() const noexcept { return config_; }

  /** @brief 이력 초기화 및 기준값 재설정 (tare/교정 이후 호출) */
  void Reset(double baseline_grams = 0.0) noexcept;

private:
  StabilityConfig config_;
  std::deque<double> history_;
  bool is_stable_ = false;
  double stable_weight_ = 0.0;
  double baseline_ = 0.0;
};

} // namespace loadcell_bus

#endif // LOADCELL_BUS_STABILITY_DETECTOR_H_
