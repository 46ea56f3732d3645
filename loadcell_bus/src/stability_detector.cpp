#include "loadcell_bus/stability_detector.h"

#include <cmath>

#include "loadcell_bus/loadcell_exception.h"

namespace loadcell_bus {

namespace {
constexpr std::size_t kExtraHistory = 5;
} // namespace

const char *WeightChangeKindToString(WeightChangeKind kind) noexcept {
  return kind == WeightChangeKind::kAdded ? "added" : "removed";
}

StabilityDetector::StabilityDetector(StabilityConfig config)
    : config_(config) {
  if (config_.stable_count == 0) {
    throw LoadCellException(ResultCode::kInvalidArgument,
                            "stable_count must be >= 1");
  }
  if (!std::isfinite(config_.tolerance_grams) || config_.tolerance_grams < 0.0) {
    throw LoadCellException(ResultCode::kInvalidArgument,
                            "stable tolerance must be >= 0");
  }
}

std::optional<WeightChange> StabilityDetector::Update(double weight_grams) {
  history_.push_back(weight_grams);
  while (history_.size() > config_.stable_count + kExtraHistory)
    history_.pop_front();

  if (history_.size() < config_.stable_count)
    return std::nullopt;

  const auto first = history_.end() - static_cast<long>(config_.stable_count);

  double sum = 0.0;
  for (auto it = first; it != history_.end(); ++it)
    sum += *it;
  const double mean = sum / static_cast<double>(config_.stable_count);

  bool all_within = true;
  for (auto it = first; it != history_.end(); ++it) {
    if (std::fabs(*it - mean) > config_.tolerance_grams) {
      all_within = false;
      break;
    }
  }

  if (!all_within) {
    is_stable_ = false;
    return std::nullopt;
  }

  if (is_stable_)
    return std::nullopt;

  // 불안정 -> 안정 전이
  is_stable_ = true;
  stable_weight_ = mean;

  const double delta = stable_weight_ - baseline_;
  if (std::fabs(delta) <= config_.tolerance_grams)
    return std::nullopt;

  baseline_ = stable_weight_;

  WeightChange change;
  change.kind = delta > 0.0 ? WeightChangeKind::kAdded : WeightChangeKind::kRemoved;
  change.delta_grams = delta;
  change.stable_weight_grams = stable_weight_;
  return change;
}

void StabilityDetector::Reset(double baseline_grams) noexcept {
  history_.clear();
  is_stable_ = false;
  stable_weight_ = 0.0;
  baseline_ = baseline_grams;
}

} // namespace loadcell_bus
