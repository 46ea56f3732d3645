#include "loadcell_bus/device_registry.h"

#include <cmath>
#include <cstdio>
#include <iostream>
#include <string>
#include <utility>

#include <unistd.h>

#include "loadcell_bus/loadcell_exception.h"

namespace loadcell_bus {

namespace {

constexpr const char *kClassName = "DeviceRegistry";
constexpr double kMinCalibrationMagnitude = 0.1;

std::string Hex_(std::uint8_t address) {
  char buf[8] = {0};
  std::snprintf(buf, sizeof(buf), "0x%02X", address);
  return std::string(buf);
}

} // namespace

const char *CalibrationModeToString(CalibrationMode mode) noexcept {
  return mode == CalibrationMode::kMultiply ? "multiply" : "replace";
}

const char *SignModeToString(SignMode mode) noexcept {
  return mode == SignMode::kAbsolute ? "absolute" : "signed";
}

const char *BusModeToString(BusMode mode) noexcept {
  return mode == BusMode::kSingleDevice ? "single_device" : "multi_drop";
}

bool DeviceState::operator==(const DeviceState &rhs) const noexcept {
  return address == rhs.address && zero_offset_grams == rhs.zero_offset_grams &&
         scale_factor == rhs.scale_factor &&
         last_raw_weight == rhs.last_raw_weight &&
         last_calibrated_weight == rhs.last_calibrated_weight &&
         last_corrected_weight == rhs.last_corrected_weight &&
         smoothed_weight == rhs.smoothed_weight &&
         sample_count == rhs.sample_count && last_status == rhs.last_status &&
         is_stable == rhs.is_stable && stable_weight == rhs.stable_weight;
}

DeviceRegistry::DeviceRegistry(RegistryConfig config)
    : config_(std::move(config)) {
  if (config_.smoothing_window == 0) {
    throw LoadCellException(ResultCode::kInvalidArgument,
                            "smoothing_window must be >= 1");
  }
  // stable_count / tolerance 검증. 실제 검출기는 장치마다 생성
  static_cast<void>(StabilityDetector(config_.stability));
}

std::optional<WeightChange> DeviceRegistry::Record(std::uint8_t address,
                                                   const DecodedWeight &decoded) {
  if (address == 0x00 && config_.bus_mode == BusMode::kMultiDrop) {
    // 첫 건만 알림. Clear() 후 다시 알림
    if (ignored_broadcast_samples_++ == 0U) {
      std::cerr << "[" << kClassName << "][pid=" << ::getpid()
                << "] ignoring weight responses from address 0x00 in "
                   "multi_drop mode (use bus_mode=single_device for a lone "
                   "factory-default load cell)"
                << std::endl;
    }
    return std::nullopt;
  }

  auto it = devices_.find(address);
  if (it == devices_.end()) {
    it = devices_.emplace(address, Entry(config_.stability)).first;
    it->second.state.address = address;
  }

  Entry &entry = it->second;
  entry.state.last_raw_weight = config_.sign_mode == SignMode::kAbsolute
                                    ? std::fabs(decoded.weight_grams)
                                    : decoded.weight_grams;
  entry.state.last_status = decoded.status;
  ++entry.state.sample_count;

  Recompute_(entry);

  // smoothing window 갱신
  entry.window.push_back(entry.state.last_corrected_weight);
  while (entry.window.size() > config_.smoothing_window)
    entry.window.pop_front();

  double sum = 0.0;
  for (const double w : entry.window)
    sum += w;
  entry.state.smoothed_weight = sum / static_cast<double>(entry.window.size());

  std::optional<WeightChange> change =
      entry.detector.Update(entry.state.smoothed_weight);
  entry.state.is_stable = entry.detector.IsStable();
  entry.state.stable_weight = entry.detector.StableWeight();

  if (change)
    change->address = address;
  return change;
}

void DeviceRegistry::Zero(std::uint8_t address) {
  Entry &entry = Require_(address, "zero");
  entry.state.zero_offset_grams = entry.state.last_raw_weight;
  Recompute_(entry);
  ResetHistory_(entry);
}

double DeviceRegistry::Calibrate(std::uint8_t address,
                                 double known_weight_grams) {
  Entry &entry = Require_(address, "calibrate");

  if (!std::isfinite(known_weight_grams)) {
    throw LoadCellException(ResultCode::kInvalidArgument,
                            "known weight must be finite");
  }

  const double zeroed =
      entry.state.last_raw_weight - entry.state.zero_offset_grams;

  double reference = zeroed;
  if (config_.calibration_mode == CalibrationMode::kMultiply)
    reference = zeroed * entry.state.scale_factor;

  if (std::fabs(reference) < kMinCalibrationMagnitude) {
    throw LoadCellException(ResultCode::kCalibrationTooCloseToZero,
                            "device " + Hex_(address) +
                                " reading too close to zero (" +
                                std::to_string(reference) + "g), re-tare");
  }

  double factor = known_weight_grams / reference;
  if (config_.calibration_mode == CalibrationMode::kMultiply)
    factor *= entry.state.scale_factor;

  if (!std::isfinite(factor) || factor <= 0.0) {
    throw LoadCellException(ResultCode::kInvalidArgument,
                            "device " + Hex_(address) +
                                " calibration yields invalid scale factor " +
                                std::to_string(factor));
  }

  entry.state.scale_factor = factor;
  Recompute_(entry);
  ResetHistory_(entry);
  return factor;
}

void DeviceRegistry::SetCorrectionPolicy(std::uint8_t address,
                                         const CorrectionPolicy &policy) {
  corrections_[address] = policy;
  auto it = devices_.find(address);
  if (it != devices_.end())
    Recompute_(it->second);
}

void DeviceRegistry::ClearCorrectionPolicy(std::uint8_t address) {
  corrections_.erase(address);
  auto it = devices_.find(address);
  if (it != devices_.end())
    Recompute_(it->second);
}

const CorrectionPolicy &
DeviceRegistry::CorrectionFor(std::uint8_t address) const noexcept {
  const auto it = corrections_.find(address);
  return it != corrections_.end() ? it->second : config_.correction;
}

std::vector<DeviceState> DeviceRegistry::Snapshot() const {
  std::vector<DeviceState> out;
  out.reserve(devices_.size());
  for (const auto &kv : devices_)
    out.push_back(kv.second.state);
  return out;
}

std::optional<DeviceState> DeviceRegistry::Find(std::uint8_t address) const {
  const auto it = devices_.find(address);
  if (it == devices_.end())
    return std::nullopt;
  return it->second.state;
}

bool DeviceRegistry::Contains(std::uint8_t address) const noexcept {
  return devices_.find(address) != devices_.end();
}

void DeviceRegistry::Clear() noexcept {
  devices_.clear();
  ignored_broadcast_samples_ = 0;
}

DeviceRegistry::Entry &DeviceRegistry::Require_(std::uint8_t address,
                                                const char *operation) {
  auto it = devices_.find(address);
  if (it == devices_.end()) {
    throw LoadCellException(ResultCode::kUnknownDevice,
                            std::string(operation) + ": device " +
                                Hex_(address) + " has not responded yet");
  }
  return it->second;
}

void DeviceRegistry::Recompute_(Entry &entry) {
  DeviceState &s = entry.state;
  s.last_calibrated_weight =
      (s.last_raw_weight - s.zero_offset_grams) * s.scale_factor;
  s.last_corrected_weight =
      CorrectionFor(s.address).Apply(s.last_calibrated_weight);
}

void DeviceRegistry::ResetHistory_(Entry &entry) {
  entry.window.clear();
  entry.window.push_back(entry.state.last_corrected_weight);
  entry.state.smoothed_weight = entry.state.last_corrected_weight;

  entry.detector.Reset(entry.state.last_corrected_weight);
  entry.state.is_stable = false;
  entry.state.stable_weight = 0.0;
}

} // namespace loadcell_bus
