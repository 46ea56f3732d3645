#include <gtest/gtest.h>

#include <functional>
#include <string>

#include "loadcell_bus/device_registry.h"
#include "loadcell_bus/loadcell_exception.h"

namespace loadcell_bus {
namespace {

DecodedWeight Weight(double grams, std::uint8_t status = 0) {
  DecodedWeight w;
  w.status = status;
  w.weight_grams = grams;
  w.is_negative = grams < 0.0;
  return w;
}

ResultCode CodeOf(const std::function<void()> &fn) {
  try {
    fn();
  } catch (const LoadCellException &e) {
    return e.Code();
  }
  return ResultCode::kOk;
}

TEST(DeviceRegistryTest, FirstFrameCreatesDeviceWithDefaults) {
  DeviceRegistry registry;
  EXPECT_FALSE(registry.Record(1, Weight(250.0, 0x08)).has_value());

  const auto state = registry.Find(1);
  ASSERT_TRUE(state.has_value());
  EXPECT_EQ(state->address, 1);
  EXPECT_DOUBLE_EQ(state->zero_offset_grams, 0.0);
  EXPECT_DOUBLE_EQ(state->scale_factor, 1.0);
  EXPECT_DOUBLE_EQ(state->last_raw_weight, 250.0);
  EXPECT_DOUBLE_EQ(state->last_calibrated_weight, 250.0);
  EXPECT_DOUBLE_EQ(state->last_corrected_weight, 250.0);
  EXPECT_EQ(state->sample_count, 1U);
  EXPECT_EQ(state->last_status, 0x08);
}

TEST(DeviceRegistryTest, DevicesAreIsolated) {
  DeviceRegistry registry;
  registry.Record(3, Weight(100.0));
  registry.Record(4, Weight(200.0));
  registry.Record(3, Weight(110.0));
  registry.Record(4, Weight(220.0));

  registry.Zero(3);

  EXPECT_DOUBLE_EQ(registry.Find(3)->zero_offset_grams, 110.0);
  EXPECT_DOUBLE_EQ(registry.Find(3)->last_calibrated_weight, 0.0);
  EXPECT_EQ(registry.Find(3)->sample_count, 2U);
  EXPECT_DOUBLE_EQ(registry.Find(4)->zero_offset_grams, 0.0);
  EXPECT_DOUBLE_EQ(registry.Find(4)->last_calibrated_weight, 220.0);
  EXPECT_EQ(registry.Find(4)->sample_count, 2U);
}

TEST(DeviceRegistryTest, SnapshotIsOrderedAndIdempotent) {
  DeviceRegistry registry;
  registry.Record(7, Weight(1.0));
  registry.Record(2, Weight(2.0));
  registry.Record(5, Weight(3.0));

  const std::vector<DeviceState> a = registry.Snapshot();
  const std::vector<DeviceState> b = registry.Snapshot();
  ASSERT_EQ(a.size(), 3U);
  EXPECT_EQ(a[0].address, 2);
  EXPECT_EQ(a[1].address, 5);
  EXPECT_EQ(a[2].address, 7);
  EXPECT_EQ(a, b);
}

TEST(DeviceRegistryTest, UnknownDeviceIsReported) {
  DeviceRegistry registry;
  registry.Record(1, Weight(10.0));

  EXPECT_EQ(CodeOf([&] { registry.Zero(3); }), ResultCode::kUnknownDevice);
  EXPECT_EQ(CodeOf([&] { registry.Calibrate(3, 100.0); }), ResultCode::kUnknownDevice);
  EXPECT_FALSE(registry.Contains(3));
}

TEST(DeviceRegistryTest, ReplaceCalibration) {
  DeviceRegistry registry;
  registry.Record(1, Weight(100.0));
  registry.Zero(1);

  // zero 직후에는 기준 무게가 0 이므로 교정 불가
  EXPECT_EQ(CodeOf([&] { registry.Calibrate(1, 1000.0); }), ResultCode::kCalibrationTooCloseToZero);

  registry.Record(1, Weight(600.0));
  EXPECT_DOUBLE_EQ(registry.Calibrate(1, 1000.0), 2.0);
  EXPECT_DOUBLE_EQ(registry.Find(1)->last_calibrated_weight, 1000.0);

  registry.Record(1, Weight(350.0));
  EXPECT_DOUBLE_EQ(registry.Find(1)->last_calibrated_weight, 500.0);

  // replace 모드는 이전 scale 과 무관하게 다시 계산
  EXPECT_DOUBLE_EQ(registry.Calibrate(1, 250.0), 1.0);
}

TEST(DeviceRegistryTest, MultiplyCalibrationMatchesReplaceFactor) {
  RegistryConfig config;
  config.calibration_mode = CalibrationMode::kMultiply;
  DeviceRegistry multiply(config);
  DeviceRegistry replace;

  for (DeviceRegistry *registry : {&multiply, &replace})
    registry->Record(1, Weight(500.0));
  EXPECT_DOUBLE_EQ(multiply.Calibrate(1, 1000.0), 2.0);
  EXPECT_DOUBLE_EQ(replace.Calibrate(1, 1000.0), 2.0);

  // 이전 factor 를 곱해도 결과는 known / (raw - zero) 로 같다
  for (DeviceRegistry *registry : {&multiply, &replace})
    registry->Record(1, Weight(400.0));
  EXPECT_DOUBLE_EQ(multiply.Find(1)->last_calibrated_weight, 800.0);
  EXPECT_DOUBLE_EQ(multiply.Calibrate(1, 1000.0), 2.5);
  EXPECT_DOUBLE_EQ(replace.Calibrate(1, 1000.0), 2.5);
}

TEST(DeviceRegistryTest, MultiplyThresholdUsesCalibratedReading) {
  RegistryConfig config;
  config.calibration_mode = CalibrationMode::kMultiply;
  DeviceRegistry multiply(config);
  DeviceRegistry replace;

  for (DeviceRegistry *registry : {&multiply, &replace}) {
    registry->Record(1, Weight(500.0));
    registry->Calibrate(1, 5000.0);
    registry->Record(1, Weight(0.05));
  }

  // raw 0.05g 는 replace 에서는 너무 작지만 보정값(0.5g)으로 보면 허용
  EXPECT_NEAR(multiply.Calibrate(1, 1.0), 20.0, 1e-9);
  EXPECT_EQ(CodeOf([&] { replace.Calibrate(1, 1.0); }),
            ResultCode::kCalibrationTooCloseToZero);
}

TEST(DeviceRegistryTest, NegativeKnownWeightIsRejected) {
  DeviceRegistry registry;
  registry.Record(1, Weight(500.0));
  EXPECT_EQ(CodeOf([&] { registry.Calibrate(1, -100.0); }), ResultCode::kInvalidArgument);
  EXPECT_DOUBLE_EQ(registry.Find(1)->scale_factor, 1.0);
}

TEST(DeviceRegistryTest, MultiDropIgnoresBroadcastAddress) {
  DeviceRegistry registry;
  registry.Record(0x00, Weight(42.0));
  EXPECT_EQ(registry.Size(), 0U);
  EXPECT_EQ(registry.IgnoredBroadcastSamples(), 1U);

  RegistryConfig config;
  config.bus_mode = BusMode::kSingleDevice;
  DeviceRegistry single(config);
  single.Record(0x00, Weight(42.0));
  EXPECT_TRUE(single.Contains(0x00));
}

TEST(DeviceRegistryTest, MultiDropWarnsOnceAboutBroadcastAddress) {
  DeviceRegistry registry;

  testing::internal::CaptureStderr();
  registry.Record(0x00, Weight(42.0));
  registry.Record(0x00, Weight(43.0));
  registry.Record(0x00, Weight(44.0));
  std::string log = testing::internal::GetCapturedStderr();

  EXPECT_EQ(registry.IgnoredBroadcastSamples(), 3U);
  const std::string marker = "address 0x00 in multi_drop mode";
  const std::size_t first = log.find(marker);
  ASSERT_NE(first, std::string::npos) << log;
  EXPECT_EQ(log.find(marker, first + 1), std::string::npos);
  EXPECT_NE(log.find("[DeviceRegistry][pid="), std::string::npos);

  // Clear() 후에는 다시 한 번 알린다
  registry.Clear();
  testing::internal::CaptureStderr();
  registry.Record(0x00, Weight(42.0));
  log = testing::internal::GetCapturedStderr();
  EXPECT_NE(log.find(marker), std::string::npos);
  EXPECT_EQ(registry.IgnoredBroadcastSamples(), 1U);
}

TEST(DeviceRegistryTest, AbsoluteSignMode) {
  RegistryConfig config;
  config.sign_mode = SignMode::kAbsolute;
  DeviceRegistry registry(config);

  registry.Record(1, Weight(-50.0));
  EXPECT_DOUBLE_EQ(registry.Find(1)->last_raw_weight, 50.0);
}

TEST(DeviceRegistryTest, PerDeviceCorrectionPolicy) {
  RegistryConfig config;
  config.correction = CorrectionPolicy::Linear(1.0, 10.0);
  DeviceRegistry registry(config);

  registry.Record(1, Weight(100.0));
  registry.Record(2, Weight(100.0));
  registry.SetCorrectionPolicy(2, CorrectionPolicy::Linear(2.0, 0.0));

  EXPECT_DOUBLE_EQ(registry.Find(1)->last_corrected_weight, 110.0);
  EXPECT_DOUBLE_EQ(registry.Find(2)->last_corrected_weight, 200.0);
  EXPECT_EQ(registry.CorrectionFor(2), CorrectionPolicy::Linear(2.0, 0.0));

  registry.ClearCorrectionPolicy(2);
  EXPECT_DOUBLE_EQ(registry.Find(2)->last_corrected_weight, 110.0);
}

TEST(DeviceRegistryTest, SmoothingWindowAverages) {
  RegistryConfig config;
  config.smoothing_window = 3;
  DeviceRegistry registry(config);

  registry.Record(1, Weight(10.0));
  registry.Record(1, Weight(20.0));
  registry.Record(1, Weight(30.0));
  EXPECT_DOUBLE_EQ(registry.Find(1)->smoothed_weight, 20.0);
  registry.Record(1, Weight(40.0));
  EXPECT_DOUBLE_EQ(registry.Find(1)->smoothed_weight, 30.0);
}

TEST(DeviceRegistryTest, WeightChangeCarriesAddress) {
  RegistryConfig config;
  config.stability.stable_count = 2;
  config.stability.tolerance_grams = 1.0;
  DeviceRegistry registry(config);

  registry.Record(4, Weight(500.0));
  const auto change = registry.Record(4, Weight(500.0));
  ASSERT_TRUE(change.has_value());
  EXPECT_EQ(change->address, 4);
  EXPECT_EQ(change->kind, WeightChangeKind::kAdded);
  EXPECT_DOUBLE_EQ(change->delta_grams, 500.0);
  EXPECT_TRUE(registry.Find(4)->is_stable);
}

TEST(DeviceRegistryTest, InvalidConfigIsRejected) {
  RegistryConfig config;
  config.smoothing_window = 0;
  EXPECT_THROW(DeviceRegistry{config}, LoadCellException);

  config.smoothing_window = 1;
  config.stability.stable_count = 0;
  EXPECT_THROW(DeviceRegistry{config}, LoadCellException);
}

TEST(DeviceRegistryTest, ClearForgetsDevices) {
  DeviceRegistry registry;
  registry.Record(1, Weight(1.0));
  registry.Record(0, Weight(1.0));
  registry.Clear();
  EXPECT_EQ(registry.Size(), 0U);
  EXPECT_EQ(registry.IgnoredBroadcastSamples(), 0U);
}

} // namespace
} // namespace loadcell_bus
