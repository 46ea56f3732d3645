#include "data_builder.h"

#include <utility>

namespace sensor_driver_base {

DataBuilder::DataBuilder(std::string sensor_id, std::string driver_instance_id)
    : sensor_id_(std::move(sensor_id)), driver_instance_id_(std::move(driver_instance_id)) {}

LOADCELL_BUS::BusSnapshot DataBuilder::Build(std::uint64_t seq_no, const rclcpp::Time& pub_timestamp,
                                             const DataResult& data_result) const {
  LOADCELL_BUS::BusSnapshot msg;
  msg.driver_instance_id = driver_instance_id_;
  msg.seq_no = seq_no;
  msg.pub_timestamp = static_cast<std::uint64_t>(pub_timestamp.nanoseconds());
  msg.cycle_no = data_result.cycle_no;
  msg.driver_state = data_result.driver_state;
  msg.ret_code = data_result.return_code;
  msg.driver_err_msg = data_result.driver_err_msg;

  msg.devices.reserve(data_result.devices.size());
  for (const auto& d : data_result.devices) {
    LOADCELL_BUS::DeviceSnapshot s;
    s.address = d.address;
    s.zero_offset_grams = d.zero_offset_grams;
    s.scale_factor = d.scale_factor;
    s.raw_weight = d.last_raw_weight;
    s.calibrated_weight = d.last_calibrated_weight;
    s.corrected_weight = d.last_corrected_weight;
    s.smoothed_weight = d.smoothed_weight;
    s.sample_count = d.sample_count;
    s.status = d.last_status;
    s.is_stable = d.is_stable;
    s.stable_weight = d.stable_weight;
    msg.devices.push_back(std::move(s));
  }

  for (const auto& c : data_result.weight_changes) {
    LOADCELL_BUS::WeightChangeEvent e;
    e.address = c.address;
    e.kind = c.kind == loadcell_bus::WeightChangeKind::kAdded ? LOADCELL_BUS::ADDED : LOADCELL_BUS::REMOVED;
    e.delta_grams = c.delta_grams;
    e.stable_weight_grams = c.stable_weight_grams;
    msg.weight_changes.push_back(e);
  }

  for (const auto& i : data_result.identities) {
    msg.identities.push_back(LOADCELL_BUS::DeviceIdentityInfo{i.address, i.ToHexString()});
  }

  for (const auto& p : data_result.params) {
    LOADCELL_BUS::DeviceParamInfo info;
    info.address = p.address;
    info.division = p.division;
    info.resolution_grams = p.resolution_grams;
    info.scale_kind = p.scale_kind;
    info.scale_kind_name = p.scale_kind_name;
    info.zero_range = p.zero_range;
    info.settling_range = p.settling_range;
    info.max_weight_grams = p.max_weight_grams;
    msg.params.push_back(std::move(info));
  }

  for (const auto& r : data_result.command_results) {
    msg.command_outcomes.push_back(LOADCELL_BUS::CommandOutcome{r.command_id, r.action, r.ret_code, r.message});
  }

  return msg;
}
}  // namespace sensor_driver_base
