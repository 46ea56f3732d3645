#pragma once

#include <cstdint>
#include <string>

#include <rclcpp/rclcpp.hpp>

#include "data_result.h"
#include "loadcell_bus_data_type.h"

namespace sensor_driver_base {
class DataBuilder {
 public:
  /**
   * @param sensor_id 센서 식별자(파라미터로부터)
   * @param driver_instance_id 드라이버 인스턴스 식별자
   */
  DataBuilder(std::string sensor_id, std::string driver_instance_id);

  /** @brief DataResult -> ZeroMQ 로 보낼 BusSnapshot */
  LOADCELL_BUS::BusSnapshot Build(std::uint64_t seq_no, const rclcpp::Time& pub_timestamp,
                                  const DataResult& data_result) const;

  const std::string& SensorId() const noexcept { return sensor_id_; }

 private:
  std::string sensor_id_;
  std::string driver_instance_id_;
};

}  // namespace sensor_driver_base
