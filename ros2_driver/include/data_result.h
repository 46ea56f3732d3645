#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <loadcell_bus/device_registry.h>
#include <loadcell_bus/frame_decoder.h>
#include <loadcell_bus/stability_detector.h>

namespace sensor_driver_base {

/**
 * @brief driver_state
 * uint8 DRIVER_STATE_OK    = 0  : 1개 이상 장치 응답
 * uint8 DRIVER_STATE_EMPTY = 1  : 응답한 장치 없음(timeout)
 * uint8 DRIVER_STATE_ERROR = 2  : 포트/송수신 오류
 */
enum DRIVER_STATE : uint8_t { OK = 0, EMPTY = 1, ERROR = 2 };

/** @brief 명령 채널로 받은 명령 1건의 처리 결과 */
struct CommandResult {
  std::uint64_t command_id = 0;
  std::string action;
  std::int32_t ret_code = 0;  // loadcell_bus::ResultCode
  std::string message;
};

/**
 * @brief IO 주기 1회의 결과. 더블 버퍼의 한 슬롯.
 * return_code 는 loadcell_bus::ResultCode 값이다.
 */
struct DataResult {
  std::uint8_t driver_state = DRIVER_STATE::ERROR;
  std::int32_t return_code = 0;
  std::string driver_err_msg = "";
  std::uint64_t cycle_no = 0;

  std::vector<loadcell_bus::DeviceState> devices;
  std::vector<loadcell_bus::WeightChange> weight_changes;
  std::vector<loadcell_bus::DeviceIdentity> identities;
  std::vector<loadcell_bus::DeviceParams> params;
  std::vector<CommandResult> command_results;
};
}  // namespace sensor_driver_base
