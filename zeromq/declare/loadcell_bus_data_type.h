#ifndef LOADCELL_BUS_DATA_TYPE_H_
#define LOADCELL_BUS_DATA_TYPE_H_

#include <cstdint>
#include <string>
#include <vector>

#include <msgpack.hpp>

/**
 * ZeroMQ 로 주고받는 MsgPack 메시지 정의.
 * 필드 순서가 곧 wire 포맷이므로 뒤에만 추가할 것.
 */
namespace LOADCELL_BUS {

enum DRIVER_STATE : uint8_t { OK = 0, EMPTY = 1, ERROR = 2 };

enum WEIGHT_CHANGE_KIND : uint8_t { ADDED = 0, REMOVED = 1 };

struct DeviceSnapshot {
  uint8_t address = 0;
  double zero_offset_grams = 0.0;
  double scale_factor = 1.0;
  double raw_weight = 0.0;
  double calibrated_weight = 0.0;
  double corrected_weight = 0.0;
  double smoothed_weight = 0.0;
  uint64_t sample_count = 0;
  uint8_t status = 0;
  bool is_stable = false;
  double stable_weight = 0.0;

  MSGPACK_DEFINE(address, zero_offset_grams, scale_factor, raw_weight,
                 calibrated_weight, corrected_weight, smoothed_weight,
                 sample_count, status, is_stable, stable_weight)
};

struct WeightChangeEvent {
  uint8_t address = 0;
  uint8_t kind = ADDED;
  double delta_grams = 0.0;
  double stable_weight_grams = 0.0;

  MSGPACK_DEFINE(address, kind, delta_grams, stable_weight_grams)
};

struct DeviceIdentityInfo {
  uint8_t address = 0;
  std::string id_hex;

  MSGPACK_DEFINE(address, id_hex)
};

struct DeviceParamInfo {
  uint8_t address = 0;
  uint8_t division = 0;
  double resolution_grams = 0.0;
  uint8_t scale_kind = 0;
  std::string scale_kind_name;
  uint8_t zero_range = 0;
  uint8_t settling_range = 0;
  double max_weight_grams = 0.0;

  MSGPACK_DEFINE(address, division, resolution_grams, scale_kind,
                 scale_kind_name, zero_range, settling_range, max_weight_grams)
};

struct CommandOutcome {
  uint64_t command_id = 0;
  std::string action;
  int32_t ret_code = 0;
  std::string message;

  MSGPACK_DEFINE(command_id, action, ret_code, message)
};

/** @brief 드라이버 -> 소비자. publish 주기마다 1건 */
struct BusSnapshot {
  std::string driver_instance_id;
  uint64_t seq_no = 0;
  uint64_t pub_timestamp = 0;
  uint64_t cycle_no = 0; // IO 주기 번호. 같은 값이면 같은 데이터(이벤트 중복 제거용)
  uint8_t driver_state = ERROR;
  int32_t ret_code = 0;
  std::string driver_err_msg;
  std::vector<DeviceSnapshot> devices;
  std::vector<WeightChangeEvent> weight_changes;
  std::vector<DeviceIdentityInfo> identities;
  std::vector<DeviceParamInfo> params;
  std::vector<CommandOutcome> command_outcomes;

  MSGPACK_DEFINE(driver_instance_id, seq_no, pub_timestamp, cycle_no,
                 driver_state, ret_code, driver_err_msg, devices,
                 weight_changes, identities, params, command_outcomes)
};

/**
 * @brief 소비자 -> 드라이버 교정/유지보수 명령.
 *
 * action        address     value        args
 * zero          대상 주소   -            -
 * calibrate     대상 주소   기준 무게(g) -
 * tare_device   -           -            -
 * change_address -          -            [new_address]
 * write_params  -           -            [max, div, zero, settle, kind]
 * read_id       -           -            -
 * read_params   -           -            -
 */
struct BusCommand {
  uint64_t command_id = 0;
  std::string action;
  uint8_t address = 0;
  double value = 0.0;
  std::vector<uint8_t> args;

  MSGPACK_DEFINE(command_id, action, address, value, args)
};

} // namespace LOADCELL_BUS

#endif // LOADCELL_BUS_DATA_TYPE_H_
