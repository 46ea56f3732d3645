#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <loadcell_bus/loadcell_bus.h>

#include "data_result.h"
#include "loadcell_bus_data_type.h"
#include "sensor_driver_node.h"
#include "zmq_subscriber_msgpack.hpp"

namespace loadcell_bus_driver {

/**
 * @brief RS-485 다중 로드셀 버스 드라이버 노드.
 *
 * IO 주기마다 브로드캐스트 무게 요청을 보내고 response_timeout_ms 동안
 * 모든 장치의 응답을 수집한 뒤 레지스트리 스냅샷을 DataResult 로 채운다.
 * ZeroMQ 명령 채널로 받은 교정/유지보수 명령은 큐에 쌓았다가 IO 스레드에서
 * 실행한다(레지스트리는 IO 스레드에서만 변경).
 */
class LoadCellBusDriverNode : public sensor_driver_base::SensorDriverNode {
 public:
  LoadCellBusDriverNode();
  ~LoadCellBusDriverNode() override;

 private:
  void ParamChange() override;
  bool IsConnected() override;
  void Connect() override;
  bool IsChangedOption() override;
  void ChangeOption() override;
  void GetData(sensor_driver_base::DataResult& out) override;
  void PrintPublishData(const LOADCELL_BUS::BusSnapshot& msg) override;

  void OnCommand(LOADCELL_BUS::BusCommand&& command);
  sensor_driver_base::CommandResult Execute(const LOADCELL_BUS::BusCommand& command);

  std::unique_ptr<loadcell_bus::LoadCellBus> bus_;
  loadcell_bus::SerialConfig serial_config_;
  std::chrono::milliseconds response_timeout_{200};
  bool print_publish_data_ = false;

  std::unique_ptr<zmq_pub::MsgPackSubscriber<LOADCELL_BUS::BusCommand>> command_subscriber_;
  std::mutex command_mutex_;
  std::deque<LOADCELL_BUS::BusCommand> pending_commands_;

  /** IO 스레드 전용 */
  std::vector<sensor_driver_base::CommandResult> command_results_;
  std::uint64_t cycle_no_ = 0;
  std::uint64_t last_published_cycle_ = 0;
};
}  // namespace loadcell_bus_driver
