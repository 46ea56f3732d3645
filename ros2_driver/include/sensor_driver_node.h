#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <rclcpp/rclcpp.hpp>
#include <zmq.hpp>

#include "data_builder.h"
#include "zmq_publisher_msgpack.hpp"

namespace sensor_driver_uk {
class GenSeqNo;
}

namespace sensor_driver_base {

using SnapshotPublisher = zmq_pub::MsgPackPublisher<LOADCELL_BUS::BusSnapshot>;

/**
 * @brief IO 스레드(버스 질의)와 publish 스레드(ZeroMQ 발행)를 가진 드라이버 기반 노드.
 *
 * IO 주기 결과는 DataResult 2슬롯 중 write 슬롯에 채워지고, 채움이 끝나면
 * 인덱스만 교환해 publish 스레드가 최신 결과를 BusSnapshot 으로 발행한다.
 * 하위 클래스는 아래 hook 만 구현한다.
 */
class SensorDriverNode : public rclcpp::Node {
 public:
  explicit SensorDriverNode(const std::string& node_name);

  virtual ~SensorDriverNode();

  /**
   * @brief 파라미터 선언, publisher 생성, IO/publish 스레드 시작.
   * 생성자에서 가상함수를 호출하지 않기 위해 분리되어 있습니다.
   */
  void Initialize();

 protected:
  /** @brief 하위 클래스가 IO 스레드를 먼저 멈춰야 할 때 호출 */
  void StopThreads() noexcept;

 private:
  /** @brief 재연결 -> 대기 명령 실행 -> GetData -> 슬롯 교환 */
  void IO_Callback();

  /** @brief 연결되어 있고 첫 결과가 나온 뒤에만 발행 */
  void PublisherCallback();

  /** @note 발행 실패해도 seq_no 는 증가한다 */
  void PublishOnce(std::size_t read_index);

  void IoThreadMain();
  void PublishThreadMain();

  /** @brief 하위 노드 전용 파라미터 선언. Initialize() 에서 1회 */
  virtual void ParamChange() {};
  virtual bool IsConnected() { return true; };
  /** @throw std::exception 연결 실패. IO 주기마다 재시도 */
  virtual void Connect() {};
  /** @brief 명령 채널에 처리할 명령이 쌓였는지 */
  virtual bool IsChangedOption() { return false; };
  virtual void ChangeOption() {};
  /** @brief IO 주기 1회분 결과를 채운다. 슬롯은 비워진 상태로 넘어온다 */
  virtual void GetData(DataResult&) {};
  /** @brief 발행 직전 메시지 확인용 (디버그) */
  virtual void PrintPublishData(const LOADCELL_BUS::BusSnapshot&) {};

 protected:
  /** @brief publish 메시지의 seq_no 생성기 */
  std::unique_ptr<sensor_driver_uk::GenSeqNo> gen_seq_no_;

  /** @brief DataResult -> BusSnapshot 변환 */
  std::unique_ptr<DataBuilder> data_builder_;

  /** @brief ZeroMQ 컨텍스트 (publisher/subscriber 공용) */
  zmq::context_t zmq_context_{1};

  /** @brief BusSnapshot 퍼블리셔 */
  std::unique_ptr<SnapshotPublisher> publisher_;

  /** @brief false 이면 publish 를 건너뛰고 IO 스레드가 재연결한다 */
  std::atomic<bool> connection_state_{false};

  /** read_index_: publish 스레드, write_index_: IO 스레드 */
  std::array<DataResult, 2> data_buffer_{};
  std::size_t read_index_{0};
  std::size_t write_index_{1};

  /** @brief 최초 데이터 수신 여부. 수신 전에는 publish 하지 않습니다. */
  bool has_data_{false};

  /** @brief read/write 인덱스 스왑 및 has_data_ 갱신 보호 (짧게만 잠금) */
  std::mutex data_mutex_;

  std::chrono::milliseconds io_period_{500};
  std::chrono::milliseconds publish_period_{100};

  std::atomic<bool> stop_requested_{false};
  std::thread io_thread_;
  std::thread publish_thread_;
};

}  // namespace sensor_driver_base
