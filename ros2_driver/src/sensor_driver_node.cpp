#include "sensor_driver_node.h"

#include <exception>
#include <utility>

#include "unique_key_generator.h"

namespace sensor_driver_base {

SensorDriverNode::SensorDriverNode(const std::string& node_name) : rclcpp::Node(node_name) {}

SensorDriverNode::~SensorDriverNode() { StopThreads(); }

void SensorDriverNode::StopThreads() noexcept {
  /** thread stop flag 활성화 */
  stop_requested_.store(true, std::memory_order_relaxed);

  if (io_thread_.joinable())
    io_thread_.join();

  if (publish_thread_.joinable())
    publish_thread_.join();
}

/**
 * @brief 초기화.
 *
 * - 공통 파라미터(sensor_id, zmq_endpoint, zmq_topic, 주기) 선언
 * - driver_instance_id 생성, seq generator / data builder 초기화
 * - ZeroMQ publisher 생성 (실패 시 예외 전파: 같은 endpoint 중복 실행 등)
 * - 하위 클래스 파라미터 반영 및 최초 연결 시도
 * - IO / publish 스레드 시작
 */
void SensorDriverNode::Initialize() {
  const std::string sensor_id = declare_parameter<std::string>("sensor_id", "loadcell_bus");
  const std::string zmq_endpoint = declare_parameter<std::string>("zmq_endpoint", "tcp://*:5558");
  const std::string zmq_topic = declare_parameter<std::string>("zmq_topic", "loadcell_bus");
  const int io_period_ms = declare_parameter<int>("io_period_ms", 500);
  const int publish_period_ms = declare_parameter<int>("publish_period_ms", 100);

  if (io_period_ms > 0)
    io_period_ = std::chrono::milliseconds(io_period_ms);
  if (publish_period_ms > 0)
    publish_period_ = std::chrono::milliseconds(publish_period_ms);

  gen_seq_no_ = std::make_unique<sensor_driver_uk::GenSeqNo>();
  const std::string driver_instance_id = sensor_driver_uk::GenerateInstanceID(sensor_id);
  data_builder_ = std::make_unique<DataBuilder>(sensor_id, driver_instance_id);

  publisher_ = std::make_unique<SnapshotPublisher>(zmq_context_, zmq_endpoint, zmq_topic);

  RCLCPP_INFO(this->get_logger(), "instance=%s publish=%s topic=%s io=%dms pub=%dms", driver_instance_id.c_str(),
              zmq_endpoint.c_str(), zmq_topic.c_str(), static_cast<int>(io_period_.count()),
              static_cast<int>(publish_period_.count()));

  try {
    /** user params 변경 사항을 반영하기 위해 호출 */
    ParamChange();

    /** 최초 자동 연결. 실패하면 IO 스레드가 재시도 */
    Connect();
    connection_state_.store(true, std::memory_order_relaxed);
  }
  catch (const std::exception& e) {
    RCLCPP_ERROR(this->get_logger(), "%s", e.what());
  }

  stop_requested_.store(false, std::memory_order_relaxed);
  io_thread_ = std::thread(&SensorDriverNode::IoThreadMain, this);
  publish_thread_ = std::thread(&SensorDriverNode::PublishThreadMain, this);
}

void SensorDriverNode::IoThreadMain() {
  auto next_wakeup = std::chrono::steady_clock::now();

  while (rclcpp::ok() && !stop_requested_.load(std::memory_order_relaxed)) {
    next_wakeup += io_period_;

    IO_Callback();

    // 한 주기가 io_period_ 보다 길어지면 밀린 주기를 따라잡지 않는다
    const auto now = std::chrono::steady_clock::now();
    if (next_wakeup < now)
      next_wakeup = now;
    std::this_thread::sleep_until(next_wakeup);
  }
}

void SensorDriverNode::PublishThreadMain() {
  auto next_wakeup = std::chrono::steady_clock::now();

  while (rclcpp::ok() && !stop_requested_.load(std::memory_order_relaxed)) {
    next_wakeup += publish_period_;

    PublisherCallback();

    std::this_thread::sleep_until(next_wakeup);
  }
}

/**
 * @note 스레드 안전:
 * - write 슬롯 인덱스 스냅샷 및 swap 구간만 짧게 mutex로 보호합니다.
 * - 실제 수신 및 데이터 채움은 lock 없이 수행합니다.
 */
void SensorDriverNode::IO_Callback() {
  /** 재연결 시도 */
  if (false == IsConnected()) {
    try {
      Connect();
      connection_state_.store(true, std::memory_order_relaxed);
      RCLCPP_INFO(this->get_logger(), "reconnected");
    }
    catch (const std::exception& e) {
      RCLCPP_ERROR(this->get_logger(), "%s", e.what());
      connection_state_.store(false, std::memory_order_relaxed);
      return;
    }
  }
  else {
    connection_state_.store(true, std::memory_order_relaxed);
  }

  try {
    if (true == IsChangedOption())
      ChangeOption();
  }
  catch (const std::exception& e) {
    RCLCPP_ERROR(this->get_logger(), "%s", e.what());
  }

  std::size_t local_write_index = 0;
  {
    std::lock_guard<std::mutex> lock(data_mutex_);
    local_write_index = write_index_;
  }

  try {
    DataResult& slot = data_buffer_[local_write_index];
    slot = DataResult{};
    GetData(slot);

    {
      std::lock_guard<std::mutex> lock(data_mutex_);
      write_index_ = read_index_;
      read_index_ = local_write_index;
      has_data_ = true;
    }
  }
  catch (const std::exception& e) {
    RCLCPP_ERROR(this->get_logger(), "%s", e.what());
  }
}

void SensorDriverNode::PublisherCallback() {
  /** 드라이버 연결 실패 시 Publish Skip */
  if (false == connection_state_.load(std::memory_order_relaxed)) {
    return;
  }

  std::size_t local_read_index = 0;
  bool has_data_snapshot = false;
  {
    std::lock_guard<std::mutex> lock(data_mutex_);
    local_read_index = read_index_;
    has_data_snapshot = has_data_;
  }

  if (!has_data_snapshot) {
    return;
  }

  PublishOnce(local_read_index);
}

void SensorDriverNode::PublishOnce(std::size_t read_index) {
  const LOADCELL_BUS::BusSnapshot msg =
      data_builder_->Build(gen_seq_no_->Current(), this->now(), data_buffer_[read_index]);

  PrintPublishData(msg);

  try {
    publisher_->Publish(msg);
  }
  catch (const std::exception& e) {
    RCLCPP_ERROR(this->get_logger(), "Error publishing to ZMQ: %s", e.what());
  }

  /** 시퀀스 번호 증가 */
  gen_seq_no_->Increment();
}
}  // namespace sensor_driver_base
