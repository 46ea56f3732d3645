#include "loadcell_bus_driver_node.h"

#include <exception>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <loadcell_bus/loadcell_exception.h>

namespace loadcell_bus_driver {

using loadcell_bus::LoadCellException;
using loadcell_bus::ResultCode;
using sensor_driver_base::CommandResult;
using sensor_driver_base::DataResult;

namespace {

constexpr std::size_t kMaxPendingCommands = 32;

loadcell_bus::BusMode ParseBusMode(const std::string& value) {
  if (value == "multi_drop")
    return loadcell_bus::BusMode::kMultiDrop;
  if (value == "single_device")
    return loadcell_bus::BusMode::kSingleDevice;
  throw LoadCellException(ResultCode::kInvalidArgument, "bus_mode must be multi_drop|single_device: " + value);
}

loadcell_bus::SignMode ParseSignMode(const std::string& value) {
  if (value == "signed")
    return loadcell_bus::SignMode::kSigned;
  if (value == "absolute")
    return loadcell_bus::SignMode::kAbsolute;
  throw LoadCellException(ResultCode::kInvalidArgument, "sign_mode must be signed|absolute: " + value);
}

loadcell_bus::CalibrationMode ParseCalibrationMode(const std::string& value) {
  if (value == "replace")
    return loadcell_bus::CalibrationMode::kReplace;
  if (value == "multiply")
    return loadcell_bus::CalibrationMode::kMultiply;
  throw LoadCellException(ResultCode::kInvalidArgument, "calibration_mode must be replace|multiply: " + value);
}

}  // namespace

LoadCellBusDriverNode::LoadCellBusDriverNode() : sensor_driver_base::SensorDriverNode("loadcell_bus_driver_node") {}

LoadCellBusDriverNode::~LoadCellBusDriverNode() {
  // IO 스레드가 bus_ 를 사용하므로 먼저 멈춘다
  StopThreads();
  if (command_subscriber_)
    command_subscriber_->Stop();
}

void LoadCellBusDriverNode::ParamChange() {
  serial_config_.device = this->declare_parameter<std::string>("loadcell_port", "/dev/ttyUSB0");
  serial_config_.baudrate = this->declare_parameter<int>("loadcell_baudrate", 115200);
  response_timeout_ = std::chrono::milliseconds(this->declare_parameter<int>("response_timeout_ms", 200));

  loadcell_bus::BusOptions options;
  options.engine.binary_counts_per_gram = this->declare_parameter<double>(
      "binary_counts_per_gram", loadcell_bus::protocol::kDefaultBinaryCountsPerGram);
  options.engine.debug_dump_enabled = this->declare_parameter<bool>("debug_dump", false);

  rcl_interfaces::msg::ParameterDescriptor bus_mode_desc;
  bus_mode_desc.description =
      "multi_drop (default): responses from address 0x00 are dropped and counted. "
      "single_device: 0x00 is registered like any other address (lone factory-default cell)";
  options.registry.bus_mode =
      ParseBusMode(this->declare_parameter<std::string>("bus_mode", "multi_drop", bus_mode_desc));
  options.registry.sign_mode = ParseSignMode(this->declare_parameter<std::string>("sign_mode", "signed"));
  options.registry.calibration_mode =
      ParseCalibrationMode(this->declare_parameter<std::string>("calibration_mode", "replace"));
  options.registry.smoothing_window =
      static_cast<std::size_t>(this->declare_parameter<int>("smoothing_window", 1));
  options.registry.stability.stable_count = static_cast<std::size_t>(this->declare_parameter<int>("stable_count", 5));
  options.registry.stability.tolerance_grams = this->declare_parameter<double>("stable_tolerance", 1.0);

  const std::string correction = this->declare_parameter<std::string>("correction", "identity");
  const std::vector<double> coefficients =
      this->declare_parameter<std::vector<double>>("correction_coefficients", std::vector<double>{});
  options.registry.correction = loadcell_bus::CorrectionPolicy::FromName(correction, coefficients);

  print_publish_data_ = this->declare_parameter<bool>("print_publish_data", false);

  bus_ = std::make_unique<loadcell_bus::LoadCellBus>(options);

  RCLCPP_INFO(this->get_logger(), "port=%s baud=%d timeout=%dms bus_mode=%s sign=%s calibration=%s correction=%s",
              serial_config_.device.c_str(), serial_config_.baudrate, static_cast<int>(response_timeout_.count()),
              loadcell_bus::BusModeToString(options.registry.bus_mode),
              loadcell_bus::SignModeToString(options.registry.sign_mode),
              loadcell_bus::CalibrationModeToString(options.registry.calibration_mode),
              options.registry.correction.Name());

  const std::string command_endpoint = this->declare_parameter<std::string>("zmq_command_endpoint", "");
  const std::string command_topic = this->declare_parameter<std::string>("zmq_command_topic", "loadcell_bus_cmd");
  if (!command_endpoint.empty()) {
    command_subscriber_ = std::make_unique<zmq_pub::MsgPackSubscriber<LOADCELL_BUS::BusCommand>>(
        zmq_context_, command_endpoint, command_topic,
        [this](LOADCELL_BUS::BusCommand&& command) { OnCommand(std::move(command)); },
        [this](const std::string& error_message) {
          RCLCPP_WARN(this->get_logger(), "command channel: %s", error_message.c_str());
          return true;
        });
  }
}

bool LoadCellBusDriverNode::IsConnected() { return bus_ && bus_->IsOpen(); }

void LoadCellBusDriverNode::Connect() {
  if (!bus_)
    throw std::runtime_error("LoadCellBusDriverNode: bus is not configured (check parameters)");

  if (!bus_->Open(serial_config_)) {
    std::ostringstream oss;
    oss << "LoadCellBusDriverNode: Open() failed. ";
    oss << "Device: [ " << serial_config_.device << " ] ";
    oss << "last_error=\"" << bus_->LastError() << "\"";
    throw std::runtime_error(oss.str());
  }
  RCLCPP_INFO(this->get_logger(), "opened %s", serial_config_.device.c_str());
}

void LoadCellBusDriverNode::OnCommand(LOADCELL_BUS::BusCommand&& command) {
  std::lock_guard<std::mutex> lock(command_mutex_);
  if (pending_commands_.size() >= kMaxPendingCommands) {
    RCLCPP_WARN(this->get_logger(), "command queue full, dropping command_id=%lu",
                static_cast<unsigned long>(pending_commands_.front().command_id));
    pending_commands_.pop_front();
  }
  pending_commands_.push_back(std::move(command));
}

bool LoadCellBusDriverNode::IsChangedOption() {
  std::lock_guard<std::mutex> lock(command_mutex_);
  return !pending_commands_.empty();
}

void LoadCellBusDriverNode::ChangeOption() {
  std::deque<LOADCELL_BUS::BusCommand> commands;
  {
    std::lock_guard<std::mutex> lock(command_mutex_);
    commands.swap(pending_commands_);
  }

  for (const auto& command : commands) {
    CommandResult result = Execute(command);
    if (result.ret_code == static_cast<std::int32_t>(ResultCode::kOk)) {
      RCLCPP_INFO(this->get_logger(), "command %s (id=%lu): %s", command.action.c_str(),
                  static_cast<unsigned long>(command.command_id), result.message.c_str());
    } else {
      RCLCPP_ERROR(this->get_logger(), "command %s (id=%lu) failed: %s", command.action.c_str(),
                   static_cast<unsigned long>(command.command_id), result.message.c_str());
    }
    command_results_.push_back(std::move(result));
  }
}

CommandResult LoadCellBusDriverNode::Execute(const LOADCELL_BUS::BusCommand& command) {
  CommandResult result;
  result.command_id = command.command_id;
  result.action = command.action;

  ResultCode rc = ResultCode::kOk;
  std::ostringstream message;

  try {
    if (!bus_)
      throw std::runtime_error("bus is not configured");

    const auto& action = command.action;
    if (action == "zero") {
      bus_->Registry().Zero(command.address);
      message << "address=" << static_cast<int>(command.address) << " zeroed";
    } else if (action == "calibrate") {
      const double factor = bus_->Registry().Calibrate(command.address, command.value);
      message << "address=" << static_cast<int>(command.address) << " scale_factor=" << factor;
    } else if (action == "tare_device") {
      rc = bus_->SetZero();
    } else if (action == "change_address") {
      const std::uint8_t target = command.args.empty() ? command.address : command.args[0];
      rc = bus_->ChangeAddress(target);
      message << "new_address=" << static_cast<int>(target);
    } else if (action == "write_params") {
      if (command.args.size() != 5)
        throw LoadCellException(ResultCode::kInvalidArgument, "write_params needs 5 args");
      loadcell_bus::ParamWriteArgs args;
      args.max_weight_index = command.args[0];
      args.division_index = command.args[1];
      args.zero_range = command.args[2];
      args.settling_range = command.args[3];
      args.scale_kind = command.args[4];
      rc = bus_->WriteParams(args);
    } else if (action == "read_id") {
      rc = bus_->ReadIds(response_timeout_, 1);
      message << "devices=" << bus_->Identities().size();
    } else if (action == "read_params") {
      rc = bus_->ReadParams(response_timeout_, 1);
      message << "devices=" << bus_->Params().size();
    } else {
      throw LoadCellException(ResultCode::kInvalidArgument, "unknown action: " + action);
    }

    if (rc != ResultCode::kOk)
      message << " " << loadcell_bus::ResultCodeToString(rc) << " " << bus_->LastError();
  }
  catch (const LoadCellException& e) {
    rc = e.Code();
    message << e.what();
  }
  catch (const std::exception& e) {
    rc = ResultCode::kInvalidArgument;
    message << e.what();
  }

  result.ret_code = static_cast<std::int32_t>(rc);
  result.message = message.str();
  return result;
}

void LoadCellBusDriverNode::GetData(DataResult& out) {
  if (!bus_)
    throw std::runtime_error("LoadCellBusDriverNode::GetData: bus is not configured");

  const ResultCode rc = bus_->ReadWeights(response_timeout_);

  out.cycle_no = ++cycle_no_;
  out.return_code = static_cast<std::int32_t>(rc);

  switch (rc) {
    case ResultCode::kOk:
      out.driver_state = sensor_driver_base::DRIVER_STATE::OK;
      out.driver_err_msg = "";
      break;
    case ResultCode::kTimeout:
    case ResultCode::kNoFrame:
      out.driver_state = sensor_driver_base::DRIVER_STATE::EMPTY;
      out.driver_err_msg = "no device responded";
      break;
    default:
      out.driver_state = sensor_driver_base::DRIVER_STATE::ERROR;
      out.driver_err_msg = bus_->LastError() + "/" + bus_->LastIoError();
      RCLCPP_ERROR(this->get_logger(), "read weights failed: %s (%s)", loadcell_bus::ResultCodeToString(rc),
                   out.driver_err_msg.c_str());
      break;
  }

  out.devices = bus_->Registry().Snapshot();
  if (out.devices.empty() && bus_->Registry().IgnoredBroadcastSamples() != 0U) {
    RCLCPP_WARN_THROTTLE(this->get_logger(), *this->get_clock(), 10000,
                         "only address 0x00 is answering and bus_mode=multi_drop drops it (%lu samples); "
                         "set bus_mode:=single_device",
                         static_cast<unsigned long>(bus_->Registry().IgnoredBroadcastSamples()));
  }
  out.weight_changes = bus_->TakeWeightChanges();
  out.identities = bus_->Identities();
  out.params = bus_->Params();
  out.command_results.swap(command_results_);
  command_results_.clear();

  for (const auto& change : out.weight_changes) {
    RCLCPP_INFO(this->get_logger(), "address=%d %s %.1fg (stable %.1fg)", static_cast<int>(change.address),
                loadcell_bus::WeightChangeKindToString(change.kind), change.delta_grams, change.stable_weight_grams);
  }
}

void LoadCellBusDriverNode::PrintPublishData(const LOADCELL_BUS::BusSnapshot& msg) {
  if (!print_publish_data_ || msg.cycle_no == last_published_cycle_)
    return;
  last_published_cycle_ = msg.cycle_no;

  std::ostringstream oss;
  oss << "=== BusSnapshot seq=" << msg.seq_no << " cycle=" << msg.cycle_no
      << " state=" << static_cast<int>(msg.driver_state) << " ===\n";
  for (const auto& d : msg.devices) {
    oss << "  [0x" << std::hex << static_cast<int>(d.address) << std::dec << "] weight=" << d.corrected_weight
        << "g raw=" << d.raw_weight << "g samples=" << d.sample_count << (d.is_stable ? " stable" : "") << "\n";
  }
  RCLCPP_INFO(this->get_logger(), "%s", oss.str().c_str());
}

}  // namespace loadcell_bus_driver
