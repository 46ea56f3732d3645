#include "loadcell_bus/loadcell_bus.h"

#include <algorithm>
#include <cstdio>
#include <iostream>
#include <utility>

#include <unistd.h>

#include "loadcell_bus/serial_port.h"

namespace loadcell_bus {

namespace {
constexpr const char *kClassName = "LoadCellBus";
constexpr std::chrono::milliseconds kReaderErrorBackoff{50};
} // namespace

LoadCellBus::LoadCellBus() : LoadCellBus(BusOptions{}) {}

LoadCellBus::LoadCellBus(BusOptions options)
    : options_(std::move(options)),
      serial_port_(std::make_unique<SerialPort>()),
      channel_(options_.channel_capacity),
      engine_(options_.engine),
      registry_(options_.registry) {
  engine_.Subscribe([this](const DecodedEvent &event) { OnEvent_(event); });
}

LoadCellBus::~LoadCellBus() { Close(); }

bool LoadCellBus::Open(const SerialConfig &cfg) {
  StopReader_();
  if (!serial_port_->Open(cfg)) {
    SetLastError_(serial_port_->LastError());
    return false;
  }
  StartReader_();
  return true;
}

bool LoadCellBus::Open() {
  StopReader_();
  if (!serial_port_->Open()) {
    SetLastError_(serial_port_->LastError());
    return false;
  }
  StartReader_();
  return true;
}

void LoadCellBus::Close() noexcept {
  StopReader_();
  serial_port_->Close();
}

bool LoadCellBus::IsOpen() const noexcept {
  return serial_port_->IsOpen() && !reader_failed_.load();
}

void LoadCellBus::StartReader_() {
  channel_.Clear();
  channel_.Reopen();
  engine_.Clear();
  stop_requested_.store(false);
  reader_failed_.store(false);
  reader_thread_ = std::thread(&LoadCellBus::ReaderThreadMain_, this);
}

void LoadCellBus::StopReader_() noexcept {
  stop_requested_.store(true);
  channel_.Close();
  if (reader_thread_.joinable())
    reader_thread_.join();
}

void LoadCellBus::ReaderThreadMain_() {
  Bytes buf(options_.read_chunk_bytes);

  while (!stop_requested_.load()) {
    const long n = serial_port_->Read(buf.data(), buf.size());
    if (n > 0) {
      channel_.Push(Bytes(buf.begin(), buf.begin() + n));
      continue;
    }
    if (n < 0) {
      const std::string err = serial_port_->LastError();
      {
        std::lock_guard<std::mutex> lock(error_mutex_);
        last_io_error_ = err;
      }
      std::cerr << "[" << kClassName << "][device="
                << serial_port_->Config().device << "][pid=" << ::getpid()
                << "] reader stopped: " << err << std::endl;
      reader_failed_.store(true);
      break;
    }
    // n == 0: VTIME timeout, stop 요청 확인
  }

  // 대기 중인 Poll 을 깨운다
  channel_.Close();
}

ResultCode LoadCellBus::SendCommand(const Bytes &command) {
  if (!serial_port_->IsOpen()) {
    SetLastError_("send: port not open");
    return ResultCode::kNotOpen;
  }

  // flush-then-send
  serial_port_->Flush();
  channel_.Clear();
  engine_.Clear();

  const long n = serial_port_->Write(command.data(), command.size());
  if (n != static_cast<long>(command.size())) {
    const std::string err = serial_port_->LastError();
    {
      std::lock_guard<std::mutex> lock(error_mutex_);
      last_io_error_ = err;
    }
    SetLastError_("send failed: " + err);
    return ResultCode::kIoWriteFail;
  }
  return ResultCode::kOk;
}

ResultCode LoadCellBus::Poll(std::chrono::milliseconds timeout,
                             std::vector<DecodedEvent> *out) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  bool decoded_any = false;

  Bytes chunk;
  while (true) {
    const auto now = std::chrono::steady_clock::now();
    const auto remaining =
        now < deadline ? std::chrono::duration_cast<std::chrono::milliseconds>(
                             deadline - now)
                       : std::chrono::milliseconds(0);

    const bool got = remaining.count() > 0 ? channel_.Pop(chunk, remaining)
                                           : channel_.TryPop(chunk);
    if (!got)
      break;

    std::vector<DecodedEvent> events = engine_.Feed(chunk);
    if (!events.empty()) {
      decoded_any = true;
      if (out != nullptr) {
        for (auto &e : events)
          out->push_back(std::move(e));
      }
    }
  }

  if (decoded_any)
    return ResultCode::kOk;
  if (reader_failed_.load())
    return ResultCode::kIoReadFail;
  return ResultCode::kNoFrame;
}

ResultCode LoadCellBus::Transact(const Bytes &command,
                                 std::uint8_t expected_register,
                                 std::chrono::milliseconds timeout, int retries,
                                 std::vector<DecodedEvent> *out,
                                 std::size_t expected_responses) {
  for (int attempt = 0; attempt <= retries; ++attempt) {
    const ResultCode sent = SendCommand(command);
    if (sent != ResultCode::kOk)
      return sent;

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::size_t matched = 0;

    while (std::chrono::steady_clock::now() < deadline) {
      const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline - std::chrono::steady_clock::now());
      // 조기 종료 판단을 위해 짧게 나눠서 poll
      const auto slice = std::min(remaining, std::chrono::milliseconds(10));

      std::vector<DecodedEvent> events;
      const ResultCode rc = Poll(slice, &events);
      if (rc == ResultCode::kIoReadFail)
        return rc;

      for (auto &e : events) {
        if (e.reg == expected_register)
          ++matched;
        if (out != nullptr)
          out->push_back(std::move(e));
      }

      if (expected_responses != 0 && matched >= expected_responses)
        return ResultCode::kOk;
    }

    if (matched > 0)
      return ResultCode::kOk;
  }

  char reg_hex[8] = {0};
  std::snprintf(reg_hex, sizeof(reg_hex), "0x%02X", expected_register);
  SetLastError_(std::string("no response for register ") + reg_hex + " after " +
                std::to_string(retries + 1) + " attempt(s)");
  return ResultCode::kTimeout;
}

ResultCode LoadCellBus::ReadWeights(std::chrono::milliseconds timeout,
                                    int retries, std::vector<DecodedEvent> *out) {
  return Transact(FrameCodec::ReadWeight(), protocol::kRegWeight, timeout,
                  retries, out);
}

ResultCode LoadCellBus::ReadIds(std::chrono::milliseconds timeout, int retries,
                                std::vector<DecodedEvent> *out) {
  return Transact(FrameCodec::ReadId(), protocol::kRegId, timeout, retries, out);
}

ResultCode LoadCellBus::ReadParams(std::chrono::milliseconds timeout,
                                   int retries, std::vector<DecodedEvent> *out) {
  return Transact(FrameCodec::ReadParams(), protocol::kRegParam, timeout,
                  retries, out);
}

ResultCode LoadCellBus::SetZero() { return SendCommand(FrameCodec::SetZero()); }

ResultCode LoadCellBus::ChangeAddress(std::uint8_t new_address) {
  return SendCommand(FrameCodec::ChangeAddress(new_address));
}

ResultCode LoadCellBus::WriteParams(const ParamWriteArgs &args) {
  return SendCommand(FrameCodec::WriteParams(args));
}

void LoadCellBus::OnEvent_(const DecodedEvent &event) {
  switch (event.kind) {
  case EventKind::kWeight: {
    auto change = registry_.Record(event.address, event.weight);
    if (change)
      pending_changes_.push_back(*change);
    break;
  }
  case EventKind::kIdentity:
    identities_[event.address] = event.identity;
    break;
  case EventKind::kParams:
    params_[event.address] = event.params;
    break;
  }
}

std::vector<DeviceIdentity> LoadCellBus::Identities() const {
  std::vector<DeviceIdentity> out;
  out.reserve(identities_.size());
  for (const auto &kv : identities_)
    out.push_back(kv.second);
  return out;
}

std::vector<DeviceParams> LoadCellBus::Params() const {
  std::vector<DeviceParams> out;
  out.reserve(params_.size());
  for (const auto &kv : params_)
    out.push_back(kv.second);
  return out;
}

std::vector<WeightChange> LoadCellBus::TakeWeightChanges() {
  std::vector<WeightChange> out;
  out.swap(pending_changes_);
  return out;
}

std::uint64_t LoadCellBus::DroppedChunks() const {
  return channel_.DroppedChunks();
}

std::string LoadCellBus::LastError() const {
  std::lock_guard<std::mutex> lock(error_mutex_);
  return last_error_;
}

std::string LoadCellBus::LastIoError() const {
  std::lock_guard<std::mutex> lock(error_mutex_);
  return last_io_error_;
}

void LoadCellBus::SetLastError_(std::string message) {
  std::lock_guard<std::mutex> lock(error_mutex_);
  last_error_ = std::move(message);
}

} // namespace loadcell_bus
