#ifndef LOADCELL_BUS_LOADCELL_BUS_H_
#define LOADCELL_BUS_LOADCELL_BUS_H_

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "SerialConfig.h"
#include "byte_chunk_channel.h"
#include "device_registry.h"
#include "loadcell_status.h"
#include "protocol_engine.h"

namespace loadcell_bus {

class SerialPort;

struct BusOptions {
  EngineConfig engine{};
  RegistryConfig registry{};
  std::size_t channel_capacity = 64;
  std::size_t read_chunk_bytes = 256;
};

/**
 * @brief RS-485 다중 로드셀 버스.
 *
 * SerialPort + reader 스레드 + ByteChunkChannel + ProtocolEngine +
 * DeviceRegistry 를 묶는다. reader 스레드는 수신 바이트를 채널에 넣기만 하고,
 * 디코딩/레지스트리 갱신은 Poll()/Transact() 를 호출하는 단일 스레드에서 수행한다.
 *
 * 송신은 항상 "채널/엔진 버퍼 비우기 -> 전송" 순서로 이뤄진다.
 */
class LoadCellBus final {
public:
  LoadCellBus();
  explicit LoadCellBus(BusOptions options);
  ~LoadCellBus();

  LoadCellBus(const LoadCellBus &) = delete;
  LoadCellBus &operator=(const LoadCellBus &) = delete;

  bool Open(const SerialConfig &cfg);
  /** @brief 마지막 설정으로 재연결 */
  bool Open();
  void Close() noexcept;
  bool IsOpen() const noexcept;

  /** @brief 오래된 수신 데이터를 비우고 명령을 전송한다 */
  ResultCode SendCommand(const Bytes &command);

  /**
   * @brief timeout 동안 채널을 비우며 엔진/레지스트리에 반영한다.
   * @param out (nullable) 디코딩된 이벤트를 덧붙일 곳
   * @return kOk: 1개 이상 디코딩, kNoFrame: 없음, kIoReadFail: reader 오류
   */
  ResultCode Poll(std::chrono::milliseconds timeout,
                  std::vector<DecodedEvent> *out = nullptr);

  /**
   * @brief flush-send-wait 를 retries 회까지 반복한다.
   *
   * expected_register 에 해당하는 이벤트가 expected_responses 개 모이면 즉시
   * 반환한다. expected_responses 가 0 이면 timeout 창을 끝까지 기다린 뒤
   * 1개 이상 받았는지로 판단한다(브로드캐스트 다중 응답 수집용).
   *
   * @return kOk / kTimeout / kIoWriteFail / kNotOpen
   */
  ResultCode Transact(const Bytes &command, std::uint8_t expected_register,
                      std::chrono::milliseconds timeout, int retries,
                      std::vector<DecodedEvent> *out = nullptr,
                      std::size_t expected_responses = 0);

  /** 명령별 helper. 읽기 명령은 timeout 창 동안 모든 장치의 응답을 수집한다. */
  ResultCode ReadWeights(std::chrono::milliseconds timeout, int retries = 0,
                         std::vector<DecodedEvent> *out = nullptr);
  ResultCode ReadIds(std::chrono::milliseconds timeout, int retries = 0,
                     std::vector<DecodedEvent> *out = nullptr);
  ResultCode ReadParams(std::chrono::milliseconds timeout, int retries = 0,
                        std::vector<DecodedEvent> *out = nullptr);
  /** 쓰기 명령은 응답을 기다리지 않는다 */
  ResultCode SetZero();
  ResultCode ChangeAddress(std::uint8_t new_address);
  ResultCode WriteParams(const ParamWriteArgs &args);

  DeviceRegistry &Registry() noexcept { return registry_; }
  const DeviceRegistry &Registry() const noexcept { return registry_; }
  ProtocolEngine &Engine() noexcept { return engine_; }
  const ProtocolEngine &Engine() const noexcept { return engine_; }

  /** @brief 마지막으로 받은 장치별 id / 파라미터 */
  std::vector<DeviceIdentity> Identities() const;
  std::vector<DeviceParams> Params() const;

  /** @brief 누적된 안정 무게 변화 이벤트를 꺼낸다 */
  std::vector<WeightChange> TakeWeightChanges();

  std::uint64_t DroppedChunks() const;
  std::string LastError() const;
  std::string LastIoError() const;

private:
  void ReaderThreadMain_();
  void StartReader_();
  void StopReader_() noexcept;
  void OnEvent_(const DecodedEvent &event);
  void SetLastError_(std::string message);

  BusOptions options_;
  std::unique_ptr<SerialPort> serial_port_;
  ByteChunkChannel channel_;
  ProtocolEngine engine_;
  DeviceRegistry registry_;

  std::map<std::uint8_t, DeviceIdentity> identities_;
  std::map<std::uint8_t, DeviceParams> params_;
  std::vector<WeightChange> pending_changes_;

  std::thread reader_thread_;
  std::atomic<bool> stop_requested_{false};
  std::atomic<bool> reader_failed_{false};

  mutable std::mutex error_mutex_;
  std::string last_error_;
  std::string last_io_error_;
};

} // namespace loadcell_bus

#endif // LOADCELL_BUS_LOADCELL_BUS_H_
