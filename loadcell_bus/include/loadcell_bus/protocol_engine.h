#ifndef LOADCELL_BUS_PROTOCOL_ENGINE_H_
#define LOADCELL_BUS_PROTOCOL_ENGINE_H_

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string_view>
#include <vector>

#include "frame_decoder.h"
#include "stream_scanner.h"

namespace loadcell_bus {

enum class EventKind : std::uint8_t { kWeight = 0, kIdentity, kParams };

const char *EventKindToString(EventKind kind) noexcept;

/**
 * @brief 프레임 한 개의 디코딩 결과. kind 에 해당하는 필드만 유효하다.
 */
struct DecodedEvent {
  EventKind kind = EventKind::kWeight;
  std::uint8_t address = 0;
  std::uint8_t function = 0;
  std::uint8_t reg = 0;
  DecodedWeight weight{};
  DeviceIdentity identity{};
  DeviceParams params{};
};

struct EngineConfig {
  double binary_counts_per_gram = protocol::kDefaultBinaryCountsPerGram;
  /** @brief 수락 프레임/skip 바이트 hex dump (1초 스로틀링) */
  bool debug_dump_enabled = false;
};

struct EngineStats {
  std::uint64_t bytes_fed = 0;
  std::uint64_t bytes_skipped = 0;
  std::uint64_t weight_frames = 0;
  std::uint64_t id_frames = 0;
  std::uint64_t param_frames = 0;
  std::uint64_t subscriber_errors = 0;
};

/**
 * @brief 수신 버퍼 + StreamScanner + decoder 를 묶은 프로토콜 엔진.
 *
 * Feed() 로 들어온 바이트를 버퍼에 누적하고, 스캔/압축 후 프레임을
 * (function, register, length) 로 분기해 디코딩한다.
 * 결과는 구독자에게 전달되고 반환값으로도 돌려준다.
 *
 * @note 단일 consumer 전용. 내부 버퍼는 Feed/Clear 호출 스레드에서만 접근한다.
 */
class ProtocolEngine {
public:
  using EventCallback = std::function<void(const DecodedEvent &)>;
  using SubscriptionId = std::uint64_t;

  explicit ProtocolEngine(EngineConfig config = {});

  ProtocolEngine(const ProtocolEngine &) = delete;
  ProtocolEngine &operator=(const ProtocolEngine &) = delete;

  std::vector<DecodedEvent> Feed(const std::uint8_t *data, std::size_t size);
  std::vector<DecodedEvent> Feed(const Bytes &chunk) {
    return Feed(chunk.data(), chunk.size());
  }

  SubscriptionId Subscribe(EventCallback callback);
  bool Unsubscribe(SubscriptionId id);

  /** @brief 버퍼링된 미완성 바이트를 버린다 (flush-then-send 의 flush) */
  void Clear() noexcept;

  std::size_t Buffered() const noexcept { return buffer_.size(); }
  const EngineStats &Stats() const noexcept { return stats_; }
  void ResetStats() noexcept { stats_ = EngineStats{}; }

  void SetDebugDumpEnabled(bool enabled) noexcept {
    config_.debug_dump_enabled = enabled;
  }
  const EngineConfig &Config() const noexcept { return config_; }

private:
  static constexpr std::string_view kClassName = "ProtocolEngine";

  bool Dispatch_(const Frame &frame, DecodedEvent &out);
  void Deliver_(const DecodedEvent &event);

  void DumpThrottled_(const std::uint8_t *data, std::size_t size,
                      const char *tag);
  void LogError_(std::string_view message) const noexcept;

  EngineConfig config_;
  StreamScanner scanner_;
  WeightDecoder weight_decoder_;
  Bytes buffer_;
  EngineStats stats_;

  std::map<SubscriptionId, EventCallback> subscribers_;
  SubscriptionId next_subscription_id_ = 1;

  // 로그 스로틀링 상태(1초 간격)
  std::uint64_t last_dump_epoch_ms_ = 0;
  int dump_suppressed_ = 0;
};

} // namespace loadcell_bus

#endif // LOADCELL_BUS_PROTOCOL_ENGINE_H_
