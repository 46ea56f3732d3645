#include "loadcell_bus/protocol_engine.h"

#include <chrono>
#include <cstdio>
#include <exception>
#include <iostream>
#include <string>
#include <utility>

#include <unistd.h>

namespace loadcell_bus {

namespace {

constexpr std::uint64_t kDumpIntervalMs = 1000;

std::uint64_t NowEpochMs() noexcept {
  using namespace std::chrono;
  return static_cast<std::uint64_t>(
      duration_cast<milliseconds>(system_clock::now().time_since_epoch())
          .count());
}

std::string ToHex(const std::uint8_t *data, std::size_t size) {
  std::string out;
  out.reserve(size * 3);
  char buf[4];
  for (std::size_t i = 0; i < size; ++i) {
    std::snprintf(buf, sizeof(buf), "%02X", data[i]);
    if (i != 0)
      out += ' ';
    out += buf;
  }
  return out;
}

} // namespace

const char *EventKindToString(EventKind kind) noexcept {
  switch (kind) {
  case EventKind::kWeight:
    return "weight";
  case EventKind::kIdentity:
    return "identity";
  case EventKind::kParams:
    return "params";
  }
  return "unknown";
}

ProtocolEngine::ProtocolEngine(EngineConfig config)
    : config_(config), weight_decoder_(config.binary_counts_per_gram) {}

std::vector<DecodedEvent> ProtocolEngine::Feed(const std::uint8_t *data,
                                               std::size_t size) {
  std::vector<DecodedEvent> events;
  if (data != nullptr && size != 0U) {
    buffer_.insert(buffer_.end(), data, data + size);
    stats_.bytes_fed += size;
  }

  const ScanResult scan = scanner_.Scan(buffer_);

  if (scan.skipped != 0U) {
    stats_.bytes_skipped += scan.skipped;
    if (config_.debug_dump_enabled)
      DumpThrottled_(buffer_.data(), scan.consumed, "resync");
  }

  events.reserve(scan.frames.size());
  for (const Frame &frame : scan.frames) {
    DecodedEvent event;
    if (!Dispatch_(frame, event))
      continue;

    if (config_.debug_dump_enabled)
      DumpThrottled_(frame.bytes.data(), frame.Size(), EventKindToString(event.kind));

    Deliver_(event);
    events.push_back(std::move(event));
  }

  // compaction: 소비한 앞부분 제거, tail 은 다음 Feed 에서 이어서 스캔
  buffer_.erase(buffer_.begin(),
                buffer_.begin() + static_cast<long>(scan.consumed));

  return events;
}

bool ProtocolEngine::Dispatch_(const Frame &frame, DecodedEvent &out) {
  out.address = frame.Address();
  out.function = frame.Function();
  out.reg = frame.Register();

  if (WeightDecoder::CanDecode(frame)) {
    out.kind = EventKind::kWeight;
    out.weight = weight_decoder_.Decode(frame);
    ++stats_.weight_frames;
    return true;
  }
  if (IdDecoder::CanDecode(frame)) {
    out.kind = EventKind::kIdentity;
    out.identity = IdDecoder::Decode(frame);
    ++stats_.id_frames;
    return true;
  }
  if (ParamDecoder::CanDecode(frame)) {
    out.kind = EventKind::kParams;
    out.params = ParamDecoder::Decode(frame);
    ++stats_.param_frames;
    return true;
  }
  return false;
}

ProtocolEngine::SubscriptionId ProtocolEngine::Subscribe(EventCallback callback) {
  const SubscriptionId id = next_subscription_id_++;
  subscribers_.emplace(id, std::move(callback));
  return id;
}

bool ProtocolEngine::Unsubscribe(SubscriptionId id) {
  return subscribers_.erase(id) != 0U;
}

void ProtocolEngine::Clear() noexcept { buffer_.clear(); }

void ProtocolEngine::Deliver_(const DecodedEvent &event) {
  // 콜백 안에서 Subscribe/Unsubscribe 할 수 있으므로 복사본으로 순회
  const auto subscribers = subscribers_;
  for (const auto &kv : subscribers) {
    if (!kv.second)
      continue;
    try {
      kv.second(event);
    } catch (const std::exception &e) {
      ++stats_.subscriber_errors;
      LogError_(std::string("subscriber ") + std::to_string(kv.first) +
                " threw: " + e.what());
    }
  }
}

void ProtocolEngine::DumpThrottled_(const std::uint8_t *data, std::size_t size,
                                    const char *tag) {
  const std::uint64_t now_ms = NowEpochMs();
  if (now_ms - last_dump_epoch_ms_ < kDumpIntervalMs) {
    ++dump_suppressed_;
    return;
  }

  std::cerr << "[" << kClassName << "][pid=" << ::getpid() << "] " << tag
            << " len=" << size << " : " << ToHex(data, size);
  if (dump_suppressed_ > 0)
    std::cerr << " (suppressed " << dump_suppressed_ << ")";
  std::cerr << std::endl;

  last_dump_epoch_ms_ = now_ms;
  dump_suppressed_ = 0;
}

void ProtocolEngine::LogError_(std::string_view message) const noexcept {
  std::cerr << "[" << kClassName << "][pid=" << ::getpid() << "] " << message
            << std::endl;
}

} // namespace loadcell_bus
