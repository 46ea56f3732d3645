#ifndef LOADCELL_BUS_BYTE_CHUNK_CHANNEL_H_
#define LOADCELL_BUS_BYTE_CHUNK_CHANNEL_H_

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>

#include "frame_codec.h"

namespace loadcell_bus {

/**
 * @brief reader 스레드 -> consumer 로 수신 바이트 덩어리를 넘기는 bounded 큐.
 * 가득 차면 가장 오래된 chunk 를 버린다(drop-oldest).
 */
class ByteChunkChannel {
public:
  explicit ByteChunkChannel(std::size_t capacity = 64);

  ByteChunkChannel(const ByteChunkChannel &) = delete;
  ByteChunkChannel &operator=(const ByteChunkChannel &) = delete;

  /**
   * @return false: 닫힌 채널이거나 빈 chunk (무시됨)
   */
  bool Push(Bytes chunk);

  /**
   * @brief timeout 동안 chunk 를 기다린다.
   * @return false: timeout 또는 닫힌 채널이 비어 있음
   */
  bool Pop(Bytes &out, std::chrono::milliseconds timeout);
  bool TryPop(Bytes &out);

  void Clear();
  /** @brief 대기 중인 Pop 을 깨우고 이후 Push 를 거부한다 */
  void Close();
  /** @brief Close 이후 재사용 */
  void Reopen();

  bool IsClosed() const;
  std::size_t Size() const;
  std::size_t Capacity() const noexcept { return capacity_; }
  std::uint64_t DroppedChunks() const;

private:
  const std::size_t capacity_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<Bytes> queue_;
  bool closed_ = false;
  std::uint64_t dropped_ = 0;
};

} // namespace loadcell_bus

#endif // LOADCELL_BUS_BYTE_CHUNK_CHANNEL_H_
