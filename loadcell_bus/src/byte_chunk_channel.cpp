#include "loadcell_bus/byte_chunk_channel.h"

#include <utility>

#include "loadcell_bus/loadcell_exception.h"

namespace loadcell_bus {

ByteChunkChannel::ByteChunkChannel(std::size_t capacity) : capacity_(capacity) {
  if (capacity_ == 0) {
    throw LoadCellException(ResultCode::kInvalidArgument,
                            "channel capacity must be >= 1");
  }
}

bool ByteChunkChannel::Push(Bytes chunk) {
  if (chunk.empty())
    return false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_)
      return false;

    while (queue_.size() >= capacity_) {
      queue_.pop_front();
      ++dropped_;
    }
    queue_.push_back(std::move(chunk));
  }
  cv_.notify_one();
  return true;
}

bool ByteChunkChannel::Pop(Bytes &out, std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); });
  if (queue_.empty())
    return false;

  out = std::move(queue_.front());
  queue_.pop_front();
  return true;
}

bool ByteChunkChannel::TryPop(Bytes &out) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (queue_.empty())
    return false;

  out = std::move(queue_.front());
  queue_.pop_front();
  return true;
}

void ByteChunkChannel::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  queue_.clear();
}

void ByteChunkChannel::Close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

void ByteChunkChannel::Reopen() {
  std::lock_guard<std::mutex> lock(mutex_);
  closed_ = false;
}

bool ByteChunkChannel::IsClosed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

std::size_t ByteChunkChannel::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

std::uint64_t ByteChunkChannel::DroppedChunks() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return dropped_;
}

} // namespace loadcell_bus
