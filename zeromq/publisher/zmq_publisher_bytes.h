#ifndef ZMQ_PUBLISHER_BYTES_H_
#define ZMQ_PUBLISHER_BYTES_H_

#include <cstddef>
#include <string>
#include <string_view>

#include <zmq.hpp>

namespace zmq_pub {

/**
 * @brief [topic][payload] 2-frame 멀티파트로 바이트를 발행하는 PUB 소켓.
 *
 * 생성 시 endpoint 별 lock 파일에 flock 을 걸어 같은 endpoint 로 드라이버가
 * 두 번 실행되는 것을 막는다. ipc:// endpoint 는 디렉터리를 만들고 이전
 * 실행이 남긴 소켓 파일을 지운 뒤 bind 한다.
 *
 * @throw std::runtime_error / zmq::error_t 초기화/송신 실패
 */
class ZmqPublisherBytes {
 public:
  ZmqPublisherBytes(zmq::context_t& context, std::string endpoint, std::string topic);
  ~ZmqPublisherBytes() noexcept;

  ZmqPublisherBytes(const ZmqPublisherBytes&) = delete;
  ZmqPublisherBytes& operator=(const ZmqPublisherBytes&) = delete;

  /** @brief payload 를 복사해 송신한다. 수신자가 없거나 HWM 초과 시 drop 될 수 있다 */
  void PublishBytes(const void* payload_data, std::size_t payload_size);

  const std::string& Endpoint() const noexcept { return endpoint_; }
  const std::string& Topic() const noexcept { return topic_; }

 private:
  static constexpr std::string_view kClassName = "ZmqPublisherBytes";

  void AcquireLockOrThrow();
  void PrepareIpcPathOrThrow();
  void BindOrThrow();

  void Log(std::string_view message) const noexcept;

  zmq::socket_t socket_;
  std::string endpoint_;
  std::string topic_;

  int lock_fd_ = -1;
  std::string lock_path_;
};

}  // namespace zmq_pub

#endif  // ZMQ_PUBLISHER_BYTES_H_
