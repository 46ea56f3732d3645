#ifndef ZMQ_SUBSCRIBER_BYTES_H_
#define ZMQ_SUBSCRIBER_BYTES_H_

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <zmq.hpp>

namespace zmq_pub {

/**
 * @brief SUB 소켓으로 [topic][payload] 를 받아 수신 스레드에서 콜백을 호출한다.
 *
 * 명령 채널처럼 메시지량이 적은 용도이므로 별도 dispatch 큐를 두지 않는다.
 * on_message 는 수신 스레드에서 호출되므로 오래 블로킹하지 말 것.
 * on_error 가 false 를 반환하거나 등록되지 않았으면 수신을 멈춘다.
 */
class ZmqSubscriberBytes {
 public:
  using MessageCallback = std::function<void(std::vector<std::uint8_t>&& payload)>;
  using ErrorCallback = std::function<bool(const std::string& error_message)>;

  ZmqSubscriberBytes(zmq::context_t& context,
                     std::string endpoint,
                     std::string topic,
                     MessageCallback on_message,
                     ErrorCallback on_error = nullptr);
  ~ZmqSubscriberBytes() noexcept;

  ZmqSubscriberBytes(const ZmqSubscriberBytes&) = delete;
  ZmqSubscriberBytes& operator=(const ZmqSubscriberBytes&) = delete;

  /** @brief 수신 스레드 정지. 여러 번 호출해도 된다 */
  void Stop() noexcept;
  bool IsRunning() const noexcept { return !stop_requested_.load(); }

  const std::string& Endpoint() const noexcept { return endpoint_; }
  const std::string& Topic() const noexcept { return topic_; }

  /** @brief 상위 계층(역직렬화 실패 등)에서 on_error 정책을 적용할 때 사용 */
  bool ReportError(const std::string& error_message) noexcept;

 private:
  static constexpr std::string_view kClassName = "ZmqSubscriberBytes";

  void RecvLoop() noexcept;
  void Log(std::string_view message) const noexcept;

  zmq::socket_t socket_;
  std::string endpoint_;
  std::string topic_;
  MessageCallback on_message_;
  ErrorCallback on_error_;

  std::atomic<bool> stop_requested_{false};
  std::thread recv_thread_;
};

}  // namespace zmq_pub

#endif  // ZMQ_SUBSCRIBER_BYTES_H_
