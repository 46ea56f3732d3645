#ifndef ZMQ_SUBSCRIBER_MSGPACK_HPP_
#define ZMQ_SUBSCRIBER_MSGPACK_HPP_

#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <msgpack.hpp>

#include "zmq_subscriber_bytes.h"

namespace zmq_pub {

/**
 * @brief 수신 payload 를 T 로 역직렬화해 전달하는 구독자.
 *
 * ZmqSubscriberBytes 의 수신 스레드에서 payload 를 받아 msgpack 으로 풀고
 * on_message 콜백에 넘긴다. 인스턴스 하나가 endpoint(connect) 하나, topic 하나, 타입 T 하나를 담당한다.
 *
 * 오류 정책(역직렬화 실패, 콜백 예외, 소켓 오류 공통):
 *  - on_error 가 true 반환 → 다음 메시지 계속
 *  - false 반환 또는 on_error 미등록 → 구독 중지
 *
 * @tparam T msgpack 역직렬화 가능한 타입 (BusCommand, BusSnapshot 등).
 */
template <typename T>
class MsgPackSubscriber {
 public:
  /**
   * @brief 역직렬화된 메시지 콜백. 수신 스레드에서 호출된다.
   */
  using MessageCallback = std::function<void(T&& message)>;

  /**
   * @brief 오류 콜백. true 면 계속, false 면 중지.
   * @note 수신 스레드에서 호출되므로 예외를 던지지 않는 것이 좋다.
   */
  using ErrorCallback = ZmqSubscriberBytes::ErrorCallback;

  /**
   * @brief 하위 bytes subscriber 를 만들어 connect 하고 수신 스레드를 시작한다.
   * @param context ZMQ 컨텍스트(외부 소유).
   * @param endpoint connect 할 endpoint.
   * @param topic 구독 topic (prefix 일치).
   * @param on_message 메시지 콜백(필수).
   * @param on_error 오류 콜백(선택). 없으면 첫 오류에서 중지.
   * @throw std::invalid_argument on_message 가 비어 있을 때. 이미 시작된 수신 스레드는 멈춘 뒤 던진다.
   * @throw std::invalid_argument endpoint/topic 이 비어 있을 때(하위 subscriber).
   * @throw zmq::error_t connect 실패 시.
   */
  MsgPackSubscriber(zmq::context_t& context,
                    std::string endpoint,
                    std::string topic,
                    MessageCallback on_message,
                    ErrorCallback on_error = nullptr)
      : on_message_(std::move(on_message)),
        subscriber_(context,
                    std::move(endpoint),
                    std::move(topic),
                    [this](std::vector<std::uint8_t>&& payload) {
                      OnPayload(payload);
                    },
                    std::move(on_error)) {
    if (!on_message_) {
      subscriber_.Stop();
      throw std::invalid_argument("on_message callback is null");
    }
  }

  MsgPackSubscriber(const MsgPackSubscriber&) = delete;
  MsgPackSubscriber& operator=(const MsgPackSubscriber&) = delete;

  /**
   * @brief 수신 스레드를 멈춘다. 반환 후에는 콜백이 호출되지 않는다. 여러 번 호출해도 된다.
   */
  void Stop() noexcept { subscriber_.Stop(); }

  /** @brief connect 한 endpoint */
  const std::string& Endpoint() const noexcept { return subscriber_.Endpoint(); }
  /** @brief 구독 topic */
  const std::string& Topic() const noexcept { return subscriber_.Topic(); }

 private:
  /**
   * @brief payload 한 건 처리: 역직렬화 후 on_message_ 호출.
   * 역직렬화 실패는 ReportError(on_error 정책) 로 넘기고, 중지 판정이면 Stop 한다.
   * @param payload topic frame 을 뺀 bytes.
   */
  void OnPayload(const std::vector<std::uint8_t>& payload) {
    T message;
    try {
      msgpack::object_handle handle = msgpack::unpack(
          reinterpret_cast<const char*>(payload.data()), payload.size());
      message = handle.get().as<T>();
    } catch (const std::exception& e) {
      if (!subscriber_.ReportError(std::string("msgpack deserialize failed: ") + e.what())) {
        subscriber_.Stop();
      }
      return;
    }
    // on_message_ 예외는 ZmqSubscriberBytes 가 on_error 정책으로 처리
    on_message_(std::move(message));
  }

  MessageCallback on_message_;   ///< subscriber_ 보다 먼저 초기화되어야 함
  ZmqSubscriberBytes subscriber_; ///< 소켓, 수신 스레드 소유
};

}  // namespace zmq_pub

#endif  // ZMQ_SUBSCRIBER_MSGPACK_HPP_
