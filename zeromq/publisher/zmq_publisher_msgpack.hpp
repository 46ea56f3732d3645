#ifndef ZMQ_PUBLISHER_MSGPACK_HPP_
#define ZMQ_PUBLISHER_MSGPACK_HPP_

#include <exception>
#include <iostream>
#include <string>
#include <utility>

#include <unistd.h>
#include <msgpack.hpp>

#include "zmq_publisher_bytes.h"

namespace zmq_pub {

/**
 * @brief MSGPACK_DEFINE 된 T 를 직렬화해 ZmqPublisherBytes 로 발행한다.
 * 인스턴스 하나가 endpoint(bind) 하나, topic 하나, payload 타입 T 하나를 담당한다.
 * 직렬화 실패는 여기서 stderr 로그 후 재전파하고, 전송/소켓 오류는 하위 ZmqPublisherBytes 가 처리한다.
 * @tparam T msgpack 직렬화 가능한 타입 (loadcell_bus_data_type.h 의 BusSnapshot 등).
 */
template <typename T>
class MsgPackPublisher {
 public:
  /**
   * @brief 하위 bytes publisher 를 만들어 endpoint 에 bind 한다.
   * @param context ZMQ 컨텍스트(외부 소유, 이 객체보다 오래 살아야 함).
   * @param endpoint bind 할 endpoint (ipc:// 또는 tcp://).
   * @param topic 모든 메시지 앞에 붙는 topic frame.
   * @throw std::invalid_argument endpoint/topic 이 비었거나 ipc 경로가 잘못된 경우.
   * @throw std::runtime_error 같은 endpoint 로 이미 실행 중인 프로세스가 있을 때(flock).
   * @throw zmq::error_t bind 실패 시.
   */
  MsgPackPublisher(zmq::context_t& context, std::string endpoint, std::string topic)
      : publisher_(context, std::move(endpoint), std::move(topic)) {}

  MsgPackPublisher(const MsgPackPublisher&) = delete;
  MsgPackPublisher& operator=(const MsgPackPublisher&) = delete;

  /**
   * @brief payload 를 msgpack 으로 직렬화한 뒤 [topic][bytes] 로 전송한다.
   * 직렬화 버퍼(buffer_)는 호출마다 재사용하므로 동시 호출은 허용하지 않는다.
   * @param payload 전송할 값.
   * @throw std::exception 직렬화 실패 시 "[MsgPackPublisher][endpoint=..][topic=..][pid=..]" 로그 후 재전파.
   * @throw zmq::error_t 전송 실패 시 하위 publisher 에서 전파.
   */
  void Publish(const T& payload) {
    buffer_.clear();
    try {
      msgpack::pack(buffer_, payload);
    } catch (const std::exception& e) {
      std::cerr << "[MsgPackPublisher]"
                << "[endpoint=" << publisher_.Endpoint() << "]"
                << "[topic=" << publisher_.Topic() << "]"
                << "[pid=" << ::getpid() << "] "
                << "msgpack serialize failed: " << e.what() << std::endl;
      throw;
    }
    publisher_.PublishBytes(buffer_.data(), buffer_.size());
  }

  /** @brief bind 된 endpoint */
  const std::string& Endpoint() const noexcept { return publisher_.Endpoint(); }
  /** @brief 발행 topic */
  const std::string& Topic() const noexcept { return publisher_.Topic(); }

 private:
  ZmqPublisherBytes publisher_; ///< 소켓 소유, send 직렬화
  msgpack::sbuffer buffer_; ///< Publish 마다 재사용
};

}  // namespace zmq_pub

#endif  // ZMQ_PUBLISHER_MSGPACK_HPP_
