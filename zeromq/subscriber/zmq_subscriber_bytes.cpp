#include "zmq_subscriber_bytes.h"

#include <exception>
#include <iostream>
#include <stdexcept>
#include <utility>

#include <unistd.h>

namespace zmq_pub {
namespace {

constexpr int kReceiveTimeoutMillis = 100;  // stop 요청 확인 주기

}  // namespace

ZmqSubscriberBytes::ZmqSubscriberBytes(zmq::context_t& context,
                                       std::string endpoint,
                                       std::string topic,
                                       MessageCallback on_message,
                                       ErrorCallback on_error)
    : socket_(context, zmq::socket_type::sub),
      endpoint_(std::move(endpoint)),
      topic_(std::move(topic)),
      on_message_(std::move(on_message)),
      on_error_(std::move(on_error)) {
  if (endpoint_.empty() || topic_.empty()) {
    Log("invalid argument: endpoint/topic must not be empty");
    throw std::invalid_argument("endpoint/topic must not be empty");
  }
  if (!on_message_) {
    Log("invalid argument: on_message callback is null");
    throw std::invalid_argument("on_message callback is null");
  }

  try {
    socket_.set(zmq::sockopt::rcvtimeo, kReceiveTimeoutMillis);
    socket_.set(zmq::sockopt::linger, 0);
    socket_.set(zmq::sockopt::subscribe, topic_);
    socket_.connect(endpoint_);
  } catch (const zmq::error_t& e) {
    Log(std::string("socket setup/connect failed: zmq_errno=") +
        std::to_string(e.num()) + " (" + e.what() + ")");
    throw;
  }

  recv_thread_ = std::thread([this]() { RecvLoop(); });
}

ZmqSubscriberBytes::~ZmqSubscriberBytes() noexcept {
  Stop();
  socket_.close();
}

void ZmqSubscriberBytes::Stop() noexcept {
  stop_requested_.store(true);

  // 콜백 안에서 Stop 한 경우 자기 자신은 join 하지 않는다
  if (recv_thread_.joinable() &&
      recv_thread_.get_id() != std::this_thread::get_id()) {
    recv_thread_.join();
  }
}

bool ZmqSubscriberBytes::ReportError(const std::string& error_message) noexcept {
  Log(error_message);
  if (!on_error_) {
    return false;
  }
  try {
    return on_error_(error_message);
  } catch (const std::exception& e) {
    Log(std::string("on_error callback threw: ") + e.what());
    return false;
  }
}

void ZmqSubscriberBytes::RecvLoop() noexcept {
  while (!stop_requested_.load()) {
    std::string error_message;
    try {
      zmq::message_t topic_frame;
      if (!socket_.recv(topic_frame, zmq::recv_flags::none)) {
        continue;  // timeout
      }

      zmq::message_t payload_frame;
      if (!topic_frame.more() ||
          !socket_.recv(payload_frame, zmq::recv_flags::none)) {
        error_message = "multipart message without payload frame";
      } else if (topic_frame.to_string_view() == topic_) {
        // subscribe 는 prefix 매칭이므로 정확히 일치하는 topic 만 전달
        const auto* begin = static_cast<const std::uint8_t*>(payload_frame.data());
        std::vector<std::uint8_t> payload(begin, begin + payload_frame.size());
        on_message_(std::move(payload));
      }
    } catch (const zmq::error_t& e) {
      error_message = std::string("recv failed: zmq_errno=") +
                      std::to_string(e.num()) + " (" + e.what() + ")";
    } catch (const std::exception& e) {
      error_message = std::string("on_message failed: ") + e.what();
    }

    if (!error_message.empty() && !ReportError(error_message)) {
      stop_requested_.store(true);
    }
  }
}

void ZmqSubscriberBytes::Log(std::string_view message) const noexcept {
  std::cerr << "[" << kClassName << "]"
            << "[endpoint=" << endpoint_ << "]"
            << "[topic=" << topic_ << "]"
            << "[pid=" << ::getpid() << "] " << message << std::endl;
}

}  // namespace zmq_pub
