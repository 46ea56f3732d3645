#include "zmq_publisher_bytes.h"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace zmq_pub {
namespace {

constexpr std::string_view kIpcScheme = "ipc://";
constexpr int kLingerMillis = 0;
constexpr int kSendHighWaterMark = 3;
constexpr int kSendTimeoutMillis = 10;

bool IsIpc(const std::string& endpoint) {
  return endpoint.compare(0, kIpcScheme.size(), kIpcScheme) == 0;
}

std::string IpcPath(const std::string& endpoint) {
  return IsIpc(endpoint) ? endpoint.substr(kIpcScheme.size()) : std::string();
}

/** ipc 는 소켓 파일 옆에, tcp 등은 /tmp 아래 endpoint 문자열을 치환한 이름 */
std::string LockPathFor(const std::string& endpoint) {
  if (IsIpc(endpoint)) {
    return IpcPath(endpoint) + ".lock";
  }
  std::string name = endpoint;
  for (char& ch : name) {
    const bool keep = (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') ||
                      (ch >= '0' && ch <= '9') || ch == '-' || ch == '.';
    if (!keep) {
      ch = '_';
    }
  }
  return "/tmp/loadcell_bus_pub_" + name + ".lock";
}

std::string ErrnoText(int error_no) {
  return std::to_string(error_no) + " (" + std::strerror(error_no) + ")";
}

}  // namespace

ZmqPublisherBytes::ZmqPublisherBytes(zmq::context_t& context,
                                     std::string endpoint,
                                     std::string topic)
    : socket_(context, zmq::socket_type::pub),
      endpoint_(std::move(endpoint)),
      topic_(std::move(topic)) {
  if (endpoint_.empty() || topic_.empty()) {
    Log("invalid argument: endpoint/topic must not be empty");
    throw std::invalid_argument("endpoint/topic must not be empty");
  }
  if (IsIpc(endpoint_) && IpcPath(endpoint_).empty()) {
    Log("invalid ipc endpoint");
    throw std::invalid_argument("invalid ipc endpoint: " + endpoint_);
  }

  lock_path_ = LockPathFor(endpoint_);

  AcquireLockOrThrow();
  PrepareIpcPathOrThrow();
  BindOrThrow();
}

ZmqPublisherBytes::~ZmqPublisherBytes() noexcept {
  socket_.close();

  if (lock_fd_ >= 0) {
    if (::close(lock_fd_) != 0) {
      Log("lock fd close failed (ignored)");
    }
    lock_fd_ = -1;
  }
}

void ZmqPublisherBytes::PublishBytes(const void* payload_data,
                                     std::size_t payload_size) {
  if (payload_data == nullptr && payload_size != 0U) {
    Log("PublishBytes: payload_data is null");
    throw std::invalid_argument("payload_data is null");
  }

  try {
    zmq::message_t topic_frame(topic_.data(), topic_.size());
    zmq::message_t payload_frame(payload_data, payload_size);

    if (!socket_.send(topic_frame, zmq::send_flags::sndmore) ||
        !socket_.send(payload_frame, zmq::send_flags::none)) {
      // sndtimeo 초과: 구독자가 느림. 이번 메시지는 버린다
      Log("send timed out, message dropped");
    }
  } catch (const zmq::error_t& e) {
    Log(std::string("send failed: zmq_errno=") + std::to_string(e.num()) + " (" +
        e.what() + ")");
    throw;
  }
}

void ZmqPublisherBytes::AcquireLockOrThrow() {
  std::error_code ec;
  const std::filesystem::path parent = std::filesystem::path(lock_path_).parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      Log("create_directories(" + parent.string() + ") failed: " + ec.message());
      throw std::runtime_error("create_directories failed");
    }
  }

  lock_fd_ = ::open(lock_path_.c_str(), O_RDWR | O_CREAT, 0644);
  if (lock_fd_ < 0) {
    Log("open(lock) failed: path=" + lock_path_ + ", errno=" + ErrnoText(errno));
    throw std::runtime_error("open(lock) failed");
  }

  if (::flock(lock_fd_, LOCK_EX | LOCK_NB) != 0) {
    Log("flock failed (already running?): path=" + lock_path_ +
        ", errno=" + ErrnoText(errno));
    ::close(lock_fd_);
    lock_fd_ = -1;
    throw std::runtime_error("duplicate execution detected by flock");
  }
}

void ZmqPublisherBytes::PrepareIpcPathOrThrow() {
  if (!IsIpc(endpoint_)) {
    return;
  }

  // lock 을 잡은 뒤이므로 남아 있는 소켓 파일은 이전 실행의 잔재
  const std::string path = IpcPath(endpoint_);
  if (::unlink(path.c_str()) != 0 && errno != ENOENT) {
    Log("unlink(" + path + ") failed: errno=" + ErrnoText(errno));
    throw std::runtime_error("unlink(ipc socket) failed");
  }
}

void ZmqPublisherBytes::BindOrThrow() {
  try {
    socket_.set(zmq::sockopt::linger, kLingerMillis);
    socket_.set(zmq::sockopt::sndhwm, kSendHighWaterMark);
    socket_.set(zmq::sockopt::sndtimeo, kSendTimeoutMillis);
    socket_.bind(endpoint_);
  } catch (const zmq::error_t& e) {
    Log(std::string("socket setup/bind failed: zmq_errno=") +
        std::to_string(e.num()) + " (" + e.what() + ")");
    throw;
  }
}

void ZmqPublisherBytes::Log(std::string_view message) const noexcept {
  std::cerr << "[" << kClassName << "]"
            << "[endpoint=" << endpoint_ << "]"
            << "[topic=" << topic_ << "]"
            << "[pid=" << ::getpid() << "] " << message << std::endl;
}

}  // namespace zmq_pub
