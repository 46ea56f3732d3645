#include "loadcell_bus/serial_port.h"

#include <cerrno>
#include <cstring>
#include <thread>
#include <utility>

#include <fcntl.h>
#include <termios.h>
#include <unistd.h>

namespace loadcell_bus {

namespace {

constexpr int kMaxWriteRetries = 50;

bool BaudToSpeed(int baud, speed_t &out) noexcept {
  switch (baud) {
  case 9600:
    out = B9600;
    return true;
  case 19200:
    out = B19200;
    return true;
  case 38400:
    out = B38400;
    return true;
  case 57600:
    out = B57600;
    return true;
  case 115200:
    out = B115200;
    return true;
  case 230400:
    out = B230400;
    return true;
  default:
    return false;
  }
}

std::string ErrnoMessage(const char *what, int error_no) {
  return std::string(what) + " failed: errno=" + std::to_string(error_no) +
         " (" + std::strerror(error_no) + ")";
}

} // namespace

SerialPort::~SerialPort() { Close(); }

bool SerialPort::Open(const SerialConfig &cfg) {
  config_ = cfg;
  has_config_ = true;
  return Open();
}

bool SerialPort::Open() {
  if (!has_config_) {
    SetLastError_("open: no serial config");
    return false;
  }
  Close();

  fd_ = ::open(config_.device.c_str(), O_RDWR | O_NOCTTY);
  if (fd_ < 0) {
    SetLastError_(ErrnoMessage(("open(" + config_.device + ")").c_str(), errno));
    return false;
  }

  if (!Configure_()) {
    Close();
    return false;
  }
  return true;
}

void SerialPort::Close() noexcept {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

bool SerialPort::Configure_() {
  struct termios tio;
  std::memset(&tio, 0, sizeof(tio));

  if (::tcgetattr(fd_, &tio) != 0) {
    SetLastError_(ErrnoMessage("tcgetattr", errno));
    return false;
  }

  // raw mode
  tio.c_iflag &= static_cast<tcflag_t>(~(IGNBRK | BRKINT | PARMRK | ISTRIP |
                                         INLCR | IGNCR | ICRNL | IXON | IXOFF |
                                         IXANY));
  tio.c_oflag &= static_cast<tcflag_t>(~OPOST);
  tio.c_lflag &= static_cast<tcflag_t>(~(ECHO | ECHONL | ICANON | ISIG | IEXTEN));
  tio.c_cflag &= static_cast<tcflag_t>(~(CSIZE | PARENB | PARODD | CSTOPB));
  tio.c_cflag |= static_cast<tcflag_t>(CLOCAL | CREAD);

  switch (config_.data_bits) {
  case 5:
    tio.c_cflag |= CS5;
    break;
  case 6:
    tio.c_cflag |= CS6;
    break;
  case 7:
    tio.c_cflag |= CS7;
    break;
  default:
    tio.c_cflag |= CS8;
    break;
  }

  if (config_.parity == 'O' || config_.parity == 'o') {
    tio.c_cflag |= static_cast<tcflag_t>(PARENB | PARODD);
  } else if (config_.parity == 'E' || config_.parity == 'e') {
    tio.c_cflag |= PARENB;
  }

  if (config_.stop_bits == 2)
    tio.c_cflag |= CSTOPB;

#ifdef CRTSCTS
  if (config_.rtscts)
    tio.c_cflag |= CRTSCTS;
  else
    tio.c_cflag &= static_cast<tcflag_t>(~CRTSCTS);
#endif
  if (config_.xonxoff)
    tio.c_iflag |= static_cast<tcflag_t>(IXON | IXOFF);

  tio.c_cc[VMIN] = config_.vmin;
  tio.c_cc[VTIME] = config_.vtime_ds;

  speed_t speed = B115200;
  if (!BaudToSpeed(config_.baudrate, speed)) {
    SetLastError_("unsupported baudrate: " + std::to_string(config_.baudrate));
    return false;
  }
  ::cfsetispeed(&tio, speed);
  ::cfsetospeed(&tio, speed);

  if (::tcsetattr(fd_, TCSANOW, &tio) != 0) {
    SetLastError_(ErrnoMessage("tcsetattr", errno));
    return false;
  }

  ::tcflush(fd_, TCIOFLUSH);
  return true;
}

long SerialPort::Read(std::uint8_t *buf, std::size_t len) {
  if (fd_ < 0) {
    SetLastError_("read: port not open");
    return -1;
  }

  const ssize_t n = ::read(fd_, buf, len);
  if (n < 0) {
    const int error_no = errno;
    if (error_no == EINTR || error_no == EAGAIN)
      return 0;
    SetLastError_(ErrnoMessage("read", error_no));
    return -1;
  }
  return static_cast<long>(n);
}

long SerialPort::Write(const std::uint8_t *data, std::size_t len) {
  if (fd_ < 0) {
    SetLastError_("write: port not open");
    return -1;
  }

  std::size_t written = 0;
  int retries = 0;
  while (written < len) {
    const ssize_t n = ::write(fd_, data + written, len - written);
    if (n < 0) {
      const int error_no = errno;
      if ((error_no == EINTR || error_no == EAGAIN) &&
          ++retries <= kMaxWriteRetries) {
        std::this_thread::yield();
        continue;
      }
      SetLastError_(ErrnoMessage("write", error_no));
      return -1;
    }
    written += static_cast<std::size_t>(n);
  }

  // RS-485 반이중: 송신 완료 후 응답 수신
  ::tcdrain(fd_);
  return static_cast<long>(written);
}

bool SerialPort::Flush() {
  if (fd_ < 0)
    return false;
  if (::tcflush(fd_, TCIFLUSH) != 0) {
    SetLastError_(ErrnoMessage("tcflush", errno));
    return false;
  }
  return true;
}

std::string SerialPort::LastError() const {
  std::lock_guard<std::mutex> lock(error_mutex_);
  return last_error_;
}

void SerialPort::SetLastError_(std::string message) {
  std::lock_guard<std::mutex> lock(error_mutex_);
  last_error_ = std::move(message);
}

} // namespace loadcell_bus
