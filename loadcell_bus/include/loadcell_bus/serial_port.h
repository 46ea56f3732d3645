#ifndef LOADCELL_BUS_SERIAL_PORT_H_
#define LOADCELL_BUS_SERIAL_PORT_H_

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>

#include "SerialConfig.h"

namespace loadcell_bus {

/**
 * @brief POSIX termios 기반 RS-485(USB 변환기) 시리얼 포트.
 *
 * raw 모드로 열며 VMIN/VTIME 으로 read 블로킹 시간을 제한한다.
 * reader 스레드의 Read() 와 송신 측 Write() 는 서로 다른 스레드에서
 * 호출될 수 있다. Open/Close 는 reader 스레드가 정지된 상태에서만 호출할 것.
 */
class SerialPort {
public:
  SerialPort() = default;
  ~SerialPort();

  SerialPort(const SerialPort &) = delete;
  SerialPort &operator=(const SerialPort &) = delete;

  bool Open(const SerialConfig &cfg);
  /** @brief 마지막으로 사용한 설정으로 다시 연다 */
  bool Open();
  void Close() noexcept;
  bool IsOpen() const noexcept { return fd_ >= 0; }

  /**
   * @return 읽은 바이트 수(0: timeout), 실패 시 -1
   */
  long Read(std::uint8_t *buf, std::size_t len);

  /**
   * @brief len 바이트를 모두 쓴다(EINTR/EAGAIN 재시도).
   * @return 쓴 바이트 수, 실패 시 -1
   */
  long Write(const std::uint8_t *data, std::size_t len);

  /** @brief 커널 수신 버퍼의 미처리 바이트 폐기 */
  bool Flush();

  std::string LastError() const;
  const SerialConfig &Config() const noexcept { return config_; }

private:
  bool Configure_();
  void SetLastError_(std::string message);

  int fd_ = -1;
  SerialConfig config_;
  bool has_config_ = false;

  mutable std::mutex error_mutex_;
  std::string last_error_;
};

} // namespace loadcell_bus

#endif // LOADCELL_BUS_SERIAL_PORT_H_
