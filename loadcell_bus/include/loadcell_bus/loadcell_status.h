#ifndef LOADCELL_BUS_LOADCELL_STATUS_H_
#define LOADCELL_BUS_LOADCELL_STATUS_H_

#include <cstdint>

namespace loadcell_bus {

/**
 * @brief 버스/레지스트리/코덱 동작 결과 코드.
 * 전송 계층(SerialPort, LoadCellBus)은 이 값을 반환하고,
 * 호출자에게 노출되는 오류(UnknownDevice 등)는 LoadCellException 에 실려 throw 된다.
 */
enum class ResultCode {
  kOk = 0,
  kNoFrame = 1,
  kIoReadFail = 2,
  kIoWriteFail = 3,
  kNotOpen = 4,
  kTimeout = 5,
  kUnknownDevice = 6,
  kCalibrationTooCloseToZero = 7,
  kInvalidArgument = 8
};

const char *ResultCodeToString(ResultCode code) noexcept;

/**
 * @brief 응답 프레임 status 바이트(offset 3)의 비트 플래그.
 */
struct StatusFlags {
  bool zero_error = false;         // bit0
  bool error = false;              // bit1
  bool overload = false;           // bit2
  bool zero_adjusted = false;      // bit3
  bool calibration_needed = false; // bit4
};

StatusFlags DecodeStatusFlags(std::uint8_t status) noexcept;

} // namespace loadcell_bus

#endif // LOADCELL_BUS_LOADCELL_STATUS_H_
