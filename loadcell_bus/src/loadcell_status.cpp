#include "loadcell_bus/loadcell_status.h"

namespace loadcell_bus {

const char *ResultCodeToString(ResultCode code) noexcept {
  switch (code) {
  case ResultCode::kOk:
    return "OK";
  case ResultCode::kNoFrame:
    return "NO_FRAME";
  case ResultCode::kIoReadFail:
    return "IO_READ_FAIL";
  case ResultCode::kIoWriteFail:
    return "IO_WRITE_FAIL";
  case ResultCode::kNotOpen:
    return "NOT_OPEN";
  case ResultCode::kTimeout:
    return "TIMEOUT";
  case ResultCode::kUnknownDevice:
    return "UNKNOWN_DEVICE";
  case ResultCode::kCalibrationTooCloseToZero:
    return "CALIBRATION_TOO_CLOSE_TO_ZERO";
  case ResultCode::kInvalidArgument:
    return "INVALID_ARGUMENT";
  }
  return "UNKNOWN";
}

StatusFlags DecodeStatusFlags(std::uint8_t status) noexcept {
  StatusFlags flags;
  flags.zero_error = (status & 0x01) != 0;
  flags.error = (status & 0x02) != 0;
  flags.overload = (status & 0x04) != 0;
  flags.zero_adjusted = (status & 0x08) != 0;
  flags.calibration_needed = (status & 0x10) != 0;
  return flags;
}

} // namespace loadcell_bus
