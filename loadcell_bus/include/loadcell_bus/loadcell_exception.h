#ifndef LOADCELL_BUS_LOADCELL_EXCEPTION_H_
#define LOADCELL_BUS_LOADCELL_EXCEPTION_H_

#include <exception>
#include <string>

#include "loadcell_status.h"

namespace loadcell_bus {
/**
 * @brief 호출자에게 노출되는 프로토콜 엔진 오류.
 * UnknownDevice, CalibrationTooCloseToZero, InvalidArgument 가 여기에 해당하며
 * 모두 복구 가능한 오류이다(프로세스를 종료시키지 않는다).
 */
class LoadCellException final : public std::exception {
public:
  LoadCellException(ResultCode code, std::string message);

  ResultCode Code() const noexcept;
  const char *what() const noexcept override;

private:
  ResultCode code_;
  std::string message_;
};
} // namespace loadcell_bus

#endif // LOADCELL_BUS_LOADCELL_EXCEPTION_H_
