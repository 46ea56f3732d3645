#include "loadcell_bus/loadcell_exception.h"

#include <utility>

namespace loadcell_bus {

LoadCellException::LoadCellException(ResultCode code, std::string message)
    : code_(code) {
  message_.reserve(message.size() + 32);
  message_ += "[";
  message_ += ResultCodeToString(code);
  message_ += "] ";
  message_ += std::move(message);
}

ResultCode LoadCellException::Code() const noexcept { return code_; }

const char *LoadCellException::what() const noexcept {
  return message_.c_str();
}

} // namespace loadcell_bus
