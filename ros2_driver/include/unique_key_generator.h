#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace sensor_driver_uk {

/**
 * @brief publish 시퀀스 번호.
 * publish 결과(OK/EMPTY/ERROR)와 무관하게 publish 시도마다 1 증가한다.
 */
class GenSeqNo {
 public:
  std::uint64_t Current() const noexcept { return seq_no_; }
  void Increment() noexcept { ++seq_no_; }

 private:
  std::uint64_t seq_no_ = 0;
};

/** @brief "YYYY-MM-DDTHH:MM:SS.mmmZ" (UTC) */
std::string FormatUtcIso8601(const std::chrono::system_clock::time_point& time_point);

/** @brief 소문자 16진수 난수 문자열 */
std::string RandomHex(std::size_t digits);

/**
 * @brief 드라이버 인스턴스 ID: "<sensor_id>/<시작시각 UTC>/<난수 16자리>".
 * 같은 sensor_id 로 재시작해도 구분된다.
 */
std::string GenerateInstanceID(const std::string& sensor_id);

}  // namespace sensor_driver_uk
