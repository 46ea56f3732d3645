#include "unique_key_generator.h"

#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>

namespace sensor_driver_uk {

std::string FormatUtcIso8601(const std::chrono::system_clock::time_point& time_point) {
  using namespace std::chrono;

  const auto since_epoch_ms = duration_cast<milliseconds>(time_point.time_since_epoch()).count();
  const std::time_t seconds = system_clock::to_time_t(time_point);

  std::tm utc{};
  gmtime_r(&seconds, &utc);

  std::ostringstream out;
  out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << static_cast<int>(since_epoch_ms % 1000) << 'Z';
  return out.str();
}

std::string RandomHex(std::size_t digits) {
  static constexpr char kHexDigits[] = "0123456789abcdef";

  std::random_device seed;
  std::mt19937_64 engine(seed());
  std::uniform_int_distribution<int> nibble(0, 15);

  std::string out(digits, '0');
  for (char& ch : out) {
    ch = kHexDigits[nibble(engine)];
  }
  return out;
}

std::string GenerateInstanceID(const std::string& sensor_id) {
  return sensor_id + "/" + FormatUtcIso8601(std::chrono::system_clock::now()) + "/" + RandomHex(16);
}

}  // namespace sensor_driver_uk
