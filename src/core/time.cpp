#include "uusid/core/time.h"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace uusid::core {

std::string format_iso8601(const std::int64_t unix_millis) {
  // Floor division so pre-1970 instants keep a non-negative millisecond part.
  std::int64_t seconds = unix_millis / 1000;
  std::int64_t millis = unix_millis % 1000;
  if (millis < 0) {
    millis += 1000;
    --seconds;
  }

  const auto time_t_value = static_cast<std::time_t>(seconds);
  std::tm utc{};
  gmtime_r(&time_t_value, &utc);

  std::ostringstream oss;
  oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
      << millis << 'Z';
  return oss.str();
}

}  // namespace uusid::core
