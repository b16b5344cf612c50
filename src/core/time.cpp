#include "chronoid/core/time.h"

#include <iomanip>
#include <sstream>

namespace chronoid::core {

std::string format_iso8601(const Timestamp ts) {
  const auto day = std::chrono::floor<std::chrono::days>(ts);
  const std::chrono::year_month_day ymd{day};
  const std::chrono::hh_mm_ss<std::chrono::milliseconds> hms{ts - day};

  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(4) << static_cast<int>(ymd.year()) << '-' << std::setw(2)
      << static_cast<unsigned>(ymd.month()) << '-' << std::setw(2)
      << static_cast<unsigned>(ymd.day()) << 'T' << std::setw(2) << hms.hours().count() << ':'
      << std::setw(2) << hms.minutes().count() << ':' << std::setw(2) << hms.seconds().count()
      << '.' << std::setw(3) << hms.subseconds().count() << 'Z';
  return oss.str();
}

}  // namespace chronoid::core
