#include "snotes/core/time.h"

#include <iomanip>
#include <sstream>

namespace snotes::core {

std::string format_iso8601(const Timestamp ts) {
  using namespace std::chrono;

  const auto day_start = floor<days>(ts);
  const year_month_day ymd{day_start};
  const hh_mm_ss<milliseconds> tod{ts - day_start};

  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(4) << static_cast<int>(ymd.year()) << '-' << std::setw(2)
      << static_cast<unsigned>(ymd.month()) << '-' << std::setw(2)
      << static_cast<unsigned>(ymd.day()) << 'T' << std::setw(2) << tod.hours().count() << ':'
      << std::setw(2) << tod.minutes().count() << ':' << std::setw(2) << tod.seconds().count()
      << '.' << std::setw(3) << tod.subseconds().count() << 'Z';
  return oss.str();
}

}  // namespace snotes::core
