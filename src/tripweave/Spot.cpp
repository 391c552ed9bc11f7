#include "tripweave/Spot.hpp"

#include <cmath>
#include <cstdio>

namespace tripweave {

bool ParseClockMinutes(const std::string& s, int* outMinutes)
{
  if (!outMinutes) return false;

  // H:MM or HH:MM, 24h clock. "24:00" is accepted as end of day.
  const std::size_t colon = s.find(':');
  if (colon == std::string::npos || colon == 0 || colon > 2 || s.size() != colon + 3) return false;

  int h = 0;
  for (std::size_t i = 0; i < colon; ++i) {
    if (s[i] < '0' || s[i] > '9') return false;
    h = h * 10 + (s[i] - '0');
  }
  int m = 0;
  for (std::size_t i = colon + 1; i < s.size(); ++i) {
    if (s[i] < '0' || s[i] > '9') return false;
    m = m * 10 + (s[i] - '0');
  }

  if (m > 59) return false;
  if (h > 24 || (h == 24 && m != 0)) return false;
  *outMinutes = h * 60 + m;
  return true;
}

std::string FormatClockMinutes(double minutes)
{
  if (!std::isfinite(minutes) || minutes < 0.0) minutes = 0.0;
  const long total = std::lround(minutes);
  const long h = total / 60;
  const long m = total % 60;

  char buf[32];
  std::snprintf(buf, sizeof(buf), "%02ld:%02ld", h, m);
  return std::string(buf);
}

} // namespace tripweave
