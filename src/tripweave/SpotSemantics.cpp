#include "tripweave/SpotSemantics.hpp"

#include <algorithm>
#include <cctype>

namespace tripweave {

namespace {

std::string ToLowerAscii(const std::string& s)
{
  std::string out = s;
  for (char& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}

bool InList(const std::string& category, const char* const* list, std::size_t n)
{
  const std::string key = ToLowerAscii(category);
  return std::any_of(list, list + n, [&](const char* s) { return key == s; });
}

const char* const kOutdoor[] = {"outdoor", "beach", "park", "garden", "viewpoint", "zoo"};
const char* const kIndoor[] = {"indoor", "museum", "shopping", "temple", "gallery", "aquarium", "food"};

} // namespace

bool IsOutdoorCategory(const std::string& category)
{
  return InList(category, kOutdoor, sizeof(kOutdoor) / sizeof(kOutdoor[0]));
}

bool IsIndoorCategory(const std::string& category)
{
  return InList(category, kIndoor, sizeof(kIndoor) / sizeof(kIndoor[0]));
}

} // namespace tripweave
