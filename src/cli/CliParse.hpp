#pragma once

// Strict argument parsing shared by the tripweave command-line tools.
//
// Every parser rejects leading/trailing junk and leaves *out untouched on
// failure.

#include <cctype>
#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace tripweave::cli {

inline bool EnsureParentDir(const std::filesystem::path& file)
{
  if (file.empty()) return false;
  std::error_code ec;
  const std::filesystem::path parent = file.parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
    if (ec) return false;
  }
  return true;
}

inline bool ParseI32(std::string_view s, int* out)
{
  if (!out) return false;
  if (!s.empty() && s.front() == '+') s.remove_prefix(1);
  if (s.empty()) return false;

  int v = 0;
  const char* end = s.data() + s.size();
  const auto res = std::from_chars(s.data(), end, v, 10);
  if (res.ec != std::errc() || res.ptr != end) return false;
  *out = v;
  return true;
}

// Decimal or 0x-prefixed hex.
inline bool ParseU64(std::string_view s, std::uint64_t* out)
{
  if (!out) return false;
  if (!s.empty() && s.front() == '+') s.remove_prefix(1);

  int base = 10;
  if (s.size() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
    base = 16;
    s.remove_prefix(2);
  }
  if (s.empty()) return false;

  std::uint64_t v = 0;
  const char* end = s.data() + s.size();
  const auto res = std::from_chars(s.data(), end, v, base);
  if (res.ec != std::errc() || res.ptr != end) return false;
  *out = v;
  return true;
}

// Finite values only.
inline bool ParseF64(std::string_view s, double* out)
{
  if (!out || s.empty()) return false;
  if (std::isspace(static_cast<unsigned char>(s.front()))) return false;

  const std::string tmp(s);
  char* end = nullptr;
  errno = 0;
  const double v = std::strtod(tmp.c_str(), &end);
  if (errno != 0 || !end || *end != '\0') return false;
  if (!std::isfinite(v)) return false;
  *out = v;
  return true;
}

inline bool ParseBool01(std::string_view s, bool* out)
{
  if (!out) return false;
  std::string k(s);
  for (char& c : k) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (k == "0" || k == "false" || k == "off" || k == "no") {
    *out = false;
    return true;
  }
  if (k == "1" || k == "true" || k == "on" || k == "yes") {
    *out = true;
    return true;
  }
  return false;
}

// "HH:MM" or plain minutes after midnight, within [0, 1440).
inline bool ParseDayMinute(std::string_view s, double* out)
{
  if (!out) return false;
  const std::size_t colon = s.find(':');
  double v = 0.0;
  if (colon == std::string_view::npos) {
    if (!ParseF64(s, &v)) return false;
  } else {
    int h = 0;
    int m = 0;
    if (colon == 0 || s.size() - colon != 3) return false;
    if (!ParseI32(s.substr(0, colon), &h) || !ParseI32(s.substr(colon + 1), &m)) return false;
    if (h < 0 || m < 0 || m > 59) return false;
    v = h * 60.0 + m;
  }
  if (v < 0.0 || v >= 24.0 * 60.0) return false;
  *out = v;
  return true;
}

// "2,3, 5" -> {"2","3","5"}. Empty items are dropped.
inline std::vector<std::string> SplitCommaList(std::string_view s)
{
  std::vector<std::string> out;
  std::string cur;
  for (char c : s) {
    if (c == ',') {
      if (!cur.empty()) out.push_back(cur);
      cur.clear();
      continue;
    }
    if (std::isspace(static_cast<unsigned char>(c))) continue;
    cur.push_back(c);
  }
  if (!cur.empty()) out.push_back(cur);
  return out;
}

} // namespace tripweave::cli
