#pragma once

#include <optional>
#include <string>
#include <vector>

namespace tripweave {

// Geographic coordinate in degrees (WGS84).
struct GeoPoint {
  double lat = 0.0;
  double lon = 0.0;
};

// Axis-aligned lat/lon box. An empty box (the default) contains nothing.
struct GeoBounds {
  double minLat = 0.0;
  double minLon = 0.0;
  double maxLat = 0.0;
  double maxLon = 0.0;
  bool valid = false;

  bool contains(const GeoPoint& p) const
  {
    return valid && p.lat >= minLat && p.lat <= maxLat && p.lon >= minLon && p.lon <= maxLon;
  }
};

// Daily opening window, minutes after midnight. close > open.
struct OpeningHours {
  int openMinute = 0;
  int closeMinute = 24 * 60;
};

struct Spot {
  std::string id;
  std::string name;
  GeoPoint location;

  // Free-form tag from the catalog ("museum", "park", "food", ...).
  std::string category;
  std::string cityId;

  double visitMinutes = 60.0;
  std::optional<OpeningHours> hours;
};

struct City {
  std::string id;
  std::string name;
  GeoBounds bounds;
  std::vector<std::string> spotIds; // catalog order
};

// "HH:MM" helpers for opening hours and report output.
bool ParseClockMinutes(const std::string& s, int* outMinutes);
std::string FormatClockMinutes(double minutes);

} // namespace tripweave
