#include "tripweave/CatalogIO.hpp"

#include <cmath>

namespace tripweave {

namespace {

static bool GetString(const JsonValue& obj, const char* key, std::string& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(obj, key);
  if (!v || v->isNull()) return true; // missing => keep
  if (!v->isString()) {
    err = std::string("expected string for key '") + key + "'";
    return false;
  }
  io = v->stringValue;
  return true;
}

static bool GetNumber(const JsonValue& obj, const char* key, double& io, bool required, std::string& err)
{
  const JsonValue* v = FindJsonMember(obj, key);
  if (!v) {
    if (!required) return true;
    err = std::string("missing key '") + key + "'";
    return false;
  }
  if (!v->isNumber() || !std::isfinite(v->numberValue)) {
    err = std::string("expected finite number for key '") + key + "'";
    return false;
  }
  io = v->numberValue;
  return true;
}

static bool ParseHours(const JsonValue& v, OpeningHours& out, std::string& err)
{
  if (!v.isObject()) {
    err = "expected object for key 'hours'";
    return false;
  }
  const JsonValue* open = FindJsonMember(v, "open");
  const JsonValue* close = FindJsonMember(v, "close");
  if (!open || !close || !open->isString() || !close->isString()) {
    err = "'hours' needs string 'open' and 'close' (HH:MM)";
    return false;
  }
  int o = 0;
  int c = 0;
  if (!ParseClockMinutes(open->stringValue, &o)) {
    err = "invalid opening time '" + open->stringValue + "'";
    return false;
  }
  if (!ParseClockMinutes(close->stringValue, &c)) {
    err = "invalid closing time '" + close->stringValue + "'";
    return false;
  }
  out.openMinute = o;
  out.closeMinute = c;
  return true;
}

static bool ParseSpot(const JsonValue& v, Spot& out, std::string& err)
{
  if (!v.isObject()) {
    err = std::string("expected object, got ") + JsonTypeName(v.type);
    return false;
  }

  Spot s;
  if (!GetString(v, "id", s.id, err)) return false;
  if (!GetString(v, "name", s.name, err)) return false;
  if (!GetString(v, "category", s.category, err)) return false;
  if (!GetString(v, "city", s.cityId, err)) return false;
  if (!GetNumber(v, "lat", s.location.lat, true, err)) return false;
  if (!GetNumber(v, "lon", s.location.lon, true, err)) return false;
  if (!GetNumber(v, "visit_minutes", s.visitMinutes, false, err)) return false;

  if (const JsonValue* h = FindJsonMember(v, "hours")) {
    if (!h->isNull()) {
      OpeningHours hours;
      if (!ParseHours(*h, hours, err)) return false;
      s.hours = hours;
    }
  }

  out = std::move(s);
  return true;
}

static bool ParseCity(const JsonValue& v, City& out, std::string& err)
{
  if (!v.isObject()) {
    err = std::string("expected object, got ") + JsonTypeName(v.type);
    return false;
  }

  City c;
  if (!GetString(v, "id", c.id, err)) return false;
  if (!GetString(v, "name", c.name, err)) return false;

  if (const JsonValue* b = FindJsonMember(v, "bounds")) {
    if (!b->isArray() || b->arrayValue.size() != 4) {
      err = "'bounds' must be [minLat, minLon, maxLat, maxLon]";
      return false;
    }
    double vals[4] = {0.0, 0.0, 0.0, 0.0};
    for (std::size_t i = 0; i < 4; ++i) {
      const JsonValue& e = b->arrayValue[i];
      if (!e.isNumber() || !std::isfinite(e.numberValue)) {
        err = "'bounds' entries must be finite numbers";
        return false;
      }
      vals[i] = e.numberValue;
    }
    if (vals[0] > vals[2] || vals[1] > vals[3]) {
      err = "'bounds' min exceeds max";
      return false;
    }
    c.bounds.minLat = vals[0];
    c.bounds.minLon = vals[1];
    c.bounds.maxLat = vals[2];
    c.bounds.maxLon = vals[3];
    c.bounds.valid = true;
  }

  out = std::move(c);
  return true;
}

static bool LoadSpotArray(const JsonValue& arr, World& world, const std::string& defaultCityId, std::string& err)
{
  for (std::size_t i = 0; i < arr.arrayValue.size(); ++i) {
    Spot s;
    std::string e;
    if (!ParseSpot(arr.arrayValue[i], s, e)) {
      err = "spots[" + std::to_string(i) + "]: " + e;
      return false;
    }
    if (s.cityId.empty()) s.cityId = defaultCityId;
    if (!world.addSpot(std::move(s), e)) {
      err = "spots[" + std::to_string(i) + "]: " + e;
      return false;
    }
  }
  return true;
}

} // namespace

bool LoadCatalogJson(const JsonValue& root, World& world, std::string& outError, const std::string& defaultCityId)
{
  outError.clear();

  if (root.isArray()) {
    if (!defaultCityId.empty() && !world.findCity(defaultCityId)) {
      City c;
      c.id = defaultCityId;
      if (!world.addCity(std::move(c), outError)) return false;
    }
    return LoadSpotArray(root, world, defaultCityId, outError);
  }

  if (!root.isObject()) {
    outError = std::string("catalog must be an object or an array, got ") + JsonTypeName(root.type);
    return false;
  }

  if (const JsonValue* cities = FindJsonMember(root, "cities")) {
    if (!cities->isArray()) {
      outError = "'cities' must be an array";
      return false;
    }
    for (std::size_t i = 0; i < cities->arrayValue.size(); ++i) {
      City c;
      std::string e;
      if (!ParseCity(cities->arrayValue[i], c, e) || !world.addCity(std::move(c), e)) {
        outError = "cities[" + std::to_string(i) + "]: " + e;
        return false;
      }
    }
  }

  const JsonValue* spots = FindJsonMember(root, "spots");
  if (!spots || !spots->isArray()) {
    outError = "catalog needs a 'spots' array";
    return false;
  }
  return LoadSpotArray(*spots, world, std::string(), outError);
}

bool ParseCatalogJson(const std::string& text, World& world, std::string& outError,
                      const std::string& defaultCityId)
{
  JsonValue root;
  if (!ParseJson(text, root, outError)) return false;
  return LoadCatalogJson(root, world, outError, defaultCityId);
}

bool LoadCatalogJsonFile(const std::string& path, World& world, std::string& outError,
                         const std::string& defaultCityId)
{
  JsonValue root;
  if (!LoadJsonFile(path, root, outError)) return false;
  if (!LoadCatalogJson(root, world, outError, defaultCityId)) {
    outError = path + ": " + outError;
    return false;
  }
  return true;
}

} // namespace tripweave
