#pragma once

#include "tripweave/Json.hpp"
#include "tripweave/World.hpp"

#include <string>

namespace tripweave {

// Catalog loading.
//
// Two accepted shapes:
//
//   {"cities": [{"id":"tokyo","name":"Tokyo","bounds":[minLat,minLon,maxLat,maxLon]}, ...],
//    "spots":  [ ...spot objects... ]}
//
//   [ ...spot objects... ]            (bare array, one city per file)
//
// Spot object keys:
//   id (defaults to name), name, lat, lon, category, city, visit_minutes,
//   hours: {"open":"HH:MM","close":"HH:MM"}
//
// For the bare-array shape, a non-empty defaultCityId creates that city and
// assigns every spot without a "city" key to it.
//
// Loading appends to `world`; on error the message names the offending entry
// and `world` may hold the entries read before it.
bool LoadCatalogJson(const JsonValue& root, World& world, std::string& outError,
                     const std::string& defaultCityId = std::string());

bool ParseCatalogJson(const std::string& text, World& world, std::string& outError,
                      const std::string& defaultCityId = std::string());

bool LoadCatalogJsonFile(const std::string& path, World& world, std::string& outError,
                         const std::string& defaultCityId = std::string());

} // namespace tripweave
