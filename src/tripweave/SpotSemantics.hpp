#pragma once

#include "tripweave/Spot.hpp"

#include <string>

namespace tripweave {

// Weather exposure of catalog categories. Matching is case-insensitive; a
// category that is in neither set is neutral.
//
// Outdoor: outdoor, beach, park, garden, viewpoint, zoo
// Indoor : indoor, museum, shopping, temple, gallery, aquarium, food
bool IsOutdoorCategory(const std::string& category);
bool IsIndoorCategory(const std::string& category);

inline bool IsOutdoor(const Spot& s) { return IsOutdoorCategory(s.category); }
inline bool IsIndoor(const Spot& s) { return IsIndoorCategory(s.category); }

} // namespace tripweave
