#pragma once

#include "tripweave/Itinerary.hpp"
#include "tripweave/Spot.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace tripweave {

enum class StructuralIssueKind : std::uint8_t {
  UnknownSpot = 0,
  DuplicateSpot = 1,
  OutsideCity = 2,
};

const char* ToString(StructuralIssueKind k);

struct StructuralIssue {
  StructuralIssueKind kind = StructuralIssueKind::UnknownSpot;
  int day = 0; // 1-based
  std::string spotId;
};

struct StructuralCheck {
  bool ok = true;
  std::vector<StructuralIssue> issues; // day order, then visit order
};

// Read-only catalog of cities and spots for a planning run.
//
// A World is built once (usually by LoadCatalogJsonFile) and then shared by
// any number of concurrent planning runs; none of the const members mutate
// state.
class World {
public:
  World() = default;

  // Cities should be added before the spots that rely on bounds-based city
  // assignment.
  bool addCity(City city, std::string& outError);

  // Rejects duplicate ids, empty ids, out-of-range / non-finite coordinates
  // and negative visit durations. A spot with an empty cityId is assigned to
  // the first city whose bounds contain it.
  bool addSpot(Spot spot, std::string& outError);

  const Spot* findSpot(const std::string& id) const;
  const City* findCity(const std::string& id) const;

  const std::vector<Spot>& spots() const { return m_spots; }
  const std::vector<City>& cities() const { return m_cities; }

  std::size_t spotCount() const { return m_spots.size(); }
  bool empty() const { return m_spots.empty(); }

  // Spots eligible for a city scope, catalog order. Empty cityId = all spots.
  std::vector<const Spot*> spotsInCity(const std::string& cityId) const;

  // Structural pre-check: every id must exist, appear once, and belong to
  // the itinerary's city scope (when one is set).
  StructuralCheck validate(const Itinerary& it) const;

private:
  std::vector<Spot> m_spots;
  std::vector<City> m_cities;
  std::unordered_map<std::string, std::size_t> m_spotIndex;
  std::unordered_map<std::string, std::size_t> m_cityIndex;
};

} // namespace tripweave
