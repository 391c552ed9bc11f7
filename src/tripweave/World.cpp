#include "tripweave/World.hpp"

#include <cmath>
#include <unordered_set>

namespace tripweave {

const char* ToString(StructuralIssueKind k)
{
  switch (k) {
  case StructuralIssueKind::UnknownSpot: return "unknown_spot";
  case StructuralIssueKind::DuplicateSpot: return "duplicate_spot";
  case StructuralIssueKind::OutsideCity: return "outside_city";
  }
  return "unknown";
}

bool World::addCity(City city, std::string& outError)
{
  if (city.id.empty()) {
    outError = "city id is empty";
    return false;
  }
  if (m_cityIndex.count(city.id) != 0) {
    outError = "duplicate city id '" + city.id + "'";
    return false;
  }
  if (city.name.empty()) city.name = city.id;

  // Membership is rebuilt from the spots as they are added.
  city.spotIds.clear();

  m_cityIndex.emplace(city.id, m_cities.size());
  m_cities.push_back(std::move(city));
  return true;
}

bool World::addSpot(Spot spot, std::string& outError)
{
  if (spot.id.empty()) spot.id = spot.name;
  if (spot.id.empty()) {
    outError = "spot has neither id nor name";
    return false;
  }
  if (spot.name.empty()) spot.name = spot.id;

  const GeoPoint& p = spot.location;
  if (!std::isfinite(p.lat) || !std::isfinite(p.lon) || p.lat < -90.0 || p.lat > 90.0 || p.lon < -180.0 ||
      p.lon > 180.0) {
    outError = "spot '" + spot.id + "' has invalid coordinates";
    return false;
  }
  if (!std::isfinite(spot.visitMinutes) || spot.visitMinutes < 0.0) {
    outError = "spot '" + spot.id + "' has a negative or non-finite visit duration";
    return false;
  }
  if (spot.hours && spot.hours->closeMinute <= spot.hours->openMinute) {
    outError = "spot '" + spot.id + "' closes before it opens";
    return false;
  }
  if (m_spotIndex.count(spot.id) != 0) {
    outError = "duplicate spot id '" + spot.id + "'";
    return false;
  }

  if (spot.cityId.empty()) {
    for (const City& c : m_cities) {
      if (c.bounds.contains(spot.location)) {
        spot.cityId = c.id;
        break;
      }
    }
  }

  if (!spot.cityId.empty()) {
    auto it = m_cityIndex.find(spot.cityId);
    if (it == m_cityIndex.end()) {
      outError = "spot '" + spot.id + "' references unknown city '" + spot.cityId + "'";
      return false;
    }
    m_cities[it->second].spotIds.push_back(spot.id);
  }

  m_spotIndex.emplace(spot.id, m_spots.size());
  m_spots.push_back(std::move(spot));
  return true;
}

const Spot* World::findSpot(const std::string& id) const
{
  auto it = m_spotIndex.find(id);
  if (it == m_spotIndex.end()) return nullptr;
  return &m_spots[it->second];
}

const City* World::findCity(const std::string& id) const
{
  auto it = m_cityIndex.find(id);
  if (it == m_cityIndex.end()) return nullptr;
  return &m_cities[it->second];
}

std::vector<const Spot*> World::spotsInCity(const std::string& cityId) const
{
  std::vector<const Spot*> out;
  if (cityId.empty()) {
    out.reserve(m_spots.size());
    for (const Spot& s : m_spots) out.push_back(&s);
    return out;
  }

  const City* city = findCity(cityId);
  if (!city) return out;
  out.reserve(city->spotIds.size());
  for (const std::string& id : city->spotIds) {
    if (const Spot* s = findSpot(id)) out.push_back(s);
  }
  return out;
}

StructuralCheck World::validate(const Itinerary& it) const
{
  StructuralCheck check;
  std::unordered_set<std::string> seen;

  for (std::size_t d = 0; d < it.days.size(); ++d) {
    const int dayNo = static_cast<int>(d) + 1;
    for (const std::string& id : it.days[d].spots) {
      const Spot* s = findSpot(id);
      if (!s) {
        check.issues.push_back({StructuralIssueKind::UnknownSpot, dayNo, id});
        continue;
      }
      if (!seen.insert(id).second) {
        check.issues.push_back({StructuralIssueKind::DuplicateSpot, dayNo, id});
        continue;
      }
      if (!it.cityId.empty() && s->cityId != it.cityId) {
        check.issues.push_back({StructuralIssueKind::OutsideCity, dayNo, id});
      }
    }
  }

  check.ok = check.issues.empty();
  return check;
}

} // namespace tripweave
