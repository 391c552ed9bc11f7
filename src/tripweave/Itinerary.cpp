#include "tripweave/Itinerary.hpp"

#include <algorithm>
#include <unordered_map>

namespace tripweave {

int Itinerary::spotCount() const
{
  int n = 0;
  for (const DayPlan& d : days) n += static_cast<int>(d.spots.size());
  return n;
}

bool FindSpotSlot(const Itinerary& it, const std::string& spotId, SpotSlot* out)
{
  for (std::size_t d = 0; d < it.days.size(); ++d) {
    const auto& spots = it.days[d].spots;
    for (std::size_t i = 0; i < spots.size(); ++i) {
      if (spots[i] != spotId) continue;
      if (out) {
        out->day = static_cast<int>(d);
        out->pos = static_cast<int>(i);
      }
      return true;
    }
  }
  return false;
}

std::vector<std::string> FlattenSpotIds(const Itinerary& it)
{
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(it.spotCount()));
  for (const DayPlan& d : it.days) out.insert(out.end(), d.spots.begin(), d.spots.end());
  return out;
}

int RelocationDistance(const Itinerary& a, const Itinerary& b)
{
  std::unordered_map<std::string, int> dayOfA;
  for (std::size_t d = 0; d < a.days.size(); ++d) {
    for (const std::string& id : a.days[d].spots) dayOfA[id] = static_cast<int>(d);
  }

  int moved = 0;
  std::unordered_map<std::string, int> seenInB;
  for (std::size_t d = 0; d < b.days.size(); ++d) {
    for (const std::string& id : b.days[d].spots) {
      seenInB[id] = static_cast<int>(d);
      auto found = dayOfA.find(id);
      if (found == dayOfA.end() || found->second != static_cast<int>(d)) ++moved;
    }
  }

  // Spots only in a.
  for (const auto& kv : dayOfA) {
    if (seenInB.find(kv.first) == seenInB.end()) ++moved;
  }
  return moved;
}

bool SameSpotMultiset(const Itinerary& a, const Itinerary& b)
{
  std::vector<std::string> fa = FlattenSpotIds(a);
  std::vector<std::string> fb = FlattenSpotIds(b);
  if (fa.size() != fb.size()) return false;
  std::sort(fa.begin(), fa.end());
  std::sort(fb.begin(), fb.end());
  return fa == fb;
}

bool operator==(const DayPlan& a, const DayPlan& b)
{
  return a.spots == b.spots;
}

bool operator!=(const DayPlan& a, const DayPlan& b)
{
  return !(a == b);
}

bool operator==(const Itinerary& a, const Itinerary& b)
{
  return a.cityId == b.cityId && a.days == b.days;
}

bool operator!=(const Itinerary& a, const Itinerary& b)
{
  return !(a == b);
}

} // namespace tripweave
