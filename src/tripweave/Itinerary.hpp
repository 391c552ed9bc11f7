#pragma once

#include <string>
#include <vector>

namespace tripweave {

// Ordered visit sequence for one day.
struct DayPlan {
  std::vector<std::string> spots;
};

// One DayPlan per day, index 0 is "day 1".
//
// Invariant (checked by World::validate, enforced by the planner operators):
// no spot id appears more than once across all days.
struct Itinerary {
  std::string cityId; // empty = whole catalog
  std::vector<DayPlan> days;

  int dayCount() const { return static_cast<int>(days.size()); }
  int spotCount() const;
};

// Location of a spot inside an itinerary (0-based day and position).
struct SpotSlot {
  int day = -1;
  int pos = -1;
};

bool FindSpotSlot(const Itinerary& it, const std::string& spotId, SpotSlot* out);

// All spot ids in day/visit order.
std::vector<std::string> FlattenSpotIds(const Itinerary& it);

// Number of spots whose assigned day differs between a and b. Spots present in
// only one of the two itineraries count as relocated.
int RelocationDistance(const Itinerary& a, const Itinerary& b);

// True when both itineraries hold the same multiset of spot ids (order and
// day assignment ignored). Used to check that an operator neither lost nor
// duplicated a spot.
bool SameSpotMultiset(const Itinerary& a, const Itinerary& b);

bool operator==(const DayPlan& a, const DayPlan& b);
bool operator!=(const DayPlan& a, const DayPlan& b);
bool operator==(const Itinerary& a, const Itinerary& b);
bool operator!=(const Itinerary& a, const Itinerary& b);

} // namespace tripweave
