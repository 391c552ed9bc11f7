#pragma once

#include "tripweave/Geometry.hpp"
#include "tripweave/Itinerary.hpp"
#include "tripweave/Scorer.hpp"
#include "tripweave/World.hpp"

#include <string>
#include <vector>

namespace tripweave {

// Bad-weather replanning for a single day.
//
// Every outdoor spot of the affected day is exchanged with an indoor spot from
// another day. Among the indoor candidates, the one giving the lowest total
// score wins (first in day/visit order on ties). Indoor spots brought onto the
// affected day are never moved again.

struct WeatherSwap {
  std::string outdoorId;
  std::string indoorId;
  int otherDay = 0; // 1-based day the outdoor spot moved to
};

struct WeatherReplanResult {
  std::vector<WeatherSwap> swaps;

  // Outdoor spots left on the day because no indoor candidate was available.
  std::vector<std::string> unresolved;

  double scoreBefore = 0.0;
  double scoreAfter = 0.0;
};

// `day` is 1-based. Modifies `it` in place. Errors: day out of range, invalid
// scorer config.
bool ReplanDayForWeather(const World& world, Itinerary& it, int day, Policy policy, const ScorerConfig& scorer,
                         WeatherReplanResult& out, std::string& outError);

} // namespace tripweave
