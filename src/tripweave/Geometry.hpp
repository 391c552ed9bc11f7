#pragma once

#include "tripweave/Spot.hpp"

#include <cstdint>
#include <string>

namespace tripweave {

class World;
struct DayPlan;

// Offline travel estimates.
//
// Travel time is derived from great-circle distance, a per-policy detour factor,
// speed and fixed per-leg overhead. Estimates are offline and deterministic; the
// planner calls them for every candidate it scores.

enum class Policy : std::uint8_t {
  Walk = 0,
  Transit = 1,
  Taxi = 2,
};

constexpr int kPolicyCount = 3;

const char* PolicyName(Policy p);

// Accepts "walk", "transit", "taxi" (case-insensitive) plus a few aliases
// ("walking", "metro", "subway", "bus", "car", "cab").
bool ParsePolicy(const std::string& s, Policy* out);

struct PolicyProfile {
  double speedKmh = 4.5;
  double legOverheadMinutes = 0.0;

  // Straight-line distance is multiplied by this to approximate the street network.
  double detourFactor = 1.25;

  // Default daily travel budget (ScorerConfig::maxDailyTravelMinutes).
  double dailyBudgetMinutes = 240.0;
};

const PolicyProfile& GetPolicyProfile(Policy p);

constexpr double kEarthRadiusKm = 6371.0;

// Haversine distance. Returns 0 for non-finite input.
double GreatCircleKm(const GeoPoint& a, const GeoPoint& b);

struct TravelLeg {
  double minutes = 0.0;
  double km = 0.0;

  // True when a motorized policy chose to walk because it was quicker.
  bool walked = false;
};

// Estimate one leg. Identical or non-finite coordinates yield a zero leg.
// Motorized policies never take longer than walking the same leg.
TravelLeg EstimateLeg(const GeoPoint& from, const GeoPoint& to, Policy p);

// Minutes from one spot to another. A self-leg is zero.
double TravelTime(const Spot& from, const Spot& to, Policy p);

struct DayTravel {
  double minutes = 0.0;
  double km = 0.0;
  int legs = 0;
};

// Sum of consecutive legs in visit order. Unknown spot ids are skipped
// (structural problems are reported by World::validate, not here).
DayTravel DayTravelTotals(const World& world, const DayPlan& day, Policy p);

double DayTravelTime(const World& world, const DayPlan& day, Policy p);

} // namespace tripweave
