#include "tripweave/Geometry.hpp"

#include "tripweave/Itinerary.hpp"
#include "tripweave/World.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace tripweave {

namespace {

constexpr double kDegToRad = 3.14159265358979323846 / 180.0;

// Indexed by Policy. Keep in sync with the enum; GetPolicyProfile switches
// exhaustively so a new policy fails to compile without a row here.
const PolicyProfile kProfiles[kPolicyCount] = {
  // speed, overhead, detour, daily budget
  {4.5, 0.0, 1.25, 240.0},  // Walk
  {18.0, 8.0, 1.35, 300.0}, // Transit
  {24.0, 4.0, 1.30, 360.0}, // Taxi
};

bool Finite(const GeoPoint& p)
{
  return std::isfinite(p.lat) && std::isfinite(p.lon);
}

double LegMinutes(double straightKm, const PolicyProfile& prof, double* outKm)
{
  const double km = straightKm * prof.detourFactor;
  *outKm = km;
  return prof.legOverheadMinutes + (km / prof.speedKmh) * 60.0;
}

} // namespace

const char* PolicyName(Policy p)
{
  switch (p) {
  case Policy::Walk: return "walk";
  case Policy::Transit: return "transit";
  case Policy::Taxi: return "taxi";
  }
  return "unknown";
}

bool ParsePolicy(const std::string& s, Policy* out)
{
  if (!out) return false;
  std::string t = s;
  std::transform(t.begin(), t.end(), t.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (t == "walk" || t == "walking" || t == "foot") {
    *out = Policy::Walk;
    return true;
  }
  if (t == "transit" || t == "metro" || t == "subway" || t == "bus" || t == "public") {
    *out = Policy::Transit;
    return true;
  }
  if (t == "taxi" || t == "cab" || t == "car") {
    *out = Policy::Taxi;
    return true;
  }
  return false;
}

const PolicyProfile& GetPolicyProfile(Policy p)
{
  switch (p) {
  case Policy::Walk: return kProfiles[0];
  case Policy::Transit: return kProfiles[1];
  case Policy::Taxi: return kProfiles[2];
  }
  return kProfiles[0];
}

double GreatCircleKm(const GeoPoint& a, const GeoPoint& b)
{
  if (!Finite(a) || !Finite(b)) return 0.0;
  if (a.lat == b.lat && a.lon == b.lon) return 0.0;

  const double lat1 = a.lat * kDegToRad;
  const double lat2 = b.lat * kDegToRad;
  const double dLat = (b.lat - a.lat) * kDegToRad;
  const double dLon = (b.lon - a.lon) * kDegToRad;

  const double sLat = std::sin(dLat * 0.5);
  const double sLon = std::sin(dLon * 0.5);
  double h = sLat * sLat + std::cos(lat1) * std::cos(lat2) * sLon * sLon;
  h = std::clamp(h, 0.0, 1.0);
  return 2.0 * kEarthRadiusKm * std::asin(std::sqrt(h));
}

TravelLeg EstimateLeg(const GeoPoint& from, const GeoPoint& to, Policy p)
{
  TravelLeg leg;
  const double straight = GreatCircleKm(from, to);
  if (!(straight > 0.0)) return leg;

  const PolicyProfile& walk = GetPolicyProfile(Policy::Walk);
  double walkKm = 0.0;
  const double walkMin = LegMinutes(straight, walk, &walkKm);

  if (p == Policy::Walk) {
    leg.minutes = walkMin;
    leg.km = walkKm;
    return leg;
  }

  double rideKm = 0.0;
  const double rideMin = LegMinutes(straight, GetPolicyProfile(p), &rideKm);
  if (walkMin <= rideMin) {
    leg.minutes = walkMin;
    leg.km = walkKm;
    leg.walked = true;
  } else {
    leg.minutes = rideMin;
    leg.km = rideKm;
  }
  return leg;
}

double TravelTime(const Spot& from, const Spot& to, Policy p)
{
  if (&from == &to || (!from.id.empty() && from.id == to.id)) return 0.0;
  return EstimateLeg(from.location, to.location, p).minutes;
}

DayTravel DayTravelTotals(const World& world, const DayPlan& day, Policy p)
{
  DayTravel t;
  const Spot* prev = nullptr;
  for (const std::string& id : day.spots) {
    const Spot* s = world.findSpot(id);
    if (!s) continue;
    if (prev) {
      const TravelLeg leg = (prev == s) ? TravelLeg{} : EstimateLeg(prev->location, s->location, p);
      t.minutes += leg.minutes;
      t.km += leg.km;
      t.legs++;
    }
    prev = s;
  }
  return t;
}

double DayTravelTime(const World& world, const DayPlan& day, Policy p)
{
  return DayTravelTotals(world, day, p).minutes;
}

} // namespace tripweave
