#pragma once

#include "tripweave/Geometry.hpp"
#include "tripweave/Itinerary.hpp"
#include "tripweave/World.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace tripweave {

// Soft-constraint scoring. Lower is better; 0 means no penalties.
struct ScorerConfig {
  // Travel cap per day. Exceeding it is penalized per minute, not rejected,
  // so the search space stays connected.
  double maxDailyTravelMinutes = 240.0;

  int minSpotsPerDay = 2;
  int maxSpotsPerDay = 5;

  // Cost per missing / excess spot on a day.
  double spotDurationWeight = 15.0;

  // Cost per minute of travel over the daily cap.
  double travelTimeWeight = 1.5;

  // Clock time each day starts (minutes after midnight). Used to check
  // opening hours along the visit order.
  double dayStartMinute = 9.0 * 60.0;

  // Cost per spot that cannot be visited within its opening hours.
  double closedSpotPenalty = 500.0;

  // Cost per structural issue (unknown / duplicate / out-of-scope spot).
  double structuralPenalty = 1.0e6;
};

// Defaults with the daily travel cap taken from the policy profile
// (walk 240, transit 300, taxi 360 minutes).
ScorerConfig DefaultScorerConfig(Policy p);

// Configuration errors are caught here, before any planning work starts.
bool ValidateScorerConfig(const ScorerConfig& cfg, std::string& outError);

// Fixed order inside a day: the report is sorted by (day, kind, visit order).
enum class PenaltyKind : std::uint8_t {
  TravelTime = 0,
  Underfill = 1,
  Overfill = 2,
  ClosedSpot = 3,
  Structural = 4,
};

const char* ToString(PenaltyKind k);

struct Penalty {
  PenaltyKind kind = PenaltyKind::TravelTime;
  int day = 0; // 1-based

  // Raw excess in natural units: minutes (travel, closed spot) or spots
  // (under/over-fill, structural).
  double magnitude = 0.0;

  // Weighted contribution to the total.
  double cost = 0.0;

  // Set for ClosedSpot and Structural penalties.
  std::string spotId;

  // Human-readable line for the self-check report.
  std::string message;
};

struct DaySummary {
  int day = 0; // 1-based
  int spots = 0;
  double travelMinutes = 0.0;
  double travelKm = 0.0;
  double visitMinutes = 0.0;

  // Clock time when the last visit ends (dayStartMinute + travel + waits + visits).
  double endMinute = 0.0;
};

struct ScoreReport {
  double total = 0.0;

  // False when a hard constraint is violated: structural issue, a spot that
  // cannot be visited inside its opening hours, or too few spots overall to
  // satisfy minSpotsPerDay on every day.
  bool feasible = true;

  // Fewer spots assigned than days * minSpotsPerDay.
  bool capacityShortfall = false;

  std::vector<Penalty> penalties;
  std::vector<DaySummary> days;
  std::vector<StructuralIssue> structural;

  double sumCost(PenaltyKind k) const;
  int count(PenaltyKind k) const;
};

// Never throws and never rejects: infeasible itineraries get a report with
// feasible=false and a very high total, so the planner can still compare them.
ScoreReport ScoreItinerary(const World& world, const Itinerary& it, Policy policy, const ScorerConfig& cfg);

// Two reports agree on every scored field (used to check determinism).
bool SameScoreReport(const ScoreReport& a, const ScoreReport& b);

// Short phrase for one penalty without the day prefix or cost, e.g.
// "travel-time overage of 37.0 min" or "2 spot(s) short of the daily minimum".
std::string DescribePenalty(const Penalty& p);

// Multi-line self-check report: score, feasibility, one line per penalty.
std::string FormatScoreReport(const ScoreReport& r);

} // namespace tripweave
