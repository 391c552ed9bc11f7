#include "tripweave/Scorer.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <sstream>

namespace tripweave {

namespace {

bool FiniteNonNegative(double v)
{
  return std::isfinite(v) && v >= 0.0;
}

std::string Fixed(double v, int digits)
{
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(digits) << v;
  return oss.str();
}

std::string CostSuffix(double cost)
{
  return " (+" + Fixed(cost, 2) + ")";
}

Penalty MakeTravelPenalty(int day, double travel, const ScorerConfig& cfg)
{
  Penalty p;
  p.kind = PenaltyKind::TravelTime;
  p.day = day;
  p.magnitude = travel - cfg.maxDailyTravelMinutes;
  p.cost = cfg.travelTimeWeight * p.magnitude;
  p.message = "Day " + std::to_string(day) + ": travel " + Fixed(travel, 1) + " min exceeds the " +
              Fixed(cfg.maxDailyTravelMinutes, 1) + " min budget by " + Fixed(p.magnitude, 1) + " min" +
              CostSuffix(p.cost);
  return p;
}

Penalty MakeFillPenalty(PenaltyKind kind, int day, int spots, const ScorerConfig& cfg)
{
  Penalty p;
  p.kind = kind;
  p.day = day;
  if (kind == PenaltyKind::Underfill) {
    p.magnitude = static_cast<double>(cfg.minSpotsPerDay - spots);
    p.message = "Day " + std::to_string(day) + ": only " + std::to_string(spots) + " spot(s), minimum is " +
                std::to_string(cfg.minSpotsPerDay);
  } else {
    p.magnitude = static_cast<double>(spots - cfg.maxSpotsPerDay);
    p.message = "Day " + std::to_string(day) + ": " + std::to_string(spots) + " spots, maximum is " +
                std::to_string(cfg.maxSpotsPerDay);
  }
  p.cost = cfg.spotDurationWeight * p.magnitude;
  p.message += CostSuffix(p.cost);
  return p;
}

Penalty MakeClosedPenalty(int day, const Spot& s, double arrival, double overrun, const ScorerConfig& cfg)
{
  Penalty p;
  p.kind = PenaltyKind::ClosedSpot;
  p.day = day;
  p.spotId = s.id;
  p.magnitude = overrun;
  p.cost = cfg.closedSpotPenalty;
  p.message = "Day " + std::to_string(day) + ": " + s.name + " cannot be visited within its opening hours " +
              FormatClockMinutes(s.hours->openMinute) + "-" + FormatClockMinutes(s.hours->closeMinute) +
              " (arrives " + FormatClockMinutes(arrival) + ", " + Fixed(overrun, 1) + " min over)" +
              CostSuffix(p.cost);
  return p;
}

Penalty MakeStructuralPenalty(const StructuralIssue& issue, const ScorerConfig& cfg)
{
  Penalty p;
  p.kind = PenaltyKind::Structural;
  p.day = issue.day;
  p.spotId = issue.spotId;
  p.magnitude = 1.0;
  p.cost = cfg.structuralPenalty;

  std::string what;
  switch (issue.kind) {
  case StructuralIssueKind::UnknownSpot: what = "is not in the catalog"; break;
  case StructuralIssueKind::DuplicateSpot: what = "is assigned more than once"; break;
  case StructuralIssueKind::OutsideCity: what = "is outside the itinerary's city"; break;
  }
  p.message = "Day " + std::to_string(issue.day) + ": spot '" + issue.spotId + "' " + what + CostSuffix(p.cost);
  return p;
}

} // namespace

ScorerConfig DefaultScorerConfig(Policy p)
{
  ScorerConfig cfg;
  cfg.maxDailyTravelMinutes = GetPolicyProfile(p).dailyBudgetMinutes;
  return cfg;
}

bool ValidateScorerConfig(const ScorerConfig& cfg, std::string& outError)
{
  outError.clear();

  if (!FiniteNonNegative(cfg.maxDailyTravelMinutes)) {
    outError = "max_daily_travel_minutes must be a finite non-negative number";
    return false;
  }
  if (cfg.minSpotsPerDay < 0) {
    outError = "min_spots_per_day must be >= 0";
    return false;
  }
  if (cfg.maxSpotsPerDay < 1) {
    outError = "max_spots_per_day must be >= 1";
    return false;
  }
  if (cfg.minSpotsPerDay > cfg.maxSpotsPerDay) {
    outError = "min_spots_per_day (" + std::to_string(cfg.minSpotsPerDay) + ") exceeds max_spots_per_day (" +
               std::to_string(cfg.maxSpotsPerDay) + ")";
    return false;
  }
  if (!FiniteNonNegative(cfg.spotDurationWeight)) {
    outError = "spot_duration_weight must be a finite non-negative number";
    return false;
  }
  if (!FiniteNonNegative(cfg.travelTimeWeight)) {
    outError = "travel_time_weight must be a finite non-negative number";
    return false;
  }
  if (!std::isfinite(cfg.dayStartMinute) || cfg.dayStartMinute < 0.0 || cfg.dayStartMinute >= 24.0 * 60.0) {
    outError = "day_start_minute must be within [0, 1440)";
    return false;
  }
  if (!FiniteNonNegative(cfg.closedSpotPenalty)) {
    outError = "closed_spot_penalty must be a finite non-negative number";
    return false;
  }
  if (!FiniteNonNegative(cfg.structuralPenalty)) {
    outError = "structural_penalty must be a finite non-negative number";
    return false;
  }
  return true;
}

const char* ToString(PenaltyKind k)
{
  switch (k) {
  case PenaltyKind::TravelTime: return "travel_time";
  case PenaltyKind::Underfill: return "underfill";
  case PenaltyKind::Overfill: return "overfill";
  case PenaltyKind::ClosedSpot: return "closed_spot";
  case PenaltyKind::Structural: return "structural";
  }
  return "unknown";
}

double ScoreReport::sumCost(PenaltyKind k) const
{
  double sum = 0.0;
  for (const Penalty& p : penalties) {
    if (p.kind == k) sum += p.cost;
  }
  return sum;
}

int ScoreReport::count(PenaltyKind k) const
{
  return static_cast<int>(std::count_if(penalties.begin(), penalties.end(),
                                        [k](const Penalty& p) { return p.kind == k; }));
}

ScoreReport ScoreItinerary(const World& world, const Itinerary& it, Policy policy, const ScorerConfig& cfg)
{
  ScoreReport r;

  StructuralCheck check = world.validate(it);
  r.feasible = check.ok;
  r.structural = std::move(check.issues);
  std::size_t nextIssue = 0;

  r.days.reserve(it.days.size());

  for (std::size_t d = 0; d < it.days.size(); ++d) {
    const DayPlan& plan = it.days[d];
    const int dayNo = static_cast<int>(d) + 1;

    DaySummary sum;
    sum.day = dayNo;
    sum.spots = static_cast<int>(plan.spots.size());

    // Walk the day in visit order: travel, wait for opening, visit.
    std::vector<Penalty> closed;
    double clock = cfg.dayStartMinute;
    const Spot* prev = nullptr;
    for (const std::string& id : plan.spots) {
      const Spot* s = world.findSpot(id);
      if (!s) continue;

      if (prev && prev != s) {
        const TravelLeg leg = EstimateLeg(prev->location, s->location, policy);
        sum.travelMinutes += leg.minutes;
        sum.travelKm += leg.km;
        clock += leg.minutes;
      }

      sum.visitMinutes += s->visitMinutes;
      if (s->hours) {
        const double open = static_cast<double>(s->hours->openMinute);
        const double close = static_cast<double>(s->hours->closeMinute);
        if (clock < open) clock = open;
        const double overrun = clock + s->visitMinutes - close;
        if (overrun > 0.0) closed.push_back(MakeClosedPenalty(dayNo, *s, clock, overrun, cfg));
      }
      clock += s->visitMinutes;
      prev = s;
    }
    sum.endMinute = clock;

    if (sum.travelMinutes > cfg.maxDailyTravelMinutes) {
      r.penalties.push_back(MakeTravelPenalty(dayNo, sum.travelMinutes, cfg));
    }
    if (sum.spots < cfg.minSpotsPerDay) {
      r.penalties.push_back(MakeFillPenalty(PenaltyKind::Underfill, dayNo, sum.spots, cfg));
    }
    if (sum.spots > cfg.maxSpotsPerDay) {
      r.penalties.push_back(MakeFillPenalty(PenaltyKind::Overfill, dayNo, sum.spots, cfg));
    }
    if (!closed.empty()) {
      r.feasible = false;
      for (Penalty& p : closed) r.penalties.push_back(std::move(p));
    }
    while (nextIssue < r.structural.size() && r.structural[nextIssue].day == dayNo) {
      r.penalties.push_back(MakeStructuralPenalty(r.structural[nextIssue], cfg));
      ++nextIssue;
    }

    r.days.push_back(sum);
  }

  const std::int64_t assigned = it.spotCount();
  const std::int64_t required = static_cast<std::int64_t>(it.dayCount()) * cfg.minSpotsPerDay;
  if (cfg.minSpotsPerDay > 0 && assigned < required) {
    r.capacityShortfall = true;
    r.feasible = false;
  }

  for (const Penalty& p : r.penalties) r.total += p.cost;
  return r;
}

bool SameScoreReport(const ScoreReport& a, const ScoreReport& b)
{
  if (a.total != b.total || a.feasible != b.feasible || a.capacityShortfall != b.capacityShortfall) return false;
  if (a.penalties.size() != b.penalties.size() || a.days.size() != b.days.size()) return false;
  if (a.structural.size() != b.structural.size()) return false;

  for (std::size_t i = 0; i < a.penalties.size(); ++i) {
    const Penalty& x = a.penalties[i];
    const Penalty& y = b.penalties[i];
    if (x.kind != y.kind || x.day != y.day || x.magnitude != y.magnitude || x.cost != y.cost ||
        x.spotId != y.spotId || x.message != y.message) {
      return false;
    }
  }
  for (std::size_t i = 0; i < a.days.size(); ++i) {
    const DaySummary& x = a.days[i];
    const DaySummary& y = b.days[i];
    if (x.day != y.day || x.spots != y.spots || x.travelMinutes != y.travelMinutes || x.travelKm != y.travelKm ||
        x.visitMinutes != y.visitMinutes || x.endMinute != y.endMinute) {
      return false;
    }
  }
  for (std::size_t i = 0; i < a.structural.size(); ++i) {
    const StructuralIssue& x = a.structural[i];
    const StructuralIssue& y = b.structural[i];
    if (x.kind != y.kind || x.day != y.day || x.spotId != y.spotId) return false;
  }
  return true;
}

std::string DescribePenalty(const Penalty& p)
{
  switch (p.kind) {
  case PenaltyKind::TravelTime: return "travel-time overage of " + Fixed(p.magnitude, 1) + " min";
  case PenaltyKind::Underfill: return Fixed(p.magnitude, 0) + " spot(s) short of the daily minimum";
  case PenaltyKind::Overfill: return Fixed(p.magnitude, 0) + " spot(s) over the daily maximum";
  case PenaltyKind::ClosedSpot: return "'" + p.spotId + "' running " + Fixed(p.magnitude, 1) + " min past closing";
  case PenaltyKind::Structural: return "structural problem with '" + p.spotId + "'";
  }
  return "unknown penalty";
}

std::string FormatScoreReport(const ScoreReport& r)
{
  std::ostringstream oss;
  oss << "Score: " << Fixed(r.total, 2) << (r.feasible ? " (feasible)" : " (INFEASIBLE)") << "\n";

  if (r.penalties.empty() && !r.capacityShortfall) {
    oss << "Self-check report: no penalties\n";
    return oss.str();
  }

  oss << "Self-check report:\n";
  for (const Penalty& p : r.penalties) oss << " - " << p.message << "\n";
  if (r.capacityShortfall) {
    oss << " - not enough spots to reach the daily minimum on every day\n";
  }
  return oss.str();
}

} // namespace tripweave
