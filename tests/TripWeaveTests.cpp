#include "tripweave/CatalogIO.hpp"
#include "tripweave/ConfigIO.hpp"
#include "tripweave/Geometry.hpp"
#include "tripweave/Itinerary.hpp"
#include "tripweave/Json.hpp"
#include "tripweave/LogTee.hpp"
#include "tripweave/PlanExport.hpp"
#include "tripweave/Planner.hpp"
#include "tripweave/Random.hpp"
#include "tripweave/Replanner.hpp"
#include "tripweave/Scorer.hpp"
#include "tripweave/SpotSemantics.hpp"
#include "tripweave/World.hpp"

#include <chrono>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static int g_failures = 0;

#define EXPECT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_TRUE failed: " << #cond << "\n";                          \
    }                                                                                                                \
  } while (0)

#define EXPECT_FALSE(cond) EXPECT_TRUE(!(cond))

#define EXPECT_EQ(a, b)                                                                                              \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    if (!(_a == _b)) {                                                                                               \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_EQ failed: " << #a << " == " << #b << "\n";              \
    }                                                                                                                \
  } while (0)

#define EXPECT_NE(a, b)                                                                                              \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    if ((_a == _b)) {                                                                                                \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_NE failed: " << #a << " != " << #b << "\n";              \
    }                                                                                                                \
  } while (0)

#define EXPECT_NEAR(a, b, eps)                                                                                        \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    const auto _e = (eps);                                                                                           \
    if (std::fabs((_a) - (_b)) > (_e)) {                                                                             \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_NEAR failed: " << #a << " ~= " << #b << " (eps=" << _e   \
                << ")\n";                                                                                            \
    }                                                                                                                \
  } while (0)

#define ASSERT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " ASSERT_TRUE failed: " << #cond << "\n";                          \
      return;                                                                                                        \
    }                                                                                                                \
  } while (0)

namespace {

using namespace tripweave;

constexpr double kTokyoLat = 35.68;
constexpr double kTokyoLon = 139.70;

Spot MakeSpot(const std::string& id, double lat, double lon, const std::string& category = "museum")
{
  Spot s;
  s.id = id;
  s.name = id;
  s.location = GeoPoint{lat, lon};
  s.category = category;
  s.cityId = "tokyo";
  return s;
}

void AddTokyo(World& w)
{
  City c;
  c.id = "tokyo";
  c.name = "Tokyo";
  c.bounds = GeoBounds{35.5, 139.5, 35.9, 139.95, true};
  std::string err;
  if (!w.addCity(c, err)) std::cerr << "addCity failed: " << err << "\n";
}

void AddOrReport(World& w, const Spot& s)
{
  std::string err;
  if (!w.addSpot(s, err)) {
    ++g_failures;
    std::cerr << "addSpot failed: " << err << "\n";
  }
}

// n spots zig-zagging eastwards, ~0.45 km apart.
World MakeZigZagWorld(int n)
{
  World w;
  AddTokyo(w);
  for (int i = 0; i < n; ++i) {
    AddOrReport(w, MakeSpot("s" + std::to_string(i), kTokyoLat + (i % 2) * 0.004, kTokyoLon + i * 0.005));
  }
  return w;
}

// Seeded scatter over central Tokyo.
World MakeScatterWorld(int n, std::uint64_t seed)
{
  World w;
  AddTokyo(w);
  RNG rng(seed);
  for (int i = 0; i < n; ++i) {
    const double lat = kTokyoLat + rng.rangeF64(-0.06, 0.06);
    const double lon = kTokyoLon + rng.rangeF64(-0.08, 0.08);
    AddOrReport(w, MakeSpot("p" + std::to_string(i), lat, lon));
  }
  return w;
}

Itinerary MakeItinerary(std::vector<std::vector<std::string>> days, const std::string& city = "tokyo")
{
  Itinerary it;
  it.cityId = city;
  for (auto& d : days) it.days.push_back(DayPlan{std::move(d)});
  return it;
}

double WalkMinutes(double straightKm)
{
  return straightKm * 1.25 / 4.5 * 60.0;
}

fs::path MakeTempPath(const std::string& prefix)
{
  static std::uint64_t counter = 0;
  ++counter;

  std::error_code ec;
  fs::path root = fs::temp_directory_path(ec);
  if (ec || root.empty()) root = fs::path(".");

  const auto stamp = static_cast<std::uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count());
  return root / (prefix + "_" + std::to_string(stamp) + "_" + std::to_string(counter));
}

std::string ReadFile(const fs::path& p)
{
  std::ifstream f(p, std::ios::binary);
  std::ostringstream oss;
  oss << f.rdbuf();
  return oss.str();
}

} // namespace

static void TestGreatCircleAndZeroLegs()
{
  const GeoPoint tokyo{35.6812, 139.7671};
  const GeoPoint osaka{34.7025, 135.4959};
  EXPECT_NEAR(GreatCircleKm(tokyo, osaka), 403.0, 5.0);
  EXPECT_NEAR(GreatCircleKm(tokyo, osaka), GreatCircleKm(osaka, tokyo), 1e-9);

  // 0.01 degree of latitude.
  const GeoPoint a{kTokyoLat, kTokyoLon};
  const GeoPoint b{kTokyoLat + 0.01, kTokyoLon};
  EXPECT_NEAR(GreatCircleKm(a, b), 1.1119, 1e-3);

  EXPECT_EQ(GreatCircleKm(a, a), 0.0);
  const GeoPoint bad{std::numeric_limits<double>::quiet_NaN(), kTokyoLon};
  EXPECT_EQ(GreatCircleKm(a, bad), 0.0);

  for (int p = 0; p < kPolicyCount; ++p) {
    const Policy policy = static_cast<Policy>(p);
    const TravelLeg zero = EstimateLeg(a, a, policy);
    EXPECT_EQ(zero.minutes, 0.0);
    EXPECT_EQ(zero.km, 0.0);

    const Spot s = MakeSpot("x", kTokyoLat, kTokyoLon);
    EXPECT_EQ(TravelTime(s, s, policy), 0.0);
  }

  // Walking: detour-scaled distance at 4.5 km/h, no overhead.
  const TravelLeg walk = EstimateLeg(a, b, Policy::Walk);
  EXPECT_NEAR(walk.minutes, WalkMinutes(GreatCircleKm(a, b)), 1e-9);
  EXPECT_FALSE(walk.walked);

  // A short hop is quicker on foot than waiting for a taxi.
  const GeoPoint c{kTokyoLat + 0.0005, kTokyoLon};
  const TravelLeg hop = EstimateLeg(a, c, Policy::Taxi);
  EXPECT_TRUE(hop.walked);
  EXPECT_NEAR(hop.minutes, EstimateLeg(a, c, Policy::Walk).minutes, 1e-12);

  // A long leg rides: overhead + detour distance at 24 km/h.
  const TravelLeg ride = EstimateLeg(tokyo, osaka, Policy::Taxi);
  EXPECT_FALSE(ride.walked);
  EXPECT_NEAR(ride.minutes, 4.0 + GreatCircleKm(tokyo, osaka) * 1.30 / 24.0 * 60.0, 1e-6);
}

static void TestPolicyParsing()
{
  Policy p = Policy::Walk;
  EXPECT_TRUE(ParsePolicy("TAXI", &p));
  EXPECT_EQ(p, Policy::Taxi);
  EXPECT_TRUE(ParsePolicy("subway", &p));
  EXPECT_EQ(p, Policy::Transit);
  EXPECT_TRUE(ParsePolicy("walking", &p));
  EXPECT_EQ(p, Policy::Walk);
  EXPECT_FALSE(ParsePolicy("teleport", &p));
  EXPECT_EQ(p, Policy::Walk);

  EXPECT_EQ(std::string(PolicyName(Policy::Transit)), std::string("transit"));
  EXPECT_EQ(DefaultScorerConfig(Policy::Walk).maxDailyTravelMinutes, 240.0);
  EXPECT_EQ(DefaultScorerConfig(Policy::Transit).maxDailyTravelMinutes, 300.0);
  EXPECT_EQ(DefaultScorerConfig(Policy::Taxi).maxDailyTravelMinutes, 360.0);
}

static void TestWorldAddAndValidate()
{
  World w;
  AddTokyo(w);
  std::string err;

  EXPECT_FALSE(w.addCity(City{}, err));
  City dupCity;
  dupCity.id = "tokyo";
  EXPECT_FALSE(w.addCity(dupCity, err));

  AddOrReport(w, MakeSpot("a", kTokyoLat, kTokyoLon));
  EXPECT_FALSE(w.addSpot(MakeSpot("a", kTokyoLat, kTokyoLon), err));
  EXPECT_TRUE(err.find("duplicate") != std::string::npos);

  EXPECT_FALSE(w.addSpot(MakeSpot("bad", 95.0, kTokyoLon), err));
  EXPECT_FALSE(w.addSpot(MakeSpot("nan", std::numeric_limits<double>::quiet_NaN(), kTokyoLon), err));

  Spot closed = MakeSpot("closed", kTokyoLat, kTokyoLon);
  closed.hours = OpeningHours{600, 600};
  EXPECT_FALSE(w.addSpot(closed, err));

  Spot lost = MakeSpot("lost", kTokyoLat, kTokyoLon);
  lost.cityId = "kyoto";
  EXPECT_FALSE(w.addSpot(lost, err));
  EXPECT_TRUE(err.find("kyoto") != std::string::npos);

  // No city: assigned by bounds.
  Spot inBounds = MakeSpot("b", kTokyoLat + 0.01, kTokyoLon);
  inBounds.cityId.clear();
  AddOrReport(w, inBounds);
  ASSERT_TRUE(w.findSpot("b") != nullptr);
  EXPECT_EQ(w.findSpot("b")->cityId, std::string("tokyo"));

  Spot outside = MakeSpot("far", 34.70, 135.50);
  outside.cityId.clear();
  AddOrReport(w, outside);
  EXPECT_TRUE(w.findSpot("far")->cityId.empty());

  EXPECT_EQ(w.spotsInCity("tokyo").size(), 2u);
  EXPECT_EQ(w.spotsInCity("").size(), 3u);
  EXPECT_TRUE(w.spotsInCity("kyoto").empty());

  const StructuralCheck ok = w.validate(MakeItinerary({{"a"}, {"b"}}));
  EXPECT_TRUE(ok.ok);

  const StructuralCheck bad = w.validate(MakeItinerary({{"a", "ghost"}, {"far", "a"}}));
  EXPECT_FALSE(bad.ok);
  ASSERT_TRUE(bad.issues.size() == 3u);
  EXPECT_EQ(bad.issues[0].kind, StructuralIssueKind::UnknownSpot);
  EXPECT_EQ(bad.issues[0].day, 1);
  EXPECT_EQ(bad.issues[1].kind, StructuralIssueKind::OutsideCity);
  EXPECT_EQ(bad.issues[1].spotId, std::string("far"));
  EXPECT_EQ(bad.issues[2].kind, StructuralIssueKind::DuplicateSpot);
  EXPECT_EQ(bad.issues[2].day, 2);

  // Whole-catalog scope accepts spots from any city.
  EXPECT_TRUE(w.validate(MakeItinerary({{"a", "far"}}, "")).ok);
}

static void TestScorerFormulaAndOrdering()
{
  World w;
  AddTokyo(w);
  AddOrReport(w, MakeSpot("a", kTokyoLat, kTokyoLon));
  AddOrReport(w, MakeSpot("b", kTokyoLat + 0.01, kTokyoLon));
  for (int i = 0; i < 4; ++i) AddOrReport(w, MakeSpot("c" + std::to_string(i), kTokyoLat, kTokyoLon + 0.0001 * i));

  ScorerConfig cfg;
  cfg.maxDailyTravelMinutes = 10.0;
  cfg.minSpotsPerDay = 3;
  cfg.maxSpotsPerDay = 3;
  cfg.spotDurationWeight = 15.0;
  cfg.travelTimeWeight = 1.5;

  const Itinerary it = MakeItinerary({{"a", "b"}, {"c0", "c1", "c2", "c3"}});
  const ScoreReport r = ScoreItinerary(w, it, Policy::Walk, cfg);

  const double leg = WalkMinutes(GreatCircleKm(GeoPoint{kTokyoLat, kTokyoLon}, GeoPoint{kTokyoLat + 0.01, kTokyoLon}));
  ASSERT_TRUE(r.penalties.size() == 3u);

  EXPECT_EQ(r.penalties[0].kind, PenaltyKind::TravelTime);
  EXPECT_EQ(r.penalties[0].day, 1);
  EXPECT_NEAR(r.penalties[0].magnitude, leg - 10.0, 1e-9);
  EXPECT_NEAR(r.penalties[0].cost, 1.5 * (leg - 10.0), 1e-9);

  EXPECT_EQ(r.penalties[1].kind, PenaltyKind::Underfill);
  EXPECT_EQ(r.penalties[1].day, 1);
  EXPECT_EQ(r.penalties[1].cost, 15.0);

  EXPECT_EQ(r.penalties[2].kind, PenaltyKind::Overfill);
  EXPECT_EQ(r.penalties[2].day, 2);
  EXPECT_EQ(r.penalties[2].cost, 15.0);

  EXPECT_NEAR(r.total, 1.5 * (leg - 10.0) + 30.0, 1e-9);
  EXPECT_TRUE(r.feasible);
  EXPECT_EQ(r.count(PenaltyKind::Underfill), 1);
  EXPECT_NEAR(r.sumCost(PenaltyKind::TravelTime), r.penalties[0].cost, 1e-12);
  EXPECT_TRUE(r.penalties[0].message.rfind("Day 1: travel", 0) == 0);

  ASSERT_TRUE(r.days.size() == 2u);
  EXPECT_NEAR(r.days[0].travelMinutes, leg, 1e-9);
  EXPECT_NEAR(r.days[0].travelMinutes, DayTravelTime(w, it.days[0], Policy::Walk), 1e-9);
  EXPECT_EQ(r.days[1].spots, 4);

  // Scoring is a pure function of its inputs.
  const ScoreReport again = ScoreItinerary(w, it, Policy::Walk, cfg);
  EXPECT_TRUE(SameScoreReport(r, again));

  const std::string text = FormatScoreReport(r);
  EXPECT_TRUE(text.find("Self-check report:") != std::string::npos);
  EXPECT_TRUE(text.find("Day 2:") != std::string::npos);

  // Exactly at the cap is not penalized.
  cfg.maxDailyTravelMinutes = leg;
  EXPECT_EQ(ScoreItinerary(w, it, Policy::Walk, cfg).count(PenaltyKind::TravelTime), 0);
}

static void TestScorerStructuralAndEmpty()
{
  World w = MakeZigZagWorld(4);
  const ScorerConfig cfg;

  const ScoreReport clean = ScoreItinerary(w, MakeItinerary({{"s0", "s1"}, {"s2", "s3"}}), Policy::Walk, cfg);
  EXPECT_TRUE(clean.penalties.empty());
  EXPECT_EQ(clean.total, 0.0);
  EXPECT_TRUE(clean.feasible);
  EXPECT_TRUE(FormatScoreReport(clean).find("no penalties") != std::string::npos);

  const ScoreReport broken = ScoreItinerary(w, MakeItinerary({{"s0", "s1", "s0"}, {"s2", "zz"}}), Policy::Walk, cfg);
  EXPECT_FALSE(broken.feasible);
  EXPECT_EQ(broken.count(PenaltyKind::Structural), 2);
  EXPECT_TRUE(broken.total >= 2.0 * cfg.structuralPenalty);
  // Structural penalties come last within their day.
  ASSERT_TRUE(!broken.penalties.empty());
  EXPECT_EQ(broken.penalties.back().kind, PenaltyKind::Structural);
  EXPECT_EQ(broken.penalties.back().day, 2);
}

static void TestOpeningHours()
{
  World w;
  AddTokyo(w);

  Spot a = MakeSpot("a", kTokyoLat, kTokyoLon);
  a.hours = OpeningHours{9 * 60, 10 * 60};
  Spot b = MakeSpot("b", kTokyoLat + 0.01, kTokyoLon);
  b.hours = OpeningHours{9 * 60, 10 * 60 + 30};
  Spot c = MakeSpot("c", kTokyoLat, kTokyoLon + 0.0001);
  c.hours = OpeningHours{13 * 60, 18 * 60};
  AddOrReport(w, a);
  AddOrReport(w, b);
  AddOrReport(w, c);

  ScorerConfig cfg;
  cfg.minSpotsPerDay = 1;

  // a fits exactly (09:00-10:00); b is reached after 10:00 and runs past 10:30.
  const ScoreReport late = ScoreItinerary(w, MakeItinerary({{"a", "b"}}), Policy::Walk, cfg);
  EXPECT_FALSE(late.feasible);
  ASSERT_TRUE(late.count(PenaltyKind::ClosedSpot) == 1);
  const Penalty& p = late.penalties.back();
  EXPECT_EQ(p.spotId, std::string("b"));
  const double leg = WalkMinutes(GreatCircleKm(a.location, b.location));
  EXPECT_NEAR(p.magnitude, 30.0 + leg, 1e-9);
  EXPECT_EQ(p.cost, cfg.closedSpotPenalty);
  EXPECT_NEAR(late.days[0].endMinute, 600.0 + leg + 60.0, 1e-9);

  // Arriving before opening waits.
  const ScoreReport wait = ScoreItinerary(w, MakeItinerary({{"c"}}), Policy::Walk, cfg);
  EXPECT_TRUE(wait.feasible);
  EXPECT_NEAR(wait.days[0].endMinute, 13 * 60 + 60.0, 1e-9);
}

static void TestScenarioSixSpotsTwoDays()
{
  World w = MakeZigZagWorld(6);

  Itinerary init;
  std::string err;
  ASSERT_TRUE(ConstructItinerary(w, "tokyo", 2, Policy::Walk, init, err));
  ASSERT_TRUE(init.days.size() == 2u);
  EXPECT_EQ(init.days[0].spots.size(), 3u);
  EXPECT_EQ(init.days[1].spots.size(), 3u);
  EXPECT_TRUE(w.validate(init).ok);
  EXPECT_EQ(init.spotCount(), 6);

  // West-to-east chunks.
  SpotSlot slot;
  EXPECT_TRUE(FindSpotSlot(init, "s0", &slot));
  EXPECT_EQ(slot.day, 0);
  EXPECT_TRUE(FindSpotSlot(init, "s5", &slot));
  EXPECT_EQ(slot.day, 1);

  PlanRequest req;
  req.cityId = "tokyo";
  req.days = 2;
  req.policy = Policy::Walk;
  req.scorer.minSpotsPerDay = 2;
  req.scorer.maxSpotsPerDay = 4;
  req.scorer.maxDailyTravelMinutes = 180.0;

  PlanResult res;
  ASSERT_TRUE(PlanItinerary(w, req, res, err));
  EXPECT_TRUE(res.report.total <= res.initialReport.total);
  EXPECT_TRUE(res.report.feasible);
  EXPECT_TRUE(w.validate(res.itinerary).ok);
  EXPECT_TRUE(SameSpotMultiset(res.itinerary, res.initial));
  EXPECT_EQ(res.itinerary.spotCount(), 6);
  EXPECT_EQ(res.stop, StopReason::LocalOptimum);
  EXPECT_FALSE(res.explanation.empty());
}

static void TestScenarioSingleSpotThreeDays()
{
  World w = MakeZigZagWorld(1);

  Itinerary it;
  std::string err;
  ASSERT_TRUE(ConstructItinerary(w, "tokyo", 3, Policy::Walk, it, err));
  ASSERT_TRUE(it.days.size() == 3u);
  EXPECT_EQ(it.days[0].spots.size(), 1u);
  EXPECT_TRUE(it.days[1].spots.empty());
  EXPECT_TRUE(it.days[2].spots.empty());

  ScorerConfig cfg;
  cfg.minSpotsPerDay = 1;
  const ScoreReport r = ScoreItinerary(w, it, Policy::Walk, cfg);
  ASSERT_TRUE(r.penalties.size() == 2u);
  EXPECT_EQ(r.penalties[0].kind, PenaltyKind::Underfill);
  EXPECT_EQ(r.penalties[0].day, 2);
  EXPECT_EQ(r.penalties[1].day, 3);
  EXPECT_TRUE(r.capacityShortfall);
  EXPECT_FALSE(r.feasible);

  // No minimum: empty days are fine.
  cfg.minSpotsPerDay = 0;
  const ScoreReport relaxed = ScoreItinerary(w, it, Policy::Walk, cfg);
  EXPECT_TRUE(relaxed.feasible);
  EXPECT_EQ(relaxed.total, 0.0);
}

static void TestScenarioTaxiNeverSlowerThanWalk()
{
  World w = MakeScatterWorld(12, 7);

  for (const Spot& a : w.spots()) {
    for (const Spot& b : w.spots()) {
      EXPECT_TRUE(TravelTime(a, b, Policy::Taxi) <= TravelTime(a, b, Policy::Walk));
      EXPECT_TRUE(TravelTime(a, b, Policy::Transit) <= TravelTime(a, b, Policy::Walk));
    }
  }

  Itinerary it;
  std::string err;
  ASSERT_TRUE(ConstructItinerary(w, "tokyo", 2, Policy::Walk, it, err));

  ScorerConfig cfg;
  cfg.maxDailyTravelMinutes = 20.0;
  const ScoreReport walk = ScoreItinerary(w, it, Policy::Walk, cfg);
  const ScoreReport taxi = ScoreItinerary(w, it, Policy::Taxi, cfg);
  EXPECT_TRUE(taxi.sumCost(PenaltyKind::TravelTime) <= walk.sumCost(PenaltyKind::TravelTime));
  EXPECT_TRUE(walk.sumCost(PenaltyKind::TravelTime) > 0.0);
}

static World MakeRelocationWorld()
{
  World w;
  AddTokyo(w);
  for (const char* id : {"a", "b", "c", "d", "e", "f"}) {
    AddOrReport(w, MakeSpot(id, kTokyoLat + 0.001 * (id[0] - 'a'), kTokyoLon));
  }
  return w;
}

static void TestScenarioRelocateToUnderfilledDay()
{
  World w = MakeRelocationWorld();
  const Itinerary start = MakeItinerary({{"a", "b", "c", "d", "e"}, {"f"}});

  ScorerConfig sc;
  sc.minSpotsPerDay = 2;
  sc.maxSpotsPerDay = 4;
  sc.maxDailyTravelMinutes = 1000.0;

  EXPECT_EQ(ScoreItinerary(w, start, Policy::Walk, sc).total, 30.0);

  PlannerConfig pc;
  ImproveResult r;
  std::string err;
  ASSERT_TRUE(ImproveItinerary(w, start, Policy::Walk, sc, pc, r, err));
  EXPECT_EQ(r.report.total, 0.0);
  EXPECT_EQ(r.accepted, 1);
  EXPECT_EQ(r.stop, StopReason::LocalOptimum);
  ASSERT_TRUE(r.trace.size() == 1u);
  EXPECT_EQ(r.trace[0].move.kind, MoveKind::Relocate);
  EXPECT_EQ(r.trace[0].move.dayA, 0);
  EXPECT_EQ(r.trace[0].move.dayB, 1);
  EXPECT_EQ(r.trace[0].scoreBefore, 30.0);
  EXPECT_EQ(r.trace[0].scoreAfter, 0.0);
  EXPECT_EQ(r.trace[0].description, std::string("relocate 'a' from day 1 to day 2 (position 1)"));
  EXPECT_EQ(r.itinerary.days[0].spots.size(), 4u);
  EXPECT_EQ(r.itinerary.days[1].spots.size(), 2u);
  EXPECT_EQ(RelocationDistance(start, r.itinerary), 1);

  // Fixed point.
  ImproveResult again;
  ASSERT_TRUE(ImproveItinerary(w, r.itinerary, Policy::Walk, sc, pc, again, err));
  EXPECT_EQ(again.accepted, 0);
  EXPECT_TRUE(again.itinerary == r.itinerary);
  EXPECT_EQ(again.stop, StopReason::LocalOptimum);
  EXPECT_TRUE(SameScoreReport(again.report, r.report));

  // One pass accepts the move, then the pass limit stops the run.
  pc.maxPasses = 1;
  ImproveResult limited;
  ASSERT_TRUE(ImproveItinerary(w, start, Policy::Walk, sc, pc, limited, err));
  EXPECT_EQ(limited.stop, StopReason::PassLimit);
  EXPECT_EQ(limited.accepted, 1);
}

static void TestMovesApplyAndDescribe()
{
  const Itinerary it = MakeItinerary({{"a", "b"}, {"c"}});
  Itinerary out;

  EXPECT_TRUE(ApplyMove(it, Move{MoveKind::Relocate, 0, 0, 1, 1}, out));
  EXPECT_TRUE(out == MakeItinerary({{"b"}, {"c", "a"}}));
  EXPECT_EQ(DescribeMove(it, Move{MoveKind::Relocate, 0, 0, 1, 1}),
            std::string("relocate 'a' from day 1 to day 2 (position 2)"));

  EXPECT_TRUE(ApplyMove(it, Move{MoveKind::SwapWithinDay, 0, 0, 0, 1}, out));
  EXPECT_TRUE(out == MakeItinerary({{"b", "a"}, {"c"}}));

  EXPECT_TRUE(ApplyMove(it, Move{MoveKind::SwapAcrossDays, 0, 1, 1, 0}, out));
  EXPECT_TRUE(out == MakeItinerary({{"a", "c"}, {"b"}}));
  EXPECT_EQ(DescribeMove(it, Move{MoveKind::SwapAcrossDays, 0, 1, 1, 0}),
            std::string("swap 'b' (day 1) with 'c' (day 2)"));

  const Itinerary before = out;
  EXPECT_FALSE(ApplyMove(it, Move{MoveKind::Relocate, 0, 0, 0, 1}, out));
  EXPECT_FALSE(ApplyMove(it, Move{MoveKind::Relocate, 0, 0, 1, 2}, out));
  EXPECT_FALSE(ApplyMove(it, Move{MoveKind::SwapWithinDay, 0, 1, 0, 1}, out));
  EXPECT_FALSE(ApplyMove(it, Move{MoveKind::SwapAcrossDays, 0, 0, 2, 0}, out));
  EXPECT_TRUE(out == before);

  EXPECT_EQ(RelocationCount(MoveKind::SwapWithinDay), 0);
  EXPECT_EQ(RelocationCount(MoveKind::Relocate), 1);
  EXPECT_EQ(RelocationCount(MoveKind::SwapAcrossDays), 2);

  EXPECT_EQ(RelocationDistance(it, MakeItinerary({{"a", "c"}, {"b"}})), 2);
  EXPECT_EQ(RelocationDistance(it, MakeItinerary({{"a"}, {"c"}})), 1);
  EXPECT_FALSE(SameSpotMultiset(it, MakeItinerary({{"a", "a"}, {"c"}})));
}

static void TestMonotoneTraceAndExclusivity()
{
  World w = MakeScatterWorld(20, 42);

  PlanRequest req;
  req.cityId = "tokyo";
  req.days = 4;
  req.scorer.maxDailyTravelMinutes = 60.0;
  req.scorer.minSpotsPerDay = 3;
  req.scorer.maxSpotsPerDay = 6;

  PlanResult res;
  std::string err;
  ASSERT_TRUE(PlanItinerary(w, req, res, err));

  EXPECT_EQ(static_cast<int>(res.trace.size()), res.accepted);
  double prev = res.initialReport.total;
  for (const PlanStep& s : res.trace) {
    EXPECT_EQ(s.scoreBefore, prev);
    EXPECT_TRUE(s.scoreAfter < s.scoreBefore);
    prev = s.scoreAfter;
  }
  EXPECT_EQ(prev, res.report.total);

  EXPECT_TRUE(w.validate(res.itinerary).ok);
  EXPECT_EQ(res.itinerary.spotCount(), 20);
  EXPECT_TRUE(SameSpotMultiset(res.itinerary, res.initial));
  EXPECT_TRUE(SameScoreReport(res.report, ScoreItinerary(w, res.itinerary, req.policy, req.scorer)));
}

static void TestBudgetsAndCancellation()
{
  World w = MakeScatterWorld(20, 42);

  PlanRequest req;
  req.cityId = "tokyo";
  req.days = 4;
  req.scorer.maxDailyTravelMinutes = 30.0;
  req.planner.maxEvaluations = 5;

  PlanResult res;
  std::string err;
  ASSERT_TRUE(PlanItinerary(w, req, res, err));
  EXPECT_EQ(res.stop, StopReason::EvaluationBudget);
  EXPECT_EQ(res.evaluations, 5);
  EXPECT_TRUE(res.report.total <= res.initialReport.total);
  EXPECT_TRUE(res.explanation.find("evaluation_budget") != std::string::npos);

  PlanProgress progress;
  progress.cancel.store(true);
  req.planner.maxEvaluations = 0;
  PlanResult cancelled;
  ASSERT_TRUE(PlanItinerary(w, req, cancelled, err, &progress));
  EXPECT_EQ(cancelled.stop, StopReason::Cancelled);
  EXPECT_EQ(cancelled.evaluations, 0);
  EXPECT_TRUE(cancelled.itinerary == cancelled.initial);
  EXPECT_TRUE(progress.done.load());
  EXPECT_EQ(progress.restartsDone.load(), 1);
}

static void TestRestartsDeterministic()
{
  World w = MakeScatterWorld(18, 3);

  PlanRequest req;
  req.cityId = "tokyo";
  req.days = 3;
  req.scorer.maxDailyTravelMinutes = 45.0;

  PlanResult single;
  std::string err;
  ASSERT_TRUE(PlanItinerary(w, req, single, err));

  req.planner.restarts = 4;
  req.planner.seed = 99;
  req.planner.threads = 3;
  PlanResult a;
  PlanProgress progress;
  ASSERT_TRUE(PlanItinerary(w, req, a, err, &progress));
  EXPECT_EQ(a.restartsTried, 5);
  EXPECT_EQ(progress.restartsDone.load(), 5);
  EXPECT_TRUE(a.report.total <= single.report.total + 1e-9);

  req.planner.threads = 1;
  PlanResult b;
  ASSERT_TRUE(PlanItinerary(w, req, b, err));
  EXPECT_TRUE(a.itinerary == b.itinerary);
  EXPECT_EQ(a.bestRestart, b.bestRestart);
  EXPECT_TRUE(SameScoreReport(a.report, b.report));

  Itinerary s1;
  Itinerary s2;
  ASSERT_TRUE(ConstructItinerarySeeded(w, "tokyo", 3, Policy::Walk, 5, s1, err));
  ASSERT_TRUE(ConstructItinerarySeeded(w, "tokyo", 3, Policy::Walk, 5, s2, err));
  EXPECT_TRUE(s1 == s2);
  EXPECT_TRUE(w.validate(s1).ok);
  EXPECT_EQ(s1.spotCount(), 18);
}

static void TestConfigErrors()
{
  World w = MakeZigZagWorld(4);
  std::string err;

  ScorerConfig sc;
  sc.minSpotsPerDay = 5;
  sc.maxSpotsPerDay = 4;
  EXPECT_FALSE(ValidateScorerConfig(sc, err));
  EXPECT_TRUE(err.find("min_spots_per_day") != std::string::npos);

  sc = ScorerConfig{};
  sc.travelTimeWeight = -1.0;
  EXPECT_FALSE(ValidateScorerConfig(sc, err));
  sc = ScorerConfig{};
  sc.dayStartMinute = 1440.0;
  EXPECT_FALSE(ValidateScorerConfig(sc, err));
  EXPECT_TRUE(ValidateScorerConfig(ScorerConfig{}, err));

  PlannerConfig pc;
  pc.timeBudgetMs = -1;
  EXPECT_FALSE(ValidatePlannerConfig(pc, err));
  pc = PlannerConfig{};
  pc.restarts = -2;
  EXPECT_FALSE(ValidatePlannerConfig(pc, err));

  PlanRequest req;
  PlanResult res;
  req.days = 0;
  EXPECT_FALSE(PlanItinerary(w, req, res, err));
  EXPECT_TRUE(err.find("days") != std::string::npos);

  req.days = 2;
  req.cityId = "kyoto";
  EXPECT_FALSE(PlanItinerary(w, req, res, err));
  EXPECT_TRUE(err.find("kyoto") != std::string::npos);

  req.cityId = "tokyo";
  req.scorer.maxSpotsPerDay = 0;
  PlanProgress progress;
  EXPECT_FALSE(PlanItinerary(w, req, res, err, &progress));
  EXPECT_TRUE(progress.done.load());
  EXPECT_EQ(progress.evaluations.load(), 0);

  Itinerary it;
  EXPECT_FALSE(ConstructItinerary(w, "tokyo", -1, Policy::Walk, it, err));
}

static void TestCatalogParsing()
{
  const std::string text = R"({
    "cities": [{"id": "tokyo", "name": "Tokyo", "bounds": [35.5, 139.5, 35.9, 139.95]}],
    "spots": [
      {"id": "sensoji", "name": "\u6d45\u8349\u5bfa", "lat": 35.7148, "lon": 139.7967,
       "category": "temple", "visit_minutes": 75, "hours": {"open": "06:00", "close": "17:00"}},
      {"name": "Tokyo Tower \ud83d\uddfc", "lat": 35.6586, "lon": 139.7454, "category": "viewpoint"},
      {"id": "fuji", "name": "Mt Fuji", "lat": 35.3606, "lon": 138.7274}
    ]
  })";

  World w;
  std::string err;
  ASSERT_TRUE(ParseCatalogJson(text, w, err));
  EXPECT_EQ(w.spotCount(), 3u);
  EXPECT_EQ(w.cities().size(), 1u);

  const Spot* s = w.findSpot("sensoji");
  ASSERT_TRUE(s != nullptr);
  EXPECT_EQ(s->name, std::string("\xE6\xB5\x85\xE8\x8D\x89\xE5\xAF\xBA"));
  EXPECT_EQ(s->cityId, std::string("tokyo"));
  EXPECT_EQ(s->visitMinutes, 75.0);
  ASSERT_TRUE(s->hours.has_value());
  EXPECT_EQ(s->hours->openMinute, 360);
  EXPECT_EQ(s->hours->closeMinute, 1020);

  // id defaults to name; surrogate pair decodes to one 4-byte sequence.
  const Spot* tower = w.findSpot("Tokyo Tower \xF0\x9F\x97\xBC");
  ASSERT_TRUE(tower != nullptr);
  EXPECT_EQ(tower->visitMinutes, 60.0);
  EXPECT_TRUE(IsOutdoor(*tower));

  // Outside every city's bounds.
  EXPECT_TRUE(w.findSpot("fuji")->cityId.empty());
  EXPECT_EQ(w.spotsInCity("tokyo").size(), 2u);

  // Bare array shape.
  World bare;
  ASSERT_TRUE(ParseCatalogJson(R"([{"name":"A","lat":35.0,"lon":139.0,"category":"park"},
                                   {"name":"B","lat":35.1,"lon":139.1}])",
                               bare, err, "tokyo"));
  EXPECT_EQ(bare.spotsInCity("tokyo").size(), 2u);

  World bad;
  EXPECT_FALSE(ParseCatalogJson(R"({"spots":[{"name":"A","lat":1,"lon":2},{"name":"A","lat":1,"lon":2}]})", bad, err));
  EXPECT_TRUE(err.find("spots[1]") != std::string::npos);
  EXPECT_TRUE(err.find("duplicate") != std::string::npos);

  World bad2;
  EXPECT_FALSE(ParseCatalogJson(R"({"spots":[{"name":"A","lon":2}]})", bad2, err));
  EXPECT_TRUE(err.find("lat") != std::string::npos);

  World bad3;
  EXPECT_FALSE(ParseCatalogJson(R"({"spots":[{"name":"A","lat":1,"lon":2,"hours":{"open":"9am","close":"17:00"}}]})",
                                bad3, err));
  EXPECT_TRUE(err.find("9am") != std::string::npos);

  World bad4;
  EXPECT_FALSE(ParseCatalogJson(R"({"spots":[{"name":"A","lat":1,"lon":2,"hours":{"open":"18:00","close":"09:00"}}]})",
                                bad4, err));

  World bad5;
  EXPECT_FALSE(ParseCatalogJson(R"({"spots": [)", bad5, err));
  EXPECT_FALSE(ParseCatalogJson("42", bad5, err));
}

static void TestSpotSemantics()
{
  EXPECT_TRUE(IsOutdoorCategory("Park"));
  EXPECT_TRUE(IsOutdoorCategory("BEACH"));
  EXPECT_TRUE(IsIndoorCategory("museum"));
  EXPECT_TRUE(IsIndoorCategory("Temple"));
  EXPECT_FALSE(IsOutdoorCategory("museum"));
  EXPECT_FALSE(IsIndoorCategory("park"));
  EXPECT_FALSE(IsIndoorCategory(""));
  EXPECT_FALSE(IsOutdoorCategory("nightlife"));
}

static void TestWeatherReplan()
{
  World w;
  AddTokyo(w);
  AddOrReport(w, MakeSpot("park1", kTokyoLat, kTokyoLon, "park"));
  AddOrReport(w, MakeSpot("museum1", kTokyoLat + 0.001, kTokyoLon, "museum"));
  AddOrReport(w, MakeSpot("museum2", kTokyoLat + 0.002, kTokyoLon, "museum"));
  AddOrReport(w, MakeSpot("shop1", kTokyoLat + 0.003, kTokyoLon, "shopping"));
  AddOrReport(w, MakeSpot("garden1", kTokyoLat + 0.004, kTokyoLon, "garden"));

  Itinerary it = MakeItinerary({{"park1", "museum1"}, {"museum2", "shop1", "garden1"}});
  ScorerConfig sc;
  sc.maxDailyTravelMinutes = 1000.0;

  WeatherReplanResult r;
  std::string err;
  ASSERT_TRUE(ReplanDayForWeather(w, it, 1, Policy::Walk, sc, r, err));
  ASSERT_TRUE(r.swaps.size() == 1u);
  EXPECT_EQ(r.swaps[0].outdoorId, std::string("park1"));
  EXPECT_EQ(r.swaps[0].otherDay, 2);
  EXPECT_TRUE(r.unresolved.empty());
  EXPECT_TRUE(w.validate(it).ok);
  EXPECT_EQ(it.spotCount(), 5);
  for (const std::string& id : it.days[0].spots) EXPECT_FALSE(IsOutdoor(*w.findSpot(id)));
  EXPECT_TRUE(r.scoreAfter <= r.scoreBefore + 1e-9);

  // Day 2 now holds two outdoor spots and day 1 only indoor ones.
  WeatherReplanResult r2;
  ASSERT_TRUE(ReplanDayForWeather(w, it, 2, Policy::Walk, sc, r2, err));
  EXPECT_EQ(r2.swaps.size(), 2u);
  for (const std::string& id : it.days[1].spots) EXPECT_FALSE(IsOutdoor(*w.findSpot(id)));

  // Nothing indoor left elsewhere.
  Itinerary outdoorOnly = MakeItinerary({{"park1"}, {"garden1"}});
  WeatherReplanResult r3;
  ASSERT_TRUE(ReplanDayForWeather(w, outdoorOnly, 1, Policy::Walk, sc, r3, err));
  EXPECT_TRUE(r3.swaps.empty());
  EXPECT_EQ(r3.unresolved.size(), 1u);

  EXPECT_FALSE(ReplanDayForWeather(w, it, 3, Policy::Walk, sc, r3, err));
  EXPECT_FALSE(ReplanDayForWeather(w, it, 0, Policy::Walk, sc, r3, err));
}

static void TestPlanConfigJson()
{
  PlanConfig cfg;
  std::string err;

  JsonValue root;
  ASSERT_TRUE(ParseJson(R"({"policy":"taxi","days":4,"city":"tokyo","planner":{"restarts":3,"seed":12345}})", root,
                        err));
  ASSERT_TRUE(ApplyPlanConfigJson(root, cfg, err));
  EXPECT_EQ(cfg.policy, Policy::Taxi);
  EXPECT_EQ(cfg.days, 4);
  EXPECT_EQ(cfg.cityId, std::string("tokyo"));
  EXPECT_EQ(cfg.scorer.maxDailyTravelMinutes, 360.0);
  EXPECT_EQ(cfg.scorer.minSpotsPerDay, 2);
  EXPECT_EQ(cfg.planner.restarts, 3);
  EXPECT_EQ(cfg.planner.seed, 12345u);

  // Explicit cap wins over the policy default.
  ASSERT_TRUE(ParseJson(R"({"policy":"transit","scorer":{"max_daily_travel_minutes":90}})", root, err));
  ASSERT_TRUE(ApplyPlanConfigJson(root, cfg, err));
  EXPECT_EQ(cfg.scorer.maxDailyTravelMinutes, 90.0);
  EXPECT_EQ(cfg.days, 4);

  // Errors leave the config untouched.
  const PlanConfig before = cfg;
  ASSERT_TRUE(ParseJson(R"({"days":"three"})", root, err));
  EXPECT_FALSE(ApplyPlanConfigJson(root, cfg, err));
  EXPECT_TRUE(err.find("days") != std::string::npos);
  ASSERT_TRUE(ParseJson(R"({"scorer":{"min_spots_per_day":2.5}})", root, err));
  EXPECT_FALSE(ApplyPlanConfigJson(root, cfg, err));
  EXPECT_TRUE(err.rfind("scorer:", 0) == 0);
  ASSERT_TRUE(ParseJson(R"({"policy":"rocket"})", root, err));
  EXPECT_FALSE(ApplyPlanConfigJson(root, cfg, err));
  EXPECT_EQ(cfg.days, before.days);
  EXPECT_EQ(cfg.policy, before.policy);

  // Serialized config reads back unchanged.
  cfg.scorer.travelTimeWeight = 2.25;
  cfg.planner.recordTrace = false;
  cfg.planner.timeBudgetMs = 500;
  const std::string json = PlanConfigToJson(cfg);
  ASSERT_TRUE(ParseJson(json, root, err));
  PlanConfig back;
  ASSERT_TRUE(ApplyPlanConfigJson(root, back, err));
  EXPECT_EQ(back.policy, cfg.policy);
  EXPECT_EQ(back.days, cfg.days);
  EXPECT_EQ(back.cityId, cfg.cityId);
  EXPECT_EQ(back.scorer.maxDailyTravelMinutes, cfg.scorer.maxDailyTravelMinutes);
  EXPECT_EQ(back.scorer.travelTimeWeight, 2.25);
  EXPECT_EQ(back.planner.seed, cfg.planner.seed);
  EXPECT_EQ(back.planner.timeBudgetMs, 500);
  EXPECT_FALSE(back.planner.recordTrace);
}

static void TestPlanExport()
{
  World w = MakeZigZagWorld(7);

  PlanRequest req;
  req.cityId = "tokyo";
  req.days = 2;
  req.scorer.maxSpotsPerDay = 3;

  PlanResult res;
  std::string err;
  ASSERT_TRUE(PlanItinerary(w, req, res, err));

  std::ostringstream oss;
  ASSERT_TRUE(WritePlanJson(oss, w, req, res, err));

  const std::string doc = oss.str();
  ASSERT_TRUE(doc.size() >= 2u);
  EXPECT_EQ(doc.substr(doc.size() - 2), std::string("}\n"));

  std::ostringstream compact;
  ASSERT_TRUE(WritePlanJson(compact, w, req, res, err, 0));
  EXPECT_EQ(compact.str().find('\n'), compact.str().size() - 1);

  JsonValue root;
  ASSERT_TRUE(ParseJson(doc, root, err));
  ASSERT_TRUE(root.isObject());

  const JsonValue* policy = FindJsonMember(root, "policy");
  ASSERT_TRUE(policy && policy->isString());
  EXPECT_EQ(policy->stringValue, std::string("walk"));

  const JsonValue* score = FindJsonMember(root, "score");
  ASSERT_TRUE(score && score->isNumber());
  EXPECT_NEAR(score->numberValue, res.report.total, 1e-6);

  const JsonValue* days = FindJsonMember(root, "days");
  ASSERT_TRUE(days && days->isArray());
  ASSERT_TRUE(days->arrayValue.size() == 2u);

  int spots = 0;
  for (const JsonValue& d : days->arrayValue) {
    const JsonValue* list = FindJsonMember(d, "spots");
    ASSERT_TRUE(list && list->isArray());
    for (const JsonValue& s : list->arrayValue) {
      const JsonValue* id = FindJsonMember(s, "id");
      ASSERT_TRUE(id && id->isString());
      EXPECT_TRUE(w.findSpot(id->stringValue) != nullptr);
      ++spots;
    }
  }
  EXPECT_EQ(spots, 7);

  const JsonValue* penalties = FindJsonMember(root, "penalties");
  ASSERT_TRUE(penalties && penalties->isArray());
  EXPECT_EQ(penalties->arrayValue.size(), res.report.penalties.size());

  const JsonValue* stop = FindJsonMember(root, "stop");
  ASSERT_TRUE(stop && stop->isString());
  EXPECT_EQ(stop->stringValue, std::string(ToString(res.stop)));

  std::ostringstream text;
  WritePlanText(text, w, req, res);
  EXPECT_TRUE(text.str().find("Best score: ") != std::string::npos);
  EXPECT_TRUE(text.str().find("Day 2") != std::string::npos);
  EXPECT_TRUE(text.str().find("Self-check report") != std::string::npos);

  const fs::path out = MakeTempPath("tripweave_export") / "plan.json";
  std::error_code ec;
  fs::create_directories(out.parent_path(), ec);
  ASSERT_TRUE(ExportPlanJsonFile(out.string(), w, req, res, err));
  JsonValue fromFile;
  EXPECT_TRUE(LoadJsonFile(out.string(), fromFile, err));
  fs::remove_all(out.parent_path(), ec);
}

static void TestExplanationWording()
{
  World w = MakeZigZagWorld(4);

  PlanRequest req;
  req.cityId = "tokyo";
  req.days = 2;

  PlanResult res;
  std::string err;
  ASSERT_TRUE(PlanItinerary(w, req, res, err));
  EXPECT_TRUE(res.report.penalties.empty());
  EXPECT_TRUE(res.explanation.find("No soft constraint is violated") != std::string::npos);

  // Too few spots for a 3-per-day minimum: every remaining penalty is named.
  req.scorer.minSpotsPerDay = 3;
  ASSERT_TRUE(PlanItinerary(w, req, res, err));
  EXPECT_FALSE(res.report.feasible);
  EXPECT_TRUE(res.explanation.find("short of the daily minimum") != std::string::npos);
  EXPECT_TRUE(res.explanation.find("infeasible") != std::string::npos);
}

static void TestLogTeeRotation()
{
  const fs::path dir = MakeTempPath("tripweave_log");
  const fs::path log = dir / "run.log";
  std::string err;

  {
    LogTee tee;
    LogTeeOptions opt;
    opt.path = log;
    opt.teeStderr = false;
    ASSERT_TRUE(tee.start(opt, err));
    EXPECT_TRUE(tee.active());
    std::cout << "first run\n";
    std::cout.flush();
  }

  const std::string first = ReadFile(log);
  EXPECT_TRUE(first.find("[OUT] first run") != std::string::npos);

  {
    LogTee tee;
    LogTeeOptions opt;
    opt.path = log;
    opt.prefixLines = false;
    opt.teeStderr = false;
    ASSERT_TRUE(tee.start(opt, err));
    std::cout << "second run\n";
    tee.stop();
    EXPECT_FALSE(tee.active());
  }

  EXPECT_EQ(ReadFile(log), std::string("second run\n"));
  EXPECT_TRUE(ReadFile(fs::path(log.string() + ".1")).find("first run") != std::string::npos);

  LogTee empty;
  EXPECT_FALSE(empty.start(LogTeeOptions{}, err));

  std::error_code ec;
  fs::remove_all(dir, ec);
}

static void TestDayTravelZeroLegs()
{
  World w = MakeZigZagWorld(2);

  for (int p = 0; p < kPolicyCount; ++p) {
    const Policy policy = static_cast<Policy>(p);
    EXPECT_EQ(DayTravelTime(w, DayPlan{}, policy), 0.0);
    EXPECT_EQ(DayTravelTime(w, DayPlan{{"s0"}}, policy), 0.0);
    EXPECT_EQ(DayTravelTime(w, DayPlan{{"s1", "s1"}}, policy), 0.0);
    EXPECT_EQ(DayTravelTime(w, DayPlan{{"s0", "nowhere"}}, policy), 0.0);
    EXPECT_TRUE(DayTravelTime(w, DayPlan{{"s0", "s1"}}, policy) > 0.0);
  }

  const ScoreReport r = ScoreItinerary(w, MakeItinerary({{}, {"s0"}}), Policy::Walk, ScorerConfig{});
  ASSERT_TRUE(r.days.size() == 2u);
  EXPECT_EQ(r.days[0].travelMinutes, 0.0);
  EXPECT_EQ(r.days[1].travelMinutes, 0.0);
  EXPECT_EQ(r.count(PenaltyKind::TravelTime), 0);
}

static void TestCapacityShortfallLargeMinimum()
{
  World w = MakeZigZagWorld(1);

  ScorerConfig cfg;
  cfg.minSpotsPerDay = 1000000000;
  cfg.maxSpotsPerDay = 1000000000;
  std::string err;
  ASSERT_TRUE(ValidateScorerConfig(cfg, err));

  const ScoreReport r = ScoreItinerary(w, MakeItinerary({{"s0"}, {}, {}}), Policy::Walk, cfg);
  EXPECT_TRUE(r.capacityShortfall);
  EXPECT_FALSE(r.feasible);
  EXPECT_EQ(r.count(PenaltyKind::Underfill), 3);
}

static void TestTimeBudgetStop()
{
  World w = MakeScatterWorld(150, 11);

  PlanRequest req;
  req.cityId = "tokyo";
  req.days = 6;
  req.scorer.maxDailyTravelMinutes = 30.0;
  req.planner.maxEvaluations = 0;
  req.planner.maxPasses = 0;
  req.planner.timeBudgetMs = 1;

  PlanResult res;
  std::string err;
  ASSERT_TRUE(PlanItinerary(w, req, res, err));
  EXPECT_EQ(res.stop, StopReason::TimeBudget);
  EXPECT_TRUE(w.validate(res.itinerary).ok);
  EXPECT_EQ(res.itinerary.spotCount(), 150);
  EXPECT_TRUE(res.report.total <= res.initialReport.total);
  EXPECT_TRUE(res.explanation.find("time_budget") != std::string::npos);
}

static void TestSeedRange()
{
  std::string err;
  PlannerConfig pc;

  pc.seed = std::numeric_limits<std::uint64_t>::max();
  EXPECT_FALSE(ValidatePlannerConfig(pc, err));
  EXPECT_TRUE(err.find("seed") != std::string::npos);

  PlanRequest req;
  req.planner.seed = kMaxPlannerSeed + 1;
  PlanResult res;
  World w = MakeZigZagWorld(2);
  EXPECT_FALSE(PlanItinerary(w, req, res, err));

  // The largest accepted seed survives a JSON round trip.
  pc.seed = kMaxPlannerSeed;
  EXPECT_TRUE(ValidatePlannerConfig(pc, err));
  JsonValue root;
  ASSERT_TRUE(ParseJson(PlannerConfigToJson(pc), root, err));
  PlannerConfig back;
  ASSERT_TRUE(ApplyPlannerConfigJson(root, back, err));
  EXPECT_EQ(back.seed, kMaxPlannerSeed);
}

static void TestPolicyKeepsExplicitTravelCap()
{
  PlanConfig fresh;
  SetPlanPolicy(fresh, Policy::Taxi);
  EXPECT_EQ(fresh.policy, Policy::Taxi);
  EXPECT_EQ(fresh.scorer.maxDailyTravelMinutes, 360.0);

  PlanConfig cfg;
  std::string err;
  JsonValue root;
  ASSERT_TRUE(ParseJson(R"({"scorer":{"max_daily_travel_minutes":75}})", root, err));
  ASSERT_TRUE(ApplyPlanConfigJson(root, cfg, err));
  EXPECT_TRUE(cfg.travelCapSet);

  SetPlanPolicy(cfg, Policy::Transit);
  EXPECT_EQ(cfg.policy, Policy::Transit);
  EXPECT_EQ(cfg.scorer.maxDailyTravelMinutes, 75.0);

  // A later document naming only a policy keeps the explicit cap too.
  ASSERT_TRUE(ParseJson(R"({"policy":"taxi"})", root, err));
  ASSERT_TRUE(ApplyPlanConfigJson(root, cfg, err));
  EXPECT_EQ(cfg.policy, Policy::Taxi);
  EXPECT_EQ(cfg.scorer.maxDailyTravelMinutes, 75.0);
}

int main()
{
  TestGreatCircleAndZeroLegs();
  TestPolicyParsing();
  TestWorldAddAndValidate();
  TestScorerFormulaAndOrdering();
  TestScorerStructuralAndEmpty();
  TestOpeningHours();
  TestScenarioSixSpotsTwoDays();
  TestScenarioSingleSpotThreeDays();
  TestScenarioTaxiNeverSlowerThanWalk();
  TestScenarioRelocateToUnderfilledDay();
  TestMovesApplyAndDescribe();
  TestMonotoneTraceAndExclusivity();
  TestBudgetsAndCancellation();
  TestRestartsDeterministic();
  TestConfigErrors();
  TestCatalogParsing();
  TestSpotSemantics();
  TestWeatherReplan();
  TestPlanConfigJson();
  TestPlanExport();
  TestExplanationWording();
  TestLogTeeRotation();
  TestDayTravelZeroLegs();
  TestCapacityShortfallLargeMinimum();
  TestTimeBudgetStop();
  TestSeedRange();
  TestPolicyKeepsExplicitTravelCap();

  if (g_failures == 0) {
    std::cout << "tripweave_tests: OK\n";
    return 0;
  }

  std::cerr << "tripweave_tests: FAILED (" << g_failures << ")\n";
  return 1;
}
