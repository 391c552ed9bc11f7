#include "tripweave/Planner.hpp"

#include "tripweave/Random.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>

namespace tripweave {

namespace {

// Acceptance threshold: a candidate must beat the current score by more than this.
constexpr double kScoreEps = 1e-9;

constexpr double kPi = 3.14159265358979323846;

using Clock = std::chrono::steady_clock;

// Deadline of a planning call; `active` is false when no time budget is set.
struct Deadline {
  bool active = false;
  Clock::time_point at;
};

Deadline MakeDeadline(int timeBudgetMs)
{
  Deadline d;
  if (timeBudgetMs > 0) {
    d.active = true;
    d.at = Clock::now() + std::chrono::milliseconds(timeBudgetMs);
  }
  return d;
}

void ReportInvariant(const std::string& msg, std::string& outError)
{
  outError = "internal invariant violated: " + msg;
  std::cerr << "[planner] " << outError << "\n";
}

inline bool BetterTotal(double a, double b)
{
  return a < b - kScoreEps;
}

// Order a chunk by nearest neighbour, starting from its first spot. Ties keep
// the earlier spot.
std::vector<const Spot*> NearestNeighbourOrder(const std::vector<const Spot*>& chunk, Policy policy)
{
  std::vector<const Spot*> out;
  if (chunk.empty()) return out;
  out.reserve(chunk.size());

  std::vector<bool> used(chunk.size(), false);
  std::size_t cur = 0;
  used[0] = true;
  out.push_back(chunk[0]);

  for (std::size_t step = 1; step < chunk.size(); ++step) {
    std::size_t best = chunk.size();
    double bestMin = 0.0;
    for (std::size_t i = 0; i < chunk.size(); ++i) {
      if (used[i]) continue;
      const double t = TravelTime(*chunk[cur], *chunk[i], policy);
      if (best == chunk.size() || t < bestMin) {
        best = i;
        bestMin = t;
      }
    }
    used[best] = true;
    out.push_back(chunk[best]);
    cur = best;
  }
  return out;
}

bool ConstructImpl(const World& world, const std::string& cityId, int days, Policy policy, bool seeded,
                   std::uint64_t seed, Itinerary& out, std::string& outError)
{
  if (days <= 0) {
    outError = "days must be >= 1 (got " + std::to_string(days) + ")";
    return false;
  }
  if (!cityId.empty() && !world.findCity(cityId)) {
    outError = "unknown city '" + cityId + "'";
    return false;
  }

  std::vector<const Spot*> spots = world.spotsInCity(cityId);

  if (!seeded) {
    std::sort(spots.begin(), spots.end(), [](const Spot* a, const Spot* b) {
      if (a->location.lon != b->location.lon) return a->location.lon < b->location.lon;
      if (a->location.lat != b->location.lat) return a->location.lat < b->location.lat;
      return a->id < b->id;
    });
  } else {
    RNG rng(seed);
    const double bearing = rng.rangeF64(0.0, 2.0 * kPi);
    const double ux = std::cos(bearing);
    const double uy = std::sin(bearing);

    std::vector<std::pair<double, const Spot*>> keyed;
    keyed.reserve(spots.size());
    for (const Spot* s : spots) keyed.emplace_back(ux * s->location.lon + uy * s->location.lat, s);
    std::sort(keyed.begin(), keyed.end(), [](const auto& a, const auto& b) {
      if (a.first != b.first) return a.first < b.first;
      return a.second->id < b.second->id;
    });
    for (std::size_t i = 0; i < keyed.size(); ++i) spots[i] = keyed[i].second;
  }

  Itinerary it;
  it.cityId = cityId;
  it.days.resize(static_cast<std::size_t>(days));

  const std::size_t n = spots.size();
  const std::size_t base = n / static_cast<std::size_t>(days);
  const std::size_t rem = n % static_cast<std::size_t>(days);

  std::size_t next = 0;
  for (std::size_t d = 0; d < it.days.size(); ++d) {
    const std::size_t take = base + (d < rem ? 1u : 0u);
    std::vector<const Spot*> chunk(spots.begin() + static_cast<std::ptrdiff_t>(next),
                                   spots.begin() + static_cast<std::ptrdiff_t>(next + take));
    next += take;

    for (const Spot* s : NearestNeighbourOrder(chunk, policy)) it.days[d].spots.push_back(s->id);
  }

  if (it.spotCount() != static_cast<int>(n) || !world.validate(it).ok) {
    ReportInvariant("construction did not assign every eligible spot exactly once", outError);
    return false;
  }

  out = std::move(it);
  return true;
}

struct ImproveContext {
  const World& world;
  Policy policy;
  const ScorerConfig& scorer;
  const PlannerConfig& cfg;
  Deadline deadline;
  PlanProgress* progress = nullptr;
};

bool ImproveImpl(const ImproveContext& ctx, const Itinerary& start, ImproveResult& out, std::string& outError)
{
  ImproveResult res;
  res.itinerary = start;
  res.report = ScoreItinerary(ctx.world, start, ctx.policy, ctx.scorer);

  Itinerary& current = res.itinerary;
  bool invariantBroken = false;
  bool halted = false;

  auto shouldStop = [&](StopReason& why) -> bool {
    if (ctx.progress && ctx.progress->cancel.load()) {
      why = StopReason::Cancelled;
      return true;
    }
    if (ctx.deadline.active && Clock::now() >= ctx.deadline.at) {
      why = StopReason::TimeBudget;
      return true;
    }
    if (ctx.cfg.maxEvaluations > 0 && res.evaluations >= ctx.cfg.maxEvaluations) {
      why = StopReason::EvaluationBudget;
      return true;
    }
    return false;
  };

  // 0 = keep enumerating, 1 = accepted, 2 = halt.
  auto tryMove = [&](const Move& m) -> int {
    StopReason why = StopReason::LocalOptimum;
    if (shouldStop(why)) {
      res.stop = why;
      halted = true;
      return 2;
    }

    Itinerary cand;
    if (!ApplyMove(current, m, cand)) return 0;

    ++res.evaluations;
    if (ctx.progress) ctx.progress->evaluations.fetch_add(1);

    ScoreReport rep = ScoreItinerary(ctx.world, cand, ctx.policy, ctx.scorer);
    if (!BetterTotal(rep.total, res.report.total)) return 0;

    if (!SameSpotMultiset(current, cand)) {
      ReportInvariant(std::string(ToString(m.kind)) + " changed the set of planned spots", outError);
      invariantBroken = true;
      return 2;
    }

    ++res.accepted;
    if (ctx.progress) ctx.progress->accepted.fetch_add(1);

    if (ctx.cfg.recordTrace) {
      PlanStep step;
      step.index = res.accepted;
      step.move = m;
      step.description = DescribeMove(current, m);
      step.scoreBefore = res.report.total;
      step.scoreAfter = rep.total;
      res.trace.push_back(std::move(step));
    }

    current = std::move(cand);
    res.report = std::move(rep);
    return 1;
  };

  for (;;) {
    if (ctx.cfg.maxPasses > 0 && res.passes >= ctx.cfg.maxPasses) {
      res.stop = StopReason::PassLimit;
      break;
    }
    ++res.passes;
    if (ctx.progress) ctx.progress->passes.fetch_add(1);

    const int dayCount = current.dayCount();
    int status = 0;

    // Within-day swaps.
    for (int d = 0; d < dayCount && status == 0; ++d) {
      const int n = static_cast<int>(current.days[static_cast<std::size_t>(d)].spots.size());
      for (int i = 0; i < n && status == 0; ++i) {
        for (int j = i + 1; j < n && status == 0; ++j) {
          status = tryMove(Move{MoveKind::SwapWithinDay, d, i, d, j});
        }
      }
    }

    // Relocations to any slot of another day.
    for (int a = 0; a < dayCount && status == 0; ++a) {
      const int na = static_cast<int>(current.days[static_cast<std::size_t>(a)].spots.size());
      for (int i = 0; i < na && status == 0; ++i) {
        for (int b = 0; b < dayCount && status == 0; ++b) {
          if (b == a) continue;
          const int nb = static_cast<int>(current.days[static_cast<std::size_t>(b)].spots.size());
          for (int p = 0; p <= nb && status == 0; ++p) {
            status = tryMove(Move{MoveKind::Relocate, a, i, b, p});
          }
        }
      }
    }

    // Cross-day swaps.
    for (int a = 0; a < dayCount && status == 0; ++a) {
      const int na = static_cast<int>(current.days[static_cast<std::size_t>(a)].spots.size());
      for (int b = a + 1; b < dayCount && status == 0; ++b) {
        const int nb = static_cast<int>(current.days[static_cast<std::size_t>(b)].spots.size());
        for (int i = 0; i < na && status == 0; ++i) {
          for (int j = 0; j < nb && status == 0; ++j) {
            status = tryMove(Move{MoveKind::SwapAcrossDays, a, i, b, j});
          }
        }
      }
    }

    if (invariantBroken) return false;
    if (halted) break;
    if (status == 0) {
      res.stop = StopReason::LocalOptimum;
      break;
    }
  }

  out = std::move(res);
  return true;
}

std::string Fixed(double v, int digits)
{
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(digits) << v;
  return oss.str();
}

struct RestartOutcome {
  bool ok = false;
  std::string error;
  Itinerary initial;
  ScoreReport initialReport;
  ImproveResult improved;
};

} // namespace

const char* ToString(MoveKind k)
{
  switch (k) {
  case MoveKind::SwapWithinDay: return "swap_within_day";
  case MoveKind::Relocate: return "relocate";
  case MoveKind::SwapAcrossDays: return "swap_across_days";
  }
  return "unknown";
}

int RelocationCount(MoveKind k)
{
  switch (k) {
  case MoveKind::SwapWithinDay: return 0;
  case MoveKind::Relocate: return 1;
  case MoveKind::SwapAcrossDays: return 2;
  }
  return 0;
}

const char* ToString(StopReason r)
{
  switch (r) {
  case StopReason::LocalOptimum: return "local_optimum";
  case StopReason::EvaluationBudget: return "evaluation_budget";
  case StopReason::TimeBudget: return "time_budget";
  case StopReason::Cancelled: return "cancelled";
  case StopReason::PassLimit: return "pass_limit";
  }
  return "unknown";
}

bool ApplyMove(const Itinerary& in, const Move& m, Itinerary& out)
{
  const int dayCount = in.dayCount();
  if (m.dayA < 0 || m.dayA >= dayCount || m.dayB < 0 || m.dayB >= dayCount) return false;

  const auto& srcA = in.days[static_cast<std::size_t>(m.dayA)].spots;
  const auto& srcB = in.days[static_cast<std::size_t>(m.dayB)].spots;
  const int na = static_cast<int>(srcA.size());
  const int nb = static_cast<int>(srcB.size());
  if (m.posA < 0 || m.posA >= na) return false;

  switch (m.kind) {
  case MoveKind::SwapWithinDay: {
    if (m.dayA != m.dayB || m.posB < 0 || m.posB >= na || m.posA == m.posB) return false;
    Itinerary next = in;
    auto& spots = next.days[static_cast<std::size_t>(m.dayA)].spots;
    std::swap(spots[static_cast<std::size_t>(m.posA)], spots[static_cast<std::size_t>(m.posB)]);
    out = std::move(next);
    return true;
  }
  case MoveKind::Relocate: {
    if (m.dayA == m.dayB || m.posB < 0 || m.posB > nb) return false;
    Itinerary next = in;
    auto& from = next.days[static_cast<std::size_t>(m.dayA)].spots;
    auto& to = next.days[static_cast<std::size_t>(m.dayB)].spots;
    std::string id = from[static_cast<std::size_t>(m.posA)];
    from.erase(from.begin() + m.posA);
    to.insert(to.begin() + m.posB, std::move(id));
    out = std::move(next);
    return true;
  }
  case MoveKind::SwapAcrossDays: {
    if (m.dayA == m.dayB || m.posB < 0 || m.posB >= nb) return false;
    Itinerary next = in;
    std::swap(next.days[static_cast<std::size_t>(m.dayA)].spots[static_cast<std::size_t>(m.posA)],
              next.days[static_cast<std::size_t>(m.dayB)].spots[static_cast<std::size_t>(m.posB)]);
    out = std::move(next);
    return true;
  }
  }
  return false;
}

std::string DescribeMove(const Itinerary& before, const Move& m)
{
  auto idAt = [&](int day, int pos) -> std::string {
    if (day < 0 || day >= before.dayCount()) return "?";
    const auto& spots = before.days[static_cast<std::size_t>(day)].spots;
    if (pos < 0 || pos >= static_cast<int>(spots.size())) return "?";
    return spots[static_cast<std::size_t>(pos)];
  };

  std::ostringstream oss;
  switch (m.kind) {
  case MoveKind::SwapWithinDay:
    oss << "swap '" << idAt(m.dayA, m.posA) << "' and '" << idAt(m.dayA, m.posB) << "' on day " << (m.dayA + 1);
    break;
  case MoveKind::Relocate:
    oss << "relocate '" << idAt(m.dayA, m.posA) << "' from day " << (m.dayA + 1) << " to day " << (m.dayB + 1)
        << " (position " << (m.posB + 1) << ")";
    break;
  case MoveKind::SwapAcrossDays:
    oss << "swap '" << idAt(m.dayA, m.posA) << "' (day " << (m.dayA + 1) << ") with '" << idAt(m.dayB, m.posB)
        << "' (day " << (m.dayB + 1) << ")";
    break;
  }
  return oss.str();
}

bool ValidatePlannerConfig(const PlannerConfig& cfg, std::string& outError)
{
  outError.clear();
  if (cfg.maxEvaluations < 0) {
    outError = "max_evaluations must be >= 0";
    return false;
  }
  if (cfg.maxPasses < 0) {
    outError = "max_passes must be >= 0";
    return false;
  }
  if (cfg.timeBudgetMs < 0) {
    outError = "time_budget_ms must be >= 0";
    return false;
  }
  if (cfg.restarts < 0) {
    outError = "restarts must be >= 0";
    return false;
  }
  if (cfg.threads < 0) {
    outError = "threads must be >= 0";
    return false;
  }
  if (cfg.seed > kMaxPlannerSeed) {
    outError = "seed must be <= 2^53 (got " + std::to_string(cfg.seed) + ")";
    return false;
  }
  return true;
}

bool ConstructItinerary(const World& world, const std::string& cityId, int days, Policy policy, Itinerary& out,
                        std::string& outError)
{
  return ConstructImpl(world, cityId, days, policy, false, 0, out, outError);
}

bool ConstructItinerarySeeded(const World& world, const std::string& cityId, int days, Policy policy,
                              std::uint64_t seed, Itinerary& out, std::string& outError)
{
  return ConstructImpl(world, cityId, days, policy, true, seed, out, outError);
}

bool ImproveItinerary(const World& world, const Itinerary& start, Policy policy, const ScorerConfig& scorer,
                      const PlannerConfig& cfg, ImproveResult& out, std::string& outError, PlanProgress* progress)
{
  if (!ValidateScorerConfig(scorer, outError)) return false;
  if (!ValidatePlannerConfig(cfg, outError)) return false;

  const ImproveContext ctx{world, policy, scorer, cfg, MakeDeadline(cfg.timeBudgetMs), progress};
  return ImproveImpl(ctx, start, out, outError);
}

bool PlanItinerary(const World& world, const PlanRequest& req, PlanResult& out, std::string& outError,
                   PlanProgress* progress)
{
  struct DoneGuard {
    PlanProgress* p;
    ~DoneGuard()
    {
      if (p) p->done.store(true);
    }
  } doneGuard{progress};

  if (!ValidateScorerConfig(req.scorer, outError)) return false;
  if (!ValidatePlannerConfig(req.planner, outError)) return false;
  if (req.days <= 0) {
    outError = "days must be >= 1 (got " + std::to_string(req.days) + ")";
    return false;
  }
  if (!req.cityId.empty() && !world.findCity(req.cityId)) {
    outError = "unknown city '" + req.cityId + "'";
    return false;
  }

  const ImproveContext ctx{world, req.policy, req.scorer, req.planner, MakeDeadline(req.planner.timeBudgetMs),
                           progress};

  const std::size_t runs = static_cast<std::size_t>(req.planner.restarts) + 1u;
  std::vector<RestartOutcome> outcomes(runs);

  auto runOne = [&](std::size_t r) {
    RestartOutcome& o = outcomes[r];
    bool built = false;
    if (r == 0) {
      built = ConstructItinerary(world, req.cityId, req.days, req.policy, o.initial, o.error);
    } else {
      built = ConstructItinerarySeeded(world, req.cityId, req.days, req.policy,
                                       DeriveSeed(req.planner.seed, static_cast<std::uint64_t>(r)), o.initial,
                                       o.error);
    }
    if (built) {
      o.initialReport = ScoreItinerary(world, o.initial, req.policy, req.scorer);
      o.ok = ImproveImpl(ctx, o.initial, o.improved, o.error);
    }
    if (progress) progress->restartsDone.fetch_add(1);
  };

  int threads = req.planner.threads;
  if (threads <= 0) {
    threads = static_cast<int>(std::thread::hardware_concurrency());
    if (threads <= 0) threads = 1;
  }
  threads = std::min<int>(threads, static_cast<int>(runs));

  if (threads <= 1) {
    for (std::size_t r = 0; r < runs; ++r) runOne(r);
  } else {
    std::atomic<std::size_t> next{0};
    std::vector<std::thread> pool;
    pool.reserve(static_cast<std::size_t>(threads));
    for (int t = 0; t < threads; ++t) {
      pool.emplace_back([&]() {
        for (;;) {
          const std::size_t i = next.fetch_add(1);
          if (i >= runs) break;
          runOne(i);
        }
      });
    }
    for (auto& th : pool) th.join();
  }

  // Errors from any run abort the call; the lowest restart index is reported.
  for (const RestartOutcome& o : outcomes) {
    if (!o.ok) {
      outError = o.error;
      return false;
    }
  }

  std::size_t best = 0;
  for (std::size_t r = 1; r < runs; ++r) {
    if (BetterTotal(outcomes[r].improved.report.total, outcomes[best].improved.report.total)) best = r;
  }

  PlanResult res;
  RestartOutcome& win = outcomes[best];
  res.itinerary = std::move(win.improved.itinerary);
  res.report = std::move(win.improved.report);
  res.initial = std::move(win.initial);
  res.initialReport = std::move(win.initialReport);
  res.stop = win.improved.stop;
  res.trace = std::move(win.improved.trace);
  res.bestRestart = static_cast<int>(best);
  res.restartsTried = static_cast<int>(runs);

  for (const RestartOutcome& o : outcomes) {
    res.evaluations += o.improved.evaluations;
    res.accepted += o.improved.accepted;
    res.passes += o.improved.passes;
  }

  res.explanation = BuildExplanation(res);
  out = std::move(res);
  return true;
}

std::string BuildExplanation(const PlanResult& r)
{
  std::ostringstream oss;

  const int steps = static_cast<int>(r.trace.size());
  if (steps > 0) {
    oss << "Selected after " << steps << " accepted move(s), improving the score from "
        << Fixed(r.initialReport.total, 2) << " to " << Fixed(r.report.total, 2) << ".";
  } else {
    oss << "Kept the initial construction (score " << Fixed(r.report.total, 2)
        << "); no candidate move lowered it.";
  }
  if (r.restartsTried > 1) {
    oss << " Best of " << r.restartsTried << " constructions (restart " << r.bestRestart << ").";
  }

  if (r.report.penalties.empty()) {
    oss << " No soft constraint is violated.";
  } else {
    std::vector<std::string> items;
    items.reserve(r.report.penalties.size());
    for (const Penalty& p : r.report.penalties) {
      items.push_back("day-" + std::to_string(p.day) + " " + DescribePenalty(p));
    }

    std::string joined;
    for (std::size_t i = 0; i < items.size(); ++i) {
      if (i > 0) joined += (i + 1 == items.size()) ? " or " : ", ";
      joined += items[i];
    }

    if (r.stop == StopReason::LocalOptimum) {
      oss << " No single swap or relocation reduced the " << joined << " without raising the total.";
    } else {
      oss << " Search stopped early (" << ToString(r.stop) << ") with " << joined << " remaining.";
    }
  }

  if (!r.report.feasible) {
    oss << " The itinerary is infeasible:";
    if (!r.report.structural.empty()) oss << " " << r.report.structural.size() << " structural issue(s);";
    const int closed = r.report.count(PenaltyKind::ClosedSpot);
    if (closed > 0) oss << " " << closed << " spot(s) outside opening hours;";
    if (r.report.capacityShortfall) oss << " too few spots to meet the daily minimum on every day;";
    std::string s = oss.str();
    if (!s.empty() && s.back() == ';') s.back() = '.';
    return s;
  }

  return oss.str();
}

} // namespace tripweave
