#pragma once

#include "tripweave/Geometry.hpp"
#include "tripweave/Itinerary.hpp"
#include "tripweave/Scorer.hpp"
#include "tripweave/World.hpp"

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

namespace tripweave {

// Itinerary planner.
//
// Construct builds a deterministic initial split (west-to-east chunks, each
// ordered by nearest neighbour). Improve is a first-improvement local search
// over an explicitly enumerated neighbourhood:
//   1) SwapWithinDay  : reorder two spots of one day      (0 spots change day)
//   2) Relocate       : move one spot to another day/slot (1 spot changes day)
//   3) SwapAcrossDays : exchange spots between two days   (2 spots change day)
// Candidates are enumerated in that order; the first one that lowers the total
// score by more than kScoreEps is accepted and enumeration restarts.

enum class MoveKind : std::uint8_t {
  SwapWithinDay = 0,
  Relocate = 1,
  SwapAcrossDays = 2,
};

const char* ToString(MoveKind k);

// Number of spots whose day changes when a move of this kind is applied.
int RelocationCount(MoveKind k);

// 0-based indices.
//  SwapWithinDay : positions posA and posB of dayA.
//  Relocate      : spot at (dayA, posA) inserted at position posB of dayB
//                  (posB indexes dayB before insertion, 0..size).
//  SwapAcrossDays: spot at (dayA, posA) exchanged with spot at (dayB, posB).
struct Move {
  MoveKind kind = MoveKind::Relocate;
  int dayA = 0;
  int posA = 0;
  int dayB = 0;
  int posB = 0;
};

// Returns false (and leaves out untouched) when the move's indices do not fit `in`.
bool ApplyMove(const Itinerary& in, const Move& m, Itinerary& out);

// "relocate 'senso-ji' from day 1 to day 2 (position 3)" etc. Uses `before`
// to resolve spot ids.
std::string DescribeMove(const Itinerary& before, const Move& m);

struct PlannerConfig {
  // Candidate evaluations per Improve run. 0 = unlimited.
  int maxEvaluations = 200000;

  // Improvement passes per Improve run (a pass ends at an accepted move or at
  // a full scan without one). 0 = unlimited.
  int maxPasses = 1000;

  // Wall-clock budget per planning call in milliseconds. 0 = none.
  // Runs with a time budget are not reproducible.
  int timeBudgetMs = 0;

  // Extra seeded constructions improved independently. The deterministic
  // construction is always run as restart 0.
  int restarts = 0;

  // At most kMaxPlannerSeed so the value survives a JSON number.
  std::uint64_t seed = 1;

  // Worker threads for restarts. 0 = hardware concurrency.
  int threads = 0;

  // Keep the accepted-step trace of the winning run.
  bool recordTrace = true;
};

constexpr std::uint64_t kMaxPlannerSeed = std::uint64_t{1} << 53;

bool ValidatePlannerConfig(const PlannerConfig& cfg, std::string& outError);

enum class StopReason : std::uint8_t {
  LocalOptimum = 0,
  EvaluationBudget = 1,
  TimeBudget = 2,
  Cancelled = 3,
  PassLimit = 4,
};

const char* ToString(StopReason r);

// One accepted move.
struct PlanStep {
  int index = 0; // 1-based
  Move move;
  std::string description;
  double scoreBefore = 0.0;
  double scoreAfter = 0.0;
};

// Optional progress reporting.
//
// When non-null, the planner updates these atomics as it evaluates candidates.
// Setting `cancel` stops all runs at the next evaluation boundary.
struct PlanProgress {
  std::atomic<int> evaluations{0};
  std::atomic<int> accepted{0};
  std::atomic<int> passes{0};
  std::atomic<int> restartsDone{0};
  std::atomic<bool> cancel{false};
  std::atomic<bool> done{false}; // set to true when PlanItinerary returns
};

struct ImproveResult {
  Itinerary itinerary;
  ScoreReport report;
  StopReason stop = StopReason::LocalOptimum;

  int evaluations = 0;
  int accepted = 0;
  int passes = 0;

  std::vector<PlanStep> trace;
};

// Deterministic initial itinerary over every spot in the city scope
// (empty cityId = whole catalog). Errors: days <= 0, unknown city.
bool ConstructItinerary(const World& world, const std::string& cityId, int days, Policy policy, Itinerary& out,
                        std::string& outError);

// Seeded variant: spots are ordered along a random bearing instead of west to east.
bool ConstructItinerarySeeded(const World& world, const std::string& cityId, int days, Policy policy,
                              std::uint64_t seed, Itinerary& out, std::string& outError);

// Local search from `start`. Fails only on invalid configuration or an internal
// invariant violation (an operator changed the set of spots).
bool ImproveItinerary(const World& world, const Itinerary& start, Policy policy, const ScorerConfig& scorer,
                      const PlannerConfig& cfg, ImproveResult& out, std::string& outError,
                      PlanProgress* progress = nullptr);

struct PlanRequest {
  std::string cityId; // empty = whole catalog
  int days = 1;
  Policy policy = Policy::Walk;
  ScorerConfig scorer;
  PlannerConfig planner;
};

struct PlanResult {
  Itinerary itinerary;
  ScoreReport report;

  Itinerary initial;
  ScoreReport initialReport;

  std::string explanation;
  StopReason stop = StopReason::LocalOptimum;

  // Counters summed over all restarts.
  int evaluations = 0;
  int accepted = 0;
  int passes = 0;

  // Index of the restart that produced the result (0 = deterministic construction).
  int bestRestart = 0;
  int restartsTried = 0;

  std::vector<PlanStep> trace;
};

// Construct + Improve (+ seeded restarts). Configuration errors are reported
// before any work starts.
bool PlanItinerary(const World& world, const PlanRequest& req, PlanResult& out, std::string& outError,
                   PlanProgress* progress = nullptr);

// Text explanation derived from the final report and the run statistics.
std::string BuildExplanation(const PlanResult& r);

} // namespace tripweave
