#include "cli/CliParse.hpp"

#include "tripweave/CatalogIO.hpp"
#include "tripweave/ConfigIO.hpp"
#include "tripweave/LogTee.hpp"
#include "tripweave/PlanExport.hpp"
#include "tripweave/Planner.hpp"
#include "tripweave/Replanner.hpp"

#include <chrono>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

void PrintHelp()
{
  std::cout
      << "tripweave_cli (multi-day itinerary planner)\n\n"
      << "Loads a spot catalog, builds an initial itinerary and improves it by local search\n"
      << "against the soft-constraint scorer. Prints the plan and its self-check report.\n\n"
      << "Usage:\n"
      << "  tripweave_cli --catalog <spots.json> [--config <plan.json>] [options]\n\n"
      << "Inputs:\n"
      << "  --catalog <path>       Catalog JSON ({\"cities\":[...],\"spots\":[...]} or a bare spot array).\n"
      << "  --config <path>        Plan config JSON (policy, days, city, scorer, planner).\n"
      << "  --city <id>            City scope. Default: whole catalog.\n"
      << "  --days <N>             Number of days. Default: 3\n"
      << "  --policy <walk|transit|taxi>   Default: walk\n\n"
      << "Scorer:\n"
      << "  --max-travel <min>     Daily travel cap. Default: policy budget (240/300/360)\n"
      << "  --min-spots <N>        Minimum spots per day. Default: 2\n"
      << "  --max-spots <N>        Maximum spots per day. Default: 5\n"
      << "  --w-spot <f>           Cost per missing/excess spot. Default: 15\n"
      << "  --w-travel <f>         Cost per minute over the cap. Default: 1.5\n"
      << "  --day-start <HH:MM>    Day start for opening-hours checks. Default: 09:00\n\n"
      << "Search:\n"
      << "  --max-evals <N>        Evaluations per run (0=unlimited). Default: 200000\n"
      << "  --max-passes <N>       Passes per run (0=unlimited). Default: 1000\n"
      << "  --time-budget-ms <N>   Wall-clock budget (0=none). Default: 0\n"
      << "  --restarts <N>         Extra seeded constructions. Default: 0\n"
      << "  --seed <N>             Restart seed in [0, 2^53]. Default: 1\n"
      << "  --threads <N>          Restart worker threads (0=auto). Default: 0\n"
      << "  --record-trace <0|1>   Keep the accepted-move trace. Default: 1\n\n"
      << "Outputs:\n"
      << "  --json <path>          Write the plan as JSON.\n"
      << "  --rain-day <D[,D...]>  Swap outdoor spots of these days for indoor ones.\n"
      << "  --print-config         Print the effective plan config as JSON and exit.\n"
      << "  --log <path>           Duplicate stdout/stderr to a rotated log file.\n"
      << "  --quiet                Only print the score line.\n\n";
}

} // namespace

int main(int argc, char** argv)
{
  using namespace tripweave;
  using namespace tripweave::cli;

  std::string catalogPath;
  std::string configPath;
  std::string jsonPath;
  std::string logPath;
  std::vector<int> rainDays;
  bool printConfig = false;
  bool quiet = false;

  // CLI overrides are applied on top of the config file.
  std::optional<std::string> city;
  std::optional<int> days;
  std::optional<Policy> policy;
  std::optional<double> maxTravel;
  std::optional<int> minSpots;
  std::optional<int> maxSpots;
  std::optional<double> wSpot;
  std::optional<double> wTravel;
  std::optional<double> dayStart;
  std::optional<int> maxEvals;
  std::optional<int> maxPasses;
  std::optional<int> timeBudgetMs;
  std::optional<int> restarts;
  std::optional<std::uint64_t> seed;
  std::optional<int> threads;
  std::optional<bool> recordTrace;

  auto requireValue = [&](int& i, std::string& out) -> bool {
    if (i + 1 >= argc) return false;
    out = argv[++i];
    return true;
  };

  auto requireInt = [&](int& i, const char* flag, int minValue, std::optional<int>& out) -> bool {
    std::string v;
    int n = 0;
    if (!requireValue(i, v) || !ParseI32(v, &n) || n < minValue) {
      std::cerr << flag << " requires an int >= " << minValue << "\n";
      return false;
    }
    out = n;
    return true;
  };

  auto requireNonNegative = [&](int& i, const char* flag, std::optional<double>& out) -> bool {
    std::string v;
    double f = 0.0;
    if (!requireValue(i, v) || !ParseF64(v, &f) || f < 0.0) {
      std::cerr << flag << " requires a non-negative number\n";
      return false;
    }
    out = f;
    return true;
  };

  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    std::string v;

    if (a == "--help" || a == "-h") {
      PrintHelp();
      return 0;
    } else if (a == "--catalog") {
      if (!requireValue(i, catalogPath)) {
        std::cerr << "--catalog requires a path\n";
        return 2;
      }
    } else if (a == "--config") {
      if (!requireValue(i, configPath)) {
        std::cerr << "--config requires a path\n";
        return 2;
      }
    } else if (a == "--city") {
      if (!requireValue(i, v)) {
        std::cerr << "--city requires an id\n";
        return 2;
      }
      city = v;
    } else if (a == "--days") {
      if (!requireInt(i, "--days", 1, days)) return 2;
    } else if (a == "--policy") {
      Policy p = Policy::Walk;
      if (!requireValue(i, v) || !ParsePolicy(v, &p)) {
        std::cerr << "--policy requires walk|transit|taxi\n";
        return 2;
      }
      policy = p;
    } else if (a == "--max-travel") {
      if (!requireNonNegative(i, "--max-travel", maxTravel)) return 2;
    } else if (a == "--min-spots") {
      if (!requireInt(i, "--min-spots", 0, minSpots)) return 2;
    } else if (a == "--max-spots") {
      if (!requireInt(i, "--max-spots", 1, maxSpots)) return 2;
    } else if (a == "--w-spot") {
      if (!requireNonNegative(i, "--w-spot", wSpot)) return 2;
    } else if (a == "--w-travel") {
      if (!requireNonNegative(i, "--w-travel", wTravel)) return 2;
    } else if (a == "--day-start") {
      double m = 0.0;
      if (!requireValue(i, v) || !ParseDayMinute(v, &m)) {
        std::cerr << "--day-start requires HH:MM or minutes in [0, 1440)\n";
        return 2;
      }
      dayStart = m;
    } else if (a == "--max-evals") {
      if (!requireInt(i, "--max-evals", 0, maxEvals)) return 2;
    } else if (a == "--max-passes") {
      if (!requireInt(i, "--max-passes", 0, maxPasses)) return 2;
    } else if (a == "--time-budget-ms") {
      if (!requireInt(i, "--time-budget-ms", 0, timeBudgetMs)) return 2;
    } else if (a == "--restarts") {
      if (!requireInt(i, "--restarts", 0, restarts)) return 2;
    } else if (a == "--seed") {
      std::uint64_t s = 0;
      if (!requireValue(i, v) || !ParseU64(v, &s) || s > kMaxPlannerSeed) {
        std::cerr << "--seed requires an integer in [0, 2^53]\n";
        return 2;
      }
      seed = s;
    } else if (a == "--threads") {
      if (!requireInt(i, "--threads", 0, threads)) return 2;
    } else if (a == "--record-trace") {
      bool b = true;
      if (!requireValue(i, v) || !ParseBool01(v, &b)) {
        std::cerr << "--record-trace requires 0 or 1\n";
        return 2;
      }
      recordTrace = b;
    } else if (a == "--json") {
      if (!requireValue(i, jsonPath)) {
        std::cerr << "--json requires a path\n";
        return 2;
      }
    } else if (a == "--rain-day") {
      if (!requireValue(i, v)) {
        std::cerr << "--rain-day requires a day list\n";
        return 2;
      }
      for (const std::string& item : SplitCommaList(v)) {
        int d = 0;
        if (!ParseI32(item, &d) || d < 1) {
          std::cerr << "--rain-day expects 1-based day numbers, got '" << item << "'\n";
          return 2;
        }
        rainDays.push_back(d);
      }
    } else if (a == "--print-config") {
      printConfig = true;
    } else if (a == "--log") {
      if (!requireValue(i, logPath)) {
        std::cerr << "--log requires a path\n";
        return 2;
      }
    } else if (a == "--quiet") {
      quiet = true;
    } else {
      std::cerr << "Unknown arg: " << a << "\n";
      std::cerr << "Use --help for usage.\n";
      return 2;
    }
  }

  LogTee logTee;
  if (!logPath.empty()) {
    LogTeeOptions lopt;
    lopt.path = logPath;
    std::string err;
    if (!EnsureParentDir(lopt.path) || !logTee.start(lopt, err)) {
      std::cerr << "Failed to start log: " << (err.empty() ? logPath : err) << "\n";
      return 2;
    }
  }

  PlanConfig cfg;
  if (!configPath.empty()) {
    std::string err;
    if (!LoadPlanConfigJsonFile(configPath, cfg, err)) {
      std::cerr << "Config error: " << err << "\n";
      return 2;
    }
  }

  if (policy) SetPlanPolicy(cfg, *policy);
  if (city) cfg.cityId = *city;
  if (days) cfg.days = *days;
  if (maxTravel) {
    cfg.scorer.maxDailyTravelMinutes = *maxTravel;
    cfg.travelCapSet = true;
  }
  if (minSpots) cfg.scorer.minSpotsPerDay = *minSpots;
  if (maxSpots) cfg.scorer.maxSpotsPerDay = *maxSpots;
  if (wSpot) cfg.scorer.spotDurationWeight = *wSpot;
  if (wTravel) cfg.scorer.travelTimeWeight = *wTravel;
  if (dayStart) cfg.scorer.dayStartMinute = *dayStart;
  if (maxEvals) cfg.planner.maxEvaluations = *maxEvals;
  if (maxPasses) cfg.planner.maxPasses = *maxPasses;
  if (timeBudgetMs) cfg.planner.timeBudgetMs = *timeBudgetMs;
  if (restarts) cfg.planner.restarts = *restarts;
  if (seed) cfg.planner.seed = *seed;
  if (threads) cfg.planner.threads = *threads;
  if (recordTrace) cfg.planner.recordTrace = *recordTrace;

  if (printConfig) {
    std::cout << PlanConfigToJson(cfg);
    return 0;
  }

  if (catalogPath.empty()) {
    std::cerr << "--catalog is required\n";
    std::cerr << "Use --help for usage.\n";
    return 2;
  }

  World world;
  {
    std::string err;
    if (!LoadCatalogJsonFile(catalogPath, world, err, cfg.cityId)) {
      std::cerr << "Catalog error: " << err << "\n";
      return 2;
    }
  }
  if (!quiet) {
    std::cout << "Loaded " << world.spotCount() << " spots in " << world.cities().size() << " cities from "
              << catalogPath << "\n";
  }

  PlanRequest req;
  req.cityId = cfg.cityId;
  req.days = cfg.days;
  req.policy = cfg.policy;
  req.scorer = cfg.scorer;
  req.planner = cfg.planner;

  PlanResult res;
  const auto t0 = std::chrono::steady_clock::now();
  {
    std::string err;
    if (!PlanItinerary(world, req, res, err)) {
      std::cerr << "Planning failed: " << err << "\n";
      return err.rfind("internal invariant violated", 0) == 0 ? 1 : 2;
    }
  }
  const auto t1 = std::chrono::steady_clock::now();

  for (int d : rainDays) {
    WeatherReplanResult wr;
    std::string err;
    if (!ReplanDayForWeather(world, res.itinerary, d, req.policy, req.scorer, wr, err)) {
      std::cerr << "Rain replan failed: " << err << "\n";
      return 2;
    }
    if (!quiet) {
      std::cout << "Rain on day " << d << ": " << wr.swaps.size() << " swap(s)";
      for (const WeatherSwap& s : wr.swaps) {
        std::cout << "\n  " << s.outdoorId << " -> day " << s.otherDay << ", " << s.indoorId << " -> day " << d;
      }
      for (const std::string& id : wr.unresolved) std::cout << "\n  " << id << " stays (no indoor alternative)";
      std::cout << "\n";
    }
  }
  if (!rainDays.empty()) {
    res.report = ScoreItinerary(world, res.itinerary, req.policy, req.scorer);
    res.explanation = BuildExplanation(res);
  }

  if (quiet) {
    std::cout << "Best score: " << res.report.total << "\n";
  } else {
    WritePlanText(std::cout, world, req, res);
    const double ms = std::chrono::duration<double, std::milli>(t1 - t0).count();
    std::cout << "Search: " << res.evaluations << " evaluations, " << res.accepted << " accepted, "
              << res.passes << " passes, " << res.restartsTried << " construction(s), stop "
              << ToString(res.stop) << ", " << ms << " ms\n";
  }

  if (!jsonPath.empty()) {
    std::string err;
    if (!EnsureParentDir(jsonPath) || !ExportPlanJsonFile(jsonPath, world, req, res, err)) {
      std::cerr << "Failed to write JSON: " << (err.empty() ? jsonPath : err) << "\n";
      return 2;
    }
    if (!quiet) std::cout << "Wrote " << jsonPath << "\n";
  }

  return 0;
}
