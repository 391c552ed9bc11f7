#include "tripweave/Replanner.hpp"

#include "tripweave/Planner.hpp"
#include "tripweave/SpotSemantics.hpp"

#include <unordered_set>

namespace tripweave {

bool ReplanDayForWeather(const World& world, Itinerary& it, int day, Policy policy, const ScorerConfig& scorer,
                         WeatherReplanResult& out, std::string& outError)
{
  if (!ValidateScorerConfig(scorer, outError)) return false;
  if (day < 1 || day > it.dayCount()) {
    outError = "rain day " + std::to_string(day) + " is outside 1.." + std::to_string(it.dayCount());
    return false;
  }

  const int d = day - 1;
  WeatherReplanResult res;
  res.scoreBefore = ScoreItinerary(world, it, policy, scorer).total;

  // Snapshot the outdoor ids first: positions shift as swaps are applied.
  std::vector<std::string> outdoor;
  for (const std::string& id : it.days[static_cast<std::size_t>(d)].spots) {
    const Spot* s = world.findSpot(id);
    if (s && IsOutdoor(*s)) outdoor.push_back(id);
  }

  std::unordered_set<std::string> swappedIn;
  for (const std::string& outId : outdoor) {
    SpotSlot slot;
    if (!FindSpotSlot(it, outId, &slot) || slot.day != d) continue;

    bool found = false;
    Move bestMove;
    Itinerary bestIt;
    double bestScore = 0.0;

    for (int other = 0; other < it.dayCount(); ++other) {
      if (other == d) continue;
      const auto& spots = it.days[static_cast<std::size_t>(other)].spots;
      for (int j = 0; j < static_cast<int>(spots.size()); ++j) {
        const std::string& candId = spots[static_cast<std::size_t>(j)];
        if (swappedIn.count(candId) != 0) continue;
        const Spot* s = world.findSpot(candId);
        if (!s || !IsIndoor(*s)) continue;

        const Move m{MoveKind::SwapAcrossDays, d, slot.pos, other, j};
        Itinerary cand;
        if (!ApplyMove(it, m, cand)) continue;

        const double score = ScoreItinerary(world, cand, policy, scorer).total;
        if (!found || score < bestScore) {
          found = true;
          bestMove = m;
          bestIt = std::move(cand);
          bestScore = score;
        }
      }
    }

    if (!found) {
      res.unresolved.push_back(outId);
      continue;
    }

    WeatherSwap sw;
    sw.outdoorId = outId;
    sw.indoorId = it.days[static_cast<std::size_t>(bestMove.dayB)].spots[static_cast<std::size_t>(bestMove.posB)];
    sw.otherDay = bestMove.dayB + 1;
    swappedIn.insert(sw.indoorId);
    res.swaps.push_back(std::move(sw));
    it = std::move(bestIt);
  }

  res.scoreAfter = ScoreItinerary(world, it, policy, scorer).total;
  out = std::move(res);
  return true;
}

} // namespace tripweave
