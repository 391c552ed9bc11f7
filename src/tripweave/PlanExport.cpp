#include "tripweave/PlanExport.hpp"

#include "tripweave/Json.hpp"

#include <fstream>
#include <iomanip>
#include <ostream>

namespace tripweave {

namespace {

void WriteDays(JsonWriter& w, const World& world, const PlanResult& res)
{
  w.key("days");
  w.beginArray();
  for (std::size_t d = 0; d < res.itinerary.days.size(); ++d) {
    w.beginObject();
    w.field("day", static_cast<int>(d) + 1);
    if (d < res.report.days.size()) {
      const DaySummary& s = res.report.days[d];
      w.field("travel_minutes", s.travelMinutes);
      w.field("travel_km", s.travelKm);
      w.field("visit_minutes", s.visitMinutes);
      w.field("end_time", FormatClockMinutes(s.endMinute));
    }

    w.key("spots");
    w.beginArray();
    for (const std::string& id : res.itinerary.days[d].spots) {
      w.beginObject();
      w.field("id", id);
      if (const Spot* s = world.findSpot(id)) {
        w.field("name", s->name);
        w.field("lat", s->location.lat);
        w.field("lon", s->location.lon);
        w.field("category", s->category);
      }
      w.endObject();
    }
    w.endArray();
    w.endObject();
  }
  w.endArray();
}

void WritePenalties(JsonWriter& w, const ScoreReport& r)
{
  w.key("penalties");
  w.beginArray();
  for (const Penalty& p : r.penalties) {
    w.beginObject();
    w.field("day", p.day);
    w.field("kind", ToString(p.kind));
    w.field("magnitude", p.magnitude);
    w.field("cost", p.cost);
    if (!p.spotId.empty()) w.field("spot", p.spotId);
    w.field("message", p.message);
    w.endObject();
  }
  w.endArray();
}

void WriteTrace(JsonWriter& w, const PlanResult& res)
{
  w.key("trace");
  w.beginArray();
  for (const PlanStep& s : res.trace) {
    w.beginObject();
    w.field("step", s.index);
    w.field("move", ToString(s.move.kind));
    w.field("description", s.description);
    w.field("score_before", s.scoreBefore);
    w.field("score_after", s.scoreAfter);
    w.endObject();
  }
  w.endArray();
}

} // namespace

bool WritePlanJson(std::ostream& os, const World& world, const PlanRequest& req, const PlanResult& res,
                   std::string& outError, int indent)
{
  JsonWriteOptions opt;
  opt.pretty = indent > 0;
  opt.indent = indent;
  JsonWriter w(os, opt);

  w.beginObject();
  w.field("policy", PolicyName(req.policy));
  w.field("city", res.itinerary.cityId);
  w.field("day_count", res.itinerary.dayCount());
  w.field("score", res.report.total);
  w.field("feasible", res.report.feasible);
  w.field("capacity_shortfall", res.report.capacityShortfall);
  w.field("initial_score", res.initialReport.total);
  w.field("stop", ToString(res.stop));
  w.field("explanation", res.explanation);

  w.key("counters");
  w.beginObject();
  w.field("evaluations", res.evaluations);
  w.field("accepted", res.accepted);
  w.field("passes", res.passes);
  w.field("restarts", res.restartsTried);
  w.field("best_restart", res.bestRestart);
  w.endObject();

  WriteDays(w, world, res);
  WritePenalties(w, res.report);
  WriteTrace(w, res);
  w.endObject();

  if (!w.ok()) {
    outError = "json writer: " + w.error();
    return false;
  }
  // The writer already ends a pretty document with a newline.
  if (!opt.pretty) os << "\n";
  if (!os.good()) {
    outError = "failed to write plan JSON";
    return false;
  }
  return true;
}

bool ExportPlanJsonFile(const std::string& path, const World& world, const PlanRequest& req, const PlanResult& res,
                        std::string& outError, int indent)
{
  std::ofstream f(path, std::ios::binary);
  if (!f) {
    outError = "unable to open '" + path + "' for writing";
    return false;
  }
  if (!WritePlanJson(f, world, req, res, outError, indent)) {
    outError = path + ": " + outError;
    return false;
  }
  return true;
}

void WritePlanText(std::ostream& os, const World& world, const PlanRequest& req, const PlanResult& res)
{
  const auto flags = os.flags();
  const auto prec = os.precision();
  os << std::fixed << std::setprecision(1);

  os << "Itinerary: " << (res.itinerary.cityId.empty() ? std::string("all spots") : res.itinerary.cityId) << ", "
     << res.itinerary.dayCount() << " day(s), policy " << PolicyName(req.policy) << "\n";

  for (std::size_t d = 0; d < res.itinerary.days.size(); ++d) {
    os << "Day " << (d + 1);
    if (d < res.report.days.size()) {
      const DaySummary& s = res.report.days[d];
      os << " (" << s.spots << " spots, travel " << s.travelMinutes << " min / " << s.travelKm << " km, ends "
         << FormatClockMinutes(s.endMinute) << ")";
    }
    os << ":\n";
    int n = 0;
    for (const std::string& id : res.itinerary.days[d].spots) {
      os << "  " << ++n << ". ";
      if (const Spot* s = world.findSpot(id)) {
        os << s->name;
        if (!s->category.empty()) os << " [" << s->category << "]";
      } else {
        os << id << " (unknown)";
      }
      os << "\n";
    }
  }

  os << std::setprecision(2);
  os << "Best score: " << res.report.total << (res.report.feasible ? "" : " (infeasible)") << "\n";
  if (res.report.penalties.empty() && !res.report.capacityShortfall) {
    os << "Self-check report: no penalties\n";
  } else {
    os << "Self-check report:\n";
    for (const Penalty& p : res.report.penalties) os << " - " << p.message << "\n";
    if (res.report.capacityShortfall) os << " - not enough spots to reach the daily minimum on every day\n";
  }
  os << res.explanation << "\n";

  os.flags(flags);
  os.precision(prec);
}

} // namespace tripweave
