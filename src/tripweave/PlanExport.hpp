#pragma once

#include "tripweave/Planner.hpp"
#include "tripweave/World.hpp"

#include <iosfwd>
#include <string>

namespace tripweave {

// Plan result export.
//
// JSON layout (stable key order):
//   policy, city, day_count, score, feasible, capacity_shortfall,
//   initial_score, stop, explanation,
//   counters {evaluations, accepted, passes, restarts, best_restart},
//   days [{day, travel_minutes, travel_km, visit_minutes, end_time,
//          spots [{id, name, lat, lon, category}]}],
//   penalties [{day, kind, magnitude, cost, spot, message}],
//   trace [{step, move, description, score_before, score_after}]

bool WritePlanJson(std::ostream& os, const World& world, const PlanRequest& req, const PlanResult& res,
                   std::string& outError, int indent = 2);

bool ExportPlanJsonFile(const std::string& path, const World& world, const PlanRequest& req, const PlanResult& res,
                        std::string& outError, int indent = 2);

// Human-readable summary: per-day visit list, then "Best score" and the
// self-check report.
void WritePlanText(std::ostream& os, const World& world, const PlanRequest& req, const PlanResult& res);

} // namespace tripweave
