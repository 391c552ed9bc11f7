#pragma once

#include "tripweave/Geometry.hpp"
#include "tripweave/Json.hpp"
#include "tripweave/Planner.hpp"
#include "tripweave/Scorer.hpp"

#include <string>

namespace tripweave {

// JSON config IO for the scorer and planner.
//
// Keys are snake_case. Apply* functions use merge semantics: missing keys keep
// the current value, a key with the wrong type is an error. Values are
// range-checked by ValidateScorerConfig / ValidatePlannerConfig afterwards.

bool ApplyScorerConfigJson(const JsonValue& root, ScorerConfig& ioCfg, std::string& outError);
bool ApplyPlannerConfigJson(const JsonValue& root, PlannerConfig& ioCfg, std::string& outError);

// Top-level run configuration:
//   {"policy":"walk", "days":3, "city":"tokyo", "scorer":{...}, "planner":{...}}
struct PlanConfig {
  Policy policy = Policy::Walk;
  int days = 3;
  std::string cityId;
  ScorerConfig scorer;
  PlannerConfig planner;

  // True once scorer.max_daily_travel_minutes was given explicitly.
  bool travelCapSet = false;
};

// Sets the policy. The daily travel cap follows the policy's default budget
// unless it was set explicitly.
void SetPlanPolicy(PlanConfig& cfg, Policy p);

// "policy" goes through SetPlanPolicy; an explicit
// "scorer.max_daily_travel_minutes" in the same document still wins.
bool ApplyPlanConfigJson(const JsonValue& root, PlanConfig& ioCfg, std::string& outError);

bool LoadPlanConfigJsonFile(const std::string& path, PlanConfig& ioCfg, std::string& outError);

// Serialize (pretty, stable key order). The output round-trips through the
// Apply* functions.
std::string ScorerConfigToJson(const ScorerConfig& cfg, int indent = 2);
std::string PlannerConfigToJson(const PlannerConfig& cfg, int indent = 2);
std::string PlanConfigToJson(const PlanConfig& cfg, int indent = 2);

} // namespace tripweave
