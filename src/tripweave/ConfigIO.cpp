#include "tripweave/ConfigIO.hpp"

#include <cmath>
#include <limits>
#include <sstream>

namespace tripweave {

namespace {

static bool ApplyBool(const JsonValue& root, const char* key, bool& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true; // missing => keep
  if (!v->isBool()) {
    err = std::string("expected boolean for key '") + key + "'";
    return false;
  }
  io = v->boolValue;
  return true;
}

static bool ApplyI32(const JsonValue& root, const char* key, int& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true;
  if (!v->isNumber()) {
    err = std::string("expected number for key '") + key + "'";
    return false;
  }
  const double dv = v->numberValue;
  if (!std::isfinite(dv) || dv != std::floor(dv) || dv < static_cast<double>(std::numeric_limits<int>::min()) ||
      dv > static_cast<double>(std::numeric_limits<int>::max())) {
    err = std::string("expected integer for key '") + key + "'";
    return false;
  }
  io = static_cast<int>(dv);
  return true;
}

static bool ApplyU64(const JsonValue& root, const char* key, std::uint64_t& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true;
  if (!v->isNumber()) {
    err = std::string("expected number for key '") + key + "'";
    return false;
  }
  const double dv = v->numberValue;
  // Exactly representable integers only.
  if (!std::isfinite(dv) || dv != std::floor(dv) || dv < 0.0 || dv > 9007199254740992.0) {
    err = std::string("expected non-negative integer (<= 2^53) for key '") + key + "'";
    return false;
  }
  io = static_cast<std::uint64_t>(dv);
  return true;
}

static bool ApplyF64(const JsonValue& root, const char* key, double& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true;
  if (!v->isNumber()) {
    err = std::string("expected number for key '") + key + "'";
    return false;
  }
  if (!std::isfinite(v->numberValue)) {
    err = std::string("non-finite number for key '") + key + "'";
    return false;
  }
  io = v->numberValue;
  return true;
}

static bool ExpectObject(const JsonValue& root, const char* what, std::string& err)
{
  if (root.isObject()) return true;
  err = std::string(what) + " must be a JSON object";
  return false;
}

static void WriteScorer(JsonWriter& w, const ScorerConfig& c)
{
  w.beginObject();
  w.field("max_daily_travel_minutes", c.maxDailyTravelMinutes);
  w.field("min_spots_per_day", c.minSpotsPerDay);
  w.field("max_spots_per_day", c.maxSpotsPerDay);
  w.field("spot_duration_weight", c.spotDurationWeight);
  w.field("travel_time_weight", c.travelTimeWeight);
  w.field("day_start_minute", c.dayStartMinute);
  w.field("closed_spot_penalty", c.closedSpotPenalty);
  w.field("structural_penalty", c.structuralPenalty);
  w.endObject();
}

static void WritePlanner(JsonWriter& w, const PlannerConfig& c)
{
  w.beginObject();
  w.field("max_evaluations", c.maxEvaluations);
  w.field("max_passes", c.maxPasses);
  w.field("time_budget_ms", c.timeBudgetMs);
  w.field("restarts", c.restarts);
  w.key("seed");
  w.intValue(static_cast<std::int64_t>(c.seed));
  w.field("threads", c.threads);
  w.field("record_trace", c.recordTrace);
  w.endObject();
}

static JsonWriteOptions Options(int indent)
{
  JsonWriteOptions opt;
  opt.pretty = indent > 0;
  opt.indent = indent;
  return opt;
}

} // namespace

bool ApplyScorerConfigJson(const JsonValue& root, ScorerConfig& ioCfg, std::string& outError)
{
  if (!ExpectObject(root, "scorer config", outError)) return false;

  ScorerConfig c = ioCfg;
  if (!ApplyF64(root, "max_daily_travel_minutes", c.maxDailyTravelMinutes, outError)) return false;
  if (!ApplyI32(root, "min_spots_per_day", c.minSpotsPerDay, outError)) return false;
  if (!ApplyI32(root, "max_spots_per_day", c.maxSpotsPerDay, outError)) return false;
  if (!ApplyF64(root, "spot_duration_weight", c.spotDurationWeight, outError)) return false;
  if (!ApplyF64(root, "travel_time_weight", c.travelTimeWeight, outError)) return false;
  if (!ApplyF64(root, "day_start_minute", c.dayStartMinute, outError)) return false;
  if (!ApplyF64(root, "closed_spot_penalty", c.closedSpotPenalty, outError)) return false;
  if (!ApplyF64(root, "structural_penalty", c.structuralPenalty, outError)) return false;

  ioCfg = c;
  return true;
}

bool ApplyPlannerConfigJson(const JsonValue& root, PlannerConfig& ioCfg, std::string& outError)
{
  if (!ExpectObject(root, "planner config", outError)) return false;

  PlannerConfig c = ioCfg;
  if (!ApplyI32(root, "max_evaluations", c.maxEvaluations, outError)) return false;
  if (!ApplyI32(root, "max_passes", c.maxPasses, outError)) return false;
  if (!ApplyI32(root, "time_budget_ms", c.timeBudgetMs, outError)) return false;
  if (!ApplyI32(root, "restarts", c.restarts, outError)) return false;
  if (!ApplyU64(root, "seed", c.seed, outError)) return false;
  if (!ApplyI32(root, "threads", c.threads, outError)) return false;
  if (!ApplyBool(root, "record_trace", c.recordTrace, outError)) return false;

  ioCfg = c;
  return true;
}

void SetPlanPolicy(PlanConfig& cfg, Policy p)
{
  cfg.policy = p;
  if (!cfg.travelCapSet) cfg.scorer.maxDailyTravelMinutes = GetPolicyProfile(p).dailyBudgetMinutes;
}

bool ApplyPlanConfigJson(const JsonValue& root, PlanConfig& ioCfg, std::string& outError)
{
  if (!ExpectObject(root, "plan config", outError)) return false;

  PlanConfig c = ioCfg;

  if (const JsonValue* p = FindJsonMember(root, "policy")) {
    if (!p->isString()) {
      outError = "expected string for key 'policy'";
      return false;
    }
    Policy policy = c.policy;
    if (!ParsePolicy(p->stringValue, &policy)) {
      outError = "unknown policy '" + p->stringValue + "' (expected walk, transit or taxi)";
      return false;
    }
    SetPlanPolicy(c, policy);
  }

  if (!ApplyI32(root, "days", c.days, outError)) return false;

  if (const JsonValue* city = FindJsonMember(root, "city")) {
    if (!city->isString()) {
      outError = "expected string for key 'city'";
      return false;
    }
    c.cityId = city->stringValue;
  }

  if (const JsonValue* s = FindJsonMember(root, "scorer")) {
    if (!ApplyScorerConfigJson(*s, c.scorer, outError)) {
      outError = "scorer: " + outError;
      return false;
    }
    if (FindJsonMember(*s, "max_daily_travel_minutes")) c.travelCapSet = true;
  }
  if (const JsonValue* p = FindJsonMember(root, "planner")) {
    if (!ApplyPlannerConfigJson(*p, c.planner, outError)) {
      outError = "planner: " + outError;
      return false;
    }
  }

  ioCfg = std::move(c);
  return true;
}

bool LoadPlanConfigJsonFile(const std::string& path, PlanConfig& ioCfg, std::string& outError)
{
  JsonValue root;
  if (!LoadJsonFile(path, root, outError)) return false;
  if (!ApplyPlanConfigJson(root, ioCfg, outError)) {
    outError = path + ": " + outError;
    return false;
  }
  return true;
}

std::string ScorerConfigToJson(const ScorerConfig& cfg, int indent)
{
  std::ostringstream oss;
  JsonWriter w(oss, Options(indent));
  WriteScorer(w, cfg);
  return oss.str();
}

std::string PlannerConfigToJson(const PlannerConfig& cfg, int indent)
{
  std::ostringstream oss;
  JsonWriter w(oss, Options(indent));
  WritePlanner(w, cfg);
  return oss.str();
}

std::string PlanConfigToJson(const PlanConfig& cfg, int indent)
{
  std::ostringstream oss;
  JsonWriter w(oss, Options(indent));
  w.beginObject();
  w.field("policy", PolicyName(cfg.policy));
  w.field("days", cfg.days);
  w.field("city", cfg.cityId);
  w.key("scorer");
  WriteScorer(w, cfg.scorer);
  w.key("planner");
  WritePlanner(w, cfg.planner);
  w.endObject();
  return oss.str();
}

} // namespace tripweave
