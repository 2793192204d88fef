#include "parcelcity/ConfigIO.hpp"

#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>

namespace parcelcity {

namespace {

bool ApplyBool(const JsonValue& obj, const char* key, bool& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(obj, key);
  if (!v) return true;
  if (!v->isBool()) {
    err = std::string("expected boolean for key '") + key + "'";
    return false;
  }
  io = v->boolValue;
  return true;
}

bool ApplyInt(const JsonValue& obj, const char* key, int& io, std::string& err, int minValue)
{
  const JsonValue* v = FindJsonMember(obj, key);
  if (!v) return true;
  if (!v->isNumber()) {
    err = std::string("expected number for key '") + key + "'";
    return false;
  }
  const double d = v->numberValue;
  if (!std::isfinite(d) || std::floor(d) != d) {
    err = std::string("expected integer for key '") + key + "'";
    return false;
  }
  if (d < static_cast<double>(minValue) || d > static_cast<double>(std::numeric_limits<int>::max())) {
    err = std::string("out-of-range value for key '") + key + "'";
    return false;
  }
  io = static_cast<int>(d);
  return true;
}

bool ApplyString(const JsonValue& obj, const char* key, std::string& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(obj, key);
  if (!v) return true;
  if (!v->isString()) {
    err = std::string("expected string for key '") + key + "'";
    return false;
  }
  io = v->stringValue;
  return true;
}

bool GetObject(const JsonValue& obj, const char* key, const JsonValue** out, std::string& err)
{
  *out = FindJsonMember(obj, key);
  if (!*out) return true;
  if (!(*out)->isObject()) {
    err = std::string("expected object for key '") + key + "'";
    return false;
  }
  return true;
}

bool ApplyQuote(const JsonValue& costs, const char* key, BuildQuote& io, std::string& err)
{
  const JsonValue* q = nullptr;
  if (!GetObject(costs, key, &q, err)) return false;
  if (!q) return true;
  if (!ApplyInt(*q, "build", io.cost, err, 0)) return false;
  if (!ApplyInt(*q, "refund", io.refund, err, 0)) return false;
  return true;
}

// Build-cost-only entry: {"build": n}. A "refund" member is an error.
bool ApplyBuildCost(const JsonValue& costs, const char* key, int& io, std::string& err)
{
  const JsonValue* q = nullptr;
  if (!GetObject(costs, key, &q, err)) return false;
  if (!q) return true;
  if (FindJsonMember(*q, "refund")) {
    err = std::string("refund is not supported for key '") + key + "'";
    return false;
  }
  return ApplyInt(*q, "build", io, err, 0);
}

bool ApplyMission(const JsonValue& v, MissionDefinition& io, std::string& err)
{
  if (!v.isObject()) {
    err = "campaign missions must be objects";
    return false;
  }

  std::string kind = ToString(io.kind);
  if (!ApplyString(v, "kind", kind, err)) return false;
  if (!ParseMissionKind(kind, io.kind)) {
    err = "unknown mission kind '" + kind + "' (expected population|buildings|roads)";
    return false;
  }
  if (!ApplyInt(v, "target", io.target, err, 0)) return false;
  if (!ApplyString(v, "description", io.description, err)) return false;
  io.done = false;
  return true;
}

bool ApplyCampaign(const JsonValue& root, Campaign& io, std::string& err)
{
  const JsonValue* c = FindJsonMember(root, "campaign");
  if (!c) return true;

  if (!c->isArray() || c->arrayValue.size() != static_cast<std::size_t>(kCampaignLevels)) {
    err = "campaign must be an array of exactly 2 levels";
    return false;
  }

  Campaign tmp = io;
  for (std::size_t lvl = 0; lvl < tmp.size(); ++lvl) {
    const JsonValue& level = c->arrayValue[lvl];
    if (!level.isArray() || level.arrayValue.size() != static_cast<std::size_t>(kMissionsPerLevel)) {
      err = "each campaign level must be an array of exactly 3 missions";
      return false;
    }
    for (std::size_t k = 0; k < tmp[lvl].size(); ++k) {
      if (!ApplyMission(level.arrayValue[k], tmp[lvl][k], err)) return false;
    }
  }

  io = tmp;
  return true;
}

bool ApplyAll(const JsonValue& root, CityConfig& cfg, std::string& err)
{
  if (!ApplyInt(root, "size", cfg.size, err, 1)) return false;
  if (!ApplyInt(root, "starting_money", cfg.startingMoney, err, 0)) return false;
  if (!ApplyString(root, "name", cfg.name, err)) return false;
  if (!ApplyInt(root, "level_up_reward", cfg.levelUpReward, err, 0)) return false;
  if (!ApplyBool(root, "repeat_campaign_complete_notice", cfg.repeatCampaignCompleteNotice, err)) return false;

  const JsonValue* costs = nullptr;
  if (!GetObject(root, "costs", &costs, err)) return false;
  if (costs) {
    if (!ApplyQuote(*costs, "residential", cfg.costs.residential, err)) return false;
    if (!ApplyQuote(*costs, "road", cfg.costs.road, err)) return false;
    if (!ApplyBuildCost(*costs, "commercial", cfg.costs.commercial, err)) return false;
    if (!ApplyBuildCost(*costs, "industrial", cfg.costs.industrial, err)) return false;
    if (!ApplyBuildCost(*costs, "park", cfg.costs.park, err)) return false;
  }

  const JsonValue* res = nullptr;
  if (!GetObject(root, "residential", &res, err)) return false;
  if (res) {
    if (!ApplyInt(*res, "move_in_per_tick", cfg.residential.moveInPerTick, err, 0)) return false;
    if (!ApplyInt(*res, "capacity_per_level", cfg.residential.capacityPerLevel, err, 0)) return false;
    if (!ApplyInt(*res, "max_level", cfg.residential.maxLevel, err, 1)) return false;
  }

  return ApplyCampaign(root, cfg.campaign, err);
}

JsonValue QuoteToJson(const BuildQuote& q)
{
  JsonValue o = JsonValue::MakeObject();
  o.set("build", JsonValue::MakeNumber(q.cost));
  o.set("refund", JsonValue::MakeNumber(q.refund));
  return o;
}

JsonValue BuildCostToJson(int cost)
{
  JsonValue o = JsonValue::MakeObject();
  o.set("build", JsonValue::MakeNumber(cost));
  return o;
}

} // namespace

JsonValue CityConfigToJsonValue(const CityConfig& cfg)
{
  JsonValue root = JsonValue::MakeObject();
  root.set("size", JsonValue::MakeNumber(cfg.size));
  root.set("starting_money", JsonValue::MakeNumber(cfg.startingMoney));
  root.set("name", JsonValue::MakeString(cfg.name));
  root.set("level_up_reward", JsonValue::MakeNumber(cfg.levelUpReward));
  root.set("repeat_campaign_complete_notice", JsonValue::MakeBool(cfg.repeatCampaignCompleteNotice));

  JsonValue costs = JsonValue::MakeObject();
  costs.set("residential", QuoteToJson(cfg.costs.residential));
  costs.set("road", QuoteToJson(cfg.costs.road));
  costs.set("commercial", BuildCostToJson(cfg.costs.commercial));
  costs.set("industrial", BuildCostToJson(cfg.costs.industrial));
  costs.set("park", BuildCostToJson(cfg.costs.park));
  root.set("costs", std::move(costs));

  JsonValue res = JsonValue::MakeObject();
  res.set("move_in_per_tick", JsonValue::MakeNumber(cfg.residential.moveInPerTick));
  res.set("capacity_per_level", JsonValue::MakeNumber(cfg.residential.capacityPerLevel));
  res.set("max_level", JsonValue::MakeNumber(cfg.residential.maxLevel));
  root.set("residential", std::move(res));

  JsonValue campaign = JsonValue::MakeArray();
  for (const LevelMissions& level : cfg.campaign) {
    JsonValue lv = JsonValue::MakeArray();
    for (const MissionDefinition& m : level) {
      JsonValue mo = JsonValue::MakeObject();
      mo.set("description", JsonValue::MakeString(m.description));
      mo.set("kind", JsonValue::MakeString(ToString(m.kind)));
      mo.set("target", JsonValue::MakeNumber(m.target));
      lv.arrayValue.push_back(std::move(mo));
    }
    campaign.arrayValue.push_back(std::move(lv));
  }
  root.set("campaign", std::move(campaign));
  return root;
}

std::string CityConfigToJson(const CityConfig& cfg, int indentSpaces)
{
  JsonWriteOptions opt;
  opt.pretty = indentSpaces > 0;
  opt.indent = indentSpaces;
  return JsonStringify(CityConfigToJsonValue(cfg), opt);
}

bool ApplyCityConfigJson(const JsonValue& root, CityConfig& ioCfg, std::string& outError)
{
  if (!root.isObject()) {
    outError = "config root must be a JSON object";
    return false;
  }

  // Work on a copy so a failed document leaves the caller's config untouched.
  CityConfig cfg = ioCfg;
  if (!ApplyAll(root, cfg, outError)) return false;

  ioCfg = cfg;
  outError.clear();
  return true;
}

bool LoadCityConfigJsonFile(const std::string& path, CityConfig& ioCfg, std::string& outError)
{
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    outError = "failed to open config file: " + path;
    return false;
  }

  std::ostringstream oss;
  oss << f.rdbuf();

  JsonValue root;
  std::string err;
  if (!ParseJson(oss.str(), root, err)) {
    outError = path + ": " + err;
    return false;
  }
  if (!ApplyCityConfigJson(root, ioCfg, err)) {
    outError = path + ": " + err;
    return false;
  }
  outError.clear();
  return true;
}

bool WriteCityConfigJsonFile(const std::string& path, const CityConfig& cfg, std::string& outError,
                             int indentSpaces)
{
  std::ofstream f(path, std::ios::binary | std::ios::trunc);
  if (!f) {
    outError = "failed to open for writing: " + path;
    return false;
  }

  JsonWriteOptions opt;
  opt.pretty = indentSpaces > 0;
  opt.indent = indentSpaces;
  if (!WriteJson(f, CityConfigToJsonValue(cfg), outError, opt)) return false;

  f.flush();
  if (!f) {
    outError = "failed to write config file: " + path;
    return false;
  }
  outError.clear();
  return true;
}

} // namespace parcelcity
