#include "parcelcity/City.hpp"
#include "parcelcity/ConfigIO.hpp"
#include "parcelcity/Json.hpp"
#include "parcelcity/LogTee.hpp"
#include "parcelcity/Script.hpp"
#include "parcelcity/StatsHistory.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
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

#define ASSERT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " ASSERT_TRUE failed: " << #cond << "\n";                          \
      return;                                                                                                        \
    }                                                                                                                \
  } while (0)

using namespace parcelcity;

static fs::path MakeTempPath(const std::string& prefix)
{
  static std::uint64_t counter = 0;
  ++counter;

  std::error_code ec;
  fs::path root = fs::temp_directory_path(ec);
  if (ec || root.empty()) {
    root = fs::current_path(ec);
    if (ec || root.empty()) {
      root = fs::path(".");
    }
  }

  const auto stamp = static_cast<std::uint64_t>(
    std::chrono::high_resolution_clock::now().time_since_epoch().count());

  return root / (prefix + "_" + std::to_string(stamp) + "_" + std::to_string(counter));
}

static bool WriteTextFile(const fs::path& p, const std::string& text)
{
  std::ofstream f(p, std::ios::binary | std::ios::trunc);
  if (!f) return false;
  f << text;
  return static_cast<bool>(f);
}

static std::string ReadTextFile(const fs::path& p)
{
  std::ifstream f(p, std::ios::binary);
  std::ostringstream oss;
  oss << f.rdbuf();
  return oss.str();
}

static bool Contains(const std::string& hay, const std::string& needle)
{
  return hay.find(needle) != std::string::npos;
}

static void TestJsonParseBasics()
{
  JsonValue v;
  std::string err;
  ASSERT_TRUE(ParseJson("{\"a\": [1, -2.5, true, null], \"b\": \"x\\\"y\\u00e9\", \"c\": {}}", v, err));
  EXPECT_TRUE(err.empty());
  ASSERT_TRUE(v.isObject());

  const JsonValue* a = FindJsonMember(v, "a");
  ASSERT_TRUE(a && a->isArray());
  ASSERT_TRUE(a->arrayValue.size() == 4);
  EXPECT_EQ(a->arrayValue[0].numberValue, 1.0);
  EXPECT_EQ(a->arrayValue[1].numberValue, -2.5);
  EXPECT_TRUE(a->arrayValue[2].isBool() && a->arrayValue[2].boolValue);
  EXPECT_TRUE(a->arrayValue[3].isNull());

  const JsonValue* b = FindJsonMember(v, "b");
  ASSERT_TRUE(b && b->isString());
  EXPECT_EQ(b->stringValue, std::string("x\"y\xC3\xA9"));

  const JsonValue* c = FindJsonMember(v, "c");
  EXPECT_TRUE(c && c->isObject() && c->objectValue.empty());
  EXPECT_TRUE(FindJsonMember(v, "missing") == nullptr);
}

static void TestJsonParseErrors()
{
  JsonValue v;
  std::string err;

  EXPECT_FALSE(ParseJson("{\n  \"a\": tru}", v, err));
  EXPECT_EQ(err, std::string("JSON parse error at 2:8: invalid literal"));

  EXPECT_FALSE(ParseJson("[1, 2,]", v, err));
  EXPECT_TRUE(Contains(err, "JSON parse error at 1:"));

  EXPECT_FALSE(ParseJson("{} extra", v, err));
  EXPECT_TRUE(Contains(err, "trailing characters"));

  EXPECT_FALSE(ParseJson("", v, err));
  EXPECT_TRUE(Contains(err, "unexpected end of input"));

  EXPECT_FALSE(ParseJson("\"abc", v, err));
  EXPECT_TRUE(Contains(err, "unterminated string"));

  std::string deep;
  for (int i = 0; i < 100; ++i) deep += '[';
  for (int i = 0; i < 100; ++i) deep += ']';
  EXPECT_FALSE(ParseJson(deep, v, err));
  EXPECT_TRUE(Contains(err, "nesting too deep"));
}

static void TestJsonWriteCompact()
{
  JsonValue root = JsonValue::MakeObject();
  JsonValue arr = JsonValue::MakeArray();
  arr.arrayValue.push_back(JsonValue::MakeNumber(1));
  arr.arrayValue.push_back(JsonValue::MakeBool(true));
  arr.arrayValue.push_back(JsonValue::MakeNull());
  root.set("a", std::move(arr));
  root.set("b", JsonValue::MakeString("x\"y"));

  JsonWriteOptions opt;
  opt.pretty = false;
  EXPECT_EQ(JsonStringify(root, opt), std::string("{\"a\":[1,true,null],\"b\":\"x\\\"y\"}"));
}

static void TestConfigDefaultsRoundTrip()
{
  CityConfig cfg;
  cfg.size = 9;
  cfg.name = "Round \"Trip\"";
  cfg.costs.park = 40;
  cfg.residential.maxLevel = 5;
  cfg.campaign[1][2].target = 12;

  JsonValue v;
  std::string err;
  ASSERT_TRUE(ParseJson(CityConfigToJson(cfg), v, err));

  CityConfig loaded;
  ASSERT_TRUE(ApplyCityConfigJson(v, loaded, err));
  EXPECT_EQ(loaded.size, 9);
  EXPECT_EQ(loaded.name, cfg.name);
  EXPECT_EQ(loaded.startingMoney, 1000);
  EXPECT_EQ(loaded.costs.park, 40);
  EXPECT_EQ(loaded.costs.commercial, 0);
  EXPECT_EQ(loaded.residential.maxLevel, 5);
  EXPECT_EQ(loaded.campaign[1][2].target, 12);
  EXPECT_EQ(loaded.campaign[1][2].kind, MissionKind::Roads);
  EXPECT_EQ(loaded.campaign[0][0].description, std::string("Reach 35 residents"));
}

static void TestConfigMergeKeepsMissingKeys()
{
  JsonValue v;
  std::string err;
  ASSERT_TRUE(ParseJson("{\"starting_money\": 3000, \"costs\": {\"road\": {\"build\": 120}}}", v, err));

  CityConfig cfg;
  cfg.name = "Kept";
  ASSERT_TRUE(ApplyCityConfigJson(v, cfg, err));
  EXPECT_EQ(cfg.startingMoney, 3000);
  EXPECT_EQ(cfg.costs.road.cost, 120);
  EXPECT_EQ(cfg.costs.road.refund, 50);
  EXPECT_EQ(cfg.costs.residential.cost, 500);
  EXPECT_EQ(cfg.name, std::string("Kept"));
  EXPECT_EQ(cfg.size, 6);
}

static void TestConfigValidationLeavesConfigUntouched()
{
  JsonValue v;
  std::string err;
  CityConfig cfg;

  ASSERT_TRUE(ParseJson("{\"starting_money\": 5, \"size\": 0}", v, err));
  EXPECT_FALSE(ApplyCityConfigJson(v, cfg, err));
  EXPECT_EQ(err, std::string("out-of-range value for key 'size'"));
  EXPECT_EQ(cfg.startingMoney, 1000);

  ASSERT_TRUE(ParseJson("{\"name\": 4}", v, err));
  EXPECT_FALSE(ApplyCityConfigJson(v, cfg, err));
  EXPECT_EQ(err, std::string("expected string for key 'name'"));

  ASSERT_TRUE(ParseJson("{\"level_up_reward\": 1.5}", v, err));
  EXPECT_FALSE(ApplyCityConfigJson(v, cfg, err));
  EXPECT_EQ(err, std::string("expected integer for key 'level_up_reward'"));

  ASSERT_TRUE(ParseJson("{\"repeat_campaign_complete_notice\": 1}", v, err));
  EXPECT_FALSE(ApplyCityConfigJson(v, cfg, err));
  EXPECT_EQ(err, std::string("expected boolean for key 'repeat_campaign_complete_notice'"));

  ASSERT_TRUE(ParseJson("{\"costs\": []}", v, err));
  EXPECT_FALSE(ApplyCityConfigJson(v, cfg, err));
  EXPECT_EQ(err, std::string("expected object for key 'costs'"));

  ASSERT_TRUE(ParseJson("{\"costs\": {\"park\": {\"build\": 10, \"refund\": 5}}}", v, err));
  EXPECT_FALSE(ApplyCityConfigJson(v, cfg, err));
  EXPECT_EQ(err, std::string("refund is not supported for key 'park'"));
  EXPECT_EQ(cfg.costs.park, 0);

  ASSERT_TRUE(ParseJson("[1]", v, err));
  EXPECT_FALSE(ApplyCityConfigJson(v, cfg, err));
  EXPECT_EQ(err, std::string("config root must be a JSON object"));

  ASSERT_TRUE(ParseJson("{\"campaign\": [[], []]}", v, err));
  EXPECT_FALSE(ApplyCityConfigJson(v, cfg, err));
  EXPECT_TRUE(Contains(err, "exactly 3 missions"));

  ASSERT_TRUE(ParseJson("{\"campaign\": [[{\"kind\": \"parks\"}, {}, {}], [{}, {}, {}]]}", v, err));
  EXPECT_FALSE(ApplyCityConfigJson(v, cfg, err));
  EXPECT_TRUE(Contains(err, "unknown mission kind 'parks'"));
  EXPECT_EQ(cfg.campaign[0][0].kind, MissionKind::Population);
}

static void TestConfigCampaignOverride()
{
  JsonValue v;
  std::string err;
  ASSERT_TRUE(ParseJson("{\"campaign\": ["
                        "[{\"kind\": \"roads\", \"target\": 2, \"description\": \"Two roads\"}, {}, {}],"
                        "[{}, {}, {\"target\": 1}]"
                        "]}",
                        v, err));

  CityConfig cfg;
  ASSERT_TRUE(ApplyCityConfigJson(v, cfg, err));
  EXPECT_EQ(cfg.campaign[0][0].kind, MissionKind::Roads);
  EXPECT_EQ(cfg.campaign[0][0].target, 2);
  EXPECT_EQ(cfg.campaign[0][0].description, std::string("Two roads"));
  // Empty mission objects keep the defaults.
  EXPECT_EQ(cfg.campaign[0][1].target, 5);
  EXPECT_EQ(cfg.campaign[1][2].target, 1);
  EXPECT_EQ(cfg.campaign[1][2].kind, MissionKind::Roads);
}

static void TestCommercialFromConfigNeverRefunds()
{
  JsonValue v;
  std::string err;
  ASSERT_TRUE(ParseJson("{\"size\": 2, \"starting_money\": 1000, \"costs\": {\"commercial\": {\"build\": 300}}}",
                        v, err));

  CityConfig cfg;
  ASSERT_TRUE(ApplyCityConfigJson(v, cfg, err));
  EXPECT_EQ(cfg.costs.commercial, 300);

  // Written back as a build cost alone.
  EXPECT_FALSE(Contains(CityConfigToJson(cfg, 0), "\"commercial\":{\"build\":300,"));
  EXPECT_TRUE(Contains(CityConfigToJson(cfg, 0), "\"commercial\":{\"build\":300}"));

  City city(cfg);
  EXPECT_EQ(city.placeBuilding(1, 1, BuildingType::Commercial), ActionResult::Applied);
  EXPECT_EQ(city.money(), 700);
  EXPECT_EQ(city.bulldoze(1, 1), ActionResult::Applied);
  EXPECT_FALSE(city.getParcel(1, 1)->occupied());
  EXPECT_EQ(city.money(), 700);
}

static void TestConfigFileIO()
{
  std::error_code ec;
  const fs::path dir = MakeTempPath("parcelcity_config");
  fs::create_directories(dir, ec);
  ASSERT_TRUE(!ec);

  CityConfig cfg;
  cfg.startingMoney = 4242;
  std::string err;
  const fs::path out = dir / "city.json";
  ASSERT_TRUE(WriteCityConfigJsonFile(out.string(), cfg, err));

  CityConfig loaded;
  EXPECT_TRUE(LoadCityConfigJsonFile(out.string(), loaded, err));
  EXPECT_EQ(loaded.startingMoney, 4242);

  const fs::path bad = dir / "bad.json";
  ASSERT_TRUE(WriteTextFile(bad, "{\"size\": }"));
  EXPECT_FALSE(LoadCityConfigJsonFile(bad.string(), loaded, err));
  EXPECT_TRUE(err.rfind(bad.string() + ": JSON parse error", 0) == 0);

  EXPECT_FALSE(LoadCityConfigJsonFile((dir / "missing.json").string(), loaded, err));
  EXPECT_TRUE(Contains(err, "failed to open config file"));

  fs::remove_all(dir, ec);
}

static void TestCityUsesConfiguredCosts()
{
  CityConfig cfg;
  cfg.size = 2;
  cfg.startingMoney = 100;
  cfg.costs.park = 30;
  cfg.costs.road = BuildQuote{60, 10};
  City city(cfg);

  EXPECT_EQ(city.placeBuilding(0, 0, BuildingType::Park), ActionResult::Applied);
  EXPECT_EQ(city.money(), 70);
  EXPECT_EQ(city.placeBuilding(1, 0, BuildingType::Road), ActionResult::Applied);
  EXPECT_EQ(city.money(), 10);
  EXPECT_EQ(city.bulldoze(1, 0), ActionResult::Applied);
  EXPECT_EQ(city.money(), 20);

  // Only roads and housing refund on demolition.
  EXPECT_EQ(city.bulldoze(0, 0), ActionResult::Applied);
  EXPECT_EQ(city.money(), 20);
}

struct ScriptCapture {
  std::vector<std::string> printed;
  std::vector<std::string> errors;

  ScriptCallbacks callbacks()
  {
    ScriptCallbacks cb;
    cb.print = [this](const std::string& s) { printed.push_back(s); };
    cb.info = [](const std::string&) {};
    cb.error = [this](const std::string& s) { errors.push_back(s); };
    return cb;
  }
};

static void TestScriptMissionScenario()
{
  ScriptCapture cap;
  ScriptRunner runner;
  runner.setCallbacks(cap.callbacks());

  const std::string script =
      "# five houses and a road\n"
      "size 6\n"
      "money 2600\n"
      "new\n"
      "place 0 0 residential\n"
      "place 1 0 residential\n"
      "place 2 0 residential\n"
      "place 3 0 residential\n"
      "place 4 0 residential\n"
      "place 5 0 road\n"
      "expect money == 0\n"
      "tick 6\n"
      "expect level == 1\n"
      "tick\n"
      "expect population == 35\n"
      "expect level == 2\n"
      "expect money == 2500\n"
      "expect tick == 7\n"
      "expect residential == 5\n"
      "expect roads >= 1\n"
      "expect finished == 0\n"
      "find 0 0 road 5\n"
      "find 0 0 road 4\n"
      "find 5 5 empty 0\n"
      "echo done here\n";

  EXPECT_TRUE(runner.runText(script, "mission.txt"));
  EXPECT_TRUE(cap.errors.empty());
  ASSERT_TRUE(cap.printed.size() == 4);
  EXPECT_EQ(cap.printed[0], std::string("found 5 0"));
  EXPECT_EQ(cap.printed[1], std::string("none"));
  EXPECT_EQ(cap.printed[2], std::string("found 5 5"));
  EXPECT_EQ(cap.printed[3], std::string("done here"));

  ASSERT_TRUE(runner.state().history != nullptr);
  EXPECT_EQ(runner.state().history->history().size(), static_cast<std::size_t>(7));
  EXPECT_EQ(runner.state().roads->roadTileCount(), 1);
}

static void TestScriptNoticesAndStats()
{
  ScriptCapture cap;
  ScriptRunner runner;
  runner.setCallbacks(cap.callbacks());

  const std::string script =
      "size 2\n"
      "money 600\n"
      "new\n"
      "place 0 0 residential\n"
      "place 0 1 road\n"
      "place 1 1 road\n"
      "notices\n"
      "bulldoze 0 0\n"
      "expect money == 250\n"
      "stats\n";

  ASSERT_TRUE(runner.runText(script));
  ASSERT_TRUE(cap.printed.size() == 4);
  EXPECT_EQ(cap.printed[0], std::string("[money_take] Building built: -500$"));
  EXPECT_EQ(cap.printed[1], std::string("[money_take] Road built: -100$"));
  EXPECT_EQ(cap.printed[2], std::string("[error] Insufficient funds."));
  EXPECT_EQ(cap.printed[3],
            std::string("tick=0 money=250 population=0 residential=0 roads=1 level=1 missions=0 finished=0"));
}

static void TestScriptErrors()
{
  {
    ScriptCapture cap;
    ScriptRunner runner;
    runner.setCallbacks(cap.callbacks());
    EXPECT_FALSE(runner.runText("tick 1\n", "s.txt"));
    EXPECT_EQ(runner.lastError(), std::string("s.txt:1: no city yet (use new)"));
    EXPECT_EQ(runner.lastErrorLine(), 1);
    ASSERT_TRUE(cap.errors.size() == 1);
  }

  {
    ScriptRunner runner;
    EXPECT_FALSE(runner.runText("new\n\n# comment\nfrobnicate\n", "s.txt"));
    EXPECT_EQ(runner.lastError(), std::string("s.txt:4: unknown command 'frobnicate'"));
  }

  {
    ScriptRunner runner;
    EXPECT_FALSE(runner.runText("new\nexpect money < 5\n", "s.txt"));
    EXPECT_EQ(runner.lastError(), std::string("s.txt:2: expect failed: money < 5 (actual 1000)"));
  }

  {
    ScriptRunner runner;
    EXPECT_FALSE(runner.runText("new\nplace 0 0 castle\n"));
    EXPECT_EQ(runner.lastErrorLine(), 2);
    EXPECT_FALSE(runner.runText("new\nexpect happiness == 1\n"));
    EXPECT_FALSE(runner.runText("new\nexpect money ~ 1\n"));
    EXPECT_FALSE(runner.runText("new\ntick 0\n"));
    EXPECT_FALSE(runner.runText("size -2\n"));
  }

  {
    ScriptRunner runner;
    EXPECT_FALSE(runner.runFile("/nonexistent/parcelcity/script.txt"));
    EXPECT_EQ(runner.lastErrorLine(), 1);
  }
}

static void TestScriptLoadsConfig()
{
  std::error_code ec;
  const fs::path dir = MakeTempPath("parcelcity_script_config");
  fs::create_directories(dir, ec);
  ASSERT_TRUE(!ec);

  const fs::path cfgPath = dir / "c.json";
  ASSERT_TRUE(WriteTextFile(cfgPath, "{\"size\": 3, \"starting_money\": 77, \"name\": \"Cfg\"}"));

  const fs::path scriptPath = dir / "s.txt";
  ASSERT_TRUE(WriteTextFile(scriptPath, "config " + cfgPath.string() + "\nnew\nexpect money == 77\n"));

  ScriptRunner runner;
  EXPECT_TRUE(runner.runFile(scriptPath.string()));
  ASSERT_TRUE(runner.state().city != nullptr);
  EXPECT_EQ(runner.state().city->size(), 3);
  EXPECT_EQ(runner.state().city->name(), std::string("Cfg"));

  fs::remove_all(dir, ec);
}

static void TestLogTeeCapturesStreams()
{
  std::error_code ec;
  const fs::path dir = MakeTempPath("parcelcity_logtee");
  const fs::path logPath = dir / "run.log";

  int tick = 7;
  {
    LogTeeOptions opt;
    opt.path = logPath;
    opt.tickSource = [&tick]() { return tick; };

    std::string err;
    LogTee tee;
    ASSERT_TRUE(tee.start(opt, err));
    EXPECT_TRUE(tee.active());
    EXPECT_TRUE(tee.path() == logPath);

    std::cout << "hello from stdout\n";
    tick = 8;
    std::cerr << "oops\n";
    tee.stop();
    EXPECT_FALSE(tee.active());
  }

  const std::string text = ReadTextFile(logPath);
  EXPECT_TRUE(Contains(text, "[OUT] [tick=7] hello from stdout\n"));
  EXPECT_TRUE(Contains(text, "[ERR] [tick=8] oops\n"));

  // A second session rotates the first log aside.
  {
    LogTeeOptions opt;
    opt.path = logPath;
    opt.prefixLines = false;
    std::string err;
    LogTee tee(opt, err);
    EXPECT_TRUE(tee.active());
    std::cout << "second\n";
  }

  EXPECT_EQ(ReadTextFile(logPath), std::string("second\n"));
  fs::path rotated = logPath;
  rotated += ".1";
  EXPECT_TRUE(fs::exists(rotated, ec));
  EXPECT_TRUE(Contains(ReadTextFile(rotated), "hello from stdout"));

  LogTee empty;
  std::string err;
  EXPECT_FALSE(empty.start(LogTeeOptions{}, err));
  EXPECT_EQ(err, std::string("log path is empty"));

  fs::remove_all(dir, ec);
}

int main()
{
  TestJsonParseBasics();
  TestJsonParseErrors();
  TestJsonWriteCompact();
  TestConfigDefaultsRoundTrip();
  TestConfigMergeKeepsMissingKeys();
  TestConfigValidationLeavesConfigUntouched();
  TestConfigCampaignOverride();
  TestCommercialFromConfigNeverRefunds();
  TestConfigFileIO();
  TestCityUsesConfiguredCosts();
  TestScriptMissionScenario();
  TestScriptNoticesAndStats();
  TestScriptErrors();
  TestScriptLoadsConfig();
  TestLogTeeCapturesStreams();

  if (g_failures == 0) {
    std::cout << "parcelcity_config_tests: OK\n";
    return 0;
  }

  std::cerr << "parcelcity_config_tests: FAILED (" << g_failures << ")\n";
  return 1;
}
