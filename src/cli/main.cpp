#include "cli/CliParse.hpp"

#include "parcelcity/City.hpp"
#include "parcelcity/ConfigIO.hpp"
#include "parcelcity/Hooks.hpp"
#include "parcelcity/LogTee.hpp"
#include "parcelcity/RoadNetwork.hpp"
#include "parcelcity/Script.hpp"
#include "parcelcity/Version.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

using namespace parcelcity;

namespace {

struct Placement {
  int x = 0;
  int y = 0;
  BuildingType type = BuildingType::None;
};

void PrintHelp()
{
  std::cout
      << "parcelcity_cli (headless city simulation runner)\n\n"
      << "Usage:\n"
      << "  parcelcity_cli [options]\n"
      << "  parcelcity_cli --script <scenario.txt> [options]\n\n"
      << "Options:\n"
      << "  --size <N>               grid edge length (default 6)\n"
      << "  --money <N>              starting treasury (default 1000)\n"
      << "  --name <text>            city name\n"
      << "  --config <path.json>     load CityConfig overrides\n"
      << "  --write-config <path>    write the effective config as JSON and exit\n"
      << "  --place <x,y,type>       place a building before ticking (repeatable)\n"
      << "  --ticks <N>              simulate N steps in one call (default 1)\n"
      << "  --script <path>          run a scenario script instead of --place/--ticks\n"
      << "  --log <path>             tee stdout/stderr to a rotating log file\n"
      << "  --quiet                  suppress progress output\n"
      << "  --version                print version and exit\n"
      << "  -h, --help               show this help\n\n"
      << "Script commands:\n"
      << "  size N | money N | name TEXT | config PATH | new\n"
      << "  place X Y TYPE | bulldoze X Y | destroy X Y | tick [N]\n"
      << "  find X Y <empty|any|TYPE> MAXDIST | stats | history | missions | notices\n"
      << "  expect <money|population|level|missions|tick|residential|roads|finished> <op> N\n"
      << "  echo TEXT\n";
}

bool NeedValue(int i, int argc, const std::string& arg)
{
  if (i + 1 < argc) return true;
  std::cerr << arg << " requires a value\n";
  return false;
}

} // namespace

int main(int argc, char** argv)
{
  CityConfig cfg;
  std::string configPath;
  std::string writeConfigPath;
  std::string scriptPath;
  std::string logPath;
  std::vector<Placement> placements;
  int ticks = 1;
  bool quiet = false;

  // Command-line overrides win over --config regardless of argument order.
  int sizeOverride = -1;
  int moneyOverride = -1;
  std::string nameOverride;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i] ? std::string(argv[i]) : std::string();

    if (arg == "-h" || arg == "--help") {
      PrintHelp();
      return 0;
    }
    if (arg == "--version") {
      std::cout << ParcelCityFullVersionString() << "\n";
      return 0;
    }
    if (arg == "--quiet") {
      quiet = true;
      continue;
    }
    if (arg == "--size" || arg == "--money" || arg == "--ticks") {
      if (!NeedValue(i, argc, arg)) return 2;
      int v = 0;
      if (!cli::ParseI32(argv[++i], &v) || v < (arg == "--money" ? 0 : 1)) {
        std::cerr << "invalid value for " << arg << ": " << argv[i] << "\n";
        return 2;
      }
      if (arg == "--size") sizeOverride = v;
      else if (arg == "--money") moneyOverride = v;
      else ticks = v;
      continue;
    }
    if (arg == "--name" || arg == "--config" || arg == "--write-config" || arg == "--script" || arg == "--log") {
      if (!NeedValue(i, argc, arg)) return 2;
      const std::string v = argv[++i];
      if (arg == "--name") nameOverride = v;
      else if (arg == "--config") configPath = v;
      else if (arg == "--write-config") writeConfigPath = v;
      else if (arg == "--script") scriptPath = v;
      else logPath = v;
      continue;
    }
    if (arg == "--place") {
      if (!NeedValue(i, argc, arg)) return 2;
      Placement p;
      std::string typeName;
      if (!cli::ParsePlacement(argv[++i], &p.x, &p.y, &typeName) || !ParseBuildingType(typeName, p.type)) {
        std::cerr << "invalid --place (expected x,y,type): " << argv[i] << "\n";
        return 2;
      }
      placements.push_back(p);
      continue;
    }

    std::cerr << "unknown option: " << arg << "\n";
    return 2;
  }

  // Declared before the tee: its tick source reads the city until stop().
  std::unique_ptr<City> city;
  LogTee logTee;
  if (!logPath.empty()) {
    std::string err;
    LogTeeOptions opt;
    opt.path = logPath;
    opt.tickSource = [&city]() { return city ? city->simTime() : 0; };
    if (!cli::EnsureParentDir(opt.path) || !logTee.start(opt, err)) {
      std::cerr << "failed to start log: " << err << "\n";
      return 1;
    }
  }

  if (!configPath.empty()) {
    std::string err;
    if (!LoadCityConfigJsonFile(configPath, cfg, err)) {
      std::cerr << err << "\n";
      return 1;
    }
  }
  if (sizeOverride > 0) cfg.size = sizeOverride;
  if (moneyOverride >= 0) cfg.startingMoney = moneyOverride;
  if (!nameOverride.empty()) cfg.name = nameOverride;

  if (!writeConfigPath.empty()) {
    std::string err;
    if (!cli::EnsureParentDir(writeConfigPath) || !WriteCityConfigJsonFile(writeConfigPath, cfg, err)) {
      std::cerr << "failed to write config: " << writeConfigPath << (err.empty() ? "" : ": " + err) << "\n";
      return 1;
    }
    if (!quiet) std::cout << "wrote " << writeConfigPath << "\n";
    return 0;
  }

  if (!scriptPath.empty()) {
    ScriptRunner runner;
    runner.state().cfg = cfg;

    ScriptCallbacks cb;
    cb.print = [](const std::string& line) { std::cout << line << "\n"; };
    cb.info = [](const std::string& line) { std::cout << line << "\n"; };
    cb.error = [](const std::string& line) { std::cerr << line << "\n"; };
    runner.setCallbacks(std::move(cb));

    ScriptRunOptions opt;
    opt.quiet = quiet;
    runner.setOptions(opt);

    if (!runner.runFile(scriptPath)) return 1;
    if (!quiet) std::cout << "script ok: " << scriptPath << "\n";
    return 0;
  }

  LogNotifier notifier(!quiet);
  RoadNetwork roads(cfg.size);
  CityHooks hooks;
  hooks.notifier = &notifier;
  hooks.roads = &roads;
  city = std::make_unique<City>(cfg, hooks);

  for (const Placement& p : placements) {
    const ActionResult r = city->placeBuilding(p.x, p.y, p.type);
    if (!quiet) std::cout << "place " << p.x << "," << p.y << " " << ToString(p.type) << ": " << ToString(r) << "\n";
  }

  city->simulate(ticks);

  const CityStats s = city->stats();
  std::cout << "city '" << city->name() << "' " << city->size() << "x" << city->size() << " tick=" << s.tick
            << " money=" << s.money << " population=" << s.population << " residential=" << s.residentialCount
            << " roads=" << s.roadCount << " road_components=" << roads.componentCount() << " level=" << s.level
            << " missions=" << s.missionsDone << "/" << kMissionsPerLevel << "\n";

  // Tear the city down before the log tee so late notices are still captured.
  city.reset();
  return 0;
}
