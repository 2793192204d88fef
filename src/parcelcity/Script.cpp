#include "parcelcity/Script.hpp"

#include "parcelcity/ConfigIO.hpp"
#include "parcelcity/StatsHistory.hpp"

#include <cctype>
#include <charconv>
#include <fstream>
#include <sstream>
#include <system_error>

namespace parcelcity {

namespace {

std::string Trim(const std::string& s)
{
  std::size_t b = 0;
  std::size_t e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b])) != 0) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])) != 0) --e;
  return s.substr(b, e - b);
}

std::vector<std::string> SplitWS(const std::string& s)
{
  std::vector<std::string> out;
  std::istringstream iss(s);
  std::string tok;
  while (iss >> tok) out.push_back(tok);
  return out;
}

std::string JoinFrom(const std::vector<std::string>& t, std::size_t first)
{
  std::string out;
  for (std::size_t i = first; i < t.size(); ++i) {
    if (i > first) out.push_back(' ');
    out += t[i];
  }
  return out;
}

bool ParseInt(const std::string& s, int* out)
{
  if (s.empty()) return false;
  const char* begin = s.data();
  const char* end = s.data() + s.size();
  if (*begin == '+') ++begin;
  int v = 0;
  const auto res = std::from_chars(begin, end, v, 10);
  if (res.ec != std::errc() || res.ptr != end) return false;
  *out = v;
  return true;
}

bool Compare(int lhs, const std::string& op, int rhs, bool* outOk)
{
  *outOk = true;
  if (op == "==") return lhs == rhs;
  if (op == "!=") return lhs != rhs;
  if (op == "<") return lhs < rhs;
  if (op == "<=") return lhs <= rhs;
  if (op == ">") return lhs > rhs;
  if (op == ">=") return lhs >= rhs;
  *outOk = false;
  return false;
}

bool ReadMetric(const City& city, const std::string& name, int* out)
{
  const CityStats s = city.stats();
  if (name == "money") *out = s.money;
  else if (name == "population") *out = s.population;
  else if (name == "level") *out = s.level;
  else if (name == "missions") *out = s.missionsDone;
  else if (name == "tick") *out = s.tick;
  else if (name == "residential") *out = s.residentialCount;
  else if (name == "roads") *out = s.roadCount;
  else if (name == "finished") *out = s.campaignFinished ? 1 : 0;
  else return false;
  return true;
}

std::string FormatStats(const CityStats& s)
{
  std::ostringstream oss;
  oss << "tick=" << s.tick << " money=" << s.money << " population=" << s.population
      << " residential=" << s.residentialCount << " roads=" << s.roadCount << " level=" << s.level
      << " missions=" << s.missionsDone << " finished=" << (s.campaignFinished ? 1 : 0);
  return oss.str();
}

} // namespace

bool ScriptRunner::fail(const std::string& path, int line, const std::string& msg)
{
  m_lastErrorLine = line;
  m_lastError = path + ':' + std::to_string(line) + ": " + msg;
  emitError(m_lastError);
  return false;
}

void ScriptRunner::emitPrint(const std::string& line) const
{
  if (m_cb.print) m_cb.print(line);
}

void ScriptRunner::emitInfo(const std::string& line) const
{
  if (m_opt.quiet) return;
  if (m_cb.info) m_cb.info(line);
}

void ScriptRunner::emitError(const std::string& line) const
{
  if (m_cb.error) m_cb.error(line);
}

void ScriptRunner::newCity()
{
  // Tear down in dependency order: the city refers to notifier and roads.
  m_ctx.city.reset();
  m_ctx.history = nullptr;

  m_ctx.notifier = std::make_unique<RecordingNotifier>();
  m_ctx.roads = std::make_unique<RoadNetwork>(m_ctx.cfg.size);

  CityHooks hooks;
  hooks.notifier = m_ctx.notifier.get();
  hooks.roads = m_ctx.roads.get();
  m_ctx.city = std::make_unique<City>(m_ctx.cfg, hooks);

  auto history = std::make_unique<StatsHistoryService>();
  m_ctx.history = history.get();
  m_ctx.city->addService(std::move(history));
}

bool ScriptRunner::ensureCity(const std::string& path, int lineNo)
{
  if (m_ctx.city) return true;
  return fail(path, lineNo, "no city yet (use new)");
}

bool ScriptRunner::runFile(const std::string& path)
{
  m_lastError.clear();
  m_lastErrorLine = 0;

  std::ifstream f(path, std::ios::binary);
  if (!f) return fail(path, 1, "failed to open script");

  std::ostringstream oss;
  oss << f.rdbuf();
  return runText(oss.str(), path);
}

bool ScriptRunner::runText(const std::string& text, const std::string& virtualPath)
{
  m_lastError.clear();
  m_lastErrorLine = 0;

  std::istringstream iss(text);
  std::string line;
  int lineNo = 0;
  while (std::getline(iss, line)) {
    lineNo++;

    const std::size_t hashPos = line.find('#');
    if (hashPos != std::string::npos) line = line.substr(0, hashPos);
    line = Trim(line);
    if (line.empty()) continue;

    const std::vector<std::string> t = SplitWS(line);
    if (!runCommand(t, virtualPath, lineNo)) return false;
  }
  return true;
}

bool ScriptRunner::runCommand(const std::vector<std::string>& t, const std::string& path, int lineNo)
{
  const std::string& cmd = t[0];

  if (cmd == "size" || cmd == "money") {
    int n = 0;
    if (t.size() != 2 || !ParseInt(t[1], &n) || n < (cmd == "size" ? 1 : 0)) {
      return fail(path, lineNo, cmd + " expects: " + cmd + " <non-negative integer>");
    }
    if (cmd == "size") {
      m_ctx.cfg.size = n;
    } else {
      m_ctx.cfg.startingMoney = n;
      // Adjusting money on a live city is allowed for scenario setup.
      if (m_ctx.city) m_ctx.city->treasury().setBalance(n);
    }
    return true;
  }

  if (cmd == "name") {
    if (t.size() < 2) return fail(path, lineNo, "name expects: name <text>");
    m_ctx.cfg.name = JoinFrom(t, 1);
    return true;
  }

  if (cmd == "config") {
    if (t.size() != 2) return fail(path, lineNo, "config expects: config <path.json>");
    std::string err;
    if (!LoadCityConfigJsonFile(t[1], m_ctx.cfg, err)) return fail(path, lineNo, err);
    return true;
  }

  if (cmd == "new") {
    if (t.size() != 1) return fail(path, lineNo, "new expects no arguments");
    newCity();
    emitInfo("new city '" + m_ctx.cfg.name + "' size=" + std::to_string(m_ctx.cfg.size) +
             " money=" + std::to_string(m_ctx.cfg.startingMoney));
    return true;
  }

  if (cmd == "echo") {
    emitPrint(JoinFrom(t, 1));
    return true;
  }

  if (!ensureCity(path, lineNo)) return false;
  City& city = *m_ctx.city;

  if (cmd == "place" || cmd == "bulldoze" || cmd == "destroy") {
    const std::size_t want = (cmd == "place") ? 4 : 3;
    int x = 0;
    int y = 0;
    if (t.size() != want || !ParseInt(t[1], &x) || !ParseInt(t[2], &y)) {
      return fail(path, lineNo, cmd + (cmd == "place" ? " expects: place <x> <y> <type>" : " expects: " + cmd + " <x> <y>"));
    }

    ActionResult r = ActionResult::Noop;
    if (cmd == "place") {
      BuildingType type = BuildingType::None;
      if (!ParseBuildingType(t[3], type)) return fail(path, lineNo, "unknown building type '" + t[3] + "'");
      r = city.placeBuilding(x, y, type);
    } else if (cmd == "bulldoze") {
      r = city.bulldoze(x, y);
    } else {
      r = city.destroy(x, y);
    }
    emitInfo(cmd + " " + t[1] + " " + t[2] + ": " + ToString(r));
    return true;
  }

  if (cmd == "tick") {
    int n = 1;
    if (t.size() > 2 || (t.size() == 2 && (!ParseInt(t[1], &n) || n < 1))) {
      return fail(path, lineNo, "tick expects: tick [N>=1]");
    }
    city.simulate(n);
    return true;
  }

  if (cmd == "find") {
    int x = 0;
    int y = 0;
    int dist = 0;
    if (t.size() != 5 || !ParseInt(t[1], &x) || !ParseInt(t[2], &y) || !ParseInt(t[4], &dist)) {
      return fail(path, lineNo, "find expects: find <x> <y> <empty|residential|road|any> <maxDistance>");
    }

    ParcelPredicate pred;
    if (t[3] == "empty") {
      pred = [](const Parcel& p) { return !p.occupied(); };
    } else if (t[3] == "any") {
      pred = [](const Parcel& p) { return p.occupied(); };
    } else {
      BuildingType type = BuildingType::None;
      if (!ParseBuildingType(t[3], type)) return fail(path, lineNo, "find: unknown filter '" + t[3] + "'");
      pred = [type](const Parcel& p) { return p.occupied() && p.buildingType() == type; };
    }

    const Parcel* p = city.findTile(Point{x, y}, pred, dist);
    if (p) {
      emitPrint("found " + std::to_string(p->x()) + " " + std::to_string(p->y()));
    } else {
      emitPrint("none");
    }
    return true;
  }

  if (cmd == "stats") {
    emitPrint(FormatStats(city.stats()));
    return true;
  }

  if (cmd == "history") {
    if (m_ctx.history) {
      for (const CityStats& s : m_ctx.history->history()) emitPrint(FormatStats(s));
    }
    return true;
  }

  if (cmd == "missions") {
    emitPrint("level " + std::to_string(city.level()) + " (" + std::to_string(city.missionCounter()) + "/" +
              std::to_string(kMissionsPerLevel) + ")");
    for (const MissionDefinition& m : city.missions().activeMissions()) {
      emitPrint(std::string(m.done ? "[x] " : "[ ] ") + m.description + " (" + ToString(m.kind) +
                " >= " + std::to_string(m.target) + ")");
    }
    return true;
  }

  if (cmd == "notices") {
    if (m_ctx.notifier) {
      for (const Notice& n : m_ctx.notifier->notices()) {
        emitPrint(std::string("[") + ToString(n.kind) + "] " + n.message);
      }
      m_ctx.notifier->clear();
    }
    return true;
  }

  if (cmd == "expect") {
    int rhs = 0;
    if (t.size() != 4 || !ParseInt(t[3], &rhs)) {
      return fail(path, lineNo, "expect expects: expect <metric> <op> <integer>");
    }
    int lhs = 0;
    if (!ReadMetric(city, t[1], &lhs)) return fail(path, lineNo, "expect: unknown metric '" + t[1] + "'");

    bool okOp = false;
    const bool pass = Compare(lhs, t[2], rhs, &okOp);
    if (!okOp) return fail(path, lineNo, "expect: unknown operator '" + t[2] + "'");
    if (!pass) {
      return fail(path, lineNo, "expect failed: " + t[1] + " " + t[2] + " " + t[3] + " (actual " +
                                    std::to_string(lhs) + ")");
    }
    return true;
  }

  return fail(path, lineNo, "unknown command '" + cmd + "'");
}

} // namespace parcelcity
