#pragma once

#include "parcelcity/City.hpp"
#include "parcelcity/Config.hpp"
#include "parcelcity/Hooks.hpp"
#include "parcelcity/RoadNetwork.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace parcelcity {

class StatsHistoryService;

// Callbacks used by ScriptRunner.
//
// - print(): command output (`stats`, `find`, `missions`, `echo`, ...).
// - info():  progress messages, suppressed when quiet.
// - error(): error messages, always emitted.
struct ScriptCallbacks {
  std::function<void(const std::string& line)> print;
  std::function<void(const std::string& line)> info;
  std::function<void(const std::string& line)> error;
};

struct ScriptRunOptions {
  bool quiet = false;
};

// Mutable runner state. Collaborators are heap-allocated so the City's
// non-owning hook pointers stay valid for the city's lifetime.
struct ScriptRunnerState {
  CityConfig cfg{};

  std::unique_ptr<RecordingNotifier> notifier;
  std::unique_ptr<RoadNetwork> roads;
  std::unique_ptr<City> city;

  // Owned by `city` (registered service); null before `new`.
  StatsHistoryService* history = nullptr;
};

// Deterministic, headless scenario runner.
//
// One command per line, '#' starts a comment:
//
//   size 4
//   money 2600
//   new
//   place 0 0 residential
//   place 1 0 road
//   tick 7
//   expect level == 2
//   find 0 0 empty 2
//
// A failing command stops the run; lastError() reads "<path>:<line>: <msg>".
class ScriptRunner {
public:
  ScriptRunner() = default;

  void setCallbacks(ScriptCallbacks cb) { m_cb = std::move(cb); }
  void setOptions(ScriptRunOptions opt) { m_opt = opt; }

  ScriptRunnerState& state() { return m_ctx; }
  const ScriptRunnerState& state() const { return m_ctx; }

  bool runFile(const std::string& path);
  bool runText(const std::string& text, const std::string& virtualPath = "<script>");

  const std::string& lastError() const { return m_lastError; }
  int lastErrorLine() const { return m_lastErrorLine; }

  bool fail(const std::string& path, int line, const std::string& msg);

  // (Re)build the city from the current config.
  void newCity();

private:
  bool runCommand(const std::vector<std::string>& t, const std::string& path, int lineNo);
  bool ensureCity(const std::string& path, int lineNo);

  void emitPrint(const std::string& line) const;
  void emitInfo(const std::string& line) const;
  void emitError(const std::string& line) const;

  ScriptRunnerState m_ctx;
  ScriptCallbacks m_cb{};
  ScriptRunOptions m_opt{};

  std::string m_lastError;
  int m_lastErrorLine = 0;
};

} // namespace parcelcity
