#pragma once

#include "parcelcity/Building.hpp"
#include "parcelcity/Config.hpp"
#include "parcelcity/Economy.hpp"
#include "parcelcity/Grid.hpp"
#include "parcelcity/Hooks.hpp"
#include "parcelcity/Missions.hpp"
#include "parcelcity/TileSearch.hpp"
#include "parcelcity/Types.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace parcelcity {

// Return code for the City's mutating operations so callers (CLI, scripts,
// tests) can tell a silent no-op from a successful edit.
enum class ActionResult : std::uint8_t {
  Applied = 0,
  Noop,
  OutOfBounds,
  BlockedOccupied,
  UnknownBuildingType,
  InsufficientFunds,
};

const char* ToString(ActionResult r);

// Collaborators injected at construction. All pointers are non-owning and
// optional; the City falls back to internal defaults (silent notifier, no-op
// view, no road network, DefaultBuildingFactory) for any left null.
struct CityHooks {
  Notifier* notifier = nullptr;
  RoadNetworkSync* roads = nullptr;
  ViewAdapter* view = nullptr;
  BuildingFactory* factory = nullptr;
};

struct CityStats {
  int tick = 0;
  int money = 0;
  int population = 0;
  int residentialCount = 0;
  int roadCount = 0;
  int level = 1;
  int missionsDone = 0;
  bool campaignFinished = false;
};

// The city aggregate: owns the grid, treasury, mission state, simulation clock
// and registered services.
//
// Single-threaded. Every operation runs to completion before returning; a
// caller sharing a City across threads must serialize access externally.
class City {
public:
  City(int size, int money, std::string name = "ParcelCity", CityHooks hooks = {});
  explicit City(const CityConfig& cfg, CityHooks hooks = {});

  City(const City&) = delete;
  City& operator=(const City&) = delete;

  const std::string& name() const { return m_name; }
  int size() const { return m_grid.size(); }
  const CityConfig& config() const { return m_cfg; }

  Grid& grid() { return m_grid; }
  const Grid& grid() const { return m_grid; }

  Treasury& treasury() { return m_treasury; }
  const Treasury& treasury() const { return m_treasury; }
  int money() const { return m_treasury.balance(); }

  // Live resident total; rescans the whole grid on every call.
  int population() const { return m_grid.totalResidents(); }

  Parcel* getParcel(int x, int y) { return m_grid.get(x, y); }
  const Parcel* getParcel(int x, int y) const { return m_grid.get(x, y); }

  std::vector<Parcel*> neighbors(int x, int y) { return m_grid.neighbors(x, y); }
  std::vector<const Parcel*> neighbors(int x, int y) const { return m_grid.neighbors(x, y); }

  // --- Simulation ---

  // Advance `steps` ticks (ignored when < 1). Missions are evaluated once
  // after the last step using that step's building/road counts.
  void simulate(int steps = 1);

  int simTime() const { return m_simTime; }

  // Registered services run in registration order at the start of each tick.
  // Safe to call from SimService::simulate; the new service joins on the next tick.
  SimService& addService(std::unique_ptr<SimService> service);
  const std::vector<std::unique_ptr<SimService>>& services() const { return m_services; }

  const MissionEngine& missions() const { return m_missions; }
  int level() const { return m_missions.level(); }
  int missionCounter() const { return m_missions.missionCounter(); }

  // Counts measured by the most recent tick.
  int lastBuildingCount() const { return m_lastBuildCount; }
  int lastRoadCount() const { return m_lastRoadCount; }

  CityStats stats() const;

  // --- Building economy ---

  // Check-and-deduct for one placement of `type`. False (no side effect) when
  // the type is not buildable or funds are short.
  bool quoteAndDebit(BuildingType type);

  // Noop (no charge) when the factory returns no building for the type.
  ActionResult placeBuilding(int x, int y, BuildingType type);

  // Demolish with refund (road 50, residential 250, others nothing).
  ActionResult bulldoze(int x, int y);

  // Disaster removal, residential only, no refund.
  ActionResult destroy(int x, int y);

  // --- Spatial search ---

  Parcel* findTile(Point start, const ParcelPredicate& pred, int maxDistance);
  const Parcel* findTile(Point start, const ParcelPredicate& pred, int maxDistance) const;

  // --- Collaborators ---

  Notifier& notifier() const { return *m_notifier; }
  ViewAdapter& viewAdapter() const { return *m_view; }
  RoadNetworkSync* roadNetwork() const { return m_roads; }
  BuildingFactory& factory() const { return *m_factory; }

private:
  void refreshAround(int x, int y) const;
  void syncRoad(int x, int y, const Building* b) const;
  void clearParcel(Parcel& p);
  void applyMissionResult(const MissionEvaluation& ev);

  CityConfig m_cfg;
  std::string m_name;
  Grid m_grid;
  Treasury m_treasury;
  MissionEngine m_missions;

  int m_simTime = 0;
  int m_lastBuildCount = 0;
  int m_lastRoadCount = 0;

  std::vector<std::unique_ptr<SimService>> m_services;

  std::unique_ptr<Notifier> m_ownedNotifier;
  std::unique_ptr<ViewAdapter> m_ownedView;
  std::unique_ptr<BuildingFactory> m_ownedFactory;

  Notifier* m_notifier = nullptr;
  ViewAdapter* m_view = nullptr;
  RoadNetworkSync* m_roads = nullptr;
  BuildingFactory* m_factory = nullptr;
};

} // namespace parcelcity
