#include "parcelcity/City.hpp"

#include <sstream>
#include <utility>

namespace parcelcity {

namespace {

CityConfig MakeConfig(int size, int money, std::string name)
{
  CityConfig cfg;
  cfg.size = size;
  cfg.startingMoney = money;
  cfg.name = std::move(name);
  return cfg;
}

std::string MoneyMessage(const char* what, char sign, int amount)
{
  std::ostringstream oss;
  oss << what << ": " << sign << amount << "$";
  return oss.str();
}

} // namespace

const char* ToString(ActionResult r)
{
  switch (r) {
  case ActionResult::Applied: return "Applied";
  case ActionResult::Noop: return "Noop";
  case ActionResult::OutOfBounds: return "OutOfBounds";
  case ActionResult::BlockedOccupied: return "BlockedOccupied";
  case ActionResult::UnknownBuildingType: return "UnknownBuildingType";
  case ActionResult::InsufficientFunds: return "InsufficientFunds";
  default: return "UnknownResult";
  }
}

City::City(int size, int money, std::string name, CityHooks hooks)
    : City(MakeConfig(size, money, std::move(name)), hooks)
{
}

City::City(const CityConfig& cfg, CityHooks hooks)
    : m_cfg(cfg)
    , m_name(cfg.name)
    , m_grid(cfg.size)
    , m_treasury(cfg.startingMoney)
    , m_missions(cfg.campaign)
{
  if (hooks.notifier) {
    m_notifier = hooks.notifier;
  } else {
    m_ownedNotifier = std::make_unique<NullNotifier>();
    m_notifier = m_ownedNotifier.get();
  }

  if (hooks.view) {
    m_view = hooks.view;
  } else {
    m_ownedView = std::make_unique<NullViewAdapter>();
    m_view = m_ownedView.get();
  }

  if (hooks.factory) {
    m_factory = hooks.factory;
  } else {
    m_ownedFactory = std::make_unique<DefaultBuildingFactory>(m_cfg.residential);
    m_factory = m_ownedFactory.get();
  }

  m_roads = hooks.roads;

  for (const Parcel& p : m_grid.parcels()) p.refreshView(*this);
}

SimService& City::addService(std::unique_ptr<SimService> service)
{
  m_services.push_back(std::move(service));
  return *m_services.back();
}

void City::simulate(int steps)
{
  if (steps < 1) return;

  for (int step = 0; step < steps; ++step) {
    // Indexed: a service may register another one mid-tick; it first runs next step.
    const std::size_t serviceCount = m_services.size();
    for (std::size_t i = 0; i < serviceCount; ++i) m_services[i]->simulate(*this);

    // Counts are per step; only the final step's values reach the missions.
    int buildCount = 0;
    int roadCount = 0;

    // Column-major scan: x outer, y inner.
    for (int x = 0; x < m_grid.size(); ++x) {
      for (int y = 0; y < m_grid.size(); ++y) {
        Parcel& p = m_grid.at(x, y);
        if (p.occupied()) {
          if (p.buildingType() == BuildingType::Residential) {
            buildCount++;
          } else if (p.buildingType() == BuildingType::Road) {
            roadCount++;
          }
        }
        p.simulate(*this);
      }
    }

    m_lastBuildCount = buildCount;
    m_lastRoadCount = roadCount;
  }

  MissionInputs in;
  in.population = population();
  in.buildingCount = m_lastBuildCount;
  in.roadCount = m_lastRoadCount;
  applyMissionResult(m_missions.evaluate(in));

  m_simTime += steps;
}

void City::applyMissionResult(const MissionEvaluation& ev)
{
  if (ev.leveledUp) {
    m_treasury.credit(m_cfg.levelUpReward);
    m_notifier->notify(Notice{NoticeKind::MoneyGive, MoneyMessage("Level up", '+', m_cfg.levelUpReward)});
    return;
  }

  if (ev.campaignComplete && (ev.campaignFirstCompletion || m_cfg.repeatCampaignCompleteNotice)) {
    m_notifier->notify(Notice{NoticeKind::Success, "Congratulations! All missions complete!"});
    m_notifier->setSessionFinished();
  }
}

CityStats City::stats() const
{
  CityStats s;
  s.tick = m_simTime;
  s.money = m_treasury.balance();
  s.population = population();
  s.residentialCount = m_grid.countType(BuildingType::Residential);
  s.roadCount = m_grid.countType(BuildingType::Road);
  s.level = m_missions.level();
  s.missionsDone = m_missions.missionCounter();
  s.campaignFinished = m_missions.campaignFinished();
  return s;
}

bool City::quoteAndDebit(BuildingType type)
{
  const std::optional<BuildQuote> q = QuoteBuilding(m_cfg.costs, type);
  if (!q) return false;
  return m_treasury.tryDebit(q->cost);
}

ActionResult City::placeBuilding(int x, int y, BuildingType type)
{
  Parcel* p = m_grid.get(x, y);
  if (!p) return ActionResult::OutOfBounds;
  if (p->occupied()) return ActionResult::BlockedOccupied;

  const std::optional<BuildQuote> q = QuoteBuilding(m_cfg.costs, type);
  if (!q) return ActionResult::UnknownBuildingType;

  if (m_treasury.balance() < q->cost) {
    m_notifier->notify(Notice{NoticeKind::Error, "Insufficient funds."});
    return ActionResult::InsufficientFunds;
  }

  // Create before charging: a factory that declines the type leaves the city untouched.
  std::unique_ptr<Building> building = m_factory->create(x, y, type);
  if (!building) return ActionResult::Noop;

  if (!m_treasury.tryDebit(q->cost)) return ActionResult::InsufficientFunds;

  m_notifier->playSound(SoundEffect::Building);
  p->setBuilding(std::move(building));
  refreshAround(x, y);

  if (type == BuildingType::Road) {
    syncRoad(x, y, p->building());
    m_notifier->notify(Notice{NoticeKind::MoneyTake, MoneyMessage("Road built", '-', q->cost)});
  } else {
    m_notifier->notify(Notice{NoticeKind::MoneyTake, MoneyMessage("Building built", '-', q->cost)});
  }
  return ActionResult::Applied;
}

ActionResult City::bulldoze(int x, int y)
{
  Parcel* p = m_grid.get(x, y);
  if (!p) return ActionResult::OutOfBounds;
  if (!p->occupied()) return ActionResult::Noop;

  const BuildingType type = p->buildingType();
  if (type == BuildingType::Road) {
    const int refund = m_cfg.costs.road.refund;
    m_treasury.credit(refund);
    syncRoad(x, y, nullptr);
    m_notifier->notify(Notice{NoticeKind::MoneyGive, MoneyMessage("Road demolished", '+', refund)});
  } else if (type == BuildingType::Residential) {
    const int refund = m_cfg.costs.residential.refund;
    m_notifier->notify(Notice{NoticeKind::MoneyGive, MoneyMessage("Building demolished", '+', refund)});
    m_treasury.credit(refund);
  }

  m_notifier->playSound(SoundEffect::Bulldoze);
  clearParcel(*p);
  refreshAround(x, y);
  return ActionResult::Applied;
}

ActionResult City::destroy(int x, int y)
{
  Parcel* p = m_grid.get(x, y);
  if (!p) return ActionResult::OutOfBounds;
  if (!p->occupied()) return ActionResult::Noop;

  // Disasters only hit housing; roads and other structures are left standing.
  if (p->buildingType() != BuildingType::Residential) return ActionResult::Noop;

  syncRoad(x, y, nullptr);
  m_notifier->notify(Notice{NoticeKind::Error, "Building exploded!"});
  m_notifier->notify(Notice{NoticeKind::Error, "Residents did not survive!"});
  m_notifier->playSound(SoundEffect::Explosion);
  clearParcel(*p);
  refreshAround(x, y);
  return ActionResult::Applied;
}

Parcel* City::findTile(Point start, const ParcelPredicate& pred, int maxDistance)
{
  return FindTile(m_grid, start, pred, maxDistance);
}

const Parcel* City::findTile(Point start, const ParcelPredicate& pred, int maxDistance) const
{
  return FindTile(m_grid, start, pred, maxDistance);
}

void City::refreshAround(int x, int y) const
{
  if (const Parcel* p = m_grid.get(x, y)) p->refreshView(*this);
  if (const Parcel* p = m_grid.get(x - 1, y)) p->refreshView(*this);
  if (const Parcel* p = m_grid.get(x + 1, y)) p->refreshView(*this);
  if (const Parcel* p = m_grid.get(x, y - 1)) p->refreshView(*this);
  if (const Parcel* p = m_grid.get(x, y + 1)) p->refreshView(*this);
}

void City::syncRoad(int x, int y, const Building* b) const
{
  if (m_roads) m_roads->updateTile(x, y, b);
}

void City::clearParcel(Parcel& p)
{
  if (Building* b = p.building()) b->release();
  p.setBuilding(nullptr);
}

} // namespace parcelcity
