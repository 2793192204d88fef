#pragma once

#include "parcelcity/City.hpp"
#include "parcelcity/Hooks.hpp"

#include <cstddef>
#include <vector>

namespace parcelcity {

// Service that records a CityStats snapshot at the start of every tick.
//
// Because services run before parcels are advanced, each snapshot reflects the
// city as the previous tick left it.
class StatsHistoryService final : public SimService {
public:
  // maxEntries <= 0 keeps everything; otherwise the oldest entries are dropped.
  explicit StatsHistoryService(int maxEntries = 0) : m_maxEntries(maxEntries) {}

  void simulate(City& city) override;
  const char* name() const override { return "stats_history"; }

  const std::vector<CityStats>& history() const { return m_history; }
  void clear() { m_history.clear(); }

private:
  int m_maxEntries = 0;
  std::vector<CityStats> m_history;
};

} // namespace parcelcity
