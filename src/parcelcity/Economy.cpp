#include "parcelcity/Economy.hpp"

#include <limits>

namespace parcelcity {

std::optional<BuildQuote> QuoteBuilding(const BuildCostSchedule& schedule, BuildingType type)
{
  BuildQuote q;
  switch (type) {
  case BuildingType::Residential: q = schedule.residential; break;
  case BuildingType::Road: q = schedule.road; break;
  case BuildingType::Commercial: q.cost = schedule.commercial; break;
  case BuildingType::Industrial: q.cost = schedule.industrial; break;
  case BuildingType::Park: q.cost = schedule.park; break;
  default: return std::nullopt;
  }

  if (q.cost <= 0) return std::nullopt;
  return q;
}

bool Treasury::tryDebit(int amount)
{
  if (amount < 0) return false;
  if (m_balance < amount) return false;
  m_balance -= amount;
  return true;
}

void Treasury::credit(int amount)
{
  if (amount <= 0) return;
  if (m_balance > std::numeric_limits<int>::max() - amount) {
    m_balance = std::numeric_limits<int>::max();
    return;
  }
  m_balance += amount;
}

} // namespace parcelcity
