#include "parcelcity/Building.hpp"

#include <algorithm>
#include <limits>

namespace parcelcity {

const char* ToString(BuildingType t)
{
  switch (t) {
  case BuildingType::None: return "none";
  case BuildingType::Residential: return "residential";
  case BuildingType::Road: return "road";
  case BuildingType::Commercial: return "commercial";
  case BuildingType::Industrial: return "industrial";
  case BuildingType::Park: return "park";
  default: return "unknown";
  }
}

bool ParseBuildingType(const std::string& s, BuildingType& outType)
{
  static constexpr BuildingType kAll[] = {
      BuildingType::None,       BuildingType::Residential, BuildingType::Road,
      BuildingType::Commercial, BuildingType::Industrial,  BuildingType::Park,
  };
  for (const BuildingType t : kAll) {
    if (s == ToString(t)) {
      outType = t;
      return true;
    }
  }
  return false;
}

int ResidentialBuilding::capacity() const
{
  const long long cap = static_cast<long long>(std::max(0, m_growth.capacityPerLevel)) * m_level;
  return static_cast<int>(std::min<long long>(cap, std::numeric_limits<int>::max()));
}

void ResidentialBuilding::simulate(City& city)
{
  (void)city;
  if (released()) return;

  const int cap = capacity();
  if (m_residents < cap) {
    const int room = cap - m_residents;
    m_residents += std::min(room, std::max(0, m_growth.moveInPerTick));
    return;
  }

  if (m_level < m_growth.maxLevel) {
    m_level++;
  }
}

void ResidentialBuilding::release()
{
  m_residents = 0;
  Building::release();
}

void ResidentialBuilding::setResidents(int n)
{
  m_residents = std::clamp(n, 0, capacity());
}

std::unique_ptr<Building> DefaultBuildingFactory::create(int x, int y, BuildingType type)
{
  if (type == BuildingType::Residential) {
    return std::make_unique<ResidentialBuilding>(x, y, m_growth);
  }
  return std::make_unique<Building>(x, y, type);
}

} // namespace parcelcity
