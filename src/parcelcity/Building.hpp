#pragma once

#include <cstdint>
#include <memory>
#include <string>

namespace parcelcity {

class City;

enum class BuildingType : std::uint8_t {
  None = 0,
  Residential = 1,
  Road = 2,
  Commercial = 3,
  Industrial = 4,
  Park = 5,
};

const char* ToString(BuildingType t);

// Parse a lowercase building type name ("residential", "road", ...).
// Returns false (and leaves outType untouched) for unknown names.
bool ParseBuildingType(const std::string& s, BuildingType& outType);

// Residential growth tuning. Kept separate from CityConfig so the factory can
// be constructed without pulling in the whole config header.
struct ResidentialGrowth {
  int moveInPerTick = 1;     // residents gained per tick while below capacity
  int capacityPerLevel = 10; // capacity = capacityPerLevel * level
  int maxLevel = 3;
};

// A structure placed on a parcel.
//
// Buildings are owned exclusively by the Parcel holding them. Anything a
// building acquires (residents, external handles) is dropped by release(),
// which the City calls before clearing the parcel.
class Building {
public:
  Building(int x, int y, BuildingType type)
      : m_x(x)
      , m_y(y)
      , m_type(type)
  {
  }

  virtual ~Building() = default;

  Building(const Building&) = delete;
  Building& operator=(const Building&) = delete;

  int x() const { return m_x; }
  int y() const { return m_y; }
  BuildingType type() const { return m_type; }

  // Resident count; 0 for anything that does not house people.
  virtual int residents() const { return 0; }

  // Per-tick hook. The default building is static.
  virtual void simulate(City& city) { (void)city; }

  virtual void release() { m_released = true; }
  bool released() const { return m_released; }

private:
  int m_x = 0;
  int m_y = 0;
  BuildingType m_type = BuildingType::None;
  bool m_released = false;
};

class ResidentialBuilding final : public Building {
public:
  ResidentialBuilding(int x, int y, const ResidentialGrowth& growth)
      : Building(x, y, BuildingType::Residential)
      , m_growth(growth)
  {
  }

  int residents() const override { return m_residents; }
  int level() const { return m_level; }
  int capacity() const;

  // Residents move in until the building is full. A full building develops to
  // the next level (one level per tick) until maxLevel.
  void simulate(City& city) override;

  // Evicts everyone.
  void release() override;

  // Direct occupancy override used by scenario tooling.
  void setResidents(int n);

private:
  ResidentialGrowth m_growth;
  int m_residents = 0;
  int m_level = 1;
};

// External factory contract: create(x, y, type) -> Building.
class BuildingFactory {
public:
  virtual ~BuildingFactory() = default;
  virtual std::unique_ptr<Building> create(int x, int y, BuildingType type) = 0;
};

class DefaultBuildingFactory final : public BuildingFactory {
public:
  explicit DefaultBuildingFactory(ResidentialGrowth growth = {}) : m_growth(growth) {}

  std::unique_ptr<Building> create(int x, int y, BuildingType type) override;

  const ResidentialGrowth& growth() const { return m_growth; }

private:
  ResidentialGrowth m_growth;
};

} // namespace parcelcity
