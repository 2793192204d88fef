#pragma once

#include "parcelcity/Building.hpp"
#include "parcelcity/Types.hpp"

#include <memory>

namespace parcelcity {

class City;

// One grid cell. Holds at most one Building.
//
// Parcels are created once by the Grid and never move between positions; the
// id is unique within a grid and stable for the grid's lifetime.
class Parcel {
public:
  Parcel(int x, int y, int id)
      : m_x(x)
      , m_y(y)
      , m_id(id)
  {
  }

  Parcel(Parcel&&) = default;
  Parcel& operator=(Parcel&&) = default;

  int x() const { return m_x; }
  int y() const { return m_y; }
  int id() const { return m_id; }
  Point pos() const { return Point{m_x, m_y}; }

  bool occupied() const { return static_cast<bool>(m_building); }

  Building* building() { return m_building.get(); }
  const Building* building() const { return m_building.get(); }

  // Type of the held building, BuildingType::None when empty.
  BuildingType buildingType() const { return m_building ? m_building->type() : BuildingType::None; }

  // Resident count of the held building (0 when empty or non-residential).
  int residents() const { return m_building ? m_building->residents() : 0; }

  // Replaces the held building. Passing null clears the slot.
  void setBuilding(std::unique_ptr<Building> b) { m_building = std::move(b); }

  int distanceTo(const Parcel& other) const { return ManhattanDistance(pos(), other.pos()); }

  // Per-tick hook, forwarded to the building.
  void simulate(City& city);

  // Ask the city's view adapter to redraw this parcel.
  void refreshView(const City& city) const;

private:
  int m_x = 0;
  int m_y = 0;
  int m_id = 0;
  std::unique_ptr<Building> m_building;
};

} // namespace parcelcity
