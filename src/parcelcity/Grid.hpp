#pragma once

#include "parcelcity/Building.hpp"
#include "parcelcity/Parcel.hpp"

#include <cstddef>
#include <vector>

namespace parcelcity {

// Fixed-size square matrix of parcels indexed [x][y].
//
// Storage is column-major (x outer, y inner) so a flat walk over parcels()
// matches the simulation scan order.
class Grid {
public:
  explicit Grid(int size);

  int size() const { return m_size; }

  bool inBounds(int x, int y) const { return x >= 0 && y >= 0 && x < m_size && y < m_size; }

  // Bounds-checked lookup. Returns nullptr outside the grid.
  Parcel* get(int x, int y);
  const Parcel* get(int x, int y) const;

  // Unchecked access; callers must have checked inBounds().
  Parcel& at(int x, int y) { return m_parcels[index(x, y)]; }
  const Parcel& at(int x, int y) const { return m_parcels[index(x, y)]; }

  // Up to 4 axis-aligned neighbors in the fixed order west, east, north, south.
  // Out-of-range positions yield an empty list.
  std::vector<Parcel*> neighbors(int x, int y);
  std::vector<const Parcel*> neighbors(int x, int y) const;

  // Full rescan summing the resident count of every parcel.
  int totalResidents() const;

  // Number of parcels holding a building of the given type.
  int countType(BuildingType type) const;

  std::vector<Parcel>& parcels() { return m_parcels; }
  const std::vector<Parcel>& parcels() const { return m_parcels; }

  std::size_t parcelCount() const { return m_parcels.size(); }

private:
  std::size_t index(int x, int y) const
  {
    return static_cast<std::size_t>(x) * static_cast<std::size_t>(m_size) + static_cast<std::size_t>(y);
  }

  int m_size = 0;
  std::vector<Parcel> m_parcels;
};

} // namespace parcelcity
