#include "parcelcity/Grid.hpp"

#include <algorithm>

namespace parcelcity {

Grid::Grid(int size)
    : m_size(std::max(0, size))
{
  m_parcels.reserve(static_cast<std::size_t>(m_size) * static_cast<std::size_t>(m_size));
  for (int x = 0; x < m_size; ++x) {
    for (int y = 0; y < m_size; ++y) {
      m_parcels.emplace_back(x, y, static_cast<int>(m_parcels.size()));
    }
  }
}

Parcel* Grid::get(int x, int y)
{
  if (!inBounds(x, y)) return nullptr;
  return &at(x, y);
}

const Parcel* Grid::get(int x, int y) const
{
  if (!inBounds(x, y)) return nullptr;
  return &at(x, y);
}

std::vector<Parcel*> Grid::neighbors(int x, int y)
{
  std::vector<Parcel*> out;
  if (!inBounds(x, y)) return out;
  out.reserve(4);

  // Deterministic neighbor order: W, E, N, S.
  if (x > 0) out.push_back(&at(x - 1, y));
  if (x < m_size - 1) out.push_back(&at(x + 1, y));
  if (y > 0) out.push_back(&at(x, y - 1));
  if (y < m_size - 1) out.push_back(&at(x, y + 1));
  return out;
}

std::vector<const Parcel*> Grid::neighbors(int x, int y) const
{
  std::vector<const Parcel*> out;
  if (!inBounds(x, y)) return out;
  out.reserve(4);

  if (x > 0) out.push_back(&at(x - 1, y));
  if (x < m_size - 1) out.push_back(&at(x + 1, y));
  if (y > 0) out.push_back(&at(x, y - 1));
  if (y < m_size - 1) out.push_back(&at(x, y + 1));
  return out;
}

int Grid::totalResidents() const
{
  int total = 0;
  for (const Parcel& p : m_parcels) total += p.residents();
  return total;
}

int Grid::countType(BuildingType type) const
{
  int n = 0;
  for (const Parcel& p : m_parcels) {
    if (p.occupied() && p.buildingType() == type) n++;
  }
  return n;
}

} // namespace parcelcity
