#include "parcelcity/TileSearch.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <vector>

namespace parcelcity {

const Parcel* FindTile(const Grid& grid, Point start, const ParcelPredicate& pred, int maxDistance)
{
  const Parcel* startParcel = grid.get(start.x, start.y);
  if (!startParcel || !pred) return nullptr;

  std::vector<std::uint8_t> visited(grid.parcelCount(), 0);
  std::deque<const Parcel*> q;
  q.push_back(startParcel);

  while (!q.empty()) {
    const Parcel* p = q.front();
    q.pop_front();

    const std::size_t id = static_cast<std::size_t>(p->id());
    if (visited[id]) continue;
    visited[id] = 1;

    if (startParcel->distanceTo(*p) > maxDistance) continue;

    for (const Parcel* n : grid.neighbors(p->x(), p->y())) q.push_back(n);

    if (pred(*p)) return p;
  }

  return nullptr;
}

Parcel* FindTile(Grid& grid, Point start, const ParcelPredicate& pred, int maxDistance)
{
  const Parcel* p = FindTile(static_cast<const Grid&>(grid), start, pred, maxDistance);
  return p ? &grid.at(p->x(), p->y()) : nullptr;
}

} // namespace parcelcity
