#pragma once

#include "parcelcity/Grid.hpp"
#include "parcelcity/Types.hpp"

#include <functional>

namespace parcelcity {

using ParcelPredicate = std::function<bool(const Parcel&)>;

// Bounded breadth-first search over the grid's 4-neighborhood.
//
// Returns the first parcel in BFS discovery order (FIFO frontier, neighbors
// pushed W,E,N,S) that satisfies `pred` and lies within `maxDistance`
// (Manhattan) of `start`. Parcels beyond the cutoff are dropped without being
// tested or expanded. Distance is a filter here, not a sort key.
//
// Returns nullptr when start is outside the grid or nothing matches.
const Parcel* FindTile(const Grid& grid, Point start, const ParcelPredicate& pred, int maxDistance);
Parcel* FindTile(Grid& grid, Point start, const ParcelPredicate& pred, int maxDistance);

} // namespace parcelcity
