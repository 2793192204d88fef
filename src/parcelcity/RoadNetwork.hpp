#pragma once

#include "parcelcity/Hooks.hpp"
#include "parcelcity/Types.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace parcelcity {

// Reference road-network collaborator.
//
// Mirrors which parcels hold roads and keeps a 4-bit connection mask per road
// tile so adjacency-sensitive consumers (road auto-tiling, vehicle graphs) can
// react to edits without rescanning the grid.
//
// Mask bit layout (tile-space):
//  bit0: (x, y-1)
//  bit1: (x+1, y)
//  bit2: (x, y+1)
//  bit3: (x-1, y)
class RoadNetwork final : public RoadNetworkSync {
public:
  explicit RoadNetwork(int size);

  void updateTile(int x, int y, const Building* building) override;

  int size() const { return m_size; }
  bool inBounds(int x, int y) const { return x >= 0 && y >= 0 && x < m_size && y < m_size; }

  bool isRoad(int x, int y) const;
  std::uint8_t connectionMask(int x, int y) const;

  int roadTileCount() const;

  // Number of 4-connected road components.
  int componentCount() const;

  // Tiles of the road component containing `start` in deterministic visit
  // order. Empty when start is not a road.
  std::vector<Point> component(Point start) const;

  // Number of updateTile() calls received.
  int updateCount() const { return m_updates; }

private:
  std::size_t index(int x, int y) const
  {
    return static_cast<std::size_t>(y) * static_cast<std::size_t>(m_size) + static_cast<std::size_t>(x);
  }

  std::uint8_t computeMask(int x, int y) const;
  void applyMask(int x, int y);
  void updateMasksAround(int x, int y);

  int m_size = 0;
  std::vector<std::uint8_t> m_road;
  std::vector<std::uint8_t> m_mask;
  int m_updates = 0;
};

} // namespace parcelcity
