#include "parcelcity/RoadNetwork.hpp"

#include "parcelcity/Building.hpp"

#include <algorithm>

namespace parcelcity {

RoadNetwork::RoadNetwork(int size)
    : m_size(std::max(0, size))
    , m_road(static_cast<std::size_t>(m_size) * static_cast<std::size_t>(m_size), 0)
    , m_mask(static_cast<std::size_t>(m_size) * static_cast<std::size_t>(m_size), 0)
{
}

void RoadNetwork::updateTile(int x, int y, const Building* building)
{
  m_updates++;
  if (!inBounds(x, y)) return;

  const bool road = building && building->type() == BuildingType::Road;
  const std::uint8_t before = m_road[index(x, y)];
  m_road[index(x, y)] = road ? 1 : 0;

  if (before != m_road[index(x, y)]) {
    updateMasksAround(x, y);
  }
}

bool RoadNetwork::isRoad(int x, int y) const
{
  return inBounds(x, y) && m_road[index(x, y)] != 0;
}

std::uint8_t RoadNetwork::connectionMask(int x, int y) const
{
  if (!inBounds(x, y)) return 0;
  return m_mask[index(x, y)];
}

int RoadNetwork::roadTileCount() const
{
  return static_cast<int>(std::count(m_road.begin(), m_road.end(), std::uint8_t{1}));
}

std::uint8_t RoadNetwork::computeMask(int x, int y) const
{
  if (!isRoad(x, y)) return 0;

  std::uint8_t m = 0;
  if (isRoad(x, y - 1)) m |= 1u << 0;
  if (isRoad(x + 1, y)) m |= 1u << 1;
  if (isRoad(x, y + 1)) m |= 1u << 2;
  if (isRoad(x - 1, y)) m |= 1u << 3;
  return m;
}

void RoadNetwork::applyMask(int x, int y)
{
  if (!inBounds(x, y)) return;
  m_mask[index(x, y)] = computeMask(x, y);
}

void RoadNetwork::updateMasksAround(int x, int y)
{
  applyMask(x, y);
  applyMask(x, y - 1);
  applyMask(x + 1, y);
  applyMask(x, y + 1);
  applyMask(x - 1, y);
}

std::vector<Point> RoadNetwork::component(Point start) const
{
  std::vector<Point> out;
  if (!isRoad(start.x, start.y)) return out;

  std::vector<std::uint8_t> seen(m_road.size(), 0);
  std::vector<Point> stack;

  auto markPush = [&](int x, int y) {
    if (!isRoad(x, y)) return;
    const std::size_t idx = index(x, y);
    if (seen[idx]) return;
    seen[idx] = 1;
    stack.push_back(Point{x, y});
  };

  markPush(start.x, start.y);
  while (!stack.empty()) {
    const Point p = stack.back();
    stack.pop_back();
    out.push_back(p);

    markPush(p.x - 1, p.y);
    markPush(p.x + 1, p.y);
    markPush(p.x, p.y - 1);
    markPush(p.x, p.y + 1);
  }
  return out;
}

int RoadNetwork::componentCount() const
{
  std::vector<std::uint8_t> seen(m_road.size(), 0);
  int count = 0;
  for (int y = 0; y < m_size; ++y) {
    for (int x = 0; x < m_size; ++x) {
      if (!isRoad(x, y) || seen[index(x, y)]) continue;
      count++;
      for (const Point& p : component(Point{x, y})) seen[index(p.x, p.y)] = 1;
    }
  }
  return count;
}

} // namespace parcelcity
