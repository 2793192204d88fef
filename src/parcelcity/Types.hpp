#pragma once

#include <cstdlib>

namespace parcelcity {

// Simple integer tile coordinate.
struct Point {
  int x = 0;
  int y = 0;
};

inline bool operator==(const Point& a, const Point& b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(const Point& a, const Point& b) { return !(a == b); }

// Manhattan distance in tile space.
inline int ManhattanDistance(const Point& a, const Point& b)
{
  return std::abs(a.x - b.x) + std::abs(a.y - b.y);
}

} // namespace parcelcity
