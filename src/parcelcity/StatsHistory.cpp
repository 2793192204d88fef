#include "parcelcity/StatsHistory.hpp"

namespace parcelcity {

void StatsHistoryService::simulate(City& city)
{
  m_history.push_back(city.stats());

  if (m_maxEntries > 0 && m_history.size() > static_cast<std::size_t>(m_maxEntries)) {
    const std::size_t drop = m_history.size() - static_cast<std::size_t>(m_maxEntries);
    m_history.erase(m_history.begin(), m_history.begin() + static_cast<std::ptrdiff_t>(drop));
  }
}

} // namespace parcelcity
