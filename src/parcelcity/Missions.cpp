#include "parcelcity/Missions.hpp"

#include <utility>

namespace parcelcity {

const char* ToString(MissionKind k)
{
  switch (k) {
  case MissionKind::Population: return "population";
  case MissionKind::Buildings: return "buildings";
  case MissionKind::Roads: return "roads";
  default: return "unknown";
  }
}

bool ParseMissionKind(const std::string& s, MissionKind& outKind)
{
  if (s == "population") {
    outKind = MissionKind::Population;
    return true;
  }
  if (s == "buildings") {
    outKind = MissionKind::Buildings;
    return true;
  }
  if (s == "roads") {
    outKind = MissionKind::Roads;
    return true;
  }
  return false;
}

Campaign DefaultCampaign()
{
  Campaign c{};
  c[0][0] = MissionDefinition{"Reach 35 residents", MissionKind::Population, 35, false};
  c[0][1] = MissionDefinition{"Build 5 buildings", MissionKind::Buildings, 5, false};
  c[0][2] = MissionDefinition{"Have at least 1 road", MissionKind::Roads, 1, false};

  c[1][0] = MissionDefinition{"Reach 75 residents", MissionKind::Population, 75, false};
  c[1][1] = MissionDefinition{"Build 10 buildings", MissionKind::Buildings, 10, false};
  c[1][2] = MissionDefinition{"Have at least 5 roads", MissionKind::Roads, 5, false};
  return c;
}

MissionEngine::MissionEngine(Campaign campaign)
    : m_campaign(std::move(campaign))
{
}

bool MissionEngine::Satisfied(const MissionDefinition& m, const MissionInputs& in)
{
  switch (m.kind) {
  case MissionKind::Population: return in.population >= m.target;
  case MissionKind::Buildings: return in.buildingCount >= m.target;
  case MissionKind::Roads: return in.roadCount >= m.target;
  default: return false;
  }
}

MissionEvaluation MissionEngine::evaluate(const MissionInputs& in)
{
  MissionEvaluation ev;

  m_missionCounter = 0;
  int tally = 0;
  for (MissionDefinition& m : m_campaign[static_cast<std::size_t>(m_level - 1)]) {
    if (Satisfied(m, in)) m.done = true;
    if (m.done) {
      m_missionCounter++;
      tally++;
    }
  }
  ev.missionsDone = m_missionCounter;

  if (tally != kMissionsPerLevel) return ev;
  ev.levelComplete = true;

  if (m_level < kCampaignLevels) {
    m_level++;
    ev.leveledUp = true;
  } else {
    ev.campaignComplete = true;
    ev.campaignFirstCompletion = !m_finished;
    m_finished = true;
  }
  return ev;
}

} // namespace parcelcity
