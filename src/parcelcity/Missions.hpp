#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace parcelcity {

constexpr int kCampaignLevels = 2;
constexpr int kMissionsPerLevel = 3;

// The single metric a mission tracks.
enum class MissionKind : std::uint8_t {
  Population = 0, // live resident total >= target
  Buildings = 1,  // residential buildings counted in the last tick >= target
  Roads = 2,      // road tiles counted in the last tick >= target
};

const char* ToString(MissionKind k);
bool ParseMissionKind(const std::string& s, MissionKind& outKind);

struct MissionDefinition {
  std::string description;
  MissionKind kind = MissionKind::Population;
  int target = 0;

  // Monotonic within a level episode: never reset once true.
  bool done = false;
};

using LevelMissions = std::array<MissionDefinition, kMissionsPerLevel>;
using Campaign = std::array<LevelMissions, kCampaignLevels>;

// Level 1: 35 residents, 5 buildings, 1 road.
// Level 2: 75 residents, 10 buildings, 5 roads.
Campaign DefaultCampaign();

// Aggregates measured by one simulate() call.
struct MissionInputs {
  int population = 0;
  int buildingCount = 0;
  int roadCount = 0;
};

struct MissionEvaluation {
  int missionsDone = 0;

  // The active level had all missions done during this evaluation.
  bool levelComplete = false;

  // Level 1 completed; the engine has moved to level 2.
  bool leveledUp = false;

  // Final level completed (fires on every evaluation once complete).
  bool campaignComplete = false;

  // campaignComplete, and this is the first time it happened.
  bool campaignFirstCompletion = false;
};

// Two-level mission progression.
//
// evaluate() is called once per City::simulate() call. The per-call mission
// counter is recomputed from the done flags each time; the level index
// advances at most once per evaluation and never past the last level.
class MissionEngine {
public:
  explicit MissionEngine(Campaign campaign = DefaultCampaign());

  int level() const { return m_level; }
  int missionCounter() const { return m_missionCounter; }
  bool campaignFinished() const { return m_finished; }

  const LevelMissions& activeMissions() const { return m_campaign[static_cast<std::size_t>(m_level - 1)]; }
  const Campaign& campaign() const { return m_campaign; }

  MissionEvaluation evaluate(const MissionInputs& in);

private:
  static bool Satisfied(const MissionDefinition& m, const MissionInputs& in);

  Campaign m_campaign;
  int m_level = 1;
  int m_missionCounter = 0;
  bool m_finished = false;
};

} // namespace parcelcity
