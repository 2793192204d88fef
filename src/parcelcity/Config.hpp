#pragma once

#include "parcelcity/Building.hpp"
#include "parcelcity/Economy.hpp"
#include "parcelcity/Missions.hpp"

#include <string>

namespace parcelcity {

struct CityConfig {
  // Grid edge length in parcels. Fixed once the city is built.
  int size = 6;

  int startingMoney = 1000;

  std::string name = "ParcelCity";

  BuildCostSchedule costs{};

  // Treasury credit when level 1 is completed.
  int levelUpReward = 2500;

  ResidentialGrowth residential{};

  // When false, the campaign-complete notice fires only the first time the
  // final level is completed. When true it fires on every completed evaluation.
  bool repeatCampaignCompleteNotice = false;

  Campaign campaign = DefaultCampaign();
};

} // namespace parcelcity
