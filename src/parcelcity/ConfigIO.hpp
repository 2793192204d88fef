#pragma once

#include "parcelcity/Config.hpp"
#include "parcelcity/Json.hpp"

#include <string>

namespace parcelcity {

// JSON helpers for CityConfig.
//
// Field names are snake_case. Apply* uses merge semantics: keys missing from
// the document keep the current value, so a file may override just one field.
//
// Example:
//   {
//     "size": 8,
//     "starting_money": 3000,
//     "costs": { "road": { "build": 120, "refund": 60 }, "park": { "build": 40 } },
//     "campaign": [[{"kind": "population", "target": 20, "description": "Reach 20 residents"}, ...], [...]]
//   }

JsonValue CityConfigToJsonValue(const CityConfig& cfg);
std::string CityConfigToJson(const CityConfig& cfg, int indentSpaces = 2);

bool ApplyCityConfigJson(const JsonValue& root, CityConfig& ioCfg, std::string& outError);

bool LoadCityConfigJsonFile(const std::string& path, CityConfig& ioCfg, std::string& outError);
bool WriteCityConfigJsonFile(const std::string& path, const CityConfig& cfg, std::string& outError,
                             int indentSpaces = 2);

} // namespace parcelcity
