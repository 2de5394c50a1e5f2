#pragma once

#include <optional>
#include <string>

#include "game/scenario/ObjectiveSpawner.hpp"
#include "game/scenario/ScenarioTypes.hpp"

namespace game::scenario
{
// JSON text with an asset_version header. Empty string on failure.
[[nodiscard]] std::string ScenarioToJson(const Scenario& scenario);
[[nodiscard]] std::optional<Scenario> ScenarioFromJson(const std::string& jsonContent);

[[nodiscard]] std::string SpawnStateToJson(const ObjectiveSpawnState& state);
[[nodiscard]] std::optional<ObjectiveSpawnState> SpawnStateFromJson(const std::string& jsonContent);

bool SaveScenarioToFile(const std::string& filePath, const Scenario& scenario);
bool LoadScenarioFromFile(const std::string& filePath, Scenario& outScenario);

bool SaveSpawnStateToFile(const std::string& filePath, const ObjectiveSpawnState& state);
bool LoadSpawnStateFromFile(const std::string& filePath, ObjectiveSpawnState& outState);
} // namespace game::scenario
