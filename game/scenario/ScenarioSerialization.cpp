#include "game/scenario/ScenarioSerialization.hpp"

#include <fstream>
#include <iostream>
#include <sstream>
#include <utility>

#include <nlohmann/json.hpp>

namespace game::scenario
{
namespace
{
using json = nlohmann::json;

constexpr int kAssetVersion = 1;

template <typename T>
void WriteOptional(json& node, const char* key, const std::optional<T>& value)
{
    if (value.has_value())
    {
        node[key] = *value;
    }
}

template <typename T>
std::optional<T> ReadOptional(const json& node, const char* key)
{
    if (!node.contains(key) || node[key].is_null())
    {
        return std::nullopt;
    }
    return node[key].get<T>();
}

json ObjectiveToJson(const ScenarioObjective& objective)
{
    json node = {
        {"id", objective.id},
        {"description", objective.description},
        {"short_description", objective.shortDescription},
        {"type", ObjectiveTypeToText(objective.type)},
        {"current_amount", objective.currentAmount},
        {"is_optional", objective.isOptional},
        {"is_hidden", objective.isHidden},
        {"completed", objective.completed},
        {"reward_insight", objective.rewardInsight},
    };
    WriteOptional(node, "target_id", objective.targetId);
    WriteOptional(node, "target_amount", objective.targetAmount);
    WriteOptional(node, "revealed_by", objective.revealedBy);
    WriteOptional(node, "reward_item", objective.rewardItem);
    return node;
}

ScenarioObjective ObjectiveFromJson(const json& node)
{
    ScenarioObjective objective;
    objective.id = node.value("id", "");
    objective.description = node.value("description", "");
    objective.shortDescription = node.value("short_description", "");
    objective.type = ObjectiveTypeFromText(node.value("type", "find_item"));
    objective.targetId = ReadOptional<std::string>(node, "target_id");
    objective.targetAmount = ReadOptional<int>(node, "target_amount");
    objective.currentAmount = node.value("current_amount", 0);
    objective.isOptional = node.value("is_optional", false);
    objective.isHidden = node.value("is_hidden", false);
    objective.revealedBy = ReadOptional<std::string>(node, "revealed_by");
    objective.completed = node.value("completed", false);
    objective.rewardInsight = node.value("reward_insight", 0);
    objective.rewardItem = ReadOptional<std::string>(node, "reward_item");
    return objective;
}

json DoomEventToJson(const DoomEvent& event)
{
    return {
        {"threshold", event.threshold},
        {"type", DoomEventTypeToText(event.type)},
        {"target_id", event.targetId},
        {"amount", event.amount},
        {"message", event.message},
        {"triggered", event.triggered},
    };
}

DoomEvent DoomEventFromJson(const json& node)
{
    DoomEvent event;
    event.threshold = node.value("threshold", 0);
    event.type = DoomEventTypeFromText(node.value("type", "narrative"));
    event.targetId = node.value("target_id", "");
    event.amount = node.value("amount", 0);
    event.message = node.value("message", "");
    event.triggered = node.value("triggered", false);
    return event;
}

json QuestItemToJson(const QuestItem& item)
{
    json node = {
        {"id", item.id},
        {"objective_id", item.objectiveId},
        {"scenario_id", item.scenarioId},
        {"type", QuestItemTypeToText(item.type)},
        {"name", item.name},
        {"description", item.description},
        {"spawned", item.spawned},
        {"collected", item.collected},
    };
    WriteOptional(node, "spawned_on_tile_id", item.spawnedOnTileId);
    return node;
}

QuestItem QuestItemFromJson(const json& node)
{
    QuestItem item;
    item.id = node.value("id", "");
    item.objectiveId = node.value("objective_id", "");
    item.scenarioId = node.value("scenario_id", "");
    item.type = QuestItemTypeFromText(node.value("type", "artifact"));
    item.name = node.value("name", "");
    item.description = node.value("description", "");
    item.spawned = node.value("spawned", false);
    item.spawnedOnTileId = ReadOptional<std::string>(node, "spawned_on_tile_id");
    item.collected = node.value("collected", false);
    return item;
}

json QuestTileToJson(const QuestTile& questTile)
{
    json node = {
        {"id", questTile.id},
        {"objective_id", questTile.objectiveId},
        {"type", QuestTileTypeToText(questTile.type)},
        {"name", questTile.name},
        {"spawned", questTile.spawned},
        {"revealed", questTile.revealed},
        {"reveal_condition", RevealConditionToText(questTile.revealCondition)},
    };
    WriteOptional(node, "reveal_objective_id", questTile.revealObjectiveId);
    WriteOptional(node, "boss_type", questTile.bossType);
    WriteOptional(node, "spawned_on_tile_id", questTile.spawnedOnTileId);
    return node;
}

QuestTile QuestTileFromJson(const json& node)
{
    QuestTile questTile;
    questTile.id = node.value("id", "");
    questTile.objectiveId = node.value("objective_id", "");
    questTile.type = QuestTileTypeFromText(node.value("type", "npc_location"));
    questTile.name = node.value("name", "");
    questTile.spawned = node.value("spawned", false);
    questTile.revealed = node.value("revealed", false);
    questTile.revealCondition = RevealConditionFromText(node.value("reveal_condition", "none"));
    questTile.revealObjectiveId = ReadOptional<std::string>(node, "reveal_objective_id");
    questTile.bossType = ReadOptional<std::string>(node, "boss_type");
    questTile.spawnedOnTileId = ReadOptional<std::string>(node, "spawned_on_tile_id");
    return questTile;
}

bool WriteTextFile(const std::string& filePath, const std::string& content, const char* what)
{
    if (content.empty())
    {
        return false;
    }

    std::ofstream file(filePath);
    if (!file.is_open())
    {
        std::cout << "ScenarioSerialization: ERROR - Could not open '" << filePath << "' for writing " << what << "\n";
        return false;
    }

    file << content;
    std::cout << "ScenarioSerialization: Saved " << what << " to " << filePath << "\n";
    return true;
}

std::optional<std::string> ReadTextFile(const std::string& filePath, const char* what)
{
    std::ifstream file(filePath);
    if (!file.is_open())
    {
        std::cout << "ScenarioSerialization: WARNING - Could not open " << what << " file at '" << filePath << "'\n";
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

void CheckAssetVersion(const json& root, const char* what)
{
    const int assetVersion = root.value("asset_version", 0);
    if (assetVersion != kAssetVersion)
    {
        std::cout << "ScenarioSerialization: WARNING - Unexpected " << what << " asset version " << assetVersion
                  << ", expected " << kAssetVersion << "\n";
    }
}
} // namespace

std::string ScenarioToJson(const Scenario& scenario)
{
    try
    {
        json root;
        root["asset_version"] = kAssetVersion;
        root["id"] = scenario.id;
        root["title"] = scenario.title;
        root["description"] = scenario.description;
        root["briefing"] = scenario.briefing;
        root["goal"] = scenario.goal;
        root["doom_prophecy"] = scenario.doomProphecy;
        root["start_location"] = scenario.startLocation;
        root["special_rule"] = scenario.specialRule;
        root["mission_id"] = scenario.missionId;
        root["difficulty"] = DifficultyToText(scenario.difficulty);
        root["start_doom"] = scenario.startDoom;
        root["doom_on_death"] = scenario.doomOnDeath;
        root["doom_on_survivor_rescue"] = scenario.doomOnSurvivorRescue;
        root["victory_type"] = VictoryTypeToText(scenario.victoryType);
        root["theme"] = ScenarioThemeToText(scenario.theme);
        root["atmosphere"] = AtmosphereToText(scenario.atmosphere);
        root["tile_set"] = TileSetToText(scenario.tileSet);
        root["estimated_time"] = scenario.estimatedTime;
        root["recommended_players"] = scenario.recommendedPlayers;

        json objectives = json::array();
        for (const auto& objective : scenario.objectives)
        {
            objectives.push_back(ObjectiveToJson(objective));
        }
        root["objectives"] = objectives;

        json victory = json::array();
        for (const auto& condition : scenario.victoryConditions)
        {
            victory.push_back({
                {"type", VictoryTypeToText(condition.type)},
                {"description", condition.description},
                {"required_objectives", condition.requiredObjectives},
            });
        }
        root["victory_conditions"] = victory;

        json defeat = json::array();
        for (const auto& condition : scenario.defeatConditions)
        {
            json node = {
                {"type", DefeatTypeToText(condition.type)},
                {"description", condition.description},
            };
            WriteOptional(node, "objective_id", condition.objectiveId);
            defeat.push_back(node);
        }
        root["defeat_conditions"] = defeat;

        json events = json::array();
        for (const auto& event : scenario.doomEvents)
        {
            events.push_back(DoomEventToJson(event));
        }
        root["doom_events"] = events;

        return root.dump(2);
    }
    catch (const std::exception& e)
    {
        std::cout << "ScenarioSerialization: ERROR - Failed to serialize scenario: " << e.what() << "\n";
        return {};
    }
}

std::optional<Scenario> ScenarioFromJson(const std::string& jsonContent)
{
    try
    {
        const json root = json::parse(jsonContent);
        CheckAssetVersion(root, "scenario");

        Scenario scenario;
        scenario.id = root.value("id", "");
        scenario.title = root.value("title", "");
        scenario.description = root.value("description", "");
        scenario.briefing = root.value("briefing", "");
        scenario.goal = root.value("goal", "");
        scenario.doomProphecy = root.value("doom_prophecy", "");
        scenario.startLocation = root.value("start_location", "");
        scenario.specialRule = root.value("special_rule", "");
        scenario.missionId = root.value("mission_id", "");
        scenario.difficulty = DifficultyFromText(root.value("difficulty", "normal"));
        scenario.startDoom = root.value("start_doom", scenario.startDoom);
        scenario.doomOnDeath = root.value("doom_on_death", scenario.doomOnDeath);
        scenario.doomOnSurvivorRescue = root.value("doom_on_survivor_rescue", scenario.doomOnSurvivorRescue);
        scenario.victoryType = VictoryTypeFromText(root.value("victory_type", "escape"));
        scenario.theme = ScenarioThemeFromText(root.value("theme", "manor"));
        scenario.atmosphere = AtmosphereFromText(root.value("atmosphere", "creepy"));
        scenario.tileSet = TileSetFromText(root.value("tile_set", "indoor"));
        scenario.estimatedTime = root.value("estimated_time", "");
        scenario.recommendedPlayers = root.value("recommended_players", "");

        for (const auto& node : root.value("objectives", json::array()))
        {
            scenario.objectives.push_back(ObjectiveFromJson(node));
        }

        for (const auto& node : root.value("victory_conditions", json::array()))
        {
            VictoryCondition condition;
            condition.type = VictoryTypeFromText(node.value("type", "escape"));
            condition.description = node.value("description", "");
            condition.requiredObjectives = node.value("required_objectives", std::vector<std::string>{});
            scenario.victoryConditions.push_back(condition);
        }

        for (const auto& node : root.value("defeat_conditions", json::array()))
        {
            DefeatCondition condition;
            condition.type = DefeatTypeFromText(node.value("type", "doom_zero"));
            condition.description = node.value("description", "");
            condition.objectiveId = ReadOptional<std::string>(node, "objective_id");
            scenario.defeatConditions.push_back(condition);
        }

        for (const auto& node : root.value("doom_events", json::array()))
        {
            scenario.doomEvents.push_back(DoomEventFromJson(node));
        }
        SortDoomEvents(scenario.doomEvents);

        return scenario;
    }
    catch (const std::exception& e)
    {
        std::cout << "ScenarioSerialization: ERROR - Failed to parse scenario: " << e.what() << "\n";
        return std::nullopt;
    }
}

std::string SpawnStateToJson(const ObjectiveSpawnState& state)
{
    try
    {
        json root;
        root["asset_version"] = kAssetVersion;
        root["tiles_explored"] = state.tilesExplored;
        root["items_collected"] = state.itemsCollected;
        root["tiles_since_last_spawn"] = state.tilesSinceLastSpawn;

        json items = json::array();
        for (const auto& item : state.questItems)
        {
            items.push_back(QuestItemToJson(item));
        }
        root["quest_items"] = items;

        json questTiles = json::array();
        for (const auto& questTile : state.questTiles)
        {
            questTiles.push_back(QuestTileToJson(questTile));
        }
        root["quest_tiles"] = questTiles;

        return root.dump(2);
    }
    catch (const std::exception& e)
    {
        std::cout << "ScenarioSerialization: ERROR - Failed to serialize spawn state: " << e.what() << "\n";
        return {};
    }
}

std::optional<ObjectiveSpawnState> SpawnStateFromJson(const std::string& jsonContent)
{
    try
    {
        const json root = json::parse(jsonContent);
        CheckAssetVersion(root, "spawn state");

        ObjectiveSpawnState state;
        state.tilesExplored = root.value("tiles_explored", 0);
        state.itemsCollected = root.value("items_collected", 0);
        state.tilesSinceLastSpawn = root.value("tiles_since_last_spawn", 0);

        for (const auto& node : root.value("quest_items", json::array()))
        {
            state.questItems.push_back(QuestItemFromJson(node));
        }
        for (const auto& node : root.value("quest_tiles", json::array()))
        {
            state.questTiles.push_back(QuestTileFromJson(node));
        }
        return state;
    }
    catch (const std::exception& e)
    {
        std::cout << "ScenarioSerialization: ERROR - Failed to parse spawn state: " << e.what() << "\n";
        return std::nullopt;
    }
}

bool SaveScenarioToFile(const std::string& filePath, const Scenario& scenario)
{
    return WriteTextFile(filePath, ScenarioToJson(scenario), "scenario");
}

bool LoadScenarioFromFile(const std::string& filePath, Scenario& outScenario)
{
    const std::optional<std::string> content = ReadTextFile(filePath, "scenario");
    if (!content.has_value())
    {
        return false;
    }

    std::optional<Scenario> scenario = ScenarioFromJson(*content);
    if (!scenario.has_value())
    {
        return false;
    }

    outScenario = std::move(*scenario);
    std::cout << "ScenarioSerialization: Loaded scenario '" << outScenario.title << "' from " << filePath << "\n";
    return true;
}

bool SaveSpawnStateToFile(const std::string& filePath, const ObjectiveSpawnState& state)
{
    return WriteTextFile(filePath, SpawnStateToJson(state), "spawn state");
}

bool LoadSpawnStateFromFile(const std::string& filePath, ObjectiveSpawnState& outState)
{
    const std::optional<std::string> content = ReadTextFile(filePath, "spawn state");
    if (!content.has_value())
    {
        return false;
    }

    std::optional<ObjectiveSpawnState> state = SpawnStateFromJson(*content);
    if (!state.has_value())
    {
        return false;
    }

    outState = std::move(*state);
    std::cout << "ScenarioSerialization: Loaded spawn state from " << filePath << "\n";
    return true;
}
} // namespace game::scenario
