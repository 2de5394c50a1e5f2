#pragma once

#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <unordered_set>
#include <vector>

#include <glm/vec2.hpp>

#include "game/maps/BoardTile.hpp"
#include "game/scenario/BalanceConfig.hpp"
#include "game/scenario/MissionCatalog.hpp"
#include "game/scenario/ScenarioTypes.hpp"

namespace game::scenario
{
/**
 * Objective spawn runtime
 *
 * Makes sure every objective has something physical on the board: quest items
 * appear on explored tiles as the party moves through the map, quest tiles
 * (exits, altars, sanctums) materialize once revealed. A pity timer and a
 * doom-driven escalation guarantee required items show up in time.
 *
 * State is a plain value. Every operation takes the current state and returns
 * the next one.
 */

enum class QuestItemType : uint8_t
{
    Key,
    Clue,
    Collectible,
    Artifact,
    Component
};

enum class QuestTileType : uint8_t
{
    Exit,
    Altar,
    RitualPoint,
    BossRoom,
    FinalConfrontation,
    NpcLocation
};

enum class RevealCondition : uint8_t
{
    None,
    ObjectiveComplete
};

enum class SpawnUrgency : uint8_t
{
    None,
    Warning,
    Critical
};

// unspawned -> spawned -> collected
struct QuestItem
{
    std::string id;
    std::string objectiveId;
    std::string scenarioId;
    QuestItemType type = QuestItemType::Artifact;
    std::string name;
    std::string description;
    bool spawned = false;
    std::optional<std::string> spawnedOnTileId;
    bool collected = false;
};

// unrevealed -> revealed -> spawned
struct QuestTile
{
    std::string id;
    std::string objectiveId;
    QuestTileType type = QuestTileType::NpcLocation;
    std::string name;
    bool spawned = false;
    bool revealed = false;
    RevealCondition revealCondition = RevealCondition::None;
    std::optional<std::string> revealObjectiveId;
    std::optional<std::string> bossType; // final confrontation only
    std::optional<std::string> spawnedOnTileId;
};

struct ObjectiveSpawnState
{
    std::vector<QuestItem> questItems;
    std::vector<QuestTile> questTiles;
    int tilesExplored = 0;
    int itemsCollected = 0;
    int tilesSinceLastSpawn = 0; // pity counter

    [[nodiscard]] const QuestItem* FindItem(const std::string& itemId) const;
    [[nodiscard]] QuestItem* FindItem(const std::string& itemId);
    [[nodiscard]] const QuestTile* FindTile(const std::string& questTileId) const;
    [[nodiscard]] QuestTile* FindTile(const std::string& questTileId);
};

// Changes made to a board tile when a quest tile materializes on it.
struct TileModification
{
    std::string tileId;
    std::string questTileId;
    std::optional<std::string> name;
    std::optional<std::string> description;
    std::optional<bool> isGate;
    std::optional<maps::FloorType> floorType;
};

// Emitted instead of a placed object when the final confrontation is found.
struct BossSpawnSignal
{
    std::string bossType;
    std::string tileId;
    glm::ivec2 axial{0, 0};
    std::string message;
};

struct TileExploredResult
{
    ObjectiveSpawnState updatedState;
    std::optional<QuestItem> spawnedItem;
    std::optional<QuestTile> spawnedQuestTile;
    std::optional<TileModification> tileModification;
    std::optional<BossSpawnSignal> bossSpawn;
    std::vector<QuestTile> revealedQuestTiles; // host should place these immediately
};

struct QuestTileSpawnResult
{
    ObjectiveSpawnState updatedState;
    std::optional<QuestTile> spawnedQuestTile;
    std::optional<std::string> targetTileId;
    std::optional<TileModification> tileModification;
    std::optional<BossSpawnSignal> bossSpawn;
};

struct GuaranteedSpawnCheck
{
    SpawnUrgency urgency = SpawnUrgency::None;
    std::vector<QuestItem> forcedItems;
    std::vector<QuestTile> forcedTiles;
    std::vector<std::string> warnings;
};

struct ItemPlacement
{
    QuestItem item;
    std::string tileId;
};

struct GuaranteedSpawnResult
{
    ObjectiveSpawnState updatedState;
    std::vector<ItemPlacement> itemPlacements;
    std::vector<TileModification> tileModifications;
    std::vector<BossSpawnSignal> bossSpawns;
    std::vector<std::string> deferredIds; // no eligible tile yet, retried next check
};

struct CollectResult
{
    ObjectiveSpawnState updatedState;
    std::optional<ScenarioObjective> updatedObjective;
    bool objectiveCompleted = false;
};

struct SpawnStatus
{
    int totalItems = 0;
    int spawnedItems = 0;
    int collectedItems = 0;
    int totalTiles = 0;
    int spawnedTiles = 0;
    std::vector<std::string> missingRequired; // "Item: <name>" / "Location: <name>"
};

struct ObjectiveProgress
{
    std::string id;
    std::string progress; // "collected/total"
    bool completed = false;
};

struct AdjustedSpawnConfig
{
    float chanceBoost = 0.0F;
    int pityThreshold = 4;
};

struct QuestTileTypeInfo
{
    QuestTileType type = QuestTileType::NpcLocation;
    std::string name;
};

class ObjectiveSpawner
{
public:
    explicit ObjectiveSpawner(
        const MissionCatalog& catalog,
        BalanceConfig config = DefaultBalanceConfig(),
        unsigned int seed = std::random_device{}()
    );

    [[nodiscard]] ObjectiveSpawnState InitializeObjectiveSpawns(const Scenario& scenario) const;

    /// Called when the party explores a tile. Quest items and quest tiles placed
    /// here are written into `tile`.
    [[nodiscard]] TileExploredResult OnTileExplored(
        const ObjectiveSpawnState& state,
        maps::BoardTile& tile,
        const Scenario& scenario,
        const std::vector<std::string>& completedObjectiveIds
    );

    /// Rolls whether an item appears on this tile. Forced once the pity counter is reached.
    [[nodiscard]] std::optional<QuestItem> ShouldSpawnQuestItem(
        const ObjectiveSpawnState& state,
        const maps::BoardTile& tile,
        const Scenario& scenario
    );

    /// Chance that the next roll on `tile` places an item, before the pity timer.
    /// Zero when the tile cannot hold an item or nothing is left to spawn.
    [[nodiscard]] float GetSpawnChance(const ObjectiveSpawnState& state, const maps::BoardTile& tile, const Scenario& scenario) const;

    [[nodiscard]] AdjustedSpawnConfig GetAdjustedSpawnConfig(const ObjectiveSpawnState& state, const Scenario& scenario) const;

    [[nodiscard]] GuaranteedSpawnCheck CheckGuaranteedSpawns(
        const ObjectiveSpawnState& state,
        const Scenario& scenario,
        int currentDoom,
        const std::vector<maps::BoardTile>& tiles,
        const std::vector<std::string>& completedObjectiveIds
    ) const;

    [[nodiscard]] GuaranteedSpawnResult ExecuteGuaranteedSpawns(
        const ObjectiveSpawnState& state,
        const GuaranteedSpawnCheck& check,
        std::vector<maps::BoardTile>& tiles
    ) const;

    [[nodiscard]] const BalanceConfig& GetConfig() const { return m_config; }
    [[nodiscard]] unsigned int GetSeed() const { return m_seed; }

private:
    [[nodiscard]] float RollUnit();

    const MissionCatalog& m_catalog;
    BalanceConfig m_config;
    unsigned int m_seed = 0;
    std::mt19937 m_rng;
};

// Lookups
[[nodiscard]] float GetRoomSpawnBonus(const std::string& roomName);
[[nodiscard]] int GetItemRoomScore(QuestItemType type, const std::string& roomName);
[[nodiscard]] int GetQuestTileLocationScore(QuestTileType type, const maps::BoardTile& tile);
[[nodiscard]] std::optional<QuestTileTypeInfo> MatchQuestTileType(const std::string& targetId);
[[nodiscard]] QuestTileTypeInfo QuestTileTypeFromTargetId(const std::string& targetId);
[[nodiscard]] QuestItemType QuestItemTypeFor(ObjectiveType objectiveType, const std::string& targetId);

// Placement
[[nodiscard]] bool IsEligibleSpawnTile(const maps::BoardTile& tile);
[[nodiscard]] const maps::BoardTile* FindBestSpawnTile(
    const QuestItem& item,
    const std::vector<maps::BoardTile>& tiles,
    const std::unordered_set<std::string>& usedTileIds
);
[[nodiscard]] const maps::BoardTile* FindBestQuestTileLocation(const QuestTile& questTile, const std::vector<maps::BoardTile>& tiles);
[[nodiscard]] QuestTileSpawnResult SpawnRevealedQuestTileImmediately(
    const ObjectiveSpawnState& state,
    const QuestTile& questTile,
    std::vector<maps::BoardTile>& exploredTiles
);
[[nodiscard]] TileModification BuildTileModification(const QuestTile& questTile, const maps::BoardTile& tile);
void ApplyTileModification(maps::BoardTile& tile, const TileModification& modification);

// Progress
[[nodiscard]] CollectResult CollectQuestItem(const ObjectiveSpawnState& state, const QuestItem& item, const Scenario& scenario);
[[nodiscard]] bool ShouldRevealQuestTile(const QuestTile& questTile, const std::vector<std::string>& completedObjectiveIds);
[[nodiscard]] bool CanEscape(const ObjectiveSpawnState& state, const glm::ivec2& playerAxial, const std::vector<maps::BoardTile>& tiles);
[[nodiscard]] SpawnStatus GetSpawnStatus(const ObjectiveSpawnState& state, const Scenario& scenario);
[[nodiscard]] std::vector<ObjectiveProgress> GetObjectiveProgress(const ObjectiveSpawnState& state, const Scenario& scenario);

// Text conversion helpers
[[nodiscard]] const char* QuestItemTypeToText(QuestItemType type);
[[nodiscard]] const char* QuestTileTypeToText(QuestTileType type);
[[nodiscard]] const char* RevealConditionToText(RevealCondition condition);
[[nodiscard]] const char* SpawnUrgencyToText(SpawnUrgency urgency);
[[nodiscard]] QuestItemType QuestItemTypeFromText(const std::string& value);
[[nodiscard]] QuestTileType QuestTileTypeFromText(const std::string& value);
[[nodiscard]] RevealCondition RevealConditionFromText(const std::string& value);
[[nodiscard]] SpawnUrgency SpawnUrgencyFromText(const std::string& value);
} // namespace game::scenario
