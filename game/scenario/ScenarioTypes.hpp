#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace game::scenario
{
enum class Difficulty : uint8_t
{
    Normal,
    Hard,
    Nightmare
};

enum class VictoryType : uint8_t
{
    Escape,
    Assassination,
    Survival,
    Collection,
    Ritual,
    Investigation
};

enum class ObjectiveType : uint8_t
{
    FindItem,
    FindTile,
    KillEnemy,
    KillBoss,
    Survive,
    Interact,
    Escape,
    Collect,
    Explore,
    Protect,
    Escort,
    Ritual
};

enum class DoomEventType : uint8_t
{
    SpawnEnemy,
    SpawnBoss,
    BuffEnemies,
    SanityHit,
    UnlockArea,
    Narrative
};

enum class DefeatType : uint8_t
{
    AllDead,
    DoomZero,
    ObjectiveFailed
};

enum class TileSet : uint8_t
{
    Indoor,
    Outdoor,
    Mixed
};

enum class Atmosphere : uint8_t
{
    Creepy,
    Urban,
    Wilderness,
    Academic,
    Industrial
};

enum class ScenarioTheme : uint8_t
{
    Manor,
    Church,
    Asylum,
    Warehouse,
    Forest,
    Urban,
    Coastal,
    Underground,
    Academic
};

// Boss used when a scenario needs a boss but names none.
constexpr const char* kFallbackBossType = "shoggoth";

struct ScenarioObjective
{
    std::string id;
    std::string description;
    std::string shortDescription;
    ObjectiveType type = ObjectiveType::FindItem;
    std::optional<std::string> targetId;
    std::optional<int> targetAmount;
    int currentAmount = 0;
    bool isOptional = false;
    bool isHidden = false;
    std::optional<std::string> revealedBy;
    bool completed = false;
    int rewardInsight = 0;
    std::optional<std::string> rewardItem;

    [[nodiscard]] bool IsRequired() const { return !isOptional; }
    [[nodiscard]] int Target() const { return targetAmount.value_or(0); }
};

struct DoomEvent
{
    int threshold = 0;
    DoomEventType type = DoomEventType::Narrative;
    std::string targetId;
    int amount = 0;
    std::string message;
    bool triggered = false;
};

struct VictoryCondition
{
    VictoryType type = VictoryType::Escape;
    std::string description;
    std::vector<std::string> requiredObjectives;
};

struct DefeatCondition
{
    DefeatType type = DefeatType::DoomZero;
    std::string description;
    std::optional<std::string> objectiveId;
};

struct Scenario
{
    std::string id;
    std::string title;
    std::string description;
    std::string briefing;
    std::string goal;
    std::string doomProphecy;
    std::string startLocation;
    std::string specialRule;
    std::string missionId;

    Difficulty difficulty = Difficulty::Normal;
    int startDoom = 12;
    int doomOnDeath = -1;
    int doomOnSurvivorRescue = 1;

    VictoryType victoryType = VictoryType::Escape;
    ScenarioTheme theme = ScenarioTheme::Manor;
    Atmosphere atmosphere = Atmosphere::Creepy;
    TileSet tileSet = TileSet::Indoor;

    std::string estimatedTime;
    std::string recommendedPlayers;

    std::vector<ScenarioObjective> objectives;
    std::vector<VictoryCondition> victoryConditions;
    std::vector<DefeatCondition> defeatConditions;
    std::vector<DoomEvent> doomEvents;

    [[nodiscard]] const ScenarioObjective* FindObjective(const std::string& objectiveId) const;
    [[nodiscard]] ScenarioObjective* FindObjective(const std::string& objectiveId);
    [[nodiscard]] std::vector<const ScenarioObjective*> RequiredObjectives() const;
    [[nodiscard]] bool HasDoomEvent(DoomEventType type) const;
    [[nodiscard]] int SumDoomEventAmounts(DoomEventType type) const;
};

// Sorts doom events by threshold, highest first.
void SortDoomEvents(std::vector<DoomEvent>& events);
[[nodiscard]] bool AreDoomEventsSorted(const std::vector<DoomEvent>& events);

// Text conversion helpers
[[nodiscard]] const char* DifficultyToText(Difficulty difficulty);
[[nodiscard]] const char* VictoryTypeToText(VictoryType type);
[[nodiscard]] const char* ObjectiveTypeToText(ObjectiveType type);
[[nodiscard]] const char* DoomEventTypeToText(DoomEventType type);
[[nodiscard]] const char* DefeatTypeToText(DefeatType type);
[[nodiscard]] const char* TileSetToText(TileSet tileSet);
[[nodiscard]] const char* AtmosphereToText(Atmosphere atmosphere);
[[nodiscard]] const char* ScenarioThemeToText(ScenarioTheme theme);

[[nodiscard]] Difficulty DifficultyFromText(const std::string& value);
[[nodiscard]] VictoryType VictoryTypeFromText(const std::string& value);
[[nodiscard]] ObjectiveType ObjectiveTypeFromText(const std::string& value);
[[nodiscard]] DoomEventType DoomEventTypeFromText(const std::string& value);
[[nodiscard]] DefeatType DefeatTypeFromText(const std::string& value);
[[nodiscard]] TileSet TileSetFromText(const std::string& value);
[[nodiscard]] Atmosphere AtmosphereFromText(const std::string& value);
[[nodiscard]] ScenarioTheme ScenarioThemeFromText(const std::string& value);
} // namespace game::scenario
