#pragma once

#include <array>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "game/maps/BoardTile.hpp"
#include "game/scenario/ScenarioTypes.hpp"

namespace game::scenario
{
struct AmountRange
{
    int min = 0;
    int max = 0;
};

struct ObjectiveTemplate
{
    std::string id;
    std::string descriptionTemplate;
    std::string shortDescriptionTemplate;
    ObjectiveType type = ObjectiveType::FindItem;
    std::vector<std::string> targetIdOptions;
    std::optional<AmountRange> targetAmount;
    bool isOptional = false;
    bool isHidden = false;
    std::optional<int> revealedByIndex; // index into the owning template list
    int rewardInsight = 0;
    std::vector<std::string> rewardItemOptions;
};

struct MissionTemplate
{
    std::string id;
    std::string name;
    VictoryType victoryType = VictoryType::Escape;
    TileSet tileSet = TileSet::Mixed;
    std::array<int, 3> baseDoom = {14, 12, 10}; // Normal, Hard, Nightmare
    Difficulty minimumDifficulty = Difficulty::Normal;
    std::string goalTemplate;
    std::string specialRuleTemplate;
    std::vector<ObjectiveTemplate> objectiveTemplates;
    std::string victoryDescription;
    // Escort missions fail when the escorted victim dies.
    bool victimCanDie = false;

    [[nodiscard]] int BaseDoomFor(Difficulty difficulty) const
    {
        return baseDoom[static_cast<std::size_t>(difficulty)];
    }
    [[nodiscard]] bool AllowsDifficulty(Difficulty difficulty) const
    {
        return static_cast<int>(difficulty) >= static_cast<int>(minimumDifficulty);
    }
};

struct LocationOption
{
    std::string name;
    TileSet tileSet = TileSet::Indoor;
    Atmosphere atmosphere = Atmosphere::Creepy;
};

struct EnemySpawnConfig
{
    std::string type;
    AmountRange amount;
    std::string message;
};

struct BossConfig
{
    std::string type;
    std::string name;
    std::string spawnMessage;
    Difficulty difficulty = Difficulty::Normal;
};

struct CollectibleName
{
    std::string key;
    std::string singular;
    std::string plural;
};

struct QuestItemText
{
    std::string name;
    std::string description;
};

struct ThemeTilePreferences
{
    std::vector<std::string> preferredNames;
    std::vector<std::string> avoidNames;
    std::vector<maps::TileCategory> preferredCategories;
    std::vector<maps::TileCategory> avoidCategories;
    maps::FloorType floorPreference = maps::FloorType::Wood;
    TileSet naturalTileSet = TileSet::Mixed;
};

/**
 * Static template data the generator draws from.
 * Every lookup is total: unknown keys resolve to an empty pool or a default entry.
 */
class MissionCatalog
{
public:
    MissionCatalog();
    ~MissionCatalog() = default;

    void InitializeDefaults();

    // Missions
    void RegisterMission(const MissionTemplate& mission);
    [[nodiscard]] const MissionTemplate* GetMission(const std::string& id) const;
    [[nodiscard]] const std::vector<MissionTemplate>& Missions() const { return m_missions; }
    [[nodiscard]] std::vector<const MissionTemplate*> MissionsForDifficulty(Difficulty difficulty) const;

    // Locations and themes
    [[nodiscard]] const std::vector<LocationOption>& Locations() const { return m_locations; }
    [[nodiscard]] std::vector<const LocationOption*> LocationsForTileSet(TileSet tileSet) const;
    [[nodiscard]] ScenarioTheme ThemeForLocation(const LocationOption& location) const;
    [[nodiscard]] std::vector<ScenarioTheme> ThemesForTileSet(TileSet tileSet) const;
    [[nodiscard]] const ThemeTilePreferences& ThemePreferences(ScenarioTheme theme) const;
    [[nodiscard]] int AtmosphereDoomAdjustment(Atmosphere atmosphere) const;

    // Enemies
    [[nodiscard]] const std::vector<EnemySpawnConfig>& EnemiesForDifficulty(Difficulty difficulty) const;
    [[nodiscard]] const std::vector<EnemySpawnConfig>& EnemiesForMission(const std::string& missionId) const;
    [[nodiscard]] const std::vector<EnemySpawnConfig>& EnemiesForAtmosphere(Atmosphere atmosphere) const;
    [[nodiscard]] std::vector<const BossConfig*> BossesForDifficulty(Difficulty difficulty) const;
    [[nodiscard]] const BossConfig* GetBoss(const std::string& type) const;

    // Narrative banks
    [[nodiscard]] const std::vector<std::string>& TargetNames() const { return m_targetNames; }
    [[nodiscard]] const std::vector<std::string>& VictimNames() const { return m_victimNames; }
    [[nodiscard]] const std::vector<std::string>& MysteryNames() const { return m_mysteryNames; }
    [[nodiscard]] const std::vector<CollectibleName>& Collectibles() const { return m_collectibles; }
    [[nodiscard]] const std::vector<std::string>& TitleTemplates(const MissionTemplate& mission) const;
    [[nodiscard]] const std::vector<std::string>& BriefingOpenings() const { return m_briefingOpenings; }
    [[nodiscard]] const std::vector<std::string>& BriefingMiddles(const MissionTemplate& mission) const;
    [[nodiscard]] const std::vector<std::string>& BriefingClosings(Difficulty difficulty) const;
    [[nodiscard]] const std::vector<ObjectiveTemplate>& BonusObjectives() const { return m_bonusObjectives; }
    [[nodiscard]] QuestItemText QuestItemTextFor(const std::string& targetId) const;

    // Doom rules
    [[nodiscard]] int DoomOnDeath(Difficulty difficulty) const;
    [[nodiscard]] int DoomOnSurvivorRescue(Difficulty difficulty) const;

private:
    void RegisterLocations();
    void RegisterEnemies();
    void RegisterNarrative();
    void RegisterThemes();

    std::vector<MissionTemplate> m_missions;
    std::vector<LocationOption> m_locations;

    std::array<std::vector<EnemySpawnConfig>, 3> m_difficultyEnemies;
    std::unordered_map<std::string, std::vector<EnemySpawnConfig>> m_missionEnemies;
    std::unordered_map<Atmosphere, std::vector<EnemySpawnConfig>> m_atmosphereEnemies;
    std::vector<BossConfig> m_bosses;

    std::vector<std::string> m_targetNames;
    std::vector<std::string> m_victimNames;
    std::vector<std::string> m_mysteryNames;
    std::vector<CollectibleName> m_collectibles;
    std::unordered_map<std::string, std::vector<std::string>> m_titleTemplates;
    std::vector<std::string> m_defaultTitleTemplates;
    std::vector<std::string> m_briefingOpenings;
    std::unordered_map<std::string, std::vector<std::string>> m_briefingMiddles;
    std::array<std::vector<std::string>, 3> m_briefingClosings;
    std::vector<ObjectiveTemplate> m_bonusObjectives;
    std::unordered_map<std::string, QuestItemText> m_questItemTexts;

    std::vector<std::pair<std::string, ScenarioTheme>> m_locationThemeKeywords;
    std::unordered_map<ScenarioTheme, ThemeTilePreferences> m_themePreferences;
    ThemeTilePreferences m_defaultThemePreferences;
};
} // namespace game::scenario
