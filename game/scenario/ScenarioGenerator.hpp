#pragma once

#include <random>
#include <string>
#include <vector>

#include "game/scenario/MissionCatalog.hpp"
#include "game/scenario/ScenarioTypes.hpp"

namespace game::scenario
{
// Placeholder values for {location}, {target}, {count}... in catalog templates.
struct TemplateContext
{
    std::string location;
    std::string target;
    std::string victim;
    std::string mystery;
    std::string item;
    std::string items;
    std::string enemies = "enemies";
    int count = 1;
    int half = 5;
    int total = 10;
    int rounds = 10;
};

[[nodiscard]] std::string InterpolateTemplate(const std::string& text, const TemplateContext& ctx);

// Display name used for {enemies} placeholders, e.g. "ghoul" -> "Ghouls".
[[nodiscard]] std::string EnemyPluralName(const std::string& enemyType);

// ============================================================================
// Doom wave timing (fractions of startDoom)
// ============================================================================

namespace DoomWaveConstants
{
    constexpr float EARLY_WAVE_FRACTION = 0.55F; // first encounter, leaves exploration time
    constexpr float MID_WAVE_FRACTION = 0.35F;
    constexpr float BOSS_WAVE_FRACTION = 0.15F;  // boss near the finale
    constexpr int MIN_THRESHOLD = 1;
}

class ScenarioGenerator
{
public:
    /**
     * @param catalog Template source; must outlive the generator
     * @param seed Random seed for reproducibility
     */
    explicit ScenarioGenerator(const MissionCatalog& catalog, unsigned int seed = std::random_device{}());

    [[nodiscard]] Scenario GenerateRandomScenario(Difficulty difficulty);

    // Builds a scenario for one specific mission template.
    [[nodiscard]] Scenario GenerateScenario(const MissionTemplate& mission, Difficulty difficulty);

    // Rerolls up to 10 times per slot to avoid repeating a victory type.
    [[nodiscard]] std::vector<Scenario> GenerateScenarioPool(Difficulty difficulty, int count = 3);

    [[nodiscard]] unsigned int GetSeed() const { return m_seed; }

private:
    static constexpr int kPoolRerollLimit = 10;

    struct LocationChoice
    {
        const LocationOption* location = nullptr;
        ScenarioTheme theme = ScenarioTheme::Manor;
        TileSet tileSet = TileSet::Indoor;
    };

    [[nodiscard]] LocationChoice SelectLocation(const MissionTemplate& mission);
    [[nodiscard]] std::vector<ScenarioObjective> BuildObjectives(const MissionTemplate& mission, TemplateContext& ctx);
    [[nodiscard]] std::vector<ScenarioObjective> BuildBonusObjectives(int count);
    void EnsureRequiredObjective(const MissionTemplate& mission, std::vector<ScenarioObjective>& objectives) const;
    [[nodiscard]] std::vector<DoomEvent> BuildDoomEvents(const MissionTemplate& mission, Difficulty difficulty, Atmosphere atmosphere, int startDoom);
    [[nodiscard]] std::string BuildBriefing(const MissionTemplate& mission, Difficulty difficulty, const std::string& location, const std::string& goal);

    [[nodiscard]] int RandomRange(int min, int max);

    template <typename T>
    [[nodiscard]] const T& Pick(const std::vector<T>& values)
    {
        std::uniform_int_distribution<std::size_t> dist(0, values.size() - 1);
        return values[dist(m_rng)];
    }

    const MissionCatalog& m_catalog;
    unsigned int m_seed;
    std::mt19937 m_rng;
    int m_sequence = 0;
};

[[nodiscard]] const char* EstimatedTimeFor(Difficulty difficulty);
[[nodiscard]] const char* RecommendedPlayersFor(Difficulty difficulty);
} // namespace game::scenario
