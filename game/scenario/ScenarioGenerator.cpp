#include "game/scenario/ScenarioGenerator.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>
#include <unordered_set>

#include "game/scenario/DoomTrack.hpp"

namespace game::scenario
{
namespace
{
std::string ToLower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

void ReplaceAll(std::string& text, const std::string& token, const std::string& value)
{
    std::size_t pos = 0;
    while ((pos = text.find(token, pos)) != std::string::npos)
    {
        text.replace(pos, token.size(), value);
        pos += value.size();
    }
}

int CeilFraction(int value, float fraction)
{
    return static_cast<int>(std::ceil(static_cast<float>(value) * fraction));
}

std::string ObjectiveIdFor(const ObjectiveTemplate& objectiveTemplate, int index)
{
    return "obj_" + objectiveTemplate.id + "_" + std::to_string(index);
}
} // namespace

std::string InterpolateTemplate(const std::string& text, const TemplateContext& ctx)
{
    std::string out = text;
    ReplaceAll(out, "{location}", ctx.location);
    ReplaceAll(out, "{target}", ctx.target);
    ReplaceAll(out, "{victim}", ctx.victim);
    ReplaceAll(out, "{mystery}", ctx.mystery);
    ReplaceAll(out, "{items}", ctx.items);
    ReplaceAll(out, "{item}", ctx.item);
    ReplaceAll(out, "{enemies}", ctx.enemies);
    ReplaceAll(out, "{count}", std::to_string(ctx.count));
    ReplaceAll(out, "{half}", std::to_string(ctx.half));
    ReplaceAll(out, "{total}", std::to_string(ctx.total));
    ReplaceAll(out, "{rounds}", std::to_string(ctx.rounds));
    return out;
}

std::string EnemyPluralName(const std::string& enemyType)
{
    if (enemyType == "cultist")
    {
        return "Cultists";
    }
    if (enemyType == "ghoul")
    {
        return "Ghouls";
    }
    if (enemyType == "deepone")
    {
        return "Deep Ones";
    }
    return "enemies";
}

ScenarioGenerator::ScenarioGenerator(const MissionCatalog& catalog, unsigned int seed)
    : m_catalog(catalog)
    , m_seed(seed)
    , m_rng(seed)
{
}

Scenario ScenarioGenerator::GenerateRandomScenario(Difficulty difficulty)
{
    const std::vector<const MissionTemplate*> missions = m_catalog.MissionsForDifficulty(difficulty);
    if (missions.empty())
    {
        std::cout << "ScenarioGenerator: ERROR - No mission template allows difficulty " << DifficultyToText(difficulty) << "\n";
        return Scenario{};
    }
    return GenerateScenario(*Pick(missions), difficulty);
}

Scenario ScenarioGenerator::GenerateScenario(const MissionTemplate& mission, Difficulty difficulty)
{
    const LocationChoice place = SelectLocation(mission);
    const CollectibleName& collectible = Pick(m_catalog.Collectibles());

    TemplateContext ctx;
    ctx.location = place.location != nullptr ? place.location->name : "the Unknown";
    ctx.target = Pick(m_catalog.TargetNames());
    ctx.victim = Pick(m_catalog.VictimNames());
    ctx.mystery = Pick(m_catalog.MysteryNames());
    ctx.item = collectible.singular;
    ctx.items = collectible.plural;

    Scenario scenario;
    scenario.id = "gen_" + std::to_string(m_seed) + "_" + std::to_string(++m_sequence);
    scenario.missionId = mission.id;
    scenario.difficulty = difficulty;
    scenario.victoryType = mission.victoryType;
    scenario.theme = place.theme;
    scenario.tileSet = place.tileSet;
    scenario.atmosphere = place.location != nullptr ? place.location->atmosphere : Atmosphere::Creepy;
    scenario.startLocation = ctx.location;
    scenario.specialRule = mission.specialRuleTemplate;

    scenario.startDoom = mission.BaseDoomFor(difficulty) + m_catalog.AtmosphereDoomAdjustment(scenario.atmosphere);
    scenario.doomOnDeath = m_catalog.DoomOnDeath(difficulty);
    scenario.doomOnSurvivorRescue = m_catalog.DoomOnSurvivorRescue(difficulty);

    std::vector<ScenarioObjective> objectives = BuildObjectives(mission, ctx);
    EnsureRequiredObjective(mission, objectives);
    std::vector<std::string> requiredIds;
    for (const auto& objective : objectives)
    {
        if (objective.IsRequired())
        {
            requiredIds.push_back(objective.id);
        }
    }

    // Goal text quotes the first objective's amount and the longest survival target.
    TemplateContext goalCtx = ctx;
    goalCtx.count = !objectives.empty() && objectives.front().targetAmount.has_value() ? *objectives.front().targetAmount : 3;
    goalCtx.rounds = 10;
    for (const auto& objective : objectives)
    {
        if (objective.type == ObjectiveType::Survive && objective.IsRequired())
        {
            goalCtx.rounds = objective.Target();
        }
    }

    for (auto& bonus : BuildBonusObjectives(RandomRange(1, 2)))
    {
        objectives.push_back(std::move(bonus));
    }
    scenario.objectives = std::move(objectives);

    scenario.goal = InterpolateTemplate(mission.goalTemplate, goalCtx);
    scenario.title = InterpolateTemplate(Pick(m_catalog.TitleTemplates(mission)), ctx);
    scenario.description = mission.name + " mission at " + ctx.location + ". " + scenario.goal;
    scenario.briefing = BuildBriefing(mission, difficulty, ctx.location, scenario.goal);

    VictoryCondition victory;
    victory.type = mission.victoryType;
    victory.description = mission.victoryDescription;
    victory.requiredObjectives = requiredIds;
    scenario.victoryConditions.push_back(victory);

    scenario.defeatConditions.push_back({DefeatType::AllDead, "All investigators have been killed", std::nullopt});
    scenario.defeatConditions.push_back({DefeatType::DoomZero, "The doom counter reaches zero", std::nullopt});
    if (mission.victimCanDie)
    {
        for (const auto& objective : scenario.objectives)
        {
            if (objective.type == ObjectiveType::Escape)
            {
                scenario.defeatConditions.push_back({DefeatType::ObjectiveFailed, ctx.victim + " has been killed", objective.id});
                break;
            }
        }
    }

    scenario.doomEvents = BuildDoomEvents(mission, difficulty, scenario.atmosphere, scenario.startDoom);
    scenario.doomProphecy = BuildDoomProphecy(scenario.doomEvents);

    scenario.estimatedTime = EstimatedTimeFor(difficulty);
    scenario.recommendedPlayers = RecommendedPlayersFor(difficulty);
    return scenario;
}

std::vector<Scenario> ScenarioGenerator::GenerateScenarioPool(Difficulty difficulty, int count)
{
    std::vector<Scenario> pool;
    std::unordered_set<std::string> usedVictoryTypes;

    for (int i = 0; i < count; ++i)
    {
        Scenario scenario = GenerateRandomScenario(difficulty);
        int attempts = 1;
        while (usedVictoryTypes.contains(VictoryTypeToText(scenario.victoryType)) && attempts < kPoolRerollLimit)
        {
            scenario = GenerateRandomScenario(difficulty);
            ++attempts;
        }

        usedVictoryTypes.insert(VictoryTypeToText(scenario.victoryType));
        pool.push_back(std::move(scenario));
    }
    return pool;
}

ScenarioGenerator::LocationChoice ScenarioGenerator::SelectLocation(const MissionTemplate& mission)
{
    LocationChoice choice;

    const std::vector<ScenarioTheme> themes = m_catalog.ThemesForTileSet(mission.tileSet);
    choice.theme = themes.empty() ? ScenarioTheme::Manor : Pick(themes);

    const ThemeTilePreferences& prefs = m_catalog.ThemePreferences(choice.theme);
    choice.tileSet = mission.tileSet != TileSet::Mixed ? mission.tileSet : prefs.naturalTileSet;

    const std::vector<const LocationOption*> locations = m_catalog.LocationsForTileSet(mission.tileSet);
    if (locations.empty())
    {
        return choice;
    }

    // Score every candidate against the theme and keep the best ones.
    int bestScore = 0;
    std::vector<const LocationOption*> best;
    for (const LocationOption* location : locations)
    {
        const std::string name = ToLower(location->name);
        int score = m_catalog.ThemeForLocation(*location) == choice.theme ? 3 : 0;
        for (const auto& keyword : prefs.preferredNames)
        {
            if (name.find(keyword) != std::string::npos)
            {
                score += 1;
            }
        }
        for (const auto& keyword : prefs.avoidNames)
        {
            if (name.find(keyword) != std::string::npos)
            {
                score -= 2;
            }
        }

        if (best.empty() || score > bestScore)
        {
            bestScore = score;
            best = {location};
        }
        else if (score == bestScore)
        {
            best.push_back(location);
        }
    }

    choice.location = Pick(best);
    return choice;
}

std::vector<ScenarioObjective> ScenarioGenerator::BuildObjectives(const MissionTemplate& mission, TemplateContext& ctx)
{
    std::vector<ScenarioObjective> objectives;
    const auto& templates = mission.objectiveTemplates;

    for (std::size_t index = 0; index < templates.size(); ++index)
    {
        const ObjectiveTemplate& tmpl = templates[index];

        ScenarioObjective objective;
        objective.id = ObjectiveIdFor(tmpl, static_cast<int>(index));
        objective.type = tmpl.type;
        objective.isOptional = tmpl.isOptional;
        objective.isHidden = tmpl.isHidden;
        objective.rewardInsight = tmpl.rewardInsight;

        if (tmpl.targetAmount.has_value())
        {
            objective.targetAmount = RandomRange(tmpl.targetAmount->min, tmpl.targetAmount->max);
        }
        if (!tmpl.targetIdOptions.empty())
        {
            objective.targetId = Pick(tmpl.targetIdOptions);
        }
        if (!tmpl.rewardItemOptions.empty())
        {
            objective.rewardItem = Pick(tmpl.rewardItemOptions);
        }
        if (tmpl.revealedByIndex.has_value())
        {
            const int parent = *tmpl.revealedByIndex;
            if (parent >= 0 && static_cast<std::size_t>(parent) < templates.size())
            {
                objective.revealedBy = ObjectiveIdFor(templates[static_cast<std::size_t>(parent)], parent);
            }
        }

        // The first named kill target sets {enemies} for the whole mission text.
        if (objective.type == ObjectiveType::KillEnemy && objective.targetId.has_value() && ctx.enemies == "enemies")
        {
            ctx.enemies = EnemyPluralName(*objective.targetId);
        }

        TemplateContext objectiveCtx = ctx;
        const int amount = objective.targetAmount.value_or(10);
        objectiveCtx.count = objective.targetAmount.value_or(ctx.count);
        objectiveCtx.half = (amount + 1) / 2;
        objectiveCtx.total = amount;

        objective.description = InterpolateTemplate(tmpl.descriptionTemplate, objectiveCtx);
        objective.shortDescription = InterpolateTemplate(tmpl.shortDescriptionTemplate, objectiveCtx);
        objectives.push_back(std::move(objective));
    }
    return objectives;
}

void ScenarioGenerator::EnsureRequiredObjective(const MissionTemplate& mission, std::vector<ScenarioObjective>& objectives) const
{
    if (std::any_of(objectives.begin(), objectives.end(), [](const ScenarioObjective& objective) { return objective.IsRequired(); }))
    {
        return;
    }

    if (objectives.empty())
    {
        std::cout << "ScenarioGenerator: WARNING - Mission '" << mission.id << "' has no objectives, adding an escape objective\n";
        ScenarioObjective escape;
        escape.id = "obj_escape_0";
        escape.type = ObjectiveType::Escape;
        escape.description = "Find a way out before the doom track runs out.";
        escape.shortDescription = "Escape";
        objectives.push_back(std::move(escape));
        return;
    }

    // Promote the first objective players can see from the start.
    auto promoted = std::find_if(objectives.begin(), objectives.end(), [](const ScenarioObjective& objective) { return !objective.isHidden; });
    if (promoted == objectives.end())
    {
        promoted = objectives.begin();
        promoted->isHidden = false;
        promoted->revealedBy.reset();
    }
    promoted->isOptional = false;
    std::cout << "ScenarioGenerator: WARNING - Mission '" << mission.id << "' has only optional objectives, '"
              << promoted->id << "' is now required\n";
}

std::vector<ScenarioObjective> ScenarioGenerator::BuildBonusObjectives(int count)
{
    std::vector<const ObjectiveTemplate*> shuffled;
    for (const auto& tmpl : m_catalog.BonusObjectives())
    {
        shuffled.push_back(&tmpl);
    }
    std::shuffle(shuffled.begin(), shuffled.end(), m_rng);

    std::vector<ScenarioObjective> objectives;
    for (int i = 0; i < count && static_cast<std::size_t>(i) < shuffled.size(); ++i)
    {
        const ObjectiveTemplate& tmpl = *shuffled[static_cast<std::size_t>(i)];

        ScenarioObjective objective;
        objective.id = "obj_bonus_" + std::to_string(i);
        objective.type = tmpl.type;
        objective.isOptional = true;
        objective.isHidden = tmpl.isHidden;
        objective.rewardInsight = tmpl.rewardInsight;
        if (tmpl.targetAmount.has_value())
        {
            objective.targetAmount = RandomRange(tmpl.targetAmount->min, tmpl.targetAmount->max);
        }
        if (!tmpl.targetIdOptions.empty())
        {
            objective.targetId = Pick(tmpl.targetIdOptions);
        }
        if (!tmpl.rewardItemOptions.empty())
        {
            objective.rewardItem = Pick(tmpl.rewardItemOptions);
        }

        TemplateContext bonusCtx;
        bonusCtx.count = objective.targetAmount.value_or(1);
        objective.description = InterpolateTemplate(tmpl.descriptionTemplate, bonusCtx);
        objective.shortDescription = InterpolateTemplate(tmpl.shortDescriptionTemplate, bonusCtx);
        objectives.push_back(std::move(objective));
    }
    return objectives;
}

std::vector<DoomEvent> ScenarioGenerator::BuildDoomEvents(const MissionTemplate& mission, Difficulty difficulty, Atmosphere atmosphere, int startDoom)
{
    using namespace DoomWaveConstants;

    // Thresholds must be strictly decreasing and never below 1.
    const int bossThreshold = std::max(MIN_THRESHOLD, CeilFraction(startDoom, BOSS_WAVE_FRACTION));
    const int midThreshold = std::max(bossThreshold + 1, CeilFraction(startDoom, MID_WAVE_FRACTION));
    const int earlyThreshold = std::max(midThreshold + 1, CeilFraction(startDoom, EARLY_WAVE_FRACTION));

    const std::vector<EnemySpawnConfig>& difficultyPool = m_catalog.EnemiesForDifficulty(difficulty);
    std::vector<EnemySpawnConfig> mergedPool = difficultyPool;
    const auto& missionPool = m_catalog.EnemiesForMission(mission.id);
    const auto& atmospherePool = m_catalog.EnemiesForAtmosphere(atmosphere);
    mergedPool.insert(mergedPool.end(), missionPool.begin(), missionPool.end());
    mergedPool.insert(mergedPool.end(), atmospherePool.begin(), atmospherePool.end());

    std::vector<DoomEvent> events;
    auto addWave = [&](const std::vector<EnemySpawnConfig>& pool, int threshold)
    {
        if (pool.empty())
        {
            return;
        }
        const EnemySpawnConfig& enemy = Pick(pool);
        DoomEvent event;
        event.threshold = threshold;
        event.type = DoomEventType::SpawnEnemy;
        event.targetId = enemy.type;
        event.amount = RandomRange(enemy.amount.min, enemy.amount.max);
        event.message = enemy.message;
        events.push_back(event);
    };

    addWave(mergedPool, earlyThreshold);
    addWave(difficultyPool.empty() ? mergedPool : difficultyPool, midThreshold);

    const std::vector<const BossConfig*> bosses = m_catalog.BossesForDifficulty(difficulty);
    DoomEvent bossEvent;
    bossEvent.threshold = bossThreshold;
    bossEvent.type = DoomEventType::SpawnBoss;
    bossEvent.amount = 1;
    if (!bosses.empty())
    {
        const BossConfig* boss = Pick(bosses);
        bossEvent.targetId = boss->type;
        bossEvent.message = boss->spawnMessage;
    }
    else
    {
        bossEvent.targetId = kFallbackBossType;
        bossEvent.message = "Something enormous stirs in the dark!";
    }
    events.push_back(bossEvent);

    SortDoomEvents(events);
    return events;
}

std::string ScenarioGenerator::BuildBriefing(const MissionTemplate& mission, Difficulty difficulty, const std::string& location, const std::string& goal)
{
    const std::string& opening = Pick(m_catalog.BriefingOpenings());
    const std::string& middle = Pick(m_catalog.BriefingMiddles(mission));
    const std::string& closing = Pick(m_catalog.BriefingClosings(difficulty));

    return opening + "\n\n" + middle + "\n\n" + closing + "\n\nLocation: " + location + "\nObjective: " + goal;
}

int ScenarioGenerator::RandomRange(int min, int max)
{
    if (max < min)
    {
        std::swap(min, max);
    }
    std::uniform_int_distribution<int> dist(min, max);
    return dist(m_rng);
}

const char* EstimatedTimeFor(Difficulty difficulty)
{
    switch (difficulty)
    {
        case Difficulty::Normal: return "30-45 min";
        case Difficulty::Hard: return "45-60 min";
        case Difficulty::Nightmare: return "60-90 min";
        default: return "30-45 min";
    }
}

const char* RecommendedPlayersFor(Difficulty difficulty)
{
    switch (difficulty)
    {
        case Difficulty::Normal: return "1-2";
        case Difficulty::Hard: return "2-3";
        case Difficulty::Nightmare: return "3-4";
        default: return "1-2";
    }
}
} // namespace game::scenario
