#include "game/scenario/BalanceConfig.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>

#include <nlohmann/json.hpp>

namespace game::scenario
{
namespace
{
using json = nlohmann::json;

void ReadRoundCosts(const json& node, RoundCostTable& c)
{
    c.findItem = node.value("find_item", c.findItem);
    c.findTile = node.value("find_tile", c.findTile);
    c.killEnemyEach = node.value("kill_enemy_each", c.killEnemyEach);
    c.killBoss = node.value("kill_boss", c.killBoss);
    c.collectEach = node.value("collect_each", c.collectEach);
    c.exploreEach = node.value("explore_each", c.exploreEach);
    c.escape = node.value("escape", c.escape);
    c.ritual = node.value("ritual", c.ritual);
    c.interact = node.value("interact", c.interact);
    c.protect = node.value("protect", c.protect);
    c.escort = node.value("escort", c.escort);
}

void ReadValidator(const json& node, ValidatorTuning& v)
{
    v.efficiencyNormal = node.value("efficiency_normal", v.efficiencyNormal);
    v.efficiencyHard = node.value("efficiency_hard", v.efficiencyHard);
    v.efficiencyNightmare = node.value("efficiency_nightmare", v.efficiencyNightmare);
    v.minimumStartDoom = node.value("minimum_start_doom", v.minimumStartDoom);
    v.tightMarginRounds = node.value("tight_margin_rounds", v.tightMarginRounds);
    v.maxEnemiesPerSurvivalRound = node.value("max_enemies_per_survival_round", v.maxEnemiesPerSurvivalRound);
    v.purgeKillThreshold = node.value("purge_kill_threshold", v.purgeKillThreshold);
    v.highCollectionTarget = node.value("high_collection_target", v.highCollectionTarget);
    v.tilesPerDoom = node.value("tiles_per_doom", v.tilesPerDoom);
    v.collectibleYield = node.value("collectible_yield", v.collectibleYield);
    v.errorPenalty = node.value("error_penalty", v.errorPenalty);
    v.warningPenalty = node.value("warning_penalty", v.warningPenalty);
    v.confidentThreshold = node.value("confident_threshold", v.confidentThreshold);
    v.challengingThreshold = node.value("challenging_threshold", v.challengingThreshold);
}

void ReadFixer(const json& node, FixerTuning& f)
{
    f.survivalMargin = node.value("survival_margin", f.survivalMargin);
    f.doomBudgetMargin = node.value("doom_budget_margin", f.doomBudgetMargin);
    f.bossThresholdFraction = node.value("boss_threshold_fraction", f.bossThresholdFraction);
    f.enemyThresholdFraction = node.value("enemy_threshold_fraction", f.enemyThresholdFraction);
}

void ReadSpawn(const json& node, SpawnTuning& s)
{
    s.earlyChance = node.value("early_chance", s.earlyChance);
    s.normalChance = node.value("normal_chance", s.normalChance);
    s.behindChance = node.value("behind_chance", s.behindChance);
    s.maxChance = node.value("max_chance", s.maxChance);
    s.earlyGameThreshold = node.value("early_game_threshold", s.earlyGameThreshold);
    s.scheduleEndProgress = node.value("schedule_end_progress", s.scheduleEndProgress);
    s.tilesPerDoom = node.value("tiles_per_doom", s.tilesPerDoom);
    s.pityThreshold = node.value("pity_threshold", s.pityThreshold);
    s.minPityThreshold = node.value("min_pity_threshold", s.minPityThreshold);
    s.maxPityThreshold = node.value("max_pity_threshold", s.maxPityThreshold);
    s.collectionMissionItems = node.value("collection_mission_items", s.collectionMissionItems);
    s.collectionChanceBoost = node.value("collection_chance_boost", s.collectionChanceBoost);
    s.collectionPityThreshold = node.value("collection_pity_threshold", s.collectionPityThreshold);
    s.nightmarePityReduction = node.value("nightmare_pity_reduction", s.nightmarePityReduction);
    s.affinityWeight = node.value("affinity_weight", s.affinityWeight);
    s.organicQuestTileScore = node.value("organic_quest_tile_score", s.organicQuestTileScore);
}

void ReadGuaranteed(const json& node, GuaranteedSpawnTuning& g)
{
    g.doomCritical = node.value("doom_critical", g.doomCritical);
    g.doomWarning = node.value("doom_warning", g.doomWarning);
    g.explorationForceRatio = node.value("exploration_force_ratio", g.explorationForceRatio);
}

bool IsFraction(float value)
{
    return value >= 0.0F && value <= 1.0F;
}

// Empty when the table is usable, otherwise the first offending field.
std::string FindTuningProblem(const BalanceConfig& config)
{
    const ValidatorTuning& v = config.validator;
    if (v.efficiencyNormal <= 0.0F || v.efficiencyHard <= 0.0F || v.efficiencyNightmare <= 0.0F)
    {
        return "validator efficiency must be above zero";
    }
    if (v.tilesPerDoom < 0.0F || !IsFraction(v.collectibleYield))
    {
        return "validator collectible estimate is out of range";
    }
    if (!IsFraction(config.fixer.bossThresholdFraction) || !IsFraction(config.fixer.enemyThresholdFraction))
    {
        return "fixer threshold fractions must lie in [0, 1]";
    }

    const SpawnTuning& s = config.spawn;
    if (!IsFraction(s.earlyChance) || !IsFraction(s.normalChance) || !IsFraction(s.behindChance)
        || !IsFraction(s.maxChance) || !IsFraction(s.collectionChanceBoost))
    {
        return "spawn chances must lie in [0, 1]";
    }
    if (s.minPityThreshold < 1 || s.minPityThreshold > s.maxPityThreshold)
    {
        return "min_pity_threshold must be at least 1 and not above max_pity_threshold";
    }
    if (s.tilesPerDoom < 0.0F || s.affinityWeight < 0.0F)
    {
        return "spawn tiles_per_doom and affinity_weight must not be negative";
    }
    if (!IsFraction(config.guaranteed.explorationForceRatio))
    {
        return "exploration_force_ratio must lie in [0, 1]";
    }
    return {};
}
} // namespace

float ValidatorTuning::EfficiencyFor(Difficulty difficulty) const
{
    // Budgets divide by this, so it never reaches zero.
    constexpr float kMinEfficiency = 0.05F;
    switch (difficulty)
    {
        case Difficulty::Normal: return std::max(efficiencyNormal, kMinEfficiency);
        case Difficulty::Hard: return std::max(efficiencyHard, kMinEfficiency);
        case Difficulty::Nightmare: return std::max(efficiencyNightmare, kMinEfficiency);
        default: return std::max(efficiencyHard, kMinEfficiency);
    }
}

bool BalanceConfig::LoadFromJson(const std::string& jsonPath)
{
    std::ifstream file(jsonPath);
    if (!file.is_open())
    {
        std::cout << "BalanceConfig: WARNING - Could not open balance file at '" << jsonPath << "', keeping defaults\n";
        return false;
    }

    try
    {
        json root;
        file >> root;

        const int assetVersion = root.value("asset_version", 0);
        if (assetVersion != 1)
        {
            std::cout << "BalanceConfig: WARNING - Unexpected asset version " << assetVersion << ", expected 1\n";
        }

        // Parse into a copy so a malformed file leaves the live table untouched.
        BalanceConfig loaded = *this;
        if (root.contains("round_costs"))
        {
            ReadRoundCosts(root["round_costs"], loaded.roundCosts);
        }
        if (root.contains("validator"))
        {
            ReadValidator(root["validator"], loaded.validator);
        }
        if (root.contains("fixer"))
        {
            ReadFixer(root["fixer"], loaded.fixer);
        }
        if (root.contains("spawn"))
        {
            ReadSpawn(root["spawn"], loaded.spawn);
        }
        if (root.contains("guaranteed_spawn"))
        {
            ReadGuaranteed(root["guaranteed_spawn"], loaded.guaranteed);
        }

        const std::string problem = FindTuningProblem(loaded);
        if (!problem.empty())
        {
            std::cout << "BalanceConfig: ERROR - Rejected balance table " << jsonPath << ": " << problem << "\n";
            return false;
        }

        *this = loaded;
        std::cout << "BalanceConfig: Loaded balance table from " << jsonPath << "\n";
        return true;
    }
    catch (const std::exception& e)
    {
        std::cout << "BalanceConfig: ERROR - Failed to load balance table: " << e.what() << "\n";
        return false;
    }
}

bool BalanceConfig::SaveToJson(const std::string& jsonPath) const
{
    try
    {
        json root;
        root["asset_version"] = 1;

        const auto& c = roundCosts;
        root["round_costs"] = {
            {"find_item", c.findItem},
            {"find_tile", c.findTile},
            {"kill_enemy_each", c.killEnemyEach},
            {"kill_boss", c.killBoss},
            {"collect_each", c.collectEach},
            {"explore_each", c.exploreEach},
            {"escape", c.escape},
            {"ritual", c.ritual},
            {"interact", c.interact},
            {"protect", c.protect},
            {"escort", c.escort},
        };

        const auto& v = validator;
        root["validator"] = {
            {"efficiency_normal", v.efficiencyNormal},
            {"efficiency_hard", v.efficiencyHard},
            {"efficiency_nightmare", v.efficiencyNightmare},
            {"minimum_start_doom", v.minimumStartDoom},
            {"tight_margin_rounds", v.tightMarginRounds},
            {"max_enemies_per_survival_round", v.maxEnemiesPerSurvivalRound},
            {"purge_kill_threshold", v.purgeKillThreshold},
            {"high_collection_target", v.highCollectionTarget},
            {"tiles_per_doom", v.tilesPerDoom},
            {"collectible_yield", v.collectibleYield},
            {"error_penalty", v.errorPenalty},
            {"warning_penalty", v.warningPenalty},
            {"confident_threshold", v.confidentThreshold},
            {"challenging_threshold", v.challengingThreshold},
        };

        const auto& f = fixer;
        root["fixer"] = {
            {"survival_margin", f.survivalMargin},
            {"doom_budget_margin", f.doomBudgetMargin},
            {"boss_threshold_fraction", f.bossThresholdFraction},
            {"enemy_threshold_fraction", f.enemyThresholdFraction},
        };

        const auto& s = spawn;
        root["spawn"] = {
            {"early_chance", s.earlyChance},
            {"normal_chance", s.normalChance},
            {"behind_chance", s.behindChance},
            {"max_chance", s.maxChance},
            {"early_game_threshold", s.earlyGameThreshold},
            {"schedule_end_progress", s.scheduleEndProgress},
            {"tiles_per_doom", s.tilesPerDoom},
            {"pity_threshold", s.pityThreshold},
            {"min_pity_threshold", s.minPityThreshold},
            {"max_pity_threshold", s.maxPityThreshold},
            {"collection_mission_items", s.collectionMissionItems},
            {"collection_chance_boost", s.collectionChanceBoost},
            {"collection_pity_threshold", s.collectionPityThreshold},
            {"nightmare_pity_reduction", s.nightmarePityReduction},
            {"affinity_weight", s.affinityWeight},
            {"organic_quest_tile_score", s.organicQuestTileScore},
        };

        root["guaranteed_spawn"] = {
            {"doom_critical", guaranteed.doomCritical},
            {"doom_warning", guaranteed.doomWarning},
            {"exploration_force_ratio", guaranteed.explorationForceRatio},
        };

        std::ofstream file(jsonPath);
        if (!file.is_open())
        {
            std::cout << "BalanceConfig: ERROR - Could not open '" << jsonPath << "' for writing\n";
            return false;
        }

        file << root.dump(2);
        std::cout << "BalanceConfig: Saved balance table to " << jsonPath << "\n";
        return true;
    }
    catch (const std::exception& e)
    {
        std::cout << "BalanceConfig: ERROR - Failed to save balance table: " << e.what() << "\n";
        return false;
    }
}

const BalanceConfig& DefaultBalanceConfig()
{
    static const BalanceConfig kDefaults;
    return kDefaults;
}
} // namespace game::scenario
