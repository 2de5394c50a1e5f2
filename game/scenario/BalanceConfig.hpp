#pragma once

#include <string>

#include "game/scenario/ScenarioTypes.hpp"

namespace game::scenario
{
// Estimated rounds spent per unit of objective progress.
struct RoundCostTable
{
    float findItem = 2.0F;
    float findTile = 3.0F;
    float killEnemyEach = 1.0F;
    float killBoss = 3.0F;
    float collectEach = 1.5F;
    float exploreEach = 1.0F;
    float escape = 2.0F;
    float ritual = 1.0F;
    float interact = 1.0F;
    float protect = 1.0F;
    float escort = 2.0F;
};

struct ValidatorTuning
{
    // Share of the doom track players turn into progress.
    float efficiencyNormal = 0.8F;
    float efficiencyHard = 0.7F;
    float efficiencyNightmare = 0.6F;

    int minimumStartDoom = 3;
    int tightMarginRounds = 2;
    float maxEnemiesPerSurvivalRound = 2.0F;
    int purgeKillThreshold = 3;
    int highCollectionTarget = 5;

    // Collectibles: explored tiles ~ startDoom * 1.5, ~30% of them yield one.
    float tilesPerDoom = 1.5F;
    float collectibleYield = 0.3F;

    int errorPenalty = 40;
    int warningPenalty = 10;
    int confidentThreshold = 90;
    int challengingThreshold = 60;

    [[nodiscard]] float EfficiencyFor(Difficulty difficulty) const;
};

struct FixerTuning
{
    int survivalMargin = 4;
    int doomBudgetMargin = 2;
    float bossThresholdFraction = 0.3F;
    float enemyThresholdFraction = 0.6F;
};

struct SpawnTuning
{
    float earlyChance = 0.10F;
    float normalChance = 0.25F;
    float behindChance = 0.50F;
    float maxChance = 0.80F;

    float earlyGameThreshold = 0.2F;
    float scheduleEndProgress = 0.8F;
    float tilesPerDoom = 1.5F;

    int pityThreshold = 4;
    int minPityThreshold = 2;
    int maxPityThreshold = 10;

    int collectionMissionItems = 5;
    float collectionChanceBoost = 0.15F;
    int collectionPityThreshold = 3;
    int nightmarePityReduction = 1;

    float affinityWeight = 0.05F;

    // Location score a revealed quest tile needs to appear on a freshly explored tile.
    int organicQuestTileScore = 6;
};

struct GuaranteedSpawnTuning
{
    int doomCritical = 3;
    int doomWarning = 6;
    float explorationForceRatio = 0.7F;
};

struct BalanceConfig
{
    RoundCostTable roundCosts;
    ValidatorTuning validator;
    FixerTuning fixer;
    SpawnTuning spawn;
    GuaranteedSpawnTuning guaranteed;

    bool LoadFromJson(const std::string& jsonPath);
    bool SaveToJson(const std::string& jsonPath) const;
};

[[nodiscard]] const BalanceConfig& DefaultBalanceConfig();
} // namespace game::scenario
