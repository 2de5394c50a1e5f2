#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "game/scenario/BalanceConfig.hpp"
#include "game/scenario/ScenarioTypes.hpp"

namespace game::scenario
{
enum class IssueSeverity : uint8_t
{
    Error,  // scenario cannot be won
    Warning // winnable, but risky or unpleasant
};

// Issue codes reported by the validator.
namespace IssueCodes
{
    constexpr const char* NO_VICTORY_CONDITIONS = "NO_VICTORY_CONDITIONS";
    constexpr const char* INVALID_VICTORY_OBJECTIVE_REF = "INVALID_VICTORY_OBJECTIVE_REF";
    constexpr const char* NO_ACHIEVABLE_VICTORY = "NO_ACHIEVABLE_VICTORY";
    constexpr const char* INVALID_REVEAL_REFERENCE = "INVALID_REVEAL_REFERENCE";
    constexpr const char* UNREVEALED_REQUIRED_OBJECTIVE = "UNREVEALED_REQUIRED_OBJECTIVE";
    constexpr const char* CIRCULAR_REVEAL_CHAIN = "CIRCULAR_REVEAL_CHAIN";
    constexpr const char* DOOM_TOO_LOW = "DOOM_TOO_LOW";
    constexpr const char* DOOM_TIGHT = "DOOM_TIGHT";
    constexpr const char* SURVIVAL_DOOM_MISMATCH = "SURVIVAL_DOOM_MISMATCH";
    constexpr const char* HIGH_ENEMY_PRESSURE = "HIGH_ENEMY_PRESSURE";
    constexpr const char* MISSING_BOSS_SPAWN = "MISSING_BOSS_SPAWN";
    constexpr const char* INSUFFICIENT_ENEMY_SPAWNS = "INSUFFICIENT_ENEMY_SPAWNS";
    constexpr const char* PURGE_IMPOSSIBLE = "PURGE_IMPOSSIBLE";
    constexpr const char* MISSING_TARGET_ID = "MISSING_TARGET_ID";
    constexpr const char* ESCAPE_PATH_UNCLEAR = "ESCAPE_PATH_UNCLEAR";
    constexpr const char* COLLECTION_UNLIKELY = "COLLECTION_UNLIKELY";
    constexpr const char* HIGH_COLLECTION_TARGET = "HIGH_COLLECTION_TARGET";
}

struct ValidationIssue
{
    IssueSeverity severity = IssueSeverity::Warning;
    std::string code;
    std::string message;
    std::string suggestion;
    std::optional<std::string> objectiveId;
};

struct ScenarioAnalysis
{
    int estimatedMinRounds = 0;
    int effectiveDoomBudget = 0;
    int totalEnemiesFromEvents = 0; // every spawn_enemy and spawn_boss amount
    int enemySpawnCapacity = 0;     // spawn_enemy amounts only
    bool hasBossSpawn = false;
    bool requiresBoss = false;
    int requiredKills = 0;
    int survivalRoundsRequired = 0;
    int requiredCollectibles = 0;
    int availableCollectibles = 0;
    bool hasEscapeRoute = false;
    bool objectiveChainValid = true;
};

struct ValidationResult
{
    bool isWinnable = false;
    int confidence = 0;
    std::vector<ValidationIssue> issues;
    ScenarioAnalysis analysis;

    [[nodiscard]] bool HasIssue(const std::string& code) const;
    [[nodiscard]] int ErrorCount() const;
    [[nodiscard]] int WarningCount() const;
};

// Flattened result for UI panels.
struct ScenarioValidationInfo
{
    bool isWinnable = false;
    int confidence = 0;
    std::string summary;
    std::vector<std::string> warnings;
    std::vector<std::string> errors;
};

[[nodiscard]] ScenarioAnalysis AnalyzeScenario(const Scenario& scenario, const BalanceConfig& config = DefaultBalanceConfig());

[[nodiscard]] ValidationResult ValidateScenarioWinnability(const Scenario& scenario, const BalanceConfig& config = DefaultBalanceConfig());

// Cheap pre-filter run before the full validator.
[[nodiscard]] bool IsScenarioBasicallyWinnable(const Scenario& scenario, const BalanceConfig& config = DefaultBalanceConfig());

[[nodiscard]] std::string GetValidationSummary(const ValidationResult& result, const BalanceConfig& config = DefaultBalanceConfig());

[[nodiscard]] ScenarioValidationInfo GetScenarioValidationInfo(const Scenario& scenario, const BalanceConfig& config = DefaultBalanceConfig());

// True when following revealedBy links from this objective loops back on itself.
[[nodiscard]] bool HasCircularReveal(const Scenario& scenario, const ScenarioObjective& objective);

[[nodiscard]] const char* IssueSeverityToText(IssueSeverity severity);
} // namespace game::scenario
