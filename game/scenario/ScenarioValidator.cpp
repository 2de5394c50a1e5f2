#include "game/scenario/ScenarioValidator.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <unordered_set>

namespace game::scenario
{
namespace
{
void AddIssue(std::vector<ValidationIssue>& issues,
              IssueSeverity severity,
              const char* code,
              std::string message,
              std::string suggestion = {},
              std::optional<std::string> objectiveId = std::nullopt)
{
    ValidationIssue issue;
    issue.severity = severity;
    issue.code = code;
    issue.message = std::move(message);
    issue.suggestion = std::move(suggestion);
    issue.objectiveId = std::move(objectiveId);
    issues.push_back(std::move(issue));
}

// Missing amounts count as one unit of work.
int AmountOrOne(const ScenarioObjective& objective)
{
    return objective.targetAmount.has_value() ? std::max(0, *objective.targetAmount) : 1;
}

std::string FormatFactor(float value)
{
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << value;
    return out.str();
}

// An objective can become active if it is visible, or if its reveal chain is sound.
bool CanBecomeActive(const Scenario& scenario, const ScenarioObjective& objective)
{
    if (!objective.isHidden)
    {
        return true;
    }
    if (!objective.revealedBy.has_value())
    {
        return false;
    }
    if (scenario.FindObjective(*objective.revealedBy) == nullptr)
    {
        return false;
    }
    return !HasCircularReveal(scenario, objective);
}

void CheckVictoryPath(const Scenario& scenario, std::vector<ValidationIssue>& issues)
{
    if (scenario.victoryConditions.empty())
    {
        AddIssue(issues, IssueSeverity::Error, IssueCodes::NO_VICTORY_CONDITIONS,
                 "Scenario has no victory conditions",
                 "Add at least one victory condition");
        return;
    }

    bool anyAchievable = false;
    for (const auto& condition : scenario.victoryConditions)
    {
        bool achievable = true;
        for (const auto& objectiveId : condition.requiredObjectives)
        {
            const ScenarioObjective* objective = scenario.FindObjective(objectiveId);
            if (objective == nullptr)
            {
                AddIssue(issues, IssueSeverity::Error, IssueCodes::INVALID_VICTORY_OBJECTIVE_REF,
                         "Victory condition references non-existent objective \"" + objectiveId + "\"");
                achievable = false;
            }
            else if (!CanBecomeActive(scenario, *objective))
            {
                achievable = false;
            }
        }
        anyAchievable = anyAchievable || achievable;
    }

    if (!anyAchievable)
    {
        AddIssue(issues, IssueSeverity::Error, IssueCodes::NO_ACHIEVABLE_VICTORY,
                 "No victory condition can be completed",
                 "Fix the objectives referenced by the victory conditions");
    }
}

void CheckObjectiveChain(const Scenario& scenario, std::vector<ValidationIssue>& issues)
{
    for (const auto& objective : scenario.objectives)
    {
        if (objective.revealedBy.has_value() && scenario.FindObjective(*objective.revealedBy) == nullptr)
        {
            AddIssue(issues, IssueSeverity::Error, IssueCodes::INVALID_REVEAL_REFERENCE,
                     "Objective \"" + objective.shortDescription + "\" references non-existent parent \"" + *objective.revealedBy + "\"",
                     {}, objective.id);
        }

        if (!objective.IsRequired())
        {
            continue;
        }

        if (objective.isHidden && !objective.revealedBy.has_value())
        {
            AddIssue(issues, IssueSeverity::Error, IssueCodes::UNREVEALED_REQUIRED_OBJECTIVE,
                     "Required objective \"" + objective.shortDescription + "\" is hidden but has no revealedBy trigger",
                     "Either add revealedBy or set isHidden to false", objective.id);
        }
        else if (objective.revealedBy.has_value() && HasCircularReveal(scenario, objective))
        {
            AddIssue(issues, IssueSeverity::Error, IssueCodes::CIRCULAR_REVEAL_CHAIN,
                     "Required objective \"" + objective.shortDescription + "\" is revealed by a circular chain",
                     "Break the revealedBy loop", objective.id);
        }
    }
}

void CheckDoomTimer(const Scenario& scenario, const ScenarioAnalysis& analysis, const BalanceConfig& config, std::vector<ValidationIssue>& issues)
{
    const ValidatorTuning& tuning = config.validator;
    if (scenario.startDoom < tuning.minimumStartDoom)
    {
        AddIssue(issues, IssueSeverity::Error, IssueCodes::DOOM_TOO_LOW,
                 "Start doom " + std::to_string(scenario.startDoom) + " is below the playable minimum of " + std::to_string(tuning.minimumStartDoom),
                 "Increase startDoom to at least " + std::to_string(tuning.minimumStartDoom));
        return;
    }

    // Survival missions are judged by their round target instead.
    if (scenario.victoryType == VictoryType::Survival)
    {
        return;
    }

    const float efficiency = tuning.EfficiencyFor(scenario.difficulty);
    const int buffer = analysis.effectiveDoomBudget - analysis.estimatedMinRounds;
    if (buffer < 0)
    {
        const int needed = static_cast<int>(std::ceil(static_cast<float>(analysis.estimatedMinRounds) / efficiency));
        AddIssue(issues, IssueSeverity::Error, IssueCodes::DOOM_TOO_LOW,
                 "Insufficient doom timer: need ~" + std::to_string(analysis.estimatedMinRounds) + " rounds but only have "
                     + std::to_string(analysis.effectiveDoomBudget) + " effective rounds (" + std::to_string(scenario.startDoom)
                     + " doom * " + FormatFactor(efficiency) + " efficiency)",
                 "Increase startDoom to at least " + std::to_string(needed));
    }
    else if (buffer < tuning.tightMarginRounds)
    {
        AddIssue(issues, IssueSeverity::Warning, IssueCodes::DOOM_TIGHT,
                 "Very tight doom margin: only " + std::to_string(buffer) + " buffer rounds for unexpected events",
                 "Consider increasing doom by 2-3 for more comfortable gameplay");
    }
}

void CheckSurvival(const Scenario& scenario, const ScenarioAnalysis& analysis, const BalanceConfig& config, std::vector<ValidationIssue>& issues)
{
    if (analysis.survivalRoundsRequired <= 0)
    {
        return;
    }

    // Doom drops every round, so it has to outlast the target.
    if (analysis.survivalRoundsRequired >= scenario.startDoom)
    {
        AddIssue(issues, IssueSeverity::Error, IssueCodes::SURVIVAL_DOOM_MISMATCH,
                 "Survival requires " + std::to_string(analysis.survivalRoundsRequired) + " rounds but doom is only "
                     + std::to_string(scenario.startDoom),
                 "Increase startDoom to at least " + std::to_string(analysis.survivalRoundsRequired + config.fixer.survivalMargin));
    }

    const float enemiesPerRound = static_cast<float>(analysis.totalEnemiesFromEvents) / static_cast<float>(analysis.survivalRoundsRequired);
    if (enemiesPerRound > config.validator.maxEnemiesPerSurvivalRound)
    {
        AddIssue(issues, IssueSeverity::Warning, IssueCodes::HIGH_ENEMY_PRESSURE,
                 "High enemy spawn rate (~" + FormatFactor(enemiesPerRound) + "/round) during survival",
                 "Consider spreading enemy spawns more evenly");
    }
}

void CheckEnemySpawns(const Scenario& scenario, const ScenarioAnalysis& analysis, const BalanceConfig& config, std::vector<ValidationIssue>& issues)
{
    if (analysis.requiresBoss && !analysis.hasBossSpawn)
    {
        AddIssue(issues, IssueSeverity::Error, IssueCodes::MISSING_BOSS_SPAWN,
                 "Scenario requires a boss kill but no boss spawns in doom events",
                 "Add a spawn_boss doom event");
    }

    bool reported = false;
    for (const auto& objective : scenario.objectives)
    {
        if (objective.type != ObjectiveType::KillEnemy || !objective.IsRequired() || !objective.targetAmount.has_value())
        {
            continue;
        }

        const int target = *objective.targetAmount;
        if (target <= analysis.enemySpawnCapacity)
        {
            continue;
        }

        const bool isPurge = scenario.victoryType == VictoryType::Assassination && target > config.validator.purgeKillThreshold;
        AddIssue(issues, IssueSeverity::Error, isPurge ? IssueCodes::PURGE_IMPOSSIBLE : IssueCodes::INSUFFICIENT_ENEMY_SPAWNS,
                 "Kill objective requires " + std::to_string(target) + " kills, but doom events only spawn "
                     + std::to_string(analysis.enemySpawnCapacity) + " enemies",
                 "Add spawn_enemy doom events or reduce the kill target to " + std::to_string(analysis.enemySpawnCapacity),
                 objective.id);
        reported = true;
    }

    if (!reported && analysis.requiredKills > analysis.enemySpawnCapacity)
    {
        AddIssue(issues, IssueSeverity::Error, IssueCodes::INSUFFICIENT_ENEMY_SPAWNS,
                 "Kill objectives require " + std::to_string(analysis.requiredKills) + " kills in total, but doom events only spawn "
                     + std::to_string(analysis.enemySpawnCapacity) + " enemies",
                 "Add more spawn_enemy doom events");
    }
}

void CheckResources(const Scenario& scenario, std::vector<ValidationIssue>& issues)
{
    bool hasExitObjective = false;
    bool hasKeyObjective = false;
    for (const auto& objective : scenario.objectives)
    {
        if (objective.type == ObjectiveType::FindItem && objective.IsRequired() && !objective.targetId.has_value())
        {
            AddIssue(issues, IssueSeverity::Warning, IssueCodes::MISSING_TARGET_ID,
                     "Objective \"" + objective.shortDescription + "\" has no target item ID specified",
                     {}, objective.id);
        }
        hasExitObjective = hasExitObjective || objective.type == ObjectiveType::Escape || objective.type == ObjectiveType::FindTile;
        hasKeyObjective = hasKeyObjective
            || (objective.type == ObjectiveType::FindItem && objective.targetId.has_value()
                && objective.targetId->find("key") != std::string::npos);
    }

    if (scenario.victoryType == VictoryType::Escape && !hasExitObjective && !hasKeyObjective)
    {
        AddIssue(issues, IssueSeverity::Warning, IssueCodes::ESCAPE_PATH_UNCLEAR,
                 "Escape scenario has no clear exit or key objective",
                 "Add a find_item objective for a key or a find_tile objective for the exit");
    }
}

void CheckCollection(const Scenario& scenario, const ScenarioAnalysis& analysis, const BalanceConfig& config, std::vector<ValidationIssue>& issues)
{
    if (analysis.requiredCollectibles <= 0)
    {
        return;
    }

    if (analysis.availableCollectibles < analysis.requiredCollectibles)
    {
        AddIssue(issues, IssueSeverity::Warning, IssueCodes::COLLECTION_UNLIKELY,
                 "Collection objective requires " + std::to_string(analysis.requiredCollectibles)
                     + " items but estimated availability is only " + std::to_string(analysis.availableCollectibles),
                 "Reduce the collection target or increase the doom timer");
    }

    for (const auto& objective : scenario.objectives)
    {
        if (objective.type == ObjectiveType::Collect && objective.IsRequired()
            && objective.Target() > config.validator.highCollectionTarget)
        {
            AddIssue(issues, IssueSeverity::Warning, IssueCodes::HIGH_COLLECTION_TARGET,
                     "Collection objective \"" + objective.shortDescription + "\" has a high target ("
                         + std::to_string(objective.Target()) + ")",
                     "Consider reducing to 3-4 for better player experience", objective.id);
        }
    }
}
} // namespace

bool ValidationResult::HasIssue(const std::string& code) const
{
    return std::any_of(issues.begin(), issues.end(), [&code](const ValidationIssue& issue) { return issue.code == code; });
}

int ValidationResult::ErrorCount() const
{
    return static_cast<int>(std::count_if(issues.begin(), issues.end(), [](const ValidationIssue& issue) {
        return issue.severity == IssueSeverity::Error;
    }));
}

int ValidationResult::WarningCount() const
{
    return static_cast<int>(std::count_if(issues.begin(), issues.end(), [](const ValidationIssue& issue) {
        return issue.severity == IssueSeverity::Warning;
    }));
}

bool HasCircularReveal(const Scenario& scenario, const ScenarioObjective& objective)
{
    std::unordered_set<std::string> visited;
    const ScenarioObjective* current = &objective;
    while (current != nullptr && current->revealedBy.has_value())
    {
        if (!visited.insert(current->id).second)
        {
            return true;
        }
        current = scenario.FindObjective(*current->revealedBy);
    }
    return false;
}

ScenarioAnalysis AnalyzeScenario(const Scenario& scenario, const BalanceConfig& config)
{
    const RoundCostTable& costs = config.roundCosts;
    ScenarioAnalysis analysis;

    float rounds = 0.0F;
    for (const auto& objective : scenario.objectives)
    {
        if (!objective.IsRequired())
        {
            continue;
        }

        switch (objective.type)
        {
            case ObjectiveType::FindItem:
                rounds += costs.findItem;
                break;
            case ObjectiveType::FindTile:
                rounds += costs.findTile;
                break;
            case ObjectiveType::KillEnemy:
            {
                const int kills = AmountOrOne(objective);
                analysis.requiredKills += kills;
                rounds += static_cast<float>(kills) * costs.killEnemyEach;
                break;
            }
            case ObjectiveType::KillBoss:
                analysis.requiresBoss = true;
                rounds += costs.killBoss;
                break;
            case ObjectiveType::Survive:
                analysis.survivalRoundsRequired = std::max(analysis.survivalRoundsRequired, objective.Target());
                break;
            case ObjectiveType::Collect:
            {
                const int pieces = AmountOrOne(objective);
                analysis.requiredCollectibles += pieces;
                rounds += static_cast<float>(pieces) * costs.collectEach;
                break;
            }
            case ObjectiveType::Explore:
                rounds += static_cast<float>(AmountOrOne(objective)) * costs.exploreEach;
                break;
            case ObjectiveType::Escape:
                rounds += costs.escape;
                break;
            case ObjectiveType::Ritual:
                rounds += static_cast<float>(std::max(1, AmountOrOne(objective))) * costs.ritual;
                break;
            case ObjectiveType::Interact:
                rounds += static_cast<float>(std::max(1, AmountOrOne(objective))) * costs.interact;
                break;
            case ObjectiveType::Protect:
                rounds += costs.protect;
                break;
            case ObjectiveType::Escort:
                rounds += costs.escort;
                break;
            default:
                break;
        }
    }

    analysis.estimatedMinRounds = static_cast<int>(std::ceil(rounds));
    if (analysis.survivalRoundsRequired > 0)
    {
        analysis.estimatedMinRounds = std::max(analysis.estimatedMinRounds, analysis.survivalRoundsRequired);
    }

    for (const auto& event : scenario.doomEvents)
    {
        if (event.type == DoomEventType::SpawnEnemy)
        {
            analysis.enemySpawnCapacity += std::max(0, event.amount);
            analysis.totalEnemiesFromEvents += std::max(0, event.amount);
        }
        else if (event.type == DoomEventType::SpawnBoss)
        {
            analysis.hasBossSpawn = true;
            analysis.totalEnemiesFromEvents += std::max(1, event.amount);
        }
    }

    const ValidatorTuning& tuning = config.validator;
    const int expectedTiles = static_cast<int>(std::floor(static_cast<float>(scenario.startDoom) * tuning.tilesPerDoom));
    analysis.availableCollectibles = static_cast<int>(std::floor(static_cast<float>(expectedTiles) * tuning.collectibleYield));
    analysis.effectiveDoomBudget = static_cast<int>(std::floor(static_cast<float>(scenario.startDoom) * tuning.EfficiencyFor(scenario.difficulty)));

    analysis.hasEscapeRoute = scenario.victoryType == VictoryType::Escape
        || std::any_of(scenario.objectives.begin(), scenario.objectives.end(), [](const ScenarioObjective& o) {
               return o.type == ObjectiveType::Escape;
           });

    for (const auto& objective : scenario.objectives)
    {
        if (!objective.revealedBy.has_value())
        {
            continue;
        }
        if (scenario.FindObjective(*objective.revealedBy) == nullptr || HasCircularReveal(scenario, objective))
        {
            analysis.objectiveChainValid = false;
            break;
        }
    }

    return analysis;
}

ValidationResult ValidateScenarioWinnability(const Scenario& scenario, const BalanceConfig& config)
{
    ValidationResult result;
    result.analysis = AnalyzeScenario(scenario, config);

    CheckVictoryPath(scenario, result.issues);
    CheckObjectiveChain(scenario, result.issues);
    CheckDoomTimer(scenario, result.analysis, config, result.issues);
    CheckSurvival(scenario, result.analysis, config, result.issues);
    CheckEnemySpawns(scenario, result.analysis, config, result.issues);
    CheckResources(scenario, result.issues);
    CheckCollection(scenario, result.analysis, config, result.issues);

    const int errors = result.ErrorCount();
    const int warnings = result.WarningCount();
    const int confidence = 100 - errors * config.validator.errorPenalty - warnings * config.validator.warningPenalty;

    result.confidence = std::clamp(confidence, 0, 100);
    result.isWinnable = errors == 0;
    return result;
}

bool IsScenarioBasicallyWinnable(const Scenario& scenario, const BalanceConfig& config)
{
    if (scenario.victoryConditions.empty())
    {
        return false;
    }
    if (scenario.startDoom < config.validator.minimumStartDoom)
    {
        return false;
    }

    int survivalRounds = 0;
    bool requiresBoss = false;
    for (const auto& objective : scenario.objectives)
    {
        if (!objective.IsRequired())
        {
            continue;
        }
        if (objective.type == ObjectiveType::Survive)
        {
            survivalRounds = std::max(survivalRounds, objective.Target());
        }
        else if (objective.type == ObjectiveType::KillBoss)
        {
            requiresBoss = true;
        }
    }

    if (survivalRounds > 0 && survivalRounds >= scenario.startDoom)
    {
        return false;
    }
    if (requiresBoss && !scenario.HasDoomEvent(DoomEventType::SpawnBoss))
    {
        return false;
    }
    return true;
}

std::string GetValidationSummary(const ValidationResult& result, const BalanceConfig& config)
{
    const int errors = result.ErrorCount();
    if (errors > 0 || result.confidence < config.validator.challengingThreshold)
    {
        return "Scenario is NOT winnable - " + std::to_string(errors) + " critical issue(s) found.";
    }
    if (result.confidence >= config.validator.confidentThreshold)
    {
        return "Scenario is winnable with high confidence (" + std::to_string(result.confidence) + "%).";
    }
    return "Scenario is winnable but may be challenging (" + std::to_string(result.confidence) + "% confidence).";
}

ScenarioValidationInfo GetScenarioValidationInfo(const Scenario& scenario, const BalanceConfig& config)
{
    const ValidationResult validation = ValidateScenarioWinnability(scenario, config);

    ScenarioValidationInfo info;
    info.isWinnable = validation.isWinnable;
    info.confidence = validation.confidence;
    info.summary = GetValidationSummary(validation, config);
    for (const auto& issue : validation.issues)
    {
        if (issue.severity == IssueSeverity::Error)
        {
            info.errors.push_back(issue.message);
        }
        else
        {
            info.warnings.push_back(issue.message);
        }
    }
    return info;
}

const char* IssueSeverityToText(IssueSeverity severity)
{
    switch (severity)
    {
        case IssueSeverity::Error: return "error";
        case IssueSeverity::Warning: return "warning";
        default: return "warning";
    }
}
} // namespace game::scenario
