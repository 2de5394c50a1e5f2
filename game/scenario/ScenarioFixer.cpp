#include "game/scenario/ScenarioFixer.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

#include "game/scenario/DoomTrack.hpp"

namespace game::scenario
{
namespace
{
int FractionOfDoom(int startDoom, float fraction)
{
    return std::max(1, static_cast<int>(std::ceil(static_cast<float>(startDoom) * fraction)));
}

void RaiseStartDoom(Scenario& scenario, int newDoom, const std::string& reason, std::vector<std::string>& changes)
{
    if (newDoom <= scenario.startDoom)
    {
        return;
    }
    changes.push_back("Increased startDoom from " + std::to_string(scenario.startDoom) + " to " + std::to_string(newDoom) + " " + reason);
    scenario.startDoom = newDoom;
}

std::string EnemyTypeForKills(const Scenario& scenario)
{
    for (const auto& objective : scenario.objectives)
    {
        if (objective.type == ObjectiveType::KillEnemy && objective.IsRequired() && objective.targetId.has_value()
            && *objective.targetId != "any")
        {
            return *objective.targetId;
        }
    }
    return "cultist";
}
} // namespace

FixResult AutoFixScenario(const Scenario& scenario, const BalanceConfig& config)
{
    FixResult result;
    result.fixed = scenario;
    Scenario& fixed = result.fixed;
    std::vector<std::string>& changes = result.changes;

    const FixerTuning& tuning = config.fixer;
    const ScenarioAnalysis analysis = AnalyzeScenario(fixed, config);

    // Doom length
    RaiseStartDoom(fixed, config.validator.minimumStartDoom, "to reach the playable minimum", changes);

    if (analysis.survivalRoundsRequired > 0 && analysis.survivalRoundsRequired >= fixed.startDoom)
    {
        RaiseStartDoom(fixed, analysis.survivalRoundsRequired + tuning.survivalMargin, "for survival feasibility", changes);
    }

    if (fixed.victoryType != VictoryType::Survival)
    {
        const float efficiency = config.validator.EfficiencyFor(fixed.difficulty);
        const int budget = static_cast<int>(std::floor(static_cast<float>(fixed.startDoom) * efficiency));
        if (budget < analysis.estimatedMinRounds)
        {
            const int needed = static_cast<int>(std::ceil(static_cast<float>(analysis.estimatedMinRounds) / efficiency)) + tuning.doomBudgetMargin;
            RaiseStartDoom(fixed, needed, "for objective complexity", changes);
        }
    }

    bool eventsChanged = false;

    // Boss
    if (analysis.requiresBoss)
    {
        auto bossEvent = std::find_if(fixed.doomEvents.begin(), fixed.doomEvents.end(), [](const DoomEvent& event) {
            return event.type == DoomEventType::SpawnBoss;
        });

        if (bossEvent == fixed.doomEvents.end())
        {
            DoomEvent event;
            event.threshold = FractionOfDoom(fixed.startDoom, tuning.bossThresholdFraction);
            event.type = DoomEventType::SpawnBoss;
            event.targetId = kFallbackBossType;
            event.amount = 1;
            event.message = "Something ancient stirs. The final horror emerges from the shadows!";
            fixed.doomEvents.push_back(event);
            changes.push_back("Added boss spawn event at doom " + std::to_string(event.threshold));
            eventsChanged = true;
        }
        else if (bossEvent->amount <= 0)
        {
            bossEvent->amount = 1;
            changes.push_back("Raised boss spawn amount to 1");
            eventsChanged = true;
        }
    }

    // Enemy supply for kill objectives
    int killRequirement = analysis.requiredKills;
    for (const auto& objective : fixed.objectives)
    {
        if (objective.type == ObjectiveType::KillEnemy && objective.IsRequired())
        {
            killRequirement = std::max(killRequirement, objective.Target());
        }
    }

    const int deficit = killRequirement - fixed.SumDoomEventAmounts(DoomEventType::SpawnEnemy);
    if (deficit > 0)
    {
        DoomEvent event;
        event.threshold = FractionOfDoom(fixed.startDoom, tuning.enemyThresholdFraction);
        event.type = DoomEventType::SpawnEnemy;
        event.targetId = EnemyTypeForKills(fixed);
        event.amount = deficit;
        event.message = "More enemies emerge from the darkness!";
        fixed.doomEvents.push_back(event);
        changes.push_back("Added enemy spawn event for " + std::to_string(deficit) + " additional enemies");
        eventsChanged = true;
    }

    SortDoomEvents(fixed.doomEvents);
    if (eventsChanged)
    {
        fixed.doomProphecy = BuildDoomProphecy(fixed.doomEvents);
    }

    return result;
}

std::optional<GeneratedScenario> GenerateValidatedScenario(
    const std::function<Scenario()>& generator,
    int maxAttempts,
    const BalanceConfig& config
)
{
    for (int attempt = 1; attempt <= maxAttempts; ++attempt)
    {
        Scenario scenario = generator();

        if (IsScenarioBasicallyWinnable(scenario, config))
        {
            ValidationResult validation = ValidateScenarioWinnability(scenario, config);
            if (validation.isWinnable)
            {
                GeneratedScenario generated;
                generated.scenario = std::move(scenario);
                generated.validation = std::move(validation);
                generated.attempts = attempt;
                return generated;
            }
        }

        FixResult fix = AutoFixScenario(scenario, config);
        if (!fix.changes.empty())
        {
            ValidationResult validation = ValidateScenarioWinnability(fix.fixed, config);
            if (validation.isWinnable)
            {
                std::cout << "ScenarioGenerator: Repaired '" << fix.fixed.title << "' on attempt " << attempt << "\n";
                for (const auto& change : fix.changes)
                {
                    std::cout << "  - " << change << "\n";
                }

                GeneratedScenario generated;
                generated.scenario = std::move(fix.fixed);
                generated.validation = std::move(validation);
                generated.attempts = attempt;
                generated.wasFixed = true;
                generated.fixChanges = std::move(fix.changes);
                return generated;
            }
        }

        std::cout << "ScenarioGenerator: WARNING - Attempt " << attempt << " produced an unwinnable scenario, retrying\n";
    }

    std::cout << "ScenarioGenerator: ERROR - No winnable scenario after " << maxAttempts << " attempts\n";
    return std::nullopt;
}
} // namespace game::scenario
