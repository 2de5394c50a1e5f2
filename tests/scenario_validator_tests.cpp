#include <doctest/doctest.h>

#include <algorithm>
#include <string>

#include "game/scenario/BalanceConfig.hpp"
#include "game/scenario/ScenarioValidator.hpp"
#include "tests/TestFixtures.hpp"

using namespace game::scenario;
using namespace test_fixtures;

TEST_CASE("A well-formed escape scenario is winnable with full confidence")
{
    const Scenario scenario = MakeEscapeScenario();
    const ValidationResult result = ValidateScenarioWinnability(scenario);

    CHECK(result.isWinnable);
    CHECK(result.confidence == 100);
    CHECK(result.issues.empty());
    CHECK(result.analysis.estimatedMinRounds == 4);
    CHECK(result.analysis.effectiveDoomBudget == 9);
    CHECK(result.analysis.hasBossSpawn);
    CHECK(result.analysis.hasEscapeRoute);
    CHECK(result.analysis.objectiveChainValid);
    CHECK(GetValidationSummary(result) == "Scenario is winnable with high confidence (100%).");
}

TEST_CASE("Start doom of 2 is never winnable")
{
    Scenario scenario = MakeEscapeScenario();
    scenario.startDoom = 2;

    const ValidationResult result = ValidateScenarioWinnability(scenario);
    CHECK_FALSE(result.isWinnable);
    CHECK(result.HasIssue(IssueCodes::DOOM_TOO_LOW));
    CHECK_FALSE(IsScenarioBasicallyWinnable(scenario));
}

TEST_CASE("Doom budget below the estimated rounds is an error, a thin margin a warning")
{
    Scenario scenario = MakeEscapeScenario();
    scenario.objectives.push_back(MakeObjective("obj_collect", ObjectiveType::Collect, std::string("necro_page"), 4));
    scenario.victoryConditions[0].requiredObjectives.push_back("obj_collect");

    // 2 + 2 + 4 * 1.5 = 10 rounds against floor(12 * 0.8) = 9.
    ValidationResult result = ValidateScenarioWinnability(scenario);
    CHECK(result.analysis.estimatedMinRounds == 10);
    CHECK(result.HasIssue(IssueCodes::DOOM_TOO_LOW));
    CHECK_FALSE(result.isWinnable);

    // floor(13 * 0.8) = 10 leaves zero buffer rounds.
    scenario.startDoom = 13;
    result = ValidateScenarioWinnability(scenario);
    CHECK(result.isWinnable);
    CHECK(result.HasIssue(IssueCodes::DOOM_TIGHT));
    CHECK(result.confidence < 100);
}

TEST_CASE("Harder difficulties shrink the effective doom budget")
{
    Scenario scenario = MakeEscapeScenario();
    scenario.difficulty = Difficulty::Nightmare;
    CHECK(AnalyzeScenario(scenario).effectiveDoomBudget == 7);
    scenario.difficulty = Difficulty::Hard;
    CHECK(AnalyzeScenario(scenario).effectiveDoomBudget == 8);
}

TEST_CASE("A zero efficiency suggests a finite positive doom")
{
    BalanceConfig config;
    config.validator.efficiencyNormal = 0.0F;

    const ValidationResult result = ValidateScenarioWinnability(MakeEscapeScenario(), config);
    CHECK_FALSE(result.isWinnable);
    const auto issue = std::find_if(result.issues.begin(), result.issues.end(), [](const ValidationIssue& candidate) {
        return candidate.code == IssueCodes::DOOM_TOO_LOW;
    });
    REQUIRE(issue != result.issues.end());
    CHECK(issue->suggestion.find('-') == std::string::npos);

    const int suggested = std::stoi(issue->suggestion.substr(issue->suggestion.rfind(' ') + 1));
    CHECK(suggested >= 80);
    CHECK(suggested <= 81);
}

TEST_CASE("Survival target must fit inside the doom track")
{
    const Scenario impossible = MakeSurvivalScenario(15, 10);
    const ValidationResult bad = ValidateScenarioWinnability(impossible);
    CHECK_FALSE(bad.isWinnable);
    CHECK(bad.HasIssue(IssueCodes::SURVIVAL_DOOM_MISMATCH));
    CHECK_FALSE(IsScenarioBasicallyWinnable(impossible));

    const Scenario fine = MakeSurvivalScenario(8, 12);
    const ValidationResult good = ValidateScenarioWinnability(fine);
    CHECK(good.isWinnable);
    CHECK_FALSE(good.HasIssue(IssueCodes::SURVIVAL_DOOM_MISMATCH));
    CHECK(good.analysis.survivalRoundsRequired == 8);
    CHECK(IsScenarioBasicallyWinnable(fine));
}

TEST_CASE("Heavy spawns during a survival mission raise a pressure warning")
{
    Scenario scenario = MakeSurvivalScenario(5, 12);
    scenario.doomEvents.push_back(MakeDoomEvent(9, DoomEventType::SpawnEnemy, "ghoul", 8));
    scenario.doomEvents.push_back(MakeDoomEvent(4, DoomEventType::SpawnBoss, "shoggoth", 3));

    const ValidationResult result = ValidateScenarioWinnability(scenario);
    CHECK(result.isWinnable);
    CHECK(result.HasIssue(IssueCodes::HIGH_ENEMY_PRESSURE));
    CHECK(result.analysis.totalEnemiesFromEvents == 11);
}

TEST_CASE("Boss kill objectives need a boss spawn")
{
    const Scenario missing = MakeAssassinationScenario(false);
    const ValidationResult bad = ValidateScenarioWinnability(missing);
    CHECK_FALSE(bad.isWinnable);
    CHECK(bad.HasIssue(IssueCodes::MISSING_BOSS_SPAWN));
    CHECK(bad.analysis.requiresBoss);
    CHECK_FALSE(IsScenarioBasicallyWinnable(missing));

    const Scenario present = MakeAssassinationScenario(true);
    const ValidationResult good = ValidateScenarioWinnability(present);
    CHECK_FALSE(good.HasIssue(IssueCodes::MISSING_BOSS_SPAWN));
    CHECK(good.isWinnable);
}

TEST_CASE("Kill targets are checked against spawned enemies")
{
    Scenario scenario;
    scenario.startDoom = 20;
    scenario.victoryType = VictoryType::Escape;
    scenario.objectives.push_back(MakeObjective("obj_kill", ObjectiveType::KillEnemy, std::string("ghoul"), 10));
    scenario.victoryConditions.push_back({VictoryType::Escape, "Kill them all", {"obj_kill"}});
    scenario.doomEvents.push_back(MakeDoomEvent(12, DoomEventType::SpawnEnemy, "ghoul", 3));

    ValidationResult result = ValidateScenarioWinnability(scenario);
    CHECK_FALSE(result.isWinnable);
    CHECK(result.HasIssue(IssueCodes::INSUFFICIENT_ENEMY_SPAWNS));
    CHECK(result.analysis.requiredKills == 10);
    CHECK(result.analysis.enemySpawnCapacity == 3);

    scenario.doomEvents.push_back(MakeDoomEvent(6, DoomEventType::SpawnEnemy, "ghoul", 7));
    result = ValidateScenarioWinnability(scenario);
    CHECK_FALSE(result.HasIssue(IssueCodes::INSUFFICIENT_ENEMY_SPAWNS));
    CHECK(result.isWinnable);
}

TEST_CASE("Large kill targets on assassination missions report a purge problem")
{
    Scenario scenario = MakeAssassinationScenario(true);
    scenario.objectives.push_back(MakeObjective("obj_guards", ObjectiveType::KillEnemy, std::string("cultist"), 5));
    scenario.victoryConditions[0].requiredObjectives.push_back("obj_guards");
    scenario.doomEvents.push_back(MakeDoomEvent(10, DoomEventType::SpawnEnemy, "cultist", 2));

    const ValidationResult result = ValidateScenarioWinnability(scenario);
    CHECK(result.HasIssue(IssueCodes::PURGE_IMPOSSIBLE));
    CHECK_FALSE(result.HasIssue(IssueCodes::INSUFFICIENT_ENEMY_SPAWNS));
}

TEST_CASE("A kill objective with target zero needs no spawns")
{
    Scenario scenario = MakeEscapeScenario();
    scenario.objectives.push_back(MakeObjective("obj_cleanse", ObjectiveType::KillEnemy, std::string("any"), 0));
    scenario.victoryConditions[0].requiredObjectives.push_back("obj_cleanse");
    scenario.doomEvents.erase(scenario.doomEvents.begin());

    const ValidationResult result = ValidateScenarioWinnability(scenario);
    CHECK(result.analysis.requiredKills == 0);
    CHECK(result.isWinnable);
}

TEST_CASE("Broken objective chains are errors")
{
    SUBCASE("hidden required objective without a trigger")
    {
        Scenario scenario = MakeEscapeScenario();
        scenario.objectives[1].revealedBy.reset();
        const ValidationResult result = ValidateScenarioWinnability(scenario);
        CHECK(result.HasIssue(IssueCodes::UNREVEALED_REQUIRED_OBJECTIVE));
        CHECK(result.HasIssue(IssueCodes::NO_ACHIEVABLE_VICTORY));
        CHECK_FALSE(result.isWinnable);
    }

    SUBCASE("reveal trigger points at nothing")
    {
        Scenario scenario = MakeEscapeScenario();
        scenario.objectives[1].revealedBy = "obj_ghost";
        const ValidationResult result = ValidateScenarioWinnability(scenario);
        CHECK(result.HasIssue(IssueCodes::INVALID_REVEAL_REFERENCE));
        CHECK_FALSE(result.analysis.objectiveChainValid);
        CHECK_FALSE(result.isWinnable);
    }

    SUBCASE("objectives reveal each other")
    {
        Scenario scenario = MakeEscapeScenario();
        scenario.objectives[0].isHidden = true;
        scenario.objectives[0].revealedBy = "obj_escape";
        const ValidationResult result = ValidateScenarioWinnability(scenario);
        CHECK(HasCircularReveal(scenario, scenario.objectives[0]));
        CHECK(result.HasIssue(IssueCodes::CIRCULAR_REVEAL_CHAIN));
        CHECK_FALSE(result.isWinnable);
    }

    SUBCASE("victory condition names an unknown objective")
    {
        Scenario scenario = MakeEscapeScenario();
        scenario.victoryConditions[0].requiredObjectives.push_back("obj_missing");
        const ValidationResult result = ValidateScenarioWinnability(scenario);
        CHECK(result.HasIssue(IssueCodes::INVALID_VICTORY_OBJECTIVE_REF));
        CHECK_FALSE(result.isWinnable);
    }

    SUBCASE("no victory conditions at all")
    {
        Scenario scenario = MakeEscapeScenario();
        scenario.victoryConditions.clear();
        const ValidationResult result = ValidateScenarioWinnability(scenario);
        CHECK(result.HasIssue(IssueCodes::NO_VICTORY_CONDITIONS));
        CHECK_FALSE(IsScenarioBasicallyWinnable(scenario));
    }
}

TEST_CASE("Soft resource problems only lower confidence")
{
    Scenario scenario = MakeEscapeScenario();
    scenario.startDoom = 20;
    scenario.objectives[0].targetId.reset();
    scenario.objectives.push_back(MakeObjective("obj_pages", ObjectiveType::Collect, std::string("necro_page"), 6));
    scenario.victoryConditions[0].requiredObjectives.push_back("obj_pages");

    const ValidationResult result = ValidateScenarioWinnability(scenario);
    CHECK(result.isWinnable);
    CHECK(result.HasIssue(IssueCodes::MISSING_TARGET_ID));
    CHECK(result.HasIssue(IssueCodes::HIGH_COLLECTION_TARGET));
    // floor(floor(20 * 1.5) * 0.3) = 9 pickups available for 6 required.
    CHECK(result.analysis.availableCollectibles == 9);
    CHECK_FALSE(result.HasIssue(IssueCodes::COLLECTION_UNLIKELY));
    CHECK(result.WarningCount() == 2);
    CHECK(result.confidence == 80);
    CHECK(GetValidationSummary(result) == "Scenario is winnable but may be challenging (80% confidence).");
}

TEST_CASE("Escape scenarios without an exit or key get a warning")
{
    Scenario scenario;
    scenario.startDoom = 12;
    scenario.victoryType = VictoryType::Escape;
    scenario.objectives.push_back(MakeObjective("obj_talk", ObjectiveType::Interact, std::string("npc")));
    scenario.victoryConditions.push_back({VictoryType::Escape, "Leave", {"obj_talk"}});

    const ValidationResult result = ValidateScenarioWinnability(scenario);
    CHECK(result.HasIssue(IssueCodes::ESCAPE_PATH_UNCLEAR));
    CHECK(result.isWinnable);
}

TEST_CASE("Confidence arithmetic and summary bands")
{
    ValidationResult result;
    result.isWinnable = false;
    result.issues.push_back({IssueSeverity::Error, IssueCodes::DOOM_TOO_LOW, "too low", "", std::nullopt});
    result.confidence = 60;
    CHECK(GetValidationSummary(result) == "Scenario is NOT winnable - 1 critical issue(s) found.");

    ValidationResult shaky;
    shaky.isWinnable = true;
    shaky.confidence = 50;
    CHECK(GetValidationSummary(shaky) == "Scenario is NOT winnable - 0 critical issue(s) found.");

    // Penalties come from the balance table.
    BalanceConfig harsh;
    harsh.validator.warningPenalty = 25;
    Scenario tight = MakeEscapeScenario();
    tight.objectives[0].targetId.reset();
    CHECK(ValidateScenarioWinnability(tight, harsh).confidence == 75);
}

TEST_CASE("Validation info flattens the result for display")
{
    Scenario scenario = MakeSurvivalScenario(15, 10);
    const ScenarioValidationInfo info = GetScenarioValidationInfo(scenario);
    CHECK_FALSE(info.isWinnable);
    CHECK_FALSE(info.errors.empty());
    CHECK(info.summary.find("NOT winnable") != std::string::npos);
}
