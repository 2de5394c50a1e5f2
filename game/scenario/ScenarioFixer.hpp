#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "game/scenario/BalanceConfig.hpp"
#include "game/scenario/ScenarioTypes.hpp"
#include "game/scenario/ScenarioValidator.hpp"

namespace game::scenario
{
struct FixResult
{
    Scenario fixed;
    std::vector<std::string> changes; // empty when nothing needed repair
};

struct GeneratedScenario
{
    Scenario scenario;
    ValidationResult validation;
    int attempts = 0;
    bool wasFixed = false;
    std::vector<std::string> fixChanges;
};

/**
 * Repairs the mechanical problems the validator reports: doom too low for the
 * objectives or survival target, missing boss spawns and enemy spawn deficits.
 * The input is never modified. Doom events of the result are sorted.
 */
[[nodiscard]] FixResult AutoFixScenario(const Scenario& scenario, const BalanceConfig& config = DefaultBalanceConfig());

/**
 * Calls the generator until it yields a winnable scenario, applying one
 * auto-fix pass per attempt. Returns std::nullopt when every attempt failed.
 */
[[nodiscard]] std::optional<GeneratedScenario> GenerateValidatedScenario(
    const std::function<Scenario()>& generator,
    int maxAttempts = 5,
    const BalanceConfig& config = DefaultBalanceConfig()
);
} // namespace game::scenario
