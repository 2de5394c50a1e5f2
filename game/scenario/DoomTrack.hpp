#pragma once

#include <optional>
#include <string>
#include <vector>

#include "game/scenario/ScenarioTypes.hpp"

namespace game::scenario
{
/// Marks every untriggered event whose threshold the doom counter has reached
/// (threshold >= currentDoom) and returns copies of them, highest threshold first.
/// Each event fires exactly once across repeated calls.
[[nodiscard]] std::vector<DoomEvent> ProcessDoomThresholds(std::vector<DoomEvent>& events, int currentDoom);

/// Highest threshold that has not fired yet.
[[nodiscard]] std::optional<int> NextDoomThreshold(const std::vector<DoomEvent>& events);

/// Briefing text listing what happens at each threshold.
[[nodiscard]] std::string BuildDoomProphecy(const std::vector<DoomEvent>& events);
} // namespace game::scenario
