#include "game/scenario/ScenarioTypes.hpp"

#include <algorithm>

namespace game::scenario
{
const ScenarioObjective* Scenario::FindObjective(const std::string& objectiveId) const
{
    for (const auto& objective : objectives)
    {
        if (objective.id == objectiveId)
        {
            return &objective;
        }
    }
    return nullptr;
}

ScenarioObjective* Scenario::FindObjective(const std::string& objectiveId)
{
    for (auto& objective : objectives)
    {
        if (objective.id == objectiveId)
        {
            return &objective;
        }
    }
    return nullptr;
}

std::vector<const ScenarioObjective*> Scenario::RequiredObjectives() const
{
    std::vector<const ScenarioObjective*> out;
    for (const auto& objective : objectives)
    {
        if (objective.IsRequired())
        {
            out.push_back(&objective);
        }
    }
    return out;
}

bool Scenario::HasDoomEvent(DoomEventType type) const
{
    return std::any_of(doomEvents.begin(), doomEvents.end(), [type](const DoomEvent& e) { return e.type == type; });
}

int Scenario::SumDoomEventAmounts(DoomEventType type) const
{
    int total = 0;
    for (const auto& e : doomEvents)
    {
        if (e.type == type)
        {
            total += std::max(0, e.amount);
        }
    }
    return total;
}

void SortDoomEvents(std::vector<DoomEvent>& events)
{
    std::stable_sort(events.begin(), events.end(), [](const DoomEvent& a, const DoomEvent& b) {
        return a.threshold > b.threshold;
    });
}

bool AreDoomEventsSorted(const std::vector<DoomEvent>& events)
{
    for (std::size_t i = 1; i < events.size(); ++i)
    {
        if (events[i].threshold > events[i - 1].threshold)
        {
            return false;
        }
    }
    return true;
}

const char* DifficultyToText(Difficulty difficulty)
{
    switch (difficulty)
    {
        case Difficulty::Normal: return "normal";
        case Difficulty::Hard: return "hard";
        case Difficulty::Nightmare: return "nightmare";
        default: return "normal";
    }
}

const char* VictoryTypeToText(VictoryType type)
{
    switch (type)
    {
        case VictoryType::Escape: return "escape";
        case VictoryType::Assassination: return "assassination";
        case VictoryType::Survival: return "survival";
        case VictoryType::Collection: return "collection";
        case VictoryType::Ritual: return "ritual";
        case VictoryType::Investigation: return "investigation";
        default: return "escape";
    }
}

const char* ObjectiveTypeToText(ObjectiveType type)
{
    switch (type)
    {
        case ObjectiveType::FindItem: return "find_item";
        case ObjectiveType::FindTile: return "find_tile";
        case ObjectiveType::KillEnemy: return "kill_enemy";
        case ObjectiveType::KillBoss: return "kill_boss";
        case ObjectiveType::Survive: return "survive";
        case ObjectiveType::Interact: return "interact";
        case ObjectiveType::Escape: return "escape";
        case ObjectiveType::Collect: return "collect";
        case ObjectiveType::Explore: return "explore";
        case ObjectiveType::Protect: return "protect";
        case ObjectiveType::Escort: return "escort";
        case ObjectiveType::Ritual: return "ritual";
        default: return "find_item";
    }
}

const char* DoomEventTypeToText(DoomEventType type)
{
    switch (type)
    {
        case DoomEventType::SpawnEnemy: return "spawn_enemy";
        case DoomEventType::SpawnBoss: return "spawn_boss";
        case DoomEventType::BuffEnemies: return "buff_enemies";
        case DoomEventType::SanityHit: return "sanity_hit";
        case DoomEventType::UnlockArea: return "unlock_area";
        case DoomEventType::Narrative: return "narrative";
        default: return "narrative";
    }
}

const char* DefeatTypeToText(DefeatType type)
{
    switch (type)
    {
        case DefeatType::AllDead: return "all_dead";
        case DefeatType::DoomZero: return "doom_zero";
        case DefeatType::ObjectiveFailed: return "objective_failed";
        default: return "doom_zero";
    }
}

const char* TileSetToText(TileSet tileSet)
{
    switch (tileSet)
    {
        case TileSet::Indoor: return "indoor";
        case TileSet::Outdoor: return "outdoor";
        case TileSet::Mixed: return "mixed";
        default: return "mixed";
    }
}

const char* AtmosphereToText(Atmosphere atmosphere)
{
    switch (atmosphere)
    {
        case Atmosphere::Creepy: return "creepy";
        case Atmosphere::Urban: return "urban";
        case Atmosphere::Wilderness: return "wilderness";
        case Atmosphere::Academic: return "academic";
        case Atmosphere::Industrial: return "industrial";
        default: return "creepy";
    }
}

const char* ScenarioThemeToText(ScenarioTheme theme)
{
    switch (theme)
    {
        case ScenarioTheme::Manor: return "manor";
        case ScenarioTheme::Church: return "church";
        case ScenarioTheme::Asylum: return "asylum";
        case ScenarioTheme::Warehouse: return "warehouse";
        case ScenarioTheme::Forest: return "forest";
        case ScenarioTheme::Urban: return "urban";
        case ScenarioTheme::Coastal: return "coastal";
        case ScenarioTheme::Underground: return "underground";
        case ScenarioTheme::Academic: return "academic";
        default: return "manor";
    }
}

Difficulty DifficultyFromText(const std::string& value)
{
    if (value == "hard")
    {
        return Difficulty::Hard;
    }
    if (value == "nightmare")
    {
        return Difficulty::Nightmare;
    }
    return Difficulty::Normal;
}

VictoryType VictoryTypeFromText(const std::string& value)
{
    if (value == "assassination")
    {
        return VictoryType::Assassination;
    }
    if (value == "survival")
    {
        return VictoryType::Survival;
    }
    if (value == "collection")
    {
        return VictoryType::Collection;
    }
    if (value == "ritual")
    {
        return VictoryType::Ritual;
    }
    if (value == "investigation")
    {
        return VictoryType::Investigation;
    }
    return VictoryType::Escape;
}

ObjectiveType ObjectiveTypeFromText(const std::string& value)
{
    static constexpr ObjectiveType kAll[] = {
        ObjectiveType::FindItem, ObjectiveType::FindTile, ObjectiveType::KillEnemy, ObjectiveType::KillBoss,
        ObjectiveType::Survive, ObjectiveType::Interact, ObjectiveType::Escape, ObjectiveType::Collect,
        ObjectiveType::Explore, ObjectiveType::Protect, ObjectiveType::Escort, ObjectiveType::Ritual,
    };
    for (const ObjectiveType type : kAll)
    {
        if (value == ObjectiveTypeToText(type))
        {
            return type;
        }
    }
    return ObjectiveType::FindItem;
}

DoomEventType DoomEventTypeFromText(const std::string& value)
{
    static constexpr DoomEventType kAll[] = {
        DoomEventType::SpawnEnemy, DoomEventType::SpawnBoss, DoomEventType::BuffEnemies,
        DoomEventType::SanityHit, DoomEventType::UnlockArea, DoomEventType::Narrative,
    };
    for (const DoomEventType type : kAll)
    {
        if (value == DoomEventTypeToText(type))
        {
            return type;
        }
    }
    return DoomEventType::Narrative;
}

DefeatType DefeatTypeFromText(const std::string& value)
{
    if (value == "all_dead")
    {
        return DefeatType::AllDead;
    }
    if (value == "objective_failed")
    {
        return DefeatType::ObjectiveFailed;
    }
    return DefeatType::DoomZero;
}

TileSet TileSetFromText(const std::string& value)
{
    if (value == "indoor")
    {
        return TileSet::Indoor;
    }
    if (value == "outdoor")
    {
        return TileSet::Outdoor;
    }
    return TileSet::Mixed;
}

Atmosphere AtmosphereFromText(const std::string& value)
{
    if (value == "urban")
    {
        return Atmosphere::Urban;
    }
    if (value == "wilderness")
    {
        return Atmosphere::Wilderness;
    }
    if (value == "academic")
    {
        return Atmosphere::Academic;
    }
    if (value == "industrial")
    {
        return Atmosphere::Industrial;
    }
    return Atmosphere::Creepy;
}

ScenarioTheme ScenarioThemeFromText(const std::string& value)
{
    static constexpr ScenarioTheme kAll[] = {
        ScenarioTheme::Manor, ScenarioTheme::Church, ScenarioTheme::Asylum,
        ScenarioTheme::Warehouse, ScenarioTheme::Forest, ScenarioTheme::Urban,
        ScenarioTheme::Coastal, ScenarioTheme::Underground, ScenarioTheme::Academic,
    };
    for (const ScenarioTheme theme : kAll)
    {
        if (value == ScenarioThemeToText(theme))
        {
            return theme;
        }
    }
    return ScenarioTheme::Manor;
}
} // namespace game::scenario
