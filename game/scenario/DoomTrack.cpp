#include "game/scenario/DoomTrack.hpp"

#include <sstream>

namespace game::scenario
{
std::vector<DoomEvent> ProcessDoomThresholds(std::vector<DoomEvent>& events, int currentDoom)
{
    std::vector<DoomEvent> fired;
    for (auto& event : events)
    {
        if (!event.triggered && currentDoom <= event.threshold)
        {
            event.triggered = true;
            fired.push_back(event);
        }
    }
    SortDoomEvents(fired);
    return fired;
}

std::optional<int> NextDoomThreshold(const std::vector<DoomEvent>& events)
{
    std::optional<int> next;
    for (const auto& event : events)
    {
        if (!event.triggered && (!next.has_value() || event.threshold > *next))
        {
            next = event.threshold;
        }
    }
    return next;
}

std::string BuildDoomProphecy(const std::vector<DoomEvent>& events)
{
    std::vector<DoomEvent> ordered = events;
    SortDoomEvents(ordered);

    std::ostringstream out;
    out << "The signs foretell what is to come:";
    for (const auto& event : ordered)
    {
        out << "\n- When doom reaches " << event.threshold << ": ";
        if (!event.message.empty())
        {
            out << event.message;
        }
        else
        {
            out << DoomEventTypeToText(event.type);
        }
    }
    if (ordered.empty())
    {
        out << "\n- Only silence, until the end.";
    }
    return out.str();
}
} // namespace game::scenario
