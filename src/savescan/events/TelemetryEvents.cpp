#include "TelemetryEvents.hpp"

#include <unordered_map>

namespace savescan
{

std::vector<GameEvent> TelemetryEvents::Diff(const GameTelemetry& previous, const GameTelemetry& current)
{
    std::vector<GameEvent> events;

    if (previous.location && current.location && *previous.location != *current.location)
        events.emplace_back(LocationChangeEvent{ *previous.location, *current.location });

    std::unordered_map<uint32_t, uint8_t> previous_levels;
    for (const auto& member : previous.party)
        previous_levels.emplace(member.pid, member.level);

    for (const auto& member : current.party)
    {
        auto it = previous_levels.find(member.pid);
        if (it != previous_levels.end() && member.level > it->second)
            events.emplace_back(LevelUpEvent{ member.nickname, it->second, member.level });
    }

    return events;
}

const char* TelemetryEvents::TypeName(const GameEvent& event)
{
    return std::holds_alternative<LocationChangeEvent>(event) ? "location_change" : "level_up";
}

} // namespace savescan
