#pragma once

#include "../api/game_telemetry.hpp"

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace savescan
{

struct LocationChangeEvent
{
    std::string from;
    std::string to;

    bool operator==(const LocationChangeEvent&) const = default;
};

struct LevelUpEvent
{
    std::string pokemon;
    std::uint8_t old_level = 0;
    std::uint8_t new_level = 0;

    bool operator==(const LevelUpEvent&) const = default;
};

using GameEvent = std::variant<LocationChangeEvent, LevelUpEvent>;

/**
 * @brief Derives game events from two consecutive telemetry readings
 */
class TelemetryEvents
{
public:
    /**
     * @brief Events between two readings
     *
     * A location change needs both locations known and different. Level ups
     * match party members by PID, so reordering the party never emits one.
     */
    static std::vector<GameEvent> Diff(const GameTelemetry& previous, const GameTelemetry& current);

    /// "location_change" or "level_up"
    static const char* TypeName(const GameEvent& event);
};

} // namespace savescan
