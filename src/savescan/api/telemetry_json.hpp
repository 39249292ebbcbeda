#pragma once

#include "game_telemetry.hpp"
#include "../events/TelemetryEvents.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace savescan
{

// Field names follow the payload the game server and overlay consume.
// Empty optionals serialize as null.

nlohmann::json ToJson(const PartyMember& member);
nlohmann::json ToJson(const GameTelemetry& telemetry);
nlohmann::json ToJson(const GameEvent& event);

/// {timestamp, events, currentState}; each event carries the same timestamp
nlohmann::json BuildPayload(const GameTelemetry& telemetry, const std::vector<GameEvent>& events,
                            const std::string& timestamp);

} // namespace savescan
