#include "telemetry_json.hpp"

#include <cstdint>
#include <utility>

namespace savescan
{
namespace
{
template <typename T>
nlohmann::json OrNull(const std::optional<T>& value)
{
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}
} // namespace

nlohmann::json ToJson(const PartyMember& member)
{
    return {
        { "nickname", member.nickname },
        { "level", member.level },
        { "currentHp", member.current_hp },
        { "maxHp", member.max_hp },
        { "attack", member.attack },
        { "defense", member.defense },
        { "speed", member.speed },
        { "specialAttack", member.special_attack },
        { "specialDefense", member.special_defense },
        { "pid", member.pid },
        { "speciesId", OrNull(member.species_id) },
    };
}

nlohmann::json ToJson(const GameTelemetry& telemetry)
{
    nlohmann::json j;
    j["playerName"] = OrNull(telemetry.player_name);
    j["location"] = OrNull(telemetry.location);
    j["badges"] = OrNull(telemetry.badge_count);
    j["money"] = OrNull(telemetry.money);

    if (telemetry.playtime)
    {
        j["playtime"] = {
            { "hours", telemetry.playtime->hours },
            { "minutes", telemetry.playtime->minutes },
            { "seconds", telemetry.playtime->seconds },
        };
    }
    else
    {
        j["playtime"] = nullptr;
    }

    if (telemetry.position)
        j["position"] = { { "x", telemetry.position->x }, { "y", telemetry.position->y } };
    else
        j["position"] = nullptr;

    j["party"] = nlohmann::json::array();
    for (const auto& member : telemetry.party)
        j["party"].push_back(ToJson(member));

    return j;
}

nlohmann::json ToJson(const GameEvent& event)
{
    nlohmann::json j;
    j["type"] = TelemetryEvents::TypeName(event);

    if (const auto* change = std::get_if<LocationChangeEvent>(&event))
    {
        j["data"] = { { "from", change->from }, { "to", change->to } };
    }
    else if (const auto* level_up = std::get_if<LevelUpEvent>(&event))
    {
        j["data"] = {
            { "pokemon", level_up->pokemon },
            { "oldLevel", level_up->old_level },
            { "newLevel", level_up->new_level },
        };
    }
    return j;
}

nlohmann::json BuildPayload(const GameTelemetry& telemetry, const std::vector<GameEvent>& events,
                            const std::string& timestamp)
{
    nlohmann::json j;
    j["timestamp"] = timestamp;
    j["events"] = nlohmann::json::array();
    for (const auto& event : events)
    {
        auto entry = ToJson(event);
        entry["timestamp"] = timestamp;
        j["events"].push_back(std::move(entry));
    }

    // Consumers of the payload take playtime as total seconds
    auto state = ToJson(telemetry);
    if (telemetry.playtime)
    {
        state["playtime"] = static_cast<std::int64_t>(telemetry.playtime->hours) * 3600 +
                            telemetry.playtime->minutes * 60 + telemetry.playtime->seconds;
    }
    // No battle state is decoded from a save state
    state["inBattle"] = false;
    j["currentState"] = std::move(state);
    return j;
}

} // namespace savescan
