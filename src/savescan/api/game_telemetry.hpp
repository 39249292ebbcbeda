#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace savescan
{

struct Playtime
{
    std::uint16_t hours = 0;
    std::uint8_t minutes = 0;
    std::uint8_t seconds = 0;

    bool operator==(const Playtime&) const = default;
};

struct Position
{
    std::int16_t x = 0;
    std::int16_t y = 0;

    bool operator==(const Position&) const = default;
};

struct PartyMember
{
    std::string nickname;
    std::uint8_t level = 0;
    std::uint16_t current_hp = 0;
    std::uint16_t max_hp = 0;
    std::uint16_t attack = 0;
    std::uint16_t defense = 0;
    std::uint16_t speed = 0;
    std::uint16_t special_attack = 0;
    std::uint16_t special_defense = 0;
    std::uint32_t pid = 0;
    // Only set when the encrypted substructure checksum verifies
    std::optional<std::uint16_t> species_id;

    bool operator==(const PartyMember&) const = default;
};

/**
 * @brief Decoded game state for one snapshot
 *
 * Every field is decoded independently; a field that could not be read
 * or failed a sanity bound is left empty without affecting the others.
 */
struct GameTelemetry
{
    std::optional<std::string> player_name;
    std::optional<std::string> location;
    std::optional<std::uint8_t> badge_count;
    std::optional<std::uint32_t> money;
    std::optional<Playtime> playtime;
    std::optional<Position> position;
    std::vector<PartyMember> party;

    bool IsEmpty() const
    {
        return !player_name && !location && !badge_count && !money && !playtime && !position && party.empty();
    }

    bool operator==(const GameTelemetry&) const = default;
};

} // namespace savescan
