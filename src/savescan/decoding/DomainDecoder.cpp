#include "DomainDecoder.hpp"
#include "LocationTable.hpp"
#include "PartyRecord.hpp"
#include "../text/TextCodec.hpp"
#include "../util/Profile.hpp"

#include <bitset>
#include <sstream>
#include <utility>

namespace savescan
{

DomainDecoder::DomainDecoder(const VirtualMemoryReader& reader, Logger logger)
    : reader_(reader)
    , logger_(std::move(logger))
{
}

GameTelemetry DomainDecoder::Decode() const
{
    PROFILE_SCOPE_FUNCTION();

    GameTelemetry telemetry;
    telemetry.player_name = DecodePlayerName();
    telemetry.location = DecodeLocation();
    telemetry.badge_count = DecodeBadgeCount();
    telemetry.money = DecodeMoney();
    telemetry.playtime = DecodePlaytime();
    telemetry.position = DecodePosition();
    telemetry.party = DecodeParty();
    return telemetry;
}

std::optional<std::string> DomainDecoder::DecodeNameAt(std::optional<uint32_t> address) const
{
    if (!address)
        return std::nullopt;

    auto bytes = reader_.ReadBytes(*address, AddressTable::kPlayerNameLength);
    if (!bytes || !TextCodec::IsValidFirstCharacter(bytes->front()))
        return std::nullopt;

    std::string name = TextCodec::Decode(*bytes);
    if (name.empty())
        return std::nullopt;
    return name;
}

std::optional<std::string> DomainDecoder::DecodePlayerName() const
{
    if (auto name = DecodeNameAt(reader_.Resolve(Field::PlayerNameDirect)))
        return name;

    Debug("Direct player name invalid, reading through SaveBlock2");
    return DecodeNameAt(reader_.Resolve(Field::PlayerName));
}

std::optional<std::string> DomainDecoder::DecodeLocation() const
{
    auto group_address = reader_.Resolve(Field::MapGroup);
    auto number_address = reader_.Resolve(Field::MapNumber);
    if (!group_address || !number_address)
        return std::nullopt;

    auto group = reader_.ReadU8(*group_address);
    auto number = reader_.ReadU8(*number_address);
    if (!group || !number)
        return std::nullopt;

    return LocationTable::Describe(*group, *number);
}

std::optional<uint8_t> DomainDecoder::DecodeBadgeCount() const
{
    auto flags = reader_.Resolve(Field::Flags);
    if (!flags)
        return std::nullopt;

    auto badges = reader_.ReadU8(*flags + AddressTable::kBadgeFlagByteOffset);
    if (!badges)
        return std::nullopt;

    return CountBadgeBits(*badges);
}

std::optional<uint32_t> DomainDecoder::DecodeMoney() const
{
    auto money_address = reader_.Resolve(Field::Money);
    auto key_address = reader_.Resolve(Field::SecurityKey);
    if (!money_address || !key_address)
        return std::nullopt;

    auto encrypted = reader_.ReadU32(*money_address);
    auto key = reader_.ReadU32(*key_address);
    if (!encrypted || !key)
        return std::nullopt;

    // A zero key is seen before the game first writes one; the value is stored plain
    uint32_t money = *key == 0 ? *encrypted : XorCrypt(*encrypted, *key);
    if (money > kMaxMoney)
    {
        std::ostringstream oss;
        oss << "Implausible money value " << money << " (key 0x" << std::hex << *key << "), discarding";
        Warn(oss.str());
        return std::nullopt;
    }
    return money;
}

std::optional<Playtime> DomainDecoder::DecodePlaytime() const
{
    auto hours_address = reader_.Resolve(Field::PlayTimeHours);
    auto minutes_address = reader_.Resolve(Field::PlayTimeMinutes);
    auto seconds_address = reader_.Resolve(Field::PlayTimeSeconds);
    if (!hours_address || !minutes_address || !seconds_address)
        return std::nullopt;

    auto hours = reader_.ReadU16(*hours_address);
    auto minutes = reader_.ReadU8(*minutes_address);
    auto seconds = reader_.ReadU8(*seconds_address);
    if (!hours || !minutes || !seconds)
        return std::nullopt;

    return Playtime{ *hours, *minutes, *seconds };
}

std::optional<Position> DomainDecoder::DecodePosition() const
{
    auto x_address = reader_.Resolve(Field::PositionX);
    auto y_address = reader_.Resolve(Field::PositionY);
    if (!x_address || !y_address)
        return std::nullopt;

    auto x = reader_.ReadU16(*x_address);
    auto y = reader_.ReadU16(*y_address);
    if (!x || !y)
        return std::nullopt;

    return Position{ static_cast<int16_t>(*x), static_cast<int16_t>(*y) };
}

std::vector<PartyMember> DomainDecoder::DecodeParty() const
{
    std::vector<PartyMember> party;

    auto base = reader_.Resolve(Field::PlayerParty);
    if (!base)
        return party;

    for (size_t slot = 0; slot < AddressTable::kMaxPartySize; ++slot)
    {
        auto record = reader_.ReadBytes(*base + static_cast<uint32_t>(slot * PartyRecord::kSize), PartyRecord::kSize);
        if (!record)
            break;

        // PID 0 marks the first empty slot
        auto member = PartyRecord::Decode(record->data(), record->size());
        if (!member)
            break;

        if (!member->species_id)
            Debug("Party slot " + std::to_string(slot) + " failed substructure checksum");

        party.push_back(std::move(*member));
    }

    auto count_address = reader_.Resolve(Field::PlayerPartyCount);
    if (count_address)
    {
        auto count = reader_.ReadU8(*count_address);
        if (count && *count != party.size())
        {
            std::ostringstream oss;
            oss << "Party count byte says " << static_cast<int>(*count) << ", scanned " << party.size();
            Debug(oss.str());
        }
    }

    return party;
}

uint8_t DomainDecoder::CountBadgeBits(uint8_t flags) { return static_cast<uint8_t>(std::bitset<8>(flags).count()); }

void DomainDecoder::Warn(const std::string& message) const
{
    if (logger_.warn)
        logger_.warn(message);
}

void DomainDecoder::Debug(const std::string& message) const
{
    if (logger_.debug)
        logger_.debug(message);
}

} // namespace savescan
