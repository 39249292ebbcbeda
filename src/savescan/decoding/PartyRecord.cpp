#include "PartyRecord.hpp"
#include "../text/TextCodec.hpp"

#include <array>
#include <cstring>

namespace savescan
{
namespace
{
constexpr std::array<std::string_view, 24> kSubstructOrders = {
    "GAEM", "GAME", "GEAM", "GEMA", "GMAE", "GMEA", "AGEM", "AGME", "AEGM", "AEMG", "AMGE", "AMEG",
    "EGAM", "EGMA", "EAGM", "EAMG", "EMGA", "EMAG", "MGAE", "MGEA", "MAGE", "MAEG", "MEGA", "MEAG",
};

uint16_t ReadU16(const uint8_t* p) { return static_cast<uint16_t>(p[0] | (p[1] << 8)); }

uint32_t ReadU32(const uint8_t* p)
{
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) | (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}
} // namespace

std::string_view PartyRecord::SubstructOrder(uint32_t pid) { return kSubstructOrders[pid % kSubstructOrders.size()]; }

size_t PartyRecord::SubstructIndex(uint32_t pid, char part)
{
    auto order = SubstructOrder(pid);
    auto index = order.find(part);
    return index == std::string_view::npos ? 0 : index;
}

void PartyRecord::CryptSubstructs(uint8_t* block, uint32_t key)
{
    for (size_t i = 0; i < kSubstructBlockSize; i += 4)
    {
        uint32_t word = ReadU32(block + i) ^ key;
        block[i] = static_cast<uint8_t>(word);
        block[i + 1] = static_cast<uint8_t>(word >> 8);
        block[i + 2] = static_cast<uint8_t>(word >> 16);
        block[i + 3] = static_cast<uint8_t>(word >> 24);
    }
}

uint16_t PartyRecord::Checksum(const uint8_t* decrypted_block)
{
    uint16_t sum = 0;
    for (size_t i = 0; i < kSubstructBlockSize; i += 2)
        sum = static_cast<uint16_t>(sum + ReadU16(decrypted_block + i));
    return sum;
}

std::optional<uint16_t> PartyRecord::DecodeSpecies(const uint8_t* record, size_t size)
{
    if (!record || size < kSize)
        return std::nullopt;

    uint32_t pid = ReadU32(record + kPidOffset);
    uint32_t key = pid ^ ReadU32(record + kOtIdOffset);

    std::array<uint8_t, kSubstructBlockSize> block{};
    std::memcpy(block.data(), record + kSubstructOffset, block.size());
    CryptSubstructs(block.data(), key);

    if (Checksum(block.data()) != ReadU16(record + kChecksumOffset))
        return std::nullopt;

    return ReadU16(block.data() + SubstructIndex(pid, 'G') * kSubstructSize);
}

std::optional<PartyMember> PartyRecord::Decode(const uint8_t* record, size_t size)
{
    if (!record || size < kSize)
        return std::nullopt;

    PartyMember member;
    member.pid = ReadU32(record + kPidOffset);
    if (member.pid == 0)
        return std::nullopt;

    member.nickname = TextCodec::Decode(record + kNicknameOffset, kNicknameLength);
    member.level = record[kLevelOffset];
    member.current_hp = ReadU16(record + kCurrentHpOffset);
    member.max_hp = ReadU16(record + kMaxHpOffset);
    member.attack = ReadU16(record + kAttackOffset);
    member.defense = ReadU16(record + kDefenseOffset);
    member.speed = ReadU16(record + kSpeedOffset);
    member.special_attack = ReadU16(record + kSpecialAttackOffset);
    member.special_defense = ReadU16(record + kSpecialDefenseOffset);
    member.species_id = DecodeSpecies(record, size);
    return member;
}

} // namespace savescan
