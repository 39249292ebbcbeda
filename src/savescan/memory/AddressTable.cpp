#include "AddressTable.hpp"

namespace savescan
{
namespace
{
constexpr std::array<AddressTableEntry, static_cast<size_t>(Field::Count)> kEntries = { {
    { "saveBlock1Ptr", 0x03005008, RamRegion::B, 4, FieldAnchor::Absolute },
    { "saveBlock2Ptr", 0x0300500C, RamRegion::B, 4, FieldAnchor::Absolute },
    { "playerNameDirect", 0x02025734, RamRegion::A, 8, FieldAnchor::Absolute },
    { "playerParty", 0x02024284, RamRegion::A, 100, FieldAnchor::Absolute },
    { "playerPartyCount", 0x02024029, RamRegion::A, 1, FieldAnchor::Absolute },
    { "playerName", 0x000, RamRegion::A, 8, FieldAnchor::SaveBlock2 },
    { "playTimeHours", 0x00E, RamRegion::A, 2, FieldAnchor::SaveBlock2 },
    { "playTimeMinutes", 0x010, RamRegion::A, 1, FieldAnchor::SaveBlock2 },
    { "playTimeSeconds", 0x011, RamRegion::A, 1, FieldAnchor::SaveBlock2 },
    { "securityKey", 0xF20, RamRegion::A, 4, FieldAnchor::SaveBlock2 },
    { "positionX", 0x000, RamRegion::A, 2, FieldAnchor::SaveBlock1 },
    { "positionY", 0x002, RamRegion::A, 2, FieldAnchor::SaveBlock1 },
    { "mapGroup", 0x004, RamRegion::A, 1, FieldAnchor::SaveBlock1 },
    { "mapNumber", 0x005, RamRegion::A, 1, FieldAnchor::SaveBlock1 },
    { "money", 0x290, RamRegion::A, 4, FieldAnchor::SaveBlock1 },
    { "flags", 0xEE0, RamRegion::A, 1, FieldAnchor::SaveBlock1 },
} };
} // namespace

const AddressTableEntry& AddressTable::Get(Field field) { return kEntries[static_cast<size_t>(field)]; }

const AddressTableEntry* AddressTable::Find(std::string_view name)
{
    for (const auto& entry : kEntries)
    {
        if (entry.name == name)
            return &entry;
    }
    return nullptr;
}

const RegionSpec& AddressTable::Region(RamRegion region) { return region == RamRegion::A ? kRegionA : kRegionB; }

const RegionSpec* AddressTable::RegionFor(uint32_t address, size_t length)
{
    if (kRegionA.Contains(address, length))
        return &kRegionA;
    if (kRegionB.Contains(address, length))
        return &kRegionB;
    return nullptr;
}

const std::array<AddressTableEntry, static_cast<size_t>(Field::Count)>& AddressTable::Entries() { return kEntries; }

} // namespace savescan
