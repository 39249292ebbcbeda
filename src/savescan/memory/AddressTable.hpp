#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace savescan
{

enum class RamRegion : std::uint8_t
{
    A, // EWRAM, 256 KiB general purpose
    B  // IWRAM, 32 KiB fast
};

struct RegionSpec
{
    RamRegion id;
    uint32_t start;
    uint32_t size;

    uint32_t End() const { return start + size; }

    bool Contains(uint32_t address, size_t length = 1) const
    {
        if (address < start || length == 0)
            return false;
        uint64_t last = static_cast<uint64_t>(address) + length;
        return last <= End();
    }
};

enum class FieldAnchor : std::uint8_t
{
    Absolute,
    SaveBlock1,
    SaveBlock2
};

enum class Field : std::uint8_t
{
    SaveBlock1Ptr,
    SaveBlock2Ptr,
    PlayerNameDirect,
    PlayerParty,
    PlayerPartyCount,
    PlayerName,
    PlayTimeHours,
    PlayTimeMinutes,
    PlayTimeSeconds,
    SecurityKey,
    PositionX,
    PositionY,
    MapGroup,
    MapNumber,
    Money,
    Flags,
    Count
};

struct AddressTableEntry
{
    std::string_view name;
    // Absolute virtual address, or byte offset from the anchor's save block
    uint32_t virtual_address;
    RamRegion region;
    uint8_t size;
    FieldAnchor anchor;
};

/**
 * @brief Compiled-in field addresses for Pokemon FireRed (US, BPRE)
 */
class AddressTable
{
public:
    static constexpr RegionSpec kRegionA{ RamRegion::A, 0x02000000, 0x40000 };
    static constexpr RegionSpec kRegionB{ RamRegion::B, 0x03000000, 0x8000 };

    // Offset of the save block pointer pair from the start of region B
    static constexpr uint32_t kPointerPairOffset = 0x5008;
    // Pointer pair heuristic: 0 < |p1 - p2| < kMaxPointerDistance
    static constexpr uint32_t kMaxPointerDistance = 0x10000;

    static constexpr uint32_t kBadgeFlagByteOffset = 0x104;
    static constexpr size_t kPartyRecordSize = 100;
    static constexpr size_t kMaxPartySize = 6;
    static constexpr size_t kPlayerNameLength = 8;

    static const AddressTableEntry& Get(Field field);

    static const AddressTableEntry* Find(std::string_view name);

    static const RegionSpec& Region(RamRegion region);

    static const RegionSpec* RegionFor(uint32_t address, size_t length = 1);

    static const std::array<AddressTableEntry, static_cast<size_t>(Field::Count)>& Entries();
};

} // namespace savescan
