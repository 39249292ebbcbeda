#include "PointerPairScanStrategy.hpp"
#include "../memory/AddressTable.hpp"
#include "../signatures/Signatures.hpp"
#include "../text/TextCodec.hpp"

#include <sstream>

namespace savescan
{

std::optional<MemoryLayout> PointerPairScanStrategy::OnLocate(const uint8_t* data, size_t size)
{
    size_t candidates = 0;

    for (size_t offset = AddressTable::kPointerPairOffset; offset + 8 <= size; offset += kStride)
    {
        auto first = ReadLe32(data, size, offset);
        auto second = ReadLe32(data, size, offset + 4);
        if (!first || !second || !IsPointerPair(*first, *second))
            continue;

        ++candidates;

        // Region A follows region B directly in the state layout
        size_t region_b_base = offset - AddressTable::kPointerPairOffset;
        size_t region_a_base = region_b_base + AddressTable::kRegionB.size;
        if (!RegionsFit(size, region_a_base, region_b_base))
            continue;

        // Second pointer is SaveBlock2, which starts with the player name
        size_t name_offset = region_a_base + (*second - AddressTable::kRegionA.start);
        if (name_offset >= size || !TextCodec::IsValidFirstCharacter(data[name_offset]))
            continue;

        MemoryLayout layout;
        layout.region_a_base = region_a_base;
        layout.region_b_base = region_b_base;
        layout.header_offset =
            region_b_base >= Signatures::kRegionBOffset ? region_b_base - Signatures::kRegionBOffset : 0;
        layout.found_by = Kind();
        return layout;
    }

    if (candidates > 0)
    {
        std::ostringstream oss;
        oss << "Pointer pair scan rejected " << candidates << " candidate(s)";
        LogDebug(oss.str());
    }
    return std::nullopt;
}

} // namespace savescan
