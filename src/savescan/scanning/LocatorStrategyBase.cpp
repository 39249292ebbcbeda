#include "LocatorStrategyBase.hpp"
#include "MemoryLocator.hpp"
#include "../memory/AddressTable.hpp"
#include "../signatures/Signatures.hpp"
#include "../util/Profile.hpp"

#include <sstream>

namespace savescan
{

LocatorStrategyBase::LocatorStrategyBase(const LocatorCreateInfo& create_info)
    : logger_(create_info.logger)
    , verbose_(create_info.verbose)
{
}

std::optional<MemoryLayout> LocatorStrategyBase::Locate(const uint8_t* data, size_t size)
{
    PROFILE_SCOPE_CUSTOM(MemoryLocator::GetStrategyName(Kind()));

    if (!data || size == 0)
        return std::nullopt;

    LogDebug(std::string("Trying locator strategy: ") + MemoryLocator::GetStrategyName(Kind()));

    auto layout = OnLocate(data, size);
    if (layout)
    {
        std::ostringstream oss;
        oss << MemoryLocator::GetStrategyName(Kind()) << " located regions: header=0x" << std::hex
            << layout->header_offset << " regionB=0x" << layout->region_b_base << " regionA=0x"
            << layout->region_a_base;
        LogDebug(oss.str());
    }
    else
    {
        LogDebug(std::string(MemoryLocator::GetStrategyName(Kind())) + " found no valid layout");
    }
    return layout;
}

std::optional<MemoryLayout> LocatorStrategyBase::ValidateAtHeader(const uint8_t* data, size_t size,
                                                                  size_t header_offset) const
{
    if (header_offset > size)
        return std::nullopt;

    size_t region_b_base = header_offset + Signatures::kRegionBOffset;
    size_t region_a_base = header_offset + Signatures::kRegionAOffset;
    if (!RegionsFit(size, region_a_base, region_b_base))
        return std::nullopt;

    auto first = ReadLe32(data, size, region_b_base + AddressTable::kPointerPairOffset);
    auto second = ReadLe32(data, size, region_b_base + AddressTable::kPointerPairOffset + 4);
    if (!first || !second || !IsPointerPair(*first, *second))
        return std::nullopt;

    MemoryLayout layout;
    layout.region_a_base = region_a_base;
    layout.region_b_base = region_b_base;
    layout.header_offset = header_offset;
    layout.found_by = Kind();
    return layout;
}

bool LocatorStrategyBase::IsPointerPair(uint32_t first, uint32_t second)
{
    if (!AddressTable::kRegionA.Contains(first) || !AddressTable::kRegionA.Contains(second))
        return false;

    uint32_t distance = first > second ? first - second : second - first;
    return distance > 0 && distance < AddressTable::kMaxPointerDistance;
}

bool LocatorStrategyBase::RegionsFit(size_t size, size_t region_a_base, size_t region_b_base)
{
    if (region_a_base > size || region_b_base > size)
        return false;
    return size - region_a_base >= AddressTable::kRegionA.size && size - region_b_base >= AddressTable::kRegionB.size;
}

std::optional<uint32_t> LocatorStrategyBase::ReadLe32(const uint8_t* data, size_t size, size_t offset)
{
    if (offset > size || size - offset < 4)
        return std::nullopt;

    const uint8_t* p = data + offset;
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) | (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

void LocatorStrategyBase::LogDebug(const std::string& message) const
{
    if (verbose_ && logger_.debug)
        logger_.debug(message);
}

} // namespace savescan
