#include "VirtualMemoryReader.hpp"

#include "../snapshot/SnapshotBuffer.hpp"

namespace savescan
{

VirtualMemoryReader::VirtualMemoryReader(const uint8_t* data, size_t size, const MemoryLayout& layout)
    : data_(data)
    , size_(data ? size : 0)
    , layout_(layout)
{
}

VirtualMemoryReader::VirtualMemoryReader(const SnapshotBuffer& snapshot, const MemoryLayout& layout)
    : VirtualMemoryReader(snapshot.data(), snapshot.size(), layout)
{
}

std::optional<size_t> VirtualMemoryReader::Translate(uint32_t address, size_t length) const
{
    const RegionSpec* region = AddressTable::RegionFor(address, length);
    if (!region)
        return std::nullopt;

    size_t base = region->id == RamRegion::A ? layout_.region_a_base : layout_.region_b_base;
    size_t offset = base + (address - region->start);
    if (offset < base || offset > size_ || length > size_ - offset)
        return std::nullopt;

    return offset;
}

std::optional<uint8_t> VirtualMemoryReader::ReadU8(uint32_t address) const
{
    auto offset = Translate(address, 1);
    if (!offset)
        return std::nullopt;
    return data_[*offset];
}

std::optional<uint16_t> VirtualMemoryReader::ReadU16(uint32_t address) const
{
    auto offset = Translate(address, 2);
    if (!offset)
        return std::nullopt;
    const uint8_t* p = data_ + *offset;
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

std::optional<uint32_t> VirtualMemoryReader::ReadU32(uint32_t address) const
{
    auto offset = Translate(address, 4);
    if (!offset)
        return std::nullopt;
    const uint8_t* p = data_ + *offset;
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) | (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

std::optional<std::vector<uint8_t>> VirtualMemoryReader::ReadBytes(uint32_t address, size_t length) const
{
    auto offset = Translate(address, length);
    if (!offset)
        return std::nullopt;
    return std::vector<uint8_t>(data_ + *offset, data_ + *offset + length);
}

std::optional<uint32_t> VirtualMemoryReader::ReadRegionAPointer(uint32_t address) const
{
    auto pointer = ReadU32(address);
    if (!pointer || !AddressTable::kRegionA.Contains(*pointer))
        return std::nullopt;
    return pointer;
}

std::optional<uint32_t> VirtualMemoryReader::Resolve(const AddressTableEntry& entry) const
{
    switch (entry.anchor)
    {
    case FieldAnchor::Absolute:
        return entry.virtual_address;
    case FieldAnchor::SaveBlock1:
    case FieldAnchor::SaveBlock2:
    {
        Field pointer_field = entry.anchor == FieldAnchor::SaveBlock1 ? Field::SaveBlock1Ptr : Field::SaveBlock2Ptr;
        auto base = ReadRegionAPointer(AddressTable::Get(pointer_field).virtual_address);
        if (!base)
            return std::nullopt;
        uint64_t address = static_cast<uint64_t>(*base) + entry.virtual_address;
        if (address > UINT32_MAX || !AddressTable::kRegionA.Contains(static_cast<uint32_t>(address), entry.size))
            return std::nullopt;
        return static_cast<uint32_t>(address);
    }
    }
    return std::nullopt;
}

} // namespace savescan
