#pragma once

#include "AddressTable.hpp"
#include "MemoryLayout.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace savescan
{

class SnapshotBuffer;

/**
 * @brief Read-only view of emulated RAM inside a snapshot
 *
 * Translates console virtual addresses into snapshot offsets using a
 * located MemoryLayout. Every read is bounds checked against both the
 * region and the snapshot; a failed check yields std::nullopt.
 *
 * The reader borrows the snapshot bytes and must not outlive them.
 */
class VirtualMemoryReader
{
public:
    VirtualMemoryReader(const uint8_t* data, size_t size, const MemoryLayout& layout);
    VirtualMemoryReader(const SnapshotBuffer& snapshot, const MemoryLayout& layout);

    /**
     * @brief Snapshot offset of [address, address + length)
     * @return std::nullopt if the range leaves its region or the snapshot
     */
    std::optional<size_t> Translate(uint32_t address, size_t length) const;

    std::optional<uint8_t> ReadU8(uint32_t address) const;
    std::optional<uint16_t> ReadU16(uint32_t address) const;
    std::optional<uint32_t> ReadU32(uint32_t address) const;
    std::optional<std::vector<uint8_t>> ReadBytes(uint32_t address, size_t length) const;

    /**
     * @brief Read a 32-bit pointer and require it to point into region A
     */
    std::optional<uint32_t> ReadRegionAPointer(uint32_t address) const;

    /**
     * @brief Resolve a table entry to an absolute virtual address
     *
     * Save-block anchored entries dereference the save block pointer stored
     * in region B first.
     */
    std::optional<uint32_t> Resolve(const AddressTableEntry& entry) const;
    std::optional<uint32_t> Resolve(Field field) const { return Resolve(AddressTable::Get(field)); }

    const MemoryLayout& Layout() const { return layout_; }

private:
    const uint8_t* data_;
    size_t size_;
    MemoryLayout layout_;
};

} // namespace savescan
