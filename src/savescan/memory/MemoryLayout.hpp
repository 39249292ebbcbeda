#pragma once

#include <cstddef>
#include <cstdint>

namespace savescan
{

enum class LocatorStrategyKind : std::uint8_t
{
    HeaderMagic = 0,
    KnownOffset = 1,
    PointerPairScan = 2,
    TitleSignature = 3
};

inline constexpr std::size_t kLocatorStrategyCount = 4;

/**
 * @brief Byte offsets inside a snapshot where the two working-RAM regions begin
 *
 * Produced by MemoryLocator. A layout describes one snapshot format, so it
 * stays valid for every capture of the same emulator build.
 */
struct MemoryLayout
{
    std::size_t region_a_base = 0;
    std::size_t region_b_base = 0;
    std::size_t header_offset = 0;
    LocatorStrategyKind found_by = LocatorStrategyKind::HeaderMagic;

    bool operator==(const MemoryLayout&) const = default;
};

} // namespace savescan
