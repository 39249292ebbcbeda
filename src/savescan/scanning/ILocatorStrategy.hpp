#pragma once

#include "../memory/MemoryLayout.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>

namespace savescan
{

/**
 * @brief Pure virtual interface for one way of finding the RAM regions
 *
 * Strategies only read the snapshot. Each returns a layout that already
 * passed at least one independent validity check, or std::nullopt.
 */
class ILocatorStrategy
{
public:
    virtual ~ILocatorStrategy() = default;

    virtual LocatorStrategyKind Kind() const = 0;

    /**
     * @brief Try to locate both regions inside a snapshot
     * @param data Snapshot bytes
     * @param size Snapshot length
     * @return Validated layout, or std::nullopt
     */
    virtual std::optional<MemoryLayout> Locate(const uint8_t* data, size_t size) = 0;
};

} // namespace savescan
