#pragma once

#include "ILocatorStrategy.hpp"
#include "LocatorCreateInfo.hpp"
#include "../api/logger.hpp"

#include <string>

namespace savescan
{

/**
 * @brief Shared validation and logging for locator strategies
 *
 * Locate() wraps OnLocate() with profiling and debug logging. Derived
 * strategies generate candidates and use ValidateAtHeader() or the
 * pointer-pair helpers to accept them.
 */
class LocatorStrategyBase : public ILocatorStrategy
{
public:
    explicit LocatorStrategyBase(const LocatorCreateInfo& create_info);
    virtual ~LocatorStrategyBase() = default;

    std::optional<MemoryLayout> Locate(const uint8_t* data, size_t size) override;

protected:
    virtual std::optional<MemoryLayout> OnLocate(const uint8_t* data, size_t size) = 0;

    /**
     * @brief Derive both region bases from a header offset and check the pointer pair
     * @param header_offset Candidate start of the state header
     * @return Layout tagged with Kind(), or std::nullopt if bounds or pointers fail
     */
    std::optional<MemoryLayout> ValidateAtHeader(const uint8_t* data, size_t size, size_t header_offset) const;

    /// Both pointers inside region A and 0 < |p1 - p2| < kMaxPointerDistance
    static bool IsPointerPair(uint32_t first, uint32_t second);

    static bool RegionsFit(size_t size, size_t region_a_base, size_t region_b_base);

    static std::optional<uint32_t> ReadLe32(const uint8_t* data, size_t size, size_t offset);

    void LogDebug(const std::string& message) const;

    Logger logger_;
    bool verbose_;
};

} // namespace savescan
