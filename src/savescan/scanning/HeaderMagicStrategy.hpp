#pragma once

#include "LocatorStrategyBase.hpp"

namespace savescan
{

/**
 * @brief Finds a format version tag and validates the regions at fixed offsets from it
 */
class HeaderMagicStrategy : public LocatorStrategyBase
{
public:
    explicit HeaderMagicStrategy(const LocatorCreateInfo& create_info)
        : LocatorStrategyBase(create_info)
    {
    }

    LocatorStrategyKind Kind() const override { return LocatorStrategyKind::HeaderMagic; }

protected:
    std::optional<MemoryLayout> OnLocate(const uint8_t* data, size_t size) override;
};

} // namespace savescan
