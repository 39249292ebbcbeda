#pragma once

#include "LocatorStrategyBase.hpp"

namespace savescan
{

/**
 * @brief Finds the cartridge title or game code and validates a header derived from it
 */
class TitleSignatureStrategy : public LocatorStrategyBase
{
public:
    explicit TitleSignatureStrategy(const LocatorCreateInfo& create_info)
        : LocatorStrategyBase(create_info)
    {
    }

    LocatorStrategyKind Kind() const override { return LocatorStrategyKind::TitleSignature; }

protected:
    std::optional<MemoryLayout> OnLocate(const uint8_t* data, size_t size) override;
};

} // namespace savescan
