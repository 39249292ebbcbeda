#pragma once

#include "LocatorStrategyBase.hpp"

namespace savescan
{

/**
 * @brief Sweeps the whole snapshot for the save block pointer pair
 *
 * Each hit is only accepted if the player name reached through the
 * candidate mapping starts with a letter. This is the most expensive
 * strategy: one pass over the buffer in 4-byte strides.
 */
class PointerPairScanStrategy : public LocatorStrategyBase
{
public:
    explicit PointerPairScanStrategy(const LocatorCreateInfo& create_info)
        : LocatorStrategyBase(create_info)
    {
    }

    LocatorStrategyKind Kind() const override { return LocatorStrategyKind::PointerPairScan; }

protected:
    std::optional<MemoryLayout> OnLocate(const uint8_t* data, size_t size) override;

private:
    static constexpr size_t kStride = 4;
};

} // namespace savescan
